// Copyright 2025, 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "junit_launcher/config.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "google/protobuf/json/json.h"
#include "google/protobuf/map.h"
#include "google/protobuf/repeated_ptr_field.h"

#include "junit_launcher/classpath.h"
#include "junit_launcher/launch.pb.h"
#include "junit_launcher/options.h"
#include "junit_launcher/strings.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

using StringMap = absl::flat_hash_map<std::string, std::string>;

static absl::Status SetFileName(const std::string_view flag,
                                const std::string_view value,
                                std::optional<FileName>& result) {
  absl::StatusOr<FileName> name = FileName::FromString(value);
  if (!name.ok()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid value for %s: %s", flag, name.status().message()));
  }
  result = *std::move(name);
  return absl::OkStatus();
}

static absl::Status SetKeyValue(const std::string_view flag,
                                const std::string_view value,
                                StringMap& result) {
  std::pair<std::string, std::string> pair;
  if (!SplitKeyValue(value, pair)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid value %s for %s, expected KEY=VALUE", Quote(value), flag));
  }
  result.insert_or_assign(std::move(pair.first), std::move(pair.second));
  return absl::OkStatus();
}

static absl::Status SetTimeout(const std::string_view value,
                               std::uint64_t& result) {
  if (!absl::SimpleAtoi(value, &result)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid timeout %s", Quote(value)));
  }
  return absl::OkStatus();
}

static absl::Status SetGracePeriod(const std::string_view value,
                                   absl::Duration& result) {
  absl::Duration duration;
  if (!absl::ParseDuration(value, &duration) ||
      duration < absl::ZeroDuration() || duration == absl::InfiniteDuration()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid grace period %s", Quote(value)));
  }
  result = duration;
  return absl::OkStatus();
}

static void Extend(const google::protobuf::Map<std::string, std::string>& from,
                   StringMap& to) {
  for (const auto& [key, value] : from) to.insert_or_assign(key, value);
}

static absl::Status Apply(const LaunchFile& file, Options& opts) {
  if (!file.build_directory().empty()) {
    const absl::Status status = SetFileName(
        "buildDirectory", file.build_directory(), opts.build_directory);
    if (!status.ok()) return status;
  }
  if (!file.test_output_directory().empty()) {
    const absl::Status status =
        SetFileName("testOutputDirectory", file.test_output_directory(),
                    opts.test_output_directory);
    if (!status.ok()) return status;
  }
  if (file.has_timeout_seconds()) opts.timeout_seconds = file.timeout_seconds();
  if (!file.grace_period().empty()) {
    const absl::Status status =
        SetGracePeriod(file.grace_period(), opts.grace_period);
    if (!status.ok()) return status;
  }
  if (!file.reports_directory().empty()) {
    const absl::Status status = SetFileName(
        "reportsDirectory", file.reports_directory(), opts.reports_directory);
    if (!status.ok()) return status;
  }
  if (file.strict()) opts.strict = true;
  opts.tags.insert(opts.tags.end(), file.tags().cbegin(), file.tags().cend());
  Extend(file.parameters(), opts.parameters);
  if (!file.test_module().empty()) opts.test_module = file.test_module();
  opts.class_path_elements.insert(opts.class_path_elements.end(),
                                  file.class_path_elements().cbegin(),
                                  file.class_path_elements().cend());
  if (!file.class_path_file().empty()) {
    const absl::Status status = SetFileName(
        "classPathFile", file.class_path_file(), opts.class_path_file);
    if (!status.ok()) return status;
  }
  if (!file.java_executable().empty()) {
    const absl::Status status =
        SetFileName("javaExecutable", file.java_executable(), opts.java);
    if (!status.ok()) return status;
  }
  Extend(file.versions(), opts.versions);
  Extend(file.artifacts(), opts.artifacts);
  Extend(file.environment(), opts.environment);
  if (file.skip()) opts.skip = true;
  if (file.debug()) opts.debug = true;
  return absl::OkStatus();
}

absl::Status LoadLaunchFile(const FileName& file, Options& opts) {
  const absl::StatusOr<std::string> json = ReadFile(file);
  if (!json.ok()) return json.status();
  LaunchFile message;
  google::protobuf::json::ParseOptions options;
  options.ignore_unknown_fields = false;
  const absl::Status status =
      google::protobuf::json::JsonStringToMessage(*json, &message, options);
  if (!status.ok()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid launch file %s: %s", file, status.message()));
  }
  return Apply(message, opts);
}

absl::StatusOr<Options> ParseOptions(
    const absl::Span<const std::string_view> args) {
  Options opts;
  for (std::string_view arg : args) {
    if (ConsumePrefix(arg, "--config-file=")) {
      std::optional<FileName> file;
      absl::Status status = SetFileName("--config-file", arg, file);
      if (status.ok()) status = LoadLaunchFile(*file, opts);
      if (!status.ok()) return status;
    }
  }
  for (std::string_view arg : args) {
    absl::Status status;
    if (ConsumePrefix(arg, "--config-file=")) {
      continue;
    } else if (ConsumePrefix(arg, "--build-directory=")) {
      status = SetFileName("--build-directory", arg, opts.build_directory);
    } else if (ConsumePrefix(arg, "--test-output-directory=")) {
      status = SetFileName("--test-output-directory", arg,
                           opts.test_output_directory);
    } else if (ConsumePrefix(arg, "--timeout=")) {
      status = SetTimeout(arg, opts.timeout_seconds);
    } else if (ConsumePrefix(arg, "--grace-period=")) {
      status = SetGracePeriod(arg, opts.grace_period);
    } else if (ConsumePrefix(arg, "--reports-dir=")) {
      status = SetFileName("--reports-dir", arg, opts.reports_directory);
    } else if (arg == "--strict") {
      opts.strict = true;
    } else if (ConsumePrefix(arg, "--tag=")) {
      opts.tags.emplace_back(arg);
    } else if (ConsumePrefix(arg, "--parameter=")) {
      status = SetKeyValue("--parameter", arg, opts.parameters);
    } else if (ConsumePrefix(arg, "--module=")) {
      if (arg.empty()) {
        status = absl::InvalidArgumentError("Empty module name");
      } else {
        opts.test_module = std::string(arg);
      }
    } else if (ConsumePrefix(arg, "--class-path-element=")) {
      opts.class_path_elements.emplace_back(arg);
    } else if (ConsumePrefix(arg, "--class-path-file=")) {
      status = SetFileName("--class-path-file", arg, opts.class_path_file);
    } else if (ConsumePrefix(arg, "--java=")) {
      status = SetFileName("--java", arg, opts.java);
    } else if (ConsumePrefix(arg, "--version=")) {
      status = SetKeyValue("--version", arg, opts.versions);
    } else if (ConsumePrefix(arg, "--artifact=")) {
      status = SetKeyValue("--artifact", arg, opts.artifacts);
    } else if (ConsumePrefix(arg, "--env=")) {
      status = SetKeyValue("--env", arg, opts.environment);
    } else if (arg == "--skip") {
      opts.skip = true;
    } else if (arg == "--debug") {
      opts.debug = true;
    } else {
      status = absl::InvalidArgumentError(
          absl::StrFormat("Invalid command-line argument %s", Quote(arg)));
    }
    if (!status.ok()) return status;
  }
  return opts;
}

absl::StatusOr<LaunchConfiguration> MakeLaunchConfiguration(
    const Options& opts) {
  if (!opts.build_directory.has_value()) {
    return absl::InvalidArgumentError(
        "No build directory given, use --build-directory");
  }
  LaunchConfiguration config(*opts.build_directory);
  config.timeout_seconds = opts.timeout_seconds;
  config.grace_period = opts.grace_period;
  config.reports_path = opts.reports_directory;
  config.strict = opts.strict;
  config.tags = opts.tags;
  config.parameters = opts.parameters;
  config.test_module = opts.test_module;
  return config;
}

absl::StatusOr<std::unique_ptr<ClasspathSource>> MakeClasspathSource(
    const Options& opts) {
  if (opts.class_path_file.has_value()) {
    if (!opts.class_path_elements.empty()) {
      return absl::InvalidArgumentError(
          "Class path elements and a class path file are mutually exclusive");
    }
    return std::unique_ptr<ClasspathSource>(
        std::make_unique<FileClasspathSource>(*opts.class_path_file));
  }
  return std::unique_ptr<ClasspathSource>(
      std::make_unique<ListClasspathSource>(opts.class_path_elements));
}

}  // namespace junit_launcher
