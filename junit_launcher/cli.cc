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

#include "junit_launcher/cli.h"

#include <cstdlib>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"

#include "junit_launcher/classpath.h"
#include "junit_launcher/config.h"
#include "junit_launcher/context.h"
#include "junit_launcher/launcher.h"
#include "junit_launcher/options.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

static std::string_view JavaHome(const Options& opts) {
  if (const auto it = opts.environment.find("JAVA_HOME");
      it != opts.environment.end()) {
    return it->second;
  }
  const char* const value = std::getenv("JAVA_HOME");
  return value == nullptr ? std::string_view() : std::string_view(value);
}

static void LogDiagnostics(const Options& opts, const VersionTable& versions) {
  LOG(INFO) << "Path";
  LOG(INFO) << "  JAVA_HOME = " << JavaHome(opts);
  const absl::StatusOr<FileName> cwd = WorkingDirectory();
  if (cwd.ok()) {
    LOG(INFO) << "  working directory = " << *cwd;
  } else {
    LOG(WARNING) << "Can’t determine working directory: " << cwd.status();
  }
  LOG(INFO) << "Artifact";
  std::vector<std::pair<std::string_view, std::string_view>> artifacts(
      opts.artifacts.cbegin(), opts.artifacts.cend());
  absl::c_sort(artifacts);
  for (const auto& [artifact, version] : artifacts) {
    LOG(INFO) << absl::StreamFormat("  %-50s -> %s", artifact, version);
  }
  LOG(INFO) << "Version";
  for (const Version& version : kKnownVersions) {
    LOG(INFO) << "  " << version.key << " = " << versions.Lookup(version);
  }
}

int ExitStatus(const int result) {
  switch (result) {
    case kProcessErrorResult:
      return kProcessErrorStatus;
    case kTimedOutResult:
      return kTimedOutStatus;
    default:
      return result;
  }
}

int RunCli(const absl::Span<const std::string_view> args) {
  const absl::StatusOr<Options> opts = ParseOptions(args);
  if (!opts.ok()) {
    LOG(ERROR) << opts.status();
    return kConfigurationErrorStatus;
  }
  if (opts->skip) {
    LOG(INFO) << "JUnit Platform Plugin execution skipped.";
    return EXIT_SUCCESS;
  }

  const VersionTable versions(opts->artifacts, opts->versions);
  LOG(INFO) << "Launching JUnit Platform "
            << versions.Lookup(kJUnitPlatformVersion) << "...";
  if (opts->debug) LogDiagnostics(*opts, versions);

  if (opts->test_output_directory.has_value() &&
      !IsDirectory(*opts->test_output_directory)) {
    LOG(INFO) << "Test output directory does not exist.";
    return EXIT_SUCCESS;
  }

  const absl::StatusOr<LaunchConfiguration> config =
      MakeLaunchConfiguration(*opts);
  if (!config.ok()) {
    LOG(ERROR) << config.status();
    return kConfigurationErrorStatus;
  }
  const absl::StatusOr<std::unique_ptr<ClasspathSource>> source =
      MakeClasspathSource(*opts);
  if (!source.ok()) {
    LOG(ERROR) << source.status();
    return kConfigurationErrorStatus;
  }

  // Without an interpreter there’s nothing to launch.
  const absl::StatusOr<Context> context = Context::Create(*opts);
  if (!context.ok()) {
    LOG(ERROR) << "Can’t prepare the console launcher: " << context.status();
    return kProcessErrorStatus;
  }
  LOG_IF(INFO, context->debug()) << "Interpreter: " << context->interpreter();

  const absl::StatusOr<int> result =
      RunConsoleLauncher(*context, *config, **source);
  if (!result.ok()) {
    LOG(ERROR) << result.status();
    return kResolutionErrorStatus;
  }
  return ExitStatus(*result);
}

}  // namespace junit_launcher
