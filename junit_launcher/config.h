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

#ifndef JUNIT_LAUNCHER_CONFIG_H_
#define JUNIT_LAUNCHER_CONFIG_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "junit_launcher/classpath.h"
#include "junit_launcher/options.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

// Settings for one launch of the console launcher.  Built once before the
// launch and not modified afterwards.
struct LaunchConfiguration final {
  explicit LaunchConfiguration(FileName build_directory)
      : build_directory(std::move(build_directory)) {}

  // Receives the output files of the console launcher.
  FileName build_directory;

  std::uint64_t timeout_seconds = kDefaultTimeoutSeconds;

  // Time between SIGTERM and SIGKILL once the timeout has elapsed.
  absl::Duration grace_period = kDefaultGracePeriod;

  std::optional<FileName> reports_path;

  // Fail if no tests are found.
  bool strict = false;

  // Tag expressions, passed through unchanged.
  std::vector<std::string> tags;

  absl::flat_hash_map<std::string, std::string> parameters;

  // If set, run in module mode and select this module.
  std::optional<std::string> test_module;
};

// Parses command-line flags, not including the program name.  A
// --config-file flag is applied before all other flags, regardless of its
// position.
absl::StatusOr<Options> ParseOptions(absl::Span<const std::string_view> args);

// Reads a JSON launch file (see launch.proto) into opts.  Scalar settings
// replace existing values; lists and maps are extended.
absl::Status LoadLaunchFile(const FileName& file, Options& opts);

absl::StatusOr<LaunchConfiguration> MakeLaunchConfiguration(
    const Options& opts);

absl::StatusOr<std::unique_ptr<ClasspathSource>> MakeClasspathSource(
    const Options& opts);

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_CONFIG_H_
