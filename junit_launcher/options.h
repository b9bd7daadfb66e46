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

#ifndef JUNIT_LAUNCHER_OPTIONS_H_
#define JUNIT_LAUNCHER_OPTIONS_H_

#if !defined __cplusplus || __cplusplus < 201703L
#  error this file requires at least C++17
#endif

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/time/time.h"

#include "junit_launcher/system.h"

namespace junit_launcher {

inline constexpr std::uint64_t kDefaultTimeoutSeconds = 300;
inline constexpr absl::Duration kDefaultGracePeriod = absl::Seconds(5);

// Everything the command line and the launch file can specify.
struct Options final {
  // Options describing the test run.
  std::optional<FileName> build_directory;
  std::optional<FileName> test_output_directory;
  std::uint64_t timeout_seconds = kDefaultTimeoutSeconds;
  absl::Duration grace_period = kDefaultGracePeriod;
  std::optional<FileName> reports_directory;
  bool strict = false;
  std::vector<std::string> tags;
  absl::flat_hash_map<std::string, std::string> parameters;
  std::optional<std::string> test_module;

  // Where the class path comes from.  At most one of these may be set.
  std::vector<std::string> class_path_elements;
  std::optional<FileName> class_path_file;

  // Options for the launcher itself.
  std::optional<FileName> java;
  absl::flat_hash_map<std::string, std::string> versions;
  absl::flat_hash_map<std::string, std::string> artifacts;
  absl::flat_hash_map<std::string, std::string> environment;
  bool skip = false;
  bool debug = false;
};

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_OPTIONS_H_
