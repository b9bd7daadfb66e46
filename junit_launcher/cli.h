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

#ifndef JUNIT_LAUNCHER_CLI_H_
#define JUNIT_LAUNCHER_CLI_H_

#include <string_view>

#include "absl/types/span.h"

namespace junit_launcher {

// Exit statuses for failures of the launcher itself.  The console launcher
// only uses small exit codes, and a process killed by a signal reports at
// most 128 + 64, so none of these collide with test results.
inline constexpr int kProcessErrorStatus = 0xFF;
inline constexpr int kTimedOutStatus = 0xFE;
inline constexpr int kConfigurationErrorStatus = 0xFD;
inline constexpr int kResolutionErrorStatus = 0xFC;

// Converts a result of RunConsoleLauncher into a process exit status.
[[nodiscard]] int ExitStatus(int result);

// Runs the launcher with the given command-line flags, not including the
// program name.  Logs errors and returns the process exit status.
[[nodiscard]] int RunCli(absl::Span<const std::string_view> args);

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_CLI_H_
