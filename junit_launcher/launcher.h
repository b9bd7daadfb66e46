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

#ifndef JUNIT_LAUNCHER_LAUNCHER_H_
#define JUNIT_LAUNCHER_LAUNCHER_H_

#include <cstdint>
#include <string>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "junit_launcher/classpath.h"
#include "junit_launcher/config.h"
#include "junit_launcher/context.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

// Result codes for outcomes that don’t have an exit code.  Nonnegative
// results are exit codes of the console launcher.
inline constexpr int kProcessErrorResult = -1;
inline constexpr int kTimedOutResult = -2;

// The console launcher exited normally or was killed by a signal.
struct ExitCode final {
  int code;
};

// The console launcher didn’t finish in time and was terminated.
// termination is OK if the process was reaped.
struct TimedOut final {
  absl::Duration timeout;
  absl::Status termination;
};

// The console launcher couldn’t be started or waited for.
struct ProcessError final {
  absl::Status cause;
};

using LaunchResult = std::variant<ExitCode, TimedOut, ProcessError>;

[[nodiscard]] int ResultCode(const LaunchResult& result);

// Runs command_line, whose first element is the program, and waits at most
// timeout_seconds for it to finish.  Standard output and standard error go to
// files in the target directory, which is created if necessary.
LaunchResult Launch(const Context& context,
                    absl::Span<const std::string> command_line,
                    const FileName& target, std::uint64_t timeout_seconds,
                    absl::Duration grace_period);

// Resolves the class path, builds the command line, and launches the console
// launcher.  Returns an error if the class path can’t be resolved; in that
// case nothing is launched.
absl::StatusOr<int> RunConsoleLauncher(const Context& context,
                                       const LaunchConfiguration& config,
                                       const ClasspathSource& source);

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_LAUNCHER_H_
