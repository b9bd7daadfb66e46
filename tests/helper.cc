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

// Test helper that stands in for the Java interpreter.  It prints its
// arguments to standard output, one per line, and writes a line to standard
// error.  The following environment variables control its behavior:
//
// JUNIT_LAUNCHER_HELPER_PRINT_ENV: name of a variable whose value to print
// JUNIT_LAUNCHER_HELPER_IGNORE_TERM: if nonempty, ignore SIGTERM
// JUNIT_LAUNCHER_HELPER_SLEEP: duration to sleep before exiting
// JUNIT_LAUNCHER_HELPER_EXIT: exit code

#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <string_view>

#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/strings/numbers.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

static std::string_view GetEnv(const char* const name) {
  const char* const value = std::getenv(name);
  return value == nullptr ? std::string_view() : std::string_view(value);
}

int main(const int argc, char** const argv) {
  absl::InitializeLog();
  for (int i = 1; i < argc; ++i) std::cout << argv[i] << '\n';
  const char* const print_env = std::getenv("JUNIT_LAUNCHER_HELPER_PRINT_ENV");
  if (print_env != nullptr) {
    std::cout << print_env << '=' << GetEnv(print_env) << '\n';
  }
  std::cout.flush();
  std::cerr << "helper stderr\n" << std::flush;
  if (!GetEnv("JUNIT_LAUNCHER_HELPER_IGNORE_TERM").empty()) {
    if (signal(SIGTERM, SIG_IGN) == SIG_ERR) {
      LOG(ERROR) << "can’t ignore SIGTERM";
      return EXIT_FAILURE;
    }
  }
  if (const std::string_view sleep = GetEnv("JUNIT_LAUNCHER_HELPER_SLEEP");
      !sleep.empty()) {
    absl::Duration duration;
    if (!absl::ParseDuration(sleep, &duration)) {
      LOG(ERROR) << "invalid duration " << sleep;
      return EXIT_FAILURE;
    }
    absl::SleepFor(duration);
  }
  int code = 0;
  const std::string_view exit_code = GetEnv("JUNIT_LAUNCHER_HELPER_EXIT");
  if (!exit_code.empty() && !absl::SimpleAtoi(exit_code, &code)) {
    LOG(ERROR) << "invalid exit code " << exit_code;
    return EXIT_FAILURE;
  }
  return code;
}
