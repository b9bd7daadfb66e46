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

#ifndef JUNIT_LAUNCHER_PLATFORM_H_
#define JUNIT_LAUNCHER_PLATFORM_H_

#if !defined __cplusplus || __cplusplus < 201703L
#  error this file requires at least C++17
#endif

#include <string_view>

namespace junit_launcher {

constexpr inline bool kWindows =
#ifdef _WIN32
    true
#else
    false
#endif
    ;

inline constexpr char kSeparator = kWindows ? '\\' : '/';

// Separates the elements of a class or module path.
inline constexpr char kPathListSeparator = kWindows ? ';' : ':';

// Names of the files that receive the console launcher’s standard output and
// standard error.
inline constexpr std::string_view kOutputFileName =
    "junit-console-launcher.out.txt";
inline constexpr std::string_view kErrorFileName =
    "junit-console-launcher.err.txt";

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_PLATFORM_H_
