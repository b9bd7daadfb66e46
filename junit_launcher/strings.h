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

#ifndef JUNIT_LAUNCHER_STRINGS_H_
#define JUNIT_LAUNCHER_STRINGS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/strip.h"

namespace junit_launcher {

[[nodiscard]] inline constexpr bool ConsumePrefix(
    std::string_view& string, const std::string_view prefix) {
  return absl::ConsumePrefix(&string, prefix);
}

// Returns a C++-style quoted version of the string, for use in messages.
std::string Quote(std::string_view string);

[[nodiscard]] inline bool ContainsNull(const std::string_view string) {
  return string.find('\0') != string.npos;
}

// Splits a KEY=VALUE argument at the first equals sign.  Returns false if
// there is no equals sign or the key is empty.
[[nodiscard]] bool SplitKeyValue(std::string_view arg,
                                 std::pair<std::string, std::string>& result);

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_STRINGS_H_
