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

#include "junit_launcher/strings.h"

#include <iomanip>
#include <ios>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace junit_launcher {

std::string Quote(const std::string_view string) {
  std::ostringstream stream;
  stream.exceptions(std::ios::badbit | std::ios::failbit | std::ios::eofbit);
  stream.imbue(std::locale::classic());
  stream << std::quoted(string) << std::flush;
  return stream.str();
}

bool SplitKeyValue(const std::string_view arg,
                   std::pair<std::string, std::string>& result) {
  const std::string_view::size_type i = arg.find('=');
  if (i == 0 || i == arg.npos) return false;
  result.first = std::string(arg.substr(0, i));
  result.second = std::string(arg.substr(i + 1));
  return true;
}

}  // namespace junit_launcher
