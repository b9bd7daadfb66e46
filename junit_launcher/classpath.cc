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

#include "junit_launcher/classpath.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/types/span.h"

#include "junit_launcher/context.h"
#include "junit_launcher/platform.h"
#include "junit_launcher/strings.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

absl::StatusOr<std::vector<std::string>> FileClasspathSource::Elements()
    const {
  const absl::StatusOr<std::string> contents = ReadFile(file_);
  if (!contents.ok()) return contents.status();
  std::vector<std::string> result;
  for (std::string_view line : absl::StrSplit(*contents, '\n')) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (!line.empty()) result.emplace_back(line);
  }
  return result;
}

absl::StatusOr<std::vector<FileName>> ResolveClasspathEntries(
    const Context& context, const absl::Span<const std::string> elements) {
  std::vector<FileName> result;
  absl::flat_hash_set<FileName> seen;
  for (const std::string& element : elements) {
    const absl::StatusOr<FileName> name = FileName::FromString(element);
    if (!name.ok()) {
      LOG(WARNING) << "Ignoring class path element " << Quote(element) << ": "
                   << name.status();
      continue;
    }
    const absl::StatusOr<FileName> abs = name->MakeAbsolute();
    if (!abs.ok()) return abs.status();
    if (!FileExists(*abs)) {
      LOG_IF(INFO, context.debug()) << "   X " << *abs << " // doesn't exist";
      continue;
    }
    const absl::StatusOr<FileName> resolved = abs->Resolve();
    if (absl::IsNotFound(resolved.status())) {
      // Dangling symbolic link.
      LOG_IF(INFO, context.debug()) << "   X " << *abs << " // doesn't exist";
      continue;
    }
    if (!resolved.ok()) {
      LOG(WARNING) << "Ignoring class path element " << *abs << ": "
                   << resolved.status();
      continue;
    }
    if (!seen.insert(*resolved).second) {
      LOG_IF(INFO, context.debug()) << "   = " << *resolved << " // duplicate";
      continue;
    }
    LOG_IF(INFO, context.debug()) << "  -> " << *resolved;
    result.push_back(*resolved);
  }
  return result;
}

std::string JoinClasspath(const absl::Span<const FileName> entries) {
  return absl::StrJoin(entries, std::string(1, kPathListSeparator),
                       [](std::string* const out, const FileName& entry) {
                         out->append(entry.string());
                       });
}

absl::StatusOr<std::string> ResolveClasspath(const Context& context,
                                             const ClasspathSource& source) {
  const absl::StatusOr<std::vector<std::string>> elements = source.Elements();
  if (!elements.ok()) {
    return absl::FailedPreconditionError(
        absl::StrCat("Resolving test class-path elements failed: ",
                     elements.status().ToString()));
  }
  const absl::StatusOr<std::vector<FileName>> entries =
      ResolveClasspathEntries(context, *elements);
  if (!entries.ok()) return entries.status();
  return JoinClasspath(*entries);
}

}  // namespace junit_launcher
