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

#include "junit_launcher/context.h"

#include <optional>
#include <string_view>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

#include "junit_launcher/options.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

std::string_view VersionTable::Lookup(const Version& version) const {
  if (const auto it = overrides_.find(version.key); it != overrides_.end()) {
    return it->second;
  }
  if (const auto it = artifacts_.find(version.artifact);
      it != artifacts_.end()) {
    return it->second;
  }
  return {};
}

absl::StatusOr<FileName> FindJava(const std::optional<FileName>& java,
                                  const Environment& env) {
  if (java.has_value()) {
    const absl::StatusOr<FileName> abs = java->MakeAbsolute();
    if (!abs.ok()) return abs.status();
    return abs->Resolve();
  }
  const std::string_view home = env.Get("JAVA_HOME");
  if (!home.empty()) {
    const absl::StatusOr<FileName> dir = FileName::FromString(home);
    if (!dir.ok()) return dir.status();
    const absl::StatusOr<FileName> file = dir->Join("bin/java");
    if (!file.ok()) return file.status();
    if (FileExists(*file)) {
      const absl::StatusOr<FileName> abs = file->MakeAbsolute();
      if (!abs.ok()) return abs.status();
      return abs->Resolve();
    }
    LOG(WARNING) << absl::StreamFormat(
        "JAVA_HOME is set to %s, but %s doesn’t exist", home, *file);
  }
  const absl::StatusOr<FileName> found =
      SearchPath(FileName::FromString("java").value());
  if (!found.ok()) return found.status();
  const absl::StatusOr<FileName> abs = found->MakeAbsolute();
  if (!abs.ok()) return abs.status();
  return abs->Resolve();
}

absl::StatusOr<Context> Context::Create(const Options& opts) {
  const absl::StatusOr<Environment> current = Environment::Current();
  if (!current.ok()) return current.status();
  Environment env;
  for (const auto& [key, value] : opts.environment) {
    const absl::Status status = env.Add(key, value);
    if (!status.ok()) return status;
  }
  // Explicit settings take precedence over inherited ones.
  env.Merge(*current);
  const absl::StatusOr<FileName> java = FindJava(opts.java, env);
  if (!java.ok()) return java.status();
  return Context(*java, std::move(env),
                 VersionTable(opts.artifacts, opts.versions), opts.debug);
}

}  // namespace junit_launcher
