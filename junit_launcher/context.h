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

#ifndef JUNIT_LAUNCHER_CONTEXT_H_
#define JUNIT_LAUNCHER_CONTEXT_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"

#include "junit_launcher/options.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

// A version that can be looked up in a VersionTable.  The artifact is the
// “group:artifact” key under which the build tool reports the version.
struct Version final {
  std::string_view key;
  std::string_view artifact;
};

inline constexpr Version kJUnitPlatformVersion = {
    "junit.platform.version", "org.junit.platform:junit-platform-commons"};
inline constexpr Version kJUnitJupiterVersion = {
    "junit.jupiter.version", "org.junit.jupiter:junit-jupiter-api"};
inline constexpr Version kJUnitVintageVersion = {
    "junit.vintage.version", "org.junit.vintage:junit-vintage-engine"};

inline constexpr Version kKnownVersions[] = {
    kJUnitPlatformVersion,
    kJUnitJupiterVersion,
    kJUnitVintageVersion,
};

class VersionTable final {
 public:
  using Map = absl::flat_hash_map<std::string, std::string>;

  VersionTable() = default;

  explicit VersionTable(Map artifacts, Map overrides)
      : artifacts_(std::move(artifacts)), overrides_(std::move(overrides)) {}

  // Returns the overridden version if there is one, else the version of the
  // corresponding artifact, else an empty string.
  std::string_view Lookup(const Version& version) const
      ABSL_ATTRIBUTE_LIFETIME_BOUND;

 private:
  Map artifacts_;
  Map overrides_;
};

// Returns the Java executable to launch: the explicit one if given, else
// $JAVA_HOME/bin/java, else java from PATH.  The result is absolute and has
// all symbolic links resolved.
absl::StatusOr<FileName> FindJava(const std::optional<FileName>& java,
                                  const Environment& env);

// State shared by all parts of a launch.  Built once and passed around by
// reference.
class Context final {
 public:
  static absl::StatusOr<Context> Create(const Options& opts);

  explicit Context(FileName interpreter, Environment environment,
                   VersionTable versions, const bool debug)
      : interpreter_(std::move(interpreter)),
        environment_(std::move(environment)),
        versions_(std::move(versions)),
        debug_(debug) {}

  const FileName& interpreter() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return interpreter_;
  }

  // Environment for the child process.
  const Environment& environment() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return environment_;
  }

  const VersionTable& versions() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return versions_;
  }

  // Whether to emit diagnostic log lines.
  bool debug() const { return debug_; }

 private:
  FileName interpreter_;
  Environment environment_;
  VersionTable versions_;
  bool debug_;
};

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_CONTEXT_H_
