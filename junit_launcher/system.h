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

#ifndef JUNIT_LAUNCHER_SYSTEM_H_
#define JUNIT_LAUNCHER_SYSTEM_H_

#include <sys/types.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "junit_launcher/strings.h"

namespace junit_launcher {

class FileName final {
 public:
  static absl::StatusOr<FileName> FromString(std::string_view string);

  FileName(const FileName&) = default;
  FileName& operator=(const FileName&) = default;
  FileName(FileName&&) = default;
  FileName& operator=(FileName&&) = default;

  const std::string& string() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    CHECK(!string_.empty());
    return string_;
  }

  const char* pointer() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    CHECK(!string_.empty());
    CHECK(!ContainsNull(string_));
    return string_.c_str();
  }

  absl::StatusOr<FileName> Parent() const;
  absl::StatusOr<FileName> Child(std::string_view child) const;
  absl::StatusOr<FileName> Join(const FileName& descendant) const;
  absl::StatusOr<FileName> Join(std::string_view descendant) const;

  bool IsAbsolute() const;
  absl::StatusOr<FileName> MakeAbsolute() const;

  // Returns the canonical absolute name of an existing file, with all
  // symbolic links resolved.
  absl::StatusOr<FileName> Resolve() const;

  friend bool operator==(const FileName& a, const FileName& b) {
    return a.string_ == b.string_;
  }

  friend bool operator!=(const FileName& a, const FileName& b) {
    return a.string_ != b.string_;
  }

  friend bool operator<(const FileName& a, const FileName& b) {
    return a.string_ < b.string_;
  }

  template <typename H>
  friend H AbslHashValue(H state, const FileName& name) {
    return H::combine(std::move(state), name.string_);
  }

  // Supports %s and %#s; the latter quotes the name.
  friend absl::FormatConvertResult<absl::FormatConversionCharSet::kString>
  AbslFormatConvert(const FileName& file,
                    const absl::FormatConversionSpec& spec,
                    absl::FormatSink* sink);

  friend std::ostream& operator<<(std::ostream& stream, const FileName& file) {
    return stream << file.string_;
  }

  friend void PrintTo(const FileName& file, std::ostream* stream);

 private:
  explicit FileName(std::string string) : string_(std::move(string)) {
    CHECK(!string_.empty());
  }

  std::string string_;
};

absl::StatusOr<std::string> ReadFile(const FileName& file);
absl::Status WriteFile(const FileName& file, std::string_view contents);
[[nodiscard]] bool FileExists(const FileName& file);
[[nodiscard]] bool IsDirectory(const FileName& file);
absl::Status Unlink(const FileName& file);
absl::Status CreateDirectory(const FileName& name);
absl::Status CreateDirectories(const FileName& name);
absl::Status RemoveTree(const FileName& directory);
absl::StatusOr<FileName> CreateTemporaryDirectory();
absl::StatusOr<FileName> WorkingDirectory();

// Looks up a program in the directories listed in PATH.  Names containing a
// slash are returned unchanged.
absl::StatusOr<FileName> SearchPath(const FileName& program);

class Environment final {
 private:
  using Map = absl::flat_hash_map<std::string, std::string>;

 public:
  static absl::StatusOr<Environment> Current();

  template <typename I>
  static absl::StatusOr<Environment> Create(I begin, const I end) {
    Map map;
    for (; begin != end; ++begin) {
      const auto& [key, value] = *begin;
      if (const absl::Status status = Check(key, value); !status.ok()) {
        return status;
      }
      const auto [it, ok] = map.emplace(key, value);
      if (!ok) {
        return absl::AlreadyExistsError(
            absl::StrFormat("Duplicate environment variable %s", key));
      }
    }
    return Environment(std::move(map));
  }

  using value_type = Map::value_type;
  using const_iterator = Map::const_iterator;
  using size_type = Map::size_type;

  Environment() = default;
  Environment(const Environment&) = default;
  Environment& operator=(const Environment&) = default;
  Environment(Environment&&) = default;
  Environment& operator=(Environment&&) = default;

  const_iterator begin() const { return map_.begin(); }
  const_iterator end() const { return map_.end(); }
  size_type size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }

  friend bool operator==(const Environment& a, const Environment& b) {
    return a.map_ == b.map_;
  }
  friend bool operator!=(const Environment& a, const Environment& b) {
    return a.map_ != b.map_;
  }

  // Returns an empty string if the variable isn’t set.
  std::string_view Get(const std::string_view key) const
      ABSL_ATTRIBUTE_LIFETIME_BOUND {
    const auto it = map_.find(key);
    return it == map_.end() ? std::string_view() : it->second;
  }

  // Doesn’t overwrite existing variables.
  absl::Status Add(std::string_view key, std::string_view value);

  // Adds all variables from other that aren’t already present.
  void Merge(const Environment& other) {
    map_.insert(other.begin(), other.end());
  }

  // Returns KEY=VALUE entries, sorted for hermeticity.
  std::vector<std::string> ToEntries() const;

 private:
  explicit Environment(Map map) : map_(std::move(map)) {}

  static absl::Status Check(std::string_view key, std::string_view value);

  Map map_;
};

struct ProcessOptions final {
  // If set, redirect standard output to this file.  If error_file isn’t set,
  // redirect standard error to the same file.
  std::optional<FileName> output_file;

  // If set, redirect standard error to this file.
  std::optional<FileName> error_file;
};

// A running child process.  Once Wait or Terminate has reaped the process,
// the object no longer refers to a process.  Destroying an object that still
// refers to a running process kills and reaps it.
class Process final {
 public:
  // Starts program with the given arguments, not including the program name.
  // Standard input and the working directory are inherited.
  static absl::StatusOr<Process> Start(const FileName& program,
                                       absl::Span<const std::string> args,
                                       const Environment& env,
                                       const ProcessOptions& options = {});

  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;

  Process(Process&& other) : pid_(std::exchange(other.pid_, std::nullopt)) {}

  Process& operator=(Process&& other) {
    Kill();
    pid_ = std::exchange(other.pid_, std::nullopt);
    return *this;
  }

  ~Process() noexcept { Kill(); }

  [[nodiscard]] bool running() const { return pid_.has_value(); }

  pid_t pid() const {
    CHECK(pid_.has_value());
    return *pid_;
  }

  // Waits for the process to exit and returns its exit code.  A process
  // killed by signal N reports 128 + N.  If the deadline passes first,
  // returns a DeadlineExceeded status and leaves the process running.
  absl::StatusOr<int> Wait(absl::Time deadline = absl::InfiniteFuture());

  // Sends SIGTERM, waits for the grace period, then sends SIGKILL.  Returns
  // OK once the process has been reaped.
  absl::Status Terminate(absl::Duration grace_period);

 private:
  explicit Process(const pid_t pid) : pid_(pid) { CHECK_GT(pid, 0); }

  void Kill() noexcept;

  std::optional<pid_t> pid_;
};

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_SYSTEM_H_
