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

#ifndef JUNIT_LAUNCHER_CLASSPATH_H_
#define JUNIT_LAUNCHER_CLASSPATH_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "junit_launcher/context.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

// Supplies the raw test class path elements.  Elements may be relative or
// refer to files that don’t exist.
class ClasspathSource {
 public:
  virtual ~ClasspathSource() = default;

  // Returns an error if the elements can’t be obtained, for example because
  // dependency resolution hasn’t happened yet.
  virtual absl::StatusOr<std::vector<std::string>> Elements() const = 0;
};

class ListClasspathSource final : public ClasspathSource {
 public:
  explicit ListClasspathSource(std::vector<std::string> elements)
      : elements_(std::move(elements)) {}

  absl::StatusOr<std::vector<std::string>> Elements() const final {
    return elements_;
  }

 private:
  std::vector<std::string> elements_;
};

// Reads elements from a text file, one per line.  Empty lines are ignored.
class FileClasspathSource final : public ClasspathSource {
 public:
  explicit FileClasspathSource(FileName file) : file_(std::move(file)) {}

  absl::StatusOr<std::vector<std::string>> Elements() const final;

 private:
  FileName file_;
};

// Turns raw elements into absolute, symlink-free names of existing files.
// Nonexisting elements and elements that can’t be resolved are skipped,
// duplicates are removed, and the order of first occurrences is preserved.
absl::StatusOr<std::vector<FileName>> ResolveClasspathEntries(
    const Context& context, absl::Span<const std::string> elements);

std::string JoinClasspath(absl::Span<const FileName> entries);

// Obtains the elements from the source and returns the resolved entries
// joined with the platform path list separator.  Failure to obtain the
// elements is reported as FailedPrecondition.
absl::StatusOr<std::string> ResolveClasspath(const Context& context,
                                             const ClasspathSource& source);

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_CLASSPATH_H_
