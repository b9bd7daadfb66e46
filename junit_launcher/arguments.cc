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

#include "junit_launcher/arguments.h"

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/strings/str_cat.h"

#include "junit_launcher/config.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

namespace {

// Appends the Java options that select the class or module path and the main
// class or module.
struct ModeArgs final {
  void operator()(const ClasspathMode& mode) const {
    args.push_back("--class-path");
    args.push_back(mode.class_path);
    args.emplace_back(kConsoleLauncherClass);
  }

  void operator()(const ModuleMode& mode) const {
    args.push_back("--module-path");
    args.push_back(mode.module_path);
    args.push_back("--add-modules");
    args.push_back("ALL-MODULE-PATH,ALL-DEFAULT");
    args.push_back("--module");
    args.emplace_back(kConsoleLauncherModule);
  }

  std::vector<std::string>& args;
};

// Appends the console launcher options that select the tests.
struct SelectArgs final {
  void operator()(const ClasspathMode&) const {
    args.push_back("--scan-class-path");
  }

  void operator()(const ModuleMode& mode) const {
    args.push_back("--select-module");
    args.push_back(mode.module_name);
  }

  std::vector<std::string>& args;
};

}  // namespace

ExecutionMode SelectExecutionMode(const LaunchConfiguration& config,
                                  std::string resolved_path) {
  if (config.test_module.has_value()) {
    return ModuleMode{std::move(resolved_path), *config.test_module};
  }
  return ClasspathMode{std::move(resolved_path)};
}

std::string ConfigArgument(const std::string_view key,
                           const std::string_view value) {
  return absl::StrCat("--config=\"", key, "\"=\"", value, "\"");
}

std::vector<std::string> BuildCommandLine(const FileName& interpreter,
                                          const LaunchConfiguration& config,
                                          const ExecutionMode& mode) {
  std::vector<std::string> args = {interpreter.string()};
  std::visit(ModeArgs{args}, mode);

  // See
  // https://junit.org/junit5/docs/current/user-guide/#running-tests-console-launcher-options.
  args.push_back("--disable-ansi-colors");
  if (config.strict) args.push_back("--fail-if-no-tests");
  args.insert(args.end(), config.tags.cbegin(), config.tags.cend());

  // Sort parameters so that the command line doesn’t depend on hash order.
  std::vector<std::pair<std::string_view, std::string_view>> parameters(
      config.parameters.cbegin(), config.parameters.cend());
  absl::c_sort(parameters);
  for (const auto& [key, value] : parameters) {
    args.push_back(ConfigArgument(key, value));
  }

  if (config.reports_path.has_value()) {
    args.push_back("--reports-dir");
    args.push_back(config.reports_path->string());
  }
  std::visit(SelectArgs{args}, mode);
  return args;
}

std::vector<std::string> BuildCommandLine(
    const FileName& interpreter, const LaunchConfiguration& config,
    const std::string_view resolved_path) {
  return BuildCommandLine(
      interpreter, config,
      SelectExecutionMode(config, std::string(resolved_path)));
}

}  // namespace junit_launcher
