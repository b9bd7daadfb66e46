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

#ifndef JUNIT_LAUNCHER_ARGUMENTS_H_
#define JUNIT_LAUNCHER_ARGUMENTS_H_

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "junit_launcher/config.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

// Entry point of the console launcher in class path mode.
inline constexpr std::string_view kConsoleLauncherClass =
    "org.junit.platform.console.ConsoleLauncher";

// Module containing the console launcher in module mode.
inline constexpr std::string_view kConsoleLauncherModule =
    "org.junit.platform.console";

// All dependencies on one flat class path, which is scanned for tests.
struct ClasspathMode final {
  std::string class_path;
};

// Dependencies on the module path; tests are selected by module name.
struct ModuleMode final {
  std::string module_path;
  std::string module_name;
};

using ExecutionMode = std::variant<ClasspathMode, ModuleMode>;

// Module mode if the configuration names a test module, class path mode
// otherwise.
ExecutionMode SelectExecutionMode(const LaunchConfiguration& config,
                                  std::string resolved_path);

// Returns --config="key"="value".  Quotation marks within the key or value
// aren’t escaped.
std::string ConfigArgument(std::string_view key, std::string_view value);

// Returns the command line for the console launcher.  The first element is
// the interpreter.
std::vector<std::string> BuildCommandLine(const FileName& interpreter,
                                          const LaunchConfiguration& config,
                                          const ExecutionMode& mode);

std::vector<std::string> BuildCommandLine(const FileName& interpreter,
                                          const LaunchConfiguration& config,
                                          std::string_view resolved_path);

}  // namespace junit_launcher

#endif  // JUNIT_LAUNCHER_ARGUMENTS_H_
