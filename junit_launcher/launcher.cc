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

#include "junit_launcher/launcher.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "junit_launcher/arguments.h"
#include "junit_launcher/classpath.h"
#include "junit_launcher/config.h"
#include "junit_launcher/context.h"
#include "junit_launcher/numeric.h"
#include "junit_launcher/platform.h"
#include "junit_launcher/system.h"

namespace junit_launcher {

namespace {

struct ResultCodeVisitor final {
  int operator()(const ExitCode& result) const { return result.code; }
  int operator()(const TimedOut&) const { return kTimedOutResult; }
  int operator()(const ProcessError&) const { return kProcessErrorResult; }
};

}  // namespace

int ResultCode(const LaunchResult& result) {
  return std::visit(ResultCodeVisitor{}, result);
}

static absl::Time Deadline(const std::uint64_t timeout_seconds) {
  const std::optional<std::int64_t> seconds =
      CastNumber<std::int64_t>(timeout_seconds);
  if (!seconds.has_value()) return absl::InfiniteFuture();
  return absl::Now() + absl::Seconds(*seconds);
}

static absl::StatusOr<Process> StartProcess(
    const Context& context, const absl::Span<const std::string> command_line,
    const FileName& target) {
  if (command_line.empty()) {
    return absl::InvalidArgumentError("Empty command line");
  }
  const absl::StatusOr<FileName> program =
      FileName::FromString(command_line.front());
  if (!program.ok()) return program.status();
  if (const absl::Status status = CreateDirectories(target); !status.ok()) {
    return status;
  }
  ProcessOptions options;
  absl::StatusOr<FileName> file = target.Child(kOutputFileName);
  if (!file.ok()) return file.status();
  options.output_file = *std::move(file);
  file = target.Child(kErrorFileName);
  if (!file.ok()) return file.status();
  options.error_file = *std::move(file);
  return Process::Start(*program, command_line.subspan(1),
                        context.environment(), options);
}

LaunchResult Launch(const Context& context,
                    const absl::Span<const std::string> command_line,
                    const FileName& target, const std::uint64_t timeout_seconds,
                    const absl::Duration grace_period) {
  absl::StatusOr<Process> process =
      StartProcess(context, command_line, target);
  if (!process.ok()) return ProcessError{process.status()};
  LOG_IF(INFO, context.debug()) << "Started process " << process->pid();
  const absl::StatusOr<int> code = process->Wait(Deadline(timeout_seconds));
  if (code.ok()) return ExitCode{*code};
  const absl::Duration timeout =
      absl::Seconds(CastNumber<std::int64_t>(timeout_seconds).value_or(0));
  absl::Status termination = absl::OkStatus();
  if (process->running()) termination = process->Terminate(grace_period);
  if (absl::IsDeadlineExceeded(code.status())) {
    return TimedOut{timeout, std::move(termination)};
  }
  if (!termination.ok()) {
    LOG(ERROR) << "Terminating process failed: " << termination;
  }
  return ProcessError{code.status()};
}

absl::StatusOr<int> RunConsoleLauncher(const Context& context,
                                       const LaunchConfiguration& config,
                                       const ClasspathSource& source) {
  const absl::StatusOr<std::string> path = ResolveClasspath(context, source);
  if (!path.ok()) return path.status();
  const std::vector<std::string> command_line =
      BuildCommandLine(context.interpreter(), config, *path);
  LOG_IF(INFO, context.debug())
      << "Starting process (timeout=" << config.timeout_seconds << ")...";
  if (context.debug()) {
    for (const std::string& token : command_line) LOG(INFO) << "  " << token;
  }
  const LaunchResult result =
      Launch(context, command_line, config.build_directory,
             config.timeout_seconds, config.grace_period);
  if (const TimedOut* timed_out = std::get_if<TimedOut>(&result)) {
    LOG(ERROR) << absl::StrFormat("Global timeout reached: %d second(s)",
                                  config.timeout_seconds);
    if (!timed_out->termination.ok()) {
      LOG(ERROR) << "Terminating process failed: " << timed_out->termination;
    }
  } else if (const ProcessError* error = std::get_if<ProcessError>(&result)) {
    LOG(ERROR) << "Executing process failed: " << error->cause;
  }
  return ResultCode(result);
}

}  // namespace junit_launcher
