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

#include "junit_launcher/system.h"

#ifdef _WIN32
#  error this file requires a POSIX system
#endif

#include <fcntl.h>
#include <ftw.h>
#include <signal.h>
#include <spawn.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <ios>
#include <iostream>
#include <locale>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/base/attributes.h"
#include "absl/cleanup/cleanup.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "junit_launcher/numeric.h"
#include "junit_launcher/platform.h"
#include "junit_launcher/strings.h"

namespace junit_launcher {

namespace {

absl::Status MakeErrorStatus(const std::error_code& code,
                             const std::string_view function) {
  if (!code) return absl::OkStatus();
  const std::error_condition condition = code.default_error_condition();
  const std::string message =
      absl::StrCat(function, ": ", code.category().name(), "/", code.value(),
                   ": ", code.message());
  return condition.category() == std::generic_category()
             ? absl::ErrnoToStatus(condition.value(), message)
             : absl::UnknownError(message);
}

template <typename... Ts>
absl::Status ErrorStatus(const std::error_code& code,
                         const absl::FormatSpec<Ts...>& format,
                         const Ts&... args) {
  return MakeErrorStatus(code, absl::StrFormat(format, args...));
}

[[nodiscard]] std::error_code ErrnoError() {
  const int code = errno;
  return std::error_code(code, std::generic_category());
}

template <typename... Ts>
absl::Status ErrnoStatus(const absl::FormatSpec<Ts...>& format,
                         const Ts&... args) {
  const std::error_code code = ErrnoError();
  return ErrorStatus(code, format, args...);
}

// Functions like posix_spawn return the error number instead of setting
// errno.
template <typename... Ts>
absl::Status ReturnedStatus(const int error,
                            const absl::FormatSpec<Ts...>& format,
                            const Ts&... args) {
  return ErrorStatus(std::error_code(error, std::generic_category()), format,
                     args...);
}

constexpr absl::Duration kPollInterval = absl::Milliseconds(10);

}  // namespace

absl::StatusOr<FileName> FileName::FromString(const std::string_view string) {
  if (string.empty()) return absl::InvalidArgumentError("Empty filename");
  if (ContainsNull(string)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Filename %s contains null character", Quote(string)));
  }
  return FileName(std::string(string));
}

absl::StatusOr<FileName> FileName::Parent() const {
  std::string string = string_;
  while (string.length() > 1 && string.back() == kSeparator) string.pop_back();
  const std::string::size_type i = string.rfind(kSeparator);
  if (i == string.npos || string == "/") {
    return absl::InvalidArgumentError(
        absl::StrFormat("File %s has no parent", *this));
  }
  const std::string_view element = std::string_view(string).substr(i + 1);
  if (element == "." || element == "..") {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Removing trailing component %s would be ambiguous", element));
  }
  // Root directories need to end in a separator character.
  return FileName::FromString(string.substr(0, i == 0 ? 1 : i));
}

absl::StatusOr<FileName> FileName::Child(const std::string_view child) const {
  if (child == "." || child == ".." || child.find(kSeparator) != child.npos) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "File %s is not a child of %s", Quote(child), *this));
  }
  return this->Join(child);
}

absl::StatusOr<FileName> FileName::Join(const FileName& descendant) const {
  if (descendant.IsAbsolute()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("File name %s is absolute", descendant));
  }
  return FileName::FromString(absl::StrCat(
      string_, string_.back() == kSeparator ? "" : "/", descendant.string_));
}

absl::StatusOr<FileName> FileName::Join(
    const std::string_view descendant) const {
  const absl::StatusOr<FileName> name = FileName::FromString(descendant);
  if (!name.ok()) return name.status();
  return this->Join(*name);
}

bool FileName::IsAbsolute() const { return string_.front() == kSeparator; }

absl::StatusOr<FileName> FileName::MakeAbsolute() const {
  if (this->IsAbsolute()) return *this;
  const absl::StatusOr<FileName> cwd = WorkingDirectory();
  if (!cwd.ok()) return cwd.status();
  return cwd->Join(*this);
}

absl::StatusOr<FileName> FileName::Resolve() const {
  char* const result = realpath(this->pointer(), nullptr);
  if (result == nullptr) return ErrnoStatus("realpath(%#s, nullptr)", *this);
  const absl::Cleanup cleanup = [result] { std::free(result); };
  return FileName::FromString(result);
}

absl::FormatConvertResult<absl::FormatConversionCharSet::kString>
AbslFormatConvert(const FileName& file, const absl::FormatConversionSpec& spec,
                  absl::FormatSink* const sink) {
  CHECK_EQ(spec.conversion_char(), absl::FormatConversionChar::s);
  if (spec.has_alt_flag()) {
    sink->Append(Quote(file.string_));
    return {true};
  }
  return {absl::Format(sink, "%s", file.string_)};
}

void PrintTo(const FileName& file, std::ostream* const stream) {
  *stream << file.string_;
}

absl::StatusOr<FileName> WorkingDirectory() {
  // Assume that we always run on an OS that allocates a buffer when passed a
  // null pointer.
  char* const ptr = getcwd(nullptr, 0);
  if (ptr == nullptr) return ErrnoStatus("getcwd(nullptr, 0)");
  const absl::Cleanup cleanup = [ptr] { std::free(ptr); };
  // See the Linux man page for getcwd(3) why this can happen.
  if (*ptr != '/') {
    return absl::NotFoundError(
        absl::StrFormat("Current working directory %s is unreachable", ptr));
  }
  return FileName::FromString(ptr);
}

absl::StatusOr<std::string> ReadFile(const FileName& file) {
  std::ifstream stream(file.string(), std::ios::in | std::ios::binary);
  if (!stream.is_open() || !stream.good()) {
    return absl::NotFoundError(
        absl::StrFormat("Cannot open file %#s for reading", file));
  }
  stream.imbue(std::locale::classic());

  std::ostringstream buffer;
  buffer.imbue(std::locale::classic());
  buffer << stream.rdbuf();
  buffer.flush();
  // Reading an empty file sets failbit on the output stream.
  if (stream.bad() || buffer.bad()) {
    return absl::DataLossError(absl::StrFormat("Cannot read file %#s", file));
  }
  return buffer.str();
}

absl::Status WriteFile(const FileName& file, const std::string_view contents) {
  std::ofstream stream(file.string(),
                       std::ios::out | std::ios::trunc | std::ios::binary);
  if (!stream.is_open() || !stream.good()) {
    return absl::UnknownError(
        absl::StrFormat("Cannot open file %#s for writing", file));
  }
  stream.imbue(std::locale::classic());
  const std::optional<std::streamsize> count =
      CastNumber<std::streamsize>(contents.size());
  if (!count.has_value()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Content too big (%d bytes)", contents.size()));
  }
  stream.write(contents.data(), *count);
  stream.flush();
  if (!stream.good()) {
    return absl::DataLossError(
        absl::StrFormat("Cannot write %d bytes to file %#s", *count, file));
  }
  return absl::OkStatus();
}

bool FileExists(const FileName& file) {
  struct stat st;
  return lstat(file.pointer(), &st) == 0;
}

bool IsDirectory(const FileName& file) {
  struct stat st;
  return stat(file.pointer(), &st) == 0 && S_ISDIR(st.st_mode);
}

absl::Status Unlink(const FileName& file) {
  if (unlink(file.pointer()) != 0) return ErrnoStatus("unlink(%#s)", file);
  return absl::OkStatus();
}

absl::Status CreateDirectory(const FileName& name) {
  constexpr mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO;
  if (mkdir(name.pointer(), mode) != 0) {
    return ErrnoStatus("mkdir(%#s, %#04o)", name, mode);
  }
  return absl::OkStatus();
}

static absl::Status DoCreateDirectories(const FileName& name, const int depth) {
  if (depth > 100) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Potential filesystem loop when creating directory %s", name));
  }
  CHECK(name.IsAbsolute());
  if (IsDirectory(name)) return absl::OkStatus();
  const absl::StatusOr<FileName> parent = name.Parent();
  if (!parent.ok()) return parent.status();
  const absl::Status status = DoCreateDirectories(*parent, depth + 1);
  if (!status.ok()) return status;
  return CreateDirectory(name);
}

absl::Status CreateDirectories(const FileName& name) {
  const absl::StatusOr<FileName> abs = name.MakeAbsolute();
  if (!abs.ok()) return abs.status();
  return DoCreateDirectories(*abs, 0);
}

static int Remove(const char* const name, const struct stat*, const int type,
                  struct FTW* const ftw) {
  switch (type) {
    case FTW_DP:
      return rmdir(name);
    case FTW_F:
    case FTW_SL:
      return unlink(name);
    default:
      LOG(ERROR) << "File " << name << " encountered at level " << ftw->level
                 << " has unsupported type " << type;
      errno = ENOTSUP;
      return -1;
  }
}

absl::Status RemoveTree(const FileName& directory) {
  const absl::StatusOr<FileName> abs = directory.MakeAbsolute();
  if (!abs.ok()) return abs.status();
  constexpr int fd_limit = 100;
  constexpr int flags = FTW_DEPTH | FTW_MOUNT | FTW_PHYS;
  if (nftw(abs->pointer(), Remove, fd_limit, flags) != 0) {
    return ErrnoStatus("nftw(%#s, ..., %d, %#x)", *abs, fd_limit, flags);
  }
  return absl::OkStatus();
}

absl::StatusOr<FileName> CreateTemporaryDirectory() {
  const char* const dir = std::getenv("TMPDIR");
  std::string buffer = absl::StrCat(
      dir == nullptr || *dir == '\0' ? "/tmp" : dir, "/junit_launcher.XXXXXX");
  char* const name = mkdtemp(buffer.data());
  if (name == nullptr) return ErrnoStatus("mkdtemp(%#s)", buffer);
  const absl::StatusOr<FileName> result = FileName::FromString(name);
  if (!result.ok()) {
    if (rmdir(name) != 0) LOG(ERROR) << ErrnoStatus("rmdir(%#s)", name);
    return result.status();
  }
  return *std::move(result);
}

absl::StatusOr<FileName> SearchPath(const FileName& program) {
  // See the description of PATH at
  // https://pubs.opengroup.org/onlinepubs/9799919799/basedefs/V1_chap08.html#tag_08_03.
  const std::string& string = program.string();
  if (string.find(kSeparator) != string.npos) return program;
  const char* const path = std::getenv("PATH");
  if (path == nullptr) {
    return absl::NotFoundError("PATH environment variable not set");
  }
  for (const std::string_view dir : absl::StrSplit(path, kPathListSeparator)) {
    std::string file(dir.empty() ? "." : dir);
    if (file.back() != kSeparator) file += kSeparator;
    file += string;
    if (access(file.c_str(), X_OK) == 0) return FileName::FromString(file);
  }
  return absl::NotFoundError(
      absl::StrFormat("Program %s not found in PATH %s", program, path));
}

absl::Status Environment::Check(const std::string_view key,
                                const std::string_view value) {
  if (key.empty()) {
    return absl::InvalidArgumentError("Empty environment variable name");
  }
  if (key.find('=') != key.npos) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Environment variable name %s contains equals sign", Quote(key)));
  }
  if (ContainsNull(key)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Environment variable name %s contains null character", Quote(key)));
  }
  if (ContainsNull(value)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Value %s for environment variable %s contains null character",
        Quote(value), key));
  }
  return absl::OkStatus();
}

absl::StatusOr<Environment> Environment::Current() {
  Map map;
  for (char** ptr = environ; *ptr != nullptr; ++ptr) {
    const std::string_view var = *ptr;
    const std::string_view::size_type i = var.find('=');
    if (i == 0 || i == var.npos) {
      return absl::FailedPreconditionError(
          absl::StrFormat("Invalid environment block entry %s", Quote(var)));
    }
    const std::string_view key = var.substr(0, i);
    const auto [it, ok] = map.emplace(key, var.substr(i + 1));
    if (!ok) {
      return absl::AlreadyExistsError(
          absl::StrFormat("Duplicate environment variable %s", key));
    }
  }
  return Environment(std::move(map));
}

absl::Status Environment::Add(const std::string_view key,
                              const std::string_view value) {
  if (const absl::Status status = Check(key, value); !status.ok()) {
    return status;
  }
  map_.emplace(key, value);
  return absl::OkStatus();
}

std::vector<std::string> Environment::ToEntries() const {
  std::vector<std::string> result;
  result.reserve(map_.size());
  for (const auto& [key, value] : map_) {
    result.push_back(absl::StrCat(key, "=", value));
  }
  absl::c_sort(result);
  return result;
}

static void FlushEverything() {
  std::cout.flush();
  std::cerr.flush();
  if (std::fflush(nullptr) != 0) LOG(ERROR) << ErrnoStatus("fflush(nullptr)");
}

static std::vector<char*> Pointers(
    std::vector<std::string>& strings ABSL_ATTRIBUTE_LIFETIME_BOUND) {
  std::vector<char*> ptrs;
  for (std::string& s : strings) {
    CHECK(!ContainsNull(s)) << s << " contains null character";
    ptrs.push_back(s.data());
  }
  ptrs.push_back(nullptr);
  return ptrs;
}

static absl::Status RedirectTo(posix_spawn_file_actions_t& actions,
                               const int fd, const FileName& file) {
  constexpr int oflag = O_WRONLY | O_CREAT | O_TRUNC | O_NOCTTY;
  constexpr mode_t mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  const int error = posix_spawn_file_actions_addopen(
      &actions, fd, file.pointer(), oflag, mode);
  if (error != 0) {
    return ReturnedStatus(
        error, "posix_spawn_file_actions_addopen(..., %d, %#s, %#x, %#04o)",
        fd, file, oflag, mode);
  }
  return absl::OkStatus();
}

absl::StatusOr<Process> Process::Start(const FileName& program,
                                       const absl::Span<const std::string> args,
                                       const Environment& env,
                                       const ProcessOptions& options) {
  for (const std::string& arg : args) {
    if (ContainsNull(arg)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Argument %s contains null character", Quote(arg)));
    }
  }
  const std::string& string = program.string();
  if (string.find(kSeparator) == string.npos) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Program name %s doesn’t contain a directory separator character",
        program));
  }
  const absl::StatusOr<FileName> abs_program = program.MakeAbsolute();
  if (!abs_program.ok()) return abs_program.status();
  std::vector<std::string> args_vec = {program.string()};
  args_vec.insert(args_vec.end(), args.cbegin(), args.cend());
  std::vector<std::string> final_env = env.ToEntries();

  posix_spawn_file_actions_t actions;
  if (const int error = posix_spawn_file_actions_init(&actions); error != 0) {
    return ReturnedStatus(error, "posix_spawn_file_actions_init");
  }
  const absl::Cleanup cleanup = [&actions] {
    if (const int error = posix_spawn_file_actions_destroy(&actions);
        error != 0) {
      LOG(ERROR) << ReturnedStatus(error, "posix_spawn_file_actions_destroy");
    }
  };
  if (options.output_file.has_value()) {
    const absl::Status status =
        RedirectTo(actions, STDOUT_FILENO, *options.output_file);
    if (!status.ok()) return status;
    if (!options.error_file.has_value()) {
      const int error = posix_spawn_file_actions_adddup2(
          &actions, STDOUT_FILENO, STDERR_FILENO);
      if (error != 0) {
        return ReturnedStatus(error,
                              "posix_spawn_file_actions_adddup2(..., %d, %d)",
                              STDOUT_FILENO, STDERR_FILENO);
      }
    }
  }
  if (options.error_file.has_value()) {
    const absl::Status status =
        RedirectTo(actions, STDERR_FILENO, *options.error_file);
    if (!status.ok()) return status;
  }
  const std::vector<char*> argv = Pointers(args_vec);
  const std::vector<char*> envp = Pointers(final_env);
  FlushEverything();
  pid_t pid;
  const int error = posix_spawn(&pid, abs_program->pointer(), &actions, nullptr,
                                argv.data(), envp.data());
  if (error != 0) {
    return ReturnedStatus(error, "posix_spawn(..., %#s)", *abs_program);
  }
  return Process(pid);
}

[[nodiscard]] static int ExitCode(const int wstatus) {
  if (WIFEXITED(wstatus)) return WEXITSTATUS(wstatus);
  if (WIFSIGNALED(wstatus)) return 128 + WTERMSIG(wstatus);
  return 0xFF;
}

absl::StatusOr<int> Process::Wait(const absl::Time deadline) {
  CHECK(pid_.has_value()) << "process has already been reaped";
  const pid_t pid = *pid_;
  const int flags = deadline == absl::InfiniteFuture() ? 0 : WNOHANG;
  while (true) {
    int wstatus;
    const pid_t result = waitpid(pid, &wstatus, flags);
    if (result == pid) {
      pid_.reset();
      return ExitCode(wstatus);
    }
    if (result < 0) {
      const std::error_code code = ErrnoError();
      // The process is gone, so there’s nothing left to kill.
      if (code == std::errc::no_child_process) pid_.reset();
      return ErrorStatus(code, "waitpid(%d, ..., %#x)", pid, flags);
    }
    const absl::Time now = absl::Now();
    if (now >= deadline) {
      return absl::DeadlineExceededError(absl::StrFormat(
          "Deadline %v exceeded waiting for process %d", deadline, pid));
    }
    absl::SleepFor(std::min(kPollInterval, deadline - now));
  }
}

absl::Status Process::Terminate(const absl::Duration grace_period) {
  CHECK(pid_.has_value()) << "process has already been reaped";
  const pid_t pid = *pid_;
  LOG(WARNING) << "Sending SIGTERM to process " << pid;
  if (kill(pid, SIGTERM) != 0 && errno != ESRCH) {
    return ErrnoStatus("kill(%d, SIGTERM)", pid);
  }
  absl::StatusOr<int> code = this->Wait(absl::Now() + grace_period);
  if (code.ok()) return absl::OkStatus();
  if (!absl::IsDeadlineExceeded(code.status())) return code.status();
  LOG(WARNING) << "Process " << pid << " didn’t exit within " << grace_period
               << ", sending SIGKILL";
  if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
    return ErrnoStatus("kill(%d, SIGKILL)", pid);
  }
  code = this->Wait();
  return code.status();
}

void Process::Kill() noexcept {
  if (!pid_.has_value()) return;
  const pid_t pid = *pid_;
  pid_.reset();
  LOG(WARNING) << "Killing process " << pid << ", which is still running";
  if (kill(pid, SIGKILL) != 0) {
    LOG(ERROR) << ErrnoStatus("kill(%d, SIGKILL)", pid);
  }
  int wstatus;
  while (waitpid(pid, &wstatus, 0) < 0) {
    if (errno != EINTR) {
      LOG(ERROR) << ErrnoStatus("waitpid(%d, ..., 0)", pid);
      break;
    }
  }
}

}  // namespace junit_launcher
