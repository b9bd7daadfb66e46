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

#include "junit_launcher/config.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "junit_launcher/classpath.h"
#include "junit_launcher/options.h"
#include "junit_launcher/system.h"

namespace junit_launcher {
namespace {

using absl_testing::IsOk;
using absl_testing::IsOkAndHolds;
using absl_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

TEST(ParseOptionsTest, UsesDefaults) {
  const absl::StatusOr<Options> opts = ParseOptions({});
  ASSERT_THAT(opts, IsOk());
  EXPECT_EQ(opts->build_directory, std::nullopt);
  EXPECT_EQ(opts->timeout_seconds, 300);
  EXPECT_EQ(opts->grace_period, absl::Seconds(5));
  EXPECT_FALSE(opts->strict);
  EXPECT_FALSE(opts->skip);
  EXPECT_FALSE(opts->debug);
  EXPECT_THAT(opts->tags, IsEmpty());
  EXPECT_THAT(opts->parameters, IsEmpty());
  EXPECT_EQ(opts->test_module, std::nullopt);
}

TEST(ParseOptionsTest, ParsesFlags) {
  const std::vector<std::string_view> args = {
      "--build-directory=target",
      "--test-output-directory=target/test-classes",
      "--timeout=42",
      "--grace-period=1500ms",
      "--reports-dir=target/reports",
      "--strict",
      "--tag=fast",
      "--tag=slow",
      "--parameter=a=1",
      "--parameter=b=x=y",
      "--module=com.example.tests",
      "--class-path-element=lib/a.jar",
      "--class-path-element=lib/b.jar",
      "--java=/opt/jdk/bin/java",
      "--version=junit.platform.version=1.10.0",
      "--artifact=org.junit.platform:junit-platform-commons=1.9.3",
      "--env=FOO=bar",
      "--skip",
      "--debug",
  };
  const absl::StatusOr<Options> opts = ParseOptions(args);
  ASSERT_THAT(opts, IsOk());
  EXPECT_THAT(opts->build_directory,
              Optional(FileName::FromString("target").value()));
  EXPECT_THAT(opts->test_output_directory,
              Optional(FileName::FromString("target/test-classes").value()));
  EXPECT_EQ(opts->timeout_seconds, 42);
  EXPECT_EQ(opts->grace_period, absl::Milliseconds(1500));
  EXPECT_THAT(opts->reports_directory,
              Optional(FileName::FromString("target/reports").value()));
  EXPECT_TRUE(opts->strict);
  EXPECT_THAT(opts->tags, ElementsAre("fast", "slow"));
  EXPECT_THAT(opts->parameters,
              UnorderedElementsAre(Pair("a", "1"), Pair("b", "x=y")));
  EXPECT_THAT(opts->test_module, Optional(std::string("com.example.tests")));
  EXPECT_THAT(opts->class_path_elements, ElementsAre("lib/a.jar", "lib/b.jar"));
  EXPECT_THAT(opts->java,
              Optional(FileName::FromString("/opt/jdk/bin/java").value()));
  EXPECT_THAT(opts->versions,
              ElementsAre(Pair("junit.platform.version", "1.10.0")));
  EXPECT_THAT(opts->artifacts,
              ElementsAre(Pair("org.junit.platform:junit-platform-commons",
                               "1.9.3")));
  EXPECT_THAT(opts->environment, ElementsAre(Pair("FOO", "bar")));
  EXPECT_TRUE(opts->skip);
  EXPECT_TRUE(opts->debug);
}

TEST(ParseOptionsTest, LaterParametersWin) {
  const std::vector<std::string_view> args = {"--parameter=a=1",
                                              "--parameter=a=2"};
  const absl::StatusOr<Options> opts = ParseOptions(args);
  ASSERT_THAT(opts, IsOk());
  EXPECT_THAT(opts->parameters, ElementsAre(Pair("a", "2")));
}

TEST(ParseOptionsTest, RejectsInvalidArguments) {
  for (const std::string_view arg :
       {"--unknown", "positional", "--timeout=abc", "--timeout=-1",
        "--grace-period=-1s", "--grace-period=5", "--parameter=novalue",
        "--parameter==value", "--module=", "--build-directory=",
        "--strict=true"}) {
    EXPECT_THAT(ParseOptions({arg}),
                StatusIs(absl::StatusCode::kInvalidArgument))
        << arg;
  }
}

class LaunchFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<FileName> dir = CreateTemporaryDirectory();
    ASSERT_THAT(dir, IsOk());
    dir_ = *dir;
  }

  void TearDown() override {
    if (dir_.has_value()) EXPECT_THAT(RemoveTree(*dir_), IsOk());
  }

  FileName Write(const std::string_view contents) const {
    const FileName file = dir_->Child("launch.json").value();
    EXPECT_THAT(WriteFile(file, contents), IsOk());
    return file;
  }

 private:
  std::optional<FileName> dir_;
};

TEST_F(LaunchFileTest, LoadsFile) {
  const FileName file = Write(R"js({
    "buildDirectory": "/work/target",
    "timeoutSeconds": 30,
    "gracePeriod": "2s",
    "strict": true,
    "tags": ["fast"],
    "parameters": {"k": "v"},
    "testModule": "com.example.tests",
    "classPathFile": "/work/classpath.txt",
    "javaExecutable": "/opt/jdk/bin/java",
    "versions": {"junit.jupiter.version": "5.10.0"},
    "artifacts": {"org.junit.jupiter:junit-jupiter-api": "5.9.0"},
    "environment": {"FOO": "bar"},
    "debug": true
  })js");
  Options opts;
  ASSERT_THAT(LoadLaunchFile(file, opts), IsOk());
  EXPECT_THAT(opts.build_directory,
              Optional(FileName::FromString("/work/target").value()));
  EXPECT_EQ(opts.timeout_seconds, 30);
  EXPECT_EQ(opts.grace_period, absl::Seconds(2));
  EXPECT_TRUE(opts.strict);
  EXPECT_THAT(opts.tags, ElementsAre("fast"));
  EXPECT_THAT(opts.parameters, ElementsAre(Pair("k", "v")));
  EXPECT_THAT(opts.test_module, Optional(std::string("com.example.tests")));
  EXPECT_THAT(opts.class_path_file,
              Optional(FileName::FromString("/work/classpath.txt").value()));
  EXPECT_THAT(opts.java,
              Optional(FileName::FromString("/opt/jdk/bin/java").value()));
  EXPECT_THAT(opts.versions,
              ElementsAre(Pair("junit.jupiter.version", "5.10.0")));
  EXPECT_THAT(opts.artifacts,
              ElementsAre(
                  Pair("org.junit.jupiter:junit-jupiter-api", "5.9.0")));
  EXPECT_THAT(opts.environment, ElementsAre(Pair("FOO", "bar")));
  EXPECT_FALSE(opts.skip);
  EXPECT_TRUE(opts.debug);
}

TEST_F(LaunchFileTest, KeepsDefaultsForMissingFields) {
  const FileName file = Write("{}");
  Options opts;
  ASSERT_THAT(LoadLaunchFile(file, opts), IsOk());
  EXPECT_EQ(opts.timeout_seconds, kDefaultTimeoutSeconds);
  EXPECT_EQ(opts.grace_period, kDefaultGracePeriod);
  EXPECT_EQ(opts.build_directory, std::nullopt);
}

TEST_F(LaunchFileTest, FlagsOverrideFile) {
  const FileName file = Write(R"js({
    "buildDirectory": "/work/target",
    "timeoutSeconds": 30,
    "tags": ["fast"],
    "parameters": {"k": "v", "l": "w"}
  })js");
  const std::string config_flag = absl::StrCat("--config-file=", file.string());
  const std::vector<std::string_view> args = {
      "--timeout=60", "--tag=slow", "--parameter=k=x", config_flag};
  const absl::StatusOr<Options> opts = ParseOptions(args);
  ASSERT_THAT(opts, IsOk());
  EXPECT_THAT(opts->build_directory,
              Optional(FileName::FromString("/work/target").value()));
  EXPECT_EQ(opts->timeout_seconds, 60);
  EXPECT_THAT(opts->tags, ElementsAre("fast", "slow"));
  EXPECT_THAT(opts->parameters,
              UnorderedElementsAre(Pair("k", "x"), Pair("l", "w")));
}

TEST_F(LaunchFileTest, RejectsMalformedFile) {
  Options opts;
  EXPECT_THAT(LoadLaunchFile(Write("{"), opts),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(LoadLaunchFile(Write(R"js({"unknownField": 1})js"), opts),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(LoadLaunchFile(Write(R"js({"gracePeriod": "soon"})js"), opts),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(LaunchFileTest, RejectsMissingFile) {
  const std::vector<std::string_view> args = {
      "--config-file=/nonexisting/launch.json"};
  EXPECT_THAT(ParseOptions(args), StatusIs(absl::StatusCode::kNotFound));
}

TEST(MakeLaunchConfigurationTest, RequiresBuildDirectory) {
  EXPECT_THAT(MakeLaunchConfiguration(Options()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(MakeLaunchConfigurationTest, CopiesSettings) {
  const std::vector<std::string_view> args = {
      "--build-directory=/work/target", "--timeout=7",  "--strict",
      "--tag=fast",                     "--module=mod", "--reports-dir=/r"};
  const absl::StatusOr<Options> opts = ParseOptions(args);
  ASSERT_THAT(opts, IsOk());
  const absl::StatusOr<LaunchConfiguration> config =
      MakeLaunchConfiguration(*opts);
  ASSERT_THAT(config, IsOk());
  EXPECT_EQ(config->build_directory,
            FileName::FromString("/work/target").value());
  EXPECT_EQ(config->timeout_seconds, 7);
  EXPECT_EQ(config->grace_period, kDefaultGracePeriod);
  EXPECT_TRUE(config->strict);
  EXPECT_THAT(config->tags, ElementsAre("fast"));
  EXPECT_THAT(config->test_module, Optional(std::string("mod")));
  EXPECT_THAT(config->reports_path,
              Optional(FileName::FromString("/r").value()));
}

TEST(MakeClasspathSourceTest, UsesExplicitElements) {
  Options opts;
  opts.class_path_elements = {"a.jar", "b.jar"};
  const absl::StatusOr<std::unique_ptr<ClasspathSource>> source =
      MakeClasspathSource(opts);
  ASSERT_THAT(source, IsOk());
  EXPECT_THAT((*source)->Elements(),
              IsOkAndHolds(ElementsAre("a.jar", "b.jar")));
}

TEST(MakeClasspathSourceTest, RejectsBothSources) {
  Options opts;
  opts.class_path_elements = {"a.jar"};
  opts.class_path_file = FileName::FromString("classpath.txt").value();
  EXPECT_THAT(MakeClasspathSource(opts),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace junit_launcher
