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

#include "junit_launcher/numeric.h"

#include <cstddef>
#include <cstdint>
#include <ios>
#include <limits>
#include <optional>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace junit_launcher {
namespace {

using ::testing::Optional;

TEST(InRangeTest, SameSignedness) {
  EXPECT_TRUE(InRange<std::int16_t>(std::int64_t{-32768}));
  EXPECT_FALSE(InRange<std::int16_t>(std::int64_t{-32769}));
  EXPECT_TRUE(InRange<std::int16_t>(std::int64_t{32767}));
  EXPECT_FALSE(InRange<std::int16_t>(std::int64_t{32768}));
  EXPECT_TRUE(InRange<std::int64_t>(std::numeric_limits<std::int8_t>::min()));

  EXPECT_TRUE(InRange<std::uint16_t>(std::uint64_t{65535}));
  EXPECT_FALSE(InRange<std::uint16_t>(std::uint64_t{65536}));
  EXPECT_TRUE(InRange<std::uint64_t>(std::numeric_limits<std::uint8_t>::max()));
}

TEST(InRangeTest, UnsignedToSigned) {
  EXPECT_TRUE(InRange<std::int64_t>(std::uint64_t{0}));
  EXPECT_TRUE(InRange<std::int64_t>(
      std::uint64_t{std::numeric_limits<std::int64_t>::max()}));
  EXPECT_FALSE(InRange<std::int64_t>(
      std::uint64_t{std::numeric_limits<std::int64_t>::max()} + 1));
  EXPECT_FALSE(
      InRange<std::int64_t>(std::numeric_limits<std::uint64_t>::max()));
  EXPECT_TRUE(InRange<std::int8_t>(127u));
  EXPECT_FALSE(InRange<std::int8_t>(128u));
}

TEST(InRangeTest, SignedToUnsigned) {
  EXPECT_FALSE(InRange<std::uint64_t>(-1));
  EXPECT_FALSE(
      InRange<std::uint64_t>(std::numeric_limits<std::int64_t>::min()));
  EXPECT_TRUE(InRange<std::uint64_t>(std::numeric_limits<std::int64_t>::max()));
  EXPECT_TRUE(InRange<std::uint8_t>(255));
  EXPECT_FALSE(InRange<std::uint8_t>(256));
}

TEST(CastNumberTest, ConvertsTimeouts) {
  EXPECT_THAT(CastNumber<std::int64_t>(std::uint64_t{300}), Optional(300));
  EXPECT_EQ(CastNumber<std::int64_t>(std::numeric_limits<std::uint64_t>::max()),
            std::nullopt);
}

TEST(CastNumberTest, ConvertsSizes) {
  EXPECT_THAT(CastNumber<std::streamsize>(std::size_t{4096}),
              Optional(std::streamsize{4096}));
  EXPECT_EQ(
      CastNumber<std::streamsize>(std::numeric_limits<std::size_t>::max()),
      std::nullopt);
}

TEST(CastNumberTest, RejectsNegativeValues) {
  EXPECT_EQ(CastNumber<unsigned int>(-5), std::nullopt);
  EXPECT_THAT(CastNumber<unsigned int>(5), Optional(5u));
}

}  // namespace
}  // namespace junit_launcher
