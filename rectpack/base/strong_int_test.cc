// Copyright 2010-2025 Google LLC
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

#include "rectpack/base/strong_int.h"

#include <cstdint>
#include <limits>
#include <sstream>
#include <type_traits>

#include "gtest/gtest.h"

namespace rectpack {
namespace {

DEFINE_STRONG_INT_TYPE(Length, int64_t);

// Same native type as Length, but a different type.
DEFINE_STRONG_INT_TYPE(Offset, int64_t);

TEST(StrongIntTest, DistinctTypes) {
  EXPECT_FALSE((std::is_same_v<Length, Offset>));
  EXPECT_FALSE((std::is_convertible_v<Length, Offset>));
  EXPECT_FALSE((std::is_convertible_v<int64_t, Length>));
  EXPECT_TRUE((std::is_constructible_v<Length, int64_t>));
  EXPECT_TRUE((std::is_constructible_v<Length, int>));
}

TEST(StrongIntTest, Traits) {
  EXPECT_TRUE(std::is_standard_layout<Length>::value);
  EXPECT_TRUE(std::is_trivially_copy_constructible<Length>::value);
  EXPECT_TRUE(std::is_trivially_copy_assignable<Length>::value);
  EXPECT_TRUE(std::is_trivially_destructible<Length>::value);
  EXPECT_EQ(sizeof(Length), sizeof(int64_t));
}

TEST(StrongIntTest, Construction) {
  EXPECT_EQ(Length().value(), 0);
  EXPECT_EQ(Length(93).value(), 93);
  EXPECT_EQ(Length(-1).value(), -1);
  const int64_t max = std::numeric_limits<int64_t>::max();
  EXPECT_EQ(Length(max).value(), max);

  const Length x(76);
  const Length y(x);
  EXPECT_EQ(y.value(), 76);

  constexpr Length z(42);
  static_assert(z.value() == 42, "value() is not constexpr");
}

TEST(StrongIntTest, Arithmetic) {
  const Length x(12);
  const Length y(5);
  EXPECT_EQ((-x).value(), -12);
  EXPECT_EQ((-(-x)).value(), 12);
  EXPECT_EQ((x + y).value(), 17);
  EXPECT_EQ((x - y).value(), 7);
  EXPECT_EQ((y - x).value(), -7);

  constexpr Length sum = Length(1) + Length(2);
  static_assert(sum.value() == 3, "operator+ is not constexpr");
}

TEST(StrongIntTest, Comparisons) {
  const Length x(7);
  const Length y(8);
  EXPECT_TRUE(x == Length(7));
  EXPECT_FALSE(x == y);
  EXPECT_TRUE(x != y);
  EXPECT_TRUE(x < y);
  EXPECT_FALSE(y < x);
  EXPECT_TRUE(x <= y);
  EXPECT_TRUE(x <= Length(7));
  EXPECT_TRUE(y > x);
  EXPECT_TRUE(y >= x);
  EXPECT_TRUE(y >= Length(8));
  EXPECT_FALSE(x >= y);
  EXPECT_TRUE(Length(-3) < Length(0));
}

TEST(StrongIntTest, StreamOutput) {
  std::ostringstream out;
  out << Length(-42) << " " << Length(17);
  EXPECT_EQ(out.str(), "-42 17");
}

}  // namespace
}  // namespace rectpack
