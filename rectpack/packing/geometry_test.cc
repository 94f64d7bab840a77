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

#include "rectpack/packing/geometry.h"

#include <cstdint>
#include <limits>
#include <sstream>

#include "absl/numeric/int128.h"
#include "gtest/gtest.h"

namespace rectpack {
namespace {

constexpr int64_t kint64max = std::numeric_limits<int64_t>::max();

TEST(AbsTest, Basic) {
  EXPECT_EQ(Abs(Coordinate(-9)), Coordinate(9));
  EXPECT_EQ(Abs(Coordinate(27)), Coordinate(27));
  EXPECT_EQ(Abs(Coordinate(0)), Coordinate(0));
}

TEST(AreaTest, DoesNotOverflow) {
  EXPECT_EQ(Area(Coordinate(3), Coordinate(4)), 12);
  EXPECT_EQ(Area(Coordinate(kint64max), Coordinate(kint64max)),
            absl::int128(kint64max) * absl::int128(kint64max));
}

TEST(NextPowerOfTwoTest, Basic) {
  EXPECT_EQ(NextPowerOfTwo(Coordinate(0)), Coordinate(0));
  EXPECT_EQ(NextPowerOfTwo(Coordinate(-5)), Coordinate(0));
  EXPECT_EQ(NextPowerOfTwo(Coordinate(1)), Coordinate(1));
  EXPECT_EQ(NextPowerOfTwo(Coordinate(2)), Coordinate(2));
  EXPECT_EQ(NextPowerOfTwo(Coordinate(3)), Coordinate(4));
  EXPECT_EQ(NextPowerOfTwo(Coordinate(128)), Coordinate(128));
  EXPECT_EQ(NextPowerOfTwo(Coordinate(129)), Coordinate(256));
  EXPECT_EQ(NextPowerOfTwo(Coordinate(int64_t{1} << 62)),
            Coordinate(int64_t{1} << 62));
}

TEST(NextPowerOfTwoDeathTest, TooLarge) {
  EXPECT_DEATH(NextPowerOfTwo(Coordinate((int64_t{1} << 62) + 1)),
               "No power of two");
}

TEST(RegionExtentTest, Unbounded) {
  const RegionExtent extent = RegionExtent::Unbounded();
  EXPECT_TRUE(extent.IsUnbounded());
  EXPECT_FALSE(extent.IsFinite());
  EXPECT_TRUE(extent.IsPositive());
  EXPECT_TRUE(extent.Fits(Coordinate(kint64max)));
  EXPECT_EQ(extent - Coordinate(1000), RegionExtent::Unbounded());
  EXPECT_EQ(extent.DebugString(), "unbounded");
}

TEST(RegionExtentTest, Finite) {
  const RegionExtent extent = RegionExtent::Finite(Coordinate(10));
  EXPECT_TRUE(extent.IsFinite());
  EXPECT_EQ(extent.length(), Coordinate(10));
  EXPECT_TRUE(extent.Fits(Coordinate(10)));
  EXPECT_FALSE(extent.Fits(Coordinate(11)));
  EXPECT_TRUE(extent.IsPositive());
  EXPECT_EQ(extent.DebugString(), "10");

  EXPECT_EQ(extent - Coordinate(4), RegionExtent::Finite(Coordinate(6)));
  EXPECT_FALSE((extent - Coordinate(10)).IsPositive());
  EXPECT_FALSE((extent - Coordinate(12)).IsPositive());
  EXPECT_EQ((extent - Coordinate(12)).length(), Coordinate(-2));
}

TEST(RegionExtentTest, Equality) {
  EXPECT_EQ(RegionExtent::Finite(Coordinate(3)),
            RegionExtent::Finite(Coordinate(3)));
  EXPECT_NE(RegionExtent::Finite(Coordinate(3)),
            RegionExtent::Finite(Coordinate(4)));
  EXPECT_NE(RegionExtent::Finite(Coordinate(0)), RegionExtent::Unbounded());
  EXPECT_NE(RegionExtent::Unbounded(), RegionExtent::Finite(Coordinate(0)));
}

#ifndef NDEBUG
TEST(RegionExtentDeathTest, LengthOfUnboundedExtent) {
  EXPECT_DEATH(RegionExtent::Unbounded().length(), "unbounded extent");
}
#endif  // NDEBUG

TEST(RectangleTest, DebugString) {
  const Rectangle rectangle = {Coordinate(1), Coordinate(2), Coordinate(3),
                               Coordinate(4)};
  EXPECT_EQ(rectangle.DebugString(), "[1,2 3x4]");
  std::ostringstream out;
  out << rectangle;
  EXPECT_EQ(out.str(), "[1,2 3x4]");
}

}  // namespace
}  // namespace rectpack
