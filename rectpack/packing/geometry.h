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

#ifndef RECTPACK_PACKING_GEOMETRY_H_
#define RECTPACK_PACKING_GEOMETRY_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "absl/numeric/int128.h"
#include "rectpack/base/logging.h"
#include "rectpack/base/strong_int.h"

namespace rectpack {

// Positions and lengths on the packing plane. All of them share one unit, so
// any length can be added to any coordinate.
DEFINE_STRONG_INT_TYPE(Coordinate, int64_t);

inline Coordinate Abs(Coordinate c) {
  return c < Coordinate(0) ? -c : c;
}

// Areas are computed in 128 bits so that two maximal coordinates never
// overflow.
inline absl::int128 Area(Coordinate width, Coordinate height) {
  return absl::int128(width.value()) * absl::int128(height.value());
}

// Smallest power of two greater or equal to `size`. Zero (and any negative
// value) maps to zero.
Coordinate NextPowerOfTwo(Coordinate size);

// Extent of a free region along one axis: either a finite, non-negative
// length, or unbounded. The free space of the packing plane starts unbounded
// on both axes, and finite extents only appear after a cut.
class RegionExtent {
 public:
  static constexpr RegionExtent Unbounded() { return RegionExtent(); }
  static constexpr RegionExtent Finite(Coordinate length) {
    return RegionExtent(length);
  }

  bool IsUnbounded() const { return unbounded_; }
  bool IsFinite() const { return !unbounded_; }

  // Must only be called on a finite extent.
  Coordinate length() const {
    DCHECK(!unbounded_) << "length() called on an unbounded extent";
    return length_;
  }

  // True if a segment of the given length fits in this extent. Unbounded
  // extents hold anything.
  bool Fits(Coordinate size) const { return unbounded_ || length_ >= size; }

  // A finite extent must be strictly positive to be usable. Unbounded extents
  // always are.
  bool IsPositive() const { return unbounded_ || length_ > Coordinate(0); }

  // Removes `amount` from a finite extent. Unbounded minus anything stays
  // unbounded. The result can be negative: callers check IsPositive().
  RegionExtent operator-(Coordinate amount) const {
    if (unbounded_) return Unbounded();
    return Finite(length_ - amount);
  }

  bool operator==(const RegionExtent& other) const {
    if (unbounded_ || other.unbounded_) return unbounded_ == other.unbounded_;
    return length_ == other.length_;
  }
  bool operator!=(const RegionExtent& other) const { return !(*this == other); }

  std::string DebugString() const;

 private:
  constexpr RegionExtent() : unbounded_(true), length_(0) {}
  explicit constexpr RegionExtent(Coordinate length)
      : unbounded_(false), length_(length) {}

  bool unbounded_;
  Coordinate length_;
};

std::ostream& operator<<(std::ostream& os, const RegionExtent& extent);

// An axis-aligned rectangle given by its lower corner and its sizes. Sizes may
// be negative when coming from user input; see BoxIntersections().
struct Rectangle {
  Coordinate x;
  Coordinate y;
  Coordinate width;
  Coordinate height;

  bool operator==(const Rectangle& other) const {
    return x == other.x && y == other.y && width == other.width &&
           height == other.height;
  }

  std::string DebugString() const;
};

std::ostream& operator<<(std::ostream& os, const Rectangle& rectangle);

}  // namespace rectpack

#endif  // RECTPACK_PACKING_GEOMETRY_H_
