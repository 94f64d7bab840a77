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
#include <ostream>
#include <string>

#include "absl/numeric/bits.h"
#include "absl/strings/str_format.h"
#include "rectpack/base/logging.h"

namespace rectpack {

Coordinate NextPowerOfTwo(Coordinate size) {
  if (size <= Coordinate(0)) return Coordinate(0);
  const uint64_t value = static_cast<uint64_t>(size.value());
  CHECK_LE(value, uint64_t{1} << 62)
      << "No power of two above " << size << " fits in a Coordinate";
  return Coordinate(static_cast<int64_t>(absl::bit_ceil(value)));
}

std::string RegionExtent::DebugString() const {
  if (unbounded_) return "unbounded";
  return absl::StrFormat("%d", length_.value());
}

std::ostream& operator<<(std::ostream& os, const RegionExtent& extent) {
  return os << extent.DebugString();
}

std::string Rectangle::DebugString() const {
  return absl::StrFormat("[%d,%d %dx%d]", x.value(), y.value(), width.value(),
                         height.value());
}

std::ostream& operator<<(std::ostream& os, const Rectangle& rectangle) {
  return os << rectangle.DebugString();
}

}  // namespace rectpack
