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

// Data model of the packer. The payload type T is opaque: it is moved or
// copied from the input Box to the output PlacedBox and never inspected, so it
// needs neither equality, ordering nor hashing.

#ifndef RECTPACK_PACKING_BOXES_H_
#define RECTPACK_PACKING_BOXES_H_

#include <vector>

#include "absl/numeric/int128.h"
#include "rectpack/packing/geometry.h"

namespace rectpack {

// A rectangle to pack. Its sizes may be zero or negative: the packer always
// uses their absolute value as the footprint.
template <typename T>
struct Box {
  Coordinate width;
  Coordinate height;
  T data;
};

// A box after placement. width and height are the absolute values of the
// source Box sizes, x and y are non-negative.
template <typename T>
struct PlacedBox {
  Coordinate x;
  Coordinate y;
  Coordinate width;
  Coordinate height;
  T data;

  Rectangle rectangle() const { return {x, y, width, height}; }
};

// Container size and placements, in placement order (not input order).
template <typename T>
struct PackedBoxes {
  Coordinate width;
  Coordinate height;
  std::vector<PlacedBox<T>> boxes;
};

template <typename T>
absl::int128 ContainerArea(const PackedBoxes<T>& packed) {
  return Area(packed.width, packed.height);
}

template <typename T>
absl::int128 PlacedArea(const PackedBoxes<T>& packed) {
  absl::int128 area = 0;
  for (const PlacedBox<T>& box : packed.boxes) {
    area += Area(box.width, box.height);
  }
  return area;
}

// Fraction of the container covered by boxes, in [0, 1]. Returns 0 for an
// empty container.
template <typename T>
double ComputePackingEfficiency(const PackedBoxes<T>& packed) {
  const absl::int128 container_area = ContainerArea(packed);
  if (container_area == 0) return 0.0;
  return static_cast<double>(PlacedArea(packed)) /
         static_cast<double>(container_area);
}

}  // namespace rectpack

#endif  // RECTPACK_PACKING_BOXES_H_
