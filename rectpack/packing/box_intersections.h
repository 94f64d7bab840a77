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

#ifndef RECTPACK_PACKING_BOX_INTERSECTIONS_H_
#define RECTPACK_PACKING_BOX_INTERSECTIONS_H_

#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/types/span.h"
#include "rectpack/packing/boxes.h"
#include "rectpack/packing/geometry.h"

namespace rectpack {

// Returns all the pairs (i, j), i < j, of rectangles whose interiors
// intersect, i.e. that overlap by a positive length on both axes. Rectangles
// that only touch do not intersect, and neither does a rectangle with a zero
// width or height. A negative size extends the rectangle towards the negative
// side of its (x, y) corner.
//
// This is a sweep line on each axis, in O(n log n + k) where k is the number
// of pairs overlapping on one axis.
absl::btree_set<std::pair<int, int>> BoxIntersections(
    absl::Span<const Rectangle> rectangles);

// Same as above, on the output of the packer. Indices refer to
// `boxes`, which is in placement order.
template <typename T>
absl::btree_set<std::pair<int, int>> BoxIntersections(
    absl::Span<const PlacedBox<T>> boxes) {
  std::vector<Rectangle> rectangles;
  rectangles.reserve(boxes.size());
  for (const PlacedBox<T>& box : boxes) {
    rectangles.push_back(box.rectangle());
  }
  return BoxIntersections(absl::MakeConstSpan(rectangles));
}

template <typename T>
absl::btree_set<std::pair<int, int>> BoxIntersections(
    const std::vector<PlacedBox<T>>& boxes) {
  return BoxIntersections(absl::MakeConstSpan(boxes));
}

}  // namespace rectpack

#endif  // RECTPACK_PACKING_BOX_INTERSECTIONS_H_
