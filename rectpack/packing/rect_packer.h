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

// Greedy packing of rectangles into a small bounding container, e.g. to build
// a texture atlas or a sprite sheet.
//
// The boxes are sorted largest first and placed one by one at the lower corner
// of the free region that fits them best. Each placement cuts its region in
// two (guillotine cut), alternating between a vertical and a horizontal cut.
// The result is never overlapping and deterministic, but is not optimal.
//
// Example:
//   std::vector<Box<std::string>> boxes = {{Coordinate(32), Coordinate(16),
//                                           "player"}, ...};
//   RectPackingParameters params;
//   params.set_spacing(1);
//   params.set_power_of_two_size(true);
//   ASSIGN_OR_RETURN(const PackedBoxes<std::string> atlas,
//                    Pack(params, std::move(boxes)));

#ifndef RECTPACK_PACKING_RECT_PACKER_H_
#define RECTPACK_PACKING_RECT_PACKER_H_

#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rectpack/base/status_macros.h"
#include "rectpack/packing/boxes.h"
#include "rectpack/packing/geometry.h"
#include "rectpack/packing/packed_layout.pb.h"
#include "rectpack/packing/rect_packing_parameters.pb.h"

namespace rectpack {

// Size of a box to pack. Negative sizes stand for their absolute value.
struct BoxSize {
  Coordinate width;
  Coordinate height;
};

// Where one input box was placed.
struct BoxPlacement {
  // Index of the box in the input of PackBoxSizes().
  int box_index;
  // Always has non-negative sizes.
  Rectangle rectangle;
};

struct PackingLayout {
  Coordinate width;
  Coordinate height;
  // In placement order.
  std::vector<BoxPlacement> placements;
};

// Payload-free version of Pack(): computes the container and the position of
// every box. See Pack() for the semantics and the errors.
absl::StatusOr<PackingLayout> PackBoxSizes(const RectPackingParameters& params,
                                           absl::Span<const BoxSize> sizes);

// Returns the indices of `sizes` in the order the packer places them. The
// sort is stable.
std::vector<int> SortBoxesForPacking(
    RectPackingParameters::BoxOrdering ordering,
    absl::Span<const BoxSize> sizes);

// Packs `boxes` and moves their payload to the placed boxes, which come in
// placement order. Every input box is placed exactly once.
//
// The returned container is the smallest one holding all placed boxes, with
// `spacing` kept between two boxes but not along the container border. Its
// width is then raised to `minimum_width`, and both sizes are rounded up to a
// power of two if requested.
//
// Packing into the default unbounded plane always succeeds. With max_width or
// max_height set, a box that does not fit in the remaining space makes the
// call fail with RESOURCE_EXHAUSTED. The returned status carries an
// UnplaceableBoxDetails payload, see GetUnplaceableBoxDetails().
template <typename T>
absl::StatusOr<PackedBoxes<T>> Pack(const RectPackingParameters& params,
                                    std::vector<Box<T>> boxes) {
  std::vector<BoxSize> sizes;
  sizes.reserve(boxes.size());
  for (const Box<T>& box : boxes) {
    sizes.push_back({box.width, box.height});
  }
  ASSIGN_OR_RETURN(PackingLayout layout, PackBoxSizes(params, sizes));

  PackedBoxes<T> packed;
  packed.width = layout.width;
  packed.height = layout.height;
  packed.boxes.reserve(layout.placements.size());
  for (const BoxPlacement& placement : layout.placements) {
    const Rectangle& rectangle = placement.rectangle;
    packed.boxes.push_back({rectangle.x, rectangle.y, rectangle.width,
                            rectangle.height,
                            std::move(boxes[placement.box_index].data)});
  }
  return packed;
}

// Returns the details of the box that could not be placed if `status` was
// returned by Pack() or PackBoxSizes() for that reason.
std::optional<UnplaceableBoxDetails> GetUnplaceableBoxDetails(
    const absl::Status& status);

}  // namespace rectpack

#endif  // RECTPACK_PACKING_RECT_PACKER_H_
