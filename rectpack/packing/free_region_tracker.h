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

#ifndef RECTPACK_PACKING_FREE_REGION_TRACKER_H_
#define RECTPACK_PACKING_FREE_REGION_TRACKER_H_

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/inlined_vector.h"
#include "rectpack/packing/geometry.h"

namespace rectpack {

// A rectangle of the plane still available for placement. Its extents may be
// unbounded.
struct FreeRegion {
  Coordinate x;
  Coordinate y;
  RegionExtent width;
  RegionExtent height;

  bool operator==(const FreeRegion& other) const {
    return x == other.x && y == other.y && width == other.width &&
           height == other.height;
  }

  std::string DebugString() const;
};

std::ostream& operator<<(std::ostream& os, const FreeRegion& region);

// Guillotine cut of `region` after placing a width x height box at its lower
// corner. The box footprint is grown by `spacing` on its +x and +y sides and
// the remaining space is returned as at most two disjoint regions:
//  - "right", starting at x + width + spacing. It spans the full region height
//    if `split_vertically`, otherwise only height + spacing.
//  - "top", starting at y + height + spacing. It spans width + spacing if
//    `split_vertically`, otherwise the full region width.
// Children with a finite extent <= 0 are dropped. The right child, if any,
// comes first.
absl::InlinedVector<FreeRegion, 2> SplitRegion(const FreeRegion& region,
                                               Coordinate spacing,
                                               Coordinate width,
                                               Coordinate height,
                                               bool split_vertically);

// Keeps the list of free regions of a packing and answers best-fit queries.
//
// The regions form the leaves of a guillotine tree, stored as a flat list:
// placing a box consumes one region and appends its children. Best-fit is a
// linear scan, which is fine for the few thousand boxes of a texture atlas.
//
// All sizes given to this class must be non-negative.
class FreeRegionTracker {
 public:
  // Starts with a single region at the origin, unbounded on both axes. Such a
  // tracker can always place a box.
  FreeRegionTracker();

  // Starts with the given region, e.g. a bounded container.
  explicit FreeRegionTracker(const FreeRegion& seed);

  // Returns the index in regions() of the best region for a box of the given
  // size plus `spacing`, or nullopt if no region is large enough.
  //
  // The best region minimizes the space left over by the box:
  //  - if both leftovers are finite, the shortest of them (best short side
  //    fit);
  //  - regions with exactly one unbounded extent come after all fully finite
  //    ones and are ranked by their finite leftover;
  //  - a region unbounded on both axes is used last.
  // Ties go to the region closest to the origin (smallest x + y), then to the
  // oldest region.
  std::optional<int> FindBestRegion(Coordinate spacing, Coordinate width,
                                    Coordinate height) const;

  // Places a box at the lower corner of regions()[region_index], which must be
  // large enough, and replaces that region by the SplitRegion() children.
  // Returns the placed rectangle.
  Rectangle PlaceAndSplit(int region_index, Coordinate spacing,
                          Coordinate width, Coordinate height,
                          bool split_vertically);

  const std::vector<FreeRegion>& regions() const { return regions_; }
  int num_regions() const { return regions_.size(); }

 private:
  std::vector<FreeRegion> regions_;
};

}  // namespace rectpack

#endif  // RECTPACK_PACKING_FREE_REGION_TRACKER_H_
