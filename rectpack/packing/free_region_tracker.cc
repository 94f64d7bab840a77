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

#include "rectpack/packing/free_region_tracker.h"

#include <algorithm>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

#include "absl/container/inlined_vector.h"
#include "absl/strings/str_format.h"
#include "rectpack/base/logging.h"
#include "rectpack/packing/geometry.h"

namespace rectpack {

namespace {

// Lower is better.
struct RegionScore {
  // 0 if both leftovers are finite, 1 if one is unbounded, 2 if both are.
  int num_unbounded_leftovers = 0;
  Coordinate leftover;
  Coordinate distance_to_origin;

  bool operator<(const RegionScore& other) const {
    return std::tie(num_unbounded_leftovers, leftover, distance_to_origin) <
           std::tie(other.num_unbounded_leftovers, other.leftover,
                    other.distance_to_origin);
  }
};

std::optional<RegionScore> ScoreRegion(const FreeRegion& region,
                                       Coordinate needed_width,
                                       Coordinate needed_height) {
  if (!region.width.Fits(needed_width) || !region.height.Fits(needed_height)) {
    return std::nullopt;
  }
  const RegionExtent leftover_width = region.width - needed_width;
  const RegionExtent leftover_height = region.height - needed_height;

  RegionScore score;
  score.distance_to_origin = region.x + region.y;
  if (leftover_width.IsFinite() && leftover_height.IsFinite()) {
    score.num_unbounded_leftovers = 0;
    score.leftover =
        std::min(leftover_width.length(), leftover_height.length());
  } else if (leftover_width.IsFinite()) {
    score.num_unbounded_leftovers = 1;
    score.leftover = leftover_width.length();
  } else if (leftover_height.IsFinite()) {
    score.num_unbounded_leftovers = 1;
    score.leftover = leftover_height.length();
  } else {
    score.num_unbounded_leftovers = 2;
    score.leftover = Coordinate(0);
  }
  return score;
}

}  // namespace

std::string FreeRegion::DebugString() const {
  return absl::StrFormat("[%d,%d %sx%s]", x.value(), y.value(),
                         width.DebugString(), height.DebugString());
}

std::ostream& operator<<(std::ostream& os, const FreeRegion& region) {
  return os << region.DebugString();
}

absl::InlinedVector<FreeRegion, 2> SplitRegion(const FreeRegion& region,
                                               Coordinate spacing,
                                               Coordinate width,
                                               Coordinate height,
                                               bool split_vertically) {
  const Coordinate used_width = width + spacing;
  const Coordinate used_height = height + spacing;
  const FreeRegion right = {
      region.x + used_width, region.y, region.width - used_width,
      split_vertically ? region.height : RegionExtent::Finite(used_height)};
  const FreeRegion top = {
      region.x, region.y + used_height,
      split_vertically ? RegionExtent::Finite(used_width) : region.width,
      region.height - used_height};

  absl::InlinedVector<FreeRegion, 2> children;
  for (const FreeRegion& child : {right, top}) {
    if (child.width.IsPositive() && child.height.IsPositive()) {
      children.push_back(child);
    }
  }
  return children;
}

FreeRegionTracker::FreeRegionTracker()
    : FreeRegionTracker(FreeRegion{Coordinate(0), Coordinate(0),
                                   RegionExtent::Unbounded(),
                                   RegionExtent::Unbounded()}) {}

FreeRegionTracker::FreeRegionTracker(const FreeRegion& seed)
    : regions_({seed}) {}

std::optional<int> FreeRegionTracker::FindBestRegion(Coordinate spacing,
                                                     Coordinate width,
                                                     Coordinate height) const {
  DCHECK_GE(spacing, Coordinate(0));
  DCHECK_GE(width, Coordinate(0));
  DCHECK_GE(height, Coordinate(0));
  const Coordinate needed_width = width + spacing;
  const Coordinate needed_height = height + spacing;

  std::optional<int> best_index;
  RegionScore best_score;
  for (int i = 0; i < regions_.size(); ++i) {
    const std::optional<RegionScore> score =
        ScoreRegion(regions_[i], needed_width, needed_height);
    if (!score.has_value()) continue;
    if (!best_index.has_value() || *score < best_score) {
      best_index = i;
      best_score = *score;
    }
  }
  return best_index;
}

Rectangle FreeRegionTracker::PlaceAndSplit(int region_index,
                                           Coordinate spacing,
                                           Coordinate width, Coordinate height,
                                           bool split_vertically) {
  CHECK_GE(region_index, 0);
  CHECK_LT(region_index, regions_.size());
  const FreeRegion region = regions_[region_index];
  DCHECK(region.width.Fits(width + spacing)) << region;
  DCHECK(region.height.Fits(height + spacing)) << region;

  regions_.erase(regions_.begin() + region_index);
  for (const FreeRegion& child :
       SplitRegion(region, spacing, width, height, split_vertically)) {
    regions_.push_back(child);
  }
  return {region.x, region.y, width, height};
}

}  // namespace rectpack
