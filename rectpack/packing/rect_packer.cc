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

#include "rectpack/packing/rect_packer.h"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "absl/numeric/int128.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "rectpack/base/logging.h"
#include "rectpack/packing/free_region_tracker.h"
#include "rectpack/packing/geometry.h"
#include "rectpack/packing/packed_layout.pb.h"
#include "rectpack/packing/rect_packing_parameters.pb.h"

namespace rectpack {

namespace {

constexpr absl::string_view kUnplaceableBoxDetailsUrl =
    "type.googleapis.com/rectpack.UnplaceableBoxDetails";

// True if `a` must be placed before `b` in the BY_DOMINANCE_THEN_AREA order:
// a box at least as large as the other in both dimensions goes first,
// otherwise the larger area goes first. For positive areas, dominance implies
// a strictly larger area, so comparing areas is enough and equal areas keep
// their input order. Zero-area boxes can dominate each other without any area
// difference; they are ordered by width + height, which keeps the comparator a
// strict weak ordering.
bool DominatesOrIsLarger(const BoxSize& a, const BoxSize& b) {
  const absl::int128 a_area = Area(a.width, a.height);
  const absl::int128 b_area = Area(b.width, b.height);
  if (a_area != b_area) return a_area > b_area;
  if (a_area != 0) return false;
  return a.width + a.height > b.width + b.height;
}

FreeRegion InitialRegion(const RectPackingParameters& params,
                         Coordinate spacing) {
  // The last box on each axis consumes its trailing spacing too.
  const auto extent = [spacing](bool has_max, int64_t max) {
    if (!has_max) return RegionExtent::Unbounded();
    return RegionExtent::Finite(Coordinate(std::max<int64_t>(0, max)) +
                                spacing);
  };
  return {Coordinate(0), Coordinate(0),
          extent(params.has_max_width(), params.max_width()),
          extent(params.has_max_height(), params.max_height())};
}

absl::Status UnplaceableBoxError(bool bounded, int box_index, Coordinate width,
                                 Coordinate height) {
  absl::Status status;
  if (bounded) {
    status = absl::ResourceExhaustedError(
        absl::StrCat("Box #", box_index, " (", width.value(), "x",
                     height.value(), ") does not fit in the container"));
  } else {
    // The unbounded region always has room, so this is a bug.
    status = absl::InternalError(absl::StrCat(
        "Box #", box_index, " (", width.value(), "x", height.value(),
        ") found no free region in an unbounded plane"));
    LOG(ERROR) << status;
  }
  UnplaceableBoxDetails details;
  details.set_box_index(box_index);
  details.set_width(width.value());
  details.set_height(height.value());
  status.SetPayload(kUnplaceableBoxDetailsUrl,
                    absl::Cord(details.SerializeAsString()));
  return status;
}

}  // namespace

std::vector<int> SortBoxesForPacking(
    RectPackingParameters::BoxOrdering ordering,
    absl::Span<const BoxSize> sizes) {
  std::vector<BoxSize> abs_sizes;
  abs_sizes.reserve(sizes.size());
  for (const BoxSize& size : sizes) {
    abs_sizes.push_back({Abs(size.width), Abs(size.height)});
  }

  std::vector<int> order(sizes.size());
  std::iota(order.begin(), order.end(), 0);
  switch (ordering) {
    case RectPackingParameters::BY_WIDTH_THEN_HEIGHT:
      std::stable_sort(order.begin(), order.end(), [&abs_sizes](int a, int b) {
        return std::tie(abs_sizes[b].width, abs_sizes[b].height) <
               std::tie(abs_sizes[a].width, abs_sizes[a].height);
      });
      break;
    case RectPackingParameters::BY_DOMINANCE_THEN_AREA:
    default:
      std::stable_sort(order.begin(), order.end(), [&abs_sizes](int a, int b) {
        return DominatesOrIsLarger(abs_sizes[a], abs_sizes[b]);
      });
      break;
  }
  return order;
}

absl::StatusOr<PackingLayout> PackBoxSizes(const RectPackingParameters& params,
                                           absl::Span<const BoxSize> sizes) {
  const Coordinate spacing(std::max<int64_t>(0, params.spacing()));
  const Coordinate minimum_width(std::max<int64_t>(0, params.minimum_width()));
  const bool bounded = params.has_max_width() || params.has_max_height();

  FreeRegionTracker tracker(InitialRegion(params, spacing));
  PackingLayout layout;
  layout.placements.reserve(sizes.size());

  // Bounding box of the placed boxes, trailing spacing included.
  Coordinate used_width(0);
  Coordinate used_height(0);
  for (const int box_index : SortBoxesForPacking(params.box_ordering(), sizes)) {
    const Coordinate width = Abs(sizes[box_index].width);
    const Coordinate height = Abs(sizes[box_index].height);
    const std::optional<int> region =
        tracker.FindBestRegion(spacing, width, height);
    if (!region.has_value()) {
      return UnplaceableBoxError(bounded, box_index, width, height);
    }
    const bool split_vertically = layout.placements.size() % 2 == 0;
    const Rectangle placed = tracker.PlaceAndSplit(*region, spacing, width,
                                                   height, split_vertically);
    VLOG(2) << "Box #" << box_index << " placed at " << placed << ", "
            << tracker.num_regions() << " free regions left.";
    used_width = std::max(used_width, placed.x + placed.width + spacing);
    used_height = std::max(used_height, placed.y + placed.height + spacing);
    layout.placements.push_back({box_index, placed});
  }

  layout.width = std::max(Coordinate(0), used_width - spacing);
  layout.height = std::max(Coordinate(0), used_height - spacing);
  layout.width = std::max(layout.width, minimum_width);
  if (params.power_of_two_size()) {
    layout.width = NextPowerOfTwo(layout.width);
    layout.height = NextPowerOfTwo(layout.height);
  }
  VLOG(1) << "Packed " << sizes.size() << " boxes in a " << layout.width << "x"
          << layout.height << " container (" << tracker.num_regions()
          << " free regions).";
  return layout;
}

std::optional<UnplaceableBoxDetails> GetUnplaceableBoxDetails(
    const absl::Status& status) {
  const auto payload = status.GetPayload(kUnplaceableBoxDetailsUrl);
  if (!payload.has_value()) return std::nullopt;
  UnplaceableBoxDetails details;
  if (!details.ParseFromString(std::string(*payload))) return std::nullopt;
  return details;
}

}  // namespace rectpack
