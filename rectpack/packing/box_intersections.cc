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

#include "rectpack/packing/box_intersections.h"

#include <algorithm>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_set.h"
#include "absl/types/span.h"
#include "rectpack/packing/geometry.h"

namespace rectpack {

namespace {

struct IntervalEvent {
  Coordinate value;
  // End events sort before start events of the same value, so that touching
  // intervals are never open together.
  bool is_start;
  int id;

  bool operator<(const IntervalEvent& other) const {
    return std::tie(value, is_start, id) <
           std::tie(other.value, other.is_start, other.id);
  }
};

// Calls `report(i, j)` with i < j for every pair of intervals
// [start, start + length) that overlap by a positive length.
template <typename ReportFn>
void SweepIntervals(absl::Span<const Rectangle> rectangles,
                    Coordinate Rectangle::*start, Coordinate Rectangle::*length,
                    ReportFn report) {
  std::vector<IntervalEvent> events;
  events.reserve(2 * rectangles.size());
  for (int i = 0; i < rectangles.size(); ++i) {
    const Rectangle& rectangle = rectangles[i];
    if (rectangle.*length == Coordinate(0)) continue;
    const Coordinate a = rectangle.*start;
    const Coordinate b = rectangle.*start + rectangle.*length;
    events.push_back({std::min(a, b), /*is_start=*/true, i});
    events.push_back({std::max(a, b), /*is_start=*/false, i});
  }
  std::sort(events.begin(), events.end());

  absl::btree_set<int> open_ids;
  for (const IntervalEvent& event : events) {
    if (!event.is_start) {
      open_ids.erase(event.id);
      continue;
    }
    for (const int other : open_ids) {
      report(std::min(event.id, other), std::max(event.id, other));
    }
    open_ids.insert(event.id);
  }
}

}  // namespace

absl::btree_set<std::pair<int, int>> BoxIntersections(
    absl::Span<const Rectangle> rectangles) {
  absl::flat_hash_set<std::pair<int, int>> x_overlaps;
  SweepIntervals(rectangles, &Rectangle::x, &Rectangle::width,
                 [&x_overlaps](int i, int j) { x_overlaps.insert({i, j}); });

  absl::btree_set<std::pair<int, int>> result;
  SweepIntervals(rectangles, &Rectangle::y, &Rectangle::height,
                 [&x_overlaps, &result](int i, int j) {
                   if (x_overlaps.contains(std::make_pair(i, j))) {
                     result.insert({i, j});
                   }
                 });
  return result;
}

}  // namespace rectpack
