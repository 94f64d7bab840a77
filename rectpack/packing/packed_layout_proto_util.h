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

// Conversions between PackedBoxes<T> and PackedLayoutProto. The payloads are
// converted to and from bytes by caller-provided functions.

#ifndef RECTPACK_PACKING_PACKED_LAYOUT_PROTO_UTIL_H_
#define RECTPACK_PACKING_PACKED_LAYOUT_PROTO_UTIL_H_

#include <string>
#include <utility>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "rectpack/base/status_macros.h"
#include "rectpack/packing/boxes.h"
#include "rectpack/packing/geometry.h"
#include "rectpack/packing/packed_layout.pb.h"

namespace rectpack {

// Returns an error if a size or a coordinate is negative, or if a box does not
// lie inside the container.
absl::Status ValidatePackedLayout(const PackedLayoutProto& layout);

// `encode_payload` is called as std::string(const T&) on each box.
template <typename T, typename EncodeFn>
PackedLayoutProto PackedBoxesToProto(const PackedBoxes<T>& packed,
                                     EncodeFn encode_payload) {
  PackedLayoutProto layout;
  layout.set_width(packed.width.value());
  layout.set_height(packed.height.value());
  for (const PlacedBox<T>& box : packed.boxes) {
    PlacedBoxProto* const box_proto = layout.add_boxes();
    box_proto->set_x(box.x.value());
    box_proto->set_y(box.y.value());
    box_proto->set_width(box.width.value());
    box_proto->set_height(box.height.value());
    box_proto->set_payload(encode_payload(box.data));
  }
  return layout;
}

// The payload type must be given explicitly, e.g.
//   PackedBoxesFromProto<Sprite>(layout, &DecodeSprite);
// The first payload decoding error is returned as is.
template <typename T>
absl::StatusOr<PackedBoxes<T>> PackedBoxesFromProto(
    const PackedLayoutProto& layout,
    absl::FunctionRef<absl::StatusOr<T>(absl::string_view)> decode_payload) {
  RETURN_IF_ERROR(ValidatePackedLayout(layout));
  PackedBoxes<T> packed;
  packed.width = Coordinate(layout.width());
  packed.height = Coordinate(layout.height());
  packed.boxes.reserve(layout.boxes_size());
  for (const PlacedBoxProto& box_proto : layout.boxes()) {
    ASSIGN_OR_RETURN(T data, decode_payload(box_proto.payload()));
    packed.boxes.push_back(
        {Coordinate(box_proto.x()), Coordinate(box_proto.y()),
         Coordinate(box_proto.width()), Coordinate(box_proto.height()),
         std::move(data)});
  }
  return packed;
}

}  // namespace rectpack

#endif  // RECTPACK_PACKING_PACKED_LAYOUT_PROTO_UTIL_H_
