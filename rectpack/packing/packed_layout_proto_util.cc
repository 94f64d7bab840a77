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

#include "rectpack/packing/packed_layout_proto_util.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "rectpack/packing/packed_layout.pb.h"

namespace rectpack {

absl::Status ValidatePackedLayout(const PackedLayoutProto& layout) {
  if (layout.width() < 0 || layout.height() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Negative container size: ", layout.width(), "x",
                     layout.height()));
  }
  for (int i = 0; i < layout.boxes_size(); ++i) {
    const PlacedBoxProto& box = layout.boxes(i);
    if (box.x() < 0 || box.y() < 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Box #", i, " has a negative position: ", box.x(), ",", box.y()));
    }
    if (box.width() < 0 || box.height() < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Box #", i, " has a negative size: ", box.width(), "x",
                       box.height()));
    }
    // Written as subtractions so that they cannot overflow.
    if (box.width() > layout.width() - box.x() ||
        box.height() > layout.height() - box.y()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Box #", i, " at ", box.x(), ",", box.y(), " with size ",
          box.width(), "x", box.height(), " is outside of the ",
          layout.width(), "x", layout.height(), " container"));
    }
  }
  return absl::OkStatus();
}

}  // namespace rectpack
