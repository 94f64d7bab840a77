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

// Packs a list of rectangles, e.g. the sprites of a texture atlas, and prints
// their positions.
//
// The input file has one box per line: "<width> <height> [name]". The layout
// is written in text proto format (rectpack.PackedLayoutProto), with the box
// names as payload.
//
// Example:
//   pack_rectangles --input=sprites.txt \
//     --params="spacing: 1 power_of_two_size: true" --output=atlas.textproto

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/text_format.h"
#include "rectpack/base/file.h"
#include "rectpack/base/init_google.h"
#include "rectpack/base/logging.h"
#include "rectpack/base/status_macros.h"
#include "rectpack/packing/box_intersections.h"
#include "rectpack/packing/box_list_parser.h"
#include "rectpack/packing/boxes.h"
#include "rectpack/packing/packed_layout.pb.h"
#include "rectpack/packing/packed_layout_proto_util.h"
#include "rectpack/packing/rect_packer.h"
#include "rectpack/packing/rect_packing_parameters.pb.h"

ABSL_FLAG(std::string, input, "", "Box list file.");
ABSL_FLAG(std::string, params, "",
          "RectPackingParameters in text proto format.");
ABSL_FLAG(std::string, output, "",
          "If not empty, write the layout to this file instead of stdout.");

namespace rectpack {
namespace {

absl::Status LoadAndPack(const std::string& input, const std::string& params_text,
                         const std::string& output) {
  RectPackingParameters params;
  if (!google::protobuf::TextFormat::ParseFromString(params_text, &params)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse --params: '", params_text, "'"));
  }
  ASSIGN_OR_RETURN(std::vector<Box<std::string>> boxes,
                   ReadBoxListFile(input));
  LOG(INFO) << "Read " << boxes.size() << " boxes from " << input;

  const absl::StatusOr<PackedBoxes<std::string>> packed =
      Pack(params, std::move(boxes));
  if (!packed.ok()) {
    if (const auto details = GetUnplaceableBoxDetails(packed.status());
        details.has_value()) {
      LOG(ERROR) << "Unplaceable box: " << details->ShortDebugString();
    }
    return packed.status();
  }
  // The packer never overlaps boxes; this double checks the output.
  const auto overlaps = BoxIntersections(packed->boxes);
  CHECK(overlaps.empty()) << overlaps.size() << " overlapping pairs";
  LOG(INFO) << "Container: " << packed->width << "x" << packed->height
            << ", efficiency: " << ComputePackingEfficiency(*packed);

  const PackedLayoutProto layout = PackedBoxesToProto(
      *packed, [](const std::string& name) { return name; });
  if (!output.empty()) return file::SetTextProto(output, layout);
  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(layout, &text)) {
    return absl::InternalError("Could not print the layout");
  }
  std::cout << text;
  return absl::OkStatus();
}

}  // namespace
}  // namespace rectpack

static const char kUsage[] =
    "Usage: pack_rectangles --input=<box list> [--params=<text proto>] "
    "[--output=<file>]";

int main(int argc, char** argv) {
  rectpack::LogToStderr();
  InitGoogle(kUsage, &argc, &argv);
  if (absl::GetFlag(FLAGS_input).empty()) {
    LOG(FATAL) << "Please supply a box list with --input=";
  }
  const absl::Status status = rectpack::LoadAndPack(
      absl::GetFlag(FLAGS_input), absl::GetFlag(FLAGS_params),
      absl::GetFlag(FLAGS_output));
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
