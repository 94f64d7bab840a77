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

// Reader for box lists in a simple text format, one box per line:
//
//   # Sprites of level 1.
//   32 32 player
//   16 8  bullet
//   64 64
//
// A line holds the width, the height and an optional name, which is the rest
// of the line. Everything after a '#' is a comment, and blank lines are
// ignored. Sizes are integers and may be negative.

#ifndef RECTPACK_PACKING_BOX_LIST_PARSER_H_
#define RECTPACK_PACKING_BOX_LIST_PARSER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "rectpack/packing/boxes.h"

namespace rectpack {

// Returns the boxes in file order, with their name as payload (empty if not
// given). Errors are INVALID_ARGUMENT and name the first offending line.
absl::StatusOr<std::vector<Box<std::string>>> ParseBoxList(
    absl::string_view text);

// Same as ParseBoxList() on the contents of a file.
absl::StatusOr<std::vector<Box<std::string>>> ReadBoxListFile(
    absl::string_view file_name);

}  // namespace rectpack

#endif  // RECTPACK_PACKING_BOX_LIST_PARSER_H_
