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

#include "rectpack/packing/box_list_parser.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "rectpack/base/file.h"
#include "rectpack/base/logging.h"
#include "rectpack/base/status_macros.h"
#include "rectpack/packing/boxes.h"
#include "rectpack/packing/geometry.h"

namespace rectpack {

namespace {

absl::Status LineError(int line_number, absl::string_view message) {
  return absl::InvalidArgumentError(
      absl::StrCat("Line ", line_number, ": ", message));
}

absl::StatusOr<Coordinate> ParseSize(absl::string_view word,
                                     absl::string_view what, int line_number) {
  int64_t value;
  if (!absl::SimpleAtoi(word, &value)) {
    return LineError(line_number,
                     absl::StrCat("invalid ", what, " '", word, "'"));
  }
  return Coordinate(value);
}

}  // namespace

absl::StatusOr<std::vector<Box<std::string>>> ParseBoxList(
    absl::string_view text) {
  std::vector<Box<std::string>> boxes;
  int line_number = 0;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    ++line_number;
    const size_t comment = line.find('#');
    if (comment != absl::string_view::npos) line = line.substr(0, comment);
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) continue;

    const std::vector<absl::string_view> words =
        absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
    if (words.size() < 2) {
      return LineError(
          line_number,
          absl::StrCat("expected '<width> <height> [name]', got '", line, "'"));
    }
    ASSIGN_OR_RETURN(const Coordinate width,
                     ParseSize(words[0], "width", line_number));
    ASSIGN_OR_RETURN(const Coordinate height,
                     ParseSize(words[1], "height", line_number));
    // The name is the rest of the line, inner spaces included.
    const size_t name_start = words[1].data() + words[1].size() - line.data();
    std::string name(absl::StripAsciiWhitespace(line.substr(name_start)));
    boxes.push_back({width, height, std::move(name)});
  }
  VLOG(1) << "Parsed " << boxes.size() << " boxes from " << line_number
          << " lines.";
  return boxes;
}

absl::StatusOr<std::vector<Box<std::string>>> ReadBoxListFile(
    absl::string_view file_name) {
  ASSIGN_OR_RETURN(const std::string contents, file::GetContents(file_name));
  absl::StatusOr<std::vector<Box<std::string>>> boxes =
      ParseBoxList(contents);
  if (!boxes.ok()) {
    return absl::Status(boxes.status().code(),
                        absl::StrCat(file_name, ": ", boxes.status().message()));
  }
  return boxes;
}

}  // namespace rectpack
