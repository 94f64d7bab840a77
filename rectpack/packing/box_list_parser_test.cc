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

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"
#include "rectpack/base/file.h"
#include "rectpack/base/gmock.h"
#include "rectpack/packing/boxes.h"
#include "rectpack/packing/geometry.h"

namespace rectpack {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::status::IsOkAndHolds;
using ::testing::status::StatusIs;

MATCHER_P3(BoxIs, width, height, name, "") {
  return arg.width == Coordinate(width) && arg.height == Coordinate(height) &&
         arg.data == name;
}

TEST(ParseBoxListTest, Basic) {
  EXPECT_THAT(ParseBoxList("32 32 player\n"
                           "16\t8 bullet\n"
                           "64 64\n"),
              IsOkAndHolds(ElementsAre(BoxIs(32, 32, "player"),
                                       BoxIs(16, 8, "bullet"),
                                       BoxIs(64, 64, ""))));
}

TEST(ParseBoxListTest, CommentsAndBlankLines) {
  EXPECT_THAT(ParseBoxList("# Sprites of level 1.\n"
                           "\n"
                           "   \n"
                           "  10 20   tree  # the big one\n"
                           "# 1 1 ignored\n"
                           "5 5"),
              IsOkAndHolds(ElementsAre(BoxIs(10, 20, "tree"),
                                       BoxIs(5, 5, ""))));
}

TEST(ParseBoxListTest, NamesKeepInnerSpaces) {
  EXPECT_THAT(ParseBoxList("3 4 health  bar\r\n"),
              IsOkAndHolds(ElementsAre(BoxIs(3, 4, "health  bar"))));
}

TEST(ParseBoxListTest, NegativeAndZeroSizes) {
  EXPECT_THAT(ParseBoxList("-9 27\n128 0\n"),
              IsOkAndHolds(ElementsAre(BoxIs(-9, 27, ""), BoxIs(128, 0, ""))));
}

TEST(ParseBoxListTest, Empty) {
  EXPECT_THAT(ParseBoxList(""), IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(ParseBoxList("# nothing\n\n"), IsOkAndHolds(IsEmpty()));
}

TEST(ParseBoxListTest, MissingHeight) {
  EXPECT_THAT(ParseBoxList("1 2\n\n12\n"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       AllOf(HasSubstr("Line 3"),
                             HasSubstr("expected '<width> <height> [name]'"))));
}

TEST(ParseBoxListTest, InvalidSizes) {
  EXPECT_THAT(ParseBoxList("ten 10"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Line 1: invalid width 'ten'")));
  EXPECT_THAT(ParseBoxList("10 10\n10 1.5 name"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Line 2: invalid height '1.5'")));
  EXPECT_THAT(ParseBoxList("99999999999999999999 1"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("invalid width")));
}

TEST(ReadBoxListFileTest, ReadsFile) {
  const std::string file_name =
      absl::StrCat(::testing::TempDir(), "/boxes.txt");
  ASSERT_OK(file::SetContents(file_name, "# atlas\n8 8 coin\n"));
  EXPECT_THAT(ReadBoxListFile(file_name),
              IsOkAndHolds(ElementsAre(BoxIs(8, 8, "coin"))));
}

TEST(ReadBoxListFileTest, ErrorsNameTheFile) {
  const std::string file_name =
      absl::StrCat(::testing::TempDir(), "/bad_boxes.txt");
  ASSERT_OK(file::SetContents(file_name, "8 8 coin\n8 x\n"));
  EXPECT_THAT(ReadBoxListFile(file_name),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       AllOf(HasSubstr("bad_boxes.txt"), HasSubstr("Line 2"))));
}

TEST(ReadBoxListFileTest, MissingFile) {
  EXPECT_THAT(
      ReadBoxListFile(absl::StrCat(::testing::TempDir(), "/missing.txt")),
      StatusIs(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace rectpack
