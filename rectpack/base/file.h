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

// Whole-file reads and writes, with errors reported as absl::Status.

#ifndef RECTPACK_BASE_FILE_H_
#define RECTPACK_BASE_FILE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace file {

absl::StatusOr<std::string> GetContents(absl::string_view file_name);

// Creates or truncates the file.
absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents);

// Reads or writes a proto in text format.
absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto);
absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto);

}  // namespace file

#endif  // RECTPACK_BASE_FILE_H_
