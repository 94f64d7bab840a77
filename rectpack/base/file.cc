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

#include "rectpack/base/file.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "rectpack/base/logging.h"
#include "rectpack/base/status_macros.h"

namespace file {

namespace {

absl::Status ErrnoToStatus(absl::string_view operation,
                           absl::string_view file_name, int error_number) {
  const std::string message = absl::StrCat(
      "Could not ", operation, " '", file_name, "': ", strerror(error_number));
  if (error_number == ENOENT) return absl::NotFoundError(message);
  if (error_number == EACCES) return absl::PermissionDeniedError(message);
  return absl::InvalidArgumentError(message);
}

// Closes the file on destruction.
class CFile {
 public:
  CFile(absl::string_view file_name, const char* mode)
      : file_name_(file_name), f_(fopen(file_name_.c_str(), mode)) {}
  CFile(const CFile&) = delete;
  CFile& operator=(const CFile&) = delete;
  ~CFile() {
    if (f_ != nullptr) fclose(f_);
  }

  FILE* get() const { return f_; }

  absl::Status Close() {
    FILE* const f = f_;
    f_ = nullptr;
    if (fclose(f) != 0) return ErrnoToStatus("close", file_name_, errno);
    return absl::OkStatus();
  }

 private:
  const std::string file_name_;
  FILE* f_;
};

}  // namespace

absl::StatusOr<std::string> GetContents(absl::string_view file_name) {
  CFile file(file_name, "rb");
  if (file.get() == nullptr) return ErrnoToStatus("open", file_name, errno);

  std::string contents;
  char buffer[4096];
  size_t num_read;
  while ((num_read = fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
    contents.append(buffer, num_read);
  }
  if (ferror(file.get())) return ErrnoToStatus("read", file_name, errno);
  RETURN_IF_ERROR(file.Close());
  return contents;
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  CFile file(file_name, "wb");
  if (file.get() == nullptr) return ErrnoToStatus("open", file_name, errno);
  if (fwrite(contents.data(), 1, contents.size(), file.get()) !=
      contents.size()) {
    return ErrnoToStatus("write", file_name, errno);
  }
  return file.Close();
}

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto) {
  ASSIGN_OR_RETURN(const std::string contents, GetContents(file_name));
  if (!google::protobuf::TextFormat::ParseFromString(contents, proto)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Could not parse '", file_name, "' as a ", proto->GetTypeName()));
  }
  return absl::OkStatus();
}

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto) {
  std::string contents;
  if (!google::protobuf::TextFormat::PrintToString(proto, &contents)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not print a ", proto.GetTypeName(), " for '",
                     file_name, "'"));
  }
  VLOG(1) << "Writing " << contents.size() << " bytes to " << file_name;
  return SetContents(file_name, contents);
}

}  // namespace file
