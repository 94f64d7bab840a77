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

#ifndef RECTPACK_BASE_LOGGING_H_
#define RECTPACK_BASE_LOGGING_H_

#include "absl/base/log_severity.h"    // IWYU pragma: keep
#include "absl/log/check.h"            // IWYU pragma: keep
#include "absl/log/globals.h"          // IWYU pragma: keep
#include "absl/log/log.h"              // IWYU pragma: keep
#include "absl/log/vlog_is_on.h"       // IWYU pragma: keep
#include "absl/status/status.h"        // IWYU pragma: keep
#include "absl/strings/str_cat.h"      // IWYU pragma: keep
#include "absl/strings/string_view.h"  // IWYU pragma: keep

namespace rectpack {

// Sends every message of at least `min_severity` to stderr, e.g. so that a
// command line tool shows its LOG(INFO) progress. Packer internals only log at
// VLOG(1) and above, which are enabled separately with --v or --vmodule.
void LogToStderr(absl::LogSeverityAtLeast min_severity =
                     absl::LogSeverityAtLeast::kInfo);

}  // namespace rectpack

#endif  // RECTPACK_BASE_LOGGING_H_
