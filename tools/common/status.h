// Copyright 2022 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef XCODE_MAKE_TOOLS_COMMON_STATUS_H_
#define XCODE_MAKE_TOOLS_COMMON_STATUS_H_

#include <cerrno>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace xcode_make {

// Returns the canonical status code that best describes the given `errno`
// value.
absl::StatusCode StatusCodeForErrno(int error_number);

// Returns a status whose code is derived from `error_number` and whose message
// is `message` followed by the errno value and its description. The default
// argument reads `errno` at the call site, so call this immediately after the
// failing system call.
absl::Status MakeStatusFromErrno(absl::string_view message,
                                 int error_number = errno);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_COMMON_STATUS_H_
