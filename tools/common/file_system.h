// Copyright 2019 The Bazel Authors. All rights reserved.
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

#ifndef XCODE_MAKE_TOOLS_COMMON_FILE_SYSTEM_H_
#define XCODE_MAKE_TOOLS_COMMON_FILE_SYSTEM_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace xcode_make {

// Returns true if something exists at path.
bool PathExists(absl::string_view path);

// Reads the entire contents of the file at the given path.
absl::StatusOr<std::string> ReadFile(absl::string_view path);

// Returns the last modification time of the file at the given path.
absl::StatusOr<absl::Time> GetModificationTime(absl::string_view path);

// Replaces the contents of the file at the given path with `contents`,
// creating the file if it does not exist.
absl::Status WriteFile(absl::string_view path, absl::string_view contents);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_COMMON_FILE_SYSTEM_H_
