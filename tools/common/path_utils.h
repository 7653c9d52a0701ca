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

#ifndef XCODE_MAKE_TOOLS_COMMON_PATH_UTILS_H_
#define XCODE_MAKE_TOOLS_COMMON_PATH_UTILS_H_

#include <string>

#include "absl/strings/string_view.h"

namespace xcode_make {

// The extension of object files produced by compilers and consumed by the
// linker.
inline constexpr absl::string_view kObjectFileExtension = ".o";

// The extension of Swift source files.
inline constexpr absl::string_view kSwiftSourceExtension = ".swift";

// Returns the extension of the last path component of the given filepath,
// including the leading dot. For example, given "/foo/bar.d/baz.o", returns
// ".o". Returns the empty string if the file name has no extension.
absl::string_view GetExtension(absl::string_view path);

// Returns true if the file name in the given path ends in `.o`.
bool IsObjectFilePath(absl::string_view path);

// Returns true if the file name in the given path ends in `.swift`.
bool IsSwiftSourcePath(absl::string_view path);

// Returns true if the path begins at the file system root.
bool IsAbsolutePath(absl::string_view path);

// Joins `path` to `directory`, inserting a separator if needed. If `path` is
// absolute or `directory` is empty, `path` is returned unchanged.
std::string JoinPath(absl::string_view directory, absl::string_view path);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_COMMON_PATH_UTILS_H_
