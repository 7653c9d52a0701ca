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

#include "tools/common/path_utils.h"

#include <string>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace xcode_make {

absl::string_view GetExtension(absl::string_view path) {
  size_t last_slash = path.rfind('/');
  size_t dot = path.rfind('.');
  if (dot == absl::string_view::npos ||
      (last_slash != absl::string_view::npos && dot < last_slash)) {
    // If the dot was part of a previous path segment, treat it as if it wasn't
    // found (it's not an extension of the filename).
    return "";
  }
  return path.substr(dot);
}

bool IsObjectFilePath(absl::string_view path) {
  return GetExtension(path) == kObjectFileExtension;
}

bool IsSwiftSourcePath(absl::string_view path) {
  return GetExtension(path) == kSwiftSourceExtension;
}

bool IsAbsolutePath(absl::string_view path) {
  return absl::StartsWith(path, "/");
}

std::string JoinPath(absl::string_view directory, absl::string_view path) {
  if (directory.empty() || IsAbsolutePath(path)) {
    return std::string(path);
  }
  if (absl::EndsWith(directory, "/")) {
    return absl::StrCat(directory, path);
  }
  return absl::StrCat(directory, "/", path);
}

}  // namespace xcode_make
