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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_LINK_FILE_LIST_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_LINK_FILE_LIST_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace xcode_make {

// The value of a linker `-filelist` option. ld accepts `-filelist file,dir`,
// in which case every listed path is relative to `directory`.
struct FileListArgument {
  std::string path;
  std::string directory;
};

// Finds the `-filelist` option in a linker command line. Arguments passed
// through to the linker by the compiler driver (`-Xlinker -filelist` or
// `-Wl,-filelist,...`) are not considered.
std::optional<FileListArgument> FindFileListArgument(
    absl::string_view command_line);

// Reads the object paths listed one per line in the given file list. Blank
// lines are ignored. If `directory` is not empty, it is prepended to each
// relative entry.
absl::StatusOr<std::vector<std::string>> ReadLinkFileList(
    absl::string_view path, absl::string_view directory = "");

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_LINK_FILE_LIST_H_
