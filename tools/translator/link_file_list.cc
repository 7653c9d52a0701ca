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

#include "tools/translator/link_file_list.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "tools/common/command_line.h"
#include "tools/common/file_system.h"
#include "tools/common/path_utils.h"

namespace xcode_make {

std::optional<FileListArgument> FindFileListArgument(
    absl::string_view command_line) {
  std::vector<std::string> args = SplitCommandLine(command_line);
  for (auto it = args.begin(); it != args.end(); ++it) {
    if (*it == "-Xlinker") {
      // The next argument belongs to the linker, not to the driver; skip it
      // even if it happens to spell `-filelist`.
      if (++it == args.end()) {
        break;
      }
      continue;
    }
    if (*it != "-filelist") {
      continue;
    }
    if (it + 1 == args.end()) {
      return std::nullopt;
    }
    std::pair<std::string, std::string> path_and_directory =
        absl::StrSplit(*(it + 1), absl::MaxSplits(',', 1));
    return FileListArgument{path_and_directory.first,
                            path_and_directory.second};
  }
  return std::nullopt;
}

absl::StatusOr<std::vector<std::string>> ReadLinkFileList(
    absl::string_view path, absl::string_view directory) {
  absl::StatusOr<std::string> contents = ReadFile(path);
  if (!contents.ok()) {
    return contents.status();
  }

  std::vector<std::string> entries;
  for (absl::string_view line : absl::StrSplit(*contents, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) {
      continue;
    }
    entries.push_back(JoinPath(directory, line));
  }
  return entries;
}

}  // namespace xcode_make
