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

#include "tools/translator/line_cursor.h"

#include <istream>
#include <optional>
#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "re2/re2.h"
#include "tools/common/command_line.h"
#include "tools/translator/path_escaper.h"

namespace xcode_make {

std::optional<std::string> LineCursor::NextLine() {
  std::string line;
  if (!std::getline(stream_, line)) {
    return std::nullopt;
  }
  ++line_number_;
  absl::StripAsciiWhitespace(&line);
  return line;
}

std::optional<std::string> LineCursor::NextNonBlankLine() {
  while (std::optional<std::string> line = NextLine()) {
    if (!line->empty()) {
      return line;
    }
  }
  return std::nullopt;
}

std::optional<DirectoryChange> LineCursor::NextDirectoryChange(
    std::string *record) {
  std::optional<std::string> line = NextLine();
  if (!line.has_value()) {
    return std::nullopt;
  }
  if (record != nullptr) {
    *record = *line;
  }
  return ParseDirectoryChange(*line);
}

std::optional<DirectoryChange> ParseDirectoryChange(const std::string &record) {
  static const RE2 *const kDirectoryChangePattern =
      new RE2(R"(^(?:/usr/bin/time\s+)?cd\s+(.+)$)");

  std::string escaped_path;
  if (!RE2::FullMatch(record, *kDirectoryChangePattern, &escaped_path)) {
    return std::nullopt;
  }

  DirectoryChange change;
  change.path = Unescape(escaped_path);
  change.recipe_prefix =
      absl::StrCat("cd ", EscapeDollars(EscapeShell(change.path)));
  return change;
}

}  // namespace xcode_make
