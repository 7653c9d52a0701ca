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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_LINE_CURSOR_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_LINE_CURSOR_H_

#include <istream>
#include <optional>
#include <string>

namespace xcode_make {

// A `cd` record that introduces the working directory of a build step.
struct DirectoryChange {
  // The directory, with the log's quoting and escaping removed.
  std::string path;

  // `cd <path>`, with the path escaped for use at the start of a make recipe.
  std::string recipe_prefix;
};

// Reads a build log one record at a time, strictly forward. Records are
// returned with leading and trailing whitespace removed. A record that has
// been returned is never returned again.
class LineCursor {
 public:
  explicit LineCursor(std::istream &stream) : stream_(stream) {}

  LineCursor(const LineCursor &) = delete;
  LineCursor &operator=(const LineCursor &) = delete;

  // Returns the next record, or `nullopt` at the end of the log.
  std::optional<std::string> NextLine();

  // Returns the next record that is not blank, skipping blank ones, or
  // `nullopt` at the end of the log.
  std::optional<std::string> NextNonBlankLine();

  // Consumes the next record and returns it as a directory change if it is of
  // the form `cd <path>` (optionally preceded by `/usr/bin/time`). Returns
  // `nullopt` otherwise; the record is consumed either way. If `record` is not
  // null, the consumed record is stored there.
  std::optional<DirectoryChange> NextDirectoryChange(
      std::string *record = nullptr);

  // The 1-based number of the record most recently returned, or 0 if none has
  // been read yet.
  int line_number() const { return line_number_; }

 private:
  std::istream &stream_;
  int line_number_ = 0;
};

// Parses a single trimmed record as a directory change.
std::optional<DirectoryChange> ParseDirectoryChange(const std::string &record);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_LINE_CURSOR_H_
