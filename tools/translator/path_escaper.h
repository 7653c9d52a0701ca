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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_PATH_ESCAPER_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_PATH_ESCAPER_H_

#include <string>

#include "absl/strings/string_view.h"

namespace xcode_make {

// The quoting dialects used when a path from the build log is written into the
// generated makefile. Each function is applied exactly once per use site, in
// this order:
//
// - Targets and prerequisites: `UnescapeLogPath` (for paths taken from log
//   records), then `EscapeMakeTarget`.
// - Paths inside a recipe: `UnescapeLogPath`, then `EscapeShell`, then
//   `EscapeDollars`.
// - Command lines copied from the log: `EscapeDollars` only; they are already
//   valid shell.

// Escapes `$`, `&` and spaces so that the path is a single make target or
// prerequisite token. Dollars are doubled; the others are backslash-escaped.
std::string EscapeMakeTarget(absl::string_view path);

// Inverts `EscapeMakeTarget`.
std::string UnescapeMakeTarget(absl::string_view target);

// Backslash-escapes the shell metacharacters `(`, `)`, `#`, `&`, `$` and
// spaces so that the path is a single shell word.
std::string EscapeShell(absl::string_view path);

// Inverts `EscapeShell` the way the shell would when reading the word.
std::string UnescapeShell(absl::string_view word);

// Doubles every `$` so that the text survives make's variable expansion.
std::string EscapeDollars(absl::string_view text);

// Removes the backslash escapes that build logs place in front of spaces and
// other special characters in paths (for example, `My\ App` becomes `My App`).
std::string UnescapeLogPath(absl::string_view path);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_PATH_ESCAPER_H_
