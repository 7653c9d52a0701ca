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

#ifndef XCODE_MAKE_TOOLS_COMMON_COMMAND_LINE_H_
#define XCODE_MAKE_TOOLS_COMMON_COMMAND_LINE_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace xcode_make {

// Consumes and returns a single argument from the given command line (skipping
// any leading whitespace and also handling quoted/escaped arguments), advancing
// the view to the end of the argument in a similar fashion to
// `absl::ConsumePrefix()`. Returns `nullopt` when only whitespace remains.
std::optional<std::string> ConsumeArg(absl::string_view *line);

// Splits a shell-style command line as printed in a build log into its
// unquoted, unescaped arguments.
std::vector<std::string> SplitCommandLine(absl::string_view command_line);

// Removes quoting and backslash escapes from the whole string. Unlike
// `ConsumeArg`, unescaped whitespace does not end the value.
std::string Unescape(absl::string_view arg);

// Returns `command_line` with every argument that unescapes to exactly `arg`
// removed, along with the whitespace preceding it. The remaining text is left
// byte-for-byte as it was, including its quoting.
std::string RemoveArg(absl::string_view command_line, absl::string_view arg);

// Returns the value of `option` in the argument list, accepting both the
// separate (`-flag value`) and joined (`-flag=value`) spellings. The first
// occurrence wins.
std::optional<std::string> FindOptionValue(const std::vector<std::string> &args,
                                           absl::string_view option);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_COMMON_COMMAND_LINE_H_
