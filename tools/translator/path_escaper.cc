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

#include "tools/translator/path_escaper.h"

#include <string>

#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"

namespace xcode_make {

namespace {

// Returns `text` with a backslash inserted before each character that appears
// in `special`.
std::string BackslashEscape(absl::string_view text, absl::string_view special) {
  std::string result;
  result.reserve(text.size());
  for (char ch : text) {
    if (special.find(ch) != absl::string_view::npos) {
      result.push_back('\\');
    }
    result.push_back(ch);
  }
  return result;
}

// Drops each backslash and keeps the character that follows it. A trailing
// lone backslash is kept.
std::string BackslashUnescape(absl::string_view text) {
  std::string result;
  result.reserve(text.size());
  size_t length = text.size();
  for (size_t i = 0; i < length; ++i) {
    if (text[i] == '\\' && i + 1 < length) {
      ++i;
    }
    result.push_back(text[i]);
  }
  return result;
}

}  // namespace

std::string EscapeMakeTarget(absl::string_view path) {
  std::string result;
  result.reserve(path.size());
  for (char ch : path) {
    switch (ch) {
      case '$':
        result.append("$$");
        break;
      case '&':
      case ' ':
        result.push_back('\\');
        result.push_back(ch);
        break;
      default:
        result.push_back(ch);
    }
  }
  return result;
}

std::string UnescapeMakeTarget(absl::string_view target) {
  std::string result;
  result.reserve(target.size());
  size_t length = target.size();
  for (size_t i = 0; i < length; ++i) {
    char ch = target[i];
    if (ch == '$' && i + 1 < length && target[i + 1] == '$') {
      ++i;
    } else if (ch == '\\' && i + 1 < length &&
               (target[i + 1] == ' ' || target[i + 1] == '&')) {
      ++i;
      ch = target[i];
    }
    result.push_back(ch);
  }
  return result;
}

std::string EscapeShell(absl::string_view path) {
  return BackslashEscape(path, "()#&$ ");
}

std::string UnescapeShell(absl::string_view word) {
  return BackslashUnescape(word);
}

std::string EscapeDollars(absl::string_view text) {
  return absl::StrReplaceAll(text, {{"$", "$$"}});
}

std::string UnescapeLogPath(absl::string_view path) {
  return BackslashUnescape(path);
}

}  // namespace xcode_make
