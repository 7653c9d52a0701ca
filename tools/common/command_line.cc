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

#include "tools/common/command_line.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace xcode_make {

namespace {

// Appends the unescaped characters of `text` starting at `*index` to `result`,
// stopping at the end of the text or (if `stop_at_whitespace` is true) at the
// first unquoted, unescaped whitespace character. On return, `*index` is the
// position where scanning stopped.
void UnescapeInto(absl::string_view text, bool stop_at_whitespace,
                  size_t *index, std::string *result) {
  size_t length = text.size();
  size_t i = *index;
  for (; i < length; ++i) {
    char ch = text[i];

    if (stop_at_whitespace && absl::ascii_isspace(ch)) {
      break;
    }

    // If it's a backslash, consume it and append the character that follows.
    if (ch == '\\' && i + 1 < length) {
      ++i;
      result->push_back(text[i]);
      continue;
    }

    // If it's a quote, process everything up to the matching quote, unescaping
    // backslashed characters as needed. Single quotes are literal in the
    // shell, so backslashes are only special inside double quotes.
    if (ch == '"' || ch == '\'') {
      char quote = ch;
      ++i;
      while (i != length && text[i] != quote) {
        if (quote == '"' && text[i] == '\\' && i + 1 < length) {
          ++i;
        }
        result->push_back(text[i]);
        ++i;
      }
      if (i == length) {
        break;
      }
      continue;
    }

    // It's a regular character.
    result->push_back(ch);
  }
  *index = i;
}

}  // namespace

std::optional<std::string> ConsumeArg(absl::string_view *line) {
  size_t whitespace_count = 0;
  size_t length = line->size();
  while (whitespace_count < length &&
         absl::ascii_isspace((*line)[whitespace_count])) {
    whitespace_count++;
  }
  line->remove_prefix(whitespace_count);

  if (line->empty()) {
    return std::nullopt;
  }

  std::string result;
  size_t i = 0;
  UnescapeInto(*line, /*stop_at_whitespace=*/true, &i, &result);
  line->remove_prefix(i);
  return result;
}

std::vector<std::string> SplitCommandLine(absl::string_view command_line) {
  std::vector<std::string> args;
  while (std::optional<std::string> arg = ConsumeArg(&command_line)) {
    args.push_back(*std::move(arg));
  }
  return args;
}

std::string Unescape(absl::string_view arg) {
  std::string result;
  size_t i = 0;
  UnescapeInto(arg, /*stop_at_whitespace=*/false, &i, &result);
  return result;
}

std::string RemoveArg(absl::string_view command_line, absl::string_view arg) {
  std::string result;
  absl::string_view remaining = command_line;
  while (!remaining.empty()) {
    // `ConsumeArg` strips the leading whitespace itself; remember where this
    // argument's whitespace began so it can be dropped along with it.
    absl::string_view before = remaining;
    std::optional<std::string> consumed = ConsumeArg(&remaining);
    if (!consumed.has_value()) {
      // Trailing whitespace only.
      absl::StrAppend(&result, before);
      break;
    }
    absl::string_view raw = before.substr(0, before.size() - remaining.size());
    if (*consumed != arg) {
      absl::StrAppend(&result, raw);
    }
  }
  if (command_line.empty() || !absl::ascii_isspace(command_line.front())) {
    // If the first argument was removed, don't leave the separator of the one
    // that followed it at the front.
    return std::string(absl::StripLeadingAsciiWhitespace(result));
  }
  return result;
}

std::optional<std::string> FindOptionValue(const std::vector<std::string> &args,
                                           absl::string_view option) {
  for (auto it = args.begin(); it != args.end(); ++it) {
    absl::string_view current = *it;
    if (current == option) {
      if (it + 1 == args.end()) {
        return std::nullopt;
      }
      return *(it + 1);
    }
    if (absl::ConsumePrefix(&current, option) &&
        absl::ConsumePrefix(&current, "=")) {
      return std::string(current);
    }
  }
  return std::nullopt;
}

}  // namespace xcode_make
