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

#include "tools/translator/rule_set_writer.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/time/time.h"
#include "tools/common/file_system.h"
#include "tools/translator/rule_table.h"

namespace xcode_make {

namespace {

constexpr absl::string_view kGeneratedBanner =
    "# Generated by xcode_make. Do not edit.";
constexpr absl::string_view kInvocationPrefix = "# Invocation: ";

// Returns `text` on a single line, with any line break turned into a space.
std::string SingleLine(absl::string_view text) {
  return absl::StrReplaceAll(text, {{"\r\n", " "}, {"\n", " "}, {"\r", " "}});
}

}  // namespace

RuleSetWriter::RuleSetWriter(const RuleSetHeader &header) {
  absl::StrAppend(&text_, kGeneratedBanner, "\n");
  absl::StrAppend(&text_, kInvocationPrefix, SingleLine(header.invocation),
                  "\n");
  absl::StrAppend(&text_, "# Log captured: ",
                  absl::FormatTime("%Y-%m-%d %H:%M:%S UTC",
                                   header.log_captured, absl::UTCTimeZone()),
                  "\n");
  absl::StrAppend(&text_, "# Log file: ", SingleLine(header.log_path), "\n\n");
}

void RuleSetWriter::AddComment(absl::string_view text) {
  absl::StrAppend(&text_, "# ", SingleLine(text));
  // A backslash at the end of a comment would continue it onto the next line.
  if (absl::EndsWith(text, "\\")) {
    text_.push_back(' ');
  }
  text_.push_back('\n');
}

void RuleSetWriter::AddRule(const Rule &rule) {
  absl::StrAppend(&text_, rule.target, ":");
  for (const std::string &prerequisite : rule.prerequisites) {
    absl::StrAppend(&text_, " ", prerequisite);
  }
  absl::StrAppend(&text_, "\n\t", rule.recipe, "\n\n");
}

std::string RuleSetWriter::Finish(
    const std::vector<std::string> &linked_products,
    const std::vector<std::string> &post_link_recipe) && {
  if (!absl::EndsWith(text_, "\n\n")) {
    text_.push_back('\n');
  }
  absl::StrAppend(&text_, kTerminalTarget, ":");
  for (const std::string &product : linked_products) {
    absl::StrAppend(&text_, " ", product);
  }
  text_.push_back('\n');
  for (const std::string &command : post_link_recipe) {
    absl::StrAppend(&text_, "\t", command, "\n");
  }
  return std::move(text_);
}

std::optional<std::string> ReadRuleSetInvocation(
    absl::string_view rule_set_text) {
  std::pair<absl::string_view, absl::string_view> banner_and_rest =
      absl::StrSplit(rule_set_text, absl::MaxSplits('\n', 1));
  if (banner_and_rest.first != kGeneratedBanner) {
    return std::nullopt;
  }
  std::pair<absl::string_view, absl::string_view> invocation_and_rest =
      absl::StrSplit(banner_and_rest.second, absl::MaxSplits('\n', 1));
  absl::string_view invocation = invocation_and_rest.first;
  if (!absl::ConsumePrefix(&invocation, kInvocationPrefix)) {
    return std::nullopt;
  }
  return std::string(invocation);
}

bool IsRuleSetFresh(absl::string_view rule_set_path,
                    absl::string_view invocation) {
  absl::StatusOr<std::string> contents = ReadFile(rule_set_path);
  if (!contents.ok()) {
    return false;
  }
  std::optional<std::string> recorded = ReadRuleSetInvocation(*contents);
  return recorded.has_value() && *recorded == SingleLine(invocation);
}

}  // namespace xcode_make
