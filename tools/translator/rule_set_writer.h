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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_RULE_SET_WRITER_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_RULE_SET_WRITER_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "tools/translator/rule_table.h"

namespace xcode_make {

// The name of the rule that depends on every linked product and runs the
// post-link commands.
inline constexpr absl::string_view kTerminalTarget = "main";

// The values stamped into the comment block at the top of a rule set.
struct RuleSetHeader {
  // The build tool invocation that produced the log. A rule set is stale when
  // this no longer matches the invocation the caller is about to run.
  std::string invocation;

  // When the log was captured.
  absl::Time log_captured;

  // The log the rule set was generated from.
  std::string log_path;
};

// Accumulates the text of a makefile: a header, then comments and rule blocks
// in the order they are added, then the terminal `main` rule.
class RuleSetWriter {
 public:
  explicit RuleSetWriter(const RuleSetHeader &header);

  // Appends `# <text>`.
  void AddComment(absl::string_view text);

  // Appends the rule as a `target: prerequisites` line followed by its
  // tab-indented recipe.
  void AddRule(const Rule &rule);

  // Appends the terminal rule, which depends on `linked_products` and runs
  // `post_link_recipe` one command per line, and returns the finished text.
  // The commands must already be escaped for make.
  std::string Finish(const std::vector<std::string> &linked_products,
                     const std::vector<std::string> &post_link_recipe) &&;

 private:
  std::string text_;
};

// Returns the invocation recorded in the header of a rule set, or `nullopt` if
// the text does not begin with a rule set header.
std::optional<std::string> ReadRuleSetInvocation(
    absl::string_view rule_set_text);

// Returns true if the rule set at the given path exists and was generated for
// `invocation`.
bool IsRuleSetFresh(absl::string_view rule_set_path,
                    absl::string_view invocation);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_RULE_SET_WRITER_H_
