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

#include "tools/translator/rule_builder.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tools/common/path_utils.h"
#include "tools/translator/build_step.h"
#include "tools/translator/link_file_list.h"
#include "tools/translator/output_file_map.h"
#include "tools/translator/path_escaper.h"
#include "tools/translator/rule_table.h"

namespace xcode_make {

namespace {

// Returns a rule that rebuilds `output` from `source` with the step's command.
Rule MakeCompileRule(const BuildStep &step, absl::string_view source,
                     absl::string_view output) {
  Rule rule;
  rule.target = EscapeMakeTarget(output);
  rule.prerequisites.push_back(EscapeMakeTarget(source));
  rule.working_directory = step.working_directory;
  rule.recipe = CompileRecipe(step, output);
  return rule;
}

}  // namespace

std::string CompileRecipe(const BuildStep &step, absl::string_view object) {
  return absl::StrCat(step.directory_change, " && ",
                      EscapeDollars(step.command), " && touch ",
                      EscapeDollars(EscapeShell(object)));
}

std::vector<Rule> BuildCompileRules(const BuildStep &step) {
  std::vector<Rule> rules;
  for (size_t i = 0; i < step.outputs.size() && i < step.sources.size(); ++i) {
    rules.push_back(MakeCompileRule(step, step.sources[i], step.outputs[i]));
  }
  return rules;
}

absl::StatusOr<std::vector<Rule>> BuildSwiftDriverRules(
    const BuildStep &step) {
  OutputFileMap output_file_map;
  if (absl::Status status = output_file_map.ReadFromPath(
          JoinPath(step.working_directory, step.output_file_map_path));
      !status.ok()) {
    return status;
  }

  std::vector<Rule> rules;
  for (const SourceOutput &entry :
       output_file_map.SwiftOutputsOfKind("object")) {
    rules.push_back(MakeCompileRule(step, entry.source, entry.output));
  }
  return rules;
}

absl::StatusOr<Rule> BuildLinkRule(const BuildStep &step,
                                   const RuleTable &table,
                                   bool *dependencies_tracked) {
  if (step.outputs.empty()) {
    return absl::InvalidArgumentError("the link step has no output");
  }

  Rule rule;
  rule.target = EscapeMakeTarget(step.outputs.front());
  rule.working_directory = step.working_directory;
  rule.recipe = absl::StrCat(step.directory_change, " && ",
                             EscapeDollars(step.command));

  std::optional<FileListArgument> file_list =
      FindFileListArgument(step.command);
  if (!file_list.has_value()) {
    *dependencies_tracked = false;
    return rule;
  }

  std::string directory;
  if (!file_list->directory.empty()) {
    directory = JoinPath(step.working_directory, file_list->directory);
  }
  absl::StatusOr<std::vector<std::string>> objects = ReadLinkFileList(
      JoinPath(step.working_directory, file_list->path), directory);
  if (!objects.ok()) {
    return objects.status();
  }

  for (const std::string &object : *objects) {
    std::string prerequisite = EscapeMakeTarget(object);
    if (table.Contains(prerequisite) || IsObjectFilePath(object)) {
      rule.prerequisites.push_back(std::move(prerequisite));
    }
  }
  *dependencies_tracked = true;
  return rule;
}

}  // namespace xcode_make
