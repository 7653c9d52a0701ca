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

#include "tools/translator/translator.h"

#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "absl/time/time.h"
#include "tools/common/diagnostics.h"
#include "tools/common/file_system.h"
#include "tools/common/status.h"
#include "tools/translator/build_step.h"
#include "tools/translator/line_cursor.h"
#include "tools/translator/path_escaper.h"
#include "tools/translator/rule_builder.h"
#include "tools/translator/rule_set_writer.h"
#include "tools/translator/rule_table.h"
#include "tools/translator/step_parser.h"

namespace xcode_make {

namespace {

// The state of a single translation. Everything here is owned by one call to
// `Translator::Translate` and discarded when it returns.
class TranslationState {
 public:
  TranslationState(const RuleSetHeader &header, Diagnostics &diagnostics)
      : log_path_(header.log_path),
        diagnostics_(diagnostics),
        writer_(header) {}

  // Handles one record read from the log, consuming any further records that
  // belong to the step it begins.
  void ProcessRecord(const std::string &record, LineCursor &cursor);

  // Appends the terminal rule and returns the result.
  Translation Finish(int records_read) &&;

 private:
  // Returns the rules of a parsed step and records its linked product or
  // post-link command.
  absl::StatusOr<std::vector<Rule>> RulesForStep(const BuildStep &step);

  // Registers each rule and writes the ones whose targets are new.
  void AddRules(const std::vector<Rule> &rules);

  // Reports a step that produced no rules and echoes what it consumed.
  void SkipStep(const BuildStep &step, const absl::Status &status);

  std::string Location(const BuildStep &step) const {
    return absl::StrCat(log_path_, ":", step.line_number);
  }

  std::string log_path_;
  Diagnostics &diagnostics_;
  RuleTable table_;
  LinkedProducts linked_products_;

  // The post-link commands, escaped for make, in log order.
  std::vector<std::string> post_link_recipe_;

  RuleSetWriter writer_;
  TranslationSummary summary_;
};

void TranslationState::ProcessRecord(const std::string &record,
                                     LineCursor &cursor) {
  if (record.empty()) {
    return;
  }

  std::optional<StepKind> kind = ClassifyRecord(record);
  if (!kind.has_value()) {
    writer_.AddComment(record);
    return;
  }

  BuildStep step;
  step.line_number = cursor.line_number();
  absl::Status status = ParseStep(*kind, record, cursor, &step);
  if (!status.ok()) {
    SkipStep(step, status);
    return;
  }

  absl::StatusOr<std::vector<Rule>> rules = RulesForStep(step);
  if (!rules.ok()) {
    SkipStep(step, rules.status());
    return;
  }
  writer_.AddComment(record);
  AddRules(*rules);
  ++summary_.steps_translated;
}

absl::StatusOr<std::vector<Rule>> TranslationState::RulesForStep(
    const BuildStep &step) {
  switch (step.kind) {
    case StepKind::kCompileC:
    case StepKind::kSwiftCompile:
      return BuildCompileRules(step);

    case StepKind::kSwiftDriver: {
      absl::StatusOr<std::vector<Rule>> rules = BuildSwiftDriverRules(step);
      if (rules.ok() && rules->empty()) {
        diagnostics_.Warning(Location(step),
                             "the output file map lists no Swift sources "
                             "with object files",
                             step.output_file_map_path);
      }
      return rules;
    }

    case StepKind::kLink: {
      bool dependencies_tracked = true;
      absl::StatusOr<Rule> rule =
          BuildLinkRule(step, table_, &dependencies_tracked);
      if (!rule.ok()) {
        return rule.status();
      }
      if (!dependencies_tracked) {
        diagnostics_.Warning(
            Location(step),
            "the link command has no -filelist option; the product will not "
            "be relinked when its objects change",
            step.records.front());
      }
      linked_products_.Add(rule->target);
      return std::vector<Rule>{*std::move(rule)};
    }

    case StepKind::kPostLink:
      post_link_recipe_.push_back(EscapeDollars(step.command));
      return std::vector<Rule>();
  }
  return absl::InternalError("unhandled step kind");
}

void TranslationState::AddRules(const std::vector<Rule> &rules) {
  for (const Rule &rule : rules) {
    if (table_.Insert(rule)) {
      writer_.AddRule(rule);
      ++summary_.rules_emitted;
    }
  }
}

void TranslationState::SkipStep(const BuildStep &step,
                                const absl::Status &status) {
  ++summary_.steps_skipped;
  diagnostics_.Warning(
      Location(step),
      absl::Substitute("skipped $0 step: $1", StepKindName(step.kind),
                       status.message()),
      step.records.empty() ? "" : step.records.front());
  for (const std::string &record : step.records) {
    if (!record.empty()) {
      writer_.AddComment(record);
    }
  }
}

Translation TranslationState::Finish(int records_read) && {
  summary_.records_read = records_read;
  summary_.linked_products = linked_products_.targets();
  Translation translation;
  translation.rule_set = std::move(writer_).Finish(linked_products_.targets(),
                                                   post_link_recipe_);
  translation.summary = std::move(summary_);
  return translation;
}

}  // namespace

absl::StatusOr<Translation> Translator::Translate(absl::string_view log_path) {
  std::ifstream log_stream{std::string(log_path)};
  if (!log_stream.is_open()) {
    return MakeStatusFromErrno(
        absl::Substitute("Could not open build log $0", log_path));
  }

  absl::StatusOr<absl::Time> captured = GetModificationTime(log_path);
  if (!captured.ok()) {
    return captured.status();
  }

  RuleSetHeader header;
  header.invocation = invocation_;
  header.log_captured = *captured;
  header.log_path = std::string(log_path);
  return Translate(log_stream, header);
}

absl::StatusOr<Translation> Translator::Translate(std::istream &log,
                                                  const RuleSetHeader &header) {
  TranslationState state(header, diagnostics_);
  LineCursor cursor(log);
  while (std::optional<std::string> record = cursor.NextLine()) {
    state.ProcessRecord(*record, cursor);
  }
  if (log.bad()) {
    return absl::DataLossError(
        absl::Substitute("Could not read build log $0 to the end; stopped "
                         "after line $1",
                         header.log_path, cursor.line_number()));
  }
  return std::move(state).Finish(cursor.line_number());
}

absl::StatusOr<std::string> TranslateLog(absl::string_view log_path,
                                         absl::string_view invocation,
                                         Diagnostics &diagnostics) {
  absl::StatusOr<Translation> translation =
      Translator(invocation, diagnostics).Translate(log_path);
  if (!translation.ok()) {
    return translation.status();
  }
  return std::move(translation->rule_set);
}

absl::Status WriteRuleSet(absl::string_view path, absl::string_view rule_set) {
  return WriteFile(path, rule_set);
}

}  // namespace xcode_make
