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

#include "tools/translator/step_parser.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "re2/re2.h"
#include "tools/common/command_line.h"
#include "tools/translator/build_step.h"
#include "tools/translator/line_cursor.h"
#include "tools/translator/output_file_map.h"
#include "tools/translator/path_escaper.h"

namespace xcode_make {

namespace {

// Paths in marker records escape spaces with a backslash, so a path is a run
// of escaped characters or non-space characters.
constexpr absl::string_view kLogPathPattern = R"((?:\\.|\S)+)";

const RE2 &CompileCPattern() {
  static const RE2 *const kPattern =
      new RE2(absl::StrCat(R"(^CompileC\s+()", kLogPathPattern, R"(\.o)\s+()",
                           kLogPathPattern, ")"));
  return *kPattern;
}

const RE2 &LinkPattern() {
  static const RE2 *const kPattern =
      new RE2(absl::StrCat(R"(^Ld\s+()", kLogPathPattern, ")"));
  return *kPattern;
}

// A step marker and the kind of step it begins.
struct StepPattern {
  StepKind kind;
  const RE2 *pattern;
};

// The markers in dispatch order.
const std::vector<StepPattern> &StepPatterns() {
  static const std::vector<StepPattern> *const kPatterns =
      new std::vector<StepPattern>{
          {StepKind::kCompileC, &CompileCPattern()},
          // `SwiftDriver\ Compilation` and `SwiftDriver\ Compilation\
          // Requirements` are progress records of the same step and do not
          // match because the name is followed by a backslash.
          {StepKind::kSwiftDriver, new RE2(R"(^SwiftDriver\s)")},
          {StepKind::kSwiftCompile, new RE2(R"(^CompileSwift\s)")},
          {StepKind::kLink, &LinkPattern()},
          {StepKind::kPostLink,
           new RE2(R"(^(?:/usr/bin/)?(?:codesign|touch)\s)")},
      };
  return *kPatterns;
}

// Consumes the `cd` record that must follow a step marker.
absl::Status ConsumeDirectoryChange(LineCursor &cursor,
                                    BuildStep *step) {
  int line_before = cursor.line_number();
  std::string record;
  std::optional<DirectoryChange> change = cursor.NextDirectoryChange(&record);
  if (cursor.line_number() == line_before) {
    return absl::OutOfRangeError(
        "the log ended before the step's 'cd' record");
  }
  step->records.push_back(record);
  if (!change.has_value()) {
    return absl::InvalidArgumentError(
        absl::Substitute("expected a 'cd' record but found '$0'", record));
  }
  step->working_directory = std::move(change->path);
  step->directory_change = std::move(change->recipe_prefix);
  return absl::OkStatus();
}

// Consumes the next non-blank record as the step's command.
absl::Status ConsumeCommand(LineCursor &cursor, BuildStep *step) {
  std::optional<std::string> command = cursor.NextNonBlankLine();
  if (!command.has_value()) {
    return absl::OutOfRangeError("the log ended before the step's command");
  }
  step->records.push_back(*command);
  step->command = *std::move(command);
  return absl::OkStatus();
}

void BeginStep(StepKind kind, absl::string_view marker, int line_number,
               BuildStep *step) {
  step->kind = kind;
  step->line_number = line_number;
  step->records.assign({std::string(marker)});
}

}  // namespace

std::optional<StepKind> ClassifyRecord(absl::string_view record) {
  for (const StepPattern &step_pattern : StepPatterns()) {
    if (RE2::PartialMatch(re2::StringPiece(record.data(), record.size()), *step_pattern.pattern)) {
      return step_pattern.kind;
    }
  }
  return std::nullopt;
}

absl::Status ParseStep(StepKind kind, absl::string_view marker,
                       LineCursor &cursor, BuildStep *step) {
  switch (kind) {
    case StepKind::kCompileC:
      return ParseCompileCStep(marker, cursor, step);
    case StepKind::kSwiftDriver:
      return ParseSwiftDriverStep(marker, cursor, step);
    case StepKind::kSwiftCompile:
      return ParseSwiftCompileStep(marker, cursor, step);
    case StepKind::kLink:
      return ParseLinkStep(marker, cursor, step);
    case StepKind::kPostLink:
      BeginStep(kind, marker, cursor.line_number(), step);
      return ParsePostLinkStep(marker, step);
  }
  return absl::InternalError("unhandled step kind");
}

absl::Status ParseCompileCStep(absl::string_view marker, LineCursor &cursor,
                               BuildStep *step) {
  BeginStep(StepKind::kCompileC, marker, cursor.line_number(), step);

  std::string object, source;
  if (!RE2::PartialMatch(re2::StringPiece(marker.data(), marker.size()), CompileCPattern(), &object, &source)) {
    return absl::InvalidArgumentError(
        "could not find the object and source paths");
  }
  step->outputs.push_back(UnescapeLogPath(object));
  step->sources.push_back(UnescapeLogPath(source));

  if (absl::Status status = ConsumeDirectoryChange(cursor, step);
      !status.ok()) {
    return status;
  }

  // xcodebuild escapes the `=` of exported variables (`export LANG\=C`).
  static const RE2 *const kExportPattern = new RE2(R"(^export\s+\w+\\?=)");
  std::vector<std::string> command_parts;
  while (std::optional<std::string> line = cursor.NextLine()) {
    step->records.push_back(*line);
    if (line->empty() || absl::StrContains(*line, "response file")) {
      continue;
    }
    bool is_export = RE2::PartialMatch(*line, *kExportPattern);
    command_parts.push_back(*std::move(line));
    if (!is_export) {
      step->command = absl::StrJoin(command_parts, " && ");
      return absl::OkStatus();
    }
  }
  return absl::OutOfRangeError("the log ended before the compiler command");
}

absl::Status ParseSwiftDriverStep(absl::string_view marker, LineCursor &cursor,
                                  BuildStep *step) {
  BeginStep(StepKind::kSwiftDriver, marker, cursor.line_number(), step);

  if (absl::Status status = ConsumeDirectoryChange(cursor, step);
      !status.ok()) {
    return status;
  }

  std::optional<std::string> driver_record = cursor.NextLine();
  if (!driver_record.has_value()) {
    return absl::OutOfRangeError(
        "the log ended before the driver invocation");
  }
  step->records.push_back(*driver_record);
  if (driver_record->empty()) {
    return absl::InvalidArgumentError(
        "expected the driver invocation but found a blank record");
  }

  step->command = StripDriverInvocation(*driver_record);
  std::optional<std::string> output_file_map_path =
      FindOutputFileMapPath(*driver_record, step->command);
  if (!output_file_map_path.has_value()) {
    return absl::InvalidArgumentError(
        "the driver invocation has no -output-file-map option");
  }
  step->output_file_map_path = *std::move(output_file_map_path);
  return absl::OkStatus();
}

absl::Status ParseSwiftCompileStep(absl::string_view marker, LineCursor &cursor,
                                   BuildStep *step) {
  BeginStep(StepKind::kSwiftCompile, marker, cursor.line_number(), step);

  if (absl::Status status = ConsumeDirectoryChange(cursor, step);
      !status.ok()) {
    return status;
  }
  if (absl::Status status = ConsumeCommand(cursor, step); !status.ok()) {
    return status;
  }

  static const RE2 *const kFrontendPattern =
      new RE2(R"(swift(?:-frontend|\s+-frontend)\s)");
  if (!RE2::PartialMatch(step->command, *kFrontendPattern)) {
    return absl::InvalidArgumentError(
        "expected a swift-frontend invocation");
  }

  std::vector<std::string> args = SplitCommandLine(step->command);
  for (auto it = args.begin(); it != args.end() && it + 1 != args.end(); ++it) {
    if (*it == "-primary-file") {
      step->sources.push_back(*++it);
    } else if (*it == "-o") {
      step->outputs.push_back(*++it);
    }
  }
  if (step->sources.empty() || step->sources.size() != step->outputs.size()) {
    return absl::InvalidArgumentError(absl::Substitute(
        "found $0 -primary-file argument(s) but $1 -o argument(s)",
        step->sources.size(), step->outputs.size()));
  }
  return absl::OkStatus();
}

absl::Status ParseLinkStep(absl::string_view marker, LineCursor &cursor,
                           BuildStep *step) {
  BeginStep(StepKind::kLink, marker, cursor.line_number(), step);

  std::string output;
  if (!RE2::PartialMatch(re2::StringPiece(marker.data(), marker.size()), LinkPattern(), &output)) {
    return absl::InvalidArgumentError("could not find the link output path");
  }
  step->outputs.push_back(UnescapeLogPath(output));

  if (absl::Status status = ConsumeDirectoryChange(cursor, step);
      !status.ok()) {
    return status;
  }
  return ConsumeCommand(cursor, step);
}

absl::Status ParsePostLinkStep(absl::string_view marker,
                               BuildStep *step) {
  step->kind = StepKind::kPostLink;
  if (step->records.empty()) {
    step->records.push_back(std::string(marker));
  }
  step->command = std::string(marker);
  return absl::OkStatus();
}

}  // namespace xcode_make
