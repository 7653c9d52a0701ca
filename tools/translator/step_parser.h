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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_STEP_PARSER_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_STEP_PARSER_H_

#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "tools/translator/build_step.h"
#include "tools/translator/line_cursor.h"

namespace xcode_make {

// Returns the kind of step that the given trimmed record begins, or `nullopt`
// if the record is not a step marker. Kinds are tried in a fixed order and the
// first match wins.
std::optional<StepKind> ClassifyRecord(absl::string_view record);

// Parses the step of the given kind that begins with `marker`, consuming the
// records that belong to it from `cursor` and filling in `step`.
//
// A non-OK status means the step is malformed and must be skipped; the records
// consumed so far are still listed in `step->records` so they can be reported.
// Parsing of the log can always resume at the cursor's next record.
absl::Status ParseStep(StepKind kind, absl::string_view marker,
                       LineCursor &cursor, BuildStep *step);

// The per-kind parsers dispatched to by `ParseStep`. Each expects `marker` to
// have been classified as its kind.

// `CompileC <object> <source> ...`, then `cd`, then the compiler command. Blank
// records, `response file` notices and `export` records before the command are
// skipped; exports are prefixed to the command.
absl::Status ParseCompileCStep(absl::string_view marker, LineCursor &cursor,
                               BuildStep *step);

// `SwiftDriver ...`, then `cd`, then the driver invocation, which must name an
// output file map.
absl::Status ParseSwiftDriverStep(absl::string_view marker, LineCursor &cursor,
                                  BuildStep *step);

// `CompileSwift ...`, then `cd`, then a frontend invocation whose
// `-primary-file` and `-o` arguments are paired positionally.
absl::Status ParseSwiftCompileStep(absl::string_view marker, LineCursor &cursor,
                                   BuildStep *step);

// `Ld <output> ...`, then `cd`, then the linker invocation.
absl::Status ParseLinkStep(absl::string_view marker, LineCursor &cursor,
                           BuildStep *step);

// A `codesign` or `touch` command; nothing further is consumed.
absl::Status ParsePostLinkStep(absl::string_view marker,
                               BuildStep *step);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_STEP_PARSER_H_
