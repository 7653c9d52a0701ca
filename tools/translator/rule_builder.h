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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_RULE_BUILDER_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_RULE_BUILDER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tools/translator/build_step.h"
#include "tools/translator/rule_table.h"

namespace xcode_make {

// Returns the recipe that reruns a compilation in the step's working
// directory and then touches `object`, so that the object is newer than its
// source even when the compiler leaves an unchanged file alone.
std::string CompileRecipe(const BuildStep &step, absl::string_view object);

// Returns one rule per (output, source) pair of a `CompileC` or `CompileSwift`
// step.
std::vector<Rule> BuildCompileRules(const BuildStep &step);

// Reads the output file map of a `SwiftDriver` step and returns one rule per
// Swift source that has an object output, sorted by source path. Every rule
// shares the driver invocation. Fails if the map cannot be read or parsed.
absl::StatusOr<std::vector<Rule>> BuildSwiftDriverRules(const BuildStep &step);

// Returns the rule for an `Ld` step. Its prerequisites are the entries of the
// `-filelist` file that are targets in `table`, plus any other `.o` entries,
// which are prebuilt objects that still take part in staleness checks. A
// relative file list, and the directory of ld's `-filelist file,dir` form, are
// resolved against the step's working directory.
//
// If the command has no `-filelist` option, the rule has no prerequisites and
// `*dependencies_tracked` is set to false. Fails if the file list cannot be
// read.
absl::StatusOr<Rule> BuildLinkRule(const BuildStep &step,
                                   const RuleTable &table,
                                   bool *dependencies_tracked);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_RULE_BUILDER_H_
