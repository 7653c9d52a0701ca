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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_BUILD_STEP_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_BUILD_STEP_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace xcode_make {

// The kinds of build log records that the translator understands.
enum class StepKind {
  // `CompileC <object> <source> ...`: a C-family compilation of one file.
  kCompileC,

  // `SwiftDriver <module> ...`: a whole-module driver invocation whose
  // per-file outputs are listed in an output file map.
  kSwiftDriver,

  // `CompileSwift ...`: a legacy frontend invocation for one or more primary
  // files.
  kSwiftCompile,

  // `Ld <output> ...`: a link of an executable, dylib, or relocatable object.
  kLink,

  // A `codesign` or `touch` command run after linking.
  kPostLink,
};

// Returns the human-readable name of the step kind used in diagnostics.
absl::string_view StepKindName(StepKind kind);

// A unit of the build log, classified by the kind of its marker record.
struct BuildStep {
  StepKind kind;

  // The raw log records consumed by the step, beginning with the marker.
  std::vector<std::string> records;

  // The log line number of the marker record.
  int line_number = 0;

  // The step's working directory, unescaped.
  std::string working_directory;

  // `cd <working directory>`, ready to begin a recipe. Empty for post-link
  // steps.
  std::string directory_change;

  // The command that performs the step, as it should be rerun. This is the
  // log's text verbatim except where the step kind requires a rewrite (for
  // example, removing driver-only flags).
  std::string command;

  // Unescaped output paths: object files for compile steps, the product for
  // link steps.
  std::vector<std::string> outputs;

  // Unescaped source paths, paired positionally with `outputs` for compile
  // steps.
  std::vector<std::string> sources;

  // For driver steps, the unescaped path of the output file map as written on
  // the command line.
  std::string output_file_map_path;
};

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_BUILD_STEP_H_
