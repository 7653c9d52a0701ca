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


#include "tools/translator/build_step.h"

#include "absl/strings/string_view.h"

namespace xcode_make {

absl::string_view StepKindName(StepKind kind) {
  switch (kind) {
    case StepKind::kCompileC:
      return "CompileC";
    case StepKind::kSwiftDriver:
      return "SwiftDriver";
    case StepKind::kSwiftCompile:
      return "CompileSwift";
    case StepKind::kLink:
      return "Ld";
    case StepKind::kPostLink:
      return "codesign/touch";
  }
  return "unknown";
}

}  // namespace xcode_make
