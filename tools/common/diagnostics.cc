// Copyright 2022 The Bazel Authors. All rights reserved.
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

#include "tools/common/diagnostics.h"

#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "tools/common/color.h"

namespace xcode_make {

void Diagnostics::Warning(absl::string_view location,
                          absl::string_view message,
                          absl::string_view record) {
  ++warning_count_;
  WithColor(stream_, Color::kBold, use_color_) << location << ": ";
  WithColor(stream_, Color::kBoldMagenta, use_color_) << "warning: ";
  WithColor(stream_, Color::kBold, use_color_) << message << std::endl;
  if (!record.empty()) {
    stream_ << "    " << record << std::endl;
  }
}

void Diagnostics::Error(absl::string_view message) {
  ++error_count_;
  WithColor(stream_, Color::kBoldRed, use_color_) << "error: ";
  WithColor(stream_, Color::kBold, use_color_) << message << std::endl;
}

void Diagnostics::Error(const absl::Status &status) {
  Error(status.ToString(absl::StatusToStringMode::kWithEverything));
}

void Diagnostics::Note(absl::string_view message) {
  WithColor(stream_, Color::kBoldGreen, use_color_) << "note: ";
  stream_ << message << std::endl;
}

}  // namespace xcode_make
