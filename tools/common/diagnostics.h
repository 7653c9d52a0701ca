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

#ifndef XCODE_MAKE_TOOLS_COMMON_DIAGNOSTICS_H_
#define XCODE_MAKE_TOOLS_COMMON_DIAGNOSTICS_H_

#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace xcode_make {

// Reports problems to the operator in the familiar compiler format
// (`<location>: warning: <message>`), optionally colorized.
class Diagnostics {
 public:
  Diagnostics(std::ostream &stream, bool use_color)
      : stream_(stream), use_color_(use_color) {}

  // Reports a recoverable problem at the given location. If `record` is not
  // empty, it is echoed on the following line so the operator can find it in
  // the log.
  void Warning(absl::string_view location, absl::string_view message,
               absl::string_view record = "");

  // Reports a fatal problem.
  void Error(absl::string_view message);

  // Reports a fatal problem described by a non-OK status.
  void Error(const absl::Status &status);

  // Prints an informational message.
  void Note(absl::string_view message);

  // The number of warnings reported so far.
  int warning_count() const { return warning_count_; }

  // The number of errors reported so far.
  int error_count() const { return error_count_; }

 private:
  // The stream that receives all diagnostics.
  std::ostream &stream_;

  // Whether ANSI color sequences are written.
  bool use_color_;

  int warning_count_ = 0;
  int error_count_ = 0;
};

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_COMMON_DIAGNOSTICS_H_
