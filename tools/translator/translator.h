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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_TRANSLATOR_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_TRANSLATOR_H_

#include <istream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tools/common/diagnostics.h"
#include "tools/translator/rule_set_writer.h"

namespace xcode_make {

// Counts describing one translation, for reporting to the operator.
struct TranslationSummary {
  // The number of log records read.
  int records_read = 0;

  // The number of steps that contributed to the rule set.
  int steps_translated = 0;

  // The number of malformed steps that were skipped.
  int steps_skipped = 0;

  // The number of rule blocks written, not counting `main`.
  int rules_emitted = 0;

  // The prerequisites of `main`.
  std::vector<std::string> linked_products;
};

// The result of a successful translation.
struct Translation {
  std::string rule_set;
  TranslationSummary summary;
};

// Translates a captured build log into a makefile that rebuilds the objects
// and products the log describes.
//
// A translation makes one forward pass over the log. Each recognized step
// contributes zero or more rules; a malformed step is reported to
// `diagnostics` and skipped without affecting the rest of the log. Only a log
// that cannot be read fails the translation.
class Translator {
 public:
  // `invocation` is the build tool command line that produced the log; it is
  // recorded in the rule set so that callers can tell when it is stale.
  Translator(absl::string_view invocation, Diagnostics &diagnostics)
      : invocation_(invocation), diagnostics_(diagnostics) {}

  // Translates the log at the given path. The log's modification time is
  // recorded as the capture time.
  absl::StatusOr<Translation> Translate(absl::string_view log_path);

  // Translates a log that has already been opened. `header.log_path` is used
  // to locate diagnostics.
  absl::StatusOr<Translation> Translate(std::istream &log,
                                        const RuleSetHeader &header);

 private:
  std::string invocation_;
  Diagnostics &diagnostics_;
};

// Convenience wrapper that translates the log at `log_path` and returns only
// the rule set text.
absl::StatusOr<std::string> TranslateLog(absl::string_view log_path,
                                         absl::string_view invocation,
                                         Diagnostics &diagnostics);

// Writes a rule set to the given path.
absl::Status WriteRuleSet(absl::string_view path, absl::string_view rule_set);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_TRANSLATOR_H_
