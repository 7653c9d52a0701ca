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

#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/strings/substitute.h"
#include "tools/common/diagnostics.h"
#include "tools/translator/translator.h"

namespace {

constexpr absl::string_view kUsage =
    "usage: xcode_make_translate --log=<path> --output=<path>\n"
    "                            [--invocation=<command>] "
    "[--color|--no-color]\n"
    "\n"
    "Translates a captured build log into a makefile whose `main` target\n"
    "rebuilds the products the log describes. The invocation defaults to\n"
    "$XCODE_MAKE_INVOCATION.\n";

// Exit code for command line errors.
constexpr int kUsageError = 2;

// The settings of a single run of the tool.
struct Options {
  std::string log_path;
  std::string output_path;
  std::string invocation;
  bool use_color = isatty(STDERR_FILENO);
};

// Parses the command line into `options`. Returns an error message if it is
// not valid.
std::optional<std::string> ParseArguments(const std::vector<std::string> &args,
                                          Options *options) {
  bool have_invocation = false;
  for (absl::string_view arg : args) {
    if (absl::ConsumePrefix(&arg, "--log=")) {
      options->log_path = std::string(arg);
    } else if (absl::ConsumePrefix(&arg, "--output=")) {
      options->output_path = std::string(arg);
    } else if (absl::ConsumePrefix(&arg, "--invocation=")) {
      options->invocation = std::string(arg);
      have_invocation = true;
    } else if (arg == "--color") {
      options->use_color = true;
    } else if (arg == "--no-color") {
      options->use_color = false;
    } else {
      return absl::Substitute("unrecognized argument '$0'", arg);
    }
  }

  if (options->log_path.empty()) {
    return "--log is required";
  }
  if (options->output_path.empty()) {
    return "--output is required";
  }
  if (!have_invocation) {
    if (const char *env_value = getenv("XCODE_MAKE_INVOCATION")) {
      options->invocation = env_value;
    }
  }
  return std::nullopt;
}

}  // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  for (const std::string &arg : args) {
    if (arg == "--help" || arg == "-h") {
      std::cout << kUsage;
      return EXIT_SUCCESS;
    }
  }

  Options options;
  if (std::optional<std::string> error = ParseArguments(args, &options)) {
    std::cerr << "xcode_make_translate: " << *error << "\n\n" << kUsage;
    return kUsageError;
  }

  xcode_make::Diagnostics diagnostics(std::cerr, options.use_color);
  xcode_make::Translator translator(options.invocation, diagnostics);
  absl::StatusOr<xcode_make::Translation> translation =
      translator.Translate(options.log_path);
  if (!translation.ok()) {
    diagnostics.Error(translation.status());
    return EXIT_FAILURE;
  }

  if (absl::Status status =
          xcode_make::WriteRuleSet(options.output_path, translation->rule_set);
      !status.ok()) {
    diagnostics.Error(status);
    return EXIT_FAILURE;
  }

  const xcode_make::TranslationSummary &summary = translation->summary;
  diagnostics.Note(absl::Substitute(
      "wrote $0 rule(s) for $1 linked product(s) to $2 ($3 step(s) "
      "translated, $4 skipped, $5 record(s) read)",
      summary.rules_emitted, summary.linked_products.size(),
      options.output_path, summary.steps_translated, summary.steps_skipped,
      summary.records_read));
  return EXIT_SUCCESS;
}
