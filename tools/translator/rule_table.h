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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_RULE_TABLE_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_RULE_TABLE_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"

namespace xcode_make {

// A make rule: the target is rebuilt by running the recipe in the working
// directory when any prerequisite is newer than it.
//
// The target and prerequisites are canonical paths, i.e. already escaped with
// `EscapeMakeTarget`; they are compared byte-for-byte.
struct Rule {
  std::string target;
  std::vector<std::string> prerequisites;
  std::string working_directory;
  std::string recipe;
};

// The rules produced during one translation, keyed by canonical target.
//
// Insertion is idempotent: the first rule registered for a target wins and
// later rules for the same target are dropped. This mirrors make's handling
// of targets and keeps a single recipe per object when the log describes the
// same compilation twice (for example, once by the driver and once per file).
class RuleTable {
 public:
  RuleTable() = default;

  RuleTable(const RuleTable &) = delete;
  RuleTable &operator=(const RuleTable &) = delete;
  RuleTable(RuleTable &&) = default;
  RuleTable &operator=(RuleTable &&) = default;

  // Adds the rule if its target is not already present. Returns true if the
  // rule was added.
  bool Insert(Rule rule);

  // Returns true if a rule for the given canonical target has been added.
  bool Contains(absl::string_view target) const;

  // Returns the rule for the given canonical target, or null if there is none.
  const Rule *Find(absl::string_view target) const;

  // The rules in the order they were added.
  const std::vector<Rule> &rules() const { return rules_; }

  size_t size() const { return rules_.size(); }

 private:
  std::vector<Rule> rules_;

  // Indices into `rules_` by target.
  absl::flat_hash_map<std::string, size_t> index_by_target_;
};

// The executables and dynamic libraries produced by link steps, in the order
// they were first seen. Object files produced by relocatable links are never
// recorded.
class LinkedProducts {
 public:
  // Records the canonical target. Returns false (and records nothing) if the
  // target is an object file or was already recorded.
  bool Add(absl::string_view target);

  const std::vector<std::string> &targets() const { return targets_; }

 private:
  std::vector<std::string> targets_;
  absl::flat_hash_set<std::string> seen_;
};

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_RULE_TABLE_H_
