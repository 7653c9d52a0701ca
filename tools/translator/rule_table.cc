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

#include "tools/translator/rule_table.h"

#include <string>
#include <utility>

#include "absl/strings/string_view.h"
#include "tools/common/path_utils.h"

namespace xcode_make {

bool RuleTable::Insert(Rule rule) {
  auto [it, inserted] =
      index_by_target_.try_emplace(rule.target, rules_.size());
  if (!inserted) {
    return false;
  }
  rules_.push_back(std::move(rule));
  return true;
}

bool RuleTable::Contains(absl::string_view target) const {
  return index_by_target_.contains(target);
}

const Rule *RuleTable::Find(absl::string_view target) const {
  auto it = index_by_target_.find(target);
  if (it == index_by_target_.end()) {
    return nullptr;
  }
  return &rules_[it->second];
}

bool LinkedProducts::Add(absl::string_view target) {
  if (IsObjectFilePath(target) || !seen_.insert(std::string(target)).second) {
    return false;
  }
  targets_.emplace_back(target);
  return true;
}

}  // namespace xcode_make
