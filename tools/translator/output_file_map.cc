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

#include "tools/translator/output_file_map.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/strings/substitute.h"
#include "tools/common/command_line.h"
#include "tools/common/file_system.h"
#include "tools/common/path_utils.h"

namespace xcode_make {

absl::Status OutputFileMap::ReadFromPath(absl::string_view path) {
  absl::StatusOr<std::string> contents = ReadFile(path);
  if (!contents.ok()) {
    return contents.status();
  }
  if (absl::Status status = ReadFromString(*contents); !status.ok()) {
    return absl::Status(status.code(),
                        absl::StrCat(path, ": ", status.message()));
  }
  return absl::OkStatus();
}

absl::Status OutputFileMap::ReadFromString(absl::string_view contents) {
  nlohmann::json parsed = nlohmann::json::parse(
      contents.begin(), contents.end(), /*cb=*/nullptr,
      /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return absl::InvalidArgumentError("output file map is not valid JSON");
  }
  if (!parsed.is_object()) {
    return absl::InvalidArgumentError(
        absl::Substitute("output file map is a JSON $0, not an object",
                         parsed.type_name()));
  }
  json_ = std::move(parsed);
  return absl::OkStatus();
}

std::vector<SourceOutput> OutputFileMap::SwiftOutputsOfKind(
    absl::string_view kind) const {
  std::string key(kind);

  // Sort by source path explicitly so that the order of the generated rules
  // does not depend on how the JSON library stores objects.
  absl::btree_map<std::string, std::string> outputs_by_source;
  for (const auto &element : json_.items()) {
    if (!IsSwiftSourcePath(element.key())) {
      continue;
    }
    const nlohmann::json &outputs = element.value();
    if (!outputs.is_object()) {
      continue;
    }
    auto output = outputs.find(key);
    if (output == outputs.end() || !output->is_string()) {
      continue;
    }
    outputs_by_source.emplace(element.key(), output->get<std::string>());
  }

  std::vector<SourceOutput> result;
  result.reserve(outputs_by_source.size());
  for (const auto &[source, output] : outputs_by_source) {
    result.push_back(SourceOutput{source, output});
  }
  return result;
}

std::string StripDriverInvocation(absl::string_view driver_record) {
  absl::string_view invocation = driver_record;
  absl::ConsumePrefix(&invocation, kSwiftDriverInvocationPrefix);
  return RemoveArg(invocation, "-parseable-output");
}

std::optional<std::string> FindOutputFileMapPath(
    absl::string_view driver_record, absl::string_view invocation) {
  for (absl::string_view command_line : {driver_record, invocation}) {
    if (std::optional<std::string> path = FindOptionValue(
            SplitCommandLine(command_line), "-output-file-map")) {
      return path;
    }
  }
  return std::nullopt;
}

}  // namespace xcode_make
