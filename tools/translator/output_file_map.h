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

#ifndef XCODE_MAKE_TOOLS_TRANSLATOR_OUTPUT_FILE_MAP_H_
#define XCODE_MAKE_TOOLS_TRANSLATOR_OUTPUT_FILE_MAP_H_

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace xcode_make {

// The marker that Xcode prints in front of the real `swiftc` invocation of a
// `SwiftDriver` step.
inline constexpr absl::string_view kSwiftDriverInvocationPrefix =
    "builtin-SwiftDriver -- ";

// A source file and the output of one kind that the driver produces for it.
struct SourceOutput {
  std::string source;
  std::string output;
};

// Supports loading a `swiftc` output file map.
//
// See
// https://github.com/apple/swift/blob/master/docs/Driver.md#output-file-maps
// for more information on how the Swift driver uses this file.
class OutputFileMap {
 public:
  OutputFileMap() = default;

  // The in-memory JSON-based representation of the output file map.
  const nlohmann::json &json() const { return json_; }

  // Reads the output file map from the JSON file at the given path. Fails if
  // the file cannot be read or if it is not a JSON object.
  absl::Status ReadFromPath(absl::string_view path);

  // Parses the output file map from a JSON document.
  absl::Status ReadFromString(absl::string_view contents);

  // Returns the outputs of the given kind (for example, "object") for every
  // Swift source in the map, sorted by source path. Entries that are not
  // Swift sources or that lack a string output of that kind are skipped.
  std::vector<SourceOutput> SwiftOutputsOfKind(absl::string_view kind) const;

 private:
  nlohmann::json json_;
};

// Returns the compiler invocation that a `SwiftDriver` step ran: the record
// with the driver marker prefix stripped and `-parseable-output` removed (it
// only matters when the output is read by Xcode).
std::string StripDriverInvocation(absl::string_view driver_record);

// Returns the value of `-output-file-map`, searching the driver's invocation
// record first and the stripped invocation second.
std::optional<std::string> FindOutputFileMapPath(
    absl::string_view driver_record, absl::string_view invocation);

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_TRANSLATOR_OUTPUT_FILE_MAP_H_
