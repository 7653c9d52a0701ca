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

#include "tools/translator/step_parser.h"

#include <optional>
#include <sstream>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "tools/translator/build_step.h"
#include "tools/translator/line_cursor.h"

namespace xcode_make {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::SizeIs;

TEST(StepParserTest, ClassifiesStepMarkers) {
  EXPECT_THAT(ClassifyRecord("CompileC /b/a.o /s/a.m normal arm64 objective-c "
                             "com.apple.compilers.llvm.clang.1_0.compiler"),
              Optional(Eq(StepKind::kCompileC)));
  EXPECT_THAT(ClassifyRecord("SwiftDriver App normal arm64 "
                             "com.apple.xcode.tools.swift.compiler"),
              Optional(Eq(StepKind::kSwiftDriver)));
  EXPECT_THAT(ClassifyRecord("CompileSwift normal arm64 /s/a.swift"),
              Optional(Eq(StepKind::kSwiftCompile)));
  EXPECT_THAT(ClassifyRecord("Ld /b/App normal"),
              Optional(Eq(StepKind::kLink)));
  EXPECT_THAT(ClassifyRecord("/usr/bin/codesign --force --sign - /b/App.app"),
              Optional(Eq(StepKind::kPostLink)));
  EXPECT_THAT(ClassifyRecord("/usr/bin/touch -c /b/App.app"),
              Optional(Eq(StepKind::kPostLink)));
}

TEST(StepParserTest, IgnoresRecordsThatAreNotStepMarkers) {
  EXPECT_THAT(ClassifyRecord(R"(SwiftDriver\ Compilation App normal arm64)"),
              Eq(std::nullopt));
  EXPECT_THAT(ClassifyRecord("CompileSwiftSources normal arm64"),
              Eq(std::nullopt));
  EXPECT_THAT(ClassifyRecord("Touch /b/App.app"), Eq(std::nullopt));
  EXPECT_THAT(ClassifyRecord("cd /s"), Eq(std::nullopt));
  EXPECT_THAT(ClassifyRecord("CompileC broken"), Eq(std::nullopt));
  EXPECT_THAT(ClassifyRecord("** BUILD SUCCEEDED **"), Eq(std::nullopt));
}

TEST(StepParserTest, CompileCWithEscapedPathsAndExports) {
  std::istringstream log(
      "    cd /s/My\\ App\n"
      "    export LANG=en_US.US-ASCII\n"
      "\n"
      "    Using response file: /b/a.resp\n"
      "    /usr/bin/clang -c /s/My\\ App/a.m -o /b/My\\ App/a.o\n"
      "next\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(
      StepKind::kCompileC,
      R"(CompileC /b/My\ App/a.o /s/My\ App/a.m normal arm64)", cursor, &step);

  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(step.kind, Eq(StepKind::kCompileC));
  EXPECT_THAT(step.outputs, ElementsAre("/b/My App/a.o"));
  EXPECT_THAT(step.sources, ElementsAre("/s/My App/a.m"));
  EXPECT_THAT(step.working_directory, Eq("/s/My App"));
  EXPECT_THAT(step.directory_change, Eq(R"(cd /s/My\ App)"));
  EXPECT_THAT(step.command,
              Eq(R"(export LANG=en_US.US-ASCII && /usr/bin/clang -c )"
                 R"(/s/My\ App/a.m -o /b/My\ App/a.o)"));
  EXPECT_THAT(step.records, SizeIs(6));
  EXPECT_THAT(cursor.NextLine(), Optional(Eq("next")));
}

TEST(StepParserTest, CompileCWithEscapedExportAssignments) {
  std::istringstream log(
      "    cd /s\n"
      "    export LANG\\=en_US.US-ASCII\n"
      "    export PATH\\=/usr/bin:/bin\n"
      "    /usr/bin/clang -c /s/a.m -o /b/a.o\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(StepKind::kCompileC,
                                  "CompileC /b/a.o /s/a.m normal arm64",
                                  cursor, &step);

  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(step.command,
              Eq(R"(export LANG\=en_US.US-ASCII && export PATH\=/usr/bin:/bin )"
                 R"(&& /usr/bin/clang -c /s/a.m -o /b/a.o)"));
  EXPECT_THAT(cursor.NextLine(), Eq(std::nullopt));
}

TEST(StepParserTest, CompileCWithoutDirectoryChangeFails) {
  std::istringstream log(
      "    /usr/bin/clang -c a.m\n"
      "CompileC /b/b.o /s/b.m normal arm64\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(StepKind::kCompileC,
                                  "CompileC /b/a.o /s/a.m normal arm64",
                                  cursor, &step);

  EXPECT_THAT(status.code(), Eq(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(step.records, ElementsAre("CompileC /b/a.o /s/a.m normal arm64",
                                        "/usr/bin/clang -c a.m"));
  EXPECT_THAT(cursor.NextLine(),
              Optional(Eq("CompileC /b/b.o /s/b.m normal arm64")));
}

TEST(StepParserTest, CompileCAtEndOfLogFails) {
  std::istringstream log("");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(StepKind::kCompileC,
                                  "CompileC /b/a.o /s/a.m normal arm64",
                                  cursor, &step);

  EXPECT_THAT(status.code(), Eq(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(step.records, ElementsAre("CompileC /b/a.o /s/a.m normal arm64"));
}

TEST(StepParserTest, SwiftDriverStripsDriverOnlyFlags) {
  std::istringstream log(
      "    cd /proj\n"
      "    builtin-SwiftDriver -- /usr/bin/swiftc -module-name App "
      "-output-file-map /b/App-OutputFileMap.json -parseable-output -c\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(
      StepKind::kSwiftDriver,
      "SwiftDriver App normal arm64 com.apple.xcode.tools.swift.compiler",
      cursor, &step);

  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(step.working_directory, Eq("/proj"));
  EXPECT_THAT(step.command,
              Eq("/usr/bin/swiftc -module-name App -output-file-map "
                 "/b/App-OutputFileMap.json -c"));
  EXPECT_THAT(step.output_file_map_path, Eq("/b/App-OutputFileMap.json"));
}

TEST(StepParserTest, SwiftDriverWithoutOutputFileMapFails) {
  std::istringstream log(
      "    cd /proj\n"
      "    builtin-SwiftDriver -- /usr/bin/swiftc -module-name App -c\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(StepKind::kSwiftDriver,
                                  "SwiftDriver App normal arm64", cursor,
                                  &step);

  EXPECT_THAT(status.code(), Eq(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(status.message(), HasSubstr("-output-file-map"));
}

TEST(StepParserTest, SwiftDriverWithBlankInvocationFails) {
  std::istringstream log("    cd /proj\n\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(StepKind::kSwiftDriver,
                                  "SwiftDriver App normal arm64", cursor,
                                  &step);

  EXPECT_THAT(status.code(), Eq(absl::StatusCode::kInvalidArgument));
}

TEST(StepParserTest, SwiftCompilePairsPrimaryFilesWithOutputs) {
  std::istringstream log(
      "    cd /proj\n"
      "    /usr/bin/swift-frontend -frontend -c -primary-file /s/a.swift "
      "-primary-file /s/b.swift /s/c.swift -o /b/a.o -o /b/b.o\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status =
      ParseStep(StepKind::kSwiftCompile,
                "CompileSwift normal arm64 /s/a.swift /s/b.swift", cursor,
                &step);

  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(step.sources, ElementsAre("/s/a.swift", "/s/b.swift"));
  EXPECT_THAT(step.outputs, ElementsAre("/b/a.o", "/b/b.o"));
}

TEST(StepParserTest, SwiftCompileWithMismatchedOutputsFails) {
  std::istringstream log(
      "    cd /proj\n"
      "    /usr/bin/swift-frontend -frontend -c -primary-file /s/a.swift "
      "-o /b/a.o -o /b/b.o\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(StepKind::kSwiftCompile,
                                  "CompileSwift normal arm64 /s/a.swift",
                                  cursor, &step);

  EXPECT_THAT(status.code(), Eq(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(status.message(), HasSubstr("1 -primary-file"));
}

TEST(StepParserTest, SwiftCompileRequiresFrontendInvocation) {
  std::istringstream log(
      "    cd /proj\n"
      "    /usr/bin/clang -c -primary-file /s/a.swift -o /b/a.o\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status = ParseStep(StepKind::kSwiftCompile,
                                  "CompileSwift normal arm64 /s/a.swift",
                                  cursor, &step);

  EXPECT_THAT(status.code(), Eq(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(status.message(), HasSubstr("swift-frontend"));
}

TEST(StepParserTest, LinkTakesOutputFromMarker) {
  std::istringstream log(
      "    cd /proj\n"
      "\n"
      "    /usr/bin/clang -o /b/My\\ App -filelist /b/App.LinkFileList\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status =
      ParseStep(StepKind::kLink, R"(Ld /b/My\ App normal arm64)", cursor,
                &step);

  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(step.outputs, ElementsAre("/b/My App"));
  EXPECT_THAT(step.command,
              Eq(R"(/usr/bin/clang -o /b/My\ App -filelist /b/App.LinkFileList)"));
  EXPECT_THAT(step.sources, IsEmpty());
}

TEST(StepParserTest, PostLinkConsumesNothing) {
  std::istringstream log("next\n");
  LineCursor cursor(log);
  BuildStep step;
  absl::Status status =
      ParseStep(StepKind::kPostLink, "/usr/bin/codesign --force /b/App.app",
                cursor, &step);

  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(step.command, Eq("/usr/bin/codesign --force /b/App.app"));
  EXPECT_THAT(step.records, ElementsAre("/usr/bin/codesign --force /b/App.app"));
  EXPECT_THAT(cursor.NextLine(), Optional(Eq("next")));
}

}  // namespace
}  // namespace xcode_make
