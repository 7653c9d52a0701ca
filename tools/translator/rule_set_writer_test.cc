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

#include "tools/translator/rule_set_writer.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/time/time.h"
#include "tools/common/temp_file.h"
#include "tools/translator/rule_table.h"

namespace xcode_make {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Optional;

RuleSetHeader TestHeader() {
  RuleSetHeader header;
  header.invocation = "xcodebuild -scheme App";
  header.log_captured = absl::FromUnixSeconds(0);
  header.log_path = "/tmp/build.log";
  return header;
}

TEST(RuleSetWriterTest, WritesHeaderRulesAndTerminalRule) {
  RuleSetWriter writer(TestHeader());
  writer.AddComment("CompileC a.o a.c normal");
  writer.AddRule(Rule{"a.o", {"a.c"}, "/w", "cd /w && cc -c a.c && touch a.o"});
  std::string text = std::move(writer).Finish(
      {"App"}, {"/usr/bin/codesign --force App"});

  EXPECT_THAT(text, Eq("# Generated by xcode_make. Do not edit.\n"
                       "# Invocation: xcodebuild -scheme App\n"
                       "# Log captured: 1970-01-01 00:00:00 UTC\n"
                       "# Log file: /tmp/build.log\n"
                       "\n"
                       "# CompileC a.o a.c normal\n"
                       "a.o: a.c\n"
                       "\tcd /w && cc -c a.c && touch a.o\n"
                       "\n"
                       "main: App\n"
                       "\t/usr/bin/codesign --force App\n"));
}

TEST(RuleSetWriterTest, EmptyRuleSetStillHasMain) {
  std::string text = RuleSetWriter(TestHeader()).Finish({}, {});
  EXPECT_THAT(text, HasSubstr("# Log file: /tmp/build.log\n\nmain:\n"));
}

TEST(RuleSetWriterTest, TrailingCommentGetsBlankLineBeforeMain) {
  RuleSetWriter writer(TestHeader());
  writer.AddComment("** BUILD SUCCEEDED **");
  std::string text = std::move(writer).Finish({"App"}, {});
  EXPECT_THAT(text, HasSubstr("# ** BUILD SUCCEEDED **\n\nmain: App\n"));
}

TEST(RuleSetWriterTest, CommentsStayOnOneLine) {
  RuleSetWriter writer(TestHeader());
  writer.AddComment("ends in a continuation \\");
  writer.AddComment("two\nlines");
  std::string text = std::move(writer).Finish({}, {});
  EXPECT_THAT(text, HasSubstr("# ends in a continuation \\ \n"));
  EXPECT_THAT(text, HasSubstr("# two lines\n"));
}

TEST(RuleSetWriterTest, ReadsBackTheInvocation) {
  std::string text = RuleSetWriter(TestHeader()).Finish({}, {});
  EXPECT_THAT(ReadRuleSetInvocation(text),
              Optional(Eq("xcodebuild -scheme App")));
  EXPECT_THAT(ReadRuleSetInvocation("main:\n"), Eq(std::nullopt));
  EXPECT_THAT(ReadRuleSetInvocation(""), Eq(std::nullopt));
}

TEST(RuleSetWriterTest, FreshnessFollowsTheInvocation) {
  std::unique_ptr<TempDirectory> temp_dir =
      TempDirectory::Create("rule_set_writer_test.XXXXXX");
  ASSERT_NE(temp_dir, nullptr);
  std::string path = temp_dir->WriteFile(
      "Makefile", RuleSetWriter(TestHeader()).Finish({}, {}));

  EXPECT_TRUE(IsRuleSetFresh(path, "xcodebuild -scheme App"));
  EXPECT_FALSE(IsRuleSetFresh(path, "xcodebuild -scheme Other"));
  EXPECT_FALSE(IsRuleSetFresh(temp_dir->PathOf("missing"),
                              "xcodebuild -scheme App"));
}

}  // namespace
}  // namespace xcode_make
