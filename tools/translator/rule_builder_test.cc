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

#include "tools/translator/rule_builder.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tools/common/temp_file.h"
#include "tools/translator/build_step.h"
#include "tools/translator/path_escaper.h"
#include "tools/translator/rule_table.h"

namespace xcode_make {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::IsEmpty;
using ::testing::SizeIs;

BuildStep CompileStep(std::string source, std::string object,
                      std::string command) {
  BuildStep step;
  step.kind = StepKind::kCompileC;
  step.working_directory = "/s";
  step.directory_change = "cd /s";
  step.command = std::move(command);
  step.sources.push_back(std::move(source));
  step.outputs.push_back(std::move(object));
  return step;
}

BuildStep LinkStep(std::string working_directory, std::string command) {
  BuildStep step;
  step.kind = StepKind::kLink;
  step.outputs.push_back("/b/App");
  step.directory_change = absl::StrCat("cd ", working_directory);
  step.working_directory = std::move(working_directory);
  step.command = std::move(command);
  return step;
}

TEST(RuleBuilderTest, CompileRuleEscapesEachDialect) {
  std::vector<Rule> rules = BuildCompileRules(
      CompileStep("/s/a b.c", "/b/a b.o", R"(clang -DX=$Y -c a\ b.c)"));

  ASSERT_THAT(rules, SizeIs(1));
  EXPECT_THAT(rules[0].target, Eq(R"(/b/a\ b.o)"));
  EXPECT_THAT(rules[0].prerequisites, ElementsAre(R"(/s/a\ b.c)"));
  EXPECT_THAT(rules[0].working_directory, Eq("/s"));
  EXPECT_THAT(rules[0].recipe,
              Eq(R"(cd /s && clang -DX=$$Y -c a\ b.c && touch /b/a\ b.o)"));
}

TEST(RuleBuilderTest, CompileRulesPairSourcesWithOutputs) {
  BuildStep step = CompileStep("/s/a.swift", "/b/a.o", "swift -frontend");
  step.sources.push_back("/s/b.swift");
  step.outputs.push_back("/b/b.o");

  std::vector<Rule> rules = BuildCompileRules(step);
  ASSERT_THAT(rules, SizeIs(2));
  EXPECT_THAT(rules[1].target, Eq("/b/b.o"));
  EXPECT_THAT(rules[1].prerequisites, ElementsAre("/s/b.swift"));
  EXPECT_THAT(rules[1].recipe,
              Eq("cd /s && swift -frontend && touch /b/b.o"));
}

TEST(RuleBuilderTest, SwiftDriverRulesComeFromTheOutputFileMap) {
  std::unique_ptr<TempDirectory> temp_dir =
      TempDirectory::Create("rule_builder_test.XXXXXX");
  ASSERT_NE(temp_dir, nullptr);
  temp_dir->WriteFile("map.json", R"({
    "b.swift": {"object": "b.o"},
    "a.swift": {"object": "a.o"}
  })");

  BuildStep step;
  step.kind = StepKind::kSwiftDriver;
  step.working_directory = std::string(temp_dir->GetPath());
  step.directory_change = "cd /proj";
  step.command = "swiftc -c";
  step.output_file_map_path = "map.json";

  absl::StatusOr<std::vector<Rule>> rules = BuildSwiftDriverRules(step);
  ASSERT_TRUE(rules.ok()) << rules.status();
  ASSERT_THAT(*rules, SizeIs(2));
  EXPECT_THAT((*rules)[0].target, Eq("a.o"));
  EXPECT_THAT((*rules)[0].prerequisites, ElementsAre("a.swift"));
  EXPECT_THAT((*rules)[0].recipe, Eq("cd /proj && swiftc -c && touch a.o"));
  EXPECT_THAT((*rules)[1].target, Eq("b.o"));
  EXPECT_THAT((*rules)[1].recipe, Eq("cd /proj && swiftc -c && touch b.o"));
}

TEST(RuleBuilderTest, SwiftDriverWithMissingOutputFileMapFails) {
  BuildStep step;
  step.kind = StepKind::kSwiftDriver;
  step.working_directory = "/nonexistent";
  step.output_file_map_path = "map.json";

  EXPECT_THAT(BuildSwiftDriverRules(step).status().code(),
              Eq(absl::StatusCode::kNotFound));
}

TEST(RuleBuilderTest, LinkRuleKeepsKnownTargetsAndObjects) {
  std::unique_ptr<TempDirectory> temp_dir =
      TempDirectory::Create("rule_builder_test.XXXXXX");
  ASSERT_NE(temp_dir, nullptr);
  temp_dir->WriteFile("App.list",
                      "/b/A.o\n/b/B.o\n/b/C.txt\n/b/Generated.tbd\n");

  RuleTable table;
  table.Insert(Rule{"/b/A.o", {"/s/A.c"}, "/s", "cc"});
  table.Insert(Rule{"/b/Generated.tbd", {}, "/s", "gen"});

  bool dependencies_tracked = false;
  absl::StatusOr<Rule> rule = BuildLinkRule(
      LinkStep(std::string(temp_dir->GetPath()),
               "clang -o /b/App -filelist App.list -Wl,-rpath,$ORIGIN"),
      table, &dependencies_tracked);

  ASSERT_TRUE(rule.ok()) << rule.status();
  EXPECT_TRUE(dependencies_tracked);
  EXPECT_THAT(rule->target, Eq("/b/App"));
  EXPECT_THAT(rule->prerequisites,
              ElementsAre("/b/A.o", "/b/B.o", "/b/Generated.tbd"));
  EXPECT_THAT(rule->recipe,
              Eq(absl::StrCat("cd ", temp_dir->GetPath(),
                              " && clang -o /b/App -filelist App.list "
                              "-Wl,-rpath,$$ORIGIN")));
}

TEST(RuleBuilderTest, LinkRuleResolvesFileListDirectory) {
  std::unique_ptr<TempDirectory> temp_dir =
      TempDirectory::Create("rule_builder_test.XXXXXX");
  ASSERT_NE(temp_dir, nullptr);
  temp_dir->WriteFile("App.list", "a.o\n/abs/b.o\n");
  std::string dir = std::string(temp_dir->GetPath());

  RuleTable table;
  bool dependencies_tracked = false;
  absl::StatusOr<Rule> rule = BuildLinkRule(
      LinkStep(dir, "ld -o /b/App -filelist App.list,objects"), table,
      &dependencies_tracked);

  ASSERT_TRUE(rule.ok()) << rule.status();
  EXPECT_TRUE(dependencies_tracked);
  EXPECT_THAT(rule->prerequisites,
              ElementsAre(EscapeMakeTarget(absl::StrCat(dir, "/objects/a.o")),
                          "/abs/b.o"));
}

TEST(RuleBuilderTest, LinkRuleWithoutFileListHasNoPrerequisites) {
  RuleTable table;
  bool dependencies_tracked = true;
  absl::StatusOr<Rule> rule = BuildLinkRule(
      LinkStep("/proj", "clang -o /b/App /b/a.o"), table,
      &dependencies_tracked);

  ASSERT_TRUE(rule.ok()) << rule.status();
  EXPECT_FALSE(dependencies_tracked);
  EXPECT_THAT(rule->prerequisites, IsEmpty());
  EXPECT_THAT(rule->recipe, Eq("cd /proj && clang -o /b/App /b/a.o"));
}

TEST(RuleBuilderTest, LinkRuleWithUnreadableFileListFails) {
  RuleTable table;
  bool dependencies_tracked = true;
  absl::StatusOr<Rule> rule = BuildLinkRule(
      LinkStep("/nonexistent", "clang -o /b/App -filelist App.list"), table,
      &dependencies_tracked);

  EXPECT_THAT(rule.status().code(), Eq(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace xcode_make
