//===- argbind/test/NameTest.cpp - Option name tests ----------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/Name.h"
#include "argbind/Support.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace argbind;

namespace {

std::vector<std::string> synopses(const std::vector<Name> &Names) {
  std::vector<std::string> Result;
  for (const Name &N : Names)
    Result.push_back(N.getSynopsisString());
  return Result;
}

TEST(NameTest, Spellings) {
  EXPECT_EQ("--name", Name::makeLong("name").getSynopsisString());
  EXPECT_EQ("-n", Name::makeShort('n').getSynopsisString());
  EXPECT_EQ("-name", Name::makeLongWithSingleDash("name").getSynopsisString());
  EXPECT_EQ("name", Name::makeLong("name").getValueString());
}

TEST(NameTest, NameToMatchDropsJoined) {
  Name Joined = Name::makeShort('D', /*AllowingJoined=*/true);
  EXPECT_NE(Name::makeShort('D'), Joined);
  EXPECT_EQ(Name::makeShort('D'), Joined.nameToMatch());
  EXPECT_FALSE(Joined.nameToMatch().allowsJoined());
}

TEST(NameTest, SortedNames) {
  std::vector<Name> Names = {Name::makeLong("verbose"),
                             Name::makeLongWithSingleDash("vv"),
                             Name::makeShort('v')};
  EXPECT_THAT(synopses(sortedNames(Names)),
              ::testing::ElementsAre("-v", "-vv", "--verbose"));
}

TEST(NameTest, MakeNamesFromKey) {
  NameSpecification Spec = {NameSpecification::longName(),
                            NameSpecification::shortName()};
  EXPECT_THAT(synopses(Spec.makeNames("outputFile")),
              ::testing::ElementsAre("--output-file", "-o"));
}

TEST(NameTest, MakeNamesCustom) {
  NameSpecification Spec = {NameSpecification::customLong("out"),
                            NameSpecification::customLong("o", true),
                            NameSpecification::customShort('O'),
                            NameSpecification::customLong("out")};
  // Duplicates keep the first spelling.
  EXPECT_THAT(synopses(Spec.makeNames("output")),
              ::testing::ElementsAre("--out", "-o", "-O"));
}

TEST(NameTest, MakePrefixedNames) {
  NameSpecification Spec = {NameSpecification::longName(),
                            NameSpecification::shortName(),
                            NameSpecification::customLong("x", true)};
  EXPECT_THAT(synopses(Spec.makePrefixedNames("useColor", "no", false)),
              ::testing::ElementsAre("--no-use-color", "-no-x"));
  EXPECT_THAT(synopses(Spec.makePrefixedNames("useColor", "enable", true)),
              ::testing::ElementsAre("--enable-use-color", "-u",
                                     "-enable-x"));
}

TEST(NameTest, ConvertToSnakeCase) {
  EXPECT_EQ("some-argument-name", convertToSnakeCase("someArgumentName"));
  EXPECT_EQ("url-path", convertToSnakeCase("URLPath"));
  EXPECT_EQ("plain", convertToSnakeCase("plain"));
  EXPECT_EQ("snake_case", convertToSnakeCase("snakeCase", '_'));
}

TEST(NameTest, EditDistance) {
  EXPECT_EQ(0u, editDistance("--name", "--name"));
  EXPECT_EQ(1u, editDistance("--name", "--nme"));
  EXPECT_EQ(2u, editDistance("--jobs", "--jbos"));
}

} // anonymous namespace
