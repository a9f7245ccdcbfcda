//===- argbind/test/SplitArgumentsTest.cpp - Tokenizer tests --------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/SplitArguments.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace argbind;

namespace {

std::string describe(std::vector<std::string> Args) {
  return SplitArguments(std::move(Args)).getDescription();
}

Index sub(size_t I, unsigned N) { return Index(I, SubIndex::sub(N)); }

bool anyValue(const Element &E) { return E.isValue(); }

TEST(SplitArgumentsTest, LongOptions) {
  EXPECT_EQ("[0] --foo [1] 'bar'", describe({"--foo", "bar"}));
  EXPECT_EQ("[0] --foo='bar'", describe({"--foo=bar"}));
  EXPECT_EQ("[0] --name=''", describe({"--name="}));
  // A third dash belongs to the name.
  EXPECT_EQ("[0] ---x", describe({"---x"}));
}

TEST(SplitArgumentsTest, SingleDashOptions) {
  EXPECT_EQ("[0] -x", describe({"-x"}));
  EXPECT_EQ("[0] -c='1'", describe({"-c=1"}));

  SplitArguments S({"-count=1"});
  const Element *E = S.lookup(Index(0));
  ASSERT_NE(nullptr, E);
  ASSERT_TRUE(E->isOption());
  EXPECT_EQ(Name::LongWithSingleDash,
            E->getParsedArgument().getName().getKind());
  EXPECT_EQ("1", E->getParsedArgument().getValue());
}

TEST(SplitArgumentsTest, Clusters) {
  EXPECT_EQ("[0] -abc [0.0] -a [0.1] -b [0.2] -c", describe({"-abc"}));

  SplitArguments S({"-vx"});
  const Element *Whole = S.lookup(Index(0));
  ASSERT_NE(nullptr, Whole);
  EXPECT_EQ(Name::makeLongWithSingleDash("vx"),
            Whole->getParsedArgument().getName());
  const Element *X = S.lookup(sub(0, 1));
  ASSERT_NE(nullptr, X);
  EXPECT_EQ(Name::makeShort('x'), X->getParsedArgument().getName());
}

TEST(SplitArgumentsTest, PossibleNegativeNumbers) {
  EXPECT_EQ("[0] -5?", describe({"-5"}));
  EXPECT_EQ("[0] -12? [0.0] -1 [0.1] -2", describe({"-12"}));
  EXPECT_EQ("[0] -1.5? [0.0] -1 [0.1] -. [0.2] -5", describe({"-1.5"}));

  // Not a number: a plain cluster.
  SplitArguments S({"-1a"});
  ASSERT_NE(nullptr, S.lookup(Index(0)));
  EXPECT_TRUE(S.lookup(Index(0))->isOption());
}

TEST(SplitArgumentsTest, Values) {
  EXPECT_EQ("[0] '' [1] '-' [2] 'file'", describe({"", "-", "file"}));
  EXPECT_EQ("<empty>", describe({}));
}

TEST(SplitArgumentsTest, Terminator) {
  EXPECT_EQ("[0] -a [1] -- [2] '-b' [3] '--c' [4] '--'",
            describe({"-a", "--", "-b", "--c", "--"}));

  SplitArguments S({"--"});
  EXPECT_FALSE(S.empty());
  EXPECT_FALSE(S.containsNonTerminatorArguments());
}

TEST(SplitArgumentsTest, RemoveCompleteRemovesCluster) {
  SplitArguments S({"-ab", "c"});
  S.remove(sub(0, 0));
  EXPECT_EQ("[0] -ab [0.1] -b [1] 'c'", S.getDescription());

  S.remove(Index(0));
  EXPECT_EQ("[1] 'c'", S.getDescription());
}

TEST(SplitArgumentsTest, RemoveExactLeavesSubElements) {
  SplitArguments S({"-ab"});
  S.removeExact(Index(0));
  EXPECT_EQ("[0.0] -a [0.1] -b", S.getDescription());
}

TEST(SplitArgumentsTest, PopNext) {
  SplitArguments S({"--foo", "bar"});
  std::optional<SplitArguments::Entry> First = S.popNext();
  ASSERT_TRUE(First);
  EXPECT_EQ(Index(0), First->first);
  EXPECT_TRUE(First->second.isOption());

  ASSERT_TRUE(S.peekNext());
  EXPECT_EQ(Index(1), S.peekNext()->first);
  EXPECT_EQ(1u, S.size());
}

TEST(SplitArgumentsTest, PopNextElementIfValue) {
  SplitArguments S({"--foo", "--bar", "baz"});
  EXPECT_FALSE(S.popNextElementIfValue(Index(0), anyValue));

  auto V = S.popNextElementIfValue(Index(1), anyValue);
  ASSERT_TRUE(V);
  EXPECT_EQ(Index(2), V->first);
  EXPECT_EQ("baz", V->second);
  EXPECT_FALSE(S.contains(Index(2)));
}

TEST(SplitArgumentsTest, PopNextValueScansAhead) {
  SplitArguments S({"--foo", "--bar", "baz"});
  auto V = S.popNextValue(Index(0), anyValue);
  ASSERT_TRUE(V);
  EXPECT_EQ(Index(2), V->first);
  EXPECT_EQ("baz", V->second);
}

TEST(SplitArgumentsTest, PopNextElementAsValue) {
  SplitArguments S({"--opt", "-vx", "v"});
  auto V = S.popNextElementAsValue(Index(0));
  ASSERT_TRUE(V);
  EXPECT_EQ(Index(1), V->first);
  EXPECT_EQ("-vx", V->second);
  // The letters of the cluster go with it.
  EXPECT_EQ("[0] --opt [2] 'v'", S.getDescription());
}

TEST(SplitArgumentsTest, ExtractJoinedElement) {
  SplitArguments S({"-Ddebug"});
  auto V = S.extractJoinedElement(sub(0, 0));
  ASSERT_TRUE(V);
  EXPECT_EQ(Index(0), V->first);
  EXPECT_EQ("debug", V->second);

  EXPECT_FALSE(S.extractJoinedElement(sub(0, 1)));
  EXPECT_FALSE(S.extractJoinedElement(Index(0)));
}

TEST(SplitArgumentsTest, CoalescedExtraElements) {
  SplitArguments S({"-ab", "--", "x"});
  using Extra = std::pair<Index, std::string>;

  // With the cluster still whole, it is reported once.
  EXPECT_THAT(S.coalescedExtraElements(),
              ::testing::ElementsAre(Extra(Index(0), "-ab"),
                                     Extra(Index(2), "x")));

  S.removeExact(Index(0));
  S.remove(sub(0, 0));
  EXPECT_THAT(S.coalescedExtraElements(),
              ::testing::ElementsAre(Extra(sub(0, 1), "-b"),
                                     Extra(Index(2), "x")));
}

TEST(SplitArgumentsTest, ContainsAnyOf) {
  SplitArguments S({"-vh", "--", "--help"});
  EXPECT_TRUE(S.containsAnyOf({Name::makeShort('h')}));
  // "--help" after the terminator is a value.
  EXPECT_FALSE(S.containsAnyOf({Name::makeLong("help")}));
}

TEST(SplitArgumentsTest, IndexOrdering) {
  EXPECT_LT(Index(0), sub(0, 0));
  EXPECT_LT(sub(0, 0), sub(0, 1));
  EXPECT_LT(sub(0, 5), Index(1));
  EXPECT_EQ("3", Index(3).toString());
  EXPECT_EQ("3.1", sub(3, 1).toString());
}

} // anonymous namespace
