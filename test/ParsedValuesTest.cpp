//===- argbind/test/ParsedValuesTest.cpp - Bound value tests --------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/ParsedValues.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace argbind;

namespace {

TEST(ParsedValuesTest, SetMergesOrigins) {
  ParsedValues V;
  V.set("name", {"a"}, InputOrigin(Index(1)));
  V.set("name", {"b"}, InputOrigin(Index(3)));

  EXPECT_EQ("b", V.getValue("name"));
  std::set<Index> Want = {Index(1), Index(3)};
  EXPECT_EQ(Want, V.getOrigin("name").getIndices());
}

TEST(ParsedValuesTest, AppendReplacesDefault) {
  ParsedValues V;
  V.set("files", {"x", "y"}, InputOrigin::defaultValue());
  EXPECT_TRUE(V.getOrigin("files").isDefaultValue());

  V.append("files", "a", InputOrigin(Index(0)));
  V.append("files", "b", InputOrigin(Index(1)));
  EXPECT_THAT(V.getValues("files"), ::testing::ElementsAre("a", "b"));
  EXPECT_FALSE(V.getOrigin("files").hasDefaultValue());
}

TEST(ParsedValuesTest, SetKeepsDefaultMarker) {
  ParsedValues V;
  V.set("name", {"x"}, InputOrigin::defaultValue());
  V.set("name", {"y"}, InputOrigin(Index(2)));

  InputOrigin O = V.getOrigin("name");
  EXPECT_TRUE(O.hasDefaultValue());
  EXPECT_FALSE(O.isDefaultValue());
  EXPECT_TRUE(O.containsAnyArguments());
}

TEST(ParsedValuesTest, UsedOrigins) {
  ParsedValues V;
  V.set("a", {"1"}, InputOrigin::defaultValue());
  V.set("b", {"2"}, InputOrigin(Index(0)).inserting(Index(1)));
  V.append("c", "3", InputOrigin(Index(2, SubIndex::sub(1))));

  std::set<Index> Want = {Index(0), Index(1),
                              Index(2, SubIndex::sub(1))};
  EXPECT_EQ(Want, V.getUsedOrigins().getIndices());
}

TEST(ParsedValuesTest, MissingKey) {
  ParsedValues V;
  EXPECT_FALSE(V.contains("nope"));
  EXPECT_FALSE(V.getValue("nope"));
  EXPECT_TRUE(V.getValues("nope").empty());
  EXPECT_TRUE(V.getOrigin("nope").empty());
}

} // anonymous namespace
