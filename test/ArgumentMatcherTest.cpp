//===- argbind/test/ArgumentMatcherTest.cpp - Binding engine tests --------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/ArgumentMatcher.h"

#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace argbind;
using ::testing::ElementsAre;

namespace {

std::optional<ParserError>
bindArgs(const ArgumentSet &Args, std::vector<std::string> Input,
         ParsedValues &Values, std::vector<std::string> Subcommands = {}) {
  SplitArguments Split(std::move(Input));
  ArgumentMatcher Matcher(Args, std::move(Subcommands));
  if (std::optional<ParserError> Err = Matcher.lenientParse(Split, Values))
    return Err;
  return Matcher.checkRequired(Values);
}

// The rendered error for Input, or an empty string if it binds.
std::string bindError(const ArgumentSet &Args,
                      std::vector<std::string> Input) {
  ParsedValues Values;
  std::optional<ParserError> Err = bindArgs(Args, Input, Values);
  if (!Err)
    return std::string();
  return ErrorMessageGenerator(Args, Input).makeErrorMessage(*Err);
}

Index sub(size_t I, unsigned N) { return Index(I, SubIndex::sub(N)); }

TEST(ArgumentMatcherTest, ParsingIsDeterministic) {
  ArgumentSet Args = {flag("verbose", names{shortName(), longName()}),
                      option("name", init("none")),
                      positional("files", ZeroOrMore)};
  std::vector<std::string> Input = {"-v", "a", "--name", "x", "b"};

  ParsedValues First, Second;
  ASSERT_FALSE(bindArgs(Args, Input, First));
  ASSERT_FALSE(bindArgs(Args, Input, Second));
  EXPECT_TRUE(First == Second);
  EXPECT_THAT(First.getValues("files"), ElementsAre("a", "b"));
  EXPECT_EQ("x", First.getValue("name"));
}

TEST(ArgumentMatcherTest, ClusterMatchesSeparateFlags) {
  ArgumentSet Args = {flag("a", names{shortName()}),
                      flag("b", names{shortName()}),
                      flag("c", names{shortName()})};

  ParsedValues Clustered, Separate;
  ASSERT_FALSE(bindArgs(Args, {"-abc"}, Clustered));
  ASSERT_FALSE(bindArgs(Args, {"-a", "-b", "-c"}, Separate));
  for (const char *Key : {"a", "b", "c"}) {
    EXPECT_EQ("true", Clustered.getValue(Key));
    EXPECT_EQ(Clustered.getValue(Key), Separate.getValue(Key));
  }
  std::set<Index> Want = {sub(0, 1)};
  EXPECT_EQ(Want, Clustered.getOrigin("b").getIndices());
}

TEST(ArgumentMatcherTest, SingleDashLongNameWinsOverCluster) {
  ArgumentSet Args = {flag("ab", names{customLong("ab", true)}),
                      flag("a", names{shortName()})};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"-ab"}, Values));
  EXPECT_EQ("true", Values.getValue("ab"));
  EXPECT_EQ("false", Values.getValue("a"));
}

TEST(ArgumentMatcherTest, RemoveUsedRetiresCluster) {
  SplitArguments Split({"-ab", "x"});
  ArgumentMatcher::removeUsed(Split, InputOrigin(sub(0, 0)));
  EXPECT_EQ("[0.1] -b [1] 'x'", Split.getDescription());

  ArgumentMatcher::removeUsed(Split, InputOrigin(Index(1)));
  EXPECT_EQ("[0.1] -b", Split.getDescription());
}

TEST(ArgumentMatcherTest, TerminatorMakesValues) {
  ArgumentSet Args = {flag("all", names{shortName()}),
                      positional("file")};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--", "-a"}, Values));
  EXPECT_EQ("-a", Values.getValue("file"));
  EXPECT_EQ("false", Values.getValue("all"));
}

TEST(ArgumentMatcherTest, NegativeNumberIsPositional) {
  ArgumentSet Args = {flag("verbose"), positional("number")};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"-5"}, Values));
  EXPECT_EQ("-5", Values.getValue("number"));

  ASSERT_FALSE(bindArgs(Args, {"-1.5"}, Values));
  EXPECT_EQ("-1.5", Values.getValue("number"));
}

TEST(ArgumentMatcherTest, DeclaredDigitNameWinsOverNumber) {
  ArgumentSet Args = {flag("five", names{customShort('5')}),
                      positional("number", Optional)};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"-5"}, Values));
  EXPECT_EQ("true", Values.getValue("five"));
  EXPECT_FALSE(Values.contains("number"));
}

TEST(ArgumentMatcherTest, NegativeNumberAsOptionValue) {
  ArgumentSet Args = {option("offset")};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--offset", "-12"}, Values));
  EXPECT_EQ("-12", Values.getValue("offset"));
}

TEST(ArgumentMatcherTest, MissingValue) {
  ArgumentSet Args = {option("format"), flag("verbose")};
  EXPECT_EQ("Missing value for '--format <format>'",
            bindError(Args, {"--format"}));
  EXPECT_EQ("Missing value for '--format <format>'",
            bindError(Args, {"--format", "--verbose"}));
}

TEST(ArgumentMatcherTest, ExclusiveFlags) {
  ArgumentSet Args;
  Args.add(enumerableFlag("mode", {"list", "count"},
                          names{shortName(), longName()}));
  EXPECT_EQ("Value to be set with flag '-c' had already been set with flag "
            "'--list'",
            bindError(Args, {"--list", "-c"}));
  EXPECT_EQ("Value to be set with flag 'c' in '-lc' had already been set "
            "with flag 'l' in '-lc'",
            bindError(Args, {"-lc"}));

  // The same value twice is not a conflict.
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--list", "-l"}, Values));
  EXPECT_EQ("list", Values.getValue("mode"));
}

TEST(ArgumentMatcherTest, ChooseFirstAndChooseLast) {
  ArgumentSet First, Last;
  First.add(enumerableFlag("size", {"small", "large"}, ChooseFirst));
  Last.add(enumerableFlag("size", {"small", "large"}, ChooseLast));

  ParsedValues Values;
  ASSERT_FALSE(bindArgs(First, {"--small", "--large"}, Values));
  EXPECT_EQ("small", Values.getValue("size"));
  ASSERT_FALSE(bindArgs(Last, {"--small", "--large"}, Values));
  EXPECT_EQ("large", Values.getValue("size"));
}

TEST(ArgumentMatcherTest, EnumerableFlagRequiresOne) {
  ArgumentSet Args;
  Args.add(enumerableFlag("size", {"small", "large"}));
  EXPECT_EQ("Missing one of: '--small', '--large'", bindError(Args, {}));
}

TEST(ArgumentMatcherTest, InvertibleFlag) {
  ArgumentSet Args;
  Args.add(invertibleFlag("color", PrefixedNo, init(true)));

  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {}, Values));
  EXPECT_EQ("true", Values.getValue("color"));
  ASSERT_FALSE(bindArgs(Args, {"--no-color"}, Values));
  EXPECT_EQ("false", Values.getValue("color"));
  ASSERT_FALSE(bindArgs(Args, {"--no-color", "--color"}, Values));
  EXPECT_EQ("true", Values.getValue("color"));

  ArgumentSet EnableDisable;
  EnableDisable.add(invertibleFlag("cache", PrefixedEnableDisable));
  ASSERT_FALSE(bindArgs(EnableDisable, {"--disable-cache"}, Values));
  EXPECT_EQ("false", Values.getValue("cache"));
  EXPECT_EQ("Missing one of: '--enable-cache', '--disable-cache'",
            bindError(EnableDisable, {}));
}

TEST(ArgumentMatcherTest, Counter) {
  ArgumentSet Args = {counter("verbose", names{shortName()})};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {}, Values));
  EXPECT_EQ("0", Values.getValue("verbose"));
  ASSERT_FALSE(bindArgs(Args, {"-vvv", "-v"}, Values));
  EXPECT_EQ("4", Values.getValue("verbose"));
}

TEST(ArgumentMatcherTest, FlagWithValue) {
  ArgumentSet Args = {flag("verbose")};
  EXPECT_EQ("The option '--verbose' does not take any value, but 'yes' was "
            "specified.",
            bindError(Args, {"--verbose=yes"}));
}

TEST(ArgumentMatcherTest, ScalarOptionLastWins) {
  ArgumentSet Args = {option("name")};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--name", "a", "--name=b"}, Values));
  EXPECT_EQ("b", Values.getValue("name"));
  std::set<Index> Want = {Index(0), Index(1), Index(2)};
  EXPECT_EQ(Want, Values.getOrigin("name").getIndices());
}

TEST(ArgumentMatcherTest, ArrayOptionAccumulates) {
  ArgumentSet Args = {option("file", ZeroOrMore, list_init({"default"}))};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {}, Values));
  EXPECT_THAT(Values.getValues("file"), ElementsAre("default"));
  ASSERT_FALSE(bindArgs(Args, {"--file", "a", "--file", "b"}, Values));
  EXPECT_THAT(Values.getValues("file"), ElementsAre("a", "b"));
}

TEST(ArgumentMatcherTest, JoinedShortValue) {
  ArgumentSet Args = {option("define", names{customShort('D')}, AllowJoined),
                      flag("debug", names{shortName()})};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"-Dfoo"}, Values));
  EXPECT_EQ("foo", Values.getValue("define"));

  ASSERT_FALSE(bindArgs(Args, {"-D", "bar"}, Values));
  EXPECT_EQ("bar", Values.getValue("define"));
  EXPECT_EQ("false", Values.getValue("debug"));
}

TEST(ArgumentMatcherTest, ClusterLetterTakesNextValue) {
  ArgumentSet Args = {flag("verbose", names{shortName()}),
                      option("file", names{shortName()})};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"-vf", "out.txt"}, Values));
  EXPECT_EQ("true", Values.getValue("verbose"));
  EXPECT_EQ("out.txt", Values.getValue("file"));
}

TEST(ArgumentMatcherTest, ScanningForValue) {
  ArgumentSet Args = {option("name", ScanningForValue), flag("verbose")};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--name", "--verbose", "x"}, Values));
  EXPECT_EQ("x", Values.getValue("name"));
  EXPECT_EQ("true", Values.getValue("verbose"));
}

TEST(ArgumentMatcherTest, UnconditionalValue) {
  ArgumentSet Args = {option("name", Unconditional), flag("verbose")};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--name", "--verbose"}, Values));
  EXPECT_EQ("--verbose", Values.getValue("name"));
  EXPECT_EQ("false", Values.getValue("verbose"));
}

TEST(ArgumentMatcherTest, UpToNextOption) {
  ArgumentSet Args = {option("files", UpToNextOption), flag("verbose"),
                      positional("rest", ZeroOrMore)};
  ParsedValues Values;
  ASSERT_FALSE(
      bindArgs(Args, {"--files", "a", "b", "--verbose", "c"}, Values));
  EXPECT_THAT(Values.getValues("files"), ElementsAre("a", "b"));
  EXPECT_THAT(Values.getValues("rest"), ElementsAre("c"));
}

TEST(ArgumentMatcherTest, UpToNextOptionStopsAtClusterLetter) {
  ArgumentSet Args = {option("x", names{shortName()}, Optional, UpToNextOption),
                      flag("f", names{shortName()}),
                      positional("rest", ZeroOrMore)};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"-xf", "a"}, Values));
  EXPECT_TRUE(Values.getValues("x").empty());
  EXPECT_EQ("true", Values.getValue("f"));
  EXPECT_THAT(Values.getValues("rest"), ElementsAre("a"));

  ASSERT_FALSE(bindArgs(Args, {"-x", "a", "-f"}, Values));
  EXPECT_THAT(Values.getValues("x"), ElementsAre("a"));
  EXPECT_TRUE(Values.getValues("rest").empty());
}

TEST(ArgumentMatcherTest, UpToNextOptionWithoutValues) {
  ArgumentSet Args = {option("files", Optional, UpToNextOption)};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--files"}, Values));
  EXPECT_TRUE(Values.getValues("files").empty());
  std::set<Index> Want = {Index(0)};
  EXPECT_EQ(Want, Values.getOrigin("files").getIndices());
}

TEST(ArgumentMatcherTest, AllRemainingInputOption) {
  ArgumentSet Args = {option("args", AllRemainingInput), flag("verbose")};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--args", "x", "--verbose", "-y"}, Values));
  EXPECT_THAT(Values.getValues("args"), ElementsAre("x", "--verbose", "-y"));
  EXPECT_EQ("false", Values.getValue("verbose"));
}

TEST(ArgumentMatcherTest, AllRemainingInputPositional) {
  ArgumentSet Args = {flag("verbose"),
                      positional("command", AllRemainingInput)};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"--verbose", "run", "--verbose", "-x"}, Values));
  EXPECT_EQ("true", Values.getValue("verbose"));
  EXPECT_THAT(Values.getValues("command"),
              ElementsAre("run", "--verbose", "-x"));
}

TEST(ArgumentMatcherTest, PositionalsInDeclarationOrder) {
  ArgumentSet Args = {positional("source"), flag("verbose"),
                      positional("rest", ZeroOrMore)};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"a", "--verbose", "b", "c"}, Values));
  EXPECT_EQ("a", Values.getValue("source"));
  EXPECT_THAT(Values.getValues("rest"), ElementsAre("b", "c"));
}

TEST(ArgumentMatcherTest, PositionalsStopAtSubcommand) {
  ArgumentSet Args = {positional("files", ZeroOrMore)};
  ParsedValues Values;
  ASSERT_FALSE(bindArgs(Args, {"x", "build", "y"}, Values, {"build"}));
  EXPECT_THAT(Values.getValues("files"), ElementsAre("x"));
}

TEST(ArgumentMatcherTest, MissingPositional) {
  ArgumentSet Args = {positional("file"), flag("verbose")};
  EXPECT_EQ("Missing expected argument '<file>'", bindError(Args, {}));
}

TEST(ArgumentMatcherTest, AllowedValues) {
  ArgumentSet Args = {option("mode", values("fast", "slow"))};
  EXPECT_EQ("The value 'medium' is invalid for '--mode <mode>'. Please "
            "provide one of 'fast', 'slow'",
            bindError(Args, {"--mode", "medium"}));
  EXPECT_EQ("", bindError(Args, {"--mode", "slow"}));
}

TEST(ArgumentMatcherTest, TransformRejectsValue) {
  ArgumentSet Args = {
      option("count", transform([](std::string_view V) {
               if (V.find_first_not_of("0123456789") != std::string_view::npos)
                 return Error("not a number");
               return Error::success();
             })),
      positional("level", Optional, transform([](std::string_view V) {
                   return V == "max" ? Error::success() : Error("too low");
                 }))};
  EXPECT_EQ("The value 'x' is invalid for '--count <count>': not a number",
            bindError(Args, {"--count", "x"}));
  EXPECT_EQ("The value 'min' is invalid for '<level>': too low",
            bindError(Args, {"--count", "3", "min"}));
}

TEST(ArgumentMatcherTest, UnknownOptionsAreLeftInPlace) {
  ArgumentSet Args = {flag("verbose")};
  SplitArguments Split({"--verbose", "--other", "x"});
  ParsedValues Values;
  ASSERT_FALSE(ArgumentMatcher(Args).lenientParse(Split, Values));

  ArgumentMatcher::removeUsed(Split, Values.getUsedOrigins());
  EXPECT_EQ("[1] --other [2] 'x'", Split.getDescription());
}

} // anonymous namespace
