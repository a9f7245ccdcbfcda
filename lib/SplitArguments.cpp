//===-- SplitArguments.cpp - Argument tokenizer ---------------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/SplitArguments.h"
#include "argbind/Support.h"

#include <cctype>

using namespace argbind;

//===----------------------------------------------------------------------===//
// ParsedArgument / Index / Element
//

std::vector<std::pair<unsigned, ParsedArgument>>
ParsedArgument::subarguments() const {
  std::vector<std::pair<unsigned, ParsedArgument>> Result;
  if (hasValue() || ArgName.getKind() != Name::LongWithSingleDash)
    return Result;

  const std::string &Base = ArgName.getValueString();
  for (unsigned I = 0, E = static_cast<unsigned>(Base.size()); I != E; ++I)
    Result.emplace_back(I, ParsedArgument(Name::makeShort(Base[I])));
  return Result;
}

std::string ParsedArgument::getDescription() const {
  if (!hasValue())
    return ArgName.getSynopsisString();
  return ArgName.getSynopsisString() + "=" + *Value;
}

std::string Index::toString() const {
  if (Sub.isComplete())
    return std::to_string(InputIndex);
  return std::to_string(InputIndex) + "." + std::to_string(Sub.getOffset());
}

std::string Element::getDebugDescription() const {
  switch (Kind) {
  case Value:
    return "value '" + Text + "'";
  case Option:
    if (Arg->hasValue())
      return Arg->getName().getSynopsisString() + "; value '" +
             Arg->getValue() + "'";
    return Arg->getName().getSynopsisString();
  case Terminator:
    return "terminator";
  case PossibleNegative:
    return "possible negative '" + Text + "'";
  }
  argbind_unreachable("unknown element kind");
}

//===----------------------------------------------------------------------===//
// Tokenizer
//

// Whether Str (without its leading dash) reads as an unsigned number, e.g.
// "5", "123", "1.5", ".5" or "2e10".
static bool isNumericLiteral(std::string_view Str) {
  size_t I = 0, E = Str.size();
  bool SawDigit = false, SawDot = false;
  for (; I != E; ++I) {
    char C = Str[I];
    if (std::isdigit(static_cast<unsigned char>(C))) {
      SawDigit = true;
      continue;
    }
    if (C == '.' && !SawDot) {
      SawDot = true;
      continue;
    }
    break;
  }
  if (!SawDigit)
    return false;
  if (I == E)
    return true;

  // Exponent.
  if (Str[I] != 'e' && Str[I] != 'E')
    return false;
  if (++I != E && (Str[I] == '+' || Str[I] == '-'))
    ++I;
  if (I == E)
    return false;
  for (; I != E; ++I)
    if (!std::isdigit(static_cast<unsigned char>(Str[I])))
      return false;
  return true;
}

// Splits "name=value". A single letter before the '=' is a short name after a
// single dash: "-c=1" is short "c", "-count=1" is single-dash long "count".
static ParsedArgument parseSingleDashRemainder(std::string_view Remainder,
                                               size_t EqualPos) {
  std::string_view BaseName = Remainder.substr(0, EqualPos);
  std::string Value(Remainder.substr(EqualPos + 1));
  if (BaseName.size() == 1)
    return ParsedArgument(Name::makeShort(BaseName.front()), std::move(Value));
  return ParsedArgument(Name::makeLongWithSingleDash(BaseName),
                        std::move(Value));
}

// Classifies a single input string at the given position, appending the
// resulting element(s) to Elements.
static void parseIndividualArg(std::string_view Arg, size_t Position,
                               SplitArguments::ElementMap &Elements) {
  Index I(Position);

  // "--name" and "--name=value"; a third dash becomes part of the name.
  std::string_view Remainder = Arg;
  if (consumeFront(Remainder, "--")) {
    size_t EqualPos = Remainder.find('=');
    if (EqualPos == std::string_view::npos) {
      Elements.emplace(I, Element::option(
                              ParsedArgument(Name::makeLong(Remainder))));
    } else {
      Elements.emplace(
          I, Element::option(ParsedArgument(
                 Name::makeLong(Remainder.substr(0, EqualPos)),
                 std::string(Remainder.substr(EqualPos + 1)))));
    }
    return;
  }

  // Plain values, including the empty string and a single "-".
  if (!consumeFront(Remainder, "-") || Remainder.empty()) {
    Elements.emplace(I, Element::value(std::string(Arg)));
    return;
  }

  size_t EqualPos = Remainder.find('=');
  if (EqualPos != std::string_view::npos) {
    Elements.emplace(
        I, Element::option(parseSingleDashRemainder(Remainder, EqualPos)));
    return;
  }

  if (Remainder.size() == 1) {
    ParsedArgument Parsed(Name::makeShort(Remainder.front()));
    if (std::isdigit(static_cast<unsigned char>(Remainder.front())))
      Elements.emplace(I, Element::possibleNegative(std::string(Arg),
                                                    std::move(Parsed)));
    else
      Elements.emplace(I, Element::option(std::move(Parsed)));
    return;
  }

  // A cluster: keep both the single-dash long reading and one short option
  // per character, and let the binding engine pick.
  ParsedArgument Parsed(Name::makeLongWithSingleDash(Remainder));
  std::vector<std::pair<unsigned, ParsedArgument>> Parts =
      Parsed.subarguments();
  if (isNumericLiteral(Remainder))
    Elements.emplace(I, Element::possibleNegative(std::string(Arg),
                                                  std::move(Parsed)));
  else
    Elements.emplace(I, Element::option(std::move(Parsed)));

  for (auto &[Offset, Part] : Parts)
    Elements.emplace(Index(Position, SubIndex::sub(Offset)),
                     Element::option(std::move(Part)));
}

SplitArguments::SplitArguments(std::vector<std::string> Arguments)
    : OriginalInput(std::move(Arguments)) {
  size_t Position = 0;
  size_t E = OriginalInput.size();
  for (; Position != E; ++Position) {
    const std::string &Arg = OriginalInput[Position];
    if (Arg == "--") {
      Elements.emplace(Index(Position), Element::terminator());
      ++Position;
      break;
    }
    parseIndividualArg(Arg, Position, Elements);
  }

  // Everything after the terminator is a value.
  for (; Position < E; ++Position)
    Elements.emplace(Index(Position), Element::value(OriginalInput[Position]));
}

//===----------------------------------------------------------------------===//
// Stream access
//

SplitArguments::ElementMap::iterator
SplitArguments::firstAfter(const Index &I) {
  return Elements.upper_bound(I);
}

SplitArguments::ElementMap::const_iterator
SplitArguments::firstAfter(const Index &I) const {
  return Elements.upper_bound(I);
}

const Element *SplitArguments::lookup(const Index &I) const {
  auto It = Elements.find(I);
  return It == Elements.end() ? nullptr : &It->second;
}

bool SplitArguments::containsNonTerminatorArguments() const {
  for (const auto &[I, E] : Elements)
    if (!E.isTerminator())
      return true;
  return false;
}

bool SplitArguments::containsAnyOf(const std::vector<Name> &Names) const {
  for (const auto &[I, E] : Elements) {
    if (!E.isOption())
      continue;
    const Name &N = E.getParsedArgument().getName();
    for (const Name &Candidate : Names)
      if (Candidate.nameToMatch() == N)
        return true;
  }
  return false;
}

std::optional<SplitArguments::Entry> SplitArguments::peekNext() const {
  if (Elements.empty())
    return std::nullopt;
  return *Elements.begin();
}

std::optional<SplitArguments::Entry> SplitArguments::popNext() {
  if (Elements.empty())
    return std::nullopt;
  Entry Next = *Elements.begin();
  Elements.erase(Elements.begin());
  return Next;
}

std::optional<std::pair<Index, std::string>>
SplitArguments::popNextElementAsValue(const Index &I) {
  auto It = firstAfter(I);
  while (It != Elements.end() && !It->first.isComplete())
    ++It;
  if (It == Elements.end())
    return std::nullopt;

  Index Found = It->first;
  remove(Found);
  return std::make_pair(Found, OriginalInput[Found.InputIndex]);
}

std::optional<std::pair<Index, std::string>>
SplitArguments::extractJoinedElement(const Index &I) const {
  // Joined values only apply to the first letter of a cluster.
  if (I.isComplete() || I.Sub.getOffset() != 0)
    return std::nullopt;

  const std::string &Original = OriginalInput[I.InputIndex];
  if (Original.size() <= 2)
    return std::nullopt;
  return std::make_pair(I.completeIndex(), Original.substr(2));
}

void SplitArguments::remove(const Index &I) {
  if (!I.isComplete()) {
    Elements.erase(I);
    return;
  }

  auto Begin = Elements.lower_bound(I);
  auto End = Elements.lower_bound(Index(I.InputIndex + 1));
  Elements.erase(Begin, End);
}

void SplitArguments::removeAll(const std::set<Index> &Indices) {
  for (const Index &I : Indices)
    remove(I);
}

std::vector<std::pair<Index, std::string>>
SplitArguments::coalescedExtraElements() const {
  std::vector<std::pair<Index, std::string>> Result;
  for (const auto &[I, E] : Elements) {
    if (E.isTerminator())
      continue;
    if (I.isComplete()) {
      Result.emplace_back(I, OriginalInput[I.InputIndex]);
      continue;
    }
    if (contains(I.completeIndex()))
      continue;
    if (E.hasParsedArgument())
      Result.emplace_back(I, E.getParsedArgument().getDescription());
    else
      Result.emplace_back(I, OriginalInput[I.InputIndex]);
  }
  return Result;
}

std::string SplitArguments::getDescription() const {
  if (Elements.empty())
    return "<empty>";

  std::vector<std::string> Parts;
  for (const auto &[I, E] : Elements) {
    std::string Prefix = "[" + I.toString() + "] ";
    switch (E.getKind()) {
    case Element::Value:
      Parts.push_back(Prefix + "'" + E.getText() + "'");
      break;
    case Element::Option: {
      const ParsedArgument &A = E.getParsedArgument();
      if (A.hasValue())
        Parts.push_back(Prefix + A.getName().getSynopsisString() + "='" +
                        A.getValue() + "'");
      else
        Parts.push_back(Prefix + A.getName().getSynopsisString());
      break;
    }
    case Element::Terminator:
      Parts.push_back(Prefix + "--");
      break;
    case Element::PossibleNegative:
      Parts.push_back(Prefix + E.getText() + "?");
      break;
    }
  }
  return join(Parts, " ");
}
