//===-- ArgumentMatcher.cpp - Binding engine ------------------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/ArgumentMatcher.h"

#include <algorithm>
#include <cstdlib>

using namespace argbind;

bool ArgumentMatcher::capturesAll() const {
  return std::any_of(Arguments.begin(), Arguments.end(),
                     [](const ArgumentDefinition &A) {
                       return A.isRepeatingPositional() &&
                              A.getParsingStrategy() == AllRemainingInput;
                     });
}

bool ArgumentMatcher::isSubcommandName(const std::string &S) const {
  return std::find(SubcommandNames.begin(), SubcommandNames.end(), S) !=
         SubcommandNames.end();
}

bool ArgumentMatcher::isNumericValue(const Element &E) const {
  if (!E.isPossibleNegative())
    return false;

  // An option name always takes priority over a negative number.
  const ParsedArgument &Parsed = E.getParsedArgument();
  if (Arguments.first(Parsed.getName()))
    return false;
  for (const auto &[Offset, Part] : Parsed.subarguments())
    if (Arguments.first(Part.getName()))
      return false;
  return true;
}

void ArgumentMatcher::setInitialValues(ParsedValues &Result) const {
  for (const ArgumentDefinition &A : Arguments) {
    const std::optional<std::vector<std::string>> &Init =
        A.getInitialValues();
    if (!Init || Result.contains(A.getKey()))
      continue;
    Result.set(A.getKey(), *Init, InputOrigin::defaultValue());
  }
}

void ArgumentMatcher::removeUsed(SplitArguments &Split,
                                 const InputOrigin &Origin) {
  for (const Index &I : Origin.getIndices()) {
    if (I.isComplete()) {
      Split.remove(I);
      continue;
    }
    Split.removeExact(I);
    Split.removeExact(I.completeIndex());
  }
}

//===----------------------------------------------------------------------===//
// Value updates
//

std::optional<ParserError>
ArgumentMatcher::update(const ArgumentDefinition &A, const InputOrigin &Origin,
                        const std::optional<Name> &N, const std::string &Value,
                        ParsedValues &Result) const {
  if (Error E = A.checkValue(Value))
    return ParserError::unableToParseValue(Origin, N, Value, A.getKey(),
                                           toString(std::move(E)));

  if (A.isArray())
    Result.append(A.getKey(), Value, Origin);
  else
    Result.set(A.getKey(), {Value}, Origin);
  return std::nullopt;
}

std::optional<ParserError>
ArgumentMatcher::updateFlag(const ArgumentDefinition &A, const Index &I,
                            ParsedValues &Result) const {
  const std::string &Key = A.getKey();
  InputOrigin Origin(I);

  if (A.getFlagUpdate() == ArgumentDefinition::Count) {
    unsigned long Count = 0;
    if (std::optional<std::string> Current = Result.getValue(Key))
      Count = std::strtoul(Current->c_str(), nullptr, 10);
    Result.set(Key, {std::to_string(Count + 1)}, Origin);
    return std::nullopt;
  }

  if (A.isArray()) {
    Result.append(Key, A.getFlagValue(), Origin);
    return std::nullopt;
  }

  // Composite flags share their key with other spellings; once one of them
  // has been given, the exclusivity decides what a second one does.
  const BoundValue *Previous = Result.element(Key);
  if (A.isComposite() && Previous && Previous->Origin.containsAnyArguments()) {
    switch (A.getExclusivity()) {
    case Exclusive:
      if (Previous->Values.size() != 1 ||
          Previous->Values.front() != A.getFlagValue())
        return ParserError::duplicateExclusiveValues(Previous->Origin, Origin);
      break;
    case ChooseFirst:
      Result.addOrigin(Key, Origin);
      return std::nullopt;
    case ChooseLast:
      break;
    }
  }

  Result.set(Key, {A.getFlagValue()}, Origin);
  return std::nullopt;
}

std::optional<ParserError>
ArgumentMatcher::parseValue(const ArgumentDefinition &A,
                            const ParsedArgument &Parsed, const Index &I,
                            SplitArguments &Input, ParsedValues &Result,
                            InputOrigin &Used) const {
  const Name &N = Parsed.getName();
  InputOrigin Origin(I);
  auto IsValue = [this](const Element &E) { return isValue(E); };

  // "--foo=bar"
  std::optional<std::pair<Index, std::string>> Attached;
  if (Parsed.hasValue())
    Attached = std::make_pair(I, Parsed.getValue());
  // "-fbar"
  else if (A.allowsJoinedValue() && N.isShort())
    Attached = Input.extractJoinedElement(I);

  auto Bind = [&](const Index &ValueIndex,
                  const std::string &Value) -> std::optional<ParserError> {
    InputOrigin Origins = Origin.inserting(ValueIndex);
    Used.formUnion(Origins);
    return update(A, Origins, N, Value, Result);
  };

  switch (A.getParsingStrategy()) {
  case NextAsValue:
  case ScanningForValue:
  case Unconditional: {
    if (Attached)
      return Bind(Attached->first, Attached->second);

    std::optional<std::pair<Index, std::string>> Next;
    if (A.getParsingStrategy() == NextAsValue)
      Next = Input.popNextElementIfValue(I, IsValue);
    else if (A.getParsingStrategy() == ScanningForValue)
      Next = Input.popNextValue(I, IsValue);
    else
      Next = Input.popNextElementAsValue(I);

    if (!Next)
      return ParserError::missingValueForOption(Origin, N);
    return Bind(Next->first, Next->second);
  }

  case UpToNextOption:
  case AllRemainingInput: {
    Used.insert(I);
    if (Attached) {
      if (std::optional<ParserError> Err =
              Bind(Attached->first, Attached->second))
        return Err;
      removeUsed(Input, Used);
    }

    bool UpToNext = A.getParsingStrategy() == UpToNextOption;
    while (true) {
      std::optional<std::pair<Index, std::string>> Next =
          UpToNext ? Input.popNextElementIfValue(IsValue)
                   : Input.popNextElementAsValue(I);
      if (!Next)
        break;
      if (std::optional<ParserError> Err = Bind(Next->first, Next->second))
        return Err;
    }

    // Keep the option's own position even when no value followed it.
    if (Result.contains(A.getKey()))
      Result.addOrigin(A.getKey(), Origin);
    else
      Result.set(A.getKey(), {}, Origin);
    return std::nullopt;
  }
  }
  argbind_unreachable("unknown parsing strategy");
}

//===----------------------------------------------------------------------===//
// Matching
//

std::optional<ParserError>
ArgumentMatcher::lenientParse(const SplitArguments &Split,
                              ParsedValues &Result) const {
  SplitArguments Input = Split;
  Result = ParsedValues(Split.getOriginalInput());
  setInitialValues(Result);

  // With a positional capturing everything, the first value or unknown
  // option starts the positional input.
  bool CapturesAll = capturesAll();
  InputOrigin AllUsed;

  while (std::optional<SplitArguments::Entry> Next = Input.popNext()) {
    const Index &I = Next->first;
    const Element &E = Next->second;

    if (E.isTerminator())
      continue;
    if (isValue(E)) {
      if (CapturesAll)
        break;
      continue;
    }

    const ParsedArgument &Parsed = E.getParsedArgument();
    const ArgumentDefinition *A = Arguments.first(Parsed.getName());
    if (!A) {
      // A cluster like "-fi" may still match letter by letter; anything else
      // is left for a subcommand to claim.
      if (CapturesAll && Parsed.subarguments().empty())
        break;
      continue;
    }

    InputOrigin Used;
    if (A->isNullary()) {
      if (Parsed.hasValue())
        return ParserError::unexpectedValueForOption(I, Parsed.getName(),
                                                     Parsed.getValue());
      if (std::optional<ParserError> Err = updateFlag(*A, I, Result))
        return Err;
      Used.insert(I);
    } else if (std::optional<ParserError> Err =
                   parseValue(*A, Parsed, I, Input, Result, Used)) {
      return Err;
    }

    removeUsed(Input, Used);
    AllUsed.formUnion(Used);
  }

  SplitArguments Unused = Split;
  removeUsed(Unused, AllUsed);
  return parsePositionalValues(Unused, Result);
}

std::optional<ParserError>
ArgumentMatcher::parsePositionalValues(const SplitArguments &Unused,
                                       ParsedValues &Result) const {
  // Only whole arguments are candidates, never the letters of a cluster. A
  // subcommand name ends the input for this command.
  std::vector<Index> Stack;
  bool SeenTerminator = false;
  for (const auto &[I, E] : Unused.getElements()) {
    if (!I.isComplete())
      continue;
    if (E.isTerminator())
      SeenTerminator = true;
    else if (!SeenTerminator && E.isValue() &&
             isSubcommandName(Unused.getOriginalInput(I)))
      break;
    Stack.push_back(I);
  }

  size_t Pos = 0;
  auto NextIndex = [&](bool Unconditional) -> std::optional<Index> {
    if (!Unconditional)
      while (Pos != Stack.size() && !isValue(*Unused.lookup(Stack[Pos])))
        ++Pos;
    if (Pos == Stack.size())
      return std::nullopt;
    return Stack[Pos++];
  };

  for (const ArgumentDefinition &A : Arguments) {
    if (!A.isPositional())
      continue;
    bool AllowOptions = A.getParsingStrategy() == AllRemainingInput;
    do {
      std::optional<Index> I = NextIndex(AllowOptions);
      if (!I)
        return std::nullopt;
      if (std::optional<ParserError> Err =
              update(A, InputOrigin(*I), std::nullopt,
                     Unused.getOriginalInput(*I), Result))
        return Err;
    } while (A.isRepeatingPositional());
  }
  return std::nullopt;
}

std::optional<ParserError>
ArgumentMatcher::checkRequired(const ParsedValues &Values) const {
  for (const ArgumentDefinition &A : Arguments) {
    if (A.isOptional())
      continue;
    const BoundValue *E = Values.element(A.getKey());
    if (!E || E->Values.empty())
      return ParserError::noValue(A.getKey());
  }
  return std::nullopt;
}
