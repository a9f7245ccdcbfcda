//===-- ParserError.cpp - User-facing parse errors ------------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/ParserError.h"

using namespace argbind;

// Names closer than this are offered as a suggestion for an unknown option.
static const unsigned SimilarityFloor = 4;

//===----------------------------------------------------------------------===//
// ParserError
//

ParserError ParserError::unknownOption(const Index &I, Name N) {
  ParserError E(UnknownOption);
  E.Origin = InputOrigin(I);
  E.ArgName = std::move(N);
  return E;
}

ParserError ParserError::missingValueForOption(InputOrigin O, Name N) {
  ParserError E(MissingValueForOption);
  E.Origin = std::move(O);
  E.ArgName = std::move(N);
  return E;
}

ParserError ParserError::noValue(std::string Key) {
  ParserError E(NoValue);
  E.Key = std::move(Key);
  return E;
}

ParserError
ParserError::unexpectedExtraValues(std::vector<ExtraValue> Values) {
  ParserError E(UnexpectedExtraValues);
  E.ExtraValues = std::move(Values);
  return E;
}

ParserError ParserError::duplicateExclusiveValues(InputOrigin Previous,
                                                  InputOrigin Duplicate) {
  ParserError E(DuplicateExclusiveValues);
  E.Previous = std::move(Previous);
  E.Origin = std::move(Duplicate);
  return E;
}

ParserError ParserError::unableToParseValue(InputOrigin O,
                                            std::optional<Name> N,
                                            std::string Value, std::string Key,
                                            std::string Reason) {
  ParserError E(UnableToParseValue);
  E.Origin = std::move(O);
  E.ArgName = std::move(N);
  E.Value = std::move(Value);
  E.Key = std::move(Key);
  E.Reason = std::move(Reason);
  return E;
}

ParserError ParserError::unexpectedValueForOption(const Index &I, Name N,
                                                  std::string Value) {
  ParserError E(UnexpectedValueForOption);
  E.Origin = InputOrigin(I);
  E.ArgName = std::move(N);
  E.Value = std::move(Value);
  return E;
}

ParserError ParserError::invalidState() { return ParserError(InvalidState); }

//===----------------------------------------------------------------------===//
// ErrorMessageGenerator
//

std::string
ErrorMessageGenerator::makeErrorMessage(const ParserError &E) const {
  switch (E.getKind()) {
  case ParserError::UnknownOption:
    return unknownOptionMessage(*E.getName());
  case ParserError::MissingValueForOption:
    return missingValueForOptionMessage(*E.getName());
  case ParserError::NoValue:
    return noValueMessage(E.getKey());
  case ParserError::UnexpectedExtraValues:
    return unexpectedExtraValuesMessage(E.getExtraValues());
  case ParserError::DuplicateExclusiveValues:
    return duplicateExclusiveValuesMessage(E.getPrevious(), E.getOrigin());
  case ParserError::UnableToParseValue:
    return unableToParseValueMessage(E);
  case ParserError::UnexpectedValueForOption:
    return "The option '" + E.getName()->getSynopsisString() +
           "' does not take any value, but '" + E.getValue() +
           "' was specified.";
  case ParserError::InvalidState:
    return "Internal error. Invalid state while parsing command-line "
           "arguments.";
  }
  argbind_unreachable("unknown parser error kind");
}

std::optional<std::string>
ErrorMessageGenerator::valueName(const Name &N) const {
  Name ToMatch = N.nameToMatch();
  for (const ArgumentDefinition &A : Arguments) {
    if (A.isNullary())
      continue;
    for (const Name &Candidate : A.getNames())
      if (Candidate.nameToMatch() == ToMatch)
        return A.getValueName();
  }
  return std::nullopt;
}

std::string ErrorMessageGenerator::unknownOptionMessage(const Name &N) const {
  std::string Synopsis = N.getSynopsisString();
  if (N.isShort())
    return "Unknown option '" + Synopsis + "'";

  // The closest long name wins; ties go to the first declaration.
  std::optional<std::string> Suggestion;
  unsigned BestDistance = SimilarityFloor;
  for (const ArgumentDefinition &A : Arguments) {
    if (A.getVisibility() == Private)
      continue;
    for (const Name &Candidate : A.getNames()) {
      if (Candidate.isShort())
        continue;
      std::string CandidateSynopsis = Candidate.getSynopsisString();
      unsigned Distance = editDistance(CandidateSynopsis, Synopsis);
      if (Distance < BestDistance) {
        BestDistance = Distance;
        Suggestion = std::move(CandidateSynopsis);
      }
    }
  }

  if (Suggestion)
    return "Unknown option '" + Synopsis + "'. Did you mean '" + *Suggestion +
           "'?";
  return "Unknown option '" + Synopsis + "'";
}

std::string
ErrorMessageGenerator::missingValueForOptionMessage(const Name &N) const {
  if (std::optional<std::string> V = valueName(N))
    return "Missing value for '" + N.getSynopsisString() + " <" + *V + ">'";
  return "Missing value for '" + N.getSynopsisString() + "'";
}

std::string
ErrorMessageGenerator::noValueMessage(const std::string &Key) const {
  std::vector<std::string> Possibilities;
  for (const ArgumentDefinition *A : Arguments.definitionsFor(Key))
    Possibilities.push_back(A->getSynopsis());

  switch (Possibilities.size()) {
  case 0:
    return "Missing expected argument";
  case 1:
    return "Missing expected argument '" + Possibilities.front() + "'";
  default:
    return "Missing one of: '" + join(Possibilities, "', '") + "'";
  }
}

std::string ErrorMessageGenerator::unexpectedExtraValuesMessage(
    const std::vector<ParserError::ExtraValue> &Values) const {
  if (Values.empty())
    return "Unexpected argument";
  if (Values.size() == 1)
    return "Unexpected argument '" + Values.front().second + "'";

  std::vector<std::string> Parts;
  for (const auto &[I, V] : Values)
    Parts.push_back(V);
  return std::to_string(Values.size()) + " unexpected arguments: '" +
         join(Parts, "', '") + "'";
}

// "flag '--list'", or "flag 'c' in '-lc'" for one letter of a cluster.
std::string ErrorMessageGenerator::elementString(const InputOrigin &O) const {
  std::optional<Index> First = O.firstIndex();
  if (!First || First->InputIndex >= OriginalInput.size())
    return "position " + (First ? First->toString() : std::string("?"));

  const std::string &Input = OriginalInput[First->InputIndex];
  std::string Result = "'" + Input + "'";
  if (!First->isComplete()) {
    size_t Offset = First->Sub.getOffset() + 1;
    if (Offset < Input.size())
      Result = "'" + std::string(1, Input[Offset]) + "' in " + Result;
  }
  return "flag " + Result;
}

std::string ErrorMessageGenerator::duplicateExclusiveValuesMessage(
    const InputOrigin &Previous, const InputOrigin &Duplicate) const {
  return "Value to be set with " + elementString(Duplicate) +
         " had already been set with " + elementString(Previous);
}

std::string
ErrorMessageGenerator::unableToParseValueMessage(const ParserError &E) const {
  std::vector<const ArgumentDefinition *> Defs =
      Arguments.definitionsFor(E.getKey());
  const ArgumentDefinition *Def = Defs.empty() ? nullptr : Defs.front();

  std::string Detail;
  if (!E.getReason().empty()) {
    Detail = ": " + E.getReason();
  } else if (Def && !Def->getAllowedValues().empty()) {
    Detail = ". Please provide one of '" +
             join(Def->getAllowedValues(), "', '") + "'";
  }

  std::string Message = "The value '" + E.getValue() + "' is invalid";
  const std::optional<Name> &N = E.getName();
  if (N && Def)
    return Message + " for '" + N->getSynopsisString() + " <" +
           Def->getValueName() + ">'" + Detail;
  if (Def)
    return Message + " for '<" + Def->getValueName() + ">'" + Detail;
  if (N)
    return Message + " for '" + N->getSynopsisString() + "'" + Detail;
  return Message + "." + Detail;
}
