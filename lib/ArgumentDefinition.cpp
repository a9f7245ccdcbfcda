//===-- ArgumentDefinition.cpp - Declared arguments -----------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/ArgumentDefinition.h"

#include <algorithm>

using namespace argbind;

ArgumentDefinition::ArgumentDefinition(ArgumentKind K, std::string_view Key)
    : Key(Key), Kind(K) {}

void ArgumentDefinition::setParsingStrategy(ParsingStrategy S) {
  Strategy = S;
}

void ArgumentDefinition::done() {
  // Strategies that gather several values only make sense for arrays.
  if ((Strategy == UpToNextOption || Strategy == AllRemainingInput) &&
      getArity() == Scalar)
    Occurrences = Occurrences == Optional ? ZeroOrMore : OneOrMore;

  if (Kind == Positional)
    return;

  if (NameSpec.empty())
    NameSpec.add(NameSpecification::longName());
  Names = NameSpec.makeNames(Key);

  if (Misc & AllowJoined)
    for (Name &N : Names)
      if (N.isShort())
        N = Name::makeShort(N.getShortChar(), /*AllowingJoined=*/true);
}

bool ArgumentDefinition::allowsJoinedValue() const {
  return std::any_of(Names.begin(), Names.end(),
                     [](const Name &N) { return N.allowsJoined(); });
}

bool ArgumentDefinition::isOptional() const {
  return Occurrences == Optional || Occurrences == ZeroOrMore ||
         InitialValues.has_value();
}

std::optional<Name> ArgumentDefinition::getPreferredName() const {
  if (Names.empty())
    return std::nullopt;
  for (const Name &N : Names)
    if (!N.isShort())
      return N;
  return Names.front();
}

std::string ArgumentDefinition::getValueName() const {
  if (!ValueName.empty())
    return ValueName;
  if (std::optional<Name> N = getPreferredName())
    return N->getValueString();
  return convertToSnakeCase(Key);
}

std::string ArgumentDefinition::getSynopsis() const {
  switch (Kind) {
  case Positional:
    return "<" + getValueName() + ">";
  case Option:
    if (std::optional<Name> N = getPreferredName())
      return N->getSynopsisString() + " <" + getValueName() + ">";
    return "<" + getValueName() + ">";
  case Flag:
    if (std::optional<Name> N = getPreferredName())
      return N->getSynopsisString();
    return Key;
  }
  argbind_unreachable("unknown argument kind");
}

Error ArgumentDefinition::checkValue(std::string_view Value) const {
  if (!AllowedValues.empty() &&
      std::find(AllowedValues.begin(), AllowedValues.end(), Value) ==
          AllowedValues.end())
    return Error(std::string());
  if (Transform)
    return Transform(Value);
  return Error::success();
}
