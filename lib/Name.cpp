//===-- Name.cpp - Option names -------------------------------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/Name.h"
#include "argbind/Support.h"

#include <algorithm>

using namespace argbind;

std::string Name::getSynopsisString() const {
  switch (Kind) {
  case Long:
    return "--" + Value;
  case Short:
  case LongWithSingleDash:
    return "-" + Value;
  }
  argbind_unreachable("unknown name kind");
}

static int kindRank(Name::NameKind K) {
  switch (K) {
  case Name::Short:
    return 0;
  case Name::LongWithSingleDash:
    return 1;
  case Name::Long:
    return 2;
  }
  return 2;
}

std::vector<Name> argbind::sortedNames(const std::vector<Name> &Names) {
  std::vector<Name> Result(Names);
  std::stable_sort(Result.begin(), Result.end(),
                   [](const Name &LHS, const Name &RHS) {
                     int L = kindRank(LHS.getKind());
                     int R = kindRank(RHS.getKind());
                     if (L != R)
                       return L < R;
                     return LHS.getValueString() < RHS.getValueString();
                   });
  return Result;
}

std::vector<Name> NameSpecification::makeNames(std::string_view Key) const {
  std::vector<Name> Result;
  auto AddUnique = [&](Name N) {
    if (std::find(Result.begin(), Result.end(), N) == Result.end())
      Result.push_back(std::move(N));
  };

  for (const Element &E : Elements) {
    switch (E.Kind) {
    case Element::Long:
      AddUnique(Name::makeLong(convertToSnakeCase(Key)));
      break;
    case Element::CustomLong:
      if (E.WithSingleDash)
        AddUnique(Name::makeLongWithSingleDash(E.Custom));
      else
        AddUnique(Name::makeLong(E.Custom));
      break;
    case Element::Short:
      if (!Key.empty())
        AddUnique(Name::makeShort(Key.front(), E.AllowingJoined));
      break;
    case Element::CustomShort:
      AddUnique(Name::makeShort(E.ShortChar, E.AllowingJoined));
      break;
    }
  }
  return Result;
}

std::vector<Name>
NameSpecification::makePrefixedNames(std::string_view Key,
                                     std::string_view Prefix,
                                     bool IncludingShort) const {
  std::string Dashed = std::string(Prefix) + "-";
  std::vector<Name> Result;
  for (const Element &E : Elements) {
    switch (E.Kind) {
    case Element::Long:
      Result.push_back(Name::makeLong(Dashed + convertToSnakeCase(Key)));
      break;
    case Element::CustomLong:
      if (E.WithSingleDash)
        Result.push_back(Name::makeLongWithSingleDash(Dashed + E.Custom));
      else
        Result.push_back(Name::makeLong(Dashed + E.Custom));
      break;
    case Element::Short:
      if (IncludingShort && !Key.empty())
        Result.push_back(Name::makeShort(Key.front(), E.AllowingJoined));
      break;
    case Element::CustomShort:
      if (IncludingShort)
        Result.push_back(Name::makeShort(E.ShortChar, E.AllowingJoined));
      break;
    }
  }
  return Result;
}
