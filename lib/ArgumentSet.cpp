//===-- ArgumentSet.cpp - Ordered argument definitions --------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/ArgumentSet.h"

using namespace argbind;

ArgumentSet::ArgumentSet(std::initializer_list<ArgumentDefinition> IL) {
  for (const ArgumentDefinition &A : IL)
    add(A);
}

void ArgumentSet::append(ArgumentDefinition A, bool Own) {
  size_t NewPosition = Content.size();
  for (const Name &N : A.getNames())
    NamePositions.emplace(N.nameToMatch(), NewPosition);
  if (Own)
    OwnPositions.push_back(NewPosition);
  Content.push_back(std::move(A));
}

void ArgumentSet::add(const ArgumentSet &Other) {
  for (const ArgumentDefinition &A : Other)
    append(A, /*Own=*/true);
}

void ArgumentSet::addGroup(ArgumentSet Group) {
  for (const ArgumentDefinition &A : Group)
    append(A, /*Own=*/false);
  Groups.push_back(std::move(Group));
}

const ArgumentDefinition *ArgumentSet::first(const Name &N) const {
  auto It = NamePositions.find(N.nameToMatch());
  if (It == NamePositions.end())
    return nullptr;
  return &Content[It->second];
}

std::vector<const ArgumentDefinition *>
ArgumentSet::definitionsFor(const std::string &Key) const {
  std::vector<const ArgumentDefinition *> Result;
  for (const ArgumentDefinition &A : Content)
    if (A.getKey() == Key)
      Result.push_back(&A);
  return Result;
}

std::vector<const ArgumentDefinition *> ArgumentSet::getOwnDefinitions() const {
  std::vector<const ArgumentDefinition *> Result;
  for (size_t Position : OwnPositions)
    Result.push_back(&Content[Position]);
  return Result;
}

std::string ArgumentSet::getDebugDescription() const {
  std::vector<std::string> Parts;
  for (const ArgumentDefinition &A : Content)
    Parts.push_back(A.getSynopsis());
  return join(Parts, " / ");
}
