//===-- ParsedValues.cpp - Bound values with provenance -------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/ParsedValues.h"

using namespace argbind;

void ParsedValues::set(const std::string &Key, std::vector<std::string> Values,
                       const InputOrigin &Origin) {
  auto It = Elements.find(Key);
  if (It == Elements.end()) {
    Elements.emplace(Key, BoundValue{Key, std::move(Values), Origin});
    return;
  }

  BoundValue &E = It->second;
  E.Values = std::move(Values);
  E.Origin.formUnion(Origin);
}

void ParsedValues::append(const std::string &Key, std::string Value,
                          const InputOrigin &Origin) {
  auto It = Elements.find(Key);
  if (It == Elements.end()) {
    Elements.emplace(Key, BoundValue{Key, {std::move(Value)}, Origin});
    return;
  }

  BoundValue &E = It->second;
  if (E.Origin.isDefaultValue()) {
    E.Values.clear();
    E.Origin = InputOrigin();
  }
  E.Values.push_back(std::move(Value));
  E.Origin.formUnion(Origin);
}

void ParsedValues::addOrigin(const std::string &Key,
                             const InputOrigin &Origin) {
  auto It = Elements.find(Key);
  if (It != Elements.end())
    It->second.Origin.formUnion(Origin);
}

const BoundValue *ParsedValues::element(const std::string &Key) const {
  auto It = Elements.find(Key);
  return It == Elements.end() ? nullptr : &It->second;
}

std::optional<std::string>
ParsedValues::getValue(const std::string &Key) const {
  const BoundValue *E = element(Key);
  if (!E || E->Values.empty())
    return std::nullopt;
  return E->Values.back();
}

std::vector<std::string> ParsedValues::getValues(const std::string &Key) const {
  if (const BoundValue *E = element(Key))
    return E->Values;
  return {};
}

InputOrigin ParsedValues::getOrigin(const std::string &Key) const {
  if (const BoundValue *E = element(Key))
    return E->Origin;
  return InputOrigin();
}

InputOrigin ParsedValues::getUsedOrigins() const {
  InputOrigin Result;
  for (const auto &[Key, E] : Elements)
    for (const Index &I : E.Origin.getIndices())
      Result.insert(I);
  return Result;
}
