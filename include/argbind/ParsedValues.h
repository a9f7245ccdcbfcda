//===- argbind/ParsedValues.h - Bound values with provenance ----*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The result of matching one command's arguments: a flat key -> values map
// where every entry remembers which input elements produced it.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_PARSEDVALUES_H
#define ARGBIND_PARSEDVALUES_H

#include "argbind/SplitArguments.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace argbind {

/// Where a value came from: a default, one or more input elements, or both
/// (a default that was later overwritten keeps its marker until replaced).
class InputOrigin {
  bool FromDefault = false;
  std::set<Index> Indices;

public:
  InputOrigin() = default;
  explicit InputOrigin(const Index &I) { Indices.insert(I); }

  static InputOrigin defaultValue() {
    InputOrigin O;
    O.FromDefault = true;
    return O;
  }

  void insert(const Index &I) { Indices.insert(I); }
  InputOrigin inserting(const Index &I) const {
    InputOrigin Result(*this);
    Result.insert(I);
    return Result;
  }
  void formUnion(const InputOrigin &Other) {
    FromDefault |= Other.FromDefault;
    Indices.insert(Other.Indices.begin(), Other.Indices.end());
  }

  bool empty() const { return !FromDefault && Indices.empty(); }
  bool hasDefaultValue() const { return FromDefault; }
  /// True if the origin holds the default marker and no input element.
  bool isDefaultValue() const { return FromDefault && Indices.empty(); }
  bool containsAnyArguments() const { return !Indices.empty(); }

  const std::set<Index> &getIndices() const { return Indices; }
  /// The first input element, in input order.
  std::optional<Index> firstIndex() const {
    if (Indices.empty())
      return std::nullopt;
    return *Indices.begin();
  }

  bool operator==(const InputOrigin &RHS) const {
    return FromDefault == RHS.FromDefault && Indices == RHS.Indices;
  }
  bool operator!=(const InputOrigin &RHS) const { return !(*this == RHS); }
};

/// One bound key. Scalars hold a single value, arrays any number.
struct BoundValue {
  std::string Key;
  std::vector<std::string> Values;
  InputOrigin Origin;

  bool operator==(const BoundValue &RHS) const {
    return Key == RHS.Key && Values == RHS.Values && Origin == RHS.Origin;
  }
};

class ParsedValues {
  std::map<std::string, BoundValue> Elements;
  std::vector<std::string> OriginalInput;

public:
  ParsedValues() = default;
  explicit ParsedValues(std::vector<std::string> Input)
      : OriginalInput(std::move(Input)) {}

  /// Replaces the values for Key. The origin is merged with the origin of any
  /// previous entry, so an overwritten scalar still knows every input that
  /// touched it.
  void set(const std::string &Key, std::vector<std::string> Values,
           const InputOrigin &Origin);

  /// Appends Value to the values for Key. An entry that only holds its
  /// default is replaced instead of extended.
  void append(const std::string &Key, std::string Value,
              const InputOrigin &Origin);

  /// Merges Origin into the entry for Key without touching its values.
  void addOrigin(const std::string &Key, const InputOrigin &Origin);

  const BoundValue *element(const std::string &Key) const;
  bool contains(const std::string &Key) const {
    return Elements.count(Key) != 0;
  }

  /// The last value bound to Key, if any.
  std::optional<std::string> getValue(const std::string &Key) const;
  std::vector<std::string> getValues(const std::string &Key) const;
  InputOrigin getOrigin(const std::string &Key) const;

  /// Every input element used by any entry.
  InputOrigin getUsedOrigins() const;

  const std::map<std::string, BoundValue> &getElements() const {
    return Elements;
  }
  const std::vector<std::string> &getOriginalInput() const {
    return OriginalInput;
  }

  bool operator==(const ParsedValues &RHS) const {
    return Elements == RHS.Elements && OriginalInput == RHS.OriginalInput;
  }
};

} // namespace argbind

#endif // ARGBIND_PARSEDVALUES_H
