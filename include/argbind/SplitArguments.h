//===- argbind/SplitArguments.h - Argument tokenizer ------------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// SplitArguments turns a raw argument vector into a stream of classified
// elements. Every element is addressed by a stable two-level Index: the
// position in the original input, and for combined short options like "-abc"
// the position of each letter inside the cluster. Removing an element never
// renumbers another one.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_SPLITARGUMENTS_H
#define ARGBIND_SPLITARGUMENTS_H

#include "argbind/Name.h"

#include <cassert>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argbind {

/// A single "-f", "--foo" or "--foo=bar".
class ParsedArgument {
  Name ArgName;
  std::optional<std::string> Value;

public:
  explicit ParsedArgument(Name N) : ArgName(std::move(N)) {}
  ParsedArgument(Name N, std::string V)
      : ArgName(std::move(N)), Value(std::move(V)) {}

  const Name &getName() const { return ArgName; }
  bool hasValue() const { return Value.has_value(); }
  const std::string &getValue() const { return *Value; }

  /// For a single-dash long name without an attached value, the short
  /// options the name could also stand for, with their offsets.
  std::vector<std::pair<unsigned, ParsedArgument>> subarguments() const;

  /// "--foo" or "--foo=bar".
  std::string getDescription() const;

  bool operator==(const ParsedArgument &RHS) const {
    return ArgName == RHS.ArgName && Value == RHS.Value;
  }
};

/// The position within a single input argument. Single-dash options can be
/// read as a whole or as a group of short options; "-vh" is split into the
/// complete "-vh" and the sub-elements "-v" (0) and "-h" (1).
class SubIndex {
  // -1 encodes the complete argument so the natural ordering puts it first.
  int Offset = -1;

  explicit SubIndex(int O) : Offset(O) {}

public:
  SubIndex() = default;

  static SubIndex complete() { return SubIndex(); }
  static SubIndex sub(unsigned N) { return SubIndex(static_cast<int>(N)); }

  bool isComplete() const { return Offset < 0; }
  unsigned getOffset() const {
    assert(!isComplete() && "complete sub-index has no offset");
    return static_cast<unsigned>(Offset);
  }

  bool operator==(const SubIndex &RHS) const { return Offset == RHS.Offset; }
  bool operator!=(const SubIndex &RHS) const { return Offset != RHS.Offset; }
  bool operator<(const SubIndex &RHS) const { return Offset < RHS.Offset; }
};

/// An index into the original input together with its sub-index.
struct Index {
  size_t InputIndex = 0;
  SubIndex Sub;

  Index() = default;
  explicit Index(size_t I, SubIndex S = SubIndex::complete())
      : InputIndex(I), Sub(S) {}

  Index completeIndex() const { return Index(InputIndex); }
  bool isComplete() const { return Sub.isComplete(); }

  /// "3" for a complete index, "3.1" for a sub-index.
  std::string toString() const;

  bool operator==(const Index &RHS) const {
    return InputIndex == RHS.InputIndex && Sub == RHS.Sub;
  }
  bool operator!=(const Index &RHS) const { return !(*this == RHS); }
  bool operator<(const Index &RHS) const {
    if (InputIndex != RHS.InputIndex)
      return InputIndex < RHS.InputIndex;
    return Sub < RHS.Sub;
  }
  bool operator>(const Index &RHS) const { return RHS < *this; }
};

/// One classified unit of the input.
class Element {
public:
  enum ElementKind {
    Value,           // a plain value
    Option,          // an option name, possibly with an attached value
    Terminator,      // the "--" marker
    PossibleNegative // "-5" or "-12": an option name or a negative number
  };

private:
  ElementKind Kind;
  std::string Text; // the value, or the raw input of a PossibleNegative
  std::optional<ParsedArgument> Arg;

  Element(ElementKind K, std::string T, std::optional<ParsedArgument> A)
      : Kind(K), Text(std::move(T)), Arg(std::move(A)) {}

public:
  static Element value(std::string V) {
    return Element(Value, std::move(V), std::nullopt);
  }
  static Element option(ParsedArgument A) {
    return Element(Option, std::string(), std::move(A));
  }
  static Element terminator() {
    return Element(Terminator, std::string(), std::nullopt);
  }
  static Element possibleNegative(std::string Raw, ParsedArgument A) {
    return Element(PossibleNegative, std::move(Raw), std::move(A));
  }

  ElementKind getKind() const { return Kind; }
  bool isValue() const { return Kind == Value; }
  bool isOption() const { return Kind == Option; }
  bool isTerminator() const { return Kind == Terminator; }
  bool isPossibleNegative() const { return Kind == PossibleNegative; }

  /// True for elements that carry an option name: options and possible
  /// negative numbers.
  bool hasParsedArgument() const { return Arg.has_value(); }
  const ParsedArgument &getParsedArgument() const { return *Arg; }

  /// The text of a value, or the raw input of a possible negative number.
  const std::string &getText() const { return Text; }

  std::string getDebugDescription() const;

  bool operator==(const Element &RHS) const {
    return Kind == RHS.Kind && Text == RHS.Text && Arg == RHS.Arg;
  }
};

/// A collection of classified command-line arguments, in input order.
///
/// The arguments ["--foo", "bar"] are split into
/// [0] option(--foo) and [1] value("bar").
class SplitArguments {
public:
  using ElementMap = std::map<Index, Element>;
  using Entry = std::pair<Index, Element>;

private:
  ElementMap Elements;
  std::vector<std::string> OriginalInput;

  ElementMap::iterator firstAfter(const Index &I);
  ElementMap::const_iterator firstAfter(const Index &I) const;

public:
  SplitArguments() = default;

  /// Splits the given input (without the program name). This never fails;
  /// input that cannot be an option name is left for the binding engine to
  /// report.
  explicit SplitArguments(std::vector<std::string> Arguments);

  const std::vector<std::string> &getOriginalInput() const {
    return OriginalInput;
  }
  const std::string &getOriginalInput(const Index &I) const {
    return OriginalInput[I.InputIndex];
  }
  const ElementMap &getElements() const { return Elements; }

  bool empty() const { return Elements.empty(); }
  size_t size() const { return Elements.size(); }
  bool contains(const Index &I) const { return Elements.count(I) != 0; }
  const Element *lookup(const Index &I) const;

  /// False if the arguments are empty or only the "--" terminator remains.
  bool containsNonTerminatorArguments() const;

  /// Whether any remaining option element is spelled with one of Names.
  bool containsAnyOf(const std::vector<Name> &Names) const;

  std::optional<Entry> peekNext() const;
  std::optional<Entry> popNext();

  /// Pops the element at the next input position after I, if it is a value.
  /// Used for "--foo name", and for "-fb name" where name belongs to -f.
  /// IsValue decides whether a possible negative number counts as a value.
  template <typename IsValueFn>
  std::optional<std::pair<Index, std::string>>
  popNextElementIfValue(const Index &I, IsValueFn IsValue);

  /// Pops the first remaining element if it is a value. Stops at anything
  /// else, including the remaining letters of a cluster.
  template <typename IsValueFn>
  std::optional<std::pair<Index, std::string>>
  popNextElementIfValue(IsValueFn IsValue);

  /// Pops the next value anywhere after I. Used for "-f -b name" where name
  /// belongs to -f.
  template <typename IsValueFn>
  std::optional<std::pair<Index, std::string>> popNextValue(const Index &I,
                                                            IsValueFn IsValue);

  /// Pops the next input position after I as a value, whatever it looks like.
  /// The returned text is the original input.
  std::optional<std::pair<Index, std::string>>
  popNextElementAsValue(const Index &I);

  /// The value joined to a short option inside a cluster, e.g. "debug" for the
  /// first letter of "-Ddebug". Only valid for sub-index 0.
  std::optional<std::pair<Index, std::string>>
  extractJoinedElement(const Index &I) const;

  /// Removes the element at I. Removing a complete index also removes all the
  /// sub-elements split from it; removing a sub-index removes only that one.
  void remove(const Index &I);

  /// Removes exactly the element at I, leaving any sub-elements alone.
  void removeExact(const Index &I) { Elements.erase(I); }

  void removeAll(const std::set<Index> &Indices);

  /// The leftover elements for error reporting: complete elements, and sub
  /// elements whose complete element is gone. Terminators are skipped.
  std::vector<std::pair<Index, std::string>> coalescedExtraElements() const;

  /// "[0] --foo [1] 'bar'"
  std::string getDescription() const;
};

template <typename IsValueFn>
std::optional<std::pair<Index, std::string>>
SplitArguments::popNextElementIfValue(const Index &I, IsValueFn IsValue) {
  auto It = firstAfter(I);
  while (It != Elements.end() && !It->first.isComplete())
    ++It;
  if (It == Elements.end() || !IsValue(It->second))
    return std::nullopt;

  Index Found = It->first;
  std::string Value = It->second.getText();
  remove(Found);
  return std::make_pair(Found, std::move(Value));
}

template <typename IsValueFn>
std::optional<std::pair<Index, std::string>>
SplitArguments::popNextElementIfValue(IsValueFn IsValue) {
  auto It = Elements.begin();
  if (It == Elements.end() || !IsValue(It->second))
    return std::nullopt;

  Index Found = It->first;
  std::string Value = It->second.getText();
  remove(Found);
  return std::make_pair(Found, std::move(Value));
}

template <typename IsValueFn>
std::optional<std::pair<Index, std::string>>
SplitArguments::popNextValue(const Index &I, IsValueFn IsValue) {
  for (auto It = firstAfter(I), E = Elements.end(); It != E; ++It) {
    if (!It->first.isComplete() || !IsValue(It->second))
      continue;
    Index Found = It->first;
    std::string Value = It->second.getText();
    remove(Found);
    return std::make_pair(Found, std::move(Value));
  }
  return std::nullopt;
}

} // namespace argbind

#endif // ARGBIND_SPLITARGUMENTS_H
