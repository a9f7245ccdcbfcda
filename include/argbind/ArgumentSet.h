//===- argbind/ArgumentSet.h - Ordered argument definitions -----*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// An ArgumentSet is the ordered list of definitions a command matches input
// against. Sets nest: an option group is added as a whole and flattened for
// matching, but keeps its own identity for validation.
//
// The factory functions below build definitions from a key and a list of
// modifiers:
//
//   ArgumentSet Args;
//   Args.add(flag("verbose", names{shortName(), longName()}));
//   Args.add(option("count", names{customShort('c')}, init(1)));
//   Args.add(invertibleFlag("color", PrefixedNo, init(true)));
//   Args.add(positional("files", ZeroOrMore));
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_ARGUMENTSET_H
#define ARGBIND_ARGUMENTSET_H

#include "argbind/ArgumentDefinition.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace argbind {

class ArgumentSet {
  std::vector<ArgumentDefinition> Content;
  // Name (as matched) -> position in Content. The first declaration wins.
  std::map<Name, size_t> NamePositions;
  // Positions in Content declared directly on this set, not in a group.
  std::vector<size_t> OwnPositions;
  std::vector<ArgumentSet> Groups;
  std::string Title;
  std::optional<std::vector<std::string>> CodingKeys;

  void append(ArgumentDefinition A, bool Own);

public:
  ArgumentSet() = default;
  ArgumentSet(std::initializer_list<ArgumentDefinition> IL);

  void add(ArgumentDefinition A) { append(std::move(A), /*Own=*/true); }
  /// Adds every definition of Other as if declared here. Used for the
  /// multi-definition flags built by the factories below.
  void add(const ArgumentSet &Other);
  /// Adds an option group. Its definitions are matched as part of this set
  /// and validated as their own set.
  void addGroup(ArgumentSet Group);

  /// The definition matching a parsed name, if any.
  const ArgumentDefinition *first(const Name &N) const;
  /// All definitions bound to Key, in declaration order.
  std::vector<const ArgumentDefinition *>
  definitionsFor(const std::string &Key) const;

  void setTitle(std::string_view T) { Title = std::string(T); }
  const std::string &getTitle() const { return Title; }

  /// The keys a decoder for this set knows about. When set, every key
  /// declared directly on this set has to be listed.
  void setCodingKeys(std::vector<std::string> Keys) {
    CodingKeys = std::move(Keys);
  }
  const std::optional<std::vector<std::string>> &getCodingKeys() const {
    return CodingKeys;
  }

  const std::vector<ArgumentSet> &getGroups() const { return Groups; }
  std::vector<const ArgumentDefinition *> getOwnDefinitions() const;

  using const_iterator = std::vector<ArgumentDefinition>::const_iterator;
  const_iterator begin() const { return Content.begin(); }
  const_iterator end() const { return Content.end(); }
  size_t size() const { return Content.size(); }
  bool empty() const { return Content.empty(); }
  const ArgumentDefinition &operator[](size_t I) const { return Content[I]; }

  /// "--verbose / --count <count> / <files>"
  std::string getDebugDescription() const;
};

//===----------------------------------------------------------------------===//
// Definition factories
//

template <class... Mods>
ArgumentDefinition option(std::string_view Key, const Mods &...Ms) {
  ArgumentDefinition A(ArgumentDefinition::Option, Key);
  apply(&A, Ms...);
  A.done();
  return A;
}

template <class... Mods>
ArgumentDefinition positional(std::string_view Key, const Mods &...Ms) {
  ArgumentDefinition A(ArgumentDefinition::Positional, Key);
  apply(&A, Ms...);
  A.done();
  return A;
}

/// A Boolean flag: "true" when present, "false" by default.
template <class... Mods>
ArgumentDefinition flag(std::string_view Key, const Mods &...Ms) {
  ArgumentDefinition A(ArgumentDefinition::Flag, Key);
  A.setInitialValues({"false"});
  apply(&A, Ms...);
  A.done();
  return A;
}

/// A flag counting its occurrences, as in "-vvv".
template <class... Mods>
ArgumentDefinition counter(std::string_view Key, const Mods &...Ms) {
  ArgumentDefinition A(ArgumentDefinition::Flag, Key);
  A.setFlagUpdate(ArgumentDefinition::Count);
  A.setInitialValues({"0"});
  apply(&A, Ms...);
  A.done();
  return A;
}

/// A Boolean flag with a second spelling that sets it to "false". Without a
/// default one of the two spellings is required. The last spelling given wins
/// unless another exclusivity is applied.
template <class... Mods>
ArgumentSet invertibleFlag(std::string_view Key, FlagInversion Inversion,
                           const Mods &...Ms) {
  ArgumentDefinition Enable(ArgumentDefinition::Flag, Key);
  Enable.setExclusivity(ChooseLast);
  apply(&Enable, Ms...);
  Enable.setComposite(true);
  Enable.done();

  ArgumentDefinition Disable(Enable);
  Disable.setFlagValue("false");
  Disable.clearInitialValues();
  Disable.setNumOccurrencesFlag(Optional);

  const NameSpecification &Spec = Enable.getNameSpecification();
  if (Inversion == PrefixedNo) {
    Disable.setNames(Spec.makePrefixedNames(Key, "no", false));
  } else {
    Enable.setNames(Spec.makePrefixedNames(Key, "enable", true));
    Disable.setNames(Spec.makePrefixedNames(Key, "disable", false));
  }

  ArgumentSet Result;
  Result.add(std::move(Enable));
  Result.add(std::move(Disable));
  return Result;
}

/// One flag per case, all bound to Key: "--red" and "--blue" set "color" to
/// "red" or "blue". The name modifiers are expanded against each case.
template <class... Mods>
ArgumentSet enumerableFlag(std::string_view Key,
                           const std::vector<std::string> &Cases,
                           const Mods &...Ms) {
  ArgumentSet Result;
  for (const std::string &Case : Cases) {
    ArgumentDefinition A(ArgumentDefinition::Flag, Key);
    apply(&A, Ms...);
    A.setComposite(true);
    A.setFlagValue(Case);
    A.done();
    A.setNames(A.getNameSpecification().makeNames(Case));
    Result.add(std::move(A));
  }
  return Result;
}

} // namespace argbind

#endif // ARGBIND_ARGUMENTSET_H
