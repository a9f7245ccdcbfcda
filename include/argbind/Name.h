//===- argbind/Name.h - Option names ----------------------------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The three spellings an option or flag can be matched by: "--name", "-n" and
// "-name", and the declarative NameSpecification that expands to them.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_NAME_H
#define ARGBIND_NAME_H

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace argbind {

class Name {
public:
  enum NameKind {
    Long,              // --name
    Short,             // -n
    LongWithSingleDash // -name
  };

private:
  NameKind Kind;
  std::string Value;
  bool AllowingJoined = false;

  Name(NameKind K, std::string V, bool Joined)
      : Kind(K), Value(std::move(V)), AllowingJoined(Joined) {}

public:
  static Name makeLong(std::string_view N) {
    return Name(Long, std::string(N), false);
  }
  static Name makeShort(char C, bool AllowingJoined = false) {
    return Name(Short, std::string(1, C), AllowingJoined);
  }
  static Name makeLongWithSingleDash(std::string_view N) {
    return Name(LongWithSingleDash, std::string(N), false);
  }

  NameKind getKind() const { return Kind; }
  bool isShort() const { return Kind == Short; }
  bool allowsJoined() const { return AllowingJoined; }

  /// The bare name without dashes: "name" for "--name", "n" for "-n".
  const std::string &getValueString() const { return Value; }
  char getShortChar() const { return Value.empty() ? '\0' : Value[0]; }

  /// The name as the user types it, e.g. "--name".
  std::string getSynopsisString() const;

  /// The instance to match against user input. This never has the joined bit
  /// set since that is not something tokenized input can carry.
  Name nameToMatch() const { return Name(Kind, Value, false); }

  bool operator==(const Name &RHS) const {
    return Kind == RHS.Kind && Value == RHS.Value &&
           AllowingJoined == RHS.AllowingJoined;
  }
  bool operator!=(const Name &RHS) const { return !(*this == RHS); }

  // Short names sort before long ones since "-" < "--" in synopsis order.
  bool operator<(const Name &RHS) const {
    return getSynopsisString() < RHS.getSynopsisString();
  }
};

/// Sorts names the way they are preferred in a synopsis: short names first,
/// then single-dash long names, and double-dash long names last.
std::vector<Name> sortedNames(const std::vector<Name> &Names);

/// A declarative description of the names for an argument, expanded against
/// the argument's key when the definition is created.
class NameSpecification {
public:
  struct Element {
    enum ElementKind { Long, CustomLong, Short, CustomShort };

    ElementKind Kind;
    std::string Custom;
    char ShortChar = '\0';
    bool WithSingleDash = false;
    bool AllowingJoined = false;
  };

private:
  std::vector<Element> Elements;

public:
  NameSpecification() = default;
  NameSpecification(std::initializer_list<Element> IL) : Elements(IL) {}

  /// The key converted to kebab-case, with two dashes.
  static Element longName() { return Element{Element::Long, {}, '\0'}; }
  /// The first character of the key, with one dash.
  static Element shortName(bool AllowingJoined = false) {
    Element E{Element::Short, {}, '\0'};
    E.AllowingJoined = AllowingJoined;
    return E;
  }
  static Element customLong(std::string_view N, bool WithSingleDash = false) {
    Element E{Element::CustomLong, std::string(N), '\0'};
    E.WithSingleDash = WithSingleDash;
    return E;
  }
  static Element customShort(char C, bool AllowingJoined = false) {
    Element E{Element::CustomShort, {}, C};
    E.AllowingJoined = AllowingJoined;
    return E;
  }

  NameSpecification &add(Element E) {
    Elements.push_back(std::move(E));
    return *this;
  }

  bool empty() const { return Elements.empty(); }
  const std::vector<Element> &getElements() const { return Elements; }

  /// Expands the specification against the given key. Duplicates are removed,
  /// keeping the first spelling.
  std::vector<Name> makeNames(std::string_view Key) const;

  /// Expands the specification with Prefix added to every long name, as in
  /// "--no-verbose" or "--enable-verbose". Short names are kept only when
  /// IncludingShort is set.
  std::vector<Name> makePrefixedNames(std::string_view Key,
                                      std::string_view Prefix,
                                      bool IncludingShort) const;
};

} // namespace argbind

#endif // ARGBIND_NAME_H
