//===- argbind/ArgumentDefinition.h - Declared arguments --------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares ArgumentDefinition, the immutable description of a single
// positional, option or flag, together with the modifiers used to configure
// one:
//
//   ArgumentDefinition Format =
//       option("format", desc("Output format"), values("json", "text"),
//              init("text"));
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_ARGUMENTDEFINITION_H
#define ARGBIND_ARGUMENTDEFINITION_H

#include "argbind/Name.h"
#include "argbind/Support.h"

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace argbind {

//===----------------------------------------------------------------------===//
// Flags permitted to be passed to argument definitions
//

enum NumOccurrencesFlag { // Flags for the number of values allowed
  Optional = 0x00,        // Zero or one value
  ZeroOrMore = 0x01,      // Zero or more values
  Required = 0x02,        // Exactly one value
  OneOrMore = 0x03        // One or more values
};

enum ArgumentVisibility { // Control whether help shows this argument
  Visible = 0x00,         // Shown in help and help-hidden
  Hidden = 0x01,          // Only shown in help-hidden
  Private = 0x02          // Never shown, never suggested
};

enum ParsingStrategy {
  NextAsValue,       // "--foo bar": attached value or the next value
  ScanningForValue,  // the next value anywhere after the option
  Unconditional,     // the next input, whatever it looks like
  UpToNextOption,    // arrays: values up to the next option
  AllRemainingInput  // arrays: everything after the option or first value
};

enum FlagExclusivity {
  Exclusive,   // Setting a different value twice is an error
  ChooseFirst, // The first value wins
  ChooseLast   // The last value wins
};

enum FlagInversion {
  PrefixedNo,           // --foo / --no-foo
  PrefixedEnableDisable // --enable-foo / --disable-foo
};

enum MiscFlags {
  AllowJoined = 0x01 // Short names accept "-Dvalue"
};

/// Callback run on each raw value. A failed Error rejects the value; its
/// message becomes the reason shown to the user.
using ValueTransform = std::function<Error(std::string_view)>;

class ArgumentDefinition {
public:
  enum ArgumentKind { Positional, Option, Flag };
  enum ArgumentArity { Scalar, Array };
  enum FlagUpdate { SetValue, Count };

private:
  std::string Key;
  ArgumentKind Kind;
  NameSpecification NameSpec;
  std::vector<Name> Names;

  NumOccurrencesFlag Occurrences = Required;
  ArgumentVisibility Visibility = Visible;
  ParsingStrategy Strategy = NextAsValue;
  unsigned Misc = 0;

  std::optional<std::vector<std::string>> InitialValues;
  std::string Abstract;
  std::string ValueName;
  std::vector<std::string> AllowedValues;
  ValueTransform Transform;

  std::string FlagValue = "true";
  FlagUpdate Update = SetValue;
  FlagExclusivity Exclusivity = Exclusive;
  bool Composite = false;

public:
  ArgumentDefinition(ArgumentKind K, std::string_view Key);

  /// Expands the name specification. Called once all modifiers have been
  /// applied.
  void done();
  /// Replaces the expanded names, for definitions whose names do not derive
  /// from their key.
  void setNames(std::vector<Name> N) { Names = std::move(N); }

  const std::string &getKey() const { return Key; }
  ArgumentKind getKind() const { return Kind; }
  bool isPositional() const { return Kind == Positional; }
  bool isOption() const { return Kind == Option; }
  bool isFlag() const { return Kind == Flag; }
  const std::vector<Name> &getNames() const { return Names; }
  const NameSpecification &getNameSpecification() const { return NameSpec; }

  NumOccurrencesFlag getNumOccurrencesFlag() const { return Occurrences; }
  ArgumentVisibility getVisibility() const { return Visibility; }
  ParsingStrategy getParsingStrategy() const { return Strategy; }
  const std::string &getAbstract() const { return Abstract; }
  const std::vector<std::string> &getAllowedValues() const {
    return AllowedValues;
  }
  const std::optional<std::vector<std::string>> &getInitialValues() const {
    return InitialValues;
  }
  const std::string &getFlagValue() const { return FlagValue; }
  FlagUpdate getFlagUpdate() const { return Update; }
  FlagExclusivity getExclusivity() const { return Exclusivity; }
  bool isComposite() const { return Composite; }
  bool allowsJoinedValue() const;

  ArgumentArity getArity() const {
    return (Occurrences == ZeroOrMore || Occurrences == OneOrMore) ? Array
                                                                   : Scalar;
  }
  bool isArray() const { return getArity() == Array; }
  /// Flags never take a value.
  bool isNullary() const { return Kind == Flag; }
  bool isRepeatingPositional() const { return isPositional() && isArray(); }
  /// An argument is optional when it may be left out without a default
  /// filling in for it.
  bool isOptional() const;

  /// The placeholder for the value, e.g. "format" in "--format <format>".
  std::string getValueName() const;
  /// The name shown in messages: the first non-short name, or the first name.
  std::optional<Name> getPreferredName() const;
  /// "<file>", "--format <format>" or "--verbose".
  std::string getSynopsis() const;

  /// Runs the allowed-value check and the transform on a raw value.
  Error checkValue(std::string_view Value) const;

  void setNumOccurrencesFlag(NumOccurrencesFlag N) { Occurrences = N; }
  void setVisibility(ArgumentVisibility V) { Visibility = V; }
  void setParsingStrategy(ParsingStrategy S);
  void setMiscFlag(MiscFlags M) { Misc |= M; }
  void setInitialValues(std::vector<std::string> Vals) {
    InitialValues = std::move(Vals);
  }
  void clearInitialValues() { InitialValues.reset(); }
  void setAbstract(std::string_view S) { Abstract = std::string(S); }
  void setValueName(std::string_view S) { ValueName = std::string(S); }
  void addAllowedValue(std::string_view S) {
    AllowedValues.emplace_back(S);
  }
  void setTransform(ValueTransform T) { Transform = std::move(T); }
  void setNameSpecification(NameSpecification S) { NameSpec = std::move(S); }
  void setFlagValue(std::string_view V) { FlagValue = std::string(V); }
  void setFlagUpdate(FlagUpdate U) { Update = U; }
  void setExclusivity(FlagExclusivity E) { Exclusivity = E; }
  void setComposite(bool C) { Composite = C; }
};

//===----------------------------------------------------------------------===//
// Argument modifiers
//

// Modifier to set the abstract shown in help output.
struct desc {
  std::string_view Desc;

  desc(std::string_view Str) : Desc(Str) {}

  void apply(ArgumentDefinition &A) const { A.setAbstract(Desc); }
};

// Modifier to set the value placeholder, "<file>".
struct value_desc {
  std::string_view Desc;

  value_desc(std::string_view Str) : Desc(Str) {}

  void apply(ArgumentDefinition &A) const { A.setValueName(Desc); }
};

// Specify the default value(s). An argument with a default is optional.
struct initializer {
  std::vector<std::string> Inits;

  explicit initializer(std::vector<std::string> Vals)
      : Inits(std::move(Vals)) {}

  void apply(ArgumentDefinition &A) const { A.setInitialValues(Inits); }
};

inline initializer init(std::string_view Val) {
  return initializer({std::string(Val)});
}
inline initializer init(const char *Val) {
  return initializer({std::string(Val)});
}
inline initializer init(bool Val) {
  return initializer({Val ? "true" : "false"});
}
inline initializer init(int Val) {
  return initializer({std::to_string(Val)});
}
inline initializer list_init(std::vector<std::string> Vals) {
  return initializer(std::move(Vals));
}

// Specify the names the argument is matched by.
struct names {
  NameSpecification Spec;

  names(std::initializer_list<NameSpecification::Element> Elements)
      : Spec(Elements) {}
  names(NameSpecification S) : Spec(std::move(S)) {}

  void apply(ArgumentDefinition &A) const { A.setNameSpecification(Spec); }
};

inline NameSpecification::Element longName() {
  return NameSpecification::longName();
}
inline NameSpecification::Element shortName(bool AllowingJoined = false) {
  return NameSpecification::shortName(AllowingJoined);
}
inline NameSpecification::Element customLong(std::string_view N,
                                              bool WithSingleDash = false) {
  return NameSpecification::customLong(N, WithSingleDash);
}
inline NameSpecification::Element customShort(char C,
                                               bool AllowingJoined = false) {
  return NameSpecification::customShort(C, AllowingJoined);
}

// The values an argument accepts; anything else is rejected before the
// transform runs.
class ValuesClass {
  std::vector<std::string> Values;

public:
  ValuesClass(std::initializer_list<std::string> Vals) : Values(Vals) {}

  void apply(ArgumentDefinition &A) const {
    for (const auto &Value : Values)
      A.addAllowedValue(Value);
  }
};

/// Helper to build a ValuesClass by forwarding a variable number of arguments.
template <typename... ValsTy> ValuesClass values(ValsTy... Vals) {
  return ValuesClass({std::string(Vals)...});
}

// Specify a callback validating or converting each raw value.
struct transform {
  ValueTransform Fn;

  transform(ValueTransform F) : Fn(std::move(F)) {}

  void apply(ArgumentDefinition &A) const { A.setTransform(Fn); }
};

//===----------------------------------------------------------------------===//
// Applicator support
//
template <class Mod> struct applicator {
  template <class Def> static void opt(const Mod &M, Def &D) { M.apply(D); }
};

template <> struct applicator<NumOccurrencesFlag> {
  static void opt(NumOccurrencesFlag N, ArgumentDefinition &D) {
    D.setNumOccurrencesFlag(N);
  }
};

template <> struct applicator<ArgumentVisibility> {
  static void opt(ArgumentVisibility V, ArgumentDefinition &D) {
    D.setVisibility(V);
  }
};

template <> struct applicator<ParsingStrategy> {
  static void opt(ParsingStrategy S, ArgumentDefinition &D) {
    D.setParsingStrategy(S);
  }
};

template <> struct applicator<FlagExclusivity> {
  static void opt(FlagExclusivity E, ArgumentDefinition &D) {
    D.setExclusivity(E);
  }
};

template <> struct applicator<MiscFlags> {
  static void opt(MiscFlags MF, ArgumentDefinition &D) { D.setMiscFlag(MF); }
};

// Apply modifiers to a definition in a type safe way.
template <class Def> void apply(Def *) {}

template <class Def, class Mod, class... Mods>
void apply(Def *D, const Mod &M, const Mods &...Ms) {
  applicator<Mod>::opt(M, *D);
  apply(D, Ms...);
}

} // namespace argbind

#endif // ARGBIND_ARGUMENTDEFINITION_H
