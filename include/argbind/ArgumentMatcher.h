//===- argbind/ArgumentMatcher.h - Binding engine ---------------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// ArgumentMatcher binds the elements of a SplitArguments to the definitions of
// one ArgumentSet. Matching is lenient: options nobody declared are left in
// place for a subcommand to claim, and leftovers are only reported once the
// final command has been reached.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_ARGUMENTMATCHER_H
#define ARGBIND_ARGUMENTMATCHER_H

#include "argbind/ArgumentSet.h"
#include "argbind/ParsedValues.h"
#include "argbind/ParserError.h"
#include "argbind/SplitArguments.h"

#include <optional>
#include <string>
#include <vector>

namespace argbind {

class ArgumentMatcher {
  const ArgumentSet &Arguments;
  // Values naming one of these end the positional input of this command.
  std::vector<std::string> SubcommandNames;

  bool capturesAll() const;
  bool isSubcommandName(const std::string &S) const;
  /// A possible negative number none of whose names is declared.
  bool isNumericValue(const Element &E) const;
  bool isValue(const Element &E) const {
    return E.isValue() || isNumericValue(E);
  }

  void setInitialValues(ParsedValues &Result) const;

  std::optional<ParserError> update(const ArgumentDefinition &A,
                                    const InputOrigin &Origin,
                                    const std::optional<Name> &N,
                                    const std::string &Value,
                                    ParsedValues &Result) const;
  std::optional<ParserError> updateFlag(const ArgumentDefinition &A,
                                        const Index &I,
                                        ParsedValues &Result) const;
  std::optional<ParserError> parseValue(const ArgumentDefinition &A,
                                        const ParsedArgument &Parsed,
                                        const Index &I,
                                        SplitArguments &Input,
                                        ParsedValues &Result,
                                        InputOrigin &Used) const;
  std::optional<ParserError>
  parsePositionalValues(const SplitArguments &Unused,
                        ParsedValues &Result) const;

public:
  explicit ArgumentMatcher(const ArgumentSet &Arguments,
                           std::vector<std::string> SubcommandNames = {})
      : Arguments(Arguments), SubcommandNames(std::move(SubcommandNames)) {}

  /// Binds what this set declares from Split into Result. Split itself is not
  /// modified; call removeUsed with Result's origins to consume the input.
  std::optional<ParserError> lenientParse(const SplitArguments &Split,
                                          ParsedValues &Result) const;

  /// Reports the first key that is required but has no value.
  std::optional<ParserError> checkRequired(const ParsedValues &Values) const;

  /// Removes the elements named by Origin. Consuming one letter of a cluster
  /// also retires the cluster as a whole, but leaves its other letters.
  static void removeUsed(SplitArguments &Split, const InputOrigin &Origin);
};

} // namespace argbind

#endif // ARGBIND_ARGUMENTMATCHER_H
