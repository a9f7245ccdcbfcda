//===- argbind/ParserError.h - User-facing parse errors ---------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_PARSERERROR_H
#define ARGBIND_PARSERERROR_H

#include "argbind/ArgumentSet.h"
#include "argbind/ParsedValues.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace argbind {

/// A failure to bind user input. These are data, not exceptions: the binding
/// engine returns one and the driver turns it into a message.
class ParserError {
public:
  enum ErrorKind {
    UnknownOption,            // "--nme"
    MissingValueForOption,    // "--format" with nothing after it
    NoValue,                  // a required argument was not given
    UnexpectedExtraValues,    // leftover input
    DuplicateExclusiveValues, // two exclusive flags for one value
    UnableToParseValue,       // rejected by allowed values or transform
    UnexpectedValueForOption, // "--verbose=yes"
    InvalidState              // internal inconsistency
  };

  using ExtraValue = std::pair<Index, std::string>;

private:
  ErrorKind Kind;
  InputOrigin Origin;
  InputOrigin Previous;
  std::optional<Name> ArgName;
  std::string Value;
  std::string Key;
  std::string Reason;
  std::vector<ExtraValue> ExtraValues;

  explicit ParserError(ErrorKind K) : Kind(K) {}

public:
  static ParserError unknownOption(const Index &I, Name N);
  static ParserError missingValueForOption(InputOrigin O, Name N);
  static ParserError noValue(std::string Key);
  static ParserError unexpectedExtraValues(std::vector<ExtraValue> Values);
  static ParserError duplicateExclusiveValues(InputOrigin Previous,
                                              InputOrigin Duplicate);
  static ParserError unableToParseValue(InputOrigin O, std::optional<Name> N,
                                        std::string Value, std::string Key,
                                        std::string Reason);
  static ParserError unexpectedValueForOption(const Index &I, Name N,
                                              std::string Value);
  static ParserError invalidState();

  ErrorKind getKind() const { return Kind; }
  /// Where the error happened. For duplicates, the second occurrence.
  const InputOrigin &getOrigin() const { return Origin; }
  /// For duplicates, where the value had been set first.
  const InputOrigin &getPrevious() const { return Previous; }
  const std::optional<Name> &getName() const { return ArgName; }
  const std::string &getValue() const { return Value; }
  const std::string &getKey() const { return Key; }
  const std::string &getReason() const { return Reason; }
  const std::vector<ExtraValue> &getExtraValues() const { return ExtraValues; }
};

/// Renders a ParserError against the arguments of the command stack it was
/// raised for.
class ErrorMessageGenerator {
  const ArgumentSet &Arguments;
  const std::vector<std::string> &OriginalInput;

  std::string unknownOptionMessage(const Name &N) const;
  std::string missingValueForOptionMessage(const Name &N) const;
  std::string noValueMessage(const std::string &Key) const;
  std::string unexpectedExtraValuesMessage(
      const std::vector<ParserError::ExtraValue> &Values) const;
  std::string
  duplicateExclusiveValuesMessage(const InputOrigin &Previous,
                                  const InputOrigin &Duplicate) const;
  std::string unableToParseValueMessage(const ParserError &E) const;

  std::optional<std::string> valueName(const Name &N) const;
  std::string elementString(const InputOrigin &O) const;

public:
  ErrorMessageGenerator(const ArgumentSet &Arguments,
                        const std::vector<std::string> &OriginalInput)
      : Arguments(Arguments), OriginalInput(OriginalInput) {}

  std::string makeErrorMessage(const ParserError &E) const;
};

} // namespace argbind

#endif // ARGBIND_PARSERERROR_H
