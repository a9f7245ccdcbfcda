//===- argbind/Validators.h - Declaration checks ----------------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Checks that run once over a declared ArgumentSet, independent of any input.
// A failure here is a programming mistake in the declaration, never bad user
// input.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_VALIDATORS_H
#define ARGBIND_VALIDATORS_H

#include "argbind/ArgumentSet.h"
#include "argbind/Support.h"

#include <string>
#include <string_view>
#include <vector>

namespace argbind {

struct ValidationIssue {
  enum IssueKind {
    DuplicateName,
    MisplacedRepeatingPositional,
    MissingCodingKey,
    NonsensicalDefaultFlag
  };

  IssueKind Kind;
  std::string Message;
  /// The offending names or keys.
  std::vector<std::string> Names;
};

/// Every name used by more than one definition.
std::vector<ValidationIssue> validateUniqueNames(const ArgumentSet &Args);
/// At most one array positional, declared last.
std::vector<ValidationIssue> validatePositionals(const ArgumentSet &Args);
/// Every key declared on the set or one of its groups is listed in that set's
/// coding keys, when it has any.
std::vector<ValidationIssue> validateCodingKeys(const ArgumentSet &Args);
/// Flags defaulting to "true" that have no spelling turning them off.
std::vector<ValidationIssue> validateFlagDefaults(const ArgumentSet &Args);

/// Runs all of the above and returns every issue found.
std::vector<ValidationIssue> validateArguments(const ArgumentSet &Args);

/// Formats issues as "Validation failed for `name`:" followed by one
/// "- issue" line each. Returns success if Issues is empty.
Error makeValidationError(std::string_view CommandName,
                          const std::vector<ValidationIssue> &Issues);

} // namespace argbind

#endif // ARGBIND_VALIDATORS_H
