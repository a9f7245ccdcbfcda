//===- argbind/CommandParser.h - Command-line driver ------------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// CommandParser walks a CommandTree over one argument vector. At each command
// it binds what that command declares, then descends into the subcommand
// named by the input, or into the default subcommand. Whatever the last
// command does not claim is an error.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_COMMANDPARSER_H
#define ARGBIND_COMMANDPARSER_H

#include "argbind/ArgumentDefinition.h"
#include "argbind/Command.h"
#include "argbind/ParsedValues.h"
#include "argbind/ParserError.h"
#include "argbind/SplitArguments.h"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace argbind {

/// Exit codes following <sysexits.h>.
enum ExitCode {
  ExitSuccess = 0,
  ExitFailure = 1,
  ExitUsage = 64 // EX_USAGE
};

/// The outcome of parsing one argument vector.
class ParseResult {
public:
  enum ResultKind {
    Success,
    Failure,
    HelpRequested,
    VersionRequested,
    CompletionRequested
  };

private:
  ResultKind Kind;
  std::vector<const Command *> Stack;
  std::vector<ParsedValues> Values;
  std::optional<ParserError> Err;
  std::string Message;
  ArgumentVisibility HelpVisibility = Visible;

  explicit ParseResult(ResultKind K) : Kind(K) {}

public:
  static ParseResult success(std::vector<const Command *> Stack,
                             std::vector<ParsedValues> Values);
  /// Message is the rendered text of E.
  static ParseResult failure(std::vector<const Command *> Stack,
                             ParserError E, std::string Message);
  static ParseResult helpRequested(std::vector<const Command *> Stack,
                                   ArgumentVisibility Visibility = Visible);
  static ParseResult versionRequested(std::string Version);
  static ParseResult completionRequested(std::string Shell);

  ResultKind getKind() const { return Kind; }
  bool isSuccess() const { return Kind == Success; }
  bool isFailure() const { return Kind == Failure; }

  /// The commands from the root to the one the result is for.
  const std::vector<const Command *> &getCommandStack() const { return Stack; }
  /// One entry per command on the stack, in the same order. Only for
  /// Success.
  const std::vector<ParsedValues> &getValues() const { return Values; }
  /// The values bound by the last command on the stack. Only for Success.
  const ParsedValues &getLastValues() const {
    assert(isSuccess() && "only a successful parse has values");
    return Values.back();
  }

  const std::optional<ParserError> &getError() const { return Err; }
  /// Visible or Hidden, for HelpRequested.
  ArgumentVisibility getHelpVisibility() const { return HelpVisibility; }
  /// For CompletionRequested; empty if no shell was named.
  const std::string &getShell() const { return Message; }
  /// For VersionRequested.
  const std::string &getVersion() const { return Message; }

  /// The error text for Failure, the version for VersionRequested, and empty
  /// otherwise.
  const std::string &getMessage() const { return Message; }
  /// "Error: <message>" followed by a usage hint, for Failure.
  std::string getFullMessage() const;
  /// "root sub"
  std::string getCommandPath() const;

  int getExitCode() const;
};

class CommandParser {
  const CommandTree &Tree;

  ParseResult makeFailure(const std::vector<const Command *> &Stack,
                          ParserError E, const SplitArguments &Split) const;
  std::optional<ParseResult>
  checkBuiltinFlags(const CommandTree &Node,
                    const std::vector<const Command *> &Stack,
                    const SplitArguments &Split) const;
  std::optional<ParseResult>
  checkCompletionRequest(const SplitArguments &Split) const;
  const CommandTree *consumeNextCommand(const CommandTree &Node,
                                        SplitArguments &Split) const;
  std::optional<ParserError>
  checkLeftovers(const SplitArguments &Split) const;

public:
  explicit CommandParser(const CommandTree &Tree) : Tree(Tree) {}

  /// Parses Arguments, which do not include the program name.
  ParseResult parse(std::vector<std::string> Arguments) const;
};

/// Parses argv[1..argc) against Tree.
ParseResult parseCommandLine(int argc, const char *const *argv,
                             const CommandTree &Tree);

/// Builds the tree for Root and parses argv against it. A declaration that
/// fails validation is a fatal error. Errors, help requests and version
/// requests are reported to Errs; if Errs is not set (nullptr by default) they
/// go to stderr or stdout and the program exits with the result's exit code.
/// Returns the result otherwise.
ParseResult parseCommandLineOrExit(int argc, const char *const *argv,
                                   const Command &Root,
                                   std::ostream *Errs = nullptr);

} // namespace argbind

#endif // ARGBIND_COMMANDPARSER_H
