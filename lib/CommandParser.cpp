//===-- CommandParser.cpp - Command-line driver ---------------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/CommandParser.h"
#include "argbind/ArgumentMatcher.h"

#include <cstdlib>

using namespace argbind;

//===----------------------------------------------------------------------===//
// ParseResult
//

ParseResult ParseResult::success(std::vector<const Command *> Stack,
                                 std::vector<ParsedValues> Values) {
  ParseResult R(Success);
  R.Stack = std::move(Stack);
  R.Values = std::move(Values);
  return R;
}

ParseResult ParseResult::failure(std::vector<const Command *> Stack,
                                 ParserError E, std::string Message) {
  ParseResult R(Failure);
  R.Stack = std::move(Stack);
  R.Err = std::move(E);
  R.Message = std::move(Message);
  return R;
}

ParseResult ParseResult::helpRequested(std::vector<const Command *> Stack,
                                       ArgumentVisibility Visibility) {
  ParseResult R(HelpRequested);
  R.Stack = std::move(Stack);
  R.HelpVisibility = Visibility;
  return R;
}

ParseResult ParseResult::versionRequested(std::string Version) {
  ParseResult R(VersionRequested);
  R.Message = std::move(Version);
  return R;
}

ParseResult ParseResult::completionRequested(std::string Shell) {
  ParseResult R(CompletionRequested);
  R.Message = std::move(Shell);
  return R;
}

std::string ParseResult::getCommandPath() const {
  std::vector<std::string> Names;
  for (const Command *C : Stack)
    Names.push_back(C->getName());
  return join(Names, " ");
}

std::string ParseResult::getFullMessage() const {
  if (Kind != Failure)
    return Message;
  return "Error: " + Message + "\nUsage: " + getCommandPath() + " --help";
}

int ParseResult::getExitCode() const {
  switch (Kind) {
  case Success:
  case HelpRequested:
  case VersionRequested:
  case CompletionRequested:
    return ExitSuccess;
  case Failure:
    if (Err && Err->getKind() == ParserError::InvalidState)
      return ExitFailure;
    return ExitUsage;
  }
  argbind_unreachable("unknown parse result kind");
}

//===----------------------------------------------------------------------===//
// CommandParser
//

static const char *const HelpHiddenName = "help-hidden";
static const char *const VersionName = "version";
static const char *const CompletionName = "generate-completion-script";

// A built-in name is only recognized if the command does not declare it.
static bool requestsBuiltin(const Command &C, const SplitArguments &Split,
                            const std::vector<Name> &Names) {
  std::vector<Name> Undeclared;
  for (const Name &N : Names)
    if (!C.getArguments().first(N))
      Undeclared.push_back(N);
  return !Undeclared.empty() && Split.containsAnyOf(Undeclared);
}

ParseResult
CommandParser::makeFailure(const std::vector<const Command *> &Stack,
                           ParserError E, const SplitArguments &Split) const {
  // Suggestions and value names come from every command on the stack.
  ArgumentSet Arguments;
  for (const Command *C : Stack)
    Arguments.add(C->getArguments());
  std::string Message =
      ErrorMessageGenerator(Arguments, Split.getOriginalInput())
          .makeErrorMessage(E);
  return ParseResult::failure(Stack, std::move(E), std::move(Message));
}

std::optional<ParseResult>
CommandParser::checkBuiltinFlags(const CommandTree &Node,
                                 const std::vector<const Command *> &Stack,
                                 const SplitArguments &Split) const {
  const Command &C = Node.getCommand();
  if (requestsBuiltin(C, Split, C.getHelpNames()))
    return ParseResult::helpRequested(Stack);
  if (requestsBuiltin(C, Split, {Name::makeLong(HelpHiddenName)}))
    return ParseResult::helpRequested(Stack, Hidden);

  // The innermost command with a version answers "--version".
  std::string Version;
  for (const Command *S : Stack)
    if (!S->getVersion().empty())
      Version = S->getVersion();
  if (!Version.empty() &&
      requestsBuiltin(C, Split, {Name::makeLong(VersionName)}))
    return ParseResult::versionRequested(Version);
  return std::nullopt;
}

std::optional<ParseResult>
CommandParser::checkCompletionRequest(const SplitArguments &Split) const {
  Name Completion = Name::makeLong(CompletionName);
  if (Tree.getCommand().getArguments().first(Completion))
    return std::nullopt;

  for (const auto &[I, E] : Split.getElements()) {
    if (!E.isOption() || E.getParsedArgument().getName() != Completion)
      continue;
    const ParsedArgument &Parsed = E.getParsedArgument();
    if (Parsed.hasValue())
      return ParseResult::completionRequested(Parsed.getValue());
    const Element *Next = Split.lookup(Index(I.InputIndex + 1));
    if (Next && Next->isValue())
      return ParseResult::completionRequested(Next->getText());
    return ParseResult::completionRequested(std::string());
  }
  return std::nullopt;
}

const CommandTree *
CommandParser::consumeNextCommand(const CommandTree &Node,
                                  SplitArguments &Split) const {
  // Only the first value left over by the parent can name a subcommand.
  // Options the parent did not claim may come before it.
  for (const auto &[I, E] : Split.getElements()) {
    if (E.isTerminator())
      return nullptr;
    if (!I.isComplete() || !E.isValue())
      continue;
    const CommandTree *Child = Node.firstChild(E.getText());
    if (Child)
      Split.remove(I);
    return Child;
  }
  return nullptr;
}

std::optional<ParserError>
CommandParser::checkLeftovers(const SplitArguments &Split) const {
  for (const auto &[I, E] : Split.getElements()) {
    if (!E.isOption())
      continue;
    // The letters of an unclaimed negative number are not options.
    if (!I.isComplete()) {
      const Element *Whole = Split.lookup(I.completeIndex());
      if (Whole && Whole->isPossibleNegative())
        continue;
    }
    return ParserError::unknownOption(I, E.getParsedArgument().getName());
  }

  std::vector<std::pair<Index, std::string>> Extra =
      Split.coalescedExtraElements();
  if (!Extra.empty())
    return ParserError::unexpectedExtraValues(std::move(Extra));
  return std::nullopt;
}

ParseResult CommandParser::parse(std::vector<std::string> Arguments) const {
  SplitArguments Split(std::move(Arguments));
  std::vector<const Command *> Stack = {&Tree.getCommand()};
  std::vector<ParsedValues> AllValues;

  if (std::optional<ParseResult> R = checkCompletionRequest(Split))
    return *R;

  const CommandTree *Node = &Tree;
  while (true) {
    const Command &C = Node->getCommand();
    ArgumentMatcher Matcher(C.getArguments(), Node->getChildNames());

    ParsedValues Values;
    std::optional<ParserError> Err = Matcher.lenientParse(Split, Values);
    if (!Err)
      Err = Matcher.checkRequired(Values);
    if (Err) {
      // "tool build --help" asks for help even if build is missing input.
      if (std::optional<ParseResult> R = checkBuiltinFlags(*Node, Stack, Split))
        return *R;
      return makeFailure(Stack, std::move(*Err), Split);
    }

    ArgumentMatcher::removeUsed(Split, Values.getUsedOrigins());
    AllValues.push_back(std::move(Values));

    if (const CommandTree *Next = consumeNextCommand(*Node, Split)) {
      Node = Next;
      Stack.push_back(&Node->getCommand());
      continue;
    }

    if (std::optional<ParseResult> R = checkBuiltinFlags(*Node, Stack, Split))
      return *R;

    if (const Command *Default = C.getDefaultSubcommand()) {
      Node = Node->firstChild(*Default);
      if (!Node)
        return makeFailure(Stack, ParserError::invalidState(), Split);
      Stack.push_back(&Node->getCommand());
      continue;
    }
    break;
  }

  if (std::optional<ParserError> Err = checkLeftovers(Split))
    return makeFailure(Stack, std::move(*Err), Split);

  if (Node->isBuiltinHelp())
    return ParseResult::helpRequested(Tree.commandStack(
        AllValues.back().getValues(CommandTree::HelpSubcommandsKey)));

  return ParseResult::success(std::move(Stack), std::move(AllValues));
}

//===----------------------------------------------------------------------===//
// Drivers
//

ParseResult argbind::parseCommandLine(int argc, const char *const *argv,
                                      const CommandTree &Tree) {
  std::vector<std::string> Arguments;
  for (int I = 1; I < argc; ++I)
    Arguments.emplace_back(argv[I]);
  return CommandParser(Tree).parse(std::move(Arguments));
}

// "USAGE: tool build [--verbose] <file>"
static std::string usageLine(const ParseResult &R) {
  std::string Usage = "USAGE: " + R.getCommandPath();
  const Command *Last = R.getCommandStack().back();
  for (const ArgumentDefinition &A : Last->getArguments()) {
    if (A.getVisibility() == Private ||
        (A.getVisibility() == Hidden && R.getHelpVisibility() != Hidden))
      continue;
    std::string Synopsis = A.getSynopsis();
    if (A.isRepeatingPositional())
      Synopsis += " ...";
    Usage += A.isOptional() ? " [" + Synopsis + "]" : " " + Synopsis;
  }
  return Usage;
}

ParseResult argbind::parseCommandLineOrExit(int argc,
                                            const char *const *argv,
                                            const Command &Root,
                                            std::ostream *Errs) {
  Expected<std::unique_ptr<CommandTree>> Tree = CommandTree::build(Root);
  if (!Tree)
    report_fatal_error(toString(Tree.takeError()));

  ParseResult R = parseCommandLine(argc, argv, **Tree);
  bool ExitOnResult = !Errs;
  std::ostream &Out = Errs ? *Errs : outs();
  std::ostream &Diag = Errs ? *Errs : errs();
  std::string ProgramName = argc > 0 ? argv[0] : Root.getName();

  switch (R.getKind()) {
  case ParseResult::Success:
  case ParseResult::CompletionRequested:
    return R;
  case ParseResult::Failure:
    Diag << ProgramName << ": " << R.getFullMessage() << '\n';
    break;
  case ParseResult::HelpRequested: {
    const Command *Last = R.getCommandStack().back();
    if (!Last->getAbstract().empty())
      Out << "OVERVIEW: " << Last->getAbstract() << "\n\n";
    Out << usageLine(R) << '\n';
    break;
  }
  case ParseResult::VersionRequested:
    Out << R.getVersion() << '\n';
    break;
  }

  if (ExitOnResult)
    std::exit(R.getExitCode());
  return R;
}
