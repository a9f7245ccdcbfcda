//===-- Command.cpp - Commands and the command tree -----------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/Command.h"
#include "argbind/Validators.h"

#include <algorithm>
#include <deque>
#include <map>

using namespace argbind;

Command::Command(std::string_view CommandName, std::string_view Abstract)
    : CommandName(CommandName), Abstract(Abstract),
      HelpNames({Name::makeShort('h'), Name::makeLong("help")}) {}

static Command makeHelpCommand() {
  Command Help("help", "Show subcommand help information.");
  Help.add(positional(CommandTree::HelpSubcommandsKey, ZeroOrMore,
                      value_desc("subcommands")));
  Help.add(flag("help", names{shortName(), longName()}, Private));
  return Help;
}

static const Command &getHelpCommand() {
  static const Command Help = makeHelpCommand();
  return Help;
}

static Error validateCommand(const Command &C) {
  if (Error E = makeValidationError(C.getName(),
                                    validateArguments(C.getArguments())))
    return E;

  const Command *Default = C.getDefaultSubcommand();
  const std::vector<const Command *> &Subs = C.getSubcommands();
  if (Default && std::find(Subs.begin(), Subs.end(), Default) == Subs.end())
    return Error("Default subcommand `" + Default->getName() + "` of `" +
                 C.getName() + "` is not one of its subcommands.");
  return Error::success();
}

std::unique_ptr<CommandTree> CommandTree::create(const Command &C,
                                                 const CommandTree *Parent) {
  return std::unique_ptr<CommandTree>(new CommandTree(&C, Parent));
}

Error CommandTree::buildChildren(CommandTree &Node,
                                 std::vector<const Command *> &OnPath) {
  const Command &C = *Node.Cmd;
  if (std::find(OnPath.begin(), OnPath.end(), &C) != OnPath.end()) {
    std::string Cycle;
    for (const Command *P : OnPath)
      Cycle += P->getName() + " > ";
    return Error("Command cycle detected: " + Cycle + C.getName());
  }

  if (Error E = validateCommand(C))
    return E;

  OnPath.push_back(&C);
  for (const Command *Sub : C.getSubcommands()) {
    Node.Children.push_back(create(*Sub, &Node));
    if (Error E = buildChildren(*Node.Children.back(), OnPath))
      return E;
  }
  OnPath.pop_back();
  return Error::success();
}

Expected<std::unique_ptr<CommandTree>>
CommandTree::build(const Command &Root) {
  std::unique_ptr<CommandTree> Tree = create(Root, nullptr);
  std::vector<const Command *> OnPath;
  if (Error E = buildChildren(*Tree, OnPath))
    return std::move(E);

  if (!Tree->isLeaf())
    Tree->Children.push_back(create(getHelpCommand(), Tree.get()));
  return std::move(Tree);
}

bool CommandTree::isBuiltinHelp() const { return Cmd == &getHelpCommand(); }

std::vector<std::string> CommandTree::getChildNames() const {
  std::vector<std::string> Names;
  for (const auto &Child : Children)
    Names.push_back(Child->getCommand().getName());
  return Names;
}

const CommandTree *CommandTree::firstChild(std::string_view ChildName) const {
  for (const auto &Child : Children)
    if (Child->getCommand().getName() == ChildName)
      return Child.get();
  return nullptr;
}

const CommandTree *CommandTree::firstChild(const Command &C) const {
  for (const auto &Child : Children)
    if (&Child->getCommand() == &C)
      return Child.get();
  return nullptr;
}

std::vector<const Command *>
CommandTree::commandStack(const std::vector<std::string> &Names) const {
  const CommandTree *Node = this;
  std::vector<const Command *> Result = {Cmd};
  for (const std::string &N : Names) {
    Node = Node->firstChild(N);
    if (!Node)
      break;
    Result.push_back(Node->Cmd);
  }
  return Result;
}

std::vector<const Command *> CommandTree::path(const Command &To) const {
  // Breadth-first, remembering the node each one was first reached from.
  std::map<const CommandTree *, const CommandTree *> CameFrom;
  std::deque<const CommandTree *> ToVisit = {this};
  CameFrom[this] = nullptr;

  while (!ToVisit.empty()) {
    const CommandTree *Current = ToVisit.front();
    ToVisit.pop_front();
    if (Current->Cmd == &To) {
      std::vector<const Command *> Result;
      for (const CommandTree *N = Current; N; N = CameFrom[N])
        Result.push_back(N->Cmd);
      std::reverse(Result.begin(), Result.end());
      return Result;
    }
    for (const auto &Child : Current->Children)
      if (CameFrom.emplace(Child.get(), Current).second)
        ToVisit.push_back(Child.get());
  }
  return {};
}
