//===- argbind/Command.h - Commands and the command tree --------*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A Command is the static declaration of one level of a command-line
// interface: its arguments, its subcommands and the built-in flags it answers
// to. Commands refer to their subcommands by pointer and are expected to
// outlive every tree built from them:
//
//   static Command Build("build", "Build the project");
//   static Command Tool("tool");
//   Tool.addSubcommand(Build);
//
// A CommandTree is built once from a root Command. Building validates every
// declaration and rejects cycles, so a tree that exists is safe to parse with.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_COMMAND_H
#define ARGBIND_COMMAND_H

#include "argbind/ArgumentSet.h"
#include "argbind/Name.h"
#include "argbind/Support.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace argbind {

class Command {
  std::string CommandName;
  std::string Abstract;
  std::string Version;
  std::vector<Name> HelpNames;
  ArgumentSet Arguments;
  std::vector<const Command *> Subcommands;
  const Command *DefaultSubcommand = nullptr;

public:
  explicit Command(std::string_view CommandName,
                   std::string_view Abstract = "");

  const std::string &getName() const { return CommandName; }
  const std::string &getAbstract() const { return Abstract; }

  /// A non-empty version enables "--version".
  void setVersion(std::string_view V) { Version = std::string(V); }
  const std::string &getVersion() const { return Version; }

  /// The names requesting help for this command. "-h" and "--help" unless
  /// replaced.
  void setHelpNames(std::vector<Name> N) { HelpNames = std::move(N); }
  const std::vector<Name> &getHelpNames() const { return HelpNames; }

  void add(ArgumentDefinition A) { Arguments.add(std::move(A)); }
  void add(const ArgumentSet &Set) { Arguments.add(Set); }
  void addGroup(ArgumentSet Group) { Arguments.addGroup(std::move(Group)); }
  const ArgumentSet &getArguments() const { return Arguments; }

  void setCodingKeys(std::vector<std::string> Keys) {
    Arguments.setCodingKeys(std::move(Keys));
  }

  void addSubcommand(const Command &C) { Subcommands.push_back(&C); }
  const std::vector<const Command *> &getSubcommands() const {
    return Subcommands;
  }

  /// The subcommand to descend into when no subcommand is named. It has to be
  /// one of the subcommands.
  void setDefaultSubcommand(const Command &C) { DefaultSubcommand = &C; }
  const Command *getDefaultSubcommand() const { return DefaultSubcommand; }
};

class CommandTree {
  const Command *Cmd;
  const CommandTree *Parent;
  std::vector<std::unique_ptr<CommandTree>> Children;

  CommandTree(const Command *C, const CommandTree *P)
      : Cmd(C), Parent(P) {}

  static std::unique_ptr<CommandTree> create(const Command &C,
                                             const CommandTree *Parent);

  static Error buildChildren(CommandTree &Node,
                             std::vector<const Command *> &OnPath);

public:
  /// The key the built-in help command binds the requested command names to.
  static constexpr const char *HelpSubcommandsKey = "subcommands";

  /// Builds and validates the tree rooted at Root. A tree that is not a leaf
  /// gets a built-in "help" subcommand, shared by every tree and never
  /// destroyed, so results referring to it outlive the tree.
  static Expected<std::unique_ptr<CommandTree>> build(const Command &Root);

  const Command &getCommand() const { return *Cmd; }
  const CommandTree *getParent() const { return Parent; }
  bool isRoot() const { return Parent == nullptr; }
  bool isLeaf() const { return Children.empty(); }
  /// True for the "help" subcommand added by build().
  bool isBuiltinHelp() const;

  const std::vector<std::unique_ptr<CommandTree>> &getChildren() const {
    return Children;
  }
  std::vector<std::string> getChildNames() const;

  const CommandTree *firstChild(std::string_view ChildName) const;
  const CommandTree *firstChild(const Command &C) const;

  /// The commands named by Names, starting with this node's command. Stops at
  /// the first name that is not a subcommand.
  std::vector<const Command *>
  commandStack(const std::vector<std::string> &Names) const;

  /// The commands from this node to the first node (breadth-first) declaring
  /// To, or an empty list if there is none.
  std::vector<const Command *> path(const Command &To) const;
};

} // namespace argbind

#endif // ARGBIND_COMMAND_H
