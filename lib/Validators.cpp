//===-- Validators.cpp - Declaration checks -------------------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/Validators.h"

#include <algorithm>
#include <map>

using namespace argbind;

std::vector<ValidationIssue>
argbind::validateUniqueNames(const ArgumentSet &Args) {
  std::map<std::string, unsigned> CountedNames;
  for (const ArgumentDefinition &A : Args)
    for (const Name &N : A.getNames())
      ++CountedNames[N.getSynopsisString()];

  std::vector<ValidationIssue> Issues;
  for (const auto &[Synopsis, Count] : CountedNames) {
    if (Count < 2)
      continue;
    Issues.push_back({ValidationIssue::DuplicateName,
                      "Multiple (" + std::to_string(Count) +
                          ") `Option` or `Flag` arguments are named \"" +
                          Synopsis + "\".",
                      {Synopsis}});
  }
  return Issues;
}

std::vector<ValidationIssue>
argbind::validatePositionals(const ArgumentSet &Args) {
  const ArgumentDefinition *Repeated = nullptr;
  for (const ArgumentDefinition &A : Args) {
    if (!A.isPositional())
      continue;
    if (!Repeated) {
      if (A.isRepeatingPositional())
        Repeated = &A;
      continue;
    }
    return {{ValidationIssue::MisplacedRepeatingPositional,
             "Can't have a positional argument `" + A.getKey() +
                 "` following an array of positional arguments `" +
                 Repeated->getKey() + "`.",
             {Repeated->getKey(), A.getKey()}}};
  }
  return {};
}

static void collectMissingCodingKeys(const ArgumentSet &Args,
                                     std::vector<ValidationIssue> &Issues) {
  if (const auto &CodingKeys = Args.getCodingKeys()) {
    std::vector<std::string> Missing;
    for (const ArgumentDefinition *A : Args.getOwnDefinitions()) {
      const std::string &Key = A->getKey();
      if (std::find(CodingKeys->begin(), CodingKeys->end(), Key) !=
              CodingKeys->end() ||
          std::find(Missing.begin(), Missing.end(), Key) != Missing.end())
        continue;
      Missing.push_back(Key);
    }

    if (Missing.size() == 1) {
      Issues.push_back({ValidationIssue::MissingCodingKey,
                        "Argument `" + Missing.front() +
                            "` is defined without a corresponding "
                            "`CodingKey`.",
                        Missing});
    } else if (!Missing.empty()) {
      Issues.push_back({ValidationIssue::MissingCodingKey,
                        "Arguments `" + join(Missing, "`,`") +
                            "` are defined without corresponding "
                            "`CodingKey`s.",
                        Missing});
    }
  }

  for (const ArgumentSet &Group : Args.getGroups())
    collectMissingCodingKeys(Group, Issues);
}

std::vector<ValidationIssue>
argbind::validateCodingKeys(const ArgumentSet &Args) {
  std::vector<ValidationIssue> Issues;
  collectMissingCodingKeys(Args, Issues);
  return Issues;
}

std::vector<ValidationIssue>
argbind::validateFlagDefaults(const ArgumentSet &Args) {
  std::vector<std::string> Affected;
  for (const ArgumentDefinition &A : Args) {
    if (!A.isFlag() || A.isComposite() ||
        A.getFlagUpdate() != ArgumentDefinition::SetValue)
      continue;
    const auto &Init = A.getInitialValues();
    if (!Init || Init->size() != 1 || Init->front() != "true")
      continue;
    Affected.push_back(A.getSynopsis());
  }

  if (Affected.empty())
    return {};
  return {{ValidationIssue::NonsensicalDefaultFlag,
           "One or more Boolean flags is declared with an initial value of "
           "`true`. This results in the flag always being `true`, no matter "
           "whether the user specifies the flag or not.\n\n"
           "Affected flag(s):\n" +
               join(Affected, "\n"),
           Affected}};
}

std::vector<ValidationIssue>
argbind::validateArguments(const ArgumentSet &Args) {
  using ValidatorFn = std::vector<ValidationIssue> (*)(const ArgumentSet &);
  static const ValidatorFn Validators[] = {
      &argbind::validateCodingKeys, &argbind::validateUniqueNames,
      &argbind::validateFlagDefaults};

  std::vector<ValidationIssue> Issues = validatePositionals(Args);
  for (ValidatorFn Validator : Validators) {
    std::vector<ValidationIssue> More = Validator(Args);
    Issues.insert(Issues.end(), More.begin(), More.end());
  }
  return Issues;
}

Error argbind::makeValidationError(std::string_view CommandName,
                                   const std::vector<ValidationIssue> &Issues) {
  if (Issues.empty())
    return Error::success();

  std::string Message = "Validation failed for `" + std::string(CommandName) +
                        "`:\n";
  for (const ValidationIssue &Issue : Issues)
    Message += "- " + Issue.Message + "\n";
  return Error(Message);
}
