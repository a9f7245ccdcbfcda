//===-- Support.cpp - Error and stream support utilities ------------------===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "argbind/Support.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

using namespace argbind;

void argbind::report_fatal_error(std::string_view Msg) {
  errs() << "FATAL ERROR: " << Msg << "\n";
  errs().flush();
  std::abort();
}

// Levenshtein edit distance (ported from llvm/ADT/edit_distance.h)
unsigned argbind::editDistance(std::string_view FromArray,
                               std::string_view ToArray,
                               bool AllowReplacements,
                               unsigned MaxEditDistance) {
  size_t m = FromArray.size(), n = ToArray.size();

  if (MaxEditDistance) {
    size_t AbsDiff = m > n ? m - n : n - m;
    if (AbsDiff > MaxEditDistance)
      return MaxEditDistance + 1;
  }

  std::vector<unsigned> Row(n + 1);
  for (unsigned i = 1; i <= n; ++i)
    Row[i] = i;

  for (size_t y = 1; y <= m; ++y) {
    Row[0] = static_cast<unsigned>(y);
    unsigned BestThisRow = Row[0];

    unsigned Previous = static_cast<unsigned>(y - 1);
    for (size_t x = 1; x <= n; ++x) {
      unsigned OldRow = Row[x];
      if (AllowReplacements) {
        Row[x] =
            std::min(Previous + (FromArray[y - 1] == ToArray[x - 1] ? 0u : 1u),
                     std::min(Row[x - 1], Row[x]) + 1);
      } else {
        if (FromArray[y - 1] == ToArray[x - 1])
          Row[x] = Previous;
        else
          Row[x] = std::min(Row[x - 1], Row[x]) + 1;
      }
      Previous = OldRow;
      BestThisRow = std::min(BestThisRow, Row[x]);
    }

    if (MaxEditDistance && BestThisRow > MaxEditDistance)
      return MaxEditDistance + 1;
  }

  return Row[n];
}

std::string argbind::join(const std::vector<std::string> &Parts,
                          std::string_view Separator) {
  std::string Result;
  for (size_t I = 0, E = Parts.size(); I != E; ++I) {
    if (I)
      Result.append(Separator);
    Result.append(Parts[I]);
  }
  return Result;
}

std::string argbind::convertToSnakeCase(std::string_view Str, char Separator) {
  std::string Result;
  Result.reserve(Str.size() + 4);
  for (size_t I = 0, E = Str.size(); I != E; ++I) {
    unsigned char C = static_cast<unsigned char>(Str[I]);
    if (std::isupper(C)) {
      // Break before an upper case letter that starts a new word: "fooBar",
      // and the last letter of an acronym followed by a lower case letter:
      // "URLPath" -> "url-path".
      bool PrevLower = I > 0 && (std::islower(static_cast<unsigned char>(
                                     Str[I - 1])) ||
                                 std::isdigit(static_cast<unsigned char>(
                                     Str[I - 1])));
      bool NextLower =
          I + 1 < E && std::islower(static_cast<unsigned char>(Str[I + 1]));
      bool PrevUpper =
          I > 0 && std::isupper(static_cast<unsigned char>(Str[I - 1]));
      if (!Result.empty() && (PrevLower || (PrevUpper && NextLower)))
        Result.push_back(Separator);
      Result.push_back(static_cast<char>(std::tolower(C)));
    } else if (C == '_') {
      Result.push_back(Separator);
    } else {
      Result.push_back(static_cast<char>(C));
    }
  }
  return Result;
}
