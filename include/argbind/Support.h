//===- argbind/Support.h - Error and stream support utilities ---*- C++ -*-===//
//
// Part of the argbind project, under the Apache License v2.0 with LLVM
// Exceptions. See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Small utilities shared by the argument tokenizer, the binding engine and the
// command tree: a status-style Error, a value-or-Error wrapper, the fatal error
// hook and the diagnostic stream accessors.
//
//===----------------------------------------------------------------------===//

#ifndef ARGBIND_SUPPORT_H
#define ARGBIND_SUPPORT_H

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argbind {

/// Simple error type. A default constructed Error means success.
struct Error {
  std::string Message;
  bool IsError = false;

  Error() = default;
  Error(const std::string &Msg) : Message(Msg), IsError(true) {}
  Error(Error &&Other) noexcept
      : Message(std::move(Other.Message)), IsError(Other.IsError) {
    Other.IsError = false;
  }
  Error &operator=(Error &&Other) noexcept {
    Message = std::move(Other.Message);
    IsError = Other.IsError;
    Other.IsError = false;
    return *this;
  }

  static Error success() { return Error(); }
  explicit operator bool() const { return IsError; }
};

inline std::string toString(Error E) { return std::move(E.Message); }

/// Either a value of type T or the Error that prevented producing one.
template <typename T> class Expected {
  std::optional<T> Val;
  Error Err;

public:
  Expected(T V) : Val(std::move(V)) {}
  Expected(Error E) : Err(std::move(E)) {
    assert(Err && "Expected must not be built from a success value");
  }

  explicit operator bool() const { return Val.has_value(); }
  T &get() { return *Val; }
  const T &get() const { return *Val; }
  T &operator*() { return *Val; }
  const T &operator*() const { return *Val; }
  T *operator->() { return &*Val; }
  const T *operator->() const { return &*Val; }

  /// Moves the error out of this value. Only valid when !*this.
  Error takeError() { return std::move(Err); }
  const std::string &getErrorMessage() const { return Err.Message; }
};

/// Reports an unrecoverable configuration problem and aborts.
[[noreturn]] void report_fatal_error(std::string_view Msg);

/// Stream helpers replacing raw_ostream
inline std::ostream &outs() { return std::cout; }
inline std::ostream &errs() { return std::cerr; }

#define argbind_unreachable(msg)                                               \
  do {                                                                         \
    assert(false && msg);                                                      \
    __builtin_unreachable();                                                   \
  } while (0)

//===----------------------------------------------------------------------===//
// String helpers
//===----------------------------------------------------------------------===//

/// Levenshtein distance between two strings. When MaxEditDistance is non-zero
/// the computation stops early and returns MaxEditDistance + 1 once the
/// distance is known to exceed it.
unsigned editDistance(std::string_view FromArray, std::string_view ToArray,
                      bool AllowReplacements = true,
                      unsigned MaxEditDistance = 0);

inline bool startsWith(std::string_view S, std::string_view Prefix) {
  return S.size() >= Prefix.size() && S.substr(0, Prefix.size()) == Prefix;
}

inline bool consumeFront(std::string_view &S, std::string_view Prefix) {
  if (!startsWith(S, Prefix))
    return false;
  S = S.substr(Prefix.size());
  return true;
}

std::string join(const std::vector<std::string> &Parts,
                 std::string_view Separator);

/// Converts "someArgumentName" to "some-argument-name".
std::string convertToSnakeCase(std::string_view Str, char Separator = '-');

} // namespace argbind

#endif // ARGBIND_SUPPORT_H
