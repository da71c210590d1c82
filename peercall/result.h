/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#ifndef PEERCALL_RESULT_H_
#define PEERCALL_RESULT_H_

#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "rtc_base/checks.h"

enum class ErrorKind {
  kMediaAcquisitionFailed,
  kAlreadyInCall,
  kSignalingUnavailable,
  kNegotiationFailed,        // retry budget exhausted
  kConnectivityTimeout,
  kCapacityExceeded,
  kUserRejected,
  kTransferIntegrityMismatch,
  kTransferTimeout,
  kNoActiveCall,
  kUnknownTransfer,
  kInvalidState,
  kTransportError,
};

const char* ErrorKindToString(ErrorKind kind);

struct Error {
  ErrorKind kind;
  std::string message;
};

std::ostream& operator<<(std::ostream& os, const Error& error);

// Outcome of a state transition: the new state (or a produced value such as
// a transfer id) on success, an Error otherwise.
template <typename T>
class Result {
 public:
  Result(T value) : value_(std::move(value)) {}
  Result(Error error) : value_(std::move(error)) {}
  Result(ErrorKind kind, std::string message = "")
      : value_(Error{kind, std::move(message)}) {}

  bool ok() const { return std::holds_alternative<T>(value_); }
  explicit operator bool() const { return ok(); }

  const T& value() const {
    RTC_CHECK(ok()) << "value() on failed Result";
    return std::get<T>(value_);
  }
  T& value() {
    RTC_CHECK(ok()) << "value() on failed Result";
    return std::get<T>(value_);
  }

  const Error& error() const {
    RTC_CHECK(!ok()) << "error() on successful Result";
    return std::get<Error>(value_);
  }
  ErrorKind kind() const { return error().kind; }

 private:
  std::variant<T, Error> value_;
};

#endif  // PEERCALL_RESULT_H_
