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

#include "result.h"

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kMediaAcquisitionFailed:
      return "MediaAcquisitionFailed";
    case ErrorKind::kAlreadyInCall:
      return "AlreadyInCall";
    case ErrorKind::kSignalingUnavailable:
      return "SignalingUnavailable";
    case ErrorKind::kNegotiationFailed:
      return "NegotiationFailed";
    case ErrorKind::kConnectivityTimeout:
      return "ConnectivityTimeout";
    case ErrorKind::kCapacityExceeded:
      return "CapacityExceeded";
    case ErrorKind::kUserRejected:
      return "UserRejected";
    case ErrorKind::kTransferIntegrityMismatch:
      return "TransferIntegrityMismatch";
    case ErrorKind::kTransferTimeout:
      return "TransferTimeout";
    case ErrorKind::kNoActiveCall:
      return "NoActiveCall";
    case ErrorKind::kUnknownTransfer:
      return "UnknownTransfer";
    case ErrorKind::kInvalidState:
      return "InvalidState";
    case ErrorKind::kTransportError:
      return "TransportError";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
  os << ErrorKindToString(error.kind);
  if (!error.message.empty()) {
    os << " (" << error.message << ")";
  }
  return os;
}
