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

#ifndef PEERCALL_SIGNALING_H_
#define PEERCALL_SIGNALING_H_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <json/json.h>

#include "status.h"

enum class MediaKind { kAudio, kVideo };

const char* MediaKindToString(MediaKind kind);
bool MediaKindFromString(const std::string& name, MediaKind* kind);

// One control message on the signaling bus. `peer_id` names the remote
// party: the target when sending, the origin when received.
struct SignalMessage {
  std::string type;
  std::string peer_id;
  std::string group_id;
  Json::Value payload{Json::objectValue};

  bool is(const char* msg_type) const { return type == msg_type; }
  std::string GetString(const char* key) const;
  int64_t GetInt(const char* key, int64_t fallback = 0) const;
  bool GetBool(const char* key, bool fallback = false) const;
};

// Connectivity candidate as relayed between peers.
struct IceCandidate {
  std::string sdp_mid;
  int sdp_mline_index = 0;
  std::string candidate;
};

// JSON wire form: {"type", "peerId", "groupId"?, "payload"}.
std::string EncodeSignal(const SignalMessage& message);
bool DecodeSignal(const std::string& text, SignalMessage* message);

// Best-effort, ordered-per-peer bus. Inbound messages are delivered to the
// handler on the owner's event loop.
class SignalingChannel {
 public:
  using MessageHandler = std::function<void(const SignalMessage&)>;

  virtual ~SignalingChannel() = default;

  virtual bool IsConnected() const = 0;
  virtual bool Send(const SignalMessage& message) = 0;
  virtual void SetMessageHandler(MessageHandler handler) = 0;
};

// Builders for the message catalog.
namespace signaling {

SignalMessage CallOffer(const std::string& peer_id, const std::string& sdp,
                        MediaKind media_kind, bool is_reconnect);
SignalMessage CallAnswer(const std::string& peer_id, const std::string& sdp);
SignalMessage CallIceCandidate(const std::string& peer_id,
                               const IceCandidate& candidate);
SignalMessage CallRinging(const std::string& peer_id);
SignalMessage CallReject(const std::string& peer_id, const std::string& reason);
SignalMessage CallEnd(const std::string& peer_id);
SignalMessage CallRenegotiate(const std::string& peer_id, const std::string& sdp);
SignalMessage CallRenegotiateAnswer(const std::string& peer_id,
                                    const std::string& sdp);
SignalMessage CallMediaToggled(const std::string& peer_id, const char* kind,
                               bool enabled);

SignalMessage GroupJoin(const std::string& group_id, MediaKind media_kind);
SignalMessage GroupLeave(const std::string& group_id);

SignalMessage TransferRequest(const std::string& peer_id,
                              const std::string& transfer_id,
                              const std::string& file_name,
                              uint64_t file_size,
                              const std::string& mime_type,
                              uint32_t chunk_size,
                              const std::string& sha256);
SignalMessage TransferControl(const char* type, const std::string& peer_id,
                              const std::string& transfer_id);
SignalMessage TransferWithReason(const char* type, const std::string& peer_id,
                                 const std::string& transfer_id,
                                 const std::string& reason);
SignalMessage TransferWithOffset(const char* type, const std::string& peer_id,
                                 const std::string& transfer_id,
                                 uint64_t offset);

IceCandidate CandidateFromPayload(const Json::Value& payload);

}  // namespace signaling

#endif  // PEERCALL_SIGNALING_H_
