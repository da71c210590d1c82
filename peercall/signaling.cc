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

#include <memory>

#include "rtc_base/logging.h"

#include "signaling.h"

const char* MediaKindToString(MediaKind kind) {
  return kind == MediaKind::kVideo ? Msg::kKindVideo : Msg::kKindAudio;
}

bool MediaKindFromString(const std::string& name, MediaKind* kind) {
  if (name == Msg::kKindAudio) {
    *kind = MediaKind::kAudio;
    return true;
  }
  if (name == Msg::kKindVideo) {
    *kind = MediaKind::kVideo;
    return true;
  }
  return false;
}

std::string SignalMessage::GetString(const char* key) const {
  if (payload.isMember(key) && payload[key].isString()) {
    return payload[key].asString();
  }
  return std::string();
}

int64_t SignalMessage::GetInt(const char* key, int64_t fallback) const {
  if (payload.isMember(key) && payload[key].isIntegral()) {
    return payload[key].asInt64();
  }
  return fallback;
}

bool SignalMessage::GetBool(const char* key, bool fallback) const {
  if (payload.isMember(key) && payload[key].isBool()) {
    return payload[key].asBool();
  }
  return fallback;
}

std::string EncodeSignal(const SignalMessage& message) {
  Json::Value root;
  root["type"] = message.type;
  root["peerId"] = message.peer_id;
  if (!message.group_id.empty()) {
    root["groupId"] = message.group_id;
  }
  root["payload"] = message.payload;

  Json::StreamWriterBuilder wbuilder;
  wbuilder["indentation"] = "";
  return Json::writeString(wbuilder, root);
}

bool DecodeSignal(const std::string& text, SignalMessage* message) {
  Json::CharReaderBuilder rbuilder;
  std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    RTC_LOG(LS_WARNING) << "Malformed signaling message: " << errs;
    return false;
  }
  if (!root.isObject() || !root.isMember("type") || !root["type"].isString()) {
    RTC_LOG(LS_WARNING) << "Signaling message without type: " << text;
    return false;
  }

  message->type = root["type"].asString();
  message->peer_id = root.isMember("peerId") && root["peerId"].isString()
                         ? root["peerId"].asString()
                         : std::string();
  message->group_id = root.isMember("groupId") && root["groupId"].isString()
                          ? root["groupId"].asString()
                          : std::string();
  if (root.isMember("payload") && root["payload"].isObject()) {
    message->payload = root["payload"];
  } else {
    message->payload = Json::Value(Json::objectValue);
  }
  return true;
}

namespace signaling {

namespace {

SignalMessage Make(const char* type, const std::string& peer_id) {
  SignalMessage message;
  message.type = type;
  message.peer_id = peer_id;
  return message;
}

}  // namespace

SignalMessage CallOffer(const std::string& peer_id, const std::string& sdp,
                        MediaKind media_kind, bool is_reconnect) {
  SignalMessage message = Make(Msg::kCallOffer, peer_id);
  message.payload["sdp"] = sdp;
  message.payload["mediaKind"] = MediaKindToString(media_kind);
  message.payload["isReconnect"] = is_reconnect;
  return message;
}

SignalMessage CallAnswer(const std::string& peer_id, const std::string& sdp) {
  SignalMessage message = Make(Msg::kCallAnswer, peer_id);
  message.payload["sdp"] = sdp;
  return message;
}

SignalMessage CallIceCandidate(const std::string& peer_id,
                               const IceCandidate& candidate) {
  SignalMessage message = Make(Msg::kCallIceCandidate, peer_id);
  message.payload["candidate"] = candidate.candidate;
  message.payload["sdpMid"] = candidate.sdp_mid;
  message.payload["sdpMLineIndex"] = candidate.sdp_mline_index;
  return message;
}

SignalMessage CallRinging(const std::string& peer_id) {
  return Make(Msg::kCallRinging, peer_id);
}

SignalMessage CallReject(const std::string& peer_id, const std::string& reason) {
  SignalMessage message = Make(Msg::kCallReject, peer_id);
  message.payload["reason"] = reason;
  return message;
}

SignalMessage CallEnd(const std::string& peer_id) {
  return Make(Msg::kCallEnd, peer_id);
}

SignalMessage CallRenegotiate(const std::string& peer_id, const std::string& sdp) {
  SignalMessage message = Make(Msg::kCallRenegotiate, peer_id);
  message.payload["sdp"] = sdp;
  return message;
}

SignalMessage CallRenegotiateAnswer(const std::string& peer_id,
                                    const std::string& sdp) {
  SignalMessage message = Make(Msg::kCallRenegotiateAnswer, peer_id);
  message.payload["sdp"] = sdp;
  return message;
}

SignalMessage CallMediaToggled(const std::string& peer_id, const char* kind,
                               bool enabled) {
  SignalMessage message = Make(Msg::kCallMediaToggled, peer_id);
  message.payload["kind"] = kind;
  message.payload["enabled"] = enabled;
  return message;
}

SignalMessage GroupJoin(const std::string& group_id, MediaKind media_kind) {
  SignalMessage message = Make(Msg::kGroupJoin, std::string());
  message.group_id = group_id;
  message.payload["mediaKind"] = MediaKindToString(media_kind);
  return message;
}

SignalMessage GroupLeave(const std::string& group_id) {
  SignalMessage message = Make(Msg::kGroupLeave, std::string());
  message.group_id = group_id;
  return message;
}

SignalMessage TransferRequest(const std::string& peer_id,
                              const std::string& transfer_id,
                              const std::string& file_name,
                              uint64_t file_size,
                              const std::string& mime_type,
                              uint32_t chunk_size,
                              const std::string& sha256) {
  SignalMessage message = Make(Msg::kTransferRequest, peer_id);
  message.payload["transferId"] = transfer_id;
  message.payload["fileName"] = file_name;
  message.payload["fileSize"] = Json::Value::UInt64(file_size);
  message.payload["mimeType"] = mime_type;
  message.payload["chunkSize"] = chunk_size;
  if (!sha256.empty()) {
    message.payload["sha256"] = sha256;
  }
  return message;
}

SignalMessage TransferControl(const char* type, const std::string& peer_id,
                              const std::string& transfer_id) {
  SignalMessage message = Make(type, peer_id);
  message.payload["transferId"] = transfer_id;
  return message;
}

SignalMessage TransferWithReason(const char* type, const std::string& peer_id,
                                 const std::string& transfer_id,
                                 const std::string& reason) {
  SignalMessage message = TransferControl(type, peer_id, transfer_id);
  message.payload["reason"] = reason;
  return message;
}

SignalMessage TransferWithOffset(const char* type, const std::string& peer_id,
                                 const std::string& transfer_id,
                                 uint64_t offset) {
  SignalMessage message = TransferControl(type, peer_id, transfer_id);
  message.payload["offset"] = Json::Value::UInt64(offset);
  return message;
}

IceCandidate CandidateFromPayload(const Json::Value& payload) {
  IceCandidate candidate;
  if (payload.isMember("candidate") && payload["candidate"].isString()) {
    candidate.candidate = payload["candidate"].asString();
  }
  if (payload.isMember("sdpMid") && payload["sdpMid"].isString()) {
    candidate.sdp_mid = payload["sdpMid"].asString();
  }
  if (payload.isMember("sdpMLineIndex") && payload["sdpMLineIndex"].isInt()) {
    candidate.sdp_mline_index = payload["sdpMLineIndex"].asInt();
  }
  return candidate;
}

}  // namespace signaling
