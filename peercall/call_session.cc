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

#include <utility>

#include "api/units/time_delta.h"
#include "rtc_base/logging.h"

#include "call_session.h"

const char* CallStatusToString(CallStatus status) {
  switch (status) {
    case CallStatus::kIdle: return "Idle";
    case CallStatus::kCalling: return "Calling";
    case CallStatus::kRinging: return "Ringing";
    case CallStatus::kConnecting: return "Connecting";
    case CallStatus::kConnected: return "Connected";
    case CallStatus::kReconnecting: return "Reconnecting";
    case CallStatus::kFailed: return "Failed";
    case CallStatus::kEnded: return "Ended";
  }
  return "Unknown";
}

CallSession::CallSession(std::string local_id,
                         const CallConfig& config,
                         MediaEngine* engine,
                         LocalMediaSource* local_media,
                         SignalingChannel* signaling,
                         webrtc::TaskQueueBase* loop,
                         webrtc::Clock* clock,
                         CallSessionObserver* observer)
    : local_id_(std::move(local_id)),
      config_(config),
      engine_(engine),
      local_media_(local_media),
      signaling_(signaling),
      loop_(loop),
      clock_(clock),
      observer_(observer),
      mesh_(local_id_, config.max_group_members, signaling, this),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()),
      connecting_timer_(loop),
      duration_timer_(loop) {}

CallSession::~CallSession() {
  safety_->SetNotAlive();
  connecting_timer_.Stop();
  duration_timer_.Stop();
  for (auto& entry : links_) {
    entry.second->Close();
  }
  links_.clear();
  if (media_acquired_) {
    local_media_->Release();
  }
}

std::vector<std::string> CallSession::peer_ids() const {
  std::vector<std::string> ids;
  for (const auto& entry : links_) {
    ids.push_back(entry.first);
  }
  return ids;
}

// ---------------------------------------------------------------------------
//  Commands
// ---------------------------------------------------------------------------

std::optional<Error> CallSession::Precheck() const {
  if (status_ != CallStatus::kIdle) {
    return Error{ErrorKind::kAlreadyInCall,
                 std::string("Call in progress (") + CallStatusToString(status_) + ")"};
  }
  if (!signaling_->IsConnected()) {
    return Error{ErrorKind::kSignalingUnavailable, "Signaling channel is down"};
  }
  return std::nullopt;
}

void CallSession::BeginCall(CallKind kind, MediaKind media_kind,
                            const std::string& remote_peer) {
  call_kind_ = kind;
  media_kind_ = media_kind;
  remote_peer_ = remote_peer;
  local_media_state_ = LocalMediaState();
  local_media_state_.video_enabled = media_kind == MediaKind::kVideo;
  started_at_ = clock_->CurrentTime();
  SetStatus(CallStatus::kCalling);
}

Result<CallStatus> CallSession::StartCall(const std::string& target,
                                          MediaKind media_kind) {
  if (auto error = Precheck()) {
    return *error;
  }
  if (target.empty() || target == local_id_) {
    return Error{ErrorKind::kInvalidState, "Invalid call target '" + target + "'"};
  }

  RTC_LOG(LS_INFO) << "Calling " << target << " (" << MediaKindToString(media_kind) << ")";
  BeginCall(CallKind::kDirect, media_kind, target);

  auto error = AcquireMedia(
      [this, target]() -> std::optional<Error> {
        PeerLink* link = CreateLink(target, PeerRole::kOfferer);
        if (!link) {
          return Error{ErrorKind::kNegotiationFailed, "Could not create link to " + target};
        }
        link->StartOffer();
        return std::nullopt;
      },
      nullptr);
  if (error) {
    return *error;
  }
  return status_;
}

Result<CallStatus> CallSession::AcceptIncoming(const IncomingCall& offer) {
  if (auto error = Precheck()) {
    return *error;
  }
  if (!incoming_ || incoming_->peer_id != offer.peer_id) {
    return Error{ErrorKind::kInvalidState, "No incoming call from " + offer.peer_id};
  }

  IncomingCall call = *incoming_;
  std::vector<IceCandidate> candidates;
  candidates.swap(incoming_candidates_);
  incoming_.reset();

  RTC_LOG(LS_INFO) << "Accepting call from " << call.peer_id;
  BeginCall(CallKind::kDirect, call.media_kind, call.peer_id);

  auto error = AcquireMedia(
      [this, call, candidates]() -> std::optional<Error> {
        PeerLink* link = CreateLink(call.peer_id, PeerRole::kAnswerer);
        if (!link) {
          return Error{ErrorKind::kNegotiationFailed, "Could not create link to " + call.peer_id};
        }
        link->HandleOffer(call.sdp, OfferType::kInitial);
        for (const auto& candidate : candidates) {
          link->AddRemoteCandidate(candidate);
        }
        return std::nullopt;
      },
      [this, peer = call.peer_id]() {
        SendToPeer(signaling::CallReject(peer, StatusCodes::kTemporarilyUnavailable));
      });
  if (error) {
    return *error;
  }
  return status_;
}

Result<CallStatus> CallSession::RejectIncoming(const std::string& reason) {
  if (!incoming_) {
    return Error{ErrorKind::kInvalidState, "No incoming call to reject"};
  }
  std::string peer = incoming_->peer_id;
  incoming_.reset();
  incoming_candidates_.clear();
  RTC_LOG(LS_INFO) << "Rejecting call from " << peer;
  SendToPeer(signaling::CallReject(peer, reason.empty() ? StatusCodes::kDeclined : reason));
  return status_;
}

Result<CallStatus> CallSession::JoinGroupCall(const std::string& group_id,
                                              MediaKind media_kind) {
  if (auto error = Precheck()) {
    return *error;
  }
  if (group_id.empty()) {
    return Error{ErrorKind::kInvalidState, "Empty group id"};
  }

  RTC_LOG(LS_INFO) << "Joining group call " << group_id;
  BeginCall(CallKind::kGroup, media_kind, "");

  auto error = AcquireMedia(
      [this, group_id, media_kind]() -> std::optional<Error> {
        auto joined = mesh_.Join(group_id, media_kind);
        if (!joined.ok()) {
          return joined.error();
        }
        return std::nullopt;
      },
      nullptr);
  if (error) {
    return *error;
  }
  return status_;
}

Result<CallStatus> CallSession::EndCall(bool remote_originated) {
  if (status_ == CallStatus::kIdle) {
    return status_;
  }
  RTC_LOG(LS_INFO) << "Ending call" << (remote_originated ? " (remote)" : "");
  Teardown(remote_originated, std::nullopt, CallStatus::kEnded);
  return status_;
}

Result<bool> CallSession::ToggleAudio() {
  if (status_ == CallStatus::kIdle) {
    return Error{ErrorKind::kNoActiveCall, "No active call"};
  }
  local_media_state_.audio_enabled = !local_media_state_.audio_enabled;
  local_media_->SetAudioEnabled(local_media_state_.audio_enabled);
  BroadcastMediaToggle(Msg::kKindAudio, local_media_state_.audio_enabled);
  return local_media_state_.audio_enabled;
}

Result<bool> CallSession::ToggleVideo() {
  if (status_ == CallStatus::kIdle) {
    return Error{ErrorKind::kNoActiveCall, "No active call"};
  }
  local_media_state_.video_enabled = !local_media_state_.video_enabled;
  local_media_->SetVideoEnabled(local_media_state_.video_enabled);
  BroadcastMediaToggle(Msg::kKindVideo, local_media_state_.video_enabled);
  return local_media_state_.video_enabled;
}

Result<bool> CallSession::ToggleScreenShare() {
  if (status_ == CallStatus::kIdle) {
    return Error{ErrorKind::kNoActiveCall, "No active call"};
  }

  if (local_media_state_.screen_sharing) {
    local_media_state_.screen_sharing = false;
    ApplyVideoFeed(media_kind_ == MediaKind::kVideo ? VideoFeed::kCamera : VideoFeed::kNone);
    local_media_->ReleaseScreen();
    BroadcastMediaToggle(Msg::kKindScreen, false);
    return false;
  }

  int generation = call_generation_;
  acquiring_sync_ = true;
  acquire_error_.reset();
  local_media_->AcquireScreen([this, generation, flag = safety_](bool ok) {
    if (!flag->alive() || generation != call_generation_) {
      return;
    }
    if (!ok) {
      Error error{ErrorKind::kMediaAcquisitionFailed, "Could not capture screen"};
      if (acquiring_sync_) {
        acquire_error_ = error;
      } else {
        observer_->OnCallError(error);
      }
      return;
    }
    local_media_state_.screen_sharing = true;
    ApplyVideoFeed(VideoFeed::kScreen);
    BroadcastMediaToggle(Msg::kKindScreen, true);
  });
  acquiring_sync_ = false;
  if (acquire_error_) {
    Error error = *acquire_error_;
    acquire_error_.reset();
    return error;
  }
  return true;
}

Result<bool> CallSession::SwitchDevice(MediaKind kind, const std::string& device_id) {
  if (status_ == CallStatus::kIdle) {
    return Error{ErrorKind::kNoActiveCall, "No active call"};
  }
  if (kind == MediaKind::kVideo && media_kind_ != MediaKind::kVideo) {
    return Error{ErrorKind::kInvalidState, "Audio call has no camera"};
  }
  if (!media_acquired_) {
    return Error{ErrorKind::kInvalidState, "Local media is not open yet"};
  }

  int generation = call_generation_;
  acquiring_sync_ = true;
  acquire_error_.reset();
  local_media_->SwitchDevice(
      kind, device_id, [this, generation, kind, device_id, flag = safety_](bool ok) {
        if (!flag->alive() || generation != call_generation_) {
          return;
        }
        if (!ok) {
          Error error{ErrorKind::kMediaAcquisitionFailed,
                      std::string("Could not switch ") + MediaKindToString(kind) + " to " +
                          device_id};
          if (acquiring_sync_) {
            acquire_error_ = error;
          } else {
            observer_->OnCallError(error);
          }
          return;
        }
        RTC_LOG(LS_INFO) << "Local " << MediaKindToString(kind) << " now from " << device_id;
        if (kind == MediaKind::kAudio) {
          local_media_->SetAudioEnabled(local_media_state_.audio_enabled);
          return;
        }
        local_media_->SetVideoEnabled(local_media_state_.video_enabled);
        if (!local_media_state_.screen_sharing) {
          ApplyVideoFeed(VideoFeed::kCamera);
        }
      });
  acquiring_sync_ = false;
  if (acquire_error_) {
    Error error = *acquire_error_;
    acquire_error_.reset();
    return error;
  }
  return true;
}

void CallSession::ApplyVideoFeed(VideoFeed feed) {
  for (auto& entry : links_) {
    TrackReplaceResult result = entry.second->ReplaceVideoTrack(feed);
    RTC_LOG(LS_VERBOSE) << "Video feed for " << entry.first << ": "
                        << (result == TrackReplaceResult::kReplaced ? "replaced"
                            : result == TrackReplaceResult::kNeedsRenegotiation
                                ? "renegotiating"
                                : "failed");
  }
}

void CallSession::BroadcastMediaToggle(const char* kind, bool enabled) {
  for (const auto& entry : links_) {
    SendToPeer(signaling::CallMediaToggled(entry.first, kind, enabled));
  }
}

// ---------------------------------------------------------------------------
//  Media acquisition
// ---------------------------------------------------------------------------

std::optional<Error> CallSession::AcquireMedia(Continuation next,
                                               std::function<void()> on_failure) {
  int generation = call_generation_;
  acquiring_sync_ = true;
  acquire_error_.reset();
  local_media_->Acquire(
      media_kind_, [this, generation, next, on_failure, flag = safety_](bool ok) {
        if (!flag->alive()) {
          return;
        }
        ContinueAfterAcquire(generation, ok, next, on_failure);
      });
  acquiring_sync_ = false;
  std::optional<Error> error = std::move(acquire_error_);
  acquire_error_.reset();
  return error;
}

void CallSession::ContinueAfterAcquire(int generation, bool ok,
                                       const Continuation& next,
                                       const std::function<void()>& on_failure) {
  if (generation != call_generation_) {
    RTC_LOG(LS_INFO) << "Media acquired for a call that already ended";
    return;
  }

  std::optional<Error> error;
  if (!ok) {
    error = Error{ErrorKind::kMediaAcquisitionFailed,
                  std::string("Could not open local ") + MediaKindToString(media_kind_)};
  } else {
    media_acquired_ = true;
    local_media_->SetAudioEnabled(local_media_state_.audio_enabled);
    local_media_->SetVideoEnabled(local_media_state_.video_enabled);
    error = next();
  }
  if (!error) {
    return;
  }

  RTC_LOG(LS_ERROR) << "Call setup failed: " << *error;
  if (on_failure) {
    on_failure();
  }
  bool sync = acquiring_sync_;
  // Nothing was announced to peers yet, roll back quietly.
  Teardown(true, std::nullopt, CallStatus::kIdle);
  if (sync) {
    acquire_error_ = error;
  } else {
    observer_->OnCallError(*error);
  }
}

// ---------------------------------------------------------------------------
//  Inbound signaling
// ---------------------------------------------------------------------------

void CallSession::HandleSignal(const SignalMessage& message) {
  const std::string& peer = message.peer_id;

  if (message.is(Msg::kCallOffer)) {
    HandleOffer(message);
  } else if (message.is(Msg::kCallAnswer) || message.is(Msg::kCallRenegotiateAnswer)) {
    if (PeerLink* link = FindLink(peer)) {
      link->HandleAnswer(message.GetString("sdp"));
    } else {
      RTC_LOG(LS_WARNING) << "Answer from unknown peer " << peer;
    }
  } else if (message.is(Msg::kCallRenegotiate)) {
    if (PeerLink* link = FindLink(peer)) {
      link->HandleOffer(message.GetString("sdp"), OfferType::kRenegotiate);
    }
  } else if (message.is(Msg::kCallIceCandidate)) {
    IceCandidate candidate = signaling::CandidateFromPayload(message.payload);
    if (PeerLink* link = FindLink(peer)) {
      link->AddRemoteCandidate(candidate);
    } else if (incoming_ && incoming_->peer_id == peer) {
      incoming_candidates_.push_back(candidate);
    } else {
      RTC_LOG(LS_VERBOSE) << "Dropping ICE candidate from " << peer;
    }
  } else if (message.is(Msg::kCallRinging)) {
    if (status_ == CallStatus::kCalling && call_kind_ == CallKind::kDirect &&
        peer == remote_peer_) {
      SetStatus(CallStatus::kRinging);
    }
  } else if (message.is(Msg::kCallReject)) {
    if (status_ != CallStatus::kIdle && call_kind_ == CallKind::kDirect &&
        peer == remote_peer_) {
      std::string reason = message.GetString("reason");
      RTC_LOG(LS_INFO) << peer << " rejected the call: " << reason;
      Teardown(true, Error{ErrorKind::kUserRejected, reason}, CallStatus::kEnded);
    }
  } else if (message.is(Msg::kCallEnd)) {
    HandleCallEnd(message);
  } else if (message.is(Msg::kCallMediaToggled)) {
    if (FindLink(peer)) {
      observer_->OnRemoteMediaToggled(peer, message.GetString("kind"),
                                      message.GetBool("enabled"));
    }
  } else if (message.type.rfind("group.", 0) == 0) {
    HandleGroupMessage(message);
  } else {
    RTC_LOG(LS_VERBOSE) << "CallSession ignoring " << message.type;
  }
}

void CallSession::HandleOffer(const SignalMessage& message) {
  const std::string& peer = message.peer_id;
  std::string sdp = message.GetString("sdp");
  OfferType type = message.GetBool("isReconnect") ? OfferType::kRestart
                                                  : OfferType::kInitial;

  // Group members offer through the mesh.
  if (call_kind_ == CallKind::kGroup && mesh_.joined() && !message.group_id.empty()) {
    if (message.group_id != mesh_.group_id()) {
      RTC_LOG(LS_WARNING) << "Offer for group " << message.group_id
                          << " while in " << mesh_.group_id();
      return;
    }
    auto link = mesh_.LinkForOffer(peer);
    if (!link.ok()) {
      RTC_LOG(LS_WARNING) << "Cannot accept group offer from " << peer << ": "
                          << link.error();
      SendToPeer(signaling::CallReject(peer, StatusCodes::kBusyHere));
      return;
    }
    link.value()->HandleOffer(sdp, type);
    UpdateAggregateStatus();
    return;
  }

  if (status_ != CallStatus::kIdle) {
    if (call_kind_ == CallKind::kDirect && peer == remote_peer_) {
      if (PeerLink* link = FindLink(peer)) {
        link->HandleOffer(sdp, type);
      } else {
        RTC_LOG(LS_WARNING) << "Offer from " << peer << " before our link exists";
      }
      return;
    }
    RTC_LOG(LS_INFO) << "Busy, rejecting call from " << peer;
    SignalMessage reject = signaling::CallReject(peer, StatusCodes::kBusyHere);
    if (!signaling_->Send(reject)) {
      RTC_LOG(LS_WARNING) << "Failed to send busy reject to " << peer;
    }
    return;
  }

  if (!message.group_id.empty()) {
    RTC_LOG(LS_WARNING) << "Group offer from " << peer << " outside a group call";
    return;
  }

  if (incoming_ && incoming_->peer_id != peer) {
    RTC_LOG(LS_INFO) << "Already ringing, rejecting call from " << peer;
    SendToPeer(signaling::CallReject(peer, StatusCodes::kBusyHere));
    return;
  }

  IncomingCall call;
  call.peer_id = peer;
  call.sdp = sdp;
  if (!MediaKindFromString(message.GetString("mediaKind"), &call.media_kind)) {
    call.media_kind = MediaKind::kAudio;
  }
  bool repeated = incoming_.has_value();
  incoming_ = call;
  if (repeated) {
    return;
  }

  RTC_LOG(LS_INFO) << "Incoming " << MediaKindToString(call.media_kind)
                   << " call from " << peer;
  SendToPeer(signaling::CallRinging(peer));
  observer_->OnIncomingCall(call);
}

void CallSession::HandleCallEnd(const SignalMessage& message) {
  const std::string& peer = message.peer_id;
  if (incoming_ && incoming_->peer_id == peer) {
    RTC_LOG(LS_INFO) << peer << " hung up before the call was answered";
    incoming_.reset();
    incoming_candidates_.clear();
    observer_->OnIncomingCallCancelled(peer);
    return;
  }
  if (status_ == CallStatus::kIdle) {
    return;
  }
  if (call_kind_ == CallKind::kDirect && peer == remote_peer_) {
    EndCall(true);
  } else if (call_kind_ == CallKind::kGroup) {
    mesh_.HandlePeerLeft(peer);
    UpdateAggregateStatus();
  }
}

void CallSession::HandleGroupMessage(const SignalMessage& message) {
  if (call_kind_ != CallKind::kGroup || !mesh_.joined()) {
    RTC_LOG(LS_VERBOSE) << "Ignoring " << message.type << " outside a group call";
    return;
  }
  if (!message.group_id.empty() && message.group_id != mesh_.group_id()) {
    RTC_LOG(LS_WARNING) << "Ignoring " << message.type << " for group " << message.group_id;
    return;
  }

  if (message.is(Msg::kGroupExistingPeers)) {
    std::vector<std::string> peers;
    const Json::Value& list = message.payload["peers"];
    if (list.isArray()) {
      for (const auto& peer : list) {
        if (peer.isString()) {
          peers.push_back(peer.asString());
        }
      }
    }
    auto created = mesh_.HandleExistingPeers(peers);
    if (!created.ok()) {
      Teardown(false, created.error(), CallStatus::kFailed);
      return;
    }
    UpdateAggregateStatus();
  } else if (message.is(Msg::kGroupPeerJoined)) {
    auto link = mesh_.HandlePeerJoined(message.peer_id);
    if (!link.ok()) {
      RTC_LOG(LS_WARNING) << "Not linking " << message.peer_id << ": " << link.error();
    }
  } else if (message.is(Msg::kGroupPeerLeft)) {
    mesh_.HandlePeerLeft(message.peer_id);
    UpdateAggregateStatus();
  }
}

// ---------------------------------------------------------------------------
//  Links
// ---------------------------------------------------------------------------

PeerLink* CallSession::CreateLink(const std::string& peer_id, PeerRole role) {
  if (links_.count(peer_id)) {
    return links_[peer_id].get();
  }
  auto link = std::make_unique<PeerLink>(peer_id, local_id_, mesh_.group_id(), role,
                                         media_kind_, engine_, signaling_, loop_,
                                         config_.link, this);
  if (!link->Initialize()) {
    return nullptr;
  }
  PeerLink* raw = link.get();
  links_[peer_id] = std::move(link);
  if (!ever_connected_ && !connecting_timer_.IsRunning()) {
    ArmConnectingTimer();
  }
  return raw;
}

void CallSession::DestroyLink(const std::string& peer_id) {
  auto it = links_.find(peer_id);
  if (it == links_.end()) {
    return;
  }
  it->second->Close();
  RetireLink(std::move(it->second));
  links_.erase(it);
}

PeerLink* CallSession::FindLink(const std::string& peer_id) {
  auto it = links_.find(peer_id);
  return it == links_.end() ? nullptr : it->second.get();
}

void CallSession::RetireLink(std::unique_ptr<PeerLink> link) {
  // May be called from inside the link's own callback.
  loop_->PostTask([link = std::move(link)]() {});
}

void CallSession::OnLinkConnectivityChanged(const std::string& peer_id,
                                            ConnectivityState state) {
  if (!FindLink(peer_id)) {
    return;
  }
  UpdateAggregateStatus();
}

void CallSession::OnLinkFailed(const std::string& peer_id, const Error& error) {
  if (!FindLink(peer_id)) {
    return;
  }
  if (call_kind_ == CallKind::kDirect) {
    Teardown(false, error, CallStatus::kFailed);
    return;
  }
  RTC_LOG(LS_WARNING) << "Dropping " << peer_id << " from group " << mesh_.group_id()
                      << ": " << error;
  mesh_.RemoveMember(peer_id);
  UpdateAggregateStatus();
}

void CallSession::OnLinkRemoteTrack(const std::string& peer_id, const std::string& kind) {
  observer_->OnRemoteTrack(peer_id, kind);
}

void CallSession::UpdateAggregateStatus() {
  if (status_ == CallStatus::kIdle || status_ == CallStatus::kFailed ||
      status_ == CallStatus::kEnded) {
    return;
  }

  bool any_connected = false;
  bool any_active = false;
  for (const auto& entry : links_) {
    const PeerLink& link = *entry.second;
    if (link.is_connected()) {
      any_connected = true;
    } else if (link.connectivity_state() != ConnectivityState::kNew) {
      any_active = true;
    }
  }

  if (any_connected) {
    if (!ever_connected_) {
      OnFirstConnected();
    }
    SetStatus(CallStatus::kConnected);
  } else if (ever_connected_) {
    if (!links_.empty()) {
      SetStatus(CallStatus::kReconnecting);
    }
  } else if (any_active && (status_ == CallStatus::kCalling ||
                            status_ == CallStatus::kRinging)) {
    SetStatus(CallStatus::kConnecting);
  }
}

void CallSession::OnFirstConnected() {
  ever_connected_ = true;
  connecting_timer_.Stop();
  connected_at_ = clock_->CurrentTime();
  duration_seconds_ = 0;
  RTC_LOG(LS_INFO) << "Call connected after "
                   << (*connected_at_ - *started_at_).ms() << " ms";
  ScheduleDurationTick();
}

void CallSession::ScheduleDurationTick() {
  duration_timer_.Start(webrtc::TimeDelta::Seconds(1), [this]() {
    if (status_ == CallStatus::kConnected) {
      ++duration_seconds_;
      observer_->OnCallDuration(duration_seconds_);
    }
    if (ever_connected_) {
      ScheduleDurationTick();
    }
  });
}

void CallSession::ArmConnectingTimer() {
  connecting_timer_.Start(
      webrtc::TimeDelta::Millis(config_.connecting_timeout_ms), [this]() {
        if (ever_connected_ || status_ == CallStatus::kIdle) {
          return;
        }
        RTC_LOG(LS_WARNING) << "Call did not connect within "
                            << config_.connecting_timeout_ms << " ms";
        Teardown(false,
                 Error{ErrorKind::kConnectivityTimeout, "Call did not connect in time"},
                 CallStatus::kFailed);
      });
}

bool CallSession::SendToPeer(SignalMessage message) {
  if (mesh_.joined()) {
    message.group_id = mesh_.group_id();
  }
  if (!signaling_->Send(message)) {
    RTC_LOG(LS_WARNING) << "Failed to send " << message.type << " to " << message.peer_id;
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
//  Teardown
// ---------------------------------------------------------------------------

void CallSession::Teardown(bool remote_originated, const std::optional<Error>& error,
                           CallStatus final_status) {
  if (status_ == CallStatus::kIdle) {
    return;
  }
  ++call_generation_;
  connecting_timer_.Stop();
  duration_timer_.Stop();

  if (!remote_originated) {
    if (call_kind_ == CallKind::kGroup) {
      mesh_.Leave();
    } else if (!remote_peer_.empty()) {
      SendToPeer(signaling::CallEnd(remote_peer_));
    }
  }

  for (auto& entry : links_) {
    entry.second->Close();
    RetireLink(std::move(entry.second));
  }
  links_.clear();

  if (local_media_state_.screen_sharing) {
    local_media_->ReleaseScreen();
  }
  // Also abandons an acquisition still in flight.
  local_media_->Release();
  media_acquired_ = false;

  mesh_.Reset();
  remote_peer_.clear();
  call_kind_ = CallKind::kDirect;
  media_kind_ = MediaKind::kAudio;
  local_media_state_ = LocalMediaState();
  ever_connected_ = false;
  duration_seconds_ = 0;
  started_at_.reset();
  connected_at_.reset();

  SetStatus(final_status);
  if (error) {
    observer_->OnCallError(*error);
  }
  SetStatus(CallStatus::kIdle);
}

void CallSession::SetStatus(CallStatus status) {
  if (status == status_) {
    return;
  }
  RTC_LOG(LS_INFO) << "Call status " << CallStatusToString(status_) << " -> "
                   << CallStatusToString(status);
  status_ = status;
  observer_->OnCallStatusChanged(status);
}
