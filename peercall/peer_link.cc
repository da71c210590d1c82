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

#include "peer_link.h"

const char* ConnectivityStateToString(ConnectivityState state) {
  const char* state_names[] = {
      "new", "checking", "connected", "completed", "disconnected", "failed", "closed"};
  size_t index = static_cast<size_t>(state);
  return index < 7 ? state_names[index] : "unknown";
}

const char* PeerRoleToString(PeerRole role) {
  return role == PeerRole::kOfferer ? "offerer" : "answerer";
}

const char* NegotiationStateToString(NegotiationState state) {
  switch (state) {
    case NegotiationState::kNew: return "New";
    case NegotiationState::kOfferSent: return "OfferSent";
    case NegotiationState::kOfferReceived: return "OfferReceived";
    case NegotiationState::kAnswerSent: return "AnswerSent";
    case NegotiationState::kAnswerReceived: return "AnswerReceived";
    case NegotiationState::kStable: return "Stable";
  }
  return "Unknown";
}

PeerLink::PeerLink(std::string peer_id,
                   std::string local_id,
                   std::string group_id,
                   PeerRole role,
                   MediaKind media_kind,
                   MediaEngine* engine,
                   SignalingChannel* signaling,
                   webrtc::TaskQueueBase* loop,
                   const PeerLinkConfig& config,
                   PeerLinkObserver* observer)
    : peer_id_(std::move(peer_id)),
      local_id_(std::move(local_id)),
      group_id_(std::move(group_id)),
      role_(role),
      media_kind_(media_kind),
      engine_(engine),
      signaling_(signaling),
      config_(config),
      observer_(observer),
      restart_timer_(loop) {}

PeerLink::~PeerLink() {
  Close();
}

bool PeerLink::Initialize() {
  handle_ = engine_->CreatePeer(peer_id_, media_kind_, this);
  if (!handle_) {
    RTC_LOG(LS_ERROR) << "Failed to create peer connection for " << peer_id_;
    return false;
  }
  RTC_LOG(LS_INFO) << "Peer link to " << peer_id_ << " created as "
                   << PeerRoleToString(role_)
                   << (is_polite() ? " (polite)" : " (impolite)");
  return true;
}

void PeerLink::StartOffer() {
  if (closed_ || !handle_) {
    return;
  }
  if (role_ != PeerRole::kOfferer) {
    RTC_LOG(LS_WARNING) << "StartOffer on answerer link to " << peer_id_;
  }
  SendOffer(OfferType::kInitial);
}

void PeerLink::SendOffer(OfferType type) {
  outstanding_offer_ = type;
  negotiation_state_ = NegotiationState::kOfferSent;
  int generation = ++offer_generation_;

  handle_->CreateOffer(
      type == OfferType::kRestart,
      [this, type, generation](webrtc::RTCError error, const std::string& sdp) {
        if (closed_ || generation != offer_generation_) {
          RTC_LOG(LS_INFO) << "Dropping abandoned offer for " << peer_id_;
          return;
        }
        if (!error.ok()) {
          GiveUp(std::string("Failed to create offer: ") + error.message());
          return;
        }
        RTC_LOG(LS_INFO) << "Local offer set for " << peer_id_;

        switch (type) {
          case OfferType::kInitial:
            Send(signaling::CallOffer(peer_id_, sdp, media_kind_, false));
            break;
          case OfferType::kRestart:
            Send(signaling::CallOffer(peer_id_, sdp, media_kind_, true));
            break;
          case OfferType::kRenegotiate:
            Send(signaling::CallRenegotiate(peer_id_, sdp));
            break;
        }
        // Held candidates follow the description they belong to.
        OnLocalDescriptionSet();
      });
}

void PeerLink::HandleOffer(const std::string& sdp, OfferType type) {
  if (closed_ || given_up_) {
    return;
  }

  if (negotiation_state_ == NegotiationState::kOfferSent) {
    // Glare: both sides offered.
    if (!is_polite()) {
      RTC_LOG(LS_INFO) << "Offer collision with " << peer_id_
                       << ", impolite side keeps its own offer";
      return;
    }
    RTC_LOG(LS_INFO) << "Offer collision with " << peer_id_
                     << ", rolling back local offer";
    // A remote restart offer also restarts our side.
    if (outstanding_offer_ == OfferType::kRestart && type != OfferType::kRestart) {
      pending_restart_ = true;
    } else if (outstanding_offer_ == OfferType::kRenegotiate) {
      pending_renegotiation_ = true;
    }
    ++offer_generation_;
  } else if (negotiation_state_ == NegotiationState::kOfferReceived ||
             negotiation_state_ == NegotiationState::kAnswerSent) {
    RTC_LOG(LS_WARNING) << "Ignoring offer from " << peer_id_
                        << " while answering a previous one";
    return;
  }

  ApplyRemoteOffer(sdp, type);
}

void PeerLink::ApplyRemoteOffer(const std::string& sdp, OfferType type) {
  negotiation_state_ = NegotiationState::kOfferReceived;

  handle_->SetRemoteDescription(
      SdpKind::kOffer, sdp, [this, type](webrtc::RTCError error) {
        if (closed_) {
          return;
        }
        if (!error.ok()) {
          GiveUp(std::string("Failed to set remote offer: ") + error.message());
          return;
        }
        RTC_LOG(LS_INFO) << "Remote offer applied for " << peer_id_;
        OnRemoteDescriptionSet();

        handle_->CreateAnswer([this, type](webrtc::RTCError error,
                                           const std::string& sdp) {
          if (closed_) {
            return;
          }
          if (!error.ok()) {
            GiveUp(std::string("Failed to create answer: ") + error.message());
            return;
          }
          negotiation_state_ = NegotiationState::kAnswerSent;
          if (type == OfferType::kRenegotiate) {
            Send(signaling::CallRenegotiateAnswer(peer_id_, sdp));
          } else {
            Send(signaling::CallAnswer(peer_id_, sdp));
          }
          OnLocalDescriptionSet();
          SetStable();
        });
      });
}

void PeerLink::HandleAnswer(const std::string& sdp) {
  if (closed_ || given_up_) {
    return;
  }
  if (negotiation_state_ != NegotiationState::kOfferSent) {
    RTC_LOG(LS_WARNING) << "Unexpected answer from " << peer_id_ << " in state "
                        << NegotiationStateToString(negotiation_state_);
    return;
  }
  negotiation_state_ = NegotiationState::kAnswerReceived;

  handle_->SetRemoteDescription(
      SdpKind::kAnswer, sdp, [this](webrtc::RTCError error) {
        if (closed_) {
          return;
        }
        if (!error.ok()) {
          GiveUp(std::string("Failed to set remote answer: ") + error.message());
          return;
        }
        RTC_LOG(LS_INFO) << "Remote answer applied for " << peer_id_;
        OnRemoteDescriptionSet();
        SetStable();
      });
}

void PeerLink::AddRemoteCandidate(const IceCandidate& candidate) {
  if (closed_) {
    return;
  }
  if (!remote_description_set_) {
    RTC_LOG(LS_VERBOSE) << "Queuing ICE candidate from " << peer_id_
                        << " until remote description is set";
    pending_remote_candidates_.push_back(candidate);
    return;
  }
  if (!handle_->AddRemoteCandidate(candidate)) {
    RTC_LOG(LS_WARNING) << "Failed to add ICE candidate from " << peer_id_;
  }
}

void PeerLink::OnRemoteDescriptionSet() {
  remote_description_set_ = true;
  for (const auto& candidate : pending_remote_candidates_) {
    RTC_LOG(LS_VERBOSE) << "Adding previously queued ICE candidate (mline="
                        << candidate.sdp_mline_index << ")";
    if (!handle_->AddRemoteCandidate(candidate)) {
      RTC_LOG(LS_WARNING) << "Failed to add queued ICE candidate from " << peer_id_;
    }
  }
  pending_remote_candidates_.clear();
}

void PeerLink::OnLocalDescriptionSet() {
  local_description_set_ = true;
  std::vector<IceCandidate> held;
  held.swap(pending_local_candidates_);
  for (const auto& candidate : held) {
    Send(signaling::CallIceCandidate(peer_id_, candidate));
  }
}

void PeerLink::OnLocalCandidate(const IceCandidate& candidate) {
  if (closed_) {
    return;
  }
  if (!local_description_set_) {
    RTC_LOG(LS_VERBOSE) << "Holding local ICE candidate until local description is set";
    pending_local_candidates_.push_back(candidate);
    return;
  }
  Send(signaling::CallIceCandidate(peer_id_, candidate));
}

void PeerLink::SetStable() {
  negotiation_state_ = NegotiationState::kStable;
  MaybeRunPendingNegotiation();
}

void PeerLink::MaybeRunPendingNegotiation() {
  if (closed_ || given_up_ || negotiation_state_ != NegotiationState::kStable) {
    return;
  }
  // A queued restart and a queued track change share one offer.
  if (pending_restart_) {
    pending_restart_ = false;
    pending_renegotiation_ = false;
    RTC_LOG(LS_INFO) << "Running queued ICE restart for " << peer_id_;
    SendOffer(OfferType::kRestart);
  } else if (pending_renegotiation_) {
    pending_renegotiation_ = false;
    RTC_LOG(LS_INFO) << "Running queued renegotiation for " << peer_id_;
    SendOffer(OfferType::kRenegotiate);
  }
}

void PeerLink::RequestRenegotiation() {
  if (closed_ || given_up_) {
    return;
  }
  if (negotiation_state_ != NegotiationState::kStable) {
    RTC_LOG(LS_INFO) << "Renegotiation with " << peer_id_ << " queued, state is "
                     << NegotiationStateToString(negotiation_state_);
    pending_renegotiation_ = true;
    return;
  }
  SendOffer(OfferType::kRenegotiate);
}

void PeerLink::RestartIce() {
  if (closed_ || given_up_) {
    return;
  }
  if (reconnect_attempts_ >= config_.max_reconnect_attempts) {
    GiveUp("Reconnect attempts exhausted (" + std::to_string(reconnect_attempts_) + ")");
    return;
  }
  ++reconnect_attempts_;
  RTC_LOG(LS_INFO) << "ICE restart for " << peer_id_ << ", attempt "
                   << reconnect_attempts_ << "/" << config_.max_reconnect_attempts;

  // Re-offering over our own outstanding restart offer is allowed.
  bool can_offer = negotiation_state_ == NegotiationState::kStable ||
                   (negotiation_state_ == NegotiationState::kOfferSent &&
                    outstanding_offer_ == OfferType::kRestart);
  if (can_offer) {
    SendOffer(OfferType::kRestart);
  } else {
    pending_restart_ = true;
  }
  ArmRestartTimer();
}

void PeerLink::ArmRestartTimer() {
  restart_timer_.Start(webrtc::TimeDelta::Millis(config_.ice_grace_period_ms), [this]() {
    if (!is_connected()) {
      RTC_LOG(LS_WARNING) << "Link to " << peer_id_ << " still not connected";
      RestartIce();
    }
  });
}

TrackReplaceResult PeerLink::ReplaceVideoTrack(VideoFeed feed) {
  if (closed_ || given_up_ || !handle_) {
    return TrackReplaceResult::kFailed;
  }
  TrackReplaceResult result = handle_->ReplaceVideoTrack(feed);
  if (result == TrackReplaceResult::kNeedsRenegotiation) {
    RequestRenegotiation();
  } else if (result == TrackReplaceResult::kFailed) {
    RTC_LOG(LS_ERROR) << "Failed to replace video track for " << peer_id_;
  }
  return result;
}

void PeerLink::OnConnectivityChange(ConnectivityState state) {
  if (closed_ || given_up_) {
    return;
  }
  RTC_LOG(LS_INFO) << "Link " << peer_id_ << " connectivity "
                   << ConnectivityStateToString(connectivity_state_) << " -> "
                   << ConnectivityStateToString(state);

  if (state == ConnectivityState::kClosed) {
    GiveUp("Connection closed by engine");
    return;
  }

  connectivity_state_ = state;
  switch (state) {
    case ConnectivityState::kConnected:
    case ConnectivityState::kCompleted:
      restart_timer_.Stop();
      reconnect_attempts_ = 0;
      pending_restart_ = false;
      break;
    case ConnectivityState::kDisconnected:
      restart_timer_.Start(webrtc::TimeDelta::Millis(config_.ice_grace_period_ms), [this]() {
        if (!is_connected()) {
          RTC_LOG(LS_INFO) << "Grace period over for " << peer_id_;
          RestartIce();
        }
      });
      break;
    default:
      break;
  }

  observer_->OnLinkConnectivityChanged(peer_id_, state);

  if (state == ConnectivityState::kFailed && !closed_) {
    restart_timer_.Stop();
    RestartIce();
  }
}

void PeerLink::OnRemoteTrack(const std::string& kind) {
  if (closed_) {
    return;
  }
  observer_->OnLinkRemoteTrack(peer_id_, kind);
}

void PeerLink::GiveUp(const std::string& reason) {
  if (given_up_ || closed_) {
    return;
  }
  given_up_ = true;
  restart_timer_.Stop();
  connectivity_state_ = ConnectivityState::kFailed;
  RTC_LOG(LS_ERROR) << "Link to " << peer_id_ << " failed: " << reason;
  observer_->OnLinkFailed(peer_id_, Error{ErrorKind::kNegotiationFailed, reason});
}

void PeerLink::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  restart_timer_.Stop();
  pending_remote_candidates_.clear();
  pending_local_candidates_.clear();
  if (handle_) {
    handle_->Close();
    handle_.reset();
  }
  connectivity_state_ = ConnectivityState::kClosed;
  RTC_LOG(LS_INFO) << "Link to " << peer_id_ << " closed";
}

bool PeerLink::Send(SignalMessage message) {
  message.group_id = group_id_;
  if (!signaling_->Send(message)) {
    RTC_LOG(LS_WARNING) << "Failed to send " << message.type << " to " << peer_id_;
    return false;
  }
  return true;
}
