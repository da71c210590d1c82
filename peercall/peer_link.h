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

#ifndef PEERCALL_PEER_LINK_H_
#define PEERCALL_PEER_LINK_H_

#include <memory>
#include <string>
#include <vector>

#include "api/task_queue/task_queue_base.h"

#include "config.h"
#include "media_engine.h"
#include "result.h"
#include "signaling.h"
#include "timer.h"

enum class PeerRole { kOfferer, kAnswerer };

enum class NegotiationState {
  kNew,
  kOfferSent,
  kOfferReceived,
  kAnswerSent,
  kAnswerReceived,
  kStable,
};

// How an inbound or outbound offer is carried on the wire.
enum class OfferType {
  kInitial,      // call.offer
  kRestart,      // call.offer{isReconnect:true}
  kRenegotiate,  // call.renegotiate
};

const char* PeerRoleToString(PeerRole role);
const char* NegotiationStateToString(NegotiationState state);

class PeerLinkObserver {
 public:
  virtual ~PeerLinkObserver() = default;

  virtual void OnLinkConnectivityChanged(const std::string& peer_id,
                                         ConnectivityState state) = 0;
  // The link gave up: retry budget exhausted or the engine closed it. The
  // link is unusable afterwards and should be removed.
  virtual void OnLinkFailed(const std::string& peer_id, const Error& error) = 0;
  virtual void OnLinkRemoteTrack(const std::string& peer_id,
                                 const std::string& kind) {}
};

// Negotiation and reconnection state machine for one remote participant.
// Lives on the owner's event loop; every method must be called there.
class PeerLink : public PeerHandleObserver {
 public:
  PeerLink(std::string peer_id,
           std::string local_id,
           std::string group_id,
           PeerRole role,
           MediaKind media_kind,
           MediaEngine* engine,
           SignalingChannel* signaling,
           webrtc::TaskQueueBase* loop,
           const PeerLinkConfig& config,
           PeerLinkObserver* observer);
  ~PeerLink() override;

  PeerLink(const PeerLink&) = delete;
  PeerLink& operator=(const PeerLink&) = delete;

  // Creates the media-engine handle. Must succeed before anything else.
  bool Initialize();

  // Offerer only: produce and send the first offer.
  void StartOffer();

  void HandleOffer(const std::string& sdp, OfferType type);
  void HandleAnswer(const std::string& sdp);
  void AddRemoteCandidate(const IceCandidate& candidate);

  // Track swap needing a new offer/answer cycle. Queued until stable.
  void RequestRenegotiation();
  // Fresh offer with restart semantics. Counts against the retry budget.
  void RestartIce();

  // Swaps the outgoing video feed; renegotiates when the engine asks for it.
  TrackReplaceResult ReplaceVideoTrack(VideoFeed feed);

  // Cancels timers and closes the handle. Later events are ignored.
  void Close();

  const std::string& peer_id() const { return peer_id_; }
  PeerRole role() const { return role_; }
  NegotiationState negotiation_state() const { return negotiation_state_; }
  ConnectivityState connectivity_state() const { return connectivity_state_; }
  int reconnect_attempts() const { return reconnect_attempts_; }
  size_t pending_candidate_count() const { return pending_remote_candidates_.size(); }
  bool is_polite() const { return local_id_ < peer_id_; }
  bool is_closed() const { return closed_; }
  bool is_connected() const {
    return connectivity_state_ == ConnectivityState::kConnected ||
           connectivity_state_ == ConnectivityState::kCompleted;
  }

  // PeerHandleObserver
  void OnLocalCandidate(const IceCandidate& candidate) override;
  void OnConnectivityChange(ConnectivityState state) override;
  void OnRemoteTrack(const std::string& kind) override;

 private:
  void SendOffer(OfferType type);
  void ApplyRemoteOffer(const std::string& sdp, OfferType type);
  void OnLocalDescriptionSet();
  void OnRemoteDescriptionSet();
  void SetStable();
  void MaybeRunPendingNegotiation();
  void ArmRestartTimer();
  void GiveUp(const std::string& reason);
  bool Send(SignalMessage message);

  const std::string peer_id_;
  const std::string local_id_;
  const std::string group_id_;
  const PeerRole role_;
  const MediaKind media_kind_;
  MediaEngine* engine_;
  SignalingChannel* signaling_;
  const PeerLinkConfig config_;
  PeerLinkObserver* observer_;

  std::unique_ptr<PeerHandle> handle_;

  NegotiationState negotiation_state_ = NegotiationState::kNew;
  ConnectivityState connectivity_state_ = ConnectivityState::kNew;
  OfferType outstanding_offer_ = OfferType::kInitial;
  // Bumped when a local offer is abandoned so its late callback is dropped.
  int offer_generation_ = 0;

  bool local_description_set_ = false;
  bool remote_description_set_ = false;
  std::vector<IceCandidate> pending_remote_candidates_;
  std::vector<IceCandidate> pending_local_candidates_;

  bool pending_renegotiation_ = false;
  bool pending_restart_ = false;

  int reconnect_attempts_ = 0;
  bool given_up_ = false;
  bool closed_ = false;

  // Disconnected grace period, then per-attempt restart deadline.
  OneShotTimer restart_timer_;
};

#endif  // PEERCALL_PEER_LINK_H_
