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

#ifndef PEERCALL_CALL_SESSION_H_
#define PEERCALL_CALL_SESSION_H_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/task_queue/task_queue_base.h"
#include "api/units/timestamp.h"
#include "system_wrappers/include/clock.h"

#include "config.h"
#include "media_engine.h"
#include "mesh_coordinator.h"
#include "peer_link.h"
#include "result.h"
#include "signaling.h"
#include "timer.h"

enum class CallStatus {
  kIdle,
  kCalling,
  kRinging,
  kConnecting,
  kConnected,
  kReconnecting,
  kFailed,
  kEnded,
};

enum class CallKind { kDirect, kGroup };

const char* CallStatusToString(CallStatus status);

struct LocalMediaState {
  bool audio_enabled = true;
  bool video_enabled = false;
  bool screen_sharing = false;
};

// An offer waiting for the user to accept or reject it.
struct IncomingCall {
  std::string peer_id;
  std::string sdp;
  MediaKind media_kind = MediaKind::kAudio;
};

class CallSessionObserver {
 public:
  virtual ~CallSessionObserver() = default;

  virtual void OnCallStatusChanged(CallStatus status) = 0;
  virtual void OnIncomingCall(const IncomingCall& call) = 0;
  virtual void OnIncomingCallCancelled(const std::string& peer_id) {}
  virtual void OnCallError(const Error& error) = 0;
  virtual void OnCallDuration(int64_t seconds) {}
  virtual void OnRemoteMediaToggled(const std::string& peer_id,
                                    const std::string& kind,
                                    bool enabled) {}
  virtual void OnRemoteTrack(const std::string& peer_id, const std::string& kind) {}
};

// The single active call of this client, direct or group. Not thread safe:
// owned by and driven from the signaling loop.
class CallSession : public PeerLinkObserver, public MeshDelegate {
 public:
  CallSession(std::string local_id,
              const CallConfig& config,
              MediaEngine* engine,
              LocalMediaSource* local_media,
              SignalingChannel* signaling,
              webrtc::TaskQueueBase* loop,
              webrtc::Clock* clock,
              CallSessionObserver* observer);
  ~CallSession() override;

  CallSession(const CallSession&) = delete;
  CallSession& operator=(const CallSession&) = delete;

  Result<CallStatus> StartCall(const std::string& target, MediaKind media_kind);
  Result<CallStatus> AcceptIncoming(const IncomingCall& offer);
  Result<CallStatus> RejectIncoming(const std::string& reason);
  Result<CallStatus> JoinGroupCall(const std::string& group_id, MediaKind media_kind);
  // Idempotent. Peers are told once unless the end came from them.
  Result<CallStatus> EndCall(bool remote_originated = false);

  // Return the new enabled state.
  Result<bool> ToggleAudio();
  Result<bool> ToggleVideo();
  Result<bool> ToggleScreenShare();
  // Switches the microphone or camera mid-call. A new camera reaches every
  // peer through a track replacement unless the screen is being shared.
  Result<bool> SwitchDevice(MediaKind kind, const std::string& device_id);

  void HandleSignal(const SignalMessage& message);

  CallStatus status() const { return status_; }
  CallKind call_kind() const { return call_kind_; }
  MediaKind media_kind() const { return media_kind_; }
  const LocalMediaState& local_media() const { return local_media_state_; }
  const std::optional<IncomingCall>& incoming() const { return incoming_; }
  const std::string& remote_peer() const { return remote_peer_; }
  const MeshCoordinator& mesh() const { return mesh_; }
  size_t peer_count() const { return links_.size(); }
  std::vector<std::string> peer_ids() const;
  int64_t duration_seconds() const { return duration_seconds_; }
  std::optional<webrtc::Timestamp> started_at() const { return started_at_; }
  std::optional<webrtc::Timestamp> connected_at() const { return connected_at_; }

  // MeshDelegate
  PeerLink* CreateLink(const std::string& peer_id, PeerRole role) override;
  void DestroyLink(const std::string& peer_id) override;
  PeerLink* FindLink(const std::string& peer_id) override;

  // PeerLinkObserver
  void OnLinkConnectivityChanged(const std::string& peer_id,
                                 ConnectivityState state) override;
  void OnLinkFailed(const std::string& peer_id, const Error& error) override;
  void OnLinkRemoteTrack(const std::string& peer_id, const std::string& kind) override;

 private:
  // Runs once local media is open; returns an error to roll the call back.
  using Continuation = std::function<std::optional<Error>()>;

  std::optional<Error> Precheck() const;
  void BeginCall(CallKind kind, MediaKind media_kind, const std::string& remote_peer);
  std::optional<Error> AcquireMedia(Continuation next, std::function<void()> on_failure);
  void ContinueAfterAcquire(int generation, bool ok, const Continuation& next,
                            const std::function<void()>& on_failure);

  void HandleOffer(const SignalMessage& message);
  void HandleCallEnd(const SignalMessage& message);
  void HandleGroupMessage(const SignalMessage& message);

  void UpdateAggregateStatus();
  void OnFirstConnected();
  void ScheduleDurationTick();
  void ArmConnectingTimer();
  void BroadcastMediaToggle(const char* kind, bool enabled);
  void ApplyVideoFeed(VideoFeed feed);
  void RetireLink(std::unique_ptr<PeerLink> link);
  bool SendToPeer(SignalMessage message);

  // Closes links, releases media and resets every field. Reports
  // `final_status` (and `error`) before settling on Idle.
  void Teardown(bool remote_originated, const std::optional<Error>& error,
                CallStatus final_status);
  void SetStatus(CallStatus status);

  const std::string local_id_;
  const CallConfig config_;
  MediaEngine* engine_;
  LocalMediaSource* local_media_;
  SignalingChannel* signaling_;
  webrtc::TaskQueueBase* loop_;
  webrtc::Clock* clock_;
  CallSessionObserver* observer_;

  CallStatus status_ = CallStatus::kIdle;
  CallKind call_kind_ = CallKind::kDirect;
  MediaKind media_kind_ = MediaKind::kAudio;
  LocalMediaState local_media_state_;
  std::string remote_peer_;
  std::map<std::string, std::unique_ptr<PeerLink>> links_;
  MeshCoordinator mesh_;

  std::optional<IncomingCall> incoming_;
  std::vector<IceCandidate> incoming_candidates_;

  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
  // Bumped on teardown so continuations of an old call are dropped.
  int call_generation_ = 0;
  bool acquiring_sync_ = false;
  std::optional<Error> acquire_error_;
  bool media_acquired_ = false;

  bool ever_connected_ = false;
  int64_t duration_seconds_ = 0;
  std::optional<webrtc::Timestamp> started_at_;
  std::optional<webrtc::Timestamp> connected_at_;

  OneShotTimer connecting_timer_;
  OneShotTimer duration_timer_;
};

#endif  // PEERCALL_CALL_SESSION_H_
