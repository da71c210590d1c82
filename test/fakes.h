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

#ifndef PEERCALL_TEST_FAKES_H_
#define PEERCALL_TEST_FAKES_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "api/location.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "system_wrappers/include/clock.h"

#include "byte_transport.h"
#include "media_engine.h"
#include "signaling.h"

// Manually driven event loop. Installs itself as the current task queue so
// PendingTaskSafetyFlag checks pass on the test thread.
class FakeTaskQueue : public webrtc::TaskQueueBase {
 public:
  FakeTaskQueue();
  ~FakeTaskQueue() override;

  void Delete() override {}

  // Runs every task that is due now, including ones posted meanwhile.
  void RunPending();
  // Moves the clock forward, running delayed tasks in due order.
  void AdvanceTime(webrtc::TimeDelta delta);

  webrtc::SimulatedClock* clock() { return &clock_; }
  size_t pending_tasks() const { return tasks_.size(); }

 protected:
  void PostTaskImpl(absl::AnyInvocable<void() &&> task,
                    const PostTaskTraits& traits,
                    const webrtc::Location& location) override;
  void PostDelayedTaskImpl(absl::AnyInvocable<void() &&> task,
                           webrtc::TimeDelta delay,
                           const PostDelayedTaskTraits& traits,
                           const webrtc::Location& location) override;

 private:
  bool RunNextDue(int64_t now_us);

  webrtc::SimulatedClock clock_;
  std::map<std::pair<int64_t, uint64_t>, absl::AnyInvocable<void() &&>> tasks_;
  uint64_t sequence_ = 0;
  CurrentTaskQueueSetter current_;
};

// Signaling bus that records what was sent.
class RecordingSignaling : public SignalingChannel {
 public:
  bool IsConnected() const override { return connected; }
  bool Send(const SignalMessage& message) override;
  void SetMessageHandler(MessageHandler handler) override {
    handler_ = std::move(handler);
  }

  void Deliver(const SignalMessage& message);

  // Most recent message of `type`, nullptr when none was sent.
  const SignalMessage* Last(const char* type) const;
  size_t Count(const char* type) const;
  void Clear() { sent.clear(); }

  bool connected = true;
  bool refuse_sends = false;
  std::vector<SignalMessage> sent;

 private:
  MessageHandler handler_;
};

class FakePeerHandle;
using FakePeerHandleMap = std::map<std::string, FakePeerHandle*>;

class FakePeerHandle : public PeerHandle {
 public:
  FakePeerHandle(std::string peer_id,
                 PeerHandleObserver* observer,
                 std::weak_ptr<FakePeerHandleMap> live);
  ~FakePeerHandle() override;

  void CreateOffer(bool ice_restart, SdpCallback callback) override;
  void CreateAnswer(SdpCallback callback) override;
  void SetRemoteDescription(SdpKind kind, const std::string& sdp,
                            CompletionCallback callback) override;
  bool AddRemoteCandidate(const IceCandidate& candidate) override;
  TrackReplaceResult ReplaceVideoTrack(VideoFeed feed) override;
  void Close() override { closed = true; }

  PeerHandleObserver* observer() const { return observer_; }
  void SetConnectivity(ConnectivityState state) {
    observer_->OnConnectivityChange(state);
  }

  int offers_created = 0;
  int ice_restart_offers = 0;
  int answers_created = 0;
  bool has_local_offer = false;
  int rollbacks = 0;
  bool closed = false;
  bool fail_offer = false;
  bool fail_remote_description = false;
  TrackReplaceResult replace_result = TrackReplaceResult::kReplaced;
  VideoFeed last_feed = VideoFeed::kNone;
  std::vector<std::string> remote_descriptions;
  std::vector<IceCandidate> remote_candidates;

 private:
  const std::string peer_id_;
  PeerHandleObserver* observer_;
  std::weak_ptr<FakePeerHandleMap> live_;
};

class FakeMediaEngine : public MediaEngine {
 public:
  std::unique_ptr<PeerHandle> CreatePeer(const std::string& peer_id,
                                         MediaKind media_kind,
                                         PeerHandleObserver* observer) override;

  // Live handle of `peer_id`, owned by its PeerLink. nullptr once destroyed.
  FakePeerHandle* handle(const std::string& peer_id) const;

  bool fail_create = false;
  int peers_created = 0;

 private:
  std::shared_ptr<FakePeerHandleMap> handles_ = std::make_shared<FakePeerHandleMap>();
};

class FakeLocalMedia : public LocalMediaSource {
 public:
  void Acquire(MediaKind kind, AcquireCallback callback) override;
  void AcquireScreen(AcquireCallback callback) override;
  void ReleaseScreen() override { ++screen_releases; }
  void Release() override;
  void SetAudioEnabled(bool enabled) override { audio_enabled = enabled; }
  void SetVideoEnabled(bool enabled) override { video_enabled = enabled; }
  void SwitchDevice(MediaKind kind, const std::string& device_id,
                    AcquireCallback callback) override;

  // Completes a deferred Acquire().
  void CompleteAcquire(bool ok);

  bool deferred = false;
  bool acquire_ok = true;
  bool screen_ok = true;
  bool switch_ok = true;
  std::vector<std::pair<MediaKind, std::string>> switches;
  int acquires = 0;
  int releases = 0;
  int screen_releases = 0;
  bool audio_enabled = false;
  bool video_enabled = false;

 private:
  AcquireCallback pending_;
};

class FakeByteTransport;
using FakeTransportMap = std::map<std::string, FakeByteTransport*>;

class FakeByteTransport : public ByteTransport {
 public:
  FakeByteTransport(std::weak_ptr<FakeTransportMap> live,
                    std::string transfer_id,
                    bool initiator,
                    ByteTransportObserver* observer);
  ~FakeByteTransport() override;

  void Open() override { ++opens; }
  bool Send(const uint8_t* data, size_t size) override;
  uint64_t buffered_amount() const override { return buffered; }
  void SetLowWaterMark(uint64_t bytes) override { low_water_mark = bytes; }
  bool is_open() const override { return open_; }
  void Restart() override { ++restarts; }
  void Close() override { closed = true; }
  void HandleSignal(const Json::Value& payload) override { signals.push_back(payload); }

  // Test controls, delivered as the real transport would.
  void FireOpen();
  void FireClosed(bool error);
  void Drain();

  const std::string transfer_id;
  const bool initiator;
  ByteTransportObserver* const observer;

  // When set, accepted frames add to the buffered amount.
  bool accumulate = false;
  bool refuse = false;
  uint64_t buffered = 0;
  uint64_t low_water_mark = 0;
  int opens = 0;
  int restarts = 0;
  bool closed = false;
  std::vector<std::vector<uint8_t>> frames;
  std::vector<Json::Value> signals;

 private:
  std::weak_ptr<FakeTransportMap> live_;
  bool open_ = false;
};

class FakeByteTransportFactory : public ByteTransportFactory {
 public:
  std::unique_ptr<ByteTransport> Create(const std::string& peer_id,
                                        const std::string& transfer_id,
                                        bool initiator,
                                        ByteTransportObserver* observer) override;

  // Live transport of `transfer_id`, nullptr once it was destroyed.
  FakeByteTransport* transport(const std::string& transfer_id) const;

  bool fail_create = false;
  int created = 0;
  bool accumulate = false;

 private:
  std::shared_ptr<FakeTransportMap> transports_ = std::make_shared<FakeTransportMap>();
};

// Incoming message as the signaling server would relay it.
SignalMessage FromPeer(const std::string& peer_id, SignalMessage message);

#endif  // PEERCALL_TEST_FAKES_H_
