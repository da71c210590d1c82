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

#include "fakes.h"

#include "api/rtc_error.h"

// ---------------------------------------------------------------------------
//  FakeTaskQueue
// ---------------------------------------------------------------------------

FakeTaskQueue::FakeTaskQueue() : clock_(1000000000), current_(this) {}

FakeTaskQueue::~FakeTaskQueue() {
  // Destroy leftover tasks while still current; they may own retired objects.
  while (!tasks_.empty()) {
    auto node = tasks_.extract(tasks_.begin());
  }
}

void FakeTaskQueue::PostTaskImpl(absl::AnyInvocable<void() &&> task,
                                 const PostTaskTraits& traits,
                                 const webrtc::Location& location) {
  tasks_.emplace(std::make_pair(clock_.TimeInMicroseconds(), sequence_++),
                 std::move(task));
}

void FakeTaskQueue::PostDelayedTaskImpl(absl::AnyInvocable<void() &&> task,
                                        webrtc::TimeDelta delay,
                                        const PostDelayedTaskTraits& traits,
                                        const webrtc::Location& location) {
  tasks_.emplace(std::make_pair(clock_.TimeInMicroseconds() + delay.us(), sequence_++),
                 std::move(task));
}

bool FakeTaskQueue::RunNextDue(int64_t now_us) {
  if (tasks_.empty() || tasks_.begin()->first.first > now_us) {
    return false;
  }
  auto node = tasks_.extract(tasks_.begin());
  std::move(node.mapped())();
  return true;
}

void FakeTaskQueue::RunPending() {
  while (RunNextDue(clock_.TimeInMicroseconds())) {
  }
}

void FakeTaskQueue::AdvanceTime(webrtc::TimeDelta delta) {
  const int64_t target = clock_.TimeInMicroseconds() + delta.us();
  while (!tasks_.empty() && tasks_.begin()->first.first <= target) {
    int64_t due = tasks_.begin()->first.first;
    int64_t now = clock_.TimeInMicroseconds();
    if (due > now) {
      clock_.AdvanceTimeMicroseconds(due - now);
    }
    RunNextDue(clock_.TimeInMicroseconds());
  }
  int64_t now = clock_.TimeInMicroseconds();
  if (target > now) {
    clock_.AdvanceTimeMicroseconds(target - now);
  }
}

// ---------------------------------------------------------------------------
//  RecordingSignaling
// ---------------------------------------------------------------------------

bool RecordingSignaling::Send(const SignalMessage& message) {
  if (!connected || refuse_sends) {
    return false;
  }
  sent.push_back(message);
  return true;
}

void RecordingSignaling::Deliver(const SignalMessage& message) {
  if (handler_) {
    handler_(message);
  }
}

const SignalMessage* RecordingSignaling::Last(const char* type) const {
  for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
    if (it->is(type)) {
      return &*it;
    }
  }
  return nullptr;
}

size_t RecordingSignaling::Count(const char* type) const {
  size_t count = 0;
  for (const auto& message : sent) {
    if (message.is(type)) {
      ++count;
    }
  }
  return count;
}

SignalMessage FromPeer(const std::string& peer_id, SignalMessage message) {
  message.peer_id = peer_id;
  return message;
}

// ---------------------------------------------------------------------------
//  Media
// ---------------------------------------------------------------------------

FakePeerHandle::FakePeerHandle(std::string peer_id,
                               PeerHandleObserver* observer,
                               std::weak_ptr<FakePeerHandleMap> live)
    : peer_id_(std::move(peer_id)), observer_(observer), live_(std::move(live)) {}

FakePeerHandle::~FakePeerHandle() {
  if (auto live = live_.lock()) {
    auto it = live->find(peer_id_);
    if (it != live->end() && it->second == this) {
      live->erase(it);
    }
  }
}

void FakePeerHandle::CreateOffer(bool ice_restart, SdpCallback callback) {
  if (fail_offer) {
    callback(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "offer refused"), "");
    return;
  }
  ++offers_created;
  if (ice_restart) {
    ++ice_restart_offers;
  }
  has_local_offer = true;
  callback(webrtc::RTCError::OK(),
           "v=0 offer " + peer_id_ + " " + std::to_string(offers_created));
}

void FakePeerHandle::CreateAnswer(SdpCallback callback) {
  ++answers_created;
  callback(webrtc::RTCError::OK(),
           "v=0 answer " + peer_id_ + " " + std::to_string(answers_created));
}

void FakePeerHandle::SetRemoteDescription(SdpKind kind, const std::string& sdp,
                                          CompletionCallback callback) {
  if (fail_remote_description) {
    callback(webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER, "bad sdp"));
    return;
  }
  if (kind == SdpKind::kOffer && has_local_offer) {
    ++rollbacks;
  }
  has_local_offer = false;
  remote_descriptions.push_back(sdp);
  callback(webrtc::RTCError::OK());
}

bool FakePeerHandle::AddRemoteCandidate(const IceCandidate& candidate) {
  remote_candidates.push_back(candidate);
  return true;
}

TrackReplaceResult FakePeerHandle::ReplaceVideoTrack(VideoFeed feed) {
  last_feed = feed;
  return replace_result;
}

std::unique_ptr<PeerHandle> FakeMediaEngine::CreatePeer(const std::string& peer_id,
                                                        MediaKind media_kind,
                                                        PeerHandleObserver* observer) {
  if (fail_create) {
    return nullptr;
  }
  ++peers_created;
  auto handle = std::make_unique<FakePeerHandle>(peer_id, observer, handles_);
  (*handles_)[peer_id] = handle.get();
  return handle;
}

FakePeerHandle* FakeMediaEngine::handle(const std::string& peer_id) const {
  auto it = handles_->find(peer_id);
  return it == handles_->end() ? nullptr : it->second;
}

void FakeLocalMedia::Acquire(MediaKind kind, AcquireCallback callback) {
  ++acquires;
  if (deferred) {
    pending_ = std::move(callback);
    return;
  }
  callback(acquire_ok);
}

void FakeLocalMedia::AcquireScreen(AcquireCallback callback) {
  callback(screen_ok);
}

void FakeLocalMedia::SwitchDevice(MediaKind kind, const std::string& device_id,
                                  AcquireCallback callback) {
  switches.emplace_back(kind, device_id);
  callback(switch_ok);
}

void FakeLocalMedia::Release() {
  ++releases;
  pending_ = nullptr;
}

void FakeLocalMedia::CompleteAcquire(bool ok) {
  AcquireCallback callback = std::move(pending_);
  pending_ = nullptr;
  if (callback) {
    callback(ok);
  }
}

// ---------------------------------------------------------------------------
//  Byte transport
// ---------------------------------------------------------------------------

FakeByteTransport::FakeByteTransport(std::weak_ptr<FakeTransportMap> live,
                                     std::string transfer_id,
                                     bool initiator,
                                     ByteTransportObserver* observer)
    : transfer_id(std::move(transfer_id)),
      initiator(initiator),
      observer(observer),
      live_(std::move(live)) {}

FakeByteTransport::~FakeByteTransport() {
  if (auto live = live_.lock()) {
    auto it = live->find(transfer_id);
    if (it != live->end() && it->second == this) {
      live->erase(it);
    }
  }
}

bool FakeByteTransport::Send(const uint8_t* data, size_t size) {
  if (refuse) {
    return false;
  }
  frames.emplace_back(data, data + size);
  if (accumulate) {
    buffered += size;
  }
  return true;
}

void FakeByteTransport::FireOpen() {
  open_ = true;
  observer->OnTransportOpen();
}

void FakeByteTransport::FireClosed(bool error) {
  open_ = false;
  observer->OnTransportClosed(error);
}

void FakeByteTransport::Drain() {
  buffered = 0;
  observer->OnTransportDrained();
}

std::unique_ptr<ByteTransport> FakeByteTransportFactory::Create(
    const std::string& peer_id,
    const std::string& transfer_id,
    bool initiator,
    ByteTransportObserver* observer) {
  if (fail_create) {
    return nullptr;
  }
  ++created;
  auto transport =
      std::make_unique<FakeByteTransport>(transports_, transfer_id, initiator, observer);
  transport->accumulate = accumulate;
  (*transports_)[transfer_id] = transport.get();
  return transport;
}

FakeByteTransport* FakeByteTransportFactory::transport(const std::string& transfer_id) const {
  auto it = transports_->find(transfer_id);
  return it == transports_->end() ? nullptr : it->second;
}
