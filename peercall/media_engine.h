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

#ifndef PEERCALL_MEDIA_ENGINE_H_
#define PEERCALL_MEDIA_ENGINE_H_

#include <functional>
#include <memory>
#include <string>

#include "api/rtc_error.h"

#include "signaling.h"

enum class ConnectivityState {
  kNew,
  kChecking,
  kConnected,
  kCompleted,
  kDisconnected,
  kFailed,
  kClosed,
};

const char* ConnectivityStateToString(ConnectivityState state);

enum class SdpKind { kOffer, kAnswer };

// Outgoing video feed attached to a peer's video sender.
enum class VideoFeed { kNone, kCamera, kScreen };

enum class TrackReplaceResult {
  kReplaced,            // swapped in place, no negotiation needed
  kNeedsRenegotiation,  // a new sender was added
  kFailed,
};

// Events a peer handle reports back to its owner. Delivered on the owner's
// event loop.
class PeerHandleObserver {
 public:
  virtual ~PeerHandleObserver() = default;

  virtual void OnLocalCandidate(const IceCandidate& candidate) = 0;
  virtual void OnConnectivityChange(ConnectivityState state) = 0;
  virtual void OnRemoteTrack(const std::string& kind) {}
};

// One peer connection per remote party. Negotiation internals (SDP, ICE
// checks, codecs) belong to the engine.
class PeerHandle {
 public:
  using SdpCallback =
      std::function<void(webrtc::RTCError error, const std::string& sdp)>;
  using CompletionCallback = std::function<void(webrtc::RTCError error)>;

  virtual ~PeerHandle() = default;

  // Creates an offer (or answer), applies it as the local description and
  // returns its SDP.
  virtual void CreateOffer(bool ice_restart, SdpCallback callback) = 0;
  virtual void CreateAnswer(SdpCallback callback) = 0;

  // An offer applied while a local offer is pending rolls the local one back.
  virtual void SetRemoteDescription(SdpKind kind, const std::string& sdp,
                                    CompletionCallback callback) = 0;
  virtual bool AddRemoteCandidate(const IceCandidate& candidate) = 0;

  virtual TrackReplaceResult ReplaceVideoTrack(VideoFeed feed) = 0;
  virtual void Close() = 0;
};

class MediaEngine {
 public:
  virtual ~MediaEngine() = default;

  virtual std::unique_ptr<PeerHandle> CreatePeer(const std::string& peer_id,
                                                 MediaKind media_kind,
                                                 PeerHandleObserver* observer) = 0;
};

// Microphone, camera and screen capture. Single owner: the active call.
// Callbacks may run synchronously. Release() abandons a pending Acquire().
class LocalMediaSource {
 public:
  using AcquireCallback = std::function<void(bool ok)>;

  virtual ~LocalMediaSource() = default;

  virtual void Acquire(MediaKind kind, AcquireCallback callback) = 0;
  virtual void AcquireScreen(AcquireCallback callback) = 0;
  virtual void ReleaseScreen() = 0;
  virtual void Release() = 0;
  // Moves capture of `kind` to another input device. A camera switch hands
  // out a new video track; the audio track stays.
  virtual void SwitchDevice(MediaKind kind, const std::string& device_id,
                            AcquireCallback callback) = 0;

  virtual void SetAudioEnabled(bool enabled) = 0;
  virtual void SetVideoEnabled(bool enabled) = 0;
};

#endif  // PEERCALL_MEDIA_ENGINE_H_
