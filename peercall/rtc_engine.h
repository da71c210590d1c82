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

#ifndef PEERCALL_RTC_ENGINE_H_
#define PEERCALL_RTC_ENGINE_H_

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/memory/memory.h>
#include <api/audio_codecs/builtin_audio_decoder_factory.h>
#include <api/audio_codecs/builtin_audio_encoder_factory.h>
#include <api/create_peerconnection_factory.h>
#include <api/data_channel_interface.h>
#include <api/jsep.h>
#include <api/media_stream_interface.h>
#include <api/peer_connection_interface.h>
#include <api/rtc_error.h>
#include <api/scoped_refptr.h>
#include <api/set_local_description_observer_interface.h>
#include <api/set_remote_description_observer_interface.h>
#include <api/task_queue/default_task_queue_factory.h>
#include <api/task_queue/pending_task_safety_flag.h>
#include <api/task_queue/task_queue_base.h>
#include <modules/audio_device/include/audio_device.h>
#include <rtc_base/thread.h>

#include "byte_transport.h"
#include "media_engine.h"
#include "option.h"
#include "signaling.h"

class LambdaCreateSessionDescriptionObserver
    : public webrtc::CreateSessionDescriptionObserver {
 public:
  LambdaCreateSessionDescriptionObserver(
      std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)>
          on_success,
      std::function<void(webrtc::RTCError)> on_failure)
      : on_success_(std::move(on_success)), on_failure_(std::move(on_failure)) {}
  void OnSuccess(webrtc::SessionDescriptionInterface* desc) override {
    // Takes ownership of the description, according to
    // CreateSessionDescriptionObserver convention.
    on_success_(absl::WrapUnique(desc));
  }
  void OnFailure(webrtc::RTCError error) override { on_failure_(std::move(error)); }

 private:
  std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)>
      on_success_;
  std::function<void(webrtc::RTCError)> on_failure_;
};

class LambdaSetLocalDescriptionObserver
    : public webrtc::SetLocalDescriptionObserverInterface {
 public:
  explicit LambdaSetLocalDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(std::move(on_complete)) {}
  void OnSetLocalDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

class LambdaSetRemoteDescriptionObserver
    : public webrtc::SetRemoteDescriptionObserverInterface {
 public:
  explicit LambdaSetRemoteDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(std::move(on_complete)) {}
  void OnSetRemoteDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

// Threads, audio device and PeerConnectionFactory shared by every peer
// connection of the client. The signaling thread doubles as the event loop
// of the core.
class PEERCALL_API RtcContext {
 public:
  explicit RtcContext(const Options& opts);
  ~RtcContext();

  static void rtcInitialize();
  static void rtcCleanup();

  bool Initialize();
  void Shutdown();

  rtc::Thread* signaling_thread() { return signaling_thread_.get(); }
  rtc::Thread* worker_thread() { return worker_thread_.get(); }
  rtc::Thread* network_thread() { return network_thread_.get(); }
  webrtc::PeerConnectionFactoryInterface* factory() {
    return peer_connection_factory_.get();
  }

  // Moves recording to the device matching `device_id` (index, name or
  // GUID), restarting capture if it was running.
  bool SetRecordingDevice(const std::string& device_id);

  webrtc::PeerConnectionInterface::RTCConfiguration MakeConfiguration() const;
  rtc::scoped_refptr<webrtc::PeerConnectionInterface> CreatePeerConnection(
      webrtc::PeerConnectionObserver* observer);

 private:
  bool CreateAudioDeviceModule();

  Options opts_;
  std::unique_ptr<rtc::Thread> signaling_thread_;
  std::unique_ptr<rtc::Thread> worker_thread_;
  std::unique_ptr<rtc::Thread> network_thread_;
  std::unique_ptr<webrtc::TaskQueueFactory> task_queue_factory_;
  rtc::scoped_refptr<webrtc::AudioDeviceModule> audio_device_module_;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> peer_connection_factory_;
};

// Local tracks built on the factory. Camera and screen sources are injected
// by the host application.
class PEERCALL_API RtcLocalMediaSource : public LocalMediaSource {
 public:
  // Opens the camera named by a device id, null when it cannot.
  using CameraSourceFactory =
      std::function<rtc::scoped_refptr<webrtc::VideoTrackSourceInterface>(
          const std::string& device_id)>;

  explicit RtcLocalMediaSource(RtcContext* context);
  ~RtcLocalMediaSource() override;

  void SetCameraSource(rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source);
  void SetCameraSourceFactory(CameraSourceFactory factory);
  void SetScreenSource(rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source);

  void Acquire(MediaKind kind, AcquireCallback callback) override;
  void AcquireScreen(AcquireCallback callback) override;
  void ReleaseScreen() override;
  void Release() override;
  void SetAudioEnabled(bool enabled) override;
  void SetVideoEnabled(bool enabled) override;
  void SwitchDevice(MediaKind kind, const std::string& device_id,
                    AcquireCallback callback) override;

  rtc::scoped_refptr<webrtc::AudioTrackInterface> audio_track() const { return audio_track_; }
  rtc::scoped_refptr<webrtc::VideoTrackInterface> video_track(VideoFeed feed) const;

 private:
  RtcContext* context_;
  CameraSourceFactory camera_factory_;
  rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> camera_source_;
  rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> screen_source_;
  rtc::scoped_refptr<webrtc::AudioTrackInterface> audio_track_;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> camera_track_;
  rtc::scoped_refptr<webrtc::VideoTrackInterface> screen_track_;
};

// A media peer connection. Callbacks are re-posted to the loop so owners may
// close the handle from inside them.
class RtcPeerHandle : public PeerHandle, public webrtc::PeerConnectionObserver {
 public:
  RtcPeerHandle(std::string peer_id,
                MediaKind media_kind,
                RtcContext* context,
                RtcLocalMediaSource* local_media,
                PeerHandleObserver* observer);
  ~RtcPeerHandle() override;

  bool Initialize();

  // PeerHandle
  void CreateOffer(bool ice_restart, SdpCallback callback) override;
  void CreateAnswer(SdpCallback callback) override;
  void SetRemoteDescription(SdpKind kind, const std::string& sdp,
                            CompletionCallback callback) override;
  bool AddRemoteCandidate(const IceCandidate& candidate) override;
  TrackReplaceResult ReplaceVideoTrack(VideoFeed feed) override;
  void Close() override;

  // webrtc::PeerConnectionObserver
  void OnSignalingChange(webrtc::PeerConnectionInterface::SignalingState new_state) override;
  void OnDataChannel(rtc::scoped_refptr<webrtc::DataChannelInterface> channel) override {}
  void OnIceGatheringChange(
      webrtc::PeerConnectionInterface::IceGatheringState new_state) override {}
  void OnIceConnectionChange(
      webrtc::PeerConnectionInterface::IceConnectionState new_state) override;
  void OnIceCandidate(const webrtc::IceCandidateInterface* candidate) override;
  void OnTrack(rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) override;

 private:
  void CreateDescription(bool offer, bool ice_restart, SdpCallback callback);
  void ApplyRemote(webrtc::SdpType type, const std::string& sdp,
                   CompletionCallback callback);
  // Runs `task` on the loop unless the handle was closed meanwhile.
  void PostToLoop(std::function<void()> task);

  const std::string peer_id_;
  const MediaKind media_kind_;
  RtcContext* context_;
  RtcLocalMediaSource* local_media_;
  PeerHandleObserver* observer_;
  webrtc::TaskQueueBase* loop_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
  rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection_;
  rtc::scoped_refptr<webrtc::RtpSenderInterface> video_sender_;
  bool closed_ = false;
};

class RtcMediaEngine : public MediaEngine {
 public:
  RtcMediaEngine(RtcContext* context, RtcLocalMediaSource* local_media)
      : context_(context), local_media_(local_media) {}

  std::unique_ptr<PeerHandle> CreatePeer(const std::string& peer_id,
                                         MediaKind media_kind,
                                         PeerHandleObserver* observer) override;

 private:
  RtcContext* context_;
  RtcLocalMediaSource* local_media_;
};

// One data-only peer connection carrying one transfer. SDP and candidates
// travel as transfer.signal messages.
class RtcByteTransport : public ByteTransport,
                         public webrtc::PeerConnectionObserver,
                         public webrtc::DataChannelObserver {
 public:
  RtcByteTransport(std::string peer_id,
                   std::string transfer_id,
                   bool initiator,
                   RtcContext* context,
                   SignalingChannel* signaling,
                   ByteTransportObserver* observer);
  ~RtcByteTransport() override;

  // ByteTransport
  void Open() override;
  bool Send(const uint8_t* data, size_t size) override;
  uint64_t buffered_amount() const override;
  void SetLowWaterMark(uint64_t bytes) override { low_water_mark_ = bytes; }
  bool is_open() const override;
  void Restart() override;
  void Close() override;
  void HandleSignal(const Json::Value& payload) override;

  // webrtc::PeerConnectionObserver
  void OnSignalingChange(webrtc::PeerConnectionInterface::SignalingState new_state) override {}
  void OnDataChannel(rtc::scoped_refptr<webrtc::DataChannelInterface> channel) override;
  void OnIceGatheringChange(
      webrtc::PeerConnectionInterface::IceGatheringState new_state) override {}
  void OnIceConnectionChange(
      webrtc::PeerConnectionInterface::IceConnectionState new_state) override;
  void OnIceCandidate(const webrtc::IceCandidateInterface* candidate) override;

  // webrtc::DataChannelObserver
  void OnStateChange() override;
  void OnMessage(const webrtc::DataBuffer& buffer) override;
  void OnBufferedAmountChange(uint64_t sent_data_size) override;

 private:
  bool EnsurePeerConnection();
  void AttachChannel(rtc::scoped_refptr<webrtc::DataChannelInterface> channel);
  void SendOffer(bool ice_restart);
  void SendSignal(Json::Value payload);
  void PostToLoop(std::function<void()> task);

  const std::string peer_id_;
  const std::string transfer_id_;
  const bool initiator_;
  RtcContext* context_;
  SignalingChannel* signaling_;
  ByteTransportObserver* observer_;
  webrtc::TaskQueueBase* loop_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
  rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection_;
  rtc::scoped_refptr<webrtc::DataChannelInterface> channel_;
  std::vector<std::unique_ptr<webrtc::IceCandidateInterface>> pending_candidates_;
  uint64_t low_water_mark_ = 0;
  bool drained_pending_ = false;
  bool opened_ = false;
  bool closed_ = false;
};

class RtcByteTransportFactory : public ByteTransportFactory {
 public:
  RtcByteTransportFactory(RtcContext* context, SignalingChannel* signaling)
      : context_(context), signaling_(signaling) {}

  std::unique_ptr<ByteTransport> Create(const std::string& peer_id,
                                        const std::string& transfer_id,
                                        bool initiator,
                                        ByteTransportObserver* observer) override;

 private:
  RtcContext* context_;
  SignalingChannel* signaling_;
};

#endif  // PEERCALL_RTC_ENGINE_H_
