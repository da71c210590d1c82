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
#include <vector>

#include "api/video_codecs/video_decoder_factory_template.h"
#include "api/video_codecs/video_decoder_factory_template_dav1d_adapter.h"
#include "api/video_codecs/video_decoder_factory_template_libvpx_vp8_adapter.h"
#include "api/video_codecs/video_decoder_factory_template_libvpx_vp9_adapter.h"
#include "api/video_codecs/video_decoder_factory_template_open_h264_adapter.h"
#include "api/video_codecs/video_encoder_factory_template.h"
#include "api/video_codecs/video_encoder_factory_template_libaom_av1_adapter.h"
#include "api/video_codecs/video_encoder_factory_template_libvpx_vp8_adapter.h"
#include "api/video_codecs/video_encoder_factory_template_libvpx_vp9_adapter.h"
#include "api/video_codecs/video_encoder_factory_template_open_h264_adapter.h"
#include "rtc_base/event.h"
#include "rtc_base/logging.h"
#include "rtc_base/ssl_adapter.h"

#include "rtc_engine.h"
#include "status.h"

// String split from option.cc
std::vector<std::string> stringSplit(std::string input, std::string delimiter);

namespace {

ConnectivityState FromIceState(webrtc::PeerConnectionInterface::IceConnectionState state) {
  switch (state) {
    case webrtc::PeerConnectionInterface::kIceConnectionNew:
      return ConnectivityState::kNew;
    case webrtc::PeerConnectionInterface::kIceConnectionChecking:
      return ConnectivityState::kChecking;
    case webrtc::PeerConnectionInterface::kIceConnectionConnected:
      return ConnectivityState::kConnected;
    case webrtc::PeerConnectionInterface::kIceConnectionCompleted:
      return ConnectivityState::kCompleted;
    case webrtc::PeerConnectionInterface::kIceConnectionFailed:
      return ConnectivityState::kFailed;
    case webrtc::PeerConnectionInterface::kIceConnectionDisconnected:
      return ConnectivityState::kDisconnected;
    case webrtc::PeerConnectionInterface::kIceConnectionClosed:
    default:
      return ConnectivityState::kClosed;
  }
}

webrtc::RTCError ParseError(const webrtc::SdpParseError& error) {
  return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                          "bad sdp: " + error.description);
}

}  // namespace

// ---------------------------------------------------------------------------
//  RtcContext
// ---------------------------------------------------------------------------

void RtcContext::rtcInitialize() {
  rtc::InitializeSSL();
}

void RtcContext::rtcCleanup() {
  rtc::CleanupSSL();
}

RtcContext::RtcContext(const Options& opts) : opts_(opts) {}

RtcContext::~RtcContext() {
  Shutdown();
}

bool RtcContext::Initialize() {
  network_thread_ = rtc::Thread::CreateWithSocketServer();
  worker_thread_ = rtc::Thread::Create();
  signaling_thread_ = rtc::Thread::Create();
  network_thread_->SetName("Network", nullptr);
  worker_thread_->SetName("Worker", nullptr);
  signaling_thread_->SetName("Signaling", nullptr);

  if (!network_thread_->Start() || !worker_thread_->Start() || !signaling_thread_->Start()) {
    RTC_LOG(LS_ERROR) << "Failed to start threads";
    return false;
  }

  task_queue_factory_ = webrtc::CreateDefaultTaskQueueFactory();
  if (!CreateAudioDeviceModule()) {
    return false;
  }

  peer_connection_factory_ = webrtc::CreatePeerConnectionFactory(
      network_thread_.get(),
      worker_thread_.get(),
      signaling_thread_.get(),
      audio_device_module_,
      webrtc::CreateBuiltinAudioEncoderFactory(),
      webrtc::CreateBuiltinAudioDecoderFactory(),
      std::make_unique<webrtc::VideoEncoderFactoryTemplate<
          webrtc::LibvpxVp8EncoderTemplateAdapter,
          webrtc::LibvpxVp9EncoderTemplateAdapter,
          webrtc::OpenH264EncoderTemplateAdapter,
          webrtc::LibaomAv1EncoderTemplateAdapter>>(),
      std::make_unique<webrtc::VideoDecoderFactoryTemplate<
          webrtc::LibvpxVp8DecoderTemplateAdapter,
          webrtc::LibvpxVp9DecoderTemplateAdapter,
          webrtc::OpenH264DecoderTemplateAdapter,
          webrtc::Dav1dDecoderTemplateAdapter>>(),
      nullptr,  // audio_mixer
      nullptr   // audio_processing
  );
  if (!peer_connection_factory_) {
    RTC_LOG(LS_ERROR) << "Failed to create PeerConnectionFactory";
    return false;
  }
  RTC_LOG(LS_INFO) << "PeerConnectionFactory created";
  return true;
}

// The ADM lives on the worker thread. Head-less hosts without an audio
// server fall back to the dummy layer.
bool RtcContext::CreateAudioDeviceModule() {
  worker_thread_->BlockingCall([this]() {
    audio_device_module_ = webrtc::AudioDeviceModule::Create(
        webrtc::AudioDeviceModule::kPlatformDefaultAudio, task_queue_factory_.get());
    if (audio_device_module_ && audio_device_module_->Init() == 0) {
      return;
    }
    RTC_LOG(LS_WARNING) << "Platform audio unavailable, switching to DummyAudio layer";
    audio_device_module_ = webrtc::AudioDeviceModule::Create(
        webrtc::AudioDeviceModule::kDummyAudio, task_queue_factory_.get());
    if (audio_device_module_) {
      audio_device_module_->Init();
    }
  });
  if (!audio_device_module_) {
    RTC_LOG(LS_ERROR) << "Audio device module creation failed";
    return false;
  }
  return true;
}

void RtcContext::Shutdown() {
  if (peer_connection_factory_ && signaling_thread_) {
    signaling_thread_->BlockingCall([this]() { peer_connection_factory_ = nullptr; });
  }
  if (audio_device_module_ && worker_thread_) {
    worker_thread_->BlockingCall([this]() {
      audio_device_module_->StopPlayout();
      audio_device_module_->StopRecording();
      audio_device_module_->Terminate();
      audio_device_module_ = nullptr;
    });
  }
  if (signaling_thread_) {
    signaling_thread_->Stop();
  }
  if (worker_thread_) {
    worker_thread_->Stop();
  }
  if (network_thread_) {
    network_thread_->Stop();
  }
  signaling_thread_.reset();
  worker_thread_.reset();
  network_thread_.reset();
}

webrtc::PeerConnectionInterface::RTCConfiguration RtcContext::MakeConfiguration() const {
  webrtc::PeerConnectionInterface::RTCConfiguration config;
  config.sdp_semantics = webrtc::SdpSemantics::kUnifiedPlan;
  config.bundle_policy = webrtc::PeerConnectionInterface::kBundlePolicyMaxBundle;
  config.rtcp_mux_policy = webrtc::PeerConnectionInterface::kRtcpMuxPolicyRequire;
  config.continual_gathering_policy =
      webrtc::PeerConnectionInterface::ContinualGatheringPolicy::GATHER_CONTINUALLY;

  webrtc::PeerConnectionInterface::IceServer stun;
  stun.urls = {"stun:stun.l.google.com:19302", "stun:stun1.l.google.com:19302"};
  config.servers.push_back(stun);

  // --turns=<uri,username,password>
  if (!opts_.turns.empty()) {
    std::vector<std::string> turns_params = stringSplit(opts_.turns, ",");
    if (turns_params.size() == 3) {
      webrtc::PeerConnectionInterface::IceServer turn;
      turn.uri = turns_params[0];
      turn.username = turns_params[1];
      turn.password = turns_params[2];
      turn.tls_cert_policy =
          webrtc::PeerConnectionInterface::kTlsCertPolicyInsecureNoCheck;
      config.servers.push_back(turn);
      RTC_LOG(LS_INFO) << "TURN server: " << turn.uri;
    } else {
      RTC_LOG(LS_WARNING) << "Ignoring malformed turns option: " << opts_.turns;
    }
  }
  return config;
}

bool RtcContext::SetRecordingDevice(const std::string& device_id) {
  if (!audio_device_module_ || !worker_thread_) {
    RTC_LOG(LS_ERROR) << "No audio device module to switch";
    return false;
  }
  return worker_thread_->BlockingCall([this, &device_id]() {
    int16_t count = audio_device_module_->RecordingDevices();
    int16_t index = -1;
    for (int16_t i = 0; i < count; ++i) {
      char name[webrtc::kAdmMaxDeviceNameSize] = {0};
      char guid[webrtc::kAdmMaxGuidSize] = {0};
      if (audio_device_module_->RecordingDeviceName(i, name, guid) != 0) {
        continue;
      }
      if (device_id == name || device_id == guid || device_id == std::to_string(i)) {
        index = i;
        break;
      }
    }
    if (index < 0) {
      RTC_LOG(LS_ERROR) << "No recording device matches " << device_id << " (" << count
                        << " available)";
      return false;
    }

    bool recording = audio_device_module_->Recording();
    if (recording && audio_device_module_->StopRecording() != 0) {
      RTC_LOG(LS_ERROR) << "StopRecording failed";
      return false;
    }
    if (audio_device_module_->SetRecordingDevice(static_cast<uint16_t>(index)) != 0) {
      RTC_LOG(LS_ERROR) << "SetRecordingDevice(" << index << ") failed";
      return false;
    }
    if (recording && (audio_device_module_->InitRecording() != 0 ||
                      audio_device_module_->StartRecording() != 0)) {
      RTC_LOG(LS_ERROR) << "Could not restart recording on device " << index;
      return false;
    }
    RTC_LOG(LS_INFO) << "Recording from device " << index << " (" << device_id << ")";
    return true;
  });
}

rtc::scoped_refptr<webrtc::PeerConnectionInterface> RtcContext::CreatePeerConnection(
    webrtc::PeerConnectionObserver* observer) {
  if (!peer_connection_factory_) {
    RTC_LOG(LS_ERROR) << "PeerConnectionFactory is not initialized";
    return nullptr;
  }
  webrtc::PeerConnectionDependencies dependencies(observer);
  auto result = peer_connection_factory_->CreatePeerConnectionOrError(
      MakeConfiguration(), std::move(dependencies));
  if (!result.ok()) {
    RTC_LOG(LS_ERROR) << "Failed to create PeerConnection: " << result.error().message();
    return nullptr;
  }
  return result.MoveValue();
}

// ---------------------------------------------------------------------------
//  RtcLocalMediaSource
// ---------------------------------------------------------------------------

RtcLocalMediaSource::RtcLocalMediaSource(RtcContext* context) : context_(context) {}

RtcLocalMediaSource::~RtcLocalMediaSource() {
  Release();
}

void RtcLocalMediaSource::SetCameraSource(
    rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source) {
  camera_source_ = source;
  RTC_LOG(LS_INFO) << "Camera source " << (source ? "set" : "cleared");
}

void RtcLocalMediaSource::SetCameraSourceFactory(CameraSourceFactory factory) {
  camera_factory_ = std::move(factory);
}

void RtcLocalMediaSource::SetScreenSource(
    rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source) {
  screen_source_ = source;
  RTC_LOG(LS_INFO) << "Screen source " << (source ? "set" : "cleared");
}

void RtcLocalMediaSource::Acquire(MediaKind kind, AcquireCallback callback) {
  webrtc::PeerConnectionFactoryInterface* factory = context_->factory();
  if (!factory) {
    RTC_LOG(LS_ERROR) << "Cannot acquire media without a factory";
    callback(false);
    return;
  }
  if (!audio_track_) {
    cricket::AudioOptions audio_options;
    auto audio_source = factory->CreateAudioSource(audio_options);
    if (!audio_source) {
      RTC_LOG(LS_ERROR) << "Failed to create audio source";
      callback(false);
      return;
    }
    audio_track_ = factory->CreateAudioTrack("audio_track", audio_source.get());
  }
  if (kind == MediaKind::kVideo && !camera_track_) {
    if (!camera_source_) {
      RTC_LOG(LS_ERROR) << "Video call requested but no camera source is set";
      callback(false);
      return;
    }
    camera_track_ = factory->CreateVideoTrack(camera_source_, "camera_track");
  }
  RTC_LOG(LS_INFO) << "Local " << MediaKindToString(kind) << " media acquired";
  callback(audio_track_ != nullptr);
}

void RtcLocalMediaSource::AcquireScreen(AcquireCallback callback) {
  webrtc::PeerConnectionFactoryInterface* factory = context_->factory();
  if (!factory || !screen_source_) {
    RTC_LOG(LS_ERROR) << "No screen source to share";
    callback(false);
    return;
  }
  if (!screen_track_) {
    screen_track_ = factory->CreateVideoTrack(screen_source_, "screen_track");
  }
  callback(screen_track_ != nullptr);
}

void RtcLocalMediaSource::ReleaseScreen() {
  screen_track_ = nullptr;
}

void RtcLocalMediaSource::Release() {
  screen_track_ = nullptr;
  camera_track_ = nullptr;
  audio_track_ = nullptr;
}

void RtcLocalMediaSource::SetAudioEnabled(bool enabled) {
  if (audio_track_) {
    audio_track_->set_enabled(enabled);
  }
}

void RtcLocalMediaSource::SetVideoEnabled(bool enabled) {
  if (camera_track_) {
    camera_track_->set_enabled(enabled);
  }
}

void RtcLocalMediaSource::SwitchDevice(MediaKind kind, const std::string& device_id,
                                       AcquireCallback callback) {
  if (kind == MediaKind::kAudio) {
    callback(context_->SetRecordingDevice(device_id));
    return;
  }

  webrtc::PeerConnectionFactoryInterface* factory = context_->factory();
  if (!factory || !camera_factory_) {
    RTC_LOG(LS_ERROR) << "Cannot open camera " << device_id;
    callback(false);
    return;
  }
  rtc::scoped_refptr<webrtc::VideoTrackSourceInterface> source = camera_factory_(device_id);
  if (!source) {
    RTC_LOG(LS_ERROR) << "Camera " << device_id << " is unavailable";
    callback(false);
    return;
  }
  auto track = factory->CreateVideoTrack(source, "camera_track");
  if (!track) {
    callback(false);
    return;
  }
  track->set_enabled(camera_track_ ? camera_track_->enabled() : true);
  camera_source_ = source;
  camera_track_ = track;
  RTC_LOG(LS_INFO) << "Camera switched to " << device_id;
  callback(true);
}

rtc::scoped_refptr<webrtc::VideoTrackInterface> RtcLocalMediaSource::video_track(
    VideoFeed feed) const {
  switch (feed) {
    case VideoFeed::kCamera:
      return camera_track_;
    case VideoFeed::kScreen:
      return screen_track_;
    case VideoFeed::kNone:
      break;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
//  RtcPeerHandle
// ---------------------------------------------------------------------------

RtcPeerHandle::RtcPeerHandle(std::string peer_id,
                             MediaKind media_kind,
                             RtcContext* context,
                             RtcLocalMediaSource* local_media,
                             PeerHandleObserver* observer)
    : peer_id_(std::move(peer_id)),
      media_kind_(media_kind),
      context_(context),
      local_media_(local_media),
      observer_(observer),
      loop_(context->signaling_thread()),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

RtcPeerHandle::~RtcPeerHandle() {
  Close();
}

bool RtcPeerHandle::Initialize() {
  peer_connection_ = context_->CreatePeerConnection(this);
  if (!peer_connection_) {
    return false;
  }

  webrtc::RtpTransceiverInit init;
  init.direction = webrtc::RtpTransceiverDirection::kSendRecv;
  init.stream_ids = {"stream1"};

  auto audio_track = local_media_->audio_track();
  auto audio_result = audio_track
                          ? peer_connection_->AddTransceiver(audio_track, init)
                          : peer_connection_->AddTransceiver(cricket::MEDIA_TYPE_AUDIO, init);
  if (!audio_result.ok()) {
    RTC_LOG(LS_ERROR) << "AddTransceiver(audio) failed: " << audio_result.error().message();
    return false;
  }

  if (media_kind_ == MediaKind::kVideo) {
    auto video_track = local_media_->video_track(VideoFeed::kCamera);
    auto video_result =
        video_track ? peer_connection_->AddTransceiver(video_track, init)
                    : peer_connection_->AddTransceiver(cricket::MEDIA_TYPE_VIDEO, init);
    if (!video_result.ok()) {
      RTC_LOG(LS_ERROR) << "AddTransceiver(video) failed: "
                        << video_result.error().message();
      return false;
    }
    video_sender_ = video_result.value()->sender();
  }
  RTC_LOG(LS_INFO) << "PeerConnection for " << peer_id_ << " created ("
                   << MediaKindToString(media_kind_) << ")";
  return true;
}

void RtcPeerHandle::PostToLoop(std::function<void()> task) {
  loop_->PostTask(webrtc::SafeTask(safety_, std::move(task)));
}

void RtcPeerHandle::CreateOffer(bool ice_restart, SdpCallback callback) {
  CreateDescription(true, ice_restart, std::move(callback));
}

void RtcPeerHandle::CreateAnswer(SdpCallback callback) {
  CreateDescription(false, false, std::move(callback));
}

void RtcPeerHandle::CreateDescription(bool offer, bool ice_restart, SdpCallback callback) {
  if (closed_) {
    return;
  }
  webrtc::PeerConnectionInterface::RTCOfferAnswerOptions options;
  options.ice_restart = ice_restart;

  auto observer = rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
      [this, callback](std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
        if (closed_) {
          return;
        }
        std::string sdp;
        desc->ToString(&sdp);
        peer_connection_->SetLocalDescription(
            std::move(desc),
            rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(
                [this, callback, sdp](webrtc::RTCError error) {
                  if (!error.ok()) {
                    RTC_LOG(LS_ERROR) << "Failed to set local description: "
                                      << error.message();
                  }
                  PostToLoop([callback, error, sdp]() { callback(error, sdp); });
                }));
      },
      [this, callback](webrtc::RTCError error) {
        RTC_LOG(LS_ERROR) << "Failed to create session description: " << error.message();
        PostToLoop([callback, error]() { callback(error, ""); });
      });

  if (offer) {
    peer_connection_->CreateOffer(observer.get(), options);
  } else {
    peer_connection_->CreateAnswer(observer.get(), options);
  }
}

void RtcPeerHandle::SetRemoteDescription(SdpKind kind, const std::string& sdp,
                                         CompletionCallback callback) {
  if (closed_) {
    return;
  }
  webrtc::SdpType type = kind == SdpKind::kOffer ? webrtc::SdpType::kOffer
                                                 : webrtc::SdpType::kAnswer;
  if (type == webrtc::SdpType::kOffer &&
      peer_connection_->signaling_state() ==
          webrtc::PeerConnectionInterface::kHaveLocalOffer) {
    // Our own offer lost the collision: roll it back first.
    RTC_LOG(LS_INFO) << "Rolling back local offer to " << peer_id_;
    webrtc::SdpParseError error;
    auto rollback = webrtc::CreateSessionDescription(webrtc::SdpType::kRollback, "", &error);
    peer_connection_->SetLocalDescription(
        std::move(rollback),
        rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(
            [this, type, sdp, callback](webrtc::RTCError error) {
              if (!error.ok()) {
                RTC_LOG(LS_ERROR) << "Rollback failed: " << error.message();
                PostToLoop([callback, error]() { callback(error); });
                return;
              }
              ApplyRemote(type, sdp, callback);
            }));
    return;
  }
  ApplyRemote(type, sdp, std::move(callback));
}

void RtcPeerHandle::ApplyRemote(webrtc::SdpType type, const std::string& sdp,
                                CompletionCallback callback) {
  if (closed_) {
    return;
  }
  webrtc::SdpParseError parse_error;
  std::unique_ptr<webrtc::SessionDescriptionInterface> desc =
      webrtc::CreateSessionDescription(type, sdp, &parse_error);
  if (!desc) {
    RTC_LOG(LS_ERROR) << "Failed to parse remote SDP: " << parse_error.description;
    webrtc::RTCError error = ParseError(parse_error);
    PostToLoop([callback, error]() { callback(error); });
    return;
  }
  peer_connection_->SetRemoteDescription(
      std::move(desc),
      rtc::make_ref_counted<LambdaSetRemoteDescriptionObserver>(
          [this, callback](webrtc::RTCError error) {
            if (!error.ok()) {
              RTC_LOG(LS_ERROR) << "Failed to set remote description: " << error.message();
            }
            PostToLoop([callback, error]() { callback(error); });
          }));
}

bool RtcPeerHandle::AddRemoteCandidate(const IceCandidate& candidate) {
  if (closed_) {
    return false;
  }
  webrtc::SdpParseError error;
  std::unique_ptr<webrtc::IceCandidateInterface> ice(webrtc::CreateIceCandidate(
      candidate.sdp_mid, candidate.sdp_mline_index, candidate.candidate, &error));
  if (!ice) {
    RTC_LOG(LS_ERROR) << "Failed to parse ICE candidate: " << error.description;
    return false;
  }
  if (!peer_connection_->AddIceCandidate(ice.get())) {
    RTC_LOG(LS_WARNING) << "PeerConnection refused candidate from " << peer_id_;
    return false;
  }
  return true;
}

TrackReplaceResult RtcPeerHandle::ReplaceVideoTrack(VideoFeed feed) {
  if (closed_) {
    return TrackReplaceResult::kFailed;
  }
  rtc::scoped_refptr<webrtc::VideoTrackInterface> track = local_media_->video_track(feed);
  if (video_sender_) {
    if (!video_sender_->SetTrack(track.get())) {
      RTC_LOG(LS_ERROR) << "Failed to swap video track for " << peer_id_;
      return TrackReplaceResult::kFailed;
    }
    return TrackReplaceResult::kReplaced;
  }
  if (!track) {
    return TrackReplaceResult::kReplaced;
  }
  // Audio-only call: the first video track needs a new m-line.
  auto result = peer_connection_->AddTrack(track, {"stream1"});
  if (!result.ok()) {
    RTC_LOG(LS_ERROR) << "Failed to add video track: " << result.error().message();
    return TrackReplaceResult::kFailed;
  }
  video_sender_ = result.value();
  return TrackReplaceResult::kNeedsRenegotiation;
}

void RtcPeerHandle::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  safety_->SetNotAlive();
  video_sender_ = nullptr;
  if (peer_connection_) {
    peer_connection_->Close();
    peer_connection_ = nullptr;
  }
  RTC_LOG(LS_INFO) << "PeerConnection for " << peer_id_ << " closed";
}

void RtcPeerHandle::OnSignalingChange(
    webrtc::PeerConnectionInterface::SignalingState new_state) {
  RTC_LOG(LS_VERBOSE) << peer_id_ << " signaling state " << static_cast<int>(new_state);
}

void RtcPeerHandle::OnIceConnectionChange(
    webrtc::PeerConnectionInterface::IceConnectionState new_state) {
  if (new_state == webrtc::PeerConnectionInterface::kIceConnectionMax) {
    return;
  }
  ConnectivityState state = FromIceState(new_state);
  PostToLoop([this, state]() { observer_->OnConnectivityChange(state); });
}

void RtcPeerHandle::OnIceCandidate(const webrtc::IceCandidateInterface* candidate) {
  IceCandidate local;
  if (!candidate->ToString(&local.candidate)) {
    RTC_LOG(LS_ERROR) << "Failed to serialize candidate";
    return;
  }
  local.sdp_mid = candidate->sdp_mid();
  local.sdp_mline_index = candidate->sdp_mline_index();
  PostToLoop([this, local]() { observer_->OnLocalCandidate(local); });
}

void RtcPeerHandle::OnTrack(
    rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) {
  auto track = transceiver->receiver()->track();
  if (!track) {
    return;
  }
  std::string kind = track->kind();
  RTC_LOG(LS_INFO) << "Remote " << kind << " track from " << peer_id_;
  PostToLoop([this, kind]() { observer_->OnRemoteTrack(kind); });
}

std::unique_ptr<PeerHandle> RtcMediaEngine::CreatePeer(const std::string& peer_id,
                                                       MediaKind media_kind,
                                                       PeerHandleObserver* observer) {
  auto handle = std::make_unique<RtcPeerHandle>(peer_id, media_kind, context_, local_media_,
                                                observer);
  if (!handle->Initialize()) {
    return nullptr;
  }
  return handle;
}

// ---------------------------------------------------------------------------
//  RtcByteTransport
// ---------------------------------------------------------------------------

RtcByteTransport::RtcByteTransport(std::string peer_id,
                                   std::string transfer_id,
                                   bool initiator,
                                   RtcContext* context,
                                   SignalingChannel* signaling,
                                   ByteTransportObserver* observer)
    : peer_id_(std::move(peer_id)),
      transfer_id_(std::move(transfer_id)),
      initiator_(initiator),
      context_(context),
      signaling_(signaling),
      observer_(observer),
      loop_(context->signaling_thread()),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

RtcByteTransport::~RtcByteTransport() {
  Close();
}

void RtcByteTransport::PostToLoop(std::function<void()> task) {
  loop_->PostTask(webrtc::SafeTask(safety_, std::move(task)));
}

bool RtcByteTransport::EnsurePeerConnection() {
  if (peer_connection_) {
    return true;
  }
  peer_connection_ = context_->CreatePeerConnection(this);
  return peer_connection_ != nullptr;
}

void RtcByteTransport::Open() {
  if (closed_ || !EnsurePeerConnection()) {
    PostToLoop([this]() { observer_->OnTransportClosed(true); });
    return;
  }
  if (!initiator_) {
    RTC_LOG(LS_INFO) << "Waiting for data channel offer for " << transfer_id_;
    return;
  }
  webrtc::DataChannelInit init;
  init.ordered = true;
  auto result = peer_connection_->CreateDataChannelOrError("transfer-" + transfer_id_, &init);
  if (!result.ok()) {
    RTC_LOG(LS_ERROR) << "CreateDataChannel failed: " << result.error().message();
    PostToLoop([this]() { observer_->OnTransportClosed(true); });
    return;
  }
  AttachChannel(result.MoveValue());
  SendOffer(false);
}

void RtcByteTransport::AttachChannel(
    rtc::scoped_refptr<webrtc::DataChannelInterface> channel) {
  if (channel_) {
    channel_->UnregisterObserver();
  }
  channel_ = channel;
  channel_->RegisterObserver(this);
}

void RtcByteTransport::SendOffer(bool ice_restart) {
  webrtc::PeerConnectionInterface::RTCOfferAnswerOptions options;
  options.ice_restart = ice_restart;
  auto observer = rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
      [this](std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
        if (closed_) {
          return;
        }
        std::string sdp;
        desc->ToString(&sdp);
        peer_connection_->SetLocalDescription(
            std::move(desc), rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(
                                 [this, sdp](webrtc::RTCError error) {
                                   if (!error.ok()) {
                                     RTC_LOG(LS_ERROR) << "Data channel offer failed: "
                                                       << error.message();
                                     return;
                                   }
                                   Json::Value payload;
                                   payload["kind"] = "offer";
                                   payload["sdp"] = sdp;
                                   SendSignal(payload);
                                 }));
      },
      [this](webrtc::RTCError error) {
        RTC_LOG(LS_ERROR) << "Data channel offer failed: " << error.message();
        PostToLoop([this]() { observer_->OnTransportClosed(true); });
      });
  peer_connection_->CreateOffer(observer.get(), options);
}

void RtcByteTransport::SendSignal(Json::Value payload) {
  if (closed_) {
    return;
  }
  SignalMessage message;
  message.type = Msg::kTransferSignal;
  message.peer_id = peer_id_;
  message.payload = std::move(payload);
  message.payload["transferId"] = transfer_id_;
  if (!signaling_->Send(message)) {
    RTC_LOG(LS_WARNING) << "Could not relay transport signal for " << transfer_id_;
  }
}

void RtcByteTransport::HandleSignal(const Json::Value& payload) {
  if (closed_ || !EnsurePeerConnection()) {
    return;
  }
  std::string kind = payload.get("kind", "").asString();
  if (kind == "offer" || kind == "answer") {
    webrtc::SdpType type = kind == "offer" ? webrtc::SdpType::kOffer : webrtc::SdpType::kAnswer;
    webrtc::SdpParseError error;
    std::unique_ptr<webrtc::SessionDescriptionInterface> desc =
        webrtc::CreateSessionDescription(type, payload.get("sdp", "").asString(), &error);
    if (!desc) {
      RTC_LOG(LS_ERROR) << "Bad transport " << kind << ": " << error.description;
      return;
    }
    peer_connection_->SetRemoteDescription(
        std::move(desc),
        rtc::make_ref_counted<LambdaSetRemoteDescriptionObserver>(
            [this, type](webrtc::RTCError error) {
              if (!error.ok() || closed_) {
                RTC_LOG(LS_ERROR) << "Transport remote description: " << error.message();
                return;
              }
              for (const auto& candidate : pending_candidates_) {
                peer_connection_->AddIceCandidate(candidate.get());
              }
              pending_candidates_.clear();
              if (type != webrtc::SdpType::kOffer) {
                return;
              }
              auto observer = rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
                  [this](std::unique_ptr<webrtc::SessionDescriptionInterface> answer) {
                    if (closed_) {
                      return;
                    }
                    std::string sdp;
                    answer->ToString(&sdp);
                    peer_connection_->SetLocalDescription(
                        std::move(answer),
                        rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(
                            [this, sdp](webrtc::RTCError error) {
                              if (!error.ok()) {
                                RTC_LOG(LS_ERROR) << "Transport answer failed: "
                                                  << error.message();
                                return;
                              }
                              Json::Value reply;
                              reply["kind"] = "answer";
                              reply["sdp"] = sdp;
                              SendSignal(reply);
                            }));
                  },
                  [](webrtc::RTCError error) {
                    RTC_LOG(LS_ERROR) << "Transport answer failed: " << error.message();
                  });
              peer_connection_->CreateAnswer(
                  observer.get(), webrtc::PeerConnectionInterface::RTCOfferAnswerOptions());
            }));
  } else if (kind == "candidate") {
    IceCandidate candidate = signaling::CandidateFromPayload(payload);
    webrtc::SdpParseError error;
    std::unique_ptr<webrtc::IceCandidateInterface> ice(webrtc::CreateIceCandidate(
        candidate.sdp_mid, candidate.sdp_mline_index, candidate.candidate, &error));
    if (!ice) {
      RTC_LOG(LS_ERROR) << "Bad transport candidate: " << error.description;
      return;
    }
    if (!peer_connection_->remote_description()) {
      pending_candidates_.push_back(std::move(ice));
      return;
    }
    peer_connection_->AddIceCandidate(ice.get());
  } else {
    RTC_LOG(LS_WARNING) << "Unknown transport signal '" << kind << "'";
  }
}

bool RtcByteTransport::Send(const uint8_t* data, size_t size) {
  if (!channel_ || channel_->state() != webrtc::DataChannelInterface::kOpen) {
    return false;
  }
  return channel_->Send(webrtc::DataBuffer(rtc::CopyOnWriteBuffer(data, size), true));
}

uint64_t RtcByteTransport::buffered_amount() const {
  return channel_ ? channel_->buffered_amount() : 0;
}

bool RtcByteTransport::is_open() const {
  return channel_ && channel_->state() == webrtc::DataChannelInterface::kOpen;
}

void RtcByteTransport::Restart() {
  if (closed_ || !initiator_ || !peer_connection_) {
    return;
  }
  RTC_LOG(LS_INFO) << "Restarting ICE for transfer " << transfer_id_;
  SendOffer(true);
}

void RtcByteTransport::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  safety_->SetNotAlive();
  if (channel_) {
    channel_->UnregisterObserver();
    channel_->Close();
    channel_ = nullptr;
  }
  if (peer_connection_) {
    peer_connection_->Close();
    peer_connection_ = nullptr;
  }
}

void RtcByteTransport::OnDataChannel(
    rtc::scoped_refptr<webrtc::DataChannelInterface> channel) {
  RTC_LOG(LS_INFO) << "Data channel " << channel->label() << " arrived";
  AttachChannel(channel);
}

void RtcByteTransport::OnIceConnectionChange(
    webrtc::PeerConnectionInterface::IceConnectionState new_state) {
  if (new_state == webrtc::PeerConnectionInterface::kIceConnectionFailed && !opened_) {
    PostToLoop([this]() { observer_->OnTransportClosed(true); });
  }
}

void RtcByteTransport::OnIceCandidate(const webrtc::IceCandidateInterface* candidate) {
  std::string sdp;
  if (!candidate->ToString(&sdp)) {
    RTC_LOG(LS_ERROR) << "Failed to serialize candidate";
    return;
  }
  Json::Value payload;
  payload["kind"] = "candidate";
  payload["candidate"] = sdp;
  payload["sdpMid"] = candidate->sdp_mid();
  payload["sdpMLineIndex"] = candidate->sdp_mline_index();
  PostToLoop([this, payload]() { SendSignal(payload); });
}

void RtcByteTransport::OnStateChange() {
  if (!channel_) {
    return;
  }
  webrtc::DataChannelInterface::DataState state = channel_->state();
  if (state == webrtc::DataChannelInterface::kOpen && !opened_) {
    opened_ = true;
    PostToLoop([this]() { observer_->OnTransportOpen(); });
  } else if (state == webrtc::DataChannelInterface::kClosed) {
    bool error = !opened_;
    PostToLoop([this, error]() { observer_->OnTransportClosed(error); });
  }
}

void RtcByteTransport::OnMessage(const webrtc::DataBuffer& buffer) {
  std::vector<uint8_t> data(buffer.data.cdata(), buffer.data.cdata() + buffer.data.size());
  PostToLoop([this, data]() { observer_->OnTransportMessage(data.data(), data.size()); });
}

void RtcByteTransport::OnBufferedAmountChange(uint64_t sent_data_size) {
  if (!channel_ || drained_pending_ || channel_->buffered_amount() > low_water_mark_) {
    return;
  }
  drained_pending_ = true;
  PostToLoop([this]() {
    drained_pending_ = false;
    observer_->OnTransportDrained();
  });
}

std::unique_ptr<ByteTransport> RtcByteTransportFactory::Create(
    const std::string& peer_id,
    const std::string& transfer_id,
    bool initiator,
    ByteTransportObserver* observer) {
  return std::make_unique<RtcByteTransport>(peer_id, transfer_id, initiator, context_,
                                            signaling_, observer);
}
