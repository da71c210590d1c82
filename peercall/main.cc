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

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/strings/match.h"
#include "system_wrappers/include/clock.h"

#include "call_session.h"
#include "checkpoint_store.h"
#include "option.h"
#include "rtc_engine.h"
#include "transfer_registry.h"
#include "wsock.h"

static volatile bool g_shutdown = false;
static volatile int g_shutdown_count = 0;

// Signal handler for Ctrl+C
void signalHandler(int signal) {
  if (signal == SIGINT) {
    g_shutdown_count++;
    std::cout << "\nCtrl+C received (" << g_shutdown_count << "/3), shutting down...\n";
    g_shutdown = true;

    if (g_shutdown_count >= 3) {
      std::cout << "Force exit after multiple Ctrl+C signals\n";
      std::cout.flush();
      _exit(1);
    }
  }
}

namespace {

// Console front end: wires the core to libwebrtc and the signaling server and
// plays the user for the selected mode. Lives on the signaling thread.
class PeercallApplication : public CallSessionObserver, public TransferObserver {
 public:
  PeercallApplication(const Options& opts, RtcContext* context)
      : opts_(opts),
        context_(context),
        store_(opts.state_path),
        checkpoints_(&store_) {}

  bool Start() {
    webrtc::TaskQueueBase* loop = context_->signaling_thread();
    if (!store_.Load()) {
      APP_LOG(AS_WARNING) << "Starting with an empty transfer state file " << opts_.state_path;
    }

    signaling_ = std::make_unique<WebSocketSignalingChannel>(opts_.user_name, loop);
    local_media_ = std::make_unique<RtcLocalMediaSource>(context_);
    media_engine_ = std::make_unique<RtcMediaEngine>(context_, local_media_.get());
    transport_factory_ = std::make_unique<RtcByteTransportFactory>(context_, signaling_.get());

    session_ = std::make_unique<CallSession>(
        opts_.user_name, CallConfigFromOptions(opts_), media_engine_.get(), local_media_.get(),
        signaling_.get(), loop, webrtc::Clock::GetRealTimeClock(), this);
    registry_ = std::make_unique<TransferRegistry>(
        TransferConfigFromOptions(opts_), CapabilityFromOptions(opts_), signaling_.get(),
        transport_factory_.get(), &checkpoints_, loop, webrtc::Clock::GetRealTimeClock(),
        this);

    signaling_->SetMessageHandler([this](const SignalMessage& message) {
      if (absl::StartsWith(message.type, "transfer.")) {
        registry_->HandleSignal(message);
      } else {
        session_->HandleSignal(message);
      }
    });

    if (!signaling_->Connect(opts_.server, opts_.encryption)) {
      return false;
    }

    size_t restored = registry_->Start();
    if (restored > 0) {
      APP_LOG(AS_INFO) << "Restored " << restored << " paused transfer(s)";
    }
    return RunMode();
  }

  void Stop() {
    if (session_) {
      auto ended = session_->EndCall();
      if (!ended.ok()) {
        APP_LOG(AS_VERBOSE) << "EndCall on shutdown: " << ended.error();
      }
    }
    if (registry_) {
      registry_->Shutdown();
    }
    if (signaling_) {
      signaling_->Disconnect();
    }
  }

  bool done() const { return done_.load(); }

  // CallSessionObserver
  void OnCallStatusChanged(CallStatus status) override {
    APP_LOG(AS_INFO) << "Call status: " << CallStatusToString(status);
    if ((status == CallStatus::kEnded || status == CallStatus::kFailed) &&
        (opts_.mode == "call" || opts_.mode == "group")) {
      done_ = true;
    }
  }

  void OnIncomingCall(const IncomingCall& call) override {
    APP_LOG(AS_INFO) << "Incoming " << MediaKindToString(call.media_kind) << " call from "
                     << call.peer_id;
    if (opts_.mode != "answer") {
      Report(session_->RejectIncoming(StatusCodes::kBusyHere), "reject");
      return;
    }
    Report(session_->AcceptIncoming(call), "accept");
  }

  void OnIncomingCallCancelled(const std::string& peer_id) override {
    APP_LOG(AS_INFO) << peer_id << " hung up before we answered";
  }

  void OnCallError(const Error& error) override {
    APP_LOG(AS_ERROR) << "Call error: " << error;
  }

  void OnCallDuration(int64_t seconds) override {
    if (seconds % 30 == 0) {
      APP_LOG(AS_INFO) << "Call duration " << seconds << " s";
    }
  }

  void OnRemoteMediaToggled(const std::string& peer_id, const std::string& kind,
                            bool enabled) override {
    APP_LOG(AS_INFO) << peer_id << " turned " << kind << (enabled ? " on" : " off");
  }

  // TransferObserver
  void OnIncomingTransfer(const TransferInfo& info) override {
    APP_LOG(AS_INFO) << "Incoming file " << info.file_name << " (" << info.file_size
                     << " bytes) from " << info.peer_id;
    bool accept = opts_.mode == "receive" || opts_.mode == "answer";
    auto result = registry_->Respond(info.transfer_id, accept);
    if (!result.ok()) {
      APP_LOG(AS_ERROR) << "Respond failed: " << result.error();
    }
  }

  void OnTransferStateChanged(const TransferInfo& info) override {
    APP_LOG(AS_INFO) << "Transfer " << info.transfer_id << " (" << info.file_name
                     << "): " << TransferStateToString(info.state);
    if (info.error) {
      APP_LOG(AS_ERROR) << "Transfer " << info.transfer_id << " error: " << *info.error;
    }
    if (opts_.mode == "send" && info.transfer_id == outgoing_id_ && IsTerminal(info.state)) {
      done_ = true;
    }
  }

  void OnTransferProgress(const TransferInfo& info) override {
    int percent = info.file_size ? static_cast<int>(info.bytes_transferred * 100 / info.file_size)
                                 : 100;
    if (percent != last_percent_) {
      last_percent_ = percent;
      APP_LOG(AS_INFO) << info.file_name << ": " << percent << "% at "
                       << static_cast<int64_t>(info.bytes_per_second / 1024) << " KiB/s, "
                       << EstimatedSecondsLeft(info) << " s left";
    }
  }

 private:
  bool RunMode() {
    MediaKind kind = opts_.video ? MediaKind::kVideo : MediaKind::kAudio;
    if (opts_.mode == "call") {
      return Report(session_->StartCall(opts_.target_name, kind), "call");
    }
    if (opts_.mode == "group") {
      return Report(session_->JoinGroupCall(opts_.group_name, kind), "join");
    }
    if (opts_.mode == "send") {
      // A restored send of the same file continues instead of starting over.
      for (const TransferInfo& info : registry_->List()) {
        FileTransfer* transfer = registry_->Find(info.transfer_id);
        if (info.direction == TransferDirection::kSend && transfer &&
            transfer->location() == opts_.file && info.peer_id == opts_.target_name &&
            info.state == TransferState::kPaused) {
          outgoing_id_ = info.transfer_id;
          return Report(registry_->Resume(info.transfer_id), "resume");
        }
      }
      auto proposed = registry_->Propose(opts_.file, opts_.target_name);
      if (!proposed.ok()) {
        APP_LOG(AS_ERROR) << "Cannot send " << opts_.file << ": " << proposed.error();
        return false;
      }
      outgoing_id_ = proposed.value();
      APP_LOG(AS_INFO) << "Offered " << opts_.file << " to " << opts_.target_name
                       << " as transfer " << outgoing_id_;
      return true;
    }
    APP_LOG(AS_INFO) << "Waiting as " << opts_.user_name << " (" << opts_.mode << ")";
    return true;
  }

  template <typename T>
  bool Report(const Result<T>& result, const char* what) {
    if (!result.ok()) {
      APP_LOG(AS_ERROR) << what << " failed: " << result.error();
      return false;
    }
    return true;
  }

  const Options opts_;
  RtcContext* context_;
  JsonFileStore store_;
  CheckpointStore checkpoints_;
  std::unique_ptr<WebSocketSignalingChannel> signaling_;
  std::unique_ptr<RtcLocalMediaSource> local_media_;
  std::unique_ptr<RtcMediaEngine> media_engine_;
  std::unique_ptr<RtcByteTransportFactory> transport_factory_;
  std::unique_ptr<CallSession> session_;
  std::unique_ptr<TransferRegistry> registry_;

  std::string outgoing_id_;
  int last_percent_ = -1;
  std::atomic<bool> done_{false};
};

bool ValidateOptions(const Options& opts) {
  if (opts.server.empty()) {
    fprintf(stderr, "Error: signaling server host:port is required\n");
    return false;
  }
  if (opts.user_name.empty()) {
    fprintf(stderr, "Error: --user_name is required\n");
    return false;
  }
  if ((opts.mode == "call" || opts.mode == "send") && opts.target_name.empty()) {
    fprintf(stderr, "Error: --target_name is required when mode is %s\n", opts.mode.c_str());
    return false;
  }
  if (opts.mode == "group" && opts.group_name.empty()) {
    fprintf(stderr, "Error: --group_name is required when mode is group\n");
    return false;
  }
  if (opts.mode == "send" && opts.file.empty()) {
    fprintf(stderr, "Error: --file is required when mode is send\n");
    return false;
  }
  if (opts.mode != "call" && opts.mode != "answer" && opts.mode != "group" &&
      opts.mode != "send" && opts.mode != "receive") {
    fprintf(stderr, "Error: unknown mode '%s'\n", opts.mode.c_str());
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  Options opts;
  if (argc == 1) {
    opts.help = true;
    opts.help_string = parseOptions(std::vector<std::string>{"--help"}).help_string;
  } else {
    std::vector<std::string> args(argv + 1, argv + argc);
    opts = parseOptions(args);
  }

  if (opts.help) {
    fprintf(stderr, "%s\n", opts.help_string.c_str());
    return 1;
  }

  LoggingSeverity level = LS_INFO;
  if (!LoggingSeverityFromString(opts.log_level, &level)) {
    fprintf(stderr, "Error: unknown log level '%s'\n", opts.log_level.c_str());
    return 1;
  }
  SetLoggingLevel(level);

  if (!ValidateOptions(opts)) {
    return 1;
  }
  fprintf(stderr, "%s\n", getUsage(opts).c_str());

  signal(SIGINT, signalHandler);
  RtcContext::rtcInitialize();

  RtcContext context(opts);
  if (!context.Initialize()) {
    fprintf(stderr, "Failed to initialize WebRTC\n");
    RtcContext::rtcCleanup();
    return 1;
  }

  rtc::Thread* loop = context.signaling_thread();
  std::unique_ptr<PeercallApplication> app;
  bool started = loop->BlockingCall([&]() {
    app = std::make_unique<PeercallApplication>(opts, &context);
    return app->Start();
  });

  int exit_code = started ? 0 : 1;
  while (started && !g_shutdown && !app->done()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  fprintf(stderr, "Starting cleanup...\n");
  loop->BlockingCall([&]() {
    app->Stop();
    app.reset();
  });
  context.Shutdown();
  RtcContext::rtcCleanup();
  return exit_code;
}
