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

#pragma once

#include <fcntl.h>
#include <netdb.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "rtc_base/thread.h"

#include "option.h"
#include "signaling.h"

namespace ws {

enum Opcode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA,
};

struct Frame {
  uint8_t opcode = kText;
  bool fin = true;
  std::string payload;
};

std::string Base64Encode(absl::string_view in);

// Client frames are masked with `mask`; server-side frames pass nullptr.
std::vector<unsigned char> EncodeFrame(uint8_t opcode,
                                       absl::string_view payload,
                                       const uint8_t* mask);

// Consumes every complete frame at the front of `buffer`. Bytes of a
// trailing partial frame stay in the buffer. Returns false on a malformed
// header, in which case the buffer is cleared.
bool ParseFrames(std::string* buffer, std::vector<Frame>* frames);

}  // namespace ws

class WebSocketClient {
public:
    struct Config {
        std::string host;
        std::string port;
        bool use_ssl = false;
        std::map<std::string, std::string> headers;
        int timeout_ms = 10000;
    };

    WebSocketClient();
    ~WebSocketClient();

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    // Connection management. connect() also performs the HTTP upgrade.
    bool connect(const Config& config);
    void disconnect();
    bool is_connected() const;

    // Message handling. Callbacks run on the network thread; a lost
    // connection is reported as the text Msg::kDisconnected.
    bool send_message(const std::string& message);
    void set_message_callback(std::function<void(const std::string&)> callback);
    void set_reconnect_callback(std::function<void()> callback);
    void set_allow_reconnect(bool allow) { allow_reconnect_ = allow; }
    void start_listening();
    void stop_listening();

    void set_network_thread(rtc::Thread* thread);

    std::string generate_websocket_key();

    // Ping/Pong handling
    void send_ping();
    void send_pong_frame(const std::string& ping_payload);

private:
    bool create_socket_connection();
    bool setup_ssl_context();
    bool perform_ssl_handshake();
    bool send_http_handshake();

    bool write_frame(const std::vector<unsigned char>& frame);
    int read_some(char* buffer, size_t size, bool* would_block);
    void async_read();
    void schedule_read(int delay_ms);
    void schedule_ping();
    void attempt_reconnect();

    void cleanup_connection();
    void log_ssl_error(const std::string& operation);

    int sockfd_;
    SSL_CTX* ssl_ctx_;
    SSL* ssl_;
    bool use_ssl_;
    std::atomic<bool> running_;
    std::atomic<bool> connected_;
    std::atomic<bool> allow_reconnect_;

    Config config_;
    rtc::Thread* network_thread_;
    rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;

    std::string buffer_;
    std::function<void(const std::string&)> message_callback_;
    std::function<void()> reconnect_callback_;

    std::mutex ssl_mutex_;
};

// SignalingChannel over a WebSocketClient. Messages are JSON text frames in
// the EncodeSignal() form; the server relays them to `peerId`, rewriting it
// to the sender's id.
class PEERCALL_API WebSocketSignalingChannel : public SignalingChannel {
 public:
  WebSocketSignalingChannel(std::string user_id, webrtc::TaskQueueBase* loop);
  ~WebSocketSignalingChannel() override;

  // "host:port". Registers `user_id` once the socket is up.
  bool Connect(const std::string& server, bool use_ssl);
  void Disconnect();

  // SignalingChannel
  bool IsConnected() const override;
  bool Send(const SignalMessage& message) override;
  void SetMessageHandler(MessageHandler handler) override;

 private:
  void OnText(const std::string& text);
  bool Register();

  const std::string user_id_;
  webrtc::TaskQueueBase* loop_;
  std::unique_ptr<rtc::Thread> network_thread_;
  std::unique_ptr<WebSocketClient> ws_client_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
  MessageHandler handler_;
  std::atomic<bool> connected_{false};
};
