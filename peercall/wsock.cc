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

#include "wsock.h"

#include <sys/time.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

#include "absl/strings/match.h"

namespace {

const absl::string_view base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int kReadIntervalMs = 20;
constexpr int kPingIntervalSec = 10;
constexpr int kReconnectDelaySec = 2;

}  // namespace

namespace ws {

std::string Base64Encode(absl::string_view in) {
  std::string out;
  int val = 0, valb = -6;
  for (unsigned char c : in) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(base64_chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    out.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (out.size() % 4) {
    out.push_back('=');
  }
  return out;
}

std::vector<unsigned char> EncodeFrame(uint8_t opcode,
                                       absl::string_view payload,
                                       const uint8_t* mask) {
  std::vector<unsigned char> frame;
  frame.push_back(0x80 | (opcode & 0x0F));  // FIN + opcode

  const uint8_t mask_bit = mask ? 0x80 : 0x00;
  const uint64_t length = payload.size();
  if (length <= 125) {
    frame.push_back(mask_bit | static_cast<uint8_t>(length));
  } else if (length <= 65535) {
    frame.push_back(mask_bit | 126);
    frame.push_back((length >> 8) & 0xFF);
    frame.push_back(length & 0xFF);
  } else {
    frame.push_back(mask_bit | 127);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back((length >> shift) & 0xFF);
    }
  }

  if (!mask) {
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
  }
  frame.insert(frame.end(), mask, mask + 4);
  for (size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<unsigned char>(payload[i]) ^ mask[i % 4]);
  }
  return frame;
}

bool ParseFrames(std::string* buffer, std::vector<Frame>* frames) {
  size_t pos = 0;
  while (pos + 2 <= buffer->size()) {
    const uint8_t first_byte = (*buffer)[pos];
    const uint8_t second_byte = (*buffer)[pos + 1];
    const uint8_t opcode = first_byte & 0x0F;
    if (opcode > kPong || (opcode > kBinary && opcode < kClose)) {
      APP_LOG(AS_ERROR) << "Invalid opcode 0x" << std::hex << static_cast<int>(opcode)
                        << " at pos " << std::dec << pos;
      buffer->clear();
      return false;
    }

    const bool masked = (second_byte & 0x80) != 0;
    uint64_t length = second_byte & 0x7F;
    size_t header_size = 2;
    if (length == 126) {
      if (pos + 4 > buffer->size()) {
        break;
      }
      length = (static_cast<uint64_t>((*buffer)[pos + 2] & 0xFF) << 8) |
               static_cast<uint64_t>((*buffer)[pos + 3] & 0xFF);
      header_size = 4;
    } else if (length == 127) {
      if (pos + 10 > buffer->size()) {
        break;
      }
      length = 0;
      for (int i = 2; i < 10; ++i) {
        length = (length << 8) | static_cast<uint64_t>((*buffer)[pos + i] & 0xFF);
      }
      header_size = 10;
    }

    const size_t mask_size = masked ? 4 : 0;
    const uint64_t total_frame_size = header_size + mask_size + length;
    if (pos + total_frame_size > buffer->size()) {
      break;
    }

    Frame frame;
    frame.opcode = opcode;
    frame.fin = (first_byte & 0x80) != 0;
    frame.payload = buffer->substr(pos + header_size + mask_size, length);
    if (masked) {
      const size_t mask_pos = pos + header_size;
      for (size_t i = 0; i < frame.payload.size(); ++i) {
        frame.payload[i] ^= (*buffer)[mask_pos + (i % 4)];
      }
    }
    frames->push_back(std::move(frame));
    pos += total_frame_size;
  }

  if (pos > 0) {
    buffer->erase(0, pos);
  }
  return true;
}

}  // namespace ws

// ---------------------------------------------------------------------------
//  WebSocketClient
// ---------------------------------------------------------------------------

WebSocketClient::WebSocketClient()
    : sockfd_(-1),
      ssl_ctx_(nullptr),
      ssl_(nullptr),
      use_ssl_(false),
      running_(false),
      connected_(false),
      allow_reconnect_(true),
      network_thread_(nullptr),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  SSL_library_init();
  SSL_load_error_strings();
}

WebSocketClient::~WebSocketClient() {
  allow_reconnect_ = false;
  disconnect();
}

bool WebSocketClient::connect(const Config& config) {
  config_ = config;
  use_ssl_ = config.use_ssl;

  APP_LOG(AS_INFO) << "Connecting to WebSocket server at " << config.host << ":" << config.port
                   << (use_ssl_ ? " (wss)" : " (ws)");

  if (!create_socket_connection()) {
    return false;
  }
  if (use_ssl_ && (!setup_ssl_context() || !perform_ssl_handshake())) {
    cleanup_connection();
    return false;
  }
  if (!send_http_handshake()) {
    cleanup_connection();
    return false;
  }

  connected_ = true;
  return true;
}

void WebSocketClient::disconnect() {
  if (network_thread_ && !network_thread_->IsCurrent()) {
    network_thread_->BlockingCall([this]() { disconnect(); });
    return;
  }
  running_ = false;
  connected_ = false;
  safety_->SetNotAlive();
  safety_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    if (ssl_) {
      SSL_shutdown(ssl_);
    }
  }
  cleanup_connection();
}

bool WebSocketClient::is_connected() const {
  return sockfd_ != -1 && connected_.load();
}

bool WebSocketClient::send_message(const std::string& message) {
  APP_LOG(AS_VERBOSE) << "Sending WebSocket message: " << message;

  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 255);
  uint8_t mask[4];
  for (int i = 0; i < 4; ++i) {
    mask[i] = static_cast<uint8_t>(dis(gen));
  }
  return write_frame(ws::EncodeFrame(ws::kText, message, mask));
}

void WebSocketClient::set_message_callback(std::function<void(const std::string&)> callback) {
  message_callback_ = std::move(callback);
}

void WebSocketClient::set_reconnect_callback(std::function<void()> callback) {
  reconnect_callback_ = std::move(callback);
}

void WebSocketClient::set_network_thread(rtc::Thread* thread) {
  network_thread_ = thread;
}

void WebSocketClient::start_listening() {
  if (!network_thread_) {
    APP_LOG(AS_ERROR) << "WebSocketClient::start_listening: Network thread not set";
    return;
  }
  if (running_.exchange(true)) {
    APP_LOG(AS_WARNING) << "WebSocketClient::start_listening: Already running";
    return;
  }

  // Reads are polled from here on.
  int flags = fcntl(sockfd_, F_GETFL, 0);
  if (flags < 0 || fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    APP_LOG(AS_ERROR) << "Failed to make socket non-blocking: " << strerror(errno);
  }

  schedule_read(0);
  schedule_ping();
}

void WebSocketClient::stop_listening() {
  if (running_.exchange(false)) {
    APP_LOG(AS_INFO) << "WebSocketClient: Stopped WebSocket listener";
  }
}

std::string WebSocketClient::generate_websocket_key() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 255);
  std::string key(16, '\0');
  for (int i = 0; i < 16; ++i) {
    key[i] = static_cast<char>(dis(gen));
  }
  return ws::Base64Encode(key);
}

void WebSocketClient::send_ping() {
  uint8_t mask[4] = {0, 0, 0, 0};
  if (write_frame(ws::EncodeFrame(ws::kPing, "", mask))) {
    APP_LOG(AS_VERBOSE) << "Sent ping frame";
  }
}

void WebSocketClient::send_pong_frame(const std::string& ping_payload) {
  uint8_t mask[4] = {0, 0, 0, 0};
  if (write_frame(ws::EncodeFrame(ws::kPong, ping_payload, mask))) {
    APP_LOG(AS_VERBOSE) << "Sent pong frame in response to ping";
  }
}

bool WebSocketClient::create_socket_connection() {
  struct addrinfo hints, *res;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  int status = getaddrinfo(config_.host.c_str(), config_.port.c_str(), &hints, &res);
  if (status != 0) {
    APP_LOG(AS_ERROR) << "getaddrinfo failed: " << gai_strerror(status);
    return false;
  }

  sockfd_ = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
  if (sockfd_ < 0) {
    APP_LOG(AS_ERROR) << "Socket creation failed: " << strerror(errno);
    freeaddrinfo(res);
    return false;
  }

  if (::connect(sockfd_, res->ai_addr, res->ai_addrlen) < 0) {
    APP_LOG(AS_ERROR) << "Socket connect failed: " << strerror(errno);
    ::close(sockfd_);
    sockfd_ = -1;
    freeaddrinfo(res);
    return false;
  }
  freeaddrinfo(res);

  // Bounded blocking reads until the upgrade completes.
  struct timeval tv;
  tv.tv_sec = config_.timeout_ms / 1000;
  tv.tv_usec = (config_.timeout_ms % 1000) * 1000;
  setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  APP_LOG(AS_INFO) << "TCP connection established to " << config_.host << ":" << config_.port;
  return true;
}

bool WebSocketClient::setup_ssl_context() {
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (!ssl_ctx_) {
    log_ssl_error("Failed to create SSL context");
    return false;
  }

  // Signaling servers commonly run with self-signed certificates.
  SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
  if (SSL_CTX_set_cipher_list(ssl_ctx_, "HIGH:!aNULL:!kRSA:!PSK:!SRP:!MD5:!RC4") != 1) {
    log_ssl_error("Failed to set cipher list");
  }
  SSL_CTX_set_options(ssl_ctx_,
                      SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_NO_TLSv1 | SSL_OP_NO_TLSv1_1);
  SSL_CTX_set_mode(ssl_ctx_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
  return true;
}

bool WebSocketClient::perform_ssl_handshake() {
  ssl_ = SSL_new(ssl_ctx_);
  if (!ssl_) {
    log_ssl_error("Failed to create SSL object");
    return false;
  }
  if (SSL_set_fd(ssl_, sockfd_) != 1) {
    log_ssl_error("Failed to set SSL file descriptor");
    return false;
  }
  if (SSL_set_tlsext_host_name(ssl_, config_.host.c_str()) != 1) {
    log_ssl_error("Failed to set SNI hostname");
  }

  int connect_result = SSL_connect(ssl_);
  if (connect_result <= 0) {
    APP_LOG(AS_ERROR) << "SSL connection failed with error "
                      << SSL_get_error(ssl_, connect_result);
    log_ssl_error("SSL handshake failed");
    return false;
  }

  APP_LOG(AS_INFO) << "SSL connection established with " << SSL_get_cipher(ssl_)
                   << ", protocol: " << SSL_get_version(ssl_);
  return true;
}

bool WebSocketClient::send_http_handshake() {
  std::string path = "/";
  auto it = config_.headers.find("path");
  if (it != config_.headers.end()) {
    path = it->second;
  }

  std::ostringstream request;
  request << "GET " << path << " HTTP/1.1\r\n";
  request << "Host: " << config_.host << ":" << config_.port << "\r\n";
  request << "Connection: Upgrade\r\n";
  request << "Pragma: no-cache\r\n";
  request << "Cache-Control: no-cache\r\n";
  request << "User-Agent: peercall/1.0\r\n";
  request << "Upgrade: websocket\r\n";
  request << "Sec-WebSocket-Version: 13\r\n";
  request << "Sec-WebSocket-Key: " << generate_websocket_key() << "\r\n";
  for (const auto& [key, value] : config_.headers) {
    if (key != "path") {
      request << key << ": " << value << "\r\n";
    }
  }
  request << "\r\n";

  const std::string request_str = request.str();
  if (!write_frame(std::vector<unsigned char>(request_str.begin(), request_str.end()))) {
    APP_LOG(AS_ERROR) << "Failed to send HTTP upgrade request";
    return false;
  }

  char chunk[4096];
  std::string response;
  while (response.find("\r\n\r\n") == std::string::npos) {
    bool would_block = false;
    int bytes_read = read_some(chunk, sizeof(chunk), &would_block);
    if (bytes_read <= 0) {
      APP_LOG(AS_ERROR) << "WebSocket handshake "
                        << (would_block ? "timed out" : "failed") << ", received: " << response;
      return false;
    }
    response.append(chunk, bytes_read);
  }

  size_t header_end = response.find("\r\n\r\n") + 4;
  if (response.find(" 101 ") == std::string::npos ||
      !absl::StrContainsIgnoreCase(response.substr(0, header_end), "upgrade: websocket")) {
    APP_LOG(AS_ERROR) << "WebSocket handshake failed: " << response.substr(0, header_end);
    return false;
  }

  // Frames that arrived together with the upgrade response.
  buffer_ = response.substr(header_end);
  APP_LOG(AS_INFO) << "WebSocket handshake successful";
  return true;
}

bool WebSocketClient::write_frame(const std::vector<unsigned char>& frame) {
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  if (sockfd_ == -1) {
    APP_LOG(AS_ERROR) << "Cannot send frame: socket is closed";
    return false;
  }

  size_t written = 0;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);
  while (written < frame.size()) {
    int result;
    bool retry = false;
    if (use_ssl_) {
      result = SSL_write(ssl_, frame.data() + written, frame.size() - written);
      if (result <= 0) {
        int err = SSL_get_error(ssl_, result);
        retry = err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE;
        if (!retry) {
          log_ssl_error("SSL_write failed");
          return false;
        }
      }
    } else {
      result = ::send(sockfd_, frame.data() + written, frame.size() - written, MSG_NOSIGNAL);
      if (result < 0) {
        retry = errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
        if (!retry) {
          APP_LOG(AS_ERROR) << "send failed: " << strerror(errno);
          return false;
        }
      }
    }
    if (retry) {
      if (std::chrono::steady_clock::now() > deadline) {
        APP_LOG(AS_ERROR) << "send timed out";
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }
    written += result;
  }
  return true;
}

int WebSocketClient::read_some(char* buffer, size_t size, bool* would_block) {
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  *would_block = false;
  if (sockfd_ == -1) {
    return -1;
  }
  if (use_ssl_) {
    int bytes_read = SSL_read(ssl_, buffer, size);
    if (bytes_read <= 0) {
      int err = SSL_get_error(ssl_, bytes_read);
      *would_block = err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE;
      if (!*would_block) {
        log_ssl_error("SSL_read failed");
      }
      return -1;
    }
    return bytes_read;
  }
  ssize_t bytes_read = ::recv(sockfd_, buffer, size, 0);
  if (bytes_read < 0) {
    *would_block = errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
    if (!*would_block) {
      APP_LOG(AS_ERROR) << "recv failed: " << strerror(errno);
    }
    return -1;
  }
  if (bytes_read == 0) {
    APP_LOG(AS_WARNING) << "Connection closed by server";
  }
  return static_cast<int>(bytes_read);
}

void WebSocketClient::schedule_read(int delay_ms) {
  network_thread_->PostDelayedTask(webrtc::SafeTask(safety_, [this]() { async_read(); }),
                                   webrtc::TimeDelta::Millis(delay_ms));
}

void WebSocketClient::schedule_ping() {
  network_thread_->PostDelayedTask(webrtc::SafeTask(safety_,
                                                    [this]() {
                                                      if (!running_.load()) {
                                                        return;
                                                      }
                                                      send_ping();
                                                      schedule_ping();
                                                    }),
                                   webrtc::TimeDelta::Seconds(kPingIntervalSec));
}

void WebSocketClient::async_read() {
  if (!running_.load()) {
    return;
  }

  char chunk[8192];
  bool lost = false;
  for (;;) {
    bool would_block = false;
    int bytes_read = read_some(chunk, sizeof(chunk), &would_block);
    if (bytes_read > 0) {
      buffer_.append(chunk, bytes_read);
      continue;
    }
    lost = !would_block;
    break;
  }

  std::vector<ws::Frame> frames;
  if (!ws::ParseFrames(&buffer_, &frames)) {
    lost = true;
  }

  std::string fragmented;
  for (auto& frame : frames) {
    switch (frame.opcode) {
      case ws::kText:
      case ws::kBinary:
        if (frame.fin) {
          if (message_callback_) {
            message_callback_(frame.payload);
          }
        } else {
          fragmented = std::move(frame.payload);
        }
        break;
      case ws::kContinuation:
        fragmented += frame.payload;
        if (frame.fin && message_callback_) {
          message_callback_(fragmented);
          fragmented.clear();
        }
        break;
      case ws::kPing:
        send_pong_frame(frame.payload);
        break;
      case ws::kClose:
        APP_LOG(AS_INFO) << "Received close frame";
        lost = true;
        break;
      default:
        break;
    }
  }

  if (!lost) {
    schedule_read(kReadIntervalMs);
    return;
  }

  APP_LOG(AS_WARNING) << "WebSocket connection lost";
  running_ = false;
  connected_ = false;
  if (message_callback_) {
    message_callback_(Msg::kDisconnected);
  }
  network_thread_->PostDelayedTask(webrtc::SafeTask(safety_, [this]() { attempt_reconnect(); }),
                                   webrtc::TimeDelta::Seconds(kReconnectDelaySec));
}

void WebSocketClient::attempt_reconnect() {
  if (!allow_reconnect_) {
    APP_LOG(AS_INFO) << "WebSocketClient: Reconnect not allowed after disconnect";
    return;
  }
  APP_LOG(AS_INFO) << "WebSocketClient: Attempting to reconnect";
  cleanup_connection();

  if (connect(config_)) {
    APP_LOG(AS_INFO) << "WebSocketClient: Reconnected successfully";
    start_listening();
    if (reconnect_callback_) {
      reconnect_callback_();
    }
    return;
  }
  APP_LOG(AS_ERROR) << "WebSocketClient: Reconnect failed, retrying in "
                    << kReconnectDelaySec << " seconds";
  network_thread_->PostDelayedTask(webrtc::SafeTask(safety_, [this]() { attempt_reconnect(); }),
                                   webrtc::TimeDelta::Seconds(kReconnectDelaySec));
}

void WebSocketClient::cleanup_connection() {
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  if (ssl_) {
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
  if (sockfd_ != -1) {
    ::close(sockfd_);
    sockfd_ = -1;
  }
  buffer_.clear();
}

void WebSocketClient::log_ssl_error(const std::string& operation) {
  APP_LOG(AS_ERROR) << operation << ": " << ERR_error_string(ERR_get_error(), nullptr);
}

// ---------------------------------------------------------------------------
//  WebSocketSignalingChannel
// ---------------------------------------------------------------------------

WebSocketSignalingChannel::WebSocketSignalingChannel(std::string user_id,
                                                     webrtc::TaskQueueBase* loop)
    : user_id_(std::move(user_id)),
      loop_(loop),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  network_thread_ = rtc::Thread::CreateWithSocketServer();
  network_thread_->SetName("WebSocketNetworkThread", nullptr);
  network_thread_->Start();

  ws_client_ = std::make_unique<WebSocketClient>();
  ws_client_->set_network_thread(network_thread_.get());
  ws_client_->set_message_callback([this](const std::string& text) { OnText(text); });
  ws_client_->set_reconnect_callback([this]() {
    // Presence is per socket; the server forgot us.
    connected_ = Register();
  });
}

WebSocketSignalingChannel::~WebSocketSignalingChannel() {
  safety_->SetNotAlive();
  Disconnect();
  ws_client_.reset();
  network_thread_->Stop();
}

bool WebSocketSignalingChannel::Connect(const std::string& server, bool use_ssl) {
  std::string host;
  int port = 0;
  if (!ParseIpAndPort(server, host, port)) {
    return false;
  }

  WebSocketClient::Config cfg;
  cfg.host = host;
  cfg.port = std::to_string(port);
  cfg.use_ssl = use_ssl;

  bool ok = network_thread_->BlockingCall([this, &cfg]() {
    if (!ws_client_->connect(cfg)) {
      return false;
    }
    ws_client_->start_listening();
    return true;
  });
  if (!ok) {
    APP_LOG(AS_ERROR) << "Failed to connect to signaling server " << server;
    return false;
  }

  connected_ = Register();
  APP_LOG(AS_INFO) << "Connected to signaling server " << server << " as " << user_id_;
  return connected_;
}

void WebSocketSignalingChannel::Disconnect() {
  connected_ = false;
  if (ws_client_) {
    ws_client_->set_allow_reconnect(false);
    ws_client_->disconnect();
  }
}

bool WebSocketSignalingChannel::Register() {
  SignalMessage message;
  message.type = Msg::kRegister;
  message.peer_id = user_id_;
  return ws_client_->send_message(EncodeSignal(message));
}

bool WebSocketSignalingChannel::IsConnected() const {
  return connected_.load();
}

bool WebSocketSignalingChannel::Send(const SignalMessage& message) {
  if (!connected_.load()) {
    APP_LOG(AS_WARNING) << "Signaling offline, dropping " << message.type;
    return false;
  }
  return ws_client_->send_message(EncodeSignal(message));
}

void WebSocketSignalingChannel::SetMessageHandler(MessageHandler handler) {
  handler_ = std::move(handler);
}

void WebSocketSignalingChannel::OnText(const std::string& text) {
  if (text == Msg::kDisconnected) {
    connected_ = false;
    return;
  }
  SignalMessage message;
  if (!DecodeSignal(text, &message)) {
    return;
  }
  loop_->PostTask(webrtc::SafeTask(safety_, [this, message = std::move(message)]() {
    if (handler_) {
      handler_(message);
    }
  }));
}
