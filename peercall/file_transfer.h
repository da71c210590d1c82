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

#ifndef PEERCALL_FILE_TRANSFER_H_
#define PEERCALL_FILE_TRANSFER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/task_queue/task_queue_base.h"
#include "api/units/timestamp.h"
#include "system_wrappers/include/clock.h"

#include "byte_stream.h"
#include "byte_transport.h"
#include "config.h"
#include "result.h"
#include "signaling.h"
#include "timer.h"

enum class TransferState {
  kRequested,
  kAccepted,
  kRejected,
  kConnecting,
  kTransferring,
  kPaused,
  kCompleted,
  kFailed,
  kCancelled,
};

enum class TransferDirection { kSend, kReceive };

const char* TransferStateToString(TransferState state);
bool IsTerminal(TransferState state);

// Chunk frames: 4-byte little-endian sequence number, then the payload.
inline constexpr uint32_t kEndOfDataSequence = 0xFFFFFFFF;
inline constexpr size_t kFrameHeaderSize = 4;

void EncodeChunkFrame(uint32_t sequence, const uint8_t* data, size_t size,
                      std::vector<uint8_t>* frame);
bool DecodeChunkFrame(const uint8_t* frame, size_t frame_size, uint32_t* sequence,
                      const uint8_t** payload, size_t* payload_size);

struct TransferInfo {
  std::string transfer_id;
  std::string peer_id;
  TransferDirection direction = TransferDirection::kSend;
  std::string file_name;
  uint64_t file_size = 0;
  std::string mime_type;
  std::string sha256;  // empty when not computed
  uint32_t chunk_size = 16384;
  uint64_t bytes_transferred = 0;
  uint64_t resume_offset = 0;
  // Recent throughput, 0 while no data is moving.
  double bytes_per_second = 0;
  CapabilityClass capability_class = CapabilityClass::kMemoryBuffered;
  TransferState state = TransferState::kRequested;
  std::optional<Error> error;
};

// Seconds until done at the current rate, -1 when unknown.
int64_t EstimatedSecondsLeft(const TransferInfo& info);

class FileTransfer;

// Implemented by the registry that owns the transfers.
class FileTransferDelegate {
 public:
  virtual ~FileTransferDelegate() = default;

  virtual void OnTransferStateChanged(FileTransfer* transfer) = 0;
  virtual void OnTransferProgress(FileTransfer* transfer) = 0;
  // Persist the current progress.
  virtual void OnTransferCheckpoint(FileTransfer* transfer) = 0;
};

// One negotiated transfer, either direction. Lives on the signaling loop.
class FileTransfer : public ByteTransportObserver {
 public:
  // Outgoing transfer reading from `source`.
  FileTransfer(TransferInfo info,
               std::unique_ptr<ByteSource> source,
               const TransferConfig& config,
               SignalingChannel* signaling,
               ByteTransportFactory* transport_factory,
               webrtc::TaskQueueBase* loop,
               webrtc::Clock* clock,
               FileTransferDelegate* delegate);
  // Incoming transfer. The sink arrives with Accept() or a restore.
  FileTransfer(TransferInfo info,
               std::unique_ptr<ByteSink> sink,
               const TransferConfig& config,
               SignalingChannel* signaling,
               ByteTransportFactory* transport_factory,
               webrtc::TaskQueueBase* loop,
               webrtc::Clock* clock,
               FileTransferDelegate* delegate);
  ~FileTransfer() override;

  FileTransfer(const FileTransfer&) = delete;
  FileTransfer& operator=(const FileTransfer&) = delete;

  // Sender: hashes the source when small enough and sends transfer.request.
  Result<TransferState> SendRequest();
  // Sender: opens the byte transport once a concurrency slot is granted.
  Result<TransferState> StartTransport();

  // Receiver.
  Result<TransferState> Accept(std::unique_ptr<ByteSink> sink);
  Result<TransferState> Reject(const std::string& reason);

  Result<TransferState> Pause();
  Result<TransferState> Resume();
  Result<TransferState> Cancel();

  // Pause without telling the peer, used on shutdown.
  void Suspend();

  void HandleSignal(const SignalMessage& message);

  const TransferInfo& info() const { return info_; }
  const std::string& id() const { return info_.transfer_id; }
  TransferState state() const { return info_.state; }
  bool outgoing() const { return info_.direction == TransferDirection::kSend; }
  bool has_transport() const { return transport_ != nullptr; }
  // Sender: file to reopen. Receiver: directory of the partial file.
  std::string location() const;
  // Receiver sink, for inspection once completed.
  ByteSink* sink() const { return sink_.get(); }

  // ByteTransportObserver
  void OnTransportOpen() override;
  void OnTransportClosed(bool error) override;
  void OnTransportDrained() override;
  void OnTransportMessage(const uint8_t* data, size_t size) override;

 private:
  void HandleAccept();
  void HandleReject(const std::string& reason);
  void HandlePause();
  void HandleResume(uint64_t offset);
  void HandleResumeAck(uint64_t offset);
  void HandleCancel(const std::string& reason);
  void HandleComplete();

  void OpenTransport(bool initiator);
  void ReleaseTransport();
  void EnterConnecting();
  void EnterPaused();
  bool SeekTo(uint64_t offset);

  // Sender side.
  void PumpChunks();
  bool SendFrame();
  void UpdateSenderProgress();

  // Receiver side.
  void HandleChunk(uint32_t sequence, const uint8_t* payload, size_t size);
  void FinishReceive();

  void ReportProgress();
  void ResetRate();

  void ArmStallTimer();
  void MaybeCheckpoint();
  void Fail(ErrorKind kind, const std::string& message, const char* remote_reason);
  void SetState(TransferState state);
  bool Send(const SignalMessage& message);

  TransferInfo info_;
  const TransferConfig config_;
  SignalingChannel* signaling_;
  ByteTransportFactory* transport_factory_;
  webrtc::TaskQueueBase* loop_;
  webrtc::Clock* clock_;
  FileTransferDelegate* delegate_;

  std::unique_ptr<ByteSource> source_;
  std::unique_ptr<ByteSink> sink_;
  std::unique_ptr<ByteTransport> transport_;

  // Sender: next byte of the source to frame.
  uint64_t cursor_ = 0;
  std::vector<uint8_t> pending_frame_;
  uint64_t pending_payload_size_ = 0;
  bool end_marker_sent_ = false;
  bool waiting_for_drain_ = false;
  int send_failures_ = 0;

  int chunks_since_checkpoint_ = 0;

  webrtc::Timestamp rate_sample_time_ = webrtc::Timestamp::MinusInfinity();
  uint64_t rate_sample_bytes_ = 0;

  OneShotTimer connect_timer_;
  OneShotTimer stall_timer_;
  OneShotTimer retry_timer_;
};

#endif  // PEERCALL_FILE_TRANSFER_H_
