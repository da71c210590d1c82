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

#include <algorithm>
#include <cmath>
#include <utility>

#include "absl/strings/match.h"
#include "api/units/time_delta.h"
#include "rtc_base/logging.h"

#include "file_transfer.h"
#include "status.h"

namespace {

constexpr int kSendRetryDelayMs = 250;
constexpr int64_t kRateWindowMs = 500;

void WriteSequence(uint32_t sequence, uint8_t* out) {
  out[0] = static_cast<uint8_t>(sequence & 0xFF);
  out[1] = static_cast<uint8_t>((sequence >> 8) & 0xFF);
  out[2] = static_cast<uint8_t>((sequence >> 16) & 0xFF);
  out[3] = static_cast<uint8_t>((sequence >> 24) & 0xFF);
}

ErrorKind RejectReasonToErrorKind(const std::string& reason) {
  if (reason == TransferReason::kCapacityExceeded) {
    return ErrorKind::kCapacityExceeded;
  }
  if (reason == TransferReason::kUnsupportedChunkSize) {
    return ErrorKind::kInvalidState;
  }
  return ErrorKind::kUserRejected;
}

}  // namespace

const char* TransferStateToString(TransferState state) {
  switch (state) {
    case TransferState::kRequested:
      return "requested";
    case TransferState::kAccepted:
      return "accepted";
    case TransferState::kRejected:
      return "rejected";
    case TransferState::kConnecting:
      return "connecting";
    case TransferState::kTransferring:
      return "transferring";
    case TransferState::kPaused:
      return "paused";
    case TransferState::kCompleted:
      return "completed";
    case TransferState::kFailed:
      return "failed";
    case TransferState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

bool IsTerminal(TransferState state) {
  return state == TransferState::kRejected || state == TransferState::kCompleted ||
         state == TransferState::kFailed || state == TransferState::kCancelled;
}

void EncodeChunkFrame(uint32_t sequence, const uint8_t* data, size_t size,
                      std::vector<uint8_t>* frame) {
  frame->resize(kFrameHeaderSize + size);
  WriteSequence(sequence, frame->data());
  if (size > 0) {
    std::copy(data, data + size, frame->begin() + kFrameHeaderSize);
  }
}

bool DecodeChunkFrame(const uint8_t* frame, size_t frame_size, uint32_t* sequence,
                      const uint8_t** payload, size_t* payload_size) {
  if (frame_size < kFrameHeaderSize) {
    return false;
  }
  *sequence = static_cast<uint32_t>(frame[0]) | (static_cast<uint32_t>(frame[1]) << 8) |
              (static_cast<uint32_t>(frame[2]) << 16) |
              (static_cast<uint32_t>(frame[3]) << 24);
  *payload = frame + kFrameHeaderSize;
  *payload_size = frame_size - kFrameHeaderSize;
  return true;
}

int64_t EstimatedSecondsLeft(const TransferInfo& info) {
  if (info.bytes_per_second <= 0 || info.bytes_transferred > info.file_size) {
    return -1;
  }
  return static_cast<int64_t>(
      std::ceil((info.file_size - info.bytes_transferred) / info.bytes_per_second));
}

FileTransfer::FileTransfer(TransferInfo info,
                           std::unique_ptr<ByteSource> source,
                           const TransferConfig& config,
                           SignalingChannel* signaling,
                           ByteTransportFactory* transport_factory,
                           webrtc::TaskQueueBase* loop,
                           webrtc::Clock* clock,
                           FileTransferDelegate* delegate)
    : info_(std::move(info)),
      config_(config),
      signaling_(signaling),
      transport_factory_(transport_factory),
      loop_(loop),
      clock_(clock),
      delegate_(delegate),
      source_(std::move(source)),
      connect_timer_(loop),
      stall_timer_(loop),
      retry_timer_(loop) {
  info_.direction = TransferDirection::kSend;
}

FileTransfer::FileTransfer(TransferInfo info,
                           std::unique_ptr<ByteSink> sink,
                           const TransferConfig& config,
                           SignalingChannel* signaling,
                           ByteTransportFactory* transport_factory,
                           webrtc::TaskQueueBase* loop,
                           webrtc::Clock* clock,
                           FileTransferDelegate* delegate)
    : info_(std::move(info)),
      config_(config),
      signaling_(signaling),
      transport_factory_(transport_factory),
      loop_(loop),
      clock_(clock),
      delegate_(delegate),
      sink_(std::move(sink)),
      connect_timer_(loop),
      stall_timer_(loop),
      retry_timer_(loop) {
  info_.direction = TransferDirection::kReceive;
  if (sink_) {
    info_.bytes_transferred = sink_->size();
  }
}

FileTransfer::~FileTransfer() {
  if (transport_) {
    transport_->Close();
    transport_.reset();
  }
}

std::string FileTransfer::location() const {
  if (outgoing()) {
    return source_ ? source_->path() : "";
  }
  return sink_ ? sink_->directory() : "";
}

// ---------------------------------------------------------------------------
//  Local operations
// ---------------------------------------------------------------------------

Result<TransferState> FileTransfer::SendRequest() {
  if (!outgoing() || info_.state != TransferState::kRequested || !source_) {
    return Result<TransferState>(ErrorKind::kInvalidState, "transfer cannot be requested");
  }
  if (!signaling_->IsConnected()) {
    return Result<TransferState>(ErrorKind::kSignalingUnavailable, "signaling is down");
  }
  if (info_.sha256.empty() && info_.file_size <= config_.max_hash_file_size) {
    std::string digest;
    if (source_->ComputeSha256(&digest)) {
      info_.sha256 = digest;
    } else {
      RTC_LOG(LS_WARNING) << "Could not hash " << info_.file_name
                          << ", sending without a digest";
    }
    if (!source_->Seek(0)) {
      return Result<TransferState>(ErrorKind::kInvalidState, "source is not seekable");
    }
  }
  if (!Send(signaling::TransferRequest(info_.peer_id, info_.transfer_id, info_.file_name,
                                       info_.file_size, info_.mime_type, info_.chunk_size,
                                       info_.sha256))) {
    return Result<TransferState>(ErrorKind::kSignalingUnavailable,
                                 "could not send transfer request");
  }
  RTC_LOG(LS_INFO) << "Offered " << info_.file_name << " (" << info_.file_size
                   << " bytes) to " << info_.peer_id << " as " << info_.transfer_id;
  return info_.state;
}

Result<TransferState> FileTransfer::StartTransport() {
  if (!outgoing() || info_.state != TransferState::kAccepted) {
    return Result<TransferState>(ErrorKind::kInvalidState,
                                 std::string("cannot connect from ") +
                                     TransferStateToString(info_.state));
  }
  if (!SeekTo(0)) {
    Fail(ErrorKind::kTransportError, "source cannot be read", TransferReason::kTransportError);
    return Result<TransferState>(ErrorKind::kTransportError, "source cannot be read");
  }
  EnterConnecting();
  OpenTransport(true);
  return info_.state;
}

Result<TransferState> FileTransfer::Accept(std::unique_ptr<ByteSink> sink) {
  if (outgoing() || info_.state != TransferState::kRequested) {
    return Result<TransferState>(ErrorKind::kInvalidState, "nothing to accept");
  }
  if (!sink) {
    return Result<TransferState>(ErrorKind::kInvalidState, "no destination for the file");
  }
  if (!Send(signaling::TransferControl(Msg::kTransferAccept, info_.peer_id,
                                       info_.transfer_id))) {
    return Result<TransferState>(ErrorKind::kSignalingUnavailable,
                                 "could not send transfer accept");
  }
  sink_ = std::move(sink);
  info_.bytes_transferred = sink_->size();
  SetState(TransferState::kAccepted);
  EnterConnecting();
  OpenTransport(false);
  return info_.state;
}

Result<TransferState> FileTransfer::Reject(const std::string& reason) {
  if (outgoing() || info_.state != TransferState::kRequested) {
    return Result<TransferState>(ErrorKind::kInvalidState, "nothing to reject");
  }
  // The decision stands even when the peer cannot be told.
  if (!Send(signaling::TransferWithReason(Msg::kTransferReject, info_.peer_id,
                                          info_.transfer_id, reason))) {
    RTC_LOG(LS_WARNING) << "Reject of " << info_.transfer_id << " was not delivered";
  }
  info_.error = Error{RejectReasonToErrorKind(reason), reason};
  SetState(TransferState::kRejected);
  return info_.state;
}

Result<TransferState> FileTransfer::Pause() {
  if (info_.state != TransferState::kConnecting &&
      info_.state != TransferState::kTransferring) {
    return Result<TransferState>(ErrorKind::kInvalidState,
                                 std::string("cannot pause from ") +
                                     TransferStateToString(info_.state));
  }
  Send(signaling::TransferControl(Msg::kTransferPause, info_.peer_id, info_.transfer_id));
  EnterPaused();
  return info_.state;
}

Result<TransferState> FileTransfer::Resume() {
  if (info_.state != TransferState::kPaused) {
    return Result<TransferState>(ErrorKind::kInvalidState,
                                 std::string("cannot resume from ") +
                                     TransferStateToString(info_.state));
  }
  if (!signaling_->IsConnected()) {
    return Result<TransferState>(ErrorKind::kSignalingUnavailable, "signaling is down");
  }
  if (outgoing() ? !source_ : !sink_) {
    return Result<TransferState>(ErrorKind::kInvalidState, "transfer data is gone");
  }

  if (outgoing()) {
    // The receiver answers with the offset it actually holds.
    EnterConnecting();
    Send(signaling::TransferWithOffset(Msg::kTransferResume, info_.peer_id,
                                       info_.transfer_id, info_.bytes_transferred));
  } else {
    info_.resume_offset = sink_->size();
    EnterConnecting();
    OpenTransport(false);
    Send(signaling::TransferWithOffset(Msg::kTransferResume, info_.peer_id,
                                       info_.transfer_id, info_.resume_offset));
  }
  RTC_LOG(LS_INFO) << "Resuming " << info_.transfer_id << " from "
                   << info_.bytes_transferred;
  return info_.state;
}

Result<TransferState> FileTransfer::Cancel() {
  if (IsTerminal(info_.state)) {
    return Result<TransferState>(ErrorKind::kInvalidState, "transfer already finished");
  }
  Send(signaling::TransferWithReason(Msg::kTransferCancel, info_.peer_id, info_.transfer_id,
                                     TransferReason::kUserCancelled));
  connect_timer_.Stop();
  stall_timer_.Stop();
  retry_timer_.Stop();
  ReleaseTransport();
  if (sink_) {
    sink_->Discard();
  }
  SetState(TransferState::kCancelled);
  return info_.state;
}

void FileTransfer::Suspend() {
  if (info_.state == TransferState::kConnecting ||
      info_.state == TransferState::kTransferring) {
    EnterPaused();
  }
}

// ---------------------------------------------------------------------------
//  Remote control messages
// ---------------------------------------------------------------------------

void FileTransfer::HandleSignal(const SignalMessage& message) {
  if (message.peer_id != info_.peer_id) {
    RTC_LOG(LS_WARNING) << "Ignoring " << message.type << " for " << info_.transfer_id
                        << " from " << message.peer_id;
    return;
  }
  if (message.is(Msg::kTransferAccept)) {
    HandleAccept();
  } else if (message.is(Msg::kTransferReject)) {
    HandleReject(message.GetString("reason"));
  } else if (message.is(Msg::kTransferPause)) {
    HandlePause();
  } else if (message.is(Msg::kTransferResume)) {
    HandleResume(static_cast<uint64_t>(std::max<int64_t>(0, message.GetInt("offset"))));
  } else if (message.is(Msg::kTransferResumeAck)) {
    HandleResumeAck(static_cast<uint64_t>(std::max<int64_t>(0, message.GetInt("offset"))));
  } else if (message.is(Msg::kTransferCancel)) {
    HandleCancel(message.GetString("reason"));
  } else if (message.is(Msg::kTransferComplete)) {
    HandleComplete();
  } else if (message.is(Msg::kTransferSignal)) {
    if (transport_) {
      transport_->HandleSignal(message.payload);
    } else {
      RTC_LOG(LS_VERBOSE) << "Dropping transport signal for idle " << info_.transfer_id;
    }
  } else {
    RTC_LOG(LS_WARNING) << "Unhandled transfer message " << message.type;
  }
}

void FileTransfer::HandleAccept() {
  if (!outgoing() || info_.state != TransferState::kRequested) {
    return;
  }
  RTC_LOG(LS_INFO) << info_.peer_id << " accepted " << info_.transfer_id;
  // The registry starts the transport once a slot is free.
  SetState(TransferState::kAccepted);
}

void FileTransfer::HandleReject(const std::string& reason) {
  if (!outgoing() || info_.state != TransferState::kRequested) {
    return;
  }
  RTC_LOG(LS_INFO) << info_.peer_id << " rejected " << info_.transfer_id << ": " << reason;
  info_.error = Error{RejectReasonToErrorKind(reason),
                      reason.empty() ? TransferReason::kUserRejected : reason};
  SetState(TransferState::kRejected);
}

void FileTransfer::HandlePause() {
  if (info_.state != TransferState::kConnecting &&
      info_.state != TransferState::kTransferring) {
    return;
  }
  RTC_LOG(LS_INFO) << info_.peer_id << " paused " << info_.transfer_id;
  EnterPaused();
}

void FileTransfer::HandleResume(uint64_t offset) {
  if (outgoing()) {
    // Either the receiver resumed, or both sides resumed at once and this
    // stands in for the acknowledgement.
    bool crossed = info_.state == TransferState::kConnecting && !transport_;
    if (info_.state != TransferState::kPaused && !crossed) {
      return;
    }
    if (!source_ || !SeekTo(offset)) {
      Fail(ErrorKind::kInvalidState, "cannot resume at offset " + std::to_string(offset),
           TransferReason::kTransportError);
      return;
    }
    if (!crossed) {
      EnterConnecting();
    }
    Send(signaling::TransferWithOffset(Msg::kTransferResumeAck, info_.peer_id,
                                       info_.transfer_id, offset));
    OpenTransport(true);
    return;
  }

  if (info_.state != TransferState::kPaused &&
      !(info_.state == TransferState::kConnecting && transport_)) {
    return;
  }
  if (!sink_) {
    Fail(ErrorKind::kInvalidState, "partial data is gone", TransferReason::kUnknownTransfer);
    return;
  }
  info_.resume_offset = sink_->size();
  if (info_.state == TransferState::kPaused) {
    EnterConnecting();
    OpenTransport(false);
  }
  Send(signaling::TransferWithOffset(Msg::kTransferResumeAck, info_.peer_id,
                                     info_.transfer_id, info_.resume_offset));
}

void FileTransfer::HandleResumeAck(uint64_t offset) {
  if (info_.state != TransferState::kConnecting) {
    return;
  }
  if (!outgoing()) {
    if (offset != info_.resume_offset) {
      RTC_LOG(LS_WARNING) << "Sender acknowledged offset " << offset << ", expected "
                          << info_.resume_offset;
    }
    return;
  }
  if (transport_) {
    return;  // already resumed through a crossed transfer.resume
  }
  if (!SeekTo(offset)) {
    Fail(ErrorKind::kInvalidState, "cannot resume at offset " + std::to_string(offset),
         TransferReason::kTransportError);
    return;
  }
  OpenTransport(true);
}

void FileTransfer::HandleCancel(const std::string& reason) {
  if (IsTerminal(info_.state)) {
    return;
  }
  RTC_LOG(LS_INFO) << info_.peer_id << " cancelled " << info_.transfer_id << ": " << reason;
  connect_timer_.Stop();
  stall_timer_.Stop();
  retry_timer_.Stop();
  ReleaseTransport();
  if (sink_) {
    sink_->Discard();
  }
  if (reason == TransferReason::kIntegrityMismatch) {
    info_.error = Error{ErrorKind::kTransferIntegrityMismatch, "peer reported a mismatch"};
  } else if (reason == TransferReason::kTimeout) {
    info_.error = Error{ErrorKind::kTransferTimeout, "peer timed out"};
  } else if (reason == TransferReason::kTransportError) {
    info_.error = Error{ErrorKind::kTransportError, "peer lost the data channel"};
  } else if (reason == TransferReason::kUnknownTransfer) {
    info_.error = Error{ErrorKind::kUnknownTransfer, "peer does not know this transfer"};
  }
  SetState(info_.error ? TransferState::kFailed : TransferState::kCancelled);
}

void FileTransfer::HandleComplete() {
  if (!outgoing() || IsTerminal(info_.state) || info_.state == TransferState::kRequested ||
      info_.state == TransferState::kAccepted) {
    return;
  }
  connect_timer_.Stop();
  stall_timer_.Stop();
  retry_timer_.Stop();
  ReleaseTransport();
  info_.bytes_transferred = info_.file_size;
  ReportProgress();
  RTC_LOG(LS_INFO) << "Transfer " << info_.transfer_id << " delivered to " << info_.peer_id;
  SetState(TransferState::kCompleted);
}

// ---------------------------------------------------------------------------
//  Byte transport
// ---------------------------------------------------------------------------

void FileTransfer::OpenTransport(bool initiator) {
  ReleaseTransport();
  transport_ = transport_factory_->Create(info_.peer_id, info_.transfer_id, initiator, this);
  if (!transport_) {
    Fail(ErrorKind::kTransportError, "could not create data channel",
         TransferReason::kTransportError);
    return;
  }
  transport_->SetLowWaterMark(config_.low_water_mark);
  transport_->Open();
}

void FileTransfer::ReleaseTransport() {
  waiting_for_drain_ = false;
  if (!transport_) {
    return;
  }
  transport_->Close();
  // May be running inside one of the transport's own callbacks.
  loop_->PostTask([transport = std::move(transport_)]() {});
}

void FileTransfer::EnterConnecting() {
  SetState(TransferState::kConnecting);
  int half = config_.connect_timeout_ms / 2;
  connect_timer_.Start(webrtc::TimeDelta::Millis(half), [this, half]() {
    if (info_.state != TransferState::kConnecting) {
      return;
    }
    if (outgoing() && transport_) {
      RTC_LOG(LS_WARNING) << "Transfer " << info_.transfer_id
                          << " still connecting, restarting transport";
      transport_->Restart();
    }
    connect_timer_.Start(webrtc::TimeDelta::Millis(config_.connect_timeout_ms - half),
                         [this]() {
                           if (info_.state == TransferState::kConnecting) {
                             Fail(ErrorKind::kConnectivityTimeout,
                                  "data channel did not open in time",
                                  TransferReason::kTimeout);
                           }
                         });
  });
}

void FileTransfer::EnterPaused() {
  if (outgoing()) {
    UpdateSenderProgress();
  } else if (sink_) {
    sink_->Flush();
    info_.bytes_transferred = sink_->size();
  }
  connect_timer_.Stop();
  stall_timer_.Stop();
  retry_timer_.Stop();
  ReleaseTransport();
  pending_frame_.clear();
  chunks_since_checkpoint_ = 0;
  info_.bytes_per_second = 0;
  SetState(TransferState::kPaused);
  delegate_->OnTransferCheckpoint(this);
}

bool FileTransfer::SeekTo(uint64_t offset) {
  if (offset > info_.file_size || !source_->Seek(offset)) {
    RTC_LOG(LS_ERROR) << "Cannot seek " << info_.file_name << " to " << offset;
    return false;
  }
  cursor_ = offset;
  info_.resume_offset = offset;
  info_.bytes_transferred = std::max(info_.bytes_transferred, offset);
  pending_frame_.clear();
  pending_payload_size_ = 0;
  end_marker_sent_ = false;
  send_failures_ = 0;
  return true;
}

void FileTransfer::OnTransportOpen() {
  if (info_.state != TransferState::kConnecting) {
    return;
  }
  RTC_LOG(LS_INFO) << "Data channel for " << info_.transfer_id << " open at offset "
                   << info_.resume_offset;
  connect_timer_.Stop();
  ResetRate();
  SetState(TransferState::kTransferring);
  ArmStallTimer();
  if (outgoing()) {
    PumpChunks();
  }
}

void FileTransfer::OnTransportClosed(bool error) {
  if (info_.state == TransferState::kTransferring) {
    RTC_LOG(LS_WARNING) << "Data channel for " << info_.transfer_id << " lost at "
                        << info_.bytes_transferred << "/" << info_.file_size;
    EnterPaused();
  } else if (info_.state == TransferState::kConnecting && error) {
    Fail(ErrorKind::kTransportError, "data channel failed while connecting",
         TransferReason::kTransportError);
  }
}

void FileTransfer::OnTransportDrained() {
  if (!outgoing() || info_.state != TransferState::kTransferring) {
    return;
  }
  UpdateSenderProgress();
  if (waiting_for_drain_) {
    PumpChunks();
  }
}

void FileTransfer::OnTransportMessage(const uint8_t* data, size_t size) {
  if (outgoing() || info_.state != TransferState::kTransferring) {
    return;
  }
  uint32_t sequence;
  const uint8_t* payload;
  size_t payload_size;
  if (!DecodeChunkFrame(data, size, &sequence, &payload, &payload_size)) {
    RTC_LOG(LS_WARNING) << "Runt frame of " << size << " bytes on " << info_.transfer_id;
    return;
  }
  if (sequence == kEndOfDataSequence) {
    FinishReceive();
    return;
  }
  HandleChunk(sequence, payload, payload_size);
}

// ---------------------------------------------------------------------------
//  Sender
// ---------------------------------------------------------------------------

void FileTransfer::PumpChunks() {
  if (info_.state != TransferState::kTransferring || !transport_ ||
      retry_timer_.IsRunning()) {
    return;
  }
  waiting_for_drain_ = false;
  while (true) {
    if (pending_frame_.empty()) {
      if (cursor_ < info_.file_size) {
        size_t length = static_cast<size_t>(
            std::min<uint64_t>(info_.chunk_size, info_.file_size - cursor_));
        pending_frame_.resize(kFrameHeaderSize + length);
        WriteSequence(static_cast<uint32_t>(cursor_ / info_.chunk_size),
                      pending_frame_.data());
        if (source_->Read(pending_frame_.data() + kFrameHeaderSize, length) != length) {
          Fail(ErrorKind::kTransportError, "could not read " + info_.file_name,
               TransferReason::kTransportError);
          return;
        }
        pending_payload_size_ = length;
      } else if (!end_marker_sent_) {
        EncodeChunkFrame(kEndOfDataSequence, nullptr, 0, &pending_frame_);
        pending_payload_size_ = 0;
      } else {
        break;
      }
    }
    uint64_t buffered = transport_->buffered_amount();
    if (buffered > 0 && buffered + pending_frame_.size() > config_.high_water_mark) {
      waiting_for_drain_ = true;
      break;
    }
    if (!SendFrame()) {
      return;
    }
  }
  UpdateSenderProgress();
  MaybeCheckpoint();
}

bool FileTransfer::SendFrame() {
  if (transport_->Send(pending_frame_.data(), pending_frame_.size())) {
    send_failures_ = 0;
    if (pending_payload_size_ == 0) {
      end_marker_sent_ = true;
    } else {
      cursor_ += pending_payload_size_;
      ++chunks_since_checkpoint_;
    }
    pending_frame_.clear();
    return true;
  }
  if (++send_failures_ > config_.max_send_retries) {
    Fail(ErrorKind::kTransportError, "data channel refused chunk at " + std::to_string(cursor_),
         TransferReason::kTransportError);
    return false;
  }
  RTC_LOG(LS_WARNING) << "Send failed on " << info_.transfer_id << ", retry "
                      << send_failures_ << "/" << config_.max_send_retries;
  retry_timer_.Start(webrtc::TimeDelta::Millis(kSendRetryDelayMs * send_failures_),
                     [this]() { PumpChunks(); });
  return false;
}

void FileTransfer::UpdateSenderProgress() {
  uint64_t buffered = transport_ ? transport_->buffered_amount() : 0;
  uint64_t delivered = cursor_ > buffered ? cursor_ - buffered : 0;
  delivered = std::min(delivered, info_.file_size);
  if (delivered > info_.bytes_transferred) {
    info_.bytes_transferred = delivered;
    if (info_.state == TransferState::kTransferring) {
      ArmStallTimer();
    }
    ReportProgress();
  }
}

// ---------------------------------------------------------------------------
//  Receiver
// ---------------------------------------------------------------------------

void FileTransfer::HandleChunk(uint32_t sequence, const uint8_t* payload, size_t size) {
  uint64_t committed = sink_->size();
  uint64_t expected = committed / info_.chunk_size;
  if (sequence < expected) {
    RTC_LOG(LS_VERBOSE) << "Duplicate chunk " << sequence << " on " << info_.transfer_id;
    return;
  }
  if (sequence > expected) {
    Fail(ErrorKind::kTransferIntegrityMismatch,
         "chunk " + std::to_string(sequence) + " arrived, expected " +
             std::to_string(expected),
         TransferReason::kIntegrityMismatch);
    return;
  }
  if (committed + size > info_.file_size) {
    Fail(ErrorKind::kTransferIntegrityMismatch, "more data than announced",
         TransferReason::kIntegrityMismatch);
    return;
  }
  if (!sink_->Append(payload, size)) {
    Fail(ErrorKind::kTransportError, "could not store " + info_.file_name,
         TransferReason::kTransportError);
    return;
  }
  info_.bytes_transferred = sink_->size();
  ++chunks_since_checkpoint_;
  ArmStallTimer();
  ReportProgress();
  MaybeCheckpoint();
  if (info_.bytes_transferred == info_.file_size) {
    FinishReceive();
  }
}

void FileTransfer::FinishReceive() {
  if (info_.state != TransferState::kTransferring) {
    return;
  }
  if (sink_->size() != info_.file_size) {
    Fail(ErrorKind::kTransferIntegrityMismatch,
         "received " + std::to_string(sink_->size()) + " of " +
             std::to_string(info_.file_size) + " bytes",
         TransferReason::kIntegrityMismatch);
    return;
  }
  if (!info_.sha256.empty()) {
    std::string digest;
    if (!sink_->ComputeSha256(&digest)) {
      Fail(ErrorKind::kTransportError, "could not hash received data",
           TransferReason::kTransportError);
      return;
    }
    if (!absl::EqualsIgnoreCase(digest, info_.sha256)) {
      Fail(ErrorKind::kTransferIntegrityMismatch, "sha256 " + digest + " != " + info_.sha256,
           TransferReason::kIntegrityMismatch);
      return;
    }
  }
  if (!sink_->Finalize()) {
    Fail(ErrorKind::kTransportError, "could not finalize " + info_.file_name,
         TransferReason::kTransportError);
    return;
  }
  connect_timer_.Stop();
  stall_timer_.Stop();
  Send(signaling::TransferControl(Msg::kTransferComplete, info_.peer_id, info_.transfer_id));
  ReleaseTransport();
  RTC_LOG(LS_INFO) << "Received " << info_.file_name << " (" << info_.file_size
                   << " bytes) from " << info_.peer_id;
  SetState(TransferState::kCompleted);
}

// ---------------------------------------------------------------------------
//  Shared
// ---------------------------------------------------------------------------

void FileTransfer::ReportProgress() {
  webrtc::Timestamp now = clock_->CurrentTime();
  if (rate_sample_time_.IsInfinite()) {
    rate_sample_time_ = now;
    rate_sample_bytes_ = info_.bytes_transferred;
  } else if (now - rate_sample_time_ >= webrtc::TimeDelta::Millis(kRateWindowMs)) {
    uint64_t moved = info_.bytes_transferred > rate_sample_bytes_
                         ? info_.bytes_transferred - rate_sample_bytes_
                         : 0;
    info_.bytes_per_second = moved / (now - rate_sample_time_).seconds<double>();
    rate_sample_time_ = now;
    rate_sample_bytes_ = info_.bytes_transferred;
  }
  delegate_->OnTransferProgress(this);
}

void FileTransfer::ResetRate() {
  info_.bytes_per_second = 0;
  rate_sample_time_ = clock_->CurrentTime();
  rate_sample_bytes_ = info_.bytes_transferred;
}

void FileTransfer::ArmStallTimer() {
  stall_timer_.Start(webrtc::TimeDelta::Millis(config_.stall_timeout_ms), [this]() {
    if (info_.state == TransferState::kTransferring) {
      Fail(ErrorKind::kTransferTimeout,
           "no progress for " + std::to_string(config_.stall_timeout_ms) + " ms",
           TransferReason::kTimeout);
    }
  });
}

void FileTransfer::MaybeCheckpoint() {
  if (chunks_since_checkpoint_ < config_.checkpoint_interval_chunks) {
    return;
  }
  chunks_since_checkpoint_ = 0;
  if (sink_) {
    sink_->Flush();
  }
  delegate_->OnTransferCheckpoint(this);
}

void FileTransfer::Fail(ErrorKind kind, const std::string& message,
                        const char* remote_reason) {
  if (IsTerminal(info_.state)) {
    return;
  }
  RTC_LOG(LS_ERROR) << "Transfer " << info_.transfer_id << " failed: "
                    << ErrorKindToString(kind) << " " << message;
  connect_timer_.Stop();
  stall_timer_.Stop();
  retry_timer_.Stop();
  if (remote_reason) {
    Send(signaling::TransferWithReason(Msg::kTransferCancel, info_.peer_id,
                                       info_.transfer_id, remote_reason));
  }
  ReleaseTransport();
  if (sink_) {
    sink_->Discard();
  }
  info_.error = Error{kind, message};
  SetState(TransferState::kFailed);
}

void FileTransfer::SetState(TransferState state) {
  if (info_.state == state) {
    return;
  }
  RTC_LOG(LS_INFO) << "Transfer " << info_.transfer_id << ": "
                   << TransferStateToString(info_.state) << " -> "
                   << TransferStateToString(state);
  info_.state = state;
  delegate_->OnTransferStateChanged(this);
}

bool FileTransfer::Send(const SignalMessage& message) {
  if (!signaling_->Send(message)) {
    RTC_LOG(LS_WARNING) << "Failed to send " << message.type << " for "
                        << info_.transfer_id;
    return false;
  }
  return true;
}
