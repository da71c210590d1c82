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
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "api/units/time_delta.h"
#include "rtc_base/crypto_random.h"
#include "rtc_base/logging.h"

#include "status.h"
#include "transfer_registry.h"

namespace {

struct MimeEntry {
  const char* extension;
  const char* mime_type;
};

constexpr MimeEntry kMimeTypes[] = {
    {".txt", "text/plain"},        {".json", "application/json"},
    {".pdf", "application/pdf"},   {".zip", "application/zip"},
    {".png", "image/png"},         {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},       {".gif", "image/gif"},
    {".webp", "image/webp"},       {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},         {".ogg", "audio/ogg"},
    {".mp4", "video/mp4"},         {".webm", "video/webm"},
    {".mov", "video/quicktime"},   {".html", "text/html"},
};

}  // namespace

std::string GuessMimeType(const std::string& file_name) {
  std::string lower = absl::AsciiStrToLower(file_name);
  for (const auto& entry : kMimeTypes) {
    if (absl::EndsWith(lower, entry.extension)) {
      return entry.mime_type;
    }
  }
  return "application/octet-stream";
}

TransferRegistry::TransferRegistry(const TransferConfig& config,
                                   const CapabilityDescriptor& capability,
                                   SignalingChannel* signaling,
                                   ByteTransportFactory* transport_factory,
                                   CheckpointStore* checkpoints,
                                   webrtc::TaskQueueBase* loop,
                                   webrtc::Clock* clock,
                                   TransferObserver* observer)
    : config_(config),
      capability_(capability),
      signaling_(signaling),
      transport_factory_(transport_factory),
      checkpoints_(checkpoints),
      loop_(loop),
      clock_(clock),
      observer_(observer),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

TransferRegistry::~TransferRegistry() {
  safety_->SetNotAlive();
}

// ---------------------------------------------------------------------------
//  Lifecycle
// ---------------------------------------------------------------------------

size_t TransferRegistry::Start() {
  shutting_down_ = false;
  size_t restored = 0;
  for (const auto& checkpoint : checkpoints_->LoadAll()) {
    if (transfers_.count(checkpoint.transfer_id)) {
      continue;
    }
    if (RestoreCheckpoint(checkpoint)) {
      ++restored;
    } else {
      checkpoints_->Remove(checkpoint.transfer_id);
    }
  }
  RTC_LOG(LS_INFO) << "Restored " << restored << " paused transfer(s)";
  return restored;
}

bool TransferRegistry::RestoreCheckpoint(const TransferCheckpoint& checkpoint) {
  TransferInfo info;
  info.transfer_id = checkpoint.transfer_id;
  info.peer_id = checkpoint.peer_id;
  info.file_name = checkpoint.file_name;
  info.file_size = checkpoint.file_size;
  info.mime_type = checkpoint.mime_type;
  info.sha256 = checkpoint.sha256;
  info.chunk_size = checkpoint.chunk_size > 0 ? checkpoint.chunk_size : config_.chunk_size;
  info.bytes_transferred = checkpoint.bytes_transferred;
  info.resume_offset = checkpoint.bytes_transferred;
  info.capability_class = checkpoint.capability_class;
  info.state = TransferState::kPaused;

  if (checkpoint.bytes_transferred > checkpoint.file_size) {
    RTC_LOG(LS_WARNING) << "Checkpoint " << checkpoint.transfer_id << " is past the end";
    return false;
  }

  if (checkpoint.outgoing) {
    if (checkpoint.location.empty()) {
      RTC_LOG(LS_INFO) << "Dropping in-memory send " << checkpoint.transfer_id;
      return false;
    }
    std::unique_ptr<ByteSource> source = FileByteSource::Open(checkpoint.location);
    if (!source || source->size() != checkpoint.file_size) {
      RTC_LOG(LS_WARNING) << "Source of " << checkpoint.transfer_id << " at "
                          << checkpoint.location << " is gone or changed";
      return false;
    }
    transfers_[info.transfer_id] = std::make_unique<FileTransfer>(
        std::move(info), std::move(source), config_, signaling_, transport_factory_, loop_,
        clock_, this);
  } else {
    if (checkpoint.capability_class != CapabilityClass::kStreamingDisk ||
        checkpoint.location.empty()) {
      RTC_LOG(LS_INFO) << "Dropping memory-buffered receive " << checkpoint.transfer_id;
      return false;
    }
    std::unique_ptr<ByteSink> sink =
        DiskByteSink::Create(checkpoint.location, SanitizeFileName(checkpoint.file_name),
                             checkpoint.transfer_id, checkpoint.bytes_transferred);
    if (!sink) {
      RTC_LOG(LS_WARNING) << "Partial file of " << checkpoint.transfer_id
                          << " cannot be reopened";
      return false;
    }
    transfers_[info.transfer_id] = std::make_unique<FileTransfer>(
        std::move(info), std::move(sink), config_, signaling_, transport_factory_, loop_,
        clock_, this);
  }
  RTC_LOG(LS_INFO) << "Restored " << checkpoint.transfer_id << " at "
                   << checkpoint.bytes_transferred << "/" << checkpoint.file_size;
  return true;
}

void TransferRegistry::Shutdown() {
  shutting_down_ = true;
  for (auto& entry : transfers_) {
    entry.second->Suspend();
  }
  RTC_LOG(LS_INFO) << "Transfer registry shut down";
}

// ---------------------------------------------------------------------------
//  Commands
// ---------------------------------------------------------------------------

Result<std::string> TransferRegistry::Propose(const std::string& path,
                                              const std::string& peer_id) {
  std::unique_ptr<ByteSource> source = FileByteSource::Open(path);
  if (!source) {
    return Result<std::string>(ErrorKind::kInvalidState, "cannot open " + path);
  }
  std::string name = SanitizeFileName(path);
  return ProposeSource(peer_id, name, GuessMimeType(name), std::move(source));
}

Result<std::string> TransferRegistry::ProposeSource(const std::string& peer_id,
                                                    const std::string& file_name,
                                                    const std::string& mime_type,
                                                    std::unique_ptr<ByteSource> source) {
  if (peer_id.empty()) {
    return Result<std::string>(ErrorKind::kInvalidState, "no peer to send to");
  }
  if (!signaling_->IsConnected()) {
    return Result<std::string>(ErrorKind::kSignalingUnavailable, "signaling is down");
  }

  TransferInfo info;
  info.transfer_id = rtc::CreateRandomUuid();
  info.peer_id = peer_id;
  info.file_name = SanitizeFileName(file_name);
  info.file_size = source->size();
  info.mime_type = mime_type;
  info.chunk_size = config_.chunk_size;
  info.capability_class = source->path().empty() ? CapabilityClass::kMemoryBuffered
                                                 : CapabilityClass::kStreamingDisk;
  std::string id = info.transfer_id;

  auto transfer =
      std::make_unique<FileTransfer>(std::move(info), std::move(source), config_, signaling_,
                                     transport_factory_, loop_, clock_, this);
  FileTransfer* raw = transfer.get();
  transfers_[id] = std::move(transfer);
  Result<TransferState> sent = raw->SendRequest();
  if (!sent.ok()) {
    transfers_.erase(id);
    return Result<std::string>(sent.error());
  }
  observer_->OnTransferStateChanged(raw->info());
  return id;
}

Result<TransferState> TransferRegistry::Respond(const std::string& transfer_id, bool accept) {
  FileTransfer* transfer = Find(transfer_id);
  if (!transfer) {
    return Result<TransferState>(ErrorKind::kUnknownTransfer, transfer_id);
  }
  if (transfer->outgoing()) {
    return Result<TransferState>(ErrorKind::kInvalidState, "cannot respond to own request");
  }
  if (!accept) {
    return transfer->Reject(TransferReason::kUserRejected);
  }

  std::unique_ptr<ByteSink> sink;
  if (capability_.capability_class == CapabilityClass::kStreamingDisk) {
    sink = DiskByteSink::Create(capability_.download_dir,
                                SanitizeFileName(transfer->info().file_name), transfer_id, 0);
    if (!sink) {
      return Result<TransferState>(ErrorKind::kInvalidState,
                                   "cannot write to " + capability_.download_dir);
    }
  } else {
    sink = std::make_unique<MemoryByteSink>();
  }
  return transfer->Accept(std::move(sink));
}

Result<TransferState> TransferRegistry::Pause(const std::string& transfer_id) {
  FileTransfer* transfer = Find(transfer_id);
  if (!transfer) {
    return Result<TransferState>(ErrorKind::kUnknownTransfer, transfer_id);
  }
  return transfer->Pause();
}

Result<TransferState> TransferRegistry::Resume(const std::string& transfer_id) {
  FileTransfer* transfer = Find(transfer_id);
  if (!transfer) {
    return Result<TransferState>(ErrorKind::kUnknownTransfer, transfer_id);
  }
  shutting_down_ = false;
  return transfer->Resume();
}

Result<TransferState> TransferRegistry::Cancel(const std::string& transfer_id) {
  FileTransfer* transfer = Find(transfer_id);
  if (!transfer) {
    return Result<TransferState>(ErrorKind::kUnknownTransfer, transfer_id);
  }
  return transfer->Cancel();
}

// ---------------------------------------------------------------------------
//  Inbound messages
// ---------------------------------------------------------------------------

void TransferRegistry::HandleSignal(const SignalMessage& message) {
  if (message.is(Msg::kTransferRequest)) {
    HandleRequest(message);
    return;
  }
  std::string transfer_id = message.GetString("transferId");
  FileTransfer* transfer = Find(transfer_id);
  if (!transfer) {
    RTC_LOG(LS_WARNING) << message.type << " for unknown transfer '" << transfer_id
                        << "' from " << message.peer_id;
    // Answering a terminal message would only bounce back and forth.
    if (!transfer_id.empty() && !message.is(Msg::kTransferCancel) &&
        !message.is(Msg::kTransferComplete) && !message.is(Msg::kTransferReject)) {
      signaling_->Send(signaling::TransferWithReason(Msg::kTransferCancel, message.peer_id,
                                                     transfer_id,
                                                     TransferReason::kUnknownTransfer));
    }
    return;
  }
  transfer->HandleSignal(message);
}

void TransferRegistry::HandleRequest(const SignalMessage& message) {
  std::string transfer_id = message.GetString("transferId");
  int64_t file_size = message.GetInt("fileSize", -1);
  if (transfer_id.empty() || file_size < 0) {
    RTC_LOG(LS_WARNING) << "Malformed transfer request from " << message.peer_id;
    return;
  }
  if (transfers_.count(transfer_id)) {
    RTC_LOG(LS_WARNING) << "Duplicate transfer request " << transfer_id;
    return;
  }
  int64_t chunk_size = message.GetInt("chunkSize", config_.chunk_size);
  bool chunk_size_ok = chunk_size > 0 && chunk_size <= kMaxChunkSize;
  if (!chunk_size_ok) {
    RTC_LOG(LS_WARNING) << "Peer asked for chunk size " << chunk_size << ", limit is "
                        << kMaxChunkSize;
  }

  TransferInfo info;
  info.transfer_id = transfer_id;
  info.peer_id = message.peer_id;
  info.file_name = SanitizeFileName(message.GetString("fileName"));
  info.file_size = static_cast<uint64_t>(file_size);
  info.mime_type = message.GetString("mimeType");
  info.sha256 = absl::AsciiStrToLower(message.GetString("sha256"));
  info.chunk_size = chunk_size_ok ? static_cast<uint32_t>(chunk_size) : config_.chunk_size;
  info.capability_class = capability_.capability_class;

  auto transfer = std::make_unique<FileTransfer>(std::move(info), std::unique_ptr<ByteSink>(),
                                                 config_, signaling_, transport_factory_,
                                                 loop_, clock_, this);
  FileTransfer* raw = transfer.get();
  transfers_[transfer_id] = std::move(transfer);

  if (!chunk_size_ok) {
    raw->Reject(TransferReason::kUnsupportedChunkSize);
    return;
  }
  if (raw->info().file_size > capability_.max_file_size) {
    RTC_LOG(LS_INFO) << "Rejecting " << raw->info().file_name << " ("
                     << raw->info().file_size << " bytes), limit is "
                     << capability_.max_file_size;
    raw->Reject(TransferReason::kCapacityExceeded);
    return;
  }
  RTC_LOG(LS_INFO) << message.peer_id << " offers " << raw->info().file_name << " ("
                   << raw->info().file_size << " bytes)";
  observer_->OnIncomingTransfer(raw->info());
}

// ---------------------------------------------------------------------------
//  Queries
// ---------------------------------------------------------------------------

FileTransfer* TransferRegistry::Find(const std::string& transfer_id) const {
  auto it = transfers_.find(transfer_id);
  return it == transfers_.end() ? nullptr : it->second.get();
}

std::vector<TransferInfo> TransferRegistry::List() const {
  std::vector<TransferInfo> infos;
  infos.reserve(transfers_.size());
  for (const auto& entry : transfers_) {
    infos.push_back(entry.second->info());
  }
  return infos;
}

int TransferRegistry::active_sends() const {
  return static_cast<int>(std::count_if(
      transfers_.begin(), transfers_.end(), [](const auto& entry) {
        const FileTransfer& transfer = *entry.second;
        return transfer.outgoing() && (transfer.state() == TransferState::kConnecting ||
                                       transfer.state() == TransferState::kTransferring);
      }));
}

// ---------------------------------------------------------------------------
//  FileTransferDelegate
// ---------------------------------------------------------------------------

void TransferRegistry::OnTransferStateChanged(FileTransfer* transfer) {
  if (transfer->outgoing() && transfer->state() == TransferState::kAccepted) {
    send_queue_.push_back(transfer->id());
  }
  if (IsTerminal(transfer->state())) {
    checkpoints_->Remove(transfer->id());
    loop_->PostDelayedTask(
        webrtc::SafeTask(safety_, [this, id = transfer->id()]() { Release(id); }),
        webrtc::TimeDelta::Millis(config_.finished_retention_ms));
  }
  observer_->OnTransferStateChanged(transfer->info());
  AdmitQueuedSends();
}

void TransferRegistry::Release(const std::string& transfer_id) {
  auto it = transfers_.find(transfer_id);
  if (it == transfers_.end() || !IsTerminal(it->second->state())) {
    return;
  }
  RTC_LOG(LS_VERBOSE) << "Releasing " << TransferStateToString(it->second->state())
                      << " transfer " << transfer_id;
  transfers_.erase(it);
}

void TransferRegistry::OnTransferProgress(FileTransfer* transfer) {
  observer_->OnTransferProgress(transfer->info());
}

void TransferRegistry::OnTransferCheckpoint(FileTransfer* transfer) {
  if (IsTerminal(transfer->state())) {
    return;
  }
  const TransferInfo& info = transfer->info();
  TransferCheckpoint checkpoint;
  checkpoint.transfer_id = info.transfer_id;
  checkpoint.peer_id = info.peer_id;
  checkpoint.outgoing = transfer->outgoing();
  checkpoint.file_name = info.file_name;
  checkpoint.mime_type = info.mime_type;
  checkpoint.sha256 = info.sha256;
  checkpoint.file_size = info.file_size;
  checkpoint.chunk_size = info.chunk_size;
  checkpoint.bytes_transferred = info.bytes_transferred;
  checkpoint.capability_class = info.capability_class;
  checkpoint.location = transfer->location();
  checkpoints_->Save(checkpoint);
}

void TransferRegistry::AdmitQueuedSends() {
  if (admitting_ || shutting_down_) {
    return;
  }
  admitting_ = true;
  while (!send_queue_.empty() && active_sends() < config_.max_concurrent_transfers) {
    std::string transfer_id = send_queue_.front();
    send_queue_.pop_front();
    FileTransfer* transfer = Find(transfer_id);
    if (!transfer || transfer->state() != TransferState::kAccepted) {
      continue;
    }
    Result<TransferState> started = transfer->StartTransport();
    if (!started.ok()) {
      RTC_LOG(LS_ERROR) << "Could not start " << transfer_id << ": " << started.error();
    }
  }
  if (!send_queue_.empty()) {
    RTC_LOG(LS_INFO) << send_queue_.size() << " accepted send(s) waiting for a slot";
  }
  admitting_ = false;
}
