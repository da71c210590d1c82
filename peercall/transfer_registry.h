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

#ifndef PEERCALL_TRANSFER_REGISTRY_H_
#define PEERCALL_TRANSFER_REGISTRY_H_

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"

#include "checkpoint_store.h"
#include "config.h"
#include "file_transfer.h"
#include "result.h"
#include "signaling.h"

class TransferObserver {
 public:
  virtual ~TransferObserver() = default;

  // A request passed the capability check and awaits Respond().
  virtual void OnIncomingTransfer(const TransferInfo& info) = 0;
  virtual void OnTransferStateChanged(const TransferInfo& info) = 0;
  virtual void OnTransferProgress(const TransferInfo& info) {}
};

std::string GuessMimeType(const std::string& file_name);

// Owns every FileTransfer of this client, keyed by transfer id. Finished
// transfers are released after TransferConfig::finished_retention_ms.
class TransferRegistry : public FileTransferDelegate {
 public:
  TransferRegistry(const TransferConfig& config,
                   const CapabilityDescriptor& capability,
                   SignalingChannel* signaling,
                   ByteTransportFactory* transport_factory,
                   CheckpointStore* checkpoints,
                   webrtc::TaskQueueBase* loop,
                   webrtc::Clock* clock,
                   TransferObserver* observer);
  ~TransferRegistry() override;

  TransferRegistry(const TransferRegistry&) = delete;
  TransferRegistry& operator=(const TransferRegistry&) = delete;

  // Reloads persisted transfers as Paused. Returns how many were restored.
  size_t Start();
  // Pauses every active transfer, checkpointing it.
  void Shutdown();

  Result<std::string> Propose(const std::string& path, const std::string& peer_id);
  Result<std::string> ProposeSource(const std::string& peer_id,
                                    const std::string& file_name,
                                    const std::string& mime_type,
                                    std::unique_ptr<ByteSource> source);
  Result<TransferState> Respond(const std::string& transfer_id, bool accept);
  Result<TransferState> Pause(const std::string& transfer_id);
  Result<TransferState> Resume(const std::string& transfer_id);
  Result<TransferState> Cancel(const std::string& transfer_id);

  // Routes transfer.* messages.
  void HandleSignal(const SignalMessage& message);

  FileTransfer* Find(const std::string& transfer_id) const;
  std::vector<TransferInfo> List() const;
  int active_sends() const;
  size_t size() const { return transfers_.size(); }
  const CapabilityDescriptor& capability() const { return capability_; }

  // FileTransferDelegate
  void OnTransferStateChanged(FileTransfer* transfer) override;
  void OnTransferProgress(FileTransfer* transfer) override;
  void OnTransferCheckpoint(FileTransfer* transfer) override;

 private:
  void HandleRequest(const SignalMessage& message);
  bool RestoreCheckpoint(const TransferCheckpoint& checkpoint);
  void AdmitQueuedSends();
  void Release(const std::string& transfer_id);

  const TransferConfig config_;
  const CapabilityDescriptor capability_;
  SignalingChannel* signaling_;
  ByteTransportFactory* transport_factory_;
  CheckpointStore* checkpoints_;
  webrtc::TaskQueueBase* loop_;
  webrtc::Clock* clock_;
  TransferObserver* observer_;

  std::map<std::string, std::unique_ptr<FileTransfer>> transfers_;
  // Accepted sends waiting for a concurrency slot, oldest first.
  std::deque<std::string> send_queue_;
  bool admitting_ = false;
  bool shutting_down_ = false;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
};

#endif  // PEERCALL_TRANSFER_REGISTRY_H_
