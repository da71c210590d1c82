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

#ifndef PEERCALL_CHECKPOINT_STORE_H_
#define PEERCALL_CHECKPOINT_STORE_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config.h"

// Small durable key-value store.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual bool Get(const std::string& key, std::string* value) const = 0;
  virtual bool Put(const std::string& key, const std::string& value) = 0;
  virtual bool Remove(const std::string& key) = 0;
  virtual std::vector<std::string> Keys(const std::string& prefix) const = 0;
};

class MemoryStore : public KeyValueStore {
 public:
  bool Get(const std::string& key, std::string* value) const override;
  bool Put(const std::string& key, const std::string& value) override;
  bool Remove(const std::string& key) override;
  std::vector<std::string> Keys(const std::string& prefix) const override;

 private:
  std::map<std::string, std::string> entries_;
};

// One JSON object per file, rewritten through a temporary file and rename on
// every change.
class JsonFileStore : public KeyValueStore {
 public:
  explicit JsonFileStore(std::string path);

  // Reads the file if present. A missing file is an empty store.
  bool Load();

  bool Get(const std::string& key, std::string* value) const override;
  bool Put(const std::string& key, const std::string& value) override;
  bool Remove(const std::string& key) override;
  std::vector<std::string> Keys(const std::string& prefix) const override;

  const std::string& path() const { return path_; }

 private:
  bool Save() const;

  const std::string path_;
  std::map<std::string, std::string> entries_;
};

// Persisted progress of one transfer.
struct TransferCheckpoint {
  std::string transfer_id;
  std::string peer_id;
  bool outgoing = false;
  std::string file_name;
  std::string mime_type;
  std::string sha256;
  uint64_t file_size = 0;
  uint32_t chunk_size = 0;
  uint64_t bytes_transferred = 0;
  CapabilityClass capability_class = CapabilityClass::kMemoryBuffered;
  // Sender: file to reopen. Receiver: directory of the partial file.
  std::string location;
};

std::string EncodeCheckpoint(const TransferCheckpoint& checkpoint);
bool DecodeCheckpoint(const std::string& text, TransferCheckpoint* checkpoint);

// Checkpoints under "transfer/<id>". A stored offset never moves backwards.
class CheckpointStore {
 public:
  static constexpr char kKeyPrefix[] = "transfer/";

  explicit CheckpointStore(KeyValueStore* store) : store_(store) {}

  bool Save(const TransferCheckpoint& checkpoint);
  bool Load(const std::string& transfer_id, TransferCheckpoint* checkpoint) const;
  std::vector<TransferCheckpoint> LoadAll() const;
  bool Remove(const std::string& transfer_id);

 private:
  KeyValueStore* store_;
};

#endif  // PEERCALL_CHECKPOINT_STORE_H_
