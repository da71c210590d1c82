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

#include <cstdio>
#include <memory>
#include <utility>

#include <json/json.h>

#include "rtc_base/logging.h"

#include "checkpoint_store.h"

namespace {

std::vector<std::string> KeysWithPrefix(const std::map<std::string, std::string>& entries,
                                        const std::string& prefix) {
  std::vector<std::string> keys;
  for (auto it = entries.lower_bound(prefix); it != entries.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    keys.push_back(it->first);
  }
  return keys;
}

}  // namespace

// ---------------------------------------------------------------------------
//  MemoryStore
// ---------------------------------------------------------------------------

bool MemoryStore::Get(const std::string& key, std::string* value) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  *value = it->second;
  return true;
}

bool MemoryStore::Put(const std::string& key, const std::string& value) {
  entries_[key] = value;
  return true;
}

bool MemoryStore::Remove(const std::string& key) {
  return entries_.erase(key) > 0;
}

std::vector<std::string> MemoryStore::Keys(const std::string& prefix) const {
  return KeysWithPrefix(entries_, prefix);
}

// ---------------------------------------------------------------------------
//  JsonFileStore
// ---------------------------------------------------------------------------

JsonFileStore::JsonFileStore(std::string path) : path_(std::move(path)) {}

bool JsonFileStore::Load() {
  entries_.clear();
  FILE* fp = fopen(path_.c_str(), "rb");
  if (!fp) {
    RTC_LOG(LS_INFO) << "No state file at " << path_ << ", starting empty";
    return true;
  }
  std::string contents;
  char buffer[4096];
  size_t got;
  while ((got = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
    contents.append(buffer, got);
  }
  fclose(fp);

  Json::Value root;
  Json::CharReaderBuilder reader_builder;
  std::string errs;
  std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
  if (!reader->parse(contents.data(), contents.data() + contents.size(), &root, &errs) ||
      !root.isObject()) {
    RTC_LOG(LS_ERROR) << "Corrupt state file " << path_ << ": " << errs;
    return false;
  }
  for (const auto& key : root.getMemberNames()) {
    if (root[key].isString()) {
      entries_[key] = root[key].asString();
    }
  }
  RTC_LOG(LS_INFO) << "Loaded " << entries_.size() << " entries from " << path_;
  return true;
}

bool JsonFileStore::Get(const std::string& key, std::string* value) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  *value = it->second;
  return true;
}

bool JsonFileStore::Put(const std::string& key, const std::string& value) {
  entries_[key] = value;
  return Save();
}

bool JsonFileStore::Remove(const std::string& key) {
  if (entries_.erase(key) == 0) {
    return false;
  }
  return Save();
}

std::vector<std::string> JsonFileStore::Keys(const std::string& prefix) const {
  return KeysWithPrefix(entries_, prefix);
}

bool JsonFileStore::Save() const {
  Json::Value root(Json::objectValue);
  for (const auto& entry : entries_) {
    root[entry.first] = entry.second;
  }
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  std::string text = Json::writeString(writer, root);

  std::string temp_path = path_ + ".tmp";
  FILE* fp = fopen(temp_path.c_str(), "wb");
  if (!fp) {
    RTC_LOG(LS_ERROR) << "Cannot write state file " << temp_path;
    return false;
  }
  bool written = fwrite(text.data(), 1, text.size(), fp) == text.size();
  written = (fflush(fp) == 0) && written;
  fclose(fp);
  if (!written) {
    RTC_LOG(LS_ERROR) << "Short write on " << temp_path;
    remove(temp_path.c_str());
    return false;
  }
  if (rename(temp_path.c_str(), path_.c_str()) != 0) {
    RTC_LOG(LS_ERROR) << "Cannot replace state file " << path_;
    remove(temp_path.c_str());
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
//  Checkpoints
// ---------------------------------------------------------------------------

std::string EncodeCheckpoint(const TransferCheckpoint& checkpoint) {
  Json::Value json(Json::objectValue);
  json["transferId"] = checkpoint.transfer_id;
  json["peerId"] = checkpoint.peer_id;
  json["direction"] = checkpoint.outgoing ? "send" : "receive";
  json["fileName"] = checkpoint.file_name;
  json["mimeType"] = checkpoint.mime_type;
  if (!checkpoint.sha256.empty()) {
    json["sha256"] = checkpoint.sha256;
  }
  json["fileSize"] = Json::UInt64(checkpoint.file_size);
  json["chunkSize"] = Json::UInt(checkpoint.chunk_size);
  json["bytesTransferred"] = Json::UInt64(checkpoint.bytes_transferred);
  json["capability"] = checkpoint.capability_class == CapabilityClass::kStreamingDisk
                           ? "disk"
                           : "memory";
  json["location"] = checkpoint.location;

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, json);
}

bool DecodeCheckpoint(const std::string& text, TransferCheckpoint* checkpoint) {
  Json::Value json;
  Json::CharReaderBuilder reader_builder;
  std::string errs;
  std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
  if (!reader->parse(text.data(), text.data() + text.size(), &json, &errs) ||
      !json.isObject()) {
    RTC_LOG(LS_ERROR) << "Bad checkpoint record: " << errs;
    return false;
  }
  if (!json.isMember("transferId") || !json["transferId"].isString() ||
      !json.isMember("fileSize") || !json["fileSize"].isIntegral() ||
      !json.isMember("bytesTransferred") || !json["bytesTransferred"].isIntegral()) {
    RTC_LOG(LS_ERROR) << "Checkpoint record is missing fields";
    return false;
  }
  checkpoint->transfer_id = json["transferId"].asString();
  checkpoint->peer_id = json.get("peerId", "").asString();
  checkpoint->outgoing = json.get("direction", "receive").asString() == "send";
  checkpoint->file_name = json.get("fileName", "").asString();
  checkpoint->mime_type = json.get("mimeType", "").asString();
  checkpoint->sha256 = json.get("sha256", "").asString();
  checkpoint->file_size = json["fileSize"].asUInt64();
  checkpoint->chunk_size = json.get("chunkSize", Json::UInt(0)).asUInt();
  checkpoint->bytes_transferred = json["bytesTransferred"].asUInt64();
  checkpoint->capability_class = json.get("capability", "memory").asString() == "disk"
                                     ? CapabilityClass::kStreamingDisk
                                     : CapabilityClass::kMemoryBuffered;
  checkpoint->location = json.get("location", "").asString();
  return true;
}

bool CheckpointStore::Save(const TransferCheckpoint& checkpoint) {
  std::string key = kKeyPrefix + checkpoint.transfer_id;
  std::string existing_text;
  TransferCheckpoint existing;
  if (store_->Get(key, &existing_text) && DecodeCheckpoint(existing_text, &existing) &&
      existing.bytes_transferred > checkpoint.bytes_transferred) {
    RTC_LOG(LS_WARNING) << "Refusing to move checkpoint of " << checkpoint.transfer_id
                        << " back from " << existing.bytes_transferred << " to "
                        << checkpoint.bytes_transferred;
    return false;
  }
  if (!store_->Put(key, EncodeCheckpoint(checkpoint))) {
    RTC_LOG(LS_ERROR) << "Could not persist checkpoint of " << checkpoint.transfer_id;
    return false;
  }
  RTC_LOG(LS_VERBOSE) << "Checkpoint " << checkpoint.transfer_id << " at "
                      << checkpoint.bytes_transferred << "/" << checkpoint.file_size;
  return true;
}

bool CheckpointStore::Load(const std::string& transfer_id,
                           TransferCheckpoint* checkpoint) const {
  std::string text;
  if (!store_->Get(kKeyPrefix + transfer_id, &text)) {
    return false;
  }
  return DecodeCheckpoint(text, checkpoint);
}

std::vector<TransferCheckpoint> CheckpointStore::LoadAll() const {
  std::vector<TransferCheckpoint> checkpoints;
  for (const auto& key : store_->Keys(kKeyPrefix)) {
    std::string text;
    TransferCheckpoint checkpoint;
    if (store_->Get(key, &text) && DecodeCheckpoint(text, &checkpoint)) {
      checkpoints.push_back(checkpoint);
    } else {
      RTC_LOG(LS_WARNING) << "Skipping unreadable checkpoint " << key;
    }
  }
  return checkpoints;
}

bool CheckpointStore::Remove(const std::string& transfer_id) {
  return store_->Remove(kKeyPrefix + transfer_id);
}
