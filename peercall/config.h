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

#ifndef PEERCALL_CONFIG_H_
#define PEERCALL_CONFIG_H_

#include <cstdint>
#include <string>

inline constexpr uint64_t kKiB = 1024;
inline constexpr uint64_t kMiB = 1024 * kKiB;
inline constexpr uint64_t kGiB = 1024 * kMiB;

struct PeerLinkConfig {
  int ice_grace_period_ms = 5000;
  int max_reconnect_attempts = 3;
};

struct CallConfig {
  PeerLinkConfig link;
  int connecting_timeout_ms = 60000;
  int max_group_members = 6;
};

struct TransferConfig {
  uint32_t chunk_size = 16384;
  uint64_t high_water_mark = 4 * kMiB;
  uint64_t low_water_mark = 2 * kMiB;
  int checkpoint_interval_chunks = 200;
  int stall_timeout_ms = 30000;
  int connect_timeout_ms = 60000;
  int max_concurrent_transfers = 3;
  uint64_t max_hash_file_size = 500 * kMiB;
  int max_send_retries = 3;
  // How long a finished transfer stays queryable before it is released.
  int finished_retention_ms = 30000;
};

// Largest chunk a peer may ask for.
inline constexpr uint32_t kMaxChunkSize = 256 * kKiB;

enum class CapabilityClass { kMemoryBuffered, kStreamingDisk };

inline constexpr uint64_t kMemoryBufferedMaxFileSize = 2 * kGiB;
inline constexpr uint64_t kStreamingDiskMaxFileSize = 100 * kGiB;

// What this client can receive. Resolved once at startup.
struct CapabilityDescriptor {
  CapabilityClass capability_class = CapabilityClass::kMemoryBuffered;
  uint64_t max_file_size = kMemoryBufferedMaxFileSize;
  std::string download_dir = ".";

  static CapabilityDescriptor MemoryBuffered() { return {}; }
  static CapabilityDescriptor StreamingDisk(const std::string& dir) {
    return {CapabilityClass::kStreamingDisk, kStreamingDiskMaxFileSize, dir};
  }
};

#endif  // PEERCALL_CONFIG_H_
