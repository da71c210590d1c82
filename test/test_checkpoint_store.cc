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
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "checkpoint_store.h"

namespace {

TransferCheckpoint Checkpoint(const std::string& id, uint64_t bytes) {
  TransferCheckpoint checkpoint;
  checkpoint.transfer_id = id;
  checkpoint.peer_id = "bob";
  checkpoint.outgoing = true;
  checkpoint.file_name = "movie.mp4";
  checkpoint.mime_type = "video/mp4";
  checkpoint.sha256 = "ab12";
  checkpoint.file_size = 5 * kGiB;
  checkpoint.chunk_size = 16384;
  checkpoint.bytes_transferred = bytes;
  checkpoint.capability_class = CapabilityClass::kStreamingDisk;
  checkpoint.location = "/home/alice/movie.mp4";
  return checkpoint;
}

}  // namespace

TEST(checkpoint, record_keeps_every_field)
{
  TransferCheckpoint decoded;
  ASSERT_TRUE(DecodeCheckpoint(EncodeCheckpoint(Checkpoint("t-1", 3 * kGiB)), &decoded));
  EXPECT_EQ("t-1", decoded.transfer_id);
  EXPECT_EQ("bob", decoded.peer_id);
  EXPECT_TRUE(decoded.outgoing);
  EXPECT_EQ("video/mp4", decoded.mime_type);
  EXPECT_EQ(5 * kGiB, decoded.file_size);
  EXPECT_EQ(3 * kGiB, decoded.bytes_transferred);
  EXPECT_EQ(CapabilityClass::kStreamingDisk, decoded.capability_class);
  EXPECT_EQ("/home/alice/movie.mp4", decoded.location);
}

TEST(checkpoint, record_needs_progress_fields)
{
  TransferCheckpoint decoded;
  EXPECT_FALSE(DecodeCheckpoint("{\"transferId\":\"t-1\"}", &decoded));
  EXPECT_FALSE(DecodeCheckpoint("garbage", &decoded));
  ASSERT_TRUE(DecodeCheckpoint(
      "{\"transferId\":\"t-1\",\"fileSize\":10,\"bytesTransferred\":4}", &decoded));
  EXPECT_FALSE(decoded.outgoing);
  EXPECT_EQ(CapabilityClass::kMemoryBuffered, decoded.capability_class);
}

TEST(checkpoint_store, offset_never_moves_backwards)
{
  MemoryStore store;
  CheckpointStore checkpoints(&store);
  ASSERT_TRUE(checkpoints.Save(Checkpoint("t-1", 4000)));
  EXPECT_FALSE(checkpoints.Save(Checkpoint("t-1", 2000)));
  ASSERT_TRUE(checkpoints.Save(Checkpoint("t-1", 4000)));

  TransferCheckpoint loaded;
  ASSERT_TRUE(checkpoints.Load("t-1", &loaded));
  EXPECT_EQ(4000u, loaded.bytes_transferred);

  ASSERT_TRUE(checkpoints.Remove("t-1"));
  EXPECT_FALSE(checkpoints.Load("t-1", &loaded));
  ASSERT_TRUE(checkpoints.Save(Checkpoint("t-1", 10)));
}

TEST(checkpoint_store, load_all_skips_foreign_and_corrupt_keys)
{
  MemoryStore store;
  CheckpointStore checkpoints(&store);
  ASSERT_TRUE(checkpoints.Save(Checkpoint("t-1", 1)));
  ASSERT_TRUE(checkpoints.Save(Checkpoint("t-2", 2)));
  store.Put("settings/theme", "dark");
  store.Put("transfer/t-3", "not json");

  std::vector<TransferCheckpoint> all = checkpoints.LoadAll();
  ASSERT_EQ(2u, all.size());
  EXPECT_EQ("t-1", all[0].transfer_id);
  EXPECT_EQ("t-2", all[1].transfer_id);
  EXPECT_EQ(3u, store.Keys("transfer/").size());
}

TEST(json_file_store, survives_reload)
{
  std::string path = ::testing::TempDir() + "/peercall_store_test.json";
  std::remove(path.c_str());

  {
    JsonFileStore store(path);
    ASSERT_TRUE(store.Load());
    EXPECT_TRUE(store.Keys("").empty());
    CheckpointStore checkpoints(&store);
    ASSERT_TRUE(checkpoints.Save(Checkpoint("t-1", 777)));
    ASSERT_TRUE(store.Put("other", "value"));
  }

  JsonFileStore reopened(path);
  ASSERT_TRUE(reopened.Load());
  CheckpointStore checkpoints(&reopened);
  TransferCheckpoint loaded;
  ASSERT_TRUE(checkpoints.Load("t-1", &loaded));
  EXPECT_EQ(777u, loaded.bytes_transferred);
  std::string value;
  ASSERT_TRUE(reopened.Get("other", &value));
  EXPECT_EQ("value", value);

  ASSERT_TRUE(reopened.Remove("other"));
  EXPECT_FALSE(reopened.Remove("other"));
  std::remove(path.c_str());
}

TEST(json_file_store, corrupt_file_fails_to_load)
{
  std::string path = ::testing::TempDir() + "/peercall_corrupt_test.json";
  FILE* fp = fopen(path.c_str(), "wb");
  ASSERT_NE(nullptr, fp);
  fputs("{ not json", fp);
  fclose(fp);

  JsonFileStore store(path);
  EXPECT_FALSE(store.Load());
  std::remove(path.c_str());
}
