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
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "api/units/time_delta.h"
#include "gtest/gtest.h"

#include "fakes.h"
#include "transfer_registry.h"

namespace {

constexpr uint32_t kChunk = 1000;

std::vector<uint8_t> Pattern(size_t size) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>((i * 13 + 1) & 0xFF);
  }
  return data;
}

std::vector<uint8_t> Frame(uint32_t sequence, const std::vector<uint8_t>& data) {
  std::vector<uint8_t> frame;
  size_t offset = static_cast<size_t>(sequence) * kChunk;
  size_t length = std::min<size_t>(kChunk, data.size() - offset);
  EncodeChunkFrame(sequence, data.data() + offset, length, &frame);
  return frame;
}

uint32_t SequenceOf(const std::vector<uint8_t>& frame) {
  uint32_t sequence = 0;
  const uint8_t* payload;
  size_t payload_size;
  EXPECT_TRUE(DecodeChunkFrame(frame.data(), frame.size(), &sequence, &payload, &payload_size));
  return sequence;
}

bool WriteFile(const std::string& path, const std::vector<uint8_t>& data) {
  FILE* fp = fopen(path.c_str(), "wb");
  if (!fp) {
    return false;
  }
  bool ok = fwrite(data.data(), 1, data.size(), fp) == data.size();
  return fclose(fp) == 0 && ok;
}

class RecordingTransferObserver : public TransferObserver {
 public:
  void OnIncomingTransfer(const TransferInfo& info) override { incoming.push_back(info); }
  void OnTransferStateChanged(const TransferInfo& info) override {
    changes.push_back(info.state);
  }

  std::vector<TransferInfo> incoming;
  std::vector<TransferState> changes;
};

class TransferRegistryTest : public ::testing::Test {
 protected:
  TransferRegistryTest() { config_.chunk_size = kChunk; }

  std::unique_ptr<TransferRegistry> MakeRegistry(const CapabilityDescriptor& capability) {
    return std::make_unique<TransferRegistry>(config_, capability, &signaling_, &factory_,
                                              &checkpoints_, &loop_, loop_.clock(),
                                              &observer_);
  }

  SignalMessage Request(const std::string& transfer_id, uint64_t file_size,
                        const std::string& sha256) {
    return FromPeer("bob", signaling::TransferRequest("alice", transfer_id, "notes.txt",
                                                      file_size, "text/plain", kChunk,
                                                      sha256));
  }

  SignalMessage Control(const char* type, const std::string& transfer_id) {
    return FromPeer("bob", signaling::TransferControl(type, "alice", transfer_id));
  }

  FakeTaskQueue loop_;
  RecordingSignaling signaling_;
  FakeByteTransportFactory factory_;
  MemoryStore store_;
  CheckpointStore checkpoints_{&store_};
  RecordingTransferObserver observer_;
  TransferConfig config_;
};

}  // namespace

TEST(transfer_registry, guesses_mime_types)
{
  EXPECT_EQ("image/png", GuessMimeType("holiday.PNG"));
  EXPECT_EQ("application/pdf", GuessMimeType("report.final.pdf"));
  EXPECT_EQ("application/octet-stream", GuessMimeType("Makefile"));
}

TEST_F(TransferRegistryTest, oversized_request_is_refused_automatically)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(Request("t-big", 5 * kGiB, ""));

  EXPECT_TRUE(observer_.incoming.empty());
  const SignalMessage* reject = signaling_.Last(Msg::kTransferReject);
  ASSERT_NE(nullptr, reject);
  EXPECT_EQ("bob", reject->peer_id);
  EXPECT_EQ("t-big", reject->GetString("transferId"));
  EXPECT_EQ(TransferReason::kCapacityExceeded, reject->GetString("reason"));
  ASSERT_NE(nullptr, registry->Find("t-big"));
  EXPECT_EQ(TransferState::kRejected, registry->Find("t-big")->state());
  EXPECT_EQ(0, factory_.created);
}

TEST_F(TransferRegistryTest, disk_capability_takes_large_files)
{
  auto registry = MakeRegistry(CapabilityDescriptor::StreamingDisk(::testing::TempDir()));
  registry->HandleSignal(Request("t-big", 5 * kGiB, ""));
  ASSERT_EQ(1u, observer_.incoming.size());
  EXPECT_EQ(5 * kGiB, observer_.incoming[0].file_size);
  EXPECT_EQ(0u, signaling_.Count(Msg::kTransferReject));
}

TEST_F(TransferRegistryTest, request_waits_for_the_user)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(Request("t-1", 3000, ""));
  ASSERT_EQ(1u, observer_.incoming.size());
  EXPECT_EQ("notes.txt", observer_.incoming[0].file_name);
  EXPECT_EQ(TransferDirection::kReceive, observer_.incoming[0].direction);

  // A repeated request changes nothing.
  registry->HandleSignal(Request("t-1", 3000, ""));
  EXPECT_EQ(1u, observer_.incoming.size());
  EXPECT_EQ(1u, registry->size());

  ASSERT_TRUE(registry->Respond("t-1", false).ok());
  EXPECT_EQ(TransferState::kRejected, registry->Find("t-1")->state());
  EXPECT_EQ(TransferReason::kUserRejected,
            signaling_.Last(Msg::kTransferReject)->GetString("reason"));
  EXPECT_EQ(ErrorKind::kUnknownTransfer, registry->Respond("t-404", true).kind());
}

TEST_F(TransferRegistryTest, request_file_name_is_sanitized)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(FromPeer(
      "bob", signaling::TransferRequest("alice", "t-1", "../../etc/passwd", 10, "", kChunk, "")));
  ASSERT_EQ(1u, observer_.incoming.size());
  EXPECT_EQ("passwd", observer_.incoming[0].file_name);
}

TEST_F(TransferRegistryTest, oversized_chunks_are_refused)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(FromPeer(
      "bob", signaling::TransferRequest("alice", "t-1", "notes.txt", 4 * kMiB, "text/plain",
                                        kMaxChunkSize + 1, "")));

  EXPECT_TRUE(observer_.incoming.empty());
  const SignalMessage* reject = signaling_.Last(Msg::kTransferReject);
  ASSERT_NE(nullptr, reject);
  EXPECT_EQ(TransferReason::kUnsupportedChunkSize, reject->GetString("reason"));
  ASSERT_NE(nullptr, registry->Find("t-1"));
  EXPECT_EQ(TransferState::kRejected, registry->Find("t-1")->state());
  EXPECT_EQ(0, factory_.created);

  // The largest allowed chunk is taken as offered.
  registry->HandleSignal(FromPeer(
      "bob", signaling::TransferRequest("alice", "t-2", "notes.txt", 4 * kMiB, "text/plain",
                                        kMaxChunkSize, "")));
  ASSERT_EQ(1u, observer_.incoming.size());
  EXPECT_EQ(kMaxChunkSize, observer_.incoming[0].chunk_size);
}

TEST_F(TransferRegistryTest, malformed_request_is_dropped)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  SignalMessage request = Request("", 10, "");
  registry->HandleSignal(request);
  EXPECT_EQ(0u, registry->size());
  EXPECT_TRUE(signaling_.sent.empty());
}

TEST_F(TransferRegistryTest, unknown_transfer_is_answered_once)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(Control(Msg::kTransferAccept, "t-ghost"));
  const SignalMessage* cancel = signaling_.Last(Msg::kTransferCancel);
  ASSERT_NE(nullptr, cancel);
  EXPECT_EQ("t-ghost", cancel->GetString("transferId"));
  EXPECT_EQ(TransferReason::kUnknownTransfer, cancel->GetString("reason"));

  signaling_.Clear();
  registry->HandleSignal(FromPeer(
      "bob", signaling::TransferWithReason(Msg::kTransferCancel, "alice", "t-ghost",
                                           TransferReason::kUnknownTransfer)));
  registry->HandleSignal(Control(Msg::kTransferComplete, "t-ghost"));
  EXPECT_TRUE(signaling_.sent.empty());
}

TEST_F(TransferRegistryTest, propose_needs_signaling)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  signaling_.connected = false;
  auto proposed = registry->ProposeSource(
      "bob", "a.bin", "", std::make_unique<MemoryByteSource>(Pattern(100)));
  EXPECT_EQ(ErrorKind::kSignalingUnavailable, proposed.kind());
  EXPECT_EQ(0u, registry->size());

  EXPECT_EQ(ErrorKind::kInvalidState, registry->Propose("/no/such/file", "bob").kind());
}

TEST_F(TransferRegistryTest, accepted_sends_wait_for_a_slot)
{
  config_.max_concurrent_transfers = 1;
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  auto first = registry->ProposeSource("bob", "one.bin", "",
                                       std::make_unique<MemoryByteSource>(Pattern(2500)));
  auto second = registry->ProposeSource("bob", "two.bin", "",
                                        std::make_unique<MemoryByteSource>(Pattern(1500)));
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_NE(first.value(), second.value());
  EXPECT_EQ(2u, signaling_.Count(Msg::kTransferRequest));

  registry->HandleSignal(Control(Msg::kTransferAccept, first.value()));
  registry->HandleSignal(Control(Msg::kTransferAccept, second.value()));
  EXPECT_EQ(TransferState::kConnecting, registry->Find(first.value())->state());
  EXPECT_EQ(TransferState::kAccepted, registry->Find(second.value())->state());
  EXPECT_EQ(1, registry->active_sends());
  EXPECT_EQ(1, factory_.created);

  factory_.transport(first.value())->FireOpen();
  registry->HandleSignal(Control(Msg::kTransferComplete, first.value()));
  EXPECT_EQ(TransferState::kCompleted, registry->Find(first.value())->state());
  EXPECT_EQ(TransferState::kConnecting, registry->Find(second.value())->state());
  EXPECT_EQ(1, registry->active_sends());
}

TEST_F(TransferRegistryTest, cancel_frees_a_slot)
{
  config_.max_concurrent_transfers = 1;
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  auto first = registry->ProposeSource("bob", "one.bin", "",
                                       std::make_unique<MemoryByteSource>(Pattern(10)));
  auto second = registry->ProposeSource("bob", "two.bin", "",
                                        std::make_unique<MemoryByteSource>(Pattern(10)));
  registry->HandleSignal(Control(Msg::kTransferAccept, first.value()));
  registry->HandleSignal(Control(Msg::kTransferAccept, second.value()));

  ASSERT_TRUE(registry->Cancel(first.value()).ok());
  EXPECT_EQ(TransferState::kCancelled, registry->Find(first.value())->state());
  EXPECT_EQ(TransferState::kConnecting, registry->Find(second.value())->state());
  EXPECT_EQ(ErrorKind::kUnknownTransfer, registry->Cancel("t-404").kind());
}

TEST_F(TransferRegistryTest, list_reports_every_transfer)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(Request("t-in", 10, ""));
  auto out = registry->ProposeSource("bob", "x.bin", "",
                                     std::make_unique<MemoryByteSource>(Pattern(10)));
  ASSERT_TRUE(out.ok());
  std::vector<TransferInfo> infos = registry->List();
  ASSERT_EQ(2u, infos.size());
  int incoming = 0;
  for (const auto& info : infos) {
    if (info.direction == TransferDirection::kReceive) {
      ++incoming;
      EXPECT_EQ("t-in", info.transfer_id);
    }
  }
  EXPECT_EQ(1, incoming);
}

TEST_F(TransferRegistryTest, paused_receive_survives_restart)
{
  const std::string dir = ::testing::TempDir();
  std::remove((dir + "/notes.txt").c_str());
  std::remove((dir + "/notes.txt.t-9.part").c_str());

  std::vector<uint8_t> data = Pattern(10 * kChunk);
  std::string digest = Sha256Hex(data.data(), data.size());
  CapabilityDescriptor disk = CapabilityDescriptor::StreamingDisk(dir);

  {
    auto registry = MakeRegistry(disk);
    registry->HandleSignal(Request("t-9", data.size(), digest));
    ASSERT_TRUE(registry->Respond("t-9", true).ok());
    factory_.transport("t-9")->FireOpen();
    for (uint32_t sequence = 0; sequence < 4; ++sequence) {
      std::vector<uint8_t> frame = Frame(sequence, data);
      factory_.transport("t-9")->observer->OnTransportMessage(frame.data(), frame.size());
    }
    ASSERT_TRUE(registry->Pause("t-9").ok());
    EXPECT_EQ(1u, signaling_.Count(Msg::kTransferPause));
    loop_.RunPending();
  }

  TransferCheckpoint saved;
  ASSERT_TRUE(checkpoints_.Load("t-9", &saved));
  EXPECT_EQ(4u * kChunk, saved.bytes_transferred);
  EXPECT_FALSE(saved.outgoing);
  EXPECT_EQ(CapabilityClass::kStreamingDisk, saved.capability_class);

  auto registry = MakeRegistry(disk);
  EXPECT_EQ(1u, registry->Start());
  FileTransfer* restored = registry->Find("t-9");
  ASSERT_NE(nullptr, restored);
  EXPECT_EQ(TransferState::kPaused, restored->state());
  EXPECT_EQ(4u * kChunk, restored->info().bytes_transferred);
  EXPECT_EQ(digest, restored->info().sha256);

  ASSERT_TRUE(registry->Resume("t-9").ok());
  const SignalMessage* resume = signaling_.Last(Msg::kTransferResume);
  ASSERT_NE(nullptr, resume);
  EXPECT_EQ(4000, resume->GetInt("offset"));

  factory_.transport("t-9")->FireOpen();
  for (uint32_t sequence = 4; sequence < 10; ++sequence) {
    std::vector<uint8_t> frame = Frame(sequence, data);
    factory_.transport("t-9")->observer->OnTransportMessage(frame.data(), frame.size());
  }
  EXPECT_EQ(TransferState::kCompleted, restored->state());
  EXPECT_FALSE(checkpoints_.Load("t-9", &saved));

  auto* sink = static_cast<DiskByteSink*>(restored->sink());
  std::string written;
  ASSERT_TRUE(ComputeFileSha256(sink->final_path(), data.size(), &written));
  EXPECT_EQ(digest, written);
  std::remove(sink->final_path().c_str());
}

TEST_F(TransferRegistryTest, memory_receives_are_not_restored)
{
  {
    auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
    registry->HandleSignal(Request("t-m", 5 * kChunk, ""));
    ASSERT_TRUE(registry->Respond("t-m", true).ok());
    factory_.transport("t-m")->FireOpen();
    std::vector<uint8_t> frame = Frame(0, Pattern(5 * kChunk));
    factory_.transport("t-m")->observer->OnTransportMessage(frame.data(), frame.size());
    ASSERT_TRUE(registry->Pause("t-m").ok());
    loop_.RunPending();
  }
  TransferCheckpoint saved;
  ASSERT_TRUE(checkpoints_.Load("t-m", &saved));

  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  EXPECT_EQ(0u, registry->Start());
  EXPECT_EQ(nullptr, registry->Find("t-m"));
  EXPECT_FALSE(checkpoints_.Load("t-m", &saved));
}

TEST_F(TransferRegistryTest, shutdown_suspends_quietly)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(Request("t-1", 5 * kChunk, ""));
  ASSERT_TRUE(registry->Respond("t-1", true).ok());
  factory_.transport("t-1")->FireOpen();
  signaling_.Clear();

  registry->Shutdown();
  EXPECT_EQ(TransferState::kPaused, registry->Find("t-1")->state());
  EXPECT_TRUE(signaling_.sent.empty());
  TransferCheckpoint saved;
  EXPECT_TRUE(checkpoints_.Load("t-1", &saved));
}

TEST_F(TransferRegistryTest, terminal_transfers_drop_their_checkpoint)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(Request("t-1", 5 * kChunk, ""));
  ASSERT_TRUE(registry->Respond("t-1", true).ok());
  factory_.transport("t-1")->FireOpen();
  ASSERT_TRUE(registry->Pause("t-1").ok());
  TransferCheckpoint saved;
  ASSERT_TRUE(checkpoints_.Load("t-1", &saved));

  ASSERT_TRUE(registry->Cancel("t-1").ok());
  EXPECT_FALSE(checkpoints_.Load("t-1", &saved));
  EXPECT_EQ(TransferState::kCancelled, observer_.changes.back());
}

TEST_F(TransferRegistryTest, finished_transfers_are_released)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  std::vector<uint8_t> data = Pattern(3 * kChunk);
  registry->HandleSignal(Request("t-1", data.size(), Sha256Hex(data.data(), data.size())));
  ASSERT_TRUE(registry->Respond("t-1", true).ok());
  factory_.transport("t-1")->FireOpen();
  for (uint32_t sequence = 0; sequence < 3; ++sequence) {
    std::vector<uint8_t> frame = Frame(sequence, data);
    factory_.transport("t-1")->observer->OnTransportMessage(frame.data(), frame.size());
  }
  registry->HandleSignal(Request("t-big", 5 * kGiB, ""));
  ASSERT_EQ(2u, registry->size());

  // Still readable for a while after it finished.
  FileTransfer* done = registry->Find("t-1");
  ASSERT_NE(nullptr, done);
  EXPECT_EQ(TransferState::kCompleted, done->state());
  EXPECT_EQ(data, static_cast<MemoryByteSink*>(done->sink())->data());

  loop_.AdvanceTime(webrtc::TimeDelta::Millis(config_.finished_retention_ms - 1));
  EXPECT_EQ(2u, registry->size());
  loop_.AdvanceTime(webrtc::TimeDelta::Millis(1));
  EXPECT_EQ(0u, registry->size());
  EXPECT_EQ(nullptr, registry->Find("t-1"));
  EXPECT_EQ(nullptr, registry->Find("t-big"));
  EXPECT_TRUE(registry->List().empty());
}

TEST_F(TransferRegistryTest, paused_transfers_are_kept)
{
  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  registry->HandleSignal(Request("t-1", 5 * kChunk, ""));
  ASSERT_TRUE(registry->Respond("t-1", true).ok());
  factory_.transport("t-1")->FireOpen();
  ASSERT_TRUE(registry->Pause("t-1").ok());

  loop_.AdvanceTime(webrtc::TimeDelta::Millis(2 * config_.finished_retention_ms));
  ASSERT_NE(nullptr, registry->Find("t-1"));
  EXPECT_EQ(TransferState::kPaused, registry->Find("t-1")->state());
}

TEST_F(TransferRegistryTest, same_name_disk_receives_do_not_mix)
{
  const std::string dir = ::testing::TempDir();
  std::vector<uint8_t> first = Pattern(3 * kChunk);
  std::vector<uint8_t> second(3 * kChunk, 0x5A);

  auto registry = MakeRegistry(CapabilityDescriptor::StreamingDisk(dir));
  registry->HandleSignal(Request("t-a", first.size(), Sha256Hex(first.data(), first.size())));
  registry->HandleSignal(
      Request("t-b", second.size(), Sha256Hex(second.data(), second.size())));
  ASSERT_TRUE(registry->Respond("t-a", true).ok());
  ASSERT_TRUE(registry->Respond("t-b", true).ok());
  factory_.transport("t-a")->FireOpen();
  factory_.transport("t-b")->FireOpen();

  for (uint32_t sequence = 0; sequence < 3; ++sequence) {
    std::vector<uint8_t> frame = Frame(sequence, first);
    factory_.transport("t-a")->observer->OnTransportMessage(frame.data(), frame.size());
    frame = Frame(sequence, second);
    factory_.transport("t-b")->observer->OnTransportMessage(frame.data(), frame.size());
  }

  FileTransfer* a = registry->Find("t-a");
  FileTransfer* b = registry->Find("t-b");
  ASSERT_EQ(TransferState::kCompleted, a->state());
  ASSERT_EQ(TransferState::kCompleted, b->state());
  EXPECT_EQ(0u, signaling_.Count(Msg::kTransferCancel));

  std::string path_a = static_cast<DiskByteSink*>(a->sink())->final_path();
  std::string path_b = static_cast<DiskByteSink*>(b->sink())->final_path();
  EXPECT_NE(path_a, path_b);
  std::string written;
  ASSERT_TRUE(ComputeFileSha256(path_a, first.size(), &written));
  EXPECT_EQ(Sha256Hex(first.data(), first.size()), written);
  ASSERT_TRUE(ComputeFileSha256(path_b, second.size(), &written));
  EXPECT_EQ(Sha256Hex(second.data(), second.size()), written);
  std::remove(path_a.c_str());
  std::remove(path_b.c_str());
}

TEST_F(TransferRegistryTest, paused_send_survives_restart)
{
  const std::string path = ::testing::TempDir() + "/peercall_send_restore.bin";
  std::vector<uint8_t> data = Pattern(10 * kChunk);
  ASSERT_TRUE(WriteFile(path, data));
  // Four frames fit in the send buffer.
  config_.high_water_mark = 4 * (kChunk + kFrameHeaderSize);
  factory_.accumulate = true;

  std::string id;
  {
    auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
    auto proposed = registry->Propose(path, "bob");
    ASSERT_TRUE(proposed.ok());
    id = proposed.value();
    registry->HandleSignal(Control(Msg::kTransferAccept, id));
    FakeByteTransport* out = factory_.transport(id);
    ASSERT_NE(nullptr, out);
    out->FireOpen();
    ASSERT_EQ(4u, out->frames.size());

    // Delivered, but the drain event has not been seen yet.
    out->buffered = 0;
    ASSERT_TRUE(registry->Pause(id).ok());
    EXPECT_EQ(4u * kChunk, registry->Find(id)->info().bytes_transferred);
    loop_.RunPending();
  }

  TransferCheckpoint saved;
  ASSERT_TRUE(checkpoints_.Load(id, &saved));
  EXPECT_TRUE(saved.outgoing);
  EXPECT_EQ(4u * kChunk, saved.bytes_transferred);
  EXPECT_EQ(path, saved.location);

  auto registry = MakeRegistry(CapabilityDescriptor::MemoryBuffered());
  EXPECT_EQ(1u, registry->Start());
  FileTransfer* restored = registry->Find(id);
  ASSERT_NE(nullptr, restored);
  EXPECT_TRUE(restored->outgoing());
  EXPECT_EQ(TransferState::kPaused, restored->state());

  signaling_.Clear();
  ASSERT_TRUE(registry->Resume(id).ok());
  const SignalMessage* resume = signaling_.Last(Msg::kTransferResume);
  ASSERT_NE(nullptr, resume);
  EXPECT_EQ(4 * kChunk, resume->GetInt("offset"));
  EXPECT_EQ(nullptr, factory_.transport(id));

  registry->HandleSignal(FromPeer(
      "bob", signaling::TransferWithOffset(Msg::kTransferResumeAck, "alice", id, 4 * kChunk)));
  FakeByteTransport* out = factory_.transport(id);
  ASSERT_NE(nullptr, out);
  out->FireOpen();
  ASSERT_FALSE(out->frames.empty());
  EXPECT_EQ(4u, SequenceOf(out->frames.front()));

  for (int i = 0; i < 10 && out->frames.size() < 7; ++i) {
    out->Drain();
  }
  ASSERT_EQ(7u, out->frames.size());
  EXPECT_EQ(9u, SequenceOf(out->frames[5]));
  EXPECT_EQ(kEndOfDataSequence, SequenceOf(out->frames.back()));

  registry->HandleSignal(Control(Msg::kTransferComplete, id));
  EXPECT_EQ(TransferState::kCompleted, restored->state());
  EXPECT_EQ(data.size(), restored->info().bytes_transferred);
  EXPECT_FALSE(checkpoints_.Load(id, &saved));
  std::remove(path.c_str());
}
