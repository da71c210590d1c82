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

#include <sstream>

#include "gtest/gtest.h"

#include "result.h"
#include "signaling.h"
#include "status.h"

TEST(result, holds_value_or_error)
{
  Result<int> good(7);
  ASSERT_TRUE(good.ok());
  EXPECT_EQ(7, good.value());

  Result<int> bad(ErrorKind::kCapacityExceeded, "group is full");
  ASSERT_FALSE(bad.ok());
  EXPECT_FALSE(static_cast<bool>(bad));
  EXPECT_EQ(ErrorKind::kCapacityExceeded, bad.kind());
  EXPECT_EQ("group is full", bad.error().message);
}

TEST(result, error_prints_kind_and_message)
{
  std::ostringstream os;
  os << Error{ErrorKind::kTransferIntegrityMismatch, "sha256 differs"};
  EXPECT_EQ("TransferIntegrityMismatch (sha256 differs)", os.str());

  std::ostringstream bare;
  bare << Error{ErrorKind::kNoActiveCall, ""};
  EXPECT_EQ("NoActiveCall", bare.str());
}

TEST(signaling, offer_encodes_wire_fields)
{
  SignalMessage offer = signaling::CallOffer("bob", "v=0", MediaKind::kVideo, true);
  offer.group_id = "standup";

  SignalMessage decoded;
  ASSERT_TRUE(DecodeSignal(EncodeSignal(offer), &decoded));
  EXPECT_EQ(Msg::kCallOffer, decoded.type);
  EXPECT_EQ("bob", decoded.peer_id);
  EXPECT_EQ("standup", decoded.group_id);
  EXPECT_EQ("v=0", decoded.GetString("sdp"));
  EXPECT_EQ("video", decoded.GetString("mediaKind"));
  EXPECT_TRUE(decoded.GetBool("isReconnect"));
}

TEST(signaling, group_id_is_omitted_when_empty)
{
  std::string text = EncodeSignal(signaling::CallEnd("bob"));
  EXPECT_EQ(std::string::npos, text.find("groupId"));
  EXPECT_NE(std::string::npos, text.find("\"type\":\"call.end\""));
}

TEST(signaling, decode_rejects_malformed_text)
{
  SignalMessage message;
  EXPECT_FALSE(DecodeSignal("not json", &message));
  EXPECT_FALSE(DecodeSignal("{\"peerId\":\"bob\"}", &message));
  EXPECT_FALSE(DecodeSignal("[1,2,3]", &message));
}

TEST(signaling, decode_tolerates_missing_payload)
{
  SignalMessage message;
  ASSERT_TRUE(DecodeSignal("{\"type\":\"group.peer-left\",\"peerId\":\"carol\"}", &message));
  EXPECT_TRUE(message.is(Msg::kGroupPeerLeft));
  EXPECT_TRUE(message.payload.isObject());
  EXPECT_EQ("", message.GetString("sdp"));
  EXPECT_EQ(42, message.GetInt("offset", 42));
  EXPECT_TRUE(message.GetBool("enabled", true));
}

TEST(signaling, typed_getters_ignore_wrong_types)
{
  SignalMessage message;
  ASSERT_TRUE(DecodeSignal(
      "{\"type\":\"transfer.resume\",\"payload\":{\"offset\":\"12\",\"transferId\":5}}",
      &message));
  EXPECT_EQ(-1, message.GetInt("offset", -1));
  EXPECT_EQ("", message.GetString("transferId"));
}

TEST(signaling, transfer_request_carries_large_sizes)
{
  const uint64_t five_gib = 5ULL * 1024 * 1024 * 1024;
  SignalMessage request = signaling::TransferRequest("bob", "t-1", "movie.mp4", five_gib,
                                                     "video/mp4", 16384, "");
  SignalMessage decoded;
  ASSERT_TRUE(DecodeSignal(EncodeSignal(request), &decoded));
  EXPECT_EQ(static_cast<int64_t>(five_gib), decoded.GetInt("fileSize"));
  EXPECT_EQ(16384, decoded.GetInt("chunkSize"));
  EXPECT_FALSE(decoded.payload.isMember("sha256"));
}

TEST(signaling, candidate_survives_relay)
{
  IceCandidate candidate;
  candidate.candidate = "candidate:1 1 udp 2122260223 10.0.0.2 51000 typ host";
  candidate.sdp_mid = "0";
  candidate.sdp_mline_index = 1;

  SignalMessage decoded;
  ASSERT_TRUE(DecodeSignal(EncodeSignal(signaling::CallIceCandidate("bob", candidate)),
                           &decoded));
  IceCandidate parsed = signaling::CandidateFromPayload(decoded.payload);
  EXPECT_EQ(candidate.candidate, parsed.candidate);
  EXPECT_EQ("0", parsed.sdp_mid);
  EXPECT_EQ(1, parsed.sdp_mline_index);
}

TEST(signaling, media_kind_names)
{
  MediaKind kind = MediaKind::kAudio;
  EXPECT_TRUE(MediaKindFromString("video", &kind));
  EXPECT_EQ(MediaKind::kVideo, kind);
  EXPECT_FALSE(MediaKindFromString("hologram", &kind));
  EXPECT_STREQ("audio", MediaKindToString(MediaKind::kAudio));
}
