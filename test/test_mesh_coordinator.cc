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

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "call_session.h"
#include "fakes.h"
#include "mesh_coordinator.h"

namespace {

SignalMessage Roster(const std::string& group, const std::vector<std::string>& peers) {
  SignalMessage message;
  message.type = Msg::kGroupExistingPeers;
  message.group_id = group;
  message.payload["peers"] = Json::Value(Json::arrayValue);
  for (const auto& peer : peers) {
    message.payload["peers"].append(peer);
  }
  return message;
}

SignalMessage GroupEvent(const char* type, const std::string& group,
                         const std::string& peer) {
  SignalMessage message;
  message.type = type;
  message.group_id = group;
  message.peer_id = peer;
  return message;
}

class NullCallObserver : public CallSessionObserver {
 public:
  void OnCallStatusChanged(CallStatus status) override {}
  void OnIncomingCall(const IncomingCall& call) override {}
  void OnCallError(const Error& error) override { errors.push_back(error); }

  std::vector<Error> errors;
};

CallConfig SmallGroupConfig() {
  CallConfig config;
  config.max_group_members = 4;
  return config;
}

class GroupCallTest : public ::testing::Test {
 protected:
  void Join() {
    ASSERT_TRUE(session_.JoinGroupCall("standup", MediaKind::kAudio).ok());
  }

  FakeTaskQueue loop_;
  RecordingSignaling signaling_;
  FakeMediaEngine engine_;
  FakeLocalMedia media_;
  NullCallObserver observer_;
  CallConfig config_ = SmallGroupConfig();
  CallSession session_{"alice", config_, &engine_, &media_, &signaling_,
                       &loop_, loop_.clock(), &observer_};
};

// Owns links the way a call session would, for driving the coordinator alone.
class LinkPool : public MeshDelegate, public PeerLinkObserver {
 public:
  LinkPool(FakeMediaEngine* engine, RecordingSignaling* signaling, FakeTaskQueue* loop)
      : engine_(engine), signaling_(signaling), loop_(loop) {}

  PeerLink* CreateLink(const std::string& peer_id, PeerRole role) override {
    auto link = std::make_unique<PeerLink>(peer_id, "alice", "standup", role,
                                           MediaKind::kAudio, engine_, signaling_, loop_,
                                           PeerLinkConfig(), this);
    if (!link->Initialize()) {
      return nullptr;
    }
    PeerLink* raw = link.get();
    links[peer_id] = std::move(link);
    return raw;
  }
  void DestroyLink(const std::string& peer_id) override { links.erase(peer_id); }
  PeerLink* FindLink(const std::string& peer_id) override {
    auto it = links.find(peer_id);
    return it == links.end() ? nullptr : it->second.get();
  }

  void OnLinkConnectivityChanged(const std::string& peer_id,
                                 ConnectivityState state) override {}
  void OnLinkFailed(const std::string& peer_id, const Error& error) override {}

  std::map<std::string, std::unique_ptr<PeerLink>> links;

 private:
  FakeMediaEngine* engine_;
  RecordingSignaling* signaling_;
  FakeTaskQueue* loop_;
};

}  // namespace

TEST_F(GroupCallTest, newcomer_offers_to_every_member)
{
  Join();
  const SignalMessage* join = signaling_.Last(Msg::kGroupJoin);
  ASSERT_NE(nullptr, join);
  EXPECT_EQ("standup", join->group_id);

  session_.HandleSignal(Roster("standup", {"bob", "carol", "alice"}));
  EXPECT_EQ(2u, session_.peer_count());
  EXPECT_EQ(3u, session_.mesh().member_count());
  EXPECT_EQ(2u, signaling_.Count(Msg::kCallOffer));
  for (const auto& message : signaling_.sent) {
    if (message.is(Msg::kCallOffer)) {
      EXPECT_EQ("standup", message.group_id);
    }
  }

  engine_.handle("bob")->SetConnectivity(ConnectivityState::kConnected);
  EXPECT_EQ(CallStatus::kConnected, session_.status());
}

TEST_F(GroupCallTest, incumbent_answers_later_joiner)
{
  Join();
  session_.HandleSignal(Roster("standup", {"bob"}));
  session_.HandleSignal(GroupEvent(Msg::kGroupPeerJoined, "standup", "dave"));
  EXPECT_EQ(2u, session_.peer_count());
  EXPECT_EQ(1u, signaling_.Count(Msg::kCallOffer));

  SignalMessage offer =
      FromPeer("dave", signaling::CallOffer("alice", "v=0 dave", MediaKind::kAudio, false));
  offer.group_id = "standup";
  session_.HandleSignal(offer);
  const SignalMessage* answer = signaling_.Last(Msg::kCallAnswer);
  ASSERT_NE(nullptr, answer);
  EXPECT_EQ("dave", answer->peer_id);
  EXPECT_EQ("standup", answer->group_id);
}

TEST_F(GroupCallTest, offer_may_overtake_join_notice)
{
  Join();
  session_.HandleSignal(Roster("standup", {}));
  SignalMessage offer =
      FromPeer("erin", signaling::CallOffer("alice", "v=0 erin", MediaKind::kAudio, false));
  offer.group_id = "standup";
  session_.HandleSignal(offer);
  EXPECT_EQ(1u, session_.peer_count());
  EXPECT_TRUE(session_.mesh().HasMember("erin"));
  EXPECT_EQ(1u, signaling_.Count(Msg::kCallAnswer));
}

TEST_F(GroupCallTest, departure_leaves_other_links_alone)
{
  Join();
  session_.HandleSignal(Roster("standup", {"bob", "carol"}));
  engine_.handle("bob")->SetConnectivity(ConnectivityState::kConnected);
  engine_.handle("carol")->SetConnectivity(ConnectivityState::kConnected);
  signaling_.Clear();

  session_.HandleSignal(GroupEvent(Msg::kGroupPeerLeft, "standup", "carol"));
  EXPECT_EQ(std::vector<std::string>{"bob"}, session_.peer_ids());
  EXPECT_EQ(0u, signaling_.Count(Msg::kCallOffer));
  EXPECT_EQ(0u, signaling_.Count(Msg::kCallRenegotiate));
  EXPECT_EQ(CallStatus::kConnected, session_.status());
}

TEST_F(GroupCallTest, failed_member_is_dropped)
{
  Join();
  session_.HandleSignal(Roster("standup", {"bob", "carol"}));
  engine_.handle("bob")->SetConnectivity(ConnectivityState::kConnected);
  engine_.handle("carol")->SetConnectivity(ConnectivityState::kClosed);

  EXPECT_EQ(1u, session_.peer_count());
  EXPECT_FALSE(session_.mesh().HasMember("carol"));
  EXPECT_EQ(CallStatus::kConnected, session_.status());
  EXPECT_TRUE(observer_.errors.empty());
}

TEST_F(GroupCallTest, full_group_fails_the_join)
{
  Join();
  session_.HandleSignal(Roster("standup", {"bob", "carol", "dave", "erin"}));
  EXPECT_EQ(CallStatus::kIdle, session_.status());
  ASSERT_EQ(1u, observer_.errors.size());
  EXPECT_EQ(ErrorKind::kCapacityExceeded, observer_.errors[0].kind);
  EXPECT_EQ(1u, signaling_.Count(Msg::kGroupLeave));
  EXPECT_EQ(0u, signaling_.Count(Msg::kCallOffer));
}

TEST_F(GroupCallTest, joiner_beyond_capacity_is_refused)
{
  Join();
  session_.HandleSignal(Roster("standup", {"bob", "carol", "dave"}));
  ASSERT_EQ(4u, session_.mesh().member_count());

  session_.HandleSignal(GroupEvent(Msg::kGroupPeerJoined, "standup", "erin"));
  EXPECT_EQ(3u, session_.peer_count());

  SignalMessage offer =
      FromPeer("frank", signaling::CallOffer("alice", "v=0", MediaKind::kAudio, false));
  offer.group_id = "standup";
  session_.HandleSignal(offer);
  const SignalMessage* reject = signaling_.Last(Msg::kCallReject);
  ASSERT_NE(nullptr, reject);
  EXPECT_EQ("frank", reject->peer_id);
}

TEST_F(GroupCallTest, other_group_is_ignored)
{
  Join();
  session_.HandleSignal(Roster("retro", {"bob"}));
  EXPECT_EQ(0u, session_.peer_count());
}

TEST_F(GroupCallTest, leaving_sends_group_leave)
{
  Join();
  session_.HandleSignal(Roster("standup", {"bob"}));
  ASSERT_TRUE(session_.EndCall().ok());
  EXPECT_EQ(1u, signaling_.Count(Msg::kGroupLeave));
  EXPECT_EQ(0u, signaling_.Count(Msg::kCallEnd));
  EXPECT_FALSE(session_.mesh().joined());
}

TEST(mesh_coordinator, roster_needs_a_join)
{
  FakeTaskQueue loop;
  RecordingSignaling signaling;
  FakeMediaEngine engine;
  LinkPool pool(&engine, &signaling, &loop);
  MeshCoordinator mesh("alice", 6, &signaling, &pool);

  EXPECT_EQ(ErrorKind::kNoActiveCall, mesh.HandleExistingPeers({"bob"}).kind());
  EXPECT_EQ(ErrorKind::kNoActiveCall, mesh.HandlePeerJoined("bob").kind());

  signaling.connected = false;
  EXPECT_EQ(ErrorKind::kSignalingUnavailable,
            mesh.Join("standup", MediaKind::kAudio).kind());
  EXPECT_FALSE(mesh.joined());
}

TEST(mesh_coordinator, links_one_per_member)
{
  FakeTaskQueue loop;
  RecordingSignaling signaling;
  FakeMediaEngine engine;
  LinkPool pool(&engine, &signaling, &loop);
  MeshCoordinator mesh("alice", 6, &signaling, &pool);

  ASSERT_TRUE(mesh.Join("standup", MediaKind::kVideo).ok());
  EXPECT_EQ(ErrorKind::kAlreadyInCall, mesh.Join("standup", MediaKind::kVideo).kind());

  auto created = mesh.HandleExistingPeers({"bob", "carol", "bob"});
  ASSERT_TRUE(created.ok());
  EXPECT_EQ(2u, created.value());
  EXPECT_EQ(2u, pool.links.size());
  EXPECT_EQ(PeerRole::kOfferer, pool.links["bob"]->role());

  auto joined = mesh.HandlePeerJoined("dave");
  ASSERT_TRUE(joined.ok());
  EXPECT_EQ(PeerRole::kAnswerer, joined.value()->role());
  EXPECT_EQ(ErrorKind::kInvalidState, mesh.HandlePeerJoined("alice").kind());

  mesh.HandlePeerLeft("carol");
  mesh.HandlePeerLeft("nobody");
  EXPECT_EQ(3u, mesh.member_count());
  EXPECT_EQ(0u, pool.links.count("carol"));

  mesh.Leave();
  EXPECT_EQ(1u, signaling.Count(Msg::kGroupLeave));
  mesh.Reset();
  EXPECT_FALSE(mesh.joined());
  EXPECT_TRUE(mesh.roster().empty());
}
