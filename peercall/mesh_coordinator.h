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

#ifndef PEERCALL_MESH_COORDINATOR_H_
#define PEERCALL_MESH_COORDINATOR_H_

#include <set>
#include <string>
#include <vector>

#include "peer_link.h"
#include "result.h"
#include "signaling.h"

// Owner of the PeerLinks. The coordinator decides topology, the delegate
// holds the objects.
class MeshDelegate {
 public:
  virtual ~MeshDelegate() = default;

  virtual PeerLink* CreateLink(const std::string& peer_id, PeerRole role) = 0;
  virtual void DestroyLink(const std::string& peer_id) = 0;
  virtual PeerLink* FindLink(const std::string& peer_id) = 0;
};

// Full-mesh group topology: one link per remote member, the newcomer offers
// to every incumbent.
class MeshCoordinator {
 public:
  MeshCoordinator(std::string local_id,
                  int max_members,
                  SignalingChannel* signaling,
                  MeshDelegate* delegate);

  // Sends group.join and waits for the roster.
  Result<std::string> Join(const std::string& group_id, MediaKind media_kind);
  // Sends group.leave. Links are destroyed by the delegate's owner.
  void Leave();

  // group.existing-peers: offer to every incumbent. Returns the number of
  // links created.
  Result<size_t> HandleExistingPeers(const std::vector<std::string>& peers);
  // group.peer-joined: answerer link waiting for the newcomer's offer.
  Result<PeerLink*> HandlePeerJoined(const std::string& peer_id);
  // group.peer-left: no renegotiation for the others.
  void HandlePeerLeft(const std::string& peer_id);
  // An offer may overtake group.peer-joined.
  Result<PeerLink*> LinkForOffer(const std::string& peer_id);
  // Link gave up; the call continues without that member.
  void RemoveMember(const std::string& peer_id);

  void Reset();

  bool joined() const { return !group_id_.empty(); }
  const std::string& group_id() const { return group_id_; }
  MediaKind media_kind() const { return media_kind_; }
  const std::set<std::string>& roster() const { return roster_; }
  bool HasMember(const std::string& peer_id) const {
    return roster_.count(peer_id) != 0;
  }
  // Members including ourselves.
  size_t member_count() const { return roster_.size() + 1; }

 private:
  Result<PeerLink*> AddMember(const std::string& peer_id, PeerRole role);

  const std::string local_id_;
  const size_t max_members_;
  SignalingChannel* signaling_;
  MeshDelegate* delegate_;

  std::string group_id_;
  MediaKind media_kind_ = MediaKind::kAudio;
  std::set<std::string> roster_;
};

#endif  // PEERCALL_MESH_COORDINATOR_H_
