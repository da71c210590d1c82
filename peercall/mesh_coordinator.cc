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

#include "rtc_base/logging.h"

#include "mesh_coordinator.h"

MeshCoordinator::MeshCoordinator(std::string local_id,
                                 int max_members,
                                 SignalingChannel* signaling,
                                 MeshDelegate* delegate)
    : local_id_(std::move(local_id)),
      max_members_(max_members > 1 ? static_cast<size_t>(max_members) : 2),
      signaling_(signaling),
      delegate_(delegate) {}

Result<std::string> MeshCoordinator::Join(const std::string& group_id,
                                          MediaKind media_kind) {
  if (joined()) {
    return Error{ErrorKind::kAlreadyInCall, "Already in group " + group_id_};
  }
  if (!signaling_->Send(signaling::GroupJoin(group_id, media_kind))) {
    return Error{ErrorKind::kSignalingUnavailable, "Could not send group join"};
  }
  group_id_ = group_id;
  media_kind_ = media_kind;
  RTC_LOG(LS_INFO) << "Joining group " << group_id << " as " << local_id_;
  return group_id;
}

void MeshCoordinator::Leave() {
  if (!joined()) {
    return;
  }
  RTC_LOG(LS_INFO) << "Leaving group " << group_id_ << " with " << roster_.size()
                   << " peers";
  if (!signaling_->Send(signaling::GroupLeave(group_id_))) {
    RTC_LOG(LS_WARNING) << "Could not notify group " << group_id_ << " of leave";
  }
}

Result<size_t> MeshCoordinator::HandleExistingPeers(
    const std::vector<std::string>& peers) {
  if (!joined()) {
    return Error{ErrorKind::kNoActiveCall, "Roster received outside a group call"};
  }

  std::vector<std::string> newcomers;
  for (const auto& peer : peers) {
    if (peer == local_id_ || HasMember(peer) ||
        std::find(newcomers.begin(), newcomers.end(), peer) != newcomers.end()) {
      continue;
    }
    newcomers.push_back(peer);
  }
  if (roster_.size() + newcomers.size() + 1 > max_members_) {
    RTC_LOG(LS_WARNING) << "Group " << group_id_ << " would have "
                        << roster_.size() + newcomers.size() + 1
                        << " members, limit is " << max_members_;
    return Error{ErrorKind::kCapacityExceeded,
                 "Group is full (" + std::to_string(max_members_) + " members)"};
  }

  size_t created = 0;
  for (const auto& peer : newcomers) {
    auto link = AddMember(peer, PeerRole::kOfferer);
    if (!link.ok()) {
      RTC_LOG(LS_ERROR) << "Could not link to " << peer << ": " << link.error();
      continue;
    }
    link.value()->StartOffer();
    ++created;
  }
  RTC_LOG(LS_INFO) << "Offered to " << created << " existing peers in " << group_id_;
  return created;
}

Result<PeerLink*> MeshCoordinator::HandlePeerJoined(const std::string& peer_id) {
  if (!joined()) {
    return Error{ErrorKind::kNoActiveCall, "Peer joined outside a group call"};
  }
  if (peer_id == local_id_) {
    return Error{ErrorKind::kInvalidState, "Own join notification"};
  }
  if (PeerLink* existing = delegate_->FindLink(peer_id)) {
    return existing;
  }
  return AddMember(peer_id, PeerRole::kAnswerer);
}

void MeshCoordinator::HandlePeerLeft(const std::string& peer_id) {
  if (!HasMember(peer_id)) {
    return;
  }
  RTC_LOG(LS_INFO) << peer_id << " left group " << group_id_;
  RemoveMember(peer_id);
}

Result<PeerLink*> MeshCoordinator::LinkForOffer(const std::string& peer_id) {
  if (!joined()) {
    return Error{ErrorKind::kNoActiveCall, "Offer outside a group call"};
  }
  if (PeerLink* existing = delegate_->FindLink(peer_id)) {
    return existing;
  }
  RTC_LOG(LS_INFO) << "Offer from " << peer_id << " before join notification";
  return AddMember(peer_id, PeerRole::kAnswerer);
}

void MeshCoordinator::RemoveMember(const std::string& peer_id) {
  roster_.erase(peer_id);
  delegate_->DestroyLink(peer_id);
}

void MeshCoordinator::Reset() {
  roster_.clear();
  group_id_.clear();
  media_kind_ = MediaKind::kAudio;
}

Result<PeerLink*> MeshCoordinator::AddMember(const std::string& peer_id,
                                             PeerRole role) {
  if (roster_.size() + 2 > max_members_) {
    RTC_LOG(LS_WARNING) << "Rejecting " << peer_id << ", group " << group_id_
                        << " is full";
    return Error{ErrorKind::kCapacityExceeded, "Group is full"};
  }
  PeerLink* link = delegate_->CreateLink(peer_id, role);
  if (!link) {
    return Error{ErrorKind::kNegotiationFailed, "Could not create link to " + peer_id};
  }
  roster_.insert(peer_id);
  return link;
}
