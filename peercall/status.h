#ifndef PEERCALL_STATUS_H_
#define PEERCALL_STATUS_H_

namespace StatusCodes {

// -------------------------
// SIP-style reject reasons
// -------------------------
inline constexpr const char kBusyHere[]              = "486 Busy Here";               // Callee already in a call
inline constexpr const char kDeclined[]              = "603 Decline";                 // Callee declined
inline constexpr const char kTemporarilyUnavailable[]= "480 Temporarily Unavailable";  // Callee offline

} // namespace StatusCodes

// -----------------------------------------------------------------------------
// Signaling message types
// -----------------------------------------------------------------------------
namespace Msg {

// Presence on the signaling server
inline constexpr const char kRegister[]              = "register";
inline constexpr const char kDisconnected[]          = "DISCONNECTED";  // local sentinel, never sent

// Call negotiation
inline constexpr const char kCallOffer[]             = "call.offer";
inline constexpr const char kCallAnswer[]            = "call.answer";
inline constexpr const char kCallIceCandidate[]      = "call.ice-candidate";
inline constexpr const char kCallRinging[]           = "call.ringing";
inline constexpr const char kCallReject[]            = "call.reject";
inline constexpr const char kCallEnd[]               = "call.end";
inline constexpr const char kCallRenegotiate[]       = "call.renegotiate";
inline constexpr const char kCallRenegotiateAnswer[] = "call.renegotiate-answer";
inline constexpr const char kCallMediaToggled[]      = "call.media-toggled";

// Group roster
inline constexpr const char kGroupJoin[]          = "group.join";
inline constexpr const char kGroupLeave[]         = "group.leave";
inline constexpr const char kGroupPeerJoined[]    = "group.peer-joined";
inline constexpr const char kGroupPeerLeft[]      = "group.peer-left";
inline constexpr const char kGroupExistingPeers[] = "group.existing-peers";

// File transfer handshake and control
inline constexpr const char kTransferRequest[]   = "transfer.request";
inline constexpr const char kTransferAccept[]    = "transfer.accept";
inline constexpr const char kTransferReject[]    = "transfer.reject";
inline constexpr const char kTransferPause[]     = "transfer.pause";
inline constexpr const char kTransferResume[]    = "transfer.resume";
inline constexpr const char kTransferResumeAck[] = "transfer.resume-ack";
inline constexpr const char kTransferCancel[]    = "transfer.cancel";
inline constexpr const char kTransferComplete[]  = "transfer.complete";
inline constexpr const char kTransferSignal[]    = "transfer.signal";   // byte transport SDP/ICE relay

// Media-toggled kinds
inline constexpr const char kKindAudio[]  = "audio";
inline constexpr const char kKindVideo[]  = "video";
inline constexpr const char kKindScreen[] = "screen";

} // namespace Msg

// Transfer reject / cancel reasons
namespace TransferReason {

inline constexpr const char kUserRejected[]      = "user-rejected";
inline constexpr const char kCapacityExceeded[]  = "capacity-exceeded";
inline constexpr const char kUnsupportedChunkSize[] = "unsupported-chunk-size";
inline constexpr const char kUnknownTransfer[]   = "unknown-transfer";
inline constexpr const char kUserCancelled[]     = "user-cancelled";
inline constexpr const char kIntegrityMismatch[] = "integrity-mismatch";
inline constexpr const char kTimeout[]           = "timeout";
inline constexpr const char kTransportError[]    = "transport-error";

} // namespace TransferReason

#endif // PEERCALL_STATUS_H_
