#pragma once

#include "ice_candidate.h"
#include "transport_channel.h"
#include <memory>
#include <string>
#include <vector>

namespace peerdrop {

enum class SignalType {
    OFFER,
    ANSWER,
    CANDIDATE
};

std::string signal_type_to_string(SignalType type);

/**
 * Content of the minimal SDP document carried by offer/answer blobs
 */
struct SessionDescription {
    SignalType type;                        // OFFER or ANSWER
    std::string session_id;
    IceCredentials credentials;
    std::vector<IceCandidate> candidates;
    bool end_of_candidates;

    SessionDescription() : type(SignalType::OFFER), end_of_candidates(false) {}
};

/**
 * Decoded out-of-band blob
 * For OFFER/ANSWER `sdp` holds the document; for CANDIDATE `candidate` is set.
 */
struct SignalMessage {
    SignalType type;
    std::string sdp;
    IceCandidate candidate;
    bool end_of_candidates;     // Empty candidate string
    std::string sdp_mid;
    int sdp_mline_index;

    SignalMessage() : type(SignalType::OFFER), end_of_candidates(false), sdp_mline_index(0) {}
};

std::string build_sdp(const SessionDescription& description);

/**
 * Parse an SDP document
 * @throws TransferError(SIGNAL_PARSE) if required lines are missing or malformed
 */
SessionDescription parse_sdp(const std::string& sdp, SignalType type);

// {"type":"offer"|"answer","sdp":"..."}
std::string encode_description_blob(const SessionDescription& description);
// {"candidate":{"candidate":"candidate:...","sdpMid":"0","sdpMLineIndex":0}}
std::string encode_candidate_blob(const IceCandidate& candidate);

/**
 * Decode a pasted blob; surrounding whitespace is ignored
 * @throws TransferError(SIGNAL_PARSE) with "invalid connection data"
 */
SignalMessage parse_signal_blob(const std::string& blob);

/**
 * What apply_remote() did with a blob
 */
struct RemoteSignalResult {
    enum class Kind {
        DESCRIPTION_APPLIED,
        CANDIDATE_APPLIED,
        CANDIDATE_QUEUED,
        END_OF_CANDIDATES
    };

    Kind kind;
    std::string local_answer;   // Answer blob produced by a responder, empty otherwise
    size_t flushed_candidates;  // Queued candidates applied along with a description

    RemoteSignalResult() : kind(Kind::DESCRIPTION_APPLIED), flushed_candidates(0) {}
};

/**
 * Non-trickled description exchange for one negotiation round
 *
 * Not thread-safe; the owning session serialises calls.
 */
class SignalingExchange {
public:
    SignalingExchange(std::shared_ptr<PeerTransport> transport, PeerRole role);

    /**
     * Gather candidates and build the offer (initiator only)
     * @return Offer blob
     * @throws TransferError(INVALID_STATE) for a responder or when called twice
     * @throws TransferError(TRANSPORT_ERROR) if gathering fails
     */
    std::string create_offer();

    /**
     * Apply a remote blob
     *
     * A session description is applied once; a responder answers it at once.
     * Candidates that arrive before the description are queued and flushed in
     * arrival order when it lands.
     * @throws TransferError(SIGNAL_PARSE) on malformed input
     * @throws TransferError(INVALID_STATE) for a second or wrongly typed description
     * @throws TransferError(TRANSPORT_ERROR) if a responder cannot gather
     */
    RemoteSignalResult apply_remote(const std::string& blob);

    /**
     * Check that a blob is the local description this exchange produced
     */
    bool is_local_description(const std::string& blob) const;

    PeerRole get_role() const { return role_; }
    bool has_remote_description() const { return remote_applied_; }
    bool has_local_description() const { return !local_description_.empty(); }
    const std::string& get_local_description() const { return local_description_; }
    size_t get_queued_candidate_count() const { return pending_candidates_.size(); }

private:
    std::string build_local_description(SignalType type);

    std::shared_ptr<PeerTransport> transport_;
    PeerRole role_;
    std::string session_id_;
    bool remote_applied_;
    std::string local_description_;
    std::vector<IceCandidate> pending_candidates_;
};

} // namespace peerdrop
