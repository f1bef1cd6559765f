#include "signaling.h"
#include "errors.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

#define LOG_SIGNAL_DEBUG(message) LOG_DEBUG("signal", message)
#define LOG_SIGNAL_INFO(message)  LOG_INFO("signal", message)
#define LOG_SIGNAL_WARN(message)  LOG_WARN("signal", message)

namespace peerdrop {

namespace {

const char* const INVALID_CONNECTION_DATA = "invalid connection data";

[[noreturn]] void throw_parse_error(const std::string& detail) {
    LOG_SIGNAL_WARN("Rejecting connection data: " << detail);
    throw TransferError(TransferErrorCode::SIGNAL_PARSE, INVALID_CONNECTION_DATA);
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string generate_session_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis(1, 0x7FFFFFFFFFFFFFFFull);
    return std::to_string(dis(gen));
}

} // namespace

std::string signal_type_to_string(SignalType type) {
    switch (type) {
        case SignalType::OFFER: return "offer";
        case SignalType::ANSWER: return "answer";
        case SignalType::CANDIDATE: return "candidate";
        default: return "unknown";
    }
}

//=============================================================================
// SDP
//=============================================================================

std::string build_sdp(const SessionDescription& description) {
    std::ostringstream sdp;
    sdp << "v=0\r\n";
    sdp << "o=- " << description.session_id << " 2 IN IP4 0.0.0.0\r\n";
    sdp << "s=peerdrop\r\n";
    sdp << "t=0 0\r\n";
    sdp << "a=ice-ufrag:" << description.credentials.ufrag << "\r\n";
    sdp << "a=ice-pwd:" << description.credentials.pwd << "\r\n";
    sdp << "m=application 9 TCP peerdrop\r\n";
    for (const auto& candidate : description.candidates) {
        sdp << "a=" << candidate.to_sdp() << "\r\n";
    }
    if (description.end_of_candidates) {
        sdp << "a=end-of-candidates\r\n";
    }
    return sdp.str();
}

SessionDescription parse_sdp(const std::string& sdp, SignalType type) {
    SessionDescription description;
    description.type = type;

    std::istringstream stream(sdp);
    std::string line;
    bool has_version = false;
    bool has_media = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (line.size() < 2 || line[1] != '=') {
            throw_parse_error("malformed SDP line '" + line + "'");
        }

        if (line == "v=0") {
            has_version = true;
        } else if (line.compare(0, 2, "o=") == 0) {
            std::istringstream origin(line.substr(2));
            std::string username;
            origin >> username >> description.session_id;
        } else if (line.compare(0, 12, "a=ice-ufrag:") == 0) {
            description.credentials.ufrag = trim(line.substr(12));
        } else if (line.compare(0, 10, "a=ice-pwd:") == 0) {
            description.credentials.pwd = trim(line.substr(10));
        } else if (line.compare(0, 14, "m=application ") == 0) {
            has_media = true;
        } else if (line.compare(0, 12, "a=candidate:") == 0) {
            IceCandidate candidate;
            if (!IceCandidate::from_sdp(line, candidate)) {
                throw_parse_error("malformed candidate '" + line + "'");
            }
            description.candidates.push_back(candidate);
        } else if (line == "a=end-of-candidates") {
            description.end_of_candidates = true;
        }
        // Other lines carry nothing we use
    }

    if (!has_version || !has_media) {
        throw_parse_error("SDP lacks version or media section");
    }
    if (description.credentials.empty()) {
        throw_parse_error("SDP lacks ICE credentials");
    }
    return description;
}

//=============================================================================
// Blobs
//=============================================================================

std::string encode_description_blob(const SessionDescription& description) {
    nlohmann::json blob = {
        {"type", signal_type_to_string(description.type)},
        {"sdp", build_sdp(description)}
    };
    return blob.dump();
}

std::string encode_candidate_blob(const IceCandidate& candidate) {
    nlohmann::json blob = {
        {"candidate", {
            {"candidate", candidate.to_sdp()},
            {"sdpMid", "0"},
            {"sdpMLineIndex", 0}
        }}
    };
    return blob.dump();
}

SignalMessage parse_signal_blob(const std::string& blob) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(trim(blob));
    } catch (const nlohmann::json::exception& e) {
        throw_parse_error(std::string("not JSON: ") + e.what());
    }
    if (!json.is_object()) {
        throw_parse_error("not a JSON object");
    }

    SignalMessage message;

    auto candidate_it = json.find("candidate");
    if (candidate_it != json.end()) {
        const nlohmann::json& init = *candidate_it;
        if (!init.is_object() || !init.contains("candidate") || !init["candidate"].is_string()) {
            throw_parse_error("candidate blob without candidate string");
        }
        message.type = SignalType::CANDIDATE;
        if (init.contains("sdpMid") && init["sdpMid"].is_string()) {
            message.sdp_mid = init["sdpMid"].get<std::string>();
        }
        if (init.contains("sdpMLineIndex") && init["sdpMLineIndex"].is_number_integer()) {
            message.sdp_mline_index = init["sdpMLineIndex"].get<int>();
        }

        std::string text = trim(init["candidate"].get<std::string>());
        if (text.empty()) {
            message.end_of_candidates = true;
            return message;
        }
        if (!IceCandidate::from_sdp(text, message.candidate)) {
            throw_parse_error("malformed candidate '" + text + "'");
        }
        return message;
    }

    auto type_it = json.find("type");
    auto sdp_it = json.find("sdp");
    if (type_it == json.end() || !type_it->is_string() || sdp_it == json.end() || !sdp_it->is_string()) {
        throw_parse_error("neither a session description nor a candidate");
    }

    std::string type = type_it->get<std::string>();
    if (type == "offer") {
        message.type = SignalType::OFFER;
    } else if (type == "answer") {
        message.type = SignalType::ANSWER;
    } else {
        throw_parse_error("unsupported description type '" + type + "'");
    }
    message.sdp = sdp_it->get<std::string>();
    return message;
}

//=============================================================================
// SignalingExchange
//=============================================================================

SignalingExchange::SignalingExchange(std::shared_ptr<PeerTransport> transport, PeerRole role)
    : transport_(std::move(transport)), role_(role), session_id_(generate_session_id()),
      remote_applied_(false) {}

std::string SignalingExchange::create_offer() {
    if (role_ != PeerRole::INITIATOR) {
        throw TransferError(TransferErrorCode::INVALID_STATE, "Only the initiator creates an offer");
    }
    if (!local_description_.empty()) {
        throw TransferError(TransferErrorCode::INVALID_STATE, "Offer already created");
    }
    return build_local_description(SignalType::OFFER);
}

std::string SignalingExchange::build_local_description(SignalType type) {
    PeerRole gather_role = type == SignalType::OFFER ? PeerRole::INITIATOR : PeerRole::RESPONDER;
    if (!transport_->gather_candidates(gather_role)) {
        throw TransferError(TransferErrorCode::TRANSPORT_ERROR, "Candidate gathering failed");
    }

    SessionDescription description;
    description.type = type;
    description.session_id = session_id_;
    description.credentials = transport_->local_credentials();
    description.candidates = transport_->local_candidates();
    description.end_of_candidates = true;

    local_description_ = encode_description_blob(description);
    LOG_SIGNAL_INFO("Created " << signal_type_to_string(type) << " with "
                    << description.candidates.size() << " candidate(s)");
    return local_description_;
}

RemoteSignalResult SignalingExchange::apply_remote(const std::string& blob) {
    SignalMessage message = parse_signal_blob(blob);
    RemoteSignalResult result;

    if (message.type == SignalType::CANDIDATE) {
        if (message.end_of_candidates) {
            result.kind = RemoteSignalResult::Kind::END_OF_CANDIDATES;
            return result;
        }
        if (!remote_applied_) {
            pending_candidates_.push_back(message.candidate);
            LOG_SIGNAL_DEBUG("Queued early candidate (" << pending_candidates_.size() << " waiting)");
            result.kind = RemoteSignalResult::Kind::CANDIDATE_QUEUED;
            return result;
        }
        transport_->add_remote_candidate(message.candidate);
        result.kind = RemoteSignalResult::Kind::CANDIDATE_APPLIED;
        return result;
    }

    if (remote_applied_) {
        throw TransferError(TransferErrorCode::INVALID_STATE, "Remote description already applied");
    }
    SignalType expected = role_ == PeerRole::INITIATOR ? SignalType::ANSWER : SignalType::OFFER;
    if (message.type != expected) {
        throw TransferError(TransferErrorCode::INVALID_STATE,
                            "Expected an " + signal_type_to_string(expected) + ", got an " +
                            signal_type_to_string(message.type));
    }

    SessionDescription description = parse_sdp(message.sdp, message.type);
    if (description.credentials.ufrag == transport_->local_credentials().ufrag) {
        throw TransferError(TransferErrorCode::INVALID_STATE, "Remote description is our own");
    }

    transport_->set_remote_credentials(description.credentials);
    for (const auto& candidate : description.candidates) {
        transport_->add_remote_candidate(candidate);
    }
    for (const auto& candidate : pending_candidates_) {
        transport_->add_remote_candidate(candidate);
    }
    result.flushed_candidates = pending_candidates_.size();
    pending_candidates_.clear();
    remote_applied_ = true;

    LOG_SIGNAL_INFO("Applied remote " << signal_type_to_string(message.type) << " with "
                    << description.candidates.size() << " candidate(s), flushed "
                    << result.flushed_candidates << " queued");

    result.kind = RemoteSignalResult::Kind::DESCRIPTION_APPLIED;
    if (role_ == PeerRole::RESPONDER) {
        result.local_answer = build_local_description(SignalType::ANSWER);
    }
    return result;
}

bool SignalingExchange::is_local_description(const std::string& blob) const {
    if (local_description_.empty()) {
        return false;
    }
    SignalMessage message = parse_signal_blob(blob);
    if (message.type == SignalType::CANDIDATE) {
        return false;
    }
    SignalMessage local = parse_signal_blob(local_description_);
    return message.type == local.type &&
           parse_sdp(message.sdp, message.type).credentials.ufrag ==
           parse_sdp(local.sdp, local.type).credentials.ufrag;
}

} // namespace peerdrop
