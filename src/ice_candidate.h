#ifndef PEERDROP_ICE_CANDIDATE_H
#define PEERDROP_ICE_CANDIDATE_H

#include <cstdint>
#include <string>

namespace peerdrop {

// ICE Candidate Types
enum class IceCandidateType {
    HOST,               // Local interface address
    SERVER_REFLEXIVE,   // Public address discovered via STUN
    PEER_REFLEXIVE,     // Address discovered during connectivity checks
    RELAY               // Address allocated on TURN server
};

// ICE Candidate Transport Protocol
enum class IceTransport {
    UDP,
    TCP
};

// RFC 6544 connection direction of a TCP candidate
enum class IceTcpType {
    NONE,               // UDP candidate
    ACTIVE,             // Opens outgoing connections, port is a placeholder (9)
    PASSIVE,            // Accepts incoming connections
    SIMULTANEOUS_OPEN
};

// Placeholder port carried by active TCP candidates
constexpr uint16_t ICE_DISCARD_PORT = 9;

// ICE Candidate Structure
struct IceCandidate {
    std::string foundation;     // Foundation for grouping candidates
    uint32_t component_id;      // Component identifier (always 1 for a data channel)
    IceTransport transport;     // Transport protocol
    uint32_t priority;          // Candidate priority
    std::string ip;             // IP address
    uint16_t port;              // Port number
    IceCandidateType type;      // Candidate type
    IceTcpType tcp_type;        // Direction for TCP candidates
    std::string related_ip;     // Related address (for reflexive/relay candidates)
    uint16_t related_port;      // Related port

    IceCandidate();

    /**
     * Format as an SDP attribute value, without the "a=" prefix
     * e.g. "candidate:1 1 tcp 2128609535 192.168.1.5 50000 typ host tcptype passive"
     */
    std::string to_sdp() const;

    /**
     * Parse a candidate attribute ("candidate:..." with or without "a=")
     * @param sdp_line Attribute text
     * @param candidate Output candidate
     * @return false if the line is not a well-formed candidate
     */
    static bool from_sdp(const std::string& sdp_line, IceCandidate& candidate);

    bool operator==(const IceCandidate& other) const;
};

/**
 * RFC 8445 candidate priority
 * (type_pref << 24) | (local_pref << 8) | (256 - component_id)
 */
uint32_t calculate_candidate_priority(IceCandidateType type, uint16_t local_pref, uint16_t component_id);

/**
 * RFC 6544 local preference: direction preference in the top bits, other preference below
 */
uint16_t calculate_tcp_local_preference(IceTcpType tcp_type, uint16_t other_pref);

std::string generate_foundation(const IceCandidate& candidate);

// Random ICE credentials
std::string generate_ufrag();       // 8 characters
std::string generate_password();    // 24 characters

// Utility functions
std::string ice_candidate_type_to_string(IceCandidateType type);
bool string_to_ice_candidate_type(const std::string& type_str, IceCandidateType& type);
std::string ice_transport_to_string(IceTransport transport);
bool string_to_ice_transport(const std::string& transport_str, IceTransport& transport);
std::string ice_tcp_type_to_string(IceTcpType tcp_type);
bool string_to_ice_tcp_type(const std::string& tcp_type_str, IceTcpType& tcp_type);

} // namespace peerdrop

#endif // PEERDROP_ICE_CANDIDATE_H
