#include "ice_candidate.h"
#include "network_utils.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <random>
#include <sstream>


namespace peerdrop {

//=============================================================================
// IceCandidate Implementation
//=============================================================================

IceCandidate::IceCandidate()
    : component_id(1), transport(IceTransport::TCP), priority(0), port(0),
      type(IceCandidateType::HOST), tcp_type(IceTcpType::PASSIVE), related_port(0) {
}

std::string IceCandidate::to_sdp() const {
    std::ostringstream sdp;
    sdp << "candidate:" << foundation << " " << component_id << " "
        << ice_transport_to_string(transport) << " " << priority << " "
        << ip << " " << port << " typ " << ice_candidate_type_to_string(type);

    if (!related_ip.empty() && related_port > 0) {
        sdp << " raddr " << related_ip << " rport " << related_port;
    }
    if (transport == IceTransport::TCP && tcp_type != IceTcpType::NONE) {
        sdp << " tcptype " << ice_tcp_type_to_string(tcp_type);
    }

    return sdp.str();
}

namespace {

bool parse_number(const std::string& token, uint64_t max_value, uint64_t& value) {
    if (token.empty() || token.size() > 10 ||
        !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    value = std::stoull(token);
    return value <= max_value;
}

} // namespace

bool IceCandidate::from_sdp(const std::string& sdp_line, IceCandidate& candidate) {
    std::string line = sdp_line;
    if (line.compare(0, 2, "a=") == 0) {
        line = line.substr(2);
    }
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    std::istringstream iss(line);
    std::string token;
    IceCandidate parsed;
    uint64_t number = 0;

    // candidate:foundation component transport priority ip port typ type [raddr ip rport port] [tcptype dir]
    if (!(iss >> token) || token.compare(0, 10, "candidate:") != 0 || token.size() == 10) {
        return false;
    }
    parsed.foundation = token.substr(10);

    if (!(iss >> token) || !parse_number(token, 256, number) || number == 0) return false;
    parsed.component_id = static_cast<uint32_t>(number);

    if (!(iss >> token)) return false;
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!string_to_ice_transport(token, parsed.transport)) return false;

    if (!(iss >> token) || !parse_number(token, 0xFFFFFFFFull, number)) return false;
    parsed.priority = static_cast<uint32_t>(number);

    if (!(iss >> parsed.ip) || !network_utils::is_valid_ipv4(parsed.ip)) return false;

    if (!(iss >> token) || !parse_number(token, 65535, number)) return false;
    parsed.port = static_cast<uint16_t>(number);

    if (!(iss >> token) || token != "typ") return false;
    if (!(iss >> token) || !string_to_ice_candidate_type(token, parsed.type)) return false;

    parsed.tcp_type = IceTcpType::NONE;
    while (iss >> token) {
        std::string value;
        if (!(iss >> value)) {
            return false;
        }
        if (token == "raddr") {
            parsed.related_ip = value;
        } else if (token == "rport") {
            if (!parse_number(value, 65535, number)) return false;
            parsed.related_port = static_cast<uint16_t>(number);
        } else if (token == "tcptype") {
            if (!string_to_ice_tcp_type(value, parsed.tcp_type)) return false;
        }
        // Unknown extension attributes come in name/value pairs and are skipped
    }

    if (parsed.transport == IceTransport::TCP && parsed.tcp_type == IceTcpType::NONE) {
        return false;
    }

    candidate = parsed;
    return true;
}

bool IceCandidate::operator==(const IceCandidate& other) const {
    return foundation == other.foundation && component_id == other.component_id &&
           transport == other.transport && priority == other.priority &&
           ip == other.ip && port == other.port && type == other.type &&
           tcp_type == other.tcp_type;
}

//=============================================================================
// Priorities and credentials
//=============================================================================

uint32_t calculate_candidate_priority(IceCandidateType type, uint16_t local_pref, uint16_t component_id) {
    uint8_t type_pref = 0;
    switch (type) {
        case IceCandidateType::HOST: type_pref = 126; break;
        case IceCandidateType::PEER_REFLEXIVE: type_pref = 110; break;
        case IceCandidateType::SERVER_REFLEXIVE: type_pref = 100; break;
        case IceCandidateType::RELAY: type_pref = 0; break;
    }

    return (static_cast<uint32_t>(type_pref) << 24) |
           (static_cast<uint32_t>(local_pref) << 8) |
           static_cast<uint32_t>(256 - component_id);
}

uint16_t calculate_tcp_local_preference(IceTcpType tcp_type, uint16_t other_pref) {
    uint16_t direction_pref = 0;
    switch (tcp_type) {
        case IceTcpType::ACTIVE: direction_pref = 6; break;
        case IceTcpType::PASSIVE: direction_pref = 4; break;
        case IceTcpType::SIMULTANEOUS_OPEN: direction_pref = 2; break;
        case IceTcpType::NONE: direction_pref = 0; break;
    }
    return static_cast<uint16_t>((direction_pref << 13) | (other_pref & 0x1FFF));
}

std::string generate_foundation(const IceCandidate& candidate) {
    std::string base = ice_candidate_type_to_string(candidate.type) + "_" +
                       ice_transport_to_string(candidate.transport) + "_" + candidate.ip;
    std::hash<std::string> hasher;
    return std::to_string(hasher(base) % 1000000);
}

namespace {

std::string random_string(const char* charset, size_t charset_size, size_t length) {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<size_t> dis(0, charset_size - 1);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += charset[dis(gen)];
    }
    return result;
}

} // namespace

std::string generate_ufrag() {
    static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    return random_string(charset, sizeof(charset) - 1, 8);
}

std::string generate_password() {
    static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789+/";
    return random_string(charset, sizeof(charset) - 1, 24);
}

//=============================================================================
// Utility Functions
//=============================================================================

std::string ice_candidate_type_to_string(IceCandidateType type) {
    switch (type) {
        case IceCandidateType::HOST: return "host";
        case IceCandidateType::SERVER_REFLEXIVE: return "srflx";
        case IceCandidateType::PEER_REFLEXIVE: return "prflx";
        case IceCandidateType::RELAY: return "relay";
        default: return "unknown";
    }
}

bool string_to_ice_candidate_type(const std::string& type_str, IceCandidateType& type) {
    if (type_str == "host") { type = IceCandidateType::HOST; return true; }
    if (type_str == "srflx") { type = IceCandidateType::SERVER_REFLEXIVE; return true; }
    if (type_str == "prflx") { type = IceCandidateType::PEER_REFLEXIVE; return true; }
    if (type_str == "relay") { type = IceCandidateType::RELAY; return true; }
    return false;
}

std::string ice_transport_to_string(IceTransport transport) {
    switch (transport) {
        case IceTransport::UDP: return "udp";
        case IceTransport::TCP: return "tcp";
        default: return "udp";
    }
}

bool string_to_ice_transport(const std::string& transport_str, IceTransport& transport) {
    if (transport_str == "tcp") { transport = IceTransport::TCP; return true; }
    if (transport_str == "udp") { transport = IceTransport::UDP; return true; }
    return false;
}

std::string ice_tcp_type_to_string(IceTcpType tcp_type) {
    switch (tcp_type) {
        case IceTcpType::ACTIVE: return "active";
        case IceTcpType::PASSIVE: return "passive";
        case IceTcpType::SIMULTANEOUS_OPEN: return "so";
        default: return "";
    }
}

bool string_to_ice_tcp_type(const std::string& tcp_type_str, IceTcpType& tcp_type) {
    if (tcp_type_str == "active") { tcp_type = IceTcpType::ACTIVE; return true; }
    if (tcp_type_str == "passive") { tcp_type = IceTcpType::PASSIVE; return true; }
    if (tcp_type_str == "so") { tcp_type = IceTcpType::SIMULTANEOUS_OPEN; return true; }
    return false;
}

} // namespace peerdrop
