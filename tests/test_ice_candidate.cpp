#include <gtest/gtest.h>
#include "ice_candidate.h"
#include <cctype>

using namespace peerdrop;

class IceCandidateTest : public ::testing::Test {
protected:
    IceCandidate passive_candidate() {
        IceCandidate candidate;
        candidate.component_id = 1;
        candidate.transport = IceTransport::TCP;
        candidate.type = IceCandidateType::HOST;
        candidate.tcp_type = IceTcpType::PASSIVE;
        candidate.ip = "192.168.1.5";
        candidate.port = 50000;
        candidate.priority = 2128609535;
        candidate.foundation = "1";
        return candidate;
    }
};

TEST_F(IceCandidateTest, SdpFormat) {
    EXPECT_EQ(passive_candidate().to_sdp(),
              "candidate:1 1 tcp 2128609535 192.168.1.5 50000 typ host tcptype passive");

    IceCandidate reflexive;
    reflexive.foundation = "7";
    reflexive.component_id = 1;
    reflexive.transport = IceTransport::UDP;
    reflexive.type = IceCandidateType::SERVER_REFLEXIVE;
    reflexive.priority = 1677729535;
    reflexive.ip = "203.0.113.9";
    reflexive.port = 61000;
    reflexive.related_ip = "10.0.0.2";
    reflexive.related_port = 5000;
    EXPECT_EQ(reflexive.to_sdp(),
              "candidate:7 1 udp 1677729535 203.0.113.9 61000 typ srflx raddr 10.0.0.2 rport 5000");
}

TEST_F(IceCandidateTest, ParseSdpAttribute) {
    IceCandidate parsed;
    ASSERT_TRUE(IceCandidate::from_sdp("a=candidate:1 1 TCP 2128609535 192.168.1.5 50000 typ host tcptype passive\r\n", parsed));
    EXPECT_EQ(parsed, passive_candidate());

    // Unknown attribute pairs are skipped
    ASSERT_TRUE(IceCandidate::from_sdp("candidate:2 1 tcp 100 10.0.0.1 9 typ host generation 0 tcptype active", parsed));
    EXPECT_EQ(parsed.tcp_type, IceTcpType::ACTIVE);
    EXPECT_EQ(parsed.port, ICE_DISCARD_PORT);
}

TEST_F(IceCandidateTest, RejectMalformedCandidates) {
    IceCandidate parsed;
    EXPECT_FALSE(IceCandidate::from_sdp("", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 1 sctp 100 10.0.0.1 9 typ host", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 0 tcp 100 10.0.0.1 9 typ host tcptype active", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 1 tcp 100 999.0.0.1 9 typ host tcptype active", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 1 tcp 100 10.0.0.1 70000 typ host tcptype active", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 1 tcp 100 10.0.0.1 9 type host tcptype active", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 1 tcp 100 10.0.0.1 9 typ host", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 1 tcp 100 10.0.0.1 9 typ host tcptype", parsed));
    EXPECT_FALSE(IceCandidate::from_sdp("candidate:1 1 tcp 100 10.0.0.1 9 typ host tcptype sideways", parsed));
}

TEST_F(IceCandidateTest, PriorityOrdering) {
    uint32_t host = calculate_candidate_priority(IceCandidateType::HOST, 65535, 1);
    uint32_t reflexive = calculate_candidate_priority(IceCandidateType::SERVER_REFLEXIVE, 65535, 1);
    uint32_t relay = calculate_candidate_priority(IceCandidateType::RELAY, 65535, 1);
    EXPECT_GT(host, reflexive);
    EXPECT_GT(reflexive, relay);
    EXPECT_EQ(host, (126u << 24) | (65535u << 8) | 255u);

    uint16_t active = calculate_tcp_local_preference(IceTcpType::ACTIVE, 8191);
    uint16_t passive = calculate_tcp_local_preference(IceTcpType::PASSIVE, 8191);
    EXPECT_GT(active, passive);
    EXPECT_EQ(passive, (4 << 13) | 8191);
    EXPECT_GT(calculate_tcp_local_preference(IceTcpType::PASSIVE, 8191),
              calculate_tcp_local_preference(IceTcpType::PASSIVE, 8190));
}

TEST_F(IceCandidateTest, FoundationGroupsByTypeTransportAndAddress) {
    IceCandidate a = passive_candidate();
    IceCandidate b = passive_candidate();
    b.port = 50001;
    EXPECT_EQ(generate_foundation(a), generate_foundation(b));

    b.ip = "192.168.1.6";
    EXPECT_NE(generate_foundation(a), generate_foundation(b));
}

TEST_F(IceCandidateTest, GeneratedCredentials) {
    std::string ufrag = generate_ufrag();
    std::string pwd = generate_password();
    EXPECT_EQ(ufrag.size(), 8u);
    EXPECT_EQ(pwd.size(), 24u);
    for (char c : ufrag) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << ufrag;
    }
    EXPECT_NE(generate_ufrag(), ufrag);
}

TEST_F(IceCandidateTest, EnumStrings) {
    IceTcpType tcp_type;
    EXPECT_TRUE(string_to_ice_tcp_type("so", tcp_type));
    EXPECT_EQ(tcp_type, IceTcpType::SIMULTANEOUS_OPEN);
    EXPECT_EQ(ice_tcp_type_to_string(IceTcpType::PASSIVE), "passive");

    IceTransport transport;
    EXPECT_TRUE(string_to_ice_transport("udp", transport));
    EXPECT_EQ(transport, IceTransport::UDP);
    EXPECT_FALSE(string_to_ice_transport("quic", transport));

    IceCandidateType type;
    EXPECT_TRUE(string_to_ice_candidate_type("relay", type));
    EXPECT_EQ(type, IceCandidateType::RELAY);
    EXPECT_EQ(ice_candidate_type_to_string(IceCandidateType::PEER_REFLEXIVE), "prflx");
}
