#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "signaling.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace peerdrop;
using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockPeerTransport : public PeerTransport {
public:
    MOCK_METHOD(bool, gather_candidates, (PeerRole role), (override));
    MOCK_METHOD(IceCredentials, local_credentials, (), (const, override));
    MOCK_METHOD(std::vector<IceCandidate>, local_candidates, (), (const, override));
    MOCK_METHOD(void, set_remote_credentials, (const IceCredentials& credentials), (override));
    MOCK_METHOD(void, add_remote_candidate, (const IceCandidate& candidate), (override));
    MOCK_METHOD(std::shared_ptr<TransportChannel>, channel, (), (override));
    MOCK_METHOD(void, close, (), (override));
};

MATCHER_P(HasPort, port, "") {
    return arg.port == port;
}

MATCHER_P2(HasCredentials, ufrag, pwd, "") {
    return arg.ufrag == ufrag && arg.pwd == pwd;
}

IceCandidate make_candidate(uint16_t port, IceTcpType tcp_type = IceTcpType::PASSIVE) {
    IceCandidate candidate;
    candidate.transport = IceTransport::TCP;
    candidate.type = IceCandidateType::HOST;
    candidate.tcp_type = tcp_type;
    candidate.ip = "192.168.1.20";
    candidate.port = port;
    candidate.priority = calculate_candidate_priority(IceCandidateType::HOST,
        calculate_tcp_local_preference(tcp_type, 8191), 1);
    candidate.foundation = generate_foundation(candidate);
    return candidate;
}

IceCredentials credentials(const std::string& ufrag, const std::string& pwd) {
    IceCredentials result;
    result.ufrag = ufrag;
    result.pwd = pwd;
    return result;
}

std::string description_blob(SignalType type, const std::string& ufrag, const std::vector<IceCandidate>& candidates) {
    SessionDescription description;
    description.type = type;
    description.session_id = "4242";
    description.credentials = credentials(ufrag, "remotepasswordremotepass");
    description.candidates = candidates;
    description.end_of_candidates = true;
    return encode_description_blob(description);
}

void expect_signal_parse(const std::string& blob) {
    try {
        parse_signal_blob(blob);
        FAIL() << "Expected SIGNAL_PARSE for: " << blob;
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::SIGNAL_PARSE);
        EXPECT_STREQ(e.what(), "invalid connection data");
    }
}

} // namespace

class SignalingTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<NiceMock<MockPeerTransport>>();
        ON_CALL(*transport_, gather_candidates(_)).WillByDefault(Return(true));
        ON_CALL(*transport_, local_credentials()).WillByDefault(Return(credentials("localufr", "localpasswordlocalpasswd")));
        ON_CALL(*transport_, local_candidates()).WillByDefault(Return(std::vector<IceCandidate>{make_candidate(40000)}));
    }

    std::shared_ptr<NiceMock<MockPeerTransport>> transport_;
};

//=============================================================================
// SDP and blob codec
//=============================================================================

TEST_F(SignalingTest, SdpCarriesCredentialsAndCandidates) {
    SessionDescription description;
    description.type = SignalType::OFFER;
    description.session_id = "123456";
    description.credentials = credentials("abcd1234", "passwordpasswordpassword");
    description.candidates = {make_candidate(40000), make_candidate(40001)};
    description.end_of_candidates = true;

    std::string sdp = build_sdp(description);
    EXPECT_EQ(sdp.compare(0, 5, "v=0\r\n"), 0);
    EXPECT_NE(sdp.find("a=ice-ufrag:abcd1234\r\n"), std::string::npos);
    EXPECT_NE(sdp.find("m=application 9 TCP peerdrop\r\n"), std::string::npos);
    EXPECT_NE(sdp.find("tcptype passive"), std::string::npos);
    EXPECT_NE(sdp.find("a=end-of-candidates\r\n"), std::string::npos);

    SessionDescription parsed = parse_sdp(sdp, SignalType::OFFER);
    EXPECT_EQ(parsed.session_id, "123456");
    EXPECT_EQ(parsed.credentials.ufrag, "abcd1234");
    EXPECT_EQ(parsed.credentials.pwd, "passwordpasswordpassword");
    ASSERT_EQ(parsed.candidates.size(), 2u);
    EXPECT_EQ(parsed.candidates[0], description.candidates[0]);
    EXPECT_EQ(parsed.candidates[1], description.candidates[1]);
    EXPECT_TRUE(parsed.end_of_candidates);
}

TEST_F(SignalingTest, DescriptionAndCandidateBlobShapes) {
    nlohmann::json offer = nlohmann::json::parse(description_blob(SignalType::OFFER, "ufragone", {}));
    EXPECT_EQ(offer["type"], "offer");
    EXPECT_TRUE(offer["sdp"].is_string());

    nlohmann::json candidate = nlohmann::json::parse(encode_candidate_blob(make_candidate(40000)));
    ASSERT_TRUE(candidate["candidate"].is_object());
    EXPECT_EQ(candidate["candidate"]["sdpMid"], "0");
    EXPECT_EQ(candidate["candidate"]["sdpMLineIndex"], 0);

    SignalMessage message = parse_signal_blob("  \n" + encode_candidate_blob(make_candidate(40000)) + "\n");
    EXPECT_EQ(message.type, SignalType::CANDIDATE);
    EXPECT_EQ(message.candidate.port, 40000);
    EXPECT_FALSE(message.end_of_candidates);

    SignalMessage end = parse_signal_blob(R"({"candidate":{"candidate":"","sdpMid":"0","sdpMLineIndex":0}})");
    EXPECT_TRUE(end.end_of_candidates);
}

TEST_F(SignalingTest, MalformedBlobsAreRejected) {
    expect_signal_parse("");
    expect_signal_parse("hello");
    expect_signal_parse("[]");
    expect_signal_parse("{}");
    expect_signal_parse(R"({"type":"offer"})");
    expect_signal_parse(R"({"type":"pranswer","sdp":"v=0"})");
    expect_signal_parse(R"({"type":"offer","sdp":42})");
    expect_signal_parse(R"({"candidate":{"sdpMid":"0"}})");
    expect_signal_parse(R"({"candidate":{"candidate":"candidate:garbage"}})");
}

TEST_F(SignalingTest, MalformedSdpIsRejected) {
    EXPECT_THROW(parse_sdp("", SignalType::OFFER), TransferError);
    // No media section
    EXPECT_THROW(parse_sdp("v=0\r\na=ice-ufrag:abc\r\na=ice-pwd:def\r\n", SignalType::OFFER), TransferError);
    // No credentials
    EXPECT_THROW(parse_sdp("v=0\r\nm=application 9 TCP peerdrop\r\n", SignalType::OFFER), TransferError);
    // Garbage line
    EXPECT_THROW(parse_sdp("v=0\r\nthis is not sdp\r\n", SignalType::OFFER), TransferError);
}

//=============================================================================
// Exchange
//=============================================================================

TEST_F(SignalingTest, InitiatorCreatesOfferOnce) {
    EXPECT_CALL(*transport_, gather_candidates(PeerRole::INITIATOR)).WillOnce(Return(true));

    SignalingExchange exchange(transport_, PeerRole::INITIATOR);
    std::string offer = exchange.create_offer();

    SignalMessage message = parse_signal_blob(offer);
    EXPECT_EQ(message.type, SignalType::OFFER);
    SessionDescription description = parse_sdp(message.sdp, message.type);
    EXPECT_EQ(description.credentials.ufrag, "localufr");
    ASSERT_EQ(description.candidates.size(), 1u);
    EXPECT_TRUE(exchange.has_local_description());
    EXPECT_TRUE(exchange.is_local_description(offer));

    EXPECT_THROW(exchange.create_offer(), TransferError);
}

TEST_F(SignalingTest, ResponderCannotCreateOffer) {
    SignalingExchange exchange(transport_, PeerRole::RESPONDER);
    try {
        exchange.create_offer();
        FAIL() << "Expected INVALID_STATE";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::INVALID_STATE);
    }
}

TEST_F(SignalingTest, GatherFailureIsTransportError) {
    ON_CALL(*transport_, gather_candidates(_)).WillByDefault(Return(false));

    SignalingExchange exchange(transport_, PeerRole::INITIATOR);
    try {
        exchange.create_offer();
        FAIL() << "Expected TRANSPORT_ERROR";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::TRANSPORT_ERROR);
    }
}

TEST_F(SignalingTest, ResponderAnswersOffer) {
    {
        InSequence sequence;
        EXPECT_CALL(*transport_, set_remote_credentials(HasCredentials("peerufrg", "remotepasswordremotepass")));
        EXPECT_CALL(*transport_, add_remote_candidate(HasPort(50000)));
        EXPECT_CALL(*transport_, gather_candidates(PeerRole::RESPONDER)).WillOnce(Return(true));
    }

    SignalingExchange exchange(transport_, PeerRole::RESPONDER);
    RemoteSignalResult result = exchange.apply_remote(
        description_blob(SignalType::OFFER, "peerufrg", {make_candidate(50000)}));

    EXPECT_EQ(result.kind, RemoteSignalResult::Kind::DESCRIPTION_APPLIED);
    ASSERT_FALSE(result.local_answer.empty());
    EXPECT_EQ(parse_signal_blob(result.local_answer).type, SignalType::ANSWER);
    EXPECT_EQ(exchange.get_local_description(), result.local_answer);
    EXPECT_TRUE(exchange.has_remote_description());
}

TEST_F(SignalingTest, EarlyCandidatesAreQueuedAndFlushedInOrder) {
    {
        InSequence sequence;
        EXPECT_CALL(*transport_, set_remote_credentials(_));
        // Candidates from the description first, then the queued ones in arrival order
        EXPECT_CALL(*transport_, add_remote_candidate(HasPort(50000)));
        EXPECT_CALL(*transport_, add_remote_candidate(HasPort(50001)));
        EXPECT_CALL(*transport_, add_remote_candidate(HasPort(50002)));
        EXPECT_CALL(*transport_, add_remote_candidate(HasPort(50003)));
        // A candidate after the description goes straight through
        EXPECT_CALL(*transport_, add_remote_candidate(HasPort(50004)));
    }

    SignalingExchange exchange(transport_, PeerRole::INITIATOR);
    exchange.create_offer();

    EXPECT_EQ(exchange.apply_remote(encode_candidate_blob(make_candidate(50001))).kind,
              RemoteSignalResult::Kind::CANDIDATE_QUEUED);
    EXPECT_EQ(exchange.apply_remote(encode_candidate_blob(make_candidate(50002))).kind,
              RemoteSignalResult::Kind::CANDIDATE_QUEUED);
    EXPECT_EQ(exchange.apply_remote(encode_candidate_blob(make_candidate(50003))).kind,
              RemoteSignalResult::Kind::CANDIDATE_QUEUED);
    EXPECT_EQ(exchange.get_queued_candidate_count(), 3u);

    RemoteSignalResult result = exchange.apply_remote(
        description_blob(SignalType::ANSWER, "peerufrg", {make_candidate(50000, IceTcpType::ACTIVE)}));
    EXPECT_EQ(result.kind, RemoteSignalResult::Kind::DESCRIPTION_APPLIED);
    EXPECT_EQ(result.flushed_candidates, 3u);
    EXPECT_TRUE(result.local_answer.empty());
    EXPECT_EQ(exchange.get_queued_candidate_count(), 0u);

    EXPECT_EQ(exchange.apply_remote(encode_candidate_blob(make_candidate(50004))).kind,
              RemoteSignalResult::Kind::CANDIDATE_APPLIED);
}

TEST_F(SignalingTest, SecondDescriptionIsInvalidState) {
    SignalingExchange exchange(transport_, PeerRole::INITIATOR);
    exchange.create_offer();
    exchange.apply_remote(description_blob(SignalType::ANSWER, "peerufrg", {}));

    try {
        exchange.apply_remote(description_blob(SignalType::ANSWER, "otherufr", {}));
        FAIL() << "Expected INVALID_STATE";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::INVALID_STATE);
    }
}

TEST_F(SignalingTest, WrongDescriptionTypeIsInvalidState) {
    SignalingExchange initiator(transport_, PeerRole::INITIATOR);
    initiator.create_offer();
    EXPECT_THROW(initiator.apply_remote(description_blob(SignalType::OFFER, "peerufrg", {})), TransferError);
    EXPECT_FALSE(initiator.has_remote_description());

    SignalingExchange responder(transport_, PeerRole::RESPONDER);
    EXPECT_THROW(responder.apply_remote(description_blob(SignalType::ANSWER, "peerufrg", {})), TransferError);
}

TEST_F(SignalingTest, OwnDescriptionPastedBackIsRejected) {
    SignalingExchange exchange(transport_, PeerRole::INITIATOR);
    std::string offer = exchange.create_offer();
    std::string echoed = description_blob(SignalType::ANSWER, "localufr", {});

    EXPECT_CALL(*transport_, set_remote_credentials(_)).Times(0);
    try {
        exchange.apply_remote(echoed);
        FAIL() << "Expected INVALID_STATE";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::INVALID_STATE);
    }
    EXPECT_FALSE(exchange.is_local_description(echoed));
    EXPECT_TRUE(exchange.is_local_description(offer));
}

TEST_F(SignalingTest, MalformedRemoteBlobLeavesExchangeUntouched) {
    EXPECT_CALL(*transport_, set_remote_credentials(_)).Times(0);
    EXPECT_CALL(*transport_, add_remote_candidate(_)).Times(0);

    SignalingExchange exchange(transport_, PeerRole::RESPONDER);
    EXPECT_THROW(exchange.apply_remote("{\"type\":\"offer\",\"sdp\":\"v=0\"}"), TransferError);
    EXPECT_THROW(exchange.apply_remote("garbage"), TransferError);
    EXPECT_FALSE(exchange.has_remote_description());
    EXPECT_FALSE(exchange.has_local_description());
}
