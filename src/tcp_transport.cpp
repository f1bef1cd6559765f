#include "tcp_transport.h"
#include "errors.h"
#include "logger.h"
#include "network_utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>

#define LOG_TCP_DEBUG(message) LOG_DEBUG("tcp", message)
#define LOG_TCP_INFO(message)  LOG_INFO("tcp", message)
#define LOG_TCP_WARN(message)  LOG_WARN("tcp", message)
#define LOG_TCP_ERROR(message) LOG_ERROR("tcp", message)

namespace peerdrop {

namespace {

// Accept/handshake loops re-check the running flag at this interval
constexpr int POLL_INTERVAL_MS = 200;

bool send_handshake(socket_t socket, const nlohmann::json& message) {
    std::string text = message.dump();
    return send_tcp_frame(socket, TcpFrameKind::HANDSHAKE, std::vector<uint8_t>(text.begin(), text.end()));
}

bool receive_handshake(socket_t socket, nlohmann::json& message) {
    TcpFrameKind kind;
    std::vector<uint8_t> payload;
    if (receive_tcp_frame(socket, MAX_HANDSHAKE_FRAME_SIZE, kind, payload) != FrameReadResult::OK) {
        return false;
    }
    if (kind != TcpFrameKind::HANDSHAKE) {
        LOG_TCP_WARN("Expected handshake frame, got kind " << static_cast<int>(kind));
        return false;
    }
    try {
        message = nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::exception& e) {
        LOG_TCP_WARN("Malformed handshake: " << e.what());
        return false;
    }
    return message.is_object();
}

} // namespace

//=============================================================================
// Framing
//=============================================================================

std::vector<uint8_t> encode_tcp_frame_header(TcpFrameKind kind, size_t payload_size) {
    uint32_t length = static_cast<uint32_t>(payload_size);
    return {
        static_cast<uint8_t>(kind),
        static_cast<uint8_t>((length >> 24) & 0xFF),
        static_cast<uint8_t>((length >> 16) & 0xFF),
        static_cast<uint8_t>((length >> 8) & 0xFF),
        static_cast<uint8_t>(length & 0xFF)
    };
}

bool send_tcp_frame(socket_t socket, TcpFrameKind kind, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> frame = encode_tcp_frame_header(kind, payload.size());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return send_all(socket, frame.data(), frame.size());
}

FrameReadResult receive_tcp_frame(socket_t socket, uint32_t max_payload_size,
                                  TcpFrameKind& kind, std::vector<uint8_t>& payload) {
    uint8_t header[TCP_FRAME_HEADER_SIZE];
    if (!receive_exact_bytes(socket, header, sizeof(header))) {
        return FrameReadResult::CLOSED;
    }

    if (header[0] < static_cast<uint8_t>(TcpFrameKind::TEXT) ||
        header[0] > static_cast<uint8_t>(TcpFrameKind::HANDSHAKE)) {
        return FrameReadResult::MALFORMED;
    }
    kind = static_cast<TcpFrameKind>(header[0]);

    uint32_t length = (static_cast<uint32_t>(header[1]) << 24) |
                      (static_cast<uint32_t>(header[2]) << 16) |
                      (static_cast<uint32_t>(header[3]) << 8) |
                      static_cast<uint32_t>(header[4]);
    if (length > max_payload_size) {
        return FrameReadResult::OVERSIZED;
    }

    payload.resize(length);
    if (length > 0 && !receive_exact_bytes(socket, payload.data(), length)) {
        return FrameReadResult::CLOSED;
    }
    return FrameReadResult::OK;
}

//=============================================================================
// TcpChannel
//=============================================================================

TcpChannel::TcpChannel(uint32_t max_frame_size)
    : max_frame_size_(max_frame_size), socket_(INVALID_SOCKET_VALUE),
      open_(false), closing_(false) {}

TcpChannel::~TcpChannel() {
    close();
    join_threads();
    close_socket(socket_);
}

bool TcpChannel::is_open() const {
    return open_.load() && !closing_.load();
}

void TcpChannel::send_text(const std::string& text) {
    send_frame(FrameType::TEXT, std::vector<uint8_t>(text.begin(), text.end()));
}

void TcpChannel::send_binary(const std::vector<uint8_t>& data) {
    send_frame(FrameType::BINARY, data);
}

void TcpChannel::send_frame(FrameType type, std::vector<uint8_t> data) {
    if (!is_open() || !outbound_.push(type, std::move(data))) {
        throw TransferError(TransferErrorCode::CHANNEL_NOT_OPEN, "Channel is not open");
    }
}

size_t TcpChannel::buffered_amount() const {
    return outbound_.pending_bytes();
}

std::string TcpChannel::get_remote_address() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return remote_address_;
}

void TcpChannel::close() {
    bool attached;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closing_.exchange(true)) {
            return;
        }
        attached = is_valid_socket(socket_);
        if (attached) {
            // The reader wakes up and raises the close notification
            shutdown_socket(socket_);
        }
    }
    outbound_.close();

    if (!attached) {
        notify_close(false, "Channel closed");
    }
}

void TcpChannel::attach(socket_t socket) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closing_.load()) {
            close_socket(socket);
            return;
        }
        socket_ = socket;
        remote_address_ = get_peer_address(socket);
        open_ = true;
    }
    set_tcp_nodelay(socket);
    LOG_TCP_INFO("Channel open with " << remote_address_);

    writer_thread_ = std::thread(&TcpChannel::writer_loop, this);
    notify_open();
    reader_thread_ = std::thread(&TcpChannel::reader_loop, this);
}

void TcpChannel::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closing_.exchange(true)) {
            return;
        }
        failure_reason_ = reason;
    }
    outbound_.close();
    LOG_TCP_ERROR(reason);
    notify_close(true, reason);
}

void TcpChannel::join_threads() {
    for (std::thread* thread : {&reader_thread_, &writer_thread_}) {
        if (!thread->joinable()) {
            continue;
        }
        if (thread->get_id() == std::this_thread::get_id()) {
            thread->detach();
        } else {
            thread->join();
        }
    }
}

void TcpChannel::reader_loop() {
    TcpFrameKind kind;
    std::vector<uint8_t> payload;
    FrameReadResult result;

    while ((result = receive_tcp_frame(socket_, max_frame_size_, kind, payload)) == FrameReadResult::OK) {
        if (kind == TcpFrameKind::HANDSHAKE) {
            LOG_TCP_DEBUG("Ignoring handshake frame on open channel");
            continue;
        }
        FrameType type = kind == TcpFrameKind::TEXT ? FrameType::TEXT : FrameType::BINARY;
        notify_message(ChannelMessage(type, std::move(payload)));
        payload = std::vector<uint8_t>();
    }

    bool is_error;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!failure_reason_.empty()) {
            is_error = true;
            reason = failure_reason_;
        } else if (closing_.load()) {
            is_error = false;
            reason = "Channel closed";
        } else if (result == FrameReadResult::CLOSED) {
            is_error = false;
            reason = "Peer closed the connection";
        } else {
            is_error = true;
            reason = result == FrameReadResult::OVERSIZED ? "Peer sent a frame above the size limit"
                                                          : "Peer sent a malformed frame";
        }
        closing_ = true;
        open_ = false;
        shutdown_socket(socket_);
    }
    outbound_.close();

    if (is_error) {
        LOG_TCP_ERROR(reason);
    } else {
        LOG_TCP_INFO(reason);
    }
    notify_close(is_error, reason);
}

void TcpChannel::writer_loop() {
    ChannelMessage frame;
    while (outbound_.pop(frame)) {
        TcpFrameKind kind = frame.type == FrameType::TEXT ? TcpFrameKind::TEXT : TcpFrameKind::BINARY;
        if (!send_tcp_frame(socket_, kind, frame.data)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!closing_.load() && failure_reason_.empty()) {
                failure_reason_ = "Failed to send frame to " + remote_address_;
            }
            shutdown_socket(socket_);
            break;
        }
        outbound_.mark_sent(frame.data.size());
    }
}

//=============================================================================
// TcpPeerTransport
//=============================================================================

TcpPeerTransport::TcpPeerTransport(const TransferConfig& config)
    : config_(config),
      channel_(std::make_shared<TcpChannel>(config.max_frame_size)),
      role_(PeerRole::INITIATOR), gathered_(false), running_(false),
      server_socket_(INVALID_SOCKET_VALUE), handshake_socket_(INVALID_SOCKET_VALUE),
      listen_port_(0) {
    init_socket_library();
}

TcpPeerTransport::~TcpPeerTransport() {
    close();
    cleanup_socket_library();
}

bool TcpPeerTransport::gather_candidates(PeerRole role) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (gathered_) {
        LOG_TCP_WARN("Candidates already gathered");
        return role == role_;
    }

    std::vector<std::string> addresses = network_utils::get_local_interface_addresses_v4(config_.include_loopback_candidates);
    if (addresses.empty()) {
        LOG_TCP_ERROR("No local IPv4 address to advertise");
        return false;
    }

    if (role == PeerRole::INITIATOR) {
        server_socket_ = create_tcp_server_v4(config_.listen_port);
        if (!is_valid_socket(server_socket_)) {
            LOG_TCP_ERROR("Failed to listen on port " << config_.listen_port);
            return false;
        }
        int port = get_ephemeral_port(server_socket_);
        if (port <= 0) {
            close_socket(server_socket_);
            server_socket_ = INVALID_SOCKET_VALUE;
            return false;
        }
        listen_port_ = static_cast<uint16_t>(port);
    }

    role_ = role;
    local_credentials_.ufrag = generate_ufrag();
    local_credentials_.pwd = generate_password();

    IceTcpType tcp_type = role == PeerRole::INITIATOR ? IceTcpType::PASSIVE : IceTcpType::ACTIVE;
    for (size_t i = 0; i < addresses.size(); ++i) {
        IceCandidate candidate;
        candidate.transport = IceTransport::TCP;
        candidate.type = IceCandidateType::HOST;
        candidate.tcp_type = tcp_type;
        candidate.ip = addresses[i];
        candidate.port = role == PeerRole::INITIATOR ? listen_port_ : ICE_DISCARD_PORT;
        uint16_t other_pref = static_cast<uint16_t>(8191 - std::min<size_t>(i, 8191));
        candidate.priority = calculate_candidate_priority(IceCandidateType::HOST,
            calculate_tcp_local_preference(tcp_type, other_pref), 1);
        candidate.foundation = generate_foundation(candidate);
        local_candidates_.push_back(candidate);
        LOG_TCP_DEBUG("Local candidate: " << candidate.to_sdp());
    }

    gathered_ = true;
    running_ = true;
    LOG_TCP_INFO("Gathered " << local_candidates_.size() << " candidate(s) as " << peer_role_to_string(role));

    if (role == PeerRole::INITIATOR) {
        accept_thread_ = std::thread(&TcpPeerTransport::accept_loop, this);
    } else {
        maybe_start_connecting();
    }
    return true;
}

IceCredentials TcpPeerTransport::local_credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_credentials_;
}

std::vector<IceCandidate> TcpPeerTransport::local_candidates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_candidates_;
}

uint16_t TcpPeerTransport::get_listen_port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listen_port_;
}

void TcpPeerTransport::set_remote_credentials(const IceCredentials& credentials) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_credentials_ = credentials;
        maybe_start_connecting();
    }
    cv_.notify_all();
}

void TcpPeerTransport::add_remote_candidate(const IceCandidate& candidate) {
    if (candidate.transport != IceTransport::TCP || candidate.tcp_type != IceTcpType::PASSIVE) {
        LOG_TCP_DEBUG("Skipping remote candidate we cannot dial: " << candidate.to_sdp());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_candidates_.push_back(candidate);
    }
    cv_.notify_all();
}

void TcpPeerTransport::maybe_start_connecting() {
    // Called with mutex_ held
    if (role_ != PeerRole::RESPONDER || !gathered_ || !running_ ||
        remote_credentials_.empty() || connect_thread_.joinable()) {
        return;
    }
    connect_thread_ = std::thread(&TcpPeerTransport::connect_loop, this);
}

void TcpPeerTransport::set_handshake_socket(socket_t socket) {
    std::lock_guard<std::mutex> lock(mutex_);
    handshake_socket_ = socket;
}

void TcpPeerTransport::close() {
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_socket(handshake_socket_);
    }
    cv_.notify_all();

    channel_->close();

    join_thread(accept_thread_);
    join_thread(connect_thread_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (is_valid_socket(server_socket_)) {
        close_socket(server_socket_);
        server_socket_ = INVALID_SOCKET_VALUE;
    }
}

void TcpPeerTransport::join_thread(std::thread& thread) {
    if (!thread.joinable()) {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
        thread.detach();
    } else {
        thread.join();
    }
}

void TcpPeerTransport::accept_loop() {
    LOG_TCP_DEBUG("Waiting for the responder on port " << listen_port_);

    while (running_) {
        int ready = wait_for_readable(server_socket_, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (running_) {
                channel_->fail("Listening socket failed");
            }
            return;
        }
        if (ready == 0) {
            continue;
        }

        socket_t client = accept_client(server_socket_);
        if (!is_valid_socket(client)) {
            continue;
        }

        set_handshake_socket(client);
        bool authenticated = authenticate_dialer(client);
        set_handshake_socket(INVALID_SOCKET_VALUE);

        if (!authenticated) {
            close_socket(client);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            close_socket(server_socket_);
            server_socket_ = INVALID_SOCKET_VALUE;
        }
        channel_->attach(client);
        return;
    }
}

bool TcpPeerTransport::authenticate_dialer(socket_t client) {
    if (wait_for_readable(client, static_cast<int>(config_.handshake_timeout_ms)) != 1) {
        LOG_TCP_WARN("No handshake from " << get_peer_address(client));
        return false;
    }

    nlohmann::json hello;
    if (!receive_handshake(client, hello) || hello.value("type", "") != "hello") {
        return false;
    }

    IceCredentials local = local_credentials();
    if (hello.value("target", "") != local.ufrag || hello.value("pwd", "") != local.pwd) {
        LOG_TCP_WARN("Rejecting connection with wrong credentials from " << get_peer_address(client));
        return false;
    }
    if (!send_handshake(client, nlohmann::json{{"type", "pending"}})) {
        return false;
    }

    // The dialer is known to hold our offer; wait until its answer is applied here
    IceCredentials remote;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !running_ || !remote_credentials_.empty(); });
        if (!running_) {
            return false;
        }
        remote = remote_credentials_;
    }

    if (hello.value("ufrag", "") != remote.ufrag) {
        LOG_TCP_WARN("Dialer does not match the applied answer");
        return false;
    }

    return send_handshake(client, nlohmann::json{
        {"type", "accept"},
        {"ufrag", local.ufrag},
        {"pwd", remote.pwd}
    });
}

bool TcpPeerTransport::next_candidate(IceCandidate& candidate, std::vector<IceCandidate>& tried,
                                      std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        const IceCandidate* best = nullptr;
        for (const auto& remote : remote_candidates_) {
            if (std::find(tried.begin(), tried.end(), remote) != tried.end()) {
                continue;
            }
            if (!best || remote.priority > best->priority) {
                best = &remote;
            }
        }
        if (best) {
            candidate = *best;
            tried.push_back(candidate);
            return true;
        }
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            return false;
        }
    }
    return false;
}

void TcpPeerTransport::connect_loop() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.connect_deadline_ms);
    std::vector<IceCandidate> tried;
    IceCredentials remote;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remote = remote_credentials_;
    }

    IceCandidate candidate;
    while (running_ && next_candidate(candidate, tried, deadline)) {
        LOG_TCP_DEBUG("Trying " << candidate.ip << ":" << candidate.port);
        socket_t socket = create_tcp_client_v4(candidate.ip, candidate.port, static_cast<int>(config_.connect_timeout_ms));
        if (!is_valid_socket(socket)) {
            continue;
        }

        set_handshake_socket(socket);
        bool authenticated = authenticate_listener(socket, remote);
        set_handshake_socket(INVALID_SOCKET_VALUE);

        if (authenticated) {
            channel_->attach(socket);
            return;
        }
        close_socket(socket);
    }

    if (running_) {
        channel_->fail("Could not reach the peer on any of its " + std::to_string(tried.size()) + " candidate(s)");
    }
}

bool TcpPeerTransport::authenticate_listener(socket_t socket, const IceCredentials& remote) {
    IceCredentials local = local_credentials();
    nlohmann::json hello = {
        {"type", "hello"},
        {"ufrag", local.ufrag},
        {"target", remote.ufrag},
        {"pwd", remote.pwd}
    };
    if (!send_handshake(socket, hello)) {
        return false;
    }

    // Something that is not our peer will not acknowledge in time
    if (wait_for_readable(socket, static_cast<int>(config_.handshake_timeout_ms)) != 1) {
        LOG_TCP_DEBUG("No handshake acknowledgement from " << get_peer_address(socket));
        return false;
    }
    nlohmann::json reply;
    if (!receive_handshake(socket, reply) || reply.value("type", "") != "pending") {
        return false;
    }

    // The peer accepts once our answer has been pasted on its side
    while (running_) {
        int ready = wait_for_readable(socket, POLL_INTERVAL_MS);
        if (ready < 0) {
            return false;
        }
        if (ready == 0) {
            continue;
        }
        nlohmann::json accept;
        if (!receive_handshake(socket, accept) || accept.value("type", "") != "accept") {
            return false;
        }
        if (accept.value("ufrag", "") != remote.ufrag || accept.value("pwd", "") != local.pwd) {
            LOG_TCP_WARN("Peer answered with unexpected credentials");
            return false;
        }
        return true;
    }
    return false;
}

} // namespace peerdrop
