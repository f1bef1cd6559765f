#pragma once

#include "config.h"
#include "send_queue.h"
#include "socket.h"
#include "transport_channel.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace peerdrop {

/**
 * Frame kinds on the wire: [kind:1][length:4 big-endian][payload]
 */
enum class TcpFrameKind : uint8_t {
    TEXT = 1,
    BINARY = 2,
    HANDSHAKE = 3
};

constexpr size_t TCP_FRAME_HEADER_SIZE = 5;
// Handshake frames carry a small JSON object
constexpr uint32_t MAX_HANDSHAKE_FRAME_SIZE = 4096;

enum class FrameReadResult {
    OK,
    CLOSED,         // Connection ended (EOF or socket error)
    MALFORMED,      // Unknown frame kind
    OVERSIZED       // Declared length above the limit
};

std::vector<uint8_t> encode_tcp_frame_header(TcpFrameKind kind, size_t payload_size);
bool send_tcp_frame(socket_t socket, TcpFrameKind kind, const std::vector<uint8_t>& payload);
FrameReadResult receive_tcp_frame(socket_t socket, uint32_t max_payload_size,
                                  TcpFrameKind& kind, std::vector<uint8_t>& payload);

/**
 * TransportChannel over a connected TCP socket
 *
 * A writer thread drains the outbound SendQueue; a reader thread delivers
 * incoming frames and raises the close notification when the connection ends.
 */
class TcpChannel : public TransportChannel {
public:
    explicit TcpChannel(uint32_t max_frame_size);
    ~TcpChannel() override;

    bool is_open() const override;
    void send_text(const std::string& text) override;
    void send_binary(const std::vector<uint8_t>& data) override;
    size_t buffered_amount() const override;
    void close() override;

    std::string get_remote_address() const;

private:
    friend class TcpPeerTransport;

    // Take ownership of a connected, authenticated socket and open the channel
    void attach(socket_t socket);
    // Connection could not be established
    void fail(const std::string& reason);
    void join_threads();

    void reader_loop();
    void writer_loop();
    void send_frame(FrameType type, std::vector<uint8_t> data);

    uint32_t max_frame_size_;
    socket_t socket_;
    std::string remote_address_;
    SendQueue outbound_;
    std::thread reader_thread_;
    std::thread writer_thread_;

    mutable std::mutex state_mutex_;
    std::atomic<bool> open_;
    std::atomic<bool> closing_;
    std::string failure_reason_;
};

/**
 * Direct TCP connection negotiated with ICE-TCP style host candidates
 *
 * The initiator listens and advertises passive candidates; the responder
 * advertises active candidates and dials the initiator's passive ones. Before
 * the channel opens, the dialer proves it saw the offer (HELLO carrying the
 * offerer's password) and the listener proves it saw the answer (ACCEPT
 * carrying the answerer's password).
 */
class TcpPeerTransport : public PeerTransport {
public:
    explicit TcpPeerTransport(const TransferConfig& config = TransferConfig());
    ~TcpPeerTransport() override;

    TcpPeerTransport(const TcpPeerTransport&) = delete;
    TcpPeerTransport& operator=(const TcpPeerTransport&) = delete;

    bool gather_candidates(PeerRole role) override;
    IceCredentials local_credentials() const override;
    std::vector<IceCandidate> local_candidates() const override;
    void set_remote_credentials(const IceCredentials& credentials) override;
    void add_remote_candidate(const IceCandidate& candidate) override;
    std::shared_ptr<TransportChannel> channel() override { return channel_; }
    void close() override;

    // Port the initiator listens on, 0 before gathering
    uint16_t get_listen_port() const;

private:
    void accept_loop();
    void connect_loop();
    bool authenticate_dialer(socket_t client);
    bool authenticate_listener(socket_t socket, const IceCredentials& remote);
    bool next_candidate(IceCandidate& candidate, std::vector<IceCandidate>& tried,
                        std::chrono::steady_clock::time_point deadline);
    void maybe_start_connecting();
    void set_handshake_socket(socket_t socket);
    void join_thread(std::thread& thread);

    TransferConfig config_;
    std::shared_ptr<TcpChannel> channel_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    PeerRole role_;
    bool gathered_;
    IceCredentials local_credentials_;
    IceCredentials remote_credentials_;
    std::vector<IceCandidate> local_candidates_;
    std::vector<IceCandidate> remote_candidates_;

    std::atomic<bool> running_;
    socket_t server_socket_;
    socket_t handshake_socket_;     // Connection being authenticated, shut down by close()
    uint16_t listen_port_;
    std::thread accept_thread_;
    std::thread connect_thread_;
};

} // namespace peerdrop
