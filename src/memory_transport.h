#pragma once

#include "send_queue.h"
#include "transport_channel.h"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace peerdrop {

/**
 * One end of an in-process channel pair
 *
 * Each end owns a delivery thread that hands its outbound frames to the other
 * end, so the peer's message callback runs on this end's delivery thread.
 * Open and close notifications are raised from the delivery thread as well.
 */
class MemoryChannel : public TransportChannel {
public:
    explicit MemoryChannel(bool text_as_binary);
    ~MemoryChannel() override;

    bool is_open() const override;
    void send_text(const std::string& text) override;
    void send_binary(const std::vector<uint8_t>& data) override;
    size_t buffered_amount() const override;
    bool delivers_text_as_binary() const override { return text_as_binary_; }
    void close() override;

    /**
     * Stop handing frames to the peer; queued bytes stay in buffered_amount()
     */
    void set_delivery_paused(bool paused);

private:
    friend class MemoryPeerTransport;

    void start(std::weak_ptr<MemoryChannel> peer);
    void request_open();
    void fail(const std::string& reason);
    void on_peer_closed();
    void receive(const ChannelMessage& message);
    void delivery_loop();
    void send_frame(FrameType type, std::vector<uint8_t> data);

    bool text_as_binary_;
    SendQueue outbound_;
    std::weak_ptr<MemoryChannel> peer_;
    std::thread delivery_thread_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool open_requested_;
    bool open_;
    bool open_notified_;
    bool closing_;
    bool peer_closed_;
    std::string failure_reason_;
};

struct MemoryLink;

/**
 * In-process PeerTransport
 *
 * Two transports are created together and negotiate through the usual
 * description exchange; the pair opens once each side has applied the other's
 * credentials and they match what the other side generated.
 */
class MemoryPeerTransport : public PeerTransport {
public:
    using Pair = std::pair<std::shared_ptr<MemoryPeerTransport>, std::shared_ptr<MemoryPeerTransport>>;

    /**
     * Create a connected pair of transports
     * @param text_as_binary Deliver every frame as binary, as some data channel stacks do
     */
    static Pair create_pair(bool text_as_binary = false);

    ~MemoryPeerTransport() override;

    bool gather_candidates(PeerRole role) override;
    IceCredentials local_credentials() const override;
    std::vector<IceCandidate> local_candidates() const override;
    void set_remote_credentials(const IceCredentials& credentials) override;
    void add_remote_candidate(const IceCandidate& candidate) override;
    std::shared_ptr<TransportChannel> channel() override { return channel_; }
    void close() override;

    std::shared_ptr<MemoryChannel> memory_channel() { return channel_; }
    std::vector<IceCandidate> remote_candidates() const;

private:
    MemoryPeerTransport(std::shared_ptr<MemoryLink> link, int side, std::shared_ptr<MemoryChannel> channel);

    std::shared_ptr<MemoryLink> link_;
    int side_;
    std::shared_ptr<MemoryChannel> channel_;
};

} // namespace peerdrop
