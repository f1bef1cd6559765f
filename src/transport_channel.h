#pragma once

#include "ice_candidate.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace peerdrop {

enum class FrameType {
    TEXT,
    BINARY
};

/**
 * One message received on a channel, delivered in send order
 */
struct ChannelMessage {
    FrameType type;
    std::vector<uint8_t> data;

    ChannelMessage() : type(FrameType::BINARY) {}
    ChannelMessage(FrameType t, std::vector<uint8_t> d) : type(t), data(std::move(d)) {}

    std::string text() const { return std::string(data.begin(), data.end()); }
};

using ChannelOpenCallback = std::function<void()>;
using ChannelMessageCallback = std::function<void(const ChannelMessage&)>;
using ChannelCloseCallback = std::function<void(bool is_error, const std::string& reason)>;

/**
 * Reliable, ordered, message-oriented channel between two peers
 *
 * Callbacks run on the channel's own threads. The close callback fires at most
 * once, whether the channel was closed locally, by the peer or by a failure.
 */
class TransportChannel {
public:
    virtual ~TransportChannel() = default;

    virtual bool is_open() const = 0;

    /**
     * Queue a text frame
     * @throws TransferError(CHANNEL_NOT_OPEN) before the open event and after close
     */
    virtual void send_text(const std::string& text) = 0;

    /**
     * Queue a binary frame
     * @throws TransferError(CHANNEL_NOT_OPEN) before the open event and after close
     */
    virtual void send_binary(const std::vector<uint8_t>& data) = 0;

    // Bytes queued for sending but not yet handed to the network
    virtual size_t buffered_amount() const = 0;

    // True for channels that may hand text frames to the receiver as binary
    virtual bool delivers_text_as_binary() const { return false; }

    // Idempotent; safe from any state and from inside a channel callback
    virtual void close() = 0;

    void set_open_callback(ChannelOpenCallback callback);
    void set_message_callback(ChannelMessageCallback callback);
    void set_close_callback(ChannelCloseCallback callback);

    /**
     * Drop all callbacks
     * Waits for a callback running on another thread to return. Callbacks of
     * one channel never run concurrently with each other.
     */
    void clear_callbacks();

protected:
    void notify_open();
    void notify_message(const ChannelMessage& message);
    void notify_close(bool is_error, const std::string& reason);

private:
    std::recursive_mutex dispatch_mutex_;
    std::mutex callbacks_mutex_;
    ChannelOpenCallback open_callback_;
    ChannelMessageCallback message_callback_;
    ChannelCloseCallback close_callback_;
    std::atomic<bool> close_notified_{false};
};

/**
 * Which side of the negotiation this peer plays
 */
enum class PeerRole {
    INITIATOR,      // Creates the offer
    RESPONDER       // Answers the offer
};

std::string peer_role_to_string(PeerRole role);

struct IceCredentials {
    std::string ufrag;
    std::string pwd;

    bool empty() const { return ufrag.empty() || pwd.empty(); }
};

/**
 * Connection establishment for one peer pair
 *
 * Gathering is synchronous and non-trickled: after gather_candidates() the
 * full local candidate list and credentials are known. Remote information is
 * fed in as it arrives; the channel opens once both sides have it.
 */
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    /**
     * Collect local candidates for the given role
     * @return false if no candidate could be produced
     */
    virtual bool gather_candidates(PeerRole role) = 0;

    virtual IceCredentials local_credentials() const = 0;
    virtual std::vector<IceCandidate> local_candidates() const = 0;

    virtual void set_remote_credentials(const IceCredentials& credentials) = 0;
    virtual void add_remote_candidate(const IceCandidate& candidate) = 0;

    // Channel shared with the session; valid for the lifetime of the transport
    virtual std::shared_ptr<TransportChannel> channel() = 0;

    // Idempotent teardown
    virtual void close() = 0;
};

} // namespace peerdrop
