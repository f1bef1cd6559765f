#include "transport_channel.h"

namespace peerdrop {

void TransportChannel::set_open_callback(ChannelOpenCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    open_callback_ = std::move(callback);
}

void TransportChannel::set_message_callback(ChannelMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    message_callback_ = std::move(callback);
}

void TransportChannel::set_close_callback(ChannelCloseCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    close_callback_ = std::move(callback);
}

void TransportChannel::clear_callbacks() {
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    open_callback_ = nullptr;
    message_callback_ = nullptr;
    close_callback_ = nullptr;
}

void TransportChannel::notify_open() {
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    ChannelOpenCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = open_callback_;
    }
    if (callback) {
        callback();
    }
}

void TransportChannel::notify_message(const ChannelMessage& message) {
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    ChannelMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = message_callback_;
    }
    if (callback) {
        callback(message);
    }
}

void TransportChannel::notify_close(bool is_error, const std::string& reason) {
    if (close_notified_.exchange(true)) {
        return;
    }
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    ChannelCloseCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = close_callback_;
    }
    if (callback) {
        callback(is_error, reason);
    }
}

std::string peer_role_to_string(PeerRole role) {
    switch (role) {
        case PeerRole::INITIATOR: return "initiator";
        case PeerRole::RESPONDER: return "responder";
        default: return "unknown";
    }
}

} // namespace peerdrop
