#include "memory_transport.h"
#include "errors.h"
#include "logger.h"

#define LOG_MEMORY_DEBUG(message) LOG_DEBUG("memory", message)
#define LOG_MEMORY_INFO(message)  LOG_INFO("memory", message)
#define LOG_MEMORY_WARN(message)  LOG_WARN("memory", message)

namespace peerdrop {

//=============================================================================
// MemoryChannel
//=============================================================================

MemoryChannel::MemoryChannel(bool text_as_binary)
    : text_as_binary_(text_as_binary), open_requested_(false), open_(false),
      open_notified_(false), closing_(false), peer_closed_(false) {}

MemoryChannel::~MemoryChannel() {
    close();
    if (delivery_thread_.joinable()) {
        if (delivery_thread_.get_id() == std::this_thread::get_id()) {
            delivery_thread_.detach();
        } else {
            delivery_thread_.join();
        }
    }
}

void MemoryChannel::start(std::weak_ptr<MemoryChannel> peer) {
    peer_ = std::move(peer);
    delivery_thread_ = std::thread(&MemoryChannel::delivery_loop, this);
}

bool MemoryChannel::is_open() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return open_ && !closing_;
}

void MemoryChannel::send_text(const std::string& text) {
    send_frame(FrameType::TEXT, std::vector<uint8_t>(text.begin(), text.end()));
}

void MemoryChannel::send_binary(const std::vector<uint8_t>& data) {
    send_frame(FrameType::BINARY, data);
}

void MemoryChannel::send_frame(FrameType type, std::vector<uint8_t> data) {
    if (!is_open() || !outbound_.push(type, std::move(data))) {
        throw TransferError(TransferErrorCode::CHANNEL_NOT_OPEN, "Channel is not open");
    }
}

size_t MemoryChannel::buffered_amount() const {
    return outbound_.pending_bytes();
}

void MemoryChannel::close() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closing_) {
            return;
        }
        closing_ = true;
    }
    state_cv_.notify_all();
    outbound_.close();

    if (auto peer = peer_.lock()) {
        peer->on_peer_closed();
    }
}

void MemoryChannel::set_delivery_paused(bool paused) {
    LOG_MEMORY_DEBUG("Delivery " << (paused ? "paused" : "resumed"));
    outbound_.set_paused(paused);
}

void MemoryChannel::request_open() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_requested_ = true;
    }
    state_cv_.notify_all();
}

void MemoryChannel::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closing_) {
            return;
        }
        closing_ = true;
        failure_reason_ = reason;
    }
    state_cv_.notify_all();
    outbound_.close();
}

void MemoryChannel::on_peer_closed() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closing_) {
            return;
        }
        closing_ = true;
        peer_closed_ = true;
    }
    state_cv_.notify_all();
    outbound_.close();
}

void MemoryChannel::receive(const ChannelMessage& message) {
    {
        // Frames sent right after the peer opened wait for our own open event
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this] { return open_notified_ || closing_; });
        if (closing_) {
            return;
        }
    }

    if (text_as_binary_ && message.type == FrameType::TEXT) {
        notify_message(ChannelMessage(FrameType::BINARY, message.data));
    } else {
        notify_message(message);
    }
}

void MemoryChannel::delivery_loop() {
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this] { return open_requested_ || closing_; });
        if (!closing_) {
            open_ = true;
        }
    }

    bool opened;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        opened = open_;
    }

    if (opened) {
        LOG_MEMORY_DEBUG("Channel open");
        notify_open();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            open_notified_ = true;
        }
        state_cv_.notify_all();

        ChannelMessage frame;
        while (outbound_.pop(frame)) {
            size_t size = frame.data.size();
            auto peer = peer_.lock();
            if (!peer) {
                break;
            }
            peer->receive(frame);
            outbound_.mark_sent(size);
        }
    }

    bool is_error;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_ = false;
        is_error = !failure_reason_.empty();
        if (is_error) {
            reason = failure_reason_;
        } else if (peer_closed_) {
            reason = "Peer closed the channel";
        } else {
            reason = "Channel closed";
        }
    }
    LOG_MEMORY_DEBUG(reason);
    notify_close(is_error, reason);
}

//=============================================================================
// MemoryPeerTransport
//=============================================================================

struct MemoryLink {
    std::mutex mutex;
    IceCredentials local[2];
    IceCredentials remote[2];
    std::vector<IceCandidate> local_candidates[2];
    std::vector<IceCandidate> remote_candidates[2];
    std::weak_ptr<MemoryChannel> channels[2];
    bool settled = false;
};

MemoryPeerTransport::Pair MemoryPeerTransport::create_pair(bool text_as_binary) {
    auto link = std::make_shared<MemoryLink>();
    auto first_channel = std::make_shared<MemoryChannel>(text_as_binary);
    auto second_channel = std::make_shared<MemoryChannel>(text_as_binary);
    link->channels[0] = first_channel;
    link->channels[1] = second_channel;

    first_channel->start(second_channel);
    second_channel->start(first_channel);

    std::shared_ptr<MemoryPeerTransport> first(new MemoryPeerTransport(link, 0, first_channel));
    std::shared_ptr<MemoryPeerTransport> second(new MemoryPeerTransport(link, 1, second_channel));
    return Pair(first, second);
}

MemoryPeerTransport::MemoryPeerTransport(std::shared_ptr<MemoryLink> link, int side, std::shared_ptr<MemoryChannel> channel)
    : link_(std::move(link)), side_(side), channel_(std::move(channel)) {}

MemoryPeerTransport::~MemoryPeerTransport() {
    close();
}

bool MemoryPeerTransport::gather_candidates(PeerRole role) {
    IceCandidate candidate;
    candidate.transport = IceTransport::TCP;
    candidate.type = IceCandidateType::HOST;
    candidate.ip = "127.0.0.1";
    if (role == PeerRole::INITIATOR) {
        candidate.tcp_type = IceTcpType::PASSIVE;
        candidate.port = static_cast<uint16_t>(50000 + side_);
    } else {
        candidate.tcp_type = IceTcpType::ACTIVE;
        candidate.port = ICE_DISCARD_PORT;
    }
    candidate.priority = calculate_candidate_priority(IceCandidateType::HOST,
        calculate_tcp_local_preference(candidate.tcp_type, 8191), 1);
    candidate.foundation = generate_foundation(candidate);

    std::lock_guard<std::mutex> lock(link_->mutex);
    link_->local[side_].ufrag = generate_ufrag();
    link_->local[side_].pwd = generate_password();
    link_->local_candidates[side_] = {candidate};
    LOG_MEMORY_DEBUG("Gathered in-process candidate as " << peer_role_to_string(role));
    return true;
}

IceCredentials MemoryPeerTransport::local_credentials() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->local[side_];
}

std::vector<IceCandidate> MemoryPeerTransport::local_candidates() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->local_candidates[side_];
}

void MemoryPeerTransport::set_remote_credentials(const IceCredentials& credentials) {
    std::shared_ptr<MemoryChannel> channels[2];
    bool matched = false;
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        link_->remote[side_] = credentials;
        if (link_->settled || link_->remote[0].empty() || link_->remote[1].empty()) {
            return;
        }
        link_->settled = true;
        matched = link_->remote[0].ufrag == link_->local[1].ufrag &&
                  link_->remote[0].pwd == link_->local[1].pwd &&
                  link_->remote[1].ufrag == link_->local[0].ufrag &&
                  link_->remote[1].pwd == link_->local[0].pwd;
        channels[0] = link_->channels[0].lock();
        channels[1] = link_->channels[1].lock();
    }

    for (auto& channel : channels) {
        if (!channel) {
            continue;
        }
        if (matched) {
            channel->request_open();
        } else {
            channel->fail("ICE credentials do not match the peer");
        }
    }
    if (matched) {
        LOG_MEMORY_INFO("In-process pair connected");
    } else {
        LOG_MEMORY_WARN("In-process pair rejected: credential mismatch");
    }
}

void MemoryPeerTransport::add_remote_candidate(const IceCandidate& candidate) {
    std::lock_guard<std::mutex> lock(link_->mutex);
    link_->remote_candidates[side_].push_back(candidate);
}

std::vector<IceCandidate> MemoryPeerTransport::remote_candidates() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->remote_candidates[side_];
}

void MemoryPeerTransport::close() {
    if (channel_) {
        channel_->close();
    }
}

} // namespace peerdrop
