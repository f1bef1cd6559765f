#include "send_queue.h"

namespace peerdrop {

bool SendQueue::push(FrameType type, std::vector<uint8_t> data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        pending_bytes_ += data.size();
        frames_.emplace_back(type, std::move(data));
    }
    cv_.notify_one();
    return true;
}

bool SendQueue::pop(ChannelMessage& frame) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || (!paused_ && !frames_.empty()); });
    if (closed_) {
        return false;
    }
    frame = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

void SendQueue::mark_sent(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_bytes_ = bytes >= pending_bytes_ ? 0 : pending_bytes_ - bytes;
}

size_t SendQueue::pending_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_bytes_;
}

size_t SendQueue::frame_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

void SendQueue::set_paused(bool paused) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = paused;
    }
    cv_.notify_all();
}

bool SendQueue::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

void SendQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        frames_.clear();
        pending_bytes_ = 0;
    }
    cv_.notify_all();
}

bool SendQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace peerdrop
