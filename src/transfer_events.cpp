#include "transfer_events.h"
#include "logger.h"

#define LOG_EVENTS_WARN(message) LOG_WARN("events", message)

namespace peerdrop {

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::AWAITING_LOCAL_DESCRIPTION: return "awaiting_local_description";
        case SessionState::AWAITING_REMOTE_DESCRIPTION: return "awaiting_remote_description";
        case SessionState::CHANNEL_OPEN: return "channel_open";
        case SessionState::TRANSFERRING: return "transferring";
        case SessionState::COMPLETED: return "completed";
        case SessionState::CANCELLED: return "cancelled";
        case SessionState::ERRORED: return "errored";
        default: return "unknown";
    }
}

std::string transfer_direction_to_string(TransferDirection direction) {
    return direction == TransferDirection::SEND ? "send" : "receive";
}

std::string transfer_status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::CANCELLED: return "cancelled";
        case TransferStatus::ERRORED: return "errored";
        default: return "unknown";
    }
}

std::string transfer_event_type_to_string(TransferEventType type) {
    switch (type) {
        case TransferEventType::STATE_CHANGED: return "state_changed";
        case TransferEventType::PROGRESS: return "progress";
        case TransferEventType::LOCAL_DESCRIPTION: return "local_description";
        default: return "unknown";
    }
}

TransferEventStream::TransferEventStream(size_t queue_capacity)
    : next_subscription_id_(1), next_to_deliver_(1), dispatching_(false),
      queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity) {}

uint64_t TransferEventStream::subscribe(TransferEventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_subscription_id_++;
    subscribers_[id] = std::move(callback);
    return id;
}

void TransferEventStream::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(subscription_id);
}

void TransferEventStream::publish(const TransferEvent& event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (event.sequence < next_to_deliver_) {
        LOG_EVENTS_WARN("Dropping stale event #" << event.sequence);
        return;
    }
    pending_[event.sequence] = event;
    if (dispatching_) {
        return;
    }

    dispatching_ = true;
    auto it = pending_.find(next_to_deliver_);
    while (it != pending_.end()) {
        TransferEvent next = std::move(it->second);
        pending_.erase(it);
        ++next_to_deliver_;

        if (queue_.size() >= queue_capacity_) {
            queue_.pop_front();
        }
        queue_.push_back(next);
        queue_cv_.notify_all();

        std::vector<TransferEventCallback> callbacks;
        callbacks.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            callbacks.push_back(entry.second);
        }

        lock.unlock();
        for (const auto& callback : callbacks) {
            try {
                callback(next);
            } catch (const std::exception& e) {
                LOG_EVENTS_WARN("Event subscriber threw: " << e.what());
            }
        }
        lock.lock();

        it = pending_.find(next_to_deliver_);
    }
    dispatching_ = false;
}

bool TransferEventStream::poll(TransferEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool TransferEventStream::wait_next(TransferEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

size_t TransferEventStream::get_queued_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t TransferEventStream::get_delivered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_to_deliver_ - 1;
}

} // namespace peerdrop
