#pragma once

#include "errors.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace peerdrop {

/**
 * Session lifecycle states
 */
enum class SessionState {
    IDLE,
    AWAITING_LOCAL_DESCRIPTION,
    AWAITING_REMOTE_DESCRIPTION,
    CHANNEL_OPEN,
    TRANSFERRING,
    COMPLETED,
    CANCELLED,
    ERRORED
};

std::string session_state_to_string(SessionState state);

enum class TransferDirection {
    SEND,
    RECEIVE
};

std::string transfer_direction_to_string(TransferDirection direction);

enum class TransferStatus {
    TRANSFERRING,
    COMPLETED,
    CANCELLED,
    ERRORED
};

std::string transfer_status_to_string(TransferStatus status);

/**
 * Snapshot of one transfer, recomputed on every chunk
 */
struct TransferProgress {
    std::string file_name;
    uint64_t file_size;
    uint64_t bytes_transferred;
    double percentage;              // 0.0 to 100.0
    TransferStatus status;
    double speed;                   // Bytes per second since the transfer started
    std::string error;              // Set when status is ERRORED or CANCELLED
    std::string saved_path;         // Set when a receive completes
    TransferDirection direction;

    TransferProgress()
        : file_size(0), bytes_transferred(0), percentage(0.0),
          status(TransferStatus::TRANSFERRING), speed(0.0),
          direction(TransferDirection::SEND) {}
};

enum class TransferEventType {
    STATE_CHANGED,
    PROGRESS,
    LOCAL_DESCRIPTION       // Blob the user must copy to the peer
};

std::string transfer_event_type_to_string(TransferEventType type);

struct TransferEvent {
    uint64_t sequence;
    TransferEventType type;
    SessionState state;             // State after the event
    SessionState previous_state;    // Meaningful for STATE_CHANGED
    bool has_progress;
    TransferProgress progress;
    bool has_error;
    TransferErrorCode error_code;
    std::string message;            // Reason for the transition or the description blob

    TransferEvent()
        : sequence(0), type(TransferEventType::STATE_CHANGED),
          state(SessionState::IDLE), previous_state(SessionState::IDLE),
          has_progress(false), has_error(false),
          error_code(TransferErrorCode::TRANSPORT_ERROR) {}
};

using TransferEventCallback = std::function<void(const TransferEvent&)>;

/**
 * Ordered delivery of session events to subscribers and a pollable queue
 *
 * Producers number events and may publish them from any thread in any order;
 * delivery always follows sequence numbers, starting at 1. Whichever thread
 * finds the stream idle delivers everything that is ready, so a subscriber
 * may publish (or call back into the session) without deadlocking; its events
 * are delivered after the current callback returns.
 */
class TransferEventStream {
public:
    explicit TransferEventStream(size_t queue_capacity = 1024);

    TransferEventStream(const TransferEventStream&) = delete;
    TransferEventStream& operator=(const TransferEventStream&) = delete;

    /**
     * Register a callback for every event delivered from now on
     * @return Subscription id for unsubscribe()
     */
    uint64_t subscribe(TransferEventCallback callback);
    void unsubscribe(uint64_t subscription_id);

    void publish(const TransferEvent& event);

    // Oldest undelivered-to-poller event, false if none
    bool poll(TransferEvent& event);

    /**
     * Wait for the next queued event
     * @return false on timeout
     */
    bool wait_next(TransferEvent& event, std::chrono::milliseconds timeout);

    size_t get_queued_count() const;
    uint64_t get_delivered_count() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;

    std::map<uint64_t, TransferEventCallback> subscribers_;
    uint64_t next_subscription_id_;

    std::map<uint64_t, TransferEvent> pending_;
    uint64_t next_to_deliver_;
    bool dispatching_;

    std::deque<TransferEvent> queue_;
    size_t queue_capacity_;
};

} // namespace peerdrop
