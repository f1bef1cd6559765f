#pragma once

/**
 * @file send_queue.h
 * @brief Outbound frame queue shared by a channel and its writer thread
 *
 * Producers append whole frames. The writer pops the front frame, transmits it
 * and then reports the bytes as sent. Until then they count towards
 * pending_bytes(), which is what a channel reports as its buffered amount.
 */

#include "transport_channel.h"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace peerdrop {

class SendQueue {
public:
    SendQueue() = default;

    SendQueue(const SendQueue&) = delete;
    SendQueue& operator=(const SendQueue&) = delete;

    /**
     * @brief Append a frame by moving its payload
     * @return false if the queue is closed
     */
    bool push(FrameType type, std::vector<uint8_t> data);

    /**
     * @brief Block until a frame can be taken, then remove it
     *
     * Waits while the queue is empty or paused.
     * @return false once the queue is closed
     */
    bool pop(ChannelMessage& frame);

    /**
     * @brief Report bytes of a popped frame as transmitted
     */
    void mark_sent(size_t bytes);

    /**
     * @brief Bytes pushed but not yet reported as sent
     */
    size_t pending_bytes() const;

    size_t frame_count() const;

    /**
     * @brief Hold frames in the queue without closing it
     */
    void set_paused(bool paused);
    bool is_paused() const;

    /**
     * @brief Wake the writer and drop anything still queued
     */
    void close();
    bool is_closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ChannelMessage> frames_;
    size_t pending_bytes_ = 0;
    bool paused_ = false;
    bool closed_ = false;
};

} // namespace peerdrop
