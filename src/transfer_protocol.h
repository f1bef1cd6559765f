#pragma once

#include "chunk_io.h"
#include "config.h"
#include "errors.h"
#include "transfer_events.h"
#include "transport_channel.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace peerdrop {

enum class ControlType {
    METADATA,
    COMPLETE,
    CANCEL
};

/**
 * Control frame, carried as UTF-8 JSON text
 *   {"type":"metadata","fileName":"a.bin","fileSize":200000}
 *   {"type":"complete"}
 *   {"type":"cancel"}
 */
struct ControlMessage {
    ControlType type;
    std::string file_name;      // METADATA only
    uint64_t file_size;         // METADATA only

    ControlMessage() : type(ControlType::CANCEL), file_size(0) {}

    static ControlMessage metadata(const std::string& file_name, uint64_t file_size);
    static ControlMessage complete();
    static ControlMessage cancel();
};

std::string encode_control_message(const ControlMessage& message);

/**
 * Decode a control frame
 * @return false if the text is not a well-formed control message
 */
bool decode_control_message(const std::string& text, ControlMessage& message);

/**
 * Interpret a channel frame as a control message
 * Text frames must decode. Binary frames are only tried when `speculative` is
 * set and the payload starts with a JSON object.
 */
bool decode_control_frame(const ChannelMessage& frame, bool speculative, ControlMessage& message);

/**
 * Byte counter behind TransferProgress snapshots
 */
class ProgressTracker {
public:
    ProgressTracker();

    void start(const std::string& file_name, uint64_t file_size, TransferDirection direction);
    void add_bytes(uint64_t bytes);
    void reset();

    TransferProgress snapshot(TransferStatus status) const;

    bool is_active() const { return active_; }
    uint64_t get_bytes() const { return bytes_; }
    uint64_t get_file_size() const { return file_size_; }
    const std::string& get_file_name() const { return file_name_; }

private:
    bool active_;
    std::string file_name_;
    uint64_t file_size_;
    uint64_t bytes_;
    TransferDirection direction_;
    std::chrono::steady_clock::time_point start_time_;
};

using TransferProgressCallback = std::function<void(const TransferProgress&)>;

/**
 * Sending half of one transfer
 *
 * send_file() runs on the caller's thread until the file is sent or the
 * transfer stops. The stop requests may come from any other thread and take
 * effect at the next chunk boundary or backpressure wait.
 */
class ChunkSender {
public:
    ChunkSender(TransportChannel& channel, ChunkIO& chunk_io,
                std::chrono::milliseconds poll_interval = std::chrono::milliseconds(10));

    /**
     * Send metadata, every chunk and the completion frame
     * @return Final progress snapshot (status COMPLETED)
     * @throws TransferError TRANSFER_CANCELLED when stopped, IO_ERROR on read
     *         failures, CHANNEL_NOT_OPEN or TRANSPORT_ERROR when the channel goes away
     */
    TransferProgress send_file(const std::string& path, const TransferProgressCallback& on_progress);

    // Local cancel: a cancel frame is sent to the peer
    void cancel();
    // The peer sent cancel; stop without answering
    void notify_peer_cancelled();
    // Stop silently (teardown)
    void abort();

    TransferProgress get_progress(TransferStatus status) const;
    uint64_t get_backpressure_waits() const;

private:
    enum class StopReason {
        NONE,
        LOCAL_CANCEL,
        PEER_CANCEL,
        ABORT
    };

    void request_stop(StopReason reason);
    void check_stopped();
    void wait_for_drain();
    void send_cancel_frame();

    TransportChannel& channel_;
    ChunkIO& chunk_io_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    StopReason stop_reason_;
    ProgressTracker tracker_;
    uint64_t backpressure_waits_;
};

/**
 * Result of feeding one frame to the receiver
 */
struct ReceiveOutcome {
    enum class Kind {
        IGNORED,        // Nothing changed (e.g. cancel with no transfer)
        STARTED,        // Metadata accepted, output reserved
        PROGRESS,       // Chunk written
        COMPLETED,      // File finalised at progress.saved_path
        CANCELLED,      // Partial output discarded
        FAILED          // Protocol violation or I/O failure; partial output discarded
    };

    Kind kind;
    TransferProgress progress;
    TransferErrorCode error_code;
    std::string error;

    ReceiveOutcome() : kind(Kind::IGNORED), error_code(TransferErrorCode::PROTOCOL_VIOLATION) {}
};

/**
 * Receiving half of the protocol
 *
 * Driven by frames from the channel's delivery thread. A failed or cancelled
 * receive never leaves output behind. After a local cancel or a failure the
 * receiver ignores everything but the next metadata frame, so chunks still in
 * flight from the peer do not raise further errors.
 */
class ChunkReceiver {
public:
    explicit ChunkReceiver(ChunkIO& chunk_io);
    ~ChunkReceiver();

    ChunkReceiver(const ChunkReceiver&) = delete;
    ChunkReceiver& operator=(const ChunkReceiver&) = delete;

    /**
     * Handle one frame
     * @param speculative_decode Try binary frames as JSON control messages first,
     *        for channels that cannot preserve the text/binary distinction
     */
    ReceiveOutcome handle_message(const ChannelMessage& message, bool speculative_decode);

    // Discard the active receive on local request
    ReceiveOutcome cancel();
    // Discard the active receive without an outcome (teardown, channel loss)
    void abort();

    // Ignore frames until the next metadata frame
    void skip_until_metadata();

    bool is_active() const;
    bool is_discarding() const;
    uint64_t get_bytes_received() const;
    TransferProgress get_progress(TransferStatus status) const;

private:
    ReceiveOutcome handle_control(const ControlMessage& message);
    ReceiveOutcome handle_chunk(const std::vector<uint8_t>& data);
    ReceiveOutcome fail(TransferErrorCode code, const std::string& error);
    void discard_output();

    ChunkIO& chunk_io_;
    mutable std::mutex mutex_;
    ProgressTracker tracker_;
    std::string stream_id_;
    bool discarding_;
};

} // namespace peerdrop
