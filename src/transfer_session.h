#pragma once

#include "chunk_io.h"
#include "config.h"
#include "signaling.h"
#include "transfer_events.h"
#include "transfer_protocol.h"
#include "transport_channel.h"
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace peerdrop {

/**
 * One peer-to-peer file transfer session
 *
 * Drives the description exchange, waits for the channel to open and then
 * moves files over it, one at a time, in either direction. Sends run on a
 * worker thread owned by the session; receives are driven by incoming frames.
 * Every state change, progress update and generated local description is
 * published on events().
 *
 * API misuse throws TransferError synchronously. Failures during a transfer
 * never escape: they end the transfer and are reported through events.
 *
 * Event callbacks may call back into the session, including begin_send()
 * and close(), but the session must not be destroyed from inside one of them.
 */
class FileTransferSession {
public:
    /**
     * @param transport Connection backend, owned jointly with the caller
     * @param chunk_io File access; nullptr selects DiskChunkIO over config.download_directory
     * @param config Transfer settings
     */
    FileTransferSession(std::shared_ptr<PeerTransport> transport,
                        std::shared_ptr<ChunkIO> chunk_io,
                        const TransferConfig& config = TransferConfig());
    ~FileTransferSession();

    FileTransferSession(const FileTransferSession&) = delete;
    FileTransferSession& operator=(const FileTransferSession&) = delete;

    /**
     * Begin negotiating
     * The initiator gathers candidates and publishes its offer as a
     * LOCAL_DESCRIPTION event before returning; it stays in
     * AWAITING_LOCAL_DESCRIPTION until the offer is committed with
     * apply_local_description().
     * @throws TransferError(INVALID_STATE) unless the session is idle
     * @throws TransferError(TRANSPORT_ERROR) if candidate gathering fails
     */
    void start(PeerRole role);

    /**
     * Commit the offer this session generated, once it has been handed to the user
     * Moves the initiator to AWAITING_REMOTE_DESCRIPTION. A responder's answer
     * is committed as soon as it is generated.
     * @throws TransferError(INVALID_STATE) outside AWAITING_LOCAL_DESCRIPTION or for a foreign blob
     * @throws TransferError(SIGNAL_PARSE) on malformed input
     */
    void apply_local_description(const std::string& blob);

    /**
     * Feed a blob pasted from the peer
     * Accepts the peer's session description once, and candidate blobs at any
     * point after start(). A responder answers the offer immediately.
     * @throws TransferError(INVALID_STATE) before start(), after a session failure or
     *         for a second session description
     * @throws TransferError(SIGNAL_PARSE) on malformed input
     */
    void apply_remote_description(const std::string& blob);

    /**
     * Start sending a file
     * @throws TransferError(TRANSFER_IN_PROGRESS) while a transfer is running
     * @throws TransferError(NOT_CONNECTED) unless the channel is open
     */
    void begin_send(const std::string& path);

    // Cancel the running transfer; no-op when nothing is transferring
    void cancel();

    /**
     * Tear the session down
     * A running transfer is cancelled and the peer is told so if the channel
     * is still open. Idempotent; no events are published.
     */
    void close();

    SessionState get_state() const;
    PeerRole get_role() const;
    bool is_channel_open() const;

    // Local description blob, empty until generated
    std::string get_local_description() const;

    // Latest progress of the current or last transfer
    TransferProgress get_progress() const;

    TransferEventStream& events() { return events_; }

private:
    void on_channel_open();
    void on_channel_message(const ChannelMessage& message);
    void on_channel_close(bool is_error, const std::string& reason);

    void run_send(std::shared_ptr<ChunkSender> sender, const std::string& path);
    void on_send_progress(const TransferProgress& progress);
    void finish_send(const TransferProgress& progress, TransferStatus status, TransferErrorCode code);

    void handle_frame_while_sending(const ChannelMessage& message);
    void handle_receive_outcome(const ReceiveOutcome& outcome, bool was_receiving, std::vector<TransferEvent>& events);

    void emit_local_description(const std::string& blob, std::vector<TransferEvent>& events);
    void send_cancel_frame();
    void drain_channel();

    // Helpers below require mutex_
    TransferEvent& push_event(std::vector<TransferEvent>& events, TransferEventType type);
    TransferEvent& transition(std::vector<TransferEvent>& events, SessionState next, const std::string& reason);
    TransferEvent& fail_session(std::vector<TransferEvent>& events, TransferErrorCode code, const std::string& reason);
    void require_send_ready() const;
    void end_transfer(std::vector<TransferEvent>& events, SessionState terminal, const TransferProgress& progress,
                      bool has_error, TransferErrorCode code);

    void publish(const std::vector<TransferEvent>& events);

    // Moves out every retired worker except the calling thread; requires mutex_
    std::vector<std::thread> take_joinable_workers();
    static void join_workers(std::vector<std::thread>& workers);

    std::shared_ptr<PeerTransport> transport_;
    std::shared_ptr<TransportChannel> channel_;
    std::shared_ptr<ChunkIO> chunk_io_;
    TransferConfig config_;

    TransferEventStream events_;

    mutable std::mutex mutex_;
    SessionState state_;
    PeerRole role_;
    bool session_failed_;           // ERRORED is final
    bool closed_;
    bool remote_applied_;
    bool channel_open_;
    uint64_t next_sequence_;

    std::unique_ptr<SignalingExchange> signaling_;
    std::unique_ptr<ChunkReceiver> receiver_;
    std::shared_ptr<ChunkSender> sender_;
    std::thread send_thread_;
    // Finished workers, joined outside the lock; a worker that started the
    // next send from its own event callback stays here until close()
    std::vector<std::thread> retired_workers_;
    bool sending_;
    bool receiving_;
    TransferProgress last_progress_;
};

} // namespace peerdrop
