#include "transfer_session.h"
#include "fs.h"
#include "logger.h"
#include <chrono>

#define LOG_SESSION_DEBUG(message) LOG_DEBUG("session", message)
#define LOG_SESSION_INFO(message)  LOG_INFO("session", message)
#define LOG_SESSION_WARN(message)  LOG_WARN("session", message)
#define LOG_SESSION_ERROR(message) LOG_ERROR("session", message)

namespace peerdrop {

namespace {

// How long close() lets queued frames (usually a cancel) reach the peer
constexpr int CLOSE_DRAIN_TIMEOUT_MS = 1000;

SessionState terminal_state_for(TransferStatus status) {
    switch (status) {
        case TransferStatus::COMPLETED: return SessionState::COMPLETED;
        case TransferStatus::CANCELLED: return SessionState::CANCELLED;
        default: return SessionState::ERRORED;
    }
}

} // namespace

FileTransferSession::FileTransferSession(std::shared_ptr<PeerTransport> transport,
                                         std::shared_ptr<ChunkIO> chunk_io,
                                         const TransferConfig& config)
    : transport_(std::move(transport)), chunk_io_(std::move(chunk_io)), config_(config),
      state_(SessionState::IDLE), role_(PeerRole::INITIATOR), session_failed_(false), closed_(false),
      remote_applied_(false), channel_open_(false), next_sequence_(1),
      sending_(false), receiving_(false) {
    if (!transport_ || !transport_->channel()) {
        throw TransferError(TransferErrorCode::TRANSPORT_ERROR, "A transport with a channel is required");
    }
    if (!chunk_io_) {
        chunk_io_ = std::make_shared<DiskChunkIO>(config_.download_directory);
    }

    channel_ = transport_->channel();
    receiver_.reset(new ChunkReceiver(*chunk_io_));

    channel_->set_open_callback([this]() {
        on_channel_open();
    });
    channel_->set_message_callback([this](const ChannelMessage& message) {
        on_channel_message(message);
    });
    channel_->set_close_callback([this](bool is_error, const std::string& reason) {
        on_channel_close(is_error, reason);
    });
}

FileTransferSession::~FileTransferSession() {
    close();

    // close() leaves behind a worker that closed the session from its own callback
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers = std::move(retired_workers_);
        retired_workers_.clear();
    }
    for (auto& worker : workers) {
        if (worker.get_id() == std::this_thread::get_id()) {
            LOG_SESSION_ERROR("Session destroyed from its own send worker");
            worker.detach();
        } else {
            worker.join();
        }
    }
}

//=============================================================================
// Negotiation
//=============================================================================

void FileTransferSession::start(PeerRole role) {
    std::vector<TransferEvent> events;
    std::unique_lock<std::mutex> lock(mutex_);

    if (closed_) {
        throw TransferError(TransferErrorCode::INVALID_STATE, "Session is closed");
    }
    if (state_ != SessionState::IDLE) {
        throw TransferError(TransferErrorCode::INVALID_STATE,
            "Session already started (state " + session_state_to_string(state_) + ")");
    }

    role_ = role;
    signaling_.reset(new SignalingExchange(transport_, role));
    LOG_SESSION_INFO("Starting session as " << peer_role_to_string(role));

    if (role == PeerRole::RESPONDER) {
        transition(events, SessionState::AWAITING_REMOTE_DESCRIPTION, "Waiting for the peer's offer");
        lock.unlock();
        publish(events);
        return;
    }

    transition(events, SessionState::AWAITING_LOCAL_DESCRIPTION, "Gathering candidates");
    std::string offer;
    try {
        offer = signaling_->create_offer();
    } catch (const TransferError& e) {
        fail_session(events, e.code(), std::string("Could not create offer: ") + e.what());
        lock.unlock();
        publish(events);
        throw;
    }
    // Committed by apply_local_description() once the host has shown it
    emit_local_description(offer, events);

    lock.unlock();
    publish(events);
}

void FileTransferSession::apply_local_description(const std::string& blob) {
    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !signaling_ || state_ != SessionState::AWAITING_LOCAL_DESCRIPTION) {
            throw TransferError(TransferErrorCode::INVALID_STATE,
                "No local description is awaited in state " + session_state_to_string(state_));
        }
        parse_signal_blob(blob);
        if (!signaling_->is_local_description(blob)) {
            throw TransferError(TransferErrorCode::INVALID_STATE, "Not the description this session generated");
        }
        transition(events, SessionState::AWAITING_REMOTE_DESCRIPTION, "Waiting for the peer's answer");
    }
    publish(events);
}

void FileTransferSession::apply_remote_description(const std::string& blob) {
    std::vector<TransferEvent> events;
    std::unique_lock<std::mutex> lock(mutex_);

    if (closed_) {
        throw TransferError(TransferErrorCode::INVALID_STATE, "Session is closed");
    }
    if (!signaling_ || state_ == SessionState::IDLE || state_ == SessionState::AWAITING_LOCAL_DESCRIPTION) {
        throw TransferError(TransferErrorCode::INVALID_STATE,
            "Remote description not expected in state " + session_state_to_string(state_));
    }
    if (session_failed_) {
        throw TransferError(TransferErrorCode::INVALID_STATE, "Session has failed");
    }

    RemoteSignalResult result;
    try {
        result = signaling_->apply_remote(blob);
    } catch (const TransferError& e) {
        if (e.code() == TransferErrorCode::TRANSPORT_ERROR) {
            fail_session(events, e.code(), e.what());
            lock.unlock();
            publish(events);
        } else {
            LOG_SESSION_WARN("Rejected remote blob: " << e.what());
        }
        throw;
    }

    switch (result.kind) {
        case RemoteSignalResult::Kind::DESCRIPTION_APPLIED:
            remote_applied_ = true;
            LOG_SESSION_INFO("Remote description applied (" << result.flushed_candidates << " queued candidate(s) flushed)");
            if (!result.local_answer.empty()) {
                emit_local_description(result.local_answer, events);
            }
            if (channel_open_ && state_ == SessionState::AWAITING_REMOTE_DESCRIPTION) {
                transition(events, SessionState::CHANNEL_OPEN, "Connection established");
            }
            break;
        case RemoteSignalResult::Kind::CANDIDATE_APPLIED:
            LOG_SESSION_DEBUG("Remote candidate applied");
            break;
        case RemoteSignalResult::Kind::CANDIDATE_QUEUED:
            LOG_SESSION_DEBUG("Remote candidate queued until the description arrives");
            break;
        case RemoteSignalResult::Kind::END_OF_CANDIDATES:
            LOG_SESSION_DEBUG("Remote end of candidates");
            break;
    }

    lock.unlock();
    publish(events);
}

void FileTransferSession::emit_local_description(const std::string& blob, std::vector<TransferEvent>& events) {
    TransferEvent& event = push_event(events, TransferEventType::LOCAL_DESCRIPTION);
    event.message = blob;
    LOG_SESSION_INFO("Local description ready (" << blob.size() << " bytes)");
}

//=============================================================================
// Transfers
//=============================================================================

void FileTransferSession::require_send_ready() const {
    if (closed_) {
        throw TransferError(TransferErrorCode::NOT_CONNECTED, "Session is closed");
    }
    if (state_ == SessionState::TRANSFERRING) {
        throw TransferError(TransferErrorCode::TRANSFER_IN_PROGRESS, "A transfer is already in progress");
    }
    if (state_ != SessionState::CHANNEL_OPEN || !channel_open_) {
        throw TransferError(TransferErrorCode::NOT_CONNECTED,
            "Channel is not open (state " + session_state_to_string(state_) + ")");
    }
}

void FileTransferSession::begin_send(const std::string& path) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_send_ready();
        // The previous worker has already reported its outcome
        if (send_thread_.joinable()) {
            retired_workers_.push_back(std::move(send_thread_));
        }
        finished = take_joinable_workers();
    }
    join_workers(finished);

    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_send_ready();

        sender_ = std::make_shared<ChunkSender>(*channel_, *chunk_io_,
            std::chrono::milliseconds(config_.backpressure_poll_ms));
        sending_ = true;
        last_progress_ = TransferProgress();
        last_progress_.file_name = get_filename_from_path(path);
        last_progress_.direction = TransferDirection::SEND;

        TransferEvent& event = transition(events, SessionState::TRANSFERRING, "Sending " + path);
        event.has_progress = true;
        event.progress = last_progress_;

        send_thread_ = std::thread(&FileTransferSession::run_send, this, sender_, path);
    }
    publish(events);
}

void FileTransferSession::run_send(std::shared_ptr<ChunkSender> sender, const std::string& path) {
    TransferProgress progress;
    TransferStatus status = TransferStatus::COMPLETED;
    TransferErrorCode code = TransferErrorCode::TRANSFER_CANCELLED;

    try {
        progress = sender->send_file(path, [this](const TransferProgress& update) {
            on_send_progress(update);
        });
    } catch (const TransferError& e) {
        code = e.code();
        status = code == TransferErrorCode::TRANSFER_CANCELLED ? TransferStatus::CANCELLED : TransferStatus::ERRORED;
        progress = sender->get_progress(status);
        progress.error = e.what();
        if (status == TransferStatus::ERRORED) {
            LOG_SESSION_ERROR("Send of " << path << " failed: " << e.what());
        }
    } catch (const std::exception& e) {
        code = TransferErrorCode::TRANSPORT_ERROR;
        status = TransferStatus::ERRORED;
        progress = sender->get_progress(status);
        progress.error = e.what();
        LOG_SESSION_ERROR("Send of " << path << " failed: " << e.what());
    }

    if (progress.file_name.empty()) {
        progress.file_name = get_filename_from_path(path);
    }
    finish_send(progress, status, code);
}

void FileTransferSession::on_send_progress(const TransferProgress& progress) {
    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !sending_ || state_ != SessionState::TRANSFERRING) {
            return;
        }
        last_progress_ = progress;
        TransferEvent& event = push_event(events, TransferEventType::PROGRESS);
        event.has_progress = true;
        event.progress = progress;
    }
    publish(events);
}

void FileTransferSession::finish_send(const TransferProgress& progress, TransferStatus status, TransferErrorCode code) {
    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sending_ = false;
        // Channel loss has already ended the transfer
        if (closed_ || state_ != SessionState::TRANSFERRING) {
            return;
        }
        end_transfer(events, terminal_state_for(status), progress, status != TransferStatus::COMPLETED, code);
    }
    publish(events);
}

void FileTransferSession::cancel() {
    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || state_ != SessionState::TRANSFERRING) {
            LOG_SESSION_DEBUG("Nothing to cancel in state " << session_state_to_string(state_));
            return;
        }

        if (sending_) {
            LOG_SESSION_INFO("Cancelling send");
            sender_->cancel();
            return;
        }

        if (receiving_) {
            LOG_SESSION_INFO("Cancelling receive");
            ReceiveOutcome outcome = receiver_->cancel();
            receiving_ = false;
            send_cancel_frame();
            end_transfer(events, SessionState::CANCELLED, outcome.progress, true, TransferErrorCode::TRANSFER_CANCELLED);
        }
    }
    publish(events);
}

void FileTransferSession::end_transfer(std::vector<TransferEvent>& events, SessionState terminal,
                                       const TransferProgress& progress, bool has_error, TransferErrorCode code) {
    last_progress_ = progress;

    std::string reason = progress.error;
    if (reason.empty()) {
        reason = progress.direction == TransferDirection::SEND ? "File sent" : "File received";
    }
    TransferEvent& event = transition(events, terminal, reason);
    event.has_progress = true;
    event.progress = progress;
    event.has_error = has_error;
    event.error_code = code;

    if (channel_open_) {
        transition(events, SessionState::CHANNEL_OPEN, "Ready for the next transfer");
    }
}

//=============================================================================
// Channel events
//=============================================================================

void FileTransferSession::on_channel_open() {
    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        channel_open_ = true;
        LOG_SESSION_INFO("Channel open");

        // Otherwise apply_remote_description() finishes the transition
        if (state_ == SessionState::AWAITING_REMOTE_DESCRIPTION && remote_applied_) {
            transition(events, SessionState::CHANNEL_OPEN, "Connection established");
        }
    }
    publish(events);
}

void FileTransferSession::on_channel_message(const ChannelMessage& message) {
    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || session_failed_) {
            return;
        }
        if (sending_) {
            handle_frame_while_sending(message);
            return;
        }

        bool was_receiving = receiving_;
        ReceiveOutcome outcome = receiver_->handle_message(message, channel_->delivers_text_as_binary());
        handle_receive_outcome(outcome, was_receiving, events);
    }
    publish(events);
}

void FileTransferSession::handle_frame_while_sending(const ChannelMessage& message) {
    ControlMessage control;
    if (!decode_control_frame(message, channel_->delivers_text_as_binary(), control)) {
        LOG_SESSION_WARN("Ignoring " << message.data.size() << " byte frame received while sending");
        return;
    }

    switch (control.type) {
        case ControlType::CANCEL:
            LOG_SESSION_INFO("Peer cancelled the transfer");
            sender_->notify_peer_cancelled();
            break;
        case ControlType::METADATA:
            // Both sides started sending; neither transfer can proceed
            LOG_SESSION_WARN("Peer started sending " << control.file_name << " while we are sending, cancelling both");
            receiver_->skip_until_metadata();
            send_cancel_frame();
            sender_->notify_peer_cancelled();
            break;
        case ControlType::COMPLETE:
            LOG_SESSION_WARN("Ignoring unexpected complete frame while sending");
            break;
    }
}

void FileTransferSession::handle_receive_outcome(const ReceiveOutcome& outcome, bool was_receiving,
                                                 std::vector<TransferEvent>& events) {
    switch (outcome.kind) {
        case ReceiveOutcome::Kind::IGNORED:
            break;

        case ReceiveOutcome::Kind::STARTED: {
            receiving_ = true;
            last_progress_ = outcome.progress;
            TransferEvent& event = transition(events, SessionState::TRANSFERRING,
                                              "Receiving " + outcome.progress.file_name);
            event.has_progress = true;
            event.progress = outcome.progress;
            break;
        }

        case ReceiveOutcome::Kind::PROGRESS: {
            last_progress_ = outcome.progress;
            TransferEvent& event = push_event(events, TransferEventType::PROGRESS);
            event.has_progress = true;
            event.progress = outcome.progress;
            break;
        }

        case ReceiveOutcome::Kind::COMPLETED:
            receiving_ = false;
            end_transfer(events, SessionState::COMPLETED, outcome.progress, false, outcome.error_code);
            break;

        case ReceiveOutcome::Kind::CANCELLED:
            receiving_ = false;
            end_transfer(events, SessionState::CANCELLED, outcome.progress, true, TransferErrorCode::TRANSFER_CANCELLED);
            break;

        case ReceiveOutcome::Kind::FAILED:
            receiving_ = false;
            if (was_receiving) {
                // Stop the sender; its remaining frames are dropped by the receiver
                send_cancel_frame();
            }
            end_transfer(events, SessionState::ERRORED, outcome.progress, true, outcome.error_code);
            break;
    }
}

void FileTransferSession::on_channel_close(bool is_error, const std::string& reason) {
    std::vector<TransferEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_open_ = false;
        if (closed_ || session_failed_) {
            return;
        }

        if (is_error) {
            LOG_SESSION_WARN("Channel failed: " << reason);
        } else {
            LOG_SESSION_INFO("Channel closed: " << reason);
        }

        std::string message = "Connection lost: " + reason;
        bool had_transfer = false;
        TransferProgress progress;
        if (sending_) {
            sender_->abort();
            progress = sender_->get_progress(TransferStatus::ERRORED);
            had_transfer = true;
        }
        if (receiving_) {
            progress = receiver_->get_progress(TransferStatus::ERRORED);
            receiver_->abort();
            receiving_ = false;
            had_transfer = true;
        }

        TransferEvent& event = fail_session(events, TransferErrorCode::TRANSPORT_ERROR, message);
        if (had_transfer) {
            progress.error = message;
            last_progress_ = progress;
            event.has_progress = true;
            event.progress = progress;
        }
    }
    publish(events);
}

//=============================================================================
// Teardown
//=============================================================================

void FileTransferSession::close() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        LOG_SESSION_INFO("Closing session in state " << session_state_to_string(state_));

        // Teardown mid-transfer is an implicit cancel
        if (sending_ && sender_) {
            sender_->cancel();
        }
        if (receiving_) {
            receiver_->abort();
            receiving_ = false;
            send_cancel_frame();
        }
        if (send_thread_.joinable()) {
            retired_workers_.push_back(std::move(send_thread_));
        }
        workers = take_joinable_workers();
    }

    join_workers(workers);

    drain_channel();
    channel_->clear_callbacks();
    transport_->close();
}

void FileTransferSession::drain_channel() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(CLOSE_DRAIN_TIMEOUT_MS);
    auto poll = std::chrono::milliseconds(config_.backpressure_poll_ms > 0 ? config_.backpressure_poll_ms : 1);
    while (channel_->is_open() && channel_->buffered_amount() > 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(poll);
    }
}

void FileTransferSession::send_cancel_frame() {
    try {
        channel_->send_text(encode_control_message(ControlMessage::cancel()));
    } catch (const TransferError& e) {
        LOG_SESSION_DEBUG("Could not send cancel frame: " << e.what());
    }
}

//=============================================================================
// State and events
//=============================================================================

TransferEvent& FileTransferSession::push_event(std::vector<TransferEvent>& events, TransferEventType type) {
    events.emplace_back();
    TransferEvent& event = events.back();
    event.sequence = next_sequence_++;
    event.type = type;
    event.state = state_;
    event.previous_state = state_;
    return event;
}

TransferEvent& FileTransferSession::transition(std::vector<TransferEvent>& events, SessionState next,
                                               const std::string& reason) {
    SessionState previous = state_;
    state_ = next;
    LOG_SESSION_INFO(session_state_to_string(previous) << " -> " << session_state_to_string(next)
                     << " (" << reason << ")");

    TransferEvent& event = push_event(events, TransferEventType::STATE_CHANGED);
    event.previous_state = previous;
    event.message = reason;
    return event;
}

TransferEvent& FileTransferSession::fail_session(std::vector<TransferEvent>& events, TransferErrorCode code,
                                                 const std::string& reason) {
    session_failed_ = true;
    LOG_SESSION_ERROR("Session failed: " << reason);
    TransferEvent& event = transition(events, SessionState::ERRORED, reason);
    event.has_error = true;
    event.error_code = code;
    return event;
}

void FileTransferSession::publish(const std::vector<TransferEvent>& events) {
    for (const auto& event : events) {
        events_.publish(event);
    }
}

std::vector<std::thread> FileTransferSession::take_joinable_workers() {
    std::vector<std::thread> joinable;
    std::vector<std::thread> kept;
    for (auto& worker : retired_workers_) {
        if (worker.get_id() == std::this_thread::get_id()) {
            kept.push_back(std::move(worker));
        } else {
            joinable.push_back(std::move(worker));
        }
    }
    retired_workers_ = std::move(kept);
    return joinable;
}

void FileTransferSession::join_workers(std::vector<std::thread>& workers) {
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

SessionState FileTransferSession::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

PeerRole FileTransferSession::get_role() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return role_;
}

bool FileTransferSession::is_channel_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_open_;
}

std::string FileTransferSession::get_local_description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signaling_ ? signaling_->get_local_description() : std::string();
}

TransferProgress FileTransferSession::get_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_progress_;
}

} // namespace peerdrop
