#include "transfer_protocol.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

#define LOG_PROTOCOL_DEBUG(message) LOG_DEBUG("protocol", message)
#define LOG_PROTOCOL_INFO(message)  LOG_INFO("protocol", message)
#define LOG_PROTOCOL_WARN(message)  LOG_WARN("protocol", message)
#define LOG_PROTOCOL_ERROR(message) LOG_ERROR("protocol", message)

namespace peerdrop {

//=============================================================================
// Control messages
//=============================================================================

ControlMessage ControlMessage::metadata(const std::string& file_name, uint64_t file_size) {
    ControlMessage message;
    message.type = ControlType::METADATA;
    message.file_name = file_name;
    message.file_size = file_size;
    return message;
}

ControlMessage ControlMessage::complete() {
    ControlMessage message;
    message.type = ControlType::COMPLETE;
    return message;
}

ControlMessage ControlMessage::cancel() {
    ControlMessage message;
    message.type = ControlType::CANCEL;
    return message;
}

std::string encode_control_message(const ControlMessage& message) {
    nlohmann::json j;
    switch (message.type) {
        case ControlType::METADATA:
            j["type"] = "metadata";
            j["fileName"] = message.file_name;
            j["fileSize"] = message.file_size;
            break;
        case ControlType::COMPLETE:
            j["type"] = "complete";
            break;
        case ControlType::CANCEL:
            j["type"] = "cancel";
            break;
    }
    return j.dump();
}

namespace {

// Cheap pre-check before a speculative JSON parse of a binary frame
bool looks_like_json_object(const std::vector<uint8_t>& data) {
    for (uint8_t byte : data) {
        if (std::isspace(byte)) {
            continue;
        }
        return byte == '{';
    }
    return false;
}

} // namespace

bool decode_control_message(const std::string& text, ControlMessage& message) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        return false;
    }
    const std::string type = type_it->get<std::string>();

    if (type == "metadata") {
        auto name_it = j.find("fileName");
        auto size_it = j.find("fileSize");
        if (name_it == j.end() || !name_it->is_string()) {
            return false;
        }
        // Negative or fractional sizes are rejected
        if (size_it == j.end() || !size_it->is_number_unsigned()) {
            return false;
        }
        message = ControlMessage::metadata(name_it->get<std::string>(), size_it->get<uint64_t>());
        return true;
    }
    if (type == "complete") {
        message = ControlMessage::complete();
        return true;
    }
    if (type == "cancel") {
        message = ControlMessage::cancel();
        return true;
    }
    return false;
}

bool decode_control_frame(const ChannelMessage& frame, bool speculative, ControlMessage& message) {
    if (frame.type == FrameType::TEXT) {
        return decode_control_message(frame.text(), message);
    }
    return speculative && looks_like_json_object(frame.data) && decode_control_message(frame.text(), message);
}

//=============================================================================
// ProgressTracker
//=============================================================================

ProgressTracker::ProgressTracker()
    : active_(false), file_size_(0), bytes_(0), direction_(TransferDirection::SEND) {}

void ProgressTracker::start(const std::string& file_name, uint64_t file_size, TransferDirection direction) {
    active_ = true;
    file_name_ = file_name;
    file_size_ = file_size;
    bytes_ = 0;
    direction_ = direction;
    start_time_ = std::chrono::steady_clock::now();
}

void ProgressTracker::add_bytes(uint64_t bytes) {
    bytes_ += bytes;
}

void ProgressTracker::reset() {
    active_ = false;
    file_name_.clear();
    file_size_ = 0;
    bytes_ = 0;
}

TransferProgress ProgressTracker::snapshot(TransferStatus status) const {
    TransferProgress progress;
    progress.file_name = file_name_;
    progress.file_size = file_size_;
    progress.bytes_transferred = bytes_;
    progress.status = status;
    progress.direction = direction_;

    if (file_size_ == 0) {
        progress.percentage = status == TransferStatus::COMPLETED ? 100.0 : 0.0;
    } else {
        progress.percentage = static_cast<double>(bytes_) / static_cast<double>(file_size_) * 100.0;
    }

    if (active_) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
        progress.speed = elapsed > 0.0 ? static_cast<double>(bytes_) / elapsed : 0.0;
    }
    return progress;
}

//=============================================================================
// ChunkSender
//=============================================================================

ChunkSender::ChunkSender(TransportChannel& channel, ChunkIO& chunk_io, std::chrono::milliseconds poll_interval)
    : channel_(channel), chunk_io_(chunk_io),
      poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(1)),
      stop_reason_(StopReason::NONE), backpressure_waits_(0) {}

TransferProgress ChunkSender::send_file(const std::string& path, const TransferProgressCallback& on_progress) {
    FileInfo info = chunk_io_.get_file_info(path);

    TransferProgress progress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tracker_.start(info.name, info.size, TransferDirection::SEND);
        progress = tracker_.snapshot(TransferStatus::TRANSFERRING);
    }
    LOG_PROTOCOL_INFO("Sending " << info.name << " (" << info.size << " bytes)");
    if (on_progress) {
        on_progress(progress);
    }

    channel_.send_text(encode_control_message(ControlMessage::metadata(info.name, info.size)));

    try {
        uint64_t offset = 0;
        while (offset < info.size) {
            check_stopped();
            wait_for_drain();
            check_stopped();

            size_t expected = static_cast<size_t>(std::min<uint64_t>(CHUNK_SIZE, info.size - offset));
            std::vector<uint8_t> chunk = chunk_io_.read_file_chunk(path, offset, expected);
            if (chunk.size() != expected) {
                throw TransferError(TransferErrorCode::IO_ERROR,
                    "File changed during transfer: expected " + std::to_string(expected) +
                    " bytes at offset " + std::to_string(offset) + ", read " + std::to_string(chunk.size()));
            }

            channel_.send_binary(chunk);
            offset += chunk.size();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                tracker_.add_bytes(chunk.size());
                progress = tracker_.snapshot(TransferStatus::TRANSFERRING);
            }
            if (on_progress) {
                on_progress(progress);
            }
        }
    } catch (const TransferError& e) {
        if (e.code() == TransferErrorCode::IO_ERROR) {
            LOG_PROTOCOL_ERROR("Send of " << info.name << " failed: " << e.what());
            send_cancel_frame();
        }
        throw;
    }

    channel_.send_text(encode_control_message(ControlMessage::complete()));

    std::lock_guard<std::mutex> lock(mutex_);
    LOG_PROTOCOL_INFO("Sent " << info.name << " (" << tracker_.get_bytes() << " bytes)");
    return tracker_.snapshot(TransferStatus::COMPLETED);
}

void ChunkSender::cancel() {
    request_stop(StopReason::LOCAL_CANCEL);
}

void ChunkSender::notify_peer_cancelled() {
    request_stop(StopReason::PEER_CANCEL);
}

void ChunkSender::abort() {
    request_stop(StopReason::ABORT);
}

TransferProgress ChunkSender::get_progress(TransferStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.snapshot(status);
}

uint64_t ChunkSender::get_backpressure_waits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backpressure_waits_;
}

void ChunkSender::request_stop(StopReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // First reason wins
        if (stop_reason_ != StopReason::NONE) {
            return;
        }
        stop_reason_ = reason;
    }
    stop_cv_.notify_all();
}

void ChunkSender::check_stopped() {
    StopReason reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reason = stop_reason_;
    }

    switch (reason) {
        case StopReason::NONE:
            return;
        case StopReason::LOCAL_CANCEL:
            LOG_PROTOCOL_INFO("Send cancelled locally");
            send_cancel_frame();
            throw TransferError(TransferErrorCode::TRANSFER_CANCELLED, "Transfer cancelled");
        case StopReason::PEER_CANCEL:
            LOG_PROTOCOL_INFO("Send cancelled by peer");
            throw TransferError(TransferErrorCode::TRANSFER_CANCELLED, "Transfer cancelled by peer");
        case StopReason::ABORT:
            LOG_PROTOCOL_DEBUG("Send aborted");
            throw TransferError(TransferErrorCode::TRANSFER_CANCELLED, "Transfer aborted");
    }
}

void ChunkSender::wait_for_drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    bool waited = false;
    while (stop_reason_ == StopReason::NONE && channel_.buffered_amount() > HIGH_WATER_MARK) {
        if (!channel_.is_open()) {
            throw TransferError(TransferErrorCode::TRANSPORT_ERROR, "Channel closed while waiting to send");
        }
        if (!waited) {
            LOG_PROTOCOL_DEBUG("Backpressure: " << channel_.buffered_amount() << " bytes buffered");
            ++backpressure_waits_;
            waited = true;
        }
        stop_cv_.wait_for(lock, poll_interval_);
    }
}

void ChunkSender::send_cancel_frame() {
    try {
        channel_.send_text(encode_control_message(ControlMessage::cancel()));
    } catch (const TransferError& e) {
        LOG_PROTOCOL_WARN("Could not notify peer of cancellation: " << e.what());
    }
}

//=============================================================================
// ChunkReceiver
//=============================================================================

ChunkReceiver::ChunkReceiver(ChunkIO& chunk_io) : chunk_io_(chunk_io), discarding_(false) {}

ChunkReceiver::~ChunkReceiver() {
    abort();
}

ReceiveOutcome ChunkReceiver::handle_message(const ChannelMessage& message, bool speculative_decode) {
    std::lock_guard<std::mutex> lock(mutex_);

    ControlMessage control;
    bool is_control = decode_control_frame(message, speculative_decode, control);

    if (discarding_) {
        if (!is_control || control.type != ControlType::METADATA) {
            LOG_PROTOCOL_DEBUG("Dropping " << message.data.size() << " byte frame after aborted receive");
            return ReceiveOutcome();
        }
        discarding_ = false;
    }

    if (message.type == FrameType::TEXT && !is_control) {
        return fail(TransferErrorCode::PROTOCOL_VIOLATION, "Malformed control message");
    }
    return is_control ? handle_control(control) : handle_chunk(message.data);
}

ReceiveOutcome ChunkReceiver::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    ReceiveOutcome outcome;
    if (!tracker_.is_active()) {
        return outcome;
    }

    outcome.kind = ReceiveOutcome::Kind::CANCELLED;
    outcome.error_code = TransferErrorCode::TRANSFER_CANCELLED;
    outcome.error = "Transfer cancelled";
    outcome.progress = tracker_.snapshot(TransferStatus::CANCELLED);
    outcome.progress.error = outcome.error;

    LOG_PROTOCOL_INFO("Receive of " << tracker_.get_file_name() << " cancelled locally");
    discard_output();
    tracker_.reset();
    discarding_ = true;
    return outcome;
}

void ChunkReceiver::abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tracker_.is_active()) {
        return;
    }
    LOG_PROTOCOL_DEBUG("Receive of " << tracker_.get_file_name() << " aborted");
    discard_output();
    tracker_.reset();
}

void ChunkReceiver::skip_until_metadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    discard_output();
    tracker_.reset();
    discarding_ = true;
}

bool ChunkReceiver::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.is_active();
}

bool ChunkReceiver::is_discarding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarding_;
}

uint64_t ChunkReceiver::get_bytes_received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.get_bytes();
}

TransferProgress ChunkReceiver::get_progress(TransferStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.snapshot(status);
}

ReceiveOutcome ChunkReceiver::handle_control(const ControlMessage& message) {
    ReceiveOutcome outcome;

    switch (message.type) {
        case ControlType::METADATA: {
            if (tracker_.is_active()) {
                return fail(TransferErrorCode::PROTOCOL_VIOLATION, "Metadata received during an active transfer");
            }
            WriteStreamHandle handle;
            try {
                handle = chunk_io_.init_write_stream(message.file_name);
            } catch (const TransferError& e) {
                tracker_.start(message.file_name, message.file_size, TransferDirection::RECEIVE);
                return fail(e.code(), e.what());
            }
            stream_id_ = handle.stream_id;
            tracker_.start(message.file_name, message.file_size, TransferDirection::RECEIVE);
            LOG_PROTOCOL_INFO("Receiving " << message.file_name << " (" << message.file_size
                              << " bytes) into " << handle.final_path);

            outcome.kind = ReceiveOutcome::Kind::STARTED;
            outcome.progress = tracker_.snapshot(TransferStatus::TRANSFERRING);
            return outcome;
        }

        case ControlType::COMPLETE: {
            if (!tracker_.is_active()) {
                return fail(TransferErrorCode::PROTOCOL_VIOLATION, "Complete without metadata");
            }
            if (tracker_.get_bytes() != tracker_.get_file_size()) {
                return fail(TransferErrorCode::PROTOCOL_VIOLATION,
                    "Complete after " + std::to_string(tracker_.get_bytes()) + " of " +
                    std::to_string(tracker_.get_file_size()) + " bytes");
            }

            std::string stream_id = stream_id_;
            stream_id_.clear();
            std::string saved_path;
            try {
                saved_path = chunk_io_.finalize_write_stream(stream_id);
            } catch (const TransferError& e) {
                // The stream is gone either way
                return fail(e.code(), e.what());
            }

            outcome.kind = ReceiveOutcome::Kind::COMPLETED;
            outcome.progress = tracker_.snapshot(TransferStatus::COMPLETED);
            outcome.progress.saved_path = saved_path;
            LOG_PROTOCOL_INFO("Received " << tracker_.get_file_name() << " -> " << saved_path);
            tracker_.reset();
            return outcome;
        }

        case ControlType::CANCEL: {
            if (!tracker_.is_active()) {
                LOG_PROTOCOL_DEBUG("Ignoring cancel with no active receive");
                return outcome;
            }
            outcome.kind = ReceiveOutcome::Kind::CANCELLED;
            outcome.error_code = TransferErrorCode::TRANSFER_CANCELLED;
            outcome.error = "Transfer cancelled by peer";
            outcome.progress = tracker_.snapshot(TransferStatus::CANCELLED);
            outcome.progress.error = outcome.error;

            LOG_PROTOCOL_INFO("Receive of " << tracker_.get_file_name() << " cancelled by peer");
            discard_output();
            tracker_.reset();
            return outcome;
        }
    }
    return outcome;
}

ReceiveOutcome ChunkReceiver::handle_chunk(const std::vector<uint8_t>& data) {
    if (!tracker_.is_active()) {
        return fail(TransferErrorCode::PROTOCOL_VIOLATION, "Chunk without metadata");
    }
    if (data.size() > tracker_.get_file_size() - tracker_.get_bytes()) {
        return fail(TransferErrorCode::PROTOCOL_VIOLATION,
            "Chunk of " + std::to_string(data.size()) + " bytes overruns declared size " +
            std::to_string(tracker_.get_file_size()));
    }

    try {
        chunk_io_.write_chunk(stream_id_, data.data(), data.size());
    } catch (const TransferError& e) {
        return fail(e.code(), e.what());
    }
    tracker_.add_bytes(data.size());

    ReceiveOutcome outcome;
    outcome.kind = ReceiveOutcome::Kind::PROGRESS;
    outcome.progress = tracker_.snapshot(TransferStatus::TRANSFERRING);
    return outcome;
}

ReceiveOutcome ChunkReceiver::fail(TransferErrorCode code, const std::string& error) {
    LOG_PROTOCOL_ERROR("Receive failed (" << transfer_error_code_to_string(code) << "): " << error);

    ReceiveOutcome outcome;
    outcome.kind = ReceiveOutcome::Kind::FAILED;
    outcome.error_code = code;
    outcome.error = error;
    outcome.progress = tracker_.snapshot(TransferStatus::ERRORED);
    outcome.progress.error = error;

    discard_output();
    tracker_.reset();
    discarding_ = true;
    return outcome;
}

void ChunkReceiver::discard_output() {
    if (stream_id_.empty()) {
        return;
    }
    std::string stream_id = stream_id_;
    stream_id_.clear();
    try {
        chunk_io_.cancel_write_stream(stream_id);
    } catch (const TransferError& e) {
        LOG_PROTOCOL_WARN("Failed to discard partial output: " << e.what());
    }
}

} // namespace peerdrop
