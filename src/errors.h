#pragma once

#include <stdexcept>
#include <string>

namespace peerdrop {

/**
 * Failure categories surfaced by the transfer subsystem
 */
enum class TransferErrorCode {
    INVALID_STATE,          // Operation attempted in the wrong session phase
    NOT_CONNECTED,          // Send attempted before the channel opened
    TRANSFER_IN_PROGRESS,   // Send attempted while another transfer is active
    CHANNEL_NOT_OPEN,       // Frame sent on a channel that is not open
    SIGNAL_PARSE,           // Malformed out-of-band connection blob
    PROTOCOL_VIOLATION,     // Peer broke the frame ordering contract
    TRANSFER_CANCELLED,     // Cooperative cancellation, not a failure for UI purposes
    IO_ERROR,               // Disk read/write failure
    TRANSPORT_ERROR         // Connection establishment or channel failure
};

std::string transfer_error_code_to_string(TransferErrorCode code);

class TransferError : public std::runtime_error {
public:
    TransferError(TransferErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    TransferErrorCode code() const { return code_; }

private:
    TransferErrorCode code_;
};

} // namespace peerdrop
