#include "errors.h"

namespace peerdrop {

std::string transfer_error_code_to_string(TransferErrorCode code) {
    switch (code) {
        case TransferErrorCode::INVALID_STATE: return "invalid_state";
        case TransferErrorCode::NOT_CONNECTED: return "not_connected";
        case TransferErrorCode::TRANSFER_IN_PROGRESS: return "transfer_in_progress";
        case TransferErrorCode::CHANNEL_NOT_OPEN: return "channel_not_open";
        case TransferErrorCode::SIGNAL_PARSE: return "signal_parse";
        case TransferErrorCode::PROTOCOL_VIOLATION: return "protocol_violation";
        case TransferErrorCode::TRANSFER_CANCELLED: return "transfer_cancelled";
        case TransferErrorCode::IO_ERROR: return "io_error";
        case TransferErrorCode::TRANSPORT_ERROR: return "transport_error";
        default: return "unknown";
    }
}

} // namespace peerdrop
