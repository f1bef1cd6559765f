#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstddef>
#include <string>

namespace peerdrop {

// Fixed by the wire protocol
constexpr size_t CHUNK_SIZE = 64 * 1024;
// Sender suspends while the channel holds more than this many bytes
constexpr size_t HIGH_WATER_MARK = 4 * CHUNK_SIZE;

/**
 * Transfer configuration
 */
struct TransferConfig {
    std::string download_directory;      // Where received files are written
    uint32_t backpressure_poll_ms;       // Sleep between buffered-amount checks (default: 10)
    uint16_t listen_port;                // TCP port for the offering side, 0 = ephemeral
    bool include_loopback_candidates;    // Advertise 127.0.0.1 as a candidate (default: true)
    uint32_t connect_timeout_ms;         // Per-candidate TCP connect timeout (default: 3000)
    uint32_t connect_deadline_ms;        // Give up when no candidate answers in time (default: 30000)
    uint32_t handshake_timeout_ms;       // Credential exchange after TCP connect (default: 5000)
    uint32_t max_frame_size;             // Largest frame accepted from a peer
    std::string log_level;               // "debug", "info", "warn" or "error"

    TransferConfig()
        : download_directory("./downloads"),
          backpressure_poll_ms(10),
          listen_port(0),
          include_loopback_candidates(true),
          connect_timeout_ms(3000),
          connect_deadline_ms(30000),
          handshake_timeout_ms(5000),
          max_frame_size(1024 * 1024),
          log_level("info") {}
};

void to_json(nlohmann::json& j, const TransferConfig& config);
void from_json(const nlohmann::json& j, TransferConfig& config);

/**
 * Load configuration from a JSON file
 * Missing keys keep their defaults. A missing or unparsable file yields the defaults.
 * @param file_path Path to the JSON file
 * @param config Output configuration
 * @return true if the file was read and parsed
 */
bool load_transfer_config(const std::string& file_path, TransferConfig& config);

/**
 * Apply the configured log level to the global logger
 */
void apply_logging_config(const TransferConfig& config);

} // namespace peerdrop
