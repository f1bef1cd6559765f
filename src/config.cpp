#include "config.h"
#include "fs.h"
#include "logger.h"

#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace peerdrop {

void to_json(nlohmann::json& j, const TransferConfig& config) {
    j = nlohmann::json{
        {"download_directory", config.download_directory},
        {"backpressure_poll_ms", config.backpressure_poll_ms},
        {"listen_port", config.listen_port},
        {"include_loopback_candidates", config.include_loopback_candidates},
        {"connect_timeout_ms", config.connect_timeout_ms},
        {"connect_deadline_ms", config.connect_deadline_ms},
        {"handshake_timeout_ms", config.handshake_timeout_ms},
        {"max_frame_size", config.max_frame_size},
        {"log_level", config.log_level}
    };
}

void from_json(const nlohmann::json& j, TransferConfig& config) {
    TransferConfig defaults;
    config.download_directory = j.value("download_directory", defaults.download_directory);
    config.backpressure_poll_ms = j.value("backpressure_poll_ms", defaults.backpressure_poll_ms);
    config.listen_port = j.value("listen_port", defaults.listen_port);
    config.include_loopback_candidates = j.value("include_loopback_candidates", defaults.include_loopback_candidates);
    config.connect_timeout_ms = j.value("connect_timeout_ms", defaults.connect_timeout_ms);
    config.connect_deadline_ms = j.value("connect_deadline_ms", defaults.connect_deadline_ms);
    config.handshake_timeout_ms = j.value("handshake_timeout_ms", defaults.handshake_timeout_ms);
    config.max_frame_size = j.value("max_frame_size", defaults.max_frame_size);
    config.log_level = j.value("log_level", defaults.log_level);

    if (config.backpressure_poll_ms == 0) {
        config.backpressure_poll_ms = 1;
    }
    if (config.max_frame_size < CHUNK_SIZE) {
        config.max_frame_size = static_cast<uint32_t>(CHUNK_SIZE);
    }
}

bool load_transfer_config(const std::string& file_path, TransferConfig& config) {
    if (!file_exists(file_path)) {
        LOG_CONFIG_INFO("No configuration at " << file_path << ", using defaults");
        config = TransferConfig();
        return false;
    }

    std::string config_data = read_file_text_cpp(file_path);
    if (config_data.empty()) {
        LOG_CONFIG_WARN("Configuration file is empty: " << file_path);
        config = TransferConfig();
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(config_data);
        config = j.get<TransferConfig>();
        LOG_CONFIG_INFO("Loaded configuration from " << file_path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file " << file_path << ": " << e.what());
        config = TransferConfig();
        return false;
    }
}

void apply_logging_config(const TransferConfig& config) {
    Logger::getInstance().set_log_level(parse_log_level(config.log_level, LogLevel::INFO));
}

} // namespace peerdrop
