#include "config.hpp"
#include <fstream>

namespace config {

namespace {

unsigned short read_port(const nlohmann::json& j, const std::string& key, unsigned short fallback,
                         int64_t lowest) {
    int64_t value = j.value(key, static_cast<int64_t>(fallback));
    if (value < lowest || value > 65535) {
        throw ConfigError(key + " out of range: " + std::to_string(value));
    }
    return static_cast<unsigned short>(value);
}

} // namespace

void to_json(nlohmann::json& j, const Config& cfg) {
    j = nlohmann::json{
        {"tcp_port", cfg.tcp_port},
        {"discovery_port", cfg.discovery_port},
        {"discovery_token", cfg.discovery_token},
        {"broadcast_address", cfg.broadcast_address},
        {"discovery_timeout_ms", cfg.discovery_timeout.count()},
        {"discovery_enabled", cfg.discovery_enabled},
        {"storage_dir", cfg.storage_dir},
        {"download_dir", cfg.download_dir},
        {"download_prefix", cfg.download_prefix},
        {"upload_prefix", cfg.upload_prefix},
        {"buffer_size", cfg.buffer_size},
        {"max_filename_length", cfg.max_filename_length}
    };
}

void from_json(const nlohmann::json& j, Config& cfg) {
    const Config defaults;
    // 0 asks the OS for an ephemeral listening port; discovery needs a fixed one
    cfg.tcp_port = read_port(j, "tcp_port", defaults.tcp_port, 0);
    cfg.discovery_port = read_port(j, "discovery_port", defaults.discovery_port, 1);
    cfg.discovery_token = j.value("discovery_token", defaults.discovery_token);
    cfg.broadcast_address = j.value("broadcast_address", defaults.broadcast_address);
    cfg.discovery_timeout = std::chrono::milliseconds(
        j.value("discovery_timeout_ms", static_cast<int64_t>(defaults.discovery_timeout.count())));
    cfg.discovery_enabled = j.value("discovery_enabled", defaults.discovery_enabled);
    cfg.storage_dir = j.value("storage_dir", defaults.storage_dir);
    cfg.download_dir = j.value("download_dir", defaults.download_dir);
    cfg.download_prefix = j.value("download_prefix", defaults.download_prefix);
    cfg.upload_prefix = j.value("upload_prefix", defaults.upload_prefix);
    cfg.buffer_size = j.value("buffer_size", defaults.buffer_size);
    cfg.max_filename_length = j.value("max_filename_length", defaults.max_filename_length);

    if (cfg.discovery_token.empty()) {
        throw ConfigError("discovery_token must not be empty");
    }
    if (cfg.buffer_size == 0) {
        throw ConfigError("buffer_size must be positive");
    }
    if (cfg.discovery_timeout.count() <= 0) {
        throw ConfigError("discovery_timeout_ms must be positive");
    }
}

Config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }
}

} // namespace config
