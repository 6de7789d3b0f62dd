#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Process-wide settings, resolved once at startup and passed by reference
// into the discovery, server and client components.
struct Config {
    unsigned short tcp_port = 9000;
    unsigned short discovery_port = 9999;
    std::string discovery_token = "DISCOVER_GOPHER_FS";
    std::string broadcast_address = "255.255.255.255";
    std::chrono::milliseconds discovery_timeout{5000};
    bool discovery_enabled = true;

    std::string storage_dir = ".";
    std::string download_dir = ".";
    std::string download_prefix = "downloaded_";
    std::string upload_prefix;

    std::size_t buffer_size = 64 * 1024;
    uint32_t max_filename_length = 4096;
};

void to_json(nlohmann::json& j, const Config& cfg);
void from_json(const nlohmann::json& j, Config& cfg);

// Defaults overlaid with the keys present in the JSON file at `path`.
Config load_config(const std::string& path);

} // namespace config
