#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

/**
 * Runtime settings. Every key is optional; a missing config file means defaults.
 *
 * {
 *   "peer_name": "android",
 *   "upload_path": "/android-send",
 *   "download_path": "/windows-send",
 *   "status_path": "/status",
 *   "bind_address": "0.0.0.0",
 *   "port": 0,
 *   "worker_threads": 4,
 *   "max_body_bytes": 1073741824,
 *   "log_level": "info"
 * }
 */
struct RelayConfig {
    std::string peer_name     = "android";
    std::string upload_path   = "/android-send";
    std::string download_path = "/windows-send";
    std::string status_path   = "/status";
    std::string bind_address  = "0.0.0.0";
    uint16_t    port          = 0;
    unsigned    worker_threads = 4;
    std::size_t max_body_bytes = std::size_t{1} << 30;
    std::string log_level     = "info";
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void from_json(const nlohmann::json& j, RelayConfig& config);
void to_json(nlohmann::json& j, const RelayConfig& config);

/// Parse and validate a config document. Throws ConfigError.
RelayConfig parse_config(const nlohmann::json& j);

/// Load a config file. Throws ConfigError if unreadable or invalid.
RelayConfig load_config(const std::string& path);
