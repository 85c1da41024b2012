/**
 * Config - JSON settings file for the relay.
 */

#include "config/config.h"

#include <fstream>
#include <limits>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

template <typename T>
void read_optional(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

template <typename T>
void read_integer(const json& j, const char* key, T& out, long long min, long long max) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer");
    }
    const auto value = it->get<long long>();
    if (value < min || value > max) {
        throw ConfigError(std::string(key) + " out of range: " + std::to_string(value));
    }
    out = static_cast<T>(value);
}

bool valid_route(const std::string& path) {
    return !path.empty() && path.front() == '/';
}

} // namespace

void from_json(const json& j, RelayConfig& config) {
    read_optional(j, "peer_name", config.peer_name);
    read_optional(j, "upload_path", config.upload_path);
    read_optional(j, "download_path", config.download_path);
    read_optional(j, "status_path", config.status_path);
    read_optional(j, "bind_address", config.bind_address);
    read_integer(j, "port", config.port, 0, 65535);
    read_integer(j, "worker_threads", config.worker_threads, 1, 256);
    read_integer(j, "max_body_bytes", config.max_body_bytes, 1,
                 std::numeric_limits<long long>::max());
    read_optional(j, "log_level", config.log_level);
}

void to_json(json& j, const RelayConfig& config) {
    j = json{
        {"peer_name", config.peer_name},
        {"upload_path", config.upload_path},
        {"download_path", config.download_path},
        {"status_path", config.status_path},
        {"bind_address", config.bind_address},
        {"port", config.port},
        {"worker_threads", config.worker_threads},
        {"max_body_bytes", config.max_body_bytes},
        {"log_level", config.log_level},
    };
}

RelayConfig parse_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    RelayConfig config;
    try {
        config = j.get<RelayConfig>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    if (config.peer_name.empty() ||
        config.peer_name.find_first_of("/\\") != std::string::npos) {
        throw ConfigError("peer_name must be a non-empty plain name");
    }
    if (!valid_route(config.upload_path) || !valid_route(config.download_path) ||
        !valid_route(config.status_path)) {
        throw ConfigError("route paths must start with '/'");
    }
    if (config.upload_path == config.download_path ||
        config.status_path == config.download_path ||
        config.status_path == config.upload_path) {
        throw ConfigError("upload_path, download_path and status_path must all differ");
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
        throw ConfigError("unknown log_level: " + config.log_level);
    }
    return config;
}

RelayConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    return parse_config(j);
}
