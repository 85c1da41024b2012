#pragma once

#include <asio.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

#include "api/transfer_server.h"
#include "config/config.h"
#include "storage/storage_layout.h"

/// What the presentation layer needs once the server is up.
struct SessionInfo {
    std::string url;   // http://<ip>:<port>
    std::string ip;
    uint16_t port = 0;
};

/**
 * Represents the local relay node for one process lifetime.
 *
 * Owns the storage layout and the HTTP server and wires the transfer
 * handlers into the route table. The URL is assigned once by start().
 */
class Node {
public:
    Node(asio::io_context& io, std::filesystem::path base_dir, const RelayConfig& config);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Bind the listener and resolve the LAN address. Throws std::system_error on bind failure.
    const SessionInfo& start();
    void stop();

    /// Place one file in the outbox for the peer to download.
    bool stage(const std::filesystem::path& file);

    /// Describe what the inbox holds.
    [[nodiscard]] std::string inspect() const;

    [[nodiscard]] const SessionInfo& session() const { return session_; }
    [[nodiscard]] bool running() const { return running_; }
    [[nodiscard]] const RelayConfig& config() const { return config_; }
    [[nodiscard]] StorageLayout& storage() { return storage_; }

private:
    RelayConfig config_;
    StorageLayout storage_;
    TransferServer server_;
    SessionInfo session_;
    bool running_ = false;
};

std::string make_base_url(const std::string& ip, uint16_t port);
