/**
 * Node - the relay session: storage layout, route table and listener.
 */

#include "node/node.h"

#include "api/transfer_handlers.h"
#include "net/address_resolver.h"

#include <memory>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

// Streams POST bodies through an UploadSession straight into the inbox.
class UploadSink : public RequestBodySink {
public:
    explicit UploadSink(const StorageLayout& storage) : session_(storage) {}

    std::optional<HttpResponse> begin(const HttpRequest& head) override {
        if (auto early = session_.begin(head)) {
            return to_http_response(std::move(*early));
        }
        return std::nullopt;
    }

    void write(const char* data, std::size_t size) override { session_.write(data, size); }

    HttpResponse finish() override { return to_http_response(session_.finish()); }

private:
    UploadSession session_;
};

} // namespace

Node::Node(asio::io_context& io, std::filesystem::path base_dir, const RelayConfig& config)
    : config_(config)
    , storage_(std::move(base_dir), config.peer_name)
    , server_(io, config.bind_address, config.port, config.max_body_bytes) {
    server_.add_streaming_route("POST", config_.upload_path, [this] {
        return std::make_unique<UploadSink>(storage_);
    });
    server_.add_route("GET", config_.download_path, [this](const HttpRequest&) {
        return to_http_response(handle_download(storage_));
    });
    server_.add_route("GET", config_.status_path, [this](const HttpRequest&) {
        return to_http_response(handle_status(storage_));
    });
}

const SessionInfo& Node::start() {
    if (running_) {
        return session_;
    }

    server_.start();

    session_.ip = resolve_lan_address();
    session_.port = server_.port();
    session_.url = make_base_url(session_.ip, session_.port);
    running_ = true;

    spdlog::info("Base directory: {}", storage_.base_dir().string());
    spdlog::info("Server running at {}", session_.url);
    return session_;
}

void Node::stop() {
    if (!running_) {
        return;
    }
    server_.stop();
    running_ = false;
    spdlog::info("Server stopped");
}

bool Node::stage(const std::filesystem::path& file) {
    return storage_.stage(file);
}

std::string Node::inspect() const {
    return storage_.inspect();
}

std::string make_base_url(const std::string& ip, uint16_t port) {
    return "http://" + ip + ":" + std::to_string(port);
}
