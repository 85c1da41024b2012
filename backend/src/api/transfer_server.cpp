/**
 * TransferServer - HTTP listener for the relay, on standalone ASIO.
 *
 * Each accepted socket gets an HttpConnection that reads the request head,
 * then the body by Content-Length in fixed-size chunks. Chunks go either to
 * the route's body sink or into HttpRequest::body for a buffered handler.
 * The response is written and the connection closed.
 */

#include "api/transfer_server.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "util/string_util.h"

namespace {

constexpr std::size_t kMaxHeadBytes = 64 * 1024;
constexpr std::size_t kChunkBytes = 64 * 1024;
constexpr const char* kHeadTerminator = "\r\n\r\n";
constexpr const char* kContinue = "HTTP/1.1 100 Continue\r\n\r\n";

class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(asio::ip::tcp::socket socket, const TransferServer& server)
        : socket_(std::move(socket))
        , server_(server)
        , buffer_(kMaxHeadBytes) {}

    void start() { read_head(); }

private:
    void read_head() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, kHeadTerminator,
                               [this, self](std::error_code ec, std::size_t bytes) {
                                   on_head(ec, bytes);
                               });
    }

    void on_head(std::error_code ec, std::size_t bytes) {
        if (ec == asio::error::not_found) {
            respond(HttpResponse::text(400, "Request header too large"));
            return;
        }
        if (ec) {
            if (ec != asio::error::eof) {
                spdlog::debug("Read error: {}", ec.message());
            }
            return;
        }

        const auto data = buffer_.data();
        std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + bytes);
        buffer_.consume(bytes);

        auto req = parse_request_head(head);
        if (!req) {
            respond(HttpResponse::text(400, "Bad Request"));
            return;
        }
        request_ = std::move(*req);

        if (request_.has_header("Transfer-Encoding")) {
            respond(HttpResponse::text(501, "Transfer-Encoding not supported"));
            return;
        }
        const auto length = request_.content_length();
        if (request_.has_header("Content-Length") && !length) {
            respond(HttpResponse::text(400, "Bad Content-Length"));
            return;
        }
        remaining_ = length.value_or(0);

        open_sink();
        if (!sink_ && !draining_ && remaining_ > server_.max_body_bytes()) {
            respond(HttpResponse::text(413, "Payload Too Large"));
            return;
        }
        if (!sink_ && !draining_) {
            request_.body.reserve(std::min(remaining_, kChunkBytes));
        }

        // async_read_until may have pulled part of the body in with the head.
        const auto buffered = std::min(remaining_, buffer_.size());
        deliver(static_cast<const char*>(buffer_.data().data()), buffered);
        buffer_.consume(buffered);

        if (remaining_ == 0) {
            complete();
            return;
        }

        if (to_lower(request_.header("Expect")) == "100-continue") {
            if (draining_) {
                // The client holds the body back until told to continue.
                respond(std::move(early_));
                return;
            }
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(kContinue, std::strlen(kContinue)),
                              [this, self](std::error_code ec, std::size_t) {
                                  if (ec) {
                                      spdlog::debug("Write error: {}", ec.message());
                                      return;
                                  }
                                  read_chunk();
                              });
            return;
        }
        read_chunk();
    }

    void open_sink() {
        try {
            sink_ = server_.make_sink(request_);
            if (!sink_) {
                return;
            }
            if (auto early = sink_->begin(request_)) {
                drain_with(std::move(*early));
            }
        } catch (const std::exception& e) {
            spdlog::error("Body sink for {} {} failed: {}", request_.method, request_.path(),
                          e.what());
            drain_with(HttpResponse::text(500, "Internal Server Error"));
        }
    }

    // Discard the rest of the body, then answer with `res`.
    void drain_with(HttpResponse res) {
        sink_.reset();
        draining_ = true;
        early_ = std::move(res);
    }

    void deliver(const char* data, std::size_t size) {
        remaining_ -= size;
        if (draining_ || size == 0) {
            return;
        }
        if (!sink_) {
            request_.body.append(data, size);
            return;
        }
        try {
            sink_->write(data, size);
        } catch (const std::exception& e) {
            spdlog::error("Body sink for {} {} failed: {}", request_.method, request_.path(),
                          e.what());
            drain_with(HttpResponse::text(500, "Internal Server Error"));
        }
    }

    void read_chunk() {
        auto self = shared_from_this();
        socket_.async_read_some(
            asio::buffer(chunk_.data(), std::min(remaining_, chunk_.size())),
            [this, self](std::error_code ec, std::size_t bytes) {
                if (ec) {
                    spdlog::debug("Body read error on {} {}: {}", request_.method,
                                  request_.path(), ec.message());
                    return;
                }
                deliver(chunk_.data(), bytes);
                if (remaining_ == 0) {
                    complete();
                } else {
                    read_chunk();
                }
            });
    }

    void complete() {
        if (draining_) {
            respond(std::move(early_));
            return;
        }
        if (!sink_) {
            respond(server_.dispatch(request_));
            return;
        }
        HttpResponse res;
        try {
            res = sink_->finish();
        } catch (const std::exception& e) {
            spdlog::error("Body sink for {} {} failed: {}", request_.method, request_.path(),
                          e.what());
            res = HttpResponse::text(500, "Internal Server Error");
        }
        sink_.reset();
        respond(std::move(res));
    }

    void respond(HttpResponse res) {
        spdlog::debug("{} {} -> {}", request_.method.empty() ? "-" : request_.method,
                      request_.path(), res.status);

        head_ = res.serialize_head();
        body_ = std::move(res.body);
        request_.body.clear();

        std::array<asio::const_buffer, 2> buffers = {asio::buffer(head_), asio::buffer(body_)};
        auto self = shared_from_this();
        asio::async_write(socket_, buffers, [this, self](std::error_code ec, std::size_t) {
            if (ec) {
                spdlog::debug("Write error: {}", ec.message());
            }
            close();
        });
    }

    void close() {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) {
            spdlog::debug("Shutdown: {}", ec.message());
        }
        socket_.close(ec);
    }

    asio::ip::tcp::socket socket_;
    const TransferServer& server_;
    asio::streambuf buffer_;
    HttpRequest request_;
    std::size_t remaining_ = 0;
    std::unique_ptr<RequestBodySink> sink_;
    bool draining_ = false;
    HttpResponse early_;
    std::array<char, kChunkBytes> chunk_;
    std::string head_;
    std::string body_;
};

} // namespace

TransferServer::TransferServer(asio::io_context& io, std::string bind_address, uint16_t port,
                               std::size_t max_body_bytes)
    : io_(io)
    , acceptor_(asio::make_strand(io))
    , bind_address_(std::move(bind_address))
    , requested_port_(port)
    , max_body_bytes_(max_body_bytes) {}

void TransferServer::add_route(const std::string& method, const std::string& path,
                               Handler handler) {
    insert_route(method, path, Route{std::move(handler), nullptr});
}

void TransferServer::add_streaming_route(const std::string& method, const std::string& path,
                                         SinkFactory factory) {
    insert_route(method, path, Route{nullptr, std::move(factory)});
}

void TransferServer::insert_route(const std::string& method, const std::string& path,
                                  Route route) {
    if (!routes_[path].emplace(method, std::move(route)).second) {
        throw std::invalid_argument("duplicate route " + method + " " + path);
    }
}

void TransferServer::start() {
    const asio::ip::tcp::endpoint endpoint(asio::ip::make_address(bind_address_),
                                           requested_port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("Listening on {}:{}", bind_address_, port_);
    do_accept();
}

void TransferServer::stop() {
    asio::post(acceptor_.get_executor(), [this] {
        if (!acceptor_.is_open()) {
            return;
        }
        std::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Closing listener: {}", ec.message());
        }
    });
}

void TransferServer::do_accept() {
    // Each connection gets its own strand so requests run concurrently on the pool.
    acceptor_.async_accept(asio::make_strand(io_), [this](std::error_code ec,
                                                          asio::ip::tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            spdlog::warn("Accept failed: {}", ec.message());
        } else {
            handle_request(std::move(socket));
        }
        do_accept();
    });
}

void TransferServer::handle_request(asio::ip::tcp::socket socket) {
    std::make_shared<HttpConnection>(std::move(socket), *this)->start();
}

std::unique_ptr<RequestBodySink> TransferServer::make_sink(const HttpRequest& req) const {
    const auto path_it = routes_.find(req.path());
    if (path_it == routes_.end()) {
        return nullptr;
    }
    const auto method_it = path_it->second.find(req.method);
    if (method_it == path_it->second.end() || !method_it->second.sink_factory) {
        return nullptr;
    }
    return method_it->second.sink_factory();
}

HttpResponse TransferServer::dispatch(const HttpRequest& req) const {
    const auto path_it = routes_.find(req.path());
    if (path_it == routes_.end()) {
        return HttpResponse::text(404, "Not Found");
    }

    const auto& methods = path_it->second;
    const auto method_it = methods.find(req.method);
    if (method_it == methods.end()) {
        auto res = HttpResponse::text(405, "Method Not Allowed");
        std::string allow;
        for (const auto& m : methods) {
            allow += allow.empty() ? m.first : ", " + m.first;
        }
        res.set_header("Allow", allow);
        return res;
    }

    if (!method_it->second.handler) {
        return HttpResponse::text(500, "Internal Server Error");
    }
    try {
        return method_it->second.handler(req);
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} {} threw: {}", req.method, req.path(), e.what());
        return HttpResponse::text(500, "Internal Server Error");
    }
}
