#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "http/http_message.h"

/**
 * Receives a request body chunk by chunk instead of having it buffered.
 */
class RequestBodySink {
public:
    virtual ~RequestBodySink() = default;

    /// Called with the head before any body byte. A response returned here is
    /// sent once the body has been drained, and write() is never called.
    virtual std::optional<HttpResponse> begin(const HttpRequest& head) = 0;

    virtual void write(const char* data, std::size_t size) = 0;

    /// Called after the last body byte.
    virtual HttpResponse finish() = 0;
};

/**
 * Minimal HTTP/1.1 server for the relay. One request per connection,
 * body read by Content-Length, response followed by close.
 *
 * Buffered routes get the whole body in HttpRequest::body, capped at
 * max_body_bytes. Streaming routes hand each chunk to a RequestBodySink and
 * have no size cap.
 *
 * Routes must be registered before start(); the table is read-only while serving.
 */
class TransferServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;
    using SinkFactory = std::function<std::unique_ptr<RequestBodySink>()>;

    TransferServer(asio::io_context& io, std::string bind_address, uint16_t port,
                   std::size_t max_body_bytes);

    /// Throws std::invalid_argument if (method, path) is already routed.
    void add_route(const std::string& method, const std::string& path, Handler handler);
    void add_streaming_route(const std::string& method, const std::string& path,
                             SinkFactory factory);

    /// Bind and begin accepting. Throws std::system_error if the bind fails.
    void start();
    void stop();

    /// Bound port, 0 before start().
    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] std::size_t max_body_bytes() const { return max_body_bytes_; }

    /// Sink for a streaming route matching the request, or nullptr.
    std::unique_ptr<RequestBodySink> make_sink(const HttpRequest& req) const;

    /// Route lookup and handler call for buffered routes; 404/405 otherwise.
    HttpResponse dispatch(const HttpRequest& req) const;

private:
    struct Route {
        Handler handler;
        SinkFactory sink_factory;
    };

    void insert_route(const std::string& method, const std::string& path, Route route);
    void do_accept();
    void handle_request(asio::ip::tcp::socket socket);

    asio::io_context& io_;
    asio::ip::tcp::acceptor acceptor_;
    std::string bind_address_;
    uint16_t requested_port_;
    uint16_t port_ = 0;
    std::size_t max_body_bytes_;

    // path -> method -> route
    std::map<std::string, std::map<std::string, Route>> routes_;
};
