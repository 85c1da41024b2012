#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * Plain HTTP/1.1 request/response values shared by the server and handlers.
 *
 * Header names are stored lower-cased so lookups are case-insensitive.
 */
struct HttpRequest {
    std::string method;
    std::string target;
    std::string version;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Value of a header, or an empty string when absent.
    [[nodiscard]] std::string header(const std::string& name) const;
    [[nodiscard]] bool has_header(const std::string& name) const;

    /// Target without the query string.
    [[nodiscard]] std::string path() const;

    /// Parsed Content-Length, nullopt if missing or not a number.
    [[nodiscard]] std::optional<std::size_t> content_length() const;
};

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value);
    [[nodiscard]] std::string header(const std::string& name) const;

    /// Status line and headers, terminated by the blank line.
    [[nodiscard]] std::string serialize_head() const;
    [[nodiscard]] std::string serialize() const;

    static HttpResponse text(int status, const std::string& body);
};

/// Parse the request line and header block (without the trailing blank line).
std::optional<HttpRequest> parse_request_head(const std::string& head);

const char* reason_phrase(int status);
