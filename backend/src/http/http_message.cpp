/**
 * HTTP message helpers - request head parsing and response serialisation
 * for the minimal HTTP/1.1 server in api/transfer_server.
 */

#include "http/http_message.h"
#include "util/string_util.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string{} : it->second;
}

bool HttpRequest::has_header(const std::string& name) const {
    return headers.count(to_lower(name)) != 0;
}

std::string HttpRequest::path() const {
    return target.substr(0, target.find('?'));
}

std::optional<std::size_t> HttpRequest::content_length() const {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty()) {
        return std::nullopt;
    }
    const auto& value = it->second;
    if (!std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<HttpRequest> parse_request_head(const std::string& head) {
    std::istringstream in(head);
    std::string line;

    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    HttpRequest req;
    std::istringstream request_line(line);
    std::string extra;
    if (!(request_line >> req.method >> req.target >> req.version) || (request_line >> extra)) {
        return std::nullopt;
    }
    if (req.version.rfind("HTTP/", 0) != 0 || req.target.empty()) {
        return std::nullopt;
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return req;
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    const auto key = to_lower(name);
    for (auto& h : headers) {
        if (to_lower(h.first) == key) {
            h.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HttpResponse::header(const std::string& name) const {
    const auto key = to_lower(name);
    for (const auto& h : headers) {
        if (to_lower(h.first) == key) {
            return h.second;
        }
    }
    return {};
}

std::string HttpResponse::serialize_head() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << ' ' << reason_phrase(status) << "\r\n";
    for (const auto& h : headers) {
        const auto key = to_lower(h.first);
        if (key == "content-length" || key == "connection") {
            continue;
        }
        out << h.first << ": " << h.second << "\r\n";
    }
    out << "Content-Length: " << body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    return out.str();
}

std::string HttpResponse::serialize() const {
    return serialize_head() + body;
}

HttpResponse HttpResponse::text(int status, const std::string& body) {
    HttpResponse res;
    res.status = status;
    res.set_header("Content-Type", "text/plain; charset=utf-8");
    res.body = body;
    return res;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "Unknown";
    }
}
