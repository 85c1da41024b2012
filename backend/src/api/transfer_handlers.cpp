/**
 * Transfer handlers - upload into the inbox, consume-on-read download from
 * the outbox, and the status document.
 */

#include "api/transfer_handlers.h"

#include "http/mime_types.h"
#include "http/multipart.h"
#include "util/string_util.h"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kFileReceived    = "File received";
constexpr const char* kInvalidUpload   = "Invalid multipart request";
constexpr const char* kUploadFailed    = "Upload failed";
constexpr const char* kNoFile          = "No file available";
constexpr const char* kDownloadFailed  = "Download failed";

std::string quote_filename(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + '"';
}

} // namespace

HandlerResult HandlerResult::ok(std::string body) {
    HandlerResult r;
    r.kind = Kind::Ok;
    r.body = std::move(body);
    return r;
}

HandlerResult HandlerResult::client_error(std::string body) {
    HandlerResult r;
    r.kind = Kind::ClientError;
    r.body = std::move(body);
    return r;
}

HandlerResult HandlerResult::not_found(std::string body) {
    HandlerResult r;
    r.kind = Kind::NotFound;
    r.body = std::move(body);
    return r;
}

HandlerResult HandlerResult::server_error(std::string body) {
    HandlerResult r;
    r.kind = Kind::ServerError;
    r.body = std::move(body);
    return r;
}

int status_code(HandlerResult::Kind kind) {
    switch (kind) {
        case HandlerResult::Kind::Ok:          return 200;
        case HandlerResult::Kind::ClientError: return 400;
        case HandlerResult::Kind::NotFound:    return 404;
        case HandlerResult::Kind::ServerError: return 500;
    }
    return 500;
}

HttpResponse to_http_response(HandlerResult result) {
    HttpResponse res;
    res.status = status_code(result.kind);
    res.set_header("Content-Type", result.content_type);
    for (auto& h : result.headers) {
        res.set_header(h.first, h.second);
    }
    res.body = std::move(result.body);
    return res;
}

UploadSession::UploadSession(const StorageLayout& storage) : storage_(storage) {}

UploadSession::~UploadSession() {
    if (out_.is_open()) {
        // Dropped mid-part (connection lost): do not leave a truncated file behind.
        out_.close();
        std::error_code ec;
        std::filesystem::remove(current_path_, ec);
    }
}

std::optional<HandlerResult> UploadSession::begin(const HttpRequest& head) {
    try {
        storage_.ensure_inbox();

        const auto content_type = head.header("Content-Type");
        if (to_lower(content_type).find("multipart/form-data") == std::string::npos) {
            spdlog::debug("Upload rejected: content type '{}'", content_type);
            return HandlerResult::client_error(kInvalidUpload);
        }

        // A missing boundary leaves an empty one, which the reader rejects as malformed.
        reader_ = std::make_unique<MultipartReader>(parse_boundary(content_type).value_or(""));
        reader_->set_on_part_begin(
            [this](const std::map<std::string, std::string>& headers) { open_part(headers); });
        reader_->set_on_part_data(
            [this](const char* data, std::size_t size) { write_part(data, size); });
        reader_->set_on_part_end([this] { close_part(); });
        return std::nullopt;
    } catch (const std::exception& e) {
        spdlog::error("Upload error: {}", e.what());
        return HandlerResult::server_error(kUploadFailed);
    }
}

void UploadSession::write(const char* data, std::size_t size) {
    if (failed_ || !reader_) {
        return;
    }
    try {
        reader_->feed(data, size);
    } catch (const std::exception& e) {
        fail(e);
    }
}

HandlerResult UploadSession::finish() {
    if (!failed_ && reader_) {
        try {
            reader_->finish();
        } catch (const std::exception& e) {
            fail(e);
        }
    }
    if (failed_ || !reader_) {
        return HandlerResult::server_error(kUploadFailed);
    }
    return HandlerResult::ok(kFileReceived);
}

void UploadSession::open_part(const std::map<std::string, std::string>& headers) {
    const auto it = headers.find("content-disposition");
    const auto declared = extract_filename(it == headers.end() ? std::string{} : it->second);
    if (!declared) {
        return;  // plain form field
    }
    const auto name = sanitize_filename(*declared);
    if (!name) {
        spdlog::warn("Skipping upload part with unusable filename '{}'", *declared);
        return;
    }

    current_path_ = storage_.inbox_dir() / *name;
    current_bytes_ = 0;
    out_.open(current_path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw std::runtime_error("cannot open " + current_path_.string() + " for writing");
    }
}

void UploadSession::write_part(const char* data, std::size_t size) {
    if (!out_.is_open()) {
        return;
    }
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        throw std::runtime_error("write failed for " + current_path_.string());
    }
    current_bytes_ += size;
}

void UploadSession::close_part() {
    if (!out_.is_open()) {
        return;
    }
    out_.close();
    if (!out_) {
        throw std::runtime_error("write failed for " + current_path_.string());
    }
    spdlog::info("Received: {} ({} bytes)", current_path_.filename().string(), current_bytes_);
}

void UploadSession::fail(const std::exception& e) {
    spdlog::error("Upload error: {}", e.what());
    failed_ = true;
    if (out_.is_open()) {
        out_.close();
        std::error_code ec;
        std::filesystem::remove(current_path_, ec);
    }
}

HandlerResult handle_upload(const HttpRequest& req, const StorageLayout& storage) {
    UploadSession session(storage);
    if (auto early = session.begin(req)) {
        return std::move(*early);
    }
    session.write(req.body.data(), req.body.size());
    return session.finish();
}

HandlerResult handle_download(StorageLayout& storage) {
    try {
        auto file = storage.take_staged();
        if (!file) {
            spdlog::debug("Download requested with empty outbox");
            return HandlerResult::not_found(kNoFile);
        }

        spdlog::info("Sent to {}: {} ({} bytes)", storage.peer_name(), file->name,
                     file->bytes.size());

        HandlerResult result = HandlerResult::ok(std::move(file->bytes));
        result.content_type = lookup_mime_type(file->name);
        result.headers.emplace_back("Content-Disposition",
                                    "attachment; filename=" + quote_filename(file->name));
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Download error: {}", e.what());
        return HandlerResult::server_error(kDownloadFailed);
    }
}

HandlerResult handle_status(const StorageLayout& storage) {
    try {
        nlohmann::json doc = {
            {"status", "ok"},
            {"peer", storage.peer_name()},
            {"inbox_files", storage.inbox_count()},
            {"staged", nullptr},
        };
        if (auto staged = storage.staged_name()) {
            doc["staged"] = *staged;
        }

        HandlerResult result = HandlerResult::ok(doc.dump());
        result.content_type = "application/json";
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Status error: {}", e.what());
        return HandlerResult::server_error("Status unavailable");
    }
}
