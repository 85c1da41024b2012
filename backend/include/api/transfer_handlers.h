#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "http/http_message.h"
#include "http/multipart.h"
#include "storage/storage_layout.h"

/**
 * Outcome of a transfer handler, mapped to an HTTP status by to_http_response().
 * Handlers never throw; faults come back as ServerError.
 */
struct HandlerResult {
    enum class Kind { Ok, ClientError, NotFound, ServerError };

    Kind kind = Kind::Ok;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
    std::vector<std::pair<std::string, std::string>> headers;

    static HandlerResult ok(std::string body);
    static HandlerResult client_error(std::string body);
    static HandlerResult not_found(std::string body);
    static HandlerResult server_error(std::string body);
};

int status_code(HandlerResult::Kind kind);
HttpResponse to_http_response(HandlerResult result);

/**
 * POST <upload_path>, fed incrementally: each multipart file part is written
 * to <inbox>/<filename> while the body is still arriving.
 *
 *   begin(head)    -> a result here ends the request (bad content type, no inbox)
 *   write(bytes)*  -> body chunks in order
 *   finish()       -> "File received" or "Upload failed"
 *
 * A fault stops further writes, removes the part being written and makes
 * finish() report ServerError.
 */
class UploadSession {
public:
    explicit UploadSession(const StorageLayout& storage);
    ~UploadSession();

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    std::optional<HandlerResult> begin(const HttpRequest& head);
    void write(const char* data, std::size_t size);
    HandlerResult finish();

private:
    void open_part(const std::map<std::string, std::string>& headers);
    void write_part(const char* data, std::size_t size);
    void close_part();
    void fail(const std::exception& e);

    const StorageLayout& storage_;
    std::unique_ptr<MultipartReader> reader_;
    std::ofstream out_;
    std::filesystem::path current_path_;
    std::size_t current_bytes_ = 0;
    bool failed_ = false;
};

/// POST <upload_path> with the body already in memory.
HandlerResult handle_upload(const HttpRequest& req, const StorageLayout& storage);

/// GET <download_path>: send the staged file and remove it from the outbox.
HandlerResult handle_download(StorageLayout& storage);

/// GET <status_path>: JSON health document.
HandlerResult handle_status(const StorageLayout& storage);
