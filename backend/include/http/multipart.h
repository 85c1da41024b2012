#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * multipart/form-data decoding (RFC 7578) for upload requests.
 */
struct MultipartPart {
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;

    [[nodiscard]] std::string header(const std::string& name) const;
};

class MultipartError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Incremental multipart splitter. Bytes are pushed with feed() in chunks of
 * any size; part bodies are handed out as they arrive, so a part never has
 * to fit in memory. Only a delimiter-sized tail is held back between feeds.
 *
 * Callbacks may throw; the exception propagates out of feed().
 */
class MultipartReader {
public:
    using PartBeginCallback = std::function<void(const std::map<std::string, std::string>& headers)>;
    using PartDataCallback  = std::function<void(const char* data, std::size_t size)>;
    using PartEndCallback   = std::function<void()>;

    /// Throws MultipartError for an empty boundary.
    explicit MultipartReader(const std::string& boundary);

    void set_on_part_begin(PartBeginCallback cb);
    void set_on_part_data(PartDataCallback cb);
    void set_on_part_end(PartEndCallback cb);

    /// Throws MultipartError on a malformed stream.
    void feed(const char* data, std::size_t size);

    /// End of input. Throws MultipartError unless the closing delimiter was seen.
    void finish();

    [[nodiscard]] bool done() const { return state_ == State::Done; }

private:
    enum class State { Preamble, AfterDelimiter, Headers, Body, Done };

    bool step();

    std::string separator_;   // CRLF "--" boundary
    std::string pending_;
    State state_ = State::Preamble;

    PartBeginCallback on_part_begin_;
    PartDataCallback on_part_data_;
    PartEndCallback on_part_end_;
};

/// Boundary token from a Content-Type value, unquoted. nullopt if absent or empty.
std::optional<std::string> parse_boundary(const std::string& content_type);

/// The `filename="..."` value of a Content-Disposition header, if any.
/// Backslash-escaped quotes inside the value are kept as part of the name.
std::optional<std::string> extract_filename(const std::string& content_disposition);

/// Split a complete multipart body into parts. Throws MultipartError on a malformed stream.
std::vector<MultipartPart> parse_multipart(const std::string& body, const std::string& boundary);
