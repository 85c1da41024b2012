/**
 * Multipart parser - splits a multipart/form-data stream into parts.
 *
 * Layout handled:
 *   [preamble] --B CRLF headers CRLF CRLF body CRLF --B ... CRLF --B-- [epilogue]
 *
 * The reader starts with a virtual CRLF in its buffer so the first delimiter
 * matches the same CRLF--B pattern as the others.
 */

#include "http/multipart.h"
#include "util/string_util.h"

#include <regex>
#include <utility>

namespace {

constexpr const char* kCrlf = "\r\n";
constexpr const char* kHeaderEnd = "\r\n\r\n";
constexpr std::size_t kMaxPartHeaderBytes = 16 * 1024;

std::map<std::string, std::string> parse_part_headers(const std::string& block) {
    std::map<std::string, std::string> headers;
    std::size_t pos = 0;
    while (pos < block.size()) {
        auto eol = block.find(kCrlf, pos);
        if (eol == std::string::npos) {
            eol = block.size();
        }
        const auto line = block.substr(pos, eol - pos);
        pos = eol + 2;
        if (line.empty()) {
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw MultipartError("malformed part header: " + line);
        }
        headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return headers;
}

} // namespace

std::string MultipartPart::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string{} : it->second;
}

MultipartReader::MultipartReader(const std::string& boundary)
    : separator_(std::string(kCrlf) + "--" + boundary)
    , pending_(kCrlf) {
    if (boundary.empty()) {
        throw MultipartError("empty boundary");
    }
}

void MultipartReader::set_on_part_begin(PartBeginCallback cb) { on_part_begin_ = std::move(cb); }
void MultipartReader::set_on_part_data(PartDataCallback cb)   { on_part_data_ = std::move(cb); }
void MultipartReader::set_on_part_end(PartEndCallback cb)     { on_part_end_ = std::move(cb); }

void MultipartReader::feed(const char* data, std::size_t size) {
    if (state_ == State::Done) {
        return;  // epilogue
    }
    pending_.append(data, size);
    while (step()) {
    }
}

void MultipartReader::finish() {
    switch (state_) {
        case State::Done:
            return;
        case State::Preamble:
            throw MultipartError("missing opening boundary");
        case State::Headers:
            throw MultipartError("unterminated part headers");
        default:
            throw MultipartError("missing closing boundary");
    }
}

// Advances the state machine once. False when more input is needed.
bool MultipartReader::step() {
    switch (state_) {
        case State::Preamble: {
            const auto pos = pending_.find(separator_);
            if (pos == std::string::npos) {
                if (pending_.size() >= separator_.size()) {
                    pending_.erase(0, pending_.size() - separator_.size() + 1);
                }
                return false;
            }
            pending_.erase(0, pos + separator_.size());
            state_ = State::AfterDelimiter;
            return true;
        }

        case State::AfterDelimiter: {
            // Transport padding is allowed between the delimiter and its CRLF.
            const auto first = pending_.find_first_not_of(" \t");
            if (first == std::string::npos || pending_.size() - first < 2) {
                return false;
            }
            if (first == 0 && pending_.compare(0, 2, "--") == 0) {
                state_ = State::Done;
                pending_.clear();
                return false;
            }
            if (pending_.compare(first, 2, kCrlf) != 0) {
                throw MultipartError("expected CRLF after boundary");
            }
            pending_.erase(0, first + 2);
            state_ = State::Headers;
            return true;
        }

        case State::Headers: {
            std::map<std::string, std::string> headers;
            if (pending_.size() >= 2 && pending_.compare(0, 2, kCrlf) == 0) {
                pending_.erase(0, 2);  // part without headers
            } else {
                const auto end = pending_.find(kHeaderEnd);
                if (end == std::string::npos) {
                    if (pending_.size() > kMaxPartHeaderBytes) {
                        throw MultipartError("part headers too large");
                    }
                    return false;
                }
                headers = parse_part_headers(pending_.substr(0, end));
                pending_.erase(0, end + 4);
            }
            if (on_part_begin_) {
                on_part_begin_(headers);
            }
            state_ = State::Body;
            return true;
        }

        case State::Body: {
            const auto pos = pending_.find(separator_);
            if (pos == std::string::npos) {
                // Keep a tail that could be the start of the delimiter.
                if (pending_.size() >= separator_.size()) {
                    const auto emit = pending_.size() - separator_.size() + 1;
                    if (on_part_data_) {
                        on_part_data_(pending_.data(), emit);
                    }
                    pending_.erase(0, emit);
                }
                return false;
            }
            if (pos > 0 && on_part_data_) {
                on_part_data_(pending_.data(), pos);
            }
            if (on_part_end_) {
                on_part_end_();
            }
            pending_.erase(0, pos + separator_.size());
            state_ = State::AfterDelimiter;
            return true;
        }

        case State::Done:
            return false;
    }
    return false;
}

std::optional<std::string> parse_boundary(const std::string& content_type) {
    const auto lowered = to_lower(content_type);
    const auto key = lowered.find("boundary=");
    if (key == std::string::npos) {
        return std::nullopt;
    }
    auto value = content_type.substr(key + 9);
    value = trim(value.substr(0, value.find(';')));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> extract_filename(const std::string& content_disposition) {
    static const std::regex pattern(R"re((?:^|[;\s])filename="((?:[^"\\]|\\.)+)")re",
                                    std::regex::icase);
    std::smatch match;
    if (!std::regex_search(content_disposition, match, pattern)) {
        return std::nullopt;
    }

    const auto quoted = match[1].str();
    std::string name;
    name.reserve(quoted.size());
    for (std::size_t i = 0; i < quoted.size(); ++i) {
        if (quoted[i] == '\\' && i + 1 < quoted.size()) {
            ++i;
        }
        name += quoted[i];
    }
    return name;
}

std::vector<MultipartPart> parse_multipart(const std::string& body, const std::string& boundary) {
    std::vector<MultipartPart> parts;

    MultipartReader reader(boundary);
    reader.set_on_part_begin([&parts](const std::map<std::string, std::string>& headers) {
        parts.push_back(MultipartPart{headers, {}});
    });
    reader.set_on_part_data([&parts](const char* data, std::size_t size) {
        parts.back().body.append(data, size);
    });
    reader.feed(body.data(), body.size());
    reader.finish();
    return parts;
}
