/**
 * Extension to MIME type table used for download responses.
 */

#include "http/mime_types.h"
#include "util/string_util.h"

#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string>& mime_table() {
    static const std::unordered_map<std::string, std::string> table = {
        // text
        {"txt", "text/plain"},
        {"csv", "text/csv"},
        {"htm", "text/html"},
        {"html", "text/html"},
        {"css", "text/css"},
        {"js", "text/javascript"},
        {"md", "text/markdown"},
        {"xml", "application/xml"},
        {"json", "application/json"},
        // documents
        {"pdf", "application/pdf"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"odt", "application/vnd.oasis.opendocument.text"},
        {"rtf", "application/rtf"},
        {"epub", "application/epub+zip"},
        // images
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"bmp", "image/bmp"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"ico", "image/x-icon"},
        {"heic", "image/heic"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        // audio
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"flac", "audio/flac"},
        {"m4a", "audio/mp4"},
        {"aac", "audio/aac"},
        // video
        {"mp4", "video/mp4"},
        {"m4v", "video/mp4"},
        {"mov", "video/quicktime"},
        {"webm", "video/webm"},
        {"mkv", "video/x-matroska"},
        {"avi", "video/x-msvideo"},
        {"3gp", "video/3gpp"},
        // archives
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"7z", "application/x-7z-compressed"},
        {"rar", "application/vnd.rar"},
        {"apk", "application/vnd.android.package-archive"},
    };
    return table;
}

} // namespace

std::string lookup_mime_type(const std::string& filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 == filename.size()) {
        return "application/octet-stream";
    }
    const auto& table = mime_table();
    auto it = table.find(to_lower(filename.substr(dot + 1)));
    return it == table.end() ? "application/octet-stream" : it->second;
}
