#pragma once

#include <string>

/// MIME type for a filename by extension; "application/octet-stream" if unknown.
std::string lookup_mime_type(const std::string& filename);
