/**
 * String helpers - case folding and whitespace trimming for header text.
 */

#include "util/string_util.h"

#include <algorithm>
#include <cctype>

namespace {

constexpr const char* kWhitespace = " \t\r\n";

} // namespace

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}
