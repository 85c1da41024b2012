#pragma once

#include <string>

/// ASCII lower-case copy.
std::string to_lower(std::string s);

/// Copy without leading/trailing spaces, tabs, CR and LF.
std::string trim(const std::string& s);
