#pragma once
#include <string>

namespace perouter {

// Local time as YYYYmmdd_HHMMSS, used for default capture directories
std::string compact_timestamp();

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Join a directory and a file name with exactly one '/'
std::string join_path(const std::string& dir, const std::string& name);

} // namespace perouter
