#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace cliai {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Shorten text for log lines, appending "..." when cut
std::string truncate(const std::string& s, size_t max_len);

// Parse "true"/"1"/"yes" (case-insensitive)
bool parse_bool(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace cliai
