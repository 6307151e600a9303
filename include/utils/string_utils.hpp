#pragma once

#include <string>
#include <vector>

namespace jukebox {
namespace string_utils {

// Trim whitespace
std::string trim(const std::string& str);

std::string to_lower(const std::string& str);

// Empty fields are kept
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

bool starts_with(const std::string& str, const std::string& prefix);

// http:// or https:// prefix, no whitespace
bool is_url(const std::string& str);

// Single-quoted for /bin/sh, embedded quotes escaped
std::string shell_quote(const std::string& value);

// Escapes Discord markdown so titles render literally
std::string escape_markdown(const std::string& text);

std::string truncate(const std::string& str, size_t max_length, const std::string& suffix = "...");

} // namespace string_utils
} // namespace jukebox
