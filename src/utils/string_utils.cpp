#include "utils/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace jukebox {
namespace string_utils {

std::string trim(const std::string& str) {
    auto begin = std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::istringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }
    return result;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool is_url(const std::string& str) {
    std::string lower = to_lower(trim(str));
    if (!starts_with(lower, "http://") && !starts_with(lower, "https://")) {
        return false;
    }
    return std::none_of(lower.begin(), lower.end(), [](unsigned char ch) { return std::isspace(ch); });
}

std::string shell_quote(const std::string& value) {
    std::string result = "'";
    for (char c : value) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

std::string escape_markdown(const std::string& text) {
    std::string result;
    result.reserve(text.size() * 2);
    for (char c : text) {
        if (c == '*' || c == '_' || c == '`' || c == '~' || c == '|' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string truncate(const std::string& str, size_t max_length, const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return suffix.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace string_utils
} // namespace jukebox
