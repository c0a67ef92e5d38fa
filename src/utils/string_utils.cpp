/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2026
 */

#include "enclave/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace enclave {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    for (auto& line : Split(str, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// QUOTING AND ENCODING
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& str) {
    return "'" + ReplaceAll(str, "'", "'\\''") + "'";
}

std::string StringUtils::UrlEncode(const std::string& str) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;
    result.reserve(str.size() * 3);

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }

    return result;
}

std::string StringUtils::ToValidUtf8(const std::string& str) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string result;
    result.reserve(str.size());

    std::size_t i = 0;
    while (i < str.size()) {
        auto lead = static_cast<unsigned char>(str[i]);
        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;

        if (lead < 0x80) {
            result += str[i++];
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) { low = 0xA0; }
            if (lead == 0xED) { high = 0x9F; }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) { low = 0x90; }
            if (lead == 0xF4) { high = 0x8F; }
        }

        // Count the valid continuation bytes; the second byte has a narrower range
        std::size_t valid = length == 0 ? 0 : 1;
        while (valid > 0 && valid < length && i + valid < str.size()) {
            auto next = static_cast<unsigned char>(str[i + valid]);
            unsigned char lo = valid == 1 ? low : 0x80;
            unsigned char hi = valid == 1 ? high : 0xBF;
            if (next < lo || next > hi) {
                break;
            }
            ++valid;
        }

        if (length > 0 && valid == length) {
            result.append(str, i, length);
            i += length;
        } else {
            result += kReplacement;
            i += valid == 0 ? 1 : valid;
        }
    }

    return result;
}

std::string StringUtils::Utf8Prefix(const std::string& str, std::size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return str;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return Utf8Prefix(str, max_length);
    }

    return Utf8Prefix(str, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace enclave
