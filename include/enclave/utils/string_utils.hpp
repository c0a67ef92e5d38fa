/**
 * @file string_utils.hpp
 * @brief String helpers shared by the sandbox backends and tools
 *
 * Covers the small set of operations the rest of the code needs: trimming,
 * splitting and joining paths, quoting text for a POSIX shell, and encoding
 * query parameters for the remote service.
 *
 * @date 2026
 */

#pragma once

#include <string>
#include <vector>

namespace enclave {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto parts = StringUtils::Split("/workspace//output/a.json", '/');
 * // parts = ["workspace", "output", "a.json"]
 *
 * std::string line = "cat -- " + StringUtils::ShellQuote("/workspace/it's.txt");
 * // line = "cat -- '/workspace/it'\''s.txt'"
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     */
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     *
     * **Example**:
     * @code
     * auto parts = StringUtils::Split("a//b/", '/');
     * // parts = ["a", "b"]
     * @endcode
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split text into lines, dropping a trailing carriage return
     * @return Non-empty lines only
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace all occurrences of substring
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Quoting and Encoding
     ***************************************************************************/

    /**
     * @brief Quote a string as a single POSIX shell word
     *
     * Wraps the value in single quotes; embedded single quotes become
     * '\''. The result is safe to splice into a `/bin/sh -c` line.
     */
    static std::string ShellQuote(const std::string& str);

    /**
     * @brief Percent-encode a value for use in a URL query string (RFC 3986)
     */
    static std::string UrlEncode(const std::string& str);

    /**
     * @brief Make arbitrary bytes valid UTF-8
     *
     * Every byte that does not start a well-formed sequence (stray
     * continuation bytes, overlongs, surrogates, truncated sequences) is
     * replaced with U+FFFD. Valid input is returned unchanged.
     */
    static std::string ToValidUtf8(const std::string& str);

    /**
     * @brief Longest prefix of at most `max_bytes` that ends on a UTF-8 character boundary
     */
    static std::string Utf8Prefix(const std::string& str, std::size_t max_bytes);

    /**
     * @brief Truncate string to maximum length
     *
     * @param str Input string
     * @param max_length Maximum allowed length
     * @param suffix Suffix to append if truncated (default: "...")
     *
     * **Example**:
     * @code
     * auto preview = StringUtils::Truncate("pip install pandas numpy", 10);
     * // preview = "pip ins..."
     * @endcode
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace enclave
