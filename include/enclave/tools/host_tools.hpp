/**
 * @file host_tools.hpp
 * @brief Tools executed in the controlling process
 *
 * Host tools hold credentials (search API key). They never touch the
 * sandbox, and the sandbox never sees their keys: credentials are
 * captured by the handler closures at registration time.
 *
 * @date 2026
 */

#pragma once

#include "enclave/tools/tool_registry.hpp"
#include "enclave/utils/http_transport.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace tools {

/**
 * @struct HostCredentials
 * @brief Secrets available to host tools only
 */
struct HostCredentials {
    std::string tavily_api_key;   ///< Web search key (TAVILY_API_KEY)
};

constexpr const char* kTavilySearchUrl = "https://api.tavily.com/search";
constexpr const char* kTimedTextUrl = "https://www.youtube.com/api/timedtext";

/// Cap on timestamped transcript lines
constexpr std::size_t kMaxTimestampedLines = 500;

/**
 * @struct TranscriptEntry
 * @brief One caption segment
 */
struct TranscriptEntry {
    double start{0.0};      ///< Seconds
    double duration{0.0};   ///< Seconds
    std::string text;
};

/**
 * @brief Register web_search and youtube_transcript
 * @param max_output_chars Cap on the full transcript text
 */
void RegisterHostTools(ToolRegistry& registry,
                       HostCredentials credentials,
                       std::shared_ptr<utils::HttpTransport> http,
                       std::size_t max_output_chars);

/**
 * @brief Video id from a watch/short/embed URL or a bare 11-character id
 */
std::optional<std::string> ExtractVideoId(const std::string& url);

/**
 * @brief Parse a json3 timed-text document
 * @return Empty when the document has no caption text
 */
std::vector<TranscriptEntry> ParseTimedText(const std::string& body);

/**
 * @brief Tool output for a fetched transcript
 *
 * Fields: status, video_id, language, transcript (capped at max_chars),
 * timestamped ("[mm:ss] text", at most kMaxTimestampedLines lines),
 * duration_seconds.
 */
nlohmann::json FormatTranscript(const std::vector<TranscriptEntry>& entries,
                                const std::string& video_id,
                                const std::string& language,
                                std::size_t max_chars);

/**
 * @brief Normalize a Tavily response into {status, results, answer}
 */
nlohmann::json FormatSearchResults(const nlohmann::json& response);

} // namespace tools
} // namespace enclave
