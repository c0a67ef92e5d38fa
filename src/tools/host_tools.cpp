/**
 * @file host_tools.cpp
 * @brief Web search and YouTube transcript tools
 *
 * @date 2026
 */

#include "enclave/tools/host_tools.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <regex>

using json = nlohmann::json;

namespace enclave {
namespace tools {

using core::ErrorKind;
using core::SandboxError;
using utils::StringUtils;

namespace {

utils::HttpResponse SendOrFail(utils::HttpTransport& http, utils::HttpRequest& request,
                               const core::CancellationToken& token) {
    request.should_abort = [&token]() { return token.IsCancelled(); };

    utils::HttpResponse response;
    try {
        response = http.Send(request);
    }
    catch (const utils::TransportError& e) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED, e.what(), ErrorKind::TRANSPORT);
    }
    if (response.aborted) {
        throw SandboxError(ErrorKind::CANCELLED, "Request cancelled: " + token.Reason());
    }
    return response;
}

core::ExecutionResult JsonResult(const json& body, std::chrono::steady_clock::time_point start) {
    core::ExecutionResult result;
    result.stdout_output = body.dump(-1, ' ', false, json::error_handler_t::replace);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

// ============================================================================
// WEB SEARCH
// ============================================================================

core::ExecutionResult WebSearch(const json& args, const core::CancellationToken& token,
                                const HostCredentials& credentials, utils::HttpTransport& http) {
    if (credentials.tavily_api_key.empty()) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED, "TAVILY_API_KEY not set");
    }

    auto query = args["query"].get<std::string>();
    int num_results = std::min(args["num_results"].get<int>(), 10);
    spdlog::info("web_search: query_len={}", query.size());

    auto start = std::chrono::steady_clock::now();

    utils::HttpRequest request;
    request.method = "POST";
    request.url = kTavilySearchUrl;
    request.headers["Authorization"] = "Bearer " + credentials.tavily_api_key;
    request.headers["Content-Type"] = "application/json";
    request.body = json{{"query", query}, {"max_results", num_results}, {"include_answer", true}}.dump();

    auto response = SendOrFail(http, request, token);
    if (!response.Ok()) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED,
                           "Search failed with HTTP " + std::to_string(response.status),
                           ErrorKind::TRANSPORT);
    }

    auto body = json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED, "Malformed search response",
                           ErrorKind::TRANSPORT);
    }

    auto formatted = FormatSearchResults(body);
    spdlog::info("✓ Web search returned {} results", formatted["results"].size());
    return JsonResult(formatted, start);
}

// ============================================================================
// YOUTUBE TRANSCRIPT
// ============================================================================

std::vector<TranscriptEntry> FetchTimedText(utils::HttpTransport& http, const std::string& video_id,
                                            const std::string& language, bool auto_generated,
                                            const core::CancellationToken& token) {
    utils::HttpRequest request;
    request.method = "GET";
    request.url = std::string(kTimedTextUrl) + "?v=" + StringUtils::UrlEncode(video_id) +
                  "&lang=" + StringUtils::UrlEncode(language) + "&fmt=json3";
    if (auto_generated) {
        request.url += "&kind=asr";
    }

    auto response = SendOrFail(http, request, token);
    if (response.status == 404 || StringUtils::Trim(response.body).empty()) {
        return {};
    }
    if (!response.Ok()) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED,
                           "Transcript request failed with HTTP " + std::to_string(response.status),
                           ErrorKind::TRANSPORT);
    }
    return ParseTimedText(response.body);
}

core::ExecutionResult YouTubeTranscript(const json& args, const core::CancellationToken& token,
                                        utils::HttpTransport& http, std::size_t max_chars) {
    auto url = args["url"].get<std::string>();
    auto language = args["language"].get<std::string>();
    spdlog::info("youtube_transcript: {}", url);

    auto video_id = ExtractVideoId(url);
    if (!video_id.has_value()) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED, "Could not extract video ID from URL");
    }

    auto start = std::chrono::steady_clock::now();

    // Manual captions first, then auto-generated ones
    auto entries = FetchTimedText(http, *video_id, language, false, token);
    if (entries.empty()) {
        entries = FetchTimedText(http, *video_id, language, true, token);
    }
    if (entries.empty()) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED, "No transcript available for this video");
    }

    spdlog::info("✓ Got transcript for video {} ({} segments)", *video_id, entries.size());
    return JsonResult(FormatTranscript(entries, *video_id, language, max_chars), start);
}

} // anonymous namespace

std::optional<std::string> ExtractVideoId(const std::string& url) {
    static const std::regex url_pattern(R"((?:v=|/v/|youtu\.be/|/embed/)([^&?/]+))");
    static const std::regex id_pattern(R"(^([a-zA-Z0-9_-]{11})$)");

    std::smatch match;
    if (std::regex_search(url, match, url_pattern)) {
        return match[1].str();
    }
    if (std::regex_search(url, match, id_pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::vector<TranscriptEntry> ParseTimedText(const std::string& body) {
    std::vector<TranscriptEntry> entries;

    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.contains("events") || !doc["events"].is_array()) {
        return entries;
    }

    for (const auto& event : doc["events"]) {
        if (!event.contains("segs") || !event["segs"].is_array()) {
            continue;
        }

        std::string text;
        for (const auto& seg : event["segs"]) {
            text += seg.value("utf8", "");
        }
        text = StringUtils::Trim(StringUtils::ReplaceAll(text, "\n", " "));
        if (text.empty()) {
            continue;
        }

        TranscriptEntry entry;
        entry.start = event.value("tStartMs", 0.0) / 1000.0;
        entry.duration = event.value("dDurationMs", 0.0) / 1000.0;
        entry.text = std::move(text);
        entries.push_back(std::move(entry));
    }

    return entries;
}

json FormatTranscript(const std::vector<TranscriptEntry>& entries,
                      const std::string& video_id,
                      const std::string& language,
                      std::size_t max_chars) {
    std::vector<std::string> texts;
    std::vector<std::string> timestamped;

    for (const auto& entry : entries) {
        texts.push_back(entry.text);

        if (timestamped.size() < kMaxTimestampedLines) {
            int seconds = static_cast<int>(entry.start);
            char stamp[32];
            std::snprintf(stamp, sizeof(stamp), "[%02d:%02d] ", seconds / 60, seconds % 60);
            timestamped.push_back(stamp + entry.text);
        }
    }

    int duration = 0;
    if (!entries.empty()) {
        duration = static_cast<int>(entries.back().start + entries.back().duration);
    }

    std::string full_text = StringUtils::Utf8Prefix(
        StringUtils::ToValidUtf8(StringUtils::Join(texts, " ")), max_chars);

    return {
        {"status", "success"},
        {"video_id", video_id},
        {"language", language},
        {"transcript", full_text},
        {"timestamped", StringUtils::ToValidUtf8(StringUtils::Join(timestamped, "\n"))},
        {"duration_seconds", duration}
    };
}

json FormatSearchResults(const json& response) {
    json results = json::array();
    if (response.contains("results") && response["results"].is_array()) {
        for (const auto& item : response["results"]) {
            results.push_back({
                {"title", item.value("title", "")},
                {"url", item.value("url", "")},
                {"snippet", item.value("content", "")},
                {"score", item.value("score", 0.0)}
            });
        }
    }

    json answer = nullptr;
    if (response.contains("answer") && response["answer"].is_string()) {
        answer = response["answer"];
    }

    return {{"status", "success"}, {"results", results}, {"answer", answer}};
}

void RegisterHostTools(ToolRegistry& registry,
                       HostCredentials credentials,
                       std::shared_ptr<utils::HttpTransport> http,
                       std::size_t max_output_chars) {
    {
        ToolDescriptor tool;
        tool.name = "web_search";
        tool.location = ToolLocation::HOST;
        tool.description =
            "Search the web. Returns titles, URLs and snippets of the results plus a short answer. "
            "Use it to find information or locate relevant URLs.";
        tool.input_schema
            .Required("query", PropertyType::STRING, "Search query to execute.")
            .Optional("num_results", PropertyType::INTEGER, "Number of search results to return.", json(5))
            .Range("num_results", 1, 10);
        tool.handler = HostHandler(
            [credentials, http](const json& args, const core::CancellationToken& token) {
                return WebSearch(args, token, credentials, *http);
            });
        registry.Register(std::move(tool));
    }
    {
        ToolDescriptor tool;
        tool.name = "youtube_transcript";
        tool.location = ToolLocation::HOST;
        tool.description =
            "Get the transcript of a YouTube video. Returns the full text and a timestamped version.";
        tool.input_schema
            .Required("url", PropertyType::STRING, "YouTube video URL or video ID.")
            .Optional("language", PropertyType::STRING, "Preferred transcript language (e.g. en, es, fr).",
                      json("en"));
        tool.handler = HostHandler(
            [http, max_output_chars](const json& args, const core::CancellationToken& token) {
                return YouTubeTranscript(args, token, *http, max_output_chars);
            });
        registry.Register(std::move(tool));
    }
}

} // namespace tools
} // namespace enclave
