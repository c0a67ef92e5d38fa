#include "enclave/agent/run_context.hpp"
#include "enclave/tools/host_tools.hpp"

#include "fake_backend.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

namespace {

using ::enclave::agent::RunContext;
using ::enclave::core::ErrorKind;
using ::enclave::test_support::FakeBackend;
using ::enclave::test_support::FakeBackendState;
using ::enclave::tools::ExtractVideoId;
using ::enclave::tools::FormatSearchResults;
using ::enclave::tools::FormatTranscript;
using ::enclave::tools::HostCredentials;
using ::enclave::tools::ParseTimedText;
using ::enclave::tools::ToolRegistry;
using ::enclave::tools::TranscriptEntry;
using ::enclave::utils::HttpRequest;
using ::enclave::utils::HttpResponse;
using ::enclave::utils::HttpTransport;
using ::enclave::utils::TransportError;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Optional;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;
using json = nlohmann::json;

class MockHttpTransport : public HttpTransport {
public:
    MOCK_METHOD(HttpResponse, Send, (const HttpRequest& request), (override));
};

HttpResponse Respond(long status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

// ============================================================================
// Parsing helpers
// ============================================================================

TEST(ExtractVideoIdTest, AcceptsCommonUrlShapes) {
    EXPECT_THAT(ExtractVideoId("https://www.youtube.com/watch?v=dQw4w9WgXcQ&t=42"), Optional(std::string("dQw4w9WgXcQ")));
    EXPECT_THAT(ExtractVideoId("https://youtu.be/dQw4w9WgXcQ"), Optional(std::string("dQw4w9WgXcQ")));
    EXPECT_THAT(ExtractVideoId("https://www.youtube.com/embed/dQw4w9WgXcQ?rel=0"), Optional(std::string("dQw4w9WgXcQ")));
    EXPECT_THAT(ExtractVideoId("dQw4w9WgXcQ"), Optional(std::string("dQw4w9WgXcQ")));
}

TEST(ExtractVideoIdTest, RejectsOtherText) {
    EXPECT_FALSE(ExtractVideoId("https://example.com/video").has_value());
    EXPECT_FALSE(ExtractVideoId("short").has_value());
}

TEST(ParseTimedTextTest, JoinsSegmentsAndSkipsEmptyEvents) {
    auto entries = ParseTimedText(R"({"events": [
        {"tStartMs": 0, "dDurationMs": 1500, "segs": [{"utf8": "hello "}, {"utf8": "world"}]},
        {"tStartMs": 1500, "dDurationMs": 100},
        {"tStartMs": 1600, "dDurationMs": 200, "segs": [{"utf8": "\n"}]},
        {"tStartMs": 61000, "dDurationMs": 2000, "segs": [{"utf8": "line\nbreak"}]}
    ]})");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].text, "hello world");
    EXPECT_DOUBLE_EQ(entries[0].duration, 1.5);
    EXPECT_EQ(entries[1].text, "line break");
    EXPECT_DOUBLE_EQ(entries[1].start, 61.0);

    EXPECT_TRUE(ParseTimedText("not json").empty());
    EXPECT_TRUE(ParseTimedText("{}").empty());
}

TEST(FormatTranscriptTest, CapsTextAndTimestampedLines) {
    std::vector<TranscriptEntry> entries;
    for (int i = 0; i < 600; ++i) {
        entries.push_back({static_cast<double>(i), 1.0, "word" + std::to_string(i)});
    }

    auto j = FormatTranscript(entries, "abc", "en", 50);

    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["transcript"].get<std::string>().size(), 50u);
    EXPECT_EQ(j["duration_seconds"], 600);

    auto timestamped = j["timestamped"].get<std::string>();
    EXPECT_EQ(std::count(timestamped.begin(), timestamped.end(), '\n'), 499);
    EXPECT_THAT(timestamped, HasSubstr("[01:05] word65"));
    EXPECT_THAT(timestamped, Not(HasSubstr("word500")));
}

TEST(FormatTranscriptTest, CapNeverSplitsACharacter) {
    // "caf\xc3\xa9" is five bytes; a four byte cap lands inside the e-acute
    std::vector<TranscriptEntry> entries = {{0.0, 2.0, "caf\xc3\xa9"}, {2.0, 2.0, "cr\xc3\xa8me"}};

    auto j = FormatTranscript(entries, "abc", "fr", 4);

    EXPECT_EQ(j["transcript"], "caf");
    EXPECT_NO_THROW(j.dump());
}

TEST(FormatSearchResultsTest, MapsContentToSnippet) {
    auto j = FormatSearchResults(json::parse(R"({
        "answer": "Paris",
        "results": [{"title": "France", "url": "https://fr.example", "content": "Capital is Paris", "score": 0.9}]
    })"));

    ASSERT_EQ(j["results"].size(), 1u);
    EXPECT_EQ(j["results"][0]["snippet"], "Capital is Paris");
    EXPECT_EQ(j["answer"], "Paris");

    EXPECT_TRUE(FormatSearchResults(json::object())["answer"].is_null());
    EXPECT_TRUE(FormatSearchResults(json::object())["results"].empty());
}

// ============================================================================
// Tools through a run context
// ============================================================================

class HostToolsTest : public ::testing::Test {
protected:
    void Build(const std::string& api_key) {
        http_ = std::make_shared<MockHttpTransport>();
        enclave::tools::RegisterHostTools(registry_, HostCredentials{api_key}, http_, 40000);
        registry_.Seal();
        state_ = std::make_shared<FakeBackendState>();
        context_ = std::make_unique<RunContext>(registry_, std::make_unique<FakeBackend>(state_));
    }

    ToolRegistry registry_;
    std::shared_ptr<MockHttpTransport> http_;
    std::shared_ptr<FakeBackendState> state_;
    std::unique_ptr<RunContext> context_;
};

TEST_F(HostToolsTest, SearchWithoutKeyFails) {
    Build("");
    EXPECT_CALL(*http_, Send(_)).Times(0);

    json args = {{"query", "weather"}};
    auto result = context_->Invoke("web_search", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_EQ(result.Error().kind, ErrorKind::TOOL_EXECUTION_FAILED);
    EXPECT_THAT(result.Error().message, HasSubstr("TAVILY_API_KEY not set"));
}

TEST_F(HostToolsTest, SearchSendsAuthorizedRequest) {
    Build("tvly-key");
    HttpRequest sent;
    EXPECT_CALL(*http_, Send(AllOf(Field(&HttpRequest::method, "POST"),
                                   Field(&HttpRequest::url, enclave::tools::kTavilySearchUrl))))
        .WillOnce(::testing::DoAll(SaveArg<0>(&sent),
                                   Return(Respond(200, R"({"results": [{"title": "t", "url": "u", "content": "c"}]})"))));

    json args = {{"query", "weather"}, {"num_results", 3}};
    auto result = context_->Invoke("web_search", args);

    ASSERT_FALSE(result.IsError()) << result.ToJson().dump();
    EXPECT_EQ(sent.headers["Authorization"], "Bearer tvly-key");
    auto body = json::parse(sent.body);
    EXPECT_EQ(body["max_results"], 3);
    EXPECT_EQ(body["include_answer"], true);

    auto output = json::parse(result.Result().stdout_output);
    EXPECT_EQ(output["results"][0]["snippet"], "c");
    EXPECT_EQ(state_->create_calls, 0);
}

TEST_F(HostToolsTest, SearchRangeIsEnforcedBeforeSending) {
    Build("tvly-key");
    EXPECT_CALL(*http_, Send(_)).Times(0);

    json args = {{"query", "weather"}, {"num_results", 50}};
    auto result = context_->Invoke("web_search", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_EQ(result.Error().kind, ErrorKind::INVALID_ARGUMENTS);
}

TEST_F(HostToolsTest, TransportFailureKeepsCause) {
    Build("tvly-key");
    EXPECT_CALL(*http_, Send(_)).WillOnce(Throw(TransportError("connection refused")));

    json args = {{"query", "weather"}};
    auto result = context_->Invoke("web_search", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_EQ(result.Error().kind, ErrorKind::TOOL_EXECUTION_FAILED);
    EXPECT_EQ(result.Error().cause, ErrorKind::TRANSPORT);
}

TEST_F(HostToolsTest, TranscriptFallsBackToAutoCaptions) {
    Build("");
    const std::string captions =
        R"({"events": [{"tStartMs": 0, "dDurationMs": 2000, "segs": [{"utf8": "auto text"}]}]})";

    EXPECT_CALL(*http_, Send(Field(&HttpRequest::url, Not(HasSubstr("kind=asr")))))
        .WillOnce(Return(Respond(200, "")));
    EXPECT_CALL(*http_, Send(Field(&HttpRequest::url, HasSubstr("kind=asr"))))
        .WillOnce(Return(Respond(200, captions)));

    json args = {{"url", "https://youtu.be/dQw4w9WgXcQ"}};
    auto result = context_->Invoke("youtube_transcript", args);

    ASSERT_FALSE(result.IsError()) << result.ToJson().dump();
    auto output = json::parse(result.Result().stdout_output);
    EXPECT_EQ(output["video_id"], "dQw4w9WgXcQ");
    EXPECT_EQ(output["language"], "en");
    EXPECT_EQ(output["transcript"], "auto text");
    EXPECT_EQ(output["timestamped"], "[00:00] auto text");
}

TEST_F(HostToolsTest, TranscriptMissingEverywhere) {
    Build("");
    EXPECT_CALL(*http_, Send(_)).Times(2).WillRepeatedly(Return(Respond(404, "")));

    json args = {{"url", "dQw4w9WgXcQ"}, {"language", "fr"}};
    auto result = context_->Invoke("youtube_transcript", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_THAT(result.Error().message, HasSubstr("No transcript available"));
}

TEST_F(HostToolsTest, TranscriptNeedsAVideoId) {
    Build("");
    EXPECT_CALL(*http_, Send(_)).Times(0);

    json args = {{"url", "https://example.com/"}};
    auto result = context_->Invoke("youtube_transcript", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_THAT(result.Error().message, HasSubstr("Could not extract video ID"));
}

TEST_F(HostToolsTest, AbortedRequestIsCancellation) {
    Build("tvly-key");
    HttpResponse aborted;
    aborted.aborted = true;
    EXPECT_CALL(*http_, Send(_)).WillOnce(Return(aborted));

    json args = {{"query", "weather"}};
    auto result = context_->Invoke("web_search", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_EQ(result.Error().kind, ErrorKind::CANCELLED);
}

} // namespace
