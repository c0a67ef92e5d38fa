#include "enclave/agent/run_context.hpp"
#include "enclave/tools/sandbox_tools.hpp"

#include "fake_backend.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace {

using ::enclave::agent::RunContext;
using ::enclave::core::ErrorKind;
using ::enclave::core::ExecutionKind;
using ::enclave::core::ExecutionRequest;
using ::enclave::core::ExecutionResult;
using ::enclave::test_support::FakeBackend;
using ::enclave::test_support::FakeBackendState;
using ::enclave::tools::BuildBrowserScript;
using ::enclave::tools::EscapeSelector;
using ::enclave::tools::SandboxToolOptions;
using ::enclave::tools::ToolRegistry;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using json = nlohmann::json;

class SandboxToolsTest : public ::testing::Test {
protected:
    void Build(const SandboxToolOptions& options = SandboxToolOptions()) {
        enclave::tools::RegisterSandboxTools(registry_, options);
        registry_.Seal();
        state_ = std::make_shared<FakeBackendState>();
        context_ = std::make_unique<RunContext>(registry_, std::make_unique<FakeBackend>(state_));
    }

    ToolRegistry registry_;
    std::shared_ptr<FakeBackendState> state_;
    std::unique_ptr<RunContext> context_;
};

TEST_F(SandboxToolsTest, ShellUsesDefaultsAndClampsTimeout) {
    Build();

    json args = {{"command", "ls -la"}, {"timeout", 5000}};
    auto result = context_->Invoke("shell", args);

    ASSERT_FALSE(result.IsError()) << result.ToJson().dump();
    ASSERT_EQ(state_->executed.size(), 1u);
    EXPECT_EQ(state_->executed[0].command, "ls -la");
    EXPECT_EQ(state_->executed[0].working_dir, "/workspace");
    EXPECT_EQ(state_->executed[0].timeout, std::chrono::seconds(600));
}

TEST_F(SandboxToolsTest, ShellRejectsTimeoutBeyondIntegerRange) {
    Build();

    json args = {{"command", "ls"}, {"timeout", 1e300}};
    auto result = context_->Invoke("shell", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_EQ(result.Error().kind, ErrorKind::INVALID_ARGUMENTS);
    EXPECT_TRUE(state_->executed.empty());
}

TEST_F(SandboxToolsTest, FileWriteThenRead) {
    Build();

    json write = {{"path", "output/report.md"}, {"content", "# Report"}};
    auto written = context_->Invoke("file_write", write);
    ASSERT_FALSE(written.IsError()) << written.ToJson().dump();

    auto summary = json::parse(written.Result().stdout_output);
    EXPECT_EQ(summary["path"], "/workspace/output/report.md");
    EXPECT_EQ(summary["size"], 8);

    json read = {{"path", "/workspace/output/report.md"}};
    auto content = context_->Invoke("file_read", read);
    ASSERT_FALSE(content.IsError());
    EXPECT_EQ(content.Result().stdout_output, "# Report");
}

TEST_F(SandboxToolsTest, PythonReportsAndExportsArtifacts) {
    auto dir = std::filesystem::temp_directory_path() /
               ("enclave_tools_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);

    SandboxToolOptions options;
    options.artifact_dir = dir;
    Build(options);

    state_->on_execute = [this](const ExecutionRequest& request) {
        ExecutionResult result;
        if (request.kind == ExecutionKind::PYTHON) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->files["/workspace/output/result.json"] = R"({"answer": 42})";
            result.stdout_output = "saved\n";
        } else if (request.command.find("find . -type f") != std::string::npos) {
            result.stdout_output = "./result.json\n";
        }
        return result;
    };

    json args = {{"code", "import json; json.dump({'answer': 42}, open('output/result.json', 'w'))"}};
    auto result = context_->Invoke("python", args);

    ASSERT_FALSE(result.IsError()) << result.ToJson().dump();
    EXPECT_EQ(result.Result().stdout_output, "saved\n");
    EXPECT_THAT(result.Result().artifacts, ElementsAre("output/result.json"));

    std::ifstream in(dir / "output" / "result.json");
    std::string exported((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(exported, R"({"answer": 42})");
    std::filesystem::remove_all(dir);
}

TEST_F(SandboxToolsTest, WebBrowseRunsGeneratedScript) {
    Build();
    state_->on_execute = [](const ExecutionRequest&) {
        ExecutionResult result;
        result.stdout_output = R"({"status": "success", "url": "https://example.com/", "title": "Example", "content": "Hello"})";
        return result;
    };

    json args = {{"url", "https://example.com/"}, {"selector", "h1"}};
    auto result = context_->Invoke("web_browse", args);

    ASSERT_FALSE(result.IsError()) << result.ToJson().dump();
    EXPECT_EQ(json::parse(result.Result().stdout_output)["title"], "Example");

    ASSERT_EQ(state_->executed.size(), 1u);
    EXPECT_EQ(state_->executed[0].timeout, std::chrono::seconds(enclave::tools::kBrowseTimeoutSeconds));
    EXPECT_THAT(state_->files.at(enclave::tools::kBrowserScriptPath),
                HasSubstr(R"(page.goto("https://example.com/")"));
}

TEST_F(SandboxToolsTest, WebBrowseErrorStatusIsToolFailure) {
    Build();
    state_->on_execute = [](const ExecutionRequest&) {
        ExecutionResult result;
        result.stdout_output = R"({"status": "error", "error": "net::ERR_NAME_NOT_RESOLVED"})";
        return result;
    };

    json args = {{"url", "https://nowhere.invalid/"}};
    auto result = context_->Invoke("web_browse", args);

    ASSERT_TRUE(result.IsError());
    EXPECT_EQ(result.Error().kind, ErrorKind::TOOL_EXECUTION_FAILED);
    EXPECT_THAT(result.Error().message, HasSubstr("ERR_NAME_NOT_RESOLVED"));
}

TEST(BrowserScriptTest, UrlAndSelectorCannotBreakOut) {
    auto script = BuildBrowserScript("https://x.test/?q=\"); import os; (\"", std::string("a[title=\"x\"]\nb"), 500);

    EXPECT_THAT(script, HasSubstr(R"(page.goto("https://x.test/?q=\"); import os; (\"")"));
    EXPECT_THAT(script, HasSubstr(R"(query_selector_all("a[title=\"x\"] b"))"));
    EXPECT_THAT(script, HasSubstr("content[:500]"));
}

TEST(BrowserScriptTest, WithoutSelectorReadsBody) {
    auto script = BuildBrowserScript("https://example.com", std::nullopt, 100);
    EXPECT_THAT(script, HasSubstr("page.text_content(\"body\")"));
    EXPECT_THAT(script, Not(HasSubstr("query_selector_all")));
}

TEST(BrowserScriptTest, EscapeSelector) {
    EXPECT_EQ(EscapeSelector("div.main"), "div.main");
    EXPECT_EQ(EscapeSelector("a\\b"), "a\\\\b");
    EXPECT_EQ(EscapeSelector("a\r\nb"), "a  b");
}

} // namespace
