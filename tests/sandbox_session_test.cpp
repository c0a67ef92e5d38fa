#include "enclave/core/errors.hpp"
#include "enclave/protocol/execution_protocol.hpp"
#include "enclave/protocol/sandbox_session.hpp"

#include "fake_backend.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

using ::enclave::core::CancellationToken;
using ::enclave::core::ErrorKind;
using ::enclave::core::ExecutionRequest;
using ::enclave::core::ExecutionResult;
using ::enclave::core::SandboxError;
using ::enclave::core::SandboxState;
using ::enclave::protocol::ExecutionProtocol;
using ::enclave::protocol::ProtocolLimits;
using ::enclave::protocol::SandboxSession;
using ::enclave::test_support::FakeBackend;
using ::enclave::test_support::FakeBackendState;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class SandboxSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeBackendState>();
        session_ = std::make_unique<SandboxSession>(std::make_unique<FakeBackend>(state_));
    }

    std::shared_ptr<FakeBackendState> state_;
    std::unique_ptr<SandboxSession> session_;
};

TEST_F(SandboxSessionTest, NullBackendIsRejected) {
    EXPECT_THROW(SandboxSession(nullptr), std::invalid_argument);
}

TEST_F(SandboxSessionTest, CreatesLazilyAndReuses) {
    EXPECT_FALSE(session_->HasSandbox());
    EXPECT_EQ(state_->create_calls, 0);

    auto& first = session_->Acquire(CancellationToken::None());
    auto& second = session_->Acquire(CancellationToken::None());

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.Id(), "fake-1");
    EXPECT_EQ(state_->create_calls, 1);
    EXPECT_EQ(session_->CreatedCount(), 1u);
}

TEST_F(SandboxSessionTest, ConcurrentAcquireCreatesOnce) {
    state_->create_delay = std::chrono::milliseconds(100);

    std::vector<std::thread> threads;
    std::mutex ids_mutex;
    std::set<std::string> ids;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto& sandbox = session_->Acquire(CancellationToken::None());
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.insert(sandbox.Id());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(state_->create_calls, 1);
    EXPECT_THAT(ids, ElementsAre("fake-1"));
}

TEST_F(SandboxSessionTest, CancelledWaiterDoesNotBlockOnSlowCreate) {
    state_->create_delay = std::chrono::milliseconds(400);

    std::thread creator([&]() { session_->Acquire(CancellationToken::None()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    CancellationToken token;
    token.SetDeadline(CancellationToken::Clock::now() + std::chrono::milliseconds(50));

    auto started = std::chrono::steady_clock::now();
    try {
        session_->Acquire(token);
        ADD_FAILURE() << "expected CANCELLED";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::CANCELLED);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(300));

    creator.join();
    EXPECT_EQ(state_->create_calls, 1);
}

TEST_F(SandboxSessionTest, FailedCreateCanBeRetried) {
    state_->failing_creates = 1;

    try {
        session_->Acquire(CancellationToken::None());
        FAIL() << "expected SANDBOX_CREATION_FAILED";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::SANDBOX_CREATION_FAILED);
    }
    EXPECT_FALSE(session_->HasSandbox());

    EXPECT_EQ(session_->Acquire(CancellationToken::None()).Id(), "fake-2");
}

TEST_F(SandboxSessionTest, TerminalSandboxIsReplaced) {
    auto& sandbox = session_->Acquire(CancellationToken::None());
    sandbox.MarkObserved(SandboxState::STOPPED);

    auto& replacement = session_->Acquire(CancellationToken::None());

    EXPECT_EQ(replacement.Id(), "fake-2");
    EXPECT_EQ(replacement.State(), SandboxState::RUNNING);
    EXPECT_EQ(state_->destroy_calls, 1);
    EXPECT_EQ(session_->CreatedCount(), 2u);
}

TEST_F(SandboxSessionTest, TeardownIsIdempotent) {
    session_->Teardown(CancellationToken::None());
    EXPECT_EQ(state_->destroy_calls, 0);

    session_->Acquire(CancellationToken::None());
    session_->Teardown(CancellationToken::None());
    session_->Teardown(CancellationToken::None());

    EXPECT_EQ(state_->destroy_calls, 1);
    EXPECT_FALSE(session_->HasSandbox());
}

TEST_F(SandboxSessionTest, DestructorReleasesSandbox) {
    session_->Acquire(CancellationToken::None());
    session_.reset();
    EXPECT_EQ(state_->destroy_calls, 1);
}

// ============================================================================
// ExecutionProtocol
// ============================================================================

class ExecutionProtocolTest : public SandboxSessionTest {
protected:
    ExecutionProtocol MakeProtocol(ProtocolLimits limits = ProtocolLimits()) {
        return ExecutionProtocol(*session_, limits);
    }
};

TEST_F(ExecutionProtocolTest, ClampsTimeouts) {
    auto protocol = MakeProtocol();

    EXPECT_EQ(protocol.ClampTimeout(std::nullopt), std::chrono::seconds(120));
    EXPECT_EQ(protocol.ClampTimeout(0), std::chrono::seconds(1));
    EXPECT_EQ(protocol.ClampTimeout(-5), std::chrono::seconds(1));
    EXPECT_EQ(protocol.ClampTimeout(9999), std::chrono::seconds(600));
    EXPECT_EQ(protocol.ClampTimeout(30), std::chrono::seconds(30));
}

TEST_F(ExecutionProtocolTest, ExecuteAppliesClampAndWorkspaceRoot) {
    auto protocol = MakeProtocol();

    ExecutionRequest request;
    request.command = "ls";
    request.timeout = std::chrono::seconds(5000);
    request.working_dir = "";
    protocol.Execute(request, CancellationToken::None());

    ASSERT_EQ(state_->executed.size(), 1u);
    EXPECT_EQ(state_->executed[0].timeout, std::chrono::seconds(600));
    EXPECT_EQ(state_->executed[0].working_dir, "/workspace");
}

TEST_F(ExecutionProtocolTest, OutputIsTruncatedToTheBudget) {
    ProtocolLimits limits;
    limits.max_observation_tokens = 5;
    auto protocol = MakeProtocol(limits);

    state_->on_execute = [](const ExecutionRequest&) {
        ExecutionResult result;
        result.stdout_output = std::string(100, 'x') + "END";
        return result;
    };

    ExecutionRequest request;
    request.command = "noisy";
    auto result = protocol.Execute(request, CancellationToken::None());

    EXPECT_EQ(result.stdout_output.size(), 20u);
    EXPECT_THAT(result.stdout_output, ::testing::EndsWith("END"));
    EXPECT_TRUE(result.truncated);
}

TEST_F(ExecutionProtocolTest, PathEscapeNeverProvisions) {
    auto protocol = MakeProtocol();

    try {
        protocol.ReadFile("../../etc/passwd", CancellationToken::None());
        FAIL() << "expected PATH_ESCAPE";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::PATH_ESCAPE);
    }
    EXPECT_THROW(protocol.WriteFile("/etc/x", "data", CancellationToken::None()), SandboxError);
    EXPECT_EQ(state_->create_calls, 0);
}

TEST_F(ExecutionProtocolTest, WriteThenRead) {
    auto protocol = MakeProtocol();

    protocol.WriteFile("output/test.json", R"({"ok": true})", CancellationToken::None());
    EXPECT_EQ(protocol.ReadFile("/workspace/output/test.json", CancellationToken::None()),
              R"({"ok": true})");
}

TEST_F(ExecutionProtocolTest, ListsGeneratedFiles) {
    auto protocol = MakeProtocol();
    state_->on_execute = [](const ExecutionRequest& request) {
        ExecutionResult result;
        if (request.command.find("find .") != std::string::npos) {
            result.stdout_output = "./plot.png\n./sub/data.csv\n";
        }
        return result;
    };

    EXPECT_THAT(protocol.ListGeneratedFiles(CancellationToken::None()),
                ElementsAre("plot.png", "sub/data.csv"));

    state_->on_execute = [](const ExecutionRequest&) {
        ExecutionResult result;
        result.exit_code = 1;
        result.stderr_output = "No such file or directory";
        return result;
    };
    EXPECT_THAT(protocol.ListGeneratedFiles(CancellationToken::None()), IsEmpty());
}

TEST_F(ExecutionProtocolTest, ExportsArtifactsUnderHostDirectory) {
    auto protocol = MakeProtocol();
    protocol.WriteFile("output/plot.png", "PNGDATA", CancellationToken::None());
    protocol.WriteFile("output/notes.txt", "ignored", CancellationToken::None());

    auto bundle = protocol.DownloadArtifacts({}, CancellationToken::None());
    ASSERT_EQ(bundle.files.size(), 1u);

    auto dir = std::filesystem::temp_directory_path() /
               ("enclave_export_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);

    auto written = protocol.ExportArtifacts(bundle, dir);
    EXPECT_THAT(written, ElementsAre("output/plot.png"));

    std::ifstream in(dir / "output" / "plot.png", std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "PNGDATA");

    // Unchanged files are not transferred twice
    EXPECT_TRUE(protocol.DownloadArtifacts({}, CancellationToken::None()).files.empty());

    std::filesystem::remove_all(dir);
}

TEST_F(ExecutionProtocolTest, ExportRejectsEscapingKeys) {
    auto protocol = MakeProtocol();
    enclave::core::ArtifactBundle bundle;
    bundle.files["../outside.png"] = "x";

    try {
        protocol.ExportArtifacts(bundle, std::filesystem::temp_directory_path() / "enclave_export_escape");
        FAIL() << "expected PATH_ESCAPE";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::PATH_ESCAPE);
    }
}

} // namespace
