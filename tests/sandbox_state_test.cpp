#include "enclave/core/cancellation.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/sandbox.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

namespace {

using ::enclave::core::CancellationToken;
using ::enclave::core::ErrorKind;
using ::enclave::core::ExecutionResult;
using ::enclave::core::Sandbox;
using ::enclave::core::SandboxError;
using ::enclave::core::SandboxState;
using ::testing::HasSubstr;
using ::testing::StartsWith;

Sandbox RunningSandbox() {
    Sandbox sandbox;
    sandbox.SetName("enclave_test");
    sandbox.TransitionTo(SandboxState::CREATING);
    sandbox.TransitionTo(SandboxState::RUNNING);
    return sandbox;
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST(SandboxLifecycleTest, FollowsTheCreationPath) {
    Sandbox sandbox;
    EXPECT_EQ(sandbox.State(), SandboxState::UNINITIALIZED);
    EXPECT_TRUE(sandbox.TransitionTo(SandboxState::CREATING));
    EXPECT_TRUE(sandbox.TransitionTo(SandboxState::RUNNING));
    EXPECT_TRUE(sandbox.TransitionTo(SandboxState::DESTROYING));
    EXPECT_TRUE(sandbox.TransitionTo(SandboxState::DESTROYED));
}

TEST(SandboxLifecycleTest, InvalidTransitionsLeaveStateUnchanged) {
    Sandbox sandbox;
    EXPECT_FALSE(sandbox.TransitionTo(SandboxState::RUNNING));
    EXPECT_EQ(sandbox.State(), SandboxState::UNINITIALIZED);

    auto running = RunningSandbox();
    EXPECT_FALSE(running.TransitionTo(SandboxState::CREATING));
    EXPECT_EQ(running.State(), SandboxState::RUNNING);
}

TEST(SandboxLifecycleTest, TerminalStatesHaveNoExits) {
    for (auto terminal : {SandboxState::STOPPED, SandboxState::DESTROYED, SandboxState::FAILED}) {
        EXPECT_TRUE(enclave::core::IsTerminal(terminal));
        for (auto next : {SandboxState::CREATING, SandboxState::RUNNING, SandboxState::DESTROYING}) {
            EXPECT_FALSE(enclave::core::IsValidTransition(terminal, next))
                << enclave::core::ToString(terminal) << " -> " << enclave::core::ToString(next);
        }
    }
    EXPECT_FALSE(enclave::core::IsTerminal(SandboxState::RUNNING));
}

TEST(SandboxLifecycleTest, ObservedAutoStopIsAccepted) {
    auto sandbox = RunningSandbox();
    sandbox.MarkObserved(SandboxState::STOPPED);
    EXPECT_EQ(sandbox.State(), SandboxState::STOPPED);

    // A later observation cannot revive or relabel a terminal sandbox
    sandbox.MarkObserved(SandboxState::DESTROYED);
    EXPECT_EQ(sandbox.State(), SandboxState::STOPPED);
}

TEST(SandboxLifecycleTest, NonTerminalObservationsAreIgnored) {
    auto sandbox = RunningSandbox();
    sandbox.MarkObserved(SandboxState::CREATING);
    EXPECT_EQ(sandbox.State(), SandboxState::RUNNING);
}

TEST(SandboxLifecycleTest, RequireRunningNamesTheState) {
    auto sandbox = RunningSandbox();
    EXPECT_NO_THROW(sandbox.RequireRunning("execute"));

    sandbox.MarkObserved(SandboxState::STOPPED);
    try {
        sandbox.RequireRunning("execute");
        FAIL() << "expected SANDBOX_NOT_READY";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::SANDBOX_NOT_READY);
        EXPECT_THAT(e.what(), HasSubstr("stopped"));
    }
}

TEST(SandboxLifecycleTest, ManifestTracksLastDigest) {
    Sandbox sandbox;
    EXPECT_EQ(sandbox.ManifestDigest("output/a.png"), "");
    sandbox.RecordManifest("output/a.png", "abc");
    EXPECT_EQ(sandbox.ManifestDigest("output/a.png"), "abc");
}

// ============================================================================
// Results
// ============================================================================

TEST(ExecutionResultTest, TimeoutResultShape) {
    auto result = enclave::core::MakeTimeoutResult(std::chrono::seconds(2), "partial", "",
                                                   std::chrono::milliseconds(2010));

    EXPECT_EQ(result.exit_code, enclave::core::kTimeoutExitCode);
    EXPECT_TRUE(result.TimedOut());
    EXPECT_FALSE(result.Success());
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_output, "partial");
    EXPECT_THAT(result.stderr_output, StartsWith("Command timed out after 2 seconds"));
}

TEST(ExecutionResultTest, JsonCarriesErrorKind) {
    auto result = enclave::core::MakeTimeoutResult(std::chrono::seconds(1), "", "late output",
                                                   std::chrono::milliseconds(1000));
    auto j = result.ToJson();

    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["error_kind"], "timeout");
    EXPECT_THAT(j["stderr"].get<std::string>(), HasSubstr("late output"));

    ExecutionResult ok;
    ok.stdout_output = "hi";
    EXPECT_EQ(ok.ToJson()["status"], "success");
    EXPECT_FALSE(ok.ToJson().contains("error_kind"));
}

// ============================================================================
// Errors
// ============================================================================

TEST(ErrorKindTest, NamesRoundTrip) {
    for (auto kind : {ErrorKind::PATH_ESCAPE, ErrorKind::TIMEOUT, ErrorKind::TOOL_NOT_FOUND,
                      ErrorKind::INVALID_RESOURCE_LIMIT}) {
        EXPECT_EQ(enclave::core::ErrorKindFromString(enclave::core::ToString(kind)), kind);
    }
    EXPECT_FALSE(enclave::core::ErrorKindFromString("bogus").has_value());
}

TEST(ErrorKindTest, ConfigurationKinds) {
    EXPECT_TRUE(enclave::core::IsConfigurationError(ErrorKind::INVALID_CONFIGURATION));
    EXPECT_TRUE(enclave::core::IsConfigurationError(ErrorKind::UNSUPPORTED_BACKEND));
    EXPECT_FALSE(enclave::core::IsConfigurationError(ErrorKind::TRANSPORT));
}

TEST(ErrorKindTest, CauseIsPreserved) {
    SandboxError wrapped(ErrorKind::TOOL_EXECUTION_FAILED, "boom", ErrorKind::TRANSPORT);
    EXPECT_EQ(wrapped.Cause(), ErrorKind::TRANSPORT);
    EXPECT_FALSE(SandboxError(ErrorKind::TIMEOUT, "x").Cause().has_value());
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(CancellationTokenTest, CancelIsStickyAndKeepsFirstReason) {
    CancellationToken token;
    EXPECT_FALSE(token.IsCancelled());
    EXPECT_NO_THROW(token.ThrowIfCancelled());

    token.Cancel("user abort");
    token.Cancel("second");
    EXPECT_TRUE(token.IsCancelled());
    EXPECT_EQ(token.Reason(), "user abort");

    try {
        token.ThrowIfCancelled();
        FAIL() << "expected CANCELLED";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::CANCELLED);
    }
}

TEST(CancellationTokenTest, DeadlineFires) {
    CancellationToken token;
    token.SetDeadline(CancellationToken::Clock::now() + std::chrono::milliseconds(20));
    EXPECT_FALSE(token.IsCancelled());
    ASSERT_TRUE(token.Remaining().has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_TRUE(token.IsCancelled());
    EXPECT_EQ(token.Reason(), "deadline exceeded");
    EXPECT_EQ(*token.Remaining(), CancellationToken::Clock::duration::zero());
}

TEST(CancellationTokenTest, NoneNeverFires) {
    EXPECT_FALSE(CancellationToken::None().IsCancelled());
    EXPECT_FALSE(CancellationToken::None().Remaining().has_value());
}

} // namespace
