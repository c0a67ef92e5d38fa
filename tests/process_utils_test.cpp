#include "enclave/utils/process_utils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

namespace {

using ::enclave::utils::ProcessOptions;
using ::enclave::utils::ProcessRunner;
using ::testing::EndsWith;
using ::testing::HasSubstr;

TEST(ProcessRunnerTest, CapturesBothStreams) {
    auto result = ProcessRunner::Run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.Success());
}

TEST(ProcessRunnerTest, FeedsStdin) {
    ProcessOptions options;
    options.stdin_data = "print('from stdin')\n";
    auto result = ProcessRunner::Run({"/bin/cat"}, options);

    EXPECT_TRUE(result.Success());
    EXPECT_EQ(result.stdout_output, options.stdin_data);
}

TEST(ProcessRunnerTest, TimeoutKillsTheProcessGroup) {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(300);
    auto result = ProcessRunner::Run({"/bin/sh", "-c", "echo started; sleep 30 & wait"}, options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.Success());
    EXPECT_THAT(result.stdout_output, HasSubstr("started"));
    EXPECT_LT(result.duration, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, AbortCallbackStopsTheChild) {
    std::atomic<int> polls{0};
    ProcessOptions options;
    options.poll_interval = std::chrono::milliseconds(10);
    options.should_abort = [&polls]() { return ++polls > 5; };

    auto result = ProcessRunner::Run({"/bin/sleep", "30"}, options);

    EXPECT_TRUE(result.aborted);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(result.duration, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, OutputCapKeepsTheTail) {
    ProcessOptions options;
    options.max_output_bytes = 16;
    auto result = ProcessRunner::Run({"/bin/sh", "-c", "seq 1 1000"}, options);

    EXPECT_TRUE(result.Success());
    EXPECT_TRUE(result.output_truncated);
    EXPECT_EQ(result.stdout_output.size(), 16u);
    EXPECT_THAT(result.stdout_output, EndsWith("1000\n"));
}

TEST(ProcessRunnerTest, SignalExitIsEncoded) {
    auto result = ProcessRunner::Run({"/bin/sh", "-c", "kill -9 $$"});
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(ProcessRunnerTest, StartFailuresThrow) {
    EXPECT_THROW(ProcessRunner::Run({}), std::invalid_argument);
    EXPECT_THROW(ProcessRunner::Run({"/nonexistent/enclave-binary"}), std::runtime_error);
}

TEST(ProcessRunnerTest, FindsExecutablesOnPath) {
    EXPECT_TRUE(ProcessRunner::IsExecutableAvailable("sh"));
    EXPECT_TRUE(ProcessRunner::IsExecutableAvailable("/bin/sh"));
    EXPECT_FALSE(ProcessRunner::IsExecutableAvailable("enclave-no-such-tool"));
    EXPECT_FALSE(ProcessRunner::IsExecutableAvailable(""));
}

} // namespace
