/**
 * @file process_utils.hpp
 * @brief Child process execution with deadline, abort polling and capture
 *
 * Runs an argument vector directly (no host shell), feeds optional stdin,
 * captures stdout and stderr separately and enforces a deadline. The child
 * is placed in its own process group; on timeout, abort or any exception
 * the whole group is killed with SIGKILL and reaped before Run() returns.
 *
 * **Usage Example**:
 * @code
 * ProcessOptions options;
 * options.timeout = std::chrono::seconds(5);
 * options.should_abort = [&token]() { return token.IsCancelled(); };
 *
 * auto result = ProcessRunner::Run({"docker", "ps", "-q"}, options);
 * if (result.timed_out) {
 *     spdlog::warn("docker ps timed out");
 * }
 * @endcode
 *
 * @date 2026
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace enclave {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief How a child process is run
 */
struct ProcessOptions {
    std::string stdin_data;                           ///< Written to the child's stdin, then closed
    std::chrono::milliseconds timeout{0};             ///< 0 = no deadline
    std::size_t max_output_bytes{0};                  ///< Per-stream tail cap (0 = unlimited)
    std::function<bool()> should_abort;               ///< Polled every tick; true kills the child
    std::chrono::milliseconds poll_interval{50};      ///< Tick length
};

/**
 * @struct ProcessResult
 * @brief Outcome of one child process
 */
struct ProcessResult {
    int exit_code{-1};                                ///< Exit status, 128+N if killed by signal N
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out{false};                            ///< Killed because the deadline passed
    bool aborted{false};                              ///< Killed because should_abort returned true
    bool output_truncated{false};                     ///< A stream exceeded max_output_bytes
    std::chrono::milliseconds duration{0};

    bool Success() const { return exit_code == 0 && !timed_out && !aborted; }
};

/**
 * @class ProcessRunner
 * @brief fork/exec wrapper used for every container runtime call
 */
class ProcessRunner {
public:
    /**
     * @brief Run argv[0] with the given arguments and wait for it
     *
     * @throws std::invalid_argument if argv is empty
     * @throws std::runtime_error if the process cannot be started
     *         (pipe/fork failure or executable not found)
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = {});

    /**
     * @brief True if an executable of that name is found on PATH
     */
    static bool IsExecutableAvailable(const std::string& name);
};

} // namespace utils
} // namespace enclave
