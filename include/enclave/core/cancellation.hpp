/**
 * @file cancellation.hpp
 * @brief Run-level cancellation signal with optional deadline
 *
 * A CancellationToken is shared by everything executing on behalf of one
 * agent run. Long-running backend calls poll it (process runner ticks,
 * libcurl progress callback) and terminate early once it fires.
 *
 * **Thread Safety**: Cancel() and IsCancelled() may be called concurrently.
 *
 * @date 2026
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace enclave {
namespace core {

class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Request cancellation
     * @param reason Human-readable reason reported in errors
     */
    void Cancel(const std::string& reason = "cancelled");

    /**
     * @brief Arm a deadline; the token reports cancelled once it passes
     */
    void SetDeadline(Clock::time_point deadline);

    /**
     * @brief True once Cancel() was called or the deadline passed
     */
    bool IsCancelled() const;

    /**
     * @brief Reason of cancellation ("deadline exceeded" for deadlines)
     */
    std::string Reason() const;

    /**
     * @brief Time left before the deadline, if one is armed
     */
    std::optional<Clock::duration> Remaining() const;

    /**
     * @brief Throw SandboxError(CANCELLED) if cancelled
     */
    void ThrowIfCancelled() const;

    /**
     * @brief Token that never fires, for callers without a run context
     */
    static const CancellationToken& None();

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::string reason_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace core
} // namespace enclave
