/**
 * @file signal_cancellation.hpp
 * @brief Turn SIGINT/SIGTERM into run cancellation
 *
 * The listed signals are blocked in the constructing thread and consumed
 * by a watcher thread with sigtimedwait(). A delivered signal cancels the
 * token instead of killing the process, so the running tool call unwinds
 * and the sandbox is torn down before exit.
 *
 * Construct it in main() before any other thread is started: threads
 * inherit the blocked mask, and a thread that does not block the signal
 * would still receive the default action.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/cancellation.hpp"

#include <atomic>
#include <initializer_list>
#include <thread>

#include <signal.h>

namespace enclave {
namespace core {

class SignalCancellation {
public:
    /**
     * @throws std::runtime_error if the signal mask cannot be changed
     */
    explicit SignalCancellation(CancellationToken& token,
                                std::initializer_list<int> signals = {SIGINT, SIGTERM});

    /// Stops the watcher and restores the previous signal mask
    ~SignalCancellation();

    SignalCancellation(const SignalCancellation&) = delete;
    SignalCancellation& operator=(const SignalCancellation&) = delete;

    /**
     * @brief First signal received, 0 if none
     */
    int ReceivedSignal() const { return received_.load(); }

private:
    void Watch();

    CancellationToken& token_;
    sigset_t signals_;
    sigset_t previous_mask_;
    std::atomic<bool> stopping_{false};
    std::atomic<int> received_{0};
    std::thread watcher_;
};

} // namespace core
} // namespace enclave
