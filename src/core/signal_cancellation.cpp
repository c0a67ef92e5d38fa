/**
 * @file signal_cancellation.cpp
 * @brief Signal watcher thread
 *
 * @date 2026
 */

#include "enclave/core/signal_cancellation.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string>

#include <pthread.h>

namespace enclave {
namespace core {

namespace {

// Wake-up interval of the watcher, bounds how long the destructor waits
constexpr long kWatchTickNanos = 100L * 1000L * 1000L;

} // anonymous namespace

SignalCancellation::SignalCancellation(CancellationToken& token, std::initializer_list<int> signals)
    : token_(token) {
    sigemptyset(&signals_);
    for (int signo : signals) {
        if (sigaddset(&signals_, signo) == -1) {
            throw std::runtime_error("Invalid signal number: " + std::to_string(signo));
        }
    }

    int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    if (rc != 0) {
        throw std::runtime_error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }

    watcher_ = std::thread(&SignalCancellation::Watch, this);
}

SignalCancellation::~SignalCancellation() {
    stopping_ = true;
    if (watcher_.joinable()) {
        watcher_.join();
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalCancellation::Watch() {
    timespec tick{0, kWatchTickNanos};

    while (!stopping_) {
        int signo = sigtimedwait(&signals_, nullptr, &tick);
        if (signo < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                spdlog::error("sigtimedwait failed: {}", std::strerror(errno));
                return;
            }
            continue;
        }

        int expected = 0;
        if (received_.compare_exchange_strong(expected, signo)) {
            spdlog::warn("⚠ Received {}, cancelling the run", strsignal(signo));
            token_.Cancel(std::string("interrupted by ") + strsignal(signo));
        } else {
            spdlog::warn("⚠ Received {} again, still shutting down", strsignal(signo));
        }
    }
}

} // namespace core
} // namespace enclave
