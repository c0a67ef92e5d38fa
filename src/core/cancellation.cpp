/**
 * @file cancellation.cpp
 * @brief Implementation of the run-level cancellation token
 *
 * @date 2026
 */

#include "enclave/core/cancellation.hpp"
#include "enclave/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace enclave {
namespace core {

void CancellationToken::Cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            return;
        }
        reason_ = reason;
    }
    cancelled_.store(true);
    spdlog::warn("Run cancelled: {}", reason);
}

void CancellationToken::SetDeadline(Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_ = deadline;
}

bool CancellationToken::IsCancelled() const {
    if (cancelled_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

std::string CancellationToken::Reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) {
        return reason_;
    }
    if (deadline_.has_value() && Clock::now() >= *deadline_) {
        return "deadline exceeded";
    }
    return "";
}

std::optional<CancellationToken::Clock::duration> CancellationToken::Remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!deadline_.has_value()) {
        return std::nullopt;
    }
    auto now = Clock::now();
    if (now >= *deadline_) {
        return Clock::duration::zero();
    }
    return *deadline_ - now;
}

void CancellationToken::ThrowIfCancelled() const {
    if (IsCancelled()) {
        throw SandboxError(ErrorKind::CANCELLED, "Operation cancelled: " + Reason());
    }
}

const CancellationToken& CancellationToken::None() {
    static const CancellationToken never;
    return never;
}

} // namespace core
} // namespace enclave
