/**
 * @file sandbox_session.cpp
 * @brief Single-flight sandbox creation and teardown
 *
 * @date 2026
 */

#include "enclave/protocol/sandbox_session.hpp"
#include "enclave/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace enclave {
namespace protocol {

SandboxSession::SandboxSession(std::unique_ptr<core::SandboxBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("SandboxSession requires a backend");
    }
}

SandboxSession::~SandboxSession() {
    try {
        Teardown(core::CancellationToken::None());
    }
    catch (const std::exception& e) {
        spdlog::error("Sandbox teardown failed: {}", e.what());
    }
}

core::Sandbox& SandboxSession::Acquire(const core::CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        token.ThrowIfCancelled();

        if (creating_) {
            // Wake periodically so a cancelled waiter does not block on a slow create
            creation_done_.wait_for(lock, std::chrono::milliseconds(50));
            continue;
        }

        if (sandbox_.has_value()) {
            if (!core::IsTerminal(sandbox_->State())) {
                return *sandbox_;
            }
            DropTerminalSandbox();
        }

        creating_ = true;
        lock.unlock();

        try {
            core::Sandbox created = backend_->Create(token);
            lock.lock();
            sandbox_ = std::move(created);
            ++created_count_;
            creating_ = false;
            creation_done_.notify_all();
            return *sandbox_;
        }
        catch (...) {
            if (!lock.owns_lock()) {
                lock.lock();
            }
            creating_ = false;
            creation_done_.notify_all();
            throw;
        }
    }
}

void SandboxSession::DropTerminalSandbox() {
    spdlog::warn("⚠ Sandbox {} is {}, provisioning a new one",
                 sandbox_->Name(), core::ToString(sandbox_->State()));

    if (sandbox_->State() != core::SandboxState::DESTROYED) {
        try {
            backend_->Destroy(*sandbox_, core::CancellationToken::None());
        }
        catch (const core::SandboxError& e) {
            spdlog::warn("Could not release sandbox {}: {}", sandbox_->Name(), e.what());
        }
    }
    sandbox_.reset();
}

void SandboxSession::Teardown(const core::CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    creation_done_.wait(lock, [this]() { return !creating_; });

    if (!sandbox_.has_value()) {
        return;
    }

    spdlog::debug("Tearing down sandbox {}", sandbox_->Name());
    backend_->Destroy(*sandbox_, token);
    sandbox_.reset();
}

bool SandboxSession::HasSandbox() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sandbox_.has_value();
}

std::size_t SandboxSession::CreatedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_count_;
}

} // namespace protocol
} // namespace enclave
