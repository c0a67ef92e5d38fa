/**
 * @file sandbox_session.hpp
 * @brief Lazily created sandbox shared by the tool calls of one run
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/cancellation.hpp"
#include "enclave/core/sandbox_backend.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace enclave {
namespace protocol {

/**
 * @class SandboxSession
 * @brief Owns the backend and at most one sandbox for a run
 *
 * The sandbox is created on the first Acquire(). Concurrent callers that
 * arrive while creation is in progress wait for it instead of creating a
 * second one. A sandbox found in a terminal state (auto-stopped, removed
 * by the service) is dropped and the next Acquire() provisions a fresh
 * one.
 *
 * **Usage Example**:
 * @code
 * SandboxSession session(SandboxFactory::Build(config));
 * core::Sandbox& sandbox = session.Acquire(token);
 * session.Backend().Execute(sandbox, request, token);
 * session.Teardown(token);
 * @endcode
 */
class SandboxSession {
public:
    explicit SandboxSession(std::unique_ptr<core::SandboxBackend> backend);

    /**
     * @brief Destroys the sandbox if one is still alive
     */
    ~SandboxSession();

    SandboxSession(const SandboxSession&) = delete;
    SandboxSession& operator=(const SandboxSession&) = delete;

    /**
     * @brief Return the run's sandbox, creating it if needed
     * @throws SandboxError(SANDBOX_CREATION_FAILED) or (CANCELLED)
     */
    core::Sandbox& Acquire(const core::CancellationToken& token);

    /**
     * @brief Destroy the sandbox (no-op if none exists)
     */
    void Teardown(const core::CancellationToken& token);

    bool HasSandbox() const;

    /**
     * @brief Number of sandboxes provisioned by this session so far
     */
    std::size_t CreatedCount() const;

    core::SandboxBackend& Backend() { return *backend_; }

private:
    void DropTerminalSandbox();

    std::unique_ptr<core::SandboxBackend> backend_;
    mutable std::mutex mutex_;
    std::condition_variable creation_done_;
    std::optional<core::Sandbox> sandbox_;
    bool creating_{false};
    std::size_t created_count_{0};
};

} // namespace protocol
} // namespace enclave
