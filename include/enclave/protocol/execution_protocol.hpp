/**
 * @file execution_protocol.hpp
 * @brief Bounded dispatch of sandbox operations for tool handlers
 *
 * Every sandbox-side tool goes through ExecutionProtocol, never through a
 * backend directly. The protocol:
 * - acquires the run's sandbox lazily (SandboxSession)
 * - clamps timeouts to [1, max_timeout]
 * - tail-truncates output to the observation budget
 * - maps non-taxonomy failures to TOOL_EXECUTION_FAILED
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/cancellation.hpp"
#include "enclave/core/sandbox.hpp"
#include "enclave/protocol/sandbox_session.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace protocol {

/**
 * @struct ProtocolLimits
 * @brief Per-run bounds applied to every call
 */
struct ProtocolLimits {
    std::chrono::seconds default_timeout{120};     ///< Used when a tool gives none
    std::chrono::seconds max_timeout{600};         ///< Upper clamp
    std::size_t max_observation_tokens{10000};     ///< Output budget (x4 characters)
};

class ExecutionProtocol {
public:
    ExecutionProtocol(SandboxSession& session, ProtocolLimits limits = ProtocolLimits());

    /**
     * @brief Run a command in the run's sandbox
     *
     * Timeouts come back as a result with error = TIMEOUT, not as an
     * exception.
     */
    core::ExecutionResult Execute(core::ExecutionRequest request,
                                  const core::CancellationToken& token);

    std::string ReadFile(const std::string& path, const core::CancellationToken& token);

    void WriteFile(const std::string& path, const std::string& content,
                   const core::CancellationToken& token);

    core::ArtifactBundle DownloadArtifacts(const std::vector<std::string>& extensions,
                                           const core::CancellationToken& token);

    /**
     * @brief Paths of regular files under /workspace/output, relative to it
     */
    std::vector<std::string> ListGeneratedFiles(const core::CancellationToken& token);

    /**
     * @brief Write downloaded artifacts below a host directory
     *
     * Keys keep their workspace-relative layout (output/plot.png becomes
     * host_dir/output/plot.png).
     *
     * @return Keys written
     * @throws SandboxError(PATH_ESCAPE) if a key would leave host_dir
     */
    std::vector<std::string> ExportArtifacts(const core::ArtifactBundle& bundle,
                                             const std::filesystem::path& host_dir) const;

    /**
     * @brief Clamp a requested timeout; nullopt selects the default
     */
    std::chrono::seconds ClampTimeout(std::optional<long long> seconds) const;

    std::size_t CharBudget() const;
    const ProtocolLimits& Limits() const { return limits_; }
    SandboxSession& Session() { return session_; }

private:
    template <typename Fn>
    auto Guarded(const char* operation, Fn&& fn) -> decltype(fn());

    SandboxSession& session_;
    ProtocolLimits limits_;
};

} // namespace protocol
} // namespace enclave
