/**
 * @file sandbox_backend.hpp
 * @brief Backend-agnostic contract for isolated execution environments
 *
 * Both backend variants (local container runtime, remote cloud service)
 * implement the same operations, so the execution protocol and the tool
 * registry never depend on which one is active. The variance (mount
 * support, cold-start latency, resource ceilings, file access model) is
 * contained in each implementation.
 *
 * **Usage Example**:
 * @code
 * auto backend = SandboxFactory::Build(config);
 * Sandbox sandbox = backend->Create(CancellationToken::None());
 *
 * ExecutionRequest request;
 * request.command = "echo hello";
 * auto result = backend->Execute(sandbox, request, CancellationToken::None());
 *
 * backend->Destroy(sandbox, CancellationToken::None());
 * @endcode
 *
 * **Thread Safety**: a backend instance may serve several sandboxes from
 * different threads; a single sandbox accepts one call at a time.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/cancellation.hpp"
#include "enclave/core/sandbox.hpp"
#include "enclave/core/sandbox_config.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace enclave {
namespace core {

/**
 * @struct BackendCapabilities
 * @brief Static properties that differ between variants
 */
struct BackendCapabilities {
    bool supports_volume_mounts{false};            ///< Host directories can be mounted
    bool separate_stderr{false};                   ///< stderr is reported separately from stdout
    std::chrono::milliseconds typical_cold_start{0};  ///< Indicative creation latency
};

/**
 * @class SandboxBackend
 * @brief Lifecycle, execution and file transfer for one backend variant
 */
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    virtual BackendKind Kind() const = 0;
    virtual BackendCapabilities Capabilities() const = 0;

    /**
     * @brief Validated configuration this backend provisions with
     */
    virtual const SandboxConfig& Config() const = 0;

    /**
     * @brief Provision a new environment and initialize its workspace
     *
     * Retried once with backoff on failure; partial resources are released
     * before the error is surfaced.
     *
     * @return Sandbox in RUNNING state
     * @throws SandboxError(SANDBOX_CREATION_FAILED) if provisioning fails
     * @throws SandboxError(CANCELLED) if the token fires
     */
    virtual Sandbox Create(const CancellationToken& token) = 0;

    /**
     * @brief Run a command under its timeout
     *
     * A timed-out command is killed inside the sandbox and reported as a
     * result with exit_code = kTimeoutExitCode, truncated = true and
     * error = TIMEOUT. No process started by the call survives it.
     *
     * @throws SandboxError(SANDBOX_NOT_READY) outside RUNNING
     * @throws SandboxError(CANCELLED) if the token fires mid-call
     * @throws SandboxError(TRANSPORT) on backend communication failure
     */
    virtual ExecutionResult Execute(Sandbox& sandbox,
                                    const ExecutionRequest& request,
                                    const CancellationToken& token) = 0;

    /**
     * @brief Read a workspace file
     * @param path Workspace-relative or absolute path inside /workspace
     * @throws SandboxError(PATH_ESCAPE) before any filesystem call
     * @throws SandboxError(FILE_NOT_FOUND) if the file does not exist
     */
    virtual std::string ReadFile(Sandbox& sandbox,
                                 const std::string& path,
                                 const CancellationToken& token) = 0;

    /**
     * @brief Write a workspace file, creating parent directories
     * @throws SandboxError(PATH_ESCAPE) before any filesystem call
     */
    virtual void WriteFile(Sandbox& sandbox,
                           const std::string& path,
                           const std::string& content,
                           const CancellationToken& token) = 0;

    /**
     * @brief Pull new or changed files from /workspace/output
     * @param extensions Extension allow-list (e.g. ".json")
     */
    virtual ArtifactBundle DownloadArtifacts(Sandbox& sandbox,
                                             const std::vector<std::string>& extensions,
                                             const CancellationToken& token) = 0;

    /**
     * @brief Remove the environment (idempotent)
     *
     * Destroying an already destroyed sandbox, or one the service removed
     * on its own, succeeds.
     */
    virtual void Destroy(Sandbox& sandbox, const CancellationToken& token) = 0;

    /**
     * @brief Observe the real state and record unsolicited transitions
     */
    virtual SandboxState RefreshState(Sandbox& sandbox, const CancellationToken& token) = 0;
};

} // namespace core
} // namespace enclave
