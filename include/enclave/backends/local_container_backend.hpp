/**
 * @file local_container_backend.hpp
 * @brief SandboxBackend on the local Docker CLI
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/sandbox_backend.hpp"
#include "enclave/utils/container_utils.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace enclave {
namespace backends {

/**
 * @class LocalContainerBackend
 * @brief One container per sandbox, driven through `docker` subprocesses
 *
 * - **Isolation**: memory, cpu and pids limits; bridge or no network
 * - **Mounts**: host directories mounted read-write; a mount on
 *   /workspace/output lets artifacts be read straight from the host
 * - **Timeouts**: commands run under an in-container `timeout`; the host
 *   also enforces timeout + grace and kills the in-container process
 *   group on expiry or cancellation
 *
 * **Architecture**:
 * ```
 * enclave (host)
 *     ↓ docker exec (argv, no host shell)
 * Sandbox Container (/bin/bash keep-alive)
 *     └─ timeout -k 2 N /bin/bash -c <command>
 * ```
 *
 * **Thread Safety**: distinct sandboxes may be used from different
 * threads; calls on one sandbox must be serialized by the caller.
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxFactory::Validate(SandboxConfigBuilder()
 *     .WithBackend(BackendKind::LOCAL)
 *     .WithMemoryLimit("1g")
 *     .Build());
 *
 * LocalContainerBackend backend(config);
 * auto sandbox = backend.Create(CancellationToken::None());
 *
 * ExecutionRequest request;
 * request.command = "python3 -c 'print(2+2)'";
 * auto result = backend.Execute(sandbox, request, CancellationToken::None());
 *
 * backend.Destroy(sandbox, CancellationToken::None());
 * @endcode
 */
class LocalContainerBackend : public core::SandboxBackend {
public:
    /**
     * @param config Validated configuration (see SandboxFactory::Validate)
     * @param docker CLI wrapper (injectable for tests)
     */
    explicit LocalContainerBackend(core::SandboxConfig config,
                                   std::shared_ptr<utils::ContainerUtils> docker =
                                       std::make_shared<utils::ContainerUtils>());

    core::BackendKind Kind() const override { return core::BackendKind::LOCAL; }
    core::BackendCapabilities Capabilities() const override;
    const core::SandboxConfig& Config() const override { return config_; }

    core::Sandbox Create(const core::CancellationToken& token) override;

    core::ExecutionResult Execute(core::Sandbox& sandbox,
                                  const core::ExecutionRequest& request,
                                  const core::CancellationToken& token) override;

    std::string ReadFile(core::Sandbox& sandbox,
                         const std::string& path,
                         const core::CancellationToken& token) override;

    void WriteFile(core::Sandbox& sandbox,
                   const std::string& path,
                   const std::string& content,
                   const core::CancellationToken& token) override;

    core::ArtifactBundle DownloadArtifacts(core::Sandbox& sandbox,
                                           const std::vector<std::string>& extensions,
                                           const core::CancellationToken& token) override;

    void Destroy(core::Sandbox& sandbox, const core::CancellationToken& token) override;

    core::SandboxState RefreshState(core::Sandbox& sandbox,
                                    const core::CancellationToken& token) override;

    /**
     * @brief Host directory backing /workspace/output, if one is mounted
     */
    std::optional<std::filesystem::path> HostOutputDirectory() const;

private:
    core::Sandbox CreateOnce(const core::CancellationToken& token);
    utils::ContainerConfig BuildContainerConfig(const std::string& name) const;
    void InitializeWorkspace(const core::Sandbox& sandbox, const core::CancellationToken& token);

    /**
     * @brief Resolve a tool path and re-check it after following symlinks
     */
    std::string ResolveInSandbox(core::Sandbox& sandbox, const std::string& path,
                                 const core::CancellationToken& token);

    /**
     * @brief Kill the process group recorded in pid_file (best effort)
     */
    void KillInSandbox(const core::Sandbox& sandbox, const std::string& pid_file);

    /**
     * @brief Map a failed docker exec to SANDBOX_NOT_READY when the container is gone
     */
    void CheckContainerAlive(core::Sandbox& sandbox, const utils::ProcessResult& result);

    void ThrowIfAborted(const utils::ProcessResult& result, const core::CancellationToken& token) const;

    core::ArtifactBundle CollectFromHost(core::Sandbox& sandbox,
                                         const std::filesystem::path& host_dir,
                                         const std::vector<std::string>& extensions);
    core::ArtifactBundle CollectFromContainer(core::Sandbox& sandbox,
                                              const std::vector<std::string>& extensions,
                                              const core::CancellationToken& token);

    core::SandboxConfig config_;                      ///< Validated configuration
    std::shared_ptr<utils::ContainerUtils> docker_;   ///< CLI wrapper
};

} // namespace backends
} // namespace enclave
