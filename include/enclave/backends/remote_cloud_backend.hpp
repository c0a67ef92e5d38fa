/**
 * @file remote_cloud_backend.hpp
 * @brief SandboxBackend on a Daytona-style REST sandbox service
 *
 * **Wire Contract** (bearer authentication):
 * ```
 * POST   /sandbox                                    create
 * GET    /sandbox/{id}                               state
 * GET    /sandbox?labels={json}                      list by label
 * DELETE /sandbox/{id}?force=true                    destroy
 * POST   /toolbox/{id}/toolbox/process/execute       {command,cwd,timeout,env} -> {exitCode,result}
 * GET    /toolbox/{id}/toolbox/files/download?path=  file bytes
 * POST   /toolbox/{id}/toolbox/files/upload?path=    multipart "file"
 * GET    /toolbox/{id}/toolbox/files?path=           [{name,isDir,size,modTime}]
 * ```
 *
 * The service may stop or delete a sandbox on its own (auto-stop). The
 * state is re-read before every operation; an unsolicited stop is recorded
 * on the handle and the operation fails with SANDBOX_NOT_READY.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/sandbox_backend.hpp"
#include "enclave/utils/http_transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace enclave {
namespace backends {

/**
 * @class RemoteCloudBackend
 * @brief Remote provisioning, execution and file transfer over HTTP
 *
 * Cancelling the token while a sandbox is being provisioned aborts the
 * in-flight request and deletes, best effort, every sandbox carrying this
 * backend's run label.
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxFactory::Validate(SandboxConfigBuilder()
 *     .WithBackend(BackendKind::REMOTE)
 *     .WithApiKey(key)
 *     .Build());
 *
 * RemoteCloudBackend backend(config, std::make_shared<utils::CurlHttpTransport>());
 * auto sandbox = backend.Create(token);
 * @endcode
 */
class RemoteCloudBackend : public core::SandboxBackend {
public:
    RemoteCloudBackend(core::SandboxConfig config, std::shared_ptr<utils::HttpTransport> http);

    core::BackendKind Kind() const override { return core::BackendKind::REMOTE; }
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
     * @brief Value of the "enclave.run" label set on every sandbox created here
     */
    const std::string& RunLabel() const { return run_label_; }

    /**
     * @brief Map a service state string ("started", "stopped", ...) to a lifecycle state
     * @return nullopt for transitional states (creating, starting, ...)
     */
    static std::optional<core::SandboxState> MapServiceState(const std::string& state);

private:
    core::Sandbox CreateOnce(const core::CancellationToken& token);
    nlohmann::json BuildCreateBody(const std::string& name) const;
    void WaitUntilStarted(core::Sandbox& sandbox, const core::CancellationToken& token);
    void DeleteLabelled();

    /**
     * @brief Re-read the state and require RUNNING
     */
    void EnsureRunning(core::Sandbox& sandbox, const char* operation,
                       const core::CancellationToken& token);

    /**
     * @brief Send a request; aborts become CANCELLED, I/O failures TRANSPORT
     */
    utils::HttpResponse Call(const std::string& method,
                             const std::string& path,
                             const std::string& body,
                             const core::CancellationToken& token,
                             std::chrono::milliseconds timeout = std::chrono::seconds(30),
                             std::optional<utils::MultipartFile> upload = std::nullopt);

    utils::HttpRequest MakeRequest(const std::string& method,
                                   const std::string& path,
                                   const std::string& body,
                                   const core::CancellationToken& token,
                                   std::chrono::milliseconds timeout) const;

    std::string ToolboxPath(const core::Sandbox& sandbox, const std::string& suffix) const;

    void ListOutputFiles(core::Sandbox& sandbox, const std::string& directory, int depth,
                         std::vector<std::string>& files, const core::CancellationToken& token);

    void MakeParentDirectory(core::Sandbox& sandbox, const std::string& path,
                             const core::CancellationToken& token);

    core::SandboxConfig config_;                    ///< Validated configuration
    std::shared_ptr<utils::HttpTransport> http_;    ///< HTTP client
    std::string run_label_;                         ///< Label for hard-cancel cleanup
};

} // namespace backends
} // namespace enclave
