/**
 * @file remote_cloud_backend.cpp
 * @brief REST implementation of the sandbox backend contract
 *
 * **Provisioning**:
 * ```
 * POST /sandbox → poll GET /sandbox/{id} (1s) until "started"
 *               → process/execute mkdir -p /workspace/{input,output,temp,downloads}
 * ```
 * Memory and disk are sent in whole GiB, as the service expects.
 *
 * The service returns stdout and stderr combined in "result"; stderr of
 * the ExecutionResult is only used for the timeout message.
 *
 * @date 2026
 */

#include "enclave/backends/remote_cloud_backend.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/workspace.hpp"
#include "enclave/utils/hash_utils.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

using json = nlohmann::json;

namespace enclave {
namespace backends {

using core::CancellationToken;
using core::ErrorKind;
using core::SandboxError;
using utils::StringUtils;

namespace {

constexpr std::chrono::seconds kExecuteGrace{5};
constexpr int kMaxListingDepth = 16;

std::uint64_t ToWholeGiB(std::uint64_t bytes) {
    return (bytes + core::kGiB - 1) / core::kGiB;
}

[[noreturn]] void ThrowHttpError(const utils::HttpResponse& response, const std::string& what) {
    throw SandboxError(ErrorKind::TRANSPORT,
                       what + " failed with HTTP " + std::to_string(response.status) + ": " +
                       StringUtils::Truncate(StringUtils::Trim(response.body), 200));
}

json ParseBody(const utils::HttpResponse& response, const std::string& what) {
    try {
        return json::parse(response.body);
    }
    catch (const json::parse_error& e) {
        throw SandboxError(ErrorKind::TRANSPORT, "Malformed response to " + what + ": " + e.what());
    }
}

bool SleepUnlessCancelled(std::chrono::milliseconds delay, const CancellationToken& token) {
    auto until = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < until) {
        if (token.IsCancelled()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

} // anonymous namespace

RemoteCloudBackend::RemoteCloudBackend(core::SandboxConfig config,
                                       std::shared_ptr<utils::HttpTransport> http)
    : config_(std::move(config))
    , http_(std::move(http))
    , run_label_(utils::HashUtils::RandomHex(8)) {
    spdlog::debug("Remote backend ready (server: {}, target: {}, run label: {})",
                  config_.remote.server_url, config_.remote.target, run_label_);
}

core::BackendCapabilities RemoteCloudBackend::Capabilities() const {
    core::BackendCapabilities caps;
    caps.supports_volume_mounts = false;
    caps.separate_stderr = false;
    caps.typical_cold_start = std::chrono::milliseconds(3000);
    return caps;
}

std::optional<core::SandboxState> RemoteCloudBackend::MapServiceState(const std::string& state) {
    auto s = StringUtils::ToLower(state);
    if (s == "started") return core::SandboxState::RUNNING;
    if (s == "stopped" || s == "archived") return core::SandboxState::STOPPED;
    if (s == "destroyed") return core::SandboxState::DESTROYED;
    if (s == "error" || s == "build_failed") return core::SandboxState::FAILED;
    return std::nullopt;
}

// ============================================================================
// HTTP PLUMBING
// ============================================================================

utils::HttpRequest RemoteCloudBackend::MakeRequest(const std::string& method,
                                                   const std::string& path,
                                                   const std::string& body,
                                                   const CancellationToken& token,
                                                   std::chrono::milliseconds timeout) const {
    utils::HttpRequest request;
    request.method = method;
    request.url = config_.remote.server_url + path;
    request.headers["Authorization"] = "Bearer " + config_.remote.api_key;
    request.headers["Accept"] = "application/json";
    if (!body.empty()) {
        request.headers["Content-Type"] = "application/json";
    }
    request.body = body;
    request.timeout = timeout;
    request.should_abort = [&token]() { return token.IsCancelled(); };
    return request;
}

utils::HttpResponse RemoteCloudBackend::Call(const std::string& method,
                                             const std::string& path,
                                             const std::string& body,
                                             const CancellationToken& token,
                                             std::chrono::milliseconds timeout,
                                             std::optional<utils::MultipartFile> upload) {
    auto request = MakeRequest(method, path, body, token, timeout);
    request.upload = std::move(upload);

    utils::HttpResponse response;
    try {
        response = http_->Send(request);
    }
    catch (const utils::TransportError& e) {
        throw SandboxError(ErrorKind::TRANSPORT, e.what());
    }

    if (response.aborted) {
        throw SandboxError(ErrorKind::CANCELLED, "Request cancelled: " + token.Reason());
    }
    return response;
}

std::string RemoteCloudBackend::ToolboxPath(const core::Sandbox& sandbox,
                                            const std::string& suffix) const {
    return "/toolbox/" + sandbox.Id() + "/toolbox/" + suffix;
}

// ============================================================================
// CREATION
// ============================================================================

json RemoteCloudBackend::BuildCreateBody(const std::string& name) const {
    json body;
    body["image"] = config_.image;
    body["cpu"] = config_.cpu_limit;
    body["memory"] = ToWholeGiB(config_.memory_limit_bytes);
    body["disk"] = ToWholeGiB(config_.disk_limit_bytes.value_or(10 * core::kGiB));
    body["autoStopInterval"] = config_.auto_stop_interval_minutes.value_or(0);
    body["target"] = config_.remote.target;
    body["env"] = config_.environment;
    body["labels"] = {{"enclave.run", run_label_}, {"enclave.sandbox", name}};
    body["networkBlockAll"] = !config_.network_enabled;
    return body;
}

core::Sandbox RemoteCloudBackend::Create(const CancellationToken& token) {
    spdlog::info("Creating remote sandbox (image: {}, cpu: {}, memory: {}g)",
                 config_.image, config_.cpu_limit, ToWholeGiB(config_.memory_limit_bytes));

    std::string last_error;
    for (int attempt = 1; attempt <= 2; ++attempt) {
        token.ThrowIfCancelled();
        try {
            auto sandbox = CreateOnce(token);
            spdlog::info("✓ Remote sandbox {} started ({})", sandbox.Name(), sandbox.Id());
            return sandbox;
        }
        catch (const SandboxError& e) {
            if (e.Kind() == ErrorKind::CANCELLED) {
                spdlog::warn("Provisioning cancelled, deleting sandboxes labelled {}", run_label_);
                DeleteLabelled();
                throw;
            }
            last_error = e.what();
        }

        if (attempt == 1) {
            spdlog::warn("⚠ Remote sandbox creation failed ({}), retrying in 1s", last_error);
            if (!SleepUnlessCancelled(std::chrono::seconds(1), token)) {
                DeleteLabelled();
                token.ThrowIfCancelled();
            }
        }
    }

    throw SandboxError(ErrorKind::SANDBOX_CREATION_FAILED,
                       "Failed to create remote sandbox: " + last_error);
}

core::Sandbox RemoteCloudBackend::CreateOnce(const CancellationToken& token) {
    core::Sandbox sandbox(config_);
    sandbox.SetName("enclave_" + utils::HashUtils::RandomHex(6));
    sandbox.TransitionTo(core::SandboxState::CREATING);

    try {
        // A reply with the wrong shape fails like any other transport error
        try {
            auto response = Call("POST", "/sandbox", BuildCreateBody(sandbox.Name()).dump(), token,
                                 config_.remote.provision_timeout);
            if (!response.Ok()) {
                ThrowHttpError(response, "POST /sandbox");
            }

            auto body = ParseBody(response, "POST /sandbox");
            std::string id = body.value("id", "");
            if (id.empty()) {
                throw SandboxError(ErrorKind::TRANSPORT, "POST /sandbox returned no id");
            }
            sandbox.SetId(id);

            if (MapServiceState(body.value("state", "")) != core::SandboxState::RUNNING) {
                WaitUntilStarted(sandbox, token);
            }

            json init;
            init["command"] = "/bin/bash -c " + StringUtils::ShellQuote(core::WorkspaceInitCommand());
            init["timeout"] = 30;
            auto init_response = Call("POST", ToolboxPath(sandbox, "process/execute"), init.dump(), token);
            if (!init_response.Ok()) {
                ThrowHttpError(init_response, "workspace initialization");
            }
            auto init_body = ParseBody(init_response, "workspace initialization");
            if (init_body.value("exitCode", -1) != 0) {
                throw SandboxError(ErrorKind::SANDBOX_CREATION_FAILED,
                                   "Workspace initialization failed: " + init_body.value("result", ""));
            }
        }
        catch (const json::exception& e) {
            throw SandboxError(ErrorKind::TRANSPORT,
                               std::string("Malformed response from sandbox service: ") + e.what());
        }
    }
    catch (const SandboxError& e) {
        if (!sandbox.Id().empty() && e.Kind() != ErrorKind::CANCELLED) {
            spdlog::warn("Deleting partially created sandbox {}", sandbox.Id());
            try {
                Call("DELETE", "/sandbox/" + sandbox.Id() + "?force=true", "", CancellationToken::None());
            }
            catch (const SandboxError& cleanup_error) {
                spdlog::warn("Cleanup of {} failed: {}", sandbox.Id(), cleanup_error.what());
            }
        }
        sandbox.TransitionTo(core::SandboxState::FAILED);
        throw;
    }

    sandbox.SetCreatedAt(std::chrono::system_clock::now());
    sandbox.TransitionTo(core::SandboxState::RUNNING);
    return sandbox;
}

void RemoteCloudBackend::WaitUntilStarted(core::Sandbox& sandbox, const CancellationToken& token) {
    auto deadline = std::chrono::steady_clock::now() + config_.remote.provision_timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        if (!SleepUnlessCancelled(std::chrono::seconds(1), token)) {
            token.ThrowIfCancelled();
        }

        auto response = Call("GET", "/sandbox/" + sandbox.Id(), "", token);
        if (!response.Ok()) {
            ThrowHttpError(response, "GET /sandbox/" + sandbox.Id());
        }

        std::string state = ParseBody(response, "GET /sandbox").value("state", "");
        auto mapped = MapServiceState(state);
        if (mapped == core::SandboxState::RUNNING) {
            return;
        }
        if (mapped.has_value()) {
            throw SandboxError(ErrorKind::SANDBOX_CREATION_FAILED,
                               "Sandbox " + sandbox.Id() + " entered state '" + state + "'");
        }
        spdlog::debug("Sandbox {} is {}", sandbox.Id(), state);
    }

    throw SandboxError(ErrorKind::SANDBOX_CREATION_FAILED,
                       "Sandbox " + sandbox.Id() + " did not start within " +
                       std::to_string(config_.remote.provision_timeout.count()) + "s");
}

void RemoteCloudBackend::DeleteLabelled() {
    const auto& none = CancellationToken::None();
    try {
        json labels = {{"enclave.run", run_label_}};
        auto response = Call("GET", "/sandbox?labels=" + StringUtils::UrlEncode(labels.dump()), "", none);
        if (!response.Ok()) {
            spdlog::warn("Could not list labelled sandboxes: HTTP {}", response.status);
            return;
        }

        auto listing = ParseBody(response, "GET /sandbox");
        if (!listing.is_array()) {
            return;
        }
        for (const auto& item : listing) {
            std::string id = item.value("id", "");
            if (id.empty()) {
                continue;
            }
            auto deleted = Call("DELETE", "/sandbox/" + id + "?force=true", "", none);
            if (deleted.Ok() || deleted.status == 404) {
                spdlog::info("✓ Deleted labelled sandbox {}", id);
            } else {
                spdlog::warn("Could not delete sandbox {}: HTTP {}", id, deleted.status);
            }
        }
    }
    catch (const SandboxError& e) {
        spdlog::warn("Labelled sandbox cleanup failed: {}", e.what());
    }
}

// ============================================================================
// STATE
// ============================================================================

core::SandboxState RemoteCloudBackend::RefreshState(core::Sandbox& sandbox,
                                                    const CancellationToken& token) {
    if (core::IsTerminal(sandbox.State()) || sandbox.Id().empty()) {
        return sandbox.State();
    }

    auto response = Call("GET", "/sandbox/" + sandbox.Id(), "", token);
    if (response.status == 404) {
        sandbox.MarkObserved(core::SandboxState::DESTROYED);
        return sandbox.State();
    }
    if (!response.Ok()) {
        ThrowHttpError(response, "GET /sandbox/" + sandbox.Id());
    }

    auto mapped = MapServiceState(ParseBody(response, "GET /sandbox").value("state", ""));
    if (mapped.has_value() && core::IsTerminal(*mapped)) {
        sandbox.MarkObserved(*mapped);
    }
    return sandbox.State();
}

void RemoteCloudBackend::EnsureRunning(core::Sandbox& sandbox, const char* operation,
                                       const CancellationToken& token) {
    sandbox.RequireRunning(operation);
    token.ThrowIfCancelled();
    RefreshState(sandbox, token);
    sandbox.RequireRunning(operation);
}

// ============================================================================
// EXECUTION
// ============================================================================

core::ExecutionResult RemoteCloudBackend::Execute(core::Sandbox& sandbox,
                                                  const core::ExecutionRequest& request,
                                                  const CancellationToken& token) {
    EnsureRunning(sandbox, "execute", token);

    std::string body = request.command;
    if (request.kind == core::ExecutionKind::PYTHON) {
        WriteFile(sandbox, core::kDefaultScriptPath, request.command, token);
        body = core::PythonRunCommand();
    }

    const auto timeout = std::max(request.timeout, std::chrono::seconds(1));

    json payload;
    payload["command"] = "timeout -k 2 " + std::to_string(timeout.count()) + " /bin/bash -c " +
                         StringUtils::ShellQuote(body);
    payload["cwd"] = request.working_dir;
    payload["timeout"] = (timeout + kExecuteGrace).count();
    if (!request.env.empty()) {
        payload["env"] = request.env;
    }

    spdlog::debug("[{}] $ {}", sandbox.Name(), StringUtils::Truncate(request.command, 120));

    auto http_request = MakeRequest("POST", ToolboxPath(sandbox, "process/execute"), payload.dump(),
                                    token, timeout + kExecuteGrace + std::chrono::seconds(10));

    auto start = std::chrono::steady_clock::now();
    utils::HttpResponse response;
    try {
        response = http_->Send(http_request);
    }
    catch (const utils::TransportError& e) {
        if (!e.TimedOut()) {
            throw SandboxError(ErrorKind::TRANSPORT, e.what());
        }
        // The in-sandbox timeout wrapper still bounds the command
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        spdlog::warn("⏱ Command timed out after {}s in {}", timeout.count(), sandbox.Name());
        return core::MakeTimeoutResult(timeout, "", "", elapsed);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (response.aborted) {
        throw SandboxError(ErrorKind::CANCELLED, "Execution cancelled: " + token.Reason());
    }
    if (response.status == 404) {
        RefreshState(sandbox, CancellationToken::None());
        sandbox.RequireRunning("execute");
    }
    if (!response.Ok()) {
        ThrowHttpError(response, "process/execute");
    }

    auto result_body = ParseBody(response, "process/execute");
    int exit_code = result_body.value("exitCode", -1);
    std::string output = result_body.value("result", "");

    if ((exit_code == 124 || exit_code == 137) &&
        elapsed >= std::chrono::duration_cast<std::chrono::milliseconds>(timeout) -
                       std::chrono::milliseconds(200)) {
        spdlog::warn("⏱ Command timed out after {}s in {}", timeout.count(), sandbox.Name());
        return core::MakeTimeoutResult(timeout, std::move(output), "", elapsed);
    }

    core::ExecutionResult result;
    result.exit_code = exit_code;
    result.stdout_output = std::move(output);
    result.duration = elapsed;
    return result;
}

// ============================================================================
// FILE TRANSFER
// ============================================================================

std::string RemoteCloudBackend::ReadFile(core::Sandbox& sandbox,
                                         const std::string& path,
                                         const CancellationToken& token) {
    auto resolved = core::ResolveWorkspacePath(path);
    EnsureRunning(sandbox, "read file", token);

    auto response = Call("GET", ToolboxPath(sandbox, "files/download?path=" + StringUtils::UrlEncode(resolved)),
                         "", token, std::chrono::seconds(120));
    if (response.status == 404) {
        throw SandboxError(ErrorKind::FILE_NOT_FOUND,
                           "File not found: " + core::RelativeToWorkspace(resolved));
    }
    if (!response.Ok()) {
        ThrowHttpError(response, "files/download");
    }
    return response.body;
}

void RemoteCloudBackend::MakeParentDirectory(core::Sandbox& sandbox, const std::string& path,
                                             const CancellationToken& token) {
    auto parent = std::filesystem::path(path).parent_path().generic_string();
    if (parent.empty() || parent == core::kWorkspaceRoot) {
        return;
    }

    json mkdir;
    mkdir["command"] = "mkdir -p " + StringUtils::ShellQuote(parent);
    mkdir["timeout"] = 30;
    auto response = Call("POST", ToolboxPath(sandbox, "process/execute"), mkdir.dump(), token);
    if (!response.Ok()) {
        ThrowHttpError(response, "mkdir " + parent);
    }
}

void RemoteCloudBackend::WriteFile(core::Sandbox& sandbox,
                                   const std::string& path,
                                   const std::string& content,
                                   const CancellationToken& token) {
    auto resolved = core::ResolveWorkspacePath(path);
    EnsureRunning(sandbox, "write file", token);

    MakeParentDirectory(sandbox, resolved, token);

    utils::MultipartFile file;
    file.field_name = "file";
    file.file_name = std::filesystem::path(resolved).filename().string();
    file.content = content;

    auto response = Call("POST", ToolboxPath(sandbox, "files/upload?path=" + StringUtils::UrlEncode(resolved)),
                         "", token, std::chrono::seconds(120), std::move(file));
    if (!response.Ok()) {
        ThrowHttpError(response, "files/upload");
    }

    spdlog::debug("[{}] uploaded {} bytes to {}", sandbox.Name(), content.size(), resolved);
}

// ============================================================================
// ARTIFACTS
// ============================================================================

void RemoteCloudBackend::ListOutputFiles(core::Sandbox& sandbox, const std::string& directory,
                                         int depth, std::vector<std::string>& files,
                                         const CancellationToken& token) {
    if (depth > kMaxListingDepth) {
        spdlog::warn("Artifact listing stopped at depth {} ({})", depth, directory);
        return;
    }

    auto response = Call("GET", ToolboxPath(sandbox, "files?path=" + StringUtils::UrlEncode(directory)),
                         "", token);
    if (response.status == 404) {
        return;
    }
    if (!response.Ok()) {
        ThrowHttpError(response, "files listing");
    }

    auto entries = ParseBody(response, "files listing");
    if (!entries.is_array()) {
        return;
    }

    for (const auto& entry : entries) {
        std::string name = entry.value("name", "");
        if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
            continue;
        }
        std::string child = directory + "/" + name;
        if (entry.value("isDir", false)) {
            ListOutputFiles(sandbox, child, depth + 1, files, token);
        } else {
            files.push_back(child);
        }
    }
}

core::ArtifactBundle RemoteCloudBackend::DownloadArtifacts(core::Sandbox& sandbox,
                                                           const std::vector<std::string>& extensions,
                                                           const CancellationToken& token) {
    EnsureRunning(sandbox, "download artifacts", token);

    auto start = std::chrono::steady_clock::now();

    std::vector<std::string> files;
    ListOutputFiles(sandbox, core::kWorkspaceOutput, 0, files, token);

    core::ArtifactBundle bundle;
    for (const auto& path : files) {
        std::string key = core::RelativeToWorkspace(path);
        if (!core::HasArtifactExtension(key, extensions)) {
            continue;
        }

        auto response = Call("GET", ToolboxPath(sandbox, "files/download?path=" + StringUtils::UrlEncode(path)),
                             "", token, std::chrono::seconds(120));
        if (!response.Ok()) {
            spdlog::warn("Skipping artifact {}: HTTP {}", key, response.status);
            continue;
        }

        auto digest = utils::HashUtils::ComputeSHA256(response.body);
        if (sandbox.ManifestDigest(key) == digest) {
            continue;
        }
        sandbox.RecordManifest(key, digest);
        bundle.files[key] = std::move(response.body);
    }

    bundle.transfer_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!bundle.files.empty()) {
        spdlog::info("✓ Downloaded {} artifact(s) from {} in {} ms",
                     bundle.files.size(), sandbox.Name(), bundle.transfer_time.count());
    }
    return bundle;
}

// ============================================================================
// TEARDOWN
// ============================================================================

void RemoteCloudBackend::Destroy(core::Sandbox& sandbox, const CancellationToken& token) {
    (void)token;  // teardown must run even after cancellation

    if (sandbox.State() == core::SandboxState::DESTROYED || sandbox.Id().empty()) {
        return;
    }

    sandbox.TransitionTo(core::SandboxState::DESTROYING);

    auto response = Call("DELETE", "/sandbox/" + sandbox.Id() + "?force=true", "",
                         CancellationToken::None(), std::chrono::seconds(60));
    if (!response.Ok() && response.status != 404) {
        sandbox.TransitionTo(core::SandboxState::FAILED);
        ThrowHttpError(response, "DELETE /sandbox/" + sandbox.Id());
    }

    if (sandbox.State() == core::SandboxState::DESTROYING) {
        sandbox.TransitionTo(core::SandboxState::DESTROYED);
    }
    spdlog::info("✓ Remote sandbox {} destroyed", sandbox.Id());
}

} // namespace backends
} // namespace enclave
