/**
 * @file local_container_backend.cpp
 * @brief Docker CLI implementation of the sandbox backend contract
 *
 * **Execution Wrapper** (per call):
 * ```
 * timeout -k 2 N /bin/bash -c '<command>' & pid=$!
 * echo $pid > /tmp/.enclave_<id>.pid; wait $pid; rc=$?; rm -f <pidfile>; exit $rc
 * ```
 * GNU timeout leads its own process group, so the pid file names the
 * group to kill when the host gives up first (timeout + grace or
 * cancellation).
 *
 * **Timeout Detection**:
 * - Host deadline reached (docker client killed), or
 * - exit code 124/137 and the call ran for at least N seconds
 *
 * @date 2026
 */

#include "enclave/backends/local_container_backend.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/workspace.hpp"
#include "enclave/utils/hash_utils.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <thread>

namespace enclave {
namespace backends {

using core::CancellationToken;
using core::ErrorKind;
using core::SandboxError;
using utils::StringUtils;

namespace {

/// Extra time the host waits for the in-container timeout to fire
constexpr std::chrono::seconds kHostGrace{5};

/// Per-stream capture cap; the protocol truncates further to its budget
constexpr std::size_t kMaxCapturedBytes = 8 * 1024 * 1024;

utils::ProcessOptions AbortableOptions(const CancellationToken& token,
                                       std::chrono::milliseconds timeout) {
    utils::ProcessOptions options;
    options.timeout = timeout;
    options.should_abort = [&token]() { return token.IsCancelled(); };
    return options;
}

utils::ProcessOptions CleanupOptions() {
    utils::ProcessOptions options;
    options.timeout = std::chrono::seconds(60);
    return options;
}

bool WaitOrCancelled(std::chrono::milliseconds delay, const CancellationToken& token) {
    auto until = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < until) {
        if (token.IsCancelled()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return !token.IsCancelled();
}

std::string StripTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // anonymous namespace

LocalContainerBackend::LocalContainerBackend(core::SandboxConfig config,
                                             std::shared_ptr<utils::ContainerUtils> docker)
    : config_(std::move(config))
    , docker_(std::move(docker)) {
    spdlog::debug("Local container backend ready (image: {}, network: {})",
                  config_.image, config_.network_enabled ? "bridge" : "none");
}

core::BackendCapabilities LocalContainerBackend::Capabilities() const {
    core::BackendCapabilities caps;
    caps.supports_volume_mounts = true;
    caps.separate_stderr = true;
    caps.typical_cold_start = std::chrono::milliseconds(2000);
    return caps;
}

// ============================================================================
// CREATION
// ============================================================================

core::Sandbox LocalContainerBackend::Create(const CancellationToken& token) {
    spdlog::info("Creating local sandbox (image: {}, memory: {}, cpus: {})",
                 config_.image, core::FormatByteSize(config_.memory_limit_bytes), config_.cpu_limit);

    std::string last_error;
    for (int attempt = 1; attempt <= 2; ++attempt) {
        token.ThrowIfCancelled();
        try {
            auto sandbox = CreateOnce(token);
            spdlog::info("✓ Sandbox {} running ({})", sandbox.Name(), sandbox.Id().substr(0, 12));
            return sandbox;
        }
        catch (const SandboxError& e) {
            if (e.Kind() == ErrorKind::CANCELLED) {
                throw;
            }
            last_error = e.what();
        }
        catch (const std::exception& e) {
            token.ThrowIfCancelled();
            last_error = e.what();
        }

        if (attempt == 1) {
            spdlog::warn("⚠ Sandbox creation failed ({}), retrying in 1s", last_error);
            if (!WaitOrCancelled(std::chrono::seconds(1), token)) {
                token.ThrowIfCancelled();
            }
        }
    }

    throw SandboxError(ErrorKind::SANDBOX_CREATION_FAILED,
                       "Failed to create local sandbox: " + last_error);
}

core::Sandbox LocalContainerBackend::CreateOnce(const CancellationToken& token) {
    core::Sandbox sandbox(config_);
    sandbox.SetName("enclave_" + utils::HashUtils::RandomHex(6));
    sandbox.TransitionTo(core::SandboxState::CREATING);

    try {
        if (!docker_->ImageExists(config_.image, AbortableOptions(token, std::chrono::seconds(30)))) {
            token.ThrowIfCancelled();
            docker_->PullImage(config_.image, AbortableOptions(token, std::chrono::minutes(10)));
        }
        token.ThrowIfCancelled();

        auto container_id = docker_->CreateContainer(BuildContainerConfig(sandbox.Name()),
                                                     AbortableOptions(token, std::chrono::seconds(60)));
        sandbox.SetId(container_id);
        token.ThrowIfCancelled();

        docker_->StartContainer(container_id, AbortableOptions(token, std::chrono::seconds(60)));
        token.ThrowIfCancelled();

        InitializeWorkspace(sandbox, token);
    }
    catch (...) {
        // Remove by name: covers a container created by an aborted `docker create`
        spdlog::warn("Cleaning up partially created sandbox {}", sandbox.Name());
        try {
            docker_->RemoveContainer(sandbox.Name(), true, CleanupOptions());
        }
        catch (const std::exception& e) {
            spdlog::warn("Cleanup of {} failed: {}", sandbox.Name(), e.what());
        }
        sandbox.TransitionTo(core::SandboxState::FAILED);
        throw;
    }

    sandbox.SetCreatedAt(std::chrono::system_clock::now());
    sandbox.TransitionTo(core::SandboxState::RUNNING);
    return sandbox;
}

utils::ContainerConfig LocalContainerBackend::BuildContainerConfig(const std::string& name) const {
    utils::ContainerConfig container;
    container.name = name;
    container.image = config_.image;
    container.memory_limit_bytes = config_.memory_limit_bytes;
    container.cpu_limit = config_.cpu_limit;
    container.pids_limit = config_.pids_limit;
    container.network_enabled = config_.network_enabled;
    container.mounts = config_.volume_mounts;
    container.environment_vars = config_.environment;
    container.labels["enclave.sandbox"] = name;
    container.working_dir = config_.work_dir;
    container.auto_remove = config_.auto_remove;
    return container;
}

void LocalContainerBackend::InitializeWorkspace(const core::Sandbox& sandbox,
                                                const CancellationToken& token) {
    auto result = docker_->Exec(sandbox.Id(), {"/bin/bash", "-c", core::WorkspaceInitCommand()},
                                AbortableOptions(token, std::chrono::seconds(30)));
    ThrowIfAborted(result, token);
    if (!result.Success()) {
        throw std::runtime_error("Workspace initialization failed: " +
                                 StringUtils::Trim(result.stderr_output));
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

core::ExecutionResult LocalContainerBackend::Execute(core::Sandbox& sandbox,
                                                     const core::ExecutionRequest& request,
                                                     const CancellationToken& token) {
    sandbox.RequireRunning("execute");
    token.ThrowIfCancelled();

    std::string body = request.command;
    if (request.kind == core::ExecutionKind::PYTHON) {
        WriteFile(sandbox, core::kDefaultScriptPath, request.command, token);
        body = core::PythonRunCommand();
    }

    const auto timeout = std::max(request.timeout, std::chrono::seconds(1));
    const std::string pid_file = "/tmp/.enclave_" + utils::HashUtils::RandomHex(4) + ".pid";

    std::string wrapped =
        "timeout -k 2 " + std::to_string(timeout.count()) + " /bin/bash -c " +
        StringUtils::ShellQuote(body) + " & pid=$!; echo $pid > " + pid_file +
        "; wait $pid; rc=$?; rm -f " + pid_file + "; exit $rc";

    auto options = AbortableOptions(token, timeout + kHostGrace);
    options.max_output_bytes = kMaxCapturedBytes;

    spdlog::debug("[{}] $ {}", sandbox.Name(), StringUtils::Truncate(request.command, 120));

    auto process = docker_->Exec(sandbox.Id(), {"/bin/bash", "-c", wrapped}, options,
                                 request.env, request.working_dir);

    if (process.aborted) {
        KillInSandbox(sandbox, pid_file);
        throw SandboxError(ErrorKind::CANCELLED, "Execution cancelled: " + token.Reason());
    }

    const bool in_sandbox_timeout =
        (process.exit_code == 124 || process.exit_code == 137) &&
        process.duration >= std::chrono::duration_cast<std::chrono::milliseconds>(timeout) -
                                 std::chrono::milliseconds(200);

    if (process.timed_out || in_sandbox_timeout) {
        if (process.timed_out) {
            KillInSandbox(sandbox, pid_file);
        }
        spdlog::warn("⏱ Command timed out after {}s in {}", timeout.count(), sandbox.Name());
        return core::MakeTimeoutResult(timeout, std::move(process.stdout_output),
                                       process.stderr_output, process.duration);
    }

    if (process.exit_code != 0) {
        CheckContainerAlive(sandbox, process);
    }

    core::ExecutionResult result;
    result.exit_code = process.exit_code;
    result.stdout_output = std::move(process.stdout_output);
    result.stderr_output = std::move(process.stderr_output);
    result.truncated = process.output_truncated;
    result.duration = process.duration;

    spdlog::debug("[{}] exit {} in {} ms", sandbox.Name(), result.exit_code, result.duration.count());
    return result;
}

void LocalContainerBackend::KillInSandbox(const core::Sandbox& sandbox, const std::string& pid_file) {
    const std::string script =
        "if [ -f " + pid_file + " ]; then kill -KILL -- -$(cat " + pid_file +
        ") 2>/dev/null; rm -f " + pid_file + "; fi";

    utils::ProcessOptions options;
    options.timeout = std::chrono::seconds(10);

    try {
        auto result = docker_->Exec(sandbox.Id(), {"/bin/sh", "-c", script}, options);
        if (!result.Success()) {
            spdlog::warn("Could not kill process group in {}: {}", sandbox.Name(),
                         StringUtils::Trim(result.stderr_output));
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Could not kill process group in {}: {}", sandbox.Name(), e.what());
    }
}

void LocalContainerBackend::CheckContainerAlive(core::Sandbox& sandbox,
                                                const utils::ProcessResult& result) {
    auto lowered = StringUtils::ToLower(result.stderr_output);
    if (!utils::ContainerUtils::IsNoSuchContainer(lowered) &&
        !StringUtils::Contains(lowered, "is not running")) {
        return;
    }

    auto state = RefreshState(sandbox, CancellationToken::None());
    if (state != core::SandboxState::RUNNING) {
        throw SandboxError(ErrorKind::SANDBOX_NOT_READY,
                           "Sandbox '" + sandbox.Name() + "' is " + core::ToString(state));
    }
}

void LocalContainerBackend::ThrowIfAborted(const utils::ProcessResult& result,
                                           const CancellationToken& token) const {
    if (result.aborted) {
        throw SandboxError(ErrorKind::CANCELLED, "Operation cancelled: " + token.Reason());
    }
}

// ============================================================================
// FILE TRANSFER
// ============================================================================

std::string LocalContainerBackend::ResolveInSandbox(core::Sandbox& sandbox,
                                                    const std::string& path,
                                                    const CancellationToken& token) {
    auto resolved = core::ResolveWorkspacePath(path);

    auto result = docker_->Exec(sandbox.Id(), {"readlink", "-m", "--", resolved},
                                AbortableOptions(token, std::chrono::seconds(30)));
    ThrowIfAborted(result, token);

    if (!result.Success()) {
        CheckContainerAlive(sandbox, result);
        return resolved;
    }

    auto real = StringUtils::Trim(result.stdout_output);
    if (real.empty()) {
        return resolved;
    }
    if (!core::IsWithinSandboxDir(real, core::kWorkspaceRoot)) {
        spdlog::warn("Rejected symlink escape: {} -> {}", path, real);
        throw SandboxError(ErrorKind::PATH_ESCAPE,
                           "Path '" + path + "' resolves outside the workspace");
    }
    return real;
}

std::string LocalContainerBackend::ReadFile(core::Sandbox& sandbox,
                                            const std::string& path,
                                            const CancellationToken& token) {
    sandbox.RequireRunning("read file");
    auto resolved = core::ResolveWorkspacePath(path);
    token.ThrowIfCancelled();

    auto real = ResolveInSandbox(sandbox, resolved, token);
    auto result = docker_->Exec(sandbox.Id(), {"cat", "--", real},
                                AbortableOptions(token, std::chrono::seconds(120)));
    ThrowIfAborted(result, token);

    if (!result.Success()) {
        CheckContainerAlive(sandbox, result);
        if (StringUtils::Contains(result.stderr_output, "No such file")) {
            throw SandboxError(ErrorKind::FILE_NOT_FOUND,
                               "File not found: " + core::RelativeToWorkspace(resolved));
        }
        throw std::runtime_error("Failed to read " + resolved + ": " +
                                 StringUtils::Trim(result.stderr_output));
    }

    return result.stdout_output;
}

void LocalContainerBackend::WriteFile(core::Sandbox& sandbox,
                                      const std::string& path,
                                      const std::string& content,
                                      const CancellationToken& token) {
    sandbox.RequireRunning("write file");
    auto resolved = core::ResolveWorkspacePath(path);
    token.ThrowIfCancelled();

    auto real = ResolveInSandbox(sandbox, resolved, token);

    auto options = AbortableOptions(token, std::chrono::seconds(120));
    options.stdin_data = content;

    // Path passed as $1 so it is never re-parsed by the shell
    auto result = docker_->Exec(sandbox.Id(),
                                {"/bin/sh", "-c", "mkdir -p \"$(dirname \"$1\")\" && cat > \"$1\"",
                                 "sh", real},
                                options);
    ThrowIfAborted(result, token);

    if (!result.Success()) {
        CheckContainerAlive(sandbox, result);
        throw std::runtime_error("Failed to write " + resolved + ": " +
                                 StringUtils::Trim(result.stderr_output));
    }

    spdlog::debug("[{}] wrote {} bytes to {}", sandbox.Name(), content.size(), real);
}

// ============================================================================
// ARTIFACTS
// ============================================================================

std::optional<std::filesystem::path> LocalContainerBackend::HostOutputDirectory() const {
    for (const auto& [host_path, sandbox_path] : config_.volume_mounts) {
        auto target = StripTrailingSlash(
            std::filesystem::path(sandbox_path).lexically_normal().generic_string());
        if (target == core::kWorkspaceOutput) {
            return std::filesystem::path(host_path);
        }
        if (target == core::kWorkspaceRoot) {
            return std::filesystem::path(host_path) / "output";
        }
    }
    return std::nullopt;
}

core::ArtifactBundle LocalContainerBackend::DownloadArtifacts(core::Sandbox& sandbox,
                                                              const std::vector<std::string>& extensions,
                                                              const CancellationToken& token) {
    sandbox.RequireRunning("download artifacts");
    token.ThrowIfCancelled();

    auto start = std::chrono::steady_clock::now();

    auto host_dir = HostOutputDirectory();
    core::ArtifactBundle bundle = host_dir.has_value()
        ? CollectFromHost(sandbox, *host_dir, extensions)
        : CollectFromContainer(sandbox, extensions, token);

    bundle.transfer_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!bundle.files.empty()) {
        spdlog::info("✓ Downloaded {} artifact(s) from {} in {} ms",
                     bundle.files.size(), sandbox.Name(), bundle.transfer_time.count());
    }
    return bundle;
}

core::ArtifactBundle LocalContainerBackend::CollectFromHost(core::Sandbox& sandbox,
                                                            const std::filesystem::path& host_dir,
                                                            const std::vector<std::string>& extensions) {
    core::ArtifactBundle bundle;
    if (!std::filesystem::is_directory(host_dir)) {
        return bundle;
    }

    auto iterator = std::filesystem::recursive_directory_iterator(
        host_dir, std::filesystem::directory_options::skip_permission_denied);

    for (const auto& entry : iterator) {
        if (!entry.is_regular_file()) {
            continue;
        }

        std::string key = "output/" + entry.path().lexically_relative(host_dir).generic_string();
        if (!core::HasArtifactExtension(key, extensions)) {
            continue;
        }

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in.is_open()) {
            spdlog::warn("Skipping unreadable artifact {}", entry.path().string());
            continue;
        }
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        auto digest = utils::HashUtils::ComputeSHA256(bytes);
        if (sandbox.ManifestDigest(key) == digest) {
            continue;
        }
        sandbox.RecordManifest(key, digest);
        bundle.files[key] = std::move(bytes);
    }

    return bundle;
}

core::ArtifactBundle LocalContainerBackend::CollectFromContainer(core::Sandbox& sandbox,
                                                                 const std::vector<std::string>& extensions,
                                                                 const CancellationToken& token) {
    core::ArtifactBundle bundle;

    auto listing = docker_->Exec(sandbox.Id(),
                                 {"find", core::kWorkspaceOutput, "-type", "f",
                                  "-exec", "sha256sum", "{}", "+"},
                                 AbortableOptions(token, std::chrono::seconds(120)));
    ThrowIfAborted(listing, token);

    if (!listing.Success()) {
        CheckContainerAlive(sandbox, listing);
        if (StringUtils::Contains(listing.stderr_output, "No such file")) {
            return bundle;
        }
        throw std::runtime_error("Failed to list " + std::string(core::kWorkspaceOutput) + ": " +
                                 StringUtils::Trim(listing.stderr_output));
    }

    // sha256sum lines: "<64 hex>  <path>"; escaped names start with '\'
    for (const auto& line : StringUtils::SplitLines(listing.stdout_output)) {
        if (line.size() < 67 || line.front() == '\\') {
            continue;
        }
        std::string digest = line.substr(0, 64);
        std::string path = line.substr(66);

        if (!core::IsWithinSandboxDir(path, core::kWorkspaceOutput)) {
            continue;
        }
        std::string key = core::RelativeToWorkspace(path);
        if (!core::HasArtifactExtension(key, extensions) || sandbox.ManifestDigest(key) == digest) {
            continue;
        }

        auto file = docker_->Exec(sandbox.Id(), {"cat", "--", path},
                                  AbortableOptions(token, std::chrono::seconds(120)));
        ThrowIfAborted(file, token);
        if (!file.Success()) {
            spdlog::warn("Skipping artifact {}: {}", key, StringUtils::Trim(file.stderr_output));
            continue;
        }

        sandbox.RecordManifest(key, digest);
        bundle.files[key] = std::move(file.stdout_output);
    }

    return bundle;
}

// ============================================================================
// TEARDOWN AND STATE
// ============================================================================

void LocalContainerBackend::Destroy(core::Sandbox& sandbox, const CancellationToken& token) {
    (void)token;  // teardown must run even after cancellation

    if (sandbox.State() == core::SandboxState::DESTROYED ||
        (sandbox.Id().empty() && sandbox.Name().empty())) {
        return;
    }

    sandbox.TransitionTo(core::SandboxState::DESTROYING);

    const std::string& target = sandbox.Id().empty() ? sandbox.Name() : sandbox.Id();
    if (!docker_->RemoveContainer(target, true, CleanupOptions())) {
        sandbox.TransitionTo(core::SandboxState::FAILED);
        throw SandboxError(ErrorKind::TRANSPORT, "Failed to remove container " + sandbox.Name());
    }

    if (sandbox.State() == core::SandboxState::DESTROYING) {
        sandbox.TransitionTo(core::SandboxState::DESTROYED);
    }
    spdlog::info("✓ Sandbox {} destroyed", sandbox.Name());
}

core::SandboxState LocalContainerBackend::RefreshState(core::Sandbox& sandbox,
                                                       const CancellationToken& token) {
    if (core::IsTerminal(sandbox.State()) || sandbox.Id().empty()) {
        return sandbox.State();
    }

    auto observed = docker_->GetContainerState(sandbox.Id(),
                                               AbortableOptions(token, std::chrono::seconds(30)));
    switch (observed) {
        case utils::ContainerState::EXITED:
        case utils::ContainerState::DEAD:
            sandbox.MarkObserved(core::SandboxState::STOPPED);
            break;
        case utils::ContainerState::NOT_FOUND:
        case utils::ContainerState::REMOVING:
            sandbox.MarkObserved(core::SandboxState::DESTROYED);
            break;
        default:
            break;
    }
    return sandbox.State();
}

} // namespace backends
} // namespace enclave
