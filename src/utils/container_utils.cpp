/**
 * @file container_utils.cpp
 * @brief Docker CLI wrapper implementation
 *
 * **Container Lifecycle**:
 * ```
 * create → start → exec ... → rm --force
 * ```
 *
 * Arguments are passed as a vector to ProcessRunner; nothing is quoted for
 * or parsed by a host shell.
 *
 * @date 2026
 */

#include "enclave/utils/container_utils.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

namespace enclave {
namespace utils {

namespace {

std::string FirstLine(const std::string& text) {
    auto trimmed = StringUtils::Trim(text);
    auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

ProcessOptions WithDefaultTimeout(const ProcessOptions& options, std::chrono::milliseconds timeout) {
    ProcessOptions copy = options;
    if (copy.timeout.count() == 0) {
        copy.timeout = timeout;
    }
    return copy;
}

} // anonymous namespace

ContainerUtils::ContainerUtils(std::string binary)
    : binary_(std::move(binary)) {
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable() const {
    if (!ProcessRunner::IsExecutableAvailable(binary_)) {
        spdlog::debug("{} CLI not found on PATH", binary_);
        return false;
    }

    try {
        ProcessOptions options;
        options.timeout = std::chrono::seconds(10);
        auto result = ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"}, options);
        return result.Success();
    }
    catch (const std::exception& e) {
        spdlog::debug("Container runtime check failed: {}", e.what());
        return false;
    }
}

std::string ContainerUtils::GetRuntimeVersion() const {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(10);
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"}, options);
    if (result.Success()) {
        return StringUtils::Trim(result.stdout_output);
    }
    return "unknown";
}

// ============================================================================
// IMAGES
// ============================================================================

bool ContainerUtils::ImageExists(const std::string& image, const ProcessOptions& options) const {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image},
                                       WithDefaultTimeout(options, std::chrono::seconds(30)));
    return result.Success();
}

void ContainerUtils::PullImage(const std::string& image, const ProcessOptions& options) const {
    spdlog::info("Pulling image {} ...", image);

    auto result = ExecuteDockerCommand({"pull", "--quiet", image}, options);
    if (!result.Success()) {
        throw std::runtime_error("docker pull " + image + " failed: " +
                                 FirstLine(result.stderr_output));
    }

    spdlog::info("✓ Image pulled: {}", image);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config,
                                            const ProcessOptions& options) const {
    spdlog::debug("Creating container: {}", config.name);

    auto result = ExecuteDockerCommand(BuildCreateCommand(config),
                                       WithDefaultTimeout(options, std::chrono::seconds(60)));
    if (!result.Success()) {
        throw std::runtime_error("docker create failed: " + FirstLine(result.stderr_output));
    }

    std::string container_id = StringUtils::Trim(result.stdout_output);
    if (container_id.empty()) {
        throw std::runtime_error("docker create returned no container id");
    }
    return container_id;
}

void ContainerUtils::StartContainer(const std::string& container_id,
                                    const ProcessOptions& options) const {
    auto result = ExecuteDockerCommand({"start", container_id},
                                       WithDefaultTimeout(options, std::chrono::seconds(60)));
    if (!result.Success()) {
        throw std::runtime_error("docker start failed: " + FirstLine(result.stderr_output));
    }
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force,
                                     const ProcessOptions& options) const {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args, WithDefaultTimeout(options, std::chrono::seconds(60)));
    if (result.Success() || IsNoSuchContainer(result.stderr_output)) {
        return true;
    }

    spdlog::error("Failed to remove container {}: {}", container_id,
                  FirstLine(result.stderr_output));
    return false;
}

ContainerState ContainerUtils::GetContainerState(const std::string& container_id,
                                                 const ProcessOptions& options) const {
    auto result = ExecuteDockerCommand({"inspect", "--format", "{{.State.Status}}", container_id},
                                       WithDefaultTimeout(options, std::chrono::seconds(30)));
    if (result.Success()) {
        return ParseState(StringUtils::Trim(result.stdout_output));
    }
    if (IsNoSuchContainer(result.stderr_output)) {
        return ContainerState::NOT_FOUND;
    }
    return ContainerState::UNKNOWN;
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

ProcessResult ContainerUtils::Exec(const std::string& container_id,
                                   const std::vector<std::string>& command,
                                   const ProcessOptions& options,
                                   const std::map<std::string, std::string>& env,
                                   const std::string& working_dir) const {
    std::vector<std::string> args = {"exec"};

    if (!options.stdin_data.empty()) {
        args.push_back("-i");
    }
    if (!working_dir.empty()) {
        args.push_back("-w");
        args.push_back(working_dir);
    }
    for (const auto& [key, value] : env) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    args.push_back(container_id);
    args.insert(args.end(), command.begin(), command.end());

    return ExecuteDockerCommand(args, options);
}

ProcessResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                   const ProcessOptions& options) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {} {}", binary_,
                  StringUtils::Truncate(StringUtils::Join(args, " "), 200));

    return ProcessRunner::Run(argv, options);
}

// ============================================================================
// HELPERS
// ============================================================================

std::vector<std::string> ContainerUtils::BuildCreateCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Memory limit
    if (config.memory_limit_bytes > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_bytes));
    }

    // CPU limit
    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(config.cpu_limit));
    }

    // Process limit
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    args.push_back("--network");
    args.push_back(config.network_enabled ? "bridge" : "none");

    // Volume mounts
    for (const auto& [host_path, container_path] : config.mounts) {
        args.push_back("-v");
        args.push_back(host_path + ":" + container_path + ":rw");
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    if (config.auto_remove) {
        args.push_back("--rm");
    }

    // Keep /bin/bash alive between exec calls
    args.push_back("--tty");
    args.push_back("--interactive");

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "removing") return ContainerState::REMOVING;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

bool ContainerUtils::IsNoSuchContainer(const std::string& output) {
    auto lowered = StringUtils::ToLower(output);
    return StringUtils::Contains(lowered, "no such container") ||
           StringUtils::Contains(lowered, "no such object");
}

} // namespace utils
} // namespace enclave
