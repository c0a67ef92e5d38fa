/**
 * @file sandbox.hpp
 * @brief Sandbox handle, lifecycle states and execution request/result types
 *
 * Lifecycle (terminal states are absorbing):
 * ```
 * UNINITIALIZED → CREATING → RUNNING ─┬→ STOPPING → STOPPED
 *                     │               ├→ DESTROYING → DESTROYED
 *                     └→ FAILED       └→ FAILED
 * ```
 * RUNNING is the only state in which commands or file transfers are
 * accepted. Remote sandboxes may move to STOPPED or DESTROYED on their own
 * (service-side auto-stop); backends observe that lazily on next use.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/errors.hpp"
#include "enclave/core/sandbox_config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace core {

/**
 * @enum SandboxState
 * @brief Lifecycle state of one isolated environment
 */
enum class SandboxState {
    UNINITIALIZED,  ///< Handle exists, nothing provisioned
    CREATING,       ///< Provisioning in progress
    RUNNING,        ///< Ready for execution and file transfer
    STOPPING,       ///< Being stopped
    STOPPED,        ///< Stopped (terminal)
    DESTROYING,     ///< Being removed
    DESTROYED,      ///< Removed (terminal)
    FAILED          ///< Provisioning or runtime failure (terminal)
};

const char* ToString(SandboxState state);

/**
 * @brief True for STOPPED, DESTROYED and FAILED
 */
bool IsTerminal(SandboxState state);

/**
 * @brief True if the lifecycle graph allows moving from one state to another
 */
bool IsValidTransition(SandboxState from, SandboxState to);

/// Exit code reported for commands killed by their timeout
constexpr int kTimeoutExitCode = -1;

/**
 * @enum ExecutionKind
 * @brief How the command body is interpreted
 */
enum class ExecutionKind {
    SHELL,   ///< Shell line run by /bin/bash -c
    PYTHON   ///< Python program body
};

/**
 * @struct ExecutionRequest
 * @brief One command to run inside a sandbox
 */
struct ExecutionRequest {
    std::string command;                          ///< Shell line or code body
    ExecutionKind kind{ExecutionKind::SHELL};
    std::chrono::seconds timeout{120};            ///< Per-call timeout
    std::string working_dir{"/workspace"};        ///< Working directory inside the sandbox
    std::map<std::string, std::string> env;       ///< Extra per-call environment
};

/**
 * @struct ExecutionResult
 * @brief Normalized outcome of a sandbox command
 */
struct ExecutionResult {
    int exit_code{0};                             ///< Process exit code (kTimeoutExitCode on timeout)
    std::string stdout_output;                    ///< Standard output (tail-truncated)
    std::string stderr_output;                    ///< Standard error (tail-truncated)
    bool truncated{false};                        ///< Output was cut or the command timed out
    std::chrono::milliseconds duration{0};        ///< Wall-clock execution time
    std::optional<ErrorKind> error;               ///< TIMEOUT for timed-out commands
    std::vector<std::string> artifacts;           ///< Workspace-relative artifacts exported to the host

    bool Success() const { return exit_code == 0 && !error.has_value(); }
    bool TimedOut() const { return error == ErrorKind::TIMEOUT; }

    nlohmann::json ToJson() const;
};

/**
 * @brief Result reported for a command killed by its timeout
 *
 * stderr starts with "Command timed out after N seconds", followed by any
 * partial stderr the command produced.
 */
ExecutionResult MakeTimeoutResult(std::chrono::seconds timeout,
                                  std::string partial_stdout,
                                  const std::string& partial_stderr,
                                  std::chrono::milliseconds duration);

/**
 * @struct ArtifactBundle
 * @brief Files pulled out of the sandbox output area
 */
struct ArtifactBundle {
    std::map<std::string, std::string> files;     ///< Workspace-relative path -> bytes
    std::chrono::milliseconds transfer_time{0};   ///< Transfer time, separate from execution
};

/**
 * @class Sandbox
 * @brief Handle of one isolated environment
 *
 * Created and mutated only by a SandboxBackend. The handle is a plain value
 * owned by the run's SandboxSession.
 */
class Sandbox {
public:
    Sandbox() = default;
    explicit Sandbox(SandboxConfig config) : config_(std::move(config)) {}

    const std::string& Id() const { return id_; }
    const std::string& Name() const { return name_; }
    SandboxState State() const { return state_; }
    const SandboxConfig& Config() const { return config_; }
    const std::string& WorkspaceRoot() const { return workspace_root_; }
    std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }

    void SetId(const std::string& id) { id_ = id; }
    void SetName(const std::string& name) { name_ = name; }
    void SetCreatedAt(std::chrono::system_clock::time_point t) { created_at_ = t; }

    /**
     * @brief Move to a new state if the lifecycle graph allows it
     * @return false (and state unchanged) for an invalid transition
     */
    bool TransitionTo(SandboxState next);

    /**
     * @brief Force a terminal state observed from the outside (auto-stop)
     */
    void MarkObserved(SandboxState observed);

    /**
     * @brief Throw SANDBOX_NOT_READY unless the sandbox is RUNNING
     */
    void RequireRunning(const char* operation) const;

    /**
     * @brief Digest of an artifact as last downloaded (empty if never)
     */
    std::string ManifestDigest(const std::string& relative_path) const;
    void RecordManifest(const std::string& relative_path, const std::string& digest);

private:
    std::string id_;
    std::string name_;
    SandboxState state_{SandboxState::UNINITIALIZED};
    SandboxConfig config_;
    std::string workspace_root_{"/workspace"};
    std::chrono::system_clock::time_point created_at_{};
    std::map<std::string, std::string> artifact_manifest_;
};

} // namespace core
} // namespace enclave
