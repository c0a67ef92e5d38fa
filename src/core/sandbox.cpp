/**
 * @file sandbox.cpp
 * @brief Sandbox lifecycle graph and result serialization
 *
 * @date 2026
 */

#include "enclave/core/sandbox.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace enclave {
namespace core {

const char* ToString(SandboxState state) {
    switch (state) {
        case SandboxState::UNINITIALIZED: return "uninitialized";
        case SandboxState::CREATING:      return "creating";
        case SandboxState::RUNNING:       return "running";
        case SandboxState::STOPPING:      return "stopping";
        case SandboxState::STOPPED:       return "stopped";
        case SandboxState::DESTROYING:    return "destroying";
        case SandboxState::DESTROYED:     return "destroyed";
        case SandboxState::FAILED:        return "failed";
    }
    return "unknown";
}

bool IsTerminal(SandboxState state) {
    return state == SandboxState::STOPPED ||
           state == SandboxState::DESTROYED ||
           state == SandboxState::FAILED;
}

bool IsValidTransition(SandboxState from, SandboxState to) {
    switch (from) {
        case SandboxState::UNINITIALIZED:
            return to == SandboxState::CREATING;
        case SandboxState::CREATING:
            return to == SandboxState::RUNNING || to == SandboxState::FAILED;
        case SandboxState::RUNNING:
            return to == SandboxState::STOPPING ||
                   to == SandboxState::DESTROYING ||
                   to == SandboxState::FAILED;
        case SandboxState::STOPPING:
            return to == SandboxState::STOPPED || to == SandboxState::FAILED;
        case SandboxState::DESTROYING:
            return to == SandboxState::DESTROYED || to == SandboxState::FAILED;
        case SandboxState::STOPPED:
        case SandboxState::DESTROYED:
        case SandboxState::FAILED:
            return false;
    }
    return false;
}

bool Sandbox::TransitionTo(SandboxState next) {
    if (!IsValidTransition(state_, next)) {
        spdlog::debug("Ignoring invalid sandbox transition {} -> {} ({})",
                      ToString(state_), ToString(next), name_);
        return false;
    }
    spdlog::debug("Sandbox {}: {} -> {}", name_, ToString(state_), ToString(next));
    state_ = next;
    return true;
}

void Sandbox::MarkObserved(SandboxState observed) {
    if (state_ == observed || IsTerminal(state_)) {
        return;
    }
    if (IsTerminal(observed)) {
        spdlog::warn("Sandbox {} observed in state '{}' (was '{}')",
                     name_, ToString(observed), ToString(state_));
        state_ = observed;
    }
}

void Sandbox::RequireRunning(const char* operation) const {
    if (state_ != SandboxState::RUNNING) {
        throw SandboxError(ErrorKind::SANDBOX_NOT_READY,
                           std::string("Cannot ") + operation + ": sandbox '" + name_ +
                           "' is " + ToString(state_));
    }
}

std::string Sandbox::ManifestDigest(const std::string& relative_path) const {
    auto it = artifact_manifest_.find(relative_path);
    return it == artifact_manifest_.end() ? std::string() : it->second;
}

void Sandbox::RecordManifest(const std::string& relative_path, const std::string& digest) {
    artifact_manifest_[relative_path] = digest;
}

json ExecutionResult::ToJson() const {
    json j;
    j["status"] = Success() ? "success" : "error";
    j["exit_code"] = exit_code;
    j["stdout"] = stdout_output;
    j["stderr"] = stderr_output;
    j["truncated"] = truncated;
    j["duration_ms"] = duration.count();
    if (error.has_value()) {
        j["error_kind"] = ToString(*error);
    }
    if (!artifacts.empty()) {
        j["artifacts"] = artifacts;
    }
    return j;
}

ExecutionResult MakeTimeoutResult(std::chrono::seconds timeout,
                                  std::string partial_stdout,
                                  const std::string& partial_stderr,
                                  std::chrono::milliseconds duration) {
    ExecutionResult result;
    result.exit_code = kTimeoutExitCode;
    result.stdout_output = std::move(partial_stdout);
    result.stderr_output = "Command timed out after " + std::to_string(timeout.count()) + " seconds";
    if (!partial_stderr.empty()) {
        result.stderr_output += "\n" + partial_stderr;
    }
    result.truncated = true;
    result.duration = duration;
    result.error = ErrorKind::TIMEOUT;
    return result;
}

} // namespace core
} // namespace enclave
