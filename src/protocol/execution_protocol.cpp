/**
 * @file execution_protocol.cpp
 * @brief Execution protocol implementation
 *
 * @date 2026
 */

#include "enclave/protocol/execution_protocol.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/workspace.hpp"
#include "enclave/protocol/truncation.hpp"
#include "enclave/utils/hash_utils.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace enclave {
namespace protocol {

using core::ErrorKind;
using core::SandboxError;

ExecutionProtocol::ExecutionProtocol(SandboxSession& session, ProtocolLimits limits)
    : session_(session)
    , limits_(limits) {
    if (limits_.max_timeout < std::chrono::seconds(1)) {
        limits_.max_timeout = std::chrono::seconds(1);
    }
    limits_.default_timeout = std::clamp(limits_.default_timeout, std::chrono::seconds(1),
                                         limits_.max_timeout);
}

template <typename Fn>
auto ExecutionProtocol::Guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    }
    catch (const SandboxError&) {
        throw;
    }
    catch (const std::exception& e) {
        throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED,
                           std::string(operation) + " failed: " + e.what());
    }
}

std::chrono::seconds ExecutionProtocol::ClampTimeout(std::optional<long long> seconds) const {
    if (!seconds.has_value()) {
        return limits_.default_timeout;
    }
    long long clamped = std::clamp<long long>(*seconds, 1, limits_.max_timeout.count());
    return std::chrono::seconds(clamped);
}

std::size_t ExecutionProtocol::CharBudget() const {
    return CharBudgetForTokens(limits_.max_observation_tokens);
}

core::ExecutionResult ExecutionProtocol::Execute(core::ExecutionRequest request,
                                                 const core::CancellationToken& token) {
    request.timeout = ClampTimeout(request.timeout.count());
    if (request.working_dir.empty()) {
        request.working_dir = core::kWorkspaceRoot;
    }

    return Guarded("execute", [&]() {
        core::Sandbox& sandbox = session_.Acquire(token);
        auto result = session_.Backend().Execute(sandbox, request, token);
        TruncateCombined(result, CharBudget());

        spdlog::debug("exit={} duration={}ms truncated={}",
                      result.exit_code, result.duration.count(), result.truncated);
        return result;
    });
}

std::string ExecutionProtocol::ReadFile(const std::string& path,
                                        const core::CancellationToken& token) {
    return Guarded("read file", [&]() {
        // Reject escapes before a sandbox is provisioned for them
        core::ResolveWorkspacePath(path);
        core::Sandbox& sandbox = session_.Acquire(token);
        return session_.Backend().ReadFile(sandbox, path, token);
    });
}

void ExecutionProtocol::WriteFile(const std::string& path, const std::string& content,
                                  const core::CancellationToken& token) {
    Guarded("write file", [&]() {
        core::ResolveWorkspacePath(path);
        core::Sandbox& sandbox = session_.Acquire(token);
        session_.Backend().WriteFile(sandbox, path, content, token);
    });
}

core::ArtifactBundle ExecutionProtocol::DownloadArtifacts(const std::vector<std::string>& extensions,
                                                          const core::CancellationToken& token) {
    return Guarded("download artifacts", [&]() {
        core::Sandbox& sandbox = session_.Acquire(token);
        return session_.Backend().DownloadArtifacts(sandbox, extensions, token);
    });
}

std::vector<std::string> ExecutionProtocol::ListGeneratedFiles(const core::CancellationToken& token) {
    core::ExecutionRequest request;
    request.command = std::string("cd ") + core::kWorkspaceOutput + " && find . -type f | sort";
    request.timeout = std::chrono::seconds(30);

    auto result = Execute(request, token);

    std::vector<std::string> files;
    if (result.exit_code != 0) {
        return files;
    }
    for (const auto& line : utils::StringUtils::SplitLines(result.stdout_output)) {
        std::string entry = utils::StringUtils::Trim(line);
        if (utils::StringUtils::StartsWith(entry, "./")) {
            entry = entry.substr(2);
        }
        if (!entry.empty()) {
            files.push_back(entry);
        }
    }
    return files;
}

std::vector<std::string> ExecutionProtocol::ExportArtifacts(const core::ArtifactBundle& bundle,
                                                            const std::filesystem::path& host_dir) const {
    std::vector<std::string> written;
    if (bundle.files.empty()) {
        return written;
    }

    for (const auto& [key, bytes] : bundle.files) {
        auto target = core::ResolveUnderHostRoot(host_dir, key);

        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED,
                               "Cannot create " + target.parent_path().string() + ": " + ec.message());
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED,
                               "Cannot write artifact " + target.string());
        }

        spdlog::info("✓ Artifact {} ({} bytes, sha256 {})",
                     key, bytes.size(), utils::HashUtils::ComputeSHA256(bytes));
        written.push_back(key);
    }

    return written;
}

} // namespace protocol
} // namespace enclave
