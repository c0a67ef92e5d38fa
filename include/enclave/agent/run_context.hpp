/**
 * @file run_context.hpp
 * @brief Per-run state and the tool invocation boundary
 *
 * One RunContext exists per agent run. It owns the run's cancellation
 * token and its sandbox session (hence at most one sandbox), and borrows
 * the sealed tool registry shared by all runs.
 *
 * **Invocation Flow**:
 * ```
 * Invoke(name, args)
 *     ↓ registry.Find (TOOL_NOT_FOUND)
 *     ↓ InputSchema::Validate (INVALID_ARGUMENTS)
 *     ↓ sandbox or host handler
 *     ↓ TruncateCombined
 * ToolResult (ExecutionResult | ToolError)
 * ```
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/cancellation.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/sandbox.hpp"
#include "enclave/core/sandbox_backend.hpp"
#include "enclave/protocol/execution_protocol.hpp"
#include "enclave/protocol/sandbox_session.hpp"
#include "enclave/tools/tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace enclave {
namespace agent {

/**
 * @struct ToolError
 * @brief Structured failure handed back to the agent
 */
struct ToolError {
    core::ErrorKind kind{core::ErrorKind::TOOL_EXECUTION_FAILED};
    std::optional<core::ErrorKind> cause;   ///< Originating kind of a wrapped failure
    std::string message;

    nlohmann::json ToJson() const;
};

/**
 * @struct ToolResult
 * @brief Outcome of one tool call
 */
struct ToolResult {
    std::string tool;
    std::variant<core::ExecutionResult, ToolError> outcome;

    bool IsError() const { return std::holds_alternative<ToolError>(outcome); }

    /**
     * @brief True for a successful result (exit 0, no timeout)
     */
    bool Succeeded() const;

    const core::ExecutionResult& Result() const { return std::get<core::ExecutionResult>(outcome); }
    const ToolError& Error() const { return std::get<ToolError>(outcome); }

    nlohmann::json ToJson() const;
};

class RunContext {
public:
    /**
     * @param registry Sealed registry (must outlive the context)
     * @param backend Backend the run's sandbox is provisioned with
     * @param limits Timeout and output bounds
     */
    RunContext(const tools::ToolRegistry& registry,
               std::unique_ptr<core::SandboxBackend> backend,
               protocol::ProtocolLimits limits = protocol::ProtocolLimits());

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    /**
     * @brief Run one tool; never throws for tool-level failures
     */
    ToolResult Invoke(const std::string& tool_name, const nlohmann::json& arguments);

    /**
     * @brief Same, with arguments as JSON text (malformed -> INVALID_ARGUMENTS)
     */
    ToolResult Invoke(const std::string& tool_name, const std::string& arguments_json);

    /**
     * @brief Destroy the run's sandbox, if any
     */
    void Finish();

    core::CancellationToken& Token() { return token_; }
    const std::string& RunId() const { return run_id_; }
    const tools::ToolRegistry& Registry() const { return registry_; }
    protocol::SandboxSession& Session() { return session_; }
    protocol::ExecutionProtocol& Protocol() { return protocol_; }

private:
    ToolResult Fail(const std::string& tool, core::ErrorKind kind, const std::string& message,
                    std::optional<core::ErrorKind> cause = std::nullopt) const;

    const tools::ToolRegistry& registry_;
    std::string run_id_;
    core::CancellationToken token_;
    protocol::SandboxSession session_;
    protocol::ExecutionProtocol protocol_;
};

} // namespace agent
} // namespace enclave
