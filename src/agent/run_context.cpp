/**
 * @file run_context.cpp
 * @brief Tool invocation boundary
 *
 * @date 2026
 */

#include "enclave/agent/run_context.hpp"
#include "enclave/protocol/truncation.hpp"
#include "enclave/utils/hash_utils.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace enclave {
namespace agent {

using core::ErrorKind;
using core::SandboxError;

namespace {

// Kinds reported as they are; everything else is a handler failure
bool IsReportedDirectly(ErrorKind kind) {
    return kind == ErrorKind::INVALID_ARGUMENTS ||
           kind == ErrorKind::TOOL_NOT_FOUND ||
           kind == ErrorKind::CANCELLED ||
           kind == ErrorKind::TOOL_EXECUTION_FAILED;
}

} // anonymous namespace

json ToolError::ToJson() const {
    json j;
    j["kind"] = core::ToString(kind);
    j["cause"] = cause.has_value() ? json(core::ToString(*cause)) : json(nullptr);
    j["message"] = message;
    return j;
}

bool ToolResult::Succeeded() const {
    return !IsError() && Result().Success();
}

json ToolResult::ToJson() const {
    json j;
    j["tool"] = tool;
    if (IsError()) {
        j["status"] = "error";
        j["error"] = Error().ToJson();
    } else {
        j.update(Result().ToJson());
    }
    return j;
}

RunContext::RunContext(const tools::ToolRegistry& registry,
                       std::unique_ptr<core::SandboxBackend> backend,
                       protocol::ProtocolLimits limits)
    : registry_(registry)
    , run_id_(utils::HashUtils::RandomHex(6))
    , session_(std::move(backend))
    , protocol_(session_, limits) {
    if (!registry_.IsSealed()) {
        spdlog::warn("Run {} started with an unsealed tool registry", run_id_);
    }
}

ToolResult RunContext::Fail(const std::string& tool, ErrorKind kind, const std::string& message,
                            std::optional<ErrorKind> cause) const {
    spdlog::warn("⚠ [{}] {} failed: {} ({})", run_id_, tool, message, core::ToString(kind));
    return ToolResult{tool, ToolError{kind, cause, utils::StringUtils::ToValidUtf8(message)}};
}

ToolResult RunContext::Invoke(const std::string& tool_name, const std::string& arguments_json) {
    auto arguments = json::parse(arguments_json, nullptr, false);
    if (arguments.is_discarded()) {
        return Fail(tool_name, ErrorKind::INVALID_ARGUMENTS, "Arguments are not valid JSON");
    }
    return Invoke(tool_name, arguments);
}

ToolResult RunContext::Invoke(const std::string& tool_name, const json& arguments) {
    const tools::ToolDescriptor* tool = registry_.Find(tool_name);
    if (tool == nullptr) {
        return Fail(tool_name, ErrorKind::TOOL_NOT_FOUND, "Unknown tool: " + tool_name);
    }

    spdlog::debug("[{}] invoking {} ({})", run_id_, tool_name, tools::ToString(tool->location));

    try {
        token_.ThrowIfCancelled();
        json args = tool->input_schema.Validate(arguments);

        core::ExecutionResult result;
        if (const auto* sandbox_handler = std::get_if<tools::SandboxHandler>(&tool->handler)) {
            result = (*sandbox_handler)(args, protocol_, token_);
        } else {
            result = std::get<tools::HostHandler>(tool->handler)(args, token_);
        }

        protocol::TruncateCombined(result, protocol_.CharBudget());
        return ToolResult{tool_name, std::move(result)};
    }
    catch (const SandboxError& e) {
        if (IsReportedDirectly(e.Kind())) {
            return Fail(tool_name, e.Kind(), e.what(), e.Cause());
        }
        return Fail(tool_name, ErrorKind::TOOL_EXECUTION_FAILED, e.what(), e.Kind());
    }
    catch (const std::exception& e) {
        return Fail(tool_name, ErrorKind::TOOL_EXECUTION_FAILED, e.what());
    }
}

void RunContext::Finish() {
    session_.Teardown(core::CancellationToken::None());
    spdlog::debug("Run {} finished", run_id_);
}

} // namespace agent
} // namespace enclave
