/**
 * @file tool_registry.hpp
 * @brief Named capabilities and their routing to the sandbox or the host
 *
 * **Routing**:
 * ```
 * RunContext::Invoke(name, args)
 *     ↓ Find + InputSchema::Validate
 *     ├─ SANDBOX → handler(args, ExecutionProtocol&, token)
 *     └─ HOST    → handler(args, token)     (owns its credentials)
 * ```
 *
 * Sandbox handlers only see the execution protocol; host handlers never
 * see the protocol. The separation is fixed when the handlers are built.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/cancellation.hpp"
#include "enclave/core/sandbox.hpp"
#include "enclave/protocol/execution_protocol.hpp"
#include "enclave/tools/input_schema.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace enclave {
namespace tools {

enum class ToolLocation {
    SANDBOX,   ///< Runs untrusted work inside the sandbox
    HOST       ///< Runs in this process, may hold credentials
};

const char* ToString(ToolLocation location);

using SandboxHandler = std::function<core::ExecutionResult(const nlohmann::json& args,
                                                           protocol::ExecutionProtocol& protocol,
                                                           const core::CancellationToken& token)>;

using HostHandler = std::function<core::ExecutionResult(const nlohmann::json& args,
                                                        const core::CancellationToken& token)>;

/**
 * @struct ToolDescriptor
 * @brief Registration record of one tool
 */
struct ToolDescriptor {
    std::string name;                                   ///< Unique tool name
    ToolLocation location{ToolLocation::SANDBOX};
    std::string description;                            ///< Shown to the agent
    InputSchema input_schema;
    std::variant<SandboxHandler, HostHandler> handler;

    nlohmann::json ToJson() const;
};

/**
 * @class ToolRegistry
 * @brief Owns tool descriptors; read-only once sealed
 *
 * **Thread Safety**: Register/SetAllowList/Seal are setup-time calls. After
 * Seal() the registry is immutable and may be shared by concurrent runs.
 */
class ToolRegistry {
public:
    /**
     * @throws std::invalid_argument on a duplicate name or a handler that
     *         does not match the location
     * @throws std::logic_error after Seal()
     */
    void Register(ToolDescriptor descriptor);

    /**
     * @brief Restrict visible tools to these names (empty = all)
     * @throws std::invalid_argument for a name that is not registered
     */
    void SetAllowList(const std::vector<std::string>& names);

    void Seal() { sealed_ = true; }
    bool IsSealed() const { return sealed_; }

    /**
     * @brief Registered and allowed tool, or nullptr
     */
    const ToolDescriptor* Find(const std::string& name) const;

    /**
     * @brief Allowed tools in registration order
     */
    std::vector<const ToolDescriptor*> Visible() const;

    /**
     * @brief Human-readable tool list for the agent prompt
     */
    std::string Describe() const;

private:
    bool IsAllowed(const std::string& name) const;

    std::vector<ToolDescriptor> tools_;
    std::map<std::string, std::size_t> index_;
    std::optional<std::set<std::string>> allow_list_;
    bool sealed_{false};
};

} // namespace tools
} // namespace enclave
