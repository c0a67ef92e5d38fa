/**
 * @file agent_loop.hpp
 * @brief Bounded driver around an external decision policy
 *
 * The policy decides which tool to call next and when to stop (normally
 * an LLM). AgentLoop only feeds observations back, enforces the iteration
 * bound and the run's cancellation, and tears the sandbox down at the end.
 *
 * **Usage Example**:
 * @code
 * RunContext context(registry, SandboxFactory::Build(config));
 * ScriptedPolicy policy({{"python", {{"code", "print(2+2)"}}}}, "4");
 *
 * AgentLoop loop(context, 20);
 * AgentOutcome outcome = loop.Run(policy);
 * @endcode
 *
 * @date 2026
 */

#pragma once

#include "enclave/agent/run_context.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace agent {

struct ToolCall {
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
};

struct Observation {
    ToolCall call;
    ToolResult result;
};

/**
 * @struct AgentStep
 * @brief Either a tool call or a final answer
 */
struct AgentStep {
    std::optional<ToolCall> call;
    std::optional<std::string> final_answer;
};

class AgentPolicy {
public:
    virtual ~AgentPolicy() = default;

    /**
     * @brief Decide the next step from the observations so far
     */
    virtual AgentStep Next(const std::vector<Observation>& history) = 0;
};

/**
 * @class ScriptedPolicy
 * @brief Replays a fixed list of calls, then answers
 */
class ScriptedPolicy : public AgentPolicy {
public:
    explicit ScriptedPolicy(std::vector<ToolCall> calls,
                            std::optional<std::string> final_answer = std::nullopt);

    /**
     * @brief Read JSON lines: {"tool": "...", "args": {...}} or {"answer": "..."}
     *
     * Blank lines and lines starting with '#' are skipped.
     *
     * @throws SandboxError(INVALID_ARGUMENTS) on a malformed line
     */
    static ScriptedPolicy FromJsonLines(std::istream& input);

    AgentStep Next(const std::vector<Observation>& history) override;

    std::size_t Remaining() const { return calls_.size() - next_; }

private:
    std::vector<ToolCall> calls_;
    std::optional<std::string> final_answer_;
    std::size_t next_{0};
};

/**
 * @struct AgentOutcome
 * @brief Result of one run
 */
struct AgentOutcome {
    std::optional<std::string> answer;        ///< Cleaned final answer
    std::vector<Observation> history;
    std::size_t iterations{0};
    bool hit_iteration_limit{false};
    bool cancelled{false};

    /**
     * @brief True if any observation is a ToolError
     */
    bool HasToolErrors() const;

    nlohmann::json ToJson() const;
};

class AgentLoop {
public:
    AgentLoop(RunContext& context, std::size_t max_iterations = 20);

    AgentOutcome Run(AgentPolicy& policy);

private:
    RunContext& context_;
    std::size_t max_iterations_;
};

} // namespace agent
} // namespace enclave
