/**
 * @file agent_loop.cpp
 * @brief Agent loop and scripted policy
 *
 * @date 2026
 */

#include "enclave/agent/agent_loop.hpp"
#include "enclave/agent/answer_cleaning.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace enclave {
namespace agent {

using core::ErrorKind;
using core::SandboxError;

// ============================================================================
// SCRIPTED POLICY
// ============================================================================

ScriptedPolicy::ScriptedPolicy(std::vector<ToolCall> calls, std::optional<std::string> final_answer)
    : calls_(std::move(calls))
    , final_answer_(std::move(final_answer)) {
}

ScriptedPolicy ScriptedPolicy::FromJsonLines(std::istream& input) {
    std::vector<ToolCall> calls;
    std::optional<std::string> answer;

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        auto trimmed = utils::StringUtils::Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        auto entry = json::parse(trimmed, nullptr, false);
        if (entry.is_discarded() || !entry.is_object()) {
            throw SandboxError(ErrorKind::INVALID_ARGUMENTS,
                               "Script line " + std::to_string(line_number) + " is not a JSON object");
        }

        if (entry.contains("answer")) {
            answer = entry["answer"].is_string() ? entry["answer"].get<std::string>() : entry["answer"].dump();
            continue;
        }

        if (!entry.contains("tool") || !entry["tool"].is_string()) {
            throw SandboxError(ErrorKind::INVALID_ARGUMENTS,
                               "Script line " + std::to_string(line_number) + " has no \"tool\"");
        }

        ToolCall call;
        call.tool = entry["tool"].get<std::string>();
        call.arguments = entry.contains("args") ? entry["args"] : json::object();
        calls.push_back(std::move(call));
    }

    return ScriptedPolicy(std::move(calls), std::move(answer));
}

AgentStep ScriptedPolicy::Next(const std::vector<Observation>& history) {
    (void)history;

    AgentStep step;
    if (next_ < calls_.size()) {
        step.call = calls_[next_++];
    } else {
        step.final_answer = final_answer_.value_or("");
    }
    return step;
}

// ============================================================================
// OUTCOME
// ============================================================================

bool AgentOutcome::HasToolErrors() const {
    for (const auto& observation : history) {
        if (observation.result.IsError()) {
            return true;
        }
    }
    return false;
}

json AgentOutcome::ToJson() const {
    json steps = json::array();
    for (const auto& observation : history) {
        steps.push_back({
            {"tool", observation.call.tool},
            {"arguments", observation.call.arguments},
            {"result", observation.result.ToJson()}
        });
    }

    return {
        {"answer", answer.has_value() ? json(*answer) : json(nullptr)},
        {"iterations", iterations},
        {"hit_iteration_limit", hit_iteration_limit},
        {"cancelled", cancelled},
        {"steps", steps}
    };
}

// ============================================================================
// LOOP
// ============================================================================

AgentLoop::AgentLoop(RunContext& context, std::size_t max_iterations)
    : context_(context)
    , max_iterations_(max_iterations) {
}

AgentOutcome AgentLoop::Run(AgentPolicy& policy) {
    AgentOutcome outcome;

    spdlog::info("Run {} started (max {} iterations)", context_.RunId(), max_iterations_);

    while (true) {
        if (context_.Token().IsCancelled()) {
            spdlog::warn("⚠ Run {} cancelled: {}", context_.RunId(), context_.Token().Reason());
            outcome.cancelled = true;
            break;
        }
        if (outcome.iterations >= max_iterations_) {
            spdlog::warn("⚠ Run {} reached the iteration limit ({})", context_.RunId(), max_iterations_);
            outcome.hit_iteration_limit = true;
            break;
        }

        AgentStep step = policy.Next(outcome.history);
        if (step.final_answer.has_value() || !step.call.has_value()) {
            outcome.answer = CleanAnswer(step.final_answer.value_or(""));
            break;
        }

        ++outcome.iterations;
        auto start = std::chrono::steady_clock::now();
        ToolResult result = context_.Invoke(step.call->tool, step.call->arguments);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (result.IsError()) {
            spdlog::info("[{}/{}] {} -> {} ({} ms)", outcome.iterations, max_iterations_,
                         step.call->tool, core::ToString(result.Error().kind), elapsed.count());
        } else {
            spdlog::info("[{}/{}] {} -> exit {} ({} ms)", outcome.iterations, max_iterations_,
                         step.call->tool, result.Result().exit_code, elapsed.count());
        }

        outcome.history.push_back(Observation{*step.call, std::move(result)});
    }

    context_.Finish();

    spdlog::info("✓ Run {} done after {} tool call(s)", context_.RunId(), outcome.iterations);
    return outcome;
}

} // namespace agent
} // namespace enclave
