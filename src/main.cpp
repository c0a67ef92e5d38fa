/**
 * @file main.cpp
 * @brief Enclave - Command-line interface
 *
 * Entry point of the enclave sandbox runner. Lists the configured tools,
 * invokes a single tool in a fresh sandbox, or replays a JSON-lines script
 * of tool calls through the agent loop.
 *
 * SIGINT and SIGTERM cancel the run; the sandbox is torn down before exit.
 *
 * **Exit Codes**: 0 success, 1 tool error, 2 configuration error,
 * 128 + signal number when interrupted.
 *
 * @date 2026
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "enclave/agent/agent_loop.hpp"
#include "enclave/agent/run_context.hpp"
#include "enclave/config/agent_config.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/sandbox_factory.hpp"
#include "enclave/core/signal_cancellation.hpp"
#include "enclave/protocol/truncation.hpp"
#include "enclave/tools/host_tools.hpp"
#include "enclave/tools/sandbox_tools.hpp"
#include "enclave/tools/tool_registry.hpp"
#include "enclave/utils/http_transport.hpp"
#include "enclave/utils/logging.hpp"

#include <chrono>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

constexpr int kExitToolError = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitSignalBase = 128;

/*******************************************************************************
 * Setup
 ******************************************************************************/

void BuildRegistry(enclave::tools::ToolRegistry& registry, const enclave::config::AgentConfig& config) {
    enclave::tools::SandboxToolOptions options;
    options.artifact_dir = config.artifact_dir;
    enclave::tools::RegisterSandboxTools(registry, options);

    enclave::tools::RegisterHostTools(registry,
                                      config.host,
                                      std::make_shared<enclave::utils::CurlHttpTransport>(),
                                      enclave::protocol::CharBudgetForTokens(config.max_observation_tokens));

    registry.SetAllowList(config.enabled_tools);
    registry.Seal();
}

void PrintTools(const enclave::tools::ToolRegistry& registry, bool as_json) {
    if (as_json) {
        json tools = json::array();
        for (const auto* tool : registry.Visible()) {
            tools.push_back(tool->ToJson());
        }
        std::cout << tools.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        return;
    }
    std::cout << registry.Describe();
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Enclave - sandboxed tool execution for autonomous agents"};
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* tools_cmd = app.add_subcommand("tools", "List the available tools");
    bool tools_json = false;
    tools_cmd->add_flag("--json", tools_json, "Print tool descriptors as JSON");

    auto* invoke_cmd = app.add_subcommand("invoke", "Run one tool in a fresh sandbox");
    std::string tool_name;
    std::string tool_args = "{}";
    invoke_cmd->add_option("tool", tool_name, "Tool name")->required();
    invoke_cmd->add_option("args", tool_args, "Arguments as a JSON object");

    auto* script_cmd = app.add_subcommand("script", "Replay a JSON-lines file of tool calls");
    std::string script_path;
    script_cmd->add_option("file", script_path, "Script file ({\"tool\":..,\"args\":{..}} per line)")
        ->required()
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    enclave::utils::InitLogging(verbose);

    enclave::config::AgentConfig config;
    enclave::tools::ToolRegistry registry;
    std::unique_ptr<enclave::core::SandboxBackend> backend;

    // Configuration problems are fatal before any tool runs
    try {
        if (!config_path.empty()) {
            config = enclave::config::AgentConfig::LoadFromFile(config_path);
        } else {
            config = enclave::config::AgentConfig::FromJson(json::object());
        }
        BuildRegistry(registry, config);

        if (!tools_cmd->parsed()) {
            backend = enclave::core::SandboxFactory::Build(config.sandbox);
        }
    } catch (const enclave::core::SandboxError& e) {
        spdlog::error("Configuration error ({}): {}", enclave::core::ToString(e.Kind()), e.what());
        return kExitConfigError;
    } catch (const std::invalid_argument& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitConfigError;
    }

    if (tools_cmd->parsed()) {
        PrintTools(registry, tools_json);
        return 0;
    }

    try {
        enclave::agent::RunContext context(registry, std::move(backend), config.Limits());
        enclave::core::SignalCancellation signals(context.Token());
        if (config.run_timeout) {
            context.Token().SetDeadline(std::chrono::steady_clock::now() + *config.run_timeout);
        }

        int exit_code = 0;
        if (invoke_cmd->parsed()) {
            auto result = context.Invoke(tool_name, tool_args);
            context.Finish();

            std::cout << result.ToJson().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            exit_code = result.IsError() ? kExitToolError : 0;
        } else {
            std::ifstream script(script_path);
            auto policy = enclave::agent::ScriptedPolicy::FromJsonLines(script);
            spdlog::info("Replaying {} tool call(s) from {}", policy.Remaining(), script_path);

            enclave::agent::AgentLoop loop(context, config.max_iterations);
            auto outcome = loop.Run(policy);

            std::cout << outcome.ToJson().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            exit_code = outcome.HasToolErrors() ? kExitToolError : 0;
        }

        if (signals.ReceivedSignal() != 0) {
            return kExitSignalBase + signals.ReceivedSignal();
        }
        return exit_code;

    } catch (const enclave::core::SandboxError& e) {
        spdlog::error("[{}] {}", enclave::core::ToString(e.Kind()), e.what());
        return enclave::core::IsConfigurationError(e.Kind()) ? kExitConfigError : kExitToolError;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitToolError;
    }
}
