/**
 * @file agent_config.hpp
 * @brief JSON configuration of the enclave CLI
 *
 * **File Format**:
 * ```json
 * {
 *   "max_iterations": 20,
 *   "max_observation_tokens": 10000,
 *   "default_timeout": 120,
 *   "run_timeout": 1800,
 *   "enabled_tools": ["shell", "python"],
 *   "artifact_dir": "./artifacts",
 *   "sandbox": { "type": "docker", "memory_limit": "1g", "cpu_limit": 2.0 },
 *   "host": { "tavily_api_key": "..." }
 * }
 * ```
 * Every key is optional. Host credentials fall back to TAVILY_API_KEY;
 * the remote api key falls back to DAYTONA_API_KEY during validation.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/sandbox_config.hpp"
#include "enclave/core/sandbox_factory.hpp"
#include "enclave/protocol/execution_protocol.hpp"
#include "enclave/tools/host_tools.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace config {

struct AgentConfig {
    std::size_t max_iterations{20};
    std::size_t max_observation_tokens{10000};
    int default_timeout{120};                           ///< Seconds
    std::optional<std::chrono::seconds> run_timeout;    ///< Wall-clock limit of a whole run
    std::vector<std::string> enabled_tools;             ///< Empty enables every tool
    std::optional<std::filesystem::path> artifact_dir;  ///< Export target of python artifacts
    core::SandboxConfig sandbox;
    tools::HostCredentials host;

    /**
     * @brief Parse configuration JSON
     * @throws SandboxError(INVALID_CONFIGURATION) on wrong types or values
     * @throws SandboxError(UNSUPPORTED_BACKEND) on an unknown sandbox type
     */
    static AgentConfig FromJson(const nlohmann::json& j,
                                const core::SandboxFactory::EnvLookup& env_lookup =
                                    core::SandboxFactory::DefaultEnvLookup);

    /**
     * @throws SandboxError(INVALID_CONFIGURATION) if the file is missing or malformed
     */
    static AgentConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Timeout and output bounds for the execution protocol
     */
    protocol::ProtocolLimits Limits() const;
};

} // namespace config
} // namespace enclave
