/**
 * @file agent_config.cpp
 * @brief Configuration loading
 *
 * @date 2026
 */

#include "enclave/config/agent_config.hpp"
#include "enclave/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace enclave {
namespace config {

using core::ErrorKind;
using core::SandboxError;

namespace {

std::size_t PositiveCount(const json& j, const char* key, std::size_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION,
                           std::string(key) + " must be a positive integer");
    }
    return value.get<std::size_t>();
}

} // anonymous namespace

AgentConfig AgentConfig::FromJson(const json& j, const core::SandboxFactory::EnvLookup& env_lookup) {
    if (!j.is_object()) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION, "Configuration must be a JSON object");
    }

    AgentConfig config;
    config.max_iterations = PositiveCount(j, "max_iterations", config.max_iterations);
    config.max_observation_tokens = PositiveCount(j, "max_observation_tokens", config.max_observation_tokens);
    config.default_timeout = static_cast<int>(PositiveCount(j, "default_timeout", config.default_timeout));
    if (j.contains("run_timeout") && !j.at("run_timeout").is_null()) {
        config.run_timeout = std::chrono::seconds(PositiveCount(j, "run_timeout", 0));
    }

    try {
        if (j.contains("enabled_tools")) {
            config.enabled_tools = j.at("enabled_tools").get<std::vector<std::string>>();
        }
        if (j.contains("artifact_dir") && !j.at("artifact_dir").is_null()) {
            config.artifact_dir = std::filesystem::path(j.at("artifact_dir").get<std::string>());
        }
        if (j.contains("host")) {
            config.host.tavily_api_key = j.at("host").value("tavily_api_key", std::string());
        }
    }
    catch (const json::exception& e) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION, std::string("Invalid configuration: ") + e.what());
    }

    config.sandbox = core::SandboxConfig::FromJson(j.contains("sandbox") ? j.at("sandbox") : json::object());

    if (config.host.tavily_api_key.empty()) {
        if (auto key = env_lookup("TAVILY_API_KEY")) {
            config.host.tavily_api_key = *key;
        }
    }

    return config;
}

AgentConfig AgentConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION, "Cannot open configuration file: " + path.string());
    }

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION, "Malformed JSON in " + path.string());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return FromJson(j);
}

protocol::ProtocolLimits AgentConfig::Limits() const {
    protocol::ProtocolLimits limits;
    limits.default_timeout = std::chrono::seconds(default_timeout);
    limits.max_observation_tokens = max_observation_tokens;
    return limits;
}

} // namespace config
} // namespace enclave
