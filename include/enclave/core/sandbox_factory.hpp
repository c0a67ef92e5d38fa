/**
 * @file sandbox_factory.hpp
 * @brief Validation of sandbox configuration and backend construction
 *
 * The factory is the only place where configuration is checked. It fails
 * fast with a configuration-kind SandboxError before any process or network
 * call is made, so configuration mistakes never surface as runtime failures
 * deep inside an agent run.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/sandbox_backend.hpp"
#include "enclave/core/sandbox_config.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace core {

/**
 * @class SandboxFactory
 * @brief Builds a SandboxBackend from configuration
 */
class SandboxFactory {
public:
    /// Reads a host environment variable (injectable for tests)
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Validate the configuration and construct its backend
     *
     * @throws SandboxError(UNSUPPORTED_BACKEND) backend not compiled in
     * @throws SandboxError(INVALID_RESOURCE_LIMIT) bound violated
     * @throws SandboxError(INVALID_CONFIGURATION) variant/credential misuse
     */
    static std::unique_ptr<SandboxBackend> Build(const SandboxConfig& config);

    /**
     * @brief Apply variant defaults and validate, without constructing
     * @return Effective configuration the backend would use
     */
    static SandboxConfig Validate(const SandboxConfig& config,
                                  const EnvLookup& env_lookup = DefaultEnvLookup);

    /**
     * @brief Backends compiled into this build
     */
    static std::vector<BackendKind> SupportedBackends();

    /**
     * @brief Host environment variable names that must never reach a sandbox
     */
    static const std::vector<std::string>& HostCredentialVariables();

    static std::optional<std::string> DefaultEnvLookup(const std::string& name);
};

} // namespace core
} // namespace enclave
