/**
 * @file errors.hpp
 * @brief Error taxonomy shared by backends, the execution protocol and tools
 *
 * Every failure raised inside the subsystem is a SandboxError carrying an
 * ErrorKind. Configuration-time kinds abort a run before any tool call;
 * runtime kinds are shaped into structured tool errors for the agent.
 *
 * @date 2026
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace enclave {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of subsystem failures
 */
enum class ErrorKind {
    INVALID_RESOURCE_LIMIT,   ///< Resource bound violated (configuration)
    UNSUPPORTED_BACKEND,      ///< Unknown or not compiled-in backend (configuration)
    INVALID_CONFIGURATION,    ///< Variant field misuse, missing image/key (configuration)
    SANDBOX_CREATION_FAILED,  ///< Provisioning failed after retry
    SANDBOX_NOT_READY,        ///< Operation attempted outside Running state
    TIMEOUT,                  ///< Command exceeded its timeout
    PATH_ESCAPE,              ///< Path resolved outside the allowed root
    FILE_NOT_FOUND,           ///< Sandbox file does not exist
    CANCELLED,                ///< Run-level cancellation or deadline
    TRANSPORT,                ///< Backend transport or protocol failure
    INVALID_ARGUMENTS,        ///< Tool arguments rejected by the input schema
    TOOL_NOT_FOUND,           ///< Unknown or disallowed tool name
    TOOL_EXECUTION_FAILED     ///< Handler ran but the operation failed
};

/**
 * @brief Stable snake_case name of an error kind (used in JSON results)
 */
const char* ToString(ErrorKind kind);

/**
 * @brief Parse a kind name produced by ToString()
 */
std::optional<ErrorKind> ErrorKindFromString(const std::string& name);

/**
 * @brief True for kinds raised while validating configuration
 */
bool IsConfigurationError(ErrorKind kind);

/**
 * @class SandboxError
 * @brief Exception type used throughout the subsystem
 *
 * Wraps an ErrorKind and, for wrapped failures, the kind of the error that
 * originally caused it (e.g. TOOL_EXECUTION_FAILED caused by TRANSPORT).
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    SandboxError(ErrorKind kind, const std::string& message, ErrorKind cause)
        : std::runtime_error(message), kind_(kind), cause_(cause) {}

    ErrorKind Kind() const noexcept { return kind_; }
    std::optional<ErrorKind> Cause() const noexcept { return cause_; }

private:
    ErrorKind kind_;
    std::optional<ErrorKind> cause_;
};

} // namespace core
} // namespace enclave
