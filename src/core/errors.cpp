/**
 * @file errors.cpp
 * @brief Error kind names and classification
 *
 * @date 2026
 */

#include "enclave/core/errors.hpp"

#include <array>
#include <utility>

namespace enclave {
namespace core {

namespace {

constexpr std::array<std::pair<ErrorKind, const char*>, 13> kKindNames{{
    {ErrorKind::INVALID_RESOURCE_LIMIT, "invalid_resource_limit"},
    {ErrorKind::UNSUPPORTED_BACKEND, "unsupported_backend"},
    {ErrorKind::INVALID_CONFIGURATION, "invalid_configuration"},
    {ErrorKind::SANDBOX_CREATION_FAILED, "sandbox_creation_failed"},
    {ErrorKind::SANDBOX_NOT_READY, "sandbox_not_ready"},
    {ErrorKind::TIMEOUT, "timeout"},
    {ErrorKind::PATH_ESCAPE, "path_escape"},
    {ErrorKind::FILE_NOT_FOUND, "file_not_found"},
    {ErrorKind::CANCELLED, "cancelled"},
    {ErrorKind::TRANSPORT, "transport"},
    {ErrorKind::INVALID_ARGUMENTS, "invalid_arguments"},
    {ErrorKind::TOOL_NOT_FOUND, "tool_not_found"},
    {ErrorKind::TOOL_EXECUTION_FAILED, "tool_execution_failed"},
}};

} // anonymous namespace

const char* ToString(ErrorKind kind) {
    for (const auto& [k, name] : kKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ErrorKind> ErrorKindFromString(const std::string& name) {
    for (const auto& [k, kind_name] : kKindNames) {
        if (name == kind_name) {
            return k;
        }
    }
    return std::nullopt;
}

bool IsConfigurationError(ErrorKind kind) {
    return kind == ErrorKind::INVALID_RESOURCE_LIMIT ||
           kind == ErrorKind::UNSUPPORTED_BACKEND ||
           kind == ErrorKind::INVALID_CONFIGURATION;
}

} // namespace core
} // namespace enclave
