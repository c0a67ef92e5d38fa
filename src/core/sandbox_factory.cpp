/**
 * @file sandbox_factory.cpp
 * @brief Configuration validation and backend construction
 *
 * **Validation Rules**:
 * - Backend must be compiled in (UNSUPPORTED_BACKEND)
 * - memory/cpu must be positive; remote memory <= 8 GiB, disk <= 10 GiB
 *   (INVALID_RESOURCE_LIMIT)
 * - Variant-only fields on the wrong variant, missing api key, relative
 *   paths and host credentials in the sandbox environment
 *   (INVALID_CONFIGURATION)
 *
 * No process is spawned and no network request is issued here.
 *
 * @date 2026
 */

#include "enclave/core/sandbox_factory.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/backends/local_container_backend.hpp"
#include "enclave/utils/string_utils.hpp"

#ifdef ENCLAVE_WITH_REMOTE_BACKEND
#include "enclave/backends/remote_cloud_backend.hpp"
#include "enclave/utils/http_transport.hpp"
#endif

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace enclave {
namespace core {

namespace {

constexpr const char* kDefaultLocalImage = "python:3.12-slim";
constexpr const char* kDefaultRemoteImage = "daytonaio/workspace:latest";

[[noreturn]] void Reject(ErrorKind kind, const std::string& message) {
    spdlog::error("Invalid sandbox configuration: {}", message);
    throw SandboxError(kind, message);
}

bool IsValidEnvName(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

void CheckEnvironment(const SandboxConfig& config) {
    const auto& credentials = SandboxFactory::HostCredentialVariables();
    auto is_credential = [&](const std::string& name) {
        return std::find(credentials.begin(), credentials.end(), name) != credentials.end();
    };

    for (const auto& [name, value] : config.environment) {
        if (!IsValidEnvName(name)) {
            Reject(ErrorKind::INVALID_CONFIGURATION, "Invalid environment variable name: '" + name + "'");
        }
        if (is_credential(name)) {
            Reject(ErrorKind::INVALID_CONFIGURATION,
                   name + " is a host credential and may not be set in the sandbox environment");
        }
    }
    for (const auto& name : config.pass_env_vars) {
        if (!IsValidEnvName(name)) {
            Reject(ErrorKind::INVALID_CONFIGURATION, "Invalid pass_env_vars entry: '" + name + "'");
        }
        if (is_credential(name)) {
            Reject(ErrorKind::INVALID_CONFIGURATION,
                   name + " is a host credential and may not be passed into the sandbox");
        }
    }
}

void ValidateCommon(SandboxConfig& config) {
    if (config.cpu_limit < 0.0) {
        Reject(ErrorKind::INVALID_RESOURCE_LIMIT, "cpu_limit must be positive");
    }
    if (config.auto_stop_interval_minutes.has_value() && *config.auto_stop_interval_minutes < 0) {
        Reject(ErrorKind::INVALID_RESOURCE_LIMIT, "auto_stop_interval must not be negative");
    }
    CheckEnvironment(config);
}

void ValidateLocal(SandboxConfig& config, const SandboxFactory::EnvLookup& env_lookup) {
    if (config.disk_limit_bytes.has_value()) {
        Reject(ErrorKind::INVALID_CONFIGURATION, "disk limit is only supported by the remote backend");
    }
    if (config.auto_stop_interval_minutes.has_value()) {
        Reject(ErrorKind::INVALID_CONFIGURATION, "auto_stop_interval is only supported by the remote backend");
    }

    if (config.image.empty()) {
        config.image = kDefaultLocalImage;
    }
    if (config.memory_limit_bytes == 0) {
        config.memory_limit_bytes = 512 * kMiB;
    }
    if (config.cpu_limit == 0.0) {
        config.cpu_limit = 1.0;
    }

    if (config.memory_limit_bytes < kLocalMinMemoryBytes) {
        Reject(ErrorKind::INVALID_RESOURCE_LIMIT,
               "memory_limit must be at least " + FormatByteSize(kLocalMinMemoryBytes));
    }
    if (config.pids_limit <= 0) {
        Reject(ErrorKind::INVALID_RESOURCE_LIMIT, "pids_limit must be positive");
    }
    if (config.work_dir.empty() || config.work_dir.front() != '/') {
        Reject(ErrorKind::INVALID_CONFIGURATION, "work_dir must be an absolute path");
    }

    std::map<std::string, std::string> mounts;
    for (const auto& [host_path, sandbox_path] : config.volume_mounts) {
        if (host_path.empty() || sandbox_path.empty() || sandbox_path.front() != '/') {
            Reject(ErrorKind::INVALID_CONFIGURATION,
                   "Volume mount '" + host_path + "' -> '" + sandbox_path + "' needs an absolute sandbox path");
        }
        if (host_path.find(':') != std::string::npos || sandbox_path.find(':') != std::string::npos) {
            Reject(ErrorKind::INVALID_CONFIGURATION, "Volume mount paths may not contain ':'");
        }
        auto absolute = std::filesystem::absolute(host_path).lexically_normal().string();
        mounts[absolute] = sandbox_path;
    }
    config.volume_mounts = std::move(mounts);

    // Explicit values win over pass-through values
    for (const auto& name : config.pass_env_vars) {
        if (config.environment.count(name)) {
            continue;
        }
        auto value = env_lookup(name);
        if (value.has_value() && !value->empty()) {
            config.environment[name] = *value;
        }
    }
}

void ValidateRemote(SandboxConfig& config, const SandboxFactory::EnvLookup& env_lookup) {
    if (!config.volume_mounts.empty()) {
        Reject(ErrorKind::INVALID_CONFIGURATION,
               "the remote backend cannot mount host directories; upload files after creation");
    }
    if (!config.pass_env_vars.empty()) {
        Reject(ErrorKind::INVALID_CONFIGURATION, "pass_env_vars is only supported by the local backend");
    }

    if (config.image.empty()) {
        config.image = kDefaultRemoteImage;
    }
    if (config.memory_limit_bytes == 0) {
        config.memory_limit_bytes = 4 * kGiB;
    }
    if (config.cpu_limit == 0.0) {
        config.cpu_limit = 2.0;
    }
    if (!config.disk_limit_bytes.has_value()) {
        config.disk_limit_bytes = 10 * kGiB;
    }
    if (!config.auto_stop_interval_minutes.has_value()) {
        config.auto_stop_interval_minutes = 30;
    }

    if (config.memory_limit_bytes > kRemoteMaxMemoryBytes) {
        Reject(ErrorKind::INVALID_RESOURCE_LIMIT,
               "memory_limit " + FormatByteSize(config.memory_limit_bytes) + " exceeds the remote ceiling of 8g");
    }
    if (*config.disk_limit_bytes == 0 || *config.disk_limit_bytes > kRemoteMaxDiskBytes) {
        Reject(ErrorKind::INVALID_RESOURCE_LIMIT,
               "disk limit " + FormatByteSize(*config.disk_limit_bytes) + " must be within (0, 10g]");
    }
    // The service allocates whole GiB
    if (config.memory_limit_bytes < kGiB) {
        Reject(ErrorKind::INVALID_RESOURCE_LIMIT, "remote memory_limit must be at least 1g");
    }

    if (config.remote.api_key.empty()) {
        auto key = env_lookup("DAYTONA_API_KEY");
        if (!key.has_value() || key->empty()) {
            Reject(ErrorKind::INVALID_CONFIGURATION,
                   "remote backend requires api_key (or DAYTONA_API_KEY)");
        }
        config.remote.api_key = *key;
    }

    const auto& url = config.remote.server_url;
    if (!utils::StringUtils::StartsWith(url, "https://") &&
        !utils::StringUtils::StartsWith(url, "http://")) {
        Reject(ErrorKind::INVALID_CONFIGURATION, "server_url must be an http(s) URL");
    }
    while (!config.remote.server_url.empty() && config.remote.server_url.back() == '/') {
        config.remote.server_url.pop_back();
    }
    if (config.remote.provision_timeout.count() <= 0) {
        Reject(ErrorKind::INVALID_CONFIGURATION, "provision_timeout must be positive");
    }
}

} // anonymous namespace

std::optional<std::string> SandboxFactory::DefaultEnvLookup(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

const std::vector<std::string>& SandboxFactory::HostCredentialVariables() {
    static const std::vector<std::string> names{"TAVILY_API_KEY", "DAYTONA_API_KEY"};
    return names;
}

std::vector<BackendKind> SandboxFactory::SupportedBackends() {
    std::vector<BackendKind> kinds{BackendKind::LOCAL};
#ifdef ENCLAVE_WITH_REMOTE_BACKEND
    kinds.push_back(BackendKind::REMOTE);
#endif
    return kinds;
}

SandboxConfig SandboxFactory::Validate(const SandboxConfig& config, const EnvLookup& env_lookup) {
    auto supported = SupportedBackends();
    if (std::find(supported.begin(), supported.end(), config.backend) == supported.end()) {
        Reject(ErrorKind::UNSUPPORTED_BACKEND,
               std::string("backend '") + ToString(config.backend) + "' is not compiled into this build");
    }

    SandboxConfig effective = config;
    ValidateCommon(effective);

    if (effective.backend == BackendKind::LOCAL) {
        ValidateLocal(effective, env_lookup);
    } else {
        ValidateRemote(effective, env_lookup);
    }

    return effective;
}

std::unique_ptr<SandboxBackend> SandboxFactory::Build(const SandboxConfig& config) {
    auto effective = Validate(config);

    spdlog::info("Building {} sandbox backend (image: {}, memory: {}, cpus: {})",
                 ToString(effective.backend), effective.image,
                 FormatByteSize(effective.memory_limit_bytes), effective.cpu_limit);

    if (effective.backend == BackendKind::LOCAL) {
        return std::make_unique<backends::LocalContainerBackend>(effective);
    }

#ifdef ENCLAVE_WITH_REMOTE_BACKEND
    return std::make_unique<backends::RemoteCloudBackend>(
        effective, std::make_shared<utils::CurlHttpTransport>());
#else
    throw SandboxError(ErrorKind::UNSUPPORTED_BACKEND, "remote backend is not compiled into this build");
#endif
}

} // namespace core
} // namespace enclave
