/**
 * @file sandbox_config.hpp
 * @brief Sandbox creation parameters and resource limits
 *
 * A single SandboxConfig describes both backend variants. Fields that only
 * make sense for one variant are optional and validated per variant by the
 * SandboxFactory before any backend is constructed.
 *
 * @date 2026
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace core {

/**
 * @enum BackendKind
 * @brief Sandbox implementation strategy
 */
enum class BackendKind {
    LOCAL,   ///< Local container runtime (Docker CLI)
    REMOTE   ///< Remote cloud sandbox service
};

const char* ToString(BackendKind kind);

/**
 * @brief Parse a backend name ("docker"/"local", "daytona"/"remote")
 * @throws SandboxError(UNSUPPORTED_BACKEND) for unknown names
 */
BackendKind ParseBackendKind(const std::string& name);

constexpr std::uint64_t kMiB = 1024ull * 1024ull;
constexpr std::uint64_t kGiB = 1024ull * kMiB;

/// Service-imposed ceilings of the remote backend
constexpr std::uint64_t kRemoteMaxMemoryBytes = 8 * kGiB;
constexpr std::uint64_t kRemoteMaxDiskBytes = 10 * kGiB;

/// Smallest memory limit the container runtime accepts
constexpr std::uint64_t kLocalMinMemoryBytes = 6 * kMiB;

/**
 * @brief Parse a size such as "512m", "1g", "4096k" or "1048576"
 * @return Size in bytes
 * @throws SandboxError(INVALID_RESOURCE_LIMIT) on malformed input
 */
std::uint64_t ParseByteSize(const std::string& text);

/**
 * @brief Format bytes the way the container runtime expects ("512m")
 */
std::string FormatByteSize(std::uint64_t bytes);

/**
 * @struct RemoteSettings
 * @brief Connection settings of the remote cloud backend
 */
struct RemoteSettings {
    std::string api_key;                                ///< Bearer token (never enters the sandbox)
    std::string server_url{"https://api.daytona.io"};   ///< API base URL
    std::string target{"us"};                           ///< Region
    std::chrono::seconds provision_timeout{180};        ///< Max wait for "started"
};

/**
 * @struct SandboxConfig
 * @brief Complete sandbox configuration
 */
struct SandboxConfig {
    BackendKind backend{BackendKind::LOCAL};
    std::string image;                                  ///< Empty selects the variant default

    // Resource Limits
    std::uint64_t memory_limit_bytes{0};                ///< 0 selects the variant default
    double cpu_limit{0.0};                              ///< Cores; 0 selects the variant default
    std::optional<std::uint64_t> disk_limit_bytes;      ///< Remote only
    bool network_enabled{true};

    // Variant-only settings
    std::map<std::string, std::string> volume_mounts;   ///< host path -> sandbox path (local only)
    std::optional<int> auto_stop_interval_minutes;      ///< Remote only; 0 disables
    std::vector<std::string> pass_env_vars;             ///< Host variables copied in (local only)

    std::map<std::string, std::string> environment;     ///< Sandbox environment

    // Local settings
    std::string work_dir{"/workspace"};
    bool auto_remove{false};
    int pids_limit{256};

    // Remote settings
    RemoteSettings remote;

    /**
     * @brief Parse the "sandbox" section of an agent configuration
     *
     * Accepts the keys type, image, memory_limit/memory, cpu_limit/cpu,
     * disk, network_enabled, volumes, environment, pass_env_vars,
     * auto_stop_interval, work_dir, auto_remove, pids_limit, api_key,
     * server_url, target. Integer memory/disk values are GiB.
     *
     * @throws SandboxError with a configuration kind on malformed input
     */
    static SandboxConfig FromJson(const nlohmann::json& j);

    nlohmann::json ToJson() const;
};

/**
 * @class SandboxConfigBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxConfigBuilder()
 *     .WithBackend(BackendKind::LOCAL)
 *     .WithImage("python:3.12-slim")
 *     .WithMemoryLimit("1g")
 *     .WithNetwork(true)
 *     .Build();
 * @endcode
 */
class SandboxConfigBuilder {
public:
    SandboxConfigBuilder& WithBackend(BackendKind kind) {
        config_.backend = kind;
        return *this;
    }

    SandboxConfigBuilder& WithImage(const std::string& image) {
        config_.image = image;
        return *this;
    }

    SandboxConfigBuilder& WithMemoryLimit(const std::string& size) {
        config_.memory_limit_bytes = ParseByteSize(size);
        return *this;
    }

    SandboxConfigBuilder& WithCpuLimit(double cores) {
        config_.cpu_limit = cores;
        return *this;
    }

    SandboxConfigBuilder& WithDiskLimit(const std::string& size) {
        config_.disk_limit_bytes = ParseByteSize(size);
        return *this;
    }

    SandboxConfigBuilder& WithNetwork(bool enabled) {
        config_.network_enabled = enabled;
        return *this;
    }

    SandboxConfigBuilder& WithVolume(const std::string& host_path, const std::string& sandbox_path) {
        config_.volume_mounts[host_path] = sandbox_path;
        return *this;
    }

    SandboxConfigBuilder& WithEnv(const std::string& name, const std::string& value) {
        config_.environment[name] = value;
        return *this;
    }

    SandboxConfigBuilder& WithAutoStop(int minutes) {
        config_.auto_stop_interval_minutes = minutes;
        return *this;
    }

    SandboxConfigBuilder& WithApiKey(const std::string& key) {
        config_.remote.api_key = key;
        return *this;
    }

    SandboxConfigBuilder& WithServerUrl(const std::string& url) {
        config_.remote.server_url = url;
        return *this;
    }

    SandboxConfig Build() const {
        return config_;
    }

private:
    SandboxConfig config_;
};

} // namespace core
} // namespace enclave
