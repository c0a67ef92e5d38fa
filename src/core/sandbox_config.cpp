/**
 * @file sandbox_config.cpp
 * @brief Parsing of sandbox configuration values
 *
 * Converts the JSON "sandbox" section into a SandboxConfig. Validation of
 * bounds and variant-specific fields happens in SandboxFactory::Validate;
 * this file only rejects values that cannot be parsed at all.
 *
 * @date 2026
 */

#include "enclave/core/sandbox_config.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace enclave {
namespace core {

namespace {

std::uint64_t SizeFromJson(const json& value, const char* field) {
    if (value.is_number_integer()) {
        if (!value.is_number_unsigned() && value.get<long long>() < 0) {
            throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT,
                               std::string(field) + " must not be negative");
        }
        auto gib = value.get<std::uint64_t>();
        if (gib > std::numeric_limits<std::uint64_t>::max() / kGiB) {
            throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT,
                               std::string(field) + " out of range: " + value.dump() + " GiB");
        }
        return gib * kGiB;
    }
    if (value.is_string()) {
        return ParseByteSize(value.get<std::string>());
    }
    throw SandboxError(ErrorKind::INVALID_CONFIGURATION,
                       std::string(field) + " must be a size string or an integer (GiB)");
}

std::map<std::string, std::string> StringMapFromJson(const json& value, const char* field) {
    std::map<std::string, std::string> out;
    if (value.is_null()) {
        return out;
    }
    if (!value.is_object()) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION,
                           std::string(field) + " must be an object of strings");
    }
    for (const auto& [key, item] : value.items()) {
        if (!item.is_string()) {
            throw SandboxError(ErrorKind::INVALID_CONFIGURATION,
                               std::string(field) + "." + key + " must be a string");
        }
        out[key] = item.get<std::string>();
    }
    return out;
}

} // anonymous namespace

const char* ToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::LOCAL:
            return "docker";
        case BackendKind::REMOTE:
            return "daytona";
    }
    return "unknown";
}

BackendKind ParseBackendKind(const std::string& name) {
    auto lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lowered == "docker" || lowered == "local") {
        return BackendKind::LOCAL;
    }
    if (lowered == "daytona" || lowered == "remote") {
        return BackendKind::REMOTE;
    }
    throw SandboxError(ErrorKind::UNSUPPORTED_BACKEND, "Unknown sandbox type: " + name);
}

std::uint64_t ParseByteSize(const std::string& text) {
    auto value = utils::StringUtils::ToLower(utils::StringUtils::Trim(text));
    if (value.empty()) {
        throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT, "Empty size value");
    }

    // Accept docker-style suffixes with an optional trailing "b" or "ib"
    if (utils::StringUtils::EndsWith(value, "ib")) {
        value.resize(value.size() - 2);
    } else if (value.size() > 1 && value.back() == 'b' &&
               std::isalpha(static_cast<unsigned char>(value[value.size() - 2]))) {
        value.pop_back();
    }
    if (value.empty()) {
        throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT, "Invalid size: " + text);
    }

    std::uint64_t multiplier = 1;
    switch (value.back()) {
        case 'k': multiplier = 1024ull; break;
        case 'm': multiplier = kMiB; break;
        case 'g': multiplier = kGiB; break;
        case 't': multiplier = 1024ull * kGiB; break;
        case 'b': multiplier = 1; break;
        default: break;
    }
    if (!std::isdigit(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }

    if (value.empty()) {
        throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT, "Invalid size: " + text);
    }

    double number = 0.0;
    std::size_t consumed = 0;
    try {
        number = std::stod(value, &consumed);
    }
    catch (const std::exception&) {
        throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT, "Invalid size: " + text);
    }
    if (consumed != value.size() || number < 0 || !std::isfinite(number)) {
        throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT, "Invalid size: " + text);
    }

    double bytes = number * static_cast<double>(multiplier);
    if (bytes > static_cast<double>(std::numeric_limits<std::uint64_t>::max() / 2)) {
        throw SandboxError(ErrorKind::INVALID_RESOURCE_LIMIT, "Size out of range: " + text);
    }
    return static_cast<std::uint64_t>(bytes);
}

std::string FormatByteSize(std::uint64_t bytes) {
    if (bytes != 0 && bytes % kGiB == 0) {
        return std::to_string(bytes / kGiB) + "g";
    }
    if (bytes != 0 && bytes % kMiB == 0) {
        return std::to_string(bytes / kMiB) + "m";
    }
    if (bytes != 0 && bytes % 1024 == 0) {
        return std::to_string(bytes / 1024) + "k";
    }
    return std::to_string(bytes);
}

SandboxConfig SandboxConfig::FromJson(const json& j) {
    if (!j.is_object()) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION, "sandbox configuration must be an object");
    }

    SandboxConfig config;

    try {
        config.backend = ParseBackendKind(j.value("type", std::string("docker")));
        config.image = j.value("image", std::string());

        if (j.contains("memory_limit")) {
            config.memory_limit_bytes = SizeFromJson(j.at("memory_limit"), "memory_limit");
        } else if (j.contains("memory")) {
            config.memory_limit_bytes = SizeFromJson(j.at("memory"), "memory");
        }

        if (j.contains("cpu_limit")) {
            config.cpu_limit = j.at("cpu_limit").get<double>();
        } else if (j.contains("cpu")) {
            config.cpu_limit = j.at("cpu").get<double>();
        }

        if (j.contains("disk")) {
            config.disk_limit_bytes = SizeFromJson(j.at("disk"), "disk");
        } else if (j.contains("disk_limit")) {
            config.disk_limit_bytes = SizeFromJson(j.at("disk_limit"), "disk_limit");
        }

        config.network_enabled = j.value("network_enabled", true);

        if (j.contains("volumes")) {
            config.volume_mounts = StringMapFromJson(j.at("volumes"), "volumes");
        }
        if (j.contains("environment")) {
            config.environment = StringMapFromJson(j.at("environment"), "environment");
        }
        if (j.contains("pass_env_vars") && !j.at("pass_env_vars").is_null()) {
            config.pass_env_vars = j.at("pass_env_vars").get<std::vector<std::string>>();
        }
        if (j.contains("auto_stop_interval") && !j.at("auto_stop_interval").is_null()) {
            config.auto_stop_interval_minutes = j.at("auto_stop_interval").get<int>();
        }

        config.work_dir = j.value("work_dir", config.work_dir);
        config.auto_remove = j.value("auto_remove", config.auto_remove);
        config.pids_limit = j.value("pids_limit", config.pids_limit);

        config.remote.api_key = j.value("api_key", std::string());
        config.remote.server_url = j.value("server_url", config.remote.server_url);
        config.remote.target = j.value("target", config.remote.target);
        if (j.contains("provision_timeout")) {
            config.remote.provision_timeout = std::chrono::seconds(j.at("provision_timeout").get<int>());
        }
    }
    catch (const json::exception& e) {
        throw SandboxError(ErrorKind::INVALID_CONFIGURATION,
                           std::string("Malformed sandbox configuration: ") + e.what());
    }

    spdlog::debug("Parsed sandbox configuration (type: {})", ToString(config.backend));
    return config;
}

json SandboxConfig::ToJson() const {
    json j;
    j["type"] = ToString(backend);
    j["image"] = image;
    j["memory_limit"] = FormatByteSize(memory_limit_bytes);
    j["cpu_limit"] = cpu_limit;
    j["network_enabled"] = network_enabled;
    j["environment_keys"] = json::array();
    for (const auto& [name, value] : environment) {
        j["environment_keys"].push_back(name);
    }
    if (backend == BackendKind::LOCAL) {
        j["volumes"] = volume_mounts;
        j["work_dir"] = work_dir;
    } else {
        if (disk_limit_bytes.has_value()) {
            j["disk"] = FormatByteSize(*disk_limit_bytes);
        }
        if (auto_stop_interval_minutes.has_value()) {
            j["auto_stop_interval"] = *auto_stop_interval_minutes;
        }
        j["server_url"] = remote.server_url;
        j["target"] = remote.target;
    }
    return j;
}

} // namespace core
} // namespace enclave
