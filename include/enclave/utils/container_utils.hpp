/**
 * @file container_utils.hpp
 * @brief Docker CLI wrapper used by the local container backend
 *
 * Every call goes through ProcessRunner with an argument vector, so no
 * value (image name, mount path, environment entry, command body) is ever
 * interpreted by a host shell.
 *
 * @date 2026
 */

#pragma once

#include "enclave/utils/process_utils.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace enclave {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container status as reported by `docker inspect`
 */
enum class ContainerState {
    CREATED,     ///< Created but not started
    RUNNING,     ///< Running (or restarting)
    PAUSED,      ///< Paused
    EXITED,      ///< Main process exited
    DEAD,        ///< Removal failed half-way
    REMOVING,    ///< Being removed
    NOT_FOUND,   ///< No such container
    UNKNOWN      ///< Unparseable status or runtime failure
};

/**
 * @struct ContainerConfig
 * @brief Arguments of one `docker create`
 */
struct ContainerConfig {
    std::string name;                                    ///< Container name
    std::string image;                                   ///< Image reference
    std::uint64_t memory_limit_bytes{0};                 ///< --memory (0 = unlimited)
    double cpu_limit{0.0};                               ///< --cpus (0 = unlimited)
    int pids_limit{0};                                   ///< --pids-limit (0 = unlimited)
    bool network_enabled{true};                          ///< bridge when true, none when false
    std::map<std::string, std::string> mounts;           ///< host path -> container path (rw)
    std::map<std::string, std::string> environment_vars; ///< -e NAME=value
    std::map<std::string, std::string> labels;           ///< --label key=value
    std::string working_dir{"/workspace"};               ///< -w
    bool auto_remove{false};                             ///< --rm
    std::vector<std::string> command{"/bin/bash"};       ///< Main process
};

/**
 * @class ContainerUtils
 * @brief Thin, synchronous front end to the docker CLI
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker;
 * if (!docker.IsRuntimeAvailable()) {
 *     return;
 * }
 *
 * ContainerConfig config;
 * config.name = "enclave_1a2b3c";
 * config.image = "python:3.12-slim";
 * std::string id = docker.CreateContainer(config);
 * docker.StartContainer(id);
 *
 * auto result = docker.Exec(id, {"/bin/bash", "-c", "echo hi"});
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class ContainerUtils {
public:
    explicit ContainerUtils(std::string binary = "docker");

    /***************************************************************************
     * Runtime Detection
     ***************************************************************************/

    /**
     * @brief True if the CLI is installed and the daemon answers
     */
    bool IsRuntimeAvailable() const;

    /**
     * @brief Server version string, or "unknown"
     */
    std::string GetRuntimeVersion() const;

    /***************************************************************************
     * Images
     ***************************************************************************/

    bool ImageExists(const std::string& image, const ProcessOptions& options = {}) const;

    /**
     * @throws std::runtime_error if the pull fails
     */
    void PullImage(const std::string& image, const ProcessOptions& options = {}) const;

    /***************************************************************************
     * Container Lifecycle
     ***************************************************************************/

    /**
     * @brief `docker create` from the configuration
     * @return Container id
     * @throws std::runtime_error with the CLI's stderr on failure
     */
    std::string CreateContainer(const ContainerConfig& config,
                                const ProcessOptions& options = {}) const;

    /**
     * @throws std::runtime_error on failure
     */
    void StartContainer(const std::string& container_id,
                        const ProcessOptions& options = {}) const;

    /**
     * @brief `docker rm`
     * @return true if removed or already gone
     */
    bool RemoveContainer(const std::string& container_id, bool force,
                         const ProcessOptions& options = {}) const;

    ContainerState GetContainerState(const std::string& container_id,
                                     const ProcessOptions& options = {}) const;

    /***************************************************************************
     * Command Execution
     ***************************************************************************/

    /**
     * @brief `docker exec` a command vector inside a running container
     *
     * stdin is attached (-i) when options.stdin_data is non-empty.
     */
    ProcessResult Exec(const std::string& container_id,
                       const std::vector<std::string>& command,
                       const ProcessOptions& options = {},
                       const std::map<std::string, std::string>& env = {},
                       const std::string& working_dir = "") const;

    /**
     * @brief Run `docker <args...>`
     */
    ProcessResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       const ProcessOptions& options = {}) const;

    /***************************************************************************
     * Helpers
     ***************************************************************************/

    /**
     * @brief Arguments of `docker create` (without the binary name)
     */
    static std::vector<std::string> BuildCreateCommand(const ContainerConfig& config);

    static ContainerState ParseState(const std::string& state_str);

    /**
     * @brief True if CLI output reports a missing container
     */
    static bool IsNoSuchContainer(const std::string& output);

private:
    std::string binary_;
};

} // namespace utils
} // namespace enclave
