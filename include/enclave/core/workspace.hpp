/**
 * @file workspace.hpp
 * @brief Fixed workspace layout exposed by every backend and path resolution
 *
 * Every sandbox exposes the same directory structure:
 * ```
 * /workspace
 *     ├─ input/      (files provided to the agent)
 *     ├─ output/     (generated artifacts, downloaded to the host)
 *     ├─ temp/       (scratch space, staged scripts)
 *     └─ downloads/  (web downloads)
 * ```
 *
 * Paths supplied by tools are resolved lexically against the workspace root
 * before any filesystem call. Anything that normalizes outside the root is
 * rejected with PATH_ESCAPE.
 *
 * @date 2026
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace enclave {
namespace core {

constexpr const char* kWorkspaceRoot = "/workspace";
constexpr const char* kWorkspaceInput = "/workspace/input";
constexpr const char* kWorkspaceOutput = "/workspace/output";
constexpr const char* kWorkspaceTemp = "/workspace/temp";
constexpr const char* kWorkspaceDownloads = "/workspace/downloads";

/// Script path used to stage python tool bodies
constexpr const char* kDefaultScriptPath = "/workspace/temp/_script.py";

/**
 * @brief Shell command creating the workspace directories
 */
std::string WorkspaceInitCommand();

/**
 * @brief Shell line running a staged python script from the workspace root
 */
std::string PythonRunCommand(const std::string& script_path = kDefaultScriptPath);

/**
 * @brief Extensions downloaded as artifacts when none are given
 */
const std::vector<std::string>& DefaultArtifactExtensions();

/**
 * @brief Case-insensitive extension match (empty list = defaults)
 */
bool HasArtifactExtension(const std::string& path, const std::vector<std::string>& extensions);

/**
 * @brief Resolve a tool-supplied path inside the workspace
 *
 * Relative paths are taken relative to /workspace. Absolute paths must
 * stay within /workspace after removing "." and ".." components.
 *
 * @param path Path as supplied by the agent
 * @return Normalized absolute sandbox path
 * @throws SandboxError(PATH_ESCAPE) if the path leaves the workspace
 *
 * **Example**:
 * @code
 * ResolveWorkspacePath("output/test.json");    // "/workspace/output/test.json"
 * ResolveWorkspacePath("/workspace/a/../b");   // "/workspace/b"
 * ResolveWorkspacePath("../../etc/passwd");    // throws PATH_ESCAPE
 * @endcode
 */
std::string ResolveWorkspacePath(const std::string& path);

/**
 * @brief Workspace-relative form of a resolved path ("output/test.json")
 */
std::string RelativeToWorkspace(const std::string& absolute_path);

/**
 * @brief True if a resolved path lies inside the given sandbox directory
 */
bool IsWithinSandboxDir(const std::string& absolute_path, const std::string& directory);

/**
 * @brief Join a relative key under a host directory without escaping it
 * @throws SandboxError(PATH_ESCAPE) if the key normalizes outside the root
 */
std::filesystem::path ResolveUnderHostRoot(const std::filesystem::path& root,
                                           const std::string& relative_key);

} // namespace core
} // namespace enclave
