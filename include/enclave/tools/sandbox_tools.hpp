/**
 * @file sandbox_tools.hpp
 * @brief Tools executed inside the sandbox
 *
 * | tool        | arguments                          |
 * |-------------|------------------------------------|
 * | shell       | command, working_dir=/workspace    |
 * | python      | code                               |
 * | file_read   | path                               |
 * | file_write  | path, content                      |
 * | web_browse  | url, selector?                     |
 *
 * None of these handlers can reach host credentials: they only receive
 * their arguments and the execution protocol.
 *
 * @date 2026
 */

#pragma once

#include "enclave/tools/tool_registry.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace tools {

/**
 * @struct SandboxToolOptions
 * @brief Host-side settings of the sandbox tools
 */
struct SandboxToolOptions {
    std::optional<std::filesystem::path> artifact_dir;   ///< Export target of python artifacts
    std::vector<std::string> artifact_extensions;        ///< Empty = default list
};

/// Script path of the generated browser script
constexpr const char* kBrowserScriptPath = "/workspace/temp/_browser_script.py";

/// Timeout of one web_browse call
constexpr int kBrowseTimeoutSeconds = 60;

/**
 * @brief Register shell, python, file_read, file_write and web_browse
 */
void RegisterSandboxTools(ToolRegistry& registry, const SandboxToolOptions& options = SandboxToolOptions());

/**
 * @brief Escape a CSS selector for a double-quoted Python string literal
 *
 * Backslashes and quotes are escaped; CR and LF become spaces.
 */
std::string EscapeSelector(const std::string& selector);

/**
 * @brief Playwright script that prints {status,url,title,content} as JSON
 * @param max_chars Cap on the extracted content
 */
std::string BuildBrowserScript(const std::string& url,
                               const std::optional<std::string>& selector,
                               std::size_t max_chars);

} // namespace tools
} // namespace enclave
