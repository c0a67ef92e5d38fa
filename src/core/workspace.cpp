/**
 * @file workspace.cpp
 * @brief Workspace constants and lexical path resolution
 *
 * @date 2026
 */

#include "enclave/core/workspace.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace enclave {
namespace core {

namespace {

// POSIX normalization of an absolute path; returns false if ".." would
// climb above "/".
bool NormalizeAbsolute(const std::string& path, std::string& normalized) {
    std::vector<std::string> stack;
    for (const auto& part : utils::StringUtils::Split(path, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (stack.empty()) {
                return false;
            }
            stack.pop_back();
            continue;
        }
        stack.push_back(part);
    }
    normalized = "/" + utils::StringUtils::Join(stack, "/");
    return true;
}

} // anonymous namespace

std::string WorkspaceInitCommand() {
    return std::string("mkdir -p ") + kWorkspaceInput + " " + kWorkspaceOutput + " " +
           kWorkspaceTemp + " " + kWorkspaceDownloads;
}

const std::vector<std::string>& DefaultArtifactExtensions() {
    static const std::vector<std::string> extensions{
        ".json", ".html", ".png", ".jpg", ".csv", ".pdf"
    };
    return extensions;
}

bool HasArtifactExtension(const std::string& path, const std::vector<std::string>& extensions) {
    const auto& allowed = extensions.empty() ? DefaultArtifactExtensions() : extensions;
    auto lowered = utils::StringUtils::ToLower(path);
    for (const auto& ext : allowed) {
        if (!ext.empty() && utils::StringUtils::EndsWith(lowered, utils::StringUtils::ToLower(ext))) {
            return true;
        }
    }
    return false;
}

std::string PythonRunCommand(const std::string& script_path) {
    return std::string("cd ") + kWorkspaceRoot + " && python3 " +
           utils::StringUtils::ShellQuote(script_path);
}

std::string ResolveWorkspacePath(const std::string& path) {
    if (path.empty()) {
        throw SandboxError(ErrorKind::PATH_ESCAPE, "Path must not be empty");
    }
    if (path.find('\0') != std::string::npos) {
        throw SandboxError(ErrorKind::PATH_ESCAPE, "Path contains a NUL byte");
    }

    std::string absolute = path.front() == '/' ? path : std::string(kWorkspaceRoot) + "/" + path;

    std::string normalized;
    if (!NormalizeAbsolute(absolute, normalized) ||
        !IsWithinSandboxDir(normalized, kWorkspaceRoot)) {
        spdlog::warn("Rejected path outside workspace: {}", path);
        throw SandboxError(ErrorKind::PATH_ESCAPE,
                           "Path '" + path + "' is outside the workspace (" + kWorkspaceRoot + ")");
    }
    return normalized;
}

std::string RelativeToWorkspace(const std::string& absolute_path) {
    const std::string root = std::string(kWorkspaceRoot) + "/";
    if (utils::StringUtils::StartsWith(absolute_path, root)) {
        return absolute_path.substr(root.size());
    }
    return absolute_path == kWorkspaceRoot ? "" : absolute_path;
}

bool IsWithinSandboxDir(const std::string& absolute_path, const std::string& directory) {
    if (absolute_path == directory) {
        return true;
    }
    std::string prefix = directory;
    if (prefix.empty() || prefix.back() != '/') {
        prefix += '/';
    }
    return utils::StringUtils::StartsWith(absolute_path, prefix);
}

std::filesystem::path ResolveUnderHostRoot(const std::filesystem::path& root,
                                           const std::string& relative_key) {
    std::filesystem::path key(relative_key);
    if (relative_key.empty() || key.is_absolute() || key.has_root_name()) {
        throw SandboxError(ErrorKind::PATH_ESCAPE, "Invalid artifact key: " + relative_key);
    }

    auto normalized_key = key.lexically_normal();
    auto first = normalized_key.begin();
    if (normalized_key.empty() || (first != normalized_key.end() && *first == "..")) {
        throw SandboxError(ErrorKind::PATH_ESCAPE,
                           "Artifact key escapes the output directory: " + relative_key);
    }
    return root / normalized_key;
}

} // namespace core
} // namespace enclave
