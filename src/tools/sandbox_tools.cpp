/**
 * @file sandbox_tools.cpp
 * @brief Shell, python, file and browser tools
 *
 * @date 2026
 */

#include "enclave/tools/sandbox_tools.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/workspace.hpp"
#include "enclave/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

using json = nlohmann::json;

namespace enclave {
namespace tools {

using core::ErrorKind;
using core::SandboxError;
using utils::StringUtils;

namespace {

std::optional<long long> TimeoutArgument(const json& args) {
    if (args.contains("timeout")) {
        return args["timeout"].get<long long>();
    }
    return std::nullopt;
}

// ============================================================================
// HANDLERS
// ============================================================================

core::ExecutionResult RunShell(const json& args, protocol::ExecutionProtocol& protocol,
                               const core::CancellationToken& token) {
    core::ExecutionRequest request;
    request.command = args["command"].get<std::string>();
    request.working_dir = args["working_dir"].get<std::string>();
    request.timeout = protocol.ClampTimeout(TimeoutArgument(args));

    spdlog::info("shell: {} ({} chars)", StringUtils::Truncate(request.command, 40), request.command.size());
    return protocol.Execute(request, token);
}

core::ExecutionResult RunPython(const json& args, protocol::ExecutionProtocol& protocol,
                                const core::CancellationToken& token,
                                const SandboxToolOptions& options) {
    core::ExecutionRequest request;
    request.kind = core::ExecutionKind::PYTHON;
    request.command = args["code"].get<std::string>();
    request.timeout = protocol.ClampTimeout(TimeoutArgument(args));

    spdlog::info("python: {} chars of code", request.command.size());
    auto result = protocol.Execute(request, token);

    std::vector<std::string> generated;
    try {
        generated = protocol.ListGeneratedFiles(token);
    }
    catch (const SandboxError& e) {
        if (e.Kind() == ErrorKind::CANCELLED) {
            throw;
        }
        spdlog::warn("Could not list generated files: {}", e.what());
        return result;
    }

    for (const auto& file : generated) {
        result.artifacts.push_back(core::RelativeToWorkspace(std::string(core::kWorkspaceOutput) + "/" + file));
    }

    if (options.artifact_dir.has_value() && !generated.empty()) {
        auto bundle = protocol.DownloadArtifacts(options.artifact_extensions, token);
        protocol.ExportArtifacts(bundle, *options.artifact_dir);
    }

    return result;
}

core::ExecutionResult ReadFileTool(const json& args, protocol::ExecutionProtocol& protocol,
                                   const core::CancellationToken& token) {
    auto path = args["path"].get<std::string>();
    spdlog::info("file_read: {}", path);

    auto start = std::chrono::steady_clock::now();
    core::ExecutionResult result;
    result.stdout_output = protocol.ReadFile(path, token);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

core::ExecutionResult WriteFileTool(const json& args, protocol::ExecutionProtocol& protocol,
                                    const core::CancellationToken& token) {
    auto path = args["path"].get<std::string>();
    auto content = args["content"].get<std::string>();
    spdlog::info("file_write: {} ({} chars)", path, content.size());

    auto start = std::chrono::steady_clock::now();
    protocol.WriteFile(path, content, token);

    core::ExecutionResult result;
    result.stdout_output = json{{"path", core::ResolveWorkspacePath(path)}, {"size", content.size()}}.dump();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

core::ExecutionResult WebBrowse(const json& args, protocol::ExecutionProtocol& protocol,
                                const core::CancellationToken& token) {
    auto url = args["url"].get<std::string>();
    std::optional<std::string> selector;
    if (args.contains("selector") && !args["selector"].get<std::string>().empty()) {
        selector = args["selector"].get<std::string>();
    }

    spdlog::info("web_browse: {}", url);

    protocol.WriteFile(kBrowserScriptPath, BuildBrowserScript(url, selector, protocol.CharBudget()), token);

    core::ExecutionRequest request;
    request.command = std::string("python3 ") + kBrowserScriptPath;
    request.timeout = std::chrono::seconds(kBrowseTimeoutSeconds);

    auto result = protocol.Execute(request, token);
    if (result.TimedOut()) {
        return result;
    }

    auto output = StringUtils::Trim(result.stdout_output);
    if (result.exit_code == 0 && !output.empty()) {
        auto page = json::parse(output, nullptr, false);
        if (!page.is_discarded() && page.is_object()) {
            if (page.value("status", "") == "error") {
                throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED,
                                   "Browser error: " + page.value("error", "unknown error"));
            }
            result.stdout_output = page.dump();
            return result;
        }
    }

    auto error = StringUtils::Trim(result.stderr_output);
    throw SandboxError(ErrorKind::TOOL_EXECUTION_FAILED,
                       error.empty() ? "Browser operation failed" : error);
}

} // anonymous namespace

// ============================================================================
// BROWSER SCRIPT
// ============================================================================

std::string EscapeSelector(const std::string& selector) {
    std::string escaped;
    escaped.reserve(selector.size());
    for (char c : selector) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\r':
            case '\n': escaped += ' '; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

std::string BuildBrowserScript(const std::string& url,
                               const std::optional<std::string>& selector,
                               std::size_t max_chars) {
    std::string extract;
    if (selector.has_value()) {
        extract =
            "            elements = await page.query_selector_all(\"" + EscapeSelector(*selector) + "\")\n"
            "            texts = []\n"
            "            for el in elements:\n"
            "                text = await el.text_content()\n"
            "                if text:\n"
            "                    texts.append(text.strip())\n"
            "            content = \"\\n\".join(texts)\n";
    } else {
        extract = "            content = await page.text_content(\"body\") or \"\"\n";
    }

    std::ostringstream script;
    script << "import asyncio\n"
           << "import json\n"
           << "\n"
           << "async def main():\n"
           << "    try:\n"
           << "        from playwright.async_api import async_playwright\n"
           << "\n"
           << "        async with async_playwright() as p:\n"
           << "            browser = await p.chromium.launch(headless=True)\n"
           << "            page = await browser.new_page()\n"
           << "            await page.goto(" << json(url).dump() << ", wait_until=\"domcontentloaded\")\n"
           << "            title = await page.title()\n"
           << extract
           << "            result = {\n"
           << "                \"status\": \"success\",\n"
           << "                \"url\": page.url,\n"
           << "                \"title\": title,\n"
           << "                \"content\": content[:" << max_chars << "],\n"
           << "            }\n"
           << "            await browser.close()\n"
           << "            print(json.dumps(result))\n"
           << "    except Exception as e:\n"
           << "        print(json.dumps({\"status\": \"error\", \"error\": str(e)}))\n"
           << "\n"
           << "asyncio.run(main())\n";
    return script.str();
}

// ============================================================================
// REGISTRATION
// ============================================================================

void RegisterSandboxTools(ToolRegistry& registry, const SandboxToolOptions& options) {
    {
        ToolDescriptor tool;
        tool.name = "shell";
        tool.location = ToolLocation::SANDBOX;
        tool.description =
            "Execute bash commands for system operations: file management, package installation "
            "(pip install, apt-get), downloads (curl, wget), process management and git. "
            "Use python for data processing.";
        tool.input_schema
            .Required("command", PropertyType::STRING, "The shell command to execute in the sandbox.")
            .Optional("working_dir", PropertyType::STRING, "Working directory for the command.",
                      json(core::kWorkspaceRoot))
            .Optional("timeout", PropertyType::INTEGER, "Timeout in seconds.");
        tool.handler = SandboxHandler(RunShell);
        registry.Register(std::move(tool));
    }
    {
        ToolDescriptor tool;
        tool.name = "python";
        tool.location = ToolLocation::SANDBOX;
        tool.description =
            "Execute Python code for data processing and computation: pandas, numpy, parsing "
            "JSON/CSV/XML, HTTP requests, text processing. Save generated files to /workspace/output/.";
        tool.input_schema
            .Required("code", PropertyType::STRING, "Python code to execute in the sandbox.")
            .Optional("timeout", PropertyType::INTEGER, "Timeout in seconds.");
        tool.handler = SandboxHandler(
            [options](const json& args, protocol::ExecutionProtocol& protocol,
                      const core::CancellationToken& token) {
                return RunPython(args, protocol, token, options);
            });
        registry.Register(std::move(tool));
    }
    {
        ToolDescriptor tool;
        tool.name = "file_read";
        tool.location = ToolLocation::SANDBOX;
        tool.description = "Read the contents of a file in the sandbox workspace.";
        tool.input_schema.Required("path", PropertyType::STRING,
                                   "Path of the file, relative to /workspace or absolute inside it.");
        tool.handler = SandboxHandler(ReadFileTool);
        registry.Register(std::move(tool));
    }
    {
        ToolDescriptor tool;
        tool.name = "file_write";
        tool.location = ToolLocation::SANDBOX;
        tool.description = "Write content to a file in the sandbox workspace, creating parent directories.";
        tool.input_schema
            .Required("path", PropertyType::STRING, "Path where the file should be written.")
            .Required("content", PropertyType::STRING, "Content to write to the file.");
        tool.handler = SandboxHandler(WriteFileTool);
        registry.Register(std::move(tool));
    }
    {
        ToolDescriptor tool;
        tool.name = "web_browse";
        tool.location = ToolLocation::SANDBOX;
        tool.description =
            "Browse a webpage and return its title and text content. "
            "Use 'selector' to target specific CSS elements.";
        tool.input_schema
            .Required("url", PropertyType::STRING, "URL to browse.")
            .Optional("selector", PropertyType::STRING, "Optional CSS selector to extract specific elements.");
        tool.handler = SandboxHandler(WebBrowse);
        registry.Register(std::move(tool));
    }
}

} // namespace tools
} // namespace enclave
