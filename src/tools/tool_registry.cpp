/**
 * @file tool_registry.cpp
 * @brief Tool registration and lookup
 *
 * @date 2026
 */

#include "enclave/tools/tool_registry.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace enclave {
namespace tools {

const char* ToString(ToolLocation location) {
    return location == ToolLocation::HOST ? "host" : "sandbox";
}

json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"location", ToString(location)},
        {"description", description},
        {"input_schema", input_schema.ToJson()}
    };
}

void ToolRegistry::Register(ToolDescriptor descriptor) {
    if (sealed_) {
        throw std::logic_error("Tool registry is sealed, cannot register " + descriptor.name);
    }
    if (descriptor.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (index_.count(descriptor.name) != 0) {
        throw std::invalid_argument("Tool already registered: " + descriptor.name);
    }

    bool host_handler = std::holds_alternative<HostHandler>(descriptor.handler);
    if (host_handler != (descriptor.location == ToolLocation::HOST)) {
        throw std::invalid_argument("Handler of tool " + descriptor.name +
                                    " does not match its location");
    }

    spdlog::debug("Registered {} tool '{}'", ToString(descriptor.location), descriptor.name);

    index_[descriptor.name] = tools_.size();
    tools_.push_back(std::move(descriptor));
}

void ToolRegistry::SetAllowList(const std::vector<std::string>& names) {
    if (sealed_) {
        throw std::logic_error("Tool registry is sealed");
    }
    if (names.empty()) {
        allow_list_.reset();
        return;
    }

    std::set<std::string> allowed;
    for (const auto& name : names) {
        if (index_.count(name) == 0) {
            throw std::invalid_argument("Unknown tool in allow list: " + name);
        }
        allowed.insert(name);
    }
    allow_list_ = std::move(allowed);
}

bool ToolRegistry::IsAllowed(const std::string& name) const {
    return !allow_list_.has_value() || allow_list_->count(name) != 0;
}

const ToolDescriptor* ToolRegistry::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end() || !IsAllowed(name)) {
        return nullptr;
    }
    return &tools_[it->second];
}

std::vector<const ToolDescriptor*> ToolRegistry::Visible() const {
    std::vector<const ToolDescriptor*> visible;
    for (const auto& tool : tools_) {
        if (IsAllowed(tool.name)) {
            visible.push_back(&tool);
        }
    }
    return visible;
}

std::string ToolRegistry::Describe() const {
    std::ostringstream out;
    for (const auto* tool : Visible()) {
        out << "- " << tool->name << " [" << ToString(tool->location) << "]: "
            << tool->description << "\n";
        for (const auto& property : tool->input_schema.Properties()) {
            out << "    " << property.name << " (" << ToString(property.type)
                << (property.required ? ", required" : "") << "): " << property.description << "\n";
        }
    }
    return out.str();
}

} // namespace tools
} // namespace enclave
