#include "tools/function_tool_provider.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace agentloop::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolDescriptor;

core::errors::Result<std::string> FunctionToolProvider::add(
    std::string name, std::optional<std::string> description,
    std::optional<nlohmann::json> schema, ToolHandler handler) {
    ToolDescriptor descriptor;
    descriptor.name = std::move(name);
    descriptor.description = std::move(description);
    descriptor.schema = std::move(schema);
    return add(std::move(descriptor), std::move(handler));
}

core::errors::Result<std::string> FunctionToolProvider::add(
    ToolDescriptor descriptor, ToolHandler handler) {
    if (!protocol::is_valid_tool_name(descriptor.name)) {
        return AgentError{ErrorCategory::Input,
                          "Invalid tool name: '" + descriptor.name + "'",
                          "invalid_tool_name",
                          "Use 1-64 letters, digits, '_' or '-'."};
    }
    if (!handler) {
        return AgentError{ErrorCategory::Input,
                          "Tool '" + descriptor.name + "' has no handler.",
                          "missing_tool_handler"};
    }
    if (contains(descriptor.name)) {
        return AgentError{ErrorCategory::Input,
                          "Tool already registered: " + descriptor.name,
                          "duplicate_tool_name"};
    }

    std::string name = descriptor.name;
    entries_.push_back(Entry{std::move(descriptor), std::move(handler)});
    LOG_DEBUG("FunctionToolProvider: registered tool " + name);
    return name;
}

bool FunctionToolProvider::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const FunctionToolProvider::Entry* FunctionToolProvider::find(
    const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.descriptor.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

core::errors::Result<std::vector<ToolDescriptor>> FunctionToolProvider::list_tools() const {
    std::vector<ToolDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.descriptor);
    }
    return out;
}

core::errors::Result<std::string> FunctionToolProvider::invoke(
    const std::string& name, const nlohmann::json& arguments) const {
    const Entry* entry = find(name);
    if (entry == nullptr) {
        return AgentError{ErrorCategory::ToolNotFound,
                          "Tool named '" + name + "' not found",
                          "tool_not_found"};
    }

    // Handlers read arguments with nlohmann accessors, which throw on a
    // missing key or wrong type. That is the model's mistake, not ours.
    try {
        return entry->handler(arguments);
    } catch (const nlohmann::json::exception& e) {
        return core::errors::tool_failure(
            "Invalid arguments for '" + name + "': " + e.what(), "invalid_arguments");
    } catch (const std::exception& e) {
        return core::errors::tool_failure(
            "Tool '" + name + "' failed: " + e.what(), "tool_exception");
    }
}

}  // namespace agentloop::tools
