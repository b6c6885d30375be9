#include "tools/remote_tool_provider.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace agentloop::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolDescriptor;

namespace {

std::string first_text_block(const nlohmann::json& content) {
    if (!content.is_array()) {
        return "";
    }
    for (const auto& block : content) {
        if (block.is_object() && block.contains("text") && block["text"].is_string()) {
            return block["text"].get<std::string>();
        }
    }
    return "";
}

bool whitelisted(const std::optional<std::vector<std::string>>& whitelist,
                 const std::string& name) {
    if (!whitelist.has_value()) {
        return true;
    }
    const auto& names = whitelist.value();
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

std::string to_string(const SessionKind kind) {
    switch (kind) {
        case SessionKind::Stdio:
            return "stdio";
        case SessionKind::StreamableHttp:
            return "streamable_http";
        default:
            return "unknown";
    }
}

RemoteToolProvider::RemoteToolProvider(ConnectTag, std::shared_ptr<ToolSession> session,
                                       const SessionKind kind,
                                       std::vector<ToolDescriptor> tools)
    : session_(std::move(session)), kind_(kind), tools_(std::move(tools)) {}

core::errors::Result<std::shared_ptr<RemoteToolProvider>> RemoteToolProvider::connect(
    std::shared_ptr<ToolSession> session, const SessionKind kind,
    std::optional<std::vector<std::string>> whitelist) {
    if (!session) {
        return AgentError{ErrorCategory::Input, "Remote tool session is null.",
                          "missing_tool_session"};
    }

    auto listed = session->list_tools();
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }

    std::vector<ToolDescriptor> tools;
    for (const auto& info : core::errors::get_value(listed)) {
        if (!whitelisted(whitelist, info.name)) {
            continue;
        }
        if (!protocol::is_valid_tool_name(info.name)) {
            LOG_WARN("RemoteToolProvider: skipping tool with unsupported name '" +
                     info.name + "'");
            continue;
        }
        ToolDescriptor descriptor;
        descriptor.name = info.name;
        descriptor.description = info.description;
        descriptor.schema = info.input_schema;
        tools.push_back(std::move(descriptor));
    }

    LOG_DEBUG("RemoteToolProvider: connected " + to_string(kind) + " session with " +
              std::to_string(tools.size()) + " tools");
    return std::make_shared<RemoteToolProvider>(ConnectTag{}, std::move(session), kind,
                                                std::move(tools));
}

core::errors::Result<std::vector<ToolDescriptor>> RemoteToolProvider::list_tools() const {
    return tools_;
}

bool RemoteToolProvider::has_tool(const std::string& name) const {
    return std::any_of(tools_.begin(), tools_.end(),
                       [&name](const ToolDescriptor& d) { return d.name == name; });
}

core::errors::Result<nlohmann::json> RemoteToolProvider::format_arguments(
    const std::string& name, const nlohmann::json& arguments) const {
    if (arguments.is_object()) {
        return arguments;
    }
    // HTTP servers accept an omitted argument map; stdio servers are strict.
    if (kind_ == SessionKind::StreamableHttp && arguments.is_null()) {
        return nlohmann::json::object();
    }
    return core::errors::tool_failure(
        "Invalid arguments for '" + name + "': expected a JSON object", "invalid_arguments");
}

core::errors::Result<std::string> RemoteToolProvider::invoke(
    const std::string& name, const nlohmann::json& arguments) const {
    if (!has_tool(name)) {
        return AgentError{ErrorCategory::ToolNotFound,
                          "Tool named '" + name + "' not found",
                          "tool_not_found"};
    }

    auto formatted = format_arguments(name, arguments);
    if (core::errors::is_error(formatted)) {
        return core::errors::get_error(formatted);
    }

    auto called = session_->call_tool(name, core::errors::get_value(formatted));
    if (core::errors::is_error(called)) {
        return core::errors::get_error(called);
    }
    const auto& result = core::errors::get_value(called);

    if (result.is_error) {
        std::string message = first_text_block(result.content);
        if (message.find("Unknown tool") != std::string::npos) {
            return AgentError{ErrorCategory::ToolNotFound,
                              "Tool named '" + name + "' not found",
                              "tool_not_found"};
        }
        if (message.empty()) {
            message = "Unknown error";
        }
        return core::errors::tool_failure("Tool error: " + message, "remote_tool_error");
    }

    return result.content.dump();
}

}  // namespace agentloop::tools
