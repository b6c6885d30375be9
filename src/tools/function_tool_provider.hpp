#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_provider.hpp"

namespace agentloop::tools {

using ToolHandler =
    std::function<core::errors::Result<std::string>(const nlohmann::json& arguments)>;

// Local method table: each registration pairs a descriptor with a handler that
// receives the raw JSON arguments.
class FunctionToolProvider : public ToolProvider {
public:
    core::errors::Result<std::string> add(
        std::string name, std::optional<std::string> description,
        std::optional<nlohmann::json> schema, ToolHandler handler);

    core::errors::Result<std::string> add(protocol::ToolDescriptor descriptor,
                                          ToolHandler handler);

    bool contains(const std::string& name) const;
    std::size_t size() const { return entries_.size(); }

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() const override;

    core::errors::Result<std::string> invoke(
        const std::string& name, const nlohmann::json& arguments) const override;

private:
    struct Entry {
        protocol::ToolDescriptor descriptor;
        ToolHandler handler;
    };

    const Entry* find(const std::string& name) const;

    std::vector<Entry> entries_;
};

}  // namespace agentloop::tools
