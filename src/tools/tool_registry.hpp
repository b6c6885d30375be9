#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/function_tool_provider.hpp"
#include "tools/tool_provider.hpp"

namespace agentloop::tools {

// Aggregates providers under one namespace. Provider i exposes its tool
// "name" as "<i>-name", so equal local names from different providers never
// collide. Ordinals are assigned in registration order and never change.
//
// The mapping is fixed once registration is done; the registry takes no
// locks and may be shared read-only between engines.
class ToolRegistry : public ToolProvider {
public:
    static constexpr char kSeparator = '-';

    static std::string public_name(std::size_t ordinal, const std::string& local_name);

    // Snapshots the provider's descriptors and returns its ordinal.
    core::errors::Result<std::size_t> add_provider(std::shared_ptr<ToolProvider> provider);

    // Registers a single tool. All such tools share one registry-owned
    // provider whose ordinal is allocated on the first call. Returns the
    // public name.
    core::errors::Result<std::string> add_tool(protocol::ToolDescriptor descriptor,
                                               ToolHandler handler);

    std::size_t provider_count() const { return slots_.size(); }

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() const override;

    core::errors::Result<std::string> invoke(
        const std::string& name, const nlohmann::json& arguments) const override;

private:
    struct Slot {
        std::shared_ptr<ToolProvider> provider;
        std::vector<protocol::ToolDescriptor> descriptors;  // public names
    };

    struct Route {
        std::size_t ordinal = 0;
        std::string local_name;
    };

    std::optional<Route> resolve(const std::string& public_name) const;

    std::vector<Slot> slots_;
    std::shared_ptr<FunctionToolProvider> local_tools_;
    std::size_t local_ordinal_ = 0;
};

// Builds a registry from providers in order (provider k gets ordinal k).
core::errors::Result<ToolRegistry> make_registry(
    const std::vector<std::shared_ptr<ToolProvider>>& providers);

}  // namespace agentloop::tools
