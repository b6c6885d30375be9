#include "tools/tool_registry.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace agentloop::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolDescriptor;

namespace {

AgentError tool_not_found(const std::string& name) {
    return AgentError{ErrorCategory::ToolNotFound,
                      "Tool named '" + name + "' not found", "tool_not_found"};
}

}  // namespace

std::string ToolRegistry::public_name(const std::size_t ordinal,
                                      const std::string& local_name) {
    return std::to_string(ordinal) + kSeparator + local_name;
}

core::errors::Result<std::size_t> ToolRegistry::add_provider(
    std::shared_ptr<ToolProvider> provider) {
    if (!provider) {
        return AgentError{ErrorCategory::Input, "Tool provider is null.",
                          "missing_tool_provider"};
    }

    auto listed = provider->list_tools();
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }

    const std::size_t ordinal = slots_.size();
    Slot slot;
    slot.provider = std::move(provider);
    for (const auto& descriptor : core::errors::get_value(listed)) {
        ToolDescriptor renamed = descriptor;
        renamed.name = public_name(ordinal, descriptor.name);
        if (!protocol::is_valid_tool_name(renamed.name)) {
            LOG_WARN("ToolRegistry: dropping tool '" + descriptor.name +
                     "', public name '" + renamed.name + "' is not accepted by backends");
            continue;
        }
        slot.descriptors.push_back(std::move(renamed));
    }

    LOG_DEBUG("ToolRegistry: provider " + std::to_string(ordinal) + " exposes " +
              std::to_string(slot.descriptors.size()) + " tools");
    slots_.push_back(std::move(slot));
    return ordinal;
}

core::errors::Result<std::string> ToolRegistry::add_tool(ToolDescriptor descriptor,
                                                         ToolHandler handler) {
    const std::string local_name = descriptor.name;
    const bool first_local_tool = !local_tools_;
    const std::size_t ordinal = first_local_tool ? slots_.size() : local_ordinal_;

    const std::string exposed = public_name(ordinal, local_name);
    if (!protocol::is_valid_tool_name(exposed)) {
        return AgentError{ErrorCategory::Input,
                          "Invalid tool name: '" + exposed + "'",
                          "invalid_tool_name",
                          "Use 1-64 letters, digits, '_' or '-' including the ordinal prefix."};
    }

    auto provider = first_local_tool ? std::make_shared<FunctionToolProvider>()
                                     : local_tools_;
    auto added = provider->add(descriptor, std::move(handler));
    if (core::errors::is_error(added)) {
        return core::errors::get_error(added);
    }

    if (first_local_tool) {
        local_tools_ = provider;
        local_ordinal_ = ordinal;
        slots_.push_back(Slot{provider, {}});
    }

    descriptor.name = exposed;
    slots_[local_ordinal_].descriptors.push_back(std::move(descriptor));
    return exposed;
}

core::errors::Result<std::vector<ToolDescriptor>> ToolRegistry::list_tools() const {
    std::vector<ToolDescriptor> out;
    for (const auto& slot : slots_) {
        out.insert(out.end(), slot.descriptors.begin(), slot.descriptors.end());
    }
    return out;
}

std::optional<ToolRegistry::Route> ToolRegistry::resolve(
    const std::string& public_name) const {
    const auto separator = public_name.find(kSeparator);
    if (separator == std::string::npos || separator == 0) {
        return std::nullopt;
    }

    std::size_t ordinal = 0;
    const char* begin = public_name.data();
    const char* end = public_name.data() + separator;
    auto [ptr, ec] = std::from_chars(begin, end, ordinal);
    if (ec != std::errc() || ptr != end || ordinal >= slots_.size()) {
        return std::nullopt;
    }

    // Names dropped at registration stay unreachable.
    const auto& listed = slots_[ordinal].descriptors;
    const bool exposed = std::any_of(
        listed.begin(), listed.end(),
        [&public_name](const ToolDescriptor& d) { return d.name == public_name; });
    if (!exposed) {
        return std::nullopt;
    }

    return Route{ordinal, public_name.substr(separator + 1)};
}

core::errors::Result<std::string> ToolRegistry::invoke(
    const std::string& name, const nlohmann::json& arguments) const {
    const auto route = resolve(name);
    if (!route.has_value()) {
        return tool_not_found(name);
    }

    LOG_TRACE("ToolRegistry: routing " + name + " to provider " +
              std::to_string(route->ordinal) + " as " + route->local_name);
    return slots_[route->ordinal].provider->invoke(route->local_name, arguments);
}

core::errors::Result<ToolRegistry> make_registry(
    const std::vector<std::shared_ptr<ToolProvider>>& providers) {
    ToolRegistry registry;
    for (const auto& provider : providers) {
        auto added = registry.add_provider(provider);
        if (core::errors::is_error(added)) {
            return core::errors::get_error(added);
        }
    }
    return registry;
}

}  // namespace agentloop::tools
