#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace agentloop::tools {

// A source of named tools. The error category of a failed invoke decides what
// the engine does with it: ToolExecution is reported back to the model,
// ToolNotFound and Transport abort the run.
class ToolProvider {
public:
    virtual ~ToolProvider() = default;

    virtual core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() const = 0;

    virtual core::errors::Result<std::string> invoke(
        const std::string& name, const nlohmann::json& arguments) const = 0;
};

}  // namespace agentloop::tools
