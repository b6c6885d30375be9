#pragma once
#include <memory>
#include "core/errors/agent_errors.hpp"
#include "tools/function_tool_provider.hpp"

namespace agentloop::app {

    // echo, add_numbers and utc_time, the tools replay scripts may call.
    agentloop::core::errors::Result<std::shared_ptr<agentloop::tools::FunctionToolProvider>>
    make_demo_tools();

} // namespace agentloop::app
