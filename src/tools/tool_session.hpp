#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace agentloop::tools {

struct RemoteToolInfo {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();
};

// Result of a remote tools/call. `content` is the server's array of content
// blocks, e.g. [{"type":"text","text":"..."}].
struct RemoteCallResult {
    nlohmann::json content = nlohmann::json::array();
    bool is_error = false;
};

// An established session with an out-of-process or networked tool server.
// Spawning the server, the handshake and the framing belong to the
// implementation; failures must be reported as ErrorCategory::Transport.
class ToolSession {
public:
    virtual ~ToolSession() = default;

    virtual core::errors::Result<std::vector<RemoteToolInfo>> list_tools() = 0;

    virtual core::errors::Result<RemoteCallResult> call_tool(
        const std::string& name, const nlohmann::json& arguments) = 0;
};

}  // namespace agentloop::tools
