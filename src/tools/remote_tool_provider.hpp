#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_provider.hpp"
#include "tools/tool_session.hpp"

namespace agentloop::tools {

enum class SessionKind {
    Stdio,           // locally spawned subprocess server
    StreamableHttp   // network-addressed server
};

std::string to_string(SessionKind kind);

// Proxies a remote tool server. The tool list is fetched once at connect time
// and stays fixed for the provider's lifetime. Concurrent invokes are safe
// only if the underlying session tolerates them.
class RemoteToolProvider : public ToolProvider {
    // Only connect() can name this, so only connect() can construct.
    struct ConnectTag {
        explicit ConnectTag() = default;
    };

public:
    static core::errors::Result<std::shared_ptr<RemoteToolProvider>> connect(
        std::shared_ptr<ToolSession> session, SessionKind kind,
        std::optional<std::vector<std::string>> whitelist = std::nullopt);

    RemoteToolProvider(ConnectTag, std::shared_ptr<ToolSession> session, SessionKind kind,
                       std::vector<protocol::ToolDescriptor> tools);

    SessionKind kind() const { return kind_; }

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() const override;

    core::errors::Result<std::string> invoke(
        const std::string& name, const nlohmann::json& arguments) const override;

private:
    core::errors::Result<nlohmann::json> format_arguments(
        const std::string& name, const nlohmann::json& arguments) const;
    bool has_tool(const std::string& name) const;

    std::shared_ptr<ToolSession> session_;
    SessionKind kind_;
    std::vector<protocol::ToolDescriptor> tools_;
};

}  // namespace agentloop::tools
