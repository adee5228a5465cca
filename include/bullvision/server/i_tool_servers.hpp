#pragma once

#include <bullvision/core/result.hpp>
#include <bullvision/mcp/types.hpp>
#include <bullvision/server/server_handle.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bullvision {

// ---------------------------------------------------------------------------
// IToolServers — the tool-server operations the agent layer depends on.
//
// ServerSessionManager is the production implementation; tests use
// MockToolServers.
// ---------------------------------------------------------------------------
class IToolServers {
public:
    IToolServers() = default;
    virtual ~IToolServers() = default;

    IToolServers(const IToolServers&) = delete;
    IToolServers& operator=(const IToolServers&) = delete;
    IToolServers(IToolServers&&) = delete;
    IToolServers& operator=(IToolServers&&) = delete;

    [[nodiscard]] virtual Result<std::vector<ToolDescriptor>, Error> ListTools(
        const ServerHandle& handle) = 0;

    [[nodiscard]] virtual Result<nlohmann::json, Error> CallTool(
        const ServerHandle& handle,
        const std::string& tool_name,
        const nlohmann::json& arguments) = 0;
};

} // namespace bullvision
