#pragma once

#include <bullvision/core/result.hpp>
#include <bullvision/server/i_tool_servers.hpp>
#include <bullvision/server/server_handle.hpp>
#include <bullvision/server/tool_server_connection.hpp>
#include <bullvision/server/tool_server_spec.hpp>
#include <bullvision/server/transport_factory.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bullvision {

struct ConnectionStatus {
    std::string name;
    ConnectionState state = ConnectionState::Unconnected;
};

// ---------------------------------------------------------------------------
// ServerSessionManager — owns the connections to all configured backends.
//
// Start() connects to every backend concurrently and succeeds only if all of
// them connect; otherwise the ones that did connect are closed again in
// reverse order and the first error (in start order) is returned.
//
// Stop() closes every connection in reverse start order, isolating the
// failures of each, and never throws. Destruction implies Stop().
// ---------------------------------------------------------------------------
class ServerSessionManager : public IToolServers {
public:
    explicit ServerSessionManager(TransportFactory factory,
                                  ConnectionOptions options = {});
    ~ServerSessionManager() override;

    [[nodiscard]] Result<std::vector<ServerHandle>, Error> Start(
        const std::vector<ToolServerSpec>& specs);

    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools(
        const ServerHandle& handle) override;

    [[nodiscard]] Result<nlohmann::json, Error> CallTool(
        const ServerHandle& handle,
        const std::string& tool_name,
        const nlohmann::json& arguments) override;

    [[nodiscard]] Result<void, Error> InvalidateToolCache(const ServerHandle& handle);

    void Stop();

    /// Handles of the running connections, in start order.
    [[nodiscard]] std::vector<ServerHandle> Handles() const;

    /// Name and state of each connection, in start order.
    [[nodiscard]] std::vector<ConnectionStatus> Status() const;

private:
    enum class Phase { Idle, Starting, Running, Stopped };

    using ConnectionPtr = std::shared_ptr<ToolServerConnection>;

    Result<ConnectionPtr, Error> Resolve(const ServerHandle& handle,
                                         const char* operation) const;
    static std::size_t CloseInReverse(const std::vector<ConnectionPtr>& connections);

    TransportFactory factory_;
    ConnectionOptions options_;
    const std::uint64_t id_;

    mutable std::mutex mutex_;
    Phase phase_ = Phase::Idle;
    std::vector<ConnectionPtr> connections_;
};

} // namespace bullvision
