#pragma once

#include <bullvision/core/result.hpp>
#include <bullvision/mcp/rpc_session.hpp>
#include <bullvision/mcp/types.hpp>
#include <bullvision/server/tool_server_spec.hpp>
#include <bullvision/transport/i_transport.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace bullvision {

enum class ConnectionState {
    Unconnected,
    Connecting,
    Ready,
    Closing,
    Closed,
    Failed,
};

std::string_view ConnectionStateName(ConnectionState state);

struct ConnectionOptions {
    std::chrono::milliseconds handshake_timeout{15000};
    std::chrono::milliseconds call_timeout{60000};
};

// ---------------------------------------------------------------------------
// ToolServerConnection — one live session with one tool server.
//
// State machine:
//   Unconnected -> Connecting -> Ready -> Closing -> Closed
//   Connecting -> Failed            (launch or handshake failure)
//   Ready -> Failed                 (protocol error or transport loss)
//   Failed -> Closing -> Closed     (explicit Close)
//
// Tool calls are only issued in Ready. Timeouts fail the call, not the
// connection. Close() never throws and is idempotent.
// ---------------------------------------------------------------------------
class ToolServerConnection {
public:
    ToolServerConnection(ToolServerSpec spec, std::unique_ptr<ITransport> transport,
                         ConnectionOptions options = {});
    ~ToolServerConnection();

    ToolServerConnection(const ToolServerConnection&) = delete;
    ToolServerConnection& operator=(const ToolServerConnection&) = delete;

    /// Launch the server and perform the initialize handshake. On failure
    /// every resource acquired so far is released and the state is Failed.
    [[nodiscard]] Result<void, Error> Connect();

    /// The server's tools, served from cache when cache_tools_list is set
    /// and the cache is valid. A failed refresh keeps the previous cache.
    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools();

    /// Invoke one tool. Returns the raw tools/call result on success.
    [[nodiscard]] Result<nlohmann::json, Error> CallTool(const std::string& tool_name,
                                                         const nlohmann::json& arguments);

    /// Release the session, the streams and the process, in that order.
    /// Returns the cleanup errors encountered; each is already logged.
    std::vector<Error> Close();

    void InvalidateToolCache();

    [[nodiscard]] ConnectionState State() const;
    [[nodiscard]] const ToolServerSpec& Spec() const noexcept { return spec_; }
    [[nodiscard]] const std::string& Name() const noexcept { return spec_.name.Value(); }
    [[nodiscard]] std::optional<ServerInfo> Info() const;

private:
    Result<void, Error> FailConnect(Error cause);
    void MarkFailed(const Error& cause);
    std::vector<Error> ReleaseResources();
    Result<std::vector<ToolDescriptor>, Error> FetchAllPages();

    ToolServerSpec spec_;
    ConnectionOptions options_;

    mutable std::mutex state_mutex_;
    ConnectionState state_ = ConnectionState::Unconnected;
    std::optional<ServerInfo> info_;

    std::mutex cache_mutex_;
    std::vector<ToolDescriptor> cached_tools_;
    bool cache_valid_ = false;
    std::uint64_t cache_epoch_ = 0;   // bumped by every invalidation
    std::mutex refresh_mutex_;        // one tools/list round trip at a time

    std::mutex close_mutex_;

    // The session must outlive the transport's reader thread, which the
    // transport joins on destruction; members are destroyed in reverse order.
    std::unique_ptr<RpcSession> session_;
    std::unique_ptr<ITransport> transport_;
};

} // namespace bullvision
