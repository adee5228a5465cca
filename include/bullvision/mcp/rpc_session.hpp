#pragma once

#include <bullvision/core/result.hpp>
#include <bullvision/mcp/json_rpc.hpp>
#include <bullvision/transport/i_transport.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace bullvision {

using NotificationHandler = std::function<void(const rpc::Message& notification)>;
using SessionFailureHandler = std::function<void(const Error& cause)>;

// ---------------------------------------------------------------------------
// RpcSession — JSON-RPC 2.0 request/response correlation over an ITransport.
//
// Any number of threads may have a Request() in flight; each waits on its
// own future, keyed by request id. Inbound traffic arrives through OnLine()
// and OnTransportClosed(), which the owner wires to the transport handlers.
//
// A malformed inbound line or the end of the inbound stream breaks the
// session: every waiter fails with ErrorCategory::Protocol and the failure
// handler runs once. Responses for unknown ids are logged and dropped.
// ---------------------------------------------------------------------------
class RpcSession {
public:
    RpcSession(std::string server, ITransport& transport);

    RpcSession(const RpcSession&) = delete;
    RpcSession& operator=(const RpcSession&) = delete;

    void SetNotificationHandler(NotificationHandler handler);
    void SetFailureHandler(SessionFailureHandler handler);

    /// Send a request and wait up to `timeout` for its response.
    /// Error responses map to ErrorCategory::BackendRejected with rpc_code
    /// and detail set; an expired wait maps to ErrorCategory::Timeout.
    [[nodiscard]] Result<nlohmann::json, Error> Request(
        const std::string& method, const nlohmann::json& params,
        std::chrono::milliseconds timeout);

    [[nodiscard]] Result<void, Error> Notify(const std::string& method,
                                             const nlohmann::json& params = nullptr);

    /// Fail all waiters and refuse further requests. Idempotent.
    void Close();

    [[nodiscard]] bool IsBroken() const;

    // -- Transport entry points (reader thread) -------------------------------

    void OnLine(const std::string& line);
    void OnTransportClosed(const std::string& reason);

private:
    using Reply = Result<nlohmann::json, Error>;

    void HandleResponse(const rpc::Message& msg);
    void HandleServerRequest(const rpc::Message& msg);
    void Break(const Error& cause);
    void FailAllPending(const Error& cause);

    std::string server_;
    ITransport& transport_;

    mutable std::mutex mutex_;
    std::int64_t next_id_ = 1;
    std::map<std::int64_t, std::shared_ptr<std::promise<Reply>>> pending_;
    std::optional<Error> broken_;
    bool closed_ = false;

    NotificationHandler on_notification_;
    SessionFailureHandler on_failure_;
};

} // namespace bullvision
