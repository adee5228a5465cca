#include <bullvision/mcp/rpc_session.hpp>

#include <bullvision/core/log.hpp>
#include <bullvision/mcp/mcp_messages.hpp>

#include <vector>

namespace bullvision {

RpcSession::RpcSession(std::string server, ITransport& transport)
    : server_(std::move(server)), transport_(transport) {}

void RpcSession::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_notification_ = std::move(handler);
}

void RpcSession::SetFailureHandler(SessionFailureHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_failure_ = std::move(handler);
}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------

Result<nlohmann::json, Error> RpcSession::Request(const std::string& method,
                                                  const nlohmann::json& params,
                                                  std::chrono::milliseconds timeout) {
    std::int64_t id = 0;
    std::future<Reply> reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_.has_value()) {
            auto err = *broken_;
            err.operation = method;
            return Reply::Err(std::move(err));
        }
        if (closed_) {
            return Reply::Err(Error::Make(ErrorCategory::Protocol, method, server_,
                                          "Session is closed"));
        }
        id = next_id_++;
        auto promise = std::make_shared<std::promise<Reply>>();
        reply = promise->get_future();
        pending_[id] = std::move(promise);
    }

    auto sent = transport_.Send(rpc::Serialize(rpc::MakeRequest(id, method, params)));
    if (sent.IsErr()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(id);
        }
        auto err = sent.Error();
        err.operation = method;
        err.target = server_;
        if (err.Is(ErrorCategory::Protocol)) {
            Break(err);
        }
        return Reply::Err(std::move(err));
    }

    if (reply.wait_for(timeout) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.erase(id) > 0) {
            return Reply::Err(Error::Make(
                ErrorCategory::Timeout, method, server_,
                "No response within " + std::to_string(timeout.count()) + " ms"));
        }
        // The response won the race against the deadline; it is already set.
    }
    return reply.get();
}

Result<void, Error> RpcSession::Notify(const std::string& method,
                                       const nlohmann::json& params) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_.has_value() || closed_) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::Protocol, method, server_, "Session is not open"));
        }
    }
    auto sent = transport_.Send(rpc::Serialize(rpc::MakeNotification(method, params)));
    if (sent.IsErr()) {
        auto err = sent.Error();
        err.operation = method;
        err.target = server_;
        return Result<void, Error>::Err(std::move(err));
    }
    return Result<void, Error>::Ok();
}

void RpcSession::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
    FailAllPending(Error::Make(ErrorCategory::Protocol, "Close", server_,
                               "Session closed while the request was in flight"));
}

bool RpcSession::IsBroken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return broken_.has_value();
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------

void RpcSession::OnLine(const std::string& line) {
    auto parsed = rpc::ParseMessage(line);
    if (parsed.IsErr()) {
        auto err = parsed.Error();
        err.target = server_;
        LogError("rpc", err.ToString());
        Break(err);
        return;
    }
    const auto& msg = parsed.Value();

    switch (msg.kind) {
        case rpc::MessageKind::Response:
            HandleResponse(msg);
            break;
        case rpc::MessageKind::Request:
            HandleServerRequest(msg);
            break;
        case rpc::MessageKind::Notification: {
            NotificationHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                handler = on_notification_;
            }
            LogDebug("rpc", server_ + ": notification " + msg.method);
            if (handler) handler(msg);
            break;
        }
    }
}

void RpcSession::OnTransportClosed(const std::string& reason) {
    Break(Error::Make(ErrorCategory::Protocol, "Read", server_,
                      "Transport closed: " + reason));
}

void RpcSession::HandleResponse(const rpc::Message& msg) {
    if (!msg.id.is_number_integer()) {
        LogWarn("rpc", server_ + ": dropping response with foreign id " + msg.id.dump());
        return;
    }
    const auto id = msg.id.get<std::int64_t>();

    std::shared_ptr<std::promise<Reply>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            LogWarn("rpc", server_ + ": dropping response for unknown or expired id " +
                           std::to_string(id));
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }

    if (msg.IsErrorResponse()) {
        const auto& eo = *msg.error;
        auto err = Error::Make(ErrorCategory::BackendRejected, "Response", server_,
                               eo.message.empty() ? "Server returned an error" : eo.message);
        err.rpc_code = eo.code;
        if (!eo.data.is_null()) {
            err.detail = eo.data.dump();
        }
        promise->set_value(Reply::Err(std::move(err)));
        return;
    }
    promise->set_value(Reply::Ok(msg.result));
}

void RpcSession::HandleServerRequest(const rpc::Message& msg) {
    nlohmann::json reply;
    if (msg.method == mcp::kMethodPing) {
        reply = rpc::MakeResult(msg.id, nlohmann::json::object());
    } else {
        LogDebug("rpc", server_ + ": rejecting server request " + msg.method);
        reply = rpc::MakeError(msg.id, rpc::kMethodNotFound,
                               "Method not found: " + msg.method);
    }
    auto sent = transport_.Send(rpc::Serialize(reply));
    if (sent.IsErr()) {
        LogWarn("rpc", server_ + ": failed to answer " + msg.method + ": " +
                       sent.Error().message);
    }
}

// ---------------------------------------------------------------------------
// Failure
// ---------------------------------------------------------------------------

void RpcSession::Break(const Error& cause) {
    SessionFailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_.has_value() || closed_) return;
        broken_ = cause;
        FailAllPending(cause);
        handler = on_failure_;
    }
    if (handler) handler(cause);
}

void RpcSession::FailAllPending(const Error& cause) {
    for (auto& entry : pending_) {
        auto err = cause;
        err.target = server_;
        entry.second->set_value(Reply::Err(std::move(err)));
    }
    pending_.clear();
}

} // namespace bullvision
