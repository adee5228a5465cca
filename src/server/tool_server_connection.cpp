#include <bullvision/server/tool_server_connection.hpp>

#include <bullvision/core/log.hpp>
#include <bullvision/mcp/mcp_messages.hpp>

#include <exception>

namespace bullvision {

namespace {

constexpr std::size_t kMaxToolPages = 100;

} // anonymous namespace

std::string_view ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Unconnected: return "unconnected";
        case ConnectionState::Connecting:  return "connecting";
        case ConnectionState::Ready:       return "ready";
        case ConnectionState::Closing:     return "closing";
        case ConnectionState::Closed:      return "closed";
        case ConnectionState::Failed:      return "failed";
    }
    return "unknown";
}

ToolServerConnection::ToolServerConnection(ToolServerSpec spec,
                                           std::unique_ptr<ITransport> transport,
                                           ConnectionOptions options)
    : spec_(std::move(spec)), options_(options), transport_(std::move(transport)) {
    session_ = std::make_unique<RpcSession>(spec_.name.Value(), *transport_);
    session_->SetNotificationHandler([this](const rpc::Message& msg) {
        if (msg.method == mcp::kNotifyToolsListChanged) {
            LogInfo("connection", Name() + ": tool list changed, cache invalidated");
            InvalidateToolCache();
        }
    });
    session_->SetFailureHandler([this](const Error& cause) { MarkFailed(cause); });
}

ToolServerConnection::~ToolServerConnection() {
    // Errors are logged by Close().
    Close();
}

// ---------------------------------------------------------------------------
// Connect
// ---------------------------------------------------------------------------

Result<void, Error> ToolServerConnection::Connect() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::Unconnected) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::Internal, "Connect", Name(),
                std::string("Connect called in state ") +
                    std::string(ConnectionStateName(state_))));
        }
        state_ = ConnectionState::Connecting;
    }
    LogInfo("connection", "Connecting to '" + Name() + "' (" + spec_.command + ")");

    auto opened = transport_->Open(
        [this](const std::string& line) { session_->OnLine(line); },
        [this](const std::string& reason) { session_->OnTransportClosed(reason); });
    if (opened.IsErr()) {
        auto err = opened.Error();
        err.target = Name();
        if (!err.Is(ErrorCategory::Internal)) {
            err.category = ErrorCategory::Connection;
        }
        return FailConnect(std::move(err));
    }

    auto reply = session_->Request(mcp::kMethodInitialize, mcp::MakeInitializeParams(),
                                   options_.handshake_timeout);
    if (reply.IsErr()) {
        auto err = reply.Error();
        err.operation = "Handshake";
        if (!err.Is(ErrorCategory::Timeout)) {
            err.category = ErrorCategory::Connection;
            err.message = "Initialize failed: " + err.message;
        }
        return FailConnect(std::move(err));
    }

    auto info = mcp::ParseInitializeResult(reply.Value(), Name());
    if (info.IsErr()) {
        return FailConnect(info.Error());
    }

    auto notified = session_->Notify(mcp::kMethodInitialized);
    if (notified.IsErr()) {
        auto err = notified.Error();
        err.operation = "Handshake";
        err.category = ErrorCategory::Connection;
        return FailConnect(std::move(err));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::Connecting && !session_->IsBroken()) {
            state_ = ConnectionState::Ready;
            info_ = info.Value();
        }
    }
    if (State() != ConnectionState::Ready) {
        return FailConnect(Error::Make(ErrorCategory::Connection, "Handshake", Name(),
                                       "Server went away right after the handshake"));
    }

    const auto& si = info.Value();
    LogInfo("connection", "Connected to '" + Name() + "'" +
                              (si.name.empty() ? "" : " (" + si.name + " " + si.version + ")") +
                              ", protocol " + si.protocol_version);
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolServerConnection::FailConnect(Error cause) {
    LogError("connection", cause.ToString());
    ReleaseResources();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::Failed;
    }
    return Result<void, Error>::Err(std::move(cause));
}

void ToolServerConnection::MarkFailed(const Error& cause) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ConnectionState::Ready) return;
    state_ = ConnectionState::Failed;
    LogError("connection", "'" + Name() + "' failed: " + cause.ToString());
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

Result<std::vector<ToolDescriptor>, Error> ToolServerConnection::ListTools() {
    using R = Result<std::vector<ToolDescriptor>, Error>;

    if (State() != ConnectionState::Ready) {
        return R::Err(Error::Make(ErrorCategory::NotReady, "ListTools", Name(),
                                  std::string("Connection is ") +
                                      std::string(ConnectionStateName(State()))));
    }

    auto cached = [this]() -> std::optional<std::vector<ToolDescriptor>> {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (spec_.cache_tools_list && cache_valid_) return cached_tools_;
        return std::nullopt;
    };
    if (auto hit = cached()) {
        return R::Ok(std::move(*hit));
    }

    std::lock_guard<std::mutex> refresh(refresh_mutex_);
    if (auto hit = cached()) {
        return R::Ok(std::move(*hit));
    }

    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        epoch = cache_epoch_;
    }

    auto fetched = FetchAllPages();
    if (fetched.IsErr()) {
        if (fetched.Error().Is(ErrorCategory::Protocol)) {
            MarkFailed(fetched.Error());
        }
        return fetched;
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cached_tools_ = fetched.Value();
        // An invalidation that arrived mid-fetch wins over this result.
        cache_valid_ = (cache_epoch_ == epoch);
    }
    LogDebug("connection", Name() + ": " + std::to_string(fetched.Value().size()) +
                               " tools listed");
    return fetched;
}

Result<std::vector<ToolDescriptor>, Error> ToolServerConnection::FetchAllPages() {
    using R = Result<std::vector<ToolDescriptor>, Error>;

    std::vector<ToolDescriptor> tools;
    std::optional<std::string> cursor;
    for (std::size_t page = 0; page < kMaxToolPages; ++page) {
        auto reply = session_->Request(mcp::kMethodToolsList,
                                       mcp::MakeToolsListParams(cursor),
                                       options_.call_timeout);
        if (reply.IsErr()) {
            auto err = reply.Error();
            err.operation = "ListTools";
            return R::Err(std::move(err));
        }
        auto parsed = mcp::ParseToolsListResult(reply.Value(), Name());
        if (parsed.IsErr()) {
            return R::Err(parsed.Error());
        }
        auto chunk = std::move(parsed).Value();
        for (auto& t : chunk.tools) {
            tools.push_back(std::move(t));
        }
        if (!chunk.next_cursor.has_value()) {
            return R::Ok(std::move(tools));
        }
        cursor = std::move(chunk.next_cursor);
    }
    return R::Err(Error::Make(ErrorCategory::Protocol, "ListTools", Name(),
                              "Tool list exceeds " + std::to_string(kMaxToolPages) +
                                  " pages"));
}

Result<nlohmann::json, Error> ToolServerConnection::CallTool(
    const std::string& tool_name, const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;

    const auto state = State();
    if (state != ConnectionState::Ready) {
        return R::Err(Error::Make(ErrorCategory::NotReady, "CallTool", Name(),
                                  "Cannot call '" + tool_name + "': connection is " +
                                      std::string(ConnectionStateName(state))));
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        return R::Err(Error::Make(ErrorCategory::BackendRejected, "CallTool", Name(),
                                  "Arguments for '" + tool_name +
                                      "' must be a JSON object"));
    }

    LogDebug("connection", Name() + ": calling " + tool_name);
    auto reply = session_->Request(mcp::kMethodToolsCall,
                                   mcp::MakeToolsCallParams(tool_name, arguments),
                                   options_.call_timeout);
    if (reply.IsErr()) {
        auto err = reply.Error();
        err.operation = "CallTool";
        if (err.Is(ErrorCategory::Protocol)) {
            MarkFailed(err);
        }
        return R::Err(std::move(err));
    }

    const auto& result = reply.Value();
    if (!result.is_object()) {
        auto err = Error::Make(ErrorCategory::Protocol, "CallTool", Name(),
                               "tools/call result is not an object");
        MarkFailed(err);
        return R::Err(std::move(err));
    }
    if (mcp::IsToolError(result)) {
        auto text = mcp::JoinTextContent(result);
        auto err = Error::Make(ErrorCategory::BackendRejected, "CallTool", Name(),
                               text.empty() ? "Tool '" + tool_name + "' reported an error"
                                            : text);
        err.detail = result.dump();
        return R::Err(std::move(err));
    }
    return reply;
}

void ToolServerConnection::InvalidateToolCache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_valid_ = false;
    ++cache_epoch_;
}

// ---------------------------------------------------------------------------
// Close
// ---------------------------------------------------------------------------

std::vector<Error> ToolServerConnection::Close() {
    std::lock_guard<std::mutex> serial(close_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::Closed) return {};
        if (state_ == ConnectionState::Unconnected) {
            state_ = ConnectionState::Closed;
            return {};
        }
        state_ = ConnectionState::Closing;
    }

    auto errors = ReleaseResources();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::Closed;
    }
    LogInfo("connection", "Closed '" + Name() + "'" +
                              (errors.empty() ? std::string()
                                              : " with " + std::to_string(errors.size()) +
                                                    " cleanup error(s)"));
    return errors;
}

std::vector<Error> ToolServerConnection::ReleaseResources() {
    std::vector<Error> errors;
    auto record = [&](Error e) {
        e.target = Name();
        e.category = ErrorCategory::Cleanup;
        LogWarn("connection", e.ToString());
        errors.push_back(std::move(e));
    };

    // Each step runs even when an earlier one failed.
    try {
        session_->Close();
    } catch (const std::exception& e) {
        record(Error::Make(ErrorCategory::Cleanup, "CloseSession", Name(), e.what()));
    }

    try {
        auto closed = transport_->CloseStreams();
        if (closed.IsErr()) record(closed.Error());
    } catch (const std::exception& e) {
        record(Error::Make(ErrorCategory::Cleanup, "CloseStreams", Name(), e.what()));
    }

    try {
        auto terminated = transport_->Terminate();
        if (terminated.IsErr()) record(terminated.Error());
    } catch (const std::exception& e) {
        record(Error::Make(ErrorCategory::Cleanup, "Terminate", Name(), e.what()));
    }

    return errors;
}

ConnectionState ToolServerConnection::State() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<ServerInfo> ToolServerConnection::Info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return info_;
}

} // namespace bullvision
