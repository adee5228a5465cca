#include <bullvision/server/server_session_manager.hpp>

#include <bullvision/core/log.hpp>

#include <atomic>
#include <exception>
#include <future>
#include <optional>
#include <set>
#include <system_error>

namespace bullvision {

namespace {

std::uint64_t NextManagerId() {
    static std::atomic<std::uint64_t> counter{1};
    return counter.fetch_add(1);
}

} // anonymous namespace

ServerSessionManager::ServerSessionManager(TransportFactory factory,
                                           ConnectionOptions options)
    : factory_(std::move(factory)), options_(options), id_(NextManagerId()) {}

ServerSessionManager::~ServerSessionManager() {
    Stop();
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------

Result<std::vector<ServerHandle>, Error> ServerSessionManager::Start(
    const std::vector<ToolServerSpec>& specs) {
    using R = Result<std::vector<ServerHandle>, Error>;

    if (specs.empty()) {
        return R::Err(Error::Make(ErrorCategory::Config, "Start", "",
                                  "No tool servers configured"));
    }
    std::set<std::string> names;
    for (const auto& spec : specs) {
        if (!names.insert(spec.name.Value()).second) {
            return R::Err(Error::Make(ErrorCategory::Config, "Start", spec.name.Value(),
                                      "Duplicate tool server name"));
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::Idle) {
            return R::Err(Error::Make(ErrorCategory::Internal, "Start", "",
                                      "Manager was already started"));
        }
        phase_ = Phase::Starting;
    }

    LogInfo("manager", "Starting " + std::to_string(specs.size()) + " tool server(s)");

    std::vector<ConnectionPtr> connections(specs.size());
    std::vector<std::optional<Error>> failures(specs.size());
    std::vector<std::future<Result<void, Error>>> pending(specs.size());

    for (std::size_t i = 0; i < specs.size(); ++i) {
        auto transport = factory_(specs[i]);
        if (transport.IsErr()) {
            failures[i] = transport.Error();
            continue;
        }
        connections[i] = std::make_shared<ToolServerConnection>(
            specs[i], std::move(transport).Value(), options_);
        try {
            auto conn = connections[i];
            pending[i] = std::async(std::launch::async, [conn] { return conn->Connect(); });
        } catch (const std::system_error& e) {
            failures[i] = Error::Make(ErrorCategory::Connection, "Start",
                                      specs[i].name.Value(),
                                      std::string("Could not start connect task: ") + e.what());
        }
    }

    // Join every attempt before deciding; no task outlives Start().
    for (std::size_t i = 0; i < specs.size(); ++i) {
        if (!pending[i].valid()) continue;
        auto connected = pending[i].get();
        if (connected.IsErr()) {
            failures[i] = connected.Error();
        }
    }

    std::optional<Error> first;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        if (!failures[i].has_value()) continue;
        if (!first.has_value()) {
            first = failures[i];
        } else {
            LogError("manager", "Additional startup failure: " + failures[i]->ToString());
        }
    }

    if (first.has_value()) {
        std::vector<ConnectionPtr> ready;
        for (const auto& conn : connections) {
            if (conn && conn->State() == ConnectionState::Ready) {
                ready.push_back(conn);
            }
        }
        LogError("manager", "Startup failed, closing " + std::to_string(ready.size()) +
                                " connected server(s): " + first->ToString());
        CloseInReverse(ready);
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::Starting) phase_ = Phase::Idle;
        return R::Err(std::move(*first));
    }

    std::vector<ServerHandle> handles;
    handles.reserve(connections.size());
    for (std::size_t i = 0; i < connections.size(); ++i) {
        handles.emplace_back(id_, i, connections[i]->Name());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::Starting) {
            connections_ = connections;
            phase_ = Phase::Running;
            LogInfo("manager", "All " + std::to_string(connections.size()) +
                                   " tool server(s) ready");
            return R::Ok(std::move(handles));
        }
    }

    // Stop() ran while we were connecting.
    CloseInReverse(connections);
    return R::Err(Error::Make(ErrorCategory::Internal, "Start", "",
                              "Manager was stopped during startup"));
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------

Result<ServerSessionManager::ConnectionPtr, Error> ServerSessionManager::Resolve(
    const ServerHandle& handle, const char* operation) const {
    using R = Result<ConnectionPtr, Error>;
    auto invalid = [&](const std::string& why) {
        return R::Err(Error::Make(ErrorCategory::InvalidHandle, operation, handle.Name(), why));
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (handle.Owner() != id_) {
        return invalid("Handle was issued by a different manager");
    }
    if (phase_ != Phase::Running) {
        return invalid("Manager is not running");
    }
    if (handle.Index() >= connections_.size() ||
        connections_[handle.Index()]->Name() != handle.Name()) {
        return invalid("Handle does not refer to a managed connection");
    }
    return R::Ok(connections_[handle.Index()]);
}

Result<std::vector<ToolDescriptor>, Error> ServerSessionManager::ListTools(
    const ServerHandle& handle) {
    auto conn = Resolve(handle, "ListTools");
    if (conn.IsErr()) {
        return Result<std::vector<ToolDescriptor>, Error>::Err(conn.Error());
    }
    return conn.Value()->ListTools();
}

Result<nlohmann::json, Error> ServerSessionManager::CallTool(
    const ServerHandle& handle, const std::string& tool_name,
    const nlohmann::json& arguments) {
    auto conn = Resolve(handle, "CallTool");
    if (conn.IsErr()) {
        return Result<nlohmann::json, Error>::Err(conn.Error());
    }
    return conn.Value()->CallTool(tool_name, arguments);
}

Result<void, Error> ServerSessionManager::InvalidateToolCache(const ServerHandle& handle) {
    auto conn = Resolve(handle, "InvalidateToolCache");
    if (conn.IsErr()) {
        return Result<void, Error>::Err(conn.Error());
    }
    conn.Value()->InvalidateToolCache();
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Stop
// ---------------------------------------------------------------------------

void ServerSessionManager::Stop() {
    std::vector<ConnectionPtr> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::Stopped) return;
        phase_ = Phase::Stopped;
        connections.swap(connections_);
    }
    if (connections.empty()) return;

    LogInfo("manager", "Stopping " + std::to_string(connections.size()) +
                           " tool server(s)");
    const auto errors = CloseInReverse(connections);
    if (errors > 0) {
        LogWarn("manager", "Shutdown finished with " + std::to_string(errors) +
                               " cleanup error(s)");
    } else {
        LogInfo("manager", "All tool servers stopped");
    }
}

std::size_t ServerSessionManager::CloseInReverse(
    const std::vector<ConnectionPtr>& connections) {
    std::size_t errors = 0;
    for (auto it = connections.rbegin(); it != connections.rend(); ++it) {
        if (!*it) continue;
        try {
            errors += (*it)->Close().size();
        } catch (const std::exception& e) {
            ++errors;
            LogError("manager", "Closing '" + (*it)->Name() + "' threw: " + e.what());
        }
    }
    return errors;
}

std::vector<ServerHandle> ServerSessionManager::Handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerHandle> handles;
    if (phase_ != Phase::Running) return handles;
    for (std::size_t i = 0; i < connections_.size(); ++i) {
        handles.emplace_back(id_, i, connections_[i]->Name());
    }
    return handles;
}

std::vector<ConnectionStatus> ServerSessionManager::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionStatus> out;
    out.reserve(connections_.size());
    for (const auto& conn : connections_) {
        out.push_back(ConnectionStatus{conn->Name(), conn->State()});
    }
    return out;
}

} // namespace bullvision
