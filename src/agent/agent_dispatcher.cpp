#include <bullvision/agent/agent_dispatcher.hpp>

#include <bullvision/core/log.hpp>

namespace bullvision {

namespace {

constexpr const char* kDegradedAnswer =
    "Sorry, I could not complete the analysis right now. Please try again in a moment.";

struct Invocation {
    std::string server;
    std::string tool;
    nlohmann::json result;
};

// Forwards to the tool servers and remembers every successful call.
class RecordingInvoker : public IToolInvoker {
public:
    explicit RecordingInvoker(IToolServers& servers) : servers_(servers) {}

    Result<nlohmann::json, Error> Invoke(const ServerHandle& handle,
                                         const std::string& tool_name,
                                         const nlohmann::json& arguments) override {
        auto result = servers_.CallTool(handle, tool_name, arguments);
        if (result.IsOk()) {
            invocations_.push_back(Invocation{handle.Name(), tool_name, result.Value()});
        }
        return result;
    }

    [[nodiscard]] const std::vector<Invocation>& Invocations() const { return invocations_; }

private:
    IToolServers& servers_;
    std::vector<Invocation> invocations_;
};

} // anonymous namespace

AgentDispatcher::AgentDispatcher(IToolServers& servers, IReasoningEngine& engine,
                                 DispatcherOptions options)
    : servers_(servers), engine_(engine), options_(std::move(options)) {}

Result<ToolCatalog, Error> AgentDispatcher::BuildCatalog(
    const std::vector<ServerHandle>& handles) {
    using R = Result<ToolCatalog, Error>;

    if (handles.empty()) {
        return R::Err(Error::Make(ErrorCategory::NoBackendsAvailable, "BuildCatalog", "",
                                  "No tool servers are running"));
    }

    ToolCatalog catalog;
    std::vector<Error> failures;
    for (const auto& handle : handles) {
        auto tools = servers_.ListTools(handle);
        if (tools.IsErr()) {
            LogWarn("dispatcher", "Tool listing failed: " + tools.Error().ToString());
            failures.push_back(tools.Error());
            continue;
        }
        for (auto& tool : std::move(tools).Value()) {
            catalog.push_back(CatalogEntry{handle, std::move(tool)});
        }
    }
    if (failures.empty()) {
        return R::Ok(std::move(catalog));
    }

    bool none_ready = failures.size() == handles.size();
    for (const auto& f : failures) {
        if (!f.Is(ErrorCategory::NotReady)) none_ready = false;
    }
    auto err = Error::Make(none_ready ? ErrorCategory::NoBackendsAvailable
                                      : ErrorCategory::ToolCatalogUnavailable,
                           "BuildCatalog", failures.front().target,
                           none_ready ? "No tool server is ready"
                                      : "Tool catalog of '" + failures.front().target +
                                            "' is unavailable");
    err.detail = failures.front().ToString();
    return R::Err(std::move(err));
}

Result<AgentTurnResult, Error> AgentDispatcher::Run(const std::string& input_text,
                                                    const ConversationContext& context,
                                                    const std::vector<ServerHandle>& handles) {
    using R = Result<AgentTurnResult, Error>;

    auto catalog = BuildCatalog(handles);
    if (catalog.IsErr()) {
        LogError("dispatcher", catalog.Error().ToString());
        return R::Err(catalog.Error());
    }
    LogDebug("dispatcher", "Turn for " + context.User().Value() + " with " +
                               std::to_string(catalog.Value().size()) + " tools");

    RecordingInvoker invoker(servers_);
    AgentTurnResult turn;
    auto output = engine_.RunTurn(TurnInput{input_text, context, catalog.Value()}, invoker);
    if (output.IsOk()) {
        turn.output = std::move(output).Value();
    } else {
        LogError("dispatcher", "Reasoning engine failed: " + output.Error().ToString());
        turn.output = kDegradedAnswer;
        turn.degraded = true;
    }

    std::set<std::string> seen;
    for (const auto& call : invoker.Invocations()) {
        if (options_.news_source_tools.count(call.server) == 0 &&
            options_.news_source_tools.count(call.tool) == 0) {
            continue;
        }
        for (auto& article : ExtractNewsArticles(call.result)) {
            if (seen.insert(NewsKey(article)).second) {
                turn.artifacts.push_back(std::move(article));
            }
        }
    }
    return R::Ok(std::move(turn));
}

} // namespace bullvision
