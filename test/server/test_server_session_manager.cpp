#include <catch2/catch_test_macros.hpp>

#include <bullvision/server/server_session_manager.hpp>

#include "../../test/mocks/mock_transport.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace bullvision;
using namespace bullvision::testing;
using namespace std::chrono_literals;

namespace {

ToolServerSpec Spec(const std::string& name, std::vector<std::string> args = {},
                    bool cache = false) {
    return ToolServerSpec{ServerName::Create(name).Value(), "fake", std::move(args), {},
                          "utf-8", cache};
}

// MockTransport that records the order in which backends are terminated.
class OrderedTransport : public MockTransport {
public:
    OrderedTransport(std::string name, std::shared_ptr<std::vector<std::string>> log,
                     std::shared_ptr<std::mutex> log_mutex)
        : name_(std::move(name)), log_(std::move(log)), log_mutex_(std::move(log_mutex)) {}

    Result<void, Error> Terminate() override {
        {
            std::lock_guard<std::mutex> lock(*log_mutex_);
            log_->push_back(name_);
        }
        return MockTransport::Terminate();
    }

private:
    std::string name_;
    std::shared_ptr<std::vector<std::string>> log_;
    std::shared_ptr<std::mutex> log_mutex_;
};

// Builds one scripted mock transport per backend name. Backends without a
// script get a well-formed handshake.
struct MockBackends {
    std::map<std::string, std::function<void(MockTransport&)>> scripts;
    std::map<std::string, Error> factory_failures;
    // Owned by the connections; only valid while the manager holds them.
    std::map<std::string, MockTransport*> transports;
    std::shared_ptr<std::vector<std::string>> terminated =
        std::make_shared<std::vector<std::string>>();
    std::shared_ptr<std::mutex> terminated_mutex = std::make_shared<std::mutex>();

    TransportFactory Factory() {
        return [this](const ToolServerSpec& spec)
                   -> Result<std::unique_ptr<ITransport>, Error> {
            const auto& name = spec.name.Value();
            auto failure = factory_failures.find(name);
            if (failure != factory_failures.end()) {
                return Result<std::unique_ptr<ITransport>, Error>::Err(failure->second);
            }
            auto transport =
                std::make_unique<OrderedTransport>(name, terminated, terminated_mutex);
            auto script = scripts.find(name);
            if (script != scripts.end()) {
                script->second(*transport);
            } else {
                transport->ScriptHandshake(name);
            }
            transports[name] = transport.get();
            return Result<std::unique_ptr<ITransport>, Error>::Ok(std::move(transport));
        };
    }

    std::vector<std::string> Terminated() {
        std::lock_guard<std::mutex> lock(*terminated_mutex);
        return *terminated;
    }
};

ConnectionOptions FastOptions() {
    ConnectionOptions options;
    options.handshake_timeout = 300ms;
    options.call_timeout = 300ms;
    return options;
}

} // anonymous namespace

// ===========================================================================
// Start
// ===========================================================================

TEST_CASE("ServerSessionManager: start connects every backend", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());

    auto handles = manager.Start({Spec("news"), Spec("market"), Spec("portfolio")});
    REQUIRE(handles.IsOk());
    REQUIRE(handles.Value().size() == 3);
    CHECK(handles.Value()[0].Name() == "news");
    CHECK(handles.Value()[1].Name() == "market");
    CHECK(handles.Value()[2].Name() == "portfolio");

    auto status = manager.Status();
    REQUIRE(status.size() == 3);
    for (const auto& s : status) {
        CHECK(s.state == ConnectionState::Ready);
    }
    CHECK(manager.Handles() == handles.Value());
}

TEST_CASE("ServerSessionManager: empty start list is a config error", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());

    auto r = manager.Start({});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Config));
}

TEST_CASE("ServerSessionManager: duplicate names are a config error", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());

    auto r = manager.Start({Spec("news"), Spec("news")});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Config));
    CHECK(r.Error().target == "news");
    CHECK(backends.transports.empty());
}

TEST_CASE("ServerSessionManager: one failure closes the others and reports it",
          "[server][manager]") {
    MockBackends backends;
    backends.scripts["market"] = [](MockTransport& t) {
        t.EnqueueError("initialize", -32603, "market data offline");
    };
    ServerSessionManager manager(backends.Factory(), FastOptions());

    auto r = manager.Start({Spec("news"), Spec("market"), Spec("portfolio")});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Connection));
    CHECK(r.Error().target == "market");

    // Start() drops the connections it created, so the transports are gone by
    // now; the shared log outlives them. "market" tears itself down inside its
    // handshake, then the healthy ones are released in reverse start order.
    CHECK(backends.Terminated() ==
          std::vector<std::string>{"market", "portfolio", "news"});
    CHECK(manager.Handles().empty());
}

TEST_CASE("ServerSessionManager: the first failure in start order wins",
          "[server][manager]") {
    MockBackends backends;
    // "slow" fails late by timing out; "broken" fails immediately.
    backends.scripts["slow"] = [](MockTransport&) {};
    backends.scripts["broken"] = [](MockTransport& t) {
        t.FailOpen(Error::Make(ErrorCategory::Connection, "Launch", "broken",
                               "No such file or directory"));
    };
    ServerSessionManager manager(backends.Factory(), FastOptions());

    auto r = manager.Start({Spec("slow"), Spec("broken"), Spec("ok")});
    REQUIRE(r.IsErr());
    CHECK(r.Error().target == "slow");
    CHECK(r.Error().Is(ErrorCategory::Timeout));
}

TEST_CASE("ServerSessionManager: transport factory failure aborts start",
          "[server][manager]") {
    MockBackends backends;
    backends.factory_failures.emplace(
        "legacy", Error::Make(ErrorCategory::Config, "Start", "legacy",
                              "Unsupported encoding 'ebcdic'"));
    ServerSessionManager manager(backends.Factory(), FastOptions());

    auto r = manager.Start({Spec("news"), Spec("legacy")});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Config));
    CHECK(backends.Terminated() == std::vector<std::string>{"news"});
}

TEST_CASE("ServerSessionManager: failed start can be retried", "[server][manager]") {
    MockBackends backends;
    backends.scripts["news"] = [](MockTransport&) {};
    ServerSessionManager manager(backends.Factory(), FastOptions());

    REQUIRE(manager.Start({Spec("news")}).IsErr());

    backends.scripts.erase("news");
    auto retried = manager.Start({Spec("news")});
    REQUIRE(retried.IsOk());
    CHECK(retried.Value().size() == 1);
}

TEST_CASE("ServerSessionManager: starting twice is an internal error", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());

    REQUIRE(manager.Start({Spec("news")}).IsOk());
    auto again = manager.Start({Spec("market")});
    REQUIRE(again.IsErr());
    CHECK(again.Error().Is(ErrorCategory::Internal));
    CHECK(manager.Handles().size() == 1);
}

// ===========================================================================
// Routing
// ===========================================================================

TEST_CASE("ServerSessionManager: calls are routed by handle", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());
    auto handles = manager.Start({Spec("news"), Spec("market")});
    REQUIRE(handles.IsOk());

    backends.transports["market"]->EnqueueResult(
        "tools/call",
        {{"content", nlohmann::json::array({{{"type", "text"}, {"text", "VNM 71.5"}}})}});

    auto r = manager.CallTool(handles.Value()[1], "quote", {{"symbol", "VNM"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["content"][0]["text"] == "VNM 71.5");
    CHECK(backends.transports["market"]->SentCount("tools/call") == 1);
    CHECK(backends.transports["news"]->SentCount("tools/call") == 0);
}

TEST_CASE("ServerSessionManager: cache invalidation by handle", "[server][manager][cache]") {
    MockBackends backends;
    backends.scripts["news"] = [](MockTransport& t) {
        t.ScriptHandshake();
        for (int i = 0; i < 2; ++i) {
            t.EnqueueResult("tools/list",
                            {{"tools", nlohmann::json::array({{{"name", "search"}}})}});
        }
    };
    ServerSessionManager manager(backends.Factory(), FastOptions());
    auto handles = manager.Start({Spec("news", {}, true)});
    REQUIRE(handles.IsOk());
    const auto& news = handles.Value()[0];

    REQUIRE(manager.ListTools(news).IsOk());
    REQUIRE(manager.ListTools(news).IsOk());
    CHECK(backends.transports["news"]->SentCount("tools/list") == 1);

    REQUIRE(manager.InvalidateToolCache(news).IsOk());
    REQUIRE(manager.ListTools(news).IsOk());
    CHECK(backends.transports["news"]->SentCount("tools/list") == 2);
}

TEST_CASE("ServerSessionManager: handle from another manager is invalid", "[server][manager]") {
    MockBackends first_backends;
    MockBackends second_backends;
    ServerSessionManager first(first_backends.Factory(), FastOptions());
    ServerSessionManager second(second_backends.Factory(), FastOptions());
    auto first_handles = first.Start({Spec("news")});
    REQUIRE(first_handles.IsOk());
    REQUIRE(second.Start({Spec("news")}).IsOk());

    auto r = second.CallTool(first_handles.Value()[0], "search", nlohmann::json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::InvalidHandle));
    CHECK(second_backends.transports["news"]->SentCount("tools/call") == 0);
}

TEST_CASE("ServerSessionManager: handles are invalid after stop", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());
    auto handles = manager.Start({Spec("news")});
    REQUIRE(handles.IsOk());

    manager.Stop();

    auto listed = manager.ListTools(handles.Value()[0]);
    REQUIRE(listed.IsErr());
    CHECK(listed.Error().Is(ErrorCategory::InvalidHandle));
    auto called = manager.CallTool(handles.Value()[0], "search", nlohmann::json::object());
    REQUIRE(called.IsErr());
    CHECK(called.Error().Is(ErrorCategory::InvalidHandle));
    CHECK(manager.Handles().empty());
}

TEST_CASE("ServerSessionManager: forged handle index is invalid", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());
    auto handles = manager.Start({Spec("news")});
    REQUIRE(handles.IsOk());

    ServerHandle forged(handles.Value()[0].Owner(), 7, "news");
    auto r = manager.ListTools(forged);
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::InvalidHandle));
}

// ===========================================================================
// Stop
// ===========================================================================

TEST_CASE("ServerSessionManager: stop closes in reverse start order", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());
    REQUIRE(manager.Start({Spec("news"), Spec("market"), Spec("portfolio")}).IsOk());

    manager.Stop();
    CHECK(backends.Terminated() == std::vector<std::string>{"portfolio", "market", "news"});

    manager.Stop();
    CHECK(backends.Terminated().size() == 3);
}

TEST_CASE("ServerSessionManager: cleanup failure on one backend does not stop the rest",
          "[server][manager]") {
    MockBackends backends;
    backends.scripts["market"] = [](MockTransport& t) {
        t.ScriptHandshake();
        t.FailTerminate(Error::Make(ErrorCategory::Internal, "Terminate", "market", "EPERM"));
    };
    ServerSessionManager manager(backends.Factory(), FastOptions());
    REQUIRE(manager.Start({Spec("news"), Spec("market"), Spec("portfolio")}).IsOk());

    manager.Stop();
    CHECK(backends.Terminated() == std::vector<std::string>{"portfolio", "market", "news"});
}

TEST_CASE("ServerSessionManager: stop without start is harmless", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());
    manager.Stop();
    CHECK(manager.Status().empty());
    CHECK(backends.Terminated().empty());
}

TEST_CASE("ServerSessionManager: start after stop is refused", "[server][manager]") {
    MockBackends backends;
    ServerSessionManager manager(backends.Factory(), FastOptions());
    manager.Stop();
    auto r = manager.Start({Spec("news")});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Internal));
}

TEST_CASE("ServerSessionManager: destruction stops the backends", "[server][manager]") {
    MockBackends backends;
    {
        ServerSessionManager manager(backends.Factory(), FastOptions());
        REQUIRE(manager.Start({Spec("news"), Spec("market")}).IsOk());
    }
    CHECK(backends.Terminated() == std::vector<std::string>{"market", "news"});
}

// ===========================================================================
// Against real child processes
// ===========================================================================

namespace {

ToolServerSpec FakeSpec(const std::string& name, const std::string& mode) {
    return ToolServerSpec{ServerName::Create(name).Value(), FAKE_TOOL_SERVER_PATH, {mode}, {},
                          "utf-8", false};
}

ConnectionOptions ProcessOptions() {
    ConnectionOptions options;
    options.handshake_timeout = 5s;
    options.call_timeout = 5s;
    return options;
}

} // anonymous namespace

TEST_CASE("ServerSessionManager: real backends list and call tools",
          "[server][manager][process]") {
    ServerSessionManager manager(MakeStdioTransportFactory(500ms), ProcessOptions());
    auto handles = manager.Start({FakeSpec("news", "normal"), FakeSpec("paged", "paged")});
    REQUIRE(handles.IsOk());

    auto tools = manager.ListTools(handles.Value()[0]);
    REQUIRE(tools.IsOk());
    CHECK(tools.Value().size() == 5);

    auto paged = manager.ListTools(handles.Value()[1]);
    REQUIRE(paged.IsOk());
    CHECK(paged.Value() == tools.Value());

    auto echoed = manager.CallTool(handles.Value()[0], "echo", {{"text", "xin chao"}});
    REQUIRE(echoed.IsOk());
    CHECK(echoed.Value()["content"][0]["text"] == "xin chao");

    auto failed = manager.CallTool(handles.Value()[0], "fail", nlohmann::json::object());
    REQUIRE(failed.IsErr());
    CHECK(failed.Error().Is(ErrorCategory::BackendRejected));

    auto unknown = manager.CallTool(handles.Value()[0], "nope", nlohmann::json::object());
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().rpc_code == -32602);

    manager.Stop();
}

TEST_CASE("ServerSessionManager: concurrent calls complete out of order",
          "[server][manager][process]") {
    ServerSessionManager manager(MakeStdioTransportFactory(500ms), ProcessOptions());
    auto handles = manager.Start({FakeSpec("news", "normal")});
    REQUIRE(handles.IsOk());
    const auto news = handles.Value()[0];

    std::mutex mutex;
    std::vector<std::string> finished;
    auto call = [&](int ms, const std::string& tag) {
        auto r = manager.CallTool(news, "sleep", {{"ms", ms}, {"tag", tag}});
        std::lock_guard<std::mutex> lock(mutex);
        finished.push_back(r.IsOk() ? r.Value()["content"][0]["text"].get<std::string>()
                                    : "error");
    };

    std::thread slow(call, 600, "slow");
    std::this_thread::sleep_for(50ms);
    std::thread fast(call, 10, "fast");
    slow.join();
    fast.join();

    CHECK(finished == std::vector<std::string>{"fast", "slow"});
}

TEST_CASE("ServerSessionManager: missing executable fails start", "[server][manager][process]") {
    ServerSessionManager manager(MakeStdioTransportFactory(500ms), ProcessOptions());
    auto spec = FakeSpec("ghost", "normal");
    spec.command = "/nonexistent/bullvision-tool-server";

    auto r = manager.Start({FakeSpec("news", "normal"), spec});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Connection));
    CHECK(r.Error().target == "ghost");
}

TEST_CASE("ServerSessionManager: malformed handshake fails start", "[server][manager][process]") {
    ServerSessionManager manager(MakeStdioTransportFactory(500ms), ProcessOptions());
    auto r = manager.Start({FakeSpec("bad", "bad-handshake")});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Connection));
}

TEST_CASE("ServerSessionManager: backend exiting mid-call fails its connection",
          "[server][manager][process]") {
    ServerSessionManager manager(MakeStdioTransportFactory(500ms), ProcessOptions());
    auto handles = manager.Start({FakeSpec("flaky", "exit-on-call")});
    REQUIRE(handles.IsOk());

    auto r = manager.CallTool(handles.Value()[0], "echo", {{"text", "hi"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Protocol));

    auto status = manager.Status();
    REQUIRE(status.size() == 1);
    CHECK(status[0].state == ConnectionState::Failed);

    auto next = manager.CallTool(handles.Value()[0], "echo", {{"text", "again"}});
    REQUIRE(next.IsErr());
    CHECK(next.Error().Is(ErrorCategory::NotReady));
}

TEST_CASE("ServerSessionManager: garbage output fails the connection",
          "[server][manager][process]") {
    ServerSessionManager manager(MakeStdioTransportFactory(500ms), ProcessOptions());
    auto handles = manager.Start({FakeSpec("noisy", "garbage")});
    REQUIRE(handles.IsOk());

    auto r = manager.CallTool(handles.Value()[0], "echo", {{"text", "hi"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Protocol));
    CHECK(manager.Status()[0].state == ConnectionState::Failed);
}
