#include <bullvision/agent/agent_dispatcher.hpp>
#include <bullvision/agent/chat_completions_engine.hpp>
#include <bullvision/agent/http_chat_model.hpp>
#include <bullvision/app/message_handler.hpp>
#include <bullvision/config/config_loader.hpp>
#include <bullvision/conversation/conversation_context_store.hpp>
#include <bullvision/core/log.hpp>
#include <bullvision/core/version.hpp>
#include <bullvision/news/news_store.hpp>
#include <bullvision/server/server_session_manager.hpp>
#include <bullvision/server/transport_factory.hpp>

#include <nlohmann/json.hpp>

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using bullvision::AppConfig;
using bullvision::Error;
using bullvision::ErrorCategory;

constexpr int kExitSuccess = 0;

std::atomic<bool> g_stop_requested{false};

extern "C" void OnStopSignal(int /*signo*/) {
    g_stop_requested.store(true);
}

void InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = OnStopSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;   // no SA_RESTART: a blocked read must see EINTR
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void PrintError(const Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Load YAML, apply CLI overrides, resolve secrets and validate.
bullvision::Result<AppConfig, Error> BuildConfig(int argc, const char* const* argv) {
    using R = bullvision::Result<AppConfig, Error>;

    auto cli = bullvision::LoadFromCli(argc, argv);
    if (cli.IsErr()) return cli;
    if (!cli.Value().config_path.has_value()) {
        return R::Err(Error::Make(ErrorCategory::Config, "ConfigLoader", "",
                                  "--config <file> is required"));
    }

    auto yaml = bullvision::LoadFromYaml(*cli.Value().config_path);
    if (yaml.IsErr()) return yaml;

    auto merged = bullvision::ResolveApiKeyEnv(
        bullvision::MergeConfigs(yaml.Value(), cli.Value()));
    if (merged.IsErr()) return merged;

    auto valid = bullvision::ValidateConfig(merged.Value());
    if (valid.IsErr()) return R::Err(valid.Error());
    return merged;
}

bullvision::Result<void, Error> InitLogging(const AppConfig& config) {
    auto level = bullvision::LogLevel::Info;
    if (config.log_level.has_value()) {
        auto parsed = bullvision::ParseLogLevel(*config.log_level);
        if (parsed.IsErr()) return bullvision::Result<void, Error>::Err(parsed.Error());
        level = parsed.Value();
    }

    std::unique_ptr<bullvision::ILogSink> sink;
    if (config.json_logs) {
        sink = std::make_unique<bullvision::JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<bullvision::ConsoleSink>();
    }
    if (config.log_file.has_value()) {
        auto file = bullvision::FileSink::Open(*config.log_file);
        if (file.IsErr()) return bullvision::Result<void, Error>::Err(file.Error());
        sink = std::make_unique<bullvision::TeeSink>(std::move(sink),
                                                     std::move(file).Value());
    }
    bullvision::InitGlobalLogger(std::move(sink), level);
    return bullvision::Result<void, Error>::Ok();
}

bullvision::ChatModelOptions ToChatModelOptions(const bullvision::EngineConfig& engine) {
    bullvision::ChatModelOptions options;
    options.provider = engine.provider == "openai" ? bullvision::ChatProvider::OpenAI
                                                   : bullvision::ChatProvider::Azure;
    options.endpoint = engine.endpoint;
    options.deployment = engine.deployment;
    options.api_version = engine.api_version;
    options.api_key = engine.api_key;
    options.temperature = engine.temperature;
    return options;
}

// Print every backend's tool catalog as one JSON document.
int ListToolsMode(bullvision::ServerSessionManager& manager,
                  const std::vector<bullvision::ServerHandle>& handles) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& handle : handles) {
        auto tools = manager.ListTools(handle);
        if (tools.IsErr()) {
            PrintError(tools.Error());
            return tools.Error().ExitCode();
        }
        auto list = nlohmann::json::array();
        for (const auto& tool : tools.Value()) {
            list.push_back({{"name", tool.name},
                            {"description", tool.description},
                            {"inputSchema", tool.input_schema}});
        }
        out[handle.Name()] = std::move(list);
    }
    std::cout << out.dump(2) << "\n";
    return kExitSuccess;
}

// Reads `userId<TAB>text` lines from stdin until end of input or a stop
// signal, and prints one reply line per message.
int ChatLoop(bullvision::MessageHandler& handler) {
    std::string buffer;
    char chunk[4096];
    bool eof = false;

    auto handle_line = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) return;
        const auto tab = line.find('\t');
        if (tab == std::string::npos) {
            bullvision::LogWarn("host", "Ignoring input without a user id: expected userId<TAB>text");
            return;
        }
        auto user = bullvision::UserId::Create(line.substr(0, tab));
        if (user.IsErr()) {
            bullvision::LogWarn("host", "Ignoring input with invalid user id: " + user.Error());
            return;
        }
        auto reply = handler.Handle(user.Value(), line.substr(tab + 1));
        nlohmann::json out = {{"user", user.Value().Value()}, {"reply", reply}};
        std::cout << out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
    };

    while (!eof && !g_stop_requested.load()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            bullvision::LogError("host", std::string("poll on stdin failed: ") +
                                             std::strerror(errno));
            return Error::Make(ErrorCategory::Internal, "ChatLoop", "stdin", "").ExitCode();
        }
        if (ready == 0) continue;

        const auto n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            bullvision::LogError("host", std::string("read on stdin failed: ") +
                                             std::strerror(errno));
            return Error::Make(ErrorCategory::Internal, "ChatLoop", "stdin", "").ExitCode();
        }
        if (n == 0) {
            eof = true;
        } else {
            buffer.append(chunk, static_cast<std::size_t>(n));
        }

        std::size_t pos = 0;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            handle_line(buffer.substr(0, pos));
            buffer.erase(0, pos + 1);
        }
    }
    if (eof && !buffer.empty()) {
        handle_line(buffer);
    }
    bullvision::LogInfo("host", g_stop_requested.load() ? "Stop requested"
                                                        : "End of input");
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto config_result = BuildConfig(argc, argv);
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return logging.Error().ExitCode();
    }
    bullvision::LogInfo("host", std::string("bullvision ") + bullvision::kVersion);

    auto specs = bullvision::ToServerSpecs(config);
    if (specs.IsErr()) {
        PrintError(specs.Error());
        return specs.Error().ExitCode();
    }

    InstallSignalHandlers();

    bullvision::ConnectionOptions connection_options;
    connection_options.handshake_timeout =
        std::chrono::milliseconds(config.session.handshake_timeout_ms);
    connection_options.call_timeout = std::chrono::milliseconds(config.session.call_timeout_ms);

    bullvision::ServerSessionManager manager(
        bullvision::MakeStdioTransportFactory(
            std::chrono::milliseconds(config.session.shutdown_grace_ms)),
        connection_options);

    auto handles = manager.Start(specs.Value());
    if (handles.IsErr()) {
        PrintError(handles.Error());
        return handles.Error().ExitCode();
    }

    int exit_code = kExitSuccess;
    if (config.list_tools) {
        exit_code = ListToolsMode(manager, handles.Value());
        manager.Stop();
        return exit_code;
    }

    bullvision::EngineOptions engine_options;
    engine_options.max_steps = config.engine.max_steps;
    if (config.engine.system_prompt_file.has_value()) {
        auto prompt = bullvision::ReadTextFile(*config.engine.system_prompt_file);
        if (prompt.IsErr()) {
            PrintError(prompt.Error());
            manager.Stop();
            return prompt.Error().ExitCode();
        }
        engine_options.instructions = std::move(prompt).Value();
    }

    auto store = bullvision::JsonlNewsStore::Open(config.news.store_path);
    if (store.IsErr()) {
        PrintError(store.Error());
        manager.Stop();
        return store.Error().ExitCode();
    }
    auto news_store = std::move(store).Value();

    bullvision::HttpChatModel model(ToChatModelOptions(config.engine));
    bullvision::ChatCompletionsEngine engine(model, engine_options);

    bullvision::DispatcherOptions dispatcher_options;
    dispatcher_options.news_source_tools.insert(config.news.source_tools.begin(),
                                                config.news.source_tools.end());
    bullvision::AgentDispatcher dispatcher(manager, engine, dispatcher_options);

    bullvision::ConversationContextStore contexts;
    bullvision::MessageHandler handler(contexts, dispatcher, news_store.get(),
                                       handles.Value());

    exit_code = ChatLoop(handler);
    manager.Stop();
    return exit_code;
}
