#include <bullvision/config/config_loader.hpp>

#include <bullvision/core/log.hpp>
#include <bullvision/core/version.hpp>
#include <bullvision/transport/text_codec.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace bullvision {

namespace {

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", target, message);
}

// Build a ServerConfig from one entry of the `servers` sequence.
Result<ServerConfig, Error> ParseYamlServer(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server entry must be a mapping"));
    }
    if (!node["name"]) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server entry missing 'name' field"));
    }
    if (!node["command"]) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server entry missing 'command' field",
                            node["name"].as<std::string>()));
    }

    ServerConfig server;
    server.name = node["name"].as<std::string>();
    server.command = node["command"].as<std::string>();
    if (node["args"]) {
        for (const auto& arg : node["args"]) {
            server.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"]) {
        for (const auto& kv : node["env"]) {
            server.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (node["encoding"]) {
        server.encoding = node["encoding"].as<std::string>();
    }
    if (node["cache_tools_list"]) {
        server.cache_tools_list = node["cache_tools_list"].as<bool>();
    }
    return Result<ServerConfig, Error>::Ok(std::move(server));
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;

    // -- Servers --
    if (root["servers"]) {
        for (const auto& server_node : root["servers"]) {
            auto server_result = ParseYamlServer(server_node);
            if (server_result.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(server_result).Error());
            }
            config.servers.push_back(std::move(server_result).Value());
        }
    }

    // -- Session --
    if (const auto session = root["session"]) {
        if (session["handshake_timeout_ms"]) {
            config.session.handshake_timeout_ms = session["handshake_timeout_ms"].as<int>();
        }
        if (session["call_timeout_ms"]) {
            config.session.call_timeout_ms = session["call_timeout_ms"].as<int>();
        }
        if (session["shutdown_grace_ms"]) {
            config.session.shutdown_grace_ms = session["shutdown_grace_ms"].as<int>();
        }
    }

    // -- Engine --
    if (const auto engine = root["engine"]) {
        if (engine["provider"]) {
            config.engine.provider = engine["provider"].as<std::string>();
        }
        if (engine["endpoint"]) {
            config.engine.endpoint = engine["endpoint"].as<std::string>();
        }
        if (engine["deployment"]) {
            config.engine.deployment = engine["deployment"].as<std::string>();
        }
        if (engine["api_version"]) {
            config.engine.api_version = engine["api_version"].as<std::string>();
        }
        if (engine["api_key_env"]) {
            config.engine.api_key_env = engine["api_key_env"].as<std::string>();
        }
        if (engine["max_steps"]) {
            config.engine.max_steps = engine["max_steps"].as<int>();
        }
        if (engine["temperature"]) {
            config.engine.temperature = engine["temperature"].as<double>();
        }
        if (engine["system_prompt_file"]) {
            config.engine.system_prompt_file = engine["system_prompt_file"].as<std::string>();
        }
    }

    // -- News --
    if (const auto news = root["news"]) {
        if (news["store_path"]) {
            config.news.store_path = news["store_path"].as<std::string>();
        }
        if (news["source_tools"]) {
            config.news.source_tools.clear();
            for (const auto& tool : news["source_tools"]) {
                config.news.source_tools.push_back(tool.as<std::string>());
            }
        }
    }

    // -- Options --
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    if (root["log_level"]) {
        config.log_level = root["log_level"].as<std::string>();
    }
    if (root["json_logs"]) {
        config.json_logs = root["json_logs"].as<bool>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    try {
        auto root = YAML::LoadFile(path);
        auto config = ParseYamlRoot(root);
        if (config.IsErr()) {
            auto err = config.Error();
            if (err.target.empty()) err.target = path;
            return Result<AppConfig, Error>::Err(std::move(err));
        }
        return config;
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()), path));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("bullvision", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--json-logs")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--list-tools")
        .help("Start all tool servers, print their tools and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (auto val = program.present("--log-level")) {
        config.log_level = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (program.get<bool>("--list-tools")) {
        config.list_tools = true;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (!cli_overrides.servers.empty()) {
        merged.servers = cli_overrides.servers;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }
    if (cli_overrides.list_tools) {
        merged.list_tools = true;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ResolveApiKeyEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config) {
    if (config.engine.api_key.empty() && config.engine.api_key_env.has_value()) {
        const auto& env_var = *config.engine.api_key_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr || *env_val == '\0') {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by api_key_env)"));
        }
        config.engine.api_key = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.servers.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("At least one tool server must be configured"));
    }

    std::set<std::string> names;
    for (const auto& server : config.servers) {
        auto name = ServerName::Create(server.name);
        if (name.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid server name: " + name.Error(), server.name));
        }
        if (!names.insert(server.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate server name", server.name));
        }
        if (server.command.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Server command must not be empty", server.name));
        }
        auto codec = TextCodec::Create(server.encoding);
        if (codec.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Unsupported encoding '" + server.encoding + "'",
                                server.name));
        }
    }

    const auto& s = config.session;
    if (s.handshake_timeout_ms <= 0 || s.call_timeout_ms <= 0 || s.shutdown_grace_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Session timeouts must be positive"));
    }

    if (config.engine.provider != "azure" && config.engine.provider != "openai") {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown engine provider '" + config.engine.provider +
                            "' (expected azure or openai)"));
    }
    if (config.engine.max_steps < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("engine.max_steps must be at least 1, got " +
                            std::to_string(config.engine.max_steps)));
    }

    if (config.news.store_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("news.store_path must not be empty"));
    }
    if (config.log_level.has_value()) {
        auto level = ParseLogLevel(*config.log_level);
        if (level.IsErr()) {
            return Result<void, Error>::Err(MakeConfigError(level.Error().message));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ToServerSpecs
// ---------------------------------------------------------------------------
Result<std::vector<ToolServerSpec>, Error> ToServerSpecs(const AppConfig& config) {
    std::vector<ToolServerSpec> specs;
    specs.reserve(config.servers.size());
    for (const auto& server : config.servers) {
        auto name = ServerName::Create(server.name);
        if (name.IsErr()) {
            return Result<std::vector<ToolServerSpec>, Error>::Err(
                MakeConfigError("Invalid server name: " + name.Error(), server.name));
        }
        specs.push_back(ToolServerSpec{
            std::move(name).Value(),
            server.command,
            server.args,
            server.env,
            server.encoding,
            server.cache_tools_list,
        });
    }
    return Result<std::vector<ToolServerSpec>, Error>::Ok(std::move(specs));
}

// ---------------------------------------------------------------------------
// ReadTextFile
// ---------------------------------------------------------------------------
Result<std::string, Error> ReadTextFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string, Error>::Err(
            MakeConfigError("Cannot read file", path));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string, Error>::Ok(ss.str());
}

} // namespace bullvision
