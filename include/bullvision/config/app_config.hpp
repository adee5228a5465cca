#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bullvision {

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string encoding = "utf-8";
    bool cache_tools_list = false;
};

struct SessionConfig {
    int handshake_timeout_ms = 15000;
    int call_timeout_ms = 60000;
    int shutdown_grace_ms = 3000;
};

struct EngineConfig {
    std::string provider = "azure";          // azure | openai
    std::string endpoint;
    std::string deployment;
    std::string api_version = "2024-06-01";
    std::optional<std::string> api_key_env;  // env var holding the API key
    std::string api_key;                     // resolved at startup, never in YAML
    int max_steps = 8;
    double temperature = 0.2;
    std::optional<std::string> system_prompt_file;
};

struct NewsConfig {
    std::string store_path = "data/news.jsonl";
    std::vector<std::string> source_tools{"search-stock-news"};
};

struct AppConfig {
    std::vector<ServerConfig> servers;       // order = creation order
    SessionConfig session;
    EngineConfig engine;
    NewsConfig news;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;    // debug | info | warn | error
    bool json_logs = false;

    // Command line only.
    std::optional<std::string> config_path;
    bool list_tools = false;
};

} // namespace bullvision
