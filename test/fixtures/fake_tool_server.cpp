// Tool server used by the subprocess tests. Speaks newline-delimited
// JSON-RPC over stdio; the first argument selects how it (mis)behaves:
//
//   normal          well-behaved server
//   bad-handshake   answers initialize with a non-object result
//   silent          never answers anything
//   exit-on-call    exits as soon as a tools/call arrives
//   garbage         answers tools/call with a line that is not JSON
//   list-changed    sends notifications/tools/list_changed before each call result
//   paged           serves tools/list in two pages
//   ignore-term     ignores SIGTERM, so only SIGKILL ends it
//
// Tools: echo {text}, news {}, fail {}, sleep {ms, tag}, env {name}.

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

std::mutex g_out_mutex;

void Write(const nlohmann::json& msg) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << msg.dump() << "\n" << std::flush;
}

void Reply(const nlohmann::json& id, nlohmann::json result) {
    Write({{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
}

void ReplyError(const nlohmann::json& id, int code, const std::string& message) {
    Write({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
}

nlohmann::json Text(const std::string& text, bool is_error = false) {
    nlohmann::json result = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
    if (is_error) result["isError"] = true;
    return result;
}

nlohmann::json Tool(const std::string& name, const std::string& description) {
    return {{"name", name},
            {"description", description},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}};
}

nlohmann::json AllTools() {
    return nlohmann::json::array({Tool("echo", "Echo the text argument"),
                                  Tool("news", "Recent stock news"),
                                  Tool("fail", "Always reports an error"),
                                  Tool("sleep", "Answer after ms milliseconds"),
                                  Tool("env", "Read an environment variable")});
}

nlohmann::json NewsPayload() {
    nlohmann::json item = {
        {"query", "VNM"},
        {"results", nlohmann::json::array(
             {{{"title", "Vinamilk posts record profit"},
               {"url", "https://news.example/vnm-profit"},
               {"content", "Quarterly profit rose."},
               {"score", 0.9}},
              {{"title", "Dairy sector outlook"},
               {"url", "https://news.example/dairy"},
               {"content", "Analysts expect growth."},
               {"score", 0.7}}})}};
    return Text(nlohmann::json::array({item}).dump());
}

void HandleCall(const std::string& mode, const nlohmann::json& id, const nlohmann::json& params) {
    const auto name = params.value("name", std::string());
    const auto args = params.value("arguments", nlohmann::json::object());

    if (mode == "exit-on-call") std::exit(0);
    if (mode == "garbage") {
        std::lock_guard<std::mutex> lock(g_out_mutex);
        std::cout << "this is not json\n" << std::flush;
        return;
    }
    if (mode == "list-changed") {
        Write({{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});
    }

    if (name == "echo") {
        Reply(id, Text(args.value("text", std::string())));
    } else if (name == "news") {
        Reply(id, NewsPayload());
    } else if (name == "fail") {
        Reply(id, Text("tool failed on purpose", true));
    } else if (name == "sleep") {
        const int ms = args.value("ms", 0);
        const auto tag = args.value("tag", std::string());
        std::thread([id, ms, tag] {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            Reply(id, Text(tag));
        }).detach();
    } else if (name == "env") {
        const char* value = std::getenv(args.value("name", std::string()).c_str());
        Reply(id, Text(value ? value : ""));
    } else {
        ReplyError(id, -32602, "Unknown tool: " + name);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const std::string mode = argc > 1 ? argv[1] : "normal";
    if (mode == "ignore-term") std::signal(SIGTERM, SIG_IGN);

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        nlohmann::json msg;
        try {
            msg = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            continue;
        }
        if (mode == "silent") continue;
        if (!msg.contains("id") || !msg.contains("method")) continue;

        const auto& id = msg["id"];
        const auto method = msg["method"].get<std::string>();
        const auto params = msg.value("params", nlohmann::json::object());

        if (method == "initialize") {
            if (mode == "bad-handshake") {
                Reply(id, "not an object");
            } else {
                Reply(id, {{"protocolVersion", "2024-11-05"},
                           {"capabilities", {{"tools", {{"listChanged", true}}}}},
                           {"serverInfo", {{"name", "fake-tool-server"}, {"version", "0.1"}}}});
            }
        } else if (method == "tools/list") {
            auto tools = AllTools();
            if (mode == "paged") {
                if (!params.contains("cursor")) {
                    nlohmann::json first = nlohmann::json::array({tools[0], tools[1]});
                    Reply(id, {{"tools", first}, {"nextCursor", "page-2"}});
                } else {
                    nlohmann::json rest = nlohmann::json::array({tools[2], tools[3], tools[4]});
                    Reply(id, {{"tools", rest}});
                }
            } else {
                Reply(id, {{"tools", tools}});
            }
        } else if (method == "tools/call") {
            HandleCall(mode, id, params);
        } else if (method == "ping") {
            Reply(id, nlohmann::json::object());
        } else {
            ReplyError(id, -32601, "Method not found: " + method);
        }
    }
    // Let outstanding sleep replies finish before exiting on EOF.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return 0;
}
