#include <bullvision/mcp/mcp_messages.hpp>

#include <bullvision/core/version.hpp>

namespace bullvision::mcp {

namespace {

nlohmann::json DefaultInputSchema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

std::string StringOr(const nlohmann::json& obj, const char* key,
                     const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

} // anonymous namespace

nlohmann::json MakeInitializeParams() {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "bullvision"}, {"version", kVersion}}}
    };
}

Result<ServerInfo, Error> ParseInitializeResult(const nlohmann::json& result,
                                                const std::string& server) {
    auto malformed = [&server](const std::string& why) {
        return Result<ServerInfo, Error>::Err(Error::Make(
            ErrorCategory::Connection, "Handshake", server,
            "Malformed initialize reply: " + why));
    };

    if (!result.is_object()) {
        return malformed("result is not an object");
    }
    auto version = result.find("protocolVersion");
    if (version == result.end() || !version->is_string()) {
        return malformed("missing string \"protocolVersion\"");
    }

    ServerInfo info;
    info.protocol_version = version->get<std::string>();

    auto caps = result.find("capabilities");
    if (caps != result.end()) {
        if (!caps->is_object()) {
            return malformed("\"capabilities\" is not an object");
        }
        info.capabilities = *caps;
    }

    auto server_info = result.find("serverInfo");
    if (server_info != result.end()) {
        if (!server_info->is_object()) {
            return malformed("\"serverInfo\" is not an object");
        }
        info.name = StringOr(*server_info, "name", "");
        info.version = StringOr(*server_info, "version", "");
    }

    return Result<ServerInfo, Error>::Ok(std::move(info));
}

nlohmann::json MakeToolsListParams(const std::optional<std::string>& cursor) {
    nlohmann::json params = nlohmann::json::object();
    if (cursor.has_value()) {
        params["cursor"] = *cursor;
    }
    return params;
}

Result<ToolsPage, Error> ParseToolsListResult(const nlohmann::json& result,
                                              const std::string& server) {
    auto malformed = [&server](const std::string& why) {
        return Result<ToolsPage, Error>::Err(Error::Make(
            ErrorCategory::Protocol, "ListTools", server,
            "Malformed tools/list reply: " + why));
    };

    if (!result.is_object()) {
        return malformed("result is not an object");
    }
    auto tools = result.find("tools");
    if (tools == result.end() || !tools->is_array()) {
        return malformed("missing \"tools\" array");
    }

    ToolsPage page;
    page.tools.reserve(tools->size());
    for (const auto& t : *tools) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
            return malformed("tool entry without a string \"name\"");
        }
        ToolDescriptor td;
        td.name = t["name"].get<std::string>();
        td.description = StringOr(t, "description", "");
        auto schema = t.find("inputSchema");
        td.input_schema = (schema != t.end() && schema->is_object())
                              ? *schema
                              : DefaultInputSchema();
        page.tools.push_back(std::move(td));
    }

    auto cursor = result.find("nextCursor");
    if (cursor != result.end() && cursor->is_string() &&
        !cursor->get<std::string>().empty()) {
        page.next_cursor = cursor->get<std::string>();
    }
    return Result<ToolsPage, Error>::Ok(std::move(page));
}

nlohmann::json MakeToolsCallParams(const std::string& tool_name,
                                   const nlohmann::json& arguments) {
    return {
        {"name", tool_name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
}

bool IsToolError(const nlohmann::json& call_result) {
    if (!call_result.is_object()) return false;
    auto it = call_result.find("isError");
    return it != call_result.end() && it->is_boolean() && it->get<bool>();
}

std::string JoinTextContent(const nlohmann::json& call_result) {
    if (!call_result.is_object()) return "";
    auto content = call_result.find("content");
    if (content == call_result.end() || !content->is_array()) return "";

    std::string out;
    for (const auto& block : *content) {
        if (!block.is_object()) continue;
        if (StringOr(block, "type", "") != "text") continue;
        if (!out.empty()) out += "\n";
        out += StringOr(block, "text", "");
    }
    return out;
}

} // namespace bullvision::mcp
