#include <bullvision/mcp/json_rpc.hpp>

namespace bullvision::rpc {

namespace {

Result<Message, Error> Malformed(const std::string& why) {
    return Result<Message, Error>::Err(Error::Make(
        ErrorCategory::Protocol, "ParseMessage", "", "Malformed JSON-RPC message: " + why));
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_number_integer() || id.is_string();
}

} // anonymous namespace

nlohmann::json MakeRequest(std::int64_t id, const std::string& method,
                           const nlohmann::json& params) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        req["params"] = params;
    }
    return req;
}

nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params) {
    nlohmann::json notif = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notif["params"] = params;
    }
    return notif;
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

Result<Message, Error> ParseMessage(std::string_view line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Malformed(std::string("not valid JSON (") + e.what() + ")");
    }

    if (!j.is_object()) {
        return Malformed("top-level value is not an object");
    }
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() || *version != "2.0") {
        return Malformed("missing or wrong \"jsonrpc\" version");
    }

    Message msg;
    const bool has_id = j.contains("id") && !j["id"].is_null();
    const bool has_method = j.contains("method");

    if (has_method) {
        if (!j["method"].is_string()) {
            return Malformed("\"method\" is not a string");
        }
        msg.method = j["method"].get<std::string>();
        msg.params = j.contains("params") ? j["params"] : nlohmann::json();
        if (has_id) {
            if (!IsValidId(j["id"])) {
                return Malformed("request id must be an integer or a string");
            }
            msg.kind = MessageKind::Request;
            msg.id = j["id"];
        } else {
            msg.kind = MessageKind::Notification;
        }
        return Result<Message, Error>::Ok(std::move(msg));
    }

    if (!has_id) {
        return Malformed("neither a request, a notification nor a response");
    }
    if (!IsValidId(j["id"])) {
        return Malformed("response id must be an integer or a string");
    }

    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");
    if (has_result == has_error) {
        return Malformed("response must carry exactly one of \"result\" and \"error\"");
    }

    msg.kind = MessageKind::Response;
    msg.id = j["id"];
    if (has_result) {
        msg.result = j["result"];
        return Result<Message, Error>::Ok(std::move(msg));
    }

    const auto& err = j["error"];
    if (!err.is_object() || !err.contains("code") || !err["code"].is_number_integer()) {
        return Malformed("error object must carry an integer \"code\"");
    }
    ErrorObject eo;
    eo.code = err["code"].get<int>();
    eo.message = err.contains("message") && err["message"].is_string()
                     ? err["message"].get<std::string>()
                     : std::string();
    eo.data = err.contains("data") ? err["data"] : nlohmann::json();
    msg.error = std::move(eo);
    return Result<Message, Error>::Ok(std::move(msg));
}

std::string Serialize(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace bullvision::rpc
