#include <bullvision/agent/chat_model.hpp>

namespace bullvision {

Result<ChatReply, Error> ParseChatCompletion(const nlohmann::json& body) {
    auto malformed = [](const std::string& why) {
        return Result<ChatReply, Error>::Err(Error::Make(
            ErrorCategory::Model, "ParseChatCompletion", "", "Unexpected completion: " + why));
    };

    if (!body.is_object()) return malformed("body is not an object");
    auto choices = body.find("choices");
    if (choices == body.end() || !choices->is_array() || choices->empty()) {
        return malformed("no choices");
    }
    const auto& choice = (*choices)[0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return malformed("choice has no message");
    }
    const auto& message = choice["message"];

    ChatReply reply;
    auto content = message.find("content");
    if (content != message.end() && content->is_string()) {
        reply.content = content->get<std::string>();
    }

    auto calls = message.find("tool_calls");
    if (calls != message.end() && calls->is_array()) {
        for (const auto& call : *calls) {
            if (!call.is_object() || !call.contains("function") ||
                !call["function"].is_object()) {
                return malformed("tool call without a function");
            }
            const auto& fn = call["function"];
            if (!fn.contains("name") || !fn["name"].is_string()) {
                return malformed("tool call without a function name");
            }
            ChatToolCall tc;
            tc.id = call.contains("id") && call["id"].is_string()
                        ? call["id"].get<std::string>()
                        : std::string();
            tc.name = fn["name"].get<std::string>();
            if (fn.contains("arguments")) {
                const auto& args = fn["arguments"];
                tc.arguments = args.is_string() ? args.get<std::string>() : args.dump();
            }
            reply.tool_calls.push_back(std::move(tc));
        }
    }
    return Result<ChatReply, Error>::Ok(std::move(reply));
}

} // namespace bullvision
