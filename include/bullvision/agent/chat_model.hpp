#pragma once

#include <bullvision/core/result.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bullvision {

struct ChatToolCall {
    std::string id;
    std::string name;
    std::string arguments;   // JSON text as produced by the model
};

struct ChatReply {
    std::string content;
    std::vector<ChatToolCall> tool_calls;
};

// ---------------------------------------------------------------------------
// IChatModel — one OpenAI-style chat completion round trip.
//
// `messages` and `tools` use the chat-completions wire shapes. Transport and
// decoding failures are ErrorCategory::Model.
// ---------------------------------------------------------------------------
class IChatModel {
public:
    IChatModel() = default;
    virtual ~IChatModel() = default;

    IChatModel(const IChatModel&) = delete;
    IChatModel& operator=(const IChatModel&) = delete;

    [[nodiscard]] virtual Result<ChatReply, Error> Complete(const nlohmann::json& messages,
                                                            const nlohmann::json& tools) = 0;
};

/// Decode the first choice of a chat-completions response body.
Result<ChatReply, Error> ParseChatCompletion(const nlohmann::json& body);

} // namespace bullvision
