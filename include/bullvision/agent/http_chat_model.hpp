#pragma once

#include <bullvision/agent/chat_model.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace bullvision {

enum class ChatProvider {
    Azure,    // {endpoint}/openai/deployments/{deployment}/chat/completions
    OpenAI,   // {endpoint}/v1/chat/completions
};

struct ChatModelOptions {
    ChatProvider provider = ChatProvider::Azure;
    std::string endpoint;      // scheme://host[:port]
    std::string deployment;    // deployment (azure) or model name (openai)
    std::string api_version = "2024-06-01";
    std::string api_key;
    double temperature = 0.2;
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{120};
};

/// Request path for the configured provider.
std::string ChatCompletionsPath(const ChatModelOptions& options);

// ---------------------------------------------------------------------------
// HttpChatModel — IChatModel over cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header.
// ---------------------------------------------------------------------------
class HttpChatModel : public IChatModel {
public:
    explicit HttpChatModel(ChatModelOptions options);
    ~HttpChatModel() override;

    [[nodiscard]] Result<ChatReply, Error> Complete(const nlohmann::json& messages,
                                                    const nlohmann::json& tools) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bullvision
