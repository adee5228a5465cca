#include <bullvision/agent/http_chat_model.hpp>

#include <bullvision/core/log.hpp>

#include <httplib.h>

namespace bullvision {

namespace {

std::string Truncate(const std::string& s, std::size_t max) {
    return s.size() <= max ? s : s.substr(0, max) + "...";
}

} // anonymous namespace

std::string ChatCompletionsPath(const ChatModelOptions& options) {
    if (options.provider == ChatProvider::Azure) {
        return "/openai/deployments/" + options.deployment +
               "/chat/completions?api-version=" + options.api_version;
    }
    return "/v1/chat/completions";
}

// ---------------------------------------------------------------------------
// Impl — holds the httplib::Client.
// ---------------------------------------------------------------------------
struct HttpChatModel::Impl {
    ChatModelOptions options;
    std::unique_ptr<httplib::Client> client;

    explicit Impl(ChatModelOptions opts) : options(std::move(opts)) {
        client = std::make_unique<httplib::Client>(options.endpoint);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
    }

    httplib::Headers Headers() const {
        httplib::Headers hdrs;
        if (options.provider == ChatProvider::Azure) {
            hdrs.emplace("api-key", options.api_key);
        } else {
            hdrs.emplace("Authorization", "Bearer " + options.api_key);
        }
        return hdrs;
    }
};

HttpChatModel::HttpChatModel(ChatModelOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpChatModel::~HttpChatModel() = default;

Result<ChatReply, Error> HttpChatModel::Complete(const nlohmann::json& messages,
                                                 const nlohmann::json& tools) {
    const auto& opts = impl_->options;
    const auto path = ChatCompletionsPath(opts);

    nlohmann::json body = {
        {"messages", messages},
        {"temperature", opts.temperature}
    };
    if (opts.provider == ChatProvider::OpenAI) {
        body["model"] = opts.deployment;
    }
    if (tools.is_array() && !tools.empty()) {
        body["tools"] = tools;
        body["tool_choice"] = "auto";
    }

    LogDebug("engine", "POST " + opts.endpoint + path);
    auto res = impl_->client->Post(path, impl_->Headers(),
                                   body.dump(-1, ' ', false,
                                             nlohmann::json::error_handler_t::replace),
                                   "application/json");
    if (!res) {
        const auto http_error = res.error();
        return Result<ChatReply, Error>::Err(Error::Make(
            ErrorCategory::Model, "ChatCompletion", opts.endpoint,
            "HTTP request failed: " + httplib::to_string(http_error)));
    }
    if (res->status != 200) {
        auto err = Error::Make(ErrorCategory::Model, "ChatCompletion", opts.endpoint,
                               "HTTP " + std::to_string(res->status));
        err.detail = Truncate(res->body, 2000);
        return Result<ChatReply, Error>::Err(std::move(err));
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<ChatReply, Error>::Err(Error::Make(
            ErrorCategory::Model, "ChatCompletion", opts.endpoint,
            std::string("Response is not JSON: ") + e.what()));
    }
    auto reply = ParseChatCompletion(parsed);
    if (reply.IsErr()) {
        auto err = reply.Error();
        err.target = opts.endpoint;
        return Result<ChatReply, Error>::Err(std::move(err));
    }
    return reply;
}

} // namespace bullvision
