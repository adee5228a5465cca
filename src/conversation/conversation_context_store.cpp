#include <bullvision/conversation/conversation_context_store.hpp>

#include <bullvision/core/log.hpp>

namespace bullvision {

std::shared_ptr<ConversationContext> ConversationContextStore::Get(const UserId& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(user_id);
    if (it != contexts_.end()) {
        return it->second;
    }
    auto ctx = std::make_shared<ConversationContext>(user_id);
    contexts_.emplace(user_id, ctx);
    LogDebug("context", "Created conversation context for user " + user_id.Value());
    return ctx;
}

void ConversationContextStore::Append(const UserId& user_id, Sender sender,
                                      std::string content) {
    Get(user_id)->Append(sender, std::move(content));
}

std::vector<Message> ConversationContextStore::History(const UserId& user_id) const {
    std::shared_ptr<ConversationContext> ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(user_id);
        if (it == contexts_.end()) return {};
        ctx = it->second;
    }
    return ctx->History();
}

std::size_t ConversationContextStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

bool ConversationContextStore::Contains(const UserId& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.count(user_id) > 0;
}

} // namespace bullvision
