#pragma once

#include <bullvision/conversation/conversation_context.hpp>
#include <bullvision/core/types.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bullvision {

// ---------------------------------------------------------------------------
// ConversationContextStore — user id -> ConversationContext, created lazily.
//
// Get() never creates two contexts for one user. The store lock only guards
// the map; appends lock the individual context, so different users proceed
// in parallel. Contexts live as long as the store.
// ---------------------------------------------------------------------------
class ConversationContextStore {
public:
    ConversationContextStore() = default;

    ConversationContextStore(const ConversationContextStore&) = delete;
    ConversationContextStore& operator=(const ConversationContextStore&) = delete;

    [[nodiscard]] std::shared_ptr<ConversationContext> Get(const UserId& user_id);

    void Append(const UserId& user_id, Sender sender, std::string content);

    /// Snapshot of the user's messages; empty for an unknown user.
    [[nodiscard]] std::vector<Message> History(const UserId& user_id) const;

    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] bool Contains(const UserId& user_id) const;

private:
    mutable std::mutex mutex_;
    std::map<UserId, std::shared_ptr<ConversationContext>> contexts_;
};

} // namespace bullvision
