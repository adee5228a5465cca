#pragma once

#include <bullvision/agent/agent_dispatcher.hpp>
#include <bullvision/conversation/conversation_context_store.hpp>
#include <bullvision/core/result.hpp>
#include <bullvision/core/types.hpp>
#include <bullvision/news/news_store.hpp>
#include <bullvision/server/server_handle.hpp>

#include <map>
#include <string>
#include <vector>

namespace bullvision {

/// Welcome text of /start.
extern const char* const kWelcomeText;
/// Usage text of /help.
extern const char* const kHelpText;
/// Reply sent when a turn cannot start at all.
extern const char* const kApologyText;

/// Parse "/profile" arguments: <risk> <horizon> <goal>... Values are
/// checked against the known choices.
Result<InvestorProfile, std::string> ParseProfileArgs(const std::string& args);

/// Parse "/portfolio" arguments: SYM=weight[,SYM=weight...]. Symbols are
/// upper-cased; weights must be non-negative and sum to 1.0.
Result<std::map<std::string, double>, std::string> ParsePortfolioArgs(const std::string& args);

// ---------------------------------------------------------------------------
// MessageHandler — the inbound-message entry point of the host.
//
// Chat commands are answered locally. Any other text is recorded in the
// user's conversation, dispatched to the agent, and the reply recorded too.
// News artifacts of the turn go to the store; storage failures are logged
// and never reach the user. Handle() always produces a reply.
// ---------------------------------------------------------------------------
class MessageHandler {
public:
    MessageHandler(ConversationContextStore& contexts, AgentDispatcher& dispatcher,
                   INewsStore* news_store, std::vector<ServerHandle> handles);

    MessageHandler(const MessageHandler&) = delete;
    MessageHandler& operator=(const MessageHandler&) = delete;

    [[nodiscard]] std::string Handle(const UserId& user_id, const std::string& text);

private:
    std::string HandleCommand(ConversationContext& context, const std::string& command,
                              const std::string& args);

    ConversationContextStore& contexts_;
    AgentDispatcher& dispatcher_;
    INewsStore* news_store_;
    std::vector<ServerHandle> handles_;
};

} // namespace bullvision
