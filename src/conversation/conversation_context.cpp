#include <bullvision/conversation/conversation_context.hpp>

namespace bullvision {

std::string_view SenderName(Sender sender) {
    switch (sender) {
        case Sender::User: return "user";
        case Sender::Bot:  return "bot";
    }
    return "user";
}

ConversationContext::ConversationContext(UserId user_id)
    : user_id_(std::move(user_id)), created_at_(std::chrono::system_clock::now()) {}

void ConversationContext::Append(Sender sender, std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(Message{std::chrono::system_clock::now(), sender, std::move(content)});
}

std::vector<Message> ConversationContext::History() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::size_t ConversationContext::MessageCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::string ConversationContext::FormattedHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& m : messages_) {
        if (!out.empty()) out += "\n";
        out += SenderName(m.sender);
        out += ": ";
        out += m.content;
    }
    return out;
}

void ConversationContext::SetProfile(InvestorProfile profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    profile_ = std::move(profile);
}

std::optional<InvestorProfile> ConversationContext::Profile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_;
}

void ConversationContext::SetPortfolio(std::map<std::string, double> weights) {
    std::lock_guard<std::mutex> lock(mutex_);
    portfolio_ = Portfolio{std::move(weights), std::chrono::system_clock::now()};
}

std::optional<Portfolio> ConversationContext::CurrentPortfolio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return portfolio_;
}

} // namespace bullvision
