#pragma once

#include <bullvision/core/types.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bullvision {

enum class Sender {
    User,
    Bot,
};

std::string_view SenderName(Sender sender);

// ---------------------------------------------------------------------------
// Message — one immutable entry of a conversation.
// ---------------------------------------------------------------------------
struct Message {
    std::chrono::system_clock::time_point timestamp;
    Sender sender = Sender::User;
    std::string content;
};

struct InvestorProfile {
    std::string risk_tolerance;       // conservative | moderate | aggressive
    std::string investment_horizon;   // short_term | medium_term | long_term
    std::vector<std::string> investment_goals;
};

// Symbol -> weight, as the user stated it.
struct Portfolio {
    std::map<std::string, double> weights;
    std::chrono::system_clock::time_point last_updated;
};

// ---------------------------------------------------------------------------
// ConversationContext — append-only history and investor data of one user.
//
// All members are safe to call concurrently. Appends are serialized; readers
// receive snapshots.
// ---------------------------------------------------------------------------
class ConversationContext {
public:
    explicit ConversationContext(UserId user_id);

    ConversationContext(const ConversationContext&) = delete;
    ConversationContext& operator=(const ConversationContext&) = delete;

    [[nodiscard]] const UserId& User() const noexcept { return user_id_; }
    [[nodiscard]] std::chrono::system_clock::time_point CreatedAt() const noexcept {
        return created_at_;
    }

    void Append(Sender sender, std::string content);
    [[nodiscard]] std::vector<Message> History() const;
    [[nodiscard]] std::size_t MessageCount() const;

    /// "user: ..." / "bot: ..." lines, oldest first.
    [[nodiscard]] std::string FormattedHistory() const;

    void SetProfile(InvestorProfile profile);
    [[nodiscard]] std::optional<InvestorProfile> Profile() const;

    void SetPortfolio(std::map<std::string, double> weights);
    [[nodiscard]] std::optional<Portfolio> CurrentPortfolio() const;

private:
    const UserId user_id_;
    const std::chrono::system_clock::time_point created_at_;

    mutable std::mutex mutex_;
    std::vector<Message> messages_;
    std::optional<InvestorProfile> profile_;
    std::optional<Portfolio> portfolio_;
};

} // namespace bullvision
