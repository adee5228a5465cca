#include <bullvision/app/message_handler.hpp>

#include <bullvision/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <set>
#include <sstream>
#include <stdexcept>

namespace bullvision {

const char* const kWelcomeText =
    "Welcome to Bull Vision Agent! \xF0\x9F\x9A\x80\n\n"
    "I can help you analyze stocks and manage your portfolio.\n"
    "Use /portfolio to set up your portfolio or /help to see all available commands.";

const char* const kHelpText =
    "Available commands:\n"
    "/start - Start the bot\n"
    "/portfolio [SYM=weight,...] - Show or update your portfolio\n"
    "/profile [risk horizon goals...] - Show or update your investor profile\n"
    "/help - Show this help message\n\n"
    "You can also ask me questions about stocks, market analysis, or portfolio management.";

const char* const kApologyText =
    "Sorry, I can't reach my market data services right now. Please try again later.";

namespace {

constexpr const char* kUnknownCommand = "Unknown command. Use /help to see available commands.";
constexpr double kWeightTolerance = 0.001;

const std::set<std::string> kRiskChoices = {"conservative", "moderate", "aggressive"};
const std::set<std::string> kHorizonChoices = {"short_term", "medium_term", "long_term"};
const std::set<std::string> kGoalChoices = {"growth", "value", "dividend"};

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string Join(const std::set<std::string>& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ", ";
        out += v;
    }
    return out;
}

std::string FormatWeight(double weight) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", weight);
    return buf;
}

std::string DescribeProfile(const InvestorProfile& profile) {
    std::string goals;
    for (const auto& g : profile.investment_goals) {
        if (!goals.empty()) goals += ", ";
        goals += g;
    }
    return "Risk tolerance: " + profile.risk_tolerance +
           "\nInvestment horizon: " + profile.investment_horizon +
           "\nGoals: " + goals;
}

std::string DescribePortfolio(const Portfolio& portfolio) {
    std::string out = "Your portfolio:";
    for (const auto& [symbol, weight] : portfolio.weights) {
        out += "\n" + symbol + ": " + FormatWeight(weight);
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Command argument parsing
// ---------------------------------------------------------------------------

Result<InvestorProfile, std::string> ParseProfileArgs(const std::string& args) {
    using R = Result<InvestorProfile, std::string>;

    std::istringstream in(args);
    std::vector<std::string> words;
    for (std::string w; in >> w;) {
        words.push_back(ToLower(w));
    }
    if (words.size() < 3) {
        return R::Err("Usage: /profile <risk> <horizon> <goal> [goal...]");
    }

    InvestorProfile profile;
    profile.risk_tolerance = words[0];
    if (kRiskChoices.count(profile.risk_tolerance) == 0) {
        return R::Err("Risk tolerance must be one of: " + Join(kRiskChoices));
    }
    profile.investment_horizon = words[1];
    if (kHorizonChoices.count(profile.investment_horizon) == 0) {
        return R::Err("Investment horizon must be one of: " + Join(kHorizonChoices));
    }
    for (std::size_t i = 2; i < words.size(); ++i) {
        if (kGoalChoices.count(words[i]) == 0) {
            return R::Err("Goals must be from: " + Join(kGoalChoices));
        }
        if (std::find(profile.investment_goals.begin(), profile.investment_goals.end(),
                      words[i]) == profile.investment_goals.end()) {
            profile.investment_goals.push_back(words[i]);
        }
    }
    return R::Ok(std::move(profile));
}

Result<std::map<std::string, double>, std::string> ParsePortfolioArgs(const std::string& args) {
    using R = Result<std::map<std::string, double>, std::string>;

    std::map<std::string, double> weights;
    double total = 0.0;
    std::istringstream in(args);
    for (std::string item; std::getline(in, item, ',');) {
        item = Trim(item);
        if (item.empty()) continue;
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            return R::Err("Expected SYMBOL=weight, got '" + item + "'");
        }
        const auto symbol = ToUpper(Trim(item.substr(0, eq)));
        const auto value = Trim(item.substr(eq + 1));
        if (symbol.empty()) {
            return R::Err("Missing symbol in '" + item + "'");
        }
        double weight = 0.0;
        try {
            std::size_t used = 0;
            weight = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
        } catch (const std::exception&) {
            return R::Err("Invalid weight for " + symbol + ": '" + value + "'");
        }
        if (weight < 0.0) {
            return R::Err("Weight for " + symbol + " must not be negative");
        }
        if (!weights.emplace(symbol, weight).second) {
            return R::Err("Symbol " + symbol + " listed twice");
        }
        total += weight;
    }
    if (weights.empty()) {
        return R::Err("Usage: /portfolio SYM=weight[,SYM=weight...]");
    }
    if (std::fabs(total - 1.0) > kWeightTolerance) {
        return R::Err("Weights must sum to 1.0. Please try again.");
    }
    return R::Ok(std::move(weights));
}

// ---------------------------------------------------------------------------
// MessageHandler
// ---------------------------------------------------------------------------

MessageHandler::MessageHandler(ConversationContextStore& contexts, AgentDispatcher& dispatcher,
                               INewsStore* news_store, std::vector<ServerHandle> handles)
    : contexts_(contexts),
      dispatcher_(dispatcher),
      news_store_(news_store),
      handles_(std::move(handles)) {}

std::string MessageHandler::Handle(const UserId& user_id, const std::string& text) {
    auto context = contexts_.Get(user_id);

    const auto trimmed = Trim(text);
    if (!trimmed.empty() && trimmed.front() == '/') {
        const auto space = trimmed.find_first_of(" \t");
        const auto command = ToLower(trimmed.substr(0, space));
        const auto args = space == std::string::npos ? "" : Trim(trimmed.substr(space));
        return HandleCommand(*context, command, args);
    }

    context->Append(Sender::User, text);

    auto turn = dispatcher_.Run(text, *context, handles_);
    if (turn.IsErr()) {
        const auto& err = turn.Error();
        if (!err.IsDispatchError()) {
            LogError("host", "Unexpected dispatch failure: " + err.ToString());
        }
        context->Append(Sender::Bot, kApologyText);
        return kApologyText;
    }

    auto result = std::move(turn).Value();
    context->Append(Sender::Bot, result.output);

    if (news_store_ != nullptr && !result.artifacts.empty()) {
        auto stored = StoreArticles(*news_store_, result.artifacts);
        if (stored.IsErr()) {
            LogWarn("news", "Storing news artifacts failed: " + stored.Error().ToString());
        } else if (!stored.Value().empty()) {
            LogInfo("news", "Stored " + std::to_string(stored.Value().size()) +
                                " new article(s) for " + user_id.Value());
        }
    }
    return result.output;
}

std::string MessageHandler::HandleCommand(ConversationContext& context,
                                          const std::string& command,
                                          const std::string& args) {
    LogDebug("host", context.User().Value() + " sent " + command);

    if (command == "/start") return kWelcomeText;
    if (command == "/help") return kHelpText;

    if (command == "/profile") {
        if (args.empty()) {
            auto profile = context.Profile();
            if (!profile.has_value()) {
                return "No investor profile yet. Usage: /profile <risk> <horizon> <goal> [goal...]";
            }
            return DescribeProfile(*profile);
        }
        auto parsed = ParseProfileArgs(args);
        if (parsed.IsErr()) return parsed.Error();
        context.SetProfile(parsed.Value());
        return "Profile updated.\n" + DescribeProfile(parsed.Value());
    }

    if (command == "/portfolio") {
        if (args.empty()) {
            auto portfolio = context.CurrentPortfolio();
            if (!portfolio.has_value()) {
                return "No portfolio yet. Usage: /portfolio SYM=weight[,SYM=weight...]";
            }
            return DescribePortfolio(*portfolio);
        }
        auto parsed = ParsePortfolioArgs(args);
        if (parsed.IsErr()) return parsed.Error();
        context.SetPortfolio(parsed.Value());
        return "Portfolio updated successfully! You can now ask me questions about your portfolio.";
    }

    return kUnknownCommand;
}

} // namespace bullvision
