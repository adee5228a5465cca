#include <bullvision/agent/chat_completions_engine.hpp>

#include <bullvision/core/log.hpp>
#include <bullvision/mcp/mcp_messages.hpp>

#include <chrono>
#include <ctime>
#include <map>
#include <sstream>

namespace bullvision {

namespace {

constexpr std::size_t kMaxFunctionName = 64;

std::string TodayUtc() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string ToolMessageError(const std::string& kind, const std::string& message) {
    // Parser messages quote raw input bytes, which need not be valid UTF-8.
    return nlohmann::json{{"error", kind}, {"message", message}}
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Text of a successful tools/call result as the model should see it.
std::string ToolResultText(const nlohmann::json& result) {
    auto text = mcp::JoinTextContent(result);
    return text.empty()
               ? result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
               : text;
}

std::string DescribeProfile(const ConversationContext& ctx) {
    std::ostringstream out;
    if (auto profile = ctx.Profile()) {
        out << "\n\n### Investor profile\n"
            << "- Risk tolerance: " << profile->risk_tolerance << "\n"
            << "- Investment horizon: " << profile->investment_horizon << "\n"
            << "- Goals: ";
        for (std::size_t i = 0; i < profile->investment_goals.size(); ++i) {
            if (i > 0) out << ", ";
            out << profile->investment_goals[i];
        }
    }
    if (auto portfolio = ctx.CurrentPortfolio()) {
        out << "\n\n### Portfolio\n";
        for (const auto& [symbol, weight] : portfolio->weights) {
            out << "- " << symbol << ": " << weight << "\n";
        }
    }
    return out.str();
}

} // anonymous namespace

const std::string& DefaultInstructions() {
    static const std::string kInstructions =
        "You are Bull Vision, an AI-powered stock trading assistant and swing trading "
        "expert. Help users analyze stocks and market conditions, manage their "
        "portfolio and assess risk.\n\n"
        "When users ask about a specific stock:\n"
        "1. Ask for the ticker if it was not given.\n"
        "2. Ask for the time period of the news search if it was not given.\n"
        "3. Use the available tools to gather news, prices, volume signals and "
        "company data, then give balanced insights that highlight the risks.\n\n"
        "Structure answers with a *Summary* first, then *Technical Analysis*, "
        "*Fundamental Analysis* and *Entry/Exit Points* when applicable, and end with "
        "_Risk Warnings_. Use Telegram markdown: *bold* for key points, _italic_ for "
        "terms, `code` for numbers.\n\n"
        "Remember: past performance is not indicative of future results.";
    return kInstructions;
}

std::string FunctionNameFor(const std::string& server, const std::string& tool) {
    std::string name = server + "__" + tool;
    for (auto& c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) c = '_';
    }
    if (name.size() > kMaxFunctionName) {
        name.resize(kMaxFunctionName);
    }
    return name;
}

ChatCompletionsEngine::ChatCompletionsEngine(IChatModel& model, EngineOptions options,
                                             Clock today)
    : model_(model), options_(std::move(options)), today_(std::move(today)) {
    if (!today_) today_ = TodayUtc;
    if (options_.max_steps < 1) options_.max_steps = 1;
}

std::string ChatCompletionsEngine::BuildSystemPrompt(const TurnInput& input) const {
    std::string prompt = options_.instructions.empty() ? DefaultInstructions()
                                                       : options_.instructions;
    prompt += "\n\nToday's date: " + today_();
    prompt += DescribeProfile(input.context);

    // The handler records the current input before the turn; leave it out of
    // the history since it is sent as the user message.
    auto history = input.context.History();
    if (!history.empty() && history.back().sender == Sender::User &&
        history.back().content == input.input_text) {
        history.pop_back();
    }
    if (!history.empty()) {
        prompt += "\n\n### Conversation so far\n";
        for (const auto& m : history) {
            prompt += std::string(SenderName(m.sender)) + ": " + m.content + "\n";
        }
    }
    return prompt;
}

Result<std::string, Error> ChatCompletionsEngine::RunTurn(const TurnInput& input,
                                                          IToolInvoker& invoker) {
    // Function name -> catalog entry. Colliding names get a numeric suffix.
    std::map<std::string, const CatalogEntry*> functions;
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& entry : input.catalog) {
        auto name = FunctionNameFor(entry.handle.Name(), entry.tool.name);
        for (int n = 2; functions.count(name) > 0; ++n) {
            auto suffix = "_" + std::to_string(n);
            name = FunctionNameFor(entry.handle.Name(), entry.tool.name)
                       .substr(0, kMaxFunctionName - suffix.size()) + suffix;
        }
        functions[name] = &entry;
        tools.push_back({
            {"type", "function"},
            {"function", {
                {"name", name},
                {"description", entry.tool.description},
                {"parameters", entry.tool.input_schema}
            }}
        });
    }

    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", BuildSystemPrompt(input)}});
    messages.push_back({{"role", "user"}, {"content", input.input_text}});

    for (int step = 0; step < options_.max_steps; ++step) {
        auto reply = model_.Complete(messages, tools);
        if (reply.IsErr()) {
            return Result<std::string, Error>::Err(reply.Error());
        }
        const auto& r = reply.Value();
        if (r.tool_calls.empty()) {
            LogDebug("engine", "Final answer after " + std::to_string(step + 1) + " step(s)");
            return Result<std::string, Error>::Ok(r.content);
        }

        nlohmann::json calls = nlohmann::json::array();
        for (const auto& tc : r.tool_calls) {
            calls.push_back({
                {"id", tc.id},
                {"type", "function"},
                {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
            });
        }
        messages.push_back({
            {"role", "assistant"},
            {"content", r.content.empty() ? nlohmann::json() : nlohmann::json(r.content)},
            {"tool_calls", calls}
        });

        for (const auto& tc : r.tool_calls) {
            std::string content;
            auto fn = functions.find(tc.name);
            if (fn == functions.end()) {
                LogWarn("engine", "Model asked for unknown tool " + tc.name);
                content = ToolMessageError("unknown_tool", "No tool named '" + tc.name + "'");
            } else {
                nlohmann::json args = nlohmann::json::object();
                bool args_ok = true;
                if (!tc.arguments.empty()) {
                    try {
                        args = nlohmann::json::parse(tc.arguments);
                    } catch (const nlohmann::json::parse_error& e) {
                        args_ok = false;
                        content = ToolMessageError("invalid_arguments", e.what());
                    }
                }
                if (args_ok && !args.is_object()) {
                    args_ok = false;
                    content = ToolMessageError("invalid_arguments",
                                               "Arguments must be a JSON object");
                }
                if (args_ok) {
                    const auto& entry = *fn->second;
                    auto result = invoker.Invoke(entry.handle, entry.tool.name, args);
                    if (result.IsOk()) {
                        content = ToolResultText(result.Value());
                    } else {
                        LogWarn("engine", "Tool " + tc.name + " failed: " +
                                              result.Error().ToString());
                        content = ToolMessageError(result.Error().CategoryName(),
                                                   result.Error().message);
                    }
                } else {
                    LogWarn("engine", "Bad arguments for " + tc.name + ": " + content);
                }
            }
            messages.push_back({
                {"role", "tool"},
                {"tool_call_id", tc.id},
                {"content", content}
            });
        }
    }

    LogWarn("engine", "Step budget of " + std::to_string(options_.max_steps) +
                          " exhausted without a final answer");
    return Result<std::string, Error>::Ok(
        "I could not finish this analysis within " + std::to_string(options_.max_steps) +
        " steps. Please try a narrower question, for example a single ticker and period.");
}

} // namespace bullvision
