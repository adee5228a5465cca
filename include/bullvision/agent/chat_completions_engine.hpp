#pragma once

#include <bullvision/agent/chat_model.hpp>
#include <bullvision/agent/reasoning_engine.hpp>

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace bullvision {

struct EngineOptions {
    int max_steps = 8;
    std::string instructions;   // empty = built-in Bull Vision prompt
};

/// The built-in trading-assistant instructions.
const std::string& DefaultInstructions();

/// `<server>__<tool>` with characters outside [A-Za-z0-9_-] replaced by '_',
/// cut to 64 characters.
std::string FunctionNameFor(const std::string& server, const std::string& tool);

// ---------------------------------------------------------------------------
// ChatCompletionsEngine — multi-step tool-calling loop over an IChatModel.
//
// Every step sends the whole transcript. A reply without tool calls ends the
// turn. Tool results and tool failures are appended as tool messages so the
// model can react to them; only model transport failures end the turn with
// an error.
// ---------------------------------------------------------------------------
class ChatCompletionsEngine : public IReasoningEngine {
public:
    using Clock = std::function<std::string()>;   // current date, for the prompt

    ChatCompletionsEngine(IChatModel& model, EngineOptions options, Clock today = {});

    [[nodiscard]] Result<std::string, Error> RunTurn(const TurnInput& input,
                                                     IToolInvoker& invoker) override;

    /// The system message for this turn (instructions, date, investor data
    /// and prior conversation).
    [[nodiscard]] std::string BuildSystemPrompt(const TurnInput& input) const;

private:
    IChatModel& model_;
    EngineOptions options_;
    Clock today_;
};

} // namespace bullvision
