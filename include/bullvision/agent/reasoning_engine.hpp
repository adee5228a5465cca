#pragma once

#include <bullvision/conversation/conversation_context.hpp>
#include <bullvision/core/result.hpp>
#include <bullvision/mcp/types.hpp>
#include <bullvision/server/server_handle.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bullvision {

// One tool of the turn's catalog and the backend that serves it.
struct CatalogEntry {
    ServerHandle handle;
    ToolDescriptor tool;
};

using ToolCatalog = std::vector<CatalogEntry>;

struct TurnInput {
    const std::string& input_text;
    const ConversationContext& context;
    const ToolCatalog& catalog;
};

// ---------------------------------------------------------------------------
// IToolInvoker — how an engine reaches the tool servers during a turn.
// Failures come back as values; nothing is thrown.
// ---------------------------------------------------------------------------
class IToolInvoker {
public:
    IToolInvoker() = default;
    virtual ~IToolInvoker() = default;

    IToolInvoker(const IToolInvoker&) = delete;
    IToolInvoker& operator=(const IToolInvoker&) = delete;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Invoke(
        const ServerHandle& handle,
        const std::string& tool_name,
        const nlohmann::json& arguments) = 0;
};

// ---------------------------------------------------------------------------
// IReasoningEngine — produces the answer for one turn, calling tools through
// the invoker zero or more times. Tool failures are the engine's to handle;
// an Err return means the engine itself could not run.
// ---------------------------------------------------------------------------
class IReasoningEngine {
public:
    IReasoningEngine() = default;
    virtual ~IReasoningEngine() = default;

    IReasoningEngine(const IReasoningEngine&) = delete;
    IReasoningEngine& operator=(const IReasoningEngine&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> RunTurn(const TurnInput& input,
                                                             IToolInvoker& invoker) = 0;
};

} // namespace bullvision
