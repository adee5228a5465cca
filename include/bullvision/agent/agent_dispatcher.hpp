#pragma once

#include <bullvision/agent/reasoning_engine.hpp>
#include <bullvision/conversation/conversation_context.hpp>
#include <bullvision/core/result.hpp>
#include <bullvision/news/news_article.hpp>
#include <bullvision/server/i_tool_servers.hpp>
#include <bullvision/server/server_handle.hpp>

#include <set>
#include <string>
#include <vector>

namespace bullvision {

struct AgentTurnResult {
    std::string output;
    std::vector<NewsArticle> artifacts;   // in discovery order, no duplicates
    bool degraded = false;                // engine failed; output is a fallback
};

struct DispatcherOptions {
    // Server or tool names whose results carry news articles.
    std::set<std::string> news_source_tools;
};

// ---------------------------------------------------------------------------
// AgentDispatcher — runs one reasoning turn against the live tool servers.
//
// Run() fails only when the turn cannot start:
//   NoBackendsAvailable     no handles, or none of the backends is Ready
//   ToolCatalogUnavailable  any other tool-listing failure
// Tool failures go to the engine as data; engine failures produce a
// degraded answer.
// ---------------------------------------------------------------------------
class AgentDispatcher {
public:
    AgentDispatcher(IToolServers& servers, IReasoningEngine& engine,
                    DispatcherOptions options = {});

    [[nodiscard]] Result<AgentTurnResult, Error> Run(
        const std::string& input_text,
        const ConversationContext& context,
        const std::vector<ServerHandle>& handles);

    [[nodiscard]] Result<ToolCatalog, Error> BuildCatalog(
        const std::vector<ServerHandle>& handles);

private:
    IToolServers& servers_;
    IReasoningEngine& engine_;
    DispatcherOptions options_;
};

} // namespace bullvision
