#pragma once

#include <bullvision/core/result.hpp>
#include <bullvision/mcp/types.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bullvision::mcp {

inline constexpr const char* kProtocolVersion = "2024-11-05";

inline constexpr const char* kMethodInitialize = "initialize";
inline constexpr const char* kMethodInitialized = "notifications/initialized";
inline constexpr const char* kMethodToolsList = "tools/list";
inline constexpr const char* kMethodToolsCall = "tools/call";
inline constexpr const char* kMethodPing = "ping";
inline constexpr const char* kNotifyToolsListChanged = "notifications/tools/list_changed";

/// Params for the initialize request sent by this client.
nlohmann::json MakeInitializeParams();

/// Validate an initialize result. Fails with ErrorCategory::Connection when the
/// reply is not an object with a string protocolVersion.
Result<ServerInfo, Error> ParseInitializeResult(const nlohmann::json& result,
                                                const std::string& server);

// ---------------------------------------------------------------------------
// ToolsPage — one page of a tools/list reply.
// ---------------------------------------------------------------------------
struct ToolsPage {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> next_cursor;
};

/// Params for a tools/list request (cursor for follow-up pages).
nlohmann::json MakeToolsListParams(const std::optional<std::string>& cursor);

/// Parse a tools/list result. Fails with ErrorCategory::Protocol when the
/// result has no tools array or a tool entry has no string name.
Result<ToolsPage, Error> ParseToolsListResult(const nlohmann::json& result,
                                              const std::string& server);

nlohmann::json MakeToolsCallParams(const std::string& tool_name,
                                   const nlohmann::json& arguments);

/// True when a tools/call result reports a tool-level failure (isError).
bool IsToolError(const nlohmann::json& call_result);

/// Concatenate the text content blocks of a tools/call result, one per line.
/// Returns an empty string when there are none.
std::string JoinTextContent(const nlohmann::json& call_result);

} // namespace bullvision::mcp
