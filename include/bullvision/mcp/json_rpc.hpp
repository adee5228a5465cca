#pragma once

#include <bullvision/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace bullvision::rpc {

// JSON-RPC 2.0 reserved error codes.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

enum class MessageKind {
    Request,       // method + id
    Notification,  // method, no id
    Response,      // id + result or error
};

struct ErrorObject {
    int code = 0;
    std::string message;
    nlohmann::json data;  // null when absent
};

// ---------------------------------------------------------------------------
// Message — one decoded line of the newline-delimited JSON-RPC stream.
// ---------------------------------------------------------------------------
struct Message {
    MessageKind kind = MessageKind::Notification;
    nlohmann::json id;       // null for notifications
    std::string method;      // requests and notifications
    nlohmann::json params;   // requests and notifications; null when absent
    nlohmann::json result;   // successful responses
    std::optional<ErrorObject> error;  // error responses

    [[nodiscard]] bool IsErrorResponse() const noexcept {
        return kind == MessageKind::Response && error.has_value();
    }
};

nlohmann::json MakeRequest(std::int64_t id, const std::string& method,
                           const nlohmann::json& params);
nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params = nullptr);
nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message);

/// Decode one line. Fails with ErrorCategory::Protocol when the line is not
/// JSON, not a JSON-RPC 2.0 object, or fits none of the three message shapes.
Result<Message, Error> ParseMessage(std::string_view line);

/// Serialize a message to a single line (no trailing newline).
std::string Serialize(const nlohmann::json& message);

} // namespace bullvision::rpc
