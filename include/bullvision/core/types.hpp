#pragma once

#include <bullvision/core/result.hpp>

#include <string>
#include <string_view>

namespace bullvision {

// ---------------------------------------------------------------------------
// ServerName — validated tool-server name, the unique key of a backend.
//
// Rules:
//   - Non-empty, max 64 characters
//   - ASCII letters, digits, '-', '_' and '.'
//   - Must start with a letter or digit
// ---------------------------------------------------------------------------
class ServerName {
public:
    static Result<ServerName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ServerName& other) const { return value_ == other.value_; }
    bool operator!=(const ServerName& other) const { return value_ != other.value_; }
    bool operator<(const ServerName& other) const { return value_ < other.value_; }

    ServerName(const ServerName&) = default;
    ServerName& operator=(const ServerName&) = default;
    ServerName(ServerName&&) noexcept = default;
    ServerName& operator=(ServerName&&) noexcept = default;

private:
    explicit ServerName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// UserId — opaque chat-platform user identifier.
//
// Rules:
//   - Non-empty, max 128 characters
//   - No control characters (tabs and newlines frame the host's input)
// ---------------------------------------------------------------------------
class UserId {
public:
    static Result<UserId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const UserId& other) const { return value_ == other.value_; }
    bool operator!=(const UserId& other) const { return value_ != other.value_; }
    bool operator<(const UserId& other) const { return value_ < other.value_; }

    UserId(const UserId&) = default;
    UserId& operator=(const UserId&) = default;
    UserId(UserId&&) noexcept = default;
    UserId& operator=(UserId&&) noexcept = default;

private:
    explicit UserId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace bullvision

