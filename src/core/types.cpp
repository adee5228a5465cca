#include <bullvision/core/types.hpp>

#include <algorithm>

namespace bullvision {

namespace {

bool IsAsciiAlnum(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool IsServerNameChar(char c) {
    return IsAsciiAlnum(c) || c == '-' || c == '_' || c == '.';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ServerName
// ---------------------------------------------------------------------------
Result<ServerName, std::string> ServerName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ServerName, std::string>::Err("Server name must not be empty");
    }
    if (name.size() > 64) {
        return Result<ServerName, std::string>::Err(
            "Server name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!IsAsciiAlnum(name[0])) {
        return Result<ServerName, std::string>::Err(
            "Server name must start with a letter or digit");
    }
    if (!std::all_of(name.begin(), name.end(), IsServerNameChar)) {
        return Result<ServerName, std::string>::Err(
            "Server name must contain only letters, digits, '-', '_' and '.'");
    }
    return Result<ServerName, std::string>::Ok(ServerName(std::string(name)));
}

// ---------------------------------------------------------------------------
// UserId
// ---------------------------------------------------------------------------
Result<UserId, std::string> UserId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<UserId, std::string>::Err("User id must not be empty");
    }
    if (id.size() > 128) {
        return Result<UserId, std::string>::Err(
            "User id must be at most 128 characters, got " +
            std::to_string(id.size()));
    }
    auto has_control = std::any_of(id.begin(), id.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x20 || c == 0x7f;
    });
    if (has_control) {
        return Result<UserId, std::string>::Err(
            "User id must not contain control characters");
    }
    return Result<UserId, std::string>::Ok(UserId(std::string(id)));
}

} // namespace bullvision
