#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bullvision {

// ---------------------------------------------------------------------------
// ServerHandle — opaque reference to one connection of a running manager.
//
// Handles are only meaningful to the manager that issued them; presenting
// one to another manager, or after Stop(), yields InvalidHandle.
// ---------------------------------------------------------------------------
class ServerHandle {
public:
    ServerHandle(std::uint64_t owner, std::size_t index, std::string name)
        : owner_(owner), index_(index), name_(std::move(name)) {}

    [[nodiscard]] std::uint64_t Owner() const noexcept { return owner_; }
    [[nodiscard]] std::size_t Index() const noexcept { return index_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    bool operator==(const ServerHandle& other) const {
        return owner_ == other.owner_ && index_ == other.index_ && name_ == other.name_;
    }
    bool operator!=(const ServerHandle& other) const { return !(*this == other); }

private:
    std::uint64_t owner_;
    std::size_t index_;
    std::string name_;
};

} // namespace bullvision
