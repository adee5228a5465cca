#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace bullvision {

// ---------------------------------------------------------------------------
// ToolDescriptor — one tool advertised by a backend in tools/list.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
    bool operator!=(const ToolDescriptor& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// ServerInfo — what a backend reported about itself during initialize.
// ---------------------------------------------------------------------------
struct ServerInfo {
    std::string protocol_version;
    std::string name;
    std::string version;
    nlohmann::json capabilities = nlohmann::json::object();
};

} // namespace bullvision
