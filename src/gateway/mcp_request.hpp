#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hookstack::gateway {

// A call an agent step wants to make to an external tool service.
// `payload_text` lives only for the duration of the invocation; only the
// digest is ever logged or persisted.
struct MCPRequest {
    std::string service;
    std::string operation;
    std::string tool_name;
    std::string payload_text;
    std::string payload_digest;

    nlohmann::json to_json() const;   // without payload_text
};

// "mcp__<service>__<operation>" -> request; nullopt for other tool names.
std::optional<MCPRequest> mcp_request_from_tool(const std::string& tool_name,
                                                const nlohmann::json& tool_input);

} // namespace hookstack::gateway
