#include "gateway/mcp_request.hpp"
#include "core/util.hpp"

namespace hookstack::gateway {

namespace {

// "key: value" lines for every string leaf, so patterns written against
// "password: ..." or "token=..." see the field name next to its value.
void flatten(const nlohmann::json& j, const std::string& key, std::string& out) {
    if (j.is_string()) {
        if (!key.empty()) {
            out += key;
            out += ": ";
        }
        out += j.get<std::string>();
        out += '\n';
    } else if (j.is_object()) {
        for (auto& [k, v] : j.items()) {
            flatten(v, k, out);
        }
    } else if (j.is_array()) {
        for (const auto& v : j) {
            flatten(v, key, out);
        }
    } else if (!j.is_null()) {
        if (!key.empty()) {
            out += key;
            out += ": ";
        }
        out += j.dump();
        out += '\n';
    }
}

} // namespace

nlohmann::json MCPRequest::to_json() const {
    return nlohmann::json{
        {"service", service},
        {"operation", operation},
        {"tool_name", tool_name},
        {"payload_digest", payload_digest}
    };
}

std::optional<MCPRequest> mcp_request_from_tool(const std::string& tool_name,
                                                const nlohmann::json& tool_input) {
    static const std::string kPrefix = "mcp__";
    if (tool_name.rfind(kPrefix, 0) != 0) {
        return std::nullopt;
    }

    std::string rest = tool_name.substr(kPrefix.size());
    size_t sep = rest.find("__");
    MCPRequest req;
    req.tool_name = tool_name;
    if (sep == std::string::npos) {
        req.service = rest;
        req.operation = "unknown";
    } else {
        req.service = rest.substr(0, sep);
        req.operation = rest.substr(sep + 2);
    }
    if (req.service.empty()) {
        return std::nullopt;
    }

    flatten(tool_input, "", req.payload_text);
    req.payload_digest = core::to_hex(core::fnv1a64(tool_input.dump()));
    return req;
}

} // namespace hookstack::gateway
