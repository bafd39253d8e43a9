#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core/model_tier.hpp"
#include "hooks/agent_registry.hpp"

namespace hookstack::hooks {

// One "@agent-<id>[hint]" directive.
struct AgentMention {
    std::string agent_name;
    std::optional<core::ModelTier> model_hint;
    size_t position = 0;          // byte offset of '@'
    bool unresolved = false;      // not present in the registry
    std::string context;          // surrounding text, whitespace collapsed
};

// Malformed directive; the mention is dropped and parsing continues.
struct ParseError {
    size_t position = 0;
    std::string detail;
};

struct ParseResult {
    std::vector<AgentMention> mentions;   // first-seen order, unique by (name, hint)
    std::vector<ParseError> errors;

    bool has_resolved() const;
};

// Extracts explicit routing directives from free text. Pure: the result only
// depends on the text and the registry.
class MentionParser {
public:
    static constexpr const char* kPrefix = "@agent-";
    static constexpr size_t kContextRadius = 100;

    explicit MentionParser(const AgentRegistry& registry) : registry_(registry) {}

    ParseResult parse(const std::string& text) const;

private:
    const AgentRegistry& registry_;
};

} // namespace hookstack::hooks
