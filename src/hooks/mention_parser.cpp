#include "hooks/mention_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace hookstack::hooks {

namespace {

bool is_ident_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '-';
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string context_around(const std::string& text, size_t start, size_t end, size_t radius) {
    size_t from = start > radius ? start - radius : 0;
    size_t to = std::min(text.size(), end + radius);
    return collapse_whitespace(text.substr(from, to - from));
}

} // namespace

bool ParseResult::has_resolved() const {
    return std::any_of(mentions.begin(), mentions.end(),
                       [](const AgentMention& m) { return !m.unresolved; });
}

ParseResult MentionParser::parse(const std::string& text) const {
    ParseResult result;
    const size_t prefix_len = std::strlen(kPrefix);

    size_t pos = text.find(kPrefix);
    while (pos != std::string::npos) {
        size_t cursor = pos + prefix_len;

        size_t ident_end = cursor;
        while (ident_end < text.size() && is_ident_char(text[ident_end])) {
            ++ident_end;
        }
        // "@agent-backend-" at the end of a phrase: the hyphen is punctuation.
        size_t trimmed_end = ident_end;
        while (trimmed_end > cursor && text[trimmed_end - 1] == '-') {
            --trimmed_end;
        }
        std::string ident = text.substr(cursor, trimmed_end - cursor);

        if (ident.empty()) {
            result.errors.push_back({pos, "missing agent identifier"});
            pos = text.find(kPrefix, cursor);
            continue;
        }

        std::optional<core::ModelTier> hint;
        size_t mention_end = ident_end;
        bool malformed = false;

        if (trimmed_end == ident_end && ident_end < text.size() && text[ident_end] == '[') {
            size_t close = text.find(']', ident_end + 1);
            size_t stop = text.find_first_of(" \t\r\n[", ident_end + 1);
            if (close == std::string::npos || (stop != std::string::npos && stop < close)) {
                result.errors.push_back({pos, "unterminated model hint for '" + ident + "'"});
                malformed = true;
                mention_end = ident_end + 1;
            } else {
                std::string raw = text.substr(ident_end + 1, close - ident_end - 1);
                hint = core::model_tier_from_string(raw);
                if (!hint) {
                    result.errors.push_back({pos, "unknown model hint '" + raw + "' for '" + ident + "'"});
                    malformed = true;
                }
                mention_end = close + 1;
            }
        }

        if (!malformed) {
            bool duplicate = std::any_of(result.mentions.begin(), result.mentions.end(),
                [&](const AgentMention& m) {
                    return m.agent_name == ident && m.model_hint == hint;
                });
            if (!duplicate) {
                AgentMention mention;
                mention.agent_name = ident;
                mention.model_hint = hint;
                mention.position = pos;
                mention.unresolved = !registry_.contains(ident);
                mention.context = context_around(text, pos, mention_end, kContextRadius);
                result.mentions.push_back(std::move(mention));
            }
        }

        pos = text.find(kPrefix, mention_end);
    }

    return result;
}

} // namespace hookstack::hooks
