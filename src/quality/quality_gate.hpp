#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookstack::quality {

enum class RuleKind {
    NAMING,      // file name, or identifiers captured from content, must match
    FORBIDDEN,   // content must not match
    REQUIRED,    // content must match
    MAX_LINES    // content must not exceed max_lines
};

inline const char* rule_kind_to_string(RuleKind kind) {
    switch (kind) {
        case RuleKind::NAMING:    return "naming";
        case RuleKind::FORBIDDEN: return "forbidden";
        case RuleKind::REQUIRED:  return "required";
        case RuleKind::MAX_LINES: return "max_lines";
        default: return "unknown";
    }
}

inline std::optional<RuleKind> rule_kind_from_string(const std::string& str) {
    if (str == "naming")    return RuleKind::NAMING;
    if (str == "forbidden") return RuleKind::FORBIDDEN;
    if (str == "required")  return RuleKind::REQUIRED;
    if (str == "max_lines") return RuleKind::MAX_LINES;
    return std::nullopt;
}

struct QualityRule {
    std::string name;
    RuleKind kind = RuleKind::FORBIDDEN;
    std::string pattern;
    // NAMING only: declarations whose first capture group is checked against
    // `pattern`. Empty means the file name is checked instead.
    std::string identifier_pattern;
    std::vector<std::string> extensions;   // ".py", ".ts"; empty = every file
    size_t max_lines = 0;
    bool icase = false;
    std::string message;

    bool applies_to(const std::string& file_path) const;

    static QualityRule from_json(const nlohmann::json& j);
};

// Size ceilings checked before any pattern runs. Content beyond them is
// rejected outright.
struct QualityLimits {
    size_t max_line_bytes = 8192;
    size_t max_content_bytes = 2 * 1024 * 1024;

    // "quality": {"max_line_bytes": N, "max_content_bytes": N}
    static QualityLimits from_json(const nlohmann::json& config);
};

struct QualityViolation {
    std::string rule;
    std::string file_path;
    std::string detail;

    nlohmann::json to_json() const;
};

// Ordered pass/fail checks over proposed file content. Patterns are
// matched one line at a time.
class QualityGate {
public:
    explicit QualityGate(std::vector<QualityRule> rules, QualityLimits limits = {});

    // Secret assignments (password, api_key, secret, token) are forbidden.
    static std::vector<QualityRule> default_rules();

    // "quality": {"rules": [...], "include_defaults": true}. Malformed rules
    // are logged and skipped.
    static std::vector<QualityRule> rules_from_json(const nlohmann::json& config);

    // First failing rule, or nullopt if the content passes.
    std::optional<QualityViolation> check(const std::string& file_path,
                                          const std::string& content) const;

    size_t rule_count() const { return rules_.size(); }
    const QualityLimits& limits() const { return limits_; }

private:
    struct CompiledRule {
        QualityRule rule;
        std::regex pattern;
        std::regex identifier;
    };

    std::vector<CompiledRule> rules_;
    QualityLimits limits_;

    std::optional<QualityViolation> check_size(const std::string& file_path,
                                               const std::string& content) const;
};

} // namespace hookstack::quality
