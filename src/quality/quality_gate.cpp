#include "quality/quality_gate.hpp"
#include "core/util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;

namespace hookstack::quality {

namespace {

struct LineSpan {
    size_t begin;
    size_t end;      // exclusive, before the '\n'
    size_t number;   // 1-based
};

std::vector<LineSpan> split_lines(const std::string& content) {
    std::vector<LineSpan> lines;
    size_t start = 0;
    size_t number = 1;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = nl == std::string::npos ? content.size() : nl;
        lines.push_back({start, end, number++});
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

size_t count_lines(const std::string& content) {
    if (content.empty()) return 0;
    size_t n = static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    return content.back() == '\n' ? n : n + 1;
}

} // namespace

bool QualityRule::applies_to(const std::string& file_path) const {
    if (extensions.empty()) return true;
    const std::string ext = core::to_lower(std::filesystem::path(file_path).extension().string());
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& e) { return core::to_lower(e) == ext; });
}

QualityRule QualityRule::from_json(const json& j) {
    QualityRule rule;
    rule.name = j.at("name").get<std::string>();
    const std::string kind = j.value("kind", "forbidden");
    auto parsed = rule_kind_from_string(kind);
    if (!parsed) {
        throw std::invalid_argument("rule '" + rule.name + "': unknown kind '" + kind + "'");
    }
    rule.kind = *parsed;
    rule.pattern = j.value("pattern", "");
    rule.identifier_pattern = j.value("identifier_pattern", "");
    if (j.contains("extensions") && j["extensions"].is_array()) {
        rule.extensions = j["extensions"].get<std::vector<std::string>>();
    }
    rule.max_lines = j.value("max_lines", size_t{0});
    rule.icase = j.value("icase", false);
    rule.message = j.value("message", "");
    return rule;
}

QualityLimits QualityLimits::from_json(const json& config) {
    QualityLimits limits;
    if (!config.contains("quality") || !config["quality"].is_object()) {
        return limits;
    }
    const auto& q = config["quality"];
    if (q.contains("max_line_bytes") && q["max_line_bytes"].is_number_unsigned()) {
        limits.max_line_bytes = q["max_line_bytes"].get<size_t>();
    }
    if (q.contains("max_content_bytes") && q["max_content_bytes"].is_number_unsigned()) {
        limits.max_content_bytes = q["max_content_bytes"].get<size_t>();
    }
    return limits;
}

json QualityViolation::to_json() const {
    return json{
        {"rule", rule},
        {"file_path", file_path},
        {"detail", detail}
    };
}

QualityGate::QualityGate(std::vector<QualityRule> rules, QualityLimits limits)
    : limits_(limits) {
    for (auto& rule : rules) {
        auto flags = std::regex::ECMAScript;
        if (rule.icase) flags |= std::regex::icase;
        try {
            CompiledRule compiled{rule, std::regex(rule.pattern, flags), std::regex()};
            if (!rule.identifier_pattern.empty()) {
                compiled.identifier = std::regex(rule.identifier_pattern, flags);
            }
            rules_.push_back(std::move(compiled));
        } catch (const std::regex_error& e) {
            spdlog::warn("Quality rule '{}' skipped: invalid pattern: {}", rule.name, e.what());
        }
    }
}

std::vector<QualityRule> QualityGate::default_rules() {
    QualityRule secrets;
    secrets.name = "no-hardcoded-secrets";
    secrets.kind = RuleKind::FORBIDDEN;
    secrets.pattern = R"((password|api_key|secret|token)\s*=\s*["'][^"']+["'])";
    secrets.icase = true;
    secrets.message = "Potential hardcoded secret";
    return {secrets};
}

std::vector<QualityRule> QualityGate::rules_from_json(const json& config) {
    std::vector<QualityRule> rules;
    json section = config.value("quality", json::object());
    if (!section.is_object()) {
        spdlog::warn("Ignoring \"quality\" section: not an object");
        section = json::object();
    }

    if (section.value("include_defaults", true)) {
        rules = default_rules();
    }
    if (section.contains("rules") && section["rules"].is_array()) {
        for (const auto& r : section["rules"]) {
            try {
                rules.push_back(QualityRule::from_json(r));
            } catch (const std::exception& e) {
                spdlog::warn("Ignoring quality rule: {}", e.what());
            }
        }
    }
    return rules;
}

std::optional<QualityViolation> QualityGate::check_size(const std::string& file_path,
                                                        const std::string& content) const {
    if (content.size() > limits_.max_content_bytes) {
        return QualityViolation{"content-size", file_path,
            "content is " + std::to_string(content.size()) + " bytes (max " +
            std::to_string(limits_.max_content_bytes) + ")"};
    }
    for (const auto& line : split_lines(content)) {
        if (line.end - line.begin > limits_.max_line_bytes) {
            return QualityViolation{"line-length", file_path,
                "line " + std::to_string(line.number) + " too long: " +
                std::to_string(line.end - line.begin) + " bytes (max " +
                std::to_string(limits_.max_line_bytes) + ")"};
        }
    }
    return std::nullopt;
}

std::optional<QualityViolation> QualityGate::check(const std::string& file_path,
                                                   const std::string& content) const {
    // Oversized input never reaches std::regex, whose matcher recurses per character.
    if (auto violation = check_size(file_path, content)) {
        spdlog::info("Quality size limit '{}' failed for {}", violation->rule, file_path);
        return violation;
    }

    const auto lines = split_lines(content);
    const auto line_begin = [&](const LineSpan& l) { return content.begin() + static_cast<std::ptrdiff_t>(l.begin); };
    const auto line_end = [&](const LineSpan& l) { return content.begin() + static_cast<std::ptrdiff_t>(l.end); };

    for (const auto& compiled : rules_) {
        const QualityRule& rule = compiled.rule;
        if (!rule.applies_to(file_path)) continue;

        std::string detail;
        switch (rule.kind) {
            case RuleKind::FORBIDDEN: {
                for (const auto& line : lines) {
                    if (std::regex_search(line_begin(line), line_end(line), compiled.pattern)) {
                        detail = "forbidden pattern at line " + std::to_string(line.number);
                        break;
                    }
                }
                break;
            }
            case RuleKind::REQUIRED: {
                bool found = std::any_of(lines.begin(), lines.end(), [&](const LineSpan& line) {
                    return std::regex_search(line_begin(line), line_end(line), compiled.pattern);
                });
                if (!found) {
                    detail = "required pattern not found";
                }
                break;
            }
            case RuleKind::NAMING: {
                if (rule.identifier_pattern.empty()) {
                    const std::string name = std::filesystem::path(file_path).filename().string();
                    if (!std::regex_match(name, compiled.pattern)) {
                        detail = "file name '" + name + "' does not match naming convention";
                    }
                    break;
                }
                for (const auto& line : lines) {
                    auto it = std::sregex_iterator(line_begin(line), line_end(line), compiled.identifier);
                    for (; it != std::sregex_iterator(); ++it) {
                        const auto& m = *it;
                        const std::string ident = m.size() > 1 && m[1].matched ? m[1].str() : m[0].str();
                        if (!std::regex_match(ident, compiled.pattern)) {
                            detail = "identifier '" + ident + "' at line " +
                                     std::to_string(line.number) + " does not match naming convention";
                            break;
                        }
                    }
                    if (!detail.empty()) break;
                }
                break;
            }
            case RuleKind::MAX_LINES: {
                size_t count = count_lines(content);
                if (rule.max_lines > 0 && count > rule.max_lines) {
                    detail = "file has " + std::to_string(count) + " lines (max " +
                             std::to_string(rule.max_lines) + ")";
                }
                break;
            }
        }

        if (!detail.empty()) {
            if (!rule.message.empty()) {
                detail = rule.message + ": " + detail;
            }
            spdlog::info("Quality rule '{}' failed for {}", rule.name, file_path);
            return QualityViolation{rule.name, file_path, detail};
        }
    }
    return std::nullopt;
}

} // namespace hookstack::quality
