#include <gtest/gtest.h>
#include "quality/quality_gate.hpp"

using namespace hookstack;
using json = nlohmann::json;

namespace {

quality::QualityRule rule(const std::string& name, quality::RuleKind kind, const std::string& pattern) {
    quality::QualityRule r;
    r.name = name;
    r.kind = kind;
    r.pattern = pattern;
    return r;
}

} // namespace

TEST(QualityGateTest, ForbiddenPatternRejectsContent) {
    quality::QualityGate gate({rule("no-password-literal", quality::RuleKind::FORBIDDEN,
                                    R"(password\s*=\s*".+")")});

    auto violation = gate.check("src/config.py", "user = \"bob\"\npassword = \"abc123\"\n");
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->rule, "no-password-literal");
    EXPECT_EQ(violation->file_path, "src/config.py");
    EXPECT_NE(violation->detail.find("line 2"), std::string::npos);

    EXPECT_FALSE(gate.check("src/config.py", "password = os.environ[\"PW\"]\n").has_value());
}

TEST(QualityGateTest, DefaultRulesCatchSecrets) {
    quality::QualityGate gate(quality::QualityGate::default_rules());
    auto violation = gate.check("app.js", "const API_KEY = 'sk-live-123';");
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->rule, "no-hardcoded-secrets");
    EXPECT_FALSE(gate.check("app.js", "const apiKey = process.env.API_KEY;").has_value());
}

TEST(QualityGateTest, FirstFailingRuleWins) {
    quality::QualityGate gate({
        rule("needs-docstring", quality::RuleKind::REQUIRED, R"(""")"),
        rule("no-print", quality::RuleKind::FORBIDDEN, R"(\bprint\()"),
    });
    auto violation = gate.check("a.py", "print('hi')\n");
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->rule, "needs-docstring");

    violation = gate.check("a.py", "\"\"\"Doc.\"\"\"\nprint('hi')\n");
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->rule, "no-print");
}

TEST(QualityGateTest, NamingRuleOnIdentifiers) {
    auto naming = rule("snake-case-functions", quality::RuleKind::NAMING, "[a-z_][a-z0-9_]*");
    naming.identifier_pattern = R"(def\s+([A-Za-z_]\w*))";
    naming.extensions = {".py"};
    quality::QualityGate gate({naming});

    EXPECT_FALSE(gate.check("m.py", "def load_data():\n    pass\n").has_value());

    auto violation = gate.check("m.py", "def ok():\n    pass\n\ndef LoadData():\n    pass\n");
    ASSERT_TRUE(violation.has_value());
    EXPECT_NE(violation->detail.find("LoadData"), std::string::npos);
    EXPECT_NE(violation->detail.find("line 4"), std::string::npos);

    // Extension filter.
    EXPECT_FALSE(gate.check("m.js", "def LoadData():").has_value());
}

TEST(QualityGateTest, NamingRuleOnFileName) {
    quality::QualityGate gate({rule("kebab-files", quality::RuleKind::NAMING, R"([a-z0-9-]+\.ts)")});
    EXPECT_FALSE(gate.check("src/user-service.ts", "").has_value());
    EXPECT_TRUE(gate.check("src/UserService.ts", "").has_value());
}

TEST(QualityGateTest, MaxLines) {
    auto r = rule("short-files", quality::RuleKind::MAX_LINES, "");
    r.max_lines = 2;
    quality::QualityGate gate({r});
    EXPECT_FALSE(gate.check("a.txt", "one\ntwo\n").has_value());
    EXPECT_TRUE(gate.check("a.txt", "one\ntwo\nthree").has_value());
}

TEST(QualityGateTest, RulesFromJson) {
    json config = {{"quality", {
        {"include_defaults", false},
        {"rules", {
            {{"name", "no-todo"}, {"kind", "forbidden"}, {"pattern", "TODO"}, {"message", "Resolve TODOs"}},
            {{"name", "bad"}, {"kind", "sometimes"}},
            {{"name", "broken-regex"}, {"kind", "forbidden"}, {"pattern", "(["}}
        }}
    }}};
    auto rules = quality::QualityGate::rules_from_json(config);
    ASSERT_EQ(rules.size(), 2u);

    quality::QualityGate gate(rules);
    EXPECT_EQ(gate.rule_count(), 1u);
    auto violation = gate.check("x.c", "// TODO later");
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->detail.rfind("Resolve TODOs", 0), 0u);

    EXPECT_EQ(quality::QualityGate::rules_from_json(json::object()).size(), 1u);
}

TEST(QualityGateTest, OversizedLineRejectedBeforeMatching) {
    quality::QualityGate gate(quality::QualityGate::default_rules());
    const std::string content = "password = \"" + std::string(200 * 1024, 'a') + "\"\n";

    auto violation = gate.check("big.py", content);
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->rule, "line-length");
    EXPECT_NE(violation->detail.find("line 1"), std::string::npos);
}

TEST(QualityGateTest, OversizedContentRejected) {
    quality::QualityLimits limits;
    limits.max_content_bytes = 64;
    quality::QualityGate gate({}, limits);

    EXPECT_FALSE(gate.check("a.txt", std::string(64, 'x')).has_value());
    auto violation = gate.check("a.txt", std::string(65, 'x'));
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->rule, "content-size");
}

TEST(QualityGateTest, ManyShortLinesStillMatched) {
    quality::QualityGate gate(quality::QualityGate::default_rules());
    std::string content;
    for (int i = 0; i < 5000; ++i) {
        content += "x_" + std::to_string(i) + " = " + std::to_string(i) + "\n";
    }
    EXPECT_FALSE(gate.check("big.py", content).has_value());

    content += "token = \"abc\"\n";
    auto violation = gate.check("big.py", content);
    ASSERT_TRUE(violation.has_value());
    EXPECT_NE(violation->detail.find("line 5001"), std::string::npos);
}

TEST(QualityGateTest, LimitsFromJson) {
    json config = {{"quality", {{"max_line_bytes", 100}, {"max_content_bytes", 1000}}}};
    auto limits = quality::QualityLimits::from_json(config);
    EXPECT_EQ(limits.max_line_bytes, 100u);
    EXPECT_EQ(limits.max_content_bytes, 1000u);

    auto defaults = quality::QualityLimits::from_json(json::object());
    EXPECT_EQ(defaults.max_line_bytes, 8192u);
}
