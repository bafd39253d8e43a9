#include <gtest/gtest.h>
#include "gateway/gateway.hpp"
#include "test_support.hpp"

using namespace hookstack;
using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

const core::TimePoint kStart = core::from_epoch_ms(1700000000000);

gateway::MCPRequest request(const std::string& service, json input = json::object()) {
    return *gateway::mcp_request_from_tool("mcp__" + service + "__call", input);
}

gateway::GatewayConfig config_with(std::initializer_list<std::string> services, uint32_t limit) {
    gateway::GatewayConfig config;
    for (const auto& name : services) {
        gateway::ServicePolicy policy;
        policy.name = name;
        policy.limit = limit;
        policy.window = seconds(60);
        config.services[name] = policy;
    }
    return config;
}

} // namespace

class GatewayTest : public ::testing::Test {
protected:
    test_support::TempDir dir;
    std::filesystem::path ledger() const { return dir.path() / gateway::Gateway::kFileName; }
};

TEST(MCPRequestTest, ParsesToolName) {
    auto req = gateway::mcp_request_from_tool("mcp__github__create_issue", json{{"title", "x"}});
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->service, "github");
    EXPECT_EQ(req->operation, "create_issue");
    EXPECT_EQ(req->payload_text, "title: x\n");
    EXPECT_EQ(req->payload_digest.size(), 16u);

    EXPECT_FALSE(gateway::mcp_request_from_tool("Write", json::object()).has_value());
    EXPECT_FALSE(gateway::mcp_request_from_tool("mcp__", json::object()).has_value());
    EXPECT_EQ(gateway::mcp_request_from_tool("mcp__memory", json::object())->operation, "unknown");
}

TEST_F(GatewayTest, UnknownServiceIsNotAllowed) {
    gateway::Gateway gw(config_with({"github"}, 5), ledger());
    auto decision = gw.admit(request("slack"), kStart);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, gateway::DenyReason::SERVICE_NOT_ALLOWED);
}

TEST_F(GatewayTest, LimitThenRetryAfter) {
    gateway::Gateway gw(config_with({"search"}, 3), ledger());

    for (int i = 0; i < 3; ++i) {
        auto d = gw.admit(request("search"), kStart + seconds(i));
        EXPECT_TRUE(d.allowed) << i;
        EXPECT_EQ(d.remaining, static_cast<uint32_t>(2 - i));
    }

    auto denied = gw.admit(request("search"), kStart + seconds(10));
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.reason, gateway::DenyReason::RATE_LIMIT_EXCEEDED);
    EXPECT_EQ(denied.retry_after, milliseconds(50000));

    auto after_window = gw.admit(request("search"), kStart + seconds(60));
    EXPECT_TRUE(after_window.allowed);
}

TEST_F(GatewayTest, LedgerIsSharedAcrossInstances) {
    {
        gateway::Gateway first(config_with({"search"}, 2), ledger());
        EXPECT_TRUE(first.admit(request("search"), kStart).allowed);
        EXPECT_TRUE(first.admit(request("search"), kStart).allowed);
    }
    gateway::Gateway second(config_with({"search"}, 2), ledger());
    EXPECT_EQ(second.admit(request("search"), kStart).reason,
              gateway::DenyReason::RATE_LIMIT_EXCEEDED);
}

TEST_F(GatewayTest, ConcurrentServiceBudget) {
    auto config = config_with({"s1", "s2", "s3", "s4", "s5", "s6"}, 10);
    config.max_concurrent_services = 5;
    gateway::Gateway gw(config, ledger());

    for (const char* s : {"s1", "s2", "s3", "s4", "s5"}) {
        EXPECT_TRUE(gw.admit(request(s), kStart).allowed) << s;
    }
    // A service already in flight is not a new service.
    EXPECT_TRUE(gw.admit(request("s3"), kStart).allowed);

    auto denied = gw.admit(request("s6"), kStart);
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.reason, gateway::DenyReason::TOOL_BUDGET_EXCEEDED);

    EXPECT_TRUE(gw.release("s1", kStart + seconds(1)));
    EXPECT_TRUE(gw.admit(request("s6"), kStart + seconds(1)).allowed);
}

TEST_F(GatewayTest, ExpiredLeasesFreeBudget) {
    auto config = config_with({"a", "b"}, 10);
    config.max_concurrent_services = 1;
    config.lease_ttl = seconds(5);
    gateway::Gateway gw(config, ledger());

    EXPECT_TRUE(gw.admit(request("a"), kStart).allowed);
    EXPECT_EQ(gw.admit(request("b"), kStart + seconds(1)).reason,
              gateway::DenyReason::TOOL_BUDGET_EXCEEDED);
    EXPECT_TRUE(gw.admit(request("b"), kStart + seconds(6)).allowed);
}

TEST_F(GatewayTest, ReleaseWithoutLease) {
    gateway::Gateway gw(config_with({"a"}, 10), ledger());
    EXPECT_FALSE(gw.release("a", kStart));
}

TEST_F(GatewayTest, SensitivePayloadIsPolicyViolation) {
    auto config = gateway::GatewayConfig::defaults();
    gateway::Gateway gw(config, ledger());

    auto decision = gw.admit(request("github", json{{"body", "password: hunter2"}}), kStart);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, gateway::DenyReason::POLICY_VIOLATION);
    EXPECT_EQ(decision.message.find("hunter2"), std::string::npos);

    // Rejected calls do not consume quota.
    auto ok = gw.admit(request("github", json{{"body", "hello"}}), kStart);
    EXPECT_TRUE(ok.allowed);
    EXPECT_EQ(ok.remaining, config.services["github"].limit - 1);
}

TEST_F(GatewayTest, ServiceSpecificRules) {
    gateway::Gateway gw(gateway::GatewayConfig::defaults(), ledger());

    auto url = gw.admit(request("playwright", json{{"url", "JavaScript:alert(1)"}}), kStart);
    EXPECT_EQ(url.reason, gateway::DenyReason::POLICY_VIOLATION);

    auto ssn = gw.admit(request("web-search", json{{"query", "lookup 123-45-6789"}}), kStart);
    EXPECT_EQ(ssn.reason, gateway::DenyReason::POLICY_VIOLATION);

    auto fine = gw.admit(request("web-search", json{{"query", "weather tomorrow"}}), kStart);
    EXPECT_TRUE(fine.allowed);
}

TEST_F(GatewayTest, OversizedPayloadIsPolicyViolation) {
    auto config = config_with({"notes"}, 10);
    config.services["notes"].max_payload_bytes = 16;
    gateway::Gateway gw(config, ledger());

    auto decision = gw.admit(request("notes", json{{"text", std::string(64, 'x')}}), kStart);
    EXPECT_EQ(decision.reason, gateway::DenyReason::POLICY_VIOLATION);
}

TEST_F(GatewayTest, LongFieldIsRejectedWithoutScanning) {
    gateway::Gateway gw(gateway::GatewayConfig::defaults(), ledger());
    auto decision = gw.admit(request("github", json{{"body", "password: " + std::string(200 * 1024, 'a')}}),
                             kStart);
    EXPECT_EQ(decision.reason, gateway::DenyReason::POLICY_VIOLATION);
    EXPECT_NE(decision.message.find("max-field-bytes"), std::string::npos);
}

TEST_F(GatewayTest, PreviewDoesNotConsumeQuota) {
    gateway::Gateway gw(config_with({"a"}, 1), ledger());

    auto preview = gw.preview(request("a"), kStart);
    EXPECT_TRUE(preview.allowed);
    EXPECT_EQ(preview.remaining, 1u);
    EXPECT_FALSE(std::filesystem::exists(ledger()));

    EXPECT_TRUE(gw.admit(request("a"), kStart).allowed);
    EXPECT_EQ(gw.preview(request("a"), kStart).reason, gateway::DenyReason::RATE_LIMIT_EXCEEDED);
    EXPECT_EQ(gw.preview(request("b"), kStart).reason, gateway::DenyReason::SERVICE_NOT_ALLOWED);
}

TEST_F(GatewayTest, InvalidPatternIsSkipped) {
    auto config = config_with({"a"}, 10);
    config.sensitive_patterns = {{"broken", "([unclosed", false}};
    gateway::Gateway gw(config, ledger());
    EXPECT_TRUE(gw.admit(request("a", json{{"q", "anything"}}), kStart).allowed);
}

TEST_F(GatewayTest, StatusReportsUsage) {
    gateway::Gateway gw(config_with({"a", "b"}, 4), ledger());
    gw.admit(request("a"), kStart);
    gw.admit(request("a"), kStart);

    json status = gw.status(kStart + seconds(1));
    EXPECT_EQ(status["services"]["a"]["used"], 2);
    EXPECT_EQ(status["services"]["a"]["remaining"], 2);
    EXPECT_EQ(status["services"]["a"]["in_flight"], 2);
    EXPECT_EQ(status["services"]["b"]["used"], 0);
    EXPECT_EQ(status["in_flight_services"], 1);
}

TEST_F(GatewayTest, CorruptLedgerIsReinitialized) {
    test_support::write_file(ledger(), "not json at all");
    gateway::Gateway gw(config_with({"a"}, 1), ledger());
    EXPECT_TRUE(gw.admit(request("a"), kStart).allowed);
    EXPECT_EQ(gw.admit(request("a"), kStart).reason, gateway::DenyReason::RATE_LIMIT_EXCEEDED);
}

TEST_F(GatewayTest, MalformedLedgerFieldsAreReinitialized) {
    test_support::write_file(ledger(), R"({
        "windows": {"a": {"count": "x", "window_start_ms": 1700000000000}},
        "in_flight": {"a": [42]}
    })");
    gateway::Gateway gw(config_with({"a"}, 1), ledger());

    EXPECT_NO_THROW(gw.status(kStart));
    EXPECT_TRUE(gw.admit(request("a"), kStart).allowed);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(gw.admit(request("a"), kStart).reason, gateway::DenyReason::RATE_LIMIT_EXCEEDED);
    }
    EXPECT_EQ(gw.status(kStart)["services"]["a"]["used"], 1);
}

TEST_F(GatewayTest, MalformedLeaseIsDroppedOnRelease) {
    test_support::write_file(ledger(), R"({"in_flight": {"a": ["lease", {"expires_ms": "soon"}]}})");
    gateway::Gateway gw(config_with({"a"}, 5), ledger());
    EXPECT_FALSE(gw.release("a", kStart));
    EXPECT_TRUE(gw.admit(request("a"), kStart).allowed);
    EXPECT_TRUE(gw.release("a", kStart));
}

TEST(GatewayConfigTest, JsonOverlaysDefaults) {
    json j = {
        {"gateway", {{"max_concurrent_services", 2}, {"lease_ttl_seconds", 30}}},
        {"services", {
            {"playwright", {{"enabled", false}}},
            {"github", {{"limit", 99}}},
            {"jira", {{"limit", 7}, {"window_seconds", 10}}}
        }}
    };
    auto config = gateway::GatewayConfig::from_json(j);
    EXPECT_EQ(config.max_concurrent_services, 2u);
    EXPECT_EQ(config.lease_ttl, seconds(30));
    EXPECT_EQ(config.services.count("playwright"), 0u);
    EXPECT_EQ(config.services["github"].limit, 99u);
    EXPECT_EQ(config.services["jira"].window, seconds(10));
    EXPECT_EQ(config.services["obsidian"].limit, 30u);
}
