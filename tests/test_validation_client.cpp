#include <gtest/gtest.h>
#include "../src/validation_client.hpp"
#include "fake_http_client.hpp"

namespace {
const std::string BASE = "http://firewall.test:8000";
}

class ValidationClientTest : public ::testing::Test {
protected:
    FakeHttpClient http;
    FirewallConfig config;

    void SetUp() override {
        config.base_url = BASE;
    }

    ValidationResult validate(const std::string& name, std::optional<std::string> version = std::nullopt) {
        ValidationClient client(http, config);
        return client.validate(name, version);
    }
};

TEST_F(ValidationClientTest, ExistingPackageWithoutVersionIsAllowed) {
    http.respond(BASE + "/simple/requests/", 200, "<html></html>");

    auto result = validate("requests");
    EXPECT_TRUE(result.allowed());
    EXPECT_EQ(result.reason, "passed validation");
    // No version asked, so the detail endpoint is never consulted
    ASSERT_EQ(http.requests.size(), 1u);
    EXPECT_EQ(http.timeouts[0], std::chrono::milliseconds(30000));
}

TEST_F(ValidationClientTest, PinnedBlockedVersionUsesMatchingReason) {
    http.respond(BASE + "/simple/keras/", 200);
    http.respond(BASE + "/blocked/keras", 200,
                 R"({"blocked_versions": 1, "blocked_versions_list": ["3.11.2"], "reasons": ["Version 3.11.2: CVE-2025-12060"]})");

    auto result = validate("keras", "3.11.2");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_EQ(result.reason, "Version 3.11.2: CVE-2025-12060");
    EXPECT_EQ(result.details.failure, FailureKind::BLOCKED);
    ASSERT_TRUE(result.details.blocked_info.has_value());
    EXPECT_EQ(result.details.blocked_info->blocked_versions_list.size(), 1u);
    EXPECT_EQ(result.details.audit_url, BASE + "/blocked/keras");
}

TEST_F(ValidationClientTest, PinnedUnblockedVersionIsAllowed) {
    http.respond(BASE + "/simple/keras/", 200);
    http.respond(BASE + "/blocked/keras", 200,
                 R"({"blocked_versions": 1, "blocked_versions_list": ["3.11.2"], "reasons": ["Version 3.11.2: CVE-2025-12060"]})");

    auto result = validate("keras", "3.12.0");
    EXPECT_TRUE(result.allowed());
    EXPECT_EQ(result.reason, "passed validation");
}

TEST_F(ValidationClientTest, WildcardBlocksEveryVersion) {
    http.respond(BASE + "/simple/evil/", 200);
    http.respond(BASE + "/blocked/evil", 200,
                 R"({"blocked_versions": 1, "blocked_versions_list": ["*"], "reasons": ["Malicious package"]})");

    auto result = validate("evil", "0.0.1");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    // No reason mentions 0.0.1, so the generic message is used
    EXPECT_EQ(result.reason, "version 0.0.1 is blocked");
}

TEST_F(ValidationClientTest, PinnedVersionWithNoDetailRecordIsAllowed) {
    http.respond(BASE + "/simple/requests/", 200);
    http.respond(BASE + "/blocked/requests", 404);

    EXPECT_TRUE(validate("requests", "2.32.0").allowed());
}

TEST_F(ValidationClientTest, ForbiddenJoinsResolverReasons) {
    http.respond(BASE + "/simple/keras/", 403);
    http.respond(BASE + "/blocked/keras", 200,
                 R"({"blocked_versions": 2, "blocked_versions_list": ["3.11.2", "3.11.3"], "reasons": ["Version 3.11.2: CVE-1", "Version 3.11.3: CVE-2"]})");

    auto result = validate("keras");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_EQ(result.reason, "Version 3.11.2: CVE-1; Version 3.11.3: CVE-2");
    EXPECT_EQ(result.details.status_code, 403);
}

TEST_F(ValidationClientTest, ForbiddenWithoutReasonsFallsBackToPolicyMessage) {
    http.respond(BASE + "/simple/keras/", 403);
    http.respond(BASE + "/blocked/keras", 404);

    auto result = validate("keras");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_EQ(result.reason, "blocked by firewall policy");
}

TEST_F(ValidationClientTest, ForbiddenStaysBlockedWhenDetailEndpointIsDown) {
    http.respond(BASE + "/simple/keras/", 403);
    http.fail(BASE + "/blocked/keras", TransportErrorKind::CONNECT);

    auto result = validate("keras");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_EQ(result.reason, "blocked by firewall policy");
}

TEST_F(ValidationClientTest, NotFoundIsBlocked) {
    http.respond(BASE + "/simple/totally-unknown-pkg/", 404);

    auto result = validate("totally-unknown-pkg");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_NE(result.reason.find("package not found"), std::string::npos);
    EXPECT_EQ(result.details.failure, FailureKind::NOT_FOUND);
}

TEST_F(ValidationClientTest, UnexpectedStatusIsBlockedWithCode) {
    http.respond(BASE + "/simple/requests/", 502);

    auto result = validate("requests");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_NE(result.reason.find("502"), std::string::npos);
    EXPECT_EQ(result.details.failure, FailureKind::UNEXPECTED_STATUS);
}

TEST_F(ValidationClientTest, ConnectionFailureIsBlocked) {
    http.fail(BASE + "/simple/requests/", TransportErrorKind::CONNECT);

    auto result = validate("requests");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_NE(result.reason.find(BASE), std::string::npos);
    EXPECT_EQ(result.details.failure, FailureKind::CONNECTION_ERROR);
}

TEST_F(ValidationClientTest, TimeoutIsBlocked) {
    http.fail(BASE + "/simple/requests/", TransportErrorKind::TIMEOUT);

    auto result = validate("requests");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_NE(result.reason.find("timeout"), std::string::npos);
    EXPECT_EQ(result.details.failure, FailureKind::TIMEOUT);
}

TEST_F(ValidationClientTest, OtherTransportFailureIsBlocked) {
    http.fail(BASE + "/simple/requests/", TransportErrorKind::OTHER, "SSL handshake failed");

    auto result = validate("requests");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_NE(result.reason.find("SSL handshake failed"), std::string::npos);
}

TEST_F(ValidationClientTest, DetailFailureDuringVersionCheckIsBlocked) {
    http.respond(BASE + "/simple/keras/", 200);
    http.fail(BASE + "/blocked/keras", TransportErrorKind::TIMEOUT);

    auto result = validate("keras", "3.11.2");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_EQ(result.details.failure, FailureKind::TIMEOUT);
    EXPECT_FALSE(result.reason.empty());
}

TEST_F(ValidationClientTest, UnknownDetailStatusDuringVersionCheckIsBlocked) {
    http.respond(BASE + "/simple/keras/", 200);
    http.respond(BASE + "/blocked/keras", 500);

    auto result = validate("keras", "3.11.2");
    EXPECT_EQ(result.status, ValidationStatus::BLOCK);
    EXPECT_EQ(result.details.failure, FailureKind::UNEXPECTED_STATUS);
    EXPECT_NE(result.reason.find("500"), std::string::npos);
}

TEST_F(ValidationClientTest, NamesAreLowerCasedBeforeAnyRequest) {
    http.respond(BASE + "/simple/keras/", 200);
    http.respond(BASE + "/blocked/keras", 404);

    EXPECT_TRUE(validate("KeRaS", "3.0.0").allowed());
    ASSERT_EQ(http.requests.size(), 2u);
    EXPECT_EQ(http.requests[0], BASE + "/simple/keras/");
    EXPECT_EQ(http.requests[1], BASE + "/blocked/keras");
}

TEST_F(ValidationClientTest, BlockAlwaysHasReason) {
    http.respond(BASE + "/simple/a/", 403);
    http.respond(BASE + "/blocked/a", 200, R"({"blocked_versions": 1, "blocked_versions_list": ["*"], "reasons": [""]})");
    http.respond(BASE + "/simple/b/", 200);
    http.respond(BASE + "/blocked/b", 200, R"({"blocked_versions_list": ["1.0"], "reasons": [""]})");

    auto a = validate("a");
    auto b = validate("b", "1.0");
    EXPECT_EQ(a.status, ValidationStatus::BLOCK);
    EXPECT_FALSE(a.reason.empty());
    EXPECT_EQ(b.status, ValidationStatus::BLOCK);
    EXPECT_FALSE(b.reason.empty());
}
