#include <gtest/gtest.h>
#include "../src/connectivity_probe.hpp"
#include "fake_http_client.hpp"

namespace {
const std::string BASE = "http://firewall.test:8000";
}

class ConnectivityTest : public ::testing::Test {
protected:
    FakeHttpClient http;
    FirewallConfig config;

    void SetUp() override {
        config.base_url = BASE;
    }

    bool reachable() {
        ConnectivityProbe p(http, config);
        return p.check_connectivity();
    }
};

TEST_F(ConnectivityTest, OkMeansReachable) {
    http.respond(BASE + "/simple/", 200);
    EXPECT_TRUE(reachable());
    EXPECT_EQ(http.timeouts.at(0), std::chrono::milliseconds(5000));
}

TEST_F(ConnectivityTest, NotFoundStillMeansReachable) {
    http.respond(BASE + "/simple/", 404);
    EXPECT_TRUE(reachable());
}

TEST_F(ConnectivityTest, ServerErrorMeansUnreachable) {
    http.respond(BASE + "/simple/", 500);
    EXPECT_FALSE(reachable());
}

TEST_F(ConnectivityTest, RefusedMeansUnreachable) {
    http.fail(BASE + "/simple/", TransportErrorKind::CONNECT);
    EXPECT_FALSE(reachable());
}

TEST_F(ConnectivityTest, TimeoutMeansUnreachable) {
    http.fail(BASE + "/simple/", TransportErrorKind::TIMEOUT);
    EXPECT_FALSE(reachable());
}
