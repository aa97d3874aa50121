// tests/test_mock_backend.cpp
#include <string>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

#include "../BackendServers/MockBackendResponses.hpp"

TEST(MockBackendResponsesTest, HealthBodyReflectsState) {
    auto healthy = nlohmann::json::parse(MockBackendResponses::healthBody("ride-a", true));
    EXPECT_EQ(healthy["status"], "ok");
    EXPECT_EQ(healthy["instance"], "ride-a");

    auto draining = nlohmann::json::parse(MockBackendResponses::healthBody("ride-\"b\"", false));
    EXPECT_EQ(draining["status"], "unhealthy");
    EXPECT_EQ(draining["instance"], "ride-\"b\"");
}

TEST(MockBackendResponsesTest, EchoBodyStaysValidJsonForControlCharacters) {
    const std::string request_body = "{\n\t\"pickup\": \"Main St\\\\5\"\r\n}\x01";
    const std::string echoed = MockBackendResponses::echoBody(
        "ride-a", "POST", "/rides", "req-1", "10.0.0.7, 10.0.0.8", request_body);

    nlohmann::json parsed;
    ASSERT_NO_THROW(parsed = nlohmann::json::parse(echoed)) << echoed;
    EXPECT_EQ(parsed["instance"], "ride-a");
    EXPECT_EQ(parsed["method"], "POST");
    EXPECT_EQ(parsed["path"], "/rides");
    EXPECT_EQ(parsed["requestId"], "req-1");
    EXPECT_EQ(parsed["forwardedFor"], "10.0.0.7, 10.0.0.8");
    EXPECT_EQ(parsed["body"], request_body);
}
