// tests/test_gateway.cpp
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/core/Gateway.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

class GatewayTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<NiceMock<MockTransport>> transport = std::make_shared<NiceMock<MockTransport>>();
    ServiceRegistry registry{logger, statsd};
    std::unique_ptr<Gateway> gateway;

    // Last request seen by the transport.
    std::optional<http::request<http::string_body>> forwarded;
    std::string forwarded_to;

    void SetUp() override {
        ServiceConfig rides = makeServiceConfig("ride-service", {"http://ride-a:3005"});
        rides.route_prefix = "/api/rides";
        rides.max_retries = 0;
        registry.registerService(rides);

        ServiceConfig bookings = makeServiceConfig("booking-service", {"http://booking:3002"});
        bookings.route_prefix = "/api/rides/bookings";
        bookings.max_retries = 0;
        registry.registerService(bookings);

        registry.registerService(makeServiceConfig("user-service", {"http://user:3001"}));

        auto router = std::make_shared<RequestRouter>(registry, transport, logger, statsd);
        gateway = std::make_unique<Gateway>(registry, router, logger, statsd);

        ON_CALL(*transport, forward(_, _, _, _))
            .WillByDefault(Invoke([this](const BackendUrlInfo& endpoint, http::request<http::string_body> req, std::chrono::milliseconds, ITransport::Callback cb) {
                forwarded_to = endpoint.url;
                forwarded = std::move(req);
                http::response<http::string_body> res{http::status::created, 11};
                res.set(http::field::content_type, "application/json");
                res.body() = R"({"id":"ride-1"})";
                res.prepare_payload();
                cb(TransportResult::success(std::move(res)));
            }));
    }

    http::response<http::string_body> send(http::request<http::string_body> req, const std::string& client = "10.0.0.7") {
        auto slot = std::make_shared<std::optional<http::response<http::string_body>>>();
        gateway->processRequest(std::move(req), client, [slot](std::optional<http::response<http::string_body>> res) {
            *slot = std::move(res);
        });
        EXPECT_TRUE(slot->has_value());
        return slot->has_value() ? std::move(**slot) : http::response<http::string_body>{};
    }

    http::response<http::string_body> get(const std::string& target) {
        return send(http::request<http::string_body>{http::verb::get, target, 11});
    }

    http::response<http::string_body> withBody(http::verb verb, const std::string& target, const std::string& body) {
        http::request<http::string_body> req{verb, target, 11};
        req.body() = body;
        req.prepare_payload();
        return send(std::move(req));
    }
};

TEST_F(GatewayTest, MatchesLongestPrefixAndStripsIt) {
    auto match = gateway->matchRoute("/api/rides/42?expand=driver");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->service_name, "ride-service");
    EXPECT_EQ(match->forward_target, "/42?expand=driver");

    match = gateway->matchRoute("/api/rides/bookings/7");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->service_name, "booking-service");
    EXPECT_EQ(match->forward_target, "/7");

    match = gateway->matchRoute("/api/rides");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->forward_target, "/");

    match = gateway->matchRoute("/user-service/profile");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->service_name, "user-service");

    EXPECT_FALSE(gateway->matchRoute("/api/ridesharing").has_value());
    EXPECT_FALSE(gateway->matchRoute("/unknown").has_value());
}

TEST_F(GatewayTest, ProxiesWithGatewayHeaders) {
    http::request<http::string_body> req{http::verb::post, "/api/rides/book", 11};
    req.set("X-Forwarded-For", "203.0.113.9");
    req.body() = R"({"pickup":"A"})";
    req.prepare_payload();

    auto res = send(std::move(req));
    EXPECT_EQ(res.result(), http::status::created);
    EXPECT_EQ(res.body(), R"({"id":"ride-1"})");
    EXPECT_EQ(res["X-Gateway-Processed"], "true");
    EXPECT_EQ(res["X-Service-Name"], "ride-service");

    ASSERT_TRUE(forwarded.has_value());
    EXPECT_EQ(forwarded_to, "http://ride-a:3005");
    EXPECT_EQ(std::string(forwarded->target()), "/book");
    EXPECT_EQ(forwarded->method(), http::verb::post);
    EXPECT_EQ(forwarded->body(), R"({"pickup":"A"})");
    EXPECT_EQ((*forwarded)["X-Gateway"], "ride-gateway");
    EXPECT_EQ((*forwarded)["X-Forwarded-For"], "203.0.113.9, 10.0.0.7");
    EXPECT_FALSE((*forwarded)["X-Request-ID"].empty());
    EXPECT_EQ(res["X-Request-ID"], (*forwarded)["X-Request-ID"]);
}

TEST_F(GatewayTest, KeepsInboundRequestId) {
    http::request<http::string_body> req{http::verb::get, "/api/rides/1", 11};
    req.set("X-Request-ID", "abc-123");
    send(std::move(req));
    ASSERT_TRUE(forwarded.has_value());
    EXPECT_EQ((*forwarded)["X-Request-ID"], "abc-123");
    EXPECT_EQ((*forwarded)["X-Forwarded-For"], "10.0.0.7");
}

TEST_F(GatewayTest, UnavailableServiceReturns503WithReason) {
    (*registry.instances("ride-service"))[0]->markUnhealthy();
    auto res = get("/api/rides/1");
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["error"], "Service temporarily unavailable");
    EXPECT_EQ(body["service"], "ride-service");
    EXPECT_EQ(body["code"], "SERVICE_UNAVAILABLE");
    EXPECT_EQ(body["reason"], "no_healthy_instances");

    auto breaker = registry.getBreaker("user-service");
    for (int i = 0; i < 5; ++i) breaker->recordFailure(breaker->allowRequest());
    body = json::parse(get("/user-service/me").body());
    EXPECT_EQ(body["reason"], "circuit_open");
}

TEST_F(GatewayTest, TransportFailureSurfacesAsRetriesExhausted) {
    ON_CALL(*transport, forward(_, _, _, _))
        .WillByDefault(Invoke([](const BackendUrlInfo&, http::request<http::string_body>, std::chrono::milliseconds, ITransport::Callback cb) {
            cb(TransportResult::failure("connection refused"));
        }));
    auto res = get("/api/rides/1");
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    EXPECT_EQ(json::parse(res.body())["reason"], "retries_exhausted");
}

TEST_F(GatewayTest, UnmatchedPathIs404) {
    EXPECT_CALL(*transport, forward(_, _, _, _)).Times(0);
    auto res = get("/nowhere");
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(json::parse(res.body())["error"], "Route not found");
}

TEST_F(GatewayTest, HealthEndpoint) {
    auto res = get("/health");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], "ok");
    EXPECT_TRUE(body.contains("timestamp"));
    EXPECT_GE(body["uptime"].get<double>(), 0.0);
}

TEST_F(GatewayTest, StatusAndMetricsDescribeEveryService) {
    (*registry.instances("ride-service"))[0]->markUnhealthy();
    auto status = json::parse(get("/status").body());
    ASSERT_TRUE(status.contains("ride-service"));
    EXPECT_EQ(status["ride-service"]["healthyInstances"], 0);
    EXPECT_EQ(status["ride-service"]["totalInstances"], 1);
    EXPECT_EQ(status["ride-service"]["instances"][0]["url"], "http://ride-a:3005");
    EXPECT_EQ(status["ride-service"]["instances"][0]["healthy"], false);
    EXPECT_EQ(status["ride-service"]["instances"][0]["weight"], 1);
    EXPECT_EQ(status["user-service"]["circuitBreaker"]["state"], "CLOSED");

    auto metrics = json::parse(get("/metrics").body());
    EXPECT_EQ(metrics["services"].size(), 3u);
    EXPECT_TRUE(metrics.contains("timestamp"));
    EXPECT_TRUE(metrics.contains("uptime"));
}

TEST_F(GatewayTest, AdminAddsAndRemovesInstances) {
    auto res = withBody(http::verb::post, "/admin/services/ride-service/instances",
                        R"({"address":"http://ride-b:3005","weight":2})");
    EXPECT_EQ(res.result(), http::status::ok);
    auto instances = registry.instances("ride-service");
    ASSERT_EQ(instances->size(), 2u);
    EXPECT_EQ((*instances)[1]->weight(), 2);

    res = send(http::request<http::string_body>{http::verb::delete_,
        "/admin/services/ride-service/instances?address=http%3A%2F%2Fride-b%3A3005", 11});
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(registry.instances("ride-service")->size(), 1u);

    res = send(http::request<http::string_body>{http::verb::delete_,
        "/admin/services/ride-service/instances?address=http://ride-b:3005", 11});
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(GatewayTest, AdminRejectsBadInput) {
    EXPECT_EQ(withBody(http::verb::post, "/admin/services/ride-service/instances", "{not json").result(),
              http::status::bad_request);
    EXPECT_EQ(withBody(http::verb::post, "/admin/services/ride-service/instances", R"({"weight":2})").result(),
              http::status::bad_request);
    EXPECT_EQ(withBody(http::verb::post, "/admin/services/ride-service/instances", R"({"address":"bogus"})").result(),
              http::status::bad_request);
    EXPECT_EQ(withBody(http::verb::post, "/admin/services/ride-service/instances",
                       R"({"address":"http://ride-c:3005","weight":4294967297})").result(),
              http::status::bad_request);
    EXPECT_EQ(withBody(http::verb::post, "/admin/services/ride-service/instances",
                       R"({"address":"http://ride-c:3005","weight":"2"})").result(),
              http::status::bad_request);
    EXPECT_EQ(withBody(http::verb::post, "/admin/services/ride-service/instances",
                       R"({"address":"http://ride-c:3005","weight":0})").result(),
              http::status::bad_request);
    EXPECT_EQ(registry.instances("ride-service")->size(), 1u);
    EXPECT_EQ(send(http::request<http::string_body>{http::verb::delete_, "/admin/services/ride-service/instances", 11}).result(),
              http::status::bad_request);
    EXPECT_EQ(withBody(http::verb::post, "/admin/services/ghost-service/instances", R"({"address":"http://g:1"})").result(),
              http::status::not_found);
    EXPECT_EQ(get("/admin/services/ride-service/circuit-breaker/reset").result(), http::status::method_not_allowed);
    EXPECT_EQ(get("/admin/services/ride-service/other").result(), http::status::not_found);
}

TEST_F(GatewayTest, AdminResetsCircuitBreaker) {
    auto breaker = registry.getBreaker("ride-service");
    for (int i = 0; i < 5; ++i) breaker->recordFailure(breaker->allowRequest());
    ASSERT_EQ(breaker->getState(), CircuitState::OPEN);

    auto res = withBody(http::verb::post, "/admin/services/ride-service/circuit-breaker/reset", "");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(breaker->getState(), CircuitState::CLOSED);

    res = withBody(http::verb::post, "/admin/services/ghost/circuit-breaker/reset", "");
    EXPECT_EQ(res.result(), http::status::not_found);
}
