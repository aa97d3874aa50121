// tests/test_service_registry.cpp
#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/core/ServiceRegistry.hpp"

using ::testing::NiceMock;

class ServiceRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    ServiceRegistry registry{logger, statsd};
};

TEST_F(ServiceRegistryTest, RegisterAndReadBackConfig) {
    ServiceConfig config = makeServiceConfig("ride-service", {"http://ride-a:3005", "http://ride-b:3005/"});
    config.max_retries = 2;
    config.breaker_threshold = 3;
    config.recovery_timeout = std::chrono::milliseconds(1000);
    registry.registerService(config);

    ASSERT_TRUE(registry.hasService("ride-service"));
    ServiceConfig stored = registry.getConfig("ride-service");
    EXPECT_EQ(stored.service_name, "ride-service");
    EXPECT_EQ(stored.route_prefix, "/ride-service");
    EXPECT_EQ(stored.max_retries, 2);
    EXPECT_EQ(stored.breaker_threshold, 3);
    ASSERT_EQ(stored.instances.size(), 2u);
    EXPECT_EQ(stored.instances[0].address, "http://ride-a:3005");
    EXPECT_EQ(stored.instances[1].address, "http://ride-b:3005");
    EXPECT_EQ(registry.getBreaker("ride-service")->getState(), CircuitState::CLOSED);
    EXPECT_EQ(registry.getSelector("ride-service")->strategyName(), "round_robin");
}

TEST_F(ServiceRegistryTest, RejectsInvalidRegistrations) {
    registry.registerService(makeServiceConfig("user-service", {"http://user:3001"}));
    EXPECT_THROW(registry.registerService(makeServiceConfig("user-service", {"http://other:3001"})), ConfigurationError);
    EXPECT_THROW(registry.registerService(makeServiceConfig("empty", {})), ConfigurationError);
    EXPECT_THROW(registry.registerService(makeServiceConfig("dup", {"http://x:1", "http://x:1/"})), ConfigurationError);
    EXPECT_THROW(registry.registerService(makeServiceConfig("bad-url", {"not-a-url"})), ConfigurationError);
    EXPECT_THROW(registry.registerService(makeServiceConfig("tls", {"https://secure:443"})), ConfigurationError);

    ServiceConfig bad_weight = makeServiceConfig("weight", {"http://w:1"});
    bad_weight.instances[0].weight = 0;
    EXPECT_THROW(registry.registerService(bad_weight), ConfigurationError);

    ServiceConfig bad_threshold = makeServiceConfig("threshold", {"http://t:1"});
    bad_threshold.breaker_threshold = 0;
    EXPECT_THROW(registry.registerService(bad_threshold), ConfigurationError);

    ServiceConfig bad_path = makeServiceConfig("path", {"http://p:1"});
    bad_path.health_check_path = "health";
    EXPECT_THROW(registry.registerService(bad_path), ConfigurationError);

    EXPECT_EQ(registry.serviceNames(), std::vector<std::string>{"user-service"});
}

TEST_F(ServiceRegistryTest, UnknownServiceThrowsNotFound) {
    EXPECT_THROW(registry.getConfig("nope"), NotFoundError);
    EXPECT_THROW(registry.addInstance("nope", "http://a:1"), NotFoundError);
    EXPECT_THROW(registry.removeInstance("nope", "http://a:1"), NotFoundError);
    EXPECT_THROW(registry.resetCircuitBreaker("nope"), NotFoundError);
    EXPECT_FALSE(registry.hasService("nope"));
}

TEST_F(ServiceRegistryTest, AddInstanceIsIdempotentAndHealthyByDefault) {
    registry.registerService(makeServiceConfig("payment-service", {"http://pay-a:3004"}));
    registry.addInstance("payment-service", "http://pay-b:3004", 3);
    registry.addInstance("payment-service", "http://pay-b:3004/");

    auto instances = registry.instances("payment-service");
    ASSERT_EQ(instances->size(), 2u);
    EXPECT_EQ((*instances)[1]->address(), "http://pay-b:3004");
    EXPECT_EQ((*instances)[1]->weight(), 3);
    EXPECT_TRUE((*instances)[1]->isHealthy());

    EXPECT_THROW(registry.addInstance("payment-service", "ftp://pay-c"), ConfigurationError);
}

TEST_F(ServiceRegistryTest, RemoveInstanceKeepsHeldReferencesValid) {
    registry.registerService(makeServiceConfig("ride-service", {"http://a:1", "http://b:1"}));
    auto before = registry.instances("ride-service");
    InstancePtr b = (*before)[1];

    EXPECT_TRUE(registry.removeInstance("ride-service", "http://b:1"));
    EXPECT_FALSE(registry.removeInstance("ride-service", "http://b:1"));

    // The earlier snapshot and the instance itself are untouched.
    EXPECT_EQ(before->size(), 2u);
    b->markUnhealthy();
    EXPECT_EQ(b->consecutiveFailures(), 1);

    auto selector = registry.getSelector("ride-service");
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(selector->next()->address(), "http://a:1");
    }
}

TEST_F(ServiceRegistryTest, SelectorSeesInstancesAddedAtRuntime) {
    registry.registerService(makeServiceConfig("notification-service", {"http://n1:3006"}));
    auto selector = registry.getSelector("notification-service");
    EXPECT_EQ(selector->next()->address(), "http://n1:3006");

    registry.addInstance("notification-service", "http://n2:3006");
    std::vector<std::string> picks;
    for (int i = 0; i < 4; ++i) picks.push_back(selector->next()->address());
    EXPECT_NE(std::find(picks.begin(), picks.end(), "http://n2:3006"), picks.end());
}

TEST_F(ServiceRegistryTest, SelectorOutlivingRegistrySeesNoInstances) {
    std::shared_ptr<InstanceSelector> selector;
    {
        ServiceRegistry scoped(logger, statsd);
        scoped.registerService(makeServiceConfig("payment-service", {"http://pay:3004"}));
        selector = scoped.getSelector("payment-service");
        ASSERT_NE(selector->next(), nullptr);
    }
    EXPECT_EQ(selector->next(), nullptr);
}

TEST_F(ServiceRegistryTest, StatusReportsHealthAndBreaker) {
    registry.registerService(makeServiceConfig("driver-service", {"http://d1:3003", "http://d2:3003"}));
    registry.registerService(makeServiceConfig("booking-service", {"http://b1:3002"}));
    (*registry.instances("driver-service"))[0]->markUnhealthy();
    auto breaker = registry.getBreaker("booking-service");
    breaker->recordFailure(breaker->allowRequest());

    auto statuses = registry.getStatus();
    ASSERT_EQ(statuses.size(), 2u);
    const auto& booking = statuses[0];
    const auto& driver = statuses[1];
    EXPECT_EQ(booking.service_name, "booking-service");
    EXPECT_EQ(booking.failure_count, 1);
    EXPECT_EQ(booking.breaker_state, CircuitState::CLOSED);
    EXPECT_EQ(driver.total_instances, 2u);
    EXPECT_EQ(driver.healthy_instances, 1u);
    EXPECT_FALSE(driver.instances[0].healthy);
    EXPECT_EQ(driver.instances[0].consecutive_failures, 1);
}

TEST_F(ServiceRegistryTest, ResetCircuitBreakerClosesIt) {
    ServiceConfig config = makeServiceConfig("ride-service", {"http://a:1"});
    config.breaker_threshold = 1;
    registry.registerService(config);
    auto breaker = registry.getBreaker("ride-service");
    breaker->recordFailure(breaker->allowRequest());
    ASSERT_EQ(registry.getBreaker("ride-service")->getState(), CircuitState::OPEN);

    registry.resetCircuitBreaker("ride-service");
    EXPECT_EQ(registry.getBreaker("ride-service")->getState(), CircuitState::CLOSED);
}

TEST_F(ServiceRegistryTest, ConcurrentMutationAndSelection) {
    registry.registerService(makeServiceConfig("ride-service", {"http://a:1"}));
    auto selector = registry.getSelector("ride-service");
    std::atomic<bool> stop{false};
    std::atomic<int> null_picks{0};

    std::thread reader([&]() {
        while (!stop) {
            if (!selector->next()) ++null_picks;
        }
    });
    for (int i = 0; i < 200; ++i) {
        registry.addInstance("ride-service", "http://extra:" + std::to_string(1000 + i));
        registry.removeInstance("ride-service", "http://extra:" + std::to_string(1000 + i));
    }
    stop = true;
    reader.join();

    EXPECT_EQ(null_picks.load(), 0);
    EXPECT_EQ(registry.instances("ride-service")->size(), 1u);
}

TEST(ServiceRegistryConstructionTest, RejectsNullCollaborators) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    EXPECT_THROW(ServiceRegistry(nullptr, statsd), std::invalid_argument);
    EXPECT_THROW(ServiceRegistry(logger, nullptr), std::invalid_argument);
}
