// tests/test_instance_selector.cpp
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/InstanceSelector.hpp"
#include "../src/utils/Utils.hpp"

namespace {
    InstancePtr makeInstance(const std::string& address, int weight = 1) {
        BackendUrlInfo endpoint;
        EXPECT_TRUE(Utils::parseUrl(address, &endpoint));
        return std::make_shared<Instance>(endpoint, weight);
    }
}

class InstanceSelectorTest : public ::testing::Test {
protected:
    std::shared_ptr<const InstanceList> snapshot = std::make_shared<InstanceList>();

    InstanceSelector::InstanceSource source() {
        return [this]() { return snapshot; };
    }

    void setInstances(InstanceList list) {
        snapshot = std::make_shared<InstanceList>(std::move(list));
    }
};

TEST_F(InstanceSelectorTest, RoundRobinCyclesInOrder) {
    auto a = makeInstance("http://a:1");
    auto b = makeInstance("http://b:1");
    auto c = makeInstance("http://c:1");
    setInstances({a, b, c});
    RoundRobinSelector selector(source());

    std::vector<std::string> picks;
    for (int i = 0; i < 6; ++i) picks.push_back(selector.next()->address());
    EXPECT_EQ(picks, (std::vector<std::string>{"http://a:1", "http://b:1", "http://c:1",
                                               "http://a:1", "http://b:1", "http://c:1"}));
}

TEST_F(InstanceSelectorTest, RoundRobinSkipsUnhealthy) {
    auto a = makeInstance("http://a:1");
    auto b = makeInstance("http://b:1");
    auto c = makeInstance("http://c:1");
    setInstances({a, b, c});
    b->markUnhealthy();
    RoundRobinSelector selector(source());

    for (int i = 0; i < 10; ++i) {
        EXPECT_NE(selector.next(), b);
    }
}

TEST_F(InstanceSelectorTest, ReturnsNullWhenNoInstanceIsHealthy) {
    auto a = makeInstance("http://a:1");
    setInstances({a});
    a->markUnhealthy();
    RoundRobinSelector round_robin(source());
    WeightedRoundRobinSelector weighted(source());
    EXPECT_EQ(round_robin.next(), nullptr);
    EXPECT_EQ(weighted.next(), nullptr);

    setInstances({});
    EXPECT_EQ(round_robin.next(), nullptr);
}

TEST_F(InstanceSelectorTest, HealthChangeVisibleOnNextCall) {
    auto a = makeInstance("http://a:1");
    auto b = makeInstance("http://b:1");
    setInstances({a, b});
    RoundRobinSelector selector(source());

    a->markUnhealthy();
    EXPECT_EQ(selector.next(), b);
    EXPECT_EQ(selector.next(), b);
    a->markHealthy();
    auto first = selector.next();
    auto second = selector.next();
    EXPECT_NE(first, second);
}

TEST_F(InstanceSelectorTest, RemovedInstanceNeverSelectedAgain) {
    auto a = makeInstance("http://a:1");
    auto b = makeInstance("http://b:1");
    setInstances({a, b});
    RoundRobinSelector selector(source());
    selector.next();

    setInstances({a});
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(selector.next(), a);
    }
}

TEST_F(InstanceSelectorTest, WeightedHonoursWeightsOverACycle) {
    auto a = makeInstance("http://a:1", 5);
    auto b = makeInstance("http://b:1", 1);
    auto c = makeInstance("http://c:1", 1);
    setInstances({a, b, c});
    WeightedRoundRobinSelector selector(source());

    std::map<std::string, int> counts;
    std::vector<std::string> sequence;
    for (int i = 0; i < 7; ++i) {
        auto picked = selector.next()->address();
        ++counts[picked];
        sequence.push_back(picked);
    }
    EXPECT_EQ(counts["http://a:1"], 5);
    EXPECT_EQ(counts["http://b:1"], 1);
    EXPECT_EQ(counts["http://c:1"], 1);
    // Smooth: the heavy instance is not picked in one burst.
    EXPECT_EQ(sequence, (std::vector<std::string>{"http://a:1", "http://a:1", "http://b:1", "http://a:1",
                                                  "http://c:1", "http://a:1", "http://a:1"}));
}

TEST_F(InstanceSelectorTest, FactoryPicksStrategy) {
    auto round_robin = InstanceSelector::create(LoadBalancingStrategy::RoundRobin, source());
    auto weighted = InstanceSelector::create(LoadBalancingStrategy::Weighted, source());
    EXPECT_EQ(round_robin->strategyName(), "round_robin");
    EXPECT_EQ(weighted->strategyName(), "weighted");
}
