#ifndef INSTANCE_HPP
#define INSTANCE_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "BackendUrlInfo.hpp"

// One network endpoint of a logical service. Shared-owned: a request that already
// picked an instance keeps it alive even if the instance is removed meanwhile.
//
// healthy has two writers, the HealthChecker and the RequestRouter.
class Instance {
public:
    Instance(BackendUrlInfo endpoint, int weight)
        : endpoint_(std::move(endpoint)), weight_(weight) {}

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    const std::string& address() const { return endpoint_.url; }
    const BackendUrlInfo& endpoint() const { return endpoint_; }
    int weight() const { return weight_; }

    bool isHealthy() const { return healthy_.load(std::memory_order_acquire); }
    int consecutiveFailures() const { return consecutive_failures_.load(std::memory_order_relaxed); }

    void markHealthy() {
        consecutive_failures_.store(0, std::memory_order_relaxed);
        healthy_.store(true, std::memory_order_release);
    }

    void markUnhealthy() {
        consecutive_failures_.fetch_add(1, std::memory_order_relaxed);
        healthy_.store(false, std::memory_order_release);
    }

    // Returns false when a probe for this instance is still outstanding.
    bool tryBeginProbe() { return !probe_in_flight_.exchange(true, std::memory_order_acq_rel); }
    void endProbe() { probe_in_flight_.store(false, std::memory_order_release); }

private:
    const BackendUrlInfo endpoint_;
    const int weight_;
    std::atomic<bool> healthy_{true};
    std::atomic<int> consecutive_failures_{0};
    std::atomic<bool> probe_in_flight_{false};
};

using InstancePtr = std::shared_ptr<Instance>;
using InstanceList = std::vector<InstancePtr>;

#endif // INSTANCE_HPP
