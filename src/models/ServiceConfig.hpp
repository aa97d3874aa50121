#ifndef SERVICECONFIG_HPP
#define SERVICECONFIG_HPP

#include <chrono>
#include <string>
#include <vector>

struct InstanceSpec {
    std::string address;
    int weight = 1;
};

enum class LoadBalancingStrategy {
    RoundRobin,
    Weighted
};

inline std::string to_string(LoadBalancingStrategy strategy) {
    return strategy == LoadBalancingStrategy::Weighted ? "weighted" : "round_robin";
}

// Static per-service configuration. Defaults mirror the production service table.
struct ServiceConfig {
    std::string service_name;
    std::vector<InstanceSpec> instances;
    std::string health_check_path = "/health";
    std::chrono::milliseconds request_timeout{30000};
    int max_retries = 3;
    int breaker_threshold = 5;
    std::chrono::milliseconds recovery_timeout{60000};

    // Inbound path prefix routed to this service; "/<service_name>" when empty.
    std::string route_prefix;
    LoadBalancingStrategy load_balancing = LoadBalancingStrategy::RoundRobin;
};

#endif // SERVICECONFIG_HPP
