#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "CircuitState.hpp"

struct InstanceStatus {
    std::string address;
    bool healthy = true;
    int weight = 1;
    int consecutive_failures = 0;
};

// Point-in-time view of one service, consumed by the /status and /metrics endpoints.
struct ServiceStatus {
    std::string service_name;
    std::vector<InstanceStatus> instances;
    CircuitState breaker_state = CircuitState::CLOSED;
    int failure_count = 0;
    std::size_t healthy_instances = 0;
    std::size_t total_instances = 0;
};
