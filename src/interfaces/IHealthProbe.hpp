#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "../models/BackendUrlInfo.hpp"

struct HealthProbeResult {
    bool healthy = false;
    int status_code = 0; // 0 when no response was received
    std::string detail;
};

class IHealthProbe {
public:
    using Callback = std::function<void(HealthProbeResult)>;

    virtual ~IHealthProbe() = default;

    // Callback fires exactly once.
    virtual void probe(const BackendUrlInfo& endpoint,
                       const std::string& path,
                       std::chrono::milliseconds timeout,
                       Callback callback) = 0;
};
