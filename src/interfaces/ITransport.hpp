#pragma once

#include <chrono>
#include <functional>

#include "../models/BackendUrlInfo.hpp"
#include "../models/RoutingTypes.hpp"

// Sends one request to one instance. The callback fires exactly once per call,
// with a Success, TransportFailure or Timeout result.
class ITransport {
public:
    using Callback = std::function<void(TransportResult)>;

    virtual ~ITransport() = default;

    virtual void forward(const BackendUrlInfo& endpoint,
                         http::request<http::string_body> request,
                         std::chrono::milliseconds timeout,
                         Callback callback) = 0;
};
