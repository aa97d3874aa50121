#ifndef REQUESTROUTER_HPP
#define REQUESTROUTER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "ServiceRegistry.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/ITransport.hpp"
#include "../models/RoutingTypes.hpp"

// Forwards one inbound request to one healthy instance of a service, going through
// the service's circuit breaker and retrying transport failures up to max_retries.
//
// Every attempt updates breaker and instance health; only the last attempt's
// result reaches the caller. The completion callback fires exactly once.
class RequestRouter : public std::enable_shared_from_this<RequestRouter> {
public:
    using Callback = std::function<void(RouteResult)>;

    RequestRouter(ServiceRegistry& registry,
                  std::shared_ptr<ITransport> transport,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IStatsDClient> statsd_client);

    RequestRouter(const RequestRouter&) = delete;
    RequestRouter& operator=(const RequestRouter&) = delete;

    void route(const std::string& service_name,
               http::request<http::string_body> request,
               Callback on_complete);

private:
    struct RouteContext {
        std::string service_name;
        http::request<http::string_body> request;
        std::chrono::milliseconds timeout{0};
        int max_retries = 0;
        std::shared_ptr<CircuitBreaker> breaker;
        std::shared_ptr<InstanceSelector> selector;
        Callback on_complete;
        int attempts = 0;
    };

    void attempt(const std::shared_ptr<RouteContext>& context);
    void onAttemptComplete(const std::shared_ptr<RouteContext>& context,
                           const InstancePtr& instance,
                           const CircuitBreaker::Permit& permit,
                           std::chrono::steady_clock::time_point started,
                           TransportResult result);
    void complete(const std::shared_ptr<RouteContext>& context, RouteResult result);

    ServiceRegistry& registry_;
    std::shared_ptr<ITransport> transport_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // REQUESTROUTER_HPP
