#include "RequestRouter.hpp"

#include <atomic>
#include <stdexcept>

#include "../config/AppConfig.hpp"

RequestRouter::RequestRouter(ServiceRegistry& registry,
                             std::shared_ptr<ITransport> transport,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client)
    : registry_(registry),
      transport_(std::move(transport)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null for RequestRouter");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RequestRouter");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for RequestRouter");
    }
}

void RequestRouter::route(const std::string& service_name,
                          http::request<http::string_body> request,
                          Callback on_complete) {
    auto context = std::make_shared<RouteContext>();
    context->service_name = service_name;
    context->request = std::move(request);
    context->on_complete = std::move(on_complete);

    try {
        const ServiceConfig config = registry_.getConfig(service_name);
        context->timeout = config.request_timeout;
        context->max_retries = config.max_retries;
        context->breaker = registry_.getBreaker(service_name);
        context->selector = registry_.getSelector(service_name);
    } catch (const NotFoundError& e) {
        logger_->warn("Routing request for unknown service: " + service_name);
        RouteResult result;
        result.error = RouteError::UnknownService;
        result.detail = e.what();
        complete(context, std::move(result));
        return;
    }

    attempt(context);
}

void RequestRouter::attempt(const std::shared_ptr<RouteContext>& context) {
    const CircuitBreaker::Permit permit = context->breaker->allowRequest();
    if (!permit) {
        logger_->warn("Circuit open for " + context->service_name + ", rejecting request");
        RouteResult result;
        result.error = RouteError::CircuitOpen;
        result.detail = "circuit breaker is open";
        complete(context, std::move(result));
        return;
    }

    InstancePtr instance = context->selector->next();
    if (!instance) {
        // An admitted HALF_OPEN trial never reached a backend; let the next request take it.
        context->breaker->abandonTrial(permit);
        logger_->warn("No healthy instance available for " + context->service_name);
        statsd_client_->increment(MetricsDefinitions::NO_HEALTHY_INSTANCE);
        RouteResult result;
        result.error = RouteError::NoHealthyInstances;
        result.detail = "no healthy instance";
        complete(context, std::move(result));
        return;
    }

    ++context->attempts;
    if (logger_->isDebugEnabled()) {
        logger_->debug("Attempt " + std::to_string(context->attempts) + " for " + context->service_name
            + " -> " + instance->address() + std::string(context->request.target()));
    }

    const auto started = std::chrono::steady_clock::now();
    auto delivered = std::make_shared<std::atomic<bool>>(false);
    auto self = shared_from_this();
    auto on_result = [self, context, instance, permit, started, delivered](TransportResult result) {
        if (delivered->exchange(true)) {
            self->logger_->debug("Discarding duplicate completion from " + instance->address());
            return;
        }
        self->onAttemptComplete(context, instance, permit, started, std::move(result));
    };

    try {
        transport_->forward(instance->endpoint(), context->request, context->timeout, on_result);
    } catch (const std::exception& e) {
        logger_->error("Transport threw while forwarding to " + instance->address() + ": " + e.what());
        on_result(TransportResult::failure(std::string("transport threw: ") + e.what()));
    }
}

void RequestRouter::onAttemptComplete(const std::shared_ptr<RouteContext>& context,
                                      const InstancePtr& instance,
                                      const CircuitBreaker::Permit& permit,
                                      std::chrono::steady_clock::time_point started,
                                      TransportResult result) {
    if (result.outcome == RoutingOutcome::Success) {
        context->breaker->recordSuccess(permit);
        instance->markHealthy();
        statsd_client_->increment(MetricsDefinitions::ATTEMPT_SUCCESS);
        statsd_client_->timing(MetricsDefinitions::ATTEMPT_LATENCY,
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started));

        RouteResult route_result;
        route_result.response = std::move(result.response);
        route_result.instance_address = instance->address();
        complete(context, std::move(route_result));
        return;
    }

    context->breaker->recordFailure(permit);
    instance->markUnhealthy();
    statsd_client_->increment(result.outcome == RoutingOutcome::Timeout
        ? MetricsDefinitions::ATTEMPT_TIMEOUT
        : MetricsDefinitions::ATTEMPT_FAILURE);
    logger_->warn("Attempt " + std::to_string(context->attempts) + " for " + context->service_name
        + " to " + instance->address() + " failed: " + to_string(result.outcome)
        + (result.detail.empty() ? "" : " (" + result.detail + ")"));

    if (context->attempts <= context->max_retries) {
        attempt(context);
        return;
    }

    logger_->error("Giving up on " + context->service_name + " after "
        + std::to_string(context->attempts) + " attempt(s)");
    RouteResult route_result;
    route_result.error = RouteError::RetriesExhausted;
    route_result.instance_address = instance->address();
    route_result.detail = to_string(result.outcome) + (result.detail.empty() ? "" : ": " + result.detail);
    complete(context, std::move(route_result));
}

void RequestRouter::complete(const std::shared_ptr<RouteContext>& context, RouteResult result) {
    result.service_name = context->service_name;
    result.attempts = context->attempts;
    statsd_client_->increment(result.ok()
        ? MetricsDefinitions::REQUEST_ROUTED
        : MetricsDefinitions::REQUEST_UNAVAILABLE);

    Callback callback = std::move(context->on_complete);
    context->on_complete = nullptr;
    if (!callback) {
        return;
    }
    try {
        callback(std::move(result));
    } catch (const std::exception& e) {
        logger_->error("Route completion handler threw for " + context->service_name + ": " + e.what());
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
    }
}
