#include "Gateway.hpp"

#include <boost/beast/version.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "../config/AppConfig.hpp"
#include "../utils/Utils.hpp"

namespace {
    const std::string ADMIN_SERVICES_PREFIX = "/admin/services/";
    const std::string INSTANCES_SUFFIX = "/instances";
    const std::string BREAKER_RESET_SUFFIX = "/circuit-breaker/reset";

    std::string generateRequestId() {
        thread_local boost::uuids::random_generator generator;
        return boost::uuids::to_string(generator());
    }

    bool endsWith(const std::string& value, const std::string& suffix) {
        return value.size() >= suffix.size()
            && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

Gateway::Gateway(ServiceRegistry& registry,
                 std::shared_ptr<RequestRouter> router,
                 std::shared_ptr<ILogger> logger,
                 std::shared_ptr<IStatsDClient> statsd_client)
    : registry_(registry),
      router_(std::move(router)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      started_at_(std::chrono::steady_clock::now()) {
    if (!router_) {
        throw std::invalid_argument("RequestRouter cannot be null for Gateway");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for Gateway");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for Gateway");
    }

    for (const auto& name : registry_.serviceNames()) {
        std::string prefix = registry_.getConfig(name).route_prefix;
        while (prefix.size() > 1 && prefix.back() == '/') {
            prefix.pop_back();
        }
        routes_.emplace_back(prefix, name);
        logger_->setup("Route " + prefix + " -> " + name);
    }
    std::sort(routes_.begin(), routes_.end(), [](const auto& a, const auto& b) {
        return a.first.size() > b.first.size();
    });
}

std::optional<Gateway::RouteMatch> Gateway::matchRoute(const std::string& target) const {
    const auto [path, query] = Utils::splitTarget(target);
    for (const auto& [prefix, service_name] : routes_) {
        std::string remainder;
        if (prefix == "/") {
            remainder = path;
        } else if (path == prefix) {
            remainder = "/";
        } else if (path.compare(0, prefix.size(), prefix) == 0 && path.size() > prefix.size() && path[prefix.size()] == '/') {
            remainder = path.substr(prefix.size());
        } else {
            continue;
        }
        RouteMatch match;
        match.service_name = service_name;
        match.forward_target = query.empty() ? remainder : remainder + "?" + query;
        return match;
    }
    return std::nullopt;
}

void Gateway::processRequest(http::request<http::string_body> req,
                             const std::string& client_address,
                             ResponseCallback send_response_cb) const {
    try {
        const std::string target(req.target());
        const auto [path, query] = Utils::splitTarget(target);

        if (path == "/health") {
            json body = {
                {"status", "ok"},
                {"timestamp", Utils::currentUtcTimestamp()},
                {"uptime", uptimeSeconds()}
            };
            return send_response_cb(jsonResponse(http::status::ok, body, req));
        }
        if (path == "/status" && req.method() == http::verb::get) {
            return send_response_cb(jsonResponse(http::status::ok, statusJson(), req));
        }
        if (path == "/metrics" && req.method() == http::verb::get) {
            return send_response_cb(jsonResponse(http::status::ok, metricsJson(), req));
        }
        if (path.compare(0, ADMIN_SERVICES_PREFIX.size(), ADMIN_SERVICES_PREFIX) == 0) {
            return handleAdminRequest(req, path, query, send_response_cb);
        }

        auto match = matchRoute(target);
        if (!match) {
            logger_->debug("No route for " + target);
            json body = {{"error", "Route not found"}, {"path", path}};
            return send_response_cb(jsonResponse(http::status::not_found, body, req));
        }
        proxyRequest(std::move(req), client_address, std::move(*match), send_response_cb);
    } catch (const std::exception& e) {
        logger_->error("Unexpected exception while processing request: " + std::string(e.what()));
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        json body = {{"error", "Internal Error"}};
        send_response_cb(jsonResponse(http::status::internal_server_error, body, req));
    }
}

void Gateway::proxyRequest(http::request<http::string_body> req,
                           const std::string& client_address,
                           RouteMatch match,
                           ResponseCallback send_response_cb) const {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    std::string request_id;
    auto inbound_id = req.find("X-Request-ID");
    if (inbound_id != req.end() && !inbound_id->value().empty()) {
        request_id = std::string(inbound_id->value());
    } else {
        request_id = generateRequestId();
    }

    std::string forwarded_for = client_address;
    auto inbound_forwarded = req.find("X-Forwarded-For");
    if (inbound_forwarded != req.end() && !inbound_forwarded->value().empty()) {
        forwarded_for = std::string(inbound_forwarded->value()) + ", " + client_address;
    }

    http::request<http::string_body> outbound = std::move(req);
    outbound.target(match.forward_target);
    outbound.erase(http::field::connection);
    outbound.set("X-Gateway", Constants::GATEWAY_NAME);
    outbound.set("X-Request-ID", request_id);
    outbound.set("X-Forwarded-For", forwarded_for);

    if (logger_->isDebugEnabled()) {
        logger_->debug("[" + request_id + "] " + std::string(http::to_string(outbound.method())) + " -> "
            + match.service_name + " " + match.forward_target);
    }

    auto logger = logger_;
    const std::string service_name = match.service_name;
    router_->route(service_name, std::move(outbound),
        [logger, service_name, request_id, version, keep_alive, send_response_cb = std::move(send_response_cb)](RouteResult result) {
            if (result.ok() && result.response) {
                http::response<http::string_body> res = std::move(*result.response);
                res.version(version);
                res.set("X-Gateway-Processed", "true");
                res.set("X-Service-Name", service_name);
                res.set("X-Request-ID", request_id);
                res.keep_alive(keep_alive);
                res.prepare_payload();
                return send_response_cb(std::move(res));
            }

            const bool unknown = result.error == RouteError::UnknownService;
            json body = {
                {"error", unknown ? "Service not found" : "Service temporarily unavailable"},
                {"service", service_name},
                {"code", unknown ? "NOT_FOUND" : "SERVICE_UNAVAILABLE"},
                {"reason", reasonCode(result.error)}
            };
            logger->warn("[" + request_id + "] " + service_name + " unavailable: " + reasonCode(result.error)
                + (result.detail.empty() ? "" : " (" + result.detail + ")"));

            http::response<http::string_body> res{
                unknown ? http::status::not_found : http::status::service_unavailable, version};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            res.set("X-Service-Name", service_name);
            res.set("X-Request-ID", request_id);
            res.keep_alive(keep_alive);
            res.body() = body.dump();
            res.prepare_payload();
            send_response_cb(std::move(res));
        });
}

void Gateway::handleAdminRequest(const http::request<http::string_body>& req,
                                 const std::string& path,
                                 const std::string& query,
                                 ResponseCallback& send_response_cb) const {
    std::string rest = path.substr(ADMIN_SERVICES_PREFIX.size());
    std::string service_name;
    std::string action;
    if (endsWith(rest, INSTANCES_SUFFIX)) {
        service_name = rest.substr(0, rest.size() - INSTANCES_SUFFIX.size());
        action = "instances";
    } else if (endsWith(rest, BREAKER_RESET_SUFFIX)) {
        service_name = rest.substr(0, rest.size() - BREAKER_RESET_SUFFIX.size());
        action = "reset";
    }
    service_name = Utils::urlDecode(service_name);
    if (service_name.empty() || service_name.find('/') != std::string::npos) {
        json body = {{"error", "Route not found"}, {"path", path}};
        return send_response_cb(jsonResponse(http::status::not_found, body, req));
    }

    try {
        if (action == "reset" && req.method() == http::verb::post) {
            registry_.resetCircuitBreaker(service_name);
            logger_->info("Circuit breaker for " + service_name + " reset by admin request");
            json body = {{"service", service_name}, {"circuitBreaker", to_string(CircuitState::CLOSED)}};
            return send_response_cb(jsonResponse(http::status::ok, body, req));
        }

        if (action == "instances" && req.method() == http::verb::post) {
            json payload;
            try {
                payload = json::parse(req.body());
            } catch (const json::parse_error& e) {
                json body = {{"error", std::string("Invalid JSON body: ") + e.what()}};
                return send_response_cb(jsonResponse(http::status::bad_request, body, req));
            }
            if (!payload.is_object() || !payload.contains("address") || !payload.at("address").is_string()) {
                json body = {{"error", "Body must be an object with a string \"address\""}};
                return send_response_cb(jsonResponse(http::status::bad_request, body, req));
            }
            const std::string address = payload.at("address").get<std::string>();
            const int weight = Utils::boundedInt(payload, "weight", 1, 1, std::numeric_limits<int>::max());
            registry_.addInstance(service_name, address, weight);
            json body = {{"service", service_name}, {"address", address}, {"weight", weight}};
            return send_response_cb(jsonResponse(http::status::ok, body, req));
        }

        if (action == "instances" && req.method() == http::verb::delete_) {
            auto address = Utils::queryParam(query, "address");
            if (!address || address->empty()) {
                json body = {{"error", "Missing required parameter: address"}};
                return send_response_cb(jsonResponse(http::status::bad_request, body, req));
            }
            if (!registry_.removeInstance(service_name, *address)) {
                json body = {{"error", "Instance not found"}, {"service", service_name}, {"address", *address}};
                return send_response_cb(jsonResponse(http::status::not_found, body, req));
            }
            json body = {{"service", service_name}, {"removed", *address}};
            return send_response_cb(jsonResponse(http::status::ok, body, req));
        }
    } catch (const NotFoundError& e) {
        json body = {{"error", e.what()}, {"service", service_name}, {"code", "NOT_FOUND"}, {"reason", reasonCode(RouteError::UnknownService)}};
        return send_response_cb(jsonResponse(http::status::not_found, body, req));
    } catch (const ConfigurationError& e) {
        json body = {{"error", e.what()}, {"service", service_name}};
        return send_response_cb(jsonResponse(http::status::bad_request, body, req));
    }

    if (action.empty()) {
        json body = {{"error", "Route not found"}, {"path", path}};
        return send_response_cb(jsonResponse(http::status::not_found, body, req));
    }
    json body = {{"error", "Method not allowed"}, {"path", path}};
    send_response_cb(jsonResponse(http::status::method_not_allowed, body, req));
}

json Gateway::statusJson() const {
    json services = json::object();
    for (const auto& status : registry_.getStatus()) {
        json instances = json::array();
        for (const auto& instance : status.instances) {
            instances.push_back({
                {"url", instance.address},
                {"healthy", instance.healthy},
                {"weight", instance.weight},
                {"consecutiveFailures", instance.consecutive_failures}
            });
        }
        services[status.service_name] = {
            {"instances", instances},
            {"circuitBreaker", {
                {"state", to_string(status.breaker_state)},
                {"failureCount", status.failure_count}
            }},
            {"healthyInstances", status.healthy_instances},
            {"totalInstances", status.total_instances}
        };
    }
    return services;
}

json Gateway::metricsJson() const {
    return {
        {"services", statusJson()},
        {"timestamp", Utils::currentUtcTimestamp()},
        {"uptime", uptimeSeconds()}
    };
}

http::response<http::string_body> Gateway::jsonResponse(http::status status,
                                                       const json& body,
                                                       const http::request<http::string_body>& req) const {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.set("X-Gateway", Constants::GATEWAY_NAME);
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

double Gateway::uptimeSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
}
