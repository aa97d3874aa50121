#ifndef ROUTINGTYPES_HPP
#define ROUTINGTYPES_HPP

#include <boost/beast/http.hpp>

#include <optional>
#include <string>

namespace http = boost::beast::http;

// Classification of one forwarding attempt. Any response received before the
// timeout is a Success, whatever its status code.
enum class RoutingOutcome {
    Success,
    TransportFailure,
    Timeout
};

inline std::string to_string(RoutingOutcome outcome) {
    switch (outcome) {
        case RoutingOutcome::Success: return "success";
        case RoutingOutcome::TransportFailure: return "transport_failure";
        case RoutingOutcome::Timeout: return "timeout";
    }
    return "unknown";
}

struct TransportResult {
    RoutingOutcome outcome = RoutingOutcome::TransportFailure;
    std::optional<http::response<http::string_body>> response;
    std::string detail;

    static TransportResult success(http::response<http::string_body> res) {
        TransportResult result;
        result.outcome = RoutingOutcome::Success;
        result.response = std::move(res);
        return result;
    }

    static TransportResult failure(std::string detail) {
        TransportResult result;
        result.outcome = RoutingOutcome::TransportFailure;
        result.detail = std::move(detail);
        return result;
    }

    static TransportResult timeout(std::string detail) {
        TransportResult result;
        result.outcome = RoutingOutcome::Timeout;
        result.detail = std::move(detail);
        return result;
    }
};

enum class RouteError {
    None,
    CircuitOpen,
    NoHealthyInstances,
    RetriesExhausted,
    UnknownService
};

// Machine-readable reason code returned to clients.
inline std::string reasonCode(RouteError error) {
    switch (error) {
        case RouteError::None: return "";
        case RouteError::CircuitOpen: return "circuit_open";
        case RouteError::NoHealthyInstances: return "no_healthy_instances";
        case RouteError::RetriesExhausted: return "retries_exhausted";
        case RouteError::UnknownService: return "unknown_service";
    }
    return "unknown";
}

struct RouteResult {
    RouteError error = RouteError::None;
    std::optional<http::response<http::string_body>> response;
    std::string service_name;
    std::string instance_address; // last instance contacted, empty if none
    int attempts = 0;             // attempts that reached the transport
    std::string detail;

    bool ok() const { return error == RouteError::None; }
};

#endif // ROUTINGTYPES_HPP
