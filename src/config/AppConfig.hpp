#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <cstddef>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include "../logging/LogLevel.hpp"
#include "../models/ServiceConfig.hpp"

namespace MetricsDefinitions {
    static const std::string CODE_EXCEPTION = "exception";

    static const std::string REQUEST_ROUTED = "request.routed";
    static const std::string REQUEST_UNAVAILABLE = "request.unavailable";

    static const std::string ATTEMPT_SUCCESS = "attempt.success";
    static const std::string ATTEMPT_FAILURE = "attempt.failure";
    static const std::string ATTEMPT_TIMEOUT = "attempt.timeout";
    static const std::string ATTEMPT_LATENCY = "attempt.latency";

    static const std::string CIRCUIT_OPENED = "circuit.opened";
    static const std::string CIRCUIT_CLOSED = "circuit.closed";
    static const std::string CIRCUIT_REJECTED = "circuit.rejected";

    static const std::string NO_HEALTHY_INSTANCE = "instance.none_healthy";
    static const std::string HEALTH_PROBE_FAILED = "health.probe_failed";
    static const std::string HEALTH_PROBE_SKIPPED = "health.probe_skipped";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    // Instance base address: scheme, host, optional port, optional trailing slash.
    static const std::regex url_regex(R"(^(https?):\/\/([^:\/?#]+)(?::(\d+))?\/?$)");
    static const std::string GATEWAY_NAME = "ride-gateway";
    static const std::string DEFAULT_CONFIG_FILE = "gateway.json";
}

class AppConfig {
public:
    // Registration order is preserved.
    std::vector<ServiceConfig> services;

    // Server configuration
    int frontend_port;
    unsigned int num_io_threads;
    int client_read_timeout_in_seconds;
    std::size_t max_response_queue_size;

    LogUtils::LogLevel log_level;

    // Health checking
    int health_check_interval_in_millis;
    int health_check_timeout_in_millis;
    bool health_check_on_startup;

    // Metrics
    std::string metrics_prefix;
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        frontend_port = 3000;
        num_io_threads = 4;
        client_read_timeout_in_seconds = 30;
        max_response_queue_size = 16;
        log_level = LogUtils::LogLevel::INFO;
        health_check_interval_in_millis = 30000;
        health_check_timeout_in_millis = 5000;
        health_check_on_startup = false;
        metrics_prefix = "ride_gateway.";
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "frontend_port: " << frontend_port << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "client_read_timeout_in_seconds: " << client_read_timeout_in_seconds << std::endl
            << "max_response_queue_size: " << max_response_queue_size << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "// --- Health Checking --- //" << std::endl
            << "health_check_interval_in_millis: " << health_check_interval_in_millis << std::endl
            << "health_check_timeout_in_millis: " << health_check_timeout_in_millis << std::endl
            << "health_check_on_startup: " << std::boolalpha << health_check_on_startup << std::noboolalpha << std::endl
            << "// --- Metrics --- //" << std::endl
            << "metrics_prefix: " << metrics_prefix << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl;

        ss << "--- Services ---" << std::endl;
        for (const auto& service : services) {
            ss << service.service_name << " (prefix " << service.route_prefix
               << ", " << ::to_string(service.load_balancing)
               << ", timeout " << service.request_timeout.count() << "ms"
               << ", retries " << service.max_retries
               << ", breaker " << service.breaker_threshold << "/" << service.recovery_timeout.count() << "ms"
               << ", health " << service.health_check_path << ")" << std::endl;
            for (const auto& instance : service.instances) {
                ss << "  " << instance.address << " weight=" << instance.weight << std::endl;
            }
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
