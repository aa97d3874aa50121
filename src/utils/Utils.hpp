#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../models/BackendUrlInfo.hpp"
#include "../models/GatewayErrors.hpp"
#include "../models/ServiceConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING" || level == "WARN") return LogUtils::LogLevel::WARN;
        if (level == "CERROR" || level == "ERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Integer at key, or fallback when absent. Throws ConfigurationError when the value
    // is not an integer or falls outside [min_value, max_value].
    static int boundedInt(const nlohmann::json& object, const std::string& key, int fallback,
                          int min_value, int max_value) {
        if (!object.contains(key)) {
            return fallback;
        }
        const nlohmann::json& value = object.at(key);
        if (!value.is_number_integer()) {
            throw ConfigurationError("\"" + key + "\" must be an integer");
        }
        const bool too_large_unsigned = value.is_number_unsigned()
            && value.get<std::uint64_t>() > static_cast<std::uint64_t>(max_value);
        const std::int64_t number = too_large_unsigned ? 0 : value.get<std::int64_t>();
        if (too_large_unsigned || number < min_value || number > max_value) {
            throw ConfigurationError("\"" + key + "\" must be between " + std::to_string(min_value)
                + " and " + std::to_string(max_value));
        }
        return static_cast<int>(number);
    }

    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return str;
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses key=value command-line arguments. Returns nullopt if any argument is malformed.
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt;
            }
        }
        return argMap;
    }

    // Loads the JSON configuration file, then applies command-line overrides.
    // The file is taken from the "config" argument, or searched in the standard locations.
    // Throws ConfigurationError when the file exists but cannot be parsed.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths;
        auto explicit_path = startupArguments.find("config");
        if (explicit_path != startupArguments.end()) {
            config_paths.push_back(explicit_path->second);
        } else {
            config_paths = {
                Constants::DEFAULT_CONFIG_FILE,
                "config/" + Constants::DEFAULT_CONFIG_FILE,
                "../" + Constants::DEFAULT_CONFIG_FILE,
                "/app/" + Constants::DEFAULT_CONFIG_FILE
            };
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            std::cout << "Reading configuration from " << config_path << "..." << std::endl;
            config_found = true;

            nlohmann::json root;
            try {
                root = nlohmann::json::parse(configFile);
            } catch (const nlohmann::json::parse_error& e) {
                throw ConfigurationError("Malformed configuration file " + config_path + ": " + e.what());
            }
            applyJsonConfiguration(root, config);
            break;
        }

        if (!config_found) {
            if (explicit_path != startupArguments.end()) {
                throw ConfigurationError("Configuration file not found: " + explicit_path->second);
            }
            std::cerr << "Warning: Configuration file not found in any standard location. No services will be routed." << std::endl;
        }

        for (const auto& [key, value] : startupArguments) {
            if (key == "port") {
                auto val = stringToInt(value);
                if (val && *val > 0 && *val <= 65535) {
                    config.frontend_port = *val;
                } else {
                    std::cerr << "Warning: Invalid port argument: " << value << std::endl;
                }
            } else if (key == "log_level") {
                config.log_level = stringToLogLevel(value);
            } else if (key == "io_threads") {
                auto val = stringToInt(value);
                if (val && *val > 0) {
                    config.num_io_threads = static_cast<unsigned int>(*val);
                } else {
                    std::cerr << "Warning: Invalid io_threads argument: " << value << std::endl;
                }
            }
        }

        return config;
    }

    // Fills config from a parsed configuration document. Unknown keys are ignored.
    static void applyJsonConfiguration(const nlohmann::json& root, AppConfig& config) {
        if (!root.is_object()) {
            throw ConfigurationError("Configuration root must be a JSON object");
        }
        try {
            const int int_max = std::numeric_limits<int>::max();
            config.frontend_port = boundedInt(root, "frontend_port", config.frontend_port, 1, 65535);
            config.num_io_threads = static_cast<unsigned int>(
                boundedInt(root, "io_threads", static_cast<int>(config.num_io_threads), 1, 1024));
            config.client_read_timeout_in_seconds = boundedInt(root, "client_read_timeout_seconds",
                config.client_read_timeout_in_seconds, 1, int_max);
            config.max_response_queue_size = root.value("max_response_queue_size", config.max_response_queue_size);
            if (root.contains("log_level")) {
                config.log_level = stringToLogLevel(root.at("log_level").get<std::string>());
            }
            config.health_check_interval_in_millis = boundedInt(root, "health_check_interval_ms",
                config.health_check_interval_in_millis, 0, int_max);
            config.health_check_timeout_in_millis = boundedInt(root, "health_check_timeout_ms",
                config.health_check_timeout_in_millis, 0, int_max);
            config.health_check_on_startup = root.value("health_check_on_startup", config.health_check_on_startup);
            config.metrics_prefix = root.value("metrics_prefix", config.metrics_prefix);
            config.metrics_batch_size = boundedInt(root, "metrics_batch_size", config.metrics_batch_size, 1, int_max);
            config.metrics_send_interval_in_millis = boundedInt(root, "metrics_send_interval_ms",
                config.metrics_send_interval_in_millis, 1, int_max);

            if (root.contains("services")) {
                const auto& services = root.at("services");
                if (!services.is_object()) {
                    throw ConfigurationError("\"services\" must be an object keyed by service name");
                }
                for (const auto& [name, body] : services.items()) {
                    config.services.push_back(parseServiceConfig(name, body));
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(e.what());
        }

        if (config.health_check_interval_in_millis <= 0 || config.health_check_timeout_in_millis <= 0) {
            throw ConfigurationError("Health check interval and timeout must be positive");
        }
    }

    static ServiceConfig parseServiceConfig(const std::string& name, const nlohmann::json& body) {
        if (!body.is_object()) {
            throw ConfigurationError("Service '" + name + "' must be a JSON object");
        }
        ServiceConfig service;
        service.service_name = name;
        service.route_prefix = body.value("route_prefix", "/" + name);
        service.health_check_path = body.value("health_check_path", service.health_check_path);
        service.request_timeout = std::chrono::milliseconds(
            body.value("request_timeout_ms", static_cast<long long>(service.request_timeout.count())));
        service.max_retries = boundedInt(body, "max_retries", service.max_retries, 0, std::numeric_limits<int>::max());
        service.breaker_threshold = boundedInt(body, "breaker_threshold", service.breaker_threshold,
                                               1, std::numeric_limits<int>::max());
        service.recovery_timeout = std::chrono::milliseconds(
            body.value("recovery_timeout_ms", static_cast<long long>(service.recovery_timeout.count())));

        const std::string strategy = body.value("load_balancing", std::string("round_robin"));
        if (strategy == "round_robin") {
            service.load_balancing = LoadBalancingStrategy::RoundRobin;
        } else if (strategy == "weighted") {
            service.load_balancing = LoadBalancingStrategy::Weighted;
        } else {
            throw ConfigurationError("Service '" + name + "': unknown load_balancing '" + strategy + "'");
        }

        if (!body.contains("instances") || !body.at("instances").is_array()) {
            throw ConfigurationError("Service '" + name + "' requires an \"instances\" array");
        }
        for (const auto& entry : body.at("instances")) {
            InstanceSpec spec;
            if (entry.is_string()) {
                spec.address = entry.get<std::string>();
            } else {
                spec.address = entry.at("address").get<std::string>();
                spec.weight = boundedInt(entry, "weight", 1, 1, std::numeric_limits<int>::max());
            }
            service.instances.push_back(std::move(spec));
        }
        return service;
    }

    // Splits a request target into path and query (without the '?').
    static std::pair<std::string, std::string> splitTarget(const std::string& target) {
        const size_t query_pos = target.find('?');
        if (query_pos == std::string::npos) {
            return {target, ""};
        }
        return {target.substr(0, query_pos), target.substr(query_pos + 1)};
    }

    // Decodes %XX escapes and '+' as space. Malformed escapes are kept verbatim.
    static std::string urlDecode(const std::string& value) {
        std::string decoded;
        decoded.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            const char c = value[i];
            if (c == '+') {
                decoded += ' ';
            } else if (c == '%' && i + 2 < value.size()
                       && std::isxdigit(static_cast<unsigned char>(value[i + 1]))
                       && std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
                decoded += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                decoded += c;
            }
        }
        return decoded;
    }

    // Value of the first "name=value" pair of a query string, decoded.
    static std::optional<std::string> queryParam(const std::string& query, const std::string& name) {
        size_t start = 0;
        while (start <= query.size()) {
            size_t end = query.find('&', start);
            if (end == std::string::npos) end = query.size();
            const std::string pair = query.substr(start, end - start);
            const size_t eq = pair.find('=');
            if (urlDecode(pair.substr(0, eq)) == name) {
                return eq == std::string::npos ? std::string() : urlDecode(pair.substr(eq + 1));
            }
            start = end + 1;
        }
        return std::nullopt;
    }

    // Current UTC time as RFC 3339 with millisecond precision.
    static std::string currentUtcTimestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm_utc{};
        gmtime_r(&now_c, &tm_utc);

        std::ostringstream oss;
        oss << std::put_time(&tm_utc, Constants::TIME_FORMAT) << '.'
            << std::setfill('0') << std::setw(3) << millis << 'Z';
        return oss.str();
    }

    // Splits "http(s)://host[:port][/]" into its parts. Returns false if the address does not match.
    static bool parseUrl(const std::string& url, BackendUrlInfo* urlInfo) {
        std::smatch match;
        if (!std::regex_match(url, match, Constants::url_regex)) {
            return false;
        }

        const bool is_https = (match[1].str() == "https");
        int port = is_https ? 443 : 80;
        if (match[3].matched) {
            auto parsed = stringToInt(match[3].str());
            if (!parsed || *parsed <= 0 || *parsed > 65535) {
                return false;
            }
            port = *parsed;
        }

        urlInfo->url = url;
        if (!urlInfo->url.empty() && urlInfo->url.back() == '/') {
            urlInfo->url.pop_back();
        }
        urlInfo->backend_host = match[2].str();
        urlInfo->backend_port = port;
        urlInfo->is_https = is_https;
        return true;
    }
};

#endif // UTILS_HPP
