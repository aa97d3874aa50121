#ifndef GATEWAY_HPP
#define GATEWAY_HPP

#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "RequestRouter.hpp"
#include "ServiceRegistry.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace http = boost::beast::http;

using json = nlohmann::json;

// Inbound request handling: built-in endpoints (/health, /status, /metrics, /admin/...)
// and prefix-based proxying to registered services through the RequestRouter.
class Gateway {
public:
    using ResponseCallback = std::function<void(std::optional<http::response<http::string_body>>)>;

    struct RouteMatch {
        std::string service_name;
        std::string forward_target; // prefix stripped, query kept
    };

    Gateway(ServiceRegistry& registry,
            std::shared_ptr<RequestRouter> router,
            std::shared_ptr<ILogger> logger,
            std::shared_ptr<IStatsDClient> statsd_client);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // The callback may run on another thread than the caller's.
    void processRequest(http::request<http::string_body> req,
                        const std::string& client_address,
                        ResponseCallback send_response_cb) const;

    // Longest route prefix that equals the path or is followed by '/'.
    std::optional<RouteMatch> matchRoute(const std::string& target) const;

    json statusJson() const;
    json metricsJson() const;

private:
    void proxyRequest(http::request<http::string_body> req,
                      const std::string& client_address,
                      RouteMatch match,
                      ResponseCallback send_response_cb) const;
    void handleAdminRequest(const http::request<http::string_body>& req,
                            const std::string& path,
                            const std::string& query,
                            ResponseCallback& send_response_cb) const;

    http::response<http::string_body> jsonResponse(http::status status,
                                                   const json& body,
                                                   const http::request<http::string_body>& req) const;
    double uptimeSeconds() const;

    ServiceRegistry& registry_;
    std::shared_ptr<RequestRouter> router_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    const std::chrono::steady_clock::time_point started_at_;

    // (prefix, service name), longest prefix first.
    std::vector<std::pair<std::string, std::string>> routes_;
};

#endif // GATEWAY_HPP
