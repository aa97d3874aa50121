#include "HttpHealthProbe.hpp"

#include <stdexcept>

#include "../config/AppConfig.hpp"

HttpHealthProbe::HttpHealthProbe(std::shared_ptr<ITransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null for HttpHealthProbe");
    }
}

void HttpHealthProbe::probe(const BackendUrlInfo& endpoint,
                            const std::string& path,
                            std::chrono::milliseconds timeout,
                            Callback callback) {
    http::request<http::string_body> request{http::verb::get, path, 11};
    request.set(http::field::user_agent, Constants::GATEWAY_NAME + "-health-check");

    transport_->forward(endpoint, std::move(request), timeout,
        [callback = std::move(callback)](TransportResult result) {
            HealthProbeResult probe_result;
            if (result.outcome == RoutingOutcome::Success && result.response) {
                probe_result.status_code = result.response->result_int();
                probe_result.healthy = probe_result.status_code == 200;
                if (!probe_result.healthy) {
                    probe_result.detail = "status " + std::to_string(probe_result.status_code);
                }
            } else {
                probe_result.detail = to_string(result.outcome)
                    + (result.detail.empty() ? "" : ": " + result.detail);
            }
            callback(std::move(probe_result));
        });
}
