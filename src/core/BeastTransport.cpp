#include "BeastTransport.hpp"

#include <stdexcept>
#include <vector>

BeastTransport::BeastTransport(net::io_context& ioc, std::shared_ptr<ILogger> logger)
    : ioc_(ioc), logger_(std::move(logger)), active_(std::make_shared<SessionSet>()) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for BeastTransport");
    }
}

BeastTransport::~BeastTransport() {
    cancelAll();
}

TransportResult BeastTransport::classify(std::optional<http::response<http::string_body>> response,
                                         const beast::error_code& ec) {
    if (ec == beast::errc::timed_out || ec == beast::error::timeout) {
        return TransportResult::timeout("timed out");
    }
    if (ec) {
        return TransportResult::failure(ec.message());
    }
    if (!response) {
        return TransportResult::failure("no response received");
    }
    return TransportResult::success(std::move(*response));
}

void BeastTransport::forward(const BackendUrlInfo& endpoint,
                             http::request<http::string_body> request,
                             std::chrono::milliseconds timeout,
                             Callback callback) {
    if (endpoint.is_https) {
        callback(TransportResult::failure("https is not supported for " + endpoint.url));
        return;
    }

    std::weak_ptr<SessionSet> weak_set = active_;
    auto logger = logger_;
    const std::string url = endpoint.url;

    auto session = std::make_shared<AsyncHttpClientSession>(
        ioc_,
        endpoint,
        std::move(request),
        timeout,
        [callback = std::move(callback), logger, url](
            std::optional<http::response<http::string_body>> response, beast::error_code ec) {
            TransportResult result = classify(std::move(response), ec);
            if (logger->isDebugEnabled()) {
                logger->debug("Exchange with " + url + " finished: " + to_string(result.outcome)
                    + (result.detail.empty() ? "" : " (" + result.detail + ")"));
            }
            callback(std::move(result));
        },
        [weak_set](const std::shared_ptr<AsyncHttpClientSession>& finished) {
            if (auto set = weak_set.lock()) {
                std::lock_guard<std::mutex> lock(set->mutex);
                set->sessions.erase(finished);
            }
        },
        logger_);

    {
        std::lock_guard<std::mutex> lock(active_->mutex);
        active_->sessions.insert(session);
    }
    session->run();
}

void BeastTransport::cancelAll() {
    std::vector<std::shared_ptr<AsyncHttpClientSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(active_->mutex);
        sessions.assign(active_->sessions.begin(), active_->sessions.end());
    }
    if (!sessions.empty()) {
        logger_->info("Cancelling " + std::to_string(sessions.size()) + " outstanding backend call(s)");
    }
    for (const auto& session : sessions) {
        session->cancel();
    }
}

std::size_t BeastTransport::activeCount() const {
    std::lock_guard<std::mutex> lock(active_->mutex);
    return active_->sessions.size();
}
