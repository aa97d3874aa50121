#ifndef BEASTTRANSPORT_HPP
#define BEASTTRANSPORT_HPP

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_set>

#include "AsyncHttpClientSession.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/ITransport.hpp"

// ITransport over Boost.Beast: one AsyncHttpClientSession per forwarded request.
// Sessions are tracked until they finish so that shutdown can cancel them.
class BeastTransport : public ITransport {
public:
    BeastTransport(net::io_context& ioc, std::shared_ptr<ILogger> logger);
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    void forward(const BackendUrlInfo& endpoint,
                 http::request<http::string_body> request,
                 std::chrono::milliseconds timeout,
                 Callback callback) override;

    // Aborts every outstanding exchange; each caller still receives one completion.
    void cancelAll();
    std::size_t activeCount() const;

    static TransportResult classify(std::optional<http::response<http::string_body>> response,
                                    const beast::error_code& ec);

private:
    struct SessionSet {
        std::mutex mutex;
        std::unordered_set<std::shared_ptr<AsyncHttpClientSession>> sessions;
    };

    net::io_context& ioc_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<SessionSet> active_;
};

#endif // BEASTTRANSPORT_HPP
