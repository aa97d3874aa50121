#ifndef BEAST_HTTP_SERVER_HPP
#define BEAST_HTTP_SERVER_HPP

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include <memory>
#include <mutex>
#include <unordered_set>

#include "HttpServerSession.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Gateway;

// Accepts inbound connections and runs one HttpServerSession per connection.
class BeastHttpServer : public std::enable_shared_from_this<BeastHttpServer> {
public:
    // Throws std::runtime_error when the listening socket cannot be set up.
    BeastHttpServer(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        std::shared_ptr<Gateway> gateway,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config);

    void run();

    // Stops accepting and closes every open session.
    void stop();

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void on_session_finish(const std::shared_ptr<HttpServerSession>& session);

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<Gateway> gateway_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<HttpServerSession>> active_sessions_;
};

#endif // BEAST_HTTP_SERVER_HPP
