#ifndef HTTP_SERVER_SESSION_HPP
#define HTTP_SERVER_SESSION_HPP

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/config.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class Gateway;

// One inbound client connection. Reads a request, hands it to the Gateway, writes the
// response back and, on keep-alive, reads the next one. All socket work happens on the
// stream's strand; Gateway completions are dispatched back onto it.
class HttpServerSession : public std::enable_shared_from_this<HttpServerSession> {
public:
    using FinishHandler = std::function<void(std::shared_ptr<HttpServerSession>)>;

    HttpServerSession(
        tcp::socket&& socket,
        std::shared_ptr<Gateway> gateway,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config,
        FinishHandler on_finish);

    ~HttpServerSession();

    void run();
    void stop();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void handle_request(http::request<http::string_body>&& req);

    // Queues a response for writing. std::nullopt drops the request without a reply.
    void send_response(std::optional<http::response<http::string_body>>&& opt_res);

    void do_write();
    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
    std::string id() const;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<Gateway> gateway_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    FinishHandler on_finish_callback_;
    std::string client_address_;

    std::deque<std::shared_ptr<http::response<http::string_body>>> response_queue_;
    bool write_in_progress_ = false;
    bool request_keep_alive_ = false;

    http::request<http::string_body> req_;
};

#endif // HTTP_SERVER_SESSION_HPP
