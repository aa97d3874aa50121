#ifndef ASYNC_HTTP_CLIENT_SESSION_HPP
#define ASYNC_HTTP_CLIENT_SESSION_HPP

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../models/BackendUrlInfo.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One outbound HTTP/1.1 exchange with a backend instance. Resolver, stream and timer
// share a strand, so completion is reported exactly once: whichever of the read or
// the deadline finishes first wins, the other is discarded.
class AsyncHttpClientSession : public std::enable_shared_from_this<AsyncHttpClientSession> {
public:
    using CompletionHandler = std::function<void(std::optional<http::response<http::string_body>>, beast::error_code)>;
    using FinishHandler = std::function<void(const std::shared_ptr<AsyncHttpClientSession>&)>;

    AsyncHttpClientSession(
        net::io_context& ioc,
        BackendUrlInfo backend_info,
        http::request<http::string_body> request,
        std::chrono::milliseconds timeout,
        CompletionHandler on_complete,
        FinishHandler on_finish = nullptr,
        std::shared_ptr<ILogger> logger = nullptr)
        : strand_(net::make_strand(ioc)),
          resolver_(strand_),
          stream_(strand_),
          timer_(strand_),
          req_(std::move(request)),
          backend_info_(std::move(backend_info)),
          timeout_(timeout),
          on_complete_(std::move(on_complete)),
          on_finish_(std::move(on_finish)),
          logger_(std::move(logger)) {
        req_.version(11);
        req_.set(http::field::host, backend_info_.hostHeader());
        if (req_.find(http::field::user_agent) == req_.end()) {
            req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        }
        req_.keep_alive(false);
        req_.prepare_payload();
    }

    void run() {
        net::dispatch(strand_, [self = shared_from_this()]() {
            self->timer_.expires_after(self->timeout_);
            self->timer_.async_wait(beast::bind_front_handler(&AsyncHttpClientSession::on_timeout, self));
            self->do_resolve();
        });
    }

    // Aborts the exchange. The completion handler still fires once, with operation_aborted.
    void cancel() {
        net::dispatch(strand_, [self = shared_from_this()]() {
            self->finish({}, net::error::operation_aborted);
        });
    }

    const BackendUrlInfo& backend() const { return backend_info_; }

private:
    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (logger_) logger_->debug("Request to " + backend_info_.url + " timed out");
        finish({}, beast::errc::make_error_code(beast::errc::timed_out));
    }

    void do_resolve() {
        resolver_.async_resolve(
            backend_info_.backend_host,
            std::to_string(backend_info_.backend_port),
            beast::bind_front_handler(&AsyncHttpClientSession::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return finish({}, ec);
        if (completed_) return;
        stream_.async_connect(
            results,
            beast::bind_front_handler(&AsyncHttpClientSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return finish({}, ec);
        if (completed_) return;
        http::async_write(stream_, req_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        if (ec) return finish({}, ec);
        if (completed_) return;
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        // end_of_stream here means the peer closed before a complete response arrived.
        if (ec) {
            return finish({}, ec);
        }
        finish(std::move(res_), {});
    }

    void finish(std::optional<http::response<http::string_body>> response, beast::error_code ec) {
        if (completed_) {
            return;
        }
        completed_ = true;

        timer_.cancel();
        resolver_.cancel();
        beast::error_code shut_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shut_ec);
        stream_.socket().close(shut_ec);

        auto self = shared_from_this();
        if (on_complete_) {
            on_complete_(std::move(response), ec);
            on_complete_ = nullptr;
        }
        if (on_finish_) {
            on_finish_(self);
            on_finish_ = nullptr;
        }
    }

    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    net::steady_timer timer_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    const BackendUrlInfo backend_info_;
    const std::chrono::milliseconds timeout_;
    CompletionHandler on_complete_;
    FinishHandler on_finish_;
    std::shared_ptr<ILogger> logger_;
    bool completed_ = false; // strand-confined
};

#endif // ASYNC_HTTP_CLIENT_SESSION_HPP
