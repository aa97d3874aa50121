#include "HttpServerSession.hpp"

#include <sstream>

#include "Gateway.hpp"

namespace {
    constexpr std::chrono::seconds WRITE_TIMEOUT{5};
}

HttpServerSession::HttpServerSession(
    tcp::socket&& socket,
    std::shared_ptr<Gateway> gateway,
    std::shared_ptr<ILogger> logger,
    const AppConfig& config,
    FinishHandler on_finish)
    : stream_(std::move(socket)),
      gateway_(std::move(gateway)),
      logger_(std::move(logger)),
      config_(config),
      on_finish_callback_(std::move(on_finish)) {
    beast::error_code ec;
    auto remote = stream_.socket().remote_endpoint(ec);
    client_address_ = ec ? "unknown" : remote.address().to_string();
    logger_->debug("HttpServerSession " + id() + " created for " + client_address_);
}

HttpServerSession::~HttpServerSession() {
    logger_->debug("HttpServerSession " + id() + " destroyed");
}

std::string HttpServerSession::id() const {
    std::ostringstream oss;
    oss << static_cast<const void*>(this);
    return oss.str();
}

void HttpServerSession::run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpServerSession::do_read, shared_from_this()));
}

void HttpServerSession::stop() {
    net::dispatch(stream_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        if (self->stream_.socket().is_open()) {
            self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            self->stream_.socket().close(ec);
        }
        if (ec && ec != beast::errc::not_connected) {
            self->logger_->error("HttpServerSession " + self->id() + " socket close error during stop: " + ec.message());
        }
    });
}

void HttpServerSession::do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds(config_.client_read_timeout_in_seconds));
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&HttpServerSession::on_read, shared_from_this()));
}

void HttpServerSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        return do_close();
    }
    if (ec) {
        if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
            logger_->error("HttpServerSession " + id() + " read error: " + ec.message());
        }
        return do_close();
    }

    stream_.expires_never();
    handle_request(std::move(req_));
}

void HttpServerSession::handle_request(http::request<http::string_body>&& req) {
    request_keep_alive_ = req.keep_alive();
    if (logger_->isDebugEnabled()) {
        logger_->debug("HttpServerSession " + id() + " " + std::string(http::to_string(req.method()))
            + " " + std::string(req.target()));
    }

    if (!gateway_) {
        http::response<http::string_body> res{http::status::internal_server_error, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(req.keep_alive());
        res.body() = "Internal server error: gateway not available.";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    gateway_->processRequest(std::move(req), client_address_,
        [self = shared_from_this()](std::optional<http::response<http::string_body>> opt_res) {
            net::dispatch(self->stream_.get_executor(),
                [self, opt_res = std::move(opt_res)]() mutable {
                    self->send_response(std::move(opt_res));
                });
        });
}

void HttpServerSession::send_response(std::optional<http::response<http::string_body>>&& opt_res) {
    if (!opt_res) {
        logger_->warn("HttpServerSession " + id() + " request dropped without a response");
        if (write_in_progress_) {
            return;
        }
        return request_keep_alive_ ? do_read() : do_close();
    }

    if (response_queue_.size() >= config_.max_response_queue_size) {
        logger_->warn("HttpServerSession " + id() + " response queue full (" + std::to_string(response_queue_.size())
            + "), discarding oldest response with status " + std::to_string(response_queue_.front()->result_int()));
        response_queue_.pop_front();
    }

    response_queue_.push_back(std::make_shared<http::response<http::string_body>>(std::move(*opt_res)));
    if (!write_in_progress_) {
        do_write();
    }
}

void HttpServerSession::do_write() {
    if (!stream_.socket().is_open()) {
        logger_->debug("HttpServerSession " + id() + " socket closed before write, dropping "
            + std::to_string(response_queue_.size()) + " response(s)");
        response_queue_.clear();
        write_in_progress_ = false;
        return do_close();
    }

    write_in_progress_ = true;
    auto response = response_queue_.front();
    stream_.expires_after(WRITE_TIMEOUT);
    http::async_write(stream_, *response,
        [self = shared_from_this(), response](beast::error_code ec, std::size_t bytes_transferred) {
            self->on_write(response->keep_alive(), ec, bytes_transferred);
        });
}

void HttpServerSession::on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        if (ec != net::error::operation_aborted) {
            logger_->error("HttpServerSession " + id() + " write error: " + ec.message());
        }
        response_queue_.clear();
        write_in_progress_ = false;
        return do_close();
    }

    if (!response_queue_.empty()) {
        response_queue_.pop_front();
    }
    if (!response_queue_.empty()) {
        return do_write();
    }

    write_in_progress_ = false;
    if (!keep_alive) {
        return do_close();
    }
    do_read();
}

void HttpServerSession::do_close() {
    beast::error_code ec;
    if (stream_.socket().is_open()) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
    if (ec && ec != beast::errc::not_connected) {
        logger_->debug("HttpServerSession " + id() + " shutdown: " + ec.message());
    }

    if (on_finish_callback_) {
        auto callback = std::move(on_finish_callback_);
        on_finish_callback_ = nullptr;
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(std::move(callback), shared_from_this()));
    }
}
