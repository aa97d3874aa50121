#include "BeastHttpServer.hpp"

#include <boost/asio/strand.hpp>

#include <stdexcept>
#include <vector>

#include "Gateway.hpp"

BeastHttpServer::BeastHttpServer(
    net::io_context& ioc,
    tcp::endpoint endpoint,
    std::shared_ptr<Gateway> gateway,
    std::shared_ptr<ILogger> logger,
    const AppConfig& config)
    : ioc_(ioc),
      acceptor_(ioc),
      gateway_(std::move(gateway)),
      logger_(std::move(logger)),
      config_(config) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for BeastHttpServer");
    }
    if (!gateway_) {
        throw std::invalid_argument("Gateway cannot be null for BeastHttpServer");
    }

    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        logger_->error("BeastHttpServer open acceptor error: " + ec.message());
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        logger_->error("BeastHttpServer set_option error: " + ec.message());
        throw std::runtime_error("Failed to set_option: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        logger_->error("BeastHttpServer bind error: " + ec.message());
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        logger_->error("BeastHttpServer listen error: " + ec.message());
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

void BeastHttpServer::run() {
    logger_->setup("Listening on " + acceptor_.local_endpoint().address().to_string()
        + ":" + std::to_string(acceptor_.local_endpoint().port()));
    do_accept();
}

void BeastHttpServer::stop() {
    logger_->info("BeastHttpServer stopping...");
    beast::error_code ec;
    acceptor_.cancel(ec);
    if (ec) logger_->error("BeastHttpServer acceptor cancel error: " + ec.message());
    acceptor_.close(ec);
    if (ec) logger_->error("BeastHttpServer acceptor close error: " + ec.message());

    std::vector<std::shared_ptr<HttpServerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.assign(active_sessions_.begin(), active_sessions_.end());
        active_sessions_.clear();
    }
    for (const auto& session : sessions) {
        session->stop();
    }
    logger_->info("BeastHttpServer stopped, closed " + std::to_string(sessions.size()) + " session(s)");
}

void BeastHttpServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&BeastHttpServer::on_accept, shared_from_this()));
}

void BeastHttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        logger_->error("BeastHttpServer accept error: " + ec.message());
        return do_accept();
    }

    std::weak_ptr<BeastHttpServer> weak_self = shared_from_this();
    auto session = std::make_shared<HttpServerSession>(
        std::move(socket),
        gateway_,
        logger_,
        config_,
        [weak_self](std::shared_ptr<HttpServerSession> finished) {
            if (auto self = weak_self.lock()) {
                self->on_session_finish(finished);
            }
        });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }
    session->run();

    do_accept();
}

void BeastHttpServer::on_session_finish(const std::shared_ptr<HttpServerSession>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    active_sessions_.erase(session);
    logger_->debug("BeastHttpServer session finished, active sessions: " + std::to_string(active_sessions_.size()));
}
