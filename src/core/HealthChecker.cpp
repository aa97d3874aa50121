#include "HealthChecker.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <stdexcept>

#include "../config/AppConfig.hpp"

namespace net = boost::asio;

HealthChecker::HealthChecker(net::io_context& ioc,
                             ServiceRegistry& registry,
                             std::shared_ptr<IHealthProbe> probe,
                             std::chrono::milliseconds interval,
                             std::chrono::milliseconds probe_timeout,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client)
    : registry_(registry),
      probe_(std::move(probe)),
      interval_(interval),
      probe_timeout_(probe_timeout),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      strand_(net::make_strand(ioc)),
      timer_(strand_) {
    if (!probe_) {
        throw std::invalid_argument("Health probe cannot be null for HealthChecker");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for HealthChecker");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for HealthChecker");
    }
    if (interval_.count() <= 0 || probe_timeout_.count() <= 0) {
        throw std::invalid_argument("Health check interval and probe timeout must be positive");
    }
}

void HealthChecker::start() {
    if (running_.exchange(true)) {
        return;
    }
    logger_->setup("Health checking every " + std::to_string(interval_.count())
        + "ms with probe timeout " + std::to_string(probe_timeout_.count()) + "ms");
    net::dispatch(strand_, [self = shared_from_this()]() { self->scheduleNext(); });
}

void HealthChecker::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    logger_->info("Health checker stopping");
    net::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void HealthChecker::scheduleNext() {
    if (!running_) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        self->onTick(ec);
    });
}

void HealthChecker::onTick(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || !running_) {
        return;
    }
    if (ec) {
        logger_->error("Health check timer error: " + ec.message());
    } else {
        checkNow();
    }
    scheduleNext();
}

std::size_t HealthChecker::checkNow() {
    std::size_t issued = 0;
    for (const auto& service_name : registry_.serviceNames()) {
        std::string path;
        std::shared_ptr<const InstanceList> snapshot;
        try {
            path = registry_.getConfig(service_name).health_check_path;
            snapshot = registry_.instances(service_name);
        } catch (const NotFoundError& e) {
            logger_->debug(std::string("Skipping health check: ") + e.what());
            continue;
        }
        for (const auto& instance : *snapshot) {
            if (probeInstance(service_name, path, instance)) {
                ++issued;
            }
        }
    }
    return issued;
}

bool HealthChecker::probeInstance(const std::string& service_name, const std::string& path, const InstancePtr& instance) {
    if (!instance->tryBeginProbe()) {
        logger_->debug("Previous probe of " + instance->address() + " still running, skipping");
        statsd_client_->increment(MetricsDefinitions::HEALTH_PROBE_SKIPPED);
        return false;
    }

    try {
        probe_->probe(instance->endpoint(), path, probe_timeout_,
            [self = shared_from_this(), service_name, instance](HealthProbeResult result) {
                self->applyResult(service_name, instance, result);
            });
    } catch (const std::exception& e) {
        HealthProbeResult result;
        result.detail = std::string("probe threw: ") + e.what();
        applyResult(service_name, instance, result);
    }
    return true;
}

void HealthChecker::applyResult(const std::string& service_name, const InstancePtr& instance, const HealthProbeResult& result) {
    const bool was_healthy = instance->isHealthy();
    if (result.healthy) {
        instance->markHealthy();
        if (!was_healthy) {
            logger_->info("Instance " + instance->address() + " of " + service_name + " is healthy again");
        }
    } else {
        instance->markUnhealthy();
        logger_->warn("Health check failed for " + service_name + " instance " + instance->address()
            + (result.detail.empty() ? "" : ": " + result.detail));
        statsd_client_->increment(MetricsDefinitions::HEALTH_PROBE_FAILED);
    }
    instance->endProbe();
}
