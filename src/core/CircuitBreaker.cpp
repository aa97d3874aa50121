#include "CircuitBreaker.hpp"

#include <stdexcept>

#include "../config/AppConfig.hpp"

CircuitBreaker::CircuitBreaker(std::string service_name,
                               int failure_threshold,
                               std::chrono::milliseconds recovery_timeout,
                               std::shared_ptr<ILogger> logger,
                               std::shared_ptr<IStatsDClient> statsd_client,
                               Clock clock)
    : service_name_(std::move(service_name)),
      failure_threshold_(failure_threshold),
      recovery_timeout_(recovery_timeout),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CircuitBreaker");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for CircuitBreaker");
    }
    if (failure_threshold_ < 1) {
        throw std::invalid_argument("Circuit breaker threshold must be at least 1");
    }
    if (recovery_timeout_.count() < 0) {
        throw std::invalid_argument("Circuit breaker recovery timeout cannot be negative");
    }
}

CircuitBreaker::Permit CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    Permit permit;
    permit.generation = generation_;
    switch (state_) {
        case CircuitState::CLOSED:
            permit.admitted = true;
            return permit;

        case CircuitState::OPEN: {
            const auto now = clock_();
            if (now - opened_at_ < recovery_timeout_) {
                statsd_client_->increment(MetricsDefinitions::CIRCUIT_REJECTED);
                return permit;
            }
            state_ = CircuitState::HALF_OPEN;
            trial_in_flight_ = true;
            permit.admitted = true;
            permit.trial = true;
            logger_->info("Circuit breaker for " + service_name_ + " is HALF_OPEN, admitting trial request");
            return permit;
        }

        case CircuitState::HALF_OPEN:
            if (trial_in_flight_) {
                statsd_client_->increment(MetricsDefinitions::CIRCUIT_REJECTED);
                return permit;
            }
            trial_in_flight_ = true;
            permit.admitted = true;
            permit.trial = true;
            return permit;
    }
    return permit;
}

bool CircuitBreaker::countsLocked(const Permit& permit) const {
    if (!permit.admitted || permit.generation != generation_) {
        return false;
    }
    switch (state_) {
        case CircuitState::CLOSED:
            return !permit.trial;
        case CircuitState::HALF_OPEN:
            return permit.trial && trial_in_flight_;
        case CircuitState::OPEN:
            return false;
    }
    return false;
}

void CircuitBreaker::recordSuccess(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!countsLocked(permit)) {
        return;
    }
    if (state_ == CircuitState::HALF_OPEN) {
        state_ = CircuitState::CLOSED;
        trial_in_flight_ = false;
        ++generation_;
        logger_->info("Circuit breaker for " + service_name_ + " CLOSED after successful trial");
        statsd_client_->increment(MetricsDefinitions::CIRCUIT_CLOSED);
    }
    failure_count_ = 0;
}

void CircuitBreaker::recordFailure(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!countsLocked(permit)) {
        return;
    }
    ++failure_count_;
    if (state_ == CircuitState::HALF_OPEN) {
        trial_in_flight_ = false;
        openLocked(clock_());
    } else if (failure_count_ >= failure_threshold_) {
        openLocked(clock_());
    }
}

void CircuitBreaker::abandonTrial(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HALF_OPEN && countsLocked(permit)) {
        trial_in_flight_ = false;
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::CLOSED) {
        logger_->warn("Circuit breaker for " + service_name_ + " manually reset from " + to_string(state_));
        ++generation_;
    }
    state_ = CircuitState::CLOSED;
    failure_count_ = 0;
    trial_in_flight_ = false;
    opened_at_ = {};
}

CircuitState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::getFailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

void CircuitBreaker::openLocked(std::chrono::steady_clock::time_point now) {
    state_ = CircuitState::OPEN;
    opened_at_ = now;
    ++generation_;
    logger_->warn("Circuit breaker for " + service_name_ + " OPEN after "
        + std::to_string(failure_count_) + " failures; cooling off for "
        + std::to_string(recovery_timeout_.count()) + "ms");
    statsd_client_->increment(MetricsDefinitions::CIRCUIT_OPENED);
}
