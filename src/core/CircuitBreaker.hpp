#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/CircuitState.hpp"

// Per-service breaker gating whether a request may attempt the backend at all.
//
//   CLOSED    -> OPEN       after breakerThreshold consecutive failures
//   OPEN      -> HALF_OPEN  on the first allowRequest() once recoveryTimeout has elapsed;
//                           that call is admitted as the single trial
//   HALF_OPEN -> CLOSED     on success
//   HALF_OPEN -> OPEN       on failure (recovery timer restarts)
//
// Each admitted call holds a Permit and reports its outcome with it. The generation
// advances whenever the breaker opens or closes, so outcomes of calls admitted in an
// earlier generation are ignored, and while HALF_OPEN only the trial's outcome counts.
// Outcomes recorded while OPEN are ignored. Every operation is serialized by one mutex.
class CircuitBreaker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Permit {
        bool admitted = false;
        bool trial = false;
        std::uint64_t generation = 0;

        explicit operator bool() const { return admitted; }
    };

    CircuitBreaker(std::string service_name,
                   int failure_threshold,
                   std::chrono::milliseconds recovery_timeout,
                   std::shared_ptr<ILogger> logger,
                   std::shared_ptr<IStatsDClient> statsd_client,
                   Clock clock = Clock());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    Permit allowRequest();
    void recordSuccess(const Permit& permit);
    void recordFailure(const Permit& permit);

    // Releases an admitted HALF_OPEN trial that never reached a backend, so the next
    // request can become the trial instead. No effect for any other permit.
    void abandonTrial(const Permit& permit);

    // Administrative force to CLOSED.
    void reset();

    CircuitState getState() const;
    int getFailureCount() const;
    const std::string& serviceName() const { return service_name_; }

private:
    void openLocked(std::chrono::steady_clock::time_point now);
    bool countsLocked(const Permit& permit) const;

    const std::string service_name_;
    const int failure_threshold_;
    const std::chrono::milliseconds recovery_timeout_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    Clock clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int failure_count_ = 0;
    std::chrono::steady_clock::time_point opened_at_{};
    bool trial_in_flight_ = false;
    std::uint64_t generation_ = 0;
};

#endif // CIRCUITBREAKER_HPP
