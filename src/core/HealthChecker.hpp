#ifndef HEALTHCHECKER_HPP
#define HEALTHCHECKER_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "ServiceRegistry.hpp"
#include "../interfaces/IHealthProbe.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Periodically probes every instance of every registered service and updates its
// health flag. Probe failures are logged and counted only: they never raise and
// never reach the circuit breakers.
//
// Must be owned by a std::shared_ptr; pending timer and probe handlers keep it alive.
class HealthChecker : public std::enable_shared_from_this<HealthChecker> {
public:
    HealthChecker(boost::asio::io_context& ioc,
                  ServiceRegistry& registry,
                  std::shared_ptr<IHealthProbe> probe,
                  std::chrono::milliseconds interval,
                  std::chrono::milliseconds probe_timeout,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IStatsDClient> statsd_client);

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    // First tick fires one interval after start(). Calling start() twice has no effect.
    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Issues one probe per instance right away. Returns the number of probes issued;
    // instances whose previous probe is still outstanding are skipped.
    std::size_t checkNow();

private:
    void scheduleNext();
    void onTick(const boost::system::error_code& ec);
    bool probeInstance(const std::string& service_name, const std::string& path, const InstancePtr& instance);
    void applyResult(const std::string& service_name, const InstancePtr& instance, const HealthProbeResult& result);

    ServiceRegistry& registry_;
    std::shared_ptr<IHealthProbe> probe_;
    const std::chrono::milliseconds interval_;
    const std::chrono::milliseconds probe_timeout_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
};

#endif // HEALTHCHECKER_HPP
