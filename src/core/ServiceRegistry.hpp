#ifndef SERVICEREGISTRY_HPP
#define SERVICEREGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "CircuitBreaker.hpp"
#include "InstanceSelector.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/GatewayErrors.hpp"
#include "../models/Instance.hpp"
#include "../models/ServiceConfig.hpp"
#include "../models/ServiceStatus.hpp"

// Owns, per logical service, the configuration, the live instance set, the circuit
// breaker and the instance selector.
//
// Instance lists are copy-on-write: writers build a new list and publish it, readers
// take the current snapshot without blocking. Instances are shared-owned, so a request
// that already picked an instance is unaffected by its removal.
class ServiceRegistry {
public:
    ServiceRegistry(std::shared_ptr<ILogger> logger,
                    std::shared_ptr<IStatsDClient> statsd_client,
                    CircuitBreaker::Clock clock = CircuitBreaker::Clock());

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    // Throws ConfigurationError on a duplicate name or an invalid configuration.
    void registerService(const ServiceConfig& config);

    // The following throw NotFoundError for an unknown service.
    ServiceConfig getConfig(const std::string& service_name) const;

    // Appends a healthy instance. No-op when the address is already present.
    // Throws ConfigurationError for a malformed address or weight.
    void addInstance(const std::string& service_name, const std::string& address, int weight = 1);

    // Returns false when the address was not present.
    bool removeInstance(const std::string& service_name, const std::string& address);

    void resetCircuitBreaker(const std::string& service_name);

    std::shared_ptr<CircuitBreaker> getBreaker(const std::string& service_name) const;
    std::shared_ptr<InstanceSelector> getSelector(const std::string& service_name) const;
    std::shared_ptr<const InstanceList> instances(const std::string& service_name) const;

    bool hasService(const std::string& service_name) const;
    std::vector<std::string> serviceNames() const;
    std::vector<ServiceStatus> getStatus() const;

private:
    struct ServiceEntry {
        ServiceConfig config; // instances field is the registration-time list
        std::mutex writer_mutex;
        std::shared_ptr<const InstanceList> instances;
        std::shared_ptr<CircuitBreaker> breaker;
        std::shared_ptr<InstanceSelector> selector;

        std::shared_ptr<const InstanceList> snapshot() const {
            return std::atomic_load_explicit(&instances, std::memory_order_acquire);
        }
        void publish(std::shared_ptr<const InstanceList> next) {
            std::atomic_store_explicit(&instances, std::move(next), std::memory_order_release);
        }
    };

    std::shared_ptr<ServiceEntry> findEntry(const std::string& service_name) const;
    static InstancePtr makeInstance(const std::string& service_name, const std::string& address, int weight);
    static void validate(const ServiceConfig& config);

    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    CircuitBreaker::Clock clock_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<ServiceEntry>> services_;
};

#endif // SERVICEREGISTRY_HPP
