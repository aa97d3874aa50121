#include "ServiceRegistry.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "../utils/Utils.hpp"

ServiceRegistry::ServiceRegistry(std::shared_ptr<ILogger> logger,
                                 std::shared_ptr<IStatsDClient> statsd_client,
                                 CircuitBreaker::Clock clock)
    : logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(std::move(clock)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ServiceRegistry");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for ServiceRegistry");
    }
}

void ServiceRegistry::validate(const ServiceConfig& config) {
    const std::string& name = config.service_name;
    if (name.empty()) {
        throw ConfigurationError("Service name cannot be empty");
    }
    if (config.instances.empty()) {
        throw ConfigurationError("Service '" + name + "' needs at least one instance");
    }
    if (config.request_timeout.count() <= 0) {
        throw ConfigurationError("Service '" + name + "': request timeout must be positive");
    }
    if (config.max_retries < 0) {
        throw ConfigurationError("Service '" + name + "': max retries cannot be negative");
    }
    if (config.breaker_threshold < 1) {
        throw ConfigurationError("Service '" + name + "': breaker threshold must be at least 1");
    }
    if (config.recovery_timeout.count() < 0) {
        throw ConfigurationError("Service '" + name + "': recovery timeout cannot be negative");
    }
    if (config.health_check_path.empty() || config.health_check_path.front() != '/') {
        throw ConfigurationError("Service '" + name + "': health check path must start with '/'");
    }
    if (!config.route_prefix.empty() && config.route_prefix.front() != '/') {
        throw ConfigurationError("Service '" + name + "': route prefix must start with '/'");
    }
}

InstancePtr ServiceRegistry::makeInstance(const std::string& service_name, const std::string& address, int weight) {
    BackendUrlInfo endpoint;
    if (!Utils::parseUrl(address, &endpoint)) {
        throw ConfigurationError("Service '" + service_name + "': invalid instance address '" + address + "'");
    }
    if (endpoint.is_https) {
        throw ConfigurationError("Service '" + service_name + "': https instances are not supported ('" + address + "')");
    }
    if (weight < 1) {
        throw ConfigurationError("Service '" + service_name + "': instance weight must be at least 1");
    }
    return std::make_shared<Instance>(std::move(endpoint), weight);
}

void ServiceRegistry::registerService(const ServiceConfig& config) {
    validate(config);

    auto entry = std::make_shared<ServiceEntry>();
    entry->config = config;
    if (entry->config.route_prefix.empty()) {
        entry->config.route_prefix = "/" + config.service_name;
    }

    auto list = std::make_shared<InstanceList>();
    std::unordered_set<std::string> seen;
    for (const auto& spec : config.instances) {
        auto instance = makeInstance(config.service_name, spec.address, spec.weight);
        if (!seen.insert(instance->address()).second) {
            throw ConfigurationError("Service '" + config.service_name + "': duplicate instance '" + spec.address + "'");
        }
        list->push_back(std::move(instance));
    }
    entry->instances = std::move(list);

    entry->breaker = std::make_shared<CircuitBreaker>(
        config.service_name, config.breaker_threshold, config.recovery_timeout,
        logger_, statsd_client_, clock_);

    // Selectors handed out by getSelector() may outlive the registry; they then see no instances.
    std::weak_ptr<ServiceEntry> weak_entry = entry;
    entry->selector = InstanceSelector::create(
        config.load_balancing, [weak_entry]() -> std::shared_ptr<const InstanceList> {
            if (auto owner = weak_entry.lock()) {
                return owner->snapshot();
            }
            return nullptr;
        });

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (services_.count(config.service_name) > 0) {
            throw ConfigurationError("Service '" + config.service_name + "' is already registered");
        }
        services_.emplace(config.service_name, entry);
    }

    logger_->setup("Registered service " + config.service_name + " with "
        + std::to_string(config.instances.size()) + " instance(s), routed at " + entry->config.route_prefix);
}

std::shared_ptr<ServiceRegistry::ServiceEntry> ServiceRegistry::findEntry(const std::string& service_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = services_.find(service_name);
    if (it == services_.end()) {
        throw NotFoundError("Service '" + service_name + "' is not configured");
    }
    return it->second;
}

ServiceConfig ServiceRegistry::getConfig(const std::string& service_name) const {
    auto entry = findEntry(service_name);
    ServiceConfig config = entry->config;
    config.instances.clear();
    for (const auto& instance : *entry->snapshot()) {
        config.instances.push_back(InstanceSpec{instance->address(), instance->weight()});
    }
    return config;
}

void ServiceRegistry::addInstance(const std::string& service_name, const std::string& address, int weight) {
    auto entry = findEntry(service_name);
    auto instance = makeInstance(service_name, address, weight);

    std::lock_guard<std::mutex> lock(entry->writer_mutex);
    auto current = entry->snapshot();
    const bool present = std::any_of(current->begin(), current->end(),
        [&instance](const InstancePtr& existing) { return existing->address() == instance->address(); });
    if (present) {
        logger_->debug("Instance " + instance->address() + " already registered for " + service_name);
        return;
    }

    auto next = std::make_shared<InstanceList>(*current);
    next->push_back(std::move(instance));
    entry->publish(std::move(next));
    logger_->info("Added instance " + address + " to " + service_name);
}

bool ServiceRegistry::removeInstance(const std::string& service_name, const std::string& address) {
    auto entry = findEntry(service_name);

    // Compare against the normalized form so "http://a:1/" removes "http://a:1".
    BackendUrlInfo parsed;
    const std::string key = Utils::parseUrl(address, &parsed) ? parsed.url : address;

    std::lock_guard<std::mutex> lock(entry->writer_mutex);
    auto current = entry->snapshot();
    auto next = std::make_shared<InstanceList>();
    next->reserve(current->size());
    for (const auto& instance : *current) {
        if (instance->address() != key) {
            next->push_back(instance);
        }
    }
    if (next->size() == current->size()) {
        return false;
    }
    entry->publish(std::move(next));
    logger_->info("Removed instance " + key + " from " + service_name);
    return true;
}

void ServiceRegistry::resetCircuitBreaker(const std::string& service_name) {
    findEntry(service_name)->breaker->reset();
}

std::shared_ptr<CircuitBreaker> ServiceRegistry::getBreaker(const std::string& service_name) const {
    return findEntry(service_name)->breaker;
}

std::shared_ptr<InstanceSelector> ServiceRegistry::getSelector(const std::string& service_name) const {
    return findEntry(service_name)->selector;
}

std::shared_ptr<const InstanceList> ServiceRegistry::instances(const std::string& service_name) const {
    return findEntry(service_name)->snapshot();
}

bool ServiceRegistry::hasService(const std::string& service_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return services_.count(service_name) > 0;
}

std::vector<std::string> ServiceRegistry::serviceNames() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(services_.size());
    for (const auto& [name, entry] : services_) {
        names.push_back(name);
    }
    return names;
}

std::vector<ServiceStatus> ServiceRegistry::getStatus() const {
    std::vector<std::shared_ptr<ServiceEntry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        entries.reserve(services_.size());
        for (const auto& [name, entry] : services_) {
            entries.push_back(entry);
        }
    }

    std::vector<ServiceStatus> statuses;
    statuses.reserve(entries.size());
    for (const auto& entry : entries) {
        ServiceStatus status;
        status.service_name = entry->config.service_name;
        status.breaker_state = entry->breaker->getState();
        status.failure_count = entry->breaker->getFailureCount();
        for (const auto& instance : *entry->snapshot()) {
            InstanceStatus instance_status;
            instance_status.address = instance->address();
            instance_status.healthy = instance->isHealthy();
            instance_status.weight = instance->weight();
            instance_status.consecutive_failures = instance->consecutiveFailures();
            if (instance_status.healthy) {
                ++status.healthy_instances;
            }
            status.instances.push_back(std::move(instance_status));
        }
        status.total_instances = status.instances.size();
        statuses.push_back(std::move(status));
    }
    return statuses;
}
