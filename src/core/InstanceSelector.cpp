#include "InstanceSelector.hpp"

#include <stdexcept>

InstanceSelector::InstanceSelector(InstanceSource source) : source_(std::move(source)) {
    if (!source_) {
        throw std::invalid_argument("InstanceSelector requires an instance source");
    }
}

std::unique_ptr<InstanceSelector> InstanceSelector::create(LoadBalancingStrategy strategy, InstanceSource source) {
    switch (strategy) {
        case LoadBalancingStrategy::Weighted:
            return std::make_unique<WeightedRoundRobinSelector>(std::move(source));
        case LoadBalancingStrategy::RoundRobin:
            break;
    }
    return std::make_unique<RoundRobinSelector>(std::move(source));
}

InstanceList InstanceSelector::healthyInstances() const {
    InstanceList healthy;
    auto snapshot = source_();
    if (!snapshot) {
        return healthy;
    }
    healthy.reserve(snapshot->size());
    for (const auto& instance : *snapshot) {
        if (instance && instance->isHealthy()) {
            healthy.push_back(instance);
        }
    }
    return healthy;
}

InstancePtr RoundRobinSelector::next() {
    InstanceList healthy = healthyInstances();
    if (healthy.empty()) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    InstancePtr chosen = healthy[cursor_ % healthy.size()];
    ++cursor_;
    return chosen;
}

InstancePtr WeightedRoundRobinSelector::next() {
    InstanceList healthy = healthyInstances();
    if (healthy.empty()) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Drop state of instances that left the healthy set.
    std::unordered_map<std::string, int> weights;
    weights.reserve(healthy.size());

    int total = 0;
    InstancePtr best;
    int best_weight = 0;
    for (const auto& instance : healthy) {
        const int weight = instance->weight() > 0 ? instance->weight() : 1;
        auto it = current_weights_.find(instance->address());
        int current = (it != current_weights_.end() ? it->second : 0) + weight;
        weights[instance->address()] = current;
        total += weight;
        if (!best || current > best_weight) {
            best = instance;
            best_weight = current;
        }
    }

    weights[best->address()] -= total;
    current_weights_ = std::move(weights);
    return best;
}
