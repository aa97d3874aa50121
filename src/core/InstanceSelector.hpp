#ifndef INSTANCESELECTOR_HPP
#define INSTANCESELECTOR_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../models/Instance.hpp"
#include "../models/ServiceConfig.hpp"

// Picks the next instance of one service among those currently marked healthy.
// The instance set is read from the source on every call, so registry mutations
// and health changes apply to the very next selection.
class InstanceSelector {
public:
    using InstanceSource = std::function<std::shared_ptr<const InstanceList>()>;

    explicit InstanceSelector(InstanceSource source);
    virtual ~InstanceSelector() = default;

    InstanceSelector(const InstanceSelector&) = delete;
    InstanceSelector& operator=(const InstanceSelector&) = delete;

    // Returns nullptr when no instance is healthy. Never throws.
    virtual InstancePtr next() = 0;
    virtual std::string strategyName() const = 0;

    static std::unique_ptr<InstanceSelector> create(LoadBalancingStrategy strategy, InstanceSource source);

protected:
    // Healthy instances of the current snapshot, in configuration order.
    InstanceList healthyInstances() const;

private:
    InstanceSource source_;
};

// Unweighted strict rotation. The cursor advances by one per call and is reduced
// modulo the size of the healthy set at that moment.
class RoundRobinSelector : public InstanceSelector {
public:
    explicit RoundRobinSelector(InstanceSource source) : InstanceSelector(std::move(source)) {}

    InstancePtr next() override;
    std::string strategyName() const override { return "round_robin"; }

private:
    std::mutex mutex_;
    std::size_t cursor_ = 0;
};

// Smooth weighted round-robin: over one cycle each healthy instance is chosen
// weight times, interleaved rather than in bursts. Opt-in per service.
class WeightedRoundRobinSelector : public InstanceSelector {
public:
    explicit WeightedRoundRobinSelector(InstanceSource source) : InstanceSelector(std::move(source)) {}

    InstancePtr next() override;
    std::string strategyName() const override { return "weighted"; }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, int> current_weights_;
};

#endif // INSTANCESELECTOR_HPP
