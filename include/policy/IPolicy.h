#pragma once

#include "common/RandomSource.h"
#include "common/Types.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace banditlab {
namespace policy {

// Snapshot copy; never aliases live policy state.
struct PolicyMetrics {
    int total_pulls = 0;
    double total_reward = 0.0;
    double average_reward = 0.0;
    std::vector<int> pull_count;
    std::vector<double> value_estimate;
    std::vector<HistoryEntry> history;
};

// Arm-selection capability. Whether a policy consumes a context is declared
// once through requiresContext(); runners branch on it, not on the instance.
class IPolicy {
public:
    virtual ~IPolicy() = default;

    virtual std::string getName() const = 0;
    virtual std::size_t armCount() const = 0;

    virtual bool requiresContext() const { return false; }
    virtual std::size_t contextDimension() const { return 0; }

    virtual int selectArm(RandomSource& rng) = 0;
    virtual void update(int arm, double reward) = 0;

    // Context-free policies ignore the context.
    virtual int selectArmWithContext(const FeatureVector& context, RandomSource& rng) {
        (void)context;
        return selectArm(rng);
    }
    virtual void updateWithContext(int arm, const FeatureVector& context, double reward) {
        (void)context;
        update(arm, reward);
    }

    // Zero all learned state; configuration (epsilon, c, priors, ...) is kept.
    virtual void reset() = 0;

    virtual PolicyMetrics getMetrics() const = 0;
};

// Ordered name -> policy mapping; iteration follows insertion order.
using PolicySet = std::vector<std::pair<std::string, std::shared_ptr<IPolicy>>>;

} // namespace policy
} // namespace banditlab
