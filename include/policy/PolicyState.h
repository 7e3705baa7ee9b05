#pragma once

#include "common/Types.h"
#include "policy/IPolicy.h"

#include <cstddef>
#include <vector>

namespace banditlab {
namespace policy {

// Per-arm pull counts, running-mean estimates and the round history.
// Only record()/reset() mutate it; readers get const refs or copies.
class PolicyState {
public:
    explicit PolicyState(std::size_t n_arms);

    // Validates the arm before touching anything.
    void record(int arm, double reward);
    void reset();

    std::size_t armCount() const { return pull_count_.size(); }
    int pullCount(int arm) const;
    double valueEstimate(int arm) const;
    const std::vector<int>& pullCounts() const { return pull_count_; }
    const std::vector<double>& valueEstimates() const { return value_estimate_; }
    int totalPulls() const { return total_pulls_; }
    double totalReward() const { return total_reward_; }
    const std::vector<HistoryEntry>& history() const { return history_; }

    PolicyMetrics toMetrics() const;

private:
    std::vector<int> pull_count_;
    std::vector<double> value_estimate_;
    int total_pulls_ = 0;
    double total_reward_ = 0.0;
    std::vector<HistoryEntry> history_;
};

// Shared base for the context-free policies: owns a PolicyState and provides
// the common update/reset/metrics; subclasses supply the selection rule.
class EstimatingPolicy : public IPolicy {
public:
    std::size_t armCount() const override { return state_.armCount(); }
    void update(int arm, double reward) override { state_.record(arm, reward); }
    void reset() override { state_.reset(); }
    PolicyMetrics getMetrics() const override { return state_.toMetrics(); }

protected:
    explicit EstimatingPolicy(int n_arms);

    const PolicyState& state() const { return state_; }

private:
    PolicyState state_;
};

} // namespace policy
} // namespace banditlab
