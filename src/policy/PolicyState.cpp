#include "policy/PolicyState.h"
#include "common/Errors.h"

#include <algorithm>

namespace banditlab {
namespace policy {

namespace {
std::size_t checkedArmCount(int n_arms) {
    if (n_arms <= 0) {
        throw InvalidParameterError("n_arms", "must be > 0");
    }
    return static_cast<std::size_t>(n_arms);
}
}

PolicyState::PolicyState(std::size_t n_arms)
    : pull_count_(n_arms, 0)
    , value_estimate_(n_arms, 0.0) {
    if (n_arms == 0) {
        throw InvalidParameterError("n_arms", "must be > 0");
    }
}

void PolicyState::record(int arm, double reward) {
    checkArm(arm, pull_count_.size());
    const auto idx = static_cast<std::size_t>(arm);

    pull_count_[idx]++;
    total_pulls_++;
    total_reward_ += reward;

    // Incremental mean: no running-sum/divide drift.
    value_estimate_[idx] += (reward - value_estimate_[idx]) / static_cast<double>(pull_count_[idx]);

    history_.push_back(HistoryEntry{arm, reward});
}

void PolicyState::reset() {
    std::fill(pull_count_.begin(), pull_count_.end(), 0);
    std::fill(value_estimate_.begin(), value_estimate_.end(), 0.0);
    total_pulls_ = 0;
    total_reward_ = 0.0;
    history_.clear();
}

int PolicyState::pullCount(int arm) const {
    checkArm(arm, pull_count_.size());
    return pull_count_[static_cast<std::size_t>(arm)];
}

double PolicyState::valueEstimate(int arm) const {
    checkArm(arm, value_estimate_.size());
    return value_estimate_[static_cast<std::size_t>(arm)];
}

PolicyMetrics PolicyState::toMetrics() const {
    PolicyMetrics m;
    m.total_pulls = total_pulls_;
    m.total_reward = total_reward_;
    m.average_reward = total_reward_ / static_cast<double>(std::max(1, total_pulls_));
    m.pull_count = pull_count_;
    m.value_estimate = value_estimate_;
    m.history = history_;
    return m;
}

EstimatingPolicy::EstimatingPolicy(int n_arms)
    : state_(checkedArmCount(n_arms)) {}

} // namespace policy
} // namespace banditlab
