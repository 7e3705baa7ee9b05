#pragma once

#include "policy/PolicyState.h"

namespace banditlab {
namespace policy {

// With probability epsilon pick a uniform random arm, otherwise the arm with
// the highest running mean (ties broken uniformly at random).
class EpsilonGreedyPolicy : public EstimatingPolicy {
public:
    explicit EpsilonGreedyPolicy(int n_arms, double epsilon = 0.1);

    std::string getName() const override { return "epsilon_greedy"; }
    int selectArm(RandomSource& rng) override;
    void reset() override;

    double getEpsilon() const { return epsilon_; }
    void setEpsilon(double epsilon);    // clamped into [0, 1]

    int getExplorationCount() const { return exploration_count_; }
    int getExploitationCount() const { return exploitation_count_; }
    double getExplorationRatio() const;

private:
    double epsilon_ = 0.1;
    int exploration_count_ = 0;
    int exploitation_count_ = 0;
};

} // namespace policy
} // namespace banditlab
