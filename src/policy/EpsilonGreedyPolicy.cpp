#include "policy/EpsilonGreedyPolicy.h"

#include <algorithm>
#include <cmath>

namespace banditlab {
namespace policy {

EpsilonGreedyPolicy::EpsilonGreedyPolicy(int n_arms, double epsilon)
    : EstimatingPolicy(n_arms) {
    setEpsilon(epsilon);
}

int EpsilonGreedyPolicy::selectArm(RandomSource& rng) {
    if (rng.uniform() < epsilon_) {
        exploration_count_++;
        return rng.uniformInt(0, static_cast<int>(armCount()) - 1);
    }
    exploitation_count_++;
    return rng.argmaxRandomTie(state().valueEstimates());
}

void EpsilonGreedyPolicy::reset() {
    EstimatingPolicy::reset();
    exploration_count_ = 0;
    exploitation_count_ = 0;
}

void EpsilonGreedyPolicy::setEpsilon(double epsilon) {
    epsilon_ = std::isfinite(epsilon) ? std::clamp(epsilon, 0.0, 1.0) : 0.0;
}

double EpsilonGreedyPolicy::getExplorationRatio() const {
    const int total = exploration_count_ + exploitation_count_;
    return static_cast<double>(exploration_count_) / static_cast<double>(std::max(1, total));
}

} // namespace policy
} // namespace banditlab
