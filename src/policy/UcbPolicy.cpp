#include "policy/UcbPolicy.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace banditlab {
namespace policy {

UcbPolicy::UcbPolicy(int n_arms, double c)
    : EstimatingPolicy(n_arms) {
    setC(c);
}

void UcbPolicy::setC(double c) {
    c_ = std::max(kMinC, c);
}

int UcbPolicy::selectArm(RandomSource& rng) {
    const auto& counts = state().pullCounts();
    for (std::size_t arm = 0; arm < counts.size(); ++arm) {
        if (counts[arm] == 0) {
            return static_cast<int>(arm);
        }
    }
    return rng.argmaxRandomTie(getUcbValues());
}

std::vector<double> UcbPolicy::getUcbValues() const {
    const auto& counts = state().pullCounts();
    const auto& values = state().valueEstimates();
    const double log_total = std::log(static_cast<double>(std::max(1, state().totalPulls())));

    std::vector<double> ucb(counts.size(), 0.0);
    for (std::size_t arm = 0; arm < counts.size(); ++arm) {
        if (counts[arm] == 0) {
            ucb[arm] = std::numeric_limits<double>::infinity();
            continue;
        }
        const double bonus = c_ * std::sqrt(log_total / static_cast<double>(counts[arm]));
        ucb[arm] = values[arm] + bonus;
    }
    return ucb;
}

} // namespace policy
} // namespace banditlab
