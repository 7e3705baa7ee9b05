#pragma once

#include "common/RandomSource.h"
#include "environment/RewardEnvironment.h"
#include "policy/IPolicy.h"

#include <cstddef>
#include <vector>

namespace banditlab {
namespace simulation {

// All four series have one entry per round.
struct SimulationResult {
    std::vector<double> rewards;
    std::vector<int> arms;
    std::vector<double> cumulative_regret;
    std::vector<double> running_ctr;

    std::size_t rounds() const { return arms.size(); }
    double totalReward() const;
    double finalRegret() const { return cumulative_regret.empty() ? 0.0 : cumulative_regret.back(); }
    double finalCtr() const { return running_ctr.empty() ? 0.0 : running_ctr.back(); }
};

class SimulationRunner {
public:
    // Drives one policy for n_rounds. Contextual policies always run in
    // contextual mode; context-free ones do when use_context is set (the
    // reward then uses the context-aware rate, selection stays context-free).
    SimulationResult run(
        policy::IPolicy& policy,
        const environment::RewardEnvironment& environment,
        int n_rounds,
        RandomSource& rng,
        bool use_context = false
    ) const;
};

} // namespace simulation
} // namespace banditlab
