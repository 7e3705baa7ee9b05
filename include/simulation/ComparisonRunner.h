#pragma once

#include "environment/RewardEnvironment.h"
#include "policy/IPolicy.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace banditlab {
namespace simulation {

struct ComparisonRow {
    std::string policy_name;
    double mean_total_reward = 0.0;
    double std_total_reward = 0.0;
    double mean_final_regret = 0.0;
    double std_final_regret = 0.0;
    double mean_ctr = 0.0;          // mean_total_reward / n_rounds
};

// Repeats full reset + run per policy and summarises over trials.
// Trial t of every policy draws from the stream derived from (seed, t), so
// rows do not depend on policy order and policies share random numbers.
class ComparisonRunner {
public:
    explicit ComparisonRunner(std::optional<std::uint64_t> seed = std::nullopt);

    std::vector<ComparisonRow> compare(
        const policy::PolicySet& policies,
        const environment::RewardEnvironment& environment,
        int n_rounds,
        int n_trials,
        bool use_context = false
    ) const;

    std::uint64_t baseSeed() const { return base_seed_; }

private:
    std::uint64_t base_seed_;
};

} // namespace simulation
} // namespace banditlab
