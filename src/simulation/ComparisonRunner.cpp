#include "simulation/ComparisonRunner.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/RandomSource.h"
#include "common/Statistics.h"
#include "simulation/SimulationRunner.h"

#include <set>

namespace banditlab {
namespace simulation {

ComparisonRunner::ComparisonRunner(std::optional<std::uint64_t> seed)
    : base_seed_(seed ? *seed : RandomSource().nextSeed()) {}

std::vector<ComparisonRow> ComparisonRunner::compare(
    const policy::PolicySet& policies,
    const environment::RewardEnvironment& environment,
    int n_rounds,
    int n_trials,
    bool use_context
) const {
    if (n_rounds <= 0) {
        throw InvalidParameterError("n_rounds", "must be > 0");
    }
    if (n_trials <= 0) {
        throw InvalidParameterError("n_trials", "must be > 0");
    }

    std::set<std::string> seen;
    for (const auto& [name, policy] : policies) {
        if (!policy) {
            throw InvalidParameterError("policies", "null policy '" + name + "'");
        }
        if (!seen.insert(name).second) {
            throw InvalidParameterError("policies", "duplicate policy name '" + name + "'");
        }
    }

    const SimulationRunner runner;
    std::vector<ComparisonRow> rows;
    rows.reserve(policies.size());

    for (const auto& [name, policy] : policies) {
        std::vector<double> total_rewards;
        std::vector<double> final_regrets;
        total_rewards.reserve(static_cast<std::size_t>(n_trials));
        final_regrets.reserve(static_cast<std::size_t>(n_trials));

        for (int trial = 0; trial < n_trials; ++trial) {
            policy->reset();
            RandomSource rng = RandomSource::derive(base_seed_, static_cast<std::uint64_t>(trial));
            const SimulationResult result = runner.run(*policy, environment, n_rounds, rng, use_context);

            total_rewards.push_back(result.totalReward());
            final_regrets.push_back(result.finalRegret());
            Logger::getInstance().logTrial(name, trial, total_rewards.back(), final_regrets.back());
        }

        ComparisonRow row;
        row.policy_name = name;
        row.mean_total_reward = utils::Statistics::mean(total_rewards);
        row.std_total_reward = utils::Statistics::stddev(total_rewards);
        row.mean_final_regret = utils::Statistics::mean(final_regrets);
        row.std_final_regret = utils::Statistics::stddev(final_regrets);
        row.mean_ctr = row.mean_total_reward / static_cast<double>(n_rounds);

        LOG_DEBUG("Comparison row: {} reward={:.2f}+-{:.2f} regret={:.3f}+-{:.3f} ctr={:.4f}",
                  name, row.mean_total_reward, row.std_total_reward,
                  row.mean_final_regret, row.std_final_regret, row.mean_ctr);
        rows.push_back(row);
    }

    return rows;
}

} // namespace simulation
} // namespace banditlab
