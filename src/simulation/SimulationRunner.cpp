#include "simulation/SimulationRunner.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/Statistics.h"

#include <string>

namespace banditlab {
namespace simulation {

namespace {
void validateRun(const policy::IPolicy& policy,
                 const environment::RewardEnvironment& environment,
                 int n_rounds) {
    if (n_rounds <= 0) {
        throw InvalidParameterError("n_rounds", "must be > 0");
    }
    if (policy.armCount() != environment.armCount()) {
        throw InvalidParameterError(
            "policy",
            policy.getName() + " has " + std::to_string(policy.armCount()) +
            " arms, environment has " + std::to_string(environment.armCount()));
    }
    if (policy.requiresContext() && policy.contextDimension() != environment.featureDimension()) {
        throw InvalidParameterError(
            "context_dimension",
            policy.getName() + " expects " + std::to_string(policy.contextDimension()) +
            " features, environment provides " + std::to_string(environment.featureDimension()));
    }
}
}

double SimulationResult::totalReward() const {
    return utils::Statistics::sum(rewards);
}

SimulationResult SimulationRunner::run(
    policy::IPolicy& policy,
    const environment::RewardEnvironment& environment,
    int n_rounds,
    RandomSource& rng,
    bool use_context
) const {
    validateRun(policy, environment, n_rounds);

    const bool contextual_policy = policy.requiresContext();
    const bool contextual_mode = use_context || contextual_policy;

    SimulationResult result;
    const auto n = static_cast<std::size_t>(n_rounds);
    result.rewards.reserve(n);
    result.arms.reserve(n);
    result.running_ctr.reserve(n);

    double cumulative_reward = 0.0;
    for (int t = 0; t < n_rounds; ++t) {
        int arm = 0;
        double reward = 0.0;

        if (contextual_mode) {
            const UserContext user = environment.generateContext(rng);
            arm = contextual_policy
                ? policy.selectArmWithContext(user.features, rng)
                : policy.selectArm(rng);
            reward = environment.sampleWithContext(arm, user, rng);
            if (contextual_policy) {
                policy.updateWithContext(arm, user.features, reward);
            } else {
                policy.update(arm, reward);
            }
        } else {
            arm = policy.selectArm(rng);
            reward = environment.sample(arm, rng);
            policy.update(arm, reward);
        }

        cumulative_reward += reward;
        result.rewards.push_back(reward);
        result.arms.push_back(arm);
        result.running_ctr.push_back(cumulative_reward / static_cast<double>(t + 1));
    }

    // Regret comes from the recorded arms against the fixed ground truth.
    result.cumulative_regret = environment.regretOf(result.arms);

    LOG_DEBUG("Run finished: policy={}, rounds={}, reward={:.0f}, regret={:.3f}, contextual={}",
              policy.getName(), n_rounds, cumulative_reward, result.finalRegret(), contextual_mode);
    return result;
}

} // namespace simulation
} // namespace banditlab
