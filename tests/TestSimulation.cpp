#include "common/Errors.h"
#include "environment/RewardEnvironment.h"
#include "policy/EpsilonGreedyPolicy.h"
#include "policy/LinUcbPolicy.h"
#include "policy/ThompsonSamplingPolicy.h"
#include "policy/UcbPolicy.h"
#include "simulation/SimulationRunner.h"

#include <cassert>
#include <cmath>
#include <iostream>

using banditlab::InvalidParameterError;
using banditlab::RandomSource;
using banditlab::environment::RewardEnvironment;
using banditlab::policy::EpsilonGreedyPolicy;
using banditlab::policy::LinUcbPolicy;
using banditlab::policy::ThompsonSamplingPolicy;
using banditlab::policy::UcbPolicy;
using banditlab::simulation::SimulationResult;
using banditlab::simulation::SimulationRunner;

namespace {
void checkSeries(const SimulationResult& r, const RewardEnvironment& env, std::size_t rounds) {
    assert(r.rewards.size() == rounds);
    assert(r.arms.size() == rounds);
    assert(r.cumulative_regret.size() == rounds);
    assert(r.running_ctr.size() == rounds);

    double cumulative = 0.0;
    for (std::size_t t = 0; t < rounds; ++t) {
        assert(r.arms[t] >= 0 && r.arms[t] < static_cast<int>(env.armCount()));
        assert(r.rewards[t] == 0.0 || r.rewards[t] == 1.0);
        cumulative += r.rewards[t];
        assert(std::abs(r.running_ctr[t] - cumulative / static_cast<double>(t + 1)) < 1e-12);
        assert(r.cumulative_regret[t] >= 0.0);
        if (t > 0) {
            assert(r.cumulative_regret[t] >= r.cumulative_regret[t - 1]);
        }
    }
    assert(r.cumulative_regret == env.regretOf(r.arms));
    assert(r.totalReward() == cumulative);
}
}

int main() {
    const auto env = RewardEnvironment::generate(5, 42);
    const SimulationRunner runner;

    {
        EpsilonGreedyPolicy algo(5, 0.1);
        RandomSource rng(7);
        const auto result = runner.run(algo, env, 100, rng);
        checkSeries(result, env, 100);
        assert(algo.getMetrics().total_pulls == 100);
        assert(algo.getMetrics().total_reward == result.totalReward());
    }

    // epsilon = 0: once an arm earns a click it is the unique maximum and
    // gets every later round.
    {
        EpsilonGreedyPolicy algo(5, 0.0);
        RandomSource rng(42);
        const auto result = runner.run(algo, env, 2000, rng);
        checkSeries(result, env, 2000);

        std::size_t first_click = result.rewards.size();
        for (std::size_t t = 0; t < result.rewards.size(); ++t) {
            if (result.rewards[t] > 0.0) {
                first_click = t;
                break;
            }
        }
        assert(first_click < result.rewards.size());
        for (std::size_t t = first_click; t < result.arms.size(); ++t) {
            assert(result.arms[t] == result.arms[first_click]);
        }
    }

    {
        UcbPolicy algo(5, 2.0);
        RandomSource rng(1);
        const auto result = runner.run(algo, env, 300, rng);
        checkSeries(result, env, 300);
        for (int t = 0; t < 5; ++t) {
            assert(result.arms[static_cast<std::size_t>(t)] == t);
        }
    }

    // Same seed, fresh policy: identical run.
    {
        ThompsonSamplingPolicy a(5);
        ThompsonSamplingPolicy b(5);
        RandomSource rng_a(99);
        RandomSource rng_b(99);
        const auto ra = runner.run(a, env, 200, rng_a);
        const auto rb = runner.run(b, env, 200, rng_b);
        assert(ra.arms == rb.arms);
        assert(ra.rewards == rb.rewards);
    }

    // Contextual policy runs in contextual mode even without the flag.
    {
        LinUcbPolicy algo(5, static_cast<int>(env.featureDimension()));
        RandomSource rng(5);
        const auto result = runner.run(algo, env, 150, rng);
        checkSeries(result, env, 150);
        assert(algo.getMetrics().total_pulls == 150);

        RandomSource rng2(6);
        const auto with_flag = runner.run(algo, env, 50, rng2, true);
        checkSeries(with_flag, env, 50);
        assert(algo.getMetrics().total_pulls == 200);
    }

    // Context-free policy with context-aware rewards.
    {
        EpsilonGreedyPolicy algo(5, 0.2);
        RandomSource rng(12);
        const auto result = runner.run(algo, env, 100, rng, true);
        checkSeries(result, env, 100);
    }

    {
        EpsilonGreedyPolicy algo(5, 0.1);
        RandomSource rng(1);
        bool rounds_threw = false;
        try { runner.run(algo, env, 0, rng); } catch (const InvalidParameterError&) { rounds_threw = true; }
        assert(rounds_threw);

        EpsilonGreedyPolicy wrong_arms(4, 0.1);
        bool arms_threw = false;
        try { runner.run(wrong_arms, env, 10, rng); } catch (const InvalidParameterError&) { arms_threw = true; }
        assert(arms_threw);

        LinUcbPolicy wrong_dim(5, 3);
        bool dim_threw = false;
        try { runner.run(wrong_dim, env, 10, rng); } catch (const InvalidParameterError&) { dim_threw = true; }
        assert(dim_threw);
        assert(algo.getMetrics().total_pulls == 0);
    }

    std::cout << "[TEST] Simulation PASSED\n";
    return 0;
}
