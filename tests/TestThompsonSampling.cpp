#include "common/Errors.h"
#include "policy/ThompsonSamplingPolicy.h"

#include <cassert>
#include <cmath>
#include <iostream>

using banditlab::InvalidArmError;
using banditlab::InvalidParameterError;
using banditlab::RandomSource;
using banditlab::policy::ThompsonSamplingPolicy;

namespace {
bool throwsInvalidParameter(const ThompsonSamplingPolicy& algo, double confidence) {
    try {
        algo.getConfidenceIntervals(confidence);
    } catch (const InvalidParameterError&) {
        return true;
    }
    return false;
}
}

int main() {
    {
        ThompsonSamplingPolicy algo(5);
        const auto params = algo.getDistributionParameters();
        assert(params.success_count.size() == 5);
        assert(params.failure_count.size() == 5);
        for (std::size_t i = 0; i < 5; ++i) {
            assert(params.success_count[i] == 1.0);
            assert(params.failure_count[i] == 1.0);
        }
    }

    // k successes and m failures -> (k + 1, m + 1).
    {
        ThompsonSamplingPolicy algo(3);
        algo.update(0, 1.0);
        auto params = algo.getDistributionParameters();
        assert(params.success_count[0] == 2.0);
        assert(params.failure_count[0] == 1.0);

        algo.update(0, 0.0);
        algo.update(0, 1.0);
        algo.update(0, 1.0);
        algo.update(0, 0.0);
        params = algo.getDistributionParameters();
        assert(params.success_count[0] == 4.0);
        assert(params.failure_count[0] == 3.0);

        const auto m = algo.getMetrics();
        assert(params.success_count[0] + params.failure_count[0] == m.pull_count[0] + 2);
        assert(std::abs(m.value_estimate[0] - 0.6) < 1e-12);
        assert(std::abs(algo.getPosteriorMeans()[0] - 4.0 / 7.0) < 1e-12);
    }

    {
        ThompsonSamplingPolicy algo(3);
        algo.update(1, 1.0);
        bool threw = false;
        try {
            algo.update(-1, 1.0);
        } catch (const InvalidArmError&) {
            threw = true;
        }
        assert(threw);
        const auto params = algo.getDistributionParameters();
        assert(params.success_count[1] == 2.0);
        assert(algo.getMetrics().total_pulls == 1);
    }

    {
        ThompsonSamplingPolicy algo(5);
        RandomSource rng(1);
        for (int i = 0; i < 100; ++i) {
            const int arm = algo.selectArm(rng);
            assert(arm >= 0 && arm < 5);
        }
    }

    // Strong posterior dominates selection.
    {
        ThompsonSamplingPolicy algo(3);
        for (int i = 0; i < 50; ++i) {
            algo.update(0, 1.0);
            algo.update(1, 0.0);
            algo.update(2, 0.0);
        }
        RandomSource rng(9);
        int best = 0;
        for (int i = 0; i < 100; ++i) {
            if (algo.selectArm(rng) == 0) {
                best++;
            }
        }
        assert(best >= 95);
    }

    {
        ThompsonSamplingPolicy algo(3);
        for (int i = 0; i < 10; ++i) {
            algo.update(0, 1.0);
        }
        for (int i = 0; i < 10; ++i) {
            algo.update(1, 0.0);
        }

        const auto ci = algo.getConfidenceIntervals();
        assert(ci.lower[0] > ci.lower[1]);
        assert(ci.upper[0] > ci.upper[1]);

        for (double confidence : {0.01, 0.5, 0.9, 0.95, 0.99}) {
            const auto bounds = algo.getConfidenceIntervals(confidence);
            for (std::size_t arm = 0; arm < 3; ++arm) {
                assert(0.0 <= bounds.lower[arm]);
                assert(bounds.lower[arm] <= bounds.upper[arm]);
                assert(bounds.upper[arm] <= 1.0);
            }
        }

        // Uniform prior arm: symmetric 95% interval.
        assert(std::abs(ci.lower[2] - 0.025) < 1e-9);
        assert(std::abs(ci.upper[2] - 0.975) < 1e-9);

        assert(throwsInvalidParameter(algo, 0.0));
        assert(throwsInvalidParameter(algo, 1.0));
        assert(throwsInvalidParameter(algo, 1.5));
        assert(throwsInvalidParameter(algo, -0.1));
    }

    // Custom priors survive reset.
    {
        ThompsonSamplingPolicy algo(2, 2.0, 3.0);
        algo.update(0, 1.0);
        algo.update(1, 0.0);
        algo.reset();
        const auto params = algo.getDistributionParameters();
        assert(params.success_count[0] == 2.0 && params.success_count[1] == 2.0);
        assert(params.failure_count[0] == 3.0 && params.failure_count[1] == 3.0);
        assert(algo.getMetrics().total_pulls == 0);
    }

    {
        bool alpha_threw = false;
        bool beta_threw = false;
        try { ThompsonSamplingPolicy bad(3, 0.0, 1.0); } catch (const InvalidParameterError&) { alpha_threw = true; }
        try { ThompsonSamplingPolicy bad(3, 1.0, -2.0); } catch (const InvalidParameterError&) { beta_threw = true; }
        assert(alpha_threw && beta_threw);
    }

    std::cout << "[TEST] ThompsonSampling PASSED\n";
    return 0;
}
