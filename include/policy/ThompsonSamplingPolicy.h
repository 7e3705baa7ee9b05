#pragma once

#include "policy/PolicyState.h"

#include <vector>

namespace banditlab {
namespace policy {

struct ConfidenceIntervals {
    std::vector<double> lower;
    std::vector<double> upper;
};

struct BetaParameters {
    std::vector<double> success_count;   // alpha, prior included
    std::vector<double> failure_count;   // beta, prior included
};

// Beta-Bernoulli Thompson sampling. The empirical mean from PolicyState is
// kept alongside the posterior for reporting.
class ThompsonSamplingPolicy : public EstimatingPolicy {
public:
    explicit ThompsonSamplingPolicy(int n_arms, double alpha_prior = 1.0, double beta_prior = 1.0);

    std::string getName() const override { return "thompson_sampling"; }
    int selectArm(RandomSource& rng) override;
    void update(int arm, double reward) override;
    void reset() override;

    BetaParameters getDistributionParameters() const;
    std::vector<double> getPosteriorMeans() const;

    // Equal-tailed credible interval per arm; confidence must lie in (0, 1).
    ConfidenceIntervals getConfidenceIntervals(double confidence = 0.95) const;

private:
    double alpha_prior_;
    double beta_prior_;
    std::vector<double> success_count_;
    std::vector<double> failure_count_;
};

} // namespace policy
} // namespace banditlab
