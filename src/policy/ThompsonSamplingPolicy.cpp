#include "policy/ThompsonSamplingPolicy.h"
#include "common/Errors.h"

#include <boost/math/distributions/beta.hpp>

#include <algorithm>

namespace banditlab {
namespace policy {

ThompsonSamplingPolicy::ThompsonSamplingPolicy(int n_arms, double alpha_prior, double beta_prior)
    : EstimatingPolicy(n_arms)
    , alpha_prior_(alpha_prior)
    , beta_prior_(beta_prior) {
    if (!(alpha_prior > 0.0)) {
        throw InvalidParameterError("alpha_prior", "must be > 0");
    }
    if (!(beta_prior > 0.0)) {
        throw InvalidParameterError("beta_prior", "must be > 0");
    }
    success_count_.assign(armCount(), alpha_prior_);
    failure_count_.assign(armCount(), beta_prior_);
}

int ThompsonSamplingPolicy::selectArm(RandomSource& rng) {
    std::vector<double> samples(armCount(), 0.0);
    for (std::size_t arm = 0; arm < samples.size(); ++arm) {
        samples[arm] = rng.beta(success_count_[arm], failure_count_[arm]);
    }
    return rng.argmaxRandomTie(samples);
}

void ThompsonSamplingPolicy::update(int arm, double reward) {
    // Validates the arm before any posterior change.
    EstimatingPolicy::update(arm, reward);

    const auto idx = static_cast<std::size_t>(arm);
    if (reward > 0.0) {
        success_count_[idx] += 1.0;
    } else {
        failure_count_[idx] += 1.0;
    }
}

void ThompsonSamplingPolicy::reset() {
    EstimatingPolicy::reset();
    std::fill(success_count_.begin(), success_count_.end(), alpha_prior_);
    std::fill(failure_count_.begin(), failure_count_.end(), beta_prior_);
}

BetaParameters ThompsonSamplingPolicy::getDistributionParameters() const {
    return BetaParameters{success_count_, failure_count_};
}

std::vector<double> ThompsonSamplingPolicy::getPosteriorMeans() const {
    std::vector<double> means(armCount(), 0.0);
    for (std::size_t arm = 0; arm < means.size(); ++arm) {
        means[arm] = success_count_[arm] / (success_count_[arm] + failure_count_[arm]);
    }
    return means;
}

ConfidenceIntervals ThompsonSamplingPolicy::getConfidenceIntervals(double confidence) const {
    if (!(confidence > 0.0 && confidence < 1.0)) {
        throw InvalidParameterError("confidence", "must lie in (0, 1)");
    }

    const double tail = (1.0 - confidence) / 2.0;
    ConfidenceIntervals out;
    out.lower.resize(armCount());
    out.upper.resize(armCount());

    for (std::size_t arm = 0; arm < armCount(); ++arm) {
        const boost::math::beta_distribution<double> posterior(success_count_[arm], failure_count_[arm]);
        out.lower[arm] = std::clamp(boost::math::quantile(posterior, tail), 0.0, 1.0);
        out.upper[arm] = std::clamp(boost::math::quantile(posterior, 1.0 - tail), 0.0, 1.0);
    }
    return out;
}

} // namespace policy
} // namespace banditlab
