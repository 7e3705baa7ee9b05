#pragma once

#include "common/RandomSource.h"
#include "common/Types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace banditlab {
namespace environment {

// Synthetic news-recommendation ground truth. Built once, read-only afterwards;
// every draw takes the caller's RandomSource.
class RewardEnvironment {
public:
    static constexpr std::size_t kFeatureDimension = 5;
    static constexpr double kMinCtr = 0.05;
    static constexpr double kCtrSpan = 0.25;
    static constexpr double kMaxContextualCtr = 0.95;
    static constexpr double kPreferredCategoryBonus = 0.10;
    static constexpr double kAgeCategoryBonus = 0.05;

    // Rates ~ Beta(2, 5) rescaled into [0.05, 0.30], sorted descending.
    static RewardEnvironment generate(int n_arms, std::optional<std::uint64_t> seed = std::nullopt);

    // Fixed article table. ids must equal the arm index, rates lie in [0, 1],
    // and features are empty or kFeatureDimension long.
    static RewardEnvironment fromArticles(std::vector<Article> articles);

    std::size_t armCount() const { return articles_.size(); }
    std::size_t featureDimension() const { return kFeatureDimension; }
    int optimalArm() const { return optimal_arm_; }
    double optimalRate() const { return optimal_rate_; }
    const std::vector<double>& trueRates() const { return true_rates_; }
    std::vector<Article> getArms() const { return articles_; }
    const Article& getArm(int arm) const;

    // Bernoulli(trueRate[arm]) -> 1.0 / 0.0
    double sample(int arm, RandomSource& rng) const;

    UserContext generateContext(RandomSource& rng) const;
    double effectiveRate(int arm, const UserContext& context) const;
    double sampleWithContext(int arm, const UserContext& context, RandomSource& rng) const;

    // regret[t] = sum_{i<=t} (optimalRate - trueRate[arms[i]])
    std::vector<double> regretOf(const std::vector<int>& arm_sequence) const;

private:
    explicit RewardEnvironment(std::vector<Article> articles);

    std::vector<Article> articles_;
    std::vector<double> true_rates_;
    std::vector<std::string> categories_;   // distinct, in first-seen order
    int optimal_arm_ = 0;
    double optimal_rate_ = 0.0;
};

} // namespace environment
} // namespace banditlab
