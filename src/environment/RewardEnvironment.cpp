#include "environment/RewardEnvironment.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <numeric>
#include <string>

namespace banditlab {
namespace environment {

namespace {
const std::array<const char*, 8> kCategories = {
    "Politics", "Technology", "Sports", "Entertainment",
    "Business", "Science", "Health", "World"
};

const std::array<const char*, 15> kTitles = {
    "Breaking: Major Policy Changes Announced",
    "Tech Giant Unveils Revolutionary AI System",
    "Championship Game Ends in Dramatic Fashion",
    "Celebrity Interview: Exclusive Insights",
    "Market Analysis: What Investors Need to Know",
    "Scientific Breakthrough in Climate Research",
    "Health Tips: Expert Recommendations",
    "Global Summit Addresses Critical Issues",
    "Innovation in Renewable Energy Sector",
    "Sports Star Makes Historic Achievement",
    "Entertainment Industry Trends 2025",
    "Economic Forecast for Next Quarter",
    "Medical Advances in Treatment Options",
    "International Relations Update",
    "Startup Success Story Inspires Many"
};

const std::array<int, 6> kAges = {18, 25, 35, 45, 55, 65};
const std::array<const char*, 5> kLocations = {"US-East", "US-West", "Europe", "Asia", "Other"};

constexpr int kMaxPreferredCategories = 3;
constexpr int kUserIdSpace = 100000;

FeatureVector randomUnitVector(RandomSource& rng, std::size_t dim) {
    FeatureVector v(dim, 0.0);
    double norm = 0.0;
    while (norm == 0.0) {
        for (auto& x : v) {
            x = rng.normal();
        }
        norm = std::sqrt(std::inner_product(v.begin(), v.end(), v.begin(), 0.0));
    }
    for (auto& x : v) {
        x /= norm;
    }
    return v;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}
}

RewardEnvironment RewardEnvironment::generate(int n_arms, std::optional<std::uint64_t> seed) {
    if (n_arms <= 0) {
        throw InvalidParameterError("n_arms", "must be > 0");
    }

    RandomSource rng(seed);

    std::vector<double> ctrs(static_cast<std::size_t>(n_arms));
    for (auto& ctr : ctrs) {
        ctr = kMinCtr + rng.beta(2.0, 5.0) * kCtrSpan;
    }
    std::sort(ctrs.begin(), ctrs.end(), std::greater<double>());

    std::vector<Article> articles;
    articles.reserve(ctrs.size());
    for (int i = 0; i < n_arms; ++i) {
        Article a;
        a.id = i;
        a.category = kCategories[static_cast<std::size_t>(i) % kCategories.size()];
        if (static_cast<std::size_t>(i) < kTitles.size()) {
            a.title = kTitles[static_cast<std::size_t>(i)];
        } else {
            a.title = "Article " + std::to_string(i + 1) + ": " + a.category + " News";
        }
        a.true_ctr = ctrs[static_cast<std::size_t>(i)];
        a.topic_features = randomUnitVector(rng, kFeatureDimension);
        articles.push_back(std::move(a));
    }

    RewardEnvironment env(std::move(articles));
    LOG_DEBUG("Environment generated: {} arms, optimal arm {} (ctr {:.4f})",
              env.armCount(), env.optimalArm(), env.optimalRate());
    return env;
}

RewardEnvironment RewardEnvironment::fromArticles(std::vector<Article> articles) {
    if (articles.empty()) {
        throw InvalidParameterError("articles", "must not be empty");
    }
    for (std::size_t i = 0; i < articles.size(); ++i) {
        const Article& a = articles[i];
        if (a.id != static_cast<int>(i)) {
            throw InvalidParameterError("articles", "article " + std::to_string(i) + " has id " + std::to_string(a.id));
        }
        if (!(a.true_ctr >= 0.0 && a.true_ctr <= 1.0)) {
            throw InvalidParameterError("true_ctr", "article " + std::to_string(i) + " rate outside [0, 1]");
        }
        if (!a.topic_features.empty() && a.topic_features.size() != kFeatureDimension) {
            throw InvalidParameterError("topic_features", "article " + std::to_string(i) + " has wrong dimension");
        }
    }
    return RewardEnvironment(std::move(articles));
}

RewardEnvironment::RewardEnvironment(std::vector<Article> articles)
    : articles_(std::move(articles)) {
    true_rates_.reserve(articles_.size());
    for (const auto& a : articles_) {
        true_rates_.push_back(a.true_ctr);
        if (!contains(categories_, a.category)) {
            categories_.push_back(a.category);
        }
    }
    const auto best = std::max_element(true_rates_.begin(), true_rates_.end());
    optimal_arm_ = static_cast<int>(std::distance(true_rates_.begin(), best));
    optimal_rate_ = *best;
}

const Article& RewardEnvironment::getArm(int arm) const {
    checkArm(arm, articles_.size());
    return articles_[static_cast<std::size_t>(arm)];
}

double RewardEnvironment::sample(int arm, RandomSource& rng) const {
    checkArm(arm, articles_.size());
    return rng.bernoulli(true_rates_[static_cast<std::size_t>(arm)]) ? 1.0 : 0.0;
}

UserContext RewardEnvironment::generateContext(RandomSource& rng) const {
    UserContext user;
    user.user_id = rng.uniformInt(0, kUserIdSpace - 1);

    const int age_index = rng.uniformInt(0, static_cast<int>(kAges.size()) - 1);
    const int location_index = rng.uniformInt(0, static_cast<int>(kLocations.size()) - 1);
    user.age = kAges[static_cast<std::size_t>(age_index)];
    user.location = kLocations[static_cast<std::size_t>(location_index)];

    const auto picks = rng.sampleWithoutReplacement(
        categories_.size(), static_cast<std::size_t>(kMaxPreferredCategories));
    for (auto idx : picks) {
        user.preferred_categories.push_back(categories_[idx]);
    }

    user.features = {
        static_cast<double>(user.age) / 100.0,
        static_cast<double>(location_index) / static_cast<double>(kLocations.size()),
        0.5, 0.5, 0.5
    };
    return user;
}

double RewardEnvironment::effectiveRate(int arm, const UserContext& context) const {
    const Article& article = getArm(arm);

    double boost = contains(context.preferred_categories, article.category)
        ? kPreferredCategoryBonus : 0.0;

    if (context.age < 35 &&
        (article.category == "Technology" || article.category == "Entertainment")) {
        boost += kAgeCategoryBonus;
    } else if (context.age >= 55 &&
               (article.category == "Health" || article.category == "Business")) {
        boost += kAgeCategoryBonus;
    }

    return std::min(kMaxContextualCtr, article.true_ctr + boost);
}

double RewardEnvironment::sampleWithContext(int arm, const UserContext& context, RandomSource& rng) const {
    return rng.bernoulli(effectiveRate(arm, context)) ? 1.0 : 0.0;
}

std::vector<double> RewardEnvironment::regretOf(const std::vector<int>& arm_sequence) const {
    std::vector<double> regret;
    regret.reserve(arm_sequence.size());
    double cumulative = 0.0;
    for (int arm : arm_sequence) {
        checkArm(arm, articles_.size());
        cumulative += optimal_rate_ - true_rates_[static_cast<std::size_t>(arm)];
        regret.push_back(cumulative);
    }
    return regret;
}

} // namespace environment
} // namespace banditlab
