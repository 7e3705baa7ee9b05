#include "common/Errors.h"
#include "environment/RewardEnvironment.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <numeric>
#include <set>
#include <vector>

using banditlab::Article;
using banditlab::InvalidArmError;
using banditlab::InvalidParameterError;
using banditlab::RandomSource;
using banditlab::UserContext;
using banditlab::environment::RewardEnvironment;

int main() {
    // Reproducible generation.
    {
        const auto a = RewardEnvironment::generate(10, 42);
        const auto b = RewardEnvironment::generate(10, 42);
        assert(a.armCount() == 10);
        assert(a.trueRates() == b.trueRates());
        assert(a.optimalArm() == b.optimalArm());
        assert(a.optimalRate() == b.optimalRate());
    }

    // Rates in [0.05, 0.30], sorted descending, best arm first.
    {
        const auto env = RewardEnvironment::generate(10, 42);
        const auto& rates = env.trueRates();
        for (double r : rates) {
            assert(r >= 0.05 && r <= 0.30);
        }
        assert(std::is_sorted(rates.begin(), rates.end(), std::greater<double>()));
        assert(env.optimalArm() == 0);
        assert(env.optimalRate() == rates[0]);

        const auto arms = env.getArms();
        assert(arms.size() == 10);
        for (std::size_t i = 0; i < arms.size(); ++i) {
            assert(arms[i].id == static_cast<int>(i));
            assert(!arms[i].title.empty());
            assert(!arms[i].category.empty());
            assert(arms[i].topic_features.size() == RewardEnvironment::kFeatureDimension);
            const double norm = std::sqrt(std::inner_product(
                arms[i].topic_features.begin(), arms[i].topic_features.end(),
                arms[i].topic_features.begin(), 0.0));
            assert(std::abs(norm - 1.0) < 1e-9);
        }
        assert(arms[0].category == "Politics");
        assert(arms[1].category == "Technology");
        assert(arms[8].category == "Politics");
    }

    {
        const auto env = RewardEnvironment::generate(20, 3);
        assert(env.getArm(16).title == "Article 17: Politics News");
    }

    {
        bool threw = false;
        try {
            RewardEnvironment::generate(0, 42);
        } catch (const InvalidParameterError&) {
            threw = true;
        }
        assert(threw);
    }

    // Bernoulli sampling.
    {
        const auto env = RewardEnvironment::generate(5, 42);
        RandomSource rng(1);
        double clicks = 0.0;
        const int n = 20000;
        for (int i = 0; i < n; ++i) {
            const double r = env.sample(0, rng);
            assert(r == 0.0 || r == 1.0);
            clicks += r;
        }
        assert(std::abs(clicks / n - env.trueRates()[0]) < 0.02);

        bool low = false;
        bool high = false;
        try { env.sample(-1, rng); } catch (const InvalidArmError&) { low = true; }
        try { env.sample(5, rng); } catch (const InvalidArmError& e) { high = (e.arm() == 5); }
        assert(low && high);
    }

    // Regret accounting.
    {
        const auto env = RewardEnvironment::generate(5, 42);
        const std::vector<int> optimal(100, env.optimalArm());
        const auto zero = env.regretOf(optimal);
        assert(zero.size() == 100);
        for (double r : zero) {
            assert(r == 0.0);
        }

        const auto& rates = env.trueRates();
        const int worst = static_cast<int>(std::distance(
            rates.begin(), std::min_element(rates.begin(), rates.end())));
        const auto regret = env.regretOf(std::vector<int>(100, worst));
        assert(regret.back() > 0.0);
        for (std::size_t i = 1; i < regret.size(); ++i) {
            assert(regret[i] >= regret[i - 1]);
        }

        const auto mixed = env.regretOf({0, 3, 0, 4, 1, 0});
        assert(mixed[0] == 0.0);
        for (std::size_t i = 1; i < mixed.size(); ++i) {
            assert(mixed[i] >= mixed[i - 1]);
        }

        bool threw = false;
        try { env.regretOf({0, 7}); } catch (const InvalidArmError&) { threw = true; }
        assert(threw);
    }

    // Simulated users.
    {
        const auto env = RewardEnvironment::generate(10, 42);
        RandomSource rng(17);
        const std::set<int> ages{18, 25, 35, 45, 55, 65};
        for (int i = 0; i < 50; ++i) {
            const UserContext user = env.generateContext(rng);
            assert(ages.count(user.age) == 1);
            assert(user.user_id >= 0 && user.user_id < 100000);
            assert(user.preferred_categories.size() == 3);
            assert(std::set<std::string>(user.preferred_categories.begin(),
                                         user.preferred_categories.end()).size() == 3);
            assert(user.features.size() == env.featureDimension());
            assert(user.features[0] == user.age / 100.0);
            assert(user.features[1] >= 0.0 && user.features[1] < 1.0);
            assert(user.features[4] == 0.5);
        }
    }

    // Contextual bonus table.
    {
        const auto env = RewardEnvironment::generate(8, 42);
        const auto& rates = env.trueRates();

        UserContext user;
        user.age = 40;
        user.preferred_categories = {"Politics"};
        assert(std::abs(env.effectiveRate(0, user) - (rates[0] + 0.10)) < 1e-12);  // Politics
        assert(env.effectiveRate(1, user) == rates[1]);                           // Technology

        user.age = 20;
        assert(std::abs(env.effectiveRate(1, user) - (rates[1] + 0.05)) < 1e-12);
        assert(std::abs(env.effectiveRate(3, user) - (rates[3] + 0.05)) < 1e-12);  // Entertainment
        assert(env.effectiveRate(4, user) == rates[4]);                           // Business

        user.age = 60;
        user.preferred_categories = {"Business"};
        assert(std::abs(env.effectiveRate(4, user) - (rates[4] + 0.15)) < 1e-12);
        assert(std::abs(env.effectiveRate(6, user) - (rates[6] + 0.05)) < 1e-12);  // Health

        for (int arm = 0; arm < 8; ++arm) {
            assert(env.effectiveRate(arm, user) <= RewardEnvironment::kMaxContextualCtr);
        }

        RandomSource rng(2);
        const double r = env.sampleWithContext(0, user, rng);
        assert(r == 0.0 || r == 1.0);

        bool threw = false;
        try { env.effectiveRate(8, user); } catch (const InvalidArmError&) { threw = true; }
        assert(threw);
    }

    // Boosted rate is capped at 0.95.
    {
        std::vector<Article> articles(2);
        articles[0].id = 0;
        articles[0].category = "Technology";
        articles[0].true_ctr = 0.9;
        articles[1].id = 1;
        articles[1].category = "Health";
        articles[1].true_ctr = 0.2;
        const auto env = RewardEnvironment::fromArticles(articles);
        assert(env.optimalArm() == 0);
        assert(env.optimalRate() == 0.9);

        UserContext user;
        user.age = 20;
        user.preferred_categories = {"Technology"};
        assert(env.effectiveRate(0, user) == RewardEnvironment::kMaxContextualCtr);
        assert(std::abs(env.effectiveRate(1, user) - 0.2) < 1e-12);

        RandomSource rng(8);
        double clicks = 0.0;
        const int n = 20000;
        for (int i = 0; i < n; ++i) {
            clicks += env.sampleWithContext(0, user, rng);
        }
        assert(std::abs(clicks / n - 0.95) < 0.01);
    }

    {
        std::vector<Article> bad_rate(1);
        bad_rate[0].true_ctr = 1.5;
        bool rate_threw = false;
        try { RewardEnvironment::fromArticles(bad_rate); } catch (const InvalidParameterError&) { rate_threw = true; }
        assert(rate_threw);

        std::vector<Article> bad_id(1);
        bad_id[0].id = 3;
        bool id_threw = false;
        try { RewardEnvironment::fromArticles(bad_id); } catch (const InvalidParameterError&) { id_threw = true; }
        assert(id_threw);

        bool empty_threw = false;
        try { RewardEnvironment::fromArticles({}); } catch (const InvalidParameterError&) { empty_threw = true; }
        assert(empty_threw);
    }

    std::cout << "[TEST] RewardEnvironment PASSED\n";
    return 0;
}
