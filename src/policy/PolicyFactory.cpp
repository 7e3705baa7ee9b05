#include "policy/PolicyFactory.h"
#include "common/Logger.h"
#include "policy/EpsilonGreedyPolicy.h"
#include "policy/LinUcbPolicy.h"
#include "policy/ThompsonSamplingPolicy.h"
#include "policy/UcbPolicy.h"

#include <memory>

namespace banditlab {
namespace policy {

PolicySet PolicyFactory::createFromConfig(const Config& config, int n_arms, int context_dimension) {
    PolicySet policies;

    const auto eg = config.getEpsilonGreedyConfig();
    if (eg.enabled) {
        auto p = std::make_shared<EpsilonGreedyPolicy>(n_arms, eg.epsilon);
        LOG_INFO("Policy registered: {} (epsilon={:.3f})", p->getName(), p->getEpsilon());
        policies.emplace_back(p->getName(), p);
    }

    const auto ucb = config.getUcbConfig();
    if (ucb.enabled) {
        auto p = std::make_shared<UcbPolicy>(n_arms, ucb.c);
        LOG_INFO("Policy registered: {} (c={:.3f})", p->getName(), p->getC());
        policies.emplace_back(p->getName(), p);
    }

    const auto ts = config.getThompsonSamplingConfig();
    if (ts.enabled) {
        auto p = std::make_shared<ThompsonSamplingPolicy>(n_arms, ts.alpha_prior, ts.beta_prior);
        LOG_INFO("Policy registered: {} (prior={:.2f}/{:.2f})", p->getName(), ts.alpha_prior, ts.beta_prior);
        policies.emplace_back(p->getName(), p);
    }

    const auto lin = config.getLinUcbConfig();
    if (lin.enabled) {
        auto p = std::make_shared<LinUcbPolicy>(n_arms, context_dimension, lin.alpha, lin.regularization);
        LOG_INFO("Policy registered: {} (alpha={:.3f}, lambda={:.3f}, d={})",
                 p->getName(), p->getAlpha(), p->getRegularization(), context_dimension);
        policies.emplace_back(p->getName(), p);
    }

    if (policies.empty()) {
        LOG_WARN("No policy enabled in configuration");
    }
    return policies;
}

} // namespace policy
} // namespace banditlab
