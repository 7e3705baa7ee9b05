#pragma once

#include "common/Config.h"
#include "policy/IPolicy.h"

namespace banditlab {
namespace policy {

class PolicyFactory {
public:
    // Enabled policies in fixed order: epsilon_greedy, ucb, thompson_sampling, linucb.
    static PolicySet createFromConfig(const Config& config, int n_arms, int context_dimension);
};

} // namespace policy
} // namespace banditlab
