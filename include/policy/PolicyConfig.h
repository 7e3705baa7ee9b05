#pragma once

namespace banditlab {
namespace policy {

struct EpsilonGreedyConfig {
    bool enabled = true;
    double epsilon = 0.1;       // clamped into [0, 1]
};

struct UcbConfig {
    bool enabled = true;
    double c = 2.0;             // clamped to >= 0.1
};

struct ThompsonSamplingConfig {
    bool enabled = true;
    double alpha_prior = 1.0;
    double beta_prior = 1.0;
};

struct LinUcbConfig {
    bool enabled = true;
    double alpha = 1.0;             // exploration bonus weight
    double regularization = 1.0;    // lambda in A = lambda * I
};

} // namespace policy
} // namespace banditlab
