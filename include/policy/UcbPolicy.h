#pragma once

#include "policy/PolicyState.h"

#include <vector>

namespace banditlab {
namespace policy {

// UCB1: every arm once in index order, then
// argmax(value + c * sqrt(ln(total_pulls) / pulls)).
class UcbPolicy : public EstimatingPolicy {
public:
    static constexpr double kMinC = 0.1;

    explicit UcbPolicy(int n_arms, double c = 2.0);

    std::string getName() const override { return "ucb"; }
    int selectArm(RandomSource& rng) override;

    double getC() const { return c_; }
    void setC(double c);    // clamped to >= kMinC

    // +infinity for arms that have never been pulled.
    std::vector<double> getUcbValues() const;

private:
    double c_ = 2.0;
};

} // namespace policy
} // namespace banditlab
