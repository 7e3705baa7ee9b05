#pragma once

#include "policy/IPolicy.h"
#include "policy/PolicyState.h"

#include <Eigen/Dense>

#include <vector>

namespace banditlab {
namespace policy {

// Disjoint LinUCB. Per arm: A = lambda * I + sum x x^T, b = sum r x,
// theta = A^-1 b, score = theta . x + alpha * sqrt(x^T A^-1 x).
// Each selection costs O(arms * d^3).
class LinUcbPolicy : public IPolicy {
public:
    LinUcbPolicy(int n_arms, int context_dimension, double alpha = 1.0, double regularization = 1.0);

    std::string getName() const override { return "linucb"; }
    std::size_t armCount() const override { return bookkeeping_.armCount(); }
    bool requiresContext() const override { return true; }
    std::size_t contextDimension() const override { return dimension_; }

    // A context is mandatory; these throw InvalidParameterError.
    int selectArm(RandomSource& rng) override;
    void update(int arm, double reward) override;

    int selectArmWithContext(const FeatureVector& context, RandomSource& rng) override;
    int selectArm(const FeatureVector& context, RandomSource& rng, bool use_exploration_bonus);
    void updateWithContext(int arm, const FeatureVector& context, double reward) override;

    void reset() override;
    PolicyMetrics getMetrics() const override;

    std::vector<double> getScores(const FeatureVector& context, bool use_exploration_bonus = true) const;
    Eigen::VectorXd getCoefficients(int arm) const;
    Eigen::MatrixXd getDesignMatrix(int arm) const;
    Eigen::VectorXd getResponseVector(int arm) const;

    double getAlpha() const { return alpha_; }
    double getRegularization() const { return regularization_; }

    // theta = A^-1 b, or the zero vector when A is not invertible.
    static Eigen::VectorXd solveOrZero(const Eigen::MatrixXd& design, const Eigen::VectorXd& response);

private:
    Eigen::Map<const Eigen::VectorXd> asVector(const FeatureVector& context) const;

    std::size_t dimension_;
    double alpha_;
    double regularization_;
    std::vector<Eigen::MatrixXd> design_;
    std::vector<Eigen::VectorXd> response_;
    PolicyState bookkeeping_;
};

} // namespace policy
} // namespace banditlab
