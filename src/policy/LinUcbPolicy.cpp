#include "policy/LinUcbPolicy.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace banditlab {
namespace policy {

namespace {
std::size_t checkedArms(int n_arms) {
    if (n_arms <= 0) {
        throw InvalidParameterError("n_arms", "must be > 0");
    }
    return static_cast<std::size_t>(n_arms);
}

std::size_t checkedDimension(int context_dimension) {
    if (context_dimension <= 0) {
        throw InvalidParameterError("context_dimension", "must be > 0");
    }
    return static_cast<std::size_t>(context_dimension);
}
}

LinUcbPolicy::LinUcbPolicy(int n_arms, int context_dimension, double alpha, double regularization)
    : dimension_(checkedDimension(context_dimension))
    , alpha_(alpha)
    , regularization_(regularization)
    , bookkeeping_(checkedArms(n_arms)) {
    if (!(regularization > 0.0)) {
        throw InvalidParameterError("regularization", "must be > 0");
    }
    if (!(alpha >= 0.0)) {
        throw InvalidParameterError("alpha", "must be >= 0");
    }
    reset();
}

Eigen::Map<const Eigen::VectorXd> LinUcbPolicy::asVector(const FeatureVector& context) const {
    if (context.size() != dimension_) {
        throw InvalidParameterError(
            "context",
            "expected " + std::to_string(dimension_) + " features, got " + std::to_string(context.size()));
    }
    return Eigen::Map<const Eigen::VectorXd>(context.data(), static_cast<Eigen::Index>(context.size()));
}

Eigen::VectorXd LinUcbPolicy::solveOrZero(const Eigen::MatrixXd& design, const Eigen::VectorXd& response) {
    const Eigen::FullPivLU<Eigen::MatrixXd> lu(design);
    if (!lu.isInvertible()) {
        return Eigen::VectorXd::Zero(response.size());
    }
    return lu.solve(response);
}

int LinUcbPolicy::selectArm(RandomSource& rng) {
    (void)rng;
    throw InvalidParameterError("context", "linucb requires a context vector");
}

void LinUcbPolicy::update(int arm, double reward) {
    (void)arm;
    (void)reward;
    throw InvalidParameterError("context", "linucb requires a context vector");
}

int LinUcbPolicy::selectArmWithContext(const FeatureVector& context, RandomSource& rng) {
    return selectArm(context, rng, true);
}

int LinUcbPolicy::selectArm(const FeatureVector& context, RandomSource& rng, bool use_exploration_bonus) {
    return rng.argmaxRandomTie(getScores(context, use_exploration_bonus));
}

std::vector<double> LinUcbPolicy::getScores(const FeatureVector& context, bool use_exploration_bonus) const {
    const auto x = asVector(context);
    std::vector<double> scores(armCount(), 0.0);

    for (std::size_t arm = 0; arm < scores.size(); ++arm) {
        const Eigen::FullPivLU<Eigen::MatrixXd> lu(design_[arm]);
        if (!lu.isInvertible()) {
            // theta = 0 and no bonus; the round still completes.
            LOG_WARN("LinUCB design matrix for arm {} is singular, using zero coefficients", arm);
            scores[arm] = 0.0;
            continue;
        }

        const Eigen::VectorXd theta = lu.solve(response_[arm]);
        double score = theta.dot(x);
        if (use_exploration_bonus) {
            const Eigen::VectorXd a_inv_x = lu.solve(Eigen::VectorXd(x));
            score += alpha_ * std::sqrt(std::max(0.0, x.dot(a_inv_x)));
        }
        scores[arm] = score;
    }
    return scores;
}

void LinUcbPolicy::updateWithContext(int arm, const FeatureVector& context, double reward) {
    checkArm(arm, armCount());
    const auto x = asVector(context);
    const auto idx = static_cast<std::size_t>(arm);

    design_[idx].noalias() += x * x.transpose();
    response_[idx] += reward * x;
    bookkeeping_.record(arm, reward);
}

void LinUcbPolicy::reset() {
    const auto d = static_cast<Eigen::Index>(dimension_);
    const Eigen::MatrixXd initial_design = Eigen::MatrixXd::Identity(d, d) * regularization_;
    const Eigen::VectorXd initial_response = Eigen::VectorXd::Zero(d);
    design_.assign(armCount(), initial_design);
    response_.assign(armCount(), initial_response);
    bookkeeping_.reset();
}

PolicyMetrics LinUcbPolicy::getMetrics() const {
    return bookkeeping_.toMetrics();
}

Eigen::VectorXd LinUcbPolicy::getCoefficients(int arm) const {
    checkArm(arm, armCount());
    const auto idx = static_cast<std::size_t>(arm);
    return solveOrZero(design_[idx], response_[idx]);
}

Eigen::MatrixXd LinUcbPolicy::getDesignMatrix(int arm) const {
    checkArm(arm, armCount());
    return design_[static_cast<std::size_t>(arm)];
}

Eigen::VectorXd LinUcbPolicy::getResponseVector(int arm) const {
    checkArm(arm, armCount());
    return response_[static_cast<std::size_t>(arm)];
}

} // namespace policy
} // namespace banditlab
