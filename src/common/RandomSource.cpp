#include "common/RandomSource.h"
#include "common/Errors.h"

#include <algorithm>
#include <numeric>

namespace banditlab {

RandomSource::RandomSource(std::optional<std::uint64_t> seed) {
    if (seed) {
        reseed(*seed);
    } else {
        std::random_device rd;
        reseed((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    }
}

RandomSource RandomSource::derive(std::uint64_t seed, std::uint64_t stream_id) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(seed & 0xffffffffULL),
        static_cast<std::uint32_t>(seed >> 32),
        static_cast<std::uint32_t>(stream_id & 0xffffffffULL),
        static_cast<std::uint32_t>(stream_id >> 32)
    };
    RandomSource out(0);
    out.engine_.seed(seq);
    return out;
}

void RandomSource::reseed(std::uint64_t seed) {
    engine_.seed(seed);
}

double RandomSource::uniform() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

int RandomSource::uniformInt(int lower, int upper) {
    if (upper < lower) {
        throw InvalidParameterError("upper", "must be >= lower");
    }
    std::uniform_int_distribution<int> dist(lower, upper);
    return dist(engine_);
}

bool RandomSource::bernoulli(double p) {
    return uniform() < p;
}

double RandomSource::normal(double mean, double stddev) {
    std::normal_distribution<double> dist(mean, stddev);
    return dist(engine_);
}

double RandomSource::gamma(double shape) {
    if (!(shape > 0.0)) {
        throw InvalidParameterError("shape", "gamma shape must be > 0");
    }
    std::gamma_distribution<double> dist(shape, 1.0);
    return dist(engine_);
}

double RandomSource::beta(double alpha, double beta) {
    // Beta(a, b) = X / (X + Y) with X ~ Gamma(a), Y ~ Gamma(b).
    const double x = gamma(alpha);
    const double y = gamma(beta);
    const double sum = x + y;
    if (sum <= 0.0) {
        // Both gamma draws underflowed (tiny shapes); fall back to the mean.
        return alpha / (alpha + beta);
    }
    return x / sum;
}

int RandomSource::argmaxRandomTie(const std::vector<double>& values) {
    if (values.empty()) {
        throw InvalidParameterError("values", "argmax of an empty sequence");
    }

    const double best = *std::max_element(values.begin(), values.end());
    std::vector<int> best_indices;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i] == best) {
            best_indices.push_back(static_cast<int>(i));
        }
    }
    if (best_indices.size() == 1) {
        return best_indices.front();
    }
    const int pick = uniformInt(0, static_cast<int>(best_indices.size()) - 1);
    return best_indices[static_cast<std::size_t>(pick)];
}

std::vector<std::size_t> RandomSource::sampleWithoutReplacement(std::size_t n, std::size_t k) {
    std::vector<std::size_t> pool(n);
    std::iota(pool.begin(), pool.end(), 0);
    k = std::min(k, n);
    // Partial Fisher-Yates.
    for (std::size_t i = 0; i < k; ++i) {
        const int j = uniformInt(static_cast<int>(i), static_cast<int>(n) - 1);
        std::swap(pool[i], pool[static_cast<std::size_t>(j)]);
    }
    pool.resize(k);
    return pool;
}

std::uint64_t RandomSource::nextSeed() {
    return engine_();
}

} // namespace banditlab
