#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace banditlab {

// Seedable generator handed explicitly to every stochastic operation.
class RandomSource {
public:
    explicit RandomSource(std::optional<std::uint64_t> seed = std::nullopt);

    // Independent stream for (seed, stream_id); same inputs, same stream.
    static RandomSource derive(std::uint64_t seed, std::uint64_t stream_id);

    void reseed(std::uint64_t seed);

    double uniform();                               // [0, 1)
    int uniformInt(int lower, int upper);           // [lower, upper]
    bool bernoulli(double p);
    double normal(double mean = 0.0, double stddev = 1.0);
    double beta(double alpha, double beta);
    double gamma(double shape);

    // Index of a maximum element, ties broken uniformly at random.
    int argmaxRandomTie(const std::vector<double>& values);

    // k distinct indices out of [0, n), in draw order.
    std::vector<std::size_t> sampleWithoutReplacement(std::size_t n, std::size_t k);

    std::uint64_t nextSeed();

private:
    std::mt19937_64 engine_;
};

} // namespace banditlab
