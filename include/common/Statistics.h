#pragma once

#include <vector>

namespace banditlab {
namespace utils {

class Statistics {
public:
    static double mean(const std::vector<double>& values);

    // Population standard deviation (divides by n).
    static double stddev(const std::vector<double>& values);

    static double sum(const std::vector<double>& values);
};

} // namespace utils
} // namespace banditlab
