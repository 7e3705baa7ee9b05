#include "common/Statistics.h"

#include <cmath>
#include <numeric>

namespace banditlab {
namespace utils {

double Statistics::sum(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0);
}

double Statistics::mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return sum(values) / static_cast<double>(values.size());
}

double Statistics::stddev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double m = mean(values);
    double acc = 0.0;
    for (double v : values) {
        acc += (v - m) * (v - m);
    }
    return std::sqrt(acc / static_cast<double>(values.size()));
}

} // namespace utils
} // namespace banditlab
