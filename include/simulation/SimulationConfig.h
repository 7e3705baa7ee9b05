#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace banditlab {
namespace simulation {

struct SimulationConfig {
    int n_arms = 10;
    std::optional<std::uint64_t> seed = 42;  // nullopt: nondeterministic
    int n_rounds = 1000;
    int n_trials = 5;
    bool use_context = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string log_dir = "logs";
};

} // namespace simulation
} // namespace banditlab
