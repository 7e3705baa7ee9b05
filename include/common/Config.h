#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "simulation/SimulationConfig.h"
#include "policy/PolicyConfig.h"

namespace banditlab {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; a malformed file throws std::runtime_error.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // Restore built-in defaults (used between test cases).
    void reset();

    simulation::SimulationConfig getSimulationConfig() const { return simulation_config_; }
    simulation::LoggingConfig getLoggingConfig() const { return logging_config_; }

    void setRounds(int v) { simulation_config_.n_rounds = v; }
    void setTrials(int v) { simulation_config_.n_trials = v; }
    void setSeed(std::uint64_t v) { simulation_config_.seed = v; }
    void setUseContext(bool v) { simulation_config_.use_context = v; }

    policy::EpsilonGreedyConfig getEpsilonGreedyConfig() const { return epsilon_greedy_config_; }
    policy::UcbConfig getUcbConfig() const { return ucb_config_; }
    policy::ThompsonSamplingConfig getThompsonSamplingConfig() const { return thompson_config_; }
    policy::LinUcbConfig getLinUcbConfig() const { return linucb_config_; }

private:
    Config() = default;

    simulation::SimulationConfig simulation_config_;
    simulation::LoggingConfig logging_config_;

    policy::EpsilonGreedyConfig epsilon_greedy_config_;
    policy::UcbConfig ucb_config_;
    policy::ThompsonSamplingConfig thompson_config_;
    policy::LinUcbConfig linucb_config_;
};

} // namespace banditlab
