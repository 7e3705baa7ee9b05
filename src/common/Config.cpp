#include "common/Config.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace banditlab {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    simulation_config_ = simulation::SimulationConfig();
    logging_config_ = simulation::LoggingConfig();
    epsilon_greedy_config_ = policy::EpsilonGreedyConfig();
    ucb_config_ = policy::UcbConfig();
    thompson_config_ = policy::ThompsonSamplingConfig();
    linucb_config_ = policy::LinUcbConfig();
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    std::cerr << "Config path: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Warning: config file not found: " << config_path.string() << std::endl;
        std::cerr << "Using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "Warning: config file could not be opened. Using defaults." << std::endl;
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Config parse failed (" + config_path.string() + "): " + e.what());
    }

    loadFromJson(j);
    std::cerr << "Config loaded: arms=" << simulation_config_.n_arms
              << ", rounds=" << simulation_config_.n_rounds
              << ", trials=" << simulation_config_.n_trials << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        if (j.contains("simulation")) {
            const auto& s = j["simulation"];
            simulation_config_.n_arms = s.value("n_arms", simulation_config_.n_arms);
            if (s.contains("seed")) {
                if (s["seed"].is_null()) {
                    simulation_config_.seed.reset();
                } else {
                    simulation_config_.seed = s["seed"].get<std::uint64_t>();
                }
            }
            simulation_config_.n_rounds = s.value("n_rounds", simulation_config_.n_rounds);
            simulation_config_.n_trials = s.value("n_trials", simulation_config_.n_trials);
            simulation_config_.use_context = s.value("use_context", simulation_config_.use_context);
        }

        if (j.contains("policies")) {
            const auto& p = j["policies"];

            if (p.contains("epsilon_greedy")) {
                const auto& s = p["epsilon_greedy"];
                epsilon_greedy_config_.enabled = s.value("enabled", epsilon_greedy_config_.enabled);
                epsilon_greedy_config_.epsilon = s.value("epsilon", epsilon_greedy_config_.epsilon);
            }

            if (p.contains("ucb")) {
                const auto& s = p["ucb"];
                ucb_config_.enabled = s.value("enabled", ucb_config_.enabled);
                ucb_config_.c = s.value("c", ucb_config_.c);
            }

            if (p.contains("thompson_sampling")) {
                const auto& s = p["thompson_sampling"];
                thompson_config_.enabled = s.value("enabled", thompson_config_.enabled);
                thompson_config_.alpha_prior = s.value("alpha_prior", thompson_config_.alpha_prior);
                thompson_config_.beta_prior = s.value("beta_prior", thompson_config_.beta_prior);
            }

            if (p.contains("linucb")) {
                const auto& s = p["linucb"];
                linucb_config_.enabled = s.value("enabled", linucb_config_.enabled);
                linucb_config_.alpha = s.value("alpha", linucb_config_.alpha);
                linucb_config_.regularization = s.value("regularization", linucb_config_.regularization);
            }
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            logging_config_.level = l.value("level", logging_config_.level);
            logging_config_.log_dir = l.value("log_dir", logging_config_.log_dir);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Config value error: ") + e.what());
    }
}

} // namespace banditlab
