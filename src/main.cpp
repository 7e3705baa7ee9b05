#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/RandomSource.h"
#include "environment/RewardEnvironment.h"
#include "policy/PolicyFactory.h"
#include "simulation/ComparisonRunner.h"
#include "simulation/SimulationRunner.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace banditlab;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    bool json_mode = false;
    std::optional<int> rounds;
    std::optional<int> trials;
    bool has_seed = false;
    std::uint64_t seed = 0;
    bool use_context = false;
};

void printUsage() {
    std::cerr << "Usage: BanditLab [config_path] [--json] [--rounds N] [--trials N] [--seed S] [--context]\n";
}

// Returns false on a malformed command line.
bool parseArgs(int argc, char* argv[], CliOptions& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        try {
            if (arg == "--json") {
                out.json_mode = true;
            } else if (arg == "--context") {
                out.use_context = true;
            } else if (arg == "--rounds" && i + 1 < argc) {
                out.rounds = std::stoi(argv[++i]);
            } else if (arg == "--trials" && i + 1 < argc) {
                out.trials = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                out.seed = std::stoull(argv[++i]);
                out.has_seed = true;
            } else if (arg == "--help" || arg == "-h") {
                return false;
            } else if (!arg.empty() && arg[0] != '-') {
                out.config_path = arg;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            return false;
        }
    }
    return true;
}

void logArticleTable(const environment::RewardEnvironment& env) {
    LOG_INFO("===== Articles (optimal arm {}, ctr {:.4f}) =====", env.optimalArm(), env.optimalRate());
    for (const auto& a : env.getArms()) {
        LOG_INFO("  #{:<2} {:<14} ctr={:.4f}  {}", a.id, a.category, a.true_ctr, a.title);
    }
}

nlohmann::json toJson(const simulation::SimulationResult& r, const policy::PolicyMetrics& m) {
    return {
        {"total_reward", r.totalReward()},
        {"final_regret", r.finalRegret()},
        {"final_ctr", r.finalCtr()},
        {"pull_count", m.pull_count},
        {"value_estimate", m.value_estimate},
        {"arms", r.arms},
        {"rewards", r.rewards},
        {"cumulative_regret", r.cumulative_regret},
        {"running_ctr", r.running_ctr}
    };
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 1;
    }

    try {
        auto& config = Config::getInstance();
        config.load(options.config_path);
        if (options.rounds) config.setRounds(*options.rounds);
        if (options.trials) config.setTrials(*options.trials);
        if (options.has_seed) config.setSeed(options.seed);
        if (options.use_context) config.setUseContext(true);

        const auto logging = config.getLoggingConfig();
        Logger::getInstance().initialize(logging.log_dir, !options.json_mode);
        Logger::getInstance().setLevel(logging.level);

        const auto sim = config.getSimulationConfig();
        if (sim.n_rounds <= 0) {
            throw InvalidParameterError("n_rounds", "must be > 0, got " + std::to_string(sim.n_rounds));
        }
        if (sim.n_trials <= 0) {
            throw InvalidParameterError("n_trials", "must be > 0, got " + std::to_string(sim.n_trials));
        }
        LOG_INFO("=============================================");
        LOG_INFO("  BanditLab: news recommendation bandits");
        LOG_INFO("=============================================");
        LOG_INFO("arms={}, rounds={}, trials={}, seed={}, context={}",
                 sim.n_arms, sim.n_rounds, sim.n_trials,
                 sim.seed ? std::to_string(*sim.seed) : std::string("random"),
                 sim.use_context ? "on" : "off");

        const auto env = environment::RewardEnvironment::generate(sim.n_arms, sim.seed);
        logArticleTable(env);

        auto policies = policy::PolicyFactory::createFromConfig(
            config, sim.n_arms, static_cast<int>(env.featureDimension()));

        nlohmann::json out;
        out["arms"] = nlohmann::json::array();
        for (const auto& a : env.getArms()) {
            out["arms"].push_back({
                {"id", a.id},
                {"title", a.title},
                {"category", a.category},
                {"true_ctr", a.true_ctr}
            });
        }
        out["optimal_arm"] = env.optimalArm();
        out["runs"] = nlohmann::json::object();

        // Single run per policy; the stream is seeded from the session seed.
        RandomSource run_rng(sim.seed);
        const simulation::SimulationRunner runner;
        LOG_INFO("===== Single runs ({} rounds) =====", sim.n_rounds);
        for (const auto& [name, p] : policies) {
            p->reset();
            const auto result = runner.run(*p, env, sim.n_rounds, run_rng, sim.use_context);
            const auto metrics = p->getMetrics();
            LOG_INFO("  {:<18} reward={:>6.0f}  ctr={:.4f}  regret={:.3f}",
                     name, result.totalReward(), result.finalCtr(), result.finalRegret());
            out["runs"][name] = toJson(result, metrics);
        }

        LOG_INFO("===== Comparison ({} trials x {} rounds) =====", sim.n_trials, sim.n_rounds);
        const simulation::ComparisonRunner comparison(sim.seed);
        const auto rows = comparison.compare(policies, env, sim.n_rounds, sim.n_trials, sim.use_context);

        out["comparison"] = nlohmann::json::array();
        for (const auto& row : rows) {
            LOG_INFO("  {:<18} reward={:>8.2f} (+-{:.2f})  regret={:>8.3f} (+-{:.3f})  ctr={:.4f}",
                     row.policy_name, row.mean_total_reward, row.std_total_reward,
                     row.mean_final_regret, row.std_final_regret, row.mean_ctr);
            out["comparison"].push_back({
                {"policy", row.policy_name},
                {"mean_total_reward", row.mean_total_reward},
                {"std_total_reward", row.std_total_reward},
                {"mean_final_regret", row.mean_final_regret},
                {"std_final_regret", row.std_final_regret},
                {"mean_ctr", row.mean_ctr}
            });
        }

        if (options.json_mode) {
            std::cout << out.dump(2) << std::endl;
        }
        LOG_INFO("Done");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
