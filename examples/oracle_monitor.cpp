/**
 * Crossfeed Oracle Monitor
 *
 * Polls the configured Chainlink feeds on every network, prints one JSON
 * line per evaluation round and logs triggered deviations with their best
 * buy/sell recommendation.
 *
 * Usage: crossfeed_monitor [config.toml]
 *   Without an argument CROSSFEED_CONFIG is used, then the built-in
 *   mainnet / polygon / optimism defaults.
 */

#include <crossfeed/config.hpp>
#include <crossfeed/cost.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/log.hpp>
#include <crossfeed/monitor.hpp>
#include <crossfeed/oracle.hpp>
#include <crossfeed/report.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

using namespace crossfeed;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running.store(false);
}

std::string get_env(const std::string& key, const std::string& default_value) {
    const char* value = std::getenv(key.c_str());
    return value ? value : default_value;
}

Config load_config(int argc, char** argv) {
    std::string path = argc > 1 ? argv[1] : get_env("CROSSFEED_CONFIG", "");
    if (path.empty()) {
        return Config::defaults();
    }
    return Config::from_file(path);
}

std::shared_ptr<CostEstimator> make_cost_estimator(const Config& config, const OracleService& oracle) {
    switch (config.monitor.cost_source) {
        case CostSource::Gas:
            return std::make_shared<GasCostEstimator>(oracle.shared_registry(), config.general.timeout_ms);
        case CostSource::Static:
            break;
    }
    return std::make_shared<StaticCostEstimator>(config.costs);
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        Config config = load_config(argc, argv);
        config.validate();
        log::init(config.general.log_level);

        auto oracle = std::make_shared<const OracleService>(config);
        auto costs = make_cost_estimator(config, *oracle);

        OpportunityMonitor monitor(oracle, costs, config.monitor);
        monitor.on_round([](const RoundResult& result) {
            nlohmann::json line = result;
            std::cout << line.dump() << std::endl;

            if (result.triggered() && !result.recommendations.empty()) {
                const auto& best = result.recommendations.front();
                CROSSFEED_LOG_INFO("{}: buy on {} at {}, sell on {} at {}, profit {}",
                                   result.asset, best.buy_network, best.buy_price.to_string(),
                                   best.sell_network, best.sell_price.to_string(),
                                   best.potential_profit.to_string());
            }
        });

        monitor.start();
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        monitor.stop();

        nlohmann::json summary = {{"stats", monitor.stats()}};
        std::cout << summary.dump() << std::endl;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
