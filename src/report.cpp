// Crossfeed - Report Serialization Implementation

#include <crossfeed/report.hpp>

namespace crossfeed {

using json = nlohmann::json;

void to_json(json& j, const Decimal& d) {
    j = d.to_string();
}

void to_json(json& j, const PriceSample& sample) {
    j = json{
        {"network", sample.network},
        {"asset", sample.asset},
        {"price", sample.price},
        {"observed_at", sample.observed_at},
        {"updated_at", sample.updated_at}
    };
}

void to_json(json& j, const PriceSet& set) {
    json prices = json::object();
    for (const auto& [network, sample] : set.samples) {
        prices[network] = sample;
    }

    j = json{
        {"asset", set.asset},
        {"collected_at", set.collected_at},
        {"prices", prices},
        {"failures", set.failures}
    };
}

void to_json(json& j, const DeviationReport& report) {
    j = json{
        {"asset", report.asset},
        {"deviation_percent", report.deviation_percent},
        {"threshold_percent", report.threshold_percent},
        {"exceeds_threshold", report.exceeds_threshold},
        {"insufficient_data", report.insufficient_data()},
        {"evaluated_at", report.evaluated_at},
        {"price_set", report.price_set},
        {"warnings", report.warnings}
    };
}

void to_json(json& j, const TradeRecommendation& rec) {
    json costs = json::object();
    for (const auto& [network, cost] : rec.estimated_costs) {
        costs[network] = cost;
    }

    j = json{
        {"buy_network", rec.buy_network},
        {"sell_network", rec.sell_network},
        {"buy_price", rec.buy_price},
        {"sell_price", rec.sell_price},
        {"price_difference", rec.price_difference},
        {"estimated_costs", costs},
        {"potential_profit", rec.potential_profit},
        {"profitable", rec.is_profitable()}
    };
}

void to_json(json& j, const RoundResult& result) {
    j = json{
        {"asset", result.asset},
        {"started_at", result.started_at},
        {"finished_at", result.finished_at},
        {"triggered", result.triggered()}
    };

    if (result.error) {
        j["error"] = *result.error;
        return;
    }

    j["report"] = result.report;
    j["recommendations"] = result.recommendations;
    if (result.cost_estimate) {
        json costs = json::object();
        for (const auto& [network, cost] : *result.cost_estimate) {
            costs[network] = cost;
        }
        j["costs"] = costs;
    }
}

void to_json(json& j, const MonitorStats& stats) {
    j = json{
        {"rounds_completed", stats.rounds_completed},
        {"rounds_triggered", stats.rounds_triggered},
        {"rounds_failed", stats.rounds_failed}
    };
}

}  // namespace crossfeed
