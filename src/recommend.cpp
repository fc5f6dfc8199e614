// Crossfeed - Recommendation Engine Implementation

#include <crossfeed/recommend.hpp>
#include <algorithm>
#include <iterator>

namespace crossfeed {

namespace {

std::optional<Decimal> cost_of(const CostEstimate& costs, const std::string& network,
                               MissingCostPolicy policy) {
    auto it = costs.find(network);
    if (it != costs.end()) return it->second;
    if (policy == MissingCostPolicy::Zero) return Decimal::zero();
    return std::nullopt;
}

bool ranks_before(const TradeRecommendation& a, const TradeRecommendation& b) {
    if (a.potential_profit != b.potential_profit) {
        return a.potential_profit > b.potential_profit;
    }
    if (a.buy_network != b.buy_network) {
        return a.buy_network < b.buy_network;
    }
    return a.sell_network < b.sell_network;
}

}  // namespace

std::vector<TradeRecommendation> recommend(const DeviationReport& report,
                                           const CostEstimate& costs,
                                           MissingCostPolicy policy) {
    const auto& samples = report.price_set.samples;
    std::vector<TradeRecommendation> result;
    if (samples.size() >= 2) {
        result.reserve(samples.size() * (samples.size() - 1) / 2);
    }

    // std::map iterates in key order, so `a` always has the smaller id
    for (auto a = samples.begin(); a != samples.end(); ++a) {
        for (auto b = std::next(a); b != samples.end(); ++b) {
            // Equal prices keep the smaller id on the buy side
            bool swap = b->second.price < a->second.price;
            const auto& low = swap ? *b : *a;
            const auto& high = swap ? *a : *b;

            auto buy_cost = cost_of(costs, low.first, policy);
            auto sell_cost = cost_of(costs, high.first, policy);
            if (!buy_cost || !sell_cost) continue;

            TradeRecommendation rec;
            rec.buy_network = low.first;
            rec.sell_network = high.first;
            rec.buy_price = low.second.price;
            rec.sell_price = high.second.price;
            rec.price_difference = rec.sell_price - rec.buy_price;
            rec.estimated_costs[rec.buy_network] = *buy_cost;
            rec.estimated_costs[rec.sell_network] = *sell_cost;
            rec.potential_profit = rec.price_difference - (*buy_cost + *sell_cost);
            result.push_back(std::move(rec));
        }
    }

    std::sort(result.begin(), result.end(), ranks_before);
    return result;
}

std::optional<TradeRecommendation> best_recommendation(const DeviationReport& report,
                                                       const CostEstimate& costs,
                                                       MissingCostPolicy policy) {
    auto ranked = recommend(report, costs, policy);
    if (ranked.empty()) return std::nullopt;
    return std::move(ranked.front());
}

}  // namespace crossfeed
