// Crossfeed - Recommendation Engine
// Ranked buy-low / sell-high network pairs, net of estimated costs

#pragma once

#include <crossfeed/config.hpp>
#include <crossfeed/types.hpp>
#include <optional>
#include <vector>

namespace crossfeed {

/// Enumerates every unordered pair of networks in report.price_set.
///
/// The lower-priced side buys (on equal prices the smaller network id),
/// potential_profit = |a - b| - (cost[buy] + cost[sell]).
/// Sorted by potential_profit descending, ties by (buy, sell) ascending.
/// With MissingCostPolicy::Zero an n-sample report yields n(n-1)/2 entries;
/// Exclude skips pairs that touch a network absent from costs.
///
/// Runs on any report; gating on exceeds_threshold is up to the caller.
std::vector<TradeRecommendation> recommend(const DeviationReport& report,
                                           const CostEstimate& costs,
                                           MissingCostPolicy policy = MissingCostPolicy::Zero);

std::optional<TradeRecommendation> best_recommendation(const DeviationReport& report,
                                                       const CostEstimate& costs,
                                                       MissingCostPolicy policy = MissingCostPolicy::Zero);

}  // namespace crossfeed
