// Crossfeed - Report Serialization
// nlohmann::json conversions; decimals are emitted as strings

#pragma once

#include <crossfeed/monitor.hpp>
#include <crossfeed/types.hpp>
#include <nlohmann/json.hpp>

namespace crossfeed {

void to_json(nlohmann::json& j, const Decimal& d);
void to_json(nlohmann::json& j, const PriceSample& sample);
void to_json(nlohmann::json& j, const PriceSet& set);
void to_json(nlohmann::json& j, const DeviationReport& report);
void to_json(nlohmann::json& j, const TradeRecommendation& rec);
void to_json(nlohmann::json& j, const RoundResult& result);
void to_json(nlohmann::json& j, const MonitorStats& stats);

}  // namespace crossfeed
