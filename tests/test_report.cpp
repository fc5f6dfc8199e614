// Crossfeed - Report Serialization Tests

#include <catch2/catch_test_macros.hpp>
#include <crossfeed/deviation.hpp>
#include <crossfeed/recommend.hpp>
#include <crossfeed/report.hpp>
#include "mocks.hpp"

using namespace crossfeed;
using namespace crossfeed::testing;
using json = nlohmann::json;

TEST_CASE("DeviationReport to JSON", "[report]") {
    auto set = price_set("ETH_USD", {{"A", 100}, {"B", 103}, {"C", 0}});
    set.failures["D"] = "timed out after 5000 ms";
    auto report = detect_deviation(set, Decimal::from_int(2));

    json j = report;

    REQUIRE(j["asset"] == "ETH_USD");
    REQUIRE(j["deviation_percent"] == "3");
    REQUIRE(j["threshold_percent"] == "2");
    REQUIRE(j["exceeds_threshold"] == true);
    REQUIRE(j["insufficient_data"] == false);
    REQUIRE(j["evaluated_at"] == set.collected_at);
    REQUIRE(j["price_set"]["prices"].size() == 2);
    REQUIRE(j["price_set"]["prices"]["B"]["price"] == "103");
    REQUIRE(j["price_set"]["failures"]["D"] == "timed out after 5000 ms");
    REQUIRE(j["price_set"]["failures"].contains("C"));
    REQUIRE(j["warnings"].size() == 1);
}

TEST_CASE("RoundResult to JSON", "[report]") {
    auto report = detect_deviation(price_set("ETH_USD", {{"A", 100}, {"B", 103}, {"C", 98}}),
                                   Decimal::from_int(2));

    RoundResult result;
    result.asset = "ETH_USD";
    result.report = report;
    result.cost_estimate = CostEstimate{{"B", Decimal::from_string("0.25")}};
    result.recommendations = recommend(report, *result.cost_estimate);

    SECTION("Successful round") {
        json j = result;

        REQUIRE(j["triggered"] == true);
        REQUIRE_FALSE(j.contains("error"));
        REQUIRE(j["costs"]["B"] == "0.25");
        REQUIRE(j["recommendations"].size() == 3);

        const auto& best = j["recommendations"][0];
        REQUIRE(best["buy_network"] == "C");
        REQUIRE(best["sell_network"] == "B");
        REQUIRE(best["price_difference"] == "5");
        REQUIRE(best["potential_profit"] == "4.75");
        REQUIRE(best["estimated_costs"]["C"] == "0");
        REQUIRE(best["profitable"] == true);
    }

    SECTION("Failed round") {
        result.error = "gas oracle unreachable";
        json j = result;

        REQUIRE(j["triggered"] == false);
        REQUIRE(j["error"] == "gas oracle unreachable");
        REQUIRE_FALSE(j.contains("report"));
    }
}

TEST_CASE("MonitorStats to JSON", "[report]") {
    json j = MonitorStats{5, 2, 1};
    REQUIRE(j["rounds_completed"] == 5);
    REQUIRE(j["rounds_triggered"] == 2);
    REQUIRE(j["rounds_failed"] == 1);
}
