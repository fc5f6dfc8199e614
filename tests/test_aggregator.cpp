// Crossfeed - Multi-Network Aggregator Tests

#include <catch2/catch_test_macros.hpp>
#include <crossfeed/aggregator.hpp>
#include <crossfeed/errors.hpp>
#include "mocks.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <system_error>

using namespace crossfeed;
using namespace crossfeed::testing;
using namespace std::chrono_literals;

namespace {

MultiNetworkAggregator make_aggregator(const MockNetworks& nets, AggregatorOptions options) {
    auto reader = std::make_shared<const PriceFeedReader>(nets.registry(), nets.factory());
    return MultiNetworkAggregator(reader, options);
}

}  // namespace

TEST_CASE("Aggregator collects every network", "[aggregator]") {
    MockNetworks nets{"A", "B", "C"};
    nets.set_prices({{"A", 100}, {"B", 103}, {"C", 98}});

    auto aggregator = make_aggregator(nets, AggregatorOptions{1000ms, 0});
    auto set = aggregator.collect_prices("ETH_USD");

    REQUIRE(set.asset == "ETH_USD");
    REQUIRE(set.size() == 3);
    REQUIRE(set.failures.empty());
    REQUIRE(set.price("B") == Decimal::from_int(103));
    REQUIRE(set.collected_at > 0);
    for (const auto& [network, sample] : set.samples) {
        REQUIRE(sample.asset == set.asset);
        REQUIRE(sample.network == network);
    }
}

TEST_CASE("Aggregator contains per-network failures", "[aggregator]") {
    MockNetworks nets{"A", "B", "C"};
    nets.set_prices({{"A", 100}, {"B", 103}, {"C", 98}});

    SECTION("A timed out network does not hold back the others") {
        nets["B"].set_delay(2000ms);
        auto aggregator = make_aggregator(nets, AggregatorOptions{200ms, 0});

        auto started = std::chrono::steady_clock::now();
        auto set = aggregator.collect_prices("ETH_USD");
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(set.size() == 2);
        REQUIRE(set.price("A").has_value());
        REQUIRE(set.price("C").has_value());
        REQUIRE(set.failures.count("B") == 1);
        REQUIRE(elapsed < 1500ms);
    }

    SECTION("A failing network is dropped") {
        nets["C"].fail_always();
        auto aggregator = make_aggregator(nets, AggregatorOptions{1000ms, 0});

        auto set = aggregator.collect_prices("ETH_USD");
        REQUIRE(set.size() == 2);
        REQUIRE(set.failures.at("C").find("connection refused") != std::string::npos);
    }

    SECTION("Missing feed is recorded, not thrown") {
        auto aggregator = make_aggregator(nets, AggregatorOptions{1000ms, 0});

        auto set = aggregator.collect_prices("BTC_USD");
        REQUIRE(set.empty());
        REQUIRE(set.failures.size() == 3);
        REQUIRE(set.failures.at("A") == "no feed for BTC_USD");
        REQUIRE(nets["A"].calls() == 0);
    }

    SECTION("All networks failing yields an empty set") {
        nets["A"].fail_always();
        nets["B"].fail_always();
        nets["C"].fail_always();
        auto aggregator = make_aggregator(nets, AggregatorOptions{1000ms, 0});

        PriceSet set;
        REQUIRE_NOTHROW(set = aggregator.collect_prices("ETH_USD"));
        REQUIRE(set.empty());
        REQUIRE(set.failures.size() == 3);
    }
}

TEST_CASE("Aggregator retries transient failures", "[aggregator]") {
    MockNetworks nets{"A", "B"};
    nets.set_prices({{"A", 100}, {"B", 101}});
    nets["A"].fail_next(2);

    SECTION("Within the retry budget") {
        auto aggregator = make_aggregator(nets, AggregatorOptions{1000ms, 2});
        auto set = aggregator.collect_prices("ETH_USD");

        REQUIRE(set.size() == 2);
        REQUIRE(nets["A"].calls() == 3);
    }

    SECTION("Budget exhausted") {
        auto aggregator = make_aggregator(nets, AggregatorOptions{1000ms, 1});
        auto set = aggregator.collect_prices("ETH_USD");

        REQUIRE(set.size() == 1);
        REQUIRE(nets["A"].calls() == 2);
    }
}

TEST_CASE("Aggregator records a worker that cannot start", "[aggregator]") {
    MockNetworks nets{"A", "B", "C"};
    nets.set_prices({{"A", 100}, {"B", 103}, {"C", 98}});

    auto launches = std::make_shared<std::atomic<int>>(0);
    AggregatorOptions options{1000ms, 0};
    options.launcher = [launches](std::function<void()> job) {
        if (launches->fetch_add(1) == 1) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        launch_detached(std::move(job));
    };

    auto aggregator = make_aggregator(nets, options);
    PriceSet set;
    REQUIRE_NOTHROW(set = aggregator.collect_prices("ETH_USD"));

    REQUIRE(set.size() == 2);
    REQUIRE(set.failures.size() == 1);
    const auto& [network, reason] = *set.failures.begin();
    REQUIRE(set.samples.count(network) == 0);
    REQUIRE(reason.find("could not start worker") != std::string::npos);
    REQUIRE(nets[network].calls() == 0);
}

TEST_CASE("Aggregator construction", "[aggregator]") {
    MockNetworks nets{"A"};
    auto reader = std::make_shared<const PriceFeedReader>(nets.registry(), nets.factory());

    REQUIRE_THROWS_AS(MultiNetworkAggregator(nullptr, AggregatorOptions{}), ConfigError);
    REQUIRE_THROWS_AS(MultiNetworkAggregator(reader, AggregatorOptions{0ms, 0}), ConfigError);
    REQUIRE_THROWS_AS(MultiNetworkAggregator(reader, AggregatorOptions{1000ms, 0, nullptr}), ConfigError);
}
