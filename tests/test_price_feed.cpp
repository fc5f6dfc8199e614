// Crossfeed - Price Feed Reader Tests

#include <catch2/catch_test_macros.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/price_feed.hpp>
#include "mocks.hpp"

using namespace crossfeed;
using namespace crossfeed::testing;

TEST_CASE("PriceFeedReader normalizes feed answers", "[price_feed]") {
    MockNetworks nets{"mainnet", "polygon"};
    PriceFeedReader reader(nets.registry(), nets.factory());

    SECTION("Eight decimal feed") {
        nets["mainnet"].set_round(ETH_FEED, static_cast<I128>(312345678901LL), 8, 1700000123);

        auto sample = reader.read_price("mainnet", "ETH_USD");
        REQUIRE(sample.network == "mainnet");
        REQUIRE(sample.asset == "ETH_USD");
        REQUIRE(sample.price.to_string() == "3123.45678901");
        REQUIRE(sample.updated_at == 1700000123);
        REQUIRE(sample.observed_at > 0);
    }

    SECTION("Eighteen decimal feed") {
        I128 raw = static_cast<I128>(3000) * 1000000000000000000LL;
        nets["polygon"].set_round(ETH_FEED, raw, 18);

        REQUIRE(reader.read_price("polygon", "ETH_USD").price == Decimal::from_int(3000));
    }

    SECTION("One contract call per read") {
        nets.set_prices({{"mainnet", 3000}});
        reader.read_price("mainnet", "ETH_USD");
        reader.read_price("mainnet", "ETH_USD");
        REQUIRE(nets["mainnet"].calls() == 2);
    }
}

TEST_CASE("PriceFeedReader errors", "[price_feed]") {
    MockNetworks nets{"mainnet"};
    PriceFeedReader reader(nets.registry(), nets.factory());

    SECTION("Unknown network") {
        REQUIRE_THROWS_AS(reader.read_price("arbitrum", "ETH_USD"), FeedNotFoundError);
    }

    SECTION("Unknown asset") {
        REQUIRE_THROWS_AS(reader.read_price("mainnet", "DOGE_USD"), FeedNotFoundError);
        REQUIRE(nets["mainnet"].calls() == 0);
    }

    SECTION("Source failure is not retried") {
        nets.set_prices({{"mainnet", 3000}});
        nets["mainnet"].fail_next(1);

        REQUIRE_THROWS_AS(reader.read_price("mainnet", "ETH_USD"), SourceUnavailableError);
        REQUIRE(nets["mainnet"].calls() == 1);
    }

    SECTION("Answer out of range") {
        nets["mainnet"].set_round(ETH_FEED, static_cast<I128>(1), 40);
        REQUIRE_THROWS_AS(reader.read_price("mainnet", "ETH_USD"), SourceUnavailableError);
    }

    SECTION("Factory without a contract") {
        FeedContractFactory empty = [](const NetworkEndpoint&) -> std::shared_ptr<FeedContract> {
            return nullptr;
        };
        REQUIRE_THROWS_AS(PriceFeedReader(nets.registry(), empty), ConfigError);
    }
}
