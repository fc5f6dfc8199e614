// Crossfeed - JSON-RPC and ABI Decoding Tests

#include <catch2/catch_test_macros.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/feed_contract.hpp>
#include <crossfeed/rpc.hpp>
#include <string>

using namespace crossfeed;

namespace {

std::string word(const std::string& hex) {
    return std::string(64 - hex.size(), '0') + hex;
}

std::string negative_word(const std::string& hex) {
    return std::string(64 - hex.size(), 'f') + hex;
}

}  // namespace

TEST_CASE("ABI word decoding", "[rpc]") {
    SECTION("Split words") {
        auto words = abi::split_words("0x" + word("1") + word("2"));
        REQUIRE(words.size() == 2);
        REQUIRE(abi::decode_uint(words[1]) == 2);
    }

    SECTION("Malformed return data") {
        REQUIRE_THROWS_AS(abi::split_words("0x"), SourceUnavailableError);
        REQUIRE_THROWS_AS(abi::split_words("0x1234"), SourceUnavailableError);
        REQUIRE_THROWS_AS(abi::decode_uint(word("zz")), SourceUnavailableError);
    }

    SECTION("Signed int256") {
        REQUIRE(abi::decode_int(word("2a")) == 42);
        REQUIRE(abi::decode_int(negative_word("fe")) == -2);
        REQUIRE_THROWS_AS(abi::decode_int("1" + word("").substr(1)), SourceUnavailableError);
    }

    SECTION("Unsigned overflow") {
        REQUIRE_THROWS_AS(abi::decode_uint(word("10000000000000000")), SourceUnavailableError);
        REQUIRE(abi::decode_uint(word("ffffffffffffffff")) == UINT64_MAX);
    }

    SECTION("Quantities") {
        REQUIRE(abi::decode_quantity("0x3b9aca00") == 1000000000);
        REQUIRE(abi::decode_quantity("0x0") == 0);
        REQUIRE_THROWS_AS(abi::decode_quantity("0x"), SourceUnavailableError);
    }
}

TEST_CASE("Chainlink latestRoundData decoding", "[rpc]") {
    // ETH/USD 3123.45678901 with 8 decimals, updated at 1700000000
    std::string round = "0x" +
        word("1000000000000a1b2") +   // roundId
        word("48b940d435") +          // answer 312345678901
        word("6553f0ff") +            // startedAt
        word("6553f100") +            // updatedAt
        word("1000000000000a1b2");    // answeredInRound
    std::string decimals = "0x" + word("8");

    SECTION("Decodes answer, timestamp and decimals") {
        auto data = ChainlinkFeedContract::decode(round, decimals);
        REQUIRE(data.answer == static_cast<I128>(312345678901LL));
        REQUIRE(data.updated_at == 1700000000);
        REQUIRE(data.decimals == 8);

        auto price = Decimal::from_scaled(data.answer, data.decimals);
        REQUIRE(price->to_string() == "3123.45678901");
    }

    SECTION("Wrong word count") {
        REQUIRE_THROWS_AS(ChainlinkFeedContract::decode("0x" + word("1"), decimals), SourceUnavailableError);
    }

    SECTION("Unsupported decimals") {
        REQUIRE_THROWS_AS(ChainlinkFeedContract::decode(round, "0x" + word("40")), SourceUnavailableError);
    }
}

TEST_CASE("RpcClient against an unreachable endpoint", "[rpc]") {
    RpcClient client("http://127.0.0.1:1", 200);
    REQUIRE(client.url() == "http://127.0.0.1:1");
    REQUIRE_THROWS_AS(client.gas_price(), SourceUnavailableError);
}
