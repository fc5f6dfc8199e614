// Crossfeed - Price Feed Contracts Implementation

#include <crossfeed/feed_contract.hpp>
#include <crossfeed/errors.hpp>

namespace crossfeed {

using json = nlohmann::json;

ChainlinkFeedContract::ChainlinkFeedContract(std::string url, int timeout_ms)
    : rpc_(std::move(url), timeout_ms) {}

RoundData ChainlinkFeedContract::latest_round_data(const std::string& feed_address) {
    json round_tx = {{"to", feed_address}, {"data", abi::LATEST_ROUND_DATA}};
    json decimals_tx = {{"to", feed_address}, {"data", abi::DECIMALS}};

    auto results = rpc_.batch({
        RpcRequest{"eth_call", json::array({round_tx, "latest"})},
        RpcRequest{"eth_call", json::array({decimals_tx, "latest"})}
    });

    if (!results[0].is_string() || !results[1].is_string()) {
        throw SourceUnavailableError("eth_call returned non-string result for " + feed_address);
    }

    return decode(results[0].get<std::string>(), results[1].get<std::string>());
}

RoundData ChainlinkFeedContract::decode(const std::string& round_data_hex,
                                        const std::string& decimals_hex) {
    // (roundId, answer, startedAt, updatedAt, answeredInRound)
    auto words = abi::split_words(round_data_hex);
    if (words.size() != 5) {
        throw SourceUnavailableError("latestRoundData returned " +
                                     std::to_string(words.size()) + " words, expected 5");
    }

    auto decimal_words = abi::split_words(decimals_hex);
    if (decimal_words.size() != 1) {
        throw SourceUnavailableError("decimals returned unexpected data");
    }

    uint64_t decimals = abi::decode_uint(decimal_words[0]);
    if (decimals > 36) {
        throw SourceUnavailableError("Unsupported feed decimals: " + std::to_string(decimals));
    }

    RoundData data;
    data.answer = abi::decode_int(words[1]);
    data.updated_at = abi::decode_uint(words[3]);
    data.decimals = static_cast<int>(decimals);
    return data;
}

FeedContractFactory chainlink_factory(int timeout_ms) {
    return [timeout_ms](const NetworkEndpoint& endpoint) -> std::shared_ptr<FeedContract> {
        return std::make_shared<ChainlinkFeedContract>(endpoint.url, timeout_ms);
    };
}

}  // namespace crossfeed
