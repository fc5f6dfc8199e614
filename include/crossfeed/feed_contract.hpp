// Crossfeed - Price Feed Contracts
// Read-only contract query interface and the Chainlink aggregator binding

#pragma once

#include <crossfeed/registry.hpp>
#include <crossfeed/rpc.hpp>
#include <functional>
#include <memory>
#include <string>

namespace crossfeed {

/// Raw latest round of a price feed
struct RoundData {
    I128 answer{0};          // Price scaled by 10^decimals
    uint64_t updated_at{0};  // Unix seconds
    int decimals{0};
};

/// Read-only query interface of one network's price feeds.
/// Implementations must tolerate concurrent calls.
class FeedContract {
public:
    virtual ~FeedContract() = default;

    /// Throws SourceUnavailableError on any transport or decoding failure
    virtual RoundData latest_round_data(const std::string& feed_address) = 0;
};

/// Chainlink AggregatorV3 over JSON-RPC.
/// latestRoundData() and decimals() travel in one batch request.
class ChainlinkFeedContract : public FeedContract {
public:
    ChainlinkFeedContract(std::string url, int timeout_ms);

    RoundData latest_round_data(const std::string& feed_address) override;

    /// Decode the two eth_call results
    static RoundData decode(const std::string& round_data_hex, const std::string& decimals_hex);

private:
    RpcClient rpc_;
};

/// Creates the contract handle for one network
using FeedContractFactory = std::function<std::shared_ptr<FeedContract>(const NetworkEndpoint&)>;

/// Factory producing ChainlinkFeedContract instances with the given timeout
FeedContractFactory chainlink_factory(int timeout_ms);

}  // namespace crossfeed
