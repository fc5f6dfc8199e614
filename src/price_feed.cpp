// Crossfeed - Price Feed Reader Implementation

#include <crossfeed/price_feed.hpp>
#include <crossfeed/errors.hpp>

namespace crossfeed {

PriceFeedReader::PriceFeedReader(std::shared_ptr<const EndpointRegistry> registry,
                                 const FeedContractFactory& factory)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw ConfigError("Price feed reader needs a registry");
    }

    for (const auto& network : registry_->networks()) {
        auto contract = factory(registry_->endpoint(network));
        if (!contract) {
            throw ConfigError("No feed contract for network " + network);
        }
        contracts_.emplace(network, std::move(contract));
    }
}

PriceSample PriceFeedReader::read_price(const std::string& network, const std::string& asset) const {
    const auto& address = registry_->feed_address(network, asset);
    auto& contract = contracts_.at(network);

    RoundData round;
    try {
        round = contract->latest_round_data(address);
    } catch (const OracleError&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailableError(network + ": " + e.what());
    }

    auto price = Decimal::from_scaled(round.answer, round.decimals);
    if (!price) {
        throw SourceUnavailableError("Malformed answer from " + asset + " feed on " + network);
    }

    PriceSample sample;
    sample.network = network;
    sample.asset = asset;
    sample.price = *price;
    sample.observed_at = now_ms();
    sample.updated_at = static_cast<int64_t>(round.updated_at);
    return sample;
}

}  // namespace crossfeed
