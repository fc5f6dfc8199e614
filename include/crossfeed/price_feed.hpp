// Crossfeed - Price Feed Reader
// One (network, asset) read, normalized to Decimal

#pragma once

#include <crossfeed/feed_contract.hpp>
#include <crossfeed/registry.hpp>
#include <crossfeed/types.hpp>
#include <map>
#include <memory>
#include <string>

namespace crossfeed {

class PriceFeedReader {
public:
    /// Creates one contract handle per registered network; handles are
    /// reused by every later read, including concurrent ones.
    PriceFeedReader(std::shared_ptr<const EndpointRegistry> registry,
                    const FeedContractFactory& factory);

    // Non-copyable
    PriceFeedReader(const PriceFeedReader&) = delete;
    PriceFeedReader& operator=(const PriceFeedReader&) = delete;

    /// Single read-only query, price = answer / 10^decimals.
    /// Throws FeedNotFoundError for an unknown network or asset and
    /// SourceUnavailableError for transport or response failures.
    /// Never retries.
    PriceSample read_price(const std::string& network, const std::string& asset) const;

    [[nodiscard]] const EndpointRegistry& registry() const noexcept { return *registry_; }

private:
    std::shared_ptr<const EndpointRegistry> registry_;
    std::map<std::string, std::shared_ptr<FeedContract>> contracts_;
};

}  // namespace crossfeed
