// Crossfeed - Oracle Service
// Explicitly constructed facade over reader, aggregator, detector and engine

#pragma once

#include <crossfeed/aggregator.hpp>
#include <crossfeed/config.hpp>
#include <crossfeed/deviation.hpp>
#include <crossfeed/feed_contract.hpp>
#include <crossfeed/price_feed.hpp>
#include <crossfeed/recommend.hpp>
#include <crossfeed/registry.hpp>
#include <memory>
#include <string>
#include <vector>

namespace crossfeed {

struct ServiceOptions {
    AggregatorOptions aggregator;
    DetectorOptions detector{Decimal::from_double(0.5), 0};
    MissingCostPolicy missing_cost_policy = MissingCostPolicy::Zero;

    static ServiceOptions from_config(const Config& config);
};

// Each instance owns its own contract handles; instances are independent.
class OracleService {
public:
    /// Validates config and connects every network through Chainlink feeds.
    /// Throws ConfigError on an invalid configuration.
    explicit OracleService(const Config& config);

    OracleService(std::shared_ptr<const EndpointRegistry> registry,
                  ServiceOptions options,
                  const FeedContractFactory& factory);

    // Disallow copy
    OracleService(const OracleService&) = delete;
    OracleService& operator=(const OracleService&) = delete;

    // Single read, errors propagate (FeedNotFoundError, SourceUnavailableError)
    PriceSample get_asset_price(const std::string& network, const std::string& asset) const;

    // One best-effort round across every network
    PriceSet get_multi_network_prices(const std::string& asset) const;

    // One aggregation round followed by detection
    DeviationReport get_current_deviation(const std::string& asset) const;

    DeviationReport evaluate(const PriceSet& set) const;

    std::vector<TradeRecommendation> recommend(const DeviationReport& report,
                                               const CostEstimate& costs) const;

    [[nodiscard]] const ServiceOptions& options() const noexcept { return options_; }
    [[nodiscard]] const EndpointRegistry& registry() const noexcept { return *registry_; }
    [[nodiscard]] std::shared_ptr<const EndpointRegistry> shared_registry() const noexcept { return registry_; }

private:
    std::shared_ptr<const EndpointRegistry> registry_;
    ServiceOptions options_;
    std::shared_ptr<const PriceFeedReader> reader_;
    MultiNetworkAggregator aggregator_;
};

}  // namespace crossfeed
