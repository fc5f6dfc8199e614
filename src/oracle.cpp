// Crossfeed - Oracle Service Implementation

#include <crossfeed/oracle.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/log.hpp>

namespace crossfeed {

namespace {

std::shared_ptr<const EndpointRegistry> validated_registry(const Config& config) {
    config.validate();
    return std::make_shared<const EndpointRegistry>(config);
}

std::shared_ptr<const PriceFeedReader> make_reader(std::shared_ptr<const EndpointRegistry> registry,
                                                   const FeedContractFactory& factory) {
    if (!registry) {
        throw ConfigError("Oracle service needs an endpoint registry");
    }
    if (!factory) {
        throw ConfigError("Oracle service needs a feed contract factory");
    }
    return std::make_shared<const PriceFeedReader>(std::move(registry), factory);
}

}  // namespace

ServiceOptions ServiceOptions::from_config(const Config& config) {
    ServiceOptions options;
    options.aggregator.timeout = std::chrono::milliseconds(config.general.timeout_ms);
    options.aggregator.retries = config.general.retries;
    options.detector.threshold_percent = config.monitor.threshold_percent;
    options.detector.max_staleness_ms = config.monitor.max_staleness_ms;
    options.missing_cost_policy = config.monitor.missing_cost_policy;
    return options;
}

OracleService::OracleService(const Config& config)
    : OracleService(validated_registry(config),
                    ServiceOptions::from_config(config),
                    chainlink_factory(config.general.timeout_ms)) {}

OracleService::OracleService(std::shared_ptr<const EndpointRegistry> registry,
                             ServiceOptions options,
                             const FeedContractFactory& factory)
    : registry_(registry),
      options_(options),
      reader_(make_reader(std::move(registry), factory)),
      aggregator_(reader_, options_.aggregator) {
    CROSSFEED_LOG_INFO("oracle service over {} networks, threshold {}%",
                       registry_->size(), options_.detector.threshold_percent.to_string());
}

PriceSample OracleService::get_asset_price(const std::string& network, const std::string& asset) const {
    return reader_->read_price(network, asset);
}

PriceSet OracleService::get_multi_network_prices(const std::string& asset) const {
    return aggregator_.collect_prices(asset);
}

DeviationReport OracleService::get_current_deviation(const std::string& asset) const {
    return evaluate(aggregator_.collect_prices(asset));
}

DeviationReport OracleService::evaluate(const PriceSet& set) const {
    auto report = detect_deviation(set, options_.detector);
    for (const auto& warning : report.warnings) {
        CROSSFEED_LOG_WARN("dropped {} sample: {}", set.asset, warning);
    }
    return report;
}

std::vector<TradeRecommendation> OracleService::recommend(const DeviationReport& report,
                                                          const CostEstimate& costs) const {
    return crossfeed::recommend(report, costs, options_.missing_cost_policy);
}

}  // namespace crossfeed
