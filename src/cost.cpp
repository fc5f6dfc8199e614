// Crossfeed - Cost Estimation Implementation

#include <crossfeed/cost.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/log.hpp>
#include <crossfeed/rpc.hpp>

namespace crossfeed {

namespace {

constexpr int NATIVE_DECIMALS = 18;  // wei per ether, and the same for MATIC

}  // namespace

GasCostEstimator::GasCostEstimator(std::shared_ptr<const EndpointRegistry> registry, int timeout_ms)
    : GasCostEstimator(std::move(registry), [timeout_ms](const NetworkEndpoint& endpoint) {
          return RpcClient(endpoint.url, timeout_ms).gas_price();
      }) {}

GasCostEstimator::GasCostEstimator(std::shared_ptr<const EndpointRegistry> registry,
                                   GasPriceSource source)
    : registry_(std::move(registry)), source_(std::move(source)) {
    if (!registry_ || !source_) {
        throw ConfigError("Gas cost estimator needs a registry and a gas price source");
    }
}

std::optional<Decimal> GasCostEstimator::transaction_cost(I128 gas_price_wei, uint64_t gas_limit,
                                                          Decimal native_price) noexcept {
    if (gas_price_wei < 0) return std::nullopt;

    I128 limit = static_cast<I128>(gas_limit);
    if (limit != 0 && gas_price_wei > (static_cast<I128>(1) << 126) / limit) {
        return std::nullopt;
    }

    auto native_amount = Decimal::from_scaled(gas_price_wei * limit, NATIVE_DECIMALS);
    if (!native_amount) return std::nullopt;
    return native_amount->checked_mul(native_price);
}

CostEstimate GasCostEstimator::get_costs() {
    CostEstimate costs;

    for (const auto& network : registry_->networks()) {
        const auto& endpoint = registry_->endpoint(network);
        try {
            I128 gas_price = source_(endpoint);
            auto cost = transaction_cost(gas_price, endpoint.gas_limit, endpoint.native_price);
            if (!cost) {
                CROSSFEED_LOG_WARN("gas cost on {} out of range", network);
                continue;
            }
            costs[network] = *cost;
        } catch (const std::exception& e) {
            CROSSFEED_LOG_WARN("no gas price for {}: {}", network, e.what());
        }
    }

    return costs;
}

}  // namespace crossfeed
