// Crossfeed - Cost Estimation
// Per-network fee estimates fed into the recommendation engine

#pragma once

#include <crossfeed/registry.hpp>
#include <crossfeed/types.hpp>
#include <functional>
#include <memory>

namespace crossfeed {

/// Source of per-network trading costs, in the price unit
class CostEstimator {
public:
    virtual ~CostEstimator() = default;

    /// Networks the estimator cannot price are absent from the result
    virtual CostEstimate get_costs() = 0;
};

/// Fixed costs, typically the [costs] table of the configuration
class StaticCostEstimator : public CostEstimator {
public:
    explicit StaticCostEstimator(CostEstimate costs) : costs_(std::move(costs)) {}

    CostEstimate get_costs() override { return costs_; }

private:
    CostEstimate costs_;
};

/// Gas price in wei for one network
using GasPriceSource = std::function<I128(const NetworkEndpoint&)>;

/// cost = gas_price * gas_limit / 1e18 * native_price, per network.
/// A network whose gas price cannot be read is logged and left out.
class GasCostEstimator : public CostEstimator {
public:
    /// eth_gasPrice over each network's RPC endpoint
    GasCostEstimator(std::shared_ptr<const EndpointRegistry> registry, int timeout_ms);

    GasCostEstimator(std::shared_ptr<const EndpointRegistry> registry, GasPriceSource source);

    CostEstimate get_costs() override;

    /// Cost of one transaction; nullopt when the value does not fit
    static std::optional<Decimal> transaction_cost(I128 gas_price_wei, uint64_t gas_limit,
                                                   Decimal native_price) noexcept;

private:
    std::shared_ptr<const EndpointRegistry> registry_;
    GasPriceSource source_;
};

}  // namespace crossfeed
