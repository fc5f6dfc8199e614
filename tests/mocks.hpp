// Crossfeed - Test Doubles
// In-memory feed contracts and cost estimators, no network access

#pragma once

#include <crossfeed/config.hpp>
#include <crossfeed/cost.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/feed_contract.hpp>
#include <crossfeed/registry.hpp>
#include <atomic>
#include <chrono>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace crossfeed::testing {

inline const std::string ETH_FEED = "0x5f4eC3Df9cbd43714FE2740f5E3616155c5b8419";
inline const std::string BTC_FEED = "0xF4030086522a5bEEa4988F8cA5B36dbC97BeE88c";

// Feed contract answering from a table, optionally slow or failing
class MockFeedContract : public FeedContract {
public:
    void set_round(const std::string& address, I128 answer, int decimals, uint64_t updated_at = 1700000000) {
        std::lock_guard<std::mutex> lock(mutex_);
        rounds_[address] = RoundData{answer, updated_at, decimals};
    }

    // Price with 8 decimals, as Chainlink USD feeds report
    void set_price(const std::string& address, int64_t whole, uint64_t updated_at = 1700000000) {
        set_round(address, static_cast<I128>(whole) * 100000000, 8, updated_at);
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ms_.store(delay.count()); }

    // Throw SourceUnavailableError on the next n calls
    void fail_next(int n) { failures_left_.store(n); }

    void fail_always() { failures_left_.store(1 << 30); }

    RoundData latest_round_data(const std::string& feed_address) override {
        calls_.fetch_add(1);

        auto delay = delay_ms_.load();
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }

        if (failures_left_.load() > 0) {
            failures_left_.fetch_sub(1);
            throw SourceUnavailableError("connection refused");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rounds_.find(feed_address);
        if (it == rounds_.end()) {
            throw SourceUnavailableError("execution reverted");
        }
        return it->second;
    }

    [[nodiscard]] int calls() const noexcept { return calls_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, RoundData> rounds_;
    std::atomic<int64_t> delay_ms_{0};
    std::atomic<int> failures_left_{0};
    std::atomic<int> calls_{0};
};

// One MockFeedContract per network, handed out by factory()
class MockNetworks {
public:
    explicit MockNetworks(std::initializer_list<std::string> networks) {
        for (const auto& network : networks) {
            contracts_[network] = std::make_shared<MockFeedContract>();
            config_.with_network(network,
                NetworkConfig::create(network, "http://" + network + ".invalid", 0)
                    .with_feed("ETH_USD", ETH_FEED)
                    .with_gas(250000, Decimal::from_int(2000)));
        }
        config_.watch("ETH_USD");
    }

    MockFeedContract& operator[](const std::string& network) { return *contracts_.at(network); }

    // ETH_USD price on every network, 8 decimals
    void set_prices(std::initializer_list<std::pair<std::string, int64_t>> prices) {
        for (const auto& [network, price] : prices) {
            contracts_.at(network)->set_price(ETH_FEED, price);
        }
    }

    Config& config() { return config_; }

    std::shared_ptr<const EndpointRegistry> registry() const {
        return std::make_shared<const EndpointRegistry>(config_);
    }

    FeedContractFactory factory() const {
        auto contracts = contracts_;
        return [contracts](const NetworkEndpoint& endpoint) -> std::shared_ptr<FeedContract> {
            auto it = contracts.find(endpoint.id);
            return it == contracts.end() ? nullptr : it->second;
        };
    }

private:
    Config config_;
    std::map<std::string, std::shared_ptr<MockFeedContract>> contracts_;
};

class MockCostEstimator : public CostEstimator {
public:
    explicit MockCostEstimator(CostEstimate costs = {}) : costs_(std::move(costs)) {}

    CostEstimate get_costs() override {
        calls_.fetch_add(1);
        if (fail_.load()) {
            throw SourceUnavailableError("gas oracle unreachable");
        }
        return costs_;
    }

    void set_fail(bool fail) { fail_.store(fail); }

    [[nodiscard]] int calls() const noexcept { return calls_.load(); }

private:
    CostEstimate costs_;
    std::atomic<bool> fail_{false};
    std::atomic<int> calls_{0};
};

inline PriceSample sample(const std::string& network, const std::string& asset, Decimal price,
                          int64_t updated_at = 0) {
    PriceSample s;
    s.network = network;
    s.asset = asset;
    s.price = price;
    s.observed_at = 1700000000000;
    s.updated_at = updated_at;
    return s;
}

// PriceSet of whole-number prices
inline PriceSet price_set(const std::string& asset,
                          std::initializer_list<std::pair<std::string, int64_t>> prices,
                          int64_t collected_at = 1700000000000) {
    PriceSet set;
    set.asset = asset;
    set.collected_at = collected_at;
    for (const auto& [network, price] : prices) {
        set.samples.emplace(network, sample(network, asset, Decimal::from_int(price)));
    }
    return set;
}

}  // namespace crossfeed::testing
