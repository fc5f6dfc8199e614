// Crossfeed - Configuration
// Builder pattern for fluent configuration, TOML-subset files

#pragma once

#include <crossfeed/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crossfeed {

// How the recommendation engine treats networks absent from a cost estimate
enum class MissingCostPolicy : uint8_t {
    Zero = 0,     // Missing entries cost nothing (optimistic)
    Exclude = 1   // Pairs touching an unpriced network are skipped
};

inline constexpr const char* to_string(MissingCostPolicy p) noexcept {
    switch (p) {
        case MissingCostPolicy::Zero: return "zero";
        case MissingCostPolicy::Exclude: return "exclude";
    }
    return "unknown";
}

// Where the monitor gets its per-network cost estimate
enum class CostSource : uint8_t {
    Static = 0,  // [costs] table
    Gas = 1      // eth_gasPrice * gas_limit * native_price
};

inline constexpr const char* to_string(CostSource s) noexcept {
    switch (s) {
        case CostSource::Static: return "static";
        case CostSource::Gas: return "gas";
    }
    return "unknown";
}

// General settings
struct GeneralConfig {
    std::string log_level = "info";
    int timeout_ms = 5000;   // Per network call
    int retries = 0;         // Extra attempts on SourceUnavailableError
};

// Monitoring loop settings
struct MonitorConfig {
    std::vector<std::string> assets;
    Decimal threshold_percent{Decimal::from_double(0.5)};
    int64_t interval_ms = 60000;
    int64_t max_staleness_ms = 0;  // 0 disables the staleness check
    MissingCostPolicy missing_cost_policy = MissingCostPolicy::Zero;
    CostSource cost_source = CostSource::Static;
};

// One blockchain network and the price feeds it carries
class NetworkConfig {
public:
    std::string name;
    std::string rpc_url;
    std::optional<std::string> api_key;  // Appended to rpc_url when set
    int64_t chain_id = 0;
    uint64_t gas_limit = 250000;
    Decimal native_price;                // Native gas token in the price unit
    std::map<std::string, std::string> feeds;  // asset -> feed contract address

    NetworkConfig() = default;

    static NetworkConfig create(std::string_view name, std::string_view rpc_url, int64_t chain_id) {
        NetworkConfig cfg;
        cfg.name = std::string(name);
        cfg.rpc_url = std::string(rpc_url);
        cfg.chain_id = chain_id;
        return cfg;
    }

    NetworkConfig& with_feed(std::string_view asset, std::string_view address) {
        feeds[std::string(asset)] = std::string(address);
        return *this;
    }

    NetworkConfig& with_api_key(std::string_view key) {
        api_key = std::string(key);
        return *this;
    }

    NetworkConfig& with_gas(uint64_t limit, Decimal native) {
        gas_limit = limit;
        native_price = native;
        return *this;
    }

    [[nodiscard]] std::string endpoint_url() const {
        return api_key ? rpc_url + *api_key : rpc_url;
    }
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    MonitorConfig monitor;
    std::map<std::string, NetworkConfig> networks;
    CostEstimate costs;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Ethereum mainnet, Polygon and Optimism Chainlink feeds
    static Config defaults();

    // Throws ConfigError when the configuration cannot drive a monitor
    void validate() const;

    // Builder methods
    Config& with_network(std::string_view id, NetworkConfig cfg) {
        networks[std::string(id)] = std::move(cfg);
        return *this;
    }

    Config& with_feed(std::string_view network, std::string_view asset, std::string_view address) {
        networks[std::string(network)].with_feed(asset, address);
        return *this;
    }

    Config& with_cost(std::string_view network, Decimal cost) {
        costs[std::string(network)] = cost;
        return *this;
    }

    Config& watch(std::string_view asset) {
        monitor.assets.emplace_back(asset);
        return *this;
    }

    Config& set_timeout(int ms) {
        general.timeout_ms = ms;
        return *this;
    }

    Config& set_retries(int retries) {
        general.retries = retries;
        return *this;
    }

    Config& set_threshold(Decimal percent) {
        monitor.threshold_percent = percent;
        return *this;
    }

    Config& set_interval(int64_t ms) {
        monitor.interval_ms = ms;
        return *this;
    }

    Config& set_max_staleness(int64_t ms) {
        monitor.max_staleness_ms = ms;
        return *this;
    }

    Config& set_missing_cost_policy(MissingCostPolicy policy) {
        monitor.missing_cost_policy = policy;
        return *this;
    }

    Config& set_cost_source(CostSource source) {
        monitor.cost_source = source;
        return *this;
    }
};

}  // namespace crossfeed
