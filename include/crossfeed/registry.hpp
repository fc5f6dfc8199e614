// Crossfeed - Network Endpoint Registry
// Immutable network -> endpoint and (network, asset) -> feed address mapping

#pragma once

#include <crossfeed/config.hpp>
#include <map>
#include <string>
#include <vector>

namespace crossfeed {

/// Connection parameters and price feeds of one network
struct NetworkEndpoint {
    std::string id;
    std::string name;
    std::string url;          // Resolved RPC endpoint, api key included
    int64_t chain_id{0};
    uint64_t gas_limit{0};
    Decimal native_price;
    std::map<std::string, std::string> feeds;  // asset -> feed address
};

/// Static endpoint registry, immutable after construction
class EndpointRegistry {
public:
    /// Throws ConfigError when no network is configured
    explicit EndpointRegistry(const Config& config);

    /// Registry over Config::defaults()
    static EndpointRegistry defaults();

    /// Registered network ids, sorted
    [[nodiscard]] std::vector<std::string> networks() const;

    /// Union of assets carried by any network, sorted
    [[nodiscard]] std::vector<std::string> assets() const;

    /// Throws FeedNotFoundError for an unknown network
    [[nodiscard]] const NetworkEndpoint& endpoint(const std::string& network) const;

    /// Throws FeedNotFoundError when network or asset is unknown
    [[nodiscard]] const std::string& feed_address(const std::string& network,
                                                  const std::string& asset) const;

    [[nodiscard]] bool contains(const std::string& network) const noexcept;
    [[nodiscard]] bool supports(const std::string& network, const std::string& asset) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return endpoints_.size(); }

private:
    std::map<std::string, NetworkEndpoint> endpoints_;
};

}  // namespace crossfeed
