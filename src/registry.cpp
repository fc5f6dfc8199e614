// Crossfeed - Network Endpoint Registry Implementation

#include <crossfeed/registry.hpp>
#include <crossfeed/errors.hpp>
#include <set>

namespace crossfeed {

EndpointRegistry::EndpointRegistry(const Config& config) {
    if (config.networks.empty()) {
        throw ConfigError("Endpoint registry needs at least one network");
    }

    for (const auto& [id, net] : config.networks) {
        NetworkEndpoint ep;
        ep.id = id;
        ep.name = net.name.empty() ? id : net.name;
        ep.url = net.endpoint_url();
        ep.chain_id = net.chain_id;
        ep.gas_limit = net.gas_limit;
        ep.native_price = net.native_price;
        ep.feeds = net.feeds;
        endpoints_.emplace(id, std::move(ep));
    }
}

EndpointRegistry EndpointRegistry::defaults() {
    return EndpointRegistry(Config::defaults());
}

std::vector<std::string> EndpointRegistry::networks() const {
    std::vector<std::string> ids;
    ids.reserve(endpoints_.size());
    for (const auto& [id, ep] : endpoints_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> EndpointRegistry::assets() const {
    std::set<std::string> all;
    for (const auto& [id, ep] : endpoints_) {
        for (const auto& [asset, address] : ep.feeds) {
            all.insert(asset);
        }
    }
    return {all.begin(), all.end()};
}

const NetworkEndpoint& EndpointRegistry::endpoint(const std::string& network) const {
    auto it = endpoints_.find(network);
    if (it == endpoints_.end()) {
        throw FeedNotFoundError("Unknown network: " + network);
    }
    return it->second;
}

const std::string& EndpointRegistry::feed_address(const std::string& network,
                                                  const std::string& asset) const {
    const auto& ep = endpoint(network);
    auto it = ep.feeds.find(asset);
    if (it == ep.feeds.end()) {
        throw FeedNotFoundError("Price feed not found for " + asset + " on " + network);
    }
    return it->second;
}

bool EndpointRegistry::contains(const std::string& network) const noexcept {
    return endpoints_.find(network) != endpoints_.end();
}

bool EndpointRegistry::supports(const std::string& network, const std::string& asset) const noexcept {
    auto it = endpoints_.find(network);
    return it != endpoints_.end() && it->second.feeds.count(asset) > 0;
}

}  // namespace crossfeed
