// Crossfeed - Multi-Network Aggregator
// Concurrent fan-out of price reads with independent failure capture

#pragma once

#include <crossfeed/price_feed.hpp>
#include <crossfeed/types.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace crossfeed {

/// Starts one per-network read in the background. May throw
/// std::system_error when no worker can be started.
using WorkerLauncher = std::function<void(std::function<void()>)>;

/// Runs the job on a new detached thread
void launch_detached(std::function<void()> job);

struct AggregatorOptions {
    std::chrono::milliseconds timeout{5000};  // Per network call
    int retries{0};                           // Extra attempts on SourceUnavailableError
    WorkerLauncher launcher{launch_detached};
};

/// Best-effort price collection across every registered network.
///
/// Each network is read on its own worker. A failing or slow network only
/// loses its own entry: failures are logged and recorded in
/// PriceSet::failures, calls still running at the deadline are abandoned
/// and finish in the background. A network whose worker cannot be started
/// is recorded as a failure too. Zero successes yield an empty PriceSet.
class MultiNetworkAggregator {
public:
    MultiNetworkAggregator(std::shared_ptr<const PriceFeedReader> reader, AggregatorOptions options);

    PriceSet collect_prices(const std::string& asset) const;

    [[nodiscard]] const AggregatorOptions& options() const noexcept { return options_; }
    [[nodiscard]] const PriceFeedReader& reader() const noexcept { return *reader_; }

private:
    std::shared_ptr<const PriceFeedReader> reader_;
    AggregatorOptions options_;
};

}  // namespace crossfeed
