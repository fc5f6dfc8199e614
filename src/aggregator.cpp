// Crossfeed - Multi-Network Aggregator Implementation

#include <crossfeed/aggregator.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/log.hpp>
#include <future>
#include <system_error>
#include <thread>
#include <vector>

namespace crossfeed {

namespace {

using Clock = std::chrono::steady_clock;

PriceSample read_with_retry(const PriceFeedReader& reader,
                            const std::string& network,
                            const std::string& asset,
                            int retries,
                            Clock::time_point deadline) {
    for (int attempt = 0;; ++attempt) {
        try {
            return reader.read_price(network, asset);
        } catch (const SourceUnavailableError& e) {
            if (attempt >= retries || Clock::now() >= deadline) {
                throw;
            }
            CROSSFEED_LOG_DEBUG("retrying {} on {} after: {}", asset, network, e.what());
        }
    }
}

}  // namespace

void launch_detached(std::function<void()> job) {
    std::thread(std::move(job)).detach();
}

MultiNetworkAggregator::MultiNetworkAggregator(std::shared_ptr<const PriceFeedReader> reader,
                                               AggregatorOptions options)
    : reader_(std::move(reader)), options_(options) {
    if (!reader_) {
        throw ConfigError("Aggregator needs a price feed reader");
    }
    if (options_.timeout.count() <= 0) {
        throw ConfigError("Aggregator timeout must be positive");
    }
    if (!options_.launcher) {
        throw ConfigError("Aggregator needs a worker launcher");
    }
}

PriceSet MultiNetworkAggregator::collect_prices(const std::string& asset) const {
    struct Pending {
        std::string network;
        std::future<PriceSample> result;
    };

    auto deadline = Clock::now() + options_.timeout;
    std::vector<Pending> pending;

    PriceSet set;
    set.asset = asset;

    // Fan out: one background worker per network. A packaged_task future does
    // not block on destruction, so an abandoned call cannot stall the round.
    for (const auto& network : reader_->registry().networks()) {
        if (!reader_->registry().supports(network, asset)) {
            CROSSFEED_LOG_DEBUG("no {} feed on {}", asset, network);
            set.failures[network] = "no feed for " + asset;
            continue;
        }

        auto task = std::make_shared<std::packaged_task<PriceSample()>>(
            [reader = reader_, network, asset, retries = options_.retries, deadline]() {
                return read_with_retry(*reader, network, asset, retries, deadline);
            });
        auto result = task->get_future();
        try {
            options_.launcher([task]() { (*task)(); });
        } catch (const std::system_error& e) {
            CROSSFEED_LOG_WARN("could not start {} read on {}: {}", asset, network, e.what());
            set.failures[network] = std::string("could not start worker: ") + e.what();
            continue;
        }
        pending.push_back(Pending{network, std::move(result)});
    }

    // Fan in: every call settles or hits the shared deadline
    for (auto& p : pending) {
        if (p.result.wait_until(deadline) != std::future_status::ready) {
            CROSSFEED_LOG_WARN("{} on {} timed out after {} ms", asset, p.network, options_.timeout.count());
            set.failures[p.network] = "timed out after " + std::to_string(options_.timeout.count()) + " ms";
            continue;
        }

        try {
            auto sample = p.result.get();
            set.samples.emplace(p.network, std::move(sample));
        } catch (const std::exception& e) {
            CROSSFEED_LOG_WARN("failed to read {} on {}: {}", asset, p.network, e.what());
            set.failures[p.network] = e.what();
        }
    }

    set.collected_at = now_ms();

    CROSSFEED_LOG_DEBUG("collected {} of {} {} prices", set.samples.size(),
                        reader_->registry().size(), asset);
    return set;
}

}  // namespace crossfeed
