// Crossfeed - Opportunity Monitor Implementation

#include <crossfeed/monitor.hpp>
#include <crossfeed/errors.hpp>
#include <crossfeed/log.hpp>
#include <chrono>

namespace crossfeed {

OpportunityMonitor::OpportunityMonitor(std::shared_ptr<const OracleService> oracle,
                                       std::shared_ptr<CostEstimator> costs,
                                       MonitorConfig config)
    : oracle_(std::move(oracle)), costs_(std::move(costs)), config_(std::move(config)) {
    if (!oracle_) {
        throw ConfigError("Monitor needs an oracle service");
    }
    if (!costs_) {
        throw ConfigError("Monitor needs a cost estimator");
    }
    if (config_.assets.empty()) {
        throw ConfigError("Monitor has no assets to watch");
    }
    if (config_.interval_ms <= 0) {
        throw ConfigError("Monitor interval must be positive");
    }
}

OpportunityMonitor::~OpportunityMonitor() {
    stop();
}

void OpportunityMonitor::on_round(RoundCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void OpportunityMonitor::start() {
    if (state_.load() == MonitorState::Stopped) {
        CROSSFEED_LOG_WARN("monitor already stopped, ignoring start");
        return;
    }
    if (running_.exchange(true)) {
        return;  // Already running
    }

    CROSSFEED_LOG_INFO("monitoring {} assets every {} ms", config_.assets.size(), config_.interval_ms);
    loop_thread_ = std::make_unique<std::thread>(&OpportunityMonitor::run_loop, this);
}

void OpportunityMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_.notify_all();

    if (loop_thread_ && loop_thread_->joinable()) {
        loop_thread_->join();
    }
    loop_thread_.reset();
    state_.store(MonitorState::Stopped);
}

void OpportunityMonitor::run_loop() {
    using Clock = std::chrono::steady_clock;
    const auto interval = std::chrono::milliseconds(config_.interval_ms);
    auto next_tick = Clock::now();

    while (running_.load()) {
        for (const auto& asset : config_.assets) {
            if (!running_.load()) break;
            run_round(asset);
        }

        next_tick += interval;
        auto now = Clock::now();
        if (next_tick < now) {
            CROSSFEED_LOG_DEBUG("round overran the interval, next tick now");
            next_tick = now;
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_until(lock, next_tick, [this] { return !running_.load(); });
    }
}

RoundResult OpportunityMonitor::run_once(const std::string& asset) {
    return run_round(asset);
}

RoundResult OpportunityMonitor::run_round(const std::string& asset) {
    RoundResult result = evaluate_round(asset);
    // Outside the round lock, so a callback may start another round
    publish(result);
    return result;
}

RoundResult OpportunityMonitor::evaluate_round(const std::string& asset) {
    // Single flight across the scheduler and run_once callers
    std::lock_guard<std::mutex> round_lock(round_mutex_);

    if (state_.load() != MonitorState::Stopped) {
        state_.store(MonitorState::Polling);
    }

    RoundResult result;
    result.asset = asset;
    result.started_at = now_ms();

    try {
        result.report = oracle_->get_current_deviation(asset);

        if (result.report.insufficient_data()) {
            CROSSFEED_LOG_INFO("{}: insufficient data ({} valid samples)",
                               asset, result.report.price_set.size());
        } else if (result.report.exceeds_threshold) {
            CROSSFEED_LOG_INFO("{}: deviation {}% exceeds {}%", asset,
                               result.report.deviation_percent.to_string(),
                               result.report.threshold_percent.to_string());
            result.cost_estimate = costs_->get_costs();
            result.recommendations = oracle_->recommend(result.report, *result.cost_estimate);
        } else {
            CROSSFEED_LOG_DEBUG("{}: deviation {}% within threshold", asset,
                                result.report.deviation_percent.to_string());
        }
    } catch (const std::exception& e) {
        CROSSFEED_LOG_ERROR("{} round failed: {}", asset, e.what());
        result.error = e.what();
        result.recommendations.clear();
    }

    result.finished_at = now_ms();

    rounds_completed_.fetch_add(1);
    if (result.error) rounds_failed_.fetch_add(1);
    if (result.triggered()) rounds_triggered_.fetch_add(1);

    if (state_.load() != MonitorState::Stopped) {
        state_.store(result.triggered() ? MonitorState::Triggered : MonitorState::Idle);
    }

    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        last_results_[asset] = result;
    }

    return result;
}

void OpportunityMonitor::publish(const RoundResult& result) {
    std::vector<RoundCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            CROSSFEED_LOG_ERROR("round callback for {} threw: {}", result.asset, e.what());
        }
    }
}

std::optional<RoundResult> OpportunityMonitor::last_result(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = last_results_.find(asset);
    if (it == last_results_.end()) return std::nullopt;
    return it->second;
}

MonitorStats OpportunityMonitor::stats() const noexcept {
    return MonitorStats{
        rounds_completed_.load(),
        rounds_triggered_.load(),
        rounds_failed_.load()
    };
}

}  // namespace crossfeed
