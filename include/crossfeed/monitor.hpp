// Crossfeed - Opportunity Monitor
// Single-flight periodic driver: aggregate, detect, recommend, publish

#pragma once

#include <crossfeed/config.hpp>
#include <crossfeed/cost.hpp>
#include <crossfeed/oracle.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace crossfeed {

enum class MonitorState : uint8_t {
    Idle = 0,
    Polling = 1,
    Triggered = 2,
    Stopped = 3
};

inline constexpr const char* to_string(MonitorState s) noexcept {
    switch (s) {
        case MonitorState::Idle: return "idle";
        case MonitorState::Polling: return "polling";
        case MonitorState::Triggered: return "triggered";
        case MonitorState::Stopped: return "stopped";
    }
    return "unknown";
}

/// Outcome of one evaluation round for one asset
struct RoundResult {
    std::string asset;
    DeviationReport report;
    std::vector<TradeRecommendation> recommendations;  // Only when triggered
    std::optional<CostEstimate> cost_estimate;         // Only when triggered
    std::optional<std::string> error;                  // Round failed
    int64_t started_at{0};
    int64_t finished_at{0};

    [[nodiscard]] bool triggered() const noexcept {
        return !error && report.exceeds_threshold;
    }
};

using RoundCallback = std::function<void(const RoundResult&)>;

struct MonitorStats {
    uint64_t rounds_completed{0};
    uint64_t rounds_triggered{0};
    uint64_t rounds_failed{0};
};

/// Repeats aggregation, detection and (when triggered) recommendation for
/// every configured asset on a fixed interval.
///
/// Rounds never overlap: evaluation is single flight, and the next tick
/// starts only after the previous round has been published. A round that
/// overruns the interval pushes the next tick to immediately after it;
/// missed ticks are not queued.
class OpportunityMonitor {
public:
    /// Throws ConfigError on missing collaborators, no assets or a
    /// non-positive interval
    OpportunityMonitor(std::shared_ptr<const OracleService> oracle,
                       std::shared_ptr<CostEstimator> costs,
                       MonitorConfig config);
    ~OpportunityMonitor();

    // Non-copyable
    OpportunityMonitor(const OpportunityMonitor&) = delete;
    OpportunityMonitor& operator=(const OpportunityMonitor&) = delete;

    /// Subscribe to completed rounds. Callbacks run on the thread that ran
    /// the round, after the round lock is released, so they may call
    /// run_once() or on_round(). They must not call stop().
    void on_round(RoundCallback callback);

    /// Start the scheduler; the first round runs immediately.
    /// Ignored when already running or stopped.
    void start();

    /// Wake the scheduler, wait for the in-flight round and join.
    /// The monitor is terminal afterwards.
    void stop();

    /// One synchronous round, published like a scheduled one
    RoundResult run_once(const std::string& asset);

    [[nodiscard]] std::optional<RoundResult> last_result(const std::string& asset) const;

    [[nodiscard]] MonitorState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] MonitorStats stats() const noexcept;
    [[nodiscard]] const MonitorConfig& config() const noexcept { return config_; }

private:
    void run_loop();
    RoundResult run_round(const std::string& asset);
    RoundResult evaluate_round(const std::string& asset);
    void publish(const RoundResult& result);

    std::shared_ptr<const OracleService> oracle_;
    std::shared_ptr<CostEstimator> costs_;
    MonitorConfig config_;

    std::vector<RoundCallback> callbacks_;
    std::map<std::string, RoundResult> last_results_;
    mutable std::mutex callbacks_mutex_;
    mutable std::mutex results_mutex_;
    std::mutex round_mutex_;

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    std::atomic<MonitorState> state_{MonitorState::Idle};
    std::unique_ptr<std::thread> loop_thread_;

    std::atomic<uint64_t> rounds_completed_{0};
    std::atomic<uint64_t> rounds_triggered_{0};
    std::atomic<uint64_t> rounds_failed_{0};
};

}  // namespace crossfeed
