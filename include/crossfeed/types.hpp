// Crossfeed - Core Types
// Fixed-point decimal and the per-round oracle data model

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <crossfeed/math.hpp>

namespace crossfeed {

// Fixed-point decimal for exact financial arithmetic
// Stores value as integer * 10^(-precision)
class Decimal {
public:
    static constexpr int PRECISION = 18;
    static constexpr I128 SCALE = 1000000000000000000LL;

    constexpr Decimal() noexcept : value_(0) {}
    constexpr explicit Decimal(I128 scaled) noexcept : value_(scaled) {}

    static Decimal from_double(double d) noexcept {
        return Decimal(static_cast<I128>(static_cast<long double>(d) * static_cast<long double>(SCALE)));
    }

    static constexpr Decimal from_int(int64_t v) noexcept {
        return Decimal(static_cast<I128>(v) * SCALE);
    }

    static Decimal from_string(std::string_view s);

    // raw * 10^(-decimals), truncated to PRECISION digits.
    // Returns nullopt when the result does not fit.
    static std::optional<Decimal> from_scaled(I128 raw, int decimals) noexcept;

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(value_) / static_cast<double>(SCALE);
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] I128 scaled_value() const noexcept { return value_; }

    // nullopt on overflow or division by zero
    [[nodiscard]] constexpr std::optional<Decimal> checked_mul(Decimal rhs) const noexcept {
        auto r = math::mul_div(value_, rhs.value_, SCALE);
        if (!r) return std::nullopt;
        return Decimal(*r);
    }
    [[nodiscard]] constexpr std::optional<Decimal> checked_div(Decimal rhs) const noexcept {
        auto r = math::mul_div(value_, SCALE, rhs.value_);
        if (!r) return std::nullopt;
        return Decimal(*r);
    }

    constexpr Decimal operator+(Decimal rhs) const noexcept {
        return Decimal(value_ + rhs.value_);
    }
    constexpr Decimal operator-(Decimal rhs) const noexcept {
        return Decimal(value_ - rhs.value_);
    }
    // Saturate at max_value()/min_value() where the checked forms return nullopt
    constexpr Decimal operator*(Decimal rhs) const noexcept {
        auto r = checked_mul(rhs);
        return r ? *r : saturated((value_ < 0) != (rhs.value_ < 0));
    }
    constexpr Decimal operator/(Decimal rhs) const noexcept {
        auto r = checked_div(rhs);
        return r ? *r : saturated((value_ < 0) != (rhs.value_ < 0));
    }

    Decimal& operator+=(Decimal rhs) noexcept {
        value_ += rhs.value_;
        return *this;
    }

    constexpr bool operator==(Decimal rhs) const noexcept { return value_ == rhs.value_; }
    constexpr bool operator!=(Decimal rhs) const noexcept { return value_ != rhs.value_; }
    constexpr bool operator<(Decimal rhs) const noexcept { return value_ < rhs.value_; }
    constexpr bool operator<=(Decimal rhs) const noexcept { return value_ <= rhs.value_; }
    constexpr bool operator>(Decimal rhs) const noexcept { return value_ > rhs.value_; }
    constexpr bool operator>=(Decimal rhs) const noexcept { return value_ >= rhs.value_; }

    constexpr Decimal abs() const noexcept { return Decimal(value_ < 0 ? -value_ : value_); }
    constexpr bool is_zero() const noexcept { return value_ == 0; }
    constexpr bool is_positive() const noexcept { return value_ > 0; }
    constexpr bool is_negative() const noexcept { return value_ < 0; }

    static constexpr Decimal zero() noexcept { return Decimal(0); }
    static constexpr Decimal one() noexcept { return Decimal(SCALE); }
    static constexpr Decimal max_value() noexcept { return Decimal(math::I128_MAX); }
    static constexpr Decimal min_value() noexcept { return Decimal(math::I128_MIN); }

private:
    static constexpr Decimal saturated(bool negative) noexcept {
        return negative ? min_value() : max_value();
    }

    I128 value_;
};

// One normalized price read from one network's feed
struct PriceSample {
    std::string network;
    std::string asset;
    Decimal price;
    int64_t observed_at{0};  // Local read completion, unix ms
    int64_t updated_at{0};   // On-chain round update, unix seconds
};

// Samples for one asset in one evaluation round, keyed by network
struct PriceSet {
    std::string asset;
    int64_t collected_at{0};  // Unix ms, set once all calls settled
    std::map<std::string, PriceSample> samples;
    std::map<std::string, std::string> failures;  // network -> reason

    [[nodiscard]] bool empty() const noexcept { return samples.empty(); }
    [[nodiscard]] size_t size() const noexcept { return samples.size(); }

    [[nodiscard]] std::optional<Decimal> price(const std::string& network) const {
        auto it = samples.find(network);
        if (it == samples.end()) return std::nullopt;
        return it->second.price;
    }
};

struct DeviationReport {
    std::string asset;
    Decimal deviation_percent;
    PriceSet price_set;  // Valid samples only
    bool exceeds_threshold = false;
    Decimal threshold_percent;
    int64_t evaluated_at{0};
    std::vector<std::string> warnings;

    [[nodiscard]] bool insufficient_data() const noexcept {
        return price_set.size() < 2;
    }
};

// Fee cost per network, in the same unit as price
using CostEstimate = std::map<std::string, Decimal>;

struct TradeRecommendation {
    std::string buy_network;
    std::string sell_network;
    Decimal buy_price;
    Decimal sell_price;
    Decimal price_difference;
    std::map<std::string, Decimal> estimated_costs;
    Decimal potential_profit;

    [[nodiscard]] bool is_profitable() const noexcept {
        return potential_profit.is_positive();
    }
};

// Timestamp utilities
inline int64_t now_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace crossfeed
