// Crossfeed - Types Implementation

#include <crossfeed/types.hpp>
#include <charconv>
#include <string>

namespace crossfeed {

namespace {

constexpr I128 pow10(int exp) noexcept {
    I128 result = 1;
    for (int i = 0; i < exp; ++i) {
        result *= 10;
    }
    return result;
}

std::string u128_to_string(U128 v) {
    if (v == 0) return "0";
    std::string digits;
    while (v > 0) {
        digits += static_cast<char>('0' + static_cast<int>(v % 10));
        v /= 10;
    }
    return std::string(digits.rbegin(), digits.rend());
}

}  // namespace

// Decimal implementation
Decimal Decimal::from_string(std::string_view s) {
    // Find decimal point
    auto dot = s.find('.');
    if (dot == std::string_view::npos) {
        // Integer
        int64_t val = 0;
        std::from_chars(s.data(), s.data() + s.size(), val);
        return from_int(val);
    }

    // Parse integer and fractional parts
    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part = s.substr(dot + 1);

    int64_t int_val = 0;
    if (!int_part.empty()) {
        std::from_chars(int_part.data(), int_part.data() + int_part.size(), int_val);
    }

    int64_t frac_val = 0;
    if (!frac_part.empty()) {
        // Pad or truncate to PRECISION digits
        std::string frac_str(frac_part);
        if (frac_str.size() < PRECISION) {
            frac_str.append(PRECISION - frac_str.size(), '0');
        } else if (frac_str.size() > PRECISION) {
            frac_str = frac_str.substr(0, PRECISION);
        }
        std::from_chars(frac_str.data(), frac_str.data() + frac_str.size(), frac_val);
    }

    bool negative = (!s.empty() && s[0] == '-');
    I128 result = static_cast<I128>(int_val) * SCALE + (negative ? -frac_val : frac_val);
    return Decimal(result);
}

std::optional<Decimal> Decimal::from_scaled(I128 raw, int decimals) noexcept {
    if (decimals < 0 || decimals > 36) {
        return std::nullopt;
    }

    if (decimals >= PRECISION) {
        return Decimal(raw / pow10(decimals - PRECISION));
    }

    I128 mult = pow10(PRECISION - decimals);
    I128 limit = math::I128_MAX / mult;
    if (raw > limit || raw < -limit) {
        return std::nullopt;
    }
    return Decimal(raw * mult);
}

std::string Decimal::to_string() const {
    U128 abs_val = math::abs_u128(value_);
    U128 int_part = abs_val / static_cast<U128>(SCALE);
    U128 frac_part = abs_val % static_cast<U128>(SCALE);

    std::string result;
    if (value_ < 0) result += '-';
    result += u128_to_string(int_part);
    result += '.';

    // Format fractional part with leading zeros
    std::string frac_str = u128_to_string(frac_part);
    result += std::string(PRECISION - frac_str.size(), '0');
    result += frac_str;

    // Trim trailing zeros after decimal point
    size_t last_non_zero = result.find_last_not_of('0');
    if (last_non_zero != std::string::npos && result[last_non_zero] == '.') {
        last_non_zero--;
    }
    result = result.substr(0, last_non_zero + 1);

    return result;
}

}  // namespace crossfeed
