// Crossfeed - Wide Integer Math
// Signed 128-bit mul/div through a 256-bit intermediate

#pragma once

#include <cstdint>
#include <optional>

namespace crossfeed {

using I128 = __int128;
using U128 = unsigned __int128;

namespace math {

inline constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);
inline constexpr I128 I128_MIN = -I128_MAX - 1;

struct U256 {
    U128 lo = 0;
    U128 hi = 0;
};

// Full 256-bit product of two 128-bit values
constexpr U256 mul_u128(U128 a, U128 b) noexcept {
    constexpr U128 MASK = (static_cast<U128>(1) << 64) - 1;

    U128 a_lo = a & MASK;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK) + (p2 & MASK);

    U256 result;
    result.lo = (p0 & MASK) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

// num / denom, nullopt when denom is zero or the quotient needs more than 128 bits
constexpr std::optional<U128> div_u256(U256 num, U128 denom) noexcept {
    if (denom == 0 || num.hi >= denom) {
        return std::nullopt;
    }

    // Restoring long division over the low word; rem < denom throughout
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    return quot;
}

constexpr U128 abs_u128(I128 v) noexcept {
    return v < 0 ? static_cast<U128>(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

// a * b / denom truncated toward zero, nullopt on division by zero or
// when the result does not fit in I128
constexpr std::optional<I128> mul_div(I128 a, I128 b, I128 denom) noexcept {
    if (denom == 0) {
        return std::nullopt;
    }

    bool negative = (a < 0) != (b < 0);
    if (denom < 0) negative = !negative;

    auto quot = div_u256(mul_u128(abs_u128(a), abs_u128(b)), abs_u128(denom));
    if (!quot) {
        return std::nullopt;
    }

    if (negative) {
        if (*quot > static_cast<U128>(I128_MAX) + 1) return std::nullopt;
        return static_cast<I128>(static_cast<U128>(0) - *quot);
    }
    if (*quot > static_cast<U128>(I128_MAX)) return std::nullopt;
    return static_cast<I128>(*quot);
}

}  // namespace math

}  // namespace crossfeed
