// =============================================================================
// types.cpp - Addresses, X18 Arithmetic, Error Names
// =============================================================================

#include "dsc/types.hpp"
#include <algorithm>
#include <chrono>

namespace dsc {

// =============================================================================
// Addresses
// =============================================================================

namespace address {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool from_hex(const std::string& hex, Address& out) {
    size_t offset = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        offset = 2;
    }
    if (hex.size() - offset != 40) return false;

    Address addr = {};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[offset + 2 * i]);
        int lo = hex_value(hex[offset + 2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = addr;
    return true;
}

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string s = "0x";
    s.reserve(42);
    for (auto b : addr) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

} // namespace address

// =============================================================================
// X18 Arithmetic
// =============================================================================

namespace x18 {

I128 pow10(uint32_t exp) {
    if (exp > 38) {
        throw DSCError(errors::MATH_OVERFLOW, "pow10 exponent " + std::to_string(exp));
    }
    I128 v = 1;
    for (uint32_t i = 0; i < exp; ++i) v *= 10;
    return v;
}

namespace {

U128 magnitude(I128 v) {
    return v < 0 ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

// Full 128x128 -> 256 bit product as (hi, lo)
void mul_wide(U128 a, U128 b, U128& hi, U128& lo) {
    const U128 mask = (U128(1) << 64) - 1;
    U128 a0 = a & mask, a1 = a >> 64;
    U128 b0 = b & mask, b1 = b >> 64;

    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;

    U128 mid = (p00 >> 64) + (p01 & mask) + (p10 & mask);
    lo = (p00 & mask) | (mid << 64);
    hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
}

} // namespace

I128 mul_div(I128 a, I128 b, I128 d) {
    if (d == 0) {
        throw DSCError(errors::MATH_OVERFLOW, "division by zero");
    }

    bool negative = (a < 0) != (b < 0);
    if (d < 0) negative = !negative;

    U128 ud = magnitude(d);
    U128 hi = 0, lo = 0;
    mul_wide(magnitude(a), magnitude(b), hi, lo);

    // Quotient must fit in 128 bits
    if (hi >= ud) {
        throw DSCError(errors::MATH_OVERFLOW, "mul_div quotient exceeds 128 bits");
    }

    // Shift-subtract long division of (hi:lo) by ud; remainder stays below ud < 2^127
    U128 rem = hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        rem = (rem << 1) | ((lo >> i) & 1);
        if (rem >= ud) {
            rem -= ud;
            q |= U128(1) << i;
        }
    }

    if (q > static_cast<U128>(I128_MAX)) {
        throw DSCError(errors::MATH_OVERFLOW, "mul_div result exceeds I128");
    }

    I128 result = static_cast<I128>(q);
    return negative ? -result : result;
}

I128 add(I128 a, I128 b) {
    I128 sum = 0;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw DSCError(errors::MATH_OVERFLOW, "sum exceeds I128");
    }
    return sum;
}

std::string to_string(I128 v) {
    if (v == 0) return "0";
    U128 m = magnitude(v);
    std::string s;
    while (m > 0) {
        s.push_back(static_cast<char>('0' + static_cast<int>(m % 10)));
        m /= 10;
    }
    if (v < 0) s.push_back('-');
    std::reverse(s.begin(), s.end());
    return s;
}

std::string format(I128 v) {
    U128 m = magnitude(v);
    U128 one = static_cast<U128>(X18_ONE);
    std::string whole = to_string(static_cast<I128>(m / one));
    std::string frac = to_string(static_cast<I128>(m % one));
    frac.insert(0, 18 - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') frac.pop_back();

    std::string s = (v < 0) ? "-" : "";
    s += whole;
    if (!frac.empty()) {
        s += ".";
        s += frac;
    }
    return s;
}

bool parse(const std::string& text, I128& out) {
    if (text.empty()) return false;

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-') {
        negative = true;
        pos = 1;
    }

    U128 whole = 0;
    U128 frac = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;
    const U128 limit = static_cast<U128>(I128_MAX) / static_cast<U128>(X18_ONE);

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') return false;
        seen_digit = true;
        if (seen_dot) {
            if (frac_digits == 18) continue;  // truncate beyond 18 places
            frac = frac * 10 + static_cast<U128>(c - '0');
            ++frac_digits;
        } else {
            whole = whole * 10 + static_cast<U128>(c - '0');
            if (whole > limit) return false;
        }
    }
    if (!seen_digit) return false;

    for (int i = frac_digits; i < 18; ++i) frac *= 10;
    if (whole == limit && frac > static_cast<U128>(I128_MAX) % static_cast<U128>(X18_ONE)) {
        return false;
    }
    I128 value = static_cast<I128>(whole * static_cast<U128>(X18_ONE) + frac);
    out = negative ? -value : value;
    return true;
}

} // namespace x18

uint64_t system_clock_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case ZERO_AMOUNT: return "ZeroAmount";
        case UNSUPPORTED_ASSET: return "UnsupportedAsset";
        case TRANSFER_FAILED: return "TransferFailed";
        case HEALTH_FACTOR_BROKEN: return "HealthFactorBroken";
        case HEALTH_FACTOR_OK: return "HealthFactorOk";
        case HEALTH_FACTOR_NOT_IMPROVED: return "HealthFactorNotImproved";
        case INSUFFICIENT_COLLATERAL: return "InsufficientCollateral";
        case INSUFFICIENT_DEBT: return "InsufficientDebt";
        case ORACLE_ERROR: return "OracleError";
        case REENTRANCY_BLOCKED: return "ReentrancyBlocked";
        case CONFIG_MISMATCH: return "ConfigMismatch";
        case CONFIG_INVALID: return "ConfigInvalid";
        case MATH_OVERFLOW: return "MathOverflow";
        default: return "Unknown";
    }
}

} // namespace errors

} // namespace dsc
