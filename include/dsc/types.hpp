#ifndef DSC_TYPES_HPP
#define DSC_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <cstring>
#include <stdexcept>
#include <functional>

namespace dsc {

// =============================================================================
// Addresses (EVM-style 20-byte identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace address {

constexpr Address ZERO = {};

// Deterministic address from a small integer id (low 8 bytes, big endian)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Parse "0x" + 40 hex digits. Returns false on malformed input.
bool from_hex(const std::string& hex, Address& out);

std::string to_hex(const Address& addr);

} // namespace address

struct AddressHash {
    size_t operator()(const Address& addr) const {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

namespace x18 {

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// 10^exp for exp in [0, 38]
I128 pow10(uint32_t exp);

// a * b / d with a 256-bit intermediate product, truncated toward zero.
// Throws DSCError(MATH_OVERFLOW) if d == 0 or the result exceeds I128.
I128 mul_div(I128 a, I128 b, I128 d);

// a + b. Throws DSCError(MATH_OVERFLOW) if the sum exceeds I128.
I128 add(I128 a, I128 b);

inline I128 mul(I128 a, I128 b) {
    return mul_div(a, b, X18_ONE);
}

inline I128 div(I128 a, I128 b) {
    return mul_div(a, X18_ONE, b);
}

// Integer decimal representation
std::string to_string(I128 v);

// Fixed-point representation with 18 fractional digits, trailing zeros trimmed
std::string format(I128 v);

// Parse a decimal string ("2000", "0.5") into X18. Returns false on bad input.
bool parse(const std::string& text, I128& out);

} // namespace x18

// Seconds since epoch
using Clock = std::function<uint64_t()>;

uint64_t system_clock_seconds();

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t ZERO_AMOUNT = -1;
constexpr int32_t UNSUPPORTED_ASSET = -2;
constexpr int32_t TRANSFER_FAILED = -3;
constexpr int32_t HEALTH_FACTOR_BROKEN = -10;
constexpr int32_t HEALTH_FACTOR_OK = -11;
constexpr int32_t HEALTH_FACTOR_NOT_IMPROVED = -12;
constexpr int32_t INSUFFICIENT_COLLATERAL = -13;
constexpr int32_t INSUFFICIENT_DEBT = -14;
constexpr int32_t ORACLE_ERROR = -20;
constexpr int32_t REENTRANCY_BLOCKED = -30;
constexpr int32_t CONFIG_MISMATCH = -40;
constexpr int32_t CONFIG_INVALID = -41;
constexpr int32_t MATH_OVERFLOW = -50;

const char* name(int32_t code);
}

class DSCError : public std::runtime_error {
public:
    DSCError(int32_t code, const std::string& msg)
        : std::runtime_error(std::string(errors::name(code)) + ": " + msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace dsc

#endif // DSC_TYPES_HPP
