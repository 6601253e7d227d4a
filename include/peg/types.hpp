#ifndef PEG_TYPES_HPP
#define PEG_TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace peg {

// =============================================================================
// Addresses (EVM 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address NONE = {};

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Address whose low 8 bytes hold `value` (big-endian), e.g. from_u64(0x9030)
constexpr Address from_u64(uint64_t value) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; case-insensitive
std::optional<Address> from_hex(std::string_view text);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places, 256-bit)
// =============================================================================

// Checked types: overflow throws std::overflow_error, unsigned underflow
// throws std::range_error.
using U256 = boost::multiprecision::checked_uint256_t;
using I256 = boost::multiprecision::checked_int256_t;
using U128 = unsigned __int128;

inline const U256 X18_ONE{1000000000000000000ULL};  // 1e18

namespace x18 {

inline U256 mul(const U256& a, const U256& b) {
    return (a * b) / X18_ONE;
}

inline U256 div(const U256& a, const U256& b) {
    return (a * X18_ONE) / b;
}

inline U256 from_int(uint64_t v) {
    return U256(v) * X18_ONE;
}

inline U256 pow10(unsigned exponent) {
    U256 result = 1;
    for (unsigned i = 0; i < exponent; ++i) result *= 10;
    return result;
}

// Decimal rendering of an X18 value: 10.5e18 -> "10.5"
std::string to_string(const U256& v);

// Parses an integer amount written either plainly ("1000000") or in
// scientific shorthand ("10e18", "0.5e18", "2000e8"). Throws
// std::invalid_argument when the text is malformed or not integral.
U256 parse(std::string_view text);

} // namespace x18

std::string to_string(U128 v);

// =============================================================================
// Health Factor
// =============================================================================

// Either unconstrained (no debt outstanding) or a fixed-point ratio where
// 1e18 == 1.0. Unconstrained compares greater than every ratio.
class HealthFactor {
public:
    static HealthFactor unconstrained() { return HealthFactor(); }
    static HealthFactor ratio(const U256& value) { return HealthFactor(value); }

    bool is_unconstrained() const { return !ratio_.has_value(); }

    // Only meaningful when !is_unconstrained()
    const U256& value() const { return *ratio_; }

    bool operator==(const HealthFactor& other) const { return ratio_ == other.ratio_; }
    bool operator!=(const HealthFactor& other) const { return !(*this == other); }

    bool operator<(const HealthFactor& other) const {
        if (is_unconstrained()) return false;
        if (other.is_unconstrained()) return true;
        return *ratio_ < *other.ratio_;
    }
    bool operator>(const HealthFactor& other) const { return other < *this; }
    bool operator<=(const HealthFactor& other) const { return !(other < *this); }
    bool operator>=(const HealthFactor& other) const { return !(*this < other); }

    bool operator<(const U256& threshold) const { return *this < HealthFactor(threshold); }
    bool operator>=(const U256& threshold) const { return !(*this < threshold); }

    std::string to_string() const;

private:
    HealthFactor() = default;
    explicit HealthFactor(const U256& value) : ratio_(value) {}

    std::optional<U256> ratio_;
};

std::ostream& operator<<(std::ostream& os, const HealthFactor& hf);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_ARGUMENT = -1;
constexpr int32_t UNSUPPORTED_ASSET = -2;
constexpr int32_t CONFIGURATION_ERROR = -3;
constexpr int32_t TRANSFER_FAILED = -10;
constexpr int32_t HEALTH_FACTOR_BROKEN = -11;
constexpr int32_t HEALTH_FACTOR_OK = -12;
constexpr int32_t HEALTH_FACTOR_NOT_IMPROVED = -13;
constexpr int32_t PRICE_STALE = -20;
constexpr int32_t REENTRANCY = -30;

// "StalePrice", "HealthFactorBroken", ... ; "Unknown" for unmapped codes
const char* name(int32_t code);
} // namespace errors

} // namespace peg

#endif // PEG_TYPES_HPP
