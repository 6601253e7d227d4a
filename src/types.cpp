// =============================================================================
// types.cpp - Address, fixed-point and error-code helpers
// =============================================================================

#include "peg/types.hpp"

#include <cctype>
#include <stdexcept>

namespace peg {

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[(b >> 4) & 0x0F]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Address> from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// X18
// =============================================================================

namespace x18 {

std::string to_string(const U256& v) {
    U256 whole = v / X18_ONE;
    U256 frac = v % X18_ONE;

    std::string out = whole.str();
    if (frac == 0) return out;

    std::string digits = frac.str();
    digits.insert(0, 18 - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return out + "." + digits;
}

U256 parse(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }

    std::string_view mantissa = text;
    unsigned exponent = 0;

    auto e = text.find_first_of("eE");
    if (e != std::string_view::npos) {
        mantissa = text.substr(0, e);
        std::string_view exp_text = text.substr(e + 1);
        if (exp_text.empty() || exp_text.size() > 2) {
            throw std::invalid_argument("bad exponent in amount: " + std::string(text));
        }
        for (char c : exp_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("bad exponent in amount: " + std::string(text));
            }
            exponent = exponent * 10 + static_cast<unsigned>(c - '0');
        }
    }

    U256 value = 0;
    unsigned fraction_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;
    for (char c : mantissa) {
        if (c == '.') {
            if (seen_point) throw std::invalid_argument("bad amount: " + std::string(text));
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("bad amount: " + std::string(text));
        }
        seen_digit = true;
        value = value * 10 + static_cast<unsigned>(c - '0');
        if (seen_point) ++fraction_digits;
    }
    if (!seen_digit) {
        throw std::invalid_argument("bad amount: " + std::string(text));
    }
    if (fraction_digits > exponent) {
        throw std::invalid_argument("amount is not integral: " + std::string(text));
    }

    return value * pow10(exponent - fraction_digits);
}

} // namespace x18

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    return out;
}

// =============================================================================
// Health Factor
// =============================================================================

std::string HealthFactor::to_string() const {
    if (is_unconstrained()) return "unconstrained";
    return x18::to_string(*ratio_);
}

std::ostream& operator<<(std::ostream& os, const HealthFactor& hf) {
    return os << hf.to_string();
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "Ok";
        case INVALID_ARGUMENT: return "InvalidArgument";
        case UNSUPPORTED_ASSET: return "UnsupportedAsset";
        case CONFIGURATION_ERROR: return "ConfigurationError";
        case TRANSFER_FAILED: return "TransferFailed";
        case HEALTH_FACTOR_BROKEN: return "HealthFactorBroken";
        case HEALTH_FACTOR_OK: return "HealthFactorOk";
        case HEALTH_FACTOR_NOT_IMPROVED: return "HealthFactorNotImproved";
        case PRICE_STALE: return "StalePrice";
        case REENTRANCY: return "ReentrantCall";
        default: return "Unknown";
    }
}

} // namespace errors

} // namespace peg
