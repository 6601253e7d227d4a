#ifndef PEG_ORACLE_GUARD_HPP
#define PEG_ORACLE_GUARD_HPP

#include <functional>

#include "collaborators.hpp"
#include "types.hpp"

namespace peg {

// =============================================================================
// Price Quote (never cached; fetched fresh per valuation)
// =============================================================================

struct PriceQuote {
    U128 round_id;
    I256 price;
    uint64_t started_at;
    uint64_t updated_at;
    U128 answered_in_round;
    uint8_t decimals;
};

// Seconds since the Unix epoch
using Clock = std::function<uint64_t()>;

uint64_t system_clock_seconds();

// =============================================================================
// PriceOracleGuard - fail-closed freshness check around a price feed
//
// Rejects with StalePrice when the feed never answered, carried a stale round
// forward, or last updated more than STALE_TIMEOUT ago. Readings that cannot
// be valued at all (non-positive price, timestamp in the future, precision
// beyond MAX_FEED_DECIMALS) are rejected the same way.
// =============================================================================

class PriceOracleGuard {
public:
    static constexpr uint64_t STALE_TIMEOUT = 3 * 60 * 60;  // 3 hours
    static constexpr uint8_t MAX_FEED_DECIMALS = 36;

    explicit PriceOracleGuard(Clock clock = system_clock_seconds);

    PriceQuote latest(const IPriceFeed& feed, const Address& feed_id) const;

    uint64_t timeout() const { return STALE_TIMEOUT; }
    uint64_t now() const { return clock_(); }

private:
    Clock clock_;
};

} // namespace peg

#endif // PEG_ORACLE_GUARD_HPP
