// =============================================================================
// oracle_guard.cpp - PriceOracleGuard staleness checks
// =============================================================================

#include "peg/oracle_guard.hpp"

#include <chrono>

#include "peg/errors.hpp"
#include "peg/logger.hpp"

namespace peg {

uint64_t system_clock_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

PriceOracleGuard::PriceOracleGuard(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) clock_ = system_clock_seconds;
}

PriceQuote PriceOracleGuard::latest(const IPriceFeed& feed, const Address& feed_id) const {
    RoundData round = feed.latest_round_data();

    PriceQuote quote;
    quote.round_id = round.round_id;
    quote.price = round.answer;
    quote.started_at = round.started_at;
    quote.updated_at = round.updated_at;
    quote.answered_in_round = round.answered_in_round;
    quote.decimals = feed.decimals();

    auto reject = [&](const std::string& reason) {
        PEG_LOG_WARN("oracle " << addresses::to_hex(feed_id) << " rejected: " << reason);
        return StalePrice(feed_id, reason);
    };

    if (quote.updated_at == 0) {
        throw reject("round never answered");
    }
    if (quote.answered_in_round < quote.round_id) {
        throw reject("answered in round " + to_string(quote.answered_in_round) +
                     " < round " + to_string(quote.round_id));
    }

    uint64_t now = clock_();
    if (quote.updated_at > now) {
        throw reject("updated in the future (" + std::to_string(quote.updated_at) + " > " +
                     std::to_string(now) + ")");
    }
    uint64_t age = now - quote.updated_at;
    if (age > STALE_TIMEOUT) {
        throw reject("age " + std::to_string(age) + "s exceeds " +
                     std::to_string(STALE_TIMEOUT) + "s");
    }

    if (quote.price <= 0) {
        throw reject("non-positive answer " + quote.price.str());
    }
    if (quote.decimals > MAX_FEED_DECIMALS) {
        throw reject("unsupported precision " + std::to_string(quote.decimals));
    }

    return quote;
}

} // namespace peg
