// =============================================================================
// liquidation.cpp - Atomic liquidation sequence
// =============================================================================

#include "peg/liquidation.hpp"

#include "peg/errors.hpp"
#include "peg/logger.hpp"

namespace peg {

LiquidationProtocol::LiquidationProtocol(const RiskEngine& risk, CollateralLedger& collateral,
                                         DebtLedger& debt)
    : risk_(risk), collateral_(collateral), debt_(debt) {}

LiquidationResult LiquidationProtocol::execute(Transaction& tx, const Address& liquidator,
                                               const Address& asset, const Address& target,
                                               const U256& debt_to_cover) {
    if (debt_to_cover == 0) {
        throw InvalidArgument("debt to cover must be positive");
    }
    if (addresses::is_zero(asset)) {
        throw InvalidArgument("collateral asset identity is null");
    }

    // Eligible-check
    HealthFactor starting_hf = risk_.health_factor(target);
    if (starting_hf >= risk::MIN_HEALTH_FACTOR) {
        throw HealthFactorOk(target);
    }

    U256 target_debt = debt_.debt_of(target);
    if (debt_to_cover > target_debt) {
        throw InvalidArgument("debt to cover " + x18::to_string(debt_to_cover) +
                              " exceeds outstanding debt " + x18::to_string(target_debt));
    }

    U256 base = risk_.token_amount_for_value(asset, debt_to_cover);
    U256 bonus = base * risk::LIQUIDATION_BONUS_PCT / risk::LIQUIDATION_PRECISION;
    U256 total_seize = base + bonus;

    U256 available = collateral_.balance_of(target, asset);
    if (total_seize > available) {
        throw InvalidArgument("seizing " + x18::to_string(total_seize) + " exceeds collateral " +
                              x18::to_string(available) + " held by " +
                              addresses::to_hex(target));
    }

    // Seize
    collateral_.withdraw(tx, target, liquidator, asset, total_seize);

    // Settle-debt
    debt_.burn(tx, target, liquidator, debt_to_cover);

    // Verify-improved
    HealthFactor ending_hf = risk_.health_factor(target);
    if (ending_hf <= starting_hf) {
        throw HealthFactorNotImproved(target);
    }

    // Verify-liquidator-health
    risk_.assert_healthy(liquidator);

    PEG_LOG_DEBUG("liquidation of " << addresses::to_hex(target) << ": seize "
                  << x18::to_string(total_seize) << ", health " << starting_hf << " -> "
                  << ending_hf);

    return LiquidationResult{target, liquidator, asset, debt_to_cover, total_seize, bonus,
                             starting_hf, ending_hf};
}

} // namespace peg
