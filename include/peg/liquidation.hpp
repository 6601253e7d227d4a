#ifndef PEG_LIQUIDATION_HPP
#define PEG_LIQUIDATION_HPP

#include "ledger.hpp"
#include "risk_engine.hpp"
#include "transaction.hpp"
#include "types.hpp"

namespace peg {

namespace risk {
constexpr uint64_t LIQUIDATION_BONUS_PCT = 10;
} // namespace risk

// =============================================================================
// Liquidation Result
// =============================================================================

struct LiquidationResult {
    Address target;
    Address liquidator;
    Address asset;
    U256 debt_covered;        // debt tokens burned on the target's behalf
    U256 collateral_seized;   // includes the bonus
    U256 bonus;
    HealthFactor starting_hf;
    HealthFactor ending_hf;
};

// =============================================================================
// LiquidationProtocol
//
// eligible-check -> seize -> settle-debt -> verify-improved ->
// verify-liquidator-health, all inside the caller's transaction. Any failure
// propagates and the transaction unwinds every step.
//
// Liquidations only pay out while the target holds enough collateral to
// cover debt_to_cover plus the bonus. Positions at or below 100%
// collateralization cannot be liquidated at a reduced bonus.
// =============================================================================

class LiquidationProtocol {
public:
    LiquidationProtocol(const RiskEngine& risk, CollateralLedger& collateral, DebtLedger& debt);

    LiquidationResult execute(Transaction& tx, const Address& liquidator, const Address& asset,
                              const Address& target, const U256& debt_to_cover);

private:
    const RiskEngine& risk_;
    CollateralLedger& collateral_;
    DebtLedger& debt_;
};

} // namespace peg

#endif // PEG_LIQUIDATION_HPP
