#ifndef PEG_RISK_ENGINE_HPP
#define PEG_RISK_ENGINE_HPP

#include <memory>

#include "ledger.hpp"
#include "oracle_guard.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace peg {

namespace risk {
constexpr uint64_t LIQUIDATION_THRESHOLD_PCT = 50;   // 200% collateralization
constexpr uint64_t LIQUIDATION_PRECISION = 100;
inline const U256 PRECISION = X18_ONE;
inline const U256 MIN_HEALTH_FACTOR = X18_ONE;      // 1.0
} // namespace risk

// =============================================================================
// RiskEngine - valuation and health-factor enforcement
//
// Prices are fetched through the oracle guard on every call and never cached.
// =============================================================================

class RiskEngine {
public:
    RiskEngine(std::shared_ptr<const AssetRegistry> registry, const PriceOracleGuard& oracle,
               const CollateralLedger& collateral, const DebtLedger& debt);

    // amount * normalized_price / 1e18, normalized_price = price * 1e18 / 10^decimals.
    // Throws UnsupportedAsset for null or unregistered assets.
    U256 valuation_of(const Address& asset, const U256& amount) const;

    // usd_value * 1e18 / normalized_price
    U256 token_amount_for_value(const Address& asset, const U256& usd_value) const;

    // USD value of every collateral balance the user holds
    U256 account_value(const Address& user) const;

    // Unconstrained when the user has no debt (no price is fetched then)
    HealthFactor health_factor(const Address& user) const;

    // Throws HealthFactorBroken when below MIN_HEALTH_FACTOR
    void assert_healthy(const Address& user) const;

    static HealthFactor calculate_health_factor(const U256& collateral_value, const U256& debt);

private:
    const CollateralAsset& require_asset(const Address& asset) const;
    U256 normalized_price(const CollateralAsset& asset) const;

    std::shared_ptr<const AssetRegistry> registry_;
    const PriceOracleGuard& oracle_;
    const CollateralLedger& collateral_;
    const DebtLedger& debt_;
};

} // namespace peg

#endif // PEG_RISK_ENGINE_HPP
