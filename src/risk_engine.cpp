// =============================================================================
// risk_engine.cpp - Collateral valuation and health factor
// =============================================================================

#include "peg/risk_engine.hpp"

#include "peg/errors.hpp"
#include "peg/logger.hpp"

namespace peg {

RiskEngine::RiskEngine(std::shared_ptr<const AssetRegistry> registry,
                       const PriceOracleGuard& oracle,
                       const CollateralLedger& collateral, const DebtLedger& debt)
    : registry_(std::move(registry)), oracle_(oracle), collateral_(collateral), debt_(debt) {}

const CollateralAsset& RiskEngine::require_asset(const Address& asset) const {
    const CollateralAsset* entry = addresses::is_zero(asset) ? nullptr : registry_->find(asset);
    if (!entry) {
        throw UnsupportedAsset(asset);
    }
    return *entry;
}

U256 RiskEngine::normalized_price(const CollateralAsset& asset) const {
    PriceQuote quote = oracle_.latest(*asset.feed, asset.feed_id);
    // The guard rejects non-positive prices
    U256 price = static_cast<U256>(quote.price);
    return price * risk::PRECISION / x18::pow10(quote.decimals);
}

U256 RiskEngine::valuation_of(const Address& asset, const U256& amount) const {
    const CollateralAsset& entry = require_asset(asset);
    return amount * normalized_price(entry) / risk::PRECISION;
}

U256 RiskEngine::token_amount_for_value(const Address& asset, const U256& usd_value) const {
    const CollateralAsset& entry = require_asset(asset);
    U256 price = normalized_price(entry);
    if (price == 0) {
        // Only reachable for feeds with more precision than 18 decimals and a tiny answer
        throw StalePrice(entry.feed_id, "price normalizes to zero");
    }
    return usd_value * risk::PRECISION / price;
}

U256 RiskEngine::account_value(const Address& user) const {
    U256 total = 0;
    for (const auto& asset : registry_->assets()) {
        U256 amount = collateral_.balance_of(user, asset.id);
        if (amount == 0) continue;
        total += amount * normalized_price(asset) / risk::PRECISION;
    }
    return total;
}

HealthFactor RiskEngine::calculate_health_factor(const U256& collateral_value, const U256& debt) {
    if (debt == 0) return HealthFactor::unconstrained();
    return HealthFactor::ratio(collateral_value * risk::LIQUIDATION_THRESHOLD_PCT *
                               risk::PRECISION / (risk::LIQUIDATION_PRECISION * debt));
}

HealthFactor RiskEngine::health_factor(const Address& user) const {
    U256 debt = debt_.debt_of(user);
    if (debt == 0) return HealthFactor::unconstrained();
    return calculate_health_factor(account_value(user), debt);
}

void RiskEngine::assert_healthy(const Address& user) const {
    HealthFactor hf = health_factor(user);
    if (hf < risk::MIN_HEALTH_FACTOR) {
        PEG_LOG_DEBUG("health factor of " << addresses::to_hex(user) << " is " << hf);
        throw HealthFactorBroken(user, hf.value());
    }
}

} // namespace peg
