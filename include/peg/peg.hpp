#ifndef PEG_PEG_HPP
#define PEG_PEG_HPP

// =============================================================================
// pegcore - collateral/debt ledger and risk core of an overcollateralized
// pegged token
//
//   PriceOracleGuard    fail-closed staleness checks on price feeds
//   CollateralLedger    per-user, per-asset deposited collateral
//   DebtLedger          per-user minted debt
//   RiskEngine          valuation and health factor
//   LiquidationProtocol atomic seize / settle / verify sequence
//   Engine              deposit / mint / redeem / burn / liquidate facade
//   MemoryChain         in-process collaborators for simulation and tests
//
// =============================================================================

#include "types.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "oracle_guard.hpp"
#include "transaction.hpp"
#include "custody.hpp"
#include "ledger.hpp"
#include "risk_engine.hpp"
#include "liquidation.hpp"
#include "engine.hpp"
#include "memory_chain.hpp"

#endif // PEG_PEG_HPP
