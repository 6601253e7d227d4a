#ifndef PEG_ENGINE_HPP
#define PEG_ENGINE_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "collaborators.hpp"
#include "config.hpp"
#include "custody.hpp"
#include "ledger.hpp"
#include "liquidation.hpp"
#include "oracle_guard.hpp"
#include "registry.hpp"
#include "risk_engine.hpp"
#include "transaction.hpp"
#include "types.hpp"

namespace peg {

// =============================================================================
// Account Information
// =============================================================================

struct AccountInformation {
    U256 total_debt_minted;
    U256 collateral_value_usd;
};

// =============================================================================
// Engine Listener
//
// Notified only after an operation committed and the reentrancy guard was
// released, so a listener may call back into the engine.
// =============================================================================

class IEngineListener {
public:
    virtual ~IEngineListener() = default;

    virtual void on_collateral_deposited(const Address& user, const Address& asset,
                                         const U256& amount) noexcept {
        (void)user; (void)asset; (void)amount;
    }
    virtual void on_collateral_redeemed(const Address& from, const Address& to,
                                        const Address& asset, const U256& amount) noexcept {
        (void)from; (void)to; (void)asset; (void)amount;
    }
    virtual void on_debt_minted(const Address& user, const U256& amount) noexcept {
        (void)user; (void)amount;
    }
    virtual void on_debt_burned(const Address& on_behalf, const Address& payer,
                                const U256& amount) noexcept {
        (void)on_behalf; (void)payer; (void)amount;
    }
    virtual void on_liquidation(const LiquidationResult& result) noexcept {
        (void)result;
    }
};

// =============================================================================
// Engine - collateral/debt facade
//
// Every state-mutating entry point runs under the reentrancy guard as one
// transaction: check, effect, verify health, then collaborator interactions.
// Nothing is locked internally; callers serialize operations.
// =============================================================================

class Engine {
public:
    Engine(const EngineConfig& config, ICollaboratorDirectory& directory,
           Clock clock = system_clock_seconds);
    ~Engine() = default;

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // =========================================================================
    // State-mutating operations (`caller` is the account acting)
    // =========================================================================

    void deposit_collateral(const Address& caller, const Address& asset, const U256& amount);
    void mint_debt(const Address& caller, const U256& amount);
    void redeem_collateral(const Address& caller, const Address& asset, const U256& amount);
    void burn_debt(const Address& caller, const U256& amount);

    void deposit_and_mint(const Address& caller, const Address& asset,
                          const U256& collateral_amount, const U256& debt_amount);
    void redeem_and_burn(const Address& caller, const Address& asset,
                         const U256& collateral_amount, const U256& debt_amount);

    // `debt_to_cover` is USD-denominated debt the caller pays down for `user`
    LiquidationResult liquidate(const Address& caller, const Address& asset,
                                const Address& user, const U256& debt_to_cover);

    // =========================================================================
    // Queries
    // =========================================================================

    AccountInformation account_information(const Address& user) const;
    U256 collateral_balance(const Address& user, const Address& asset) const;
    U256 debt_of(const Address& user) const;
    HealthFactor health_factor(const Address& user) const;
    U256 account_collateral_value(const Address& user) const;
    U256 valuation_of(const Address& asset, const U256& amount) const;
    U256 token_amount_for_value(const Address& asset, const U256& usd_value) const;

    std::vector<Address> collateral_assets() const;
    std::optional<Address> price_feed(const Address& asset) const;
    const Address& debt_token() const { return config_.debt_token; }
    const Address& address() const { return config_.address; }

    // Users with any recorded collateral or debt
    std::vector<Address> accounts() const;
    U256 total_debt() const { return debt_.total(); }

    // =========================================================================
    // Parameters
    // =========================================================================

    static U256 min_health_factor() { return risk::MIN_HEALTH_FACTOR; }
    static uint64_t liquidation_bonus() { return risk::LIQUIDATION_BONUS_PCT; }
    static uint64_t liquidation_threshold() { return risk::LIQUIDATION_THRESHOLD_PCT; }
    static uint64_t liquidation_precision() { return risk::LIQUIDATION_PRECISION; }
    static U256 precision() { return risk::PRECISION; }
    uint64_t stale_timeout() const { return oracle_.timeout(); }

    static HealthFactor calculate_health_factor(const U256& collateral_value, const U256& debt) {
        return RiskEngine::calculate_health_factor(collateral_value, debt);
    }

    // Listener is not owned; nullptr detaches
    void set_listener(IEngineListener* listener) { listener_ = listener; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_operations;
        uint64_t total_rejected;
        uint64_t total_liquidations;
    };
    Stats get_stats() const;

private:
    template <typename Body>
    auto run(const char* operation, const Address& caller, Body&& body);
    template <typename Step>
    void guarded(const char* operation, const Address& caller, Transaction& tx, Step&& step);

    void require_supported(const Address& asset) const;
    static IDebtToken& resolve_debt_token(const EngineConfig& config,
                                          ICollaboratorDirectory& directory);

    EngineConfig config_;
    std::shared_ptr<const AssetRegistry> registry_;
    PriceOracleGuard oracle_;
    TransferAdapter custody_;
    CollateralLedger collateral_;
    DebtLedger debt_;
    RiskEngine risk_;
    LiquidationProtocol liquidation_;
    ReentrancyGuard guard_;

    IEngineListener* listener_{nullptr};

    std::atomic<uint64_t> total_operations_{0};
    std::atomic<uint64_t> total_rejected_{0};
    std::atomic<uint64_t> total_liquidations_{0};
};

} // namespace peg

#endif // PEG_ENGINE_HPP
