// =============================================================================
// engine.cpp - Engine facade
// =============================================================================

#include "peg/engine.hpp"

#include <algorithm>
#include <optional>
#include <type_traits>
#include <utility>

#include "peg/errors.hpp"
#include "peg/logger.hpp"

namespace peg {

// =============================================================================
// Constructor
// =============================================================================

IDebtToken& Engine::resolve_debt_token(const EngineConfig& config,
                                       ICollaboratorDirectory& directory) {
    if (addresses::is_zero(config.address)) {
        throw InvalidArgument("engine address is null");
    }
    if (addresses::is_zero(config.debt_token)) {
        throw InvalidArgument("debt token identity is null");
    }
    IDebtToken* token = directory.debt_token(config.debt_token);
    if (!token) {
        throw ConfigurationError("unknown debt token " + addresses::to_hex(config.debt_token));
    }
    return *token;
}

Engine::Engine(const EngineConfig& config, ICollaboratorDirectory& directory, Clock clock)
    : config_(config),
      registry_(AssetRegistry::build(config_, directory)),
      oracle_(std::move(clock)),
      custody_(config_.address, resolve_debt_token(config_, directory), config_.debt_token),
      collateral_(registry_, custody_),
      debt_(custody_),
      risk_(registry_, oracle_, collateral_, debt_),
      liquidation_(risk_, collateral_, debt_) {
    try {
        Logger::parse_level(config_.log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }

    PEG_LOG_INFO("engine " << addresses::to_hex(config_.address) << " started with "
                 << registry_->size() << " collateral asset(s), debt token "
                 << addresses::to_hex(config_.debt_token));
}

// =============================================================================
// Operation scope
// =============================================================================

template <typename Step>
void Engine::guarded(const char* operation, const Address& caller, Transaction& tx, Step&& step) {
    try {
        ReentrancyGuard::Scope scope(guard_);
        step();
        tx.commit();
        total_operations_.fetch_add(1, std::memory_order_relaxed);
        PEG_LOG_INFO(operation << " by " << addresses::to_hex(caller) << " committed");
    } catch (const EngineError& e) {
        total_rejected_.fetch_add(1, std::memory_order_relaxed);
        PEG_LOG_WARN(operation << " by " << addresses::to_hex(caller) << " rejected: "
                     << e.name() << ": " << e.what());
        throw;
    } catch (const std::exception& e) {
        total_rejected_.fetch_add(1, std::memory_order_relaxed);
        PEG_LOG_ERROR(operation << " by " << addresses::to_hex(caller)
                      << " aborted on invariant violation: " << e.what());
        throw;
    }
}

// Listener events are published after the guard is released
template <typename Body>
auto Engine::run(const char* operation, const Address& caller, Body&& body) {
    using Result = std::invoke_result_t<Body&, Transaction&>;
    Transaction tx;

    if constexpr (std::is_void_v<Result>) {
        guarded(operation, caller, tx, [&]() { body(tx); });
        tx.publish();
    } else {
        std::optional<Result> result;
        guarded(operation, caller, tx, [&]() { result.emplace(body(tx)); });
        tx.publish();
        return std::move(*result);
    }
}

void Engine::require_supported(const Address& asset) const {
    if (addresses::is_zero(asset)) {
        throw InvalidArgument("collateral asset identity is null");
    }
    if (!registry_->contains(asset)) {
        throw UnsupportedAsset(asset);
    }
}

namespace {

void require_positive(const U256& amount, const char* what) {
    if (amount == 0) {
        throw InvalidArgument(std::string(what) + " must be positive");
    }
}

} // namespace

// =============================================================================
// Collateral
// =============================================================================

void Engine::deposit_collateral(const Address& caller, const Address& asset, const U256& amount) {
    run("deposit_collateral", caller, [&](Transaction& tx) {
        require_positive(amount, "collateral amount");
        require_supported(asset);

        collateral_.deposit(tx, caller, asset, amount);

        tx.on_commit([this, caller, asset, amount]() {
            if (listener_) listener_->on_collateral_deposited(caller, asset, amount);
        });
    });
}

void Engine::redeem_collateral(const Address& caller, const Address& asset, const U256& amount) {
    run("redeem_collateral", caller, [&](Transaction& tx) {
        require_positive(amount, "collateral amount");
        require_supported(asset);

        U256 balance = collateral_.balance_of(caller, asset);
        if (amount > balance) {
            throw InvalidArgument("redeem amount " + x18::to_string(amount) +
                                  " exceeds deposited " + x18::to_string(balance));
        }

        collateral_.withdraw(tx, caller, caller, asset, amount);
        risk_.assert_healthy(caller);

        tx.on_commit([this, caller, asset, amount]() {
            if (listener_) listener_->on_collateral_redeemed(caller, caller, asset, amount);
        });
    });
}

// =============================================================================
// Debt
// =============================================================================

void Engine::mint_debt(const Address& caller, const U256& amount) {
    run("mint_debt", caller, [&](Transaction& tx) {
        require_positive(amount, "debt amount");

        debt_.mint(tx, caller, amount);
        risk_.assert_healthy(caller);

        tx.on_commit([this, caller, amount]() {
            if (listener_) listener_->on_debt_minted(caller, amount);
        });
    });
}

void Engine::burn_debt(const Address& caller, const U256& amount) {
    run("burn_debt", caller, [&](Transaction& tx) {
        require_positive(amount, "debt amount");

        U256 debt = debt_.debt_of(caller);
        if (amount > debt) {
            throw InvalidArgument("burn amount " + x18::to_string(amount) +
                                  " exceeds minted " + x18::to_string(debt));
        }

        debt_.burn(tx, caller, caller, amount);

        tx.on_commit([this, caller, amount]() {
            if (listener_) listener_->on_debt_burned(caller, caller, amount);
        });
    });
}

// =============================================================================
// Composite operations
// =============================================================================

void Engine::deposit_and_mint(const Address& caller, const Address& asset,
                              const U256& collateral_amount, const U256& debt_amount) {
    run("deposit_and_mint", caller, [&](Transaction& tx) {
        require_positive(collateral_amount, "collateral amount");
        require_positive(debt_amount, "debt amount");
        require_supported(asset);

        collateral_.deposit(tx, caller, asset, collateral_amount);
        debt_.mint(tx, caller, debt_amount);
        risk_.assert_healthy(caller);

        tx.on_commit([this, caller, asset, collateral_amount, debt_amount]() {
            if (!listener_) return;
            listener_->on_collateral_deposited(caller, asset, collateral_amount);
            listener_->on_debt_minted(caller, debt_amount);
        });
    });
}

void Engine::redeem_and_burn(const Address& caller, const Address& asset,
                             const U256& collateral_amount, const U256& debt_amount) {
    run("redeem_and_burn", caller, [&](Transaction& tx) {
        require_positive(collateral_amount, "collateral amount");
        require_positive(debt_amount, "debt amount");
        require_supported(asset);

        U256 debt = debt_.debt_of(caller);
        if (debt_amount > debt) {
            throw InvalidArgument("burn amount " + x18::to_string(debt_amount) +
                                  " exceeds minted " + x18::to_string(debt));
        }
        U256 balance = collateral_.balance_of(caller, asset);
        if (collateral_amount > balance) {
            throw InvalidArgument("redeem amount " + x18::to_string(collateral_amount) +
                                  " exceeds deposited " + x18::to_string(balance));
        }

        debt_.burn(tx, caller, caller, debt_amount);
        collateral_.withdraw(tx, caller, caller, asset, collateral_amount);
        risk_.assert_healthy(caller);

        tx.on_commit([this, caller, asset, collateral_amount, debt_amount]() {
            if (!listener_) return;
            listener_->on_debt_burned(caller, caller, debt_amount);
            listener_->on_collateral_redeemed(caller, caller, asset, collateral_amount);
        });
    });
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult Engine::liquidate(const Address& caller, const Address& asset,
                                    const Address& user, const U256& debt_to_cover) {
    LiquidationResult result = run("liquidate", caller, [&](Transaction& tx) {
        require_positive(debt_to_cover, "debt to cover");
        require_supported(asset);

        LiquidationResult r = liquidation_.execute(tx, caller, asset, user, debt_to_cover);

        tx.on_commit([this, r]() {
            if (!listener_) return;
            listener_->on_collateral_redeemed(r.target, r.liquidator, r.asset, r.collateral_seized);
            listener_->on_debt_burned(r.target, r.liquidator, r.debt_covered);
            listener_->on_liquidation(r);
        });
        return r;
    });

    total_liquidations_.fetch_add(1, std::memory_order_relaxed);
    return result;
}

// =============================================================================
// Queries
// =============================================================================

AccountInformation Engine::account_information(const Address& user) const {
    return AccountInformation{debt_.debt_of(user), risk_.account_value(user)};
}

U256 Engine::collateral_balance(const Address& user, const Address& asset) const {
    return collateral_.balance_of(user, asset);
}

U256 Engine::debt_of(const Address& user) const {
    return debt_.debt_of(user);
}

HealthFactor Engine::health_factor(const Address& user) const {
    return risk_.health_factor(user);
}

U256 Engine::account_collateral_value(const Address& user) const {
    return risk_.account_value(user);
}

U256 Engine::valuation_of(const Address& asset, const U256& amount) const {
    return risk_.valuation_of(asset, amount);
}

U256 Engine::token_amount_for_value(const Address& asset, const U256& usd_value) const {
    return risk_.token_amount_for_value(asset, usd_value);
}

std::vector<Address> Engine::collateral_assets() const {
    return registry_->ids();
}

std::optional<Address> Engine::price_feed(const Address& asset) const {
    return registry_->price_feed_of(asset);
}

std::vector<Address> Engine::accounts() const {
    std::vector<Address> out = collateral_.users();
    for (const auto& user : debt_.users()) out.push_back(user);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

Engine::Stats Engine::get_stats() const {
    return Stats{
        total_operations_.load(std::memory_order_relaxed),
        total_rejected_.load(std::memory_order_relaxed),
        total_liquidations_.load(std::memory_order_relaxed)
    };
}

} // namespace peg
