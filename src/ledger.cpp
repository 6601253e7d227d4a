// =============================================================================
// ledger.cpp - Collateral and debt bookkeeping
// =============================================================================

#include "peg/ledger.hpp"

#include "peg/errors.hpp"
#include "peg/logger.hpp"

namespace peg {

// =============================================================================
// CollateralLedger
// =============================================================================

CollateralLedger::CollateralLedger(std::shared_ptr<const AssetRegistry> registry,
                                   TransferAdapter& custody)
    : registry_(std::move(registry)), custody_(custody) {}

const CollateralAsset& CollateralLedger::require_asset(const Address& asset) const {
    if (addresses::is_zero(asset)) {
        throw InvalidArgument("collateral asset identity is null");
    }
    const CollateralAsset* entry = registry_->find(asset);
    if (!entry) {
        throw UnsupportedAsset(asset);
    }
    return *entry;
}

void CollateralLedger::set_balance(Transaction& tx, const Address& user, const Address& asset,
                                   const U256& value) {
    auto user_entry = balances_.try_emplace(user);
    auto slot_entry = user_entry.first->second.try_emplace(asset, U256(0));
    bool new_user = user_entry.second;
    bool new_slot = slot_entry.second;
    U256 previous = slot_entry.first->second;
    slot_entry.first->second = value;

    // Entries created here are erased again on rollback
    tx.on_rollback([this, user, asset, previous, new_user, new_slot]() {
        auto it = balances_.find(user);
        if (it == balances_.end()) return;
        if (new_slot) {
            it->second.erase(asset);
        } else {
            it->second[asset] = previous;
        }
        if (new_user && it->second.empty()) {
            balances_.erase(it);
        }
    });
}

void CollateralLedger::deposit(Transaction& tx, const Address& user, const Address& asset,
                               const U256& amount) {
    if (amount == 0) {
        throw InvalidArgument("deposit amount must be positive");
    }
    const CollateralAsset& entry = require_asset(asset);

    set_balance(tx, user, asset, balance_of(user, asset) + amount);

    IFungibleAsset* token = entry.asset;
    tx.schedule(Transaction::Phase::INBOUND, "pull collateral",
        [this, token, asset, user, amount]() {
            custody_.pull(*token, asset, user, amount);
        },
        [this, token, asset, user, amount]() {
            custody_.push(*token, asset, user, amount);
        });
}

void CollateralLedger::withdraw(Transaction& tx, const Address& from, const Address& to,
                                const Address& asset, const U256& amount) {
    if (amount == 0) {
        throw InvalidArgument("withdraw amount must be positive");
    }
    const CollateralAsset& entry = require_asset(asset);

    U256 balance = balance_of(from, asset);
    if (balance < amount) {
        throw LedgerInvariantError("collateral of " + addresses::to_hex(from) + " in " +
                                   addresses::to_hex(asset) + " would go negative (" +
                                   balance.str() + " - " + amount.str() + ")");
    }
    set_balance(tx, from, asset, balance - amount);

    IFungibleAsset* token = entry.asset;
    tx.schedule(Transaction::Phase::OUTBOUND, "push collateral",
        [this, token, asset, to, amount]() {
            custody_.push(*token, asset, to, amount);
        });
}

U256 CollateralLedger::balance_of(const Address& user, const Address& asset) const {
    auto user_it = balances_.find(user);
    if (user_it == balances_.end()) return 0;
    auto it = user_it->second.find(asset);
    return (it != user_it->second.end()) ? it->second : U256(0);
}

U256 CollateralLedger::total_of(const Address& asset) const {
    U256 total = 0;
    for (const auto& [user, assets] : balances_) {
        auto it = assets.find(asset);
        if (it != assets.end()) total += it->second;
    }
    return total;
}

std::vector<Address> CollateralLedger::users() const {
    std::vector<Address> out;
    out.reserve(balances_.size());
    for (const auto& [user, assets] : balances_) out.push_back(user);
    return out;
}

// =============================================================================
// DebtLedger
// =============================================================================

DebtLedger::DebtLedger(TransferAdapter& custody) : custody_(custody) {}

void DebtLedger::set_debt(Transaction& tx, const Address& user, const U256& value) {
    auto slot_entry = debts_.try_emplace(user, U256(0));
    bool new_slot = slot_entry.second;
    U256 previous = slot_entry.first->second;
    U256 previous_total = total_;
    total_ = total_ - previous + value;
    slot_entry.first->second = value;
    tx.on_rollback([this, user, previous, previous_total, new_slot]() {
        if (new_slot) {
            debts_.erase(user);
        } else {
            debts_[user] = previous;
        }
        total_ = previous_total;
    });
}

void DebtLedger::mint(Transaction& tx, const Address& user, const U256& amount) {
    if (amount == 0) {
        throw InvalidArgument("mint amount must be positive");
    }

    set_debt(tx, user, debt_of(user) + amount);

    tx.schedule(Transaction::Phase::SETTLE, "mint debt",
        [this, user, amount]() {
            custody_.mint_debt(user, amount);
        });
}

void DebtLedger::burn(Transaction& tx, const Address& on_behalf, const Address& payer,
                      const U256& amount) {
    if (amount == 0) {
        throw InvalidArgument("burn amount must be positive");
    }

    U256 debt = debt_of(on_behalf);
    if (debt < amount) {
        throw LedgerInvariantError("debt of " + addresses::to_hex(on_behalf) +
                                   " would go negative (" + debt.str() + " - " +
                                   amount.str() + ")");
    }
    set_debt(tx, on_behalf, debt - amount);

    tx.schedule(Transaction::Phase::INBOUND, "pull debt",
        [this, payer, amount]() {
            custody_.pull_debt(payer, amount);
        },
        [this, payer, amount]() {
            custody_.push_debt(payer, amount);
        });
    tx.schedule(Transaction::Phase::SETTLE, "burn debt",
        [this, amount]() {
            custody_.burn_debt(amount);
        },
        [this, amount]() {
            custody_.mint_debt(custody_.custody(), amount);
        });
}

U256 DebtLedger::debt_of(const Address& user) const {
    auto it = debts_.find(user);
    return (it != debts_.end()) ? it->second : U256(0);
}

std::vector<Address> DebtLedger::users() const {
    std::vector<Address> out;
    out.reserve(debts_.size());
    for (const auto& [user, debt] : debts_) out.push_back(user);
    return out;
}

} // namespace peg
