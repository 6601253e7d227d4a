#ifndef PEG_LEDGER_HPP
#define PEG_LEDGER_HPP

#include <map>
#include <memory>
#include <vector>

#include "custody.hpp"
#include "registry.hpp"
#include "transaction.hpp"
#include "types.hpp"

namespace peg {

// =============================================================================
// CollateralLedger - per-user, per-asset deposited collateral (raw units)
//
// Every balance change is journaled on the transaction and paired with a
// custody transfer scheduled on the same transaction.
// =============================================================================

class CollateralLedger {
public:
    CollateralLedger(std::shared_ptr<const AssetRegistry> registry, TransferAdapter& custody);

    CollateralLedger(const CollateralLedger&) = delete;
    CollateralLedger& operator=(const CollateralLedger&) = delete;

    // Credits `user`, then pulls `amount` from `user` into custody
    void deposit(Transaction& tx, const Address& user, const Address& asset, const U256& amount);

    // Debits `from`, then pushes `amount` from custody to `to`. Debiting below
    // zero throws LedgerInvariantError.
    void withdraw(Transaction& tx, const Address& from, const Address& to,
                  const Address& asset, const U256& amount);

    U256 balance_of(const Address& user, const Address& asset) const;

    // Sum over all users for one asset
    U256 total_of(const Address& asset) const;

    // Every user that ever held a balance
    std::vector<Address> users() const;

private:
    const CollateralAsset& require_asset(const Address& asset) const;
    void set_balance(Transaction& tx, const Address& user, const Address& asset, const U256& value);

    std::shared_ptr<const AssetRegistry> registry_;
    TransferAdapter& custody_;

    // user -> asset -> balance
    std::map<Address, std::map<Address, U256>> balances_;
};

// =============================================================================
// DebtLedger - per-user minted debt (18 decimals, USD-pegged units)
// =============================================================================

class DebtLedger {
public:
    explicit DebtLedger(TransferAdapter& custody);

    DebtLedger(const DebtLedger&) = delete;
    DebtLedger& operator=(const DebtLedger&) = delete;

    // Records the debt, then mints `amount` to `user`
    void mint(Transaction& tx, const Address& user, const U256& amount);

    // Reduces `on_behalf`'s debt; pulls `amount` debt tokens from `payer`
    // into custody and burns them
    void burn(Transaction& tx, const Address& on_behalf, const Address& payer, const U256& amount);

    U256 debt_of(const Address& user) const;
    U256 total() const { return total_; }
    std::vector<Address> users() const;

private:
    void set_debt(Transaction& tx, const Address& user, const U256& value);

    TransferAdapter& custody_;
    std::map<Address, U256> debts_;
    U256 total_{0};
};

} // namespace peg

#endif // PEG_LEDGER_HPP
