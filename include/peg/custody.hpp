#ifndef PEG_CUSTODY_HPP
#define PEG_CUSTODY_HPP

#include "collaborators.hpp"
#include "types.hpp"

namespace peg {

// =============================================================================
// TransferAdapter - single entry point for collaborator transfers
//
// Collaborators signal failure either by returning false or by throwing.
// Both become TransferFailed here, so the ledgers never branch on a
// collaborator's failure convention.
// =============================================================================

class TransferAdapter {
public:
    TransferAdapter(const Address& custody, IDebtToken& debt_token, const Address& debt_token_id);

    // Collateral: `from` -> custody, custody -> `to`
    void pull(IFungibleAsset& asset, const Address& asset_id, const Address& from, const U256& amount);
    void push(IFungibleAsset& asset, const Address& asset_id, const Address& to, const U256& amount);

    // Debt token
    void mint_debt(const Address& to, const U256& amount);
    void pull_debt(const Address& from, const U256& amount);
    void push_debt(const Address& to, const U256& amount);
    void burn_debt(const U256& amount);

    const Address& custody() const { return custody_; }
    const Address& debt_token_id() const { return debt_token_id_; }

private:
    template <typename Call>
    void invoke(const char* what, const Address& token, const Address& counterparty,
                const U256& amount, Call&& call);

    Address custody_;
    IDebtToken& debt_token_;
    Address debt_token_id_;
};

} // namespace peg

#endif // PEG_CUSTODY_HPP
