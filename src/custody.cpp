// =============================================================================
// custody.cpp - TransferAdapter failure normalization
// =============================================================================

#include "peg/custody.hpp"

#include "peg/errors.hpp"
#include "peg/logger.hpp"

namespace peg {

TransferAdapter::TransferAdapter(const Address& custody, IDebtToken& debt_token,
                                 const Address& debt_token_id)
    : custody_(custody), debt_token_(debt_token), debt_token_id_(debt_token_id) {}

template <typename Call>
void TransferAdapter::invoke(const char* what, const Address& token, const Address& counterparty,
                             const U256& amount, Call&& call) {
    std::string context = std::string(what) + " " + amount.str() + " of " +
                          addresses::to_hex(token) + " (" + addresses::to_hex(counterparty) + ")";

    bool ok = false;
    try {
        ok = call();
    } catch (const std::exception& e) {
        PEG_LOG_WARN(context << " faulted: " << e.what());
        throw TransferFailed(context + " faulted: " + e.what());
    }
    if (!ok) {
        PEG_LOG_WARN(context << " returned false");
        throw TransferFailed(context + " returned false");
    }
    PEG_LOG_DEBUG(context << " ok");
}

void TransferAdapter::pull(IFungibleAsset& asset, const Address& asset_id,
                           const Address& from, const U256& amount) {
    invoke("pull", asset_id, from, amount, [&] {
        return asset.transfer_from(custody_, from, custody_, amount);
    });
}

void TransferAdapter::push(IFungibleAsset& asset, const Address& asset_id,
                           const Address& to, const U256& amount) {
    invoke("push", asset_id, to, amount, [&] {
        return asset.transfer(custody_, to, amount);
    });
}

void TransferAdapter::mint_debt(const Address& to, const U256& amount) {
    invoke("mint", debt_token_id_, to, amount, [&] {
        return debt_token_.mint(custody_, to, amount);
    });
}

void TransferAdapter::pull_debt(const Address& from, const U256& amount) {
    invoke("pull", debt_token_id_, from, amount, [&] {
        return debt_token_.transfer_from(custody_, from, custody_, amount);
    });
}

void TransferAdapter::push_debt(const Address& to, const U256& amount) {
    invoke("push", debt_token_id_, to, amount, [&] {
        return debt_token_.transfer(custody_, to, amount);
    });
}

void TransferAdapter::burn_debt(const U256& amount) {
    invoke("burn", debt_token_id_, custody_, amount, [&] {
        debt_token_.burn(custody_, amount);
        return true;
    });
}

} // namespace peg
