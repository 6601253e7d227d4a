#ifndef PEG_COLLABORATORS_HPP
#define PEG_COLLABORATORS_HPP

#include "types.hpp"

namespace peg {

// =============================================================================
// Price Feed (Chainlink AggregatorV3 shape)
// =============================================================================

struct RoundData {
    U128 round_id;
    I256 answer;              // asset-currency per unit, scaled by decimals()
    uint64_t started_at;
    uint64_t updated_at;      // 0 = round never answered
    U128 answered_in_round;
};

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual RoundData latest_round_data() const = 0;
    virtual uint8_t decimals() const = 0;
};

// =============================================================================
// Fungible Asset (ERC20 shape)
//
// The caller identity is explicit: `spender`/`sender` is the account on
// whose behalf the call is made. A `false` return is a failed transfer.
// =============================================================================

class IFungibleAsset {
public:
    virtual ~IFungibleAsset() = default;

    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, const U256& amount) = 0;
    virtual bool transfer(const Address& sender, const Address& to, const U256& amount) = 0;
    virtual U256 balance_of(const Address& owner) const = 0;
};

// =============================================================================
// Debt Token (owner-gated mint/burn)
// =============================================================================

class IDebtToken : public IFungibleAsset {
public:
    virtual bool mint(const Address& caller, const Address& to, const U256& amount) = 0;

    // Burns `amount` from the caller's own balance
    virtual void burn(const Address& caller, const U256& amount) = 0;
};

// =============================================================================
// Collaborator Directory
//
// Resolves configured identities to live collaborators. Returns nullptr for
// identities it does not know.
// =============================================================================

class ICollaboratorDirectory {
public:
    virtual ~ICollaboratorDirectory() = default;

    virtual IPriceFeed* price_feed(const Address& id) = 0;
    virtual IFungibleAsset* asset(const Address& id) = 0;
    virtual IDebtToken* debt_token(const Address& id) = 0;
};

} // namespace peg

#endif // PEG_COLLABORATORS_HPP
