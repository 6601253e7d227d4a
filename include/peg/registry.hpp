#ifndef PEG_REGISTRY_HPP
#define PEG_REGISTRY_HPP

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "collaborators.hpp"
#include "config.hpp"
#include "types.hpp"

namespace peg {

// =============================================================================
// Collateral Asset
// =============================================================================

struct CollateralAsset {
    Address id;
    Address feed_id;
    IFungibleAsset* asset;    // not owned
    IPriceFeed* feed;         // not owned
    uint8_t feed_decimals;    // reported at registration
};

// =============================================================================
// AssetRegistry - immutable set of supported collateral
//
// Built once from EngineConfig and shared read-only by every component.
// Registration order is preserved.
// =============================================================================

class AssetRegistry {
public:
    // Throws InvalidArgument for null identities, ConfigurationError for
    // mismatched list lengths, duplicates, unresolvable identities and feed
    // precision the oracle guard would reject.
    static std::shared_ptr<const AssetRegistry> build(const EngineConfig& config,
                                                       ICollaboratorDirectory& directory);

    const CollateralAsset* find(const Address& id) const;
    bool contains(const Address& id) const { return find(id) != nullptr; }

    const std::vector<CollateralAsset>& assets() const { return assets_; }
    std::vector<Address> ids() const;
    std::optional<Address> price_feed_of(const Address& id) const;
    size_t size() const { return assets_.size(); }

private:
    AssetRegistry() = default;

    std::vector<CollateralAsset> assets_;
    std::map<Address, size_t> index_;
};

} // namespace peg

#endif // PEG_REGISTRY_HPP
