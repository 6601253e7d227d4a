// =============================================================================
// registry.cpp - AssetRegistry construction and lookup
// =============================================================================

#include "peg/registry.hpp"

#include "peg/errors.hpp"
#include "peg/logger.hpp"
#include "peg/oracle_guard.hpp"

namespace peg {

std::shared_ptr<const AssetRegistry> AssetRegistry::build(const EngineConfig& config,
                                                          ICollaboratorDirectory& directory) {
    if (config.collateral_assets.size() != config.price_feeds.size()) {
        throw ConfigurationError(
            "collateral asset and price feed lists differ in length (" +
            std::to_string(config.collateral_assets.size()) + " vs " +
            std::to_string(config.price_feeds.size()) + ")");
    }

    std::shared_ptr<AssetRegistry> registry(new AssetRegistry());
    registry->assets_.reserve(config.collateral_assets.size());

    for (size_t i = 0; i < config.collateral_assets.size(); ++i) {
        const Address& id = config.collateral_assets[i];
        const Address& feed_id = config.price_feeds[i];

        if (addresses::is_zero(id)) {
            throw InvalidArgument("collateral asset " + std::to_string(i) + " has a null identity");
        }
        if (addresses::is_zero(feed_id)) {
            throw InvalidArgument("price feed " + std::to_string(i) + " has a null identity");
        }
        if (registry->index_.count(id) != 0) {
            throw ConfigurationError("duplicate collateral asset " + addresses::to_hex(id));
        }

        IFungibleAsset* asset = directory.asset(id);
        if (!asset) {
            throw ConfigurationError("unknown collateral asset " + addresses::to_hex(id));
        }
        IPriceFeed* feed = directory.price_feed(feed_id);
        if (!feed) {
            throw ConfigurationError("unknown price feed " + addresses::to_hex(feed_id));
        }

        uint8_t decimals = feed->decimals();
        if (decimals > PriceOracleGuard::MAX_FEED_DECIMALS) {
            throw ConfigurationError("price feed " + addresses::to_hex(feed_id) +
                                     " reports unsupported precision " +
                                     std::to_string(decimals));
        }

        registry->index_[id] = registry->assets_.size();
        registry->assets_.push_back(CollateralAsset{id, feed_id, asset, feed, decimals});

        PEG_LOG_DEBUG("registered collateral " << addresses::to_hex(id) << " priced by "
                      << addresses::to_hex(feed_id) << " (" << static_cast<int>(decimals)
                      << " decimals)");
    }

    return registry;
}

const CollateralAsset* AssetRegistry::find(const Address& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &assets_[it->second];
}

std::vector<Address> AssetRegistry::ids() const {
    std::vector<Address> out;
    out.reserve(assets_.size());
    for (const auto& a : assets_) out.push_back(a.id);
    return out;
}

std::optional<Address> AssetRegistry::price_feed_of(const Address& id) const {
    const CollateralAsset* asset = find(id);
    if (!asset) return std::nullopt;
    return asset->feed_id;
}

} // namespace peg
