#ifndef PEG_CONFIG_HPP
#define PEG_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace peg {

// =============================================================================
// Engine Configuration
//
// collateral_assets[i] is priced by price_feeds[i]. Validation happens when
// the engine builds its AssetRegistry, not here.
//
// JSON form:
//   {
//     "address": "0x...",             engine custody / debt-token owner
//     "collateral_assets": ["0x...", ...],
//     "price_feeds": ["0x...", ...],
//     "debt_token": "0x...",
//     "log_level": "info"             optional
//   }
// =============================================================================

struct EngineConfig {
    Address address{};
    std::vector<Address> collateral_assets;
    std::vector<Address> price_feeds;
    Address debt_token{};
    // Validated by the engine; the Logger level is process-wide, so the
    // host applies it
    std::string log_level = "info";

    // Throw ConfigurationError on missing keys or malformed addresses
    static EngineConfig from_json(const nlohmann::json& j);
    static EngineConfig from_string(std::string_view content);
    static EngineConfig from_file(std::string_view path);

    nlohmann::json to_json() const;
};

} // namespace peg

#endif // PEG_CONFIG_HPP
