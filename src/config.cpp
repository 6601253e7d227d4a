// =============================================================================
// config.cpp - EngineConfig JSON loading
// =============================================================================

#include "peg/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "peg/errors.hpp"
#include "peg/logger.hpp"

using json = nlohmann::json;

namespace peg {

namespace {

Address parse_address(const json& value, const std::string& field) {
    if (!value.is_string()) {
        throw ConfigurationError("'" + field + "' must be an address string");
    }
    auto addr = addresses::from_hex(value.get<std::string>());
    if (!addr) {
        throw ConfigurationError("'" + field + "' is not a valid address: " +
                                 value.get<std::string>());
    }
    return *addr;
}

std::vector<Address> parse_address_list(const json& j, const char* field) {
    if (!j.contains(field) || !j[field].is_array()) {
        throw ConfigurationError(std::string("'") + field + "' must be an array");
    }
    std::vector<Address> out;
    size_t i = 0;
    for (const auto& item : j[field]) {
        out.push_back(parse_address(item, std::string(field) + "[" + std::to_string(i++) + "]"));
    }
    return out;
}

} // namespace

EngineConfig EngineConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("engine config must be a JSON object");
    }

    EngineConfig config;

    if (!j.contains("address")) throw ConfigurationError("missing 'address'");
    config.address = parse_address(j["address"], "address");

    config.collateral_assets = parse_address_list(j, "collateral_assets");
    config.price_feeds = parse_address_list(j, "price_feeds");

    if (!j.contains("debt_token")) throw ConfigurationError("missing 'debt_token'");
    config.debt_token = parse_address(j["debt_token"], "debt_token");

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            throw ConfigurationError("'log_level' must be a string");
        }
        config.log_level = j["log_level"].get<std::string>();
        try {
            Logger::parse_level(config.log_level);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(e.what());
        }
    }

    return config;
}

EngineConfig EngineConfig::from_string(std::string_view content) {
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("invalid engine config JSON: ") + e.what());
    }
    return from_json(j);
}

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

json EngineConfig::to_json() const {
    json j;
    j["address"] = addresses::to_hex(address);
    j["collateral_assets"] = json::array();
    for (const auto& a : collateral_assets) j["collateral_assets"].push_back(addresses::to_hex(a));
    j["price_feeds"] = json::array();
    for (const auto& f : price_feeds) j["price_feeds"].push_back(addresses::to_hex(f));
    j["debt_token"] = addresses::to_hex(debt_token);
    j["log_level"] = log_level;
    return j;
}

} // namespace peg
