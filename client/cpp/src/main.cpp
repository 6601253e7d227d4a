// pegsim - scenario runner for the pegcore engine
//
// Replays a JSON scenario (collateral assets, price feeds, funded accounts
// and a list of operations) against the engine using in-memory collaborators
// and prints the outcome of every step.

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>

#include "peg/peg.hpp"

using json = nlohmann::json;
using namespace peg;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Config {
    std::string scenario_path;
    bool verbose = false;
    std::string log_file;
};

//------------------------------------------------------------------------------
// Scenario
//------------------------------------------------------------------------------

class Scenario {
public:
    explicit Scenario(const json& doc) : doc_(doc) {
        if (doc_.contains("names")) {
            for (const auto& [name, value] : doc_["names"].items()) {
                auto addr = addresses::from_hex(value.get<std::string>());
                if (!addr) {
                    throw std::invalid_argument("bad address for name '" + name + "'");
                }
                names_[name] = *addr;
            }
        }
    }

    // Hex address or a name declared under "names"
    Address address(const json& value) const {
        std::string text = value.get<std::string>();
        auto it = names_.find(text);
        if (it != names_.end()) return it->second;
        auto addr = addresses::from_hex(text);
        if (!addr) throw std::invalid_argument("unknown address '" + text + "'");
        return *addr;
    }

    std::string label(const Address& addr) const {
        for (const auto& [name, value] : names_) {
            if (value == addr) return name;
        }
        return addresses::to_hex(addr);
    }

    static U256 amount(const json& value) {
        if (value.is_number_unsigned()) return U256(value.get<uint64_t>());
        return x18::parse(value.get<std::string>());
    }

    const json& doc() const { return doc_; }

private:
    json doc_;
    std::unordered_map<std::string, Address> names_;
};

//------------------------------------------------------------------------------
// Setup
//------------------------------------------------------------------------------

EngineConfig engine_config(const Scenario& scenario) {
    const json& doc = scenario.doc();
    json engine = doc.at("engine");

    // Allow names inside the engine section
    for (const char* key : {"address", "debt_token"}) {
        engine[key] = addresses::to_hex(scenario.address(engine.at(key)));
    }
    for (const char* key : {"collateral_assets", "price_feeds"}) {
        json resolved = json::array();
        for (const auto& item : engine.at(key)) {
            resolved.push_back(addresses::to_hex(scenario.address(item)));
        }
        engine[key] = resolved;
    }
    return EngineConfig::from_json(engine);
}

void build_chain(const Scenario& scenario, const EngineConfig& config, MemoryChain& chain) {
    const json& doc = scenario.doc();

    for (const auto& t : doc.at("tokens")) {
        chain.add_token(scenario.address(t.at("address")), t.value("symbol", "TOKEN"));
    }
    for (const auto& f : doc.at("feeds")) {
        chain.add_feed(scenario.address(f.at("address")),
                       static_cast<uint8_t>(f.value("decimals", 8)),
                       static_cast<I256>(Scenario::amount(f.at("answer"))));
    }
    InMemoryDebtToken& debt = chain.add_debt_token(config.debt_token,
                                                   doc.value("debt_symbol", "DEBT"),
                                                   config.address);

    const U256 unlimited = std::numeric_limits<U256>::max();
    for (const auto& account : doc.value("accounts", json::array())) {
        Address owner = scenario.address(account.at("address"));
        json balances = account.value("balances", json::object());
        for (const auto& [token_name, balance] : balances.items()) {
            Address token_id = scenario.address(json(token_name));
            InMemoryToken* token = chain.token(token_id);
            if (!token) throw std::invalid_argument("account funded with unknown token " + token_name);
            token->credit(owner, Scenario::amount(balance));
        }
        for (const auto& asset : config.collateral_assets) {
            if (InMemoryToken* token = chain.token(asset)) {
                token->approve(owner, config.address, unlimited);
            }
        }
        debt.approve(owner, config.address, unlimited);
    }
}

//------------------------------------------------------------------------------
// Steps
//------------------------------------------------------------------------------

std::string describe(const Scenario& s, const json& step) {
    std::ostringstream out;
    out << step.at("op").get<std::string>();
    for (const char* key : {"caller", "user", "asset", "feed"}) {
        if (step.contains(key)) out << " " << key << "=" << s.label(s.address(step[key]));
    }
    for (const char* key : {"amount", "collateral", "debt", "debt_to_cover", "answer", "seconds"}) {
        if (step.contains(key)) out << " " << key << "=" << step[key].dump();
    }
    return out.str();
}

void report(const Scenario& s, Engine& engine, const Address& user) {
    std::cout << "    " << s.label(user)
              << " debt=" << x18::to_string(engine.debt_of(user));
    try {
        AccountInformation info = engine.account_information(user);
        std::cout << " collateral_usd=" << x18::to_string(info.collateral_value_usd)
                  << " health=" << engine.health_factor(user);
    } catch (const StalePrice& e) {
        std::cout << " collateral_usd=? (" << e.what() << ")";
    }
    std::cout << "\n";
}

void execute_step(const Scenario& s, const json& step, Engine& engine, MemoryChain& chain) {
    const std::string op = step.at("op").get<std::string>();

    if (op == "deposit") {
        engine.deposit_collateral(s.address(step.at("caller")), s.address(step.at("asset")),
                                  Scenario::amount(step.at("amount")));
    } else if (op == "mint") {
        engine.mint_debt(s.address(step.at("caller")), Scenario::amount(step.at("amount")));
    } else if (op == "redeem") {
        engine.redeem_collateral(s.address(step.at("caller")), s.address(step.at("asset")),
                                 Scenario::amount(step.at("amount")));
    } else if (op == "burn") {
        engine.burn_debt(s.address(step.at("caller")), Scenario::amount(step.at("amount")));
    } else if (op == "deposit_and_mint") {
        engine.deposit_and_mint(s.address(step.at("caller")), s.address(step.at("asset")),
                                Scenario::amount(step.at("collateral")),
                                Scenario::amount(step.at("debt")));
    } else if (op == "redeem_and_burn") {
        engine.redeem_and_burn(s.address(step.at("caller")), s.address(step.at("asset")),
                               Scenario::amount(step.at("collateral")),
                               Scenario::amount(step.at("debt")));
    } else if (op == "liquidate") {
        LiquidationResult r = engine.liquidate(s.address(step.at("caller")),
                                               s.address(step.at("asset")),
                                               s.address(step.at("user")),
                                               Scenario::amount(step.at("debt_to_cover")));
        std::cout << "    seized=" << x18::to_string(r.collateral_seized)
                  << " bonus=" << x18::to_string(r.bonus)
                  << " health " << r.starting_hf << " -> " << r.ending_hf << "\n";
    } else if (op == "set_price") {
        ManualPriceFeed* feed = chain.manual_feed(s.address(step.at("feed")));
        if (!feed) throw std::invalid_argument("unknown feed in set_price");
        feed->update_answer(static_cast<I256>(Scenario::amount(step.at("answer"))), chain.now());
    } else if (op == "advance_time") {
        chain.advance(step.at("seconds").get<uint64_t>());
    } else if (op == "report") {
        if (step.contains("user")) {
            report(s, engine, s.address(step["user"]));
        } else {
            for (const auto& user : engine.accounts()) report(s, engine, user);
        }
    } else {
        throw std::invalid_argument("unknown op '" + op + "'");
    }
}

int run_scenario(const Scenario& scenario, bool verbose) {
    EngineConfig config = engine_config(scenario);
    Logger::set_level(Logger::parse_level(config.log_level));

    MemoryChain chain(scenario.doc().value("start_time", uint64_t{1700000000}));
    build_chain(scenario, config, chain);

    Engine engine(config, chain, chain.clock());

    int mismatches = 0;
    size_t index = 0;
    for (const auto& step : scenario.doc().at("steps")) {
        ++index;
        std::string outcome = "ok";
        std::string detail;
        try {
            execute_step(scenario, step, engine, chain);
        } catch (const EngineError& e) {
            outcome = e.name();
            detail = e.what();
        }

        std::string expected = step.value("expect", outcome);
        bool matched = expected == outcome;
        if (!matched) ++mismatches;

        std::cout << "#" << index << " " << describe(scenario, step) << " -> " << outcome;
        if (verbose && !detail.empty()) std::cout << " (" << detail << ")";
        if (!matched) std::cout << "  [expected " << expected << "]";
        std::cout << "\n";
    }

    Engine::Stats stats = engine.get_stats();
    std::cout << "\n" << index << " step(s), " << stats.total_operations << " committed, "
              << stats.total_rejected << " rejected, " << stats.total_liquidations
              << " liquidation(s), " << mismatches << " unexpected outcome(s)\n";

    return mismatches == 0 ? 0 : 1;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "pegsim - pegcore scenario runner\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -v, --verbose        Print error details for rejected steps\n"
              << "  -l, --log <file>     Write engine log to <file> instead of stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Step ops:\n"
              << "  deposit, mint, redeem, burn, deposit_and_mint, redeem_and_burn,\n"
              << "  liquidate, set_price, advance_time, report\n";
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-l" || arg == "--log") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log file argument\n";
                std::exit(2);
            }
            config.log_file = argv[++i];
        } else if (arg[0] != '-' && config.scenario_path.empty()) {
            config.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(2);
        }
    }

    if (config.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(2);
    }

    return config;
}

int main(int argc, char* argv[]) {
    Config config = parse_args(argc, argv);

    if (!config.log_file.empty() && !Logger::set_file(config.log_file)) {
        std::cerr << "Cannot open log file " << config.log_file << "\n";
        return 2;
    }

    std::ifstream file(config.scenario_path);
    if (!file.is_open()) {
        std::cerr << "Cannot open scenario " << config.scenario_path << "\n";
        return 2;
    }

    try {
        Scenario scenario(json::parse(file));
        return run_scenario(scenario, config.verbose);
    } catch (const json::exception& e) {
        std::cerr << "Invalid scenario: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 2;
}
