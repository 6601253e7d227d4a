// pegcore - Shared test fixtures

#ifndef PEG_TESTS_FIXTURES_HPP
#define PEG_TESTS_FIXTURES_HPP

#include <limits>
#include <memory>

#include <peg/engine.hpp>
#include <peg/logger.hpp>
#include <peg/memory_chain.hpp>

namespace peg::testing {

constexpr Address ENGINE = addresses::from_u64(0xE0);
constexpr Address WETH = addresses::from_u64(0x1001);
constexpr Address WBTC = addresses::from_u64(0x1002);
constexpr Address ETH_FEED = addresses::from_u64(0x2001);
constexpr Address BTC_FEED = addresses::from_u64(0x2002);
constexpr Address DSC = addresses::from_u64(0x3001);

constexpr Address USER = addresses::from_u64(0xA1);
constexpr Address LIQUIDATOR = addresses::from_u64(0xA2);
constexpr Address OTHER = addresses::from_u64(0xA3);

constexpr uint64_t START_TIME = 1700000000;

inline U256 e18(uint64_t whole) { return x18::from_int(whole); }

// Feed answer with 8 decimals: usd8(2000) == 2000e8
inline I256 usd8(uint64_t dollars) { return I256(dollars) * 100000000; }

// ETH/USD feed with 8 decimals at $2000, BTC/USD feed with 18 decimals at $30000
inline EngineConfig default_config() {
    EngineConfig config;
    config.address = ENGINE;
    config.collateral_assets = {WETH, WBTC};
    config.price_feeds = {ETH_FEED, BTC_FEED};
    config.debt_token = DSC;
    config.log_level = "off";
    return config;
}

struct EngineFixture {
    MemoryChain chain{START_TIME};
    InMemoryToken& weth;
    InMemoryToken& wbtc;
    InMemoryDebtToken& dsc;
    ManualPriceFeed& eth_feed;
    ManualPriceFeed& btc_feed;
    EngineConfig config;
    std::unique_ptr<Engine> engine;

    EngineFixture()
        : weth(chain.add_token(WETH, "WETH")),
          wbtc(chain.add_token(WBTC, "WBTC")),
          dsc(chain.add_debt_token(DSC, "DSC", ENGINE)),
          eth_feed(chain.add_feed(ETH_FEED, 8, usd8(2000))),
          btc_feed(chain.add_feed(BTC_FEED, 18, static_cast<I256>(e18(30000)))),
          config(default_config()) {
        Logger::set_level(LogLevel::OFF);
        engine = std::make_unique<Engine>(config, chain, chain.clock());
    }

    // Credits WETH and approves the engine for every token
    void fund(const Address& who, const U256& weth_amount) {
        weth.credit(who, weth_amount);
        approve_all(who);
    }

    void approve_all(const Address& who) {
        const U256 unlimited = std::numeric_limits<U256>::max();
        weth.approve(who, ENGINE, unlimited);
        wbtc.approve(who, ENGINE, unlimited);
        dsc.approve(who, ENGINE, unlimited);
    }

    void set_eth_price(uint64_t dollars) {
        eth_feed.update_answer(usd8(dollars), chain.now());
    }

    // Custody holdings match the ledgers
    bool solvent() const {
        U256 weth_deposits = 0;
        U256 wbtc_deposits = 0;
        for (const auto& user : engine->accounts()) {
            weth_deposits += engine->collateral_balance(user, WETH);
            wbtc_deposits += engine->collateral_balance(user, WBTC);
        }
        return weth_deposits == weth.balance_of(ENGINE) &&
               wbtc_deposits == wbtc.balance_of(ENGINE) &&
               engine->total_debt() == dsc.total_supply() &&
               dsc.balance_of(ENGINE) == 0;
    }

    // Total collateral value covers total debt at current prices
    bool backed() const {
        U256 value = 0;
        for (const auto& user : engine->accounts()) {
            value += engine->account_collateral_value(user);
        }
        return value >= engine->total_debt();
    }
};

} // namespace peg::testing

#endif // PEG_TESTS_FIXTURES_HPP
