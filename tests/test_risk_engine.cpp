// pegcore - Risk Engine Tests

#include <catch2/catch.hpp>
#include <peg/errors.hpp>
#include <peg/risk_engine.hpp>

#include "fixtures.hpp"

using namespace peg;
using namespace peg::testing;

TEST_CASE("Health factor formula", "[risk]") {
    SECTION("No debt is unconstrained") {
        REQUIRE(RiskEngine::calculate_health_factor(e18(20000), 0).is_unconstrained());
        REQUIRE(RiskEngine::calculate_health_factor(0, 0).is_unconstrained());
    }

    SECTION("200% collateralization is exactly 1.0") {
        HealthFactor hf = RiskEngine::calculate_health_factor(e18(2000), e18(1000));
        REQUIRE(hf == HealthFactor::ratio(X18_ONE));
    }

    SECTION("Scenario values") {
        REQUIRE(RiskEngine::calculate_health_factor(e18(20000), e18(1000)).value() == e18(10));
        REQUIRE(RiskEngine::calculate_health_factor(e18(20000), e18(15000)).value() ==
                U256(666666666666666666ULL));
        REQUIRE(RiskEngine::calculate_health_factor(0, e18(1)).value() == 0);
    }

    SECTION("Engine exposes the same computation") {
        REQUIRE(Engine::calculate_health_factor(e18(1000), e18(1000)) ==
                HealthFactor::ratio(X18_ONE / 2));
    }
}

TEST_CASE("Collateral valuation", "[risk]") {
    EngineFixture fx;
    Engine& engine = *fx.engine;

    SECTION("Eight decimal feed") {
        REQUIRE(engine.valuation_of(WETH, e18(15)) == e18(30000));
        REQUIRE(engine.token_amount_for_value(WETH, e18(100)) == x18::parse("0.05e18"));
    }

    SECTION("Eighteen decimal feed") {
        REQUIRE(engine.valuation_of(WBTC, e18(1)) == e18(30000));
        REQUIRE(engine.token_amount_for_value(WBTC, e18(15000)) == x18::parse("0.5e18"));
    }

    SECTION("Round trip loses at most one unit") {
        fx.set_eth_price(1777);
        U256 amount = x18::parse("3.141592653589793238e18");
        U256 back = engine.token_amount_for_value(WETH, engine.valuation_of(WETH, amount));
        REQUIRE(back <= amount);
        REQUIRE(amount - back <= 1);
    }

    SECTION("Unsupported or null asset") {
        REQUIRE_THROWS_AS(engine.valuation_of(DSC, e18(1)), UnsupportedAsset);
        REQUIRE_THROWS_AS(engine.valuation_of(addresses::NONE, e18(1)), UnsupportedAsset);
        REQUIRE_THROWS_AS(engine.token_amount_for_value(DSC, e18(1)), UnsupportedAsset);
    }

    SECTION("Stale feed fails closed") {
        fx.chain.advance(PriceOracleGuard::STALE_TIMEOUT + 1);
        REQUIRE_THROWS_AS(engine.valuation_of(WETH, e18(1)), StalePrice);
        REQUIRE_THROWS_AS(engine.token_amount_for_value(WETH, e18(1)), StalePrice);
    }
}

TEST_CASE("Account value and health factor", "[risk]") {
    EngineFixture fx;
    Engine& engine = *fx.engine;
    fx.fund(USER, e18(10));
    fx.wbtc.credit(USER, e18(1));

    SECTION("Sums every collateral asset") {
        engine.deposit_collateral(USER, WETH, e18(10));
        engine.deposit_collateral(USER, WBTC, e18(1));
        REQUIRE(engine.account_collateral_value(USER) == e18(50000));
    }

    SECTION("Empty account is worth nothing") {
        REQUIRE(engine.account_collateral_value(OTHER) == 0);
        REQUIRE(engine.health_factor(OTHER).is_unconstrained());
    }

    SECTION("Zero debt never reads a price") {
        engine.deposit_collateral(USER, WETH, e18(10));
        fx.chain.advance(PriceOracleGuard::STALE_TIMEOUT + 1);
        REQUIRE(engine.health_factor(USER).is_unconstrained());
        REQUIRE_THROWS_AS(engine.account_collateral_value(USER), StalePrice);
    }

    SECTION("Zero balances do not need a price") {
        engine.deposit_and_mint(USER, WETH, e18(10), e18(1000));
        fx.btc_feed.set_round_data(RoundData{1, 0, 0, 0, 1});
        REQUIRE(engine.health_factor(USER).value() == e18(10));
    }

    SECTION("Tracks the price") {
        engine.deposit_and_mint(USER, WETH, e18(10), e18(1000));
        REQUIRE(engine.health_factor(USER).value() == e18(10));

        fx.set_eth_price(200);
        REQUIRE(engine.health_factor(USER) == HealthFactor::ratio(X18_ONE));

        fx.set_eth_price(100);
        REQUIRE(engine.health_factor(USER) < Engine::min_health_factor());
    }
}
