// pegcore - Liquidation Tests

#include <catch2/catch.hpp>
#include <peg/engine.hpp>
#include <peg/errors.hpp>

#include "fixtures.hpp"

using namespace peg;
using namespace peg::testing;

namespace {

// USER: 10 WETH / 100 DSC, LIQUIDATOR: 20 WETH / 100 DSC, both at $2000
struct LiquidationFixture : EngineFixture {
    LiquidationFixture() {
        fund(USER, e18(10));
        fund(LIQUIDATOR, e18(20));
        engine->deposit_and_mint(USER, WETH, e18(10), e18(100));
        engine->deposit_and_mint(LIQUIDATOR, WETH, e18(20), e18(100));
    }
};

class LiquidationRecorder : public IEngineListener {
public:
    void on_liquidation(const LiquidationResult& result) noexcept override {
        ++count;
        last_seized = result.collateral_seized;
    }

    int count = 0;
    U256 last_seized = 0;
};

} // namespace

TEST_CASE("Liquidation of an undercollateralized position", "[liquidation]") {
    LiquidationFixture fx;
    Engine& engine = *fx.engine;
    fx.set_eth_price(18);

    HealthFactor before = engine.health_factor(USER);
    REQUIRE(before.value() == x18::parse("0.9e18"));

    U256 base = engine.token_amount_for_value(WETH, e18(10));
    REQUIRE(base == U256(555555555555555555ULL));

    LiquidationResult r = engine.liquidate(LIQUIDATOR, WETH, USER, e18(10));
    REQUIRE(fx.solvent());
    REQUIRE(fx.backed());

    SECTION("Payout includes the bonus") {
        REQUIRE(r.bonus == U256(55555555555555555ULL));
        REQUIRE(r.collateral_seized == U256(611111111111111110ULL));
        REQUIRE(r.collateral_seized == base * 110 / 100);
        REQUIRE(r.debt_covered == e18(10));
        REQUIRE(fx.weth.balance_of(LIQUIDATOR) == U256(611111111111111110ULL));
    }

    SECTION("Target position shrinks and improves") {
        REQUIRE(engine.debt_of(USER) == e18(90));
        REQUIRE(engine.collateral_balance(USER, WETH) == e18(10) - U256(611111111111111110ULL));
        REQUIRE(r.starting_hf == before);
        REQUIRE(r.ending_hf > r.starting_hf);
        REQUIRE(engine.health_factor(USER) == r.ending_hf);
    }

    SECTION("Liquidator pays with its own debt tokens") {
        REQUIRE(fx.dsc.balance_of(LIQUIDATOR) == e18(90));
        REQUIRE(engine.debt_of(LIQUIDATOR) == e18(100));
        REQUIRE(fx.dsc.total_supply() == e18(190));
        REQUIRE(fx.solvent());
    }

    SECTION("Statistics") {
        Engine::Stats stats = engine.get_stats();
        REQUIRE(stats.total_liquidations == 1);
        REQUIRE(stats.total_operations == 3);
    }
}

TEST_CASE("Liquidation preconditions", "[liquidation]") {
    LiquidationFixture fx;
    Engine& engine = *fx.engine;

    SECTION("Healthy target") {
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(10)), HealthFactorOk);
    }

    SECTION("Target without debt") {
        fx.set_eth_price(18);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, OTHER, e18(10)), HealthFactorOk);
    }

    SECTION("Invalid amounts and assets") {
        fx.set_eth_price(18);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, 0), InvalidArgument);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, addresses::NONE, USER, e18(10)),
                          InvalidArgument);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, DSC, USER, e18(10)), UnsupportedAsset);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(101)), InvalidArgument);
    }

    SECTION("Seize exceeds the target's collateral") {
        fx.set_eth_price(1);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(50)), InvalidArgument);
    }

    SECTION("Collateral in a different asset") {
        fx.set_eth_price(18);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WBTC, USER, e18(10)), InvalidArgument);
    }

    SECTION("Stale price") {
        fx.set_eth_price(18);
        fx.chain.advance(PriceOracleGuard::STALE_TIMEOUT + 1);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(10)), StalePrice);
    }

    REQUIRE(engine.debt_of(USER) == e18(100));
    REQUIRE(engine.collateral_balance(USER, WETH) == e18(10));
    REQUIRE(engine.get_stats().total_liquidations == 0);
    REQUIRE(fx.solvent());
}

TEST_CASE("Liquidation must improve the target", "[liquidation]") {
    LiquidationFixture fx;
    Engine& engine = *fx.engine;

    // Collateral worth 105% of the debt cannot pay a 10% bonus
    fx.eth_feed.update_answer(I256(1050000000), fx.chain.now());
    REQUIRE(engine.health_factor(USER).value() == x18::parse("0.525e18"));

    REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(10)),
                      HealthFactorNotImproved);
    REQUIRE(engine.debt_of(USER) == e18(100));
    REQUIRE(engine.collateral_balance(USER, WETH) == e18(10));
    REQUIRE(fx.dsc.balance_of(LIQUIDATOR) == e18(100));
    REQUIRE(fx.solvent());
}

TEST_CASE("Liquidator must stay healthy", "[liquidation]") {
    LiquidationFixture fx;
    Engine& engine = *fx.engine;

    fx.fund(OTHER, e18(2));
    engine.deposit_and_mint(OTHER, WETH, e18(2), e18(30));
    fx.set_eth_price(18);

    REQUIRE_THROWS_AS(engine.liquidate(OTHER, WETH, USER, e18(10)), HealthFactorBroken);
    REQUIRE(engine.debt_of(USER) == e18(100));
    REQUIRE(fx.dsc.balance_of(OTHER) == e18(30));
    REQUIRE(fx.weth.balance_of(OTHER) == 0);
    REQUIRE(fx.solvent());
}

TEST_CASE("Liquidation is atomic across collaborators", "[liquidation]") {
    LiquidationFixture fx;
    Engine& engine = *fx.engine;
    fx.set_eth_price(18);

    SECTION("Collateral payout fails after the debt was burned") {
        fx.weth.set_failure_mode(FailureMode::RETURN_FALSE);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(10)), TransferFailed);
        REQUIRE(fx.dsc.balance_of(LIQUIDATOR) == e18(100));
        REQUIRE(fx.dsc.total_supply() == e18(200));
    }

    SECTION("Liquidator without debt-token allowance") {
        fx.dsc.approve(LIQUIDATOR, ENGINE, 0);
        REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(10)), TransferFailed);
        REQUIRE(fx.weth.balance_of(LIQUIDATOR) == 0);
    }

    REQUIRE(engine.debt_of(USER) == e18(100));
    REQUIRE(engine.collateral_balance(USER, WETH) == e18(10));
    REQUIRE(fx.solvent());
}

TEST_CASE("Liquidation events", "[liquidation]") {
    LiquidationFixture fx;
    Engine& engine = *fx.engine;
    LiquidationRecorder recorder;
    engine.set_listener(&recorder);
    fx.set_eth_price(18);

    REQUIRE_THROWS_AS(engine.liquidate(LIQUIDATOR, WETH, USER, e18(101)), InvalidArgument);
    REQUIRE(recorder.count == 0);

    engine.liquidate(LIQUIDATOR, WETH, USER, e18(10));
    REQUIRE(recorder.count == 1);
    REQUIRE(recorder.last_seized == U256(611111111111111110ULL));
    REQUIRE(fx.backed());
}
