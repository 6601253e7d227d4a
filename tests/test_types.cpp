// pegcore - Core Type Tests

#include <catch2/catch.hpp>
#include <peg/errors.hpp>
#include <peg/types.hpp>

#include <limits>
#include <sstream>
#include <stdexcept>

using namespace peg;

TEST_CASE("Address hex encoding", "[types]") {
    SECTION("Round trip") {
        Address addr = addresses::from_u64(0xDEADBEEF);
        std::string hex = addresses::to_hex(addr);
        REQUIRE(hex == "0x00000000000000000000000000000000deadbeef");
        REQUIRE(addresses::from_hex(hex) == addr);
    }

    SECTION("Prefix is optional and case is ignored") {
        auto addr = addresses::from_hex("00000000000000000000000000000000DEADBEEF");
        REQUIRE(addr.has_value());
        REQUIRE(*addr == addresses::from_u64(0xDEADBEEF));
    }

    SECTION("Malformed input") {
        REQUIRE_FALSE(addresses::from_hex("0x1234").has_value());
        REQUIRE_FALSE(addresses::from_hex("0xzz000000000000000000000000000000deadbeef").has_value());
        REQUIRE_FALSE(addresses::from_hex("").has_value());
    }

    SECTION("Null identity") {
        REQUIRE(addresses::is_zero(addresses::NONE));
        REQUIRE_FALSE(addresses::is_zero(addresses::from_u64(1)));
    }
}

TEST_CASE("X18 amount parsing", "[types]") {
    SECTION("Scientific shorthand") {
        REQUIRE(x18::parse("10e18") == x18::from_int(10));
        REQUIRE(x18::parse("0.5e18") == U256(500000000000000000ULL));
        REQUIRE(x18::parse("2000e8") == U256(200000000000ULL));
        REQUIRE(x18::parse("1E3") == U256(1000));
    }

    SECTION("Plain integers") {
        REQUIRE(x18::parse("0") == 0);
        REQUIRE(x18::parse("611111111111111110") == U256(611111111111111110ULL));
    }

    SECTION("Rejects malformed or fractional amounts") {
        REQUIRE_THROWS_AS(x18::parse(""), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::parse("abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::parse("1e"), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::parse("1.5"), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::parse("1.2.3e18"), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::parse("-5e18"), std::invalid_argument);
    }
}

TEST_CASE("X18 rendering and arithmetic", "[types]") {
    REQUIRE(x18::to_string(0) == "0");
    REQUIRE(x18::to_string(x18::from_int(42)) == "42");
    REQUIRE(x18::to_string(x18::parse("10.5e18")) == "10.5");
    REQUIRE(x18::to_string(1) == "0.000000000000000001");

    REQUIRE(x18::mul(x18::from_int(3), x18::parse("0.5e18")) == x18::parse("1.5e18"));
    REQUIRE(x18::div(x18::from_int(3), x18::from_int(2)) == x18::parse("1.5e18"));
    REQUIRE(x18::pow10(0) == 1);
    REQUIRE(x18::pow10(8) == U256(100000000));
}

TEST_CASE("Checked 256-bit arithmetic", "[types]") {
    U256 max = std::numeric_limits<U256>::max();
    REQUIRE_THROWS(max + 1);

    U256 small = 1;
    U256 large = 2;
    REQUIRE_THROWS(small - large);
}

TEST_CASE("Health factor ordering", "[types]") {
    HealthFactor unconstrained = HealthFactor::unconstrained();
    HealthFactor one = HealthFactor::ratio(X18_ONE);
    HealthFactor half = HealthFactor::ratio(X18_ONE / 2);

    SECTION("Ratios compare by value") {
        REQUIRE(half < one);
        REQUIRE(one > half);
        REQUIRE(one == HealthFactor::ratio(X18_ONE));
        REQUIRE(one != half);
    }

    SECTION("Unconstrained is greater than every ratio") {
        REQUIRE(unconstrained > HealthFactor::ratio(std::numeric_limits<U256>::max()));
        REQUIRE_FALSE(unconstrained < one);
        REQUIRE(unconstrained == HealthFactor::unconstrained());
        REQUIRE(unconstrained >= X18_ONE);
    }

    SECTION("Threshold comparison") {
        REQUIRE(half < X18_ONE);
        REQUIRE(one >= X18_ONE);
    }

    SECTION("Rendering") {
        std::ostringstream out;
        out << half << " " << unconstrained;
        REQUIRE(out.str() == "0.5 unconstrained");
    }
}

TEST_CASE("Error taxonomy", "[types][errors]") {
    REQUIRE(std::string(errors::name(errors::PRICE_STALE)) == "StalePrice");
    REQUIRE(std::string(errors::name(errors::REENTRANCY)) == "ReentrantCall");
    REQUIRE(std::string(errors::name(12345)) == "Unknown");

    HealthFactorBroken broken(addresses::from_u64(1), U256(666666666666666666ULL));
    REQUIRE(broken.code() == errors::HEALTH_FACTOR_BROKEN);
    REQUIRE(std::string(broken.name()) == "HealthFactorBroken");
    REQUIRE(broken.health_factor() == U256(666666666666666666ULL));

    StalePrice stale(addresses::from_u64(2), "age 10801s exceeds 10800s");
    const EngineError& base = stale;
    REQUIRE(base.code() == errors::PRICE_STALE);
    REQUIRE(stale.feed() == addresses::from_u64(2));
}
