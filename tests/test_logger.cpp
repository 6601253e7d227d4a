// pegcore - Logger Tests

#include <catch2/catch.hpp>
#include <peg/logger.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "fixtures.hpp"

using namespace peg;
using namespace peg::testing;

namespace {

// Captures log lines for the lifetime of the scope
struct CapturedLog {
    std::vector<std::string> lines;

    explicit CapturedLog(LogLevel level) {
        Logger::set_level(level);
        Logger::set_sink([this](LogLevel, const std::string& line) { lines.push_back(line); });
    }

    ~CapturedLog() {
        Logger::set_sink({});
        Logger::set_level(LogLevel::OFF);
    }

    bool contains(const std::string& text) const {
        for (const auto& line : lines) {
            if (line.find(text) != std::string::npos) return true;
        }
        return false;
    }
};

} // namespace

TEST_CASE("Log level parsing", "[logger]") {
    REQUIRE(Logger::parse_level("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::parse_level("info") == LogLevel::INFO);
    REQUIRE(Logger::parse_level("warn") == LogLevel::WARNING);
    REQUIRE(Logger::parse_level("warning") == LogLevel::WARNING);
    REQUIRE(Logger::parse_level("error") == LogLevel::ERROR);
    REQUIRE(Logger::parse_level("off") == LogLevel::OFF);
    REQUIRE_THROWS_AS(Logger::parse_level("trace"), std::invalid_argument);
    REQUIRE(std::string(Logger::level_name(LogLevel::WARNING)) == "WARN");
}

TEST_CASE("Log filtering and format", "[logger]") {
    CapturedLog log(LogLevel::INFO);

    PEG_LOG_DEBUG("hidden " << 1);
    PEG_LOG_INFO("visible " << 2);
    PEG_LOG_ERROR("failure " << 3);

    REQUIRE(log.lines.size() == 2);
    REQUIRE(log.lines[0].find("[INFO] test_logger.cpp:") != std::string::npos);
    REQUIRE(log.lines[0].find(" - visible 2") != std::string::npos);
    REQUIRE(log.contains("[ERROR]"));
    REQUIRE_FALSE(log.contains("hidden"));
}

TEST_CASE("Engine operations are logged", "[logger][engine]") {
    EngineFixture fx;
    fx.fund(USER, e18(10));
    CapturedLog log(LogLevel::INFO);

    fx.engine->deposit_collateral(USER, WETH, e18(10));
    REQUIRE(log.contains("deposit_collateral by " + addresses::to_hex(USER) + " committed"));

    REQUIRE_THROWS(fx.engine->mint_debt(USER, e18(15000)));
    REQUIRE(log.contains("[WARN]"));
    REQUIRE(log.contains("HealthFactorBroken"));

    fx.chain.advance(PriceOracleGuard::STALE_TIMEOUT + 1);
    REQUIRE_THROWS(fx.engine->mint_debt(USER, e18(1)));
    REQUIRE(log.contains("oracle " + addresses::to_hex(ETH_FEED) + " rejected"));
}
