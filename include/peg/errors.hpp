#ifndef PEG_ERRORS_HPP
#define PEG_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace peg {

// =============================================================================
// Engine Errors
//
// Every error raised by an engine operation is terminal for that call and
// leaves both ledgers exactly as they were before the call began.
// =============================================================================

class EngineError : public std::runtime_error {
public:
    EngineError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }
    const char* name() const noexcept { return errors::name(code_); }

private:
    int32_t code_;
};

// Zero amount where a positive one is required, null identity
class InvalidArgument : public EngineError {
public:
    explicit InvalidArgument(const std::string& msg)
        : EngineError(errors::INVALID_ARGUMENT, msg) {}
};

class UnsupportedAsset : public EngineError {
public:
    explicit UnsupportedAsset(const Address& asset)
        : EngineError(errors::UNSUPPORTED_ASSET,
                      "unsupported collateral asset " + addresses::to_hex(asset)),
          asset_(asset) {}

    const Address& asset() const noexcept { return asset_; }

private:
    Address asset_;
};

// Construction-time: mismatched lists, duplicate or unresolvable identities
class ConfigurationError : public EngineError {
public:
    explicit ConfigurationError(const std::string& msg)
        : EngineError(errors::CONFIGURATION_ERROR, msg) {}
};

class TransferFailed : public EngineError {
public:
    explicit TransferFailed(const std::string& msg)
        : EngineError(errors::TRANSFER_FAILED, msg) {}
};

class HealthFactorBroken : public EngineError {
public:
    HealthFactorBroken(const Address& user, const U256& health_factor)
        : EngineError(errors::HEALTH_FACTOR_BROKEN,
                      "health factor of " + addresses::to_hex(user) + " broken: " +
                          x18::to_string(health_factor)),
          user_(user),
          health_factor_(health_factor) {}

    const Address& user() const noexcept { return user_; }
    const U256& health_factor() const noexcept { return health_factor_; }

private:
    Address user_;
    U256 health_factor_;
};

class HealthFactorOk : public EngineError {
public:
    explicit HealthFactorOk(const Address& user)
        : EngineError(errors::HEALTH_FACTOR_OK,
                      "position of " + addresses::to_hex(user) + " is healthy") {}
};

class HealthFactorNotImproved : public EngineError {
public:
    explicit HealthFactorNotImproved(const Address& user)
        : EngineError(errors::HEALTH_FACTOR_NOT_IMPROVED,
                      "liquidation did not improve health factor of " +
                          addresses::to_hex(user)) {}
};

class StalePrice : public EngineError {
public:
    StalePrice(const Address& feed, const std::string& reason)
        : EngineError(errors::PRICE_STALE,
                      "stale price from feed " + addresses::to_hex(feed) + ": " + reason),
          feed_(feed) {}

    const Address& feed() const noexcept { return feed_; }

private:
    Address feed_;
};

class ReentrantCall : public EngineError {
public:
    ReentrantCall()
        : EngineError(errors::REENTRANCY, "reentrant call rejected") {}
};

// =============================================================================
// Ledger Invariant Violation
//
// A balance decremented below zero. Callers pre-validate every decrement, so
// this signals a programming error rather than a user-facing rejection.
// =============================================================================

class LedgerInvariantError : public std::logic_error {
public:
    explicit LedgerInvariantError(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace peg

#endif // PEG_ERRORS_HPP
