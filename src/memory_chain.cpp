// =============================================================================
// memory_chain.cpp - In-process collaborators
// =============================================================================

#include "peg/memory_chain.hpp"

namespace peg {

// =============================================================================
// ManualPriceFeed
// =============================================================================

ManualPriceFeed::ManualPriceFeed(uint8_t decimals, const I256& answer, uint64_t updated_at)
    : decimals_(decimals), round_{1, answer, updated_at, updated_at, 1} {}

void ManualPriceFeed::update_answer(const I256& answer, uint64_t timestamp) {
    round_.round_id += 1;
    round_.answer = answer;
    round_.started_at = timestamp;
    round_.updated_at = timestamp;
    round_.answered_in_round = round_.round_id;
}

// =============================================================================
// InMemoryDebtToken
// =============================================================================

InMemoryDebtToken::InMemoryDebtToken(std::string symbol, const Address& owner)
    : BasicMemoryToken<IDebtToken>(std::move(symbol)), owner_(owner) {}

bool InMemoryDebtToken::mint(const Address& caller, const Address& to, const U256& amount) {
    if (mint_failure_mode_ == FailureMode::THROW) {
        throw std::runtime_error(symbol_ + ": mint reverted");
    }
    if (mint_failure_mode_ == FailureMode::RETURN_FALSE) return false;
    if (caller != owner_) {
        throw std::runtime_error(symbol_ + ": caller is not the owner");
    }
    if (addresses::is_zero(to) || amount == 0) return false;
    credit(to, amount);
    return true;
}

void InMemoryDebtToken::burn(const Address& caller, const U256& amount) {
    if (mint_failure_mode_ == FailureMode::THROW ||
        mint_failure_mode_ == FailureMode::RETURN_FALSE) {
        throw std::runtime_error(symbol_ + ": burn reverted");
    }
    if (caller != owner_) {
        throw std::runtime_error(symbol_ + ": caller is not the owner");
    }
    if (amount == 0) {
        throw std::runtime_error(symbol_ + ": burn amount must be positive");
    }
    if (balance_of(caller) < amount) {
        throw std::runtime_error(symbol_ + ": burn amount exceeds balance");
    }
    balances_[caller] -= amount;
    total_supply_ -= amount;
}

// =============================================================================
// MemoryChain
// =============================================================================

MemoryChain::MemoryChain(uint64_t start_time) : now_(start_time) {}

ManualPriceFeed& MemoryChain::add_feed(const Address& id, uint8_t decimals, const I256& answer) {
    auto feed = std::make_unique<ManualPriceFeed>(decimals, answer, now_);
    ManualPriceFeed& ref = *feed;
    feeds_[id] = std::move(feed);
    return ref;
}

InMemoryToken& MemoryChain::add_token(const Address& id, std::string symbol) {
    auto token = std::make_unique<InMemoryToken>(std::move(symbol));
    InMemoryToken& ref = *token;
    tokens_[id] = std::move(token);
    return ref;
}

InMemoryDebtToken& MemoryChain::add_debt_token(const Address& id, std::string symbol,
                                               const Address& owner) {
    auto token = std::make_unique<InMemoryDebtToken>(std::move(symbol), owner);
    InMemoryDebtToken& ref = *token;
    debt_tokens_[id] = std::move(token);
    return ref;
}

IPriceFeed* MemoryChain::price_feed(const Address& id) {
    return manual_feed(id);
}

IFungibleAsset* MemoryChain::asset(const Address& id) {
    return token(id);
}

IDebtToken* MemoryChain::debt_token(const Address& id) {
    return memory_debt_token(id);
}

ManualPriceFeed* MemoryChain::manual_feed(const Address& id) {
    auto it = feeds_.find(id);
    return (it != feeds_.end()) ? it->second.get() : nullptr;
}

InMemoryToken* MemoryChain::token(const Address& id) {
    auto it = tokens_.find(id);
    return (it != tokens_.end()) ? it->second.get() : nullptr;
}

InMemoryDebtToken* MemoryChain::memory_debt_token(const Address& id) {
    auto it = debt_tokens_.find(id);
    return (it != debt_tokens_.end()) ? it->second.get() : nullptr;
}

Clock MemoryChain::clock() const {
    return [this]() { return now_; };
}

} // namespace peg
