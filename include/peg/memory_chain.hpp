#ifndef PEG_MEMORY_CHAIN_HPP
#define PEG_MEMORY_CHAIN_HPP

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "collaborators.hpp"
#include "oracle_guard.hpp"
#include "types.hpp"

namespace peg {

// =============================================================================
// ManualPriceFeed - price feed driven by explicit updates
// =============================================================================

class ManualPriceFeed : public IPriceFeed {
public:
    ManualPriceFeed(uint8_t decimals, const I256& answer, uint64_t updated_at);

    // Opens and answers a new round
    void update_answer(const I256& answer, uint64_t timestamp);

    // Sets the raw round data, e.g. to simulate an unanswered or carried-over round
    void set_round_data(const RoundData& data) { round_ = data; }

    RoundData latest_round_data() const override { return round_; }
    uint8_t decimals() const override { return decimals_; }

private:
    uint8_t decimals_;
    RoundData round_;
};

// =============================================================================
// BasicMemoryToken - allowance-based fungible token
//
// Returns false on insufficient balance or allowance. FailureMode lets tests
// make every transfer return false or throw.
// =============================================================================

enum class FailureMode : uint8_t {
    NONE = 0,
    RETURN_FALSE = 1,
    THROW = 2
};

template <typename Interface>
class BasicMemoryToken : public Interface {
public:
    // Invoked before a transfer moves funds; used to simulate callbacks
    using TransferHook = std::function<void(const Address& from, const Address& to, const U256& amount)>;

    explicit BasicMemoryToken(std::string symbol) : symbol_(std::move(symbol)) {}

    const std::string& symbol() const { return symbol_; }

    // Creates `amount` out of thin air for `to`
    void credit(const Address& to, const U256& amount) {
        balances_[to] += amount;
        total_supply_ += amount;
    }

    bool approve(const Address& owner, const Address& spender, const U256& amount) {
        allowances_[{owner, spender}] = amount;
        return true;
    }

    U256 allowance(const Address& owner, const Address& spender) const {
        auto it = allowances_.find({owner, spender});
        return (it != allowances_.end()) ? it->second : U256(0);
    }

    bool transfer_from(const Address& spender, const Address& from, const Address& to,
                       const U256& amount) override {
        if (!check_failure()) return false;
        U256 allowed = allowance(from, spender);
        if (allowed < amount || balance_of(from) < amount) return false;
        if (hook_) hook_(from, to, amount);
        allowances_[{from, spender}] = allowed - amount;
        move(from, to, amount);
        return true;
    }

    bool transfer(const Address& sender, const Address& to, const U256& amount) override {
        if (!check_failure()) return false;
        if (balance_of(sender) < amount) return false;
        if (hook_) hook_(sender, to, amount);
        move(sender, to, amount);
        return true;
    }

    U256 balance_of(const Address& owner) const override {
        auto it = balances_.find(owner);
        return (it != balances_.end()) ? it->second : U256(0);
    }

    U256 total_supply() const { return total_supply_; }

    void set_failure_mode(FailureMode mode) { failure_mode_ = mode; }
    void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

protected:
    bool check_failure() const {
        if (failure_mode_ == FailureMode::THROW) {
            throw std::runtime_error(symbol_ + ": transfer reverted");
        }
        return failure_mode_ != FailureMode::RETURN_FALSE;
    }

    void move(const Address& from, const Address& to, const U256& amount) {
        balances_[from] -= amount;
        balances_[to] += amount;
    }

    std::string symbol_;
    std::map<Address, U256> balances_;
    std::map<std::pair<Address, Address>, U256> allowances_;
    U256 total_supply_{0};
    FailureMode failure_mode_{FailureMode::NONE};
    TransferHook hook_;
};

using InMemoryToken = BasicMemoryToken<IFungibleAsset>;

// =============================================================================
// InMemoryDebtToken - only `owner` may mint or burn
// =============================================================================

class InMemoryDebtToken : public BasicMemoryToken<IDebtToken> {
public:
    InMemoryDebtToken(std::string symbol, const Address& owner);

    bool mint(const Address& caller, const Address& to, const U256& amount) override;
    void burn(const Address& caller, const U256& amount) override;

    const Address& owner() const { return owner_; }

    // Applies to mint/burn only; transfers use set_failure_mode()
    void set_mint_failure_mode(FailureMode mode) { mint_failure_mode_ = mode; }

private:
    Address owner_;
    FailureMode mint_failure_mode_{FailureMode::NONE};
};

// =============================================================================
// MemoryChain - in-process collaborator directory with a manual clock
// =============================================================================

class MemoryChain : public ICollaboratorDirectory {
public:
    explicit MemoryChain(uint64_t start_time = 1700000000);

    ManualPriceFeed& add_feed(const Address& id, uint8_t decimals, const I256& answer);
    InMemoryToken& add_token(const Address& id, std::string symbol);
    InMemoryDebtToken& add_debt_token(const Address& id, std::string symbol, const Address& owner);

    IPriceFeed* price_feed(const Address& id) override;
    IFungibleAsset* asset(const Address& id) override;
    IDebtToken* debt_token(const Address& id) override;

    ManualPriceFeed* manual_feed(const Address& id);
    InMemoryToken* token(const Address& id);
    InMemoryDebtToken* memory_debt_token(const Address& id);

    uint64_t now() const { return now_; }
    void set_time(uint64_t timestamp) { now_ = timestamp; }
    void advance(uint64_t seconds) { now_ += seconds; }

    // Reads this chain's time; the chain must outlive the clock
    Clock clock() const;

private:
    uint64_t now_;
    std::map<Address, std::unique_ptr<ManualPriceFeed>> feeds_;
    std::map<Address, std::unique_ptr<InMemoryToken>> tokens_;
    std::map<Address, std::unique_ptr<InMemoryDebtToken>> debt_tokens_;
};

} // namespace peg

#endif // PEG_MEMORY_CHAIN_HPP
