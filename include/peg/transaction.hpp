#ifndef PEG_TRANSACTION_HPP
#define PEG_TRANSACTION_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace peg {

// =============================================================================
// Transaction - all-or-nothing scope for one engine operation
//
// Ledger effects apply immediately and record an undo action. Collaborator
// interactions are deferred until commit(), after every check has passed,
// and run inbound-first: pulls, then settlement (mint/burn), then pushes.
//
// If an interaction fails, the completed ones are compensated in reverse
// order, the ledger journal is rolled back and the failure is rethrown.
// Destroying an uncommitted transaction rolls the ledger journal back.
//
// Commit hooks are held until publish(), so the owner can release its
// locks before they run.
// =============================================================================

class Transaction {
public:
    using Action = std::function<void()>;

    enum class Phase : uint8_t {
        INBOUND = 0,   // tokens pulled into custody
        SETTLE = 1,    // mint / burn
        OUTBOUND = 2   // tokens pushed out of custody
    };

    Transaction() = default;
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // Ledger undo record; must not throw
    void on_rollback(Action undo);

    // Deferred collaborator call with an optional compensating call
    void schedule(Phase phase, std::string label, Action interaction, Action compensation = {});

    // Runs from publish() once the transaction committed
    void on_commit(Action action);

    void commit();

    // Fires the commit hooks once; no-op unless committed
    void publish();

    bool committed() const { return state_ == State::COMMITTED; }
    size_t pending_interactions() const { return interactions_.size(); }

private:
    enum class State : uint8_t { OPEN, COMMITTED, ROLLED_BACK };

    struct Interaction {
        Phase phase;
        std::string label;
        Action run;
        Action compensate;
    };

    void rollback() noexcept;

    std::vector<Action> undo_log_;
    std::vector<Interaction> interactions_;
    std::vector<Action> commit_hooks_;
    State state_{State::OPEN};
};

// =============================================================================
// ReentrancyGuard - rejects nested entry into a state-mutating operation
// =============================================================================

class ReentrancyGuard {
public:
    // Throws ReentrantCall if the guard is already held
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

    bool entered() const { return entered_; }

private:
    bool entered_{false};
};

} // namespace peg

#endif // PEG_TRANSACTION_HPP
