// =============================================================================
// transaction.cpp - Journaled operation scope and reentrancy guard
// =============================================================================

#include "peg/transaction.hpp"

#include <algorithm>
#include <stdexcept>

#include "peg/errors.hpp"
#include "peg/logger.hpp"

namespace peg {

// =============================================================================
// Transaction
// =============================================================================

Transaction::~Transaction() {
    if (state_ == State::OPEN) {
        rollback();
    }
}

void Transaction::on_rollback(Action undo) {
    if (state_ != State::OPEN) {
        throw std::logic_error("Transaction: journal closed");
    }
    undo_log_.push_back(std::move(undo));
}

void Transaction::schedule(Phase phase, std::string label, Action interaction, Action compensation) {
    if (state_ != State::OPEN) {
        throw std::logic_error("Transaction: journal closed");
    }
    interactions_.push_back(Interaction{phase, std::move(label), std::move(interaction),
                                        std::move(compensation)});
}

void Transaction::on_commit(Action action) {
    if (state_ != State::OPEN) {
        throw std::logic_error("Transaction: journal closed");
    }
    commit_hooks_.push_back(std::move(action));
}

void Transaction::commit() {
    if (state_ != State::OPEN) {
        throw std::logic_error("Transaction: already finished");
    }

    std::stable_sort(interactions_.begin(), interactions_.end(),
                     [](const Interaction& a, const Interaction& b) {
                         return a.phase < b.phase;
                     });

    size_t completed = 0;
    try {
        for (; completed < interactions_.size(); ++completed) {
            interactions_[completed].run();
        }
    } catch (...) {
        PEG_LOG_WARN("interaction '" << interactions_[completed].label
                     << "' failed, unwinding " << completed << " completed interaction(s)");

        for (size_t i = completed; i-- > 0;) {
            const Interaction& done = interactions_[i];
            if (!done.compensate) continue;
            try {
                done.compensate();
            } catch (const std::exception& e) {
                PEG_LOG_ERROR("compensation of '" << done.label << "' failed: " << e.what());
            }
        }
        rollback();
        throw;
    }

    state_ = State::COMMITTED;
    undo_log_.clear();
}

void Transaction::publish() {
    if (state_ != State::COMMITTED) return;

    std::vector<Action> hooks;
    hooks.swap(commit_hooks_);
    for (auto& hook : hooks) hook();
}

void Transaction::rollback() noexcept {
    for (auto it = undo_log_.rbegin(); it != undo_log_.rend(); ++it) {
        (*it)();
    }
    undo_log_.clear();
    state_ = State::ROLLED_BACK;
}

// =============================================================================
// ReentrancyGuard
// =============================================================================

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard) : guard_(guard) {
    if (guard_.entered_) {
        throw ReentrantCall();
    }
    guard_.entered_ = true;
}

ReentrancyGuard::Scope::~Scope() {
    guard_.entered_ = false;
}

} // namespace peg
