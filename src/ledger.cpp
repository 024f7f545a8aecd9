// =============================================================================
// ledger.cpp - In-memory token and base-currency ledgers
// =============================================================================

#include "cpamm/ledger.hpp"
#include "cpamm/math.hpp"
#include <mutex>
#include <stdexcept>

namespace cpamm {

// =============================================================================
// TokenLedger
// =============================================================================

TokenLedger::TokenLedger(std::string symbol) : symbol_(std::move(symbol)) {}

Amount TokenLedger::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = state_.balances.find(owner);
    return it != state_.balances.end() ? it->second : 0;
}

Amount TokenLedger::total_supply() const {
    std::shared_lock lock(mutex_);
    return state_.total_supply;
}

Amount TokenLedger::allowance(const Address& owner, const Address& spender) const {
    std::shared_lock lock(mutex_);
    auto it = state_.allowances.find({owner, spender});
    return it != state_.allowances.end() ? it->second : 0;
}

int32_t TokenLedger::approve(const Address& owner, const Address& spender, Amount amount) {
    std::unique_lock lock(mutex_);
    if (amount == 0) {
        state_.allowances.erase({owner, spender});
    } else {
        state_.allowances[{owner, spender}] = amount;
    }
    return errors::OK;
}

int32_t TokenLedger::transfer(const Address& from, const Address& to, Amount amount) {
    std::unique_lock lock(mutex_);
    return move_locked(from, to, amount);
}

int32_t TokenLedger::transfer_from(const Address& spender, const Address& from,
                                   const Address& to, Amount amount) {
    std::unique_lock lock(mutex_);
    return pull_locked(spender, from, to, amount);
}

int32_t TokenLedger::check_and_pull(const Address& spender, const Address& from, Amount amount) {
    std::unique_lock lock(mutex_);
    return pull_locked(spender, from, spender, amount);
}

int32_t TokenLedger::mint(const Address& to, Amount amount) {
    std::unique_lock lock(mutex_);

    Amount new_supply = 0;
    int32_t rc = amount_math::checked_add(state_.total_supply, amount, new_supply);
    if (rc != errors::OK) return rc;

    // Balance cannot overflow: it never exceeds total supply
    state_.balances[to] += amount;
    state_.total_supply = new_supply;
    return errors::OK;
}

int32_t TokenLedger::burn(const Address& from, Amount amount) {
    std::unique_lock lock(mutex_);

    auto it = state_.balances.find(from);
    Amount balance = it != state_.balances.end() ? it->second : 0;
    if (balance < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    if (amount == 0) return errors::OK;

    it->second -= amount;
    if (it->second == 0) state_.balances.erase(it);
    state_.total_supply -= amount;
    return errors::OK;
}

int32_t TokenLedger::move_locked(const Address& from, const Address& to, Amount amount) {
    auto it = state_.balances.find(from);
    Amount balance = it != state_.balances.end() ? it->second : 0;
    if (balance < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    if (amount == 0 || from == to) return errors::OK;

    it->second -= amount;
    if (it->second == 0) state_.balances.erase(it);
    state_.balances[to] += amount;
    return errors::OK;
}

int32_t TokenLedger::pull_locked(const Address& spender, const Address& from,
                                 const Address& to, Amount amount) {
    auto allowance_it = state_.allowances.find({from, spender});
    Amount allowed = allowance_it != state_.allowances.end() ? allowance_it->second : 0;
    if (allowed < amount) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }

    int32_t rc = move_locked(from, to, amount);
    if (rc != errors::OK) return rc;

    if (amount != 0) {
        allowance_it->second -= amount;
        if (allowance_it->second == 0) state_.allowances.erase(allowance_it);
    }
    return errors::OK;
}

void TokenLedger::checkpoint() {
    std::unique_lock lock(mutex_);
    journal_.push_back(state_);
}

void TokenLedger::commit() {
    std::unique_lock lock(mutex_);
    if (journal_.empty()) {
        throw std::runtime_error("TokenLedger: commit without checkpoint");
    }
    journal_.pop_back();
}

void TokenLedger::rollback() {
    std::unique_lock lock(mutex_);
    if (journal_.empty()) {
        throw std::runtime_error("TokenLedger: rollback without checkpoint");
    }
    state_ = std::move(journal_.back());
    journal_.pop_back();
}

size_t TokenLedger::journal_depth() const {
    std::shared_lock lock(mutex_);
    return journal_.size();
}

// =============================================================================
// NativeLedger
// =============================================================================

Amount NativeLedger::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = state_.balances.find(owner);
    return it != state_.balances.end() ? it->second : 0;
}

Amount NativeLedger::total_supply() const {
    std::shared_lock lock(mutex_);
    return state_.total_supply;
}

int32_t NativeLedger::credit(const Address& to, Amount amount) {
    std::unique_lock lock(mutex_);

    Amount new_supply = 0;
    int32_t rc = amount_math::checked_add(state_.total_supply, amount, new_supply);
    if (rc != errors::OK) return rc;

    state_.balances[to] += amount;
    state_.total_supply = new_supply;
    return errors::OK;
}

int32_t NativeLedger::transfer(const Address& from, const Address& to, Amount amount) {
    IRecipient* recipient = nullptr;
    {
        std::unique_lock lock(mutex_);

        auto it = state_.balances.find(from);
        Amount balance = it != state_.balances.end() ? it->second : 0;
        if (balance < amount) {
            return errors::INSUFFICIENT_BALANCE;
        }

        auto hook_it = recipients_.find(to);
        if (hook_it != recipients_.end()) {
            recipient = hook_it->second;
            // Saved so a refusal can undo whatever the hook did here
            journal_.push_back(state_);
        }

        if (amount != 0 && from != to) {
            it->second -= amount;
            if (it->second == 0) state_.balances.erase(it);
            state_.balances[to] += amount;
        }
    }

    if (!recipient) return errors::OK;

    // No lock held: the hook may read balances or re-enter the pool
    bool accepted = false;
    try {
        accepted = recipient->on_receive(from, amount);
    } catch (...) {
        rollback();
        throw;
    }

    if (accepted) {
        commit();
        return errors::OK;
    }
    rollback();
    return errors::RECIPIENT_REJECTED;
}

void NativeLedger::register_recipient(const Address& addr, IRecipient* recipient) {
    if (!recipient) return;
    std::unique_lock lock(mutex_);
    recipients_[addr] = recipient;
}

void NativeLedger::unregister_recipient(const Address& addr) {
    std::unique_lock lock(mutex_);
    recipients_.erase(addr);
}

void NativeLedger::checkpoint() {
    std::unique_lock lock(mutex_);
    journal_.push_back(state_);
}

void NativeLedger::commit() {
    std::unique_lock lock(mutex_);
    if (journal_.empty()) {
        throw std::runtime_error("NativeLedger: commit without checkpoint");
    }
    journal_.pop_back();
}

void NativeLedger::rollback() {
    std::unique_lock lock(mutex_);
    if (journal_.empty()) {
        throw std::runtime_error("NativeLedger: rollback without checkpoint");
    }
    state_ = std::move(journal_.back());
    journal_.pop_back();
}

size_t NativeLedger::journal_depth() const {
    std::shared_lock lock(mutex_);
    return journal_.size();
}

} // namespace cpamm
