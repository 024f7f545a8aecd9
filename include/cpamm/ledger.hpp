#ifndef CPAMM_LEDGER_HPP
#define CPAMM_LEDGER_HPP

#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Journaling
//
// checkpoint() saves the current state on a stack, commit() drops the newest
// saved state, rollback() restores and drops it. Checkpoints nest, which is
// what lets a recipient hook re-enter a ledger while an outer operation is
// still open. The stack is shared by all callers, so journaled ledgers assume
// one sequential writer (the pool serializes its operations).
// =============================================================================

class IJournaled {
public:
    virtual ~IJournaled() = default;

    virtual void checkpoint() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// =============================================================================
// Collaborator Interfaces
// =============================================================================

// Fungible token balances with delegated (allowance based) pulls
class ITokenLedger : public IJournaled {
public:
    virtual Amount balance_of(const Address& owner) const = 0;

    virtual int32_t transfer(const Address& from, const Address& to, Amount amount) = 0;

    // Move `amount` from `from` to `spender`, consuming the allowance `from`
    // granted to `spender`. Either both checks pass and funds move, or nothing
    // changes.
    virtual int32_t check_and_pull(const Address& spender, const Address& from, Amount amount) = 0;
};

// LP share supply
class IShareLedger : public IJournaled {
public:
    virtual Amount balance_of(const Address& owner) const = 0;
    virtual Amount total_supply() const = 0;

    virtual int32_t mint(const Address& to, Amount amount) = 0;
    virtual int32_t burn(const Address& from, Amount amount) = 0;
};

// Base-currency balances. A transfer may be refused by the recipient.
class IValueLedger : public IJournaled {
public:
    virtual Amount balance_of(const Address& owner) const = 0;

    virtual int32_t transfer(const Address& from, const Address& to, Amount amount) = 0;
};

// Hook run when base currency arrives at a registered address. Runs after the
// funds are credited and with no ledger lock held, so it may call back into
// the pool. Returning false refuses the funds.
class IRecipient {
public:
    virtual ~IRecipient() = default;

    virtual bool on_receive(const Address& from, Amount amount) = 0;
};

// =============================================================================
// TokenLedger - divisible token with allowances, mint and burn
//
// Serves as the external token ledger and as the LP-share ledger.
// =============================================================================

class TokenLedger : public ITokenLedger, public IShareLedger {
public:
    explicit TokenLedger(std::string symbol);
    ~TokenLedger() override = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    const std::string& symbol() const { return symbol_; }

    // Queries
    Amount balance_of(const Address& owner) const override;
    Amount total_supply() const override;
    Amount allowance(const Address& owner, const Address& spender) const;

    // Transfers
    int32_t approve(const Address& owner, const Address& spender, Amount amount);
    int32_t transfer(const Address& from, const Address& to, Amount amount) override;
    int32_t transfer_from(const Address& spender, const Address& from,
                          const Address& to, Amount amount);
    int32_t check_and_pull(const Address& spender, const Address& from, Amount amount) override;

    // Supply
    int32_t mint(const Address& to, Amount amount) override;
    int32_t burn(const Address& from, Amount amount) override;

    // Journaling
    void checkpoint() override;
    void commit() override;
    void rollback() override;
    size_t journal_depth() const;

private:
    struct State {
        std::map<Address, Amount> balances;
        std::map<std::pair<Address, Address>, Amount> allowances;  // (owner, spender)
        Amount total_supply = 0;
    };

    std::string symbol_;
    State state_;
    std::vector<State> journal_;
    mutable std::shared_mutex mutex_;

    // Caller holds mutex_ exclusively
    int32_t move_locked(const Address& from, const Address& to, Amount amount);
    int32_t pull_locked(const Address& spender, const Address& from,
                        const Address& to, Amount amount);
};

// =============================================================================
// NativeLedger - base currency with recipient hooks
// =============================================================================

class NativeLedger : public IValueLedger {
public:
    NativeLedger() = default;
    ~NativeLedger() override = default;

    // Non-copyable
    NativeLedger(const NativeLedger&) = delete;
    NativeLedger& operator=(const NativeLedger&) = delete;

    Amount balance_of(const Address& owner) const override;
    Amount total_supply() const;

    // Create base currency out of nothing (genesis allocation)
    int32_t credit(const Address& to, Amount amount);

    // Moves funds, then runs the recipient hook of `to` if one is registered.
    // A refusal restores this ledger and returns RECIPIENT_REJECTED.
    int32_t transfer(const Address& from, const Address& to, Amount amount) override;

    void register_recipient(const Address& addr, IRecipient* recipient);
    void unregister_recipient(const Address& addr);

    // Journaling
    void checkpoint() override;
    void commit() override;
    void rollback() override;
    size_t journal_depth() const;

private:
    struct State {
        std::map<Address, Amount> balances;
        Amount total_supply = 0;
    };

    State state_;
    std::vector<State> journal_;
    std::map<Address, IRecipient*> recipients_;
    mutable std::shared_mutex mutex_;
};

} // namespace cpamm

#endif // CPAMM_LEDGER_HPP
