#ifndef CPAMM_POOL_HPP
#define CPAMM_POOL_HPP

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "config.hpp"
#include "ledger.hpp"
#include "observer.hpp"
#include "pricing.hpp"
#include "types.hpp"

namespace cpamm {

// =============================================================================
// Operation Results
// =============================================================================

struct LiquidityResult {
    int32_t status;
    Amount shares_minted;
    Amount tokens_pulled;
    Amount base_added;

    bool ok() const { return status == errors::OK; }
};

struct RemoveResult {
    int32_t status;
    Amount base_out;
    Amount token_out;

    bool ok() const { return status == errors::OK; }
};

struct SwapResult {
    int32_t status;
    Amount amount_in;
    Amount amount_out;

    bool ok() const { return status == errors::OK; }
};

struct PoolSnapshot {
    Amount base_reserve;
    Amount token_reserve;
    Amount total_shares;
};

// =============================================================================
// LiquidityPool - constant-product pool of base currency against one token
//
// Owns no balances of its own: reserves are the pool address's balances in
// the value and token ledgers, and LP supply is the share ledger's total.
// Every mutating call runs inside a Transaction over all three ledgers and
// either commits completely or leaves them untouched.
// =============================================================================

class LiquidityPool {
public:
    LiquidityPool(const Address& self, IValueLedger& base, ITokenLedger& token,
                  IShareLedger& shares, PoolConfig config = PoolConfig{});
    ~LiquidityPool() = default;

    // Non-copyable
    LiquidityPool(const LiquidityPool&) = delete;
    LiquidityPool& operator=(const LiquidityPool&) = delete;

    // =========================================================================
    // Queries (never fail, never cache)
    // =========================================================================

    const Address& address() const { return self_; }
    const PoolConfig& config() const { return config_; }

    // Token reserve held by the pool
    Amount get_reserve() const;
    Amount base_reserve() const;
    Amount total_shares() const;
    PoolSnapshot snapshot() const;

    Amount share_balance(const Address& holder) const;
    Amount base_balance(const Address& holder) const;
    Amount token_balance(const Address& holder) const;

    // =========================================================================
    // Liquidity
    // =========================================================================

    // Payable. On an empty pool accepts any ratio and mints ctx.value shares;
    // otherwise pulls ctx.value * tokenReserve / baseReserveBefore tokens and
    // mints totalShares * ctx.value / baseReserveBefore shares.
    // The caller must have approved the pool for token_amount_offered.
    LiquidityResult add_liquidity(const CallContext& ctx, Amount token_amount_offered);

    // Burns share_amount from the caller, then pays out its proportional
    // slice of both reserves (rounded down).
    RemoveResult remove_liquidity(const CallContext& ctx, Amount share_amount);

    // =========================================================================
    // Swaps
    // =========================================================================

    // Payable: sells ctx.value base currency for tokens
    SwapResult swap_base_for_token(const CallContext& ctx, Amount min_tokens_out);

    // Sells tokens_sold tokens (pulled via allowance) for base currency
    SwapResult swap_token_for_base(const CallContext& ctx, Amount tokens_sold,
                                   Amount min_base_out);

    // =========================================================================
    // Previews (same arithmetic as the operations, no side effects)
    // =========================================================================

    // tokens_pulled is 0 on an empty pool, where any token amount is accepted
    LiquidityResult preview_add_liquidity(Amount base_amount) const;
    RemoveResult preview_remove_liquidity(Amount share_amount) const;
    SwapResult preview_swap_base_for_token(Amount base_in) const;
    SwapResult preview_swap_token_for_base(Amount tokens_in) const;

    // =========================================================================
    // Observers
    // =========================================================================

    void register_observer(IPoolObserver* observer);
    void unregister_observer(IPoolObserver* observer);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_deposits;
        uint64_t total_withdrawals;
        uint64_t total_swaps;
        uint64_t total_rejections;
        Amount base_volume;    // base currency swapped in
        Amount token_volume;   // tokens swapped in
    };
    Stats get_stats() const;

private:
    class OperationScope;

    struct DepositPlan {
        int32_t status;
        Amount required_tokens;
        Amount shares;
    };

    Address self_;
    IValueLedger& base_;
    ITokenLedger& token_;
    IShareLedger& shares_;
    PoolConfig config_;

    // Serializes operations; owner_ is the thread running one, so reads made
    // from inside an external transfer skip the lock instead of deadlocking
    mutable std::mutex op_mutex_;
    std::atomic<std::thread::id> owner_{};

    std::vector<IPoolObserver*> observers_;
    mutable std::shared_mutex observers_mutex_;

    // Statistics
    std::atomic<uint64_t> total_deposits_{0};
    std::atomic<uint64_t> total_withdrawals_{0};
    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_rejections_{0};
    Amount base_volume_{0};    // guarded by op_mutex_
    Amount token_volume_{0};   // guarded by op_mutex_

    std::unique_lock<std::mutex> read_lock() const;

    // Bodies of the mutating operations; run inside an open Transaction
    LiquidityResult do_add_liquidity(const CallContext& ctx, Amount token_amount_offered);
    RemoveResult do_remove_liquidity(const CallContext& ctx, Amount share_amount);
    SwapResult do_swap_base_for_token(const CallContext& ctx, Amount min_tokens_out);
    SwapResult do_swap_token_for_base(const CallContext& ctx, Amount tokens_sold,
                                      Amount min_base_out);

    // Ratio arithmetic shared by operations and previews
    static DepositPlan plan_deposit(Amount base_in, Amount base_before, Amount token_reserve,
                                    Amount total_shares, Amount tokens_offered);
    static RemoveResult plan_withdrawal(Amount share_amount, Amount base_reserve,
                                        Amount token_reserve, Amount total_shares);

    std::vector<IPoolObserver*> observers() const;
    void notify_rejected(const Address& caller, const char* operation, int32_t status);
};

} // namespace cpamm

#endif // CPAMM_POOL_HPP
