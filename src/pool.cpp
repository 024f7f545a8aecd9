// =============================================================================
// pool.cpp - LiquidityPool constant-product AMM implementation
// =============================================================================

#include "cpamm/pool.hpp"
#include "cpamm/math.hpp"
#include "cpamm/transaction.hpp"
#include <algorithm>

namespace cpamm {

namespace {

// Any ledger refusal surfaces as TRANSFER_FAILED; overflow keeps its own code
inline int32_t ledger_failure(int32_t rc) {
    return rc == errors::ARITHMETIC_OVERFLOW ? rc : errors::TRANSFER_FAILED;
}

inline Amount saturating_add(Amount a, Amount b) {
    Amount sum = 0;
    return amount_math::checked_add(a, b, sum) == errors::OK ? sum : AMOUNT_MAX;
}

} // anonymous namespace

// =============================================================================
// Operation Scope (serialization + reentrancy guard)
// =============================================================================

class LiquidityPool::OperationScope {
public:
    explicit OperationScope(LiquidityPool& pool) : pool_(pool) {
        // Same thread already inside an operation: called back from a transfer
        if (pool_.owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
            status_ = errors::REENTRANCY;
            return;
        }
        lock_ = std::unique_lock<std::mutex>(pool_.op_mutex_);
        pool_.owner_.store(std::this_thread::get_id(), std::memory_order_release);
    }

    ~OperationScope() { release(); }

    OperationScope(const OperationScope&) = delete;
    OperationScope& operator=(const OperationScope&) = delete;

    int32_t status() const { return status_; }

    void release() {
        if (!lock_.owns_lock()) return;
        pool_.owner_.store(std::thread::id{}, std::memory_order_release);
        lock_.unlock();
    }

private:
    LiquidityPool& pool_;
    std::unique_lock<std::mutex> lock_;
    int32_t status_{errors::OK};
};

// =============================================================================
// Constructor
// =============================================================================

LiquidityPool::LiquidityPool(const Address& self, IValueLedger& base, ITokenLedger& token,
                             IShareLedger& shares, PoolConfig config)
    : self_(self), base_(base), token_(token), shares_(shares), config_(std::move(config)) {}

std::unique_lock<std::mutex> LiquidityPool::read_lock() const {
    // Re-entrant read from inside our own operation: the lock is already ours
    if (owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
        return {};
    }
    return std::unique_lock<std::mutex>(op_mutex_);
}

// =============================================================================
// Queries
// =============================================================================

Amount LiquidityPool::get_reserve() const {
    auto lock = read_lock();
    return token_.balance_of(self_);
}

Amount LiquidityPool::base_reserve() const {
    auto lock = read_lock();
    return base_.balance_of(self_);
}

Amount LiquidityPool::total_shares() const {
    auto lock = read_lock();
    return shares_.total_supply();
}

PoolSnapshot LiquidityPool::snapshot() const {
    auto lock = read_lock();
    return PoolSnapshot{
        base_.balance_of(self_),
        token_.balance_of(self_),
        shares_.total_supply()
    };
}

Amount LiquidityPool::share_balance(const Address& holder) const {
    auto lock = read_lock();
    return shares_.balance_of(holder);
}

Amount LiquidityPool::base_balance(const Address& holder) const {
    auto lock = read_lock();
    return base_.balance_of(holder);
}

Amount LiquidityPool::token_balance(const Address& holder) const {
    auto lock = read_lock();
    return token_.balance_of(holder);
}

// =============================================================================
// Ratio Arithmetic
// =============================================================================

LiquidityPool::DepositPlan LiquidityPool::plan_deposit(Amount base_in, Amount base_before,
                                                       Amount token_reserve, Amount total_shares,
                                                       Amount tokens_offered) {
    // Bootstrap: the first depositor sets the price, shares are 1:1 with base
    if (token_reserve == 0) {
        return {errors::OK, tokens_offered, base_in};
    }

    if (base_before == 0) {
        return {errors::NO_LIQUIDITY, 0, 0};
    }

    Amount required = 0;
    int32_t rc = amount_math::mul_div(base_in, token_reserve, base_before, required);
    if (rc != errors::OK) return {rc, 0, 0};

    if (tokens_offered < required) {
        return {errors::INSUFFICIENT_TOKEN_OFFER, required, 0};
    }

    // Truncation keeps any remainder in the pool
    Amount minted = 0;
    rc = amount_math::mul_div(total_shares, base_in, base_before, minted);
    if (rc != errors::OK) return {rc, 0, 0};

    return {errors::OK, required, minted};
}

RemoveResult LiquidityPool::plan_withdrawal(Amount share_amount, Amount base_reserve,
                                            Amount token_reserve, Amount total_shares) {
    if (share_amount == 0) {
        return {errors::INVALID_AMOUNT, 0, 0};
    }
    if (total_shares == 0) {
        return {errors::NO_LIQUIDITY, 0, 0};
    }
    if (share_amount > total_shares) {
        return {errors::INVALID_AMOUNT, 0, 0};
    }

    Amount base_out = 0;
    int32_t rc = amount_math::mul_div(base_reserve, share_amount, total_shares, base_out);
    if (rc != errors::OK) return {rc, 0, 0};

    Amount token_out = 0;
    rc = amount_math::mul_div(token_reserve, share_amount, total_shares, token_out);
    if (rc != errors::OK) return {rc, 0, 0};

    return {errors::OK, base_out, token_out};
}

// =============================================================================
// Add Liquidity
// =============================================================================

LiquidityResult LiquidityPool::add_liquidity(const CallContext& ctx, Amount token_amount_offered) {
    OperationScope scope(*this);
    if (scope.status() != errors::OK) {
        notify_rejected(ctx.caller, "add_liquidity", scope.status());
        return {scope.status(), 0, 0, 0};
    }

    Transaction tx{&base_, &token_, &shares_};
    LiquidityResult result = do_add_liquidity(ctx, token_amount_offered);
    if (!result.ok()) {
        tx.rollback();
        scope.release();
        notify_rejected(ctx.caller, "add_liquidity", result.status);
        return result;
    }

    tx.commit();
    total_deposits_.fetch_add(1, std::memory_order_relaxed);
    scope.release();

    for (IPoolObserver* observer : observers()) {
        observer->on_liquidity_added(ctx.caller, result.base_added,
                                     result.tokens_pulled, result.shares_minted);
    }
    return result;
}

LiquidityResult LiquidityPool::do_add_liquidity(const CallContext& ctx, Amount token_amount_offered) {
    const Amount value = ctx.value;
    if (value == 0) {
        return {errors::INVALID_AMOUNT, 0, 0, 0};
    }

    Amount token_reserve = token_.balance_of(self_);
    if (token_reserve == 0) {
        if (token_amount_offered == 0 || value < config_.min_bootstrap_base) {
            return {errors::INVALID_AMOUNT, 0, 0, 0};
        }
    }

    // Base currency travels with the call
    int32_t rc = base_.transfer(ctx.caller, self_, value);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0, 0};

    // Reserve as it was before this call's value arrived
    Amount base_before = 0;
    rc = amount_math::checked_sub(base_.balance_of(self_), value, base_before);
    if (rc != errors::OK) return {rc, 0, 0, 0};

    DepositPlan plan = plan_deposit(value, base_before, token_reserve,
                                    shares_.total_supply(), token_amount_offered);
    if (plan.status != errors::OK) {
        return {plan.status, 0, 0, 0};
    }

    rc = token_.check_and_pull(self_, ctx.caller, plan.required_tokens);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0, 0};

    rc = shares_.mint(ctx.caller, plan.shares);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0, 0};

    return {errors::OK, plan.shares, plan.required_tokens, value};
}

// =============================================================================
// Remove Liquidity
// =============================================================================

RemoveResult LiquidityPool::remove_liquidity(const CallContext& ctx, Amount share_amount) {
    OperationScope scope(*this);
    if (scope.status() != errors::OK) {
        notify_rejected(ctx.caller, "remove_liquidity", scope.status());
        return {scope.status(), 0, 0};
    }

    Transaction tx{&base_, &token_, &shares_};
    RemoveResult result = do_remove_liquidity(ctx, share_amount);
    if (!result.ok()) {
        tx.rollback();
        scope.release();
        notify_rejected(ctx.caller, "remove_liquidity", result.status);
        return result;
    }

    tx.commit();
    total_withdrawals_.fetch_add(1, std::memory_order_relaxed);
    scope.release();

    for (IPoolObserver* observer : observers()) {
        observer->on_liquidity_removed(ctx.caller, share_amount,
                                       result.base_out, result.token_out);
    }
    return result;
}

RemoveResult LiquidityPool::do_remove_liquidity(const CallContext& ctx, Amount share_amount) {
    if (ctx.value != 0) {
        return {errors::INVALID_AMOUNT, 0, 0};
    }

    RemoveResult plan = plan_withdrawal(share_amount, base_.balance_of(self_),
                                        token_.balance_of(self_), shares_.total_supply());
    if (!plan.ok()) return plan;

    // Burn before any value leaves the pool
    int32_t rc = shares_.burn(ctx.caller, share_amount);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0};

    // Tokens first: the base push may run a recipient hook, which must see
    // both reserves already reduced
    rc = token_.transfer(self_, ctx.caller, plan.token_out);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0};

    rc = base_.transfer(self_, ctx.caller, plan.base_out);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0};

    return plan;
}

// =============================================================================
// Swap: Base -> Token
// =============================================================================

SwapResult LiquidityPool::swap_base_for_token(const CallContext& ctx, Amount min_tokens_out) {
    OperationScope scope(*this);
    if (scope.status() != errors::OK) {
        notify_rejected(ctx.caller, "swap_base_for_token", scope.status());
        return {scope.status(), 0, 0};
    }

    Transaction tx{&base_, &token_, &shares_};
    SwapResult result = do_swap_base_for_token(ctx, min_tokens_out);
    if (!result.ok()) {
        tx.rollback();
        scope.release();
        notify_rejected(ctx.caller, "swap_base_for_token", result.status);
        return result;
    }

    tx.commit();
    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    base_volume_ = saturating_add(base_volume_, result.amount_in);
    scope.release();

    for (IPoolObserver* observer : observers()) {
        observer->on_swap(ctx.caller, SwapDirection::BASE_TO_TOKEN,
                          result.amount_in, result.amount_out);
    }
    return result;
}

SwapResult LiquidityPool::do_swap_base_for_token(const CallContext& ctx, Amount min_tokens_out) {
    const Amount value = ctx.value;
    if (value == 0) {
        return {errors::INVALID_AMOUNT, 0, 0};
    }

    Amount token_reserve = token_.balance_of(self_);

    int32_t rc = base_.transfer(ctx.caller, self_, value);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0};

    Amount base_before = 0;
    rc = amount_math::checked_sub(base_.balance_of(self_), value, base_before);
    if (rc != errors::OK) return {rc, 0, 0};

    QuoteResult q = pricing::quote(value, base_before, token_reserve, config_.fee);
    if (!q.ok()) return {q.status, 0, 0};

    if (q.amount_out < min_tokens_out) {
        return {errors::SLIPPAGE_EXCEEDED, value, q.amount_out};
    }

    rc = token_.transfer(self_, ctx.caller, q.amount_out);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0};

    return {errors::OK, value, q.amount_out};
}

// =============================================================================
// Swap: Token -> Base
// =============================================================================

SwapResult LiquidityPool::swap_token_for_base(const CallContext& ctx, Amount tokens_sold,
                                              Amount min_base_out) {
    OperationScope scope(*this);
    if (scope.status() != errors::OK) {
        notify_rejected(ctx.caller, "swap_token_for_base", scope.status());
        return {scope.status(), 0, 0};
    }

    Transaction tx{&base_, &token_, &shares_};
    SwapResult result = do_swap_token_for_base(ctx, tokens_sold, min_base_out);
    if (!result.ok()) {
        tx.rollback();
        scope.release();
        notify_rejected(ctx.caller, "swap_token_for_base", result.status);
        return result;
    }

    tx.commit();
    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    token_volume_ = saturating_add(token_volume_, result.amount_in);
    scope.release();

    for (IPoolObserver* observer : observers()) {
        observer->on_swap(ctx.caller, SwapDirection::TOKEN_TO_BASE,
                          result.amount_in, result.amount_out);
    }
    return result;
}

SwapResult LiquidityPool::do_swap_token_for_base(const CallContext& ctx, Amount tokens_sold,
                                                 Amount min_base_out) {
    if (tokens_sold == 0 || ctx.value != 0) {
        return {errors::INVALID_AMOUNT, 0, 0};
    }

    // Tokens are pulled inside this call, so the reserve is read before the pull
    Amount token_reserve = token_.balance_of(self_);
    Amount base_reserve = base_.balance_of(self_);

    QuoteResult q = pricing::quote(tokens_sold, token_reserve, base_reserve, config_.fee);
    if (!q.ok()) return {q.status, 0, 0};

    if (q.amount_out < min_base_out) {
        return {errors::SLIPPAGE_EXCEEDED, tokens_sold, q.amount_out};
    }

    int32_t rc = token_.check_and_pull(self_, ctx.caller, tokens_sold);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0};

    rc = base_.transfer(self_, ctx.caller, q.amount_out);
    if (rc != errors::OK) return {ledger_failure(rc), 0, 0};

    return {errors::OK, tokens_sold, q.amount_out};
}

// =============================================================================
// Previews
// =============================================================================

LiquidityResult LiquidityPool::preview_add_liquidity(Amount base_amount) const {
    if (base_amount == 0) {
        return {errors::INVALID_AMOUNT, 0, 0, 0};
    }

    auto lock = read_lock();
    Amount token_reserve = token_.balance_of(self_);
    if (token_reserve == 0) {
        if (base_amount < config_.min_bootstrap_base) {
            return {errors::INVALID_AMOUNT, 0, 0, 0};
        }
        return {errors::OK, base_amount, 0, base_amount};
    }

    DepositPlan plan = plan_deposit(base_amount, base_.balance_of(self_), token_reserve,
                                    shares_.total_supply(), AMOUNT_MAX);
    if (plan.status != errors::OK) {
        return {plan.status, 0, 0, 0};
    }
    return {errors::OK, plan.shares, plan.required_tokens, base_amount};
}

RemoveResult LiquidityPool::preview_remove_liquidity(Amount share_amount) const {
    auto lock = read_lock();
    return plan_withdrawal(share_amount, base_.balance_of(self_),
                           token_.balance_of(self_), shares_.total_supply());
}

SwapResult LiquidityPool::preview_swap_base_for_token(Amount base_in) const {
    if (base_in == 0) {
        return {errors::INVALID_AMOUNT, 0, 0};
    }

    auto lock = read_lock();
    QuoteResult q = pricing::quote(base_in, base_.balance_of(self_),
                                   token_.balance_of(self_), config_.fee);
    if (!q.ok()) return {q.status, 0, 0};
    return {errors::OK, base_in, q.amount_out};
}

SwapResult LiquidityPool::preview_swap_token_for_base(Amount tokens_in) const {
    if (tokens_in == 0) {
        return {errors::INVALID_AMOUNT, 0, 0};
    }

    auto lock = read_lock();
    QuoteResult q = pricing::quote(tokens_in, token_.balance_of(self_),
                                   base_.balance_of(self_), config_.fee);
    if (!q.ok()) return {q.status, 0, 0};
    return {errors::OK, tokens_in, q.amount_out};
}

// =============================================================================
// Observers
// =============================================================================

void LiquidityPool::register_observer(IPoolObserver* observer) {
    if (!observer) return;
    std::unique_lock lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void LiquidityPool::unregister_observer(IPoolObserver* observer) {
    std::unique_lock lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                     observers_.end());
}

std::vector<IPoolObserver*> LiquidityPool::observers() const {
    std::shared_lock lock(observers_mutex_);
    return observers_;
}

void LiquidityPool::notify_rejected(const Address& caller, const char* operation, int32_t status) {
    total_rejections_.fetch_add(1, std::memory_order_relaxed);
    for (IPoolObserver* observer : observers()) {
        observer->on_rejected(caller, operation, status);
    }
}

// =============================================================================
// Statistics
// =============================================================================

LiquidityPool::Stats LiquidityPool::get_stats() const {
    auto lock = read_lock();
    return Stats{
        total_deposits_.load(std::memory_order_relaxed),
        total_withdrawals_.load(std::memory_order_relaxed),
        total_swaps_.load(std::memory_order_relaxed),
        total_rejections_.load(std::memory_order_relaxed),
        base_volume_,
        token_volume_
    };
}

} // namespace cpamm
