// cpamm - Basic Example
// Bootstraps a pool, trades against it and withdraws liquidity

#include <cpamm/config.hpp>
#include <cpamm/ledger.hpp>
#include <cpamm/pool.hpp>
#include <iostream>

using namespace cpamm;

namespace {

constexpr Amount UNIT = 1000000000000000000ULL;  // 1e18

bool check(int32_t status, const char* what) {
    if (status == errors::OK) return true;
    std::cerr << what << " failed: " << errors::name(status) << "\n";
    return false;
}

void print_reserves(const LiquidityPool& pool) {
    std::cout << "Reserves: " << snapshot_to_json(pool.snapshot()) << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    PoolConfig config;
    try {
        if (argc > 1) {
            config = PoolConfig::from_file(argv[1]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (config.validate() != errors::OK) {
        std::cerr << "Error: invalid fee schedule in config\n";
        return 1;
    }

    auto level = parse_log_level(config.log_level);
    if (!level) {
        std::cerr << "Error: unknown log level '" << config.log_level << "'\n";
        return 1;
    }

    // Ledgers the pool settles against
    NativeLedger base;
    TokenLedger token("TKN");
    TokenLedger shares("LP");

    const Address pool_addr = addresses::from_id(0x9010);
    const Address alice = addresses::from_id(1);
    const Address bob = addresses::from_id(2);

    if (!check(base.credit(alice, 100 * UNIT), "credit") ||
        !check(base.credit(bob, 10 * UNIT), "credit") ||
        !check(token.mint(alice, 1000 * UNIT), "mint") ||
        !check(token.mint(bob, 100 * UNIT), "mint")) {
        return 1;
    }

    LiquidityPool pool(pool_addr, base, token, shares, config);
    StreamLogger logger(std::cerr, *level);
    pool.register_observer(&logger);

    std::cout << "Pool " << config.name << " at " << addresses::to_hex(pool_addr) << "\n";

    // Alice seeds the pool at 1 base : 10 tokens
    if (!check(token.approve(alice, pool_addr, 500 * UNIT), "approve")) return 1;
    auto seeded = pool.add_liquidity({alice, 50 * UNIT}, 500 * UNIT);
    if (!check(seeded.status, "Bootstrap")) return 1;
    print_reserves(pool);

    // Bob buys tokens with 1 base, accepting at most 5% below the preview
    auto preview = pool.preview_swap_base_for_token(UNIT);
    Amount min_out = preview.amount_out - preview.amount_out / 20;
    auto bought = pool.swap_base_for_token({bob, UNIT}, min_out);
    std::cout << "Bob bought " << to_string(bought.amount_out) << " tokens ("
              << errors::name(bought.status) << ")\n";

    // Bob sells 50 tokens back
    if (!check(token.approve(bob, pool_addr, 50 * UNIT), "approve")) return 1;
    auto sold = pool.swap_token_for_base({bob, 0}, 50 * UNIT, 0);
    std::cout << "Bob received " << to_string(sold.amount_out) << " base ("
              << errors::name(sold.status) << ")\n";
    print_reserves(pool);

    // Alice withdraws half of her shares
    Amount half = pool.share_balance(alice) / 2;
    auto removed = pool.remove_liquidity({alice, 0}, half);
    std::cout << "Alice withdrew " << to_string(removed.base_out) << " base and "
              << to_string(removed.token_out) << " tokens ("
              << errors::name(removed.status) << ")\n";
    print_reserves(pool);

    auto stats = pool.get_stats();
    std::cout << "Deposits: " << stats.total_deposits
              << ", withdrawals: " << stats.total_withdrawals
              << ", swaps: " << stats.total_swaps << "\n";

    pool.unregister_observer(&logger);
    return 0;
}
