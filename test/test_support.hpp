// cpamm - Shared test fixtures

#ifndef CPAMM_TEST_SUPPORT_HPP
#define CPAMM_TEST_SUPPORT_HPP

#include <catch2/catch_tostring.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cpamm/ledger.hpp>
#include <cpamm/pool.hpp>
#include <string>
#include <utility>

// Print 128-bit amounts in assertion failures
namespace Catch {
template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) {
        return cpamm::to_string(value);
    }
};
}  // namespace Catch

namespace cpamm::test {

// A pool wired to fresh in-memory ledgers, plus two funded-on-demand users
struct PoolFixture {
    NativeLedger base;
    TokenLedger token{"TKN"};
    TokenLedger shares{"LP"};

    const Address pool_addr = addresses::from_id(0x9010);
    const Address alice = addresses::from_id(1);
    const Address bob = addresses::from_id(2);

    LiquidityPool pool;

    explicit PoolFixture(PoolConfig config = PoolConfig{})
        : pool(pool_addr, base, token, shares, std::move(config)) {}

    void fund(const Address& who, Amount base_amount, Amount token_amount) {
        REQUIRE(base.credit(who, base_amount) == errors::OK);
        REQUIRE(token.mint(who, token_amount) == errors::OK);
    }

    LiquidityResult deposit(const Address& who, Amount value, Amount tokens_offered) {
        REQUIRE(token.approve(who, pool_addr, tokens_offered) == errors::OK);
        return pool.add_liquidity({who, value}, tokens_offered);
    }

    SwapResult sell_tokens(const Address& who, Amount tokens, Amount min_base_out) {
        REQUIRE(token.approve(who, pool_addr, tokens) == errors::OK);
        return pool.swap_token_for_base({who, 0}, tokens, min_base_out);
    }
};

// Pool seeded by alice with the given reserves
struct SeededPool : PoolFixture {
    SeededPool(Amount base_reserve, Amount token_reserve, PoolConfig config = PoolConfig{})
        : PoolFixture(std::move(config)) {
        fund(alice, base_reserve, token_reserve);
        REQUIRE(deposit(alice, base_reserve, token_reserve).ok());
    }
};

}  // namespace cpamm::test

#endif  // CPAMM_TEST_SUPPORT_HPP
