// cpamm - Ledger and Transaction Tests

#include "test_support.hpp"
#include <cpamm/transaction.hpp>

using namespace cpamm;

namespace {

const Address ALICE = addresses::from_id(1);
const Address BOB = addresses::from_id(2);
const Address SPENDER = addresses::from_id(3);

// Accepts or refuses incoming funds; counts calls
class ToggleRecipient : public IRecipient {
public:
    explicit ToggleRecipient(bool accept) : accept_(accept) {}

    bool on_receive(const Address& from, Amount amount) override {
        ++calls;
        last_amount = amount;
        return accept_;
    }

    int calls = 0;
    Amount last_amount = 0;

private:
    bool accept_;
};

}  // namespace

TEST_CASE("TokenLedger transfers", "[ledger]") {
    TokenLedger token("TKN");
    REQUIRE(token.symbol() == "TKN");
    REQUIRE(token.mint(ALICE, 1000) == errors::OK);

    SECTION("Transfer moves balance") {
        REQUIRE(token.transfer(ALICE, BOB, 400) == errors::OK);
        REQUIRE(token.balance_of(ALICE) == 600);
        REQUIRE(token.balance_of(BOB) == 400);
        REQUIRE(token.total_supply() == 1000);
    }

    SECTION("Insufficient balance changes nothing") {
        REQUIRE(token.transfer(ALICE, BOB, 1001) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(token.balance_of(ALICE) == 1000);
        REQUIRE(token.balance_of(BOB) == 0);
    }

    SECTION("Self transfer is a no-op") {
        REQUIRE(token.transfer(ALICE, ALICE, 1000) == errors::OK);
        REQUIRE(token.balance_of(ALICE) == 1000);
    }
}

TEST_CASE("TokenLedger allowances", "[ledger]") {
    TokenLedger token("TKN");
    REQUIRE(token.mint(ALICE, 1000) == errors::OK);
    REQUIRE(token.approve(ALICE, SPENDER, 300) == errors::OK);
    REQUIRE(token.allowance(ALICE, SPENDER) == 300);

    SECTION("transfer_from consumes allowance") {
        REQUIRE(token.transfer_from(SPENDER, ALICE, BOB, 200) == errors::OK);
        REQUIRE(token.balance_of(BOB) == 200);
        REQUIRE(token.allowance(ALICE, SPENDER) == 100);
    }

    SECTION("check_and_pull moves funds to the spender") {
        REQUIRE(token.check_and_pull(SPENDER, ALICE, 300) == errors::OK);
        REQUIRE(token.balance_of(SPENDER) == 300);
        REQUIRE(token.balance_of(ALICE) == 700);
        REQUIRE(token.allowance(ALICE, SPENDER) == 0);
    }

    SECTION("Allowance shortfall") {
        REQUIRE(token.check_and_pull(SPENDER, ALICE, 301) == errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(token.balance_of(ALICE) == 1000);
        REQUIRE(token.allowance(ALICE, SPENDER) == 300);
    }

    SECTION("Balance shortfall leaves allowance intact") {
        REQUIRE(token.approve(ALICE, SPENDER, 5000) == errors::OK);
        REQUIRE(token.check_and_pull(SPENDER, ALICE, 2000) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(token.allowance(ALICE, SPENDER) == 5000);
        REQUIRE(token.balance_of(ALICE) == 1000);
    }

    SECTION("Approving zero revokes") {
        REQUIRE(token.approve(ALICE, SPENDER, 0) == errors::OK);
        REQUIRE(token.allowance(ALICE, SPENDER) == 0);
        REQUIRE(token.check_and_pull(SPENDER, ALICE, 1) == errors::INSUFFICIENT_ALLOWANCE);
    }
}

TEST_CASE("TokenLedger supply", "[ledger]") {
    TokenLedger shares("LP");

    REQUIRE(shares.mint(ALICE, 500) == errors::OK);
    REQUIRE(shares.mint(BOB, 250) == errors::OK);
    REQUIRE(shares.total_supply() == 750);

    REQUIRE(shares.burn(ALICE, 501) == errors::INSUFFICIENT_BALANCE);
    REQUIRE(shares.burn(ALICE, 500) == errors::OK);
    REQUIRE(shares.balance_of(ALICE) == 0);
    REQUIRE(shares.total_supply() == 250);

    REQUIRE(shares.mint(BOB, AMOUNT_MAX) == errors::ARITHMETIC_OVERFLOW);
    REQUIRE(shares.total_supply() == 250);
}

TEST_CASE("TokenLedger journaling nests", "[ledger]") {
    TokenLedger token("TKN");
    REQUIRE(token.mint(ALICE, 100) == errors::OK);

    token.checkpoint();
    REQUIRE(token.transfer(ALICE, BOB, 10) == errors::OK);

    token.checkpoint();
    REQUIRE(token.transfer(ALICE, BOB, 20) == errors::OK);
    REQUIRE(token.journal_depth() == 2);
    token.rollback();

    REQUIRE(token.balance_of(BOB) == 10);
    token.commit();

    REQUIRE(token.journal_depth() == 0);
    REQUIRE(token.balance_of(BOB) == 10);
    REQUIRE(token.balance_of(ALICE) == 90);

    REQUIRE_THROWS_AS(token.rollback(), std::runtime_error);
}

TEST_CASE("NativeLedger transfers and recipient hooks", "[ledger]") {
    NativeLedger base;
    REQUIRE(base.credit(ALICE, 1000) == errors::OK);
    REQUIRE(base.total_supply() == 1000);

    SECTION("Plain transfer") {
        REQUIRE(base.transfer(ALICE, BOB, 300) == errors::OK);
        REQUIRE(base.balance_of(ALICE) == 700);
        REQUIRE(base.balance_of(BOB) == 300);
    }

    SECTION("Insufficient balance") {
        REQUIRE(base.transfer(ALICE, BOB, 1001) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(base.balance_of(ALICE) == 1000);
    }

    SECTION("Accepting recipient sees credited funds") {
        ToggleRecipient hook(true);
        base.register_recipient(BOB, &hook);

        REQUIRE(base.transfer(ALICE, BOB, 250) == errors::OK);
        REQUIRE(hook.calls == 1);
        REQUIRE(hook.last_amount == 250);
        REQUIRE(base.balance_of(BOB) == 250);
        REQUIRE(base.journal_depth() == 0);
    }

    SECTION("Refusing recipient restores both sides") {
        ToggleRecipient hook(false);
        base.register_recipient(BOB, &hook);

        REQUIRE(base.transfer(ALICE, BOB, 250) == errors::RECIPIENT_REJECTED);
        REQUIRE(hook.calls == 1);
        REQUIRE(base.balance_of(ALICE) == 1000);
        REQUIRE(base.balance_of(BOB) == 0);
        REQUIRE(base.journal_depth() == 0);
    }

    SECTION("Unregistered recipient is not called") {
        ToggleRecipient hook(false);
        base.register_recipient(BOB, &hook);
        base.unregister_recipient(BOB);

        REQUIRE(base.transfer(ALICE, BOB, 250) == errors::OK);
        REQUIRE(hook.calls == 0);
    }
}

TEST_CASE("Transaction rolls back unless committed", "[ledger][transaction]") {
    NativeLedger base;
    TokenLedger token("TKN");
    REQUIRE(base.credit(ALICE, 100) == errors::OK);
    REQUIRE(token.mint(ALICE, 100) == errors::OK);

    SECTION("Scope exit without commit") {
        {
            Transaction tx{&base, static_cast<ITokenLedger*>(&token)};
            REQUIRE(base.transfer(ALICE, BOB, 40) == errors::OK);
            REQUIRE(token.transfer(ALICE, BOB, 60) == errors::OK);
            REQUIRE(tx.active());
        }
        REQUIRE(base.balance_of(ALICE) == 100);
        REQUIRE(token.balance_of(ALICE) == 100);
        REQUIRE(base.journal_depth() == 0);
        REQUIRE(token.journal_depth() == 0);
    }

    SECTION("Commit keeps changes") {
        {
            Transaction tx{&base, static_cast<ITokenLedger*>(&token)};
            REQUIRE(base.transfer(ALICE, BOB, 40) == errors::OK);
            tx.commit();
            REQUIRE_FALSE(tx.active());
        }
        REQUIRE(base.balance_of(BOB) == 40);
        REQUIRE(base.journal_depth() == 0);
    }

    SECTION("Exception unwinding rolls back") {
        auto failing = [&] {
            Transaction tx{&base, static_cast<ITokenLedger*>(&token)};
            REQUIRE(token.transfer(ALICE, BOB, 60) == errors::OK);
            throw std::runtime_error("abort");
        };
        REQUIRE_THROWS_AS(failing(), std::runtime_error);
        REQUIRE(token.balance_of(BOB) == 0);
    }
}
