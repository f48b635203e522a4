// DSC Engine - Collateral and Liability Token Tests

#include <catch2/catch.hpp>

#include "fixture.hpp"

using namespace dsc;
using namespace dsc::test;

TEST_CASE("Erc20 transfers and allowances", "[tokens]") {
    Erc20 token(WETH, "WETH");
    token.mint_to(ALICE, units(10));

    REQUIRE(token.supply() == units(10));
    REQUIRE(token.balance_of(ALICE) == units(10));

    SECTION("Transfer moves balance") {
        REQUIRE(token.transfer(ALICE, BOB, units(4)));
        REQUIRE(token.balance_of(ALICE) == units(6));
        REQUIRE(token.balance_of(BOB) == units(4));
    }

    SECTION("Transfer beyond balance fails") {
        REQUIRE_FALSE(token.transfer(ALICE, BOB, units(11)));
        REQUIRE(token.balance_of(ALICE) == units(10));
    }

    SECTION("Transfer to the zero address fails") {
        REQUIRE_FALSE(token.transfer(ALICE, address::ZERO, units(1)));
    }

    SECTION("transfer_from needs an allowance") {
        REQUIRE_FALSE(token.transfer_from(ENGINE, ALICE, ENGINE, units(1)));

        REQUIRE(token.approve(ALICE, ENGINE, units(3)));
        REQUIRE(token.transfer_from(ENGINE, ALICE, ENGINE, units(2)));
        REQUIRE(token.allowance(ALICE, ENGINE) == units(1));
        REQUIRE(token.balance_of(ENGINE) == units(2));

        REQUIRE_FALSE(token.transfer_from(ENGINE, ALICE, ENGINE, units(2)));
    }
}

TEST_CASE("StableCoin owner controls", "[tokens]") {
    StableCoin coin(DSC_TOKEN, ENGINE);

    SECTION("Only the owner mints") {
        REQUIRE_FALSE(coin.mint(ALICE, ALICE, units(1)));
        REQUIRE(coin.mint(ENGINE, ALICE, units(100)));
        REQUIRE(coin.total_supply() == units(100));
    }

    SECTION("Zero amounts and the zero address are rejected") {
        REQUIRE_FALSE(coin.mint(ENGINE, ALICE, 0));
        REQUIRE_FALSE(coin.mint(ENGINE, address::ZERO, units(1)));
        REQUIRE_FALSE(coin.burn_from(ENGINE, ALICE, 0));
    }

    SECTION("Burn needs balance and allowance") {
        REQUIRE(coin.mint(ENGINE, ALICE, units(100)));
        REQUIRE_FALSE(coin.burn_from(ENGINE, ALICE, units(10)));

        coin.approve(ALICE, ENGINE, units(10));
        REQUIRE_FALSE(coin.burn_from(ENGINE, ALICE, units(20)));
        REQUIRE(coin.burn_from(ENGINE, ALICE, units(10)));
        REQUIRE(coin.balance_of(ALICE) == units(90));
        REQUIRE(coin.total_supply() == units(90));
    }

    SECTION("Ownership transfer") {
        REQUIRE_FALSE(coin.transfer_ownership(ALICE, ALICE));
        REQUIRE(coin.transfer_ownership(ENGINE, BOB));
        REQUIRE(coin.owner() == BOB);
        REQUIRE_FALSE(coin.mint(ENGINE, ALICE, units(1)));
    }
}
