// DSC Engine - Liquidation Tests

#include <catch2/catch.hpp>

#include "fixture.hpp"

using namespace dsc;
using namespace dsc::test;

namespace {

// Alice: 10 WETH against 10000 DSC (health factor exactly 1.0 at $2000).
// Bob: 20 WETH against 5000 DSC, approved to burn it all.
void open_positions(Harness& h) {
    h.open(ALICE, units(10), units(10000));
    h.open(BOB, units(20), units(5000));
    h.allow_burn(BOB, units(5000));
}

} // namespace

TEST_CASE("Healthy positions cannot be liquidated", "[liquidation]") {
    Harness h;
    open_positions(h);

    REQUIRE(error_of([&] { h.engine->liquidate(BOB, ALICE, WETH, units(5000)); })
            == errors::HEALTH_FACTOR_OK);

    REQUIRE(h.engine->get_collateral_balance(ALICE, WETH) == units(10));
    REQUIRE(h.engine->get_debt(ALICE) == units(10000));
    REQUIRE(h.dsc->balance_of(BOB) == units(5000));
    REQUIRE(h.weth->balance_of(BOB) == 0);
}

TEST_CASE("Liquidation after a price drop", "[liquidation]") {
    Harness h;
    open_positions(h);
    h.set_eth_price(1800);

    REQUIRE(h.engine->get_health_factor(ALICE) == X18_ONE * 9 / 10);

    I128 base = h.engine->get_token_amount_from_usd(WETH, units(5000));
    I128 seized = x18::mul_div(base, 110, 100);

    SECTION("Quote has no side effects") {
        LiquidationQuote q = h.engine->quote_liquidation(ALICE, WETH, units(5000));
        REQUIRE(q.liquidatable);
        REQUIRE(q.collateral_x18 == base);
        REQUIRE(q.total_seized_x18 == seized);
        REQUIRE(q.bonus_x18 == seized - base);
        REQUIRE(q.available_x18 == units(10));
        REQUIRE(h.engine->get_debt(ALICE) == units(10000));
    }

    SECTION("Liquidator receives the collateral plus a 10% bonus") {
        std::vector<Event> seen;
        h.engine->subscribe([&](const Event& e) { seen.push_back(e); });

        LiquidationResult r = h.engine->liquidate(BOB, ALICE, WETH, units(5000));

        REQUIRE(r.debt_covered_x18 == units(5000));
        REQUIRE(r.collateral_seized_x18 == seized);
        REQUIRE(r.starting_health_factor_x18 == X18_ONE * 9 / 10);
        REQUIRE(r.ending_health_factor_x18 > r.starting_health_factor_x18);
        REQUIRE(r.ending_health_factor_x18 >= X18_ONE);

        REQUIRE(h.engine->get_debt(ALICE) == units(5000));
        REQUIRE(h.engine->get_collateral_balance(ALICE, WETH) == units(10) - seized);
        REQUIRE(h.weth->balance_of(BOB) == seized);
        REQUIRE(h.dsc->balance_of(BOB) == 0);
        REQUIRE(h.dsc->total_supply() == h.engine->total_debt());
        REQUIRE(h.weth->balance_of(ENGINE) == h.engine->total_collateral(WETH));

        REQUIRE(seen.size() == 3);
        REQUIRE(seen[2].kind == EventKind::LIQUIDATION);
        REQUIRE(seen[2].account == ALICE);
        REQUIRE(seen[2].counterparty == BOB);
        REQUIRE(seen[2].collateral_x18 == seized);
    }

    SECTION("Covering more than the target owes") {
        h.allow_burn(BOB, units(20000));
        REQUIRE(error_of([&] { h.engine->liquidate(BOB, ALICE, WETH, units(10001)); })
                == errors::INSUFFICIENT_DEBT);
    }

    SECTION("Liquidator without the liability") {
        h.open(CAROL, units(1), units(100));
        REQUIRE(error_of([&] { h.engine->liquidate(CAROL, ALICE, WETH, units(5000)); })
                == errors::TRANSFER_FAILED);
        REQUIRE(h.engine->get_debt(ALICE) == units(10000));
        REQUIRE(h.engine->get_collateral_balance(ALICE, WETH) == units(10));
    }

    SECTION("Zero and unsupported inputs") {
        REQUIRE(error_of([&] { h.engine->liquidate(BOB, ALICE, WETH, 0); }) == errors::ZERO_AMOUNT);
        REQUIRE(error_of([&] { h.engine->liquidate(BOB, ALICE, address::from_id(0x42), units(1)); })
                == errors::UNSUPPORTED_ASSET);
    }
}

TEST_CASE("Deep underwater positions", "[liquidation]") {
    Harness h;
    open_positions(h);

    // Bob tops up so he stays healthy at $1000
    h.fund(BOB, *h.weth, units(20));
    h.engine->deposit_collateral(BOB, WETH, units(20));
    h.set_eth_price(1000);
    REQUIRE(h.engine->get_health_factor(ALICE) == X18_ONE / 2);

    SECTION("Full cover would seize more than the target holds") {
        h.allow_burn(BOB, units(10000));
        REQUIRE(h.dsc->transfer(ALICE, BOB, units(5000)));

        REQUIRE(error_of([&] { h.engine->liquidate(BOB, ALICE, WETH, units(10000)); })
                == errors::INSUFFICIENT_COLLATERAL);
        REQUIRE(h.engine->get_collateral_balance(ALICE, WETH) == units(10));
    }

    SECTION("Partial cover leaves the target worse off") {
        REQUIRE(error_of([&] { h.engine->liquidate(BOB, ALICE, WETH, units(1000)); })
                == errors::HEALTH_FACTOR_NOT_IMPROVED);
        REQUIRE(h.engine->get_debt(ALICE) == units(10000));
        REQUIRE(h.dsc->balance_of(BOB) == units(5000));
    }
}

TEST_CASE("Liquidator must remain healthy", "[liquidation]") {
    Harness h;
    h.open(ALICE, units(10), units(10000));

    // Carol mirrors Alice, so the price drop leaves her unhealthy too
    h.open(CAROL, units(10), units(10000));
    h.allow_burn(CAROL, units(5000));

    h.set_eth_price(1800);
    REQUIRE(error_of([&] { h.engine->liquidate(CAROL, ALICE, WETH, units(5000)); })
            == errors::HEALTH_FACTOR_BROKEN);

    REQUIRE(h.engine->get_debt(ALICE) == units(10000));
    REQUIRE(h.dsc->balance_of(CAROL) == units(10000));
}
