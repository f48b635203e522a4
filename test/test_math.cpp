// DSC Engine - Fixed-Point and Address Tests

#include <catch2/catch.hpp>

#include "fixture.hpp"

using namespace dsc;
using namespace dsc::test;

TEST_CASE("x18 mul_div", "[math]") {
    SECTION("Exact products") {
        REQUIRE(x18::mul(units(2000), units(10)) == units(20000));
        REQUIRE(x18::div(units(5000), units(10000)) == X18_ONE / 2);
        REQUIRE(x18::mul_div(7, 3, 2) == 10);
    }

    SECTION("Intermediate product wider than 128 bits") {
        // 1e30 * 1e30 overflows I128 before the division
        I128 big = x18::pow10(30);
        REQUIRE(x18::mul_div(big, big, big) == big);
        REQUIRE(x18::mul_div(big, units(3), X18_ONE) == big * 3);
    }

    SECTION("Signs") {
        REQUIRE(x18::mul_div(-10, 3, 2) == -15);
        REQUIRE(x18::mul_div(10, -3, -2) == 15);
    }

    SECTION("Negative quotients truncate toward zero") {
        REQUIRE(x18::mul_div(-7, 1, 2) == -3);
        REQUIRE(x18::mul_div(7, 1, -2) == -3);
    }

    SECTION("Division by zero") {
        REQUIRE(error_of([] { x18::mul_div(1, 1, 0); }) == errors::MATH_OVERFLOW);
    }

    SECTION("Result beyond I128") {
        REQUIRE(error_of([] { x18::mul_div(I128_MAX, 4, 1); }) == errors::MATH_OVERFLOW);
    }
}

TEST_CASE("x18 checked add", "[math]") {
    REQUIRE(x18::add(units(2), units(3)) == units(5));
    REQUIRE(x18::add(I128_MAX, -1) == I128_MAX - 1);
    REQUIRE(error_of([] { x18::add(I128_MAX, 1); }) == errors::MATH_OVERFLOW);
    REQUIRE(error_of([] { x18::add(-I128_MAX, -2); }) == errors::MATH_OVERFLOW);
}

TEST_CASE("x18 pow10", "[math]") {
    REQUIRE(x18::pow10(0) == 1);
    REQUIRE(x18::pow10(10) == 10000000000LL);
    REQUIRE(x18::pow10(18) == X18_ONE);
    REQUIRE(error_of([] { x18::pow10(39); }) == errors::MATH_OVERFLOW);
}

TEST_CASE("x18 format and parse", "[math]") {
    SECTION("Format trims trailing zeros") {
        REQUIRE(x18::format(units(2000)) == "2000");
        REQUIRE(x18::format(X18_ONE / 2) == "0.5");
        REQUIRE(x18::format(-units(3) / 4) == "-0.75");
        REQUIRE(x18::format(1) == "0.000000000000000001");
    }

    SECTION("Parse") {
        I128 v = 0;
        REQUIRE(x18::parse("2000", v));
        REQUIRE(v == units(2000));
        REQUIRE(x18::parse("0.5", v));
        REQUIRE(v == X18_ONE / 2);
        REQUIRE(x18::parse("-1.25", v));
        REQUIRE(v == -units(5) / 4);
    }

    SECTION("Parse rejects malformed text") {
        I128 v = 0;
        REQUIRE_FALSE(x18::parse("", v));
        REQUIRE_FALSE(x18::parse("1.2.3", v));
        REQUIRE_FALSE(x18::parse("12abc", v));
        REQUIRE_FALSE(x18::parse(".", v));
    }

    SECTION("Parse stops at the I128 boundary") {
        I128 v = 0;
        REQUIRE(x18::parse("170141183460469231731.687303715884105727", v));
        REQUIRE(v == I128_MAX);
        REQUIRE_FALSE(x18::parse("170141183460469231731.687303715884105728", v));
        REQUIRE_FALSE(x18::parse("170141183460469231731.9", v));
        REQUIRE_FALSE(x18::parse("170141183460469231732", v));
    }

    SECTION("Integer rendering") {
        REQUIRE(x18::to_string(0) == "0");
        REQUIRE(x18::to_string(-42) == "-42");
        REQUIRE(x18::to_string(X18_ONE) == "1000000000000000000");
    }
}

TEST_CASE("Address helpers", "[math]") {
    SECTION("Hex round trip") {
        Address a = address::from_id(0xB0B);
        REQUIRE(address::to_hex(a) == "0x0000000000000000000000000000000000000b0b");

        Address parsed{};
        REQUIRE(address::from_hex("0x0000000000000000000000000000000000000B0B", parsed));
        REQUIRE(parsed == a);
    }

    SECTION("Malformed hex") {
        Address parsed{};
        REQUIRE_FALSE(address::from_hex("0x1234", parsed));
        REQUIRE_FALSE(address::from_hex("0xzz00000000000000000000000000000000000000", parsed));
    }

    SECTION("Zero") {
        REQUIRE(address::is_zero(address::ZERO));
        REQUIRE_FALSE(address::is_zero(ALICE));
    }
}

TEST_CASE("Error table", "[errors]") {
    REQUIRE(std::string(errors::name(errors::HEALTH_FACTOR_BROKEN)) == "HealthFactorBroken");
    REQUIRE(std::string(errors::name(errors::REENTRANCY_BLOCKED)) == "ReentrancyBlocked");
    REQUIRE(std::string(errors::name(12345)) == "Unknown");

    DSCError e(errors::ZERO_AMOUNT, "deposit");
    REQUIRE(e.code() == errors::ZERO_AMOUNT);
    REQUIRE(std::string(e.what()) == "ZeroAmount: deposit");
}
