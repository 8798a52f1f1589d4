//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// Tests for the radical rule family

#include <catch2/catch_test_macros.hpp>

#include <symcore/expr/builder.hpp>
#include <symcore/expr/display.hpp>
#include <symcore/simplify/simplifier.hpp>
#include <tests/utils/catch.hpp>

using namespace symcore;
using namespace symcore::simplify;

TEST_CASE("testing square roots of literals", "[simplify][radical]")
{
    ExpressionBuilder b;
    Simplifier s(b);

    SECTION("perfect squares")
    {
        CHECK(to_string(s.simplify(b.sqrt(b.integer(4)))) == "2");
        CHECK(to_string(s.simplify(b.sqrt(b.integer(0)))) == "0");
        CHECK(to_string(s.simplify(b.sqrt(b.rational(9, 4)))) == "3/2");
        CHECK(s.simplify(b.sqrt(b.integer(4)))->number.kind() == NumberKind::Integer);
    }

    SECTION("square factors are pulled out")
    {
        CHECK(to_string(s.simplify(b.sqrt(b.integer(2)))) == "sqrt(2)");
        CHECK(to_string(s.simplify(b.sqrt(b.integer(8)))) == "2 * sqrt(2)");
        CHECK(to_string(s.simplify(b.sqrt(b.integer(72)))) == "6 * sqrt(2)");
        CHECK(to_string(s.simplify(b.sqrt(b.integer(30)))) == "sqrt(30)");
    }

    SECTION("roots are never approximated")
    {
        CHECK(s.simplify(b.sqrt(b.integer(3)))->is_unary(OpType::Sqrt));
        CHECK(to_string(s.simplify(b.sqrt(b.rational(1, 2)))) == "sqrt(1/2)");
    }
}

TEST_CASE("testing square roots of negative literals", "[simplify][radical][complex]")
{
    ExpressionBuilder b;
    const SharedExpr minus_four = b.integer(-4);

    SECTION("complex results allowed")
    {
        Simplifier s(b);
        CHECK(to_string(s.simplify(b.sqrt(minus_four))) == "2i");
    }

    SECTION("complex results disallowed")
    {
        SimplifierConfig config;
        config.allow_complex = false;
        Simplifier s(b, config);
        CHECK(to_string(s.simplify(b.sqrt(minus_four))) == "sqrt(-4)");
    }
}

TEST_CASE("testing powers of square roots", "[simplify][radical][pow]")
{
    ExpressionBuilder b;
    Simplifier s(b);
    const SharedExpr x = b.variable("x");

    CHECK(s.simplify(b.power(b.sqrt(x), b.integer(2))) == x);
    CHECK(to_string(s.simplify(b.power(b.sqrt(x), b.integer(4)))) == "x^2");
    CHECK(to_string(s.simplify(b.power(b.sqrt(x), b.integer(3)))) == "sqrt(x)^3");
    CHECK(to_string(s.simplify(b.power(b.sqrt(b.integer(3)), b.integer(2)))) == "3");
}

TEST_CASE("testing radicals can be switched off", "[simplify][radical][config]")
{
    ExpressionBuilder b;
    SimplifierConfig config;
    config.enable_radicals = false;
    Simplifier s(b, config);
    CHECK(to_string(s.simplify(b.sqrt(b.integer(4)))) == "sqrt(4)");
}
