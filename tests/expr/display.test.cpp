//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// Tests for the canonical textual form of expressions

#include <catch2/catch_test_macros.hpp>

#include <symcore/expr/display.hpp>
#include <tests/utils/catch.hpp>

#include <sstream>

using namespace symcore;
using namespace symcore::test;

TEST_CASE("testing expression display", "[expr][display]")
{
    const SharedExpr x = var("x");
    const SharedExpr y = var("y");

    SECTION("operators and spacing")
    {
        CHECK(to_string(raw(OpType::Add, x, num(1))) == "x + 1");
        CHECK(to_string(raw(OpType::Mul, num(2), x)) == "2 * x");
        CHECK(to_string(raw(OpType::Pow, x, num(2))) == "x^2");
        CHECK(to_string(raw(OpType::Mod, x, num(3))) == "x mod 3");
        CHECK(to_string(raw(OpType::Factorial, num(5))) == "5!");
    }

    SECTION("functions and negation")
    {
        CHECK(to_string(raw(OpType::Negate, raw(OpType::Sin, x))) == "-sin(x)");
        CHECK(to_string(raw(OpType::Div, raw(OpType::Sqrt, num(2)), num(2))) == "sqrt(2) / 2");
        CHECK(to_string(raw(OpType::Negate, raw(OpType::Add, x, y))) == "-(x + y)");
        CHECK(to_string(SharedExpr(ExprNode::function("max", {x, num(1)}))) == "max(x, 1)");
        CHECK(to_string(SharedExpr(ExprNode::named_constant(ConstantKind::Pi))) == "π");
    }

    SECTION("parentheses follow precedence and associativity")
    {
        CHECK(to_string(raw(OpType::Mul, raw(OpType::Add, x, y), num(2))) == "(x + y) * 2");
        CHECK(to_string(raw(OpType::Sub, x, raw(OpType::Sub, y, num(1)))) == "x - (y - 1)");
        CHECK(to_string(raw(OpType::Sub, raw(OpType::Sub, x, y), num(1))) == "x - y - 1");
        CHECK(to_string(raw(OpType::Add, x, raw(OpType::Add, y, num(1)))) == "x + y + 1");
        CHECK(to_string(raw(OpType::Pow, raw(OpType::Pow, x, y), num(2))) == "(x^y)^2");
        CHECK(to_string(raw(OpType::Pow, x, raw(OpType::Pow, y, num(2)))) == "x^y^2");
        CHECK(to_string(raw(OpType::Pow, raw(OpType::Negate, x), num(2))) == "(-x)^2");
    }

    SECTION("number literals")
    {
        const SharedExpr half = SharedExpr(ExprNode::number_literal(Number::rational(1, 2)));
        CHECK(to_string(raw(OpType::Pow, x, half)) == "x^(1/2)");
        CHECK(to_string(raw(OpType::Add, x, num(-1))) == "x + (-1)");
        CHECK(to_string(SharedExpr(ExprNode::number_literal(Number::integer(4))) ) == "4");
        CHECK(to_string(SharedExpr(ExprNode::number_literal(Number::real("2.50")))) == "2.5");
    }

    SECTION("stream output and empty handles")
    {
        std::ostringstream out;
        out << raw(OpType::Add, x, num(1));
        CHECK(out.str() == "x + 1");
        CHECK(to_string(SharedExpr()) == "<empty>");
    }
}
