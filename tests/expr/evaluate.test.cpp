//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// Tests for numeric evaluation of expressions

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <symcore/expr/builder.hpp>
#include <symcore/expr/evaluate.hpp>
#include <tests/utils/catch.hpp>

#include <cmath>
#include <string>
#include <unordered_map>

using namespace symcore;

TEST_CASE("testing exact evaluation", "[expr][evaluate]")
{
    ExpressionBuilder b;
    const SharedExpr x = b.variable("x");
    const std::unordered_map<std::string, Number> bindings = {{"x", Number::rational(1, 2)}};

    SECTION("arithmetic stays exact")
    {
        CHECK(evaluate(b.add(x, b.integer(1)), bindings) == Number::rational(3, 2));
        CHECK(evaluate(b.multiply(x, x), bindings) == Number::rational(1, 4));
        CHECK(evaluate(b.power(b.integer(2), b.integer(10))) == Number::integer(1024));
        CHECK(evaluate(b.divide(b.integer(5), b.integer(0))).symbolic_reason() == SymbolicReason::DivisionByZero);
    }

    SECTION("square roots resolve only perfect squares")
    {
        CHECK(evaluate(b.sqrt(b.integer(9))) == Number::integer(3));
        CHECK(evaluate(b.sqrt(b.integer(2))).is_symbolic());
        CHECK(evaluate(b.sqrt(b.integer(-4))) == Number::complex(Number::integer(0), Number::integer(2)));
    }

    SECTION("constants stay symbolic except the imaginary unit")
    {
        CHECK(evaluate(b.pi()).is_symbolic());
        CHECK(evaluate(b.constant(ConstantKind::I)) == Number::imaginary_unit());
        CHECK(evaluate(b.multiply(b.constant(ConstantKind::I), b.constant(ConstantKind::I))) == Number::integer(-1));
    }

    SECTION("transcendental functions of trivial arguments")
    {
        CHECK(evaluate(b.sin(b.integer(0))) == Number::integer(0));
        CHECK(evaluate(b.cos(b.integer(0))) == Number::integer(1));
        CHECK(evaluate(b.exp(b.integer(0))) == Number::integer(1));
        CHECK(evaluate(b.ln(b.integer(1))) == Number::integer(0));
        CHECK(evaluate(b.sin(b.integer(1))).is_symbolic());
    }

    SECTION("factorials")
    {
        CHECK(evaluate(b.unary(OpType::Factorial, b.integer(5))) == Number::integer(120));
        CHECK(evaluate(b.unary(OpType::Factorial, b.integer(0))) == Number::integer(1));
        CHECK(evaluate(b.unary(OpType::Factorial, b.integer(2000))).is_symbolic());
    }

    SECTION("modulo truncates toward zero")
    {
        CHECK(evaluate(b.modulo(b.integer(7), b.integer(3))) == Number::integer(1));
        CHECK(evaluate(b.modulo(b.integer(-7), b.integer(3))) == Number::integer(-1));
        CHECK(evaluate(b.modulo(b.integer(7), b.integer(0))).is_symbolic());
    }

    SECTION("named functions")
    {
        CHECK(evaluate(b.function("max", {b.integer(1), b.rational(5, 2), b.integer(2)})) == Number::rational(5, 2));
        CHECK(evaluate(b.function("min", {b.integer(1), b.rational(-5, 2)})) == Number::rational(-5, 2));
        CHECK(evaluate(b.function("abs", {b.integer(-3)})) == Number::integer(3));
        CHECK(evaluate(b.function("sqrt", {b.integer(16)})) == Number::integer(4));
    }
}

TEST_CASE("testing approximate evaluation", "[expr][evaluate]")
{
    ExpressionBuilder b;
    EvalOptions options;
    options.approximate = true;

    CHECK(evaluate(b.pi(), options).float_value() == Catch::Approx(3.141592653589793));
    CHECK(evaluate(b.sqrt(b.integer(2)), options).float_value() == Catch::Approx(std::sqrt(2.0)));
    CHECK(evaluate(b.sin(b.integer(1)), options).float_value() == Catch::Approx(std::sin(1.0)));
    CHECK(evaluate(b.ln(b.constant(ConstantKind::E)), options).float_value() == Catch::Approx(1.0));
    CHECK(evaluate(b.sqrt(b.integer(4)), options) == Number::integer(2));

    SECTION("exact operands combine with approximated ones")
    {
        const Number two_pi = evaluate(b.multiply(b.integer(2), b.pi()), options);
        REQUIRE(two_pi.is_float());
        CHECK(two_pi.float_value() == Catch::Approx(2.0 * 3.141592653589793));

        const Number shifted = evaluate(b.add(b.sin(b.integer(1)), b.integer(1)), options);
        REQUIRE(shifted.is_float());
        CHECK(shifted.float_value() == Catch::Approx(std::sin(1.0) + 1.0));

        const Number half_root = evaluate(b.divide(b.sqrt(b.integer(2)), b.integer(2)), options);
        REQUIRE(half_root.is_float());
        CHECK(half_root.float_value() == Catch::Approx(std::sqrt(2.0) / 2.0));

        const Number quarter = evaluate(b.multiply(b.rational(1, 4), b.power(b.pi(), b.integer(2))), options);
        REQUIRE(quarter.is_float());
        CHECK(quarter.float_value() == Catch::Approx(3.141592653589793 * 3.141592653589793 / 4.0));
    }

    SECTION("bound variables mix with approximated constants")
    {
        const SharedExpr x = b.variable("x");
        const Number value = evaluate(b.subtract(b.multiply(x, b.constant(ConstantKind::E)), x),
                                      {{"x", Number::rational(1, 2)}}, options);
        REQUIRE(value.is_float());
        CHECK(value.float_value() == Catch::Approx((std::exp(1.0) - 1.0) / 2.0));
    }

    SECTION("exact mode leaves mixed expressions symbolic")
    {
        CHECK(evaluate(b.multiply(b.integer(2), b.pi())).is_symbolic());
    }
}

TEST_CASE("testing evaluation errors", "[expr][evaluate][errors]")
{
    ExpressionBuilder b;
    const SharedExpr y = b.variable("y");

    SECTION("a missing binding names the variable")
    {
        try {
            evaluate(b.add(y, b.integer(1)), {{"x", Number::integer(1)}});
            FAIL("expected an undefined variable");
        } catch(const ComputeError& e) {
            CHECK(e.kind() == ErrorKind::UndefinedVariable);
            CHECK(e.detail() == "y");
            CHECK(e.is_recoverable());
            CHECK_FALSE(e.suggestions().empty());
        }
    }

    SECTION("square root of a negative number without complex mode")
    {
        EvalOptions options;
        options.allow_complex = false;
        try {
            evaluate(b.sqrt(b.integer(-4)), options);
            FAIL("expected a domain error");
        } catch(const ComputeError& e) {
            CHECK(e.kind() == ErrorKind::DomainError);
            CHECK_FALSE(e.is_recoverable());
        }
    }

    SECTION("factorial outside the non-negative integers")
    {
        CHECK_THROWS_AS(evaluate(b.unary(OpType::Factorial, b.integer(-1))), ComputeError);
        CHECK_THROWS_AS(evaluate(b.unary(OpType::Factorial, b.rational(1, 2))), ComputeError);
    }

    SECTION("logarithm of a non-positive value in approximate mode")
    {
        EvalOptions options;
        options.approximate = true;
        CHECK_THROWS_AS(evaluate(b.ln(b.integer(-1)), options), ComputeError);
    }

    SECTION("unsupported requests")
    {
        try {
            evaluate(b.modulo(b.rational(1, 2), b.integer(3)));
            FAIL("expected an unsupported operation");
        } catch(const ComputeError& e) {
            CHECK(e.kind() == ErrorKind::UnsupportedOperation);
        }
        CHECK_THROWS_AS(evaluate(b.function("gamma", {b.integer(1), b.integer(2)})), ComputeError);
    }
}
