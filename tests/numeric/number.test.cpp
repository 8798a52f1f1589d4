//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// Tests for the exact numeric tower

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <symcore/common/error.hpp>
#include <symcore/numeric/number.hpp>
#include <tests/utils/catch.hpp>

#include <string>
#include <unordered_set>

using namespace symcore;

TEST_CASE("testing exact integer arithmetic", "[numeric][integer]")
{
    SECTION("big integers do not lose precision")
    {
        const Number a = pow(Number::integer(2), Number::integer(100));
        const Number b = pow(Number::integer(2), Number::integer(100));
        const Number expected = pow(Number::integer(2), Number::integer(101));

        REQUIRE(a.kind() == NumberKind::Integer);
        CHECK(a + b == expected);
        CHECK((a + b).to_string() == "2535301200456458802993406410752");
    }

    SECTION("integer division yields an integer when exact and a rational otherwise")
    {
        CHECK((Number::integer(6) / Number::integer(3)).kind() == NumberKind::Integer);
        CHECK(Number::integer(6) / Number::integer(3) == Number::integer(2));

        const Number q = Number::integer(6) / Number::integer(4);
        CHECK(q.kind() == NumberKind::Rational);
        CHECK(q.to_string() == "3/2");
    }

    SECTION("parsing decimal digits")
    {
        CHECK(Number::integer(std::string("123456789012345678901234567890")).to_string() == "123456789012345678901234567890");
        CHECK_THROWS_AS(Number::integer(std::string("12x")), std::invalid_argument);
    }
}

TEST_CASE("testing rational arithmetic", "[numeric][rational]")
{
    const Number third = Number::rational(1, 3);

    SECTION("thirds add up to exactly one")
    {
        const Number sum = third + third + third;
        CHECK(sum == Number::integer(1));
        CHECK(sum.to_string() == "1");
    }

    SECTION("rationals are normalized")
    {
        CHECK(Number::rational(2, 4).to_string() == "1/2");
        CHECK(Number::rational(1, -2).to_string() == "-1/2");
    }

    SECTION("a rational with denominator one keeps its kind but prints as an integer")
    {
        const Number six = Number::rational(6, 1);
        CHECK(six.kind() == NumberKind::Rational);
        CHECK(six.to_string() == "6");
        CHECK(six == Number::integer(6));
        CHECK_FALSE(identical(six, Number::integer(6)));
        CHECK(six.canonical().kind() == NumberKind::Integer);
    }

    SECTION("a zero denominator gives a symbolic value")
    {
        CHECK(Number::rational(3, 0).is_symbolic());
        CHECK(Number::rational(3, 0).symbolic_reason() == SymbolicReason::DivisionByZero);
        CHECK(Number::rational(0, 0).symbolic_reason() == SymbolicReason::Indeterminate);
    }
}

TEST_CASE("testing type promotion", "[numeric][promotion]")
{
    const Number i = Number::integer(3);
    const Number r = Number::rational(1, 2);
    const Number d = Number::real("0.125");

    SECTION("integer plus rational commutes and stays rational")
    {
        const Number left = i + r;
        const Number right = r + i;
        CHECK(left.kind() == NumberKind::Rational);
        CHECK(right.kind() == NumberKind::Rational);
        CHECK(left == right);
        CHECK(left == Number::rational(7, 2));
    }

    SECTION("associativity over mixed kinds")
    {
        const Number b = Number::rational(1, 4);
        CHECK((i + b) + d == i + (b + d));
        CHECK((i * b) * d == i * (b * d));
        CHECK(((i + b) + d).kind() == NumberKind::Real);
        CHECK(((i + b) + d).to_string() == "3.375");
    }

    SECTION("distributivity over mixed kinds")
    {
        const Number b = Number::rational(1, 8);
        CHECK(i * (b + d) == i * b + i * d);
        CHECK(r * (b + d) == r * b + r * d);
    }

    SECTION("distributivity with a non-terminating rational")
    {
        const Number a = Number::rational(1, 3);
        const Number b = Number::real("0.5");
        const Number c = Number::integer(3);
        CHECK(a * (b + c) == a * b + a * c);
        CHECK(a * (b + c) == Number::rational(7, 6));
        CHECK((a * b).kind() == NumberKind::Rational);
        CHECK((b - a) + a == b);

        const auto promoted = promote_types(a, b);
        CHECK(promoted.first.kind() == NumberKind::Rational);
        CHECK(promoted.second.kind() == NumberKind::Rational);
        CHECK(promote_types(Number::rational(1, 8), b).first.kind() == NumberKind::Real);
    }

    SECTION("promote_types lifts both operands to the wider kind")
    {
        const auto promoted = promote_types(i, d);
        CHECK(promoted.first.kind() == NumberKind::Real);
        CHECK(promoted.second.kind() == NumberKind::Real);

        const auto complex = promote_types(r, Number::imaginary_unit());
        CHECK(complex.first.kind() == NumberKind::Complex);
    }

    SECTION("mixing a float with an exact value stays unevaluated")
    {
        const Number mixed = Number::floating(1.5) + Number::integer(1);
        REQUIRE(mixed.is_symbolic());
        CHECK(mixed.symbolic_reason() == SymbolicReason::Unevaluated);
        CHECK((Number::floating(1.5) + Number::floating(1.0)).float_value() == Catch::Approx(2.5));
    }
}

TEST_CASE("testing real decimal arithmetic", "[numeric][real]")
{
    SECTION("terminating decimals are exact")
    {
        const Number a = Number::real("0.1");
        const Number b = Number::real("0.2");
        CHECK(a + b == Number::real("0.3"));
        CHECK((a + b).to_string() == "0.3");
        CHECK((Number::real("1.5") * Number::integer(2)).to_string() == "3");
    }

    SECTION("non-terminating quotients keep fifty fractional digits")
    {
        const Number q = Number::real("1") / Number::real("3");
        CHECK(q.to_string() == "0." + std::string(50, '3'));
    }
}

TEST_CASE("testing division by zero", "[numeric][division]")
{
    SECTION("every kind divided by zero is symbolic")
    {
        CHECK((Number::integer(5) / Number::integer(0)).is_symbolic());
        CHECK((Number::rational(1, 2) / Number::integer(0)).is_symbolic());
        CHECK((Number::real("2.5") / Number::real("0")).is_symbolic());
        CHECK((Number::floating(2.0) / Number::floating(0.0)).is_symbolic());
        CHECK((Number::imaginary_unit() / Number::integer(0)).is_symbolic());
    }

    SECTION("zero over zero is indeterminate")
    {
        const Number q = Number::integer(0) / Number::integer(0);
        CHECK(q.symbolic_reason() == SymbolicReason::Indeterminate);
        CHECK(q.to_string() == "0/0");
    }

    SECTION("a non-zero dividend names the division")
    {
        const Number q = Number::integer(5) / Number::integer(0);
        CHECK(q.symbolic_reason() == SymbolicReason::DivisionByZero);
        CHECK(q.to_string() == "5/0");
    }
}

TEST_CASE("testing complex arithmetic", "[numeric][complex]")
{
    const Number i = Number::imaginary_unit();

    SECTION("display")
    {
        CHECK(i.to_string() == "i");
        CHECK((-i).to_string() == "-i");
        CHECK(Number::complex(Number::integer(3), Number::integer(4)).to_string() == "3+4i");
        CHECK(Number::complex(Number::integer(3), Number::integer(-1)).to_string() == "3-i");
    }

    SECTION("a vanishing imaginary part collapses to the real part")
    {
        const Number square = i * i;
        CHECK(square.kind() == NumberKind::Integer);
        CHECK(square == Number::integer(-1));

        const Number z = Number::complex(Number::integer(3), Number::integer(4));
        const Number w = Number::complex(Number::integer(3), Number::integer(-4));
        CHECK(z * w == Number::integer(25));
    }

    SECTION("division multiplies by the conjugate")
    {
        const Number a = Number::complex(Number::integer(1), Number::integer(1));
        const Number b = Number::complex(Number::integer(1), Number::integer(-1));
        CHECK(a / b == i);
    }

    SECTION("the approximation is the modulus")
    {
        CHECK(Number::complex(Number::integer(3), Number::integer(4)).approximate() == Catch::Approx(5.0));
    }

    SECTION("complex parts must be plain numbers")
    {
        CHECK_THROWS_AS(Number::complex(i, Number::integer(1)), std::invalid_argument);
    }
}

TEST_CASE("testing powers and roots", "[numeric][pow]")
{
    SECTION("integer exponents")
    {
        CHECK(pow(Number::integer(3), Number::integer(4)) == Number::integer(81));
        CHECK(pow(Number::rational(2, 3), Number::integer(2)) == Number::rational(4, 9));
        CHECK(pow(Number::integer(2), Number::integer(-2)) == Number::rational(1, 4));
        CHECK(pow(Number::imaginary_unit(), Number::integer(2)) == Number::integer(-1));
    }

    SECTION("edge cases")
    {
        CHECK(pow(Number::integer(0), Number::integer(0)) == Number::integer(1));
        CHECK(pow(Number::integer(0), Number::integer(-1)).symbolic_reason() == SymbolicReason::DivisionByZero);
        CHECK(pow(Number::integer(2), Number::rational(1, 3)).is_symbolic());
        CHECK(pow(Number::integer(4), Number::rational(1, 2)) == Number::integer(2));
    }

    SECTION("exact square roots")
    {
        REQUIRE(sqrt_exact(Number::integer(16)));
        CHECK(*sqrt_exact(Number::integer(16)) == Number::integer(4));
        CHECK(*sqrt_exact(Number::rational(9, 4)) == Number::rational(3, 2));
        CHECK_FALSE(sqrt_exact(Number::integer(2)));

        const auto imaginary = sqrt_exact(Number::integer(-4));
        REQUIRE(imaginary);
        CHECK(imaginary->is_complex());
        CHECK(imaginary->to_string() == "2i");
    }

    SECTION("absolute values")
    {
        CHECK(abs(Number::integer(-7)) == Number::integer(7));
        CHECK(abs(Number::rational(-1, 2)) == Number::rational(1, 2));
        CHECK(abs(Number::complex(Number::integer(3), Number::integer(4))) == Number::integer(5));
    }
}

TEST_CASE("testing comparison, hashing and conversions", "[numeric][compare]")
{
    SECTION("three-way comparison across kinds")
    {
        CHECK(compare(Number::integer(1), Number::rational(3, 2)) < 0);
        CHECK(compare(Number::real("2.5"), Number::rational(5, 2)) == 0);
        CHECK(compare(Number::floating(3.0), Number::integer(2)) > 0);
        CHECK_THROWS_AS(compare(Number::imaginary_unit(), Number::integer(1)), ComputeError);
    }

    SECTION("identical numbers hash alike")
    {
        CHECK(Number::rational(2, 4).hash() == Number::rational(1, 2).hash());
        CHECK(Number::real("1.50").hash() == Number::real("1.5").hash());
        CHECK(Number::floating(0.0).hash() == Number::floating(-0.0).hash());
        CHECK(Number::integer(6).hash() != Number::rational(6, 1).hash());
    }

    SECTION("equal values of different kinds hash alike by value")
    {
        const Number six = Number::integer(6);
        const Number six_over_one = Number::rational(6, 1);
        const Number real_six = Number::real("6.0");
        const Number complex_six = Number::complex(Number::integer(6), Number::zero());

        REQUIRE(six == six_over_one);
        REQUIRE(six == real_six);
        REQUIRE(complex_six == six);
        CHECK(std::hash<Number>{}(six) == std::hash<Number>{}(six_over_one));
        CHECK(std::hash<Number>{}(six) == std::hash<Number>{}(real_six));
        CHECK(std::hash<Number>{}(six) == std::hash<Number>{}(complex_six));
        CHECK(Number::real("0.25").value_hash() == Number::rational(1, 4).value_hash());

        std::unordered_set<Number> set{six, six_over_one, real_six, complex_six};
        CHECK(set.size() == 1);
        set.insert(Number::floating(6.0));
        set.insert(Number::rational(13, 2));
        CHECK(set.size() == 3);
        CHECK(set.count(Number::real("6.5")) == 1);
    }

    SECTION("conversions")
    {
        CHECK(Number::rational(7, 2).to_integer() == 3);
        CHECK(Number::real("2.75").to_rational() == mpq_class(11, 4));
        CHECK(Number::floating(0.5).to_exact() == Number::rational(1, 2));
        CHECK(Number::integer(12).to_int64().value() == 12);
        CHECK_FALSE(Number::rational(1, 2).to_int64());
        CHECK_THROWS_AS(Number::imaginary_unit().to_rational(), ComputeError);
    }

    SECTION("float overflow is reported")
    {
        try {
            (void)(Number::floating(1e308) * Number::floating(10.0));
            FAIL("expected an overflow");
        } catch(const ComputeError& e) {
            CHECK(e.kind() == ErrorKind::Overflow);
            CHECK_FALSE(e.is_recoverable());
        }
    }
}
