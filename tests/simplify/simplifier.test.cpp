//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// Tests for the fixed-point driver: pass budget, result cache and rule families

#include <catch2/catch_test_macros.hpp>

#include <symcore/expr/builder.hpp>
#include <symcore/expr/display.hpp>
#include <symcore/simplify/simplifier.hpp>
#include <tests/utils/catch.hpp>

#include <string>

using namespace symcore;
using namespace symcore::simplify;
using namespace symcore::test;

TEST_CASE("testing the pass budget", "[simplify][driver][timeout]")
{
    ExpressionBuilder b;
    Simplifier s(b);
    const SharedExpr x = b.variable("x");
    const SharedExpr input = b.sin(b.negate(x));

    SECTION("a fixed point needs one extra pass to be confirmed")
    {
        CHECK(to_string(s.simplify(input)) == "-sin(x)");
        CHECK(s.last_stats().passes == 2);
        CHECK(s.last_stats().rewrites >= 1);
        CHECK(s.last_stats().cache_hits == 0);
    }

    SECTION("running out of passes reports the last form")
    {
        try {
            s.simplify(input, 1);
            FAIL("expected a rewrite timeout");
        } catch(const RewriteTimeout& e) {
            CHECK(e.kind() == ErrorKind::Timeout);
            CHECK(e.is_recoverable());
            CHECK(e.passes() == 1);
            CHECK(to_string(e.last_form()) == "-sin(x)");
        }
    }

    SECTION("the timeout is a ComputeError")
    {
        CHECK_THROWS_AS(s.simplify(input, 0), ComputeError);
    }

    SECTION("an already simple expression settles in one pass")
    {
        CHECK(s.simplify(x) == x);
        CHECK(s.last_stats().passes == 1);
        CHECK(s.last_stats().rewrites == 0);
    }

    SECTION("an empty handle passes through")
    {
        CHECK_FALSE(s.simplify(SharedExpr()));
    }
}

TEST_CASE("testing the result cache", "[simplify][driver][cache]")
{
    ExpressionBuilder b;
    const SharedExpr x = b.variable("x");
    const SharedExpr input = b.sin(b.negate(x));

    SECTION("a repeated request is served from the cache")
    {
        Simplifier s(b);
        const SharedExpr first = s.simplify(input);
        CHECK(s.cache_size() == 2);

        const SharedExpr second = s.simplify(input);
        CHECK(second.same_node(first));
        CHECK(s.last_stats().cache_hits == 1);
        CHECK(s.last_stats().passes == 0);

        // the result itself is remembered as a fixed point
        CHECK(s.simplify(first).same_node(first));
        CHECK(s.last_stats().cache_hits == 1);
    }

    SECTION("clearing the cache forces a recomputation")
    {
        Simplifier s(b);
        s.simplify(input);
        s.clear_cache();
        CHECK(s.cache_size() == 0);
        s.simplify(input);
        CHECK(s.last_stats().cache_hits == 0);
        CHECK(s.last_stats().passes == 2);
    }

    SECTION("the least recently used entry is evicted")
    {
        SimplifierConfig config;
        config.cache_capacity = 1;
        Simplifier s(b, config);
        s.simplify(input);
        CHECK(s.cache_size() == 1);
        s.simplify(input);
        CHECK(s.last_stats().cache_hits == 0);
    }

    SECTION("a zero capacity disables caching")
    {
        SimplifierConfig config;
        config.cache_capacity = 0;
        Simplifier s(b, config);
        s.simplify(input);
        CHECK(s.cache_size() == 0);
    }
}

TEST_CASE("testing rule families", "[simplify][driver][families]")
{
    ExpressionBuilder b;
    Simplifier s(b);

    SECTION("families are listed in priority order")
    {
        std::string names;
        for(const auto& family : s.families()) names += family.name + " ";
        CHECK(names == "algebraic induction special_angles pythagorean periodicity radicals ");
    }

    SECTION("unknown families are reported")
    {
        CHECK_FALSE(s.set_family_enabled("calculus", false));
    }

    SECTION("toggling a family invalidates cached results")
    {
        const SharedExpr input = b.sqrt(b.integer(4));
        CHECK(to_string(s.simplify(input)) == "2");
        REQUIRE(s.set_family_enabled("radicals", false));
        CHECK(s.cache_size() == 0);
        CHECK(to_string(s.simplify(input)) == "sqrt(4)");
        REQUIRE(s.set_family_enabled("radicals", true));
        CHECK(to_string(s.simplify(input)) == "2");
    }
}

TEST_CASE("testing a mixed expression", "[simplify][driver]")
{
    ExpressionBuilder b;
    Simplifier s(b);
    const SharedExpr x = b.variable("x");
    const SharedExpr two = b.integer(2);

    // sin²x + cos²x + sin(π/6) + sqrt(4)  →  7/2
    const SharedExpr pythagorean = b.add(b.power(b.sin(x), two), b.power(b.cos(x), two));
    const SharedExpr e = b.add(b.add(pythagorean, b.sin(b.divide(b.pi(), b.integer(6)))), b.sqrt(b.integer(4)));
    CHECK(to_string(s.simplify(e)) == "7/2");
}

TEST_CASE("testing deep expressions", "[simplify][driver][deep]")
{
    ExpressionBuilder b;
    Simplifier s(b);

    // x + x + ... + x collects into one term without recursing on the depth
    const SharedExpr e = deep_chain(5000);
    CHECK(to_string(s.simplify(e)) == "5001 * x");
}
