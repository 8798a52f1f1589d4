//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// Tests for ExpressionBuilder interning and construction-time identities

#include <catch2/catch_test_macros.hpp>

#include <symcore/expr/builder.hpp>
#include <symcore/expr/display.hpp>
#include <tests/utils/catch.hpp>

#include <memory>
#include <stdexcept>

using namespace symcore;

TEST_CASE("testing interning of common leaves", "[builder][interning]")
{
    ExpressionBuilder b;

    SECTION("variables resolve to the same node")
    {
        const SharedExpr x1 = b.variable("x");
        const SharedExpr x2 = b.variable("x");
        CHECK(x1 == x2);
        CHECK(x1.same_node(x2));
    }

    SECTION("small integers and constants are interned")
    {
        CHECK(b.integer(2).same_node(b.integer(2)));
        CHECK(b.integer(-1).same_node(b.integer(-1)));
        CHECK(b.pi().same_node(b.constant(ConstantKind::Pi)));
        CHECK(b.interned_count() >= 14);
    }

    SECTION("other leaves are still shared through the pool")
    {
        const SharedExpr a = b.integer(12345);
        const SharedExpr c = b.integer(12345);
        CHECK(a.same_node(c));
        CHECK(b.variable("alpha").same_node(b.variable("alpha")));
    }

    SECTION("structurally equal compound nodes share storage")
    {
        const SharedExpr x = b.variable("x");
        const SharedExpr e1 = b.add(b.sin(x), b.integer(3));
        const SharedExpr e2 = b.add(b.sin(x), b.integer(3));
        CHECK(e1.same_node(e2));
    }
}

TEST_CASE("testing construction-time identities", "[builder][identities]")
{
    ExpressionBuilder b;
    const SharedExpr x = b.variable("x");
    const SharedExpr zero = b.integer(0);
    const SharedExpr one = b.integer(1);

    CHECK(b.add(x, zero) == x);
    CHECK(b.add(zero, x) == x);
    CHECK(b.subtract(x, zero) == x);
    CHECK(b.subtract(x, x) == zero);
    CHECK(b.multiply(x, one) == x);
    CHECK(b.multiply(one, x) == x);
    CHECK(b.multiply(x, zero) == zero);
    CHECK(b.multiply(zero, x) == zero);
    CHECK(b.divide(x, one) == x);
    CHECK(b.power(x, one) == x);
    CHECK(b.power(one, x) == one);
    CHECK(b.negate(b.negate(x)) == x);
    CHECK(b.negate(b.integer(4)) == b.integer(-4));

    // anything else is left for the simplifier
    CHECK(to_string(b.add(x, x)) == "x + x");
    CHECK(to_string(b.power(x, zero)) == "x^0");
    CHECK(to_string(b.subtract(zero, x)) == "0 - x");
}

TEST_CASE("testing generic constructors", "[builder][construct]")
{
    ExpressionBuilder b;
    const SharedExpr x = b.variable("x");

    CHECK(to_string(b.unary(OpType::Cos, x)) == "cos(x)");
    CHECK(b.unary(OpType::Negate, b.unary(OpType::Negate, x)) == x);
    CHECK(to_string(b.binary(OpType::Mod, x, b.integer(2))) == "x mod 2");
    CHECK_THROWS_AS(b.binary(OpType::Sin, x, x), std::invalid_argument);
    CHECK(to_string(b.function("f", {x, b.integer(1)})) == "f(x, 1)");

    const SharedExpr e = b.add(b.sin(x), b.integer(3));
    const SharedExpr rebuilt = b.rebuild(*e, {b.cos(x), b.integer(0)});
    CHECK(rebuilt == b.cos(x));
}

TEST_CASE("testing builder pool accounting", "[builder][memory]")
{
    auto memory = std::make_shared<MemoryManager>();
    ExpressionBuilder b(memory);

    SECTION("preloading does not count as traffic")
    {
        const MemoryStats stats = b.memory_stats();
        CHECK(stats.cache_hits == 0);
        CHECK(stats.cache_misses == 0);
        CHECK(&b.memory() == memory.get());
        CHECK(b.memory_handle() == memory);
    }

    SECTION("every construction updates the counters")
    {
        b.variable("x");
        b.variable("x");
        b.integer(777);
        const MemoryStats stats = b.memory_stats();
        CHECK(stats.cache_hits == 2);
        CHECK(stats.cache_misses == 1);
        CHECK(stats.total_created == 3);
    }

    SECTION("cleanup drops interned entries nobody else holds")
    {
        const std::size_t before = b.interned_count();
        const SharedExpr kept = b.variable("y");
        const std::size_t removed = b.cleanup();
        CHECK(removed > 0);
        CHECK(b.interned_count() < before);
        CHECK(b.variable("y").same_node(kept));
    }

    SECTION("a builder needs a manager")
    {
        CHECK_THROWS_AS(ExpressionBuilder(std::shared_ptr<MemoryManager>()), std::invalid_argument);
    }
}
