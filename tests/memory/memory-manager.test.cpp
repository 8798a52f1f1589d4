//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// Tests for MemoryManager pooling and MemoryMonitor

#include <catch2/catch_test_macros.hpp>

#include <symcore/memory/memory_manager.hpp>
#include <tests/utils/catch.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace symcore;
using namespace symcore::test;

TEST_CASE("testing pooled construction", "[memory][pool]")
{
    MemoryManager memory;

    SECTION("structurally equal requests share one node")
    {
        const SharedExpr a = memory.create_shared(ExprNode::variable("x"));
        const SharedExpr b = memory.create_shared(ExprNode::variable("x"));
        CHECK(a.same_node(b));
        CHECK(a.ref_count() == 2);

        const MemoryStats stats = memory.get_stats();
        CHECK(stats.cache_hits == 1);
        CHECK(stats.cache_misses == 1);
        CHECK(stats.total_created == 2);
        CHECK(stats.active_expressions == 1);
        CHECK(stats.estimated_memory_usage > 0);
    }

    SECTION("compound nodes are matched by structure")
    {
        const SharedExpr x = memory.create_shared(ExprNode::variable("x"));
        const SharedExpr one = memory.create_shared(ExprNode::number_literal(Number::integer(1)));
        const SharedExpr a = memory.create_shared(ExprNode::binary_op(OpType::Add, x, one));
        const SharedExpr b = memory.create_shared(ExprNode::binary_op(OpType::Add, var("x"), num(1)));
        CHECK(a.same_node(b));
        CHECK_FALSE(a.same_node(memory.create_shared(ExprNode::binary_op(OpType::Sub, x, one))));
    }

    SECTION("different leaves do not collide")
    {
        const SharedExpr a = memory.create_shared(ExprNode::variable("x"));
        const SharedExpr b = memory.create_shared(ExprNode::variable("y"));
        CHECK_FALSE(a.same_node(b));
        CHECK(memory.get_stats().cache_misses == 2);
    }
}

TEST_CASE("testing weak pool entries and cleanup", "[memory][cleanup]")
{
    MemoryManager memory;

    SECTION("the pool does not keep nodes alive")
    {
        {
            const SharedExpr temporary = memory.create_shared(ExprNode::variable("tmp"));
            CHECK(memory.pool_size() == 1);
        }
        CHECK(memory.pool_size() == 1);
        CHECK(memory.get_stats().active_expressions == 0);
        CHECK(memory.cleanup() == 1);
        CHECK(memory.pool_size() == 0);
    }

    SECTION("live entries survive cleanup")
    {
        const SharedExpr kept = memory.create_shared(ExprNode::variable("kept"));
        memory.create_shared(ExprNode::variable("dropped"));
        CHECK(memory.cleanup() == 1);
        CHECK(memory.pool_size() == 1);
        CHECK(memory.create_shared(ExprNode::variable("kept")).same_node(kept));
    }

    SECTION("a dead entry is replaced by a fresh node")
    {
        memory.create_shared(ExprNode::variable("gone"));
        const SharedExpr again = memory.create_shared(ExprNode::variable("gone"));
        CHECK(again.is_unique());
        CHECK(memory.get_stats().cache_misses == 2);
    }

    SECTION("nodes mutated in place leave their bucket at cleanup")
    {
        SharedExpr node = memory.create_shared(ExprNode::variable("a"));
        node.make_mut().name = "b";
        CHECK(memory.cleanup() == 1);
        CHECK_FALSE(memory.create_shared(ExprNode::variable("a")).same_node(node));
    }

    SECTION("counters can be reset")
    {
        memory.create_shared(ExprNode::variable("x"));
        memory.record_hit();
        memory.reset_counters();
        const MemoryStats stats = memory.get_stats();
        CHECK(stats.cache_hits == 0);
        CHECK(stats.cache_misses == 0);
        CHECK(stats.total_created == 0);
    }
}

TEST_CASE("testing pool configuration", "[memory][config]")
{
    SECTION("sharing can be disabled")
    {
        MemoryConfig config;
        config.enable_sharing = false;
        MemoryManager memory(config);
        const SharedExpr a = memory.create_shared(ExprNode::variable("x"));
        const SharedExpr b = memory.create_shared(ExprNode::variable("x"));
        CHECK_FALSE(a.same_node(b));
        CHECK(a == b);
        CHECK(memory.pool_size() == 0);
        CHECK(memory.get_stats().cache_misses == 2);
    }

    SECTION("the pool stops tracking past its capacity")
    {
        MemoryConfig config;
        config.max_pool_size = 2;
        MemoryManager memory(config);
        const SharedExpr a = memory.create_shared(ExprNode::variable("a"));
        const SharedExpr b = memory.create_shared(ExprNode::variable("b"));
        const SharedExpr c = memory.create_shared(ExprNode::variable("c"));
        CHECK(memory.pool_size() == 2);
        CHECK_FALSE(memory.create_shared(ExprNode::variable("c")).same_node(c));
        CHECK(memory.create_shared(ExprNode::variable("a")).same_node(a));
    }

    SECTION("statistics trigger a cleanup once the interval elapsed")
    {
        MemoryConfig config;
        config.cleanup_interval = std::chrono::steady_clock::duration::zero();
        MemoryManager memory(config);
        memory.create_shared(ExprNode::variable("x"));
        CHECK(memory.pool_size() == 1);
        memory.get_stats();
        CHECK(memory.pool_size() == 0);
    }
}

TEST_CASE("testing the memory monitor", "[memory][monitor]")
{
    auto memory = std::make_shared<MemoryManager>();
    const SharedExpr x = memory->create_shared(ExprNode::variable("x"));

    SECTION("reports once per interval")
    {
        MemoryMonitor monitor(memory, std::chrono::hours(1));
        const auto first = monitor.check();
        REQUIRE(first);
        CHECK(first->active_expressions == 1);
        CHECK_FALSE(monitor.check());
    }

    SECTION("a zero interval reports every time")
    {
        MemoryMonitor monitor(memory, std::chrono::steady_clock::duration::zero());
        CHECK(monitor.check());
        CHECK(monitor.check());
    }

    SECTION("a disabled monitor stays silent")
    {
        MemoryMonitor monitor(memory);
        monitor.set_enabled(false);
        CHECK_FALSE(monitor.is_enabled());
        CHECK_FALSE(monitor.check());
        CHECK(monitor.stats().active_expressions == 1);
        monitor.set_enabled(true);
        CHECK(monitor.check());
    }

    SECTION("the interval can be changed")
    {
        MemoryMonitor monitor(memory);
        monitor.set_interval(std::chrono::seconds(5));
        CHECK(monitor.interval() == std::chrono::seconds(5));
    }

    SECTION("a monitor needs a manager")
    {
        CHECK_THROWS_AS(MemoryMonitor(std::shared_ptr<MemoryManager>()), std::invalid_argument);
    }
}
