/**
 * @file simplify_examples.cpp
 * @brief Walks through the symcore core: exact numbers, shared expressions and the simplifier
 *
 * Each section builds a few expressions with one ExpressionBuilder session,
 * simplifies or evaluates them, and prints the canonical text form.
 */

#include <symcore/symcore.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

using namespace symcore;
using namespace symcore::simplify;

void demonstrate_exact_numbers() {
    std::cout << "\n=== 1. Exact Numeric Tower ===\n";

    const Number big = pow(Number::integer(2), Number::integer(100));
    std::cout << "2^100 + 2^100 = " << big + big << std::endl;

    const Number third = Number::rational(1, 3);
    std::cout << "1/3 + 1/3 + 1/3 = " << third + third + third << std::endl;

    std::cout << "3 + 1/2 = " << Number::integer(3) + Number::rational(1, 2) << std::endl;
    std::cout << "0.1 + 0.2 = " << Number::real("0.1") + Number::real("0.2") << std::endl;
    std::cout << "(1+i)/(1-i) = "
              << Number::complex(Number::integer(1), Number::integer(1)) / Number::complex(Number::integer(1), Number::integer(-1))
              << std::endl;

    // division by zero is a value, not an error
    const Number undefined = Number::integer(5) / Number::integer(0);
    std::cout << "5/0 = " << undefined << " (symbolic: " << std::boolalpha << undefined.is_symbolic() << ")\n";
}

void demonstrate_sharing() {
    std::cout << "\n=== 2. Shared Expressions and Copy-on-Write ===\n";

    ExpressionBuilder b;
    auto x = b.variable("x");
    auto again = b.variable("x");
    std::cout << "variable(\"x\") twice gives the same node: " << std::boolalpha << x.same_node(again) << std::endl;

    auto e = b.add(b.sin(x), b.integer(1));
    std::cout << "e = " << e << ", holders = " << e.ref_count() << std::endl;

    CowExpr view(e);
    view.as_mut().children[1] = b.integer(2);
    std::cout << "modified copy = " << view.shared() << ", original = " << e << std::endl;

    std::cout << "builder.add(x, 0) = " << b.add(x, b.integer(0)) << std::endl;
    std::cout << "builder.subtract(x, x) = " << b.subtract(x, x) << std::endl;
}

void demonstrate_simplifier() {
    std::cout << "\n=== 3. Simplifier ===\n";

    ExpressionBuilder b;
    Simplifier s(b);
    auto x = b.variable("x");
    auto pi = b.pi();
    auto two = b.integer(2);

    const std::pair<std::string, SharedExpr> cases[] = {
        {"sin(-x)", b.sin(b.negate(x))},
        {"sin(pi - x)", b.sin(b.subtract(pi, x))},
        {"cos(pi/2 + x)", b.cos(b.add(b.divide(pi, two), x))},
        {"sin(x)^2 + cos(x)^2", b.add(b.power(b.sin(x), two), b.power(b.cos(x), two))},
        {"1 - sin(x)^2", b.subtract(b.integer(1), b.power(b.sin(x), two))},
        {"sin(pi/6)", b.sin(b.divide(pi, b.integer(6)))},
        {"cos(pi/4)", b.cos(b.divide(pi, b.integer(4)))},
        {"tan(x + pi)", b.tan(b.add(x, pi))},
        {"sqrt(8)", b.sqrt(b.integer(8))},
        {"2*x + 3*x", b.add(b.multiply(two, x), b.multiply(b.integer(3), x))},
        {"x^2 * x^3", b.multiply(b.power(x, two), b.power(x, b.integer(3)))},
    };

    for(const auto& c : cases) {
        auto result = s.simplify(c.second);
        std::cout << c.first << "  ->  " << result << "  (" << s.last_stats().passes << " passes)" << std::endl;
    }

    // the second request is answered from the cache
    s.simplify(cases[0].second);
    std::cout << "cache hits on repeat: " << s.last_stats().cache_hits << ", cached results: " << s.cache_size() << std::endl;
}

void demonstrate_evaluation() {
    std::cout << "\n=== 4. Evaluation ===\n";

    ExpressionBuilder b;
    auto x = b.variable("x");
    auto e = b.add(b.multiply(b.integer(3), x), b.rational(1, 2));

    std::cout << "3*x + 1/2 at x = 1/3: " << evaluate(e, {{"x", Number::rational(1, 3)}}) << std::endl;

    EvalOptions approximate;
    approximate.approximate = true;
    std::cout << "sin(pi/4) approximately: " << evaluate(b.sin(b.divide(b.pi(), b.integer(4))), approximate) << std::endl;
}

void demonstrate_error_handling() {
    std::cout << "\n=== 5. Error Handling ===\n";

    ExpressionBuilder b;
    auto y = b.variable("y");

    try {
        evaluate(b.add(y, b.integer(1)), EvalOptions{});
    } catch(const ComputeError& e) {
        std::cout << "Expected error: " << e.what() << std::endl;
        std::cout << "  " << e.user_message() << std::endl;
        for(const auto& hint : e.suggestions()) std::cout << "  - " << hint << std::endl;
    }

    Simplifier s(b);
    try {
        s.simplify(b.sin(b.negate(y)), 1);
    } catch(const RewriteTimeout& e) {
        std::cout << "Pass budget exhausted after " << e.passes() << " pass, last form: " << e.last_form() << std::endl;
    }
}

void demonstrate_memory() {
    std::cout << "\n=== 6. Memory Manager ===\n";

    auto memory = std::make_shared<MemoryManager>();
    ExpressionBuilder b(memory);
    MemoryMonitor monitor(memory, std::chrono::seconds(1));

    auto x = b.variable("x");
    for(int i = 0; i < 100; ++i) b.add(b.sin(x), b.integer(i));

    if(auto stats = monitor.check()) {
        std::cout << "active expressions: " << stats->active_expressions << std::endl;
        std::cout << "cache hits / misses: " << stats->cache_hits << " / " << stats->cache_misses << std::endl;
        std::cout << "estimated memory: " << stats->estimated_memory_usage << " bytes" << std::endl;
    }
    std::cout << "cleanup removed " << b.cleanup() << " entries" << std::endl;
}

int main() {
    std::cout << "=== symcore - Exact Symbolic Algebra Examples ===\n";

    demonstrate_exact_numbers();
    demonstrate_sharing();
    demonstrate_simplifier();
    demonstrate_evaluation();
    demonstrate_error_handling();
    demonstrate_memory();

    return 0;
}
