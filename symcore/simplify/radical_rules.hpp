//  ,-. . . ,-,-. ,-. ,-. ,-. ,-.
//  `-. | | | | | |   | | |   |-'
//  `-' `-| ' ' ' `-' `-' '   `-'
//      `-'
//
// exact symbolic algebra made easier in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2025
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

// C++ includes
#include <optional>

// GMP includes
#include <gmpxx.h>

// symcore includes
#include <symcore/simplify/rule_common.hpp>

namespace symcore {
namespace simplify {
namespace detail {

// Trial division bound for square factor extraction
constexpr unsigned long SQUARE_FACTOR_LIMIT = 10000;

/// n = f² m with f as large as trial division up to SQUARE_FACTOR_LIMIT finds; returns f.
inline mpz_class square_factor(const mpz_class& n, mpz_class& rest)
{
    mpz_class factor = 1;
    rest = n;
    for(unsigned long p = 2; p <= SQUARE_FACTOR_LIMIT && mpz_class(p) * p <= rest; ++p) {
        const mpz_class square = mpz_class(p) * p;
        while(mpz_divisible_p(rest.get_mpz_t(), square.get_mpz_t()) != 0) {
            rest /= square;
            factor *= p;
        }
    }
    return factor;
}

inline std::optional<SharedExpr> sqrt_of_literal(const Number& n, RuleContext& ctx)
{
    ExpressionBuilder& b = ctx.builder;
    if(!n.is_exact() || n.is_complex()) return std::nullopt;

    if(auto root = sqrt_exact(n)) {
        if(root->is_complex() && !ctx.config.allow_complex) return std::nullopt;
        return b.number(root->canonical());
    }

    // sqrt(f² m) → f sqrt(m)
    if(n.kind() != NumberKind::Integer || !n.is_positive()) return std::nullopt;
    mpz_class rest;
    const mpz_class factor = square_factor(n.integer_value(), rest);
    if(factor == 1) return std::nullopt;
    return b.multiply(b.number(Number::integer(factor)), b.sqrt(b.number(Number::integer(rest))));
}

} // namespace detail

/**
 * @brief Exact square roots of literals and `(√u)^2k → u^k`.
 *
 * A root that is not exact stays a `sqrt` node (after pulling out square
 * factors); it is never replaced by a floating approximation. Roots of
 * negative perfect squares become pure imaginary numbers only when the
 * configuration allows complex results.
 */
inline std::optional<SharedExpr> radical_rules(const SharedExpr& e, RuleContext& ctx)
{
    ExpressionBuilder& b = ctx.builder;
    if(e->is_unary(OpType::Sqrt)) {
        const SharedExpr& x = e->operand();
        if(is_literal_number(x)) return detail::sqrt_of_literal(x->number, ctx);
        return std::nullopt;
    }
    if(e->is_binary(OpType::Pow) && e->left()->is_unary(OpType::Sqrt)) {
        const auto n = integer_literal(e->right());
        if(!n || *n == 0 || *n % 2 != 0) return std::nullopt;
        return b.power(e->left()->operand(), b.integer(*n / 2));
    }
    return std::nullopt;
}

} // namespace simplify
} // namespace symcore
