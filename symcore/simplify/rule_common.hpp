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
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

// GMP includes
#include <gmpxx.h>

// symcore includes
#include <symcore/expr/builder.hpp>
#include <symcore/expr/expr.hpp>

namespace symcore {
namespace simplify {

/// Knobs of the rewrite engine.
struct SimplifierConfig
{
    std::size_t max_passes = 64;            // full bottom-up passes before giving up with RewriteTimeout
    std::size_t max_local_rewrites = 16;    // rule applications at one node within a pass
    bool enable_trigonometric = true;       // induction, special angles, Pythagorean, periodicity
    bool enable_radicals = true;
    bool allow_complex = true;              // sqrt of a negative perfect square becomes k*i
    std::size_t cache_capacity = 256;       // simplify() results remembered, 0 disables
};

/// What a rule may use besides the node it looks at.
struct RuleContext
{
    ExpressionBuilder& builder;
    const SimplifierConfig& config;
};

/// A rule family: returns the rewritten node, or nothing when no rule of the family applies.
using RuleFn = std::function<std::optional<SharedExpr>(const SharedExpr&, RuleContext&)>;

struct RuleFamily
{
    std::string name;
    RuleFn apply;
    bool enabled = true;
};

//=====================================================================================================================
// MATCHERS
//=====================================================================================================================

/// Number literal that is a concrete value (not Symbolic).
inline bool is_literal_number(const SharedExpr& e)
{
    return e->is_number() && !e->number.is_symbolic();
}

/// Literal whose value is known to be non-zero: a concrete non-zero number or a finite named constant.
inline bool is_nonzero_literal(const SharedExpr& e)
{
    if(e->is_number()) return !e->number.is_symbolic() && !e->number.is_zero();
    return e->is_constant() && is_nonzero_real_constant(e->constant);
}

/// Exact minus one.
inline bool is_exact_minus_one(const SharedExpr& e)
{
    return e->is_number() && e->number.is_exact() && !e->number.is_symbolic() && e->number == Number::minus_one();
}

/// Value of an Integer or Rational literal.
inline std::optional<mpq_class> rational_literal(const SharedExpr& e)
{
    if(!e->is_number() || !e->number.is_rational()) return std::nullopt;
    return e->number.to_rational();
}

/// Value of an integral Integer or Rational literal that fits a machine integer.
inline std::optional<long> integer_literal(const SharedExpr& e)
{
    if(!e->is_number() || !e->number.is_rational()) return std::nullopt;
    return e->number.to_int64();
}

/// Negative real literal (Integer, Rational, Real or Float).
inline bool is_negative_literal(const SharedExpr& e)
{
    return is_literal_number(e) && e->number.is_real() && e->number.is_negative();
}

/// Folds a literal result through the numeric tower; Symbolic outcomes are not folded.
inline std::optional<Number> fold(const Number& value)
{
    if(value.is_symbolic()) return std::nullopt;
    return value.canonical();
}

/**
 * @brief k such that the expression equals kπ, for literal multiples of π.
 *
 * Recognizes `π`, `0`, `-X`, `q*X`, `X*q`, `X/q` and sums/differences of such
 * terms, where q is an Integer or Rational literal and X itself a multiple.
 */
inline std::optional<mpq_class> pi_multiple(const SharedExpr& e, int depth = 0)
{
    if(depth > 6) return std::nullopt;
    const ExprNode& n = *e;
    if(n.is_constant(ConstantKind::Pi)) return mpq_class(1);
    if(n.is_number()) {
        if(n.number.is_exact() && n.number.is_zero()) return mpq_class(0);
        return std::nullopt;
    }
    if(n.is_unary(OpType::Negate)) {
        auto k = pi_multiple(n.operand(), depth + 1);
        if(!k) return std::nullopt;
        return mpq_class(-*k);
    }
    if(n.is_binary(OpType::Mul)) {
        if(auto q = rational_literal(n.left())) {
            auto k = pi_multiple(n.right(), depth + 1);
            if(k) return mpq_class(*q * *k);
        }
        if(auto q = rational_literal(n.right())) {
            auto k = pi_multiple(n.left(), depth + 1);
            if(k) return mpq_class(*q * *k);
        }
        return std::nullopt;
    }
    if(n.is_binary(OpType::Div)) {
        auto q = rational_literal(n.right());
        if(!q || *q == 0) return std::nullopt;
        auto k = pi_multiple(n.left(), depth + 1);
        if(!k) return std::nullopt;
        return mpq_class(*k / *q);
    }
    if(n.is_binary(OpType::Add) || n.is_binary(OpType::Sub)) {
        auto a = pi_multiple(n.left(), depth + 1);
        if(!a) return std::nullopt;
        auto b = pi_multiple(n.right(), depth + 1);
        if(!b) return std::nullopt;
        return n.is_binary(OpType::Add) ? mpq_class(*a + *b) : mpq_class(*a - *b);
    }
    return std::nullopt;
}

/// kπ in canonical form: `π`, `π/6`, `(2/3) * π`, `-π/2`.
inline SharedExpr make_pi_multiple(const mpq_class& k, ExpressionBuilder& b)
{
    if(k == 0) return b.integer(0);
    if(k < 0) return b.negate(make_pi_multiple(mpq_class(-k), b));
    if(k == 1) return b.pi();
    if(k.get_num() == 1) return b.divide(b.pi(), b.number(Number::integer(mpz_class(k.get_den()))));
    return b.multiply(b.number(Number::rational(k).canonical()), b.pi());
}

/// q reduced into [0, period).
inline mpq_class reduce_modulo(const mpq_class& q, long period)
{
    const mpq_class scaled = q / period;
    mpz_class whole;
    mpz_fdiv_q(whole.get_mpz_t(), scaled.get_num_mpz_t(), scaled.get_den_mpz_t());
    return mpq_class(q - mpq_class(mpz_class(whole * period)));
}

/// An additive split `kπ + sign*rest` of a trigonometric argument.
struct PiShift
{
    mpq_class k;
    int sign = 1;
    SharedExpr rest;
};

/// Splits `P ± U` / `U ± P` where P is a literal multiple of π and U is not.
inline std::optional<PiShift> split_pi_shift(const SharedExpr& arg)
{
    const bool is_sub = arg->is_binary(OpType::Sub);
    if(!arg->is_binary(OpType::Add) && !is_sub) return std::nullopt;
    const SharedExpr& l = arg->left();
    const SharedExpr& r = arg->right();
    const auto kl = pi_multiple(l);
    const auto kr = pi_multiple(r);
    if(kl && !kr) return PiShift{*kl, is_sub ? -1 : 1, r};
    if(kr && !kl) return PiShift{is_sub ? mpq_class(-*kr) : *kr, 1, l};
    return std::nullopt;
}

/// A term `coefficient * base` with a concrete numeric coefficient.
struct Term
{
    Number coefficient;
    SharedExpr base;
};

/// `c*x` → (c, x), `-x` → (-1, x), `x` → (1, x); number literals have no term form.
inline std::optional<Term> split_term(const SharedExpr& e)
{
    if(e->is_number()) return std::nullopt;
    if(e->is_binary(OpType::Mul) && is_literal_number(e->left())) return Term{e->left()->number, e->right()};
    if(e->is_unary(OpType::Negate)) {
        const SharedExpr& inner = e->operand();
        if(inner->is_number()) return std::nullopt;
        if(inner->is_binary(OpType::Mul) && is_literal_number(inner->left()))
            return Term{neg(inner->left()->number), inner->right()};
        return Term{Number::minus_one(), inner};
    }
    return Term{Number::one(), e};
}

/// Rebuilds `coefficient * base`, or nothing if the coefficient did not fold.
inline std::optional<SharedExpr> join_term(const Number& coefficient, const SharedExpr& base, ExpressionBuilder& b)
{
    const auto c = fold(coefficient);
    if(!c) return std::nullopt;
    if(c->is_zero()) return b.integer(0);
    if(c->is_one()) return base;
    if(*c == Number::minus_one()) return b.negate(base);
    return b.multiply(b.number(*c), base);
}

} // namespace simplify
} // namespace symcore
