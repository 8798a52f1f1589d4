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

inline std::optional<SharedExpr> fold_binary(OpType op, const Number& a, const Number& b, ExpressionBuilder& builder)
{
    std::optional<Number> value;
    switch(op) {
        case OpType::Add: value = fold(a + b); break;
        case OpType::Sub: value = fold(a - b); break;
        case OpType::Mul: value = fold(a * b); break;
        case OpType::Div: value = fold(a / b); break;
        case OpType::Pow: value = fold(pow(a, b)); break;
        default: break;
    }
    if(!value) return std::nullopt;
    return builder.number(*value);
}

// like terms: c1*x ± c2*x → (c1 ± c2)*x
inline std::optional<SharedExpr> collect_like_terms(const SharedExpr& l, const SharedExpr& r, bool subtract, ExpressionBuilder& b)
{
    const auto tl = split_term(l);
    const auto tr = split_term(r);
    if(!tl || !tr || tl->base != tr->base) return std::nullopt;
    return join_term(subtract ? tl->coefficient - tr->coefficient : tl->coefficient + tr->coefficient, tl->base, b);
}

// (a ± t1) ± t2 with t1, t2 like terms → a ± combined
inline std::optional<SharedExpr> collect_nested_terms(const SharedExpr& l, const SharedExpr& r, bool subtract, ExpressionBuilder& b)
{
    if(!l->is_binary(OpType::Add) && !l->is_binary(OpType::Sub)) return std::nullopt;
    const bool inner_sub = l->is_binary(OpType::Sub);
    const auto t1 = split_term(l->right());
    const auto t2 = split_term(r);
    if(!t1 || !t2 || t1->base != t2->base) return std::nullopt;
    const Number c1 = inner_sub ? neg(t1->coefficient) : t1->coefficient;
    const Number c2 = subtract ? neg(t2->coefficient) : t2->coefficient;
    const auto combined = join_term(c1 + c2, t1->base, b);
    if(!combined) return std::nullopt;
    return b.add(l->left(), *combined);
}

inline std::optional<SharedExpr> add_rules(const SharedExpr& l, const SharedExpr& r, ExpressionBuilder& b)
{
    if(is_exact_zero(r)) return l;
    if(is_exact_zero(l)) return r;
    if(is_literal_number(l) && is_literal_number(r)) return fold_binary(OpType::Add, l->number, r->number, b);

    // x + -y → x - y
    if(r->is_unary(OpType::Negate)) return b.subtract(l, r->operand());
    if(is_negative_literal(r)) return b.subtract(l, b.number(neg(r->number)));
    if(r->is_binary(OpType::Mul) && is_negative_literal(r->left()))
        return b.subtract(l, b.multiply(b.number(neg(r->left()->number)), r->right()));

    // numbers to the right
    if(is_literal_number(l) && !r->is_number()) return b.add(r, l);

    if(auto like = collect_like_terms(l, r, false, b)) return like;

    // (a + n) + m → a + (n + m),  (a - n) + m → a + (m - n)
    if(is_literal_number(r) && (l->is_binary(OpType::Add) || l->is_binary(OpType::Sub)) && is_literal_number(l->right())) {
        const Number& n = l->right()->number;
        const auto value = fold(l->is_binary(OpType::Add) ? n + r->number : r->number - n);
        if(value) return b.add(l->left(), b.number(*value));
    }

    return collect_nested_terms(l, r, false, b);
}

inline std::optional<SharedExpr> sub_rules(const SharedExpr& l, const SharedExpr& r, ExpressionBuilder& b)
{
    if(is_exact_zero(r)) return l;
    if(is_exact_zero(l)) return b.negate(r);
    if(l == r) return b.integer(0);
    if(is_literal_number(l) && is_literal_number(r)) return fold_binary(OpType::Sub, l->number, r->number, b);

    // x - -y → x + y
    if(r->is_unary(OpType::Negate)) return b.add(l, r->operand());
    if(is_negative_literal(r)) return b.add(l, b.number(neg(r->number)));
    if(r->is_binary(OpType::Mul) && is_negative_literal(r->left()))
        return b.add(l, b.multiply(b.number(neg(r->left()->number)), r->right()));

    if(auto like = collect_like_terms(l, r, true, b)) return like;

    // (a + n) - m → a + (n - m),  (a - n) - m → a - (n + m)
    if(is_literal_number(r) && (l->is_binary(OpType::Add) || l->is_binary(OpType::Sub)) && is_literal_number(l->right())) {
        const Number& n = l->right()->number;
        if(l->is_binary(OpType::Add)) {
            if(auto value = fold(n - r->number)) return b.add(l->left(), b.number(*value));
        }
        else if(auto value = fold(n + r->number)) return b.subtract(l->left(), b.number(*value));
    }

    return collect_nested_terms(l, r, true, b);
}

inline std::optional<SharedExpr> mul_rules(const SharedExpr& l, const SharedExpr& r, ExpressionBuilder& b)
{
    if(is_exact_zero(l) || is_exact_zero(r)) return b.integer(0);
    if(is_exact_one(r)) return l;
    if(is_exact_one(l)) return r;
    if(is_literal_number(l) && is_literal_number(r)) return fold_binary(OpType::Mul, l->number, r->number, b);

    // numeric coefficient to the left
    if(is_literal_number(r) && !l->is_number()) return b.multiply(r, l);
    if(is_exact_minus_one(l)) return b.negate(r);

    // c1 * (c2 * x) → (c1 c2) * x
    if(is_literal_number(l) && r->is_binary(OpType::Mul) && is_literal_number(r->left())) {
        if(auto c = fold(l->number * r->left()->number)) return b.multiply(b.number(*c), r->right());
    }
    // a * (c * x) → c * (a * x)
    if(!l->is_number() && r->is_binary(OpType::Mul) && is_literal_number(r->left()))
        return b.multiply(r->left(), b.multiply(l, r->right()));

    // (-a) * b → -(a b)
    if(l->is_unary(OpType::Negate)) return b.negate(b.multiply(l->operand(), r));
    if(r->is_unary(OpType::Negate)) return b.negate(b.multiply(l, r->operand()));

    // x * x → x^2
    if(l == r) return b.power(l, b.integer(2));

    // x^a * x^b → x^(a+b) for numeric exponents
    auto base_exponent = [](const SharedExpr& e) -> std::pair<SharedExpr, std::optional<Number>> {
        if(e->is_binary(OpType::Pow) && is_literal_number(e->right())) return {e->left(), e->right()->number};
        return {e, Number::one()};
    };
    const auto [lb, le] = base_exponent(l);
    const auto [rb, re] = base_exponent(r);
    if((l->is_binary(OpType::Pow) || r->is_binary(OpType::Pow)) && lb == rb && le && re) {
        if(auto e = fold(*le + *re)) return b.power(lb, b.number(*e));
    }
    return std::nullopt;
}

inline std::optional<SharedExpr> div_rules(const SharedExpr& l, const SharedExpr& r, ExpressionBuilder& b)
{
    if(is_exact_one(r)) return l;
    if(is_exact_zero(l) && is_nonzero_literal(r)) return b.integer(0);
    if(is_literal_number(l) && is_literal_number(r) && !r->number.is_zero())
        return fold_binary(OpType::Div, l->number, r->number, b);
    if(l == r && is_nonzero_literal(r)) return b.integer(1);
    if(is_exact_minus_one(r)) return b.negate(l);

    // (c * x) / d → (c/d) * x
    if(is_literal_number(r) && !r->number.is_zero() && l->is_binary(OpType::Mul) && is_literal_number(l->left())) {
        if(auto c = fold(l->left()->number / r->number)) return b.multiply(b.number(*c), l->right());
    }
    return std::nullopt;
}

inline std::optional<SharedExpr> pow_rules(const SharedExpr& base, const SharedExpr& exponent, ExpressionBuilder& b)
{
    if(is_exact_one(exponent)) return base;
    if(is_exact_zero(exponent) && is_nonzero_literal(base)) return b.integer(1);
    if(is_exact_one(base)) return b.integer(1);
    if(is_exact_zero(base) && is_literal_number(exponent) && exponent->number.is_real() && exponent->number.is_positive())
        return b.integer(0);
    if(is_literal_number(base) && is_literal_number(exponent)) return fold_binary(OpType::Pow, base->number, exponent->number, b);

    const auto n = integer_literal(exponent);
    if(!n) return std::nullopt;

    // (x^a)^n → x^(a n) for non-negative integers a and n
    if(base->is_binary(OpType::Pow) && *n >= 0) {
        const auto a = integer_literal(base->right());
        if(a && *a >= 0) return b.power(base->left(), b.number(Number::integer(*a) * Number::integer(*n)));
    }
    // (-x)^n → x^n for even n, -(x^n) for odd n
    if(base->is_unary(OpType::Negate)) {
        const SharedExpr raised = b.power(base->operand(), exponent);
        return *n % 2 == 0 ? raised : b.negate(raised);
    }
    return std::nullopt;
}

inline std::optional<SharedExpr> unary_rules(const SharedExpr& e, ExpressionBuilder& b)
{
    const SharedExpr& x = e->operand();
    switch(e->op_type) {
        case OpType::Negate:
            if(is_literal_number(x)) return b.number(neg(x->number).canonical());
            if(x->is_unary(OpType::Negate)) return x->operand();
            if(x->is_binary(OpType::Mul) && is_literal_number(x->left())) {
                if(auto c = fold(neg(x->left()->number))) return b.multiply(b.number(*c), x->right());
            }
            // -(a - b) → b - a
            if(x->is_binary(OpType::Sub)) return b.subtract(x->right(), x->left());
            break;
        case OpType::Abs:
            if(is_literal_number(x)) {
                if(auto value = fold(abs(x->number))) return b.number(*value);
            }
            if(x->is_unary(OpType::Negate) || x->is_unary(OpType::Abs)) return b.abs(x->operand());
            break;
        case OpType::Exp:
            if(is_exact_zero(x)) return b.integer(1);
            break;
        case OpType::Ln:
            if(is_exact_one(x)) return b.integer(0);
            if(x->is_constant(ConstantKind::E)) return b.integer(1);
            break;
        case OpType::Factorial:
            if(auto k = integer_literal(x)) {
                if(*k >= 0 && *k <= 100) {
                    mpz_class value;
                    mpz_fac_ui(value.get_mpz_t(), static_cast<unsigned long>(*k));
                    return b.number(Number::integer(value));
                }
            }
            break;
        default: break;
    }
    return std::nullopt;
}

} // namespace detail

/**
 * @brief Identity laws, constant folding and like-term collection.
 *
 * Only rewrites that hold for every value of the variables involved; the
 * ones that need a non-zero operand (`x^0`, `x/x`, `0/x`) fire only when
 * the operand is a literal known to be non-zero.
 */
inline std::optional<SharedExpr> algebraic_rules(const SharedExpr& e, RuleContext& ctx)
{
    ExpressionBuilder& b = ctx.builder;
    const ExprNode& node = *e;
    switch(node.type) {
        case ExprType::Function: {
            // named one-argument functions become operator nodes
            const auto op = unary_op_from_name(node.name);
            if(op && node.children.size() == 1) return b.unary(*op, node.children[0]);
            break;
        }
        case ExprType::Unary: return detail::unary_rules(e, b);
        case ExprType::Binary:
            switch(node.op_type) {
                case OpType::Add: return detail::add_rules(node.left(), node.right(), b);
                case OpType::Sub: return detail::sub_rules(node.left(), node.right(), b);
                case OpType::Mul: return detail::mul_rules(node.left(), node.right(), b);
                case OpType::Div: return detail::div_rules(node.left(), node.right(), b);
                case OpType::Pow: return detail::pow_rules(node.left(), node.right(), b);
                default: break;
            }
            break;
        default: break;
    }
    return std::nullopt;
}

} // namespace simplify
} // namespace symcore
