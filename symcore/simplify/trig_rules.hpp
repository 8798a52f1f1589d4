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
#include <array>
#include <optional>
#include <utility>

// GMP includes
#include <gmpxx.h>

// symcore includes
#include <symcore/simplify/rule_common.hpp>

namespace symcore {
namespace simplify {
namespace detail {

inline bool is_odd_trig(OpType op) { return op == OpType::Sin || op == OpType::Tan; }

/**
 * @brief sin/cos/tan of `kπ + sign*u` for k a multiple of 1/2.
 *
 * With m = 2k mod 4 the argument is a quarter-turn shift of `sign*u`:
 *
 *   m | sin    | cos    | tan
 *   0 |  sin v |  cos v |  tan v
 *   1 |  cos v | -sin v |  (cot, not rewritten)
 *   2 | -sin v | -cos v |  tan v
 *   3 | -cos v |  sin v |  (cot, not rewritten)
 */
inline std::optional<SharedExpr> shifted_trig(OpType op, const mpq_class& k, int sign, const SharedExpr& u, ExpressionBuilder& b)
{
    const mpq_class twice = k * 2;
    if(twice.get_den() != 1) return std::nullopt;
    const unsigned long m = mpz_fdiv_ui(twice.get_num_mpz_t(), 4);

    OpType result = op;
    bool negated = false;
    switch(op) {
        case OpType::Sin:
            result = m % 2 == 0 ? OpType::Sin : OpType::Cos;
            negated = m >= 2;
            break;
        case OpType::Cos:
            result = m % 2 == 0 ? OpType::Cos : OpType::Sin;
            negated = m == 1 || m == 2;
            break;
        case OpType::Tan:
            if(m % 2 == 1) return std::nullopt;
            break;
        default: return std::nullopt;
    }
    if(sign < 0 && is_odd_trig(result)) negated = !negated;
    const SharedExpr value = b.unary(result, u);
    return negated ? b.negate(value) : value;
}

/// Index into the special value table {0, 1/2, √2/2, √3/2, 1, √3/3, √3}.
enum class SpecialValue : int
{
    Zero,
    Half,
    HalfSqrt2,
    HalfSqrt3,
    One,
    ThirdSqrt3,
    Sqrt3
};

inline SharedExpr special_value(SpecialValue v, ExpressionBuilder& b)
{
    switch(v) {
        case SpecialValue::Zero: return b.integer(0);
        case SpecialValue::Half: return b.rational(1, 2);
        case SpecialValue::HalfSqrt2: return b.divide(b.sqrt(b.integer(2)), b.integer(2));
        case SpecialValue::HalfSqrt3: return b.divide(b.sqrt(b.integer(3)), b.integer(2));
        case SpecialValue::One: return b.integer(1);
        case SpecialValue::ThirdSqrt3: return b.divide(b.sqrt(b.integer(3)), b.integer(3));
        case SpecialValue::Sqrt3: return b.sqrt(b.integer(3));
    }
    return b.integer(0);
}

inline SharedExpr signed_value(SpecialValue v, bool negative, ExpressionBuilder& b)
{
    const SharedExpr value = special_value(v, b);
    return negative ? b.negate(value) : value;
}

// sin(qπ) for q a multiple of 1/6 or 1/4
inline std::optional<SharedExpr> sin_of_pi_multiple(mpq_class q, ExpressionBuilder& b)
{
    q = reduce_modulo(q, 2);
    bool negative = false;
    if(q >= 1) {
        negative = true;
        q -= 1;
    }
    if(q > mpq_class(1, 2)) q = 1 - q;

    if(q == 0) return b.integer(0);
    if(q == mpq_class(1, 6)) return signed_value(SpecialValue::Half, negative, b);
    if(q == mpq_class(1, 4)) return signed_value(SpecialValue::HalfSqrt2, negative, b);
    if(q == mpq_class(1, 3)) return signed_value(SpecialValue::HalfSqrt3, negative, b);
    if(q == mpq_class(1, 2)) return signed_value(SpecialValue::One, negative, b);
    return std::nullopt;
}

// tan(qπ); undefined at odd multiples of π/2, where nothing is rewritten
inline std::optional<SharedExpr> tan_of_pi_multiple(mpq_class q, ExpressionBuilder& b)
{
    q = reduce_modulo(q, 1);
    if(q == mpq_class(1, 2)) return std::nullopt;
    bool negative = false;
    if(q > mpq_class(1, 2)) {
        negative = true;
        q = 1 - q;
    }

    if(q == 0) return b.integer(0);
    if(q == mpq_class(1, 6)) return signed_value(SpecialValue::ThirdSqrt3, negative, b);
    if(q == mpq_class(1, 4)) return signed_value(SpecialValue::One, negative, b);
    if(q == mpq_class(1, 3)) return signed_value(SpecialValue::Sqrt3, negative, b);
    return std::nullopt;
}

// Matches one of the special values, possibly negated; returns it with its sign.
inline std::optional<std::pair<SpecialValue, bool>> match_special_value(const SharedExpr& e, ExpressionBuilder& b)
{
    bool negative = false;
    SharedExpr magnitude = e;
    if(e->is_unary(OpType::Negate)) {
        negative = true;
        magnitude = e->operand();
    }
    else if(is_negative_literal(e)) {
        negative = true;
        magnitude = b.number(neg(e->number).canonical());
    }

    static constexpr std::array<SpecialValue, 7> table = {SpecialValue::Zero, SpecialValue::Half, SpecialValue::HalfSqrt2,
        SpecialValue::HalfSqrt3, SpecialValue::One, SpecialValue::ThirdSqrt3, SpecialValue::Sqrt3};
    for(SpecialValue v : table)
        if(magnitude == special_value(v, b)) return std::make_pair(v, negative);
    return std::nullopt;
}

// asin/acos/atan of a special value, as a multiple of π
inline std::optional<SharedExpr> inverse_special_angle(OpType op, const SharedExpr& x, ExpressionBuilder& b)
{
    const auto match = match_special_value(x, b);
    if(!match) return std::nullopt;
    const auto [value, negative] = *match;

    std::optional<mpq_class> k;
    if(op == OpType::Asin || op == OpType::Acos) {
        switch(value) {
            case SpecialValue::Zero: k = mpq_class(0); break;
            case SpecialValue::Half: k = mpq_class(1, 6); break;
            case SpecialValue::HalfSqrt2: k = mpq_class(1, 4); break;
            case SpecialValue::HalfSqrt3: k = mpq_class(1, 3); break;
            case SpecialValue::One: k = mpq_class(1, 2); break;
            default: break;
        }
    }
    else {
        switch(value) {
            case SpecialValue::Zero: k = mpq_class(0); break;
            case SpecialValue::ThirdSqrt3: k = mpq_class(1, 6); break;
            case SpecialValue::One: k = mpq_class(1, 4); break;
            case SpecialValue::Sqrt3: k = mpq_class(1, 3); break;
            default: break;
        }
    }
    if(!k) return std::nullopt;
    if(negative) *k = -*k;
    // acos(v) = π/2 - asin(v)
    if(op == OpType::Acos) *k = mpq_class(1, 2) - *k;
    return make_pi_multiple(*k, b);
}

// sin²u (op = Sin) or cos²u (op = Cos): the argument u
inline std::optional<SharedExpr> squared_trig(const SharedExpr& e, OpType op)
{
    if(!e->is_binary(OpType::Pow) || !e->left()->is_unary(op)) return std::nullopt;
    const auto n = integer_literal(e->right());
    if(!n || *n != 2) return std::nullopt;
    return e->left()->operand();
}

// c*sin²u and c*cos²u (either order) with the same c and u: c
inline std::optional<Number> pythagorean_pair(const SharedExpr& l, const SharedExpr& r)
{
    const auto tl = split_term(l);
    const auto tr = split_term(r);
    if(!tl || !tr || tl->coefficient != tr->coefficient) return std::nullopt;
    auto matches = [](const SharedExpr& a, const SharedExpr& c) {
        const auto s = squared_trig(a, OpType::Sin);
        const auto k = squared_trig(c, OpType::Cos);
        return s && k && *s == *k;
    };
    if(matches(tl->base, tr->base) || matches(tr->base, tl->base)) return fold(tl->coefficient);
    return std::nullopt;
}

} // namespace detail

/// Odd/even symmetry and shifts of sin, cos and tan by π/2 and π.
inline std::optional<SharedExpr> induction_rules(const SharedExpr& e, RuleContext& ctx)
{
    if(e->type != ExprType::Unary || !is_trigonometric(e->op_type)) return std::nullopt;
    ExpressionBuilder& b = ctx.builder;
    const OpType op = e->op_type;
    const SharedExpr& arg = e->operand();

    // sin(-u) = -sin(u), cos(-u) = cos(u), tan(-u) = -tan(u)
    auto reflect = [&](const SharedExpr& u) {
        const SharedExpr value = b.unary(op, u);
        return detail::is_odd_trig(op) ? b.negate(value) : value;
    };
    if(arg->is_unary(OpType::Negate)) return reflect(arg->operand());
    if(arg->is_binary(OpType::Mul) && is_negative_literal(arg->left()))
        return reflect(b.multiply(b.number(neg(arg->left()->number).canonical()), arg->right()));

    const auto shift = split_pi_shift(arg);
    if(!shift) return std::nullopt;
    const mpq_class magnitude = shift->k < 0 ? mpq_class(-shift->k) : shift->k;
    if(magnitude != mpq_class(1, 2) && magnitude != 1) return std::nullopt;
    return detail::shifted_trig(op, shift->k, shift->sign, shift->rest, b);
}

/**
 * @brief Exact values at multiples of π/6 and π/4.
 *
 * The argument is reduced into one period and then mapped onto the first
 * quadrant; the table holds 0, 1/2, √2/2, √3/2 and 1 (and 0, √3/3, 1, √3 for
 * tan), built from exact numbers and `sqrt` nodes. The inverse functions map
 * the same values back to multiples of π.
 */
inline std::optional<SharedExpr> special_angle_rules(const SharedExpr& e, RuleContext& ctx)
{
    if(e->type != ExprType::Unary) return std::nullopt;
    ExpressionBuilder& b = ctx.builder;
    const OpType op = e->op_type;

    if(op == OpType::Asin || op == OpType::Acos || op == OpType::Atan)
        return detail::inverse_special_angle(op, e->operand(), b);
    if(!is_trigonometric(op)) return std::nullopt;

    const auto q = pi_multiple(e->operand());
    if(!q) return std::nullopt;
    switch(op) {
        case OpType::Sin: return detail::sin_of_pi_multiple(*q, b);
        case OpType::Cos: return detail::sin_of_pi_multiple(mpq_class(*q + mpq_class(1, 2)), b);
        case OpType::Tan: return detail::tan_of_pi_multiple(*q, b);
        default: break;
    }
    return std::nullopt;
}

/// sin²u + cos²u = 1 in its additive, subtractive and quotient arrangements.
inline std::optional<SharedExpr> pythagorean_rules(const SharedExpr& e, RuleContext& ctx)
{
    if(e->type != ExprType::Binary) return std::nullopt;
    ExpressionBuilder& b = ctx.builder;
    const SharedExpr& l = e->left();
    const SharedExpr& r = e->right();

    switch(e->op_type) {
        case OpType::Add: {
            if(auto c = detail::pythagorean_pair(l, r)) return b.number(*c);
            // (a + c sin²u) + c cos²u → a + c
            if(l->is_binary(OpType::Add)) {
                if(auto c = detail::pythagorean_pair(l->right(), r)) return b.add(l->left(), b.number(*c));
                if(auto c = detail::pythagorean_pair(l->left(), r)) return b.add(l->right(), b.number(*c));
            }
            break;
        }
        case OpType::Sub: {
            // c - c sin²u → c cos²u,  c - c cos²u → c sin²u
            if(!is_literal_number(l)) break;
            const auto t = split_term(r);
            if(!t || t->coefficient != l->number) break;
            if(auto u = detail::squared_trig(t->base, OpType::Sin))
                return join_term(l->number, b.power(b.cos(*u), b.integer(2)), b);
            if(auto u = detail::squared_trig(t->base, OpType::Cos))
                return join_term(l->number, b.power(b.sin(*u), b.integer(2)), b);
            break;
        }
        case OpType::Div:
            // sin u / cos u → tan u
            if(l->is_unary(OpType::Sin) && r->is_unary(OpType::Cos) && l->operand() == r->operand())
                return b.tan(l->operand());
            break;
        default: break;
    }
    return std::nullopt;
}

/**
 * @brief Removes whole periods from trigonometric arguments.
 *
 * `sin(u + 2kπ) → sin(u)`, `cos(u + 2kπ) → cos(u)`, `tan(u + kπ) → tan(u)`,
 * and odd multiples of π (or π/2) beyond the ones the induction formulas take
 * care of. A pure multiple of π of a full period or more is reduced, keeping its sign.
 */
inline std::optional<SharedExpr> periodicity_rules(const SharedExpr& e, RuleContext& ctx)
{
    if(e->type != ExprType::Unary || !is_trigonometric(e->op_type)) return std::nullopt;
    ExpressionBuilder& b = ctx.builder;
    const OpType op = e->op_type;
    const SharedExpr& arg = e->operand();

    if(const auto q = pi_multiple(arg)) {
        const long period = op == OpType::Tan ? 1 : 2;
        if(*q < period && *q > -period) return std::nullopt;
        mpq_class reduced = reduce_modulo(*q, period);
        if(*q < 0 && reduced != 0) reduced -= period;
        return b.unary(op, make_pi_multiple(reduced, b));
    }

    const auto shift = split_pi_shift(arg);
    if(!shift) return std::nullopt;
    return detail::shifted_trig(op, shift->k, shift->sign, shift->rest, b);
}

} // namespace simplify
} // namespace symcore
