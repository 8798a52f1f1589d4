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
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// GMP includes
#include <gmpxx.h>

// symcore includes
#include <symcore/common/error.hpp>
#include <symcore/expr/expr.hpp>
#include <symcore/expr/traversal.hpp>
#include <symcore/numeric/number.hpp>

namespace symcore {

/// Switches of evaluate().
struct EvalOptions
{
    bool allow_complex = true;       // sqrt of a negative value gives a complex number instead of DomainError
    bool approximate = false;        // constants and transcendental functions become Float values
    unsigned long max_factorial = 1000;
};

namespace detail {

inline Number unevaluated_call(const char* name, const Number& x)
{
    return Number::symbolic(SymbolicReason::Unevaluated, std::string(name) + "(" + x.to_string() + ")");
}

inline Number eval_constant(ConstantKind c, const EvalOptions& options)
{
    if(c == ConstantKind::I) return Number::imaginary_unit();
    if(options.approximate && c != ConstantKind::Undefined) return Number::floating(constant_value(c));
    return Number::symbolic(SymbolicReason::Unevaluated, constant_symbol(c));
}

inline Number eval_sqrt(const Number& x, const EvalOptions& options)
{
    if(x.is_symbolic() || x.is_complex()) return unevaluated_call("sqrt", x);
    if(x.is_negative() && !options.allow_complex) throw ComputeError::domain_error("sqrt of negative number " + x.to_string());

    if(x.is_exact()) {
        if(auto root = sqrt_exact(x)) return root->canonical();
        if(!options.approximate) return unevaluated_call("sqrt", x);
    }
    const double v = x.approximate();
    if(v < 0) return Number::complex(Number::floating(0.0), Number::floating(std::sqrt(-v)));
    return Number::floating(std::sqrt(v));
}

inline Number eval_factorial(const Number& x, const EvalOptions& options)
{
    if(x.is_symbolic()) return unevaluated_call("factorial", x);
    if(!x.is_real() || !x.is_integer() || x.is_negative())
        throw ComputeError::domain_error("factorial of " + x.to_string());
    const mpz_class n = x.to_integer();
    if(n > options.max_factorial) return Number::symbolic(SymbolicReason::Unevaluated, x.to_string() + "!");
    mpz_class value;
    mpz_fac_ui(value.get_mpz_t(), n.get_ui());
    return Number::integer(value);
}

// Values that are exact without approximation: f(0) and ln(1)
inline std::optional<Number> exact_transcendental(OpType op, const Number& x)
{
    if(!x.is_exact() || x.is_symbolic()) return std::nullopt;
    if(x.is_zero()) {
        switch(op) {
            case OpType::Sin:
            case OpType::Tan:
            case OpType::Asin:
            case OpType::Atan:
            case OpType::Sinh:
            case OpType::Tanh: return Number::zero();
            case OpType::Cos:
            case OpType::Cosh:
            case OpType::Exp: return Number::one();
            default: break;
        }
    }
    if(x.is_one() && (op == OpType::Ln || op == OpType::Log10)) return Number::zero();
    return std::nullopt;
}

inline Number eval_transcendental(OpType op, const Number& x, const EvalOptions& options)
{
    if(auto exact = exact_transcendental(op, x)) return *exact;
    if(!options.approximate || !x.is_real()) return unevaluated_call(op_symbol(op), x);

    const double v = x.approximate();
    double result = 0.0;
    switch(op) {
        case OpType::Sin: result = std::sin(v); break;
        case OpType::Cos: result = std::cos(v); break;
        case OpType::Tan: result = std::tan(v); break;
        case OpType::Asin:
        case OpType::Acos:
            if(v < -1.0 || v > 1.0) throw ComputeError::domain_error(std::string(op_symbol(op)) + " of " + x.to_string());
            result = op == OpType::Asin ? std::asin(v) : std::acos(v);
            break;
        case OpType::Atan: result = std::atan(v); break;
        case OpType::Sinh: result = std::sinh(v); break;
        case OpType::Cosh: result = std::cosh(v); break;
        case OpType::Tanh: result = std::tanh(v); break;
        case OpType::Ln:
        case OpType::Log10:
            if(v <= 0.0) throw ComputeError::domain_error(std::string(op_symbol(op)) + " of " + x.to_string());
            result = op == OpType::Ln ? std::log(v) : std::log10(v);
            break;
        case OpType::Exp: result = std::exp(v); break;
        default: return unevaluated_call(op_symbol(op), x);
    }
    return Number::floating(checked_float(result, v, 0.0, op_symbol(op)));
}

inline Number eval_unary(OpType op, const Number& x, const EvalOptions& options)
{
    switch(op) {
        case OpType::Negate: return neg(x);
        case OpType::Abs: return abs(x);
        case OpType::Sqrt: return eval_sqrt(x, options);
        case OpType::Factorial: return eval_factorial(x, options);
        default: break;
    }
    return eval_transcendental(op, x, options);
}

// Truncated remainder of integers; the sign follows the dividend
inline Number eval_modulo(const Number& a, const Number& b)
{
    if(a.is_symbolic() || b.is_symbolic()) return unevaluated(a, "mod", b);
    if(!a.is_real() || !b.is_real() || !a.is_integer() || !b.is_integer())
        throw ComputeError::unsupported("modulo of " + a.to_string() + " and " + b.to_string());
    if(b.is_zero()) return Number::symbolic(SymbolicReason::DivisionByZero, a.to_string() + " mod 0");
    mpz_class r;
    mpz_tdiv_r(r.get_mpz_t(), a.to_integer().get_mpz_t(), b.to_integer().get_mpz_t());
    return Number::integer(r);
}

inline Number as_float(const Number& x)
{
    if(x.is_complex())
        return Number::complex(Number::floating(x.real_part().approximate()), Number::floating(x.imag_part().approximate()));
    return Number::floating(x.approximate());
}

// In approximate mode an exact operand meeting an inexact one is lifted to Float
inline std::pair<Number, Number> match_exactness(const Number& a, const Number& b, const EvalOptions& options)
{
    if(!options.approximate || a.is_symbolic() || b.is_symbolic() || a.is_exact() == b.is_exact()) return {a, b};
    return {a.is_exact() ? as_float(a) : a, b.is_exact() ? as_float(b) : b};
}

inline Number eval_binary(OpType op, const Number& left, const Number& right, const EvalOptions& options)
{
    const auto [a, b] = match_exactness(left, right, options);
    switch(op) {
        case OpType::Add: return a + b;
        case OpType::Sub: return a - b;
        case OpType::Mul: return a * b;
        case OpType::Div: return a / b;
        case OpType::Pow: return pow(a, b);
        case OpType::Mod: return eval_modulo(a, b);
        default: break;
    }
    throw ComputeError::unsupported(std::string("operator ") + op_symbol(op));
}

inline Number eval_function(const std::string& name, const std::vector<Number>& args, const EvalOptions& options)
{
    if(name == "max" || name == "min") {
        if(args.empty()) throw ComputeError::domain_error(name + " of no arguments");
        for(const auto& a : args)
            if(!a.is_real()) return Number::symbolic(SymbolicReason::Unevaluated, name + "(...)");
        const bool is_max = name == "max";
        Number best = args.front();
        for(std::size_t i = 1; i < args.size(); ++i) {
            const int c = compare(args[i], best);
            if(is_max ? c > 0 : c < 0) best = args[i];
        }
        return best;
    }
    if(args.size() == 1) {
        if(auto op = unary_op_from_name(name)) return eval_unary(*op, args.front(), options);
    }
    throw ComputeError::unsupported("function " + name + " with " + std::to_string(args.size()) + " arguments");
}

} // namespace detail

/**
 * @brief Numeric value of an expression under variable bindings.
 *
 * Exact by default: named constants (other than i) and transcendental
 * functions of non-trivial arguments stay Symbolic, and sqrt only resolves
 * perfect squares. With `approximate` set they become Float values, and an
 * exact operand combined with a Float is approximated as well. Nodes
 * are visited in post-order with an explicit stack, each shared node once.
 *
 * Throws ComputeError: UndefinedVariable for a missing binding, DomainError
 * for sqrt of a negative number without complex mode and for factorials of
 * negative or non-integer values, UnsupportedOperation for modulo of
 * non-integers and unknown functions.
 *
 * Usage:
 *   evaluate(b.add(x, b.integer(1)), {{"x", Number::rational(1, 2)}});   // 3/2
 */
inline Number evaluate(const SharedExpr& expr, const std::unordered_map<std::string, Number>& bindings, const EvalOptions& options = {})
{
    if(!expr) throw std::invalid_argument("evaluate of an empty expression");
    std::unordered_map<const ExprNode*, Number> values;
    for(const SharedExpr* handle : topological_order(expr)) {
        const ExprNode& node = **handle;
        Number value;
        switch(node.type) {
            case ExprType::Number: value = node.number; break;
            case ExprType::Variable: {
                auto it = bindings.find(node.name);
                if(it == bindings.end()) throw ComputeError::undefined_variable(node.name);
                value = it->second;
                break;
            }
            case ExprType::Constant: value = detail::eval_constant(node.constant, options); break;
            case ExprType::Unary: value = detail::eval_unary(node.op_type, values.at(node.operand().get()), options); break;
            case ExprType::Binary:
                value = detail::eval_binary(node.op_type, values.at(node.left().get()), values.at(node.right().get()),
                                            options);
                break;
            case ExprType::Function: {
                std::vector<Number> args;
                args.reserve(node.children.size());
                for(const auto& child : node.children) args.push_back(values.at(child.get()));
                value = detail::eval_function(node.name, args, options);
                break;
            }
        }
        values.emplace(handle->get(), std::move(value));
    }
    return values.at(expr.get());
}

/// Evaluates an expression without variables.
inline Number evaluate(const SharedExpr& expr, const EvalOptions& options = {})
{
    return evaluate(expr, {}, options);
}

} // namespace symcore
