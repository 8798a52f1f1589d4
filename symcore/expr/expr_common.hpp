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
#include <cstdint>
#include <optional>
#include <string>

namespace symcore {

// Forward declarations
struct ExprNode;
class SharedExpr;
class CowExpr;
class ExpressionBuilder;
class MemoryManager;

// Expression node categories
enum class ExprType : uint8_t
{
    Number,
    Variable,
    Constant,
    Unary,
    Binary,
    Function
};

// Operation types for unary and binary nodes
enum class OpType : uint8_t
{
    None,
    // Unary operations
    Negate,
    Sqrt,
    Abs,
    Sin,
    Cos,
    Tan,
    Asin,
    Acos,
    Atan,
    Sinh,
    Cosh,
    Tanh,
    Ln,
    Log10,
    Exp,
    Factorial,
    // Binary operations
    Add,
    Sub,
    Mul,
    Div,
    Pow,
    Mod
};

// Named mathematical constants
enum class ConstantKind : uint8_t
{
    Pi,
    E,
    I,
    EulerGamma,
    GoldenRatio,
    Catalan,
    PositiveInfinity,
    NegativeInfinity,
    Undefined
};

inline bool is_unary_op(OpType op)
{
    return op >= OpType::Negate && op <= OpType::Factorial;
}

inline bool is_binary_op(OpType op)
{
    return op >= OpType::Add && op <= OpType::Mod;
}

inline bool is_trigonometric(OpType op)
{
    return op == OpType::Sin || op == OpType::Cos || op == OpType::Tan;
}

// Operator symbol for binary operations, function name for unary ones
inline const char* op_symbol(OpType op)
{
    switch(op) {
        case OpType::Negate: return "-";
        case OpType::Sqrt: return "sqrt";
        case OpType::Abs: return "abs";
        case OpType::Sin: return "sin";
        case OpType::Cos: return "cos";
        case OpType::Tan: return "tan";
        case OpType::Asin: return "asin";
        case OpType::Acos: return "acos";
        case OpType::Atan: return "atan";
        case OpType::Sinh: return "sinh";
        case OpType::Cosh: return "cosh";
        case OpType::Tanh: return "tanh";
        case OpType::Ln: return "ln";
        case OpType::Log10: return "log10";
        case OpType::Exp: return "exp";
        case OpType::Factorial: return "!";
        case OpType::Add: return "+";
        case OpType::Sub: return "-";
        case OpType::Mul: return "*";
        case OpType::Div: return "/";
        case OpType::Pow: return "^";
        case OpType::Mod: return "mod";
        case OpType::None: break;
    }
    return "?";
}

/// Binding strength of binary operators; higher binds tighter.
inline int precedence(OpType op)
{
    switch(op) {
        case OpType::Add:
        case OpType::Sub: return 1;
        case OpType::Mul:
        case OpType::Div:
        case OpType::Mod: return 2;
        case OpType::Negate: return 3;
        case OpType::Pow: return 4;
        default: return 5;
    }
}

inline bool is_right_associative(OpType op) { return op == OpType::Pow; }

/// Whether `(a op b) op c == a op (b op c)`, so the right operand needs no parentheses.
inline bool is_associative(OpType op) { return op == OpType::Add || op == OpType::Mul; }

/// The unary operator a named one-argument function stands for, if any.
inline std::optional<OpType> unary_op_from_name(const std::string& name)
{
    if(name == "sqrt") return OpType::Sqrt;
    if(name == "abs") return OpType::Abs;
    if(name == "sin") return OpType::Sin;
    if(name == "cos") return OpType::Cos;
    if(name == "tan") return OpType::Tan;
    if(name == "asin" || name == "arcsin") return OpType::Asin;
    if(name == "acos" || name == "arccos") return OpType::Acos;
    if(name == "atan" || name == "arctan") return OpType::Atan;
    if(name == "sinh") return OpType::Sinh;
    if(name == "cosh") return OpType::Cosh;
    if(name == "tanh") return OpType::Tanh;
    if(name == "ln" || name == "log") return OpType::Ln;
    if(name == "log10") return OpType::Log10;
    if(name == "exp") return OpType::Exp;
    if(name == "factorial") return OpType::Factorial;
    return std::nullopt;
}

inline const char* constant_symbol(ConstantKind c)
{
    switch(c) {
        case ConstantKind::Pi: return "π";
        case ConstantKind::E: return "e";
        case ConstantKind::I: return "i";
        case ConstantKind::EulerGamma: return "γ";
        case ConstantKind::GoldenRatio: return "φ";
        case ConstantKind::Catalan: return "G";
        case ConstantKind::PositiveInfinity: return "∞";
        case ConstantKind::NegativeInfinity: return "-∞";
        case ConstantKind::Undefined: return "undefined";
    }
    return "?";
}

inline std::optional<ConstantKind> constant_from_name(const std::string& name)
{
    if(name == "pi" || name == "π") return ConstantKind::Pi;
    if(name == "e") return ConstantKind::E;
    if(name == "i") return ConstantKind::I;
    if(name == "gamma" || name == "euler_gamma" || name == "γ") return ConstantKind::EulerGamma;
    if(name == "phi" || name == "golden_ratio" || name == "φ") return ConstantKind::GoldenRatio;
    if(name == "catalan" || name == "G") return ConstantKind::Catalan;
    if(name == "inf" || name == "infinity" || name == "∞") return ConstantKind::PositiveInfinity;
    if(name == "-inf" || name == "-infinity" || name == "-∞") return ConstantKind::NegativeInfinity;
    if(name == "undefined" || name == "nan") return ConstantKind::Undefined;
    return std::nullopt;
}

/// Floating approximation; NaN for the imaginary unit and for undefined.
inline double constant_value(ConstantKind c)
{
    switch(c) {
        case ConstantKind::Pi: return 3.141592653589793;
        case ConstantKind::E: return 2.718281828459045;
        case ConstantKind::EulerGamma: return 0.5772156649015329;
        case ConstantKind::GoldenRatio: return 1.618033988749895;
        case ConstantKind::Catalan: return 0.915965594177219;
        case ConstantKind::PositiveInfinity: return HUGE_VAL;
        case ConstantKind::NegativeInfinity: return -HUGE_VAL;
        case ConstantKind::I:
        case ConstantKind::Undefined: break;
    }
    return std::nan("");
}

/// Constants known to be finite and non-zero.
inline bool is_nonzero_real_constant(ConstantKind c)
{
    return c == ConstantKind::Pi || c == ConstantKind::E || c == ConstantKind::EulerGamma
        || c == ConstantKind::GoldenRatio || c == ConstantKind::Catalan;
}

} // namespace symcore
