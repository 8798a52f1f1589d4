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
#include <ostream>
#include <sstream>
#include <string>

// symcore includes
#include <symcore/expr/expr.hpp>

namespace symcore {
namespace detail {

// Number literals whose text would read ambiguously next to an operator
inline bool number_needs_parens(const Number& n, OpType parent, bool is_right)
{
    const std::string text = n.to_string();
    const bool signed_text = !text.empty() && text[0] == '-';
    const bool compound = n.is_complex() && !n.real_part().is_zero();
    const bool fraction = text.find('/') != std::string::npos;
    if(parent == OpType::Negate) return signed_text || compound;
    if(compound) return true;
    if(signed_text && (is_right || precedence(parent) >= precedence(OpType::Mul))) return true;
    if(fraction && (parent == OpType::Pow || (parent == OpType::Div && is_right))) return true;
    return false;
}

inline bool operand_needs_parens(const ExprNode& child, OpType parent, bool is_right)
{
    if(child.is_number()) return number_needs_parens(child.number, parent, is_right);
    if(child.type == ExprType::Unary && child.op_type == OpType::Negate)
        return parent == OpType::Pow || (is_right && parent != OpType::Negate);
    if(child.type != ExprType::Binary) return false;
    if(parent == OpType::Negate || parent == OpType::Factorial) return true;
    const int outer = precedence(parent);
    const int inner = precedence(child.op_type);
    if(inner != outer) return inner < outer;
    if(is_right_associative(parent)) return !is_right;
    if(!is_right) return false;
    return !(is_associative(parent) && child.op_type == parent);
}

inline void write_expr(std::ostream& out, const ExprNode& node);

inline void write_operand(std::ostream& out, const SharedExpr& child, OpType parent, bool is_right)
{
    if(operand_needs_parens(*child, parent, is_right)) {
        out << '(';
        write_expr(out, *child);
        out << ')';
    }
    else write_expr(out, *child);
}

inline void write_expr(std::ostream& out, const ExprNode& node)
{
    switch(node.type) {
        case ExprType::Number: out << node.number.to_string(); break;
        case ExprType::Variable: out << node.name; break;
        case ExprType::Constant: out << constant_symbol(node.constant); break;
        case ExprType::Unary:
            if(node.op_type == OpType::Negate) {
                out << '-';
                write_operand(out, node.operand(), OpType::Negate, false);
            }
            else if(node.op_type == OpType::Factorial) {
                write_operand(out, node.operand(), OpType::Factorial, false);
                out << '!';
            }
            else {
                out << op_symbol(node.op_type) << '(';
                write_expr(out, *node.operand());
                out << ')';
            }
            break;
        case ExprType::Binary:
            write_operand(out, node.left(), node.op_type, false);
            if(node.op_type == OpType::Pow) out << '^';
            else out << ' ' << op_symbol(node.op_type) << ' ';
            write_operand(out, node.right(), node.op_type, true);
            break;
        case ExprType::Function:
            out << node.name << '(';
            for(std::size_t i = 0; i < node.children.size(); ++i) {
                if(i > 0) out << ", ";
                write_expr(out, *node.children[i]);
            }
            out << ')';
            break;
    }
}

} // namespace detail

/// Canonical textual form, e.g. `x^2 + 1`, `-sin(x)`, `sqrt(2) / 2`.
inline std::string to_string(const SharedExpr& expr)
{
    if(!expr) return "<empty>";
    std::ostringstream out;
    detail::write_expr(out, *expr);
    return out.str();
}

inline std::ostream& operator<<(std::ostream& out, const SharedExpr& expr)
{
    return out << to_string(expr);
}

} // namespace symcore
