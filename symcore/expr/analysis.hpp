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
#include <set>
#include <string>
#include <unordered_map>

// symcore includes
#include <symcore/expr/expr.hpp>
#include <symcore/expr/traversal.hpp>

namespace symcore {

/// Size measure used to compare candidate forms: leaves count 1, operators add their own weight.
inline std::size_t complexity(const SharedExpr& expr)
{
    std::unordered_map<const ExprNode*, std::size_t> cost;
    for(const SharedExpr* handle : topological_order(expr)) {
        const ExprNode& node = **handle;
        std::size_t total = 0;
        switch(node.type) {
            case ExprType::Number:
            case ExprType::Variable:
            case ExprType::Constant: total = 1; break;
            case ExprType::Unary: total = 1; break;
            case ExprType::Binary: total = node.op_type == OpType::Pow ? 2 : 1; break;
            case ExprType::Function: total = 2; break;
        }
        for(const auto& child : node.children) total += cost.at(child.get());
        cost.emplace(handle->get(), total);
    }
    return expr ? cost.at(expr.get()) : 0;
}

/// Names of all variables occurring in the expression, sorted.
inline std::set<std::string> variables(const SharedExpr& expr)
{
    std::set<std::string> names;
    for(const SharedExpr* handle : topological_order(expr))
        if((*handle)->is_variable()) names.insert((*handle)->name);
    return names;
}

/// True when no variable occurs in the expression.
inline bool is_constant_expr(const SharedExpr& expr)
{
    for(const SharedExpr* handle : topological_order(expr))
        if((*handle)->is_variable()) return false;
    return true;
}

/// Replaces every occurrence of the variable `name`; untouched subtrees are shared with the input.
inline SharedExpr substitute(const SharedExpr& expr, const std::string& name, const SharedExpr& replacement)
{
    return rewrite_bottom_up(expr, [&](const SharedExpr& original, std::vector<SharedExpr> children, bool changed) {
        const ExprNode& node = *original;
        if(node.is_variable() && node.name == name) return replacement;
        if(!changed) return original;
        ExprNode copy = node;
        copy.children = std::move(children);
        copy.invalidate_hash();
        copy.hash();
        return SharedExpr(std::move(copy));
    });
}

} // namespace symcore
