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
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// symcore includes
#include <symcore/expr/expr.hpp>

namespace symcore {

/**
 * @brief Post-order listing of every distinct node reachable from `root`.
 *
 * Iterative DFS with an explicit stack of (handle, expanded) pairs. A node
 * shared by several parents is listed once, after all of its children, and
 * the root is always the last element.
 */
inline std::vector<const SharedExpr*> topological_order(const SharedExpr& root)
{
    std::vector<const SharedExpr*> order;
    if(!root) return order;

    std::unordered_set<const ExprNode*> emitted;
    std::vector<std::pair<const SharedExpr*, bool>> stack;
    stack.reserve(64);
    stack.emplace_back(&root, false);

    while(!stack.empty()) {
        auto [handle, expanded] = stack.back();
        stack.pop_back();
        const ExprNode* node = handle->get();
        if(emitted.count(node)) continue;
        if(expanded) {
            emitted.insert(node);
            order.push_back(handle);
            continue;
        }
        stack.emplace_back(handle, true);
        const auto& children = node->children;
        for(auto it = children.rbegin(); it != children.rend(); ++it)
            if(!emitted.count(it->get())) stack.emplace_back(&*it, false);
    }
    return order;
}

/**
 * @brief Rebuilds an expression bottom-up.
 *
 * `fn(original, children, changed)` is called once per distinct node, after
 * all of its children have been rewritten; `children` holds the rewritten
 * children and `changed` tells whether any of them differs from the original
 * handle. Shared subtrees are rewritten once and stay shared in the result.
 */
template<typename Fn>
SharedExpr rewrite_bottom_up(const SharedExpr& root, Fn&& fn)
{
    if(!root) return root;
    std::unordered_map<const ExprNode*, SharedExpr> rewritten;
    for(const SharedExpr* handle : topological_order(root)) {
        const ExprNode& node = **handle;
        std::vector<SharedExpr> children;
        children.reserve(node.children.size());
        bool changed = false;
        for(const auto& child : node.children) {
            const SharedExpr& replacement = rewritten.at(child.get());
            changed = changed || !replacement.same_node(child);
            children.push_back(replacement);
        }
        rewritten.emplace(handle->get(), fn(*handle, std::move(children), changed));
    }
    return rewritten.at(root.get());
}

} // namespace symcore
