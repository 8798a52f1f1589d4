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
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Boost includes
#include <boost/container_hash/hash.hpp>

// symcore includes
#include <symcore/expr/expr_common.hpp>
#include <symcore/numeric/number.hpp>

namespace symcore {

/**
 * @brief Reference-counted handle to an immutable expression node.
 *
 * Copying a handle (or calling clone_shared) is O(1) and makes both handles
 * holders of the same node. Equality is structural and short-circuits on
 * pointer identity, then on the cached structural hash.
 *
 * Usage:
 *   SharedExpr x(ExprNode::variable("x"));
 *   SharedExpr alias = x.clone_shared();   // x.ref_count() == 2
 *   ExprNode& node = alias.make_mut();     // alias now owns a private copy
 */
class SharedExpr
{
  private:
    std::shared_ptr<ExprNode> node_;

    friend struct ExprNode;
    friend class MemoryManager;

  public:
    SharedExpr() = default;

    /// Takes ownership of a freshly built node; ref_count() == 1.
    explicit SharedExpr(ExprNode node);

    explicit SharedExpr(std::shared_ptr<ExprNode> node) : node_(std::move(node)) {}

    SharedExpr clone_shared() const { return *this; }

    long ref_count() const { return node_.use_count(); }

    bool is_unique() const { return node_.use_count() == 1; }

    explicit operator bool() const { return static_cast<bool>(node_); }

    const ExprNode& operator*() const { return *node_; }
    const ExprNode* operator->() const { return node_.get(); }
    const ExprNode* get() const { return node_.get(); }

    /// Exclusive mutable access; clones the node first if another holder shares it.
    ExprNode& make_mut();

    /// A detached copy of the node value (children stay shared).
    ExprNode into_owned() const;

    std::size_t hash() const;

    bool same_node(const SharedExpr& other) const { return node_ == other.node_; }

    bool fast_eq(const SharedExpr& other) const;
};

/**
 * @brief One node of the expression graph.
 *
 * A tagged record in the style of a closed variant: `type` selects which of
 * the payload fields are meaningful. Children are always held through
 * SharedExpr so subtrees can be shared between parents.
 */
struct ExprNode
{
    ExprType type = ExprType::Number;
    OpType op_type = OpType::None;
    ConstantKind constant = ConstantKind::Undefined;
    Number number;                        // Number literals
    std::string name;                     // Variable and Function names
    std::vector<SharedExpr> children;     // operands / arguments

  private:
    mutable std::size_t hash_ = 0;
    mutable bool hash_valid_ = false;

    // Combines the node's own fields with the cached hashes of its children.
    std::size_t compute_hash() const;

    // Post-order walk over the nodes whose hash is stale, children first.
    void refresh_hashes() const;

  public:
    ExprNode() = default;
    ExprNode(const ExprNode&) = default;
    ExprNode(ExprNode&&) = default;
    ExprNode& operator=(const ExprNode&) = default;
    ExprNode& operator=(ExprNode&&) = default;

    // Releases the subtree with an explicit work-stack so deep chains don't overflow the call stack.
    ~ExprNode();

    // Factory methods for the different node types
    static ExprNode number_literal(const Number& value)
    {
        ExprNode node;
        node.type = ExprType::Number;
        node.number = value;
        node.hash();
        return node;
    }

    static ExprNode variable(const std::string& name)
    {
        if(name.empty()) throw std::invalid_argument("variable name must not be empty");
        ExprNode node;
        node.type = ExprType::Variable;
        node.name = name;
        node.hash();
        return node;
    }

    static ExprNode named_constant(ConstantKind c)
    {
        ExprNode node;
        node.type = ExprType::Constant;
        node.constant = c;
        node.hash();
        return node;
    }

    static ExprNode unary_op(OpType op, SharedExpr operand)
    {
        if(!is_unary_op(op)) throw std::invalid_argument(std::string("not a unary operator: ") + op_symbol(op));
        if(!operand) throw std::invalid_argument("unary operand must not be empty");
        ExprNode node;
        node.type = ExprType::Unary;
        node.op_type = op;
        node.children.push_back(std::move(operand));
        node.hash();
        return node;
    }

    static ExprNode binary_op(OpType op, SharedExpr left, SharedExpr right)
    {
        if(!is_binary_op(op)) throw std::invalid_argument(std::string("not a binary operator: ") + op_symbol(op));
        if(!left || !right) throw std::invalid_argument("binary operands must not be empty");
        ExprNode node;
        node.type = ExprType::Binary;
        node.op_type = op;
        node.children.reserve(2);
        node.children.push_back(std::move(left));
        node.children.push_back(std::move(right));
        node.hash();
        return node;
    }

    static ExprNode function(const std::string& name, std::vector<SharedExpr> args)
    {
        if(name.empty()) throw std::invalid_argument("function name must not be empty");
        for(const auto& arg : args)
            if(!arg) throw std::invalid_argument("function arguments must not be empty");
        ExprNode node;
        node.type = ExprType::Function;
        node.name = name;
        node.children = std::move(args);
        node.hash();
        return node;
    }

    const SharedExpr& operand() const { return children[0]; }
    const SharedExpr& left() const { return children[0]; }
    const SharedExpr& right() const { return children[1]; }

    bool is_number() const { return type == ExprType::Number; }
    bool is_variable() const { return type == ExprType::Variable; }
    bool is_constant() const { return type == ExprType::Constant; }
    bool is_constant(ConstantKind c) const { return type == ExprType::Constant && constant == c; }
    bool is_unary(OpType op) const { return type == ExprType::Unary && op_type == op; }
    bool is_binary(OpType op) const { return type == ExprType::Binary && op_type == op; }
    bool is_function() const { return type == ExprType::Function; }

    /// Structural hash, cached; children contribute their own cached hashes.
    std::size_t hash() const
    {
        if(!hash_valid_) refresh_hashes();
        return hash_;
    }

    /// Called after in-place mutation; the hash is recomputed on next use.
    void invalidate_hash() { hash_valid_ = false; }
};

//=====================================================================================================================
// IMPLEMENTATION
//=====================================================================================================================

inline SharedExpr::SharedExpr(ExprNode node) : node_(std::make_shared<ExprNode>(std::move(node))) {}

inline ExprNode& SharedExpr::make_mut()
{
    if(!node_) throw std::runtime_error("make_mut called on an empty SharedExpr");
    if(node_.use_count() != 1) node_ = std::make_shared<ExprNode>(*node_);
    node_->invalidate_hash();
    return *node_;
}

inline ExprNode SharedExpr::into_owned() const
{
    if(!node_) throw std::runtime_error("into_owned called on an empty SharedExpr");
    return *node_;
}

inline std::size_t SharedExpr::hash() const
{
    return node_ ? node_->hash() : 0;
}

inline std::size_t ExprNode::compute_hash() const
{
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<int>(type));
    boost::hash_combine(seed, static_cast<int>(op_type));
    switch(type) {
        case ExprType::Number: boost::hash_combine(seed, number.hash()); break;
        case ExprType::Constant: boost::hash_combine(seed, static_cast<int>(constant)); break;
        case ExprType::Variable:
        case ExprType::Function: boost::hash_combine(seed, name); break;
        default: break;
    }
    boost::hash_combine(seed, children.size());
    for(const auto& child : children) boost::hash_combine(seed, child.hash());
    return seed;
}

inline void ExprNode::refresh_hashes() const
{
    std::vector<std::pair<const ExprNode*, bool>> stack;
    stack.emplace_back(this, false);
    while(!stack.empty()) {
        const auto [node, expanded] = stack.back();
        stack.pop_back();
        if(node->hash_valid_) continue;
        if(expanded) {
            node->hash_ = node->compute_hash();
            node->hash_valid_ = true;
            continue;
        }
        stack.emplace_back(node, true);
        for(const auto& child : node->children)
            if(child.node_ && !child.node_->hash_valid_) stack.emplace_back(child.node_.get(), false);
    }
}

inline ExprNode::~ExprNode()
{
    if(children.empty()) return;
    std::vector<std::shared_ptr<ExprNode>> pending;
    pending.reserve(children.size());
    for(auto& child : children)
        if(child.node_) pending.push_back(std::move(child.node_));
    children.clear();
    while(!pending.empty()) {
        std::shared_ptr<ExprNode> node = std::move(pending.back());
        pending.pop_back();
        // Only the last holder detaches the grandchildren; shared subtrees stay intact.
        if(node.use_count() == 1) {
            for(auto& child : node->children)
                if(child.node_) pending.push_back(std::move(child.node_));
            node->children.clear();
        }
    }
}

/// Iterative structural comparison; never compares addresses except as a shortcut.
inline bool structurally_equal(const ExprNode& a, const ExprNode& b)
{
    std::vector<std::pair<const ExprNode*, const ExprNode*>> stack;
    stack.emplace_back(&a, &b);
    while(!stack.empty()) {
        const auto [x, y] = stack.back();
        stack.pop_back();
        if(x == y) continue;
        if(x->type != y->type || x->op_type != y->op_type || x->children.size() != y->children.size())
            return false;
        if(x->hash() != y->hash()) return false;
        switch(x->type) {
            case ExprType::Number:
                if(!identical(x->number, y->number)) return false;
                break;
            case ExprType::Constant:
                if(x->constant != y->constant) return false;
                break;
            case ExprType::Variable:
            case ExprType::Function:
                if(x->name != y->name) return false;
                break;
            default: break;
        }
        for(std::size_t i = 0; i < x->children.size(); ++i) {
            const ExprNode* cx = x->children[i].get();
            const ExprNode* cy = y->children[i].get();
            if(!cx || !cy) {
                if(cx != cy) return false;
                continue;
            }
            stack.emplace_back(cx, cy);
        }
    }
    return true;
}

inline bool SharedExpr::fast_eq(const SharedExpr& other) const
{
    if(node_ == other.node_) return true;
    if(!node_ || !other.node_) return false;
    if(node_->hash() != other.node_->hash()) return false;
    return structurally_equal(*node_, *other.node_);
}

inline bool operator==(const SharedExpr& a, const SharedExpr& b) { return a.fast_eq(b); }
inline bool operator!=(const SharedExpr& a, const SharedExpr& b) { return !a.fast_eq(b); }

} // namespace symcore

namespace std {

template<>
struct hash<symcore::SharedExpr>
{
    std::size_t operator()(const symcore::SharedExpr& e) const { return e.hash(); }
};

} // namespace std
