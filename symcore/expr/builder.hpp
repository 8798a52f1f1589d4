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
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// symcore includes
#include <symcore/expr/expr.hpp>
#include <symcore/memory/memory_manager.hpp>

namespace symcore {

inline bool is_exact_zero(const SharedExpr& e)
{
    return e->is_number() && e->number.is_exact() && e->number.is_zero();
}

inline bool is_exact_one(const SharedExpr& e)
{
    return e->is_number() && e->number.is_exact() && e->number.is_one();
}

/**
 * @brief Construction façade over a MemoryManager pool.
 *
 * Small integers, common variables and the usual constants are interned, so
 * two requests for `x` hand back the same node. Every constructor applies a
 * few unconditional identities while assembling the tree (`x+0`, `1*x`,
 * `x*0`, `x-x`, ...); everything else is left to the simplifier.
 *
 * One builder per session or thread; it is not internally synchronized.
 *
 * Usage:
 *   ExpressionBuilder b;
 *   auto x = b.variable("x");
 *   auto e = b.add(b.multiply(b.integer(2), x), b.integer(0));   // 2 * x
 */
class ExpressionBuilder
{
  private:
    std::shared_ptr<MemoryManager> memory_;
    std::unordered_map<std::string, SharedExpr> interned_;

    SharedExpr make(ExprNode node) { return memory_->create_shared(std::move(node)); }

    SharedExpr intern(const std::string& key, ExprNode node)
    {
        auto it = interned_.find(key);
        if(it != interned_.end()) {
            memory_->record_hit();
            return it->second;
        }
        SharedExpr created = make(std::move(node));
        if(interned_.size() < memory_->config().max_interned) interned_.emplace(key, created);
        return created;
    }

    static bool is_internable_integer(const Number& n)
    {
        if(n.kind() != NumberKind::Integer || !n.integer_value().fits_slong_p()) return false;
        const long v = n.integer_value().get_si();
        return v == 0 || v == 1 || v == -1 || v == 2 || v == -2 || v == 10;
    }

    void preload()
    {
        for(long v : {0L, 1L, -1L, 2L, -2L, 10L}) integer(v);
        for(const char* name : {"x", "y", "z", "t", "n"}) variable(name);
        for(ConstantKind c : {ConstantKind::Pi, ConstantKind::E, ConstantKind::I}) constant(c);
        memory_->reset_counters();
    }

  public:
    explicit ExpressionBuilder(MemoryConfig config = {}) : memory_(std::make_shared<MemoryManager>(std::move(config)))
    {
        preload();
    }

    explicit ExpressionBuilder(std::shared_ptr<MemoryManager> memory) : memory_(std::move(memory))
    {
        if(!memory_) throw std::invalid_argument("ExpressionBuilder requires a MemoryManager");
        preload();
    }

    ExpressionBuilder(const ExpressionBuilder&) = delete;
    ExpressionBuilder& operator=(const ExpressionBuilder&) = delete;

    //-----------------------------------------------------------------------------------------------------------------
    // Leaves
    //-----------------------------------------------------------------------------------------------------------------

    SharedExpr number(const Number& value)
    {
        if(is_internable_integer(value))
            return intern("n:" + value.to_string(), ExprNode::number_literal(value));
        return make(ExprNode::number_literal(value));
    }

    SharedExpr integer(long value) { return number(Number::integer(value)); }

    SharedExpr rational(long num, long den) { return number(Number::rational(num, den)); }

    SharedExpr variable(const std::string& name)
    {
        return intern("v:" + name, ExprNode::variable(name));
    }

    SharedExpr constant(ConstantKind c)
    {
        return intern(std::string("c:") + constant_symbol(c), ExprNode::named_constant(c));
    }

    //-----------------------------------------------------------------------------------------------------------------
    // Arithmetic with construction-time identities
    //-----------------------------------------------------------------------------------------------------------------

    SharedExpr add(const SharedExpr& l, const SharedExpr& r)
    {
        if(is_exact_zero(r)) { memory_->record_hit(); return l; }
        if(is_exact_zero(l)) { memory_->record_hit(); return r; }
        return make(ExprNode::binary_op(OpType::Add, l, r));
    }

    SharedExpr subtract(const SharedExpr& l, const SharedExpr& r)
    {
        if(is_exact_zero(r)) { memory_->record_hit(); return l; }
        if(l == r) return integer(0);
        return make(ExprNode::binary_op(OpType::Sub, l, r));
    }

    SharedExpr multiply(const SharedExpr& l, const SharedExpr& r)
    {
        if(is_exact_zero(l) || is_exact_zero(r)) return integer(0);
        if(is_exact_one(r)) { memory_->record_hit(); return l; }
        if(is_exact_one(l)) { memory_->record_hit(); return r; }
        return make(ExprNode::binary_op(OpType::Mul, l, r));
    }

    SharedExpr divide(const SharedExpr& l, const SharedExpr& r)
    {
        if(is_exact_one(r)) { memory_->record_hit(); return l; }
        return make(ExprNode::binary_op(OpType::Div, l, r));
    }

    SharedExpr power(const SharedExpr& base, const SharedExpr& exponent)
    {
        if(is_exact_one(exponent)) { memory_->record_hit(); return base; }
        if(is_exact_one(base)) return integer(1);
        return make(ExprNode::binary_op(OpType::Pow, base, exponent));
    }

    SharedExpr modulo(const SharedExpr& l, const SharedExpr& r)
    {
        return make(ExprNode::binary_op(OpType::Mod, l, r));
    }

    SharedExpr negate(const SharedExpr& x)
    {
        if(x->is_unary(OpType::Negate)) { memory_->record_hit(); return x->operand(); }
        if(x->is_number() && !x->number.is_symbolic()) return number(neg(x->number));
        return make(ExprNode::unary_op(OpType::Negate, x));
    }

    //-----------------------------------------------------------------------------------------------------------------
    // Generic constructors
    //-----------------------------------------------------------------------------------------------------------------

    SharedExpr unary(OpType op, const SharedExpr& x)
    {
        if(op == OpType::Negate) return negate(x);
        return make(ExprNode::unary_op(op, x));
    }

    SharedExpr binary(OpType op, const SharedExpr& l, const SharedExpr& r)
    {
        switch(op) {
            case OpType::Add: return add(l, r);
            case OpType::Sub: return subtract(l, r);
            case OpType::Mul: return multiply(l, r);
            case OpType::Div: return divide(l, r);
            case OpType::Pow: return power(l, r);
            case OpType::Mod: return modulo(l, r);
            default: break;
        }
        throw std::invalid_argument(std::string("not a binary operator: ") + op_symbol(op));
    }

    SharedExpr function(const std::string& name, std::vector<SharedExpr> args)
    {
        return make(ExprNode::function(name, std::move(args)));
    }

    SharedExpr sin(const SharedExpr& x) { return unary(OpType::Sin, x); }
    SharedExpr cos(const SharedExpr& x) { return unary(OpType::Cos, x); }
    SharedExpr tan(const SharedExpr& x) { return unary(OpType::Tan, x); }
    SharedExpr sqrt(const SharedExpr& x) { return unary(OpType::Sqrt, x); }
    SharedExpr abs(const SharedExpr& x) { return unary(OpType::Abs, x); }
    SharedExpr ln(const SharedExpr& x) { return unary(OpType::Ln, x); }
    SharedExpr exp(const SharedExpr& x) { return unary(OpType::Exp, x); }

    SharedExpr pi() { return constant(ConstantKind::Pi); }

    /// Same shape as `node` with new children, through the identities above.
    SharedExpr rebuild(const ExprNode& node, std::vector<SharedExpr> children)
    {
        switch(node.type) {
            case ExprType::Unary: return unary(node.op_type, children.at(0));
            case ExprType::Binary: return binary(node.op_type, children.at(0), children.at(1));
            case ExprType::Function: return function(node.name, std::move(children));
            case ExprType::Number: return number(node.number);
            case ExprType::Variable: return variable(node.name);
            case ExprType::Constant: return constant(node.constant);
        }
        throw std::invalid_argument("unknown expression type");
    }

    //-----------------------------------------------------------------------------------------------------------------
    // Pool management
    //-----------------------------------------------------------------------------------------------------------------

    /// Drops interned entries only the builder still holds, then dead pool entries. Returns the number removed.
    std::size_t cleanup()
    {
        std::size_t removed = 0;
        for(auto it = interned_.begin(); it != interned_.end();) {
            if(it->second.ref_count() <= 1) {
                it = interned_.erase(it);
                ++removed;
            }
            else ++it;
        }
        return removed + memory_->cleanup();
    }

    MemoryStats memory_stats() { return memory_->get_stats(); }

    MemoryManager& memory() { return *memory_; }

    std::shared_ptr<MemoryManager> memory_handle() const { return memory_; }

    std::size_t interned_count() const { return interned_.size(); }
};

} // namespace symcore
