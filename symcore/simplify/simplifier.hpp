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
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// symcore includes
#include <symcore/common/error.hpp>
#include <symcore/expr/builder.hpp>
#include <symcore/expr/traversal.hpp>
#include <symcore/simplify/algebraic_rules.hpp>
#include <symcore/simplify/radical_rules.hpp>
#include <symcore/simplify/rule_common.hpp>
#include <symcore/simplify/trig_rules.hpp>

namespace symcore {
namespace simplify {

/// Raised when the pass budget runs out before a fixed point; carries the last form reached.
class RewriteTimeout : public ComputeError
{
  private:
    SharedExpr last_form_;
    std::size_t passes_;

  public:
    RewriteTimeout(SharedExpr last_form, std::size_t passes)
        : ComputeError(ComputeError::timeout(passes)), last_form_(std::move(last_form)), passes_(passes)
    {}

    const SharedExpr& last_form() const { return last_form_; }
    std::size_t passes() const { return passes_; }
};

/// Bookkeeping of the most recent simplify() call.
struct SimplifyStats
{
    std::size_t passes = 0;       // full bottom-up passes run
    std::size_t rewrites = 0;     // rule applications that changed a node
    std::size_t cache_hits = 0;   // 1 when the result came from the cache
};

/**
 * @brief Fixed-point term rewriter over shared expressions.
 *
 * A pass walks the expression bottom-up; at every node the rule families are
 * tried in priority order and the first one that changes the node wins, after
 * which the families are tried again on the new node (up to
 * `max_local_rewrites` times). Passes repeat until one leaves the expression
 * unchanged. Rules only rewrite when the identity holds unconditionally or the
 * fact it needs is a literal, so the result is equivalent to the input, and
 * simplifying a result again returns it unchanged.
 *
 * Family order: algebraic, induction, special_angles, pythagorean,
 * periodicity, radicals.
 *
 * Usage:
 *   ExpressionBuilder b;
 *   Simplifier s(b);
 *   auto x = b.variable("x");
 *   auto e = b.add(b.power(b.sin(x), b.integer(2)), b.power(b.cos(x), b.integer(2)));
 *   s.simplify(e);   // 1
 */
class Simplifier
{
  private:
    struct CacheEntry
    {
        SharedExpr input;
        SharedExpr output;
        std::size_t last_used = 0;
    };

    ExpressionBuilder& builder_;
    SimplifierConfig config_;
    std::vector<RuleFamily> families_;
    std::unordered_map<std::size_t, std::vector<CacheEntry>> cache_;
    std::size_t cache_entries_ = 0;
    std::size_t use_tick_ = 0;
    SimplifyStats stats_;

    const CacheEntry* cache_lookup(const SharedExpr& expr)
    {
        auto it = cache_.find(expr.hash());
        if(it == cache_.end()) return nullptr;
        for(auto& entry : it->second) {
            if(entry.input.fast_eq(expr)) {
                entry.last_used = ++use_tick_;
                return &entry;
            }
        }
        return nullptr;
    }

    void cache_store(const SharedExpr& input, const SharedExpr& output)
    {
        if(config_.cache_capacity == 0 || cache_lookup(input)) return;
        cache_[input.hash()].push_back(CacheEntry{input, output, ++use_tick_});
        ++cache_entries_;
        while(cache_entries_ > config_.cache_capacity) evict_least_recently_used();
    }

    void evict_least_recently_used()
    {
        auto lru_bucket = cache_.end();
        std::size_t lru_index = 0;
        for(auto it = cache_.begin(); it != cache_.end(); ++it) {
            for(std::size_t i = 0; i < it->second.size(); ++i) {
                if(lru_bucket == cache_.end() || it->second[i].last_used < lru_bucket->second[lru_index].last_used) {
                    lru_bucket = it;
                    lru_index = i;
                }
            }
        }
        if(lru_bucket == cache_.end()) return;
        auto& bucket = lru_bucket->second;
        bucket.erase(bucket.begin() + static_cast<std::ptrdiff_t>(lru_index));
        if(bucket.empty()) cache_.erase(lru_bucket);
        --cache_entries_;
    }

    SharedExpr rewrite_node(SharedExpr current)
    {
        RuleContext ctx{builder_, config_};
        for(std::size_t step = 0; step < config_.max_local_rewrites; ++step) {
            bool fired = false;
            for(const auto& family : families_) {
                if(!family.enabled) continue;
                auto rewritten = family.apply(current, ctx);
                if(rewritten && !rewritten->fast_eq(current)) {
                    current = std::move(*rewritten);
                    ++stats_.rewrites;
                    fired = true;
                    break;
                }
            }
            if(!fired) break;
        }
        return current;
    }

    SharedExpr run_pass(const SharedExpr& expr)
    {
        return rewrite_bottom_up(expr, [&](const SharedExpr& original, std::vector<SharedExpr> children, bool changed) {
            SharedExpr node = changed ? builder_.rebuild(*original, std::move(children)) : original;
            return rewrite_node(std::move(node));
        });
    }

  public:
    explicit Simplifier(ExpressionBuilder& builder, SimplifierConfig config = {})
        : builder_(builder), config_(std::move(config))
    {
        const bool trig = config_.enable_trigonometric;
        families_.push_back({"algebraic", algebraic_rules, true});
        families_.push_back({"induction", induction_rules, trig});
        families_.push_back({"special_angles", special_angle_rules, trig});
        families_.push_back({"pythagorean", pythagorean_rules, trig});
        families_.push_back({"periodicity", periodicity_rules, trig});
        families_.push_back({"radicals", radical_rules, config_.enable_radicals});
    }

    Simplifier(const Simplifier&) = delete;
    Simplifier& operator=(const Simplifier&) = delete;

    /// Simplifies with the configured pass budget.
    SharedExpr simplify(const SharedExpr& expr) { return simplify(expr, config_.max_passes); }

    /// Simplifies with an explicit pass budget; throws RewriteTimeout if no fixed point is reached within it.
    SharedExpr simplify(const SharedExpr& expr, std::size_t max_passes)
    {
        stats_ = SimplifyStats{};
        if(!expr) return expr;

        if(const CacheEntry* hit = cache_lookup(expr)) {
            stats_.cache_hits = 1;
            return hit->output;
        }

        SharedExpr current = expr;
        while(stats_.passes < max_passes) {
            SharedExpr next = run_pass(current);
            ++stats_.passes;
            if(next.fast_eq(current)) {
                cache_store(expr, next);
                cache_store(next, next);
                return next;
            }
            current = std::move(next);
        }
        throw RewriteTimeout(current, max_passes);
    }

    /// Enables or disables a rule family by name; returns false for an unknown name.
    bool set_family_enabled(const std::string& name, bool enabled)
    {
        for(auto& family : families_) {
            if(family.name == name) {
                family.enabled = enabled;
                clear_cache();
                return true;
            }
        }
        return false;
    }

    const std::vector<RuleFamily>& families() const { return families_; }

    const SimplifierConfig& config() const { return config_; }

    const SimplifyStats& last_stats() const { return stats_; }

    std::size_t cache_size() const { return cache_entries_; }

    void clear_cache()
    {
        cache_.clear();
        cache_entries_ = 0;
    }
};

} // namespace simplify
} // namespace symcore
