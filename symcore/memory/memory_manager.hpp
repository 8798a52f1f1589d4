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
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

// symcore includes
#include <symcore/expr/expr.hpp>

namespace symcore {

/// Pool and cleanup settings of a MemoryManager.
struct MemoryConfig
{
    bool enable_sharing = true;                                   // look up structurally equal nodes before allocating
    std::size_t max_pool_size = 5000;                             // pooled entries kept for lookup
    std::size_t max_interned = 10000;                             // builder's interned literals and variables
    std::size_t cleanup_threshold_bytes = 100 * 1024 * 1024;      // estimated footprint that forces a cleanup
    std::chrono::steady_clock::duration cleanup_interval = std::chrono::seconds(60);
};

/// Snapshot of pool bookkeeping.
struct MemoryStats
{
    std::size_t active_expressions = 0;      // live pooled nodes
    std::size_t shared_expressions = 0;      // live pooled nodes with more than one holder
    std::size_t cache_hits = 0;
    std::size_t cache_misses = 0;
    std::size_t total_created = 0;           // construction requests, pooled or interned
    std::size_t estimated_memory_usage = 0;  // bytes, heuristic
    std::chrono::steady_clock::time_point last_updated;
};

/// Heuristic heap footprint of one node (payload, child handles, control block).
inline std::size_t estimated_node_size(const ExprNode& node)
{
    constexpr std::size_t control_block = 2 * sizeof(void*) + 2 * sizeof(long);
    return sizeof(ExprNode) + control_block + node.name.capacity()
        + node.children.capacity() * sizeof(SharedExpr) + node.number.estimated_size() - sizeof(Number);
}

/**
 * @brief Hash-consing pool with hit/miss accounting.
 *
 * Entries are bucketed by structural hash and held through weak references:
 * the pool never keeps a node alive. An entry becomes dead once the last
 * external holder drops its handle, and cleanup() removes dead entries.
 *
 * Not internally synchronized; use one manager per thread or lock externally.
 *
 * Usage:
 *   MemoryManager memory;
 *   auto a = memory.create_shared(ExprNode::variable("x"));
 *   auto b = memory.create_shared(ExprNode::variable("x"));   // cache hit, a.same_node(b)
 *   memory.get_stats().cache_hits;                            // 1
 */
class MemoryManager
{
  private:
    MemoryConfig config_;
    std::unordered_map<std::size_t, std::vector<std::weak_ptr<ExprNode>>> pool_;
    std::size_t pool_entries_ = 0;
    std::size_t cache_hits_ = 0;
    std::size_t cache_misses_ = 0;
    std::size_t total_created_ = 0;
    std::chrono::steady_clock::time_point last_cleanup_ = std::chrono::steady_clock::now();

    bool should_cleanup(const MemoryStats& stats) const
    {
        const auto elapsed = std::chrono::steady_clock::now() - last_cleanup_;
        return elapsed >= config_.cleanup_interval || stats.estimated_memory_usage > config_.cleanup_threshold_bytes;
    }

    MemoryStats collect() const
    {
        MemoryStats stats;
        stats.cache_hits = cache_hits_;
        stats.cache_misses = cache_misses_;
        stats.total_created = total_created_;
        for(const auto& bucket : pool_) {
            for(const auto& weak : bucket.second) {
                const long holders = weak.use_count();
                if(holders == 0) continue;
                ++stats.active_expressions;
                if(holders > 1) ++stats.shared_expressions;
                if(auto node = weak.lock()) stats.estimated_memory_usage += estimated_node_size(*node);
            }
        }
        stats.estimated_memory_usage += pool_entries_ * sizeof(std::weak_ptr<ExprNode>);
        stats.last_updated = std::chrono::steady_clock::now();
        return stats;
    }

  public:
    MemoryManager() = default;

    explicit MemoryManager(MemoryConfig config) : config_(std::move(config)) {}

    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    const MemoryConfig& config() const { return config_; }

    /// Returns the pooled node structurally equal to `node`, or pools a new one.
    SharedExpr create_shared(ExprNode node)
    {
        ++total_created_;
        if(!config_.enable_sharing) {
            ++cache_misses_;
            return SharedExpr(std::move(node));
        }

        const std::size_t key = node.hash();
        auto& bucket = pool_[key];
        for(const auto& weak : bucket) {
            std::shared_ptr<ExprNode> live = weak.lock();
            if(live && live->hash() == key && structurally_equal(*live, node)) {
                ++cache_hits_;
                return SharedExpr(std::move(live));
            }
        }

        ++cache_misses_;
        SharedExpr created(std::move(node));
        if(pool_entries_ < config_.max_pool_size) {
            bucket.push_back(created.node_);
            ++pool_entries_;
        }
        return created;
    }

    /// Accounts a construction served from a cache outside the pool (e.g. interned literals).
    void record_hit()
    {
        ++total_created_;
        ++cache_hits_;
    }

    /// Current statistics; runs cleanup() first when the interval elapsed or the footprint is over threshold.
    MemoryStats get_stats()
    {
        MemoryStats stats = collect();
        if(should_cleanup(stats)) {
            cleanup();
            stats = collect();
        }
        return stats;
    }

    /**
     * @brief Drops entries no external handle refers to any more.
     *
     * Entries whose node was mutated in place (and therefore no longer
     * hashes to its bucket) are dropped as well. Returns the number removed.
     */
    std::size_t cleanup()
    {
        std::size_t removed = 0;
        for(auto it = pool_.begin(); it != pool_.end();) {
            auto& bucket = it->second;
            const std::size_t key = it->first;
            std::vector<std::weak_ptr<ExprNode>> kept;
            kept.reserve(bucket.size());
            for(auto& weak : bucket) {
                auto live = weak.lock();
                if(live && live->hash() == key) kept.push_back(std::move(weak));
                else ++removed;
            }
            if(kept.empty()) it = pool_.erase(it);
            else {
                bucket = std::move(kept);
                ++it;
            }
        }
        pool_entries_ -= removed;
        last_cleanup_ = std::chrono::steady_clock::now();
        return removed;
    }

    /// Entries currently tracked, dead ones included until the next cleanup().
    std::size_t pool_size() const { return pool_entries_; }

    void reset_counters()
    {
        cache_hits_ = 0;
        cache_misses_ = 0;
        total_created_ = 0;
    }
};

/**
 * @brief Periodic observer of a MemoryManager.
 *
 * check() returns fresh statistics once per interval (and nothing in between),
 * so callers can poll it from their own loop without flooding reports.
 */
class MemoryMonitor
{
  private:
    std::shared_ptr<MemoryManager> manager_;
    std::chrono::steady_clock::duration interval_;
    std::chrono::steady_clock::time_point last_check_;
    bool enabled_ = true;
    bool checked_once_ = false;

  public:
    explicit MemoryMonitor(std::shared_ptr<MemoryManager> manager,
                           std::chrono::steady_clock::duration interval = std::chrono::seconds(30))
        : manager_(std::move(manager)), interval_(interval), last_check_(std::chrono::steady_clock::now())
    {
        if(!manager_) throw std::invalid_argument("MemoryMonitor requires a MemoryManager");
    }

    std::optional<MemoryStats> check()
    {
        if(!enabled_) return std::nullopt;
        const auto now = std::chrono::steady_clock::now();
        if(checked_once_ && now - last_check_ < interval_) return std::nullopt;
        checked_once_ = true;
        last_check_ = now;
        return manager_->get_stats();
    }

    MemoryStats stats() { return manager_->get_stats(); }

    std::size_t cleanup() { return manager_->cleanup(); }

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

    void set_interval(std::chrono::steady_clock::duration interval) { interval_ = interval; }
    std::chrono::steady_clock::duration interval() const { return interval_; }
};

} // namespace symcore
