/**
 * @file binding_store.hpp
 * @brief Authoritative record of workload → pool bindings.
 * @author Dimitris Kafetzis
 *
 * Every pool owns a shard holding its capacity, its used counters and its
 * active bindings. A shard's mutex is the pool's exclusive section: capacity
 * checks and counter updates for that pool happen entirely under it, so the
 * sum of bound demand on a pool never exceeds its capacity.
 *
 * Lock order: pools_mutex_ (shared or exclusive) → shard mutex → index_mutex_.
 * Listeners are invoked after all locks are released.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cluster_gate {

struct Binding {
    WorkloadId workload_id;
    PoolId pool_id;
    Timestamp bound_at;
    uint64_t sequence = 0;     ///< Store-wide commit order
    ResourceVector demand;
};

struct BindingEvent {
    enum class Kind : uint8_t { Bound, Unbound, Evicted };

    Kind kind;
    Binding binding;
};

[[nodiscard]] constexpr std::string_view to_string(BindingEvent::Kind kind) noexcept {
    switch (kind) {
        case BindingEvent::Kind::Bound:   return "bound";
        case BindingEvent::Kind::Unbound: return "unbound";
        case BindingEvent::Kind::Evicted: return "evicted";
    }
    return "unknown";
}

class BindingStore {
public:
    using Clock = std::function<Timestamp()>;
    using Listener = std::function<void(const BindingEvent&)>;
    using SubscriptionId = uint64_t;

    explicit BindingStore(Clock clock = {});

    BindingStore(const BindingStore&) = delete;
    BindingStore& operator=(const BindingStore&) = delete;

    // ── Pools ─────────────────────────────────

    /// AlreadyExists if the pool is registered.
    Result<void> register_pool(const PoolId& pool, ResourceVector capacity);

    /// NotFound for an unknown pool; InvalidArgument while bindings remain.
    Result<void> remove_pool(const PoolId& pool);

    [[nodiscard]] bool has_pool(const PoolId& pool) const;
    [[nodiscard]] std::vector<PoolId> pools() const;

    // ── Bindings ──────────────────────────────

    /**
     * @brief Record that @p workload occupies @p demand on @p pool.
     *
     * AlreadyBound if the workload holds an active binding anywhere,
     * InsufficientCapacity if the pool cannot hold the demand, NotFound for
     * an unknown pool.
     */
    Result<Binding> bind(const WorkloadId& workload, const PoolId& pool, ResourceVector demand);

    /// Remove the workload's binding if one exists. Idempotent.
    std::optional<Binding> unbind(const WorkloadId& workload);

    /**
     * @brief Evict @p victims from @p pool and bind @p workload there, as one
     *        step under the pool's lock.
     *
     * Nothing changes unless every victim is bound to @p pool, the workload is
     * unbound, and the demand fits once the victims are gone.
     * Returns the evicted bindings followed by the new one.
     */
    Result<std::vector<Binding>> preempt(const PoolId& pool,
                                         const std::vector<WorkloadId>& victims,
                                         const WorkloadId& workload,
                                         ResourceVector demand);

    // ── Queries ───────────────────────────────

    /// Active bindings on @p pool, ordered by commit sequence.
    [[nodiscard]] std::vector<Binding> list_bindings(const PoolId& pool) const;
    /// Every active binding, ordered by commit sequence.
    [[nodiscard]] std::vector<Binding> all_bindings() const;
    [[nodiscard]] std::optional<Binding> binding_for(const WorkloadId& workload) const;
    [[nodiscard]] std::optional<ResourceVector> used(const PoolId& pool) const;
    [[nodiscard]] std::optional<ResourceVector> capacity(const PoolId& pool) const;
    [[nodiscard]] size_t binding_count() const;

    // ── Events ────────────────────────────────

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

private:
    struct Shard {
        std::mutex mutex;
        ResourceVector capacity;
        ResourceVector used;
        std::map<WorkloadId, Binding> bindings;
    };

    Shard* find_shard(const PoolId& pool) const;   // caller holds pools_mutex_
    Binding commit_locked(Shard& shard, const WorkloadId& workload,
                          const PoolId& pool, ResourceVector demand);
    void notify(const std::vector<BindingEvent>& events);

    Clock clock_;
    std::atomic<uint64_t> next_sequence_{1};

    mutable std::shared_mutex pools_mutex_;
    std::unordered_map<PoolId, std::unique_ptr<Shard>> shards_;

    mutable std::mutex index_mutex_;
    std::unordered_map<WorkloadId, PoolId> index_;

    std::mutex listeners_mutex_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId next_subscription_ = 1;
};

}  // namespace cluster_gate
