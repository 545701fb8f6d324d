/**
 * @file binding_store.cpp
 * @brief BindingStore implementation.
 * @author Dimitris Kafetzis
 */

#include "store/binding_store.hpp"

#include <algorithm>
#include <set>

namespace cluster_gate {

namespace {

void sort_by_sequence(std::vector<Binding>& bindings) {
    std::sort(bindings.begin(), bindings.end(),
              [](const Binding& a, const Binding& b) { return a.sequence < b.sequence; });
}

}  // anonymous namespace

BindingStore::BindingStore(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

// ─────────────────────────────────────────────
// Pools
// ─────────────────────────────────────────────

Result<void> BindingStore::register_pool(const PoolId& pool, ResourceVector capacity) {
    if (pool.empty()) {
        return Error{ErrorCode::InvalidArgument, "pool id must not be empty"};
    }
    std::unique_lock lock(pools_mutex_);
    if (shards_.count(pool) > 0) {
        return Error{ErrorCode::AlreadyExists, "pool '" + pool + "' already registered"};
    }
    auto shard = std::make_unique<Shard>();
    shard->capacity = capacity;
    shards_.emplace(pool, std::move(shard));
    return {};
}

Result<void> BindingStore::remove_pool(const PoolId& pool) {
    std::unique_lock lock(pools_mutex_);
    auto it = shards_.find(pool);
    if (it == shards_.end()) {
        return Error{ErrorCode::NotFound, "pool '" + pool + "' not found"};
    }
    {
        std::lock_guard shard_lock(it->second->mutex);
        if (!it->second->bindings.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "pool '" + pool + "' still holds "
                         + std::to_string(it->second->bindings.size()) + " binding(s)"};
        }
    }
    shards_.erase(it);
    return {};
}

bool BindingStore::has_pool(const PoolId& pool) const {
    std::shared_lock lock(pools_mutex_);
    return shards_.count(pool) > 0;
}

std::vector<PoolId> BindingStore::pools() const {
    std::shared_lock lock(pools_mutex_);
    std::vector<PoolId> result;
    result.reserve(shards_.size());
    for (const auto& [id, shard] : shards_) result.push_back(id);
    std::sort(result.begin(), result.end());
    return result;
}

BindingStore::Shard* BindingStore::find_shard(const PoolId& pool) const {
    auto it = shards_.find(pool);
    return it == shards_.end() ? nullptr : it->second.get();
}

// ─────────────────────────────────────────────
// Bind / Unbind
// ─────────────────────────────────────────────

Binding BindingStore::commit_locked(Shard& shard, const WorkloadId& workload,
                                    const PoolId& pool, ResourceVector demand) {
    Binding binding{
        .workload_id = workload,
        .pool_id = pool,
        .bound_at = clock_(),
        .sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed),
        .demand = demand
    };
    shard.used += demand;
    shard.bindings.emplace(workload, binding);
    index_.emplace(workload, pool);
    return binding;
}

Result<Binding> BindingStore::bind(const WorkloadId& workload, const PoolId& pool,
                                   ResourceVector demand) {
    Binding committed;
    {
        std::shared_lock pools_lock(pools_mutex_);
        Shard* shard = find_shard(pool);
        if (shard == nullptr) {
            return Error{ErrorCode::NotFound, "pool '" + pool + "' not found"};
        }

        std::lock_guard shard_lock(shard->mutex);
        std::lock_guard index_lock(index_mutex_);

        if (auto it = index_.find(workload); it != index_.end()) {
            return Error{ErrorCode::AlreadyBound,
                         "workload '" + workload + "' is already bound to '" + it->second + "'"};
        }
        if (!demand.fits_within(shard->capacity - shard->used)) {
            return Error{ErrorCode::InsufficientCapacity,
                         "pool '" + pool + "' cannot hold workload '" + workload + "'"};
        }
        committed = commit_locked(*shard, workload, pool, demand);
    }
    notify({BindingEvent{BindingEvent::Kind::Bound, committed}});
    return committed;
}

std::optional<Binding> BindingStore::unbind(const WorkloadId& workload) {
    std::optional<Binding> removed;
    {
        std::shared_lock pools_lock(pools_mutex_);

        // The index is read first without the shard lock, so re-check once
        // the shard is held; a concurrent unbind may have won.
        PoolId pool;
        {
            std::lock_guard index_lock(index_mutex_);
            auto it = index_.find(workload);
            if (it == index_.end()) return std::nullopt;
            pool = it->second;
        }

        Shard* shard = find_shard(pool);
        if (shard == nullptr) return std::nullopt;

        std::lock_guard shard_lock(shard->mutex);
        std::lock_guard index_lock(index_mutex_);

        auto bit = shard->bindings.find(workload);
        if (bit == shard->bindings.end()) return std::nullopt;

        removed = bit->second;
        shard->used -= bit->second.demand;
        shard->bindings.erase(bit);
        index_.erase(workload);
    }
    notify({BindingEvent{BindingEvent::Kind::Unbound, *removed}});
    return removed;
}

Result<std::vector<Binding>> BindingStore::preempt(const PoolId& pool,
                                                   const std::vector<WorkloadId>& victims,
                                                   const WorkloadId& workload,
                                                   ResourceVector demand) {
    std::vector<Binding> changed;
    {
        std::shared_lock pools_lock(pools_mutex_);
        Shard* shard = find_shard(pool);
        if (shard == nullptr) {
            return Error{ErrorCode::NotFound, "pool '" + pool + "' not found"};
        }

        std::lock_guard shard_lock(shard->mutex);
        std::lock_guard index_lock(index_mutex_);

        if (auto it = index_.find(workload); it != index_.end()) {
            return Error{ErrorCode::AlreadyBound,
                         "workload '" + workload + "' is already bound to '" + it->second + "'"};
        }

        std::set<WorkloadId> unique_victims(victims.begin(), victims.end());
        ResourceVector freed;
        for (const auto& victim : unique_victims) {
            auto bit = shard->bindings.find(victim);
            if (bit == shard->bindings.end()) {
                return Error{ErrorCode::NotFound,
                             "victim '" + victim + "' is not bound to pool '" + pool + "'"};
            }
            freed += bit->second.demand;
        }

        if (!demand.fits_within(shard->capacity - (shard->used - freed))) {
            return Error{ErrorCode::InsufficientCapacity,
                         "evicting " + std::to_string(unique_victims.size())
                         + " workload(s) does not free enough capacity on '" + pool + "'"};
        }

        for (const auto& victim : victims) {
            auto bit = shard->bindings.find(victim);
            if (bit == shard->bindings.end()) continue;   // duplicate entry
            changed.push_back(bit->second);
            shard->used -= bit->second.demand;
            shard->bindings.erase(bit);
            index_.erase(victim);
        }
        changed.push_back(commit_locked(*shard, workload, pool, demand));
    }

    std::vector<BindingEvent> events;
    events.reserve(changed.size());
    for (size_t i = 0; i + 1 < changed.size(); ++i) {
        events.push_back({BindingEvent::Kind::Evicted, changed[i]});
    }
    events.push_back({BindingEvent::Kind::Bound, changed.back()});
    notify(events);
    return changed;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<Binding> BindingStore::list_bindings(const PoolId& pool) const {
    std::shared_lock pools_lock(pools_mutex_);
    Shard* shard = find_shard(pool);
    if (shard == nullptr) return {};

    std::lock_guard shard_lock(shard->mutex);
    std::vector<Binding> result;
    result.reserve(shard->bindings.size());
    for (const auto& [id, binding] : shard->bindings) result.push_back(binding);
    sort_by_sequence(result);
    return result;
}

std::vector<Binding> BindingStore::all_bindings() const {
    std::shared_lock pools_lock(pools_mutex_);
    std::vector<Binding> result;
    for (const auto& [id, shard] : shards_) {
        std::lock_guard shard_lock(shard->mutex);
        for (const auto& [wid, binding] : shard->bindings) result.push_back(binding);
    }
    sort_by_sequence(result);
    return result;
}

std::optional<Binding> BindingStore::binding_for(const WorkloadId& workload) const {
    std::shared_lock pools_lock(pools_mutex_);
    PoolId pool;
    {
        std::lock_guard index_lock(index_mutex_);
        auto it = index_.find(workload);
        if (it == index_.end()) return std::nullopt;
        pool = it->second;
    }
    Shard* shard = find_shard(pool);
    if (shard == nullptr) return std::nullopt;

    std::lock_guard shard_lock(shard->mutex);
    auto bit = shard->bindings.find(workload);
    if (bit == shard->bindings.end()) return std::nullopt;
    return bit->second;
}

std::optional<ResourceVector> BindingStore::used(const PoolId& pool) const {
    std::shared_lock pools_lock(pools_mutex_);
    Shard* shard = find_shard(pool);
    if (shard == nullptr) return std::nullopt;
    std::lock_guard shard_lock(shard->mutex);
    return shard->used;
}

std::optional<ResourceVector> BindingStore::capacity(const PoolId& pool) const {
    std::shared_lock pools_lock(pools_mutex_);
    Shard* shard = find_shard(pool);
    if (shard == nullptr) return std::nullopt;
    std::lock_guard shard_lock(shard->mutex);
    return shard->capacity;
}

size_t BindingStore::binding_count() const {
    std::lock_guard index_lock(index_mutex_);
    return index_.size();
}

// ─────────────────────────────────────────────
// Events
// ─────────────────────────────────────────────

BindingStore::SubscriptionId BindingStore::subscribe(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    auto id = next_subscription_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void BindingStore::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.erase(id);
}

void BindingStore::notify(const std::vector<BindingEvent>& events) {
    std::vector<Listener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) listeners.push_back(listener);
    }
    for (const auto& event : events) {
        for (const auto& listener : listeners) listener(event);
    }
}

}  // namespace cluster_gate
