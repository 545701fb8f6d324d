/**
 * @file scheduling_engine.cpp
 * @brief SchedulingEngine: queue ordering, placement attempts and evictions.
 * @author Dimitris Kafetzis
 *
 * Per attempt:
 *   Filtering  → feasible pools by capacity, hard taints, required affinity
 *   Scoring    → strategy score, ties to the lower pool ID, then bind
 *   Preemption → only when nothing is feasible and the workload may preempt
 *
 * A lost bind race (AlreadyBound / InsufficientCapacity from the store)
 * restarts the attempt from Filtering, up to max_bind_attempts.
 */

#include "scheduler/scheduling_engine.hpp"

#include "scheduler/filter.hpp"
#include "scheduler/scoring.hpp"

#include <algorithm>

namespace cluster_gate {

namespace {

bool is_bind_race(ErrorCode code) {
    return code == ErrorCode::AlreadyBound || code == ErrorCode::InsufficientCapacity
        || code == ErrorCode::NotFound;
}

bool tolerates_no_execute(const Workload& workload, const std::vector<Taint>& taints) {
    return std::all_of(taints.begin(), taints.end(), [&](const Taint& taint) {
        return taint.effect != TaintEffect::NoExecute || tolerates_all(workload.tolerations, taint);
    });
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<SchedulingEngine>> SchedulingEngine::create(BindingStore& store,
                                                                   SchedulerOptions options,
                                                                   std::optional<Logger> logger) {
    auto strategy = make_scoring_strategy(options.strategy);
    if (!strategy) return strategy.error();
    if (options.max_bind_attempts == 0) {
        return Error{ErrorCode::InvalidArgument, "max_bind_attempts must be at least 1"};
    }
    return std::unique_ptr<SchedulingEngine>(
        new SchedulingEngine(store, std::move(options), std::move(*strategy), std::move(logger)));
}

SchedulingEngine::SchedulingEngine(BindingStore& store, SchedulerOptions options,
                                   std::unique_ptr<IScoringStrategy> strategy,
                                   std::optional<Logger> logger)
    : store_(store)
    , options_(std::move(options))
    , strategy_(std::move(strategy))
    , logger_(std::move(logger)) {}

void SchedulingEngine::log(LogLevel level, const std::string& message) {
    if (logger_) logger_->log(level, message);
}

// ─────────────────────────────────────────────
// Pools
// ─────────────────────────────────────────────

Result<void> SchedulingEngine::add_pool(ResourcePool pool) {
    std::lock_guard lock(mutex_);
    auto registered = store_.register_pool(pool.id, pool.capacity);
    if (!registered) return registered.error();

    log(LogLevel::Info, "pool '" + pool.id + "' added");
    {
        std::unique_lock pools_lock(pools_mutex_);
        auto id = pool.id;
        pools_.emplace(std::move(id), std::move(pool));
    }
    retry_unschedulable_locked();
    return {};
}

Result<std::vector<WorkloadId>> SchedulingEngine::update_taints(const PoolId& pool,
                                                                std::vector<Taint> taints) {
    std::lock_guard lock(mutex_);
    {
        std::unique_lock pools_lock(pools_mutex_);
        auto it = pools_.find(pool);
        if (it == pools_.end()) {
            return Error{ErrorCode::NotFound, "pool '" + pool + "' not found"};
        }
        it->second.taints = taints;
    }

    std::vector<WorkloadId> evicted;
    for (const auto& binding : store_.list_bindings(pool)) {
        auto rit = records_.find(binding.workload_id);
        if (rit == records_.end()) continue;
        if (tolerates_no_execute(rit->second.workload, taints)) continue;
        evict_locked(binding.workload_id);
        evicted.push_back(binding.workload_id);
    }

    if (!evicted.empty()) {
        log(LogLevel::Info, "pool '" + pool + "' NoExecute taint evicted "
            + std::to_string(evicted.size()) + " workload(s)");
    }
    retry_unschedulable_locked();
    return evicted;
}

Result<std::vector<WorkloadId>> SchedulingEngine::remove_pool(const PoolId& pool) {
    std::lock_guard lock(mutex_);
    {
        std::shared_lock pools_lock(pools_mutex_);
        if (pools_.count(pool) == 0) {
            return Error{ErrorCode::NotFound, "pool '" + pool + "' not found"};
        }
    }

    std::vector<WorkloadId> displaced;
    for (const auto& binding : store_.list_bindings(pool)) {
        if (records_.count(binding.workload_id) > 0) {
            evict_locked(binding.workload_id);
        } else {
            store_.unbind(binding.workload_id);
        }
        displaced.push_back(binding.workload_id);
    }

    auto removed = store_.remove_pool(pool);
    if (!removed) return removed.error();
    {
        std::unique_lock pools_lock(pools_mutex_);
        pools_.erase(pool);
    }
    log(LogLevel::Info, "pool '" + pool + "' removed, " + std::to_string(displaced.size())
        + " workload(s) displaced");
    return displaced;
}

std::optional<ResourcePool> SchedulingEngine::pool(const PoolId& id) const {
    std::shared_lock lock(pools_mutex_);
    auto it = pools_.find(id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

std::vector<ResourcePool> SchedulingEngine::pools() const {
    std::shared_lock lock(pools_mutex_);
    std::vector<ResourcePool> result;
    result.reserve(pools_.size());
    for (const auto& [id, p] : pools_) result.push_back(p);
    return result;
}

// ─────────────────────────────────────────────
// Workloads
// ─────────────────────────────────────────────

Result<void> SchedulingEngine::submit(Workload workload) {
    if (workload.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "workload id must not be empty"};
    }
    std::lock_guard lock(mutex_);
    if (records_.count(workload.id) > 0) {
        return Error{ErrorCode::AlreadyExists, "workload '" + workload.id + "' already submitted"};
    }
    workload.creation_seq = next_seq_++;
    auto id = workload.id;
    auto it = records_.emplace(id, Record{std::move(workload), WorkloadState::Pending, {}}).first;
    enqueue_locked(it->second);
    log(LogLevel::Debug, "workload '" + id + "' queued");
    return {};
}

bool SchedulingEngine::remove_workload(const WorkloadId& id) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;

    queue_.erase(key_for(it->second.workload));
    const bool was_bound = store_.unbind(id).has_value();
    records_.erase(it);
    log(LogLevel::Info, "workload '" + id + "' removed");

    if (was_bound) retry_unschedulable_locked();
    return true;
}

void SchedulingEngine::enqueue_locked(Record& record) {
    record.state = WorkloadState::Pending;
    record.reason.clear();
    queue_.insert(key_for(record.workload));
}

void SchedulingEngine::evict_locked(const WorkloadId& id) {
    store_.unbind(id);
    auto it = records_.find(id);
    if (it != records_.end()) enqueue_locked(it->second);
}

size_t SchedulingEngine::retry_unschedulable() {
    std::lock_guard lock(mutex_);
    return retry_unschedulable_locked();
}

size_t SchedulingEngine::retry_unschedulable_locked() {
    size_t moved = 0;
    for (auto& [id, record] : records_) {
        if (record.state == WorkloadState::Unschedulable) {
            enqueue_locked(record);
            ++moved;
        }
    }
    return moved;
}

// ─────────────────────────────────────────────
// Scheduling Loop
// ─────────────────────────────────────────────

std::vector<PoolView> SchedulingEngine::snapshot_views() const {
    std::shared_lock lock(pools_mutex_);
    std::vector<PoolView> views;
    views.reserve(pools_.size());
    for (const auto& [id, p] : pools_) {
        views.push_back({p, store_.used(id).value_or(ResourceVector{})});
    }
    return views;
}

std::vector<PoolOccupancy> SchedulingEngine::snapshot_occupancy(const std::vector<PoolView>& views) const {
    std::vector<PoolOccupancy> result;
    result.reserve(views.size());
    for (const auto& view : views) {
        PoolOccupancy occupancy{view, {}};
        for (const auto& binding : store_.list_bindings(view.pool.id)) {
            auto it = records_.find(binding.workload_id);
            if (it != records_.end()) occupancy.bound.push_back(it->second.workload);
        }
        result.push_back(std::move(occupancy));
    }
    return result;
}

ScheduleOutcome SchedulingEngine::attempt_locked(Record& record) {
    const auto& w = record.workload;
    ScheduleOutcome outcome;
    outcome.workload_id = w.id;
    std::string failure;

    for (uint32_t attempt = 0; attempt < options_.max_bind_attempts; ++attempt) {
        record.state = WorkloadState::Filtering;
        auto views = snapshot_views();
        auto filtered = filter_pools(w, views);

        if (!filtered.feasible.empty()) {
            record.state = WorkloadState::Scoring;
            const auto* best = pick_best(*strategy_, w, filtered.feasible);
            auto bound = store_.bind(w.id, best->pool.id, w.demand);
            if (bound) {
                record.state = WorkloadState::Bound;
                outcome.state = WorkloadState::Bound;
                outcome.pool = best->pool.id;
                return outcome;
            }
            failure = bound.error().message;
            if (is_bind_race(bound.error().code)) continue;
            break;
        }

        failure = filtered.summary();
        if (!options_.preemption_enabled
            || w.preemption_policy == PreemptionPolicy::NeverPreempt) {
            break;
        }

        auto plan = plan_preemption(w, snapshot_occupancy(views));
        if (!plan) break;

        record.state = WorkloadState::PendingPreemption;
        auto committed = store_.preempt(plan->pool, plan->victims, w.id, w.demand);
        if (committed) {
            for (const auto& victim : plan->victims) {
                auto vit = records_.find(victim);
                if (vit != records_.end()) enqueue_locked(vit->second);
                outcome.evicted.push_back(victim);
            }
            record.state = WorkloadState::Bound;
            outcome.state = WorkloadState::Bound;
            outcome.pool = plan->pool;
            return outcome;
        }
        failure = committed.error().message;
        if (!is_bind_race(committed.error().code)) break;
    }

    // Someone else may have bound it while we raced.
    if (auto existing = store_.binding_for(w.id)) {
        record.state = WorkloadState::Bound;
        outcome.state = WorkloadState::Bound;
        outcome.pool = existing->pool_id;
        return outcome;
    }

    record.state = WorkloadState::Unschedulable;
    record.reason = failure;
    outcome.state = WorkloadState::Unschedulable;
    outcome.reason = failure;
    return outcome;
}

std::optional<ScheduleOutcome> SchedulingEngine::schedule_one() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) return std::nullopt;

    auto head = queue_.begin();
    auto it = records_.find(std::get<2>(*head));
    queue_.erase(head);
    if (it == records_.end()) return std::nullopt;

    auto outcome = attempt_locked(it->second);
    switch (outcome.state) {
        case WorkloadState::Bound: {
            std::string msg = "workload '" + outcome.workload_id + "' bound to '" + *outcome.pool + "'";
            if (!outcome.evicted.empty()) {
                msg += " after evicting " + std::to_string(outcome.evicted.size()) + " workload(s)";
            }
            log(LogLevel::Info, msg);
            break;
        }
        case WorkloadState::Unschedulable:
            log(LogLevel::Info, "workload '" + outcome.workload_id + "' unschedulable: " + outcome.reason);
            break;
        default:
            break;
    }
    return outcome;
}

std::vector<ScheduleOutcome> SchedulingEngine::run_until_idle() {
    std::vector<ScheduleOutcome> outcomes;
    while (auto outcome = schedule_one()) {
        outcomes.push_back(std::move(*outcome));
    }
    return outcomes;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<WorkloadState> SchedulingEngine::state_of(const WorkloadId& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second.state;
}

std::optional<Workload> SchedulingEngine::workload(const WorkloadId& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second.workload;
}

std::optional<std::string> SchedulingEngine::last_reason(const WorkloadId& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.reason.empty()) return std::nullopt;
    return it->second.reason;
}

size_t SchedulingEngine::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

std::vector<WorkloadId> SchedulingEngine::unschedulable() const {
    std::lock_guard lock(mutex_);
    std::vector<WorkloadId> result;
    for (const auto& [id, record] : records_) {
        if (record.state == WorkloadState::Unschedulable) result.push_back(id);
    }
    return result;
}

}  // namespace cluster_gate
