/**
 * @file scheduling_engine.hpp
 * @brief Single-writer scheduling loop: filter → score → preempt → bind.
 * @author Dimitris Kafetzis
 *
 * The engine owns the scheduling queue, per-workload state and the pool
 * registry. One placement decision runs at a time under mutex_, which keeps
 * tie-breaks and eviction sets reproducible for identical inputs. Capacity is
 * committed through the BindingStore, whose per-pool locks serialise any
 * other writer targeting the same pool.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "scheduler/preemption.hpp"
#include "scheduler/scheduler.hpp"
#include "store/binding_store.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <tuple>
#include <vector>

namespace cluster_gate {

class SchedulingEngine {
public:
    /// Fails with InvalidArgument for an unknown scoring strategy.
    static Result<std::unique_ptr<SchedulingEngine>> create(BindingStore& store,
                                                           SchedulerOptions options = {},
                                                           std::optional<Logger> logger = std::nullopt);

    SchedulingEngine(const SchedulingEngine&) = delete;
    SchedulingEngine& operator=(const SchedulingEngine&) = delete;

    // ── Pools ─────────────────────────────────

    /// Register a pool and retry unschedulable workloads.
    Result<void> add_pool(ResourcePool pool);

    /**
     * @brief Replace a pool's taints.
     *
     * Bound workloads that do not tolerate a NoExecute taint are evicted back
     * to Pending. Returns the evicted IDs.
     */
    Result<std::vector<WorkloadId>> update_taints(const PoolId& pool, std::vector<Taint> taints);

    /// Unbind everything on the pool, re-queue it, then drop the pool.
    Result<std::vector<WorkloadId>> remove_pool(const PoolId& pool);

    [[nodiscard]] std::optional<ResourcePool> pool(const PoolId& id) const;
    /// Ordered by pool ID.
    [[nodiscard]] std::vector<ResourcePool> pools() const;

    // ── Workloads ─────────────────────────────

    /// Queue an admitted workload. AlreadyExists if the ID is known.
    Result<void> submit(Workload workload);

    /// Unbind and forget a workload. Returns false if it was unknown.
    bool remove_workload(const WorkloadId& id);

    /// Take the head of the queue through one full placement attempt.
    std::optional<ScheduleOutcome> schedule_one();

    /// Drain the queue; evicted workloads are re-queued and retried.
    std::vector<ScheduleOutcome> run_until_idle();

    /// Move every Unschedulable workload back to Pending. Returns the count.
    size_t retry_unschedulable();

    [[nodiscard]] std::optional<WorkloadState> state_of(const WorkloadId& id) const;
    [[nodiscard]] std::optional<Workload> workload(const WorkloadId& id) const;
    /// Reason recorded for the last Unschedulable outcome.
    [[nodiscard]] std::optional<std::string> last_reason(const WorkloadId& id) const;
    [[nodiscard]] size_t pending() const;
    [[nodiscard]] std::vector<WorkloadId> unschedulable() const;
    [[nodiscard]] std::string_view strategy_name() const noexcept { return strategy_->name(); }

private:
    SchedulingEngine(BindingStore& store, SchedulerOptions options,
                     std::unique_ptr<IScoringStrategy> strategy, std::optional<Logger> logger);

    struct Record {
        Workload workload;
        WorkloadState state = WorkloadState::Pending;
        std::string reason;
    };

    /// (-priority, creation_seq, id): highest priority first, then FIFO.
    using QueueKey = std::tuple<int64_t, uint64_t, WorkloadId>;

    static QueueKey key_for(const Workload& w) { return {-w.priority, w.creation_seq, w.id}; }

    void enqueue_locked(Record& record);
    size_t retry_unschedulable_locked();
    std::vector<PoolView> snapshot_views() const;
    std::vector<PoolOccupancy> snapshot_occupancy(const std::vector<PoolView>& views) const;
    ScheduleOutcome attempt_locked(Record& record);
    void evict_locked(const WorkloadId& id);

    void log(LogLevel level, const std::string& message);

    BindingStore& store_;
    SchedulerOptions options_;
    std::unique_ptr<IScoringStrategy> strategy_;
    std::optional<Logger> logger_;

    mutable std::mutex mutex_;          ///< Queue, records, sequence
    std::map<WorkloadId, Record> records_;
    std::set<QueueKey> queue_;
    uint64_t next_seq_ = 1;

    mutable std::shared_mutex pools_mutex_;
    std::map<PoolId, ResourcePool> pools_;
};

}  // namespace cluster_gate
