/**
 * @file scheduler.hpp
 * @brief Scheduler types, outcome structures, and scoring interface.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "workload/workload.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cluster_gate {

// ─────────────────────────────────────────────
// Pool View (pool + current usage)
// ─────────────────────────────────────────────

struct PoolView {
    ResourcePool pool;
    ResourceVector used;

    [[nodiscard]] ResourceVector free() const noexcept { return pool.capacity - used; }
};

// ─────────────────────────────────────────────
// Scheduling Outcome
// ─────────────────────────────────────────────

struct ScheduleOutcome {
    WorkloadId workload_id;
    WorkloadState state = WorkloadState::Pending;
    std::optional<PoolId> pool;
    std::vector<WorkloadId> evicted;   ///< Victims returned to Pending
    std::string reason;                ///< Set when Unschedulable
};

struct SchedulerOptions {
    std::string strategy = "least_allocated";
    bool preemption_enabled = true;
    uint32_t max_bind_attempts = 2;    ///< Filtering restarts after a lost bind race
};

/**
 * @brief Abstract interface for pool scoring strategies (runtime polymorphism).
 *
 * Scores are integers so ranking is exact; the engine breaks equal scores by
 * pool ID ascending.
 */
class IScoringStrategy {
public:
    virtual ~IScoringStrategy() = default;
    [[nodiscard]] virtual int64_t score(const Workload& workload, const PoolView& view) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace cluster_gate
