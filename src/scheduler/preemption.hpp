/**
 * @file preemption.hpp
 * @brief Victim selection for priority preemption.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/scheduler.hpp"

#include <optional>
#include <vector>

namespace cluster_gate {

/// A pool together with the workloads currently bound to it.
struct PoolOccupancy {
    PoolView view;
    std::vector<Workload> bound;
};

struct PreemptionPlan {
    PoolId pool;
    std::vector<WorkloadId> victims;    ///< Eviction order
    int64_t highest_victim_priority = 0;
    int64_t priority_sum = 0;
};

/**
 * @brief Minimal victim set on one pool, or nullopt if the pool cannot host
 *        @p preemptor even after evicting every lower-priority workload.
 *
 * Candidates are bound workloads with strictly lower priority, taken lowest
 * priority first, then oldest (creation_seq) first, then by ID, until the
 * demand fits.
 */
[[nodiscard]] std::optional<PreemptionPlan> select_victims(const Workload& preemptor,
                                                           const PoolOccupancy& occupancy);

/**
 * @brief Best plan across @p pools.
 *
 * Pools are ranked by (highest victim priority, victim count, victim priority
 * sum, pool ID), all ascending. Returns nullopt when the preemptor's policy is
 * NeverPreempt or no pool qualifies.
 */
[[nodiscard]] std::optional<PreemptionPlan> plan_preemption(const Workload& preemptor,
                                                            const std::vector<PoolOccupancy>& pools);

}  // namespace cluster_gate
