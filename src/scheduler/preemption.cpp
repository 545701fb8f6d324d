/**
 * @file preemption.cpp
 * @brief Deterministic victim selection.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   For each pool passing the taint and affinity filters:
 *     candidates = bound workloads with priority < preemptor.priority
 *     sort candidates by (priority, creation_seq, id)
 *     evict candidates in that order until demand fits
 *   Choose the pool with the smallest (max victim priority, |victims|,
 *   Σ victim priority, pool id).
 *
 * Complexity: O(P × B log B) where P = pools, B = bindings per pool.
 */

#include "scheduler/preemption.hpp"

#include "scheduler/filter.hpp"

#include <algorithm>
#include <tuple>

namespace cluster_gate {

std::optional<PreemptionPlan> select_victims(const Workload& preemptor,
                                             const PoolOccupancy& occupancy) {
    const auto& pool = occupancy.view.pool;
    if (!passes_placement_constraints(preemptor, pool)) return std::nullopt;
    if (!preemptor.demand.fits_within(pool.capacity)) return std::nullopt;

    std::vector<const Workload*> candidates;
    for (const auto& bound : occupancy.bound) {
        if (bound.priority < preemptor.priority) candidates.push_back(&bound);
    }
    std::sort(candidates.begin(), candidates.end(), [](const Workload* a, const Workload* b) {
        return std::tie(a->priority, a->creation_seq, a->id)
             < std::tie(b->priority, b->creation_seq, b->id);
    });

    PreemptionPlan plan;
    plan.pool = pool.id;
    ResourceVector used = occupancy.view.used;

    for (const auto* victim : candidates) {
        if (preemptor.demand.fits_within(pool.capacity - used)) break;
        used -= victim->demand;
        plan.victims.push_back(victim->id);
        plan.highest_victim_priority = plan.victims.size() == 1
            ? victim->priority
            : std::max(plan.highest_victim_priority, victim->priority);
        plan.priority_sum += victim->priority;
    }

    if (!preemptor.demand.fits_within(pool.capacity - used)) return std::nullopt;
    if (plan.victims.empty()) return std::nullopt;   // fits without eviction; not a preemption
    return plan;
}

std::optional<PreemptionPlan> plan_preemption(const Workload& preemptor,
                                              const std::vector<PoolOccupancy>& pools) {
    if (preemptor.preemption_policy == PreemptionPolicy::NeverPreempt) return std::nullopt;

    std::optional<PreemptionPlan> best;
    for (const auto& occupancy : pools) {
        auto plan = select_victims(preemptor, occupancy);
        if (!plan) continue;

        if (!best) {
            best = std::move(plan);
            continue;
        }
        const size_t plan_count = plan->victims.size();
        const size_t best_count = best->victims.size();
        if (std::tie(plan->highest_victim_priority, plan_count, plan->priority_sum, plan->pool)
            < std::tie(best->highest_victim_priority, best_count, best->priority_sum, best->pool)) {
            best = std::move(plan);
        }
    }
    return best;
}

}  // namespace cluster_gate
