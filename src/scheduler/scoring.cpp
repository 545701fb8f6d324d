/**
 * @file scoring.cpp
 * @brief Preference, soft-taint and best-pool selection helpers.
 * @author Dimitris Kafetzis
 */

#include "scheduler/scoring.hpp"

#include "scheduler/least_allocated.hpp"
#include "scheduler/most_allocated.hpp"

#include <string>

namespace cluster_gate {

int64_t preference_score(const Workload& workload, const ResourcePool& pool) {
    int64_t total = 0;
    int64_t matched = 0;
    for (const auto& preferred : workload.preferred_affinity) {
        total += preferred.weight;
        if (preferred.term.matches(pool.labels)) matched += preferred.weight;
    }
    if (total == 0) return 0;
    return matched * MAX_RESOURCE_SCORE / total;
}

int64_t soft_taint_count(const Workload& workload, const ResourcePool& pool) {
    int64_t count = 0;
    for (const auto& taint : pool.taints) {
        if (taint.effect == TaintEffect::PreferNoSchedule
            && !tolerates_all(workload.tolerations, taint)) {
            ++count;
        }
    }
    return count;
}

int64_t constraint_score(const Workload& workload, const ResourcePool& pool) {
    return preference_score(workload, pool)
         - PREFER_NO_SCHEDULE_PENALTY * soft_taint_count(workload, pool);
}

Result<std::unique_ptr<IScoringStrategy>> make_scoring_strategy(std::string_view name) {
    if (name == "least_allocated") {
        return std::unique_ptr<IScoringStrategy>(std::make_unique<LeastAllocatedStrategy>());
    }
    if (name == "most_allocated") {
        return std::unique_ptr<IScoringStrategy>(std::make_unique<MostAllocatedStrategy>());
    }
    return Error{ErrorCode::InvalidArgument,
                 "unknown scoring strategy '" + std::string{name} + "'"};
}

const PoolView* pick_best(const IScoringStrategy& strategy,
                          const Workload& workload,
                          const std::vector<const PoolView*>& feasible) {
    const PoolView* best = nullptr;
    int64_t best_score = 0;
    for (const auto* view : feasible) {
        int64_t s = strategy.score(workload, *view);
        if (best == nullptr || s > best_score
            || (s == best_score && view->pool.id < best->pool.id)) {
            best = view;
            best_score = s;
        }
    }
    return best;
}

}  // namespace cluster_gate
