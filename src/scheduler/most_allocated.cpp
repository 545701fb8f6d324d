/**
 * @file most_allocated.cpp
 * @brief MostAllocatedStrategy: packs workloads onto already busy pools.
 * @author Dimitris Kafetzis
 *
 * The resource term is the complement of LeastAllocatedStrategy's:
 *   resource = 100 - mean(free share after placement)
 */

#include "scheduler/most_allocated.hpp"

#include "scheduler/least_allocated.hpp"
#include "scheduler/scoring.hpp"

namespace cluster_gate {

int64_t MostAllocatedStrategy::score(const Workload& workload, const PoolView& view) const {
    const auto& capacity = view.pool.capacity;
    if (capacity.is_zero()) return constraint_score(workload, view.pool);

    auto after = view.used + workload.demand;
    return (MAX_RESOURCE_SCORE - free_share_after(capacity, after))
         + constraint_score(workload, view.pool);
}

}  // namespace cluster_gate
