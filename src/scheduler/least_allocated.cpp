/**
 * @file least_allocated.cpp
 * @brief LeastAllocatedStrategy: ranks pools by free capacity remaining
 *        once the workload is placed.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   For each dimension d with capacity > 0:
 *     share(d) = (capacity(d) - used(d) - demand(d)) × 100 / capacity(d)
 *   resource = mean(share)
 *   score    = resource + constraint_score(workload, pool)
 *
 * Integer arithmetic only, so equal inputs always rank identically.
 */

#include "scheduler/least_allocated.hpp"

#include "scheduler/scoring.hpp"

namespace cluster_gate {

namespace {

int64_t share(uint64_t part, uint64_t whole) {
    auto scaled = static_cast<unsigned __int128>(part) * MAX_RESOURCE_SCORE / whole;
    return static_cast<int64_t>(scaled);
}

}  // anonymous namespace

int64_t free_share_after(const ResourceVector& capacity, const ResourceVector& used_after) {
    int64_t sum = 0;
    int64_t dims = 0;
    if (capacity.cpu_millis > 0) {
        uint64_t free = capacity.cpu_millis > used_after.cpu_millis
            ? capacity.cpu_millis - used_after.cpu_millis : 0;
        sum += share(free, capacity.cpu_millis);
        ++dims;
    }
    if (capacity.memory_bytes > 0) {
        uint64_t free = capacity.memory_bytes > used_after.memory_bytes
            ? capacity.memory_bytes - used_after.memory_bytes : 0;
        sum += share(free, capacity.memory_bytes);
        ++dims;
    }
    return dims == 0 ? 0 : sum / dims;
}

int64_t LeastAllocatedStrategy::score(const Workload& workload, const PoolView& view) const {
    auto after = view.used + workload.demand;
    return free_share_after(view.pool.capacity, after) + constraint_score(workload, view.pool);
}

}  // namespace cluster_gate
