/**
 * @file filter.cpp
 * @brief Pool filtering: capacity, hard taints, required affinity.
 * @author Dimitris Kafetzis
 */

#include "scheduler/filter.hpp"

#include <algorithm>
#include <array>

namespace cluster_gate {

bool tolerates_pool(const Workload& workload, const ResourcePool& pool) {
    return std::all_of(pool.taints.begin(), pool.taints.end(), [&](const Taint& taint) {
        return !taint.is_hard() || tolerates_all(workload.tolerations, taint);
    });
}

bool matches_required_affinity(const Workload& workload, const ResourcePool& pool) {
    return std::all_of(workload.required_affinity.begin(), workload.required_affinity.end(),
                       [&](const AffinityTerm& term) { return term.matches(pool.labels); });
}

bool passes_placement_constraints(const Workload& workload, const ResourcePool& pool) {
    return tolerates_pool(workload, pool) && matches_required_affinity(workload, pool);
}

std::vector<FilterReason> check_pool(const Workload& workload, const PoolView& view) {
    std::vector<FilterReason> reasons;
    const auto free = view.free();
    if (workload.demand.cpu_millis > free.cpu_millis) {
        reasons.push_back(FilterReason::InsufficientCpu);
    }
    if (workload.demand.memory_bytes > free.memory_bytes) {
        reasons.push_back(FilterReason::InsufficientMemory);
    }
    if (!tolerates_pool(workload, view.pool)) {
        reasons.push_back(FilterReason::UntoleratedTaint);
    }
    if (!matches_required_affinity(workload, view.pool)) {
        reasons.push_back(FilterReason::AffinityMismatch);
    }
    return reasons;
}

FilterResult filter_pools(const Workload& workload, const std::vector<PoolView>& views) {
    FilterResult result;
    result.total = views.size();
    for (const auto& view : views) {
        auto reasons = check_pool(workload, view);
        if (reasons.empty()) {
            result.feasible.push_back(&view);
        } else {
            result.rejected.push_back({view.pool.id, std::move(reasons)});
        }
    }
    return result;
}

std::string FilterResult::summary() const {
    std::array<size_t, 4> counts{};
    for (const auto& rejection : rejected) {
        for (auto reason : rejection.reasons) {
            ++counts[static_cast<size_t>(reason)];
        }
    }

    std::string out = std::to_string(feasible.size()) + "/" + std::to_string(total)
                    + " pools available";
    if (total == 0) return out;

    bool first = true;
    for (size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] == 0) continue;
        out += first ? ": " : ", ";
        out += std::to_string(counts[i]) + " ";
        out += to_string(static_cast<FilterReason>(i));
        first = false;
    }
    return out;
}

}  // namespace cluster_gate
