/**
 * @file filter.hpp
 * @brief Feasibility filtering of pools for a workload.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/scheduler.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cluster_gate {

enum class FilterReason : uint8_t {
    InsufficientCpu,
    InsufficientMemory,
    UntoleratedTaint,
    AffinityMismatch
};

[[nodiscard]] constexpr std::string_view to_string(FilterReason reason) noexcept {
    switch (reason) {
        case FilterReason::InsufficientCpu:    return "insufficient cpu";
        case FilterReason::InsufficientMemory: return "insufficient memory";
        case FilterReason::UntoleratedTaint:   return "untolerated taint";
        case FilterReason::AffinityMismatch:   return "affinity mismatch";
    }
    return "unknown";
}

struct PoolRejection {
    PoolId pool;
    std::vector<FilterReason> reasons;
};

struct FilterResult {
    std::vector<const PoolView*> feasible;   ///< Points into the input views
    std::vector<PoolRejection> rejected;
    size_t total = 0;

    /// "0/3 pools available: 2 insufficient cpu, 1 untolerated taint".
    [[nodiscard]] std::string summary() const;
};

/// True when no hard taint on @p pool is left untolerated.
[[nodiscard]] bool tolerates_pool(const Workload& workload, const ResourcePool& pool);

/// True when every required affinity term matches the pool labels.
[[nodiscard]] bool matches_required_affinity(const Workload& workload, const ResourcePool& pool);

/// Taint and affinity checks only; capacity is ignored.
[[nodiscard]] bool passes_placement_constraints(const Workload& workload, const ResourcePool& pool);

/// Every reason @p view cannot take @p workload; empty when it can.
[[nodiscard]] std::vector<FilterReason> check_pool(const Workload& workload, const PoolView& view);

/// Split @p views into feasible pools and rejections, preserving input order.
[[nodiscard]] FilterResult filter_pools(const Workload& workload, const std::vector<PoolView>& views);

}  // namespace cluster_gate
