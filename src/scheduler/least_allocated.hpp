/**
 * @file least_allocated.hpp
 * @brief Spreading strategy that favours pools with the most room left.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/scheduler.hpp"

namespace cluster_gate {

class LeastAllocatedStrategy : public IScoringStrategy {
public:
    [[nodiscard]] int64_t score(const Workload& workload, const PoolView& view) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "least_allocated"; }
};

/// Mean free share (0..100) across the dimensions the pool has capacity in.
[[nodiscard]] int64_t free_share_after(const ResourceVector& capacity,
                                       const ResourceVector& used_after);

}  // namespace cluster_gate
