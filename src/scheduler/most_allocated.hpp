/**
 * @file most_allocated.hpp
 * @brief Bin-packing strategy that favours pools that end up fullest.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/scheduler.hpp"

namespace cluster_gate {

class MostAllocatedStrategy : public IScoringStrategy {
public:
    [[nodiscard]] int64_t score(const Workload& workload, const PoolView& view) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "most_allocated"; }
};

}  // namespace cluster_gate
