/**
 * @file scoring.hpp
 * @brief Shared scoring terms and strategy selection.
 * @author Dimitris Kafetzis
 *
 * Every strategy scores a pool as
 *
 *   resource_score(0..100) + preference_score(0..100)
 *     - PREFER_NO_SCHEDULE_PENALTY × untolerated PreferNoSchedule taints
 *
 * and differs only in how the resource term is computed.
 */

#pragma once

#include "core/result.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <string_view>

namespace cluster_gate {

constexpr int64_t MAX_RESOURCE_SCORE = 100;
constexpr int64_t PREFER_NO_SCHEDULE_PENALTY = 25;

/// Weighted share (0..100) of the workload's preferred terms the pool matches.
[[nodiscard]] int64_t preference_score(const Workload& workload, const ResourcePool& pool);

/// PreferNoSchedule taints the workload does not tolerate.
[[nodiscard]] int64_t soft_taint_count(const Workload& workload, const ResourcePool& pool);

/// preference_score minus the soft taint penalty.
[[nodiscard]] int64_t constraint_score(const Workload& workload, const ResourcePool& pool);

/// "least_allocated" or "most_allocated"; InvalidArgument otherwise.
Result<std::unique_ptr<IScoringStrategy>> make_scoring_strategy(std::string_view name);

/**
 * @brief Select the highest scoring view; equal scores go to the lower pool ID.
 * @return nullptr when @p feasible is empty.
 */
[[nodiscard]] const PoolView* pick_best(const IScoringStrategy& strategy,
                                        const Workload& workload,
                                        const std::vector<const PoolView*>& feasible);

}  // namespace cluster_gate
