/**
 * @file workload.hpp
 * @brief Workloads, pools, taints, tolerations and affinity terms.
 * @author Dimitris Kafetzis
 *
 * Plain value types. Workloads and pools never point at each other; the
 * relationship between them lives in the BindingStore, keyed by ID.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cluster_gate {

using LabelMap = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Taints & Tolerations
// ─────────────────────────────────────────────

struct Taint {
    std::string key;
    std::string value;
    TaintEffect effect = TaintEffect::NoSchedule;

    bool operator==(const Taint&) const = default;

    /// NoSchedule and NoExecute keep workloads off the pool.
    [[nodiscard]] bool is_hard() const noexcept { return effect != TaintEffect::PreferNoSchedule; }
};

struct Toleration {
    enum class Operator : uint8_t { Equal, Exists };

    std::string key;                       ///< Empty with Exists = tolerate everything
    Operator op = Operator::Equal;
    std::string value;
    std::optional<TaintEffect> effect;     ///< Empty = any effect

    bool operator==(const Toleration&) const = default;

    [[nodiscard]] bool tolerates(const Taint& taint) const;
};

[[nodiscard]] bool tolerates_all(const std::vector<Toleration>& tolerations, const Taint& taint);

// ─────────────────────────────────────────────
// Affinity
// ─────────────────────────────────────────────

/**
 * @brief A pool label requirement.
 *
 * Matches when the pool carries @c key and, if @c values is non-empty,
 * its value is one of @c values.
 */
struct AffinityTerm {
    std::string key;
    std::vector<std::string> values;

    bool operator==(const AffinityTerm&) const = default;

    [[nodiscard]] bool matches(const LabelMap& labels) const;
};

struct PreferredAffinityTerm {
    int32_t weight = 1;     ///< 1..100
    AffinityTerm term;

    bool operator==(const PreferredAffinityTerm&) const = default;
};

// ─────────────────────────────────────────────
// Workload
// ─────────────────────────────────────────────

/**
 * @brief An admitted unit of work waiting for, or holding, a placement.
 */
struct Workload {
    WorkloadId id;                        ///< "<namespace>/<name>"
    std::string name;
    std::string namespace_name;

    std::string priority_class_name;
    int64_t priority = 0;
    PreemptionPolicy preemption_policy = PreemptionPolicy::CanPreemptLower;

    ResourceVector demand;
    std::vector<AffinityTerm> required_affinity;
    std::vector<PreferredAffinityTerm> preferred_affinity;
    std::vector<Toleration> tolerations;

    uint64_t creation_seq = 0;            ///< Assigned by the scheduling engine

    [[nodiscard]] static WorkloadId make_id(const std::string& namespace_name,
                                            const std::string& name) {
        return namespace_name + "/" + name;
    }
};

// ─────────────────────────────────────────────
// Resource Pool
// ─────────────────────────────────────────────

/**
 * @brief A schedulable unit of capacity (node analogue).
 */
struct ResourcePool {
    PoolId id;
    ResourceVector capacity;
    LabelMap labels;
    std::vector<Taint> taints;

    bool operator==(const ResourcePool&) const = default;
};

}  // namespace cluster_gate
