/**
 * @file types.hpp
 * @brief Fundamental types used throughout ClusterGate.
 * @author Dimitris Kafetzis
 *
 * Defines identifiers, the resource demand/capacity vector, and the small
 * enumerations shared by the admission, priority and scheduling layers.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cluster_gate {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using WorkloadId = std::string;   ///< "<namespace>/<name>"
using PoolId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// ─────────────────────────────────────────────
// Resource Vector
// ─────────────────────────────────────────────

/**
 * @brief Demand or capacity along the two schedulable dimensions.
 *
 * CPU is expressed in millicores, memory in bytes.
 */
struct ResourceVector {
    uint64_t cpu_millis{0};
    uint64_t memory_bytes{0};

    auto operator<=>(const ResourceVector&) const = default;

    [[nodiscard]] constexpr bool fits_within(const ResourceVector& other) const noexcept {
        return cpu_millis <= other.cpu_millis && memory_bytes <= other.memory_bytes;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return cpu_millis == 0 && memory_bytes == 0;
    }

    constexpr ResourceVector& operator+=(const ResourceVector& other) noexcept {
        cpu_millis += other.cpu_millis;
        memory_bytes += other.memory_bytes;
        return *this;
    }

    /// Saturating subtraction; never wraps below zero.
    constexpr ResourceVector& operator-=(const ResourceVector& other) noexcept {
        cpu_millis = cpu_millis > other.cpu_millis ? cpu_millis - other.cpu_millis : 0;
        memory_bytes = memory_bytes > other.memory_bytes ? memory_bytes - other.memory_bytes : 0;
        return *this;
    }

    friend constexpr ResourceVector operator+(ResourceVector lhs, const ResourceVector& rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr ResourceVector operator-(ResourceVector lhs, const ResourceVector& rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }
};

// ─────────────────────────────────────────────
// Request Operation
// ─────────────────────────────────────────────

enum class Operation : uint8_t {
    Create,
    Update,
    Delete
};

[[nodiscard]] constexpr std::string_view to_string(Operation op) noexcept {
    switch (op) {
        case Operation::Create: return "CREATE";
        case Operation::Update: return "UPDATE";
        case Operation::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<Operation> parse_operation(std::string_view text);

// ─────────────────────────────────────────────
// Priority
// ─────────────────────────────────────────────

enum class PreemptionPolicy : uint8_t {
    CanPreemptLower,   ///< May evict strictly lower priority workloads
    NeverPreempt       ///< Waits for capacity to free naturally
};

[[nodiscard]] constexpr std::string_view to_string(PreemptionPolicy policy) noexcept {
    switch (policy) {
        case PreemptionPolicy::CanPreemptLower: return "PreemptLowerPriority";
        case PreemptionPolicy::NeverPreempt:    return "Never";
    }
    return "unknown";
}

/// Accepts both the wire names ("PreemptLowerPriority", "Never") and the
/// enumerator names.
[[nodiscard]] std::optional<PreemptionPolicy> parse_preemption_policy(std::string_view text);

// ─────────────────────────────────────────────
// Taints
// ─────────────────────────────────────────────

enum class TaintEffect : uint8_t {
    NoSchedule,
    PreferNoSchedule,
    NoExecute
};

[[nodiscard]] constexpr std::string_view to_string(TaintEffect effect) noexcept {
    switch (effect) {
        case TaintEffect::NoSchedule:       return "NoSchedule";
        case TaintEffect::PreferNoSchedule: return "PreferNoSchedule";
        case TaintEffect::NoExecute:        return "NoExecute";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaintEffect> parse_taint_effect(std::string_view text);

// ─────────────────────────────────────────────
// Workload State
// ─────────────────────────────────────────────

enum class WorkloadState : uint8_t {
    Pending,            ///< Admitted, waiting in the scheduling queue
    Filtering,          ///< Feasible pools being computed
    Scoring,            ///< Feasible pools being ranked
    PendingPreemption,  ///< Victims selected, eviction in progress
    Bound,              ///< Holds an active binding
    Unschedulable       ///< No placement possible until cluster state changes
};

[[nodiscard]] constexpr std::string_view to_string(WorkloadState state) noexcept {
    switch (state) {
        case WorkloadState::Pending:           return "pending";
        case WorkloadState::Filtering:         return "filtering";
        case WorkloadState::Scoring:           return "scoring";
        case WorkloadState::PendingPreemption: return "pending_preemption";
        case WorkloadState::Bound:             return "bound";
        case WorkloadState::Unschedulable:     return "unschedulable";
    }
    return "unknown";
}

}  // namespace cluster_gate
