/**
 * @file priority_registry.hpp
 * @brief Cluster-wide PriorityClass registry and priority resolution.
 * @author Dimitris Kafetzis
 *
 * The registry is the single writer for PriorityClass objects. The "at most
 * one default class" invariant is enforced by a compare-and-set inside
 * create(), under the registry's exclusive lock, so two concurrent creates
 * that both claim the default cannot both succeed.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace cluster_gate {

constexpr int64_t SYSTEM_CLUSTER_CRITICAL = 2000000000;
constexpr int64_t SYSTEM_NODE_CRITICAL = 2000001000;
/// Highest value a user-defined class may carry.
constexpr int64_t HIGHEST_USER_PRIORITY = 1000000000;

struct PriorityClass {
    std::string name;
    int64_t value = 0;
    bool is_default = false;
    PreemptionPolicy preemption_policy = PreemptionPolicy::CanPreemptLower;
    std::string description;

    bool operator==(const PriorityClass&) const = default;
};

/**
 * @brief Effective priority attached to a workload.
 */
struct ResolvedPriority {
    std::string class_name;   ///< Empty when no class applied
    int64_t value = 0;
    PreemptionPolicy preemption_policy = PreemptionPolicy::CanPreemptLower;
};

class PriorityClassRegistry {
public:
    PriorityClassRegistry() = default;

    PriorityClassRegistry(const PriorityClassRegistry&) = delete;
    PriorityClassRegistry& operator=(const PriorityClassRegistry&) = delete;

    /**
     * @brief Add a class.
     *
     * Fails with AlreadyExists for a taken name, DuplicateDefaultPriorityClass
     * when @p pc claims the default while another class holds it, and
     * InvalidArgument for an empty name or a user class above
     * HIGHEST_USER_PRIORITY.
     */
    Result<void> create(PriorityClass pc);

    /// Install system-cluster-critical and system-node-critical.
    void install_system_classes();

    /// Remove a class. Returns false if it did not exist.
    bool remove(const std::string& name);

    [[nodiscard]] std::optional<PriorityClass> get(const std::string& name) const;
    [[nodiscard]] std::optional<PriorityClass> default_class() const;

    /// Ordered by name.
    [[nodiscard]] std::vector<PriorityClass> list() const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Effective priority for a workload naming @p class_name.
     *
     * A named class that does not exist yields UnknownPriorityClass.
     * No name: the default class, or value 0 with CanPreemptLower.
     */
    [[nodiscard]] Result<ResolvedPriority> resolve(const std::optional<std::string>& class_name) const;

private:
    Result<void> insert_locked(PriorityClass pc);

    mutable std::shared_mutex mutex_;
    std::map<std::string, PriorityClass> classes_;
    std::optional<std::string> default_name_;
};

}  // namespace cluster_gate
