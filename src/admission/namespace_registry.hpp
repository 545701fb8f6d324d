/**
 * @file namespace_registry.hpp
 * @brief Set of active namespaces consulted by NamespaceLifecycle.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace cluster_gate {

/**
 * @brief Thread-safe namespace set. Updated by the gateway, read by
 *        admission stages via shared_mutex.
 */
class NamespaceRegistry {
public:
    /// Returns false if the namespace already existed.
    bool add(const std::string& name);
    /// Returns false if the namespace did not exist.
    bool remove(const std::string& name);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> list() const;

private:
    mutable std::shared_mutex mutex_;
    std::set<std::string> namespaces_;
};

}  // namespace cluster_gate
