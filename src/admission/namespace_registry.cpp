/**
 * @file namespace_registry.cpp
 * @brief NamespaceRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "admission/namespace_registry.hpp"

#include <mutex>

namespace cluster_gate {

bool NamespaceRegistry::add(const std::string& name) {
    std::unique_lock lock(mutex_);
    return namespaces_.insert(name).second;
}

bool NamespaceRegistry::remove(const std::string& name) {
    std::unique_lock lock(mutex_);
    return namespaces_.erase(name) > 0;
}

bool NamespaceRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return namespaces_.count(name) > 0;
}

std::vector<std::string> NamespaceRegistry::list() const {
    std::shared_lock lock(mutex_);
    return {namespaces_.begin(), namespaces_.end()};
}

}  // namespace cluster_gate
