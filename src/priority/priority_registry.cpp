/**
 * @file priority_registry.cpp
 * @brief PriorityClassRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "priority/priority_registry.hpp"

#include <mutex>

namespace cluster_gate {

namespace {

bool is_system_name(const std::string& name) {
    return name.rfind("system-", 0) == 0;
}

}  // anonymous namespace

Result<void> PriorityClassRegistry::create(PriorityClass pc) {
    std::unique_lock lock(mutex_);
    return insert_locked(std::move(pc));
}

void PriorityClassRegistry::install_system_classes() {
    std::unique_lock lock(mutex_);
    for (auto&& pc : {
             PriorityClass{"system-cluster-critical", SYSTEM_CLUSTER_CRITICAL, false,
                           PreemptionPolicy::CanPreemptLower,
                           "Used for system critical workloads that must run in the cluster"},
             PriorityClass{"system-node-critical", SYSTEM_NODE_CRITICAL, false,
                           PreemptionPolicy::CanPreemptLower,
                           "Used for system critical workloads that must not be moved from their pool"}}) {
        if (classes_.count(pc.name) == 0) {
            classes_.emplace(pc.name, pc);
        }
    }
}

Result<void> PriorityClassRegistry::insert_locked(PriorityClass pc) {
    if (pc.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "priority class name must not be empty"};
    }
    if (is_system_name(pc.name)) {
        return Error{ErrorCode::InvalidArgument,
                     "priority class names with prefix 'system-' are reserved"};
    }
    if (pc.value > HIGHEST_USER_PRIORITY) {
        return Error{ErrorCode::InvalidArgument,
                     "priority class '" + pc.name + "' value " + std::to_string(pc.value)
                     + " exceeds " + std::to_string(HIGHEST_USER_PRIORITY)};
    }
    if (classes_.count(pc.name) > 0) {
        return Error{ErrorCode::AlreadyExists, "priority class '" + pc.name + "' already exists"};
    }
    if (pc.is_default && default_name_) {
        return Error{ErrorCode::DuplicateDefaultPriorityClass,
                     "priority class '" + *default_name_
                     + "' is already the default; cannot make '" + pc.name + "' default"};
    }

    if (pc.is_default) default_name_ = pc.name;
    classes_.emplace(pc.name, std::move(pc));
    return Result<void>{};
}

bool PriorityClassRegistry::remove(const std::string& name) {
    std::unique_lock lock(mutex_);
    auto it = classes_.find(name);
    if (it == classes_.end()) return false;
    if (default_name_ && *default_name_ == name) default_name_.reset();
    classes_.erase(it);
    return true;
}

std::optional<PriorityClass> PriorityClassRegistry::get(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = classes_.find(name);
    if (it == classes_.end()) return std::nullopt;
    return it->second;
}

std::optional<PriorityClass> PriorityClassRegistry::default_class() const {
    std::shared_lock lock(mutex_);
    if (!default_name_) return std::nullopt;
    return classes_.at(*default_name_);
}

std::vector<PriorityClass> PriorityClassRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<PriorityClass> out;
    out.reserve(classes_.size());
    for (const auto& [name, pc] : classes_) out.push_back(pc);
    return out;
}

size_t PriorityClassRegistry::size() const {
    std::shared_lock lock(mutex_);
    return classes_.size();
}

Result<ResolvedPriority> PriorityClassRegistry::resolve(
    const std::optional<std::string>& class_name) const {
    std::shared_lock lock(mutex_);

    if (class_name && !class_name->empty()) {
        auto it = classes_.find(*class_name);
        if (it == classes_.end()) {
            return Error{ErrorCode::UnknownPriorityClass,
                         "no priority class named '" + *class_name + "'"};
        }
        return ResolvedPriority{it->second.name, it->second.value, it->second.preemption_policy};
    }

    if (default_name_) {
        const auto& pc = classes_.at(*default_name_);
        return ResolvedPriority{pc.name, pc.value, pc.preemption_policy};
    }
    return ResolvedPriority{};
}

}  // namespace cluster_gate
