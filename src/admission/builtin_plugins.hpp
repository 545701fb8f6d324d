/**
 * @file builtin_plugins.hpp
 * @brief In-process admission plugins shipped with ClusterGate.
 * @author Dimitris Kafetzis
 *
 * Mutating:
 *   CreatedByLabeler        metadata.labels.<key> = request user
 *   PriorityResolver        spec.priority / spec.preemptionPolicy from the
 *                           PriorityClass registry
 *   DefaultResourceRequests fills absent spec.resources.requests entries
 * Validating:
 *   PriorityClassDefault    at most one globalDefault PriorityClass
 *   RequiredLabels          listed metadata.labels keys must be present
 *   NamespaceLifecycle      objects may only be created in existing namespaces
 */

#pragma once

#include "admission/namespace_registry.hpp"
#include "admission/stage.hpp"
#include "core/types.hpp"
#include "priority/priority_registry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cluster_gate {

constexpr std::string_view DEFAULT_CREATED_BY_LABEL = "created-by";
/// Label value used when the request carries no user.
constexpr std::string_view ANONYMOUS_USER = "system:anonymous";

// ─────────────────────────────────────────────
// Mutating
// ─────────────────────────────────────────────

class CreatedByLabeler : public IMutatingPlugin {
public:
    explicit CreatedByLabeler(std::string label_key = std::string{DEFAULT_CREATED_BY_LABEL});

    Result<Patch> mutate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    std::string label_key_;
};

/**
 * @brief Resolves spec.priorityClassName against the registry.
 *
 * An unknown class fails with UnknownPriorityClass. When no class is named
 * and a default exists, spec.priorityClassName is filled in as well.
 */
class PriorityResolver : public IMutatingPlugin {
public:
    explicit PriorityResolver(std::shared_ptr<const PriorityClassRegistry> registry);

    Result<Patch> mutate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    std::shared_ptr<const PriorityClassRegistry> registry_;
};

class DefaultResourceRequests : public IMutatingPlugin {
public:
    explicit DefaultResourceRequests(ResourceVector defaults);

    Result<Patch> mutate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    ResourceVector defaults_;
};

// ─────────────────────────────────────────────
// Validating
// ─────────────────────────────────────────────

/**
 * @brief Rejects a PriorityClass claiming globalDefault while another class
 *        holds it (DuplicateDefaultPriorityClass), and creates that reuse an
 *        existing name (AlreadyExists).
 */
class PriorityClassDefault : public IValidatingPlugin {
public:
    explicit PriorityClassDefault(std::shared_ptr<const PriorityClassRegistry> registry);

    Result<AdmissionVerdict> validate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    std::shared_ptr<const PriorityClassRegistry> registry_;
};

class RequiredLabels : public IValidatingPlugin {
public:
    explicit RequiredLabels(std::vector<std::string> keys);

    Result<AdmissionVerdict> validate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    std::vector<std::string> keys_;
};

class NamespaceLifecycle : public IValidatingPlugin {
public:
    explicit NamespaceLifecycle(std::shared_ptr<const NamespaceRegistry> namespaces);

    Result<AdmissionVerdict> validate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    std::shared_ptr<const NamespaceRegistry> namespaces_;
};

}  // namespace cluster_gate
