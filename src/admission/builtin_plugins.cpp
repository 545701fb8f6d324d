/**
 * @file builtin_plugins.cpp
 * @brief Built-in admission plugins.
 * @author Dimitris Kafetzis
 */

#include "admission/builtin_plugins.hpp"

#include "workload/object_codec.hpp"
#include "workload/quantity.hpp"

namespace cluster_gate {

namespace {

/**
 * @brief Append a set_nested edit to @p out and apply it to @p working, so
 *        later edits see the parents it created.
 */
Result<void> stage_set(nlohmann::json& working, Patch& out,
                       const std::vector<std::string>& tokens, nlohmann::json value) {
    auto edit = set_nested(working, tokens, std::move(value));
    auto applied = apply_patch(working, edit);
    if (!applied) return applied.error();
    working = std::move(*applied);
    out.append(edit);
    return {};
}

const nlohmann::json* labels_of(const nlohmann::json& object) {
    if (!object.is_object()) return nullptr;
    auto meta = object.find("metadata");
    if (meta == object.end() || !meta->is_object()) return nullptr;
    auto labels = meta->find("labels");
    if (labels == meta->end() || !labels->is_object()) return nullptr;
    return &*labels;
}

bool has_request(const nlohmann::json& object, const char* resource) {
    auto spec = object.find("spec");
    if (spec == object.end() || !spec->is_object()) return false;
    auto resources = spec->find("resources");
    if (resources == spec->end() || !resources->is_object()) return false;
    auto requests = resources->find("requests");
    if (requests == resources->end() || !requests->is_object()) return false;
    return requests->contains(resource);
}

AdmissionVerdict deny_with(ErrorCode code, std::string reason) {
    return AdmissionVerdict{false, code, {}, std::move(reason)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// CreatedByLabeler
// ─────────────────────────────────────────────

CreatedByLabeler::CreatedByLabeler(std::string label_key)
    : label_key_(std::move(label_key)) {}

Result<Patch> CreatedByLabeler::mutate(const AdmissionRequest& request, std::stop_token) {
    if (request.operation == Operation::Delete) return Patch{};

    const std::string user = request.user.empty() ? std::string{ANONYMOUS_USER} : request.user;
    if (const auto* labels = labels_of(request.object)) {
        auto it = labels->find(label_key_);
        if (it != labels->end() && it->is_string() && it->get_ref<const std::string&>() == user) {
            return Patch{};
        }
    }
    return set_nested(request.object, {"metadata", "labels", label_key_}, user);
}

// ─────────────────────────────────────────────
// PriorityResolver
// ─────────────────────────────────────────────

PriorityResolver::PriorityResolver(std::shared_ptr<const PriorityClassRegistry> registry)
    : registry_(std::move(registry)) {}

Result<Patch> PriorityResolver::mutate(const AdmissionRequest& request, std::stop_token) {
    if (request.operation == Operation::Delete) return Patch{};

    auto requested = pod_priority_class_name(request.object);
    auto resolved = registry_->resolve(requested);
    if (!resolved) return resolved.error();

    Patch patch;
    nlohmann::json working = request.object;

    if (!requested && !resolved->class_name.empty()) {
        auto ok = stage_set(working, patch, {"spec", "priorityClassName"}, resolved->class_name);
        if (!ok) return ok.error();
    }
    if (auto ok = stage_set(working, patch, {"spec", "priority"}, resolved->value); !ok) {
        return ok.error();
    }
    if (auto ok = stage_set(working, patch, {"spec", "preemptionPolicy"},
                            std::string{to_string(resolved->preemption_policy)});
        !ok) {
        return ok.error();
    }
    return patch;
}

// ─────────────────────────────────────────────
// DefaultResourceRequests
// ─────────────────────────────────────────────

DefaultResourceRequests::DefaultResourceRequests(ResourceVector defaults)
    : defaults_(defaults) {}

Result<Patch> DefaultResourceRequests::mutate(const AdmissionRequest& request, std::stop_token) {
    if (request.operation != Operation::Create) return Patch{};

    Patch patch;
    nlohmann::json working = request.object;

    if (defaults_.cpu_millis > 0 && !has_request(working, "cpu")) {
        auto ok = stage_set(working, patch, {"spec", "resources", "requests", "cpu"},
                            format_cpu_millis(defaults_.cpu_millis));
        if (!ok) return ok.error();
    }
    if (defaults_.memory_bytes > 0 && !has_request(working, "memory")) {
        auto ok = stage_set(working, patch, {"spec", "resources", "requests", "memory"},
                            format_memory_bytes(defaults_.memory_bytes));
        if (!ok) return ok.error();
    }
    return patch;
}

// ─────────────────────────────────────────────
// PriorityClassDefault
// ─────────────────────────────────────────────

PriorityClassDefault::PriorityClassDefault(std::shared_ptr<const PriorityClassRegistry> registry)
    : registry_(std::move(registry)) {}

Result<AdmissionVerdict> PriorityClassDefault::validate(const AdmissionRequest& request,
                                                        std::stop_token) {
    if (request.kind != "PriorityClass" || request.operation == Operation::Delete) {
        return AdmissionVerdict::allow();
    }

    auto pc = priority_class_from_json(request.object);
    if (!pc) return deny_with(ErrorCode::InvalidArgument, pc.error().message);

    if (request.operation == Operation::Create && registry_->get(pc->name)) {
        return deny_with(ErrorCode::AlreadyExists,
                         "priority class '" + pc->name + "' already exists");
    }
    if (pc->is_default) {
        auto current = registry_->default_class();
        if (current && current->name != pc->name) {
            return deny_with(ErrorCode::DuplicateDefaultPriorityClass,
                             "priority class '" + current->name + "' is already the global default");
        }
    }
    return AdmissionVerdict::allow();
}

// ─────────────────────────────────────────────
// RequiredLabels
// ─────────────────────────────────────────────

RequiredLabels::RequiredLabels(std::vector<std::string> keys)
    : keys_(std::move(keys)) {}

Result<AdmissionVerdict> RequiredLabels::validate(const AdmissionRequest& request, std::stop_token) {
    if (request.operation == Operation::Delete) return AdmissionVerdict::allow();

    const auto* labels = labels_of(request.object);
    std::string missing;
    for (const auto& key : keys_) {
        if (labels != nullptr && labels->contains(key)) continue;
        if (!missing.empty()) missing += ", ";
        missing += key;
    }
    if (missing.empty()) return AdmissionVerdict::allow();
    return AdmissionVerdict::deny("missing required label(s): " + missing);
}

// ─────────────────────────────────────────────
// NamespaceLifecycle
// ─────────────────────────────────────────────

NamespaceLifecycle::NamespaceLifecycle(std::shared_ptr<const NamespaceRegistry> namespaces)
    : namespaces_(std::move(namespaces)) {}

Result<AdmissionVerdict> NamespaceLifecycle::validate(const AdmissionRequest& request, std::stop_token) {
    if (request.operation != Operation::Create || request.namespace_name.empty()
        || request.kind == "Namespace") {
        return AdmissionVerdict::allow();
    }
    if (!namespaces_->contains(request.namespace_name)) {
        return deny_with(ErrorCode::NotFound,
                         "namespace '" + request.namespace_name + "' does not exist");
    }
    return AdmissionVerdict::allow();
}

}  // namespace cluster_gate
