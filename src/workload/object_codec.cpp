/**
 * @file object_codec.cpp
 * @brief Payload decoding for pods, priority classes and nodes.
 * @author Dimitris Kafetzis
 */

#include "workload/object_codec.hpp"

#include "workload/quantity.hpp"

namespace cluster_gate {

namespace {

const nlohmann::json* find_object(const nlohmann::json& parent, const char* key) {
    if (!parent.is_object()) return nullptr;
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_object()) return nullptr;
    return &*it;
}

const nlohmann::json* find_array(const nlohmann::json& parent, const char* key) {
    if (!parent.is_object()) return nullptr;
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_array()) return nullptr;
    return &*it;
}

std::string metadata_name(const nlohmann::json& object) {
    const auto* meta = find_object(object, "metadata");
    if (meta == nullptr) return {};
    return meta->value("name", std::string{});
}

Result<AffinityTerm> affinity_term_from_json(const nlohmann::json& entry) {
    if (!entry.is_object()) {
        return Error{ErrorCode::InvalidArgument, "affinity term must be an object"};
    }
    AffinityTerm term;
    term.key = entry.value("key", std::string{});
    if (term.key.empty()) {
        return Error{ErrorCode::InvalidArgument, "affinity term requires a key"};
    }
    if (const auto* values = find_array(entry, "values")) {
        for (const auto& v : *values) {
            term.values.push_back(v.get<std::string>());
        }
    }
    return term;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Taints & Tolerations
// ─────────────────────────────────────────────

Result<Taint> taint_from_json(const nlohmann::json& object) {
    if (!object.is_object()) {
        return Error{ErrorCode::InvalidArgument, "taint must be an object"};
    }
    Taint taint;
    taint.key = object.value("key", std::string{});
    taint.value = object.value("value", std::string{});
    if (taint.key.empty()) {
        return Error{ErrorCode::InvalidArgument, "taint requires a key"};
    }
    auto effect = parse_taint_effect(object.value("effect", std::string{}));
    if (!effect) {
        return Error{ErrorCode::InvalidArgument,
                     "taint '" + taint.key + "' has unknown effect '"
                     + object.value("effect", std::string{}) + "'"};
    }
    taint.effect = *effect;
    return taint;
}

Result<std::vector<Taint>> taints_from_json(const nlohmann::json& array) {
    if (!array.is_array()) {
        return Error{ErrorCode::InvalidArgument, "taints must be an array"};
    }
    std::vector<Taint> taints;
    for (const auto& entry : array) {
        auto taint = taint_from_json(entry);
        if (!taint) return taint.error();
        taints.push_back(std::move(*taint));
    }
    return taints;
}

Result<Toleration> toleration_from_json(const nlohmann::json& object) {
    if (!object.is_object()) {
        return Error{ErrorCode::InvalidArgument, "toleration must be an object"};
    }
    Toleration tol;
    tol.key = object.value("key", std::string{});
    tol.value = object.value("value", std::string{});

    const auto op = object.value("operator", std::string{"Equal"});
    if (op == "Exists") {
        tol.op = Toleration::Operator::Exists;
    } else if (op == "Equal") {
        tol.op = Toleration::Operator::Equal;
        if (tol.key.empty()) {
            return Error{ErrorCode::InvalidArgument, "toleration with operator Equal requires a key"};
        }
    } else {
        return Error{ErrorCode::InvalidArgument, "unknown toleration operator '" + op + "'"};
    }

    const auto effect = object.value("effect", std::string{});
    if (!effect.empty()) {
        auto parsed = parse_taint_effect(effect);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument, "unknown toleration effect '" + effect + "'"};
        }
        tol.effect = *parsed;
    }
    return tol;
}

nlohmann::json to_json(const Taint& taint) {
    return nlohmann::json{
        {"key", taint.key}, {"value", taint.value}, {"effect", to_string(taint.effect)}
    };
}

// ─────────────────────────────────────────────
// Pod
// ─────────────────────────────────────────────

std::optional<std::string> pod_priority_class_name(const nlohmann::json& object) {
    const auto* spec = find_object(object, "spec");
    if (spec == nullptr) return std::nullopt;
    auto it = spec->find("priorityClassName");
    if (it == spec->end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

Result<Workload> workload_from_pod(const nlohmann::json& object,
                                   const std::string& namespace_name) {
    try {
        Workload w;
        w.name = metadata_name(object);
        if (w.name.empty()) {
            return Error{ErrorCode::InvalidArgument, "pod has no metadata.name"};
        }

        w.namespace_name = namespace_name.empty() ? std::string{"default"} : namespace_name;
        if (const auto* meta = find_object(object, "metadata")) {
            const auto payload_ns = meta->value("namespace", std::string{});
            if (!payload_ns.empty() && payload_ns != w.namespace_name) {
                return Error{ErrorCode::InvalidArgument,
                             "pod '" + w.name + "' declares namespace '" + payload_ns
                             + "' but was admitted into '" + w.namespace_name + "'"};
            }
        }
        w.id = Workload::make_id(w.namespace_name, w.name);

        const auto* spec = find_object(object, "spec");
        if (spec == nullptr) return w;

        w.priority_class_name = spec->value("priorityClassName", std::string{});
        if (auto it = spec->find("priority"); it != spec->end()) {
            w.priority = it->get<int64_t>();
        }
        if (auto it = spec->find("preemptionPolicy"); it != spec->end()) {
            auto policy = parse_preemption_policy(it->get<std::string>());
            if (!policy) {
                return Error{ErrorCode::InvalidArgument,
                             "unknown preemptionPolicy '" + it->get<std::string>() + "'"};
            }
            w.preemption_policy = *policy;
        }

        if (const auto* resources = find_object(*spec, "resources")) {
            if (const auto* requests = find_object(*resources, "requests")) {
                if (auto it = requests->find("cpu"); it != requests->end()) {
                    auto cpu = cpu_millis_from_json(*it);
                    if (!cpu) return cpu.error();
                    w.demand.cpu_millis = *cpu;
                }
                if (auto it = requests->find("memory"); it != requests->end()) {
                    auto mem = memory_bytes_from_json(*it);
                    if (!mem) return mem.error();
                    w.demand.memory_bytes = *mem;
                }
            }
        }

        if (const auto* tolerations = find_array(*spec, "tolerations")) {
            for (const auto& entry : *tolerations) {
                auto tol = toleration_from_json(entry);
                if (!tol) return tol.error();
                w.tolerations.push_back(std::move(*tol));
            }
        }

        if (const auto* affinity = find_object(*spec, "affinity")) {
            if (const auto* required = find_array(*affinity, "required")) {
                for (const auto& entry : *required) {
                    auto term = affinity_term_from_json(entry);
                    if (!term) return term.error();
                    w.required_affinity.push_back(std::move(*term));
                }
            }
            if (const auto* preferred = find_array(*affinity, "preferred")) {
                for (const auto& entry : *preferred) {
                    auto term = affinity_term_from_json(entry);
                    if (!term) return term.error();
                    int32_t weight = entry.value("weight", 1);
                    if (weight < 1 || weight > 100) {
                        return Error{ErrorCode::InvalidArgument,
                                     "preferred affinity weight must be in [1, 100]"};
                    }
                    w.preferred_affinity.push_back({weight, std::move(*term)});
                }
            }
        }
        return w;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string{"malformed pod: "} + e.what()};
    }
}

// ─────────────────────────────────────────────
// PriorityClass
// ─────────────────────────────────────────────

Result<PriorityClass> priority_class_from_json(const nlohmann::json& object) {
    try {
        PriorityClass pc;
        pc.name = metadata_name(object);
        if (pc.name.empty()) {
            return Error{ErrorCode::InvalidArgument, "priority class has no metadata.name"};
        }
        auto value = object.find("value");
        if (value == object.end() || !value->is_number_integer()) {
            return Error{ErrorCode::InvalidArgument,
                         "priority class '" + pc.name + "' requires an integer value"};
        }
        pc.value = value->get<int64_t>();
        pc.is_default = object.value("globalDefault", false);
        pc.description = object.value("description", std::string{});

        const auto policy_text = object.value("preemptionPolicy", std::string{"PreemptLowerPriority"});
        auto policy = parse_preemption_policy(policy_text);
        if (!policy) {
            return Error{ErrorCode::InvalidArgument, "unknown preemptionPolicy '" + policy_text + "'"};
        }
        pc.preemption_policy = *policy;
        return pc;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string{"malformed priority class: "} + e.what()};
    }
}

// ─────────────────────────────────────────────
// Node / ResourcePool
// ─────────────────────────────────────────────

Result<ResourcePool> pool_from_node(const nlohmann::json& object) {
    try {
        ResourcePool pool;
        pool.id = metadata_name(object);
        if (pool.id.empty()) {
            return Error{ErrorCode::InvalidArgument, "node has no metadata.name"};
        }

        if (const auto* meta = find_object(object, "metadata")) {
            if (const auto* labels = find_object(*meta, "labels")) {
                for (const auto& [key, value] : labels->items()) {
                    pool.labels[key] = value.get<std::string>();
                }
            }
        }

        const auto* spec = find_object(object, "spec");
        if (spec == nullptr) {
            return Error{ErrorCode::InvalidArgument, "node '" + pool.id + "' has no spec"};
        }
        const auto* capacity = find_object(*spec, "capacity");
        if (capacity == nullptr) {
            return Error{ErrorCode::InvalidArgument, "node '" + pool.id + "' has no spec.capacity"};
        }
        if (auto it = capacity->find("cpu"); it != capacity->end()) {
            auto cpu = cpu_millis_from_json(*it);
            if (!cpu) return cpu.error();
            pool.capacity.cpu_millis = *cpu;
        }
        if (auto it = capacity->find("memory"); it != capacity->end()) {
            auto mem = memory_bytes_from_json(*it);
            if (!mem) return mem.error();
            pool.capacity.memory_bytes = *mem;
        }

        if (auto it = spec->find("taints"); it != spec->end()) {
            auto taints = taints_from_json(*it);
            if (!taints) return taints.error();
            pool.taints = std::move(*taints);
        }
        return pool;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string{"malformed node: "} + e.what()};
    }
}

nlohmann::json to_json(const ResourcePool& pool) {
    auto taints = nlohmann::json::array();
    for (const auto& t : pool.taints) taints.push_back(to_json(t));
    return nlohmann::json{
        {"metadata", {{"name", pool.id}, {"labels", pool.labels}}},
        {"spec", {
            {"capacity", {{"cpu", format_cpu_millis(pool.capacity.cpu_millis)},
                          {"memory", format_memory_bytes(pool.capacity.memory_bytes)}}},
            {"taints", std::move(taints)}
        }}
    };
}

}  // namespace cluster_gate
