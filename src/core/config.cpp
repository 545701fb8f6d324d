/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "workload/quantity.hpp"

#include <toml++/toml.hpp>

namespace cluster_gate {

namespace {

Error config_error(std::string message) {
    return Error{ErrorCode::InvalidArgument, std::move(message)};
}

template <typename View>
Result<std::vector<std::string>> string_list(View view, const std::string& what) {
    std::vector<std::string> out;
    if (!view) return out;
    const auto* arr = view.as_array();
    if (arr == nullptr) return config_error(what + " must be an array of strings");
    for (const auto& elem : *arr) {
        auto s = elem.template value<std::string>();
        if (!s) return config_error(what + " must be an array of strings");
        out.push_back(std::move(*s));
    }
    return out;
}

/// Quantity as TOML string ("500m", "8Gi") or number, via the JSON readers.
template <typename View>
Result<uint64_t> quantity(View view, bool cpu, const std::string& what) {
    nlohmann::json value;
    if (view.is_string()) {
        value = *view.template value<std::string>();
    } else if (view.is_integer()) {
        value = *view.template value<int64_t>();
    } else if (view.is_floating_point()) {
        value = *view.template value<double>();
    } else {
        return config_error(what + " must be a quantity string or number");
    }
    auto parsed = cpu ? cpu_millis_from_json(value) : memory_bytes_from_json(value);
    if (!parsed) return config_error(what + ": " + parsed.error().message);
    return parsed;
}

Result<StageConfig> parse_stage(const toml::table& t, size_t index) {
    StageConfig stage;
    const std::string where = "admission.stages[" + std::to_string(index) + "]";

    stage.name = t["name"].value_or(std::string{});
    stage.type = t["type"].value_or(std::string{});
    if (stage.name.empty()) return config_error(where + " requires a name");
    if (stage.type.empty()) return config_error(where + " requires a type");

    auto kind_text = t["kind"].value_or(std::string{});
    auto kind = parse_stage_kind(kind_text);
    if (!kind) return config_error(where + " has unknown kind '" + kind_text + "'");
    stage.kind = *kind;

    stage.order = static_cast<int>(t["order"].value_or(int64_t{0}));

    auto timeout = t["timeout_ms"].value_or(int64_t{0});
    if (timeout < 0) return config_error(where + " has a negative timeout_ms");
    stage.timeout_ms = static_cast<uint32_t>(timeout);

    auto policy_text = t["failure_policy"].value_or(std::string{"Fail"});
    auto policy = parse_failure_policy(policy_text);
    if (!policy) return config_error(where + " has unknown failure_policy '" + policy_text + "'");
    stage.failure_policy = *policy;

    stage.url = t["url"].value_or(std::string{});

    if (auto match = t["match"]; match.is_table()) {
        auto kinds = string_list(match["kinds"], where + ".match.kinds");
        if (!kinds) return kinds.error();
        stage.kinds = std::move(*kinds);

        auto namespaces = string_list(match["namespaces"], where + ".match.namespaces");
        if (!namespaces) return namespaces.error();
        stage.namespaces = std::move(*namespaces);

        auto operations = string_list(match["operations"], where + ".match.operations");
        if (!operations) return operations.error();
        for (const auto& text : *operations) {
            auto op = parse_operation(text);
            if (!op) return config_error(where + " has unknown operation '" + text + "'");
            stage.operations.push_back(*op);
        }
    }
    return stage;
}

Result<PriorityClass> parse_priority_class(const toml::table& t, size_t index) {
    const std::string where = "priority_classes[" + std::to_string(index) + "]";
    PriorityClass pc;
    pc.name = t["name"].value_or(std::string{});
    if (pc.name.empty()) return config_error(where + " requires a name");

    auto value = t["value"].value<int64_t>();
    if (!value) return config_error(where + " requires an integer value");
    pc.value = *value;
    pc.is_default = t["global_default"].value_or(false);
    pc.description = t["description"].value_or(std::string{});

    auto policy_text = t["preemption_policy"].value_or(std::string{"PreemptLowerPriority"});
    auto policy = parse_preemption_policy(policy_text);
    if (!policy) return config_error(where + " has unknown preemption_policy '" + policy_text + "'");
    pc.preemption_policy = *policy;
    return pc;
}

Result<ResourcePool> parse_pool(const toml::table& t, size_t index) {
    const std::string where = "pools[" + std::to_string(index) + "]";
    ResourcePool pool;
    pool.id = t["name"].value_or(std::string{});
    if (pool.id.empty()) return config_error(where + " requires a name");

    auto cpu = quantity(t["cpu"], true, where + ".cpu");
    if (!cpu) return cpu.error();
    pool.capacity.cpu_millis = *cpu;

    auto memory = quantity(t["memory"], false, where + ".memory");
    if (!memory) return memory.error();
    pool.capacity.memory_bytes = *memory;

    if (const auto* labels = t["labels"].as_table()) {
        for (const auto& [key, value] : *labels) {
            auto s = value.value<std::string>();
            if (!s) return config_error(where + ".labels values must be strings");
            pool.labels[std::string{key.str()}] = std::move(*s);
        }
    }

    if (const auto* taints = t["taints"].as_array()) {
        for (const auto& elem : *taints) {
            const auto* tt = elem.as_table();
            if (tt == nullptr) return config_error(where + ".taints entries must be tables");
            Taint taint;
            taint.key = (*tt)["key"].value_or(std::string{});
            taint.value = (*tt)["value"].value_or(std::string{});
            if (taint.key.empty()) return config_error(where + " has a taint without a key");
            auto effect_text = (*tt)["effect"].value_or(std::string{"NoSchedule"});
            auto effect = parse_taint_effect(effect_text);
            if (!effect) return config_error(where + " has unknown taint effect '" + effect_text + "'");
            taint.effect = *effect;
            pool.taints.push_back(std::move(taint));
        }
    }
    return pool;
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [server]
    if (auto server = tbl["server"]; server.is_table()) {
        config.server.name = server["name"].value_or(std::string{"cluster-gate"});
        config.server.worker_threads = static_cast<uint32_t>(
            server["worker_threads"].value_or(int64_t{0}));
    }

    // [scheduler]
    if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
        config.scheduler.strategy = scheduler["strategy"].value_or(std::string{"least_allocated"});
        config.scheduler.preemption_enabled = scheduler["preemption_enabled"].value_or(true);
        config.scheduler.max_bind_attempts = static_cast<uint32_t>(
            scheduler["max_bind_attempts"].value_or(int64_t{2}));
    }

    // [admission]
    if (auto admission = tbl["admission"]; admission.is_table()) {
        config.admission.created_by_label =
            admission["created_by_label"].value_or(std::string{"created-by"});

        if (auto cpu = admission["default_cpu"]; cpu) {
            auto v = quantity(cpu, true, "admission.default_cpu");
            if (!v) return v.error();
            config.admission.default_requests.cpu_millis = *v;
        }
        if (auto mem = admission["default_memory"]; mem) {
            auto v = quantity(mem, false, "admission.default_memory");
            if (!v) return v.error();
            config.admission.default_requests.memory_bytes = *v;
        }

        auto labels = string_list(admission["required_labels"], "admission.required_labels");
        if (!labels) return labels.error();
        config.admission.required_labels = std::move(*labels);

        // [[admission.stages]]
        if (const auto* stages = admission["stages"].as_array()) {
            for (size_t i = 0; i < stages->size(); ++i) {
                const auto* t = (*stages)[i].as_table();
                if (t == nullptr) return config_error("admission.stages entries must be tables");
                auto stage = parse_stage(*t, i);
                if (!stage) return stage.error();
                config.admission.stages.push_back(std::move(*stage));
            }
        }
    }

    // [[priority_classes]]
    config.system_priority_classes = tbl["system_priority_classes"].value_or(true);
    if (const auto* classes = tbl["priority_classes"].as_array()) {
        for (size_t i = 0; i < classes->size(); ++i) {
            const auto* t = (*classes)[i].as_table();
            if (t == nullptr) return config_error("priority_classes entries must be tables");
            auto pc = parse_priority_class(*t, i);
            if (!pc) return pc.error();
            config.priority_classes.push_back(std::move(*pc));
        }
    }

    // namespaces = [...]
    if (tbl["namespaces"]) {
        auto namespaces = string_list(tbl["namespaces"], "namespaces");
        if (!namespaces) return namespaces.error();
        config.namespaces = std::move(*namespaces);
    }

    // [[pools]]
    if (const auto* pools = tbl["pools"].as_array()) {
        for (size_t i = 0; i < pools->size(); ++i) {
            const auto* t = (*pools)[i].as_table();
            if (t == nullptr) return config_error("pools entries must be tables");
            auto pool = parse_pool(*t, i);
            if (!pool) return pool.error();
            config.pools.push_back(std::move(*pool));
        }
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
    }

    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Config default_config() {
    return Config{};
}

}  // namespace cluster_gate
