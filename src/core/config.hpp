/**
 * @file config.hpp
 * @brief Gateway configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "admission/stage.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "priority/priority_registry.hpp"
#include "workload/workload.hpp"

namespace cluster_gate {

struct ServerConfig {
    std::string name = "cluster-gate";
    uint32_t worker_threads = 0;        ///< 0 = hardware_concurrency
};

struct SchedulerConfig {
    std::string strategy = "least_allocated";   ///< "least_allocated", "most_allocated"
    bool preemption_enabled = true;
    uint32_t max_bind_attempts = 2;
};

/**
 * @brief One [[admission.stages]] entry.
 *
 * @c type selects the plugin: "created_by", "priority",
 * "default_resources", "priority_class_default", "required_labels",
 * "namespace_lifecycle" or "webhook" (which also needs @c url).
 */
struct StageConfig {
    std::string name;
    std::string type;
    StageKind kind = StageKind::Validating;
    int order = 0;
    std::vector<std::string> kinds;
    std::vector<Operation> operations;
    std::vector<std::string> namespaces;
    uint32_t timeout_ms = 0;
    FailurePolicy failure_policy = FailurePolicy::Fail;
    std::string url;
};

struct AdmissionConfig {
    std::string created_by_label = "created-by";
    ResourceVector default_requests;              ///< Zero = no defaulting
    std::vector<std::string> required_labels;
    /// When empty, the built-in chain is installed.
    std::vector<StageConfig> stages;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level gateway configuration.
 */
struct Config {
    ServerConfig server;
    SchedulerConfig scheduler;
    AdmissionConfig admission;
    bool system_priority_classes = true;
    std::vector<PriorityClass> priority_classes;
    std::vector<std::string> namespaces{"default"};
    std::vector<ResourcePool> pools;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace cluster_gate
