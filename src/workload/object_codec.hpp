/**
 * @file object_codec.hpp
 * @brief Decoding of admitted request payloads into typed objects.
 * @author Dimitris Kafetzis
 *
 * Payload shapes follow the familiar manifest layout:
 *
 *   Pod:            metadata.{name,namespace}, spec.{priorityClassName,
 *                   priority, preemptionPolicy, resources.requests.{cpu,memory},
 *                   tolerations[], affinity.{required[],preferred[]}}
 *   PriorityClass:  metadata.name, value, globalDefault, preemptionPolicy,
 *                   description
 *   Node:           metadata.{name,labels}, spec.{capacity.{cpu,memory},
 *                   taints[]}
 */

#pragma once

#include "core/result.hpp"
#include "priority/priority_registry.hpp"
#include "workload/workload.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cluster_gate {

/**
 * @brief Build a Workload from a Pod payload.
 *
 * @p namespace_name is the admitted namespace ("default" when empty). A
 * differing metadata.namespace is InvalidArgument. spec.priority and
 * spec.preemptionPolicy are copied as declared; the caller checks them
 * against the resolved priority class.
 */
Result<Workload> workload_from_pod(const nlohmann::json& object,
                                   const std::string& namespace_name);

/// spec.priorityClassName if set and non-empty.
[[nodiscard]] std::optional<std::string> pod_priority_class_name(const nlohmann::json& object);


Result<PriorityClass> priority_class_from_json(const nlohmann::json& object);

Result<ResourcePool> pool_from_node(const nlohmann::json& object);

Result<Taint> taint_from_json(const nlohmann::json& object);
Result<Toleration> toleration_from_json(const nlohmann::json& object);
Result<std::vector<Taint>> taints_from_json(const nlohmann::json& array);

[[nodiscard]] nlohmann::json to_json(const Taint& taint);
[[nodiscard]] nlohmann::json to_json(const ResourcePool& pool);

}  // namespace cluster_gate
