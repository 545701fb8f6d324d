/**
 * @file types.cpp
 * @brief Parsers for the enumerations in types.hpp.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

namespace cluster_gate {

std::optional<Operation> parse_operation(std::string_view text) {
    if (text == "CREATE" || text == "create") return Operation::Create;
    if (text == "UPDATE" || text == "update") return Operation::Update;
    if (text == "DELETE" || text == "delete") return Operation::Delete;
    return std::nullopt;
}

std::optional<PreemptionPolicy> parse_preemption_policy(std::string_view text) {
    if (text == "PreemptLowerPriority" || text == "CanPreemptLower") {
        return PreemptionPolicy::CanPreemptLower;
    }
    if (text == "Never" || text == "NeverPreempt") {
        return PreemptionPolicy::NeverPreempt;
    }
    return std::nullopt;
}

std::optional<TaintEffect> parse_taint_effect(std::string_view text) {
    if (text == "NoSchedule") return TaintEffect::NoSchedule;
    if (text == "PreferNoSchedule") return TaintEffect::PreferNoSchedule;
    if (text == "NoExecute") return TaintEffect::NoExecute;
    return std::nullopt;
}

}  // namespace cluster_gate
