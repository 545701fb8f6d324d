/**
 * @file workload.cpp
 * @brief Toleration and affinity matching.
 * @author Dimitris Kafetzis
 */

#include "workload/workload.hpp"

#include <algorithm>

namespace cluster_gate {

bool Toleration::tolerates(const Taint& taint) const {
    if (effect && *effect != taint.effect) return false;

    if (op == Operator::Exists) {
        return key.empty() || key == taint.key;
    }
    return key == taint.key && value == taint.value;
}

bool tolerates_all(const std::vector<Toleration>& tolerations, const Taint& taint) {
    return std::any_of(tolerations.begin(), tolerations.end(),
                       [&](const Toleration& t) { return t.tolerates(taint); });
}

bool AffinityTerm::matches(const LabelMap& labels) const {
    auto it = labels.find(key);
    if (it == labels.end()) return false;
    if (values.empty()) return true;
    return std::find(values.begin(), values.end(), it->second) != values.end();
}

}  // namespace cluster_gate
