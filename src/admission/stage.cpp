/**
 * @file stage.cpp
 * @brief Matcher evaluation and AdmissionStage helpers.
 * @author Dimitris Kafetzis
 */

#include "admission/stage.hpp"

namespace cluster_gate {

std::optional<StageKind> parse_stage_kind(std::string_view text) {
    if (text == "mutating" || text == "Mutating") return StageKind::Mutating;
    if (text == "validating" || text == "Validating") return StageKind::Validating;
    return std::nullopt;
}

std::optional<FailurePolicy> parse_failure_policy(std::string_view text) {
    if (text == "Fail" || text == "fail") return FailurePolicy::Fail;
    if (text == "Ignore" || text == "ignore") return FailurePolicy::Ignore;
    return std::nullopt;
}

namespace {

bool set_matches(const std::set<std::string>& allowed, const std::string& value) {
    return allowed.empty() || allowed.count("*") > 0 || allowed.count(value) > 0;
}

}  // anonymous namespace

bool Matcher::matches(const AdmissionRequest& request) const {
    if (!set_matches(kinds, request.kind)) return false;
    if (!operations.empty() && operations.count(request.operation) == 0) return false;
    return set_matches(namespaces, request.namespace_name);
}

AdmissionStage AdmissionStage::mutating(std::string name, int order,
                                        std::shared_ptr<IMutatingPlugin> plugin,
                                        Matcher matcher) {
    AdmissionStage stage;
    stage.name = std::move(name);
    stage.kind = StageKind::Mutating;
    stage.order = order;
    stage.matcher = std::move(matcher);
    stage.plugin = std::move(plugin);
    return stage;
}

AdmissionStage AdmissionStage::validating(std::string name, int order,
                                          std::shared_ptr<IValidatingPlugin> plugin,
                                          Matcher matcher) {
    AdmissionStage stage;
    stage.name = std::move(name);
    stage.kind = StageKind::Validating;
    stage.order = order;
    stage.matcher = std::move(matcher);
    stage.plugin = std::move(plugin);
    return stage;
}

Result<void> AdmissionStage::check() const {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "admission stage has no name"};
    }

    switch (kind) {
        case StageKind::Mutating: {
            auto* p = std::get_if<std::shared_ptr<IMutatingPlugin>>(&plugin);
            if (p == nullptr || !*p) {
                return Error{ErrorCode::InvalidArgument, name,
                             "mutating stage requires a mutating plugin"};
            }
            break;
        }
        case StageKind::Validating: {
            auto* p = std::get_if<std::shared_ptr<IValidatingPlugin>>(&plugin);
            if (p == nullptr || !*p) {
                return Error{ErrorCode::InvalidArgument, name,
                             "validating stage requires a validating plugin"};
            }
            break;
        }
    }
    return Result<void>{};
}

}  // namespace cluster_gate
