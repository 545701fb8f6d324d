/**
 * @file request.cpp
 * @brief AdmissionRequest wire form.
 * @author Dimitris Kafetzis
 */

#include "admission/request.hpp"

namespace cluster_gate {

std::string AdmissionRequest::object_name() const {
    if (!object.is_object()) return {};
    auto meta = object.find("metadata");
    if (meta == object.end() || !meta->is_object()) return {};
    auto name = meta->find("name");
    if (name == meta->end() || !name->is_string()) return {};
    return name->get<std::string>();
}

nlohmann::json AdmissionRequest::to_json() const {
    return nlohmann::json{
        {"uid", uid},
        {"operation", to_string(operation)},
        {"kind", kind},
        {"namespace", namespace_name},
        {"user", user},
        {"object", object}
    };
}

Result<void> AdmissionRequest::reconcile_namespace() {
    if (!object.is_object()) return {};
    auto meta = object.find("metadata");
    if (meta == object.end() || !meta->is_object()) return {};
    auto ns = meta->find("namespace");
    if (ns == meta->end() || !ns->is_string()) return {};

    const auto& payload_ns = ns->get_ref<const std::string&>();
    if (payload_ns.empty()) return {};
    if (namespace_name.empty()) {
        namespace_name = payload_ns;
        return {};
    }
    if (payload_ns != namespace_name) {
        return Error{ErrorCode::InvalidArgument,
                     "request namespace '" + namespace_name + "' does not match metadata.namespace '"
                     + payload_ns + "'"};
    }
    return {};
}

Result<AdmissionRequest> AdmissionRequest::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidArgument, "request must be a JSON object"};
    }

    try {
        AdmissionRequest req;
        req.uid = doc.value("uid", std::string{});
        req.kind = doc.value("kind", std::string{});
        req.namespace_name = doc.value("namespace", std::string{});
        req.user = doc.value("user", std::string{});

        if (req.kind.empty()) {
            return Error{ErrorCode::InvalidArgument, "request has no kind"};
        }

        auto op = parse_operation(doc.value("operation", std::string{"CREATE"}));
        if (!op) {
            return Error{ErrorCode::InvalidArgument,
                         "unknown operation '" + doc.value("operation", std::string{}) + "'"};
        }
        req.operation = *op;

        if (auto it = doc.find("object"); it != doc.end()) {
            if (!it->is_object()) {
                return Error{ErrorCode::InvalidArgument, "request object must be a JSON object"};
            }
            req.object = *it;
        }

        if (auto ok = req.reconcile_namespace(); !ok) return ok.error();
        return req;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string{"malformed request: "} + e.what()};
    }
}

}  // namespace cluster_gate
