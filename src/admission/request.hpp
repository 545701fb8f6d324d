/**
 * @file request.hpp
 * @brief Resource mutation request flowing through the admission pipeline.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cluster_gate {

/**
 * @brief A single create/update/delete request for one object.
 *
 * The identity in @c user has already been authenticated upstream.
 * The pipeline never edits a Request in place; every stage that mutates
 * produces a new payload which replaces the previous one atomically.
 */
struct AdmissionRequest {
    std::string uid;
    Operation operation = Operation::Create;
    std::string kind;            ///< "Pod", "PriorityClass", "Node", "Namespace", ...
    std::string namespace_name;  ///< Empty for cluster-scoped kinds
    std::string user;
    nlohmann::json object = nlohmann::json::object();

    /// metadata.name of the payload, or empty.
    [[nodiscard]] std::string object_name() const;

    /// Wire form used by webhooks and the request log.
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Make the envelope namespace agree with metadata.namespace.
     *
     * An empty envelope namespace takes the payload's. A payload namespace
     * that differs from a non-empty envelope namespace is InvalidArgument.
     */
    Result<void> reconcile_namespace();

    /// Parse the wire form. Unknown operations and missing kinds are rejected.
    static Result<AdmissionRequest> from_json(const nlohmann::json& doc);
};

/**
 * @brief Final word on a request.
 */
struct AdmissionVerdict {
    bool allowed = true;
    ErrorCode code = ErrorCode::AdmissionDenied;   ///< Meaningful only when denied
    std::string stage;                             ///< Stage that denied
    std::string reason;

    [[nodiscard]] static AdmissionVerdict allow() { return AdmissionVerdict{}; }

    [[nodiscard]] static AdmissionVerdict deny(std::string reason) {
        return AdmissionVerdict{false, ErrorCode::AdmissionDenied, {}, std::move(reason)};
    }

    [[nodiscard]] static AdmissionVerdict reject(const Error& error) {
        return AdmissionVerdict{false, error.code, error.stage, error.message};
    }

    [[nodiscard]] Error to_error() const { return Error{code, stage, reason}; }
};

/**
 * @brief Output of AdmissionPipeline::admit().
 *
 * On rejection @c request is the request exactly as it was submitted.
 */
struct AdmissionReview {
    AdmissionRequest request;
    AdmissionVerdict verdict;
    std::vector<std::string> evaluated_stages;
};

}  // namespace cluster_gate
