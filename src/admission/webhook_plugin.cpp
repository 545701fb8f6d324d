/**
 * @file webhook_plugin.cpp
 * @brief Webhook-backed mutating and validating plugins.
 * @author Dimitris Kafetzis
 */

#include "admission/webhook_plugin.hpp"

namespace cluster_gate {

namespace {

/// Default client deadline when the stage has none configured.
constexpr std::chrono::milliseconds DEFAULT_WEBHOOK_TIMEOUT{10000};

Result<WebhookResponse> call_webhook(IWebhookClient& client, const AdmissionRequest& request,
                                     std::chrono::milliseconds timeout, std::stop_token stop) {
    auto reply = client.post(request.to_json(), timeout, std::move(stop));
    if (!reply) {
        return Error{ErrorCode::AdmissionFailed,
                     std::string{WEBHOOK_UNAVAILABLE} + ": " + reply.error().message};
    }
    auto parsed = parse_webhook_response(*reply);
    if (!parsed) {
        return Error{ErrorCode::AdmissionFailed,
                     std::string{WEBHOOK_UNAVAILABLE} + ": " + parsed.error().message};
    }
    return parsed;
}

}  // anonymous namespace

Result<WebhookResponse> parse_webhook_response(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidArgument, "webhook response must be a JSON object"};
    }
    auto allowed = doc.find("allowed");
    if (allowed == doc.end() || !allowed->is_boolean()) {
        return Error{ErrorCode::InvalidArgument, "webhook response lacks boolean 'allowed'"};
    }

    WebhookResponse response;
    response.allowed = allowed->get<bool>();
    if (auto reason = doc.find("reason"); reason != doc.end() && reason->is_string()) {
        response.reason = reason->get<std::string>();
    }
    if (auto patch = doc.find("patch"); patch != doc.end() && !patch->is_null()) {
        auto parsed = Patch::from_json(*patch);
        if (!parsed) return parsed.error();
        response.patch = std::move(*parsed);
    }
    return response;
}

// ─────────────────────────────────────────────
// Mutating
// ─────────────────────────────────────────────

WebhookMutatingPlugin::WebhookMutatingPlugin(std::shared_ptr<IWebhookClient> client,
                                             std::chrono::milliseconds timeout)
    : client_(std::move(client))
    , timeout_(timeout.count() > 0 ? timeout : DEFAULT_WEBHOOK_TIMEOUT) {}

Result<Patch> WebhookMutatingPlugin::mutate(const AdmissionRequest& request, std::stop_token stop) {
    auto response = call_webhook(*client_, request, timeout_, std::move(stop));
    if (!response) return response.error();
    if (!response->allowed) {
        return Error{ErrorCode::AdmissionDenied,
                     response->reason.empty() ? "denied by mutating webhook" : response->reason};
    }
    return response->patch;
}

// ─────────────────────────────────────────────
// Validating
// ─────────────────────────────────────────────

WebhookValidatingPlugin::WebhookValidatingPlugin(std::shared_ptr<IWebhookClient> client,
                                                 std::chrono::milliseconds timeout)
    : client_(std::move(client))
    , timeout_(timeout.count() > 0 ? timeout : DEFAULT_WEBHOOK_TIMEOUT) {}

Result<AdmissionVerdict> WebhookValidatingPlugin::validate(const AdmissionRequest& request,
                                                           std::stop_token stop) {
    auto response = call_webhook(*client_, request, timeout_, std::move(stop));
    if (!response) return response.error();
    if (response->allowed) return AdmissionVerdict::allow();
    return AdmissionVerdict::deny(response->reason.empty() ? "denied by validating webhook"
                                                           : response->reason);
}

}  // namespace cluster_gate
