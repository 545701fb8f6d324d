/**
 * @file webhook_plugin.hpp
 * @brief Admission stages backed by an external webhook.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "admission/stage.hpp"
#include "network/webhook_client.hpp"

#include <chrono>
#include <memory>

namespace cluster_gate {

/// Message carried by every webhook failure that prevented an answer.
inline constexpr std::string_view WEBHOOK_UNAVAILABLE = "admission webhook unavailable";

/**
 * @brief Decoded webhook answer.
 */
struct WebhookResponse {
    bool allowed = false;
    std::string reason;
    Patch patch;
};

/// Parse {"allowed","reason","patch"}. Missing "allowed" is an error.
Result<WebhookResponse> parse_webhook_response(const nlohmann::json& doc);

class WebhookMutatingPlugin : public IMutatingPlugin {
public:
    WebhookMutatingPlugin(std::shared_ptr<IWebhookClient> client, std::chrono::milliseconds timeout);

    Result<Patch> mutate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    std::shared_ptr<IWebhookClient> client_;
    std::chrono::milliseconds timeout_;
};

class WebhookValidatingPlugin : public IValidatingPlugin {
public:
    WebhookValidatingPlugin(std::shared_ptr<IWebhookClient> client, std::chrono::milliseconds timeout);

    Result<AdmissionVerdict> validate(const AdmissionRequest& request, std::stop_token stop) override;

private:
    std::shared_ptr<IWebhookClient> client_;
    std::chrono::milliseconds timeout_;
};

}  // namespace cluster_gate
