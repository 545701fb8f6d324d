/**
 * @file webhook_client.hpp
 * @brief Client side of external admission webhooks.
 * @author Dimitris Kafetzis
 *
 * A webhook receives the request envelope as a JSON body and answers with
 *   {"allowed": bool, "reason": str, "patch": [RFC 6902 ops]}.
 * HttpWebhookClient speaks plain HTTP/1.1 over a non-blocking TCP socket,
 * one connection per call ("Connection: close"), using poll() for every
 * wait so the call honours both its deadline and its stop token.
 */

#pragma once

#include "core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>

namespace cluster_gate {

struct WebhookEndpoint {
    std::string host;
    uint16_t port = 80;
    std::string path = "/";

    [[nodiscard]] std::string to_string() const;
};

/// Parse "http://host[:port][/path]". HTTPS is rejected.
Result<WebhookEndpoint> parse_webhook_url(const std::string& url);

/**
 * @brief Abstract interface for webhook transports.
 *
 * Implementations return AdmissionFailed for anything that prevents an
 * answer: connect failure, timeout, cancellation, non-2xx status, or a body
 * that is not JSON.
 */
class IWebhookClient {
public:
    virtual ~IWebhookClient() = default;
    virtual Result<nlohmann::json> post(const nlohmann::json& body,
                                        std::chrono::milliseconds timeout,
                                        std::stop_token stop) = 0;
};

class HttpWebhookClient : public IWebhookClient {
public:
    static constexpr size_t MAX_RESPONSE_SIZE = 4 * 1024 * 1024;  // 4 MB

    explicit HttpWebhookClient(WebhookEndpoint endpoint);

    Result<nlohmann::json> post(const nlohmann::json& body,
                                std::chrono::milliseconds timeout,
                                std::stop_token stop) override;

    [[nodiscard]] const WebhookEndpoint& endpoint() const noexcept { return endpoint_; }

private:
    WebhookEndpoint endpoint_;
};

}  // namespace cluster_gate
