/**
 * @file test_webhook.cpp
 * @brief Unit tests for webhook URL/response parsing, the webhook plugins,
 *        and HttpWebhookClient against a loopback server.
 * @author Dimitris Kafetzis
 */

#include "admission/pipeline.hpp"
#include "admission/webhook_plugin.hpp"
#include "network/webhook_client.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace cluster_gate;
using nlohmann::json;

namespace {

AdmissionRequest pod_request() {
    AdmissionRequest req;
    req.uid = "uid-7";
    req.operation = Operation::Create;
    req.kind = "Pod";
    req.namespace_name = "default";
    req.user = "alice";
    req.object = {{"metadata", {{"name", "web"}}}, {"spec", json::object()}};
    return req;
}

/// Returns a canned reply and records the last body it was sent.
class FakeWebhookClient : public IWebhookClient {
public:
    explicit FakeWebhookClient(Result<json> reply) : reply_(std::move(reply)) {}

    Result<json> post(const json& body, std::chrono::milliseconds timeout, std::stop_token) override {
        last_body = body;
        last_timeout = timeout;
        ++calls;
        return reply_;
    }

    json last_body;
    std::chrono::milliseconds last_timeout{0};
    int calls = 0;

private:
    Result<json> reply_;
};

/**
 * @brief One-shot loopback HTTP server.
 *
 * Accepts a single connection, reads the request headers and body, then
 * either answers with @p response or stays silent for @p stall.
 */
class LoopbackServer {
public:
    LoopbackServer(std::string response, std::chrono::milliseconds stall = std::chrono::milliseconds{0})
        : response_(std::move(response)), stall_(stall) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 1);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::jthread([this](std::stop_token stop) { serve(stop); });
    }

    ~LoopbackServer() {
        thread_.request_stop();
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
    }

    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/admit"; }

    std::string received;

private:
    void serve(std::stop_token stop) {
        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) return;

        char buf[4096];
        std::string data;
        size_t expected = std::string::npos;
        while (true) {
            auto n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            data.append(buf, static_cast<size_t>(n));
            auto split = data.find("\r\n\r\n");
            if (split != std::string::npos && expected == std::string::npos) {
                auto cl = data.find("Content-Length: ");
                expected = split + 4 + std::stoul(data.substr(cl + 16));
            }
            if (expected != std::string::npos && data.size() >= expected) break;
        }
        received = data;

        if (stall_.count() > 0) {
            auto until = std::chrono::steady_clock::now() + stall_;
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        } else {
            ::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
        }
        ::close(client);
    }

    std::string response_;
    std::chrono::milliseconds stall_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::jthread thread_;
};

std::string http_ok(const std::string& body) {
    return "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: "
           + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}

}  // namespace

// ─────────────────────────────────────────────
// URL and response parsing
// ─────────────────────────────────────────────

TEST(WebhookUrlTest, ParsesHostPortPath) {
    auto ep = parse_webhook_url("http://hooks.local:8443/validate/pods");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->host, "hooks.local");
    EXPECT_EQ(ep->port, 8443);
    EXPECT_EQ(ep->path, "/validate/pods");

    auto bare = parse_webhook_url("http://hooks.local");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->port, 80);
    EXPECT_EQ(bare->path, "/");
}

TEST(WebhookUrlTest, RejectsUnsupported) {
    EXPECT_FALSE(parse_webhook_url("https://hooks.local/x").has_value());
    EXPECT_FALSE(parse_webhook_url("ftp://hooks.local").has_value());
    EXPECT_FALSE(parse_webhook_url("http://:80/x").has_value());
    EXPECT_FALSE(parse_webhook_url("http://host:99999/").has_value());
    EXPECT_FALSE(parse_webhook_url("http://host:abc/").has_value());
}

TEST(WebhookResponseTest, AllowedWithPatch) {
    auto parsed = parse_webhook_response(json::parse(R"({
        "allowed": true,
        "patch": [{"op": "add", "path": "/metadata/labels", "value": {"hooked": "yes"}}]
    })"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->allowed);
    EXPECT_EQ(parsed->patch.size(), 1u);
}

TEST(WebhookResponseTest, MissingAllowedIsError) {
    EXPECT_FALSE(parse_webhook_response(json{{"reason", "x"}}).has_value());
    EXPECT_FALSE(parse_webhook_response(json::array()).has_value());
    EXPECT_FALSE(parse_webhook_response(json{{"allowed", "yes"}}).has_value());
}

// ─────────────────────────────────────────────
// Plugins over a fake client
// ─────────────────────────────────────────────

TEST(WebhookPluginTest, ValidatingDenyCarriesReason) {
    auto client = std::make_shared<FakeWebhookClient>(json{{"allowed", false}, {"reason", "image not signed"}});
    WebhookValidatingPlugin plugin(client, std::chrono::milliseconds(250));

    auto verdict = plugin.validate(pod_request(), {});
    ASSERT_TRUE(verdict.has_value());
    EXPECT_FALSE(verdict->allowed);
    EXPECT_EQ(verdict->reason, "image not signed");
    EXPECT_EQ(client->last_body["kind"], "Pod");
    EXPECT_EQ(client->last_timeout, std::chrono::milliseconds(250));
}

TEST(WebhookPluginTest, MutatingReturnsPatch) {
    auto client = std::make_shared<FakeWebhookClient>(json::parse(R"({
        "allowed": true,
        "patch": [{"op": "add", "path": "/metadata/labels", "value": {"hooked": "yes"}}]
    })"));
    WebhookMutatingPlugin plugin(client, std::chrono::milliseconds(0));

    auto req = pod_request();
    auto patch = plugin.mutate(req, {});
    ASSERT_TRUE(patch.has_value());
    auto out = apply_patch(req.object, *patch);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ((*out)["metadata"]["labels"]["hooked"], "yes");
    EXPECT_GT(client->last_timeout.count(), 0);
}

TEST(WebhookPluginTest, TransportFailureIsUnavailable) {
    auto client = std::make_shared<FakeWebhookClient>(Error{ErrorCode::AdmissionFailed, "connection refused"});
    WebhookValidatingPlugin plugin(client, std::chrono::milliseconds(100));

    auto verdict = plugin.validate(pod_request(), {});
    ASSERT_FALSE(verdict.has_value());
    EXPECT_EQ(verdict.error().code, ErrorCode::AdmissionFailed);
    EXPECT_NE(verdict.error().message.find(WEBHOOK_UNAVAILABLE), std::string::npos);
}

TEST(WebhookPluginTest, GarbageAnswerIsUnavailable) {
    auto client = std::make_shared<FakeWebhookClient>(json{{"unexpected", 1}});
    WebhookMutatingPlugin plugin(client, std::chrono::milliseconds(100));
    auto patch = plugin.mutate(pod_request(), {});
    ASSERT_FALSE(patch.has_value());
    EXPECT_NE(patch.error().message.find(WEBHOOK_UNAVAILABLE), std::string::npos);
}

TEST(WebhookPluginTest, FailOpenPolicyAdmits) {
    auto client = std::make_shared<FakeWebhookClient>(Error{ErrorCode::AdmissionFailed, "down"});
    auto closed = AdmissionStage::validating(
        "hook", 0, std::make_shared<WebhookValidatingPlugin>(client, std::chrono::milliseconds(50)));
    auto open = closed;
    open.failure_policy = FailurePolicy::Ignore;

    auto closed_pipeline = AdmissionPipeline::create({closed});
    auto open_pipeline = AdmissionPipeline::create({open});
    ASSERT_TRUE(closed_pipeline.has_value());
    ASSERT_TRUE(open_pipeline.has_value());

    auto rejected = closed_pipeline->admit(pod_request());
    EXPECT_FALSE(rejected.verdict.allowed);
    EXPECT_EQ(rejected.verdict.code, ErrorCode::AdmissionFailed);
    EXPECT_NE(rejected.verdict.reason.find(WEBHOOK_UNAVAILABLE), std::string::npos);

    EXPECT_TRUE(open_pipeline->admit(pod_request()).verdict.allowed);
}

// ─────────────────────────────────────────────
// HttpWebhookClient over loopback
// ─────────────────────────────────────────────

TEST(HttpWebhookClientTest, PostsJsonAndParsesReply) {
    LoopbackServer server(http_ok(R"({"allowed": true})"));
    auto endpoint = parse_webhook_url(server.url());
    ASSERT_TRUE(endpoint.has_value());

    HttpWebhookClient client(*endpoint);
    auto reply = client.post(json{{"kind", "Pod"}}, std::chrono::milliseconds(2000), {});
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ((*reply)["allowed"], true);
    EXPECT_EQ(server.received.rfind("POST /admit HTTP/1.1\r\n", 0), 0u);
}

TEST(HttpWebhookClientTest, NonSuccessStatusIsUnavailable) {
    LoopbackServer server("HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\n\r\n");
    auto endpoint = parse_webhook_url(server.url());
    ASSERT_TRUE(endpoint.has_value());
    HttpWebhookClient client(*endpoint);
    auto reply = client.post(json::object(), std::chrono::milliseconds(2000), {});
    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::AdmissionFailed);
}

TEST(HttpWebhookClientTest, SilentServerTimesOut) {
    LoopbackServer server("", std::chrono::milliseconds(3000));
    HttpWebhookClient client(*parse_webhook_url(server.url()));

    auto start = std::chrono::steady_clock::now();
    auto reply = client.post(json::object(), std::chrono::milliseconds(150), {});
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::AdmissionFailed);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(HttpWebhookClientTest, StopTokenAbortsCall) {
    LoopbackServer server("", std::chrono::milliseconds(3000));
    HttpWebhookClient client(*parse_webhook_url(server.url()));

    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.request_stop();
    });

    auto reply = client.post(json::object(), std::chrono::milliseconds(5000), source.get_token());
    ASSERT_FALSE(reply.has_value());
    EXPECT_NE(reply.error().message.find("cancelled"), std::string::npos);
}

TEST(HttpWebhookClientTest, UnreachableEndpointIsUnavailable) {
    // Reserve a loopback port, then release it without listening.
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    const uint16_t port = ntohs(addr.sin_port);
    ::close(fd);

    auto plugin = std::make_shared<WebhookValidatingPlugin>(
        std::make_shared<HttpWebhookClient>(WebhookEndpoint{"127.0.0.1", port, "/"}),
        std::chrono::milliseconds(300));
    auto verdict = plugin->validate(pod_request(), {});
    ASSERT_FALSE(verdict.has_value());
    EXPECT_EQ(verdict.error().code, ErrorCode::AdmissionFailed);
    EXPECT_NE(verdict.error().message.find(WEBHOOK_UNAVAILABLE), std::string::npos);
}
