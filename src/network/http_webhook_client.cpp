/**
 * @file http_webhook_client.cpp
 * @brief HttpWebhookClient implementation, one HTTP/1.1 POST per call.
 * @author Dimitris Kafetzis
 *
 * Every blocking step (connect, send, receive) waits in poll() slices of at
 * most POLL_SLICE_MS so a stop request is observed promptly.
 */

#include "network/webhook_client.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string_view>

namespace cluster_gate {

namespace {

constexpr int POLL_SLICE_MS = 20;

using Clock = std::chrono::steady_clock;

/**
 * @brief Closes the socket when the call returns.
 */
struct SocketGuard {
    int fd = -1;
    ~SocketGuard() {
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
            ::close(fd);
        }
    }
};

Error unavailable(std::string detail) {
    return Error{ErrorCode::AdmissionFailed, std::move(detail)};
}

/**
 * @brief Wait for @p events on @p fd until @p deadline or a stop request.
 */
Result<void> wait_ready(int fd, short events, Clock::time_point deadline,
                        const std::stop_token& stop) {
    while (true) {
        if (stop.stop_requested()) return unavailable("webhook call cancelled");

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) return unavailable("webhook call timed out");

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
        if (ready > 0) return {};
        if (ready < 0 && errno != EINTR) {
            return unavailable("poll failed: " + std::string(strerror(errno)));
        }
    }
}

Result<int> connect_to(const WebhookEndpoint& endpoint, Clock::time_point deadline,
                       const std::stop_token& stop) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* resolved = nullptr;
    auto port = std::to_string(endpoint.port);
    int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        return unavailable("cannot resolve " + endpoint.host + ": " + gai_strerror(rc));
    }

    sockaddr_in addr{};
    std::memcpy(&addr, resolved->ai_addr, sizeof(addr));
    ::freeaddrinfo(resolved);

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        return unavailable("failed to create socket: " + std::string(strerror(errno)));
    }

    int ret = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        auto err = std::string(strerror(errno));
        ::close(fd);
        return unavailable("connect to " + endpoint.to_string() + " failed: " + err);
    }

    if (ret < 0) {
        auto ready = wait_ready(fd, POLLOUT, deadline, stop);
        if (!ready) {
            ::close(fd);
            return ready.error();
        }
        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            ::close(fd);
            return unavailable("connect to " + endpoint.to_string() + " failed: "
                               + std::string(strerror(err)));
        }
    }

    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    return fd;
}

Result<void> send_all(int fd, const std::string& data, Clock::time_point deadline,
                      const std::stop_token& stop) {
    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        auto ready = wait_ready(fd, POLLOUT, deadline, stop);
        if (!ready) return ready;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return unavailable("send failed: " + std::string(strerror(errno)));
        }
        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return {};
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

struct ResponseHead {
    int status = 0;
    std::optional<size_t> content_length;
    bool chunked = false;
};

Result<ResponseHead> parse_head(std::string_view head) {
    ResponseHead out;

    auto line_end = head.find("\r\n");
    auto status_line = head.substr(0, line_end);
    if (!status_line.starts_with("HTTP/1.")) {
        return unavailable("webhook sent a malformed status line");
    }
    auto space = status_line.find(' ');
    if (space == std::string_view::npos || space + 4 > status_line.size()) {
        return unavailable("webhook sent a malformed status line");
    }
    auto code = status_line.substr(space + 1, 3);
    if (std::from_chars(code.data(), code.data() + code.size(), out.status).ec != std::errc{}) {
        return unavailable("webhook sent a malformed status code");
    }

    size_t pos = line_end == std::string_view::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        auto end = head.find("\r\n", pos);
        if (end == std::string_view::npos) end = head.size();
        auto line = head.substr(pos, end - pos);
        pos = end + 2;

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        auto name = lowercase(line.substr(0, colon));
        auto value = line.substr(colon + 1);
        while (!value.empty() && value.front() == ' ') value.remove_prefix(1);

        if (name == "content-length") {
            size_t length = 0;
            if (std::from_chars(value.data(), value.data() + value.size(), length).ec != std::errc{}) {
                return unavailable("webhook sent an invalid Content-Length");
            }
            out.content_length = length;
        } else if (name == "transfer-encoding" && lowercase(value).find("chunked") != std::string::npos) {
            out.chunked = true;
        }
    }
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────

std::string WebhookEndpoint::to_string() const {
    return "http://" + host + ":" + std::to_string(port) + path;
}

Result<WebhookEndpoint> parse_webhook_url(const std::string& url) {
    constexpr std::string_view SCHEME = "http://";
    std::string_view rest = url;
    if (rest.starts_with("https://")) {
        return Error{ErrorCode::InvalidArgument, "https webhooks are not supported: " + url};
    }
    if (!rest.starts_with(SCHEME)) {
        return Error{ErrorCode::InvalidArgument, "webhook url must start with http://: " + url};
    }
    rest.remove_prefix(SCHEME.size());

    WebhookEndpoint endpoint;
    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) endpoint.path = std::string(rest.substr(slash));

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_text = authority.substr(colon + 1);
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
            return Error{ErrorCode::InvalidArgument, "invalid webhook port in " + url};
        }
        endpoint.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return Error{ErrorCode::InvalidArgument, "webhook url has no host: " + url};
    }
    endpoint.host = std::string(authority);
    return endpoint;
}

// ─────────────────────────────────────────────
// HttpWebhookClient
// ─────────────────────────────────────────────

HttpWebhookClient::HttpWebhookClient(WebhookEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

Result<nlohmann::json> HttpWebhookClient::post(const nlohmann::json& body,
                                               std::chrono::milliseconds timeout,
                                               std::stop_token stop) {
    const auto deadline = Clock::now() + timeout;

    auto fd = connect_to(endpoint_, deadline, stop);
    if (!fd) return fd.error();
    SocketGuard guard{*fd};

    const auto payload = body.dump();
    std::string request;
    request.reserve(payload.size() + 256);
    request += "POST " + endpoint_.path + " HTTP/1.1\r\n";
    request += "Host: " + endpoint_.host + ":" + std::to_string(endpoint_.port) + "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Accept: application/json\r\n";
    request += "Content-Length: " + std::to_string(payload.size()) + "\r\n";
    request += "Connection: close\r\n\r\n";
    request += payload;

    if (auto sent = send_all(guard.fd, request, deadline, stop); !sent) {
        return sent.error();
    }

    // Read until the peer closes or the declared body is complete.
    std::string response;
    std::optional<ResponseHead> head;
    size_t body_start = 0;
    char buf[4096];

    while (true) {
        if (head && head->content_length && response.size() >= body_start + *head->content_length) {
            break;
        }

        auto ready = wait_ready(guard.fd, POLLIN, deadline, stop);
        if (!ready) return ready.error();

        auto received = ::recv(guard.fd, buf, sizeof(buf), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return unavailable("recv failed: " + std::string(strerror(errno)));
        }
        if (received == 0) break;

        response.append(buf, static_cast<size_t>(received));
        if (response.size() > MAX_RESPONSE_SIZE) {
            return unavailable("webhook response exceeds " + std::to_string(MAX_RESPONSE_SIZE) + " bytes");
        }

        if (!head) {
            auto split = response.find("\r\n\r\n");
            if (split == std::string::npos) continue;
            auto parsed = parse_head(std::string_view(response).substr(0, split));
            if (!parsed) return parsed.error();
            if (parsed->chunked) return unavailable("chunked webhook responses are not supported");
            head = *parsed;
            body_start = split + 4;
        }
    }

    if (!head) return unavailable("webhook closed the connection without a response");
    if (head->status < 200 || head->status >= 300) {
        return unavailable("webhook answered HTTP " + std::to_string(head->status));
    }

    auto body_text = std::string_view(response).substr(body_start);
    if (head->content_length && body_text.size() > *head->content_length) {
        body_text = body_text.substr(0, *head->content_length);
    }

    auto parsed = nlohmann::json::parse(body_text.begin(), body_text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return unavailable("webhook response is not valid JSON");
    }
    return parsed;
}

}  // namespace cluster_gate
