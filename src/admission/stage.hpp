/**
 * @file stage.hpp
 * @brief Admission stage configuration and plugin interfaces.
 * @author Dimitris Kafetzis
 *
 * A stage couples static configuration (name, kind, order, matcher, timeout,
 * failure policy) with a plugin. The set of plugin behaviours is closed:
 * a stage holds either a mutating or a validating plugin, and the pipeline
 * dispatches on the declared StageKind.
 */

#pragma once

#include "admission/request.hpp"
#include "core/result.hpp"
#include "document/patch.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace cluster_gate {

enum class StageKind : uint8_t {
    Mutating,
    Validating
};

[[nodiscard]] constexpr std::string_view to_string(StageKind kind) noexcept {
    switch (kind) {
        case StageKind::Mutating:   return "mutating";
        case StageKind::Validating: return "validating";
    }
    return "unknown";
}

[[nodiscard]] std::optional<StageKind> parse_stage_kind(std::string_view text);

/**
 * @brief What happens when a stage cannot produce an answer (timeout, transport error).
 */
enum class FailurePolicy : uint8_t {
    Fail,    ///< Reject the request (fail-closed)
    Ignore   ///< Treat as Allow / empty patch (fail-open)
};

[[nodiscard]] std::optional<FailurePolicy> parse_failure_policy(std::string_view text);

// ─────────────────────────────────────────────
// Matcher
// ─────────────────────────────────────────────

/**
 * @brief Selects the requests a stage applies to.
 *
 * Each set restricts one attribute; an empty set or a "*" entry matches any
 * value. Cluster-scoped requests carry an empty namespace and only match
 * stages with an unrestricted namespace set.
 */
struct Matcher {
    std::set<std::string> kinds;
    std::set<Operation> operations;
    std::set<std::string> namespaces;

    [[nodiscard]] bool matches(const AdmissionRequest& request) const;

    [[nodiscard]] static Matcher any() { return Matcher{}; }
};

// ─────────────────────────────────────────────
// Plugin interfaces
// ─────────────────────────────────────────────

/**
 * @brief A stage that normalizes requests.
 *
 * Returns a (possibly empty) patch against request.object. An error aborts
 * the request; plugins may use a specific ErrorCode, otherwise the pipeline
 * reports MutationFailed.
 */
class IMutatingPlugin {
public:
    virtual ~IMutatingPlugin() = default;
    virtual Result<Patch> mutate(const AdmissionRequest& request, std::stop_token stop) = 0;
};

/**
 * @brief A stage that accepts or denies the fully mutated request.
 *
 * Receives a const view; it has no way to alter the payload. An error means
 * the plugin could not decide and is subject to the stage failure policy.
 */
class IValidatingPlugin {
public:
    virtual ~IValidatingPlugin() = default;
    virtual Result<AdmissionVerdict> validate(const AdmissionRequest& request,
                                              std::stop_token stop) = 0;
};

using StagePlugin = std::variant<std::shared_ptr<IMutatingPlugin>,
                                 std::shared_ptr<IValidatingPlugin>>;

// ─────────────────────────────────────────────
// AdmissionStage
// ─────────────────────────────────────────────

struct AdmissionStage {
    std::string name;
    StageKind kind = StageKind::Validating;
    int order = 0;
    Matcher matcher;
    std::chrono::milliseconds timeout{0};   ///< 0 = run inline, no deadline
    FailurePolicy failure_policy = FailurePolicy::Fail;
    StagePlugin plugin;

    static AdmissionStage mutating(std::string name, int order,
                                   std::shared_ptr<IMutatingPlugin> plugin,
                                   Matcher matcher = Matcher::any());

    static AdmissionStage validating(std::string name, int order,
                                     std::shared_ptr<IValidatingPlugin> plugin,
                                     Matcher matcher = Matcher::any());

    /// Kind and plugin alternative agree, name non-empty, plugin non-null.
    [[nodiscard]] Result<void> check() const;
};

}  // namespace cluster_gate
