/**
 * @file gateway.hpp
 * @brief Top-level Gateway facade: admission, registries and scheduling.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Running a request through the admission pipeline
 *   2. Persisting the admitted object (PriorityClass, Namespace, Node)
 *   3. Handing admitted Pods to the scheduling engine and draining its queue
 *
 * Requests may be submitted from many threads; submit_async() runs them on
 * the gateway's worker pool.
 */

#pragma once

#include "admission/namespace_registry.hpp"
#include "admission/pipeline.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "network/webhook_client.hpp"
#include "priority/priority_registry.hpp"
#include "scheduler/scheduling_engine.hpp"
#include "store/binding_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

namespace cluster_gate {

/**
 * @brief What an admitted request did to the cluster.
 */
struct GatewayResponse {
    AdmissionReview review;
    std::vector<ScheduleOutcome> outcomes;   ///< Placements triggered by the request
    std::vector<WorkloadId> evicted;         ///< Workloads displaced by a Node change
};

/// Builds the transport for a webhook stage from its configured URL.
using WebhookClientFactory =
    std::function<Result<std::shared_ptr<IWebhookClient>>(const std::string& url)>;

class Gateway {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> metrics_sink;
        WebhookClientFactory webhook_factory;   ///< Empty = HttpWebhookClient
    };

    explicit Gateway(Options opts);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // ── Lifecycle ────────────────────────────

    /**
     * @brief Install configured priority classes, namespaces and pools, and
     *        build the admission chain.
     */
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Requests ─────────────────────────────

    /**
     * @brief Admit @p request and apply it.
     *
     * Returns the admission error when the pipeline rejects the request, or
     * the registry/engine error when the admitted object cannot be applied.
     */
    Result<GatewayResponse> submit(AdmissionRequest request, std::stop_token cancel = {});

    std::future<Result<GatewayResponse>> submit_async(AdmissionRequest request,
                                                      std::stop_token cancel = {});

    // ── Accessors ────────────────────────────

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    Logger& logger() { return logger_; }
    BindingStore& bindings() { return store_; }
    SchedulingEngine& engine() { return *engine_; }
    [[nodiscard]] const AdmissionPipeline& pipeline() const { return *pipeline_; }
    PriorityClassRegistry& priority_classes() { return *priorities_; }
    NamespaceRegistry& namespaces() { return *namespaces_; }
    MetricsCollector& metrics() { return metrics_; }

private:
    Result<std::vector<AdmissionStage>> build_stages();
    std::vector<AdmissionStage> builtin_stages() const;
    Result<AdmissionStage> stage_from_config(const StageConfig& sc);

    Result<void> apply(const AdmissionRequest& request, GatewayResponse& response);
    Result<void> apply_pod(const AdmissionRequest& request, GatewayResponse& response);
    Result<void> apply_priority_class(const AdmissionRequest& request);
    Result<void> apply_node(const AdmissionRequest& request, GatewayResponse& response);
    Result<void> apply_namespace(const AdmissionRequest& request);

    void drain(GatewayResponse& response);

    Config config_;
    Logger logger_;
    WebhookClientFactory webhook_factory_;

    ThreadPool thread_pool_;    ///< submit_async
    ThreadPool stage_pool_;     ///< Deadline-bounded admission stage calls
    MetricsCollector metrics_;

    std::shared_ptr<PriorityClassRegistry> priorities_;
    std::shared_ptr<NamespaceRegistry> namespaces_;
    BindingStore store_;
    std::unique_ptr<SchedulingEngine> engine_;
    std::optional<AdmissionPipeline> pipeline_;

    std::optional<BindingStore::SubscriptionId> subscription_;
    std::atomic<bool> running_{false};
};

}  // namespace cluster_gate
