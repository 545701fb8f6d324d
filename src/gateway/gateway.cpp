/**
 * @file gateway.cpp
 * @brief Gateway implementation.
 * @author Dimitris Kafetzis
 */

#include "gateway/gateway.hpp"

#include "admission/builtin_plugins.hpp"
#include "admission/webhook_plugin.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/object_codec.hpp"

#include <set>
#include <string>

namespace cluster_gate {

namespace {

// Built-in chain ordering.
constexpr int ORDER_CREATED_BY = 100;
constexpr int ORDER_PRIORITY = 200;
constexpr int ORDER_DEFAULT_RESOURCES = 300;
constexpr int ORDER_NAMESPACE_LIFECYCLE = 100;
constexpr int ORDER_PRIORITY_CLASS_DEFAULT = 200;
constexpr int ORDER_REQUIRED_LABELS = 300;

std::unique_ptr<ILogSink> or_stdout(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<StdoutSink>();
}

std::unique_ptr<ILogSink> or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

// spec.priority and spec.preemptionPolicy may only restate the resolved class.
Result<void> check_declared_priority(const nlohmann::json& pod, const Workload& declared,
                                     const ResolvedPriority& resolved) {
    auto spec = pod.find("spec");
    if (spec == pod.end() || !spec->is_object()) return {};
    if (spec->contains("priority") && declared.priority != resolved.value) {
        return Error{ErrorCode::InvalidArgument,
                     "pod " + declared.id + ": spec.priority " + std::to_string(declared.priority)
                     + " does not match priority class '" + resolved.class_name + "' ("
                     + std::to_string(resolved.value) + ")"};
    }
    if (spec->contains("preemptionPolicy")
        && declared.preemption_policy != resolved.preemption_policy) {
        return Error{ErrorCode::InvalidArgument,
                     "pod " + declared.id + ": spec.preemptionPolicy "
                     + std::string{to_string(declared.preemption_policy)} + " does not match priority class '"
                     + resolved.class_name + "' (" + std::string{to_string(resolved.preemption_policy)}
                     + ")"};
    }
    return {};
}

Result<std::shared_ptr<IWebhookClient>> http_client_for(const std::string& url) {
    auto endpoint = parse_webhook_url(url);
    if (!endpoint) return endpoint.error();
    return std::shared_ptr<IWebhookClient>(std::make_shared<HttpWebhookClient>(*endpoint));
}

Matcher kinds_and_ops(std::set<std::string> kinds, std::set<Operation> operations = {}) {
    Matcher m;
    m.kinds = std::move(kinds);
    m.operations = std::move(operations);
    return m;
}

Error with_context(const Error& err, const std::string& context) {
    return Error{err.code, err.stage, context + ": " + err.message};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Gateway::Gateway(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_stdout(std::move(opts.log_sink)), LogLevel::Info, "gateway")
    , webhook_factory_(opts.webhook_factory ? std::move(opts.webhook_factory)
                                            : WebhookClientFactory{http_client_for})
    , thread_pool_(config_.server.worker_threads)
    , stage_pool_(config_.server.worker_threads)
    , metrics_(or_null(std::move(opts.metrics_sink)))
    , priorities_(std::make_shared<PriorityClassRegistry>())
    , namespaces_(std::make_shared<NamespaceRegistry>()) {
    if (auto level = parse_log_level(config_.telemetry.log_level)) {
        logger_.set_level(*level);
    } else {
        logger_.warn("unknown log level '" + config_.telemetry.log_level + "', using info");
    }
}

Gateway::~Gateway() {
    stop();
    thread_pool_.shutdown();
    stage_pool_.shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Gateway::start() {
    if (running_.load()) {
        return Error{ErrorCode::Internal, "gateway already running"};
    }

    logger_.info("gateway starting: name=" + config_.server.name
                 + " strategy=" + config_.scheduler.strategy
                 + " preemption=" + (config_.scheduler.preemption_enabled ? "on" : "off"));

    if (!engine_) {
        if (config_.system_priority_classes) {
            priorities_->install_system_classes();
        }
        for (const auto& pc : config_.priority_classes) {
            if (auto ok = priorities_->create(pc); !ok) {
                return with_context(ok.error(), "priority class '" + pc.name + "'");
            }
        }

        for (const auto& ns : config_.namespaces) {
            namespaces_->add(ns);
        }

        SchedulerOptions options;
        options.strategy = config_.scheduler.strategy;
        options.preemption_enabled = config_.scheduler.preemption_enabled;
        options.max_bind_attempts = config_.scheduler.max_bind_attempts;

        auto engine = SchedulingEngine::create(store_, options, logger_.for_component("scheduler"));
        if (!engine) return engine.error();
        engine_ = std::move(*engine);

        for (const auto& pool : config_.pools) {
            if (auto ok = engine_->add_pool(pool); !ok) {
                return with_context(ok.error(), "pool '" + pool.id + "'");
            }
        }

        auto stages = build_stages();
        if (!stages) return stages.error();

        auto pipeline = AdmissionPipeline::create(std::move(*stages), &stage_pool_,
                                                  logger_.for_component("admission"));
        if (!pipeline) return pipeline.error();
        pipeline_.emplace(std::move(*pipeline));
    }

    subscription_ = store_.subscribe([this](const BindingEvent& event) {
        metrics_.record_binding_event(event);
    });

    running_.store(true);
    logger_.info("gateway started: " + std::to_string(pipeline_->mutating_stages().size())
                 + " mutating, " + std::to_string(pipeline_->validating_stages().size())
                 + " validating stages, " + std::to_string(engine_->pools().size()) + " pools, "
                 + std::to_string(priorities_->size()) + " priority classes");
    return {};
}

void Gateway::stop() {
    if (!running_.exchange(false)) return;

    if (subscription_) {
        store_.unsubscribe(*subscription_);
        subscription_.reset();
    }
    logger_.info("gateway stopped");
    metrics_.flush();
    logger_.flush();
}

// ─────────────────────────────────────────────
// Stage construction
// ─────────────────────────────────────────────

Result<std::vector<AdmissionStage>> Gateway::build_stages() {
    if (config_.admission.stages.empty()) {
        return builtin_stages();
    }

    std::vector<AdmissionStage> stages;
    stages.reserve(config_.admission.stages.size());
    for (const auto& sc : config_.admission.stages) {
        auto stage = stage_from_config(sc);
        if (!stage) return stage.error();
        stages.push_back(std::move(*stage));
    }
    return stages;
}

std::vector<AdmissionStage> Gateway::builtin_stages() const {
    std::vector<AdmissionStage> stages;
    const auto& adm = config_.admission;

    stages.push_back(AdmissionStage::mutating(
        "created-by", ORDER_CREATED_BY,
        std::make_shared<CreatedByLabeler>(adm.created_by_label),
        kinds_and_ops({"Pod"})));

    stages.push_back(AdmissionStage::mutating(
        "priority", ORDER_PRIORITY,
        std::make_shared<PriorityResolver>(priorities_),
        kinds_and_ops({"Pod"}, {Operation::Create})));

    if (!adm.default_requests.is_zero()) {
        stages.push_back(AdmissionStage::mutating(
            "default-resources", ORDER_DEFAULT_RESOURCES,
            std::make_shared<DefaultResourceRequests>(adm.default_requests),
            kinds_and_ops({"Pod"}, {Operation::Create})));
    }

    stages.push_back(AdmissionStage::validating(
        "namespace-lifecycle", ORDER_NAMESPACE_LIFECYCLE,
        std::make_shared<NamespaceLifecycle>(namespaces_)));

    stages.push_back(AdmissionStage::validating(
        "priority-class-default", ORDER_PRIORITY_CLASS_DEFAULT,
        std::make_shared<PriorityClassDefault>(priorities_),
        kinds_and_ops({"PriorityClass"})));

    if (!adm.required_labels.empty()) {
        stages.push_back(AdmissionStage::validating(
            "required-labels", ORDER_REQUIRED_LABELS,
            std::make_shared<RequiredLabels>(adm.required_labels),
            kinds_and_ops({"Pod"}, {Operation::Create, Operation::Update})));
    }
    return stages;
}

Result<AdmissionStage> Gateway::stage_from_config(const StageConfig& sc) {
    std::shared_ptr<IMutatingPlugin> mutator;
    std::shared_ptr<IValidatingPlugin> validator;
    const auto timeout = std::chrono::milliseconds(sc.timeout_ms);

    if (sc.type == "created_by") {
        mutator = std::make_shared<CreatedByLabeler>(config_.admission.created_by_label);
    } else if (sc.type == "priority") {
        mutator = std::make_shared<PriorityResolver>(priorities_);
    } else if (sc.type == "default_resources") {
        mutator = std::make_shared<DefaultResourceRequests>(config_.admission.default_requests);
    } else if (sc.type == "priority_class_default") {
        validator = std::make_shared<PriorityClassDefault>(priorities_);
    } else if (sc.type == "required_labels") {
        validator = std::make_shared<RequiredLabels>(config_.admission.required_labels);
    } else if (sc.type == "namespace_lifecycle") {
        validator = std::make_shared<NamespaceLifecycle>(namespaces_);
    } else if (sc.type == "webhook") {
        if (sc.url.empty()) {
            return Error{ErrorCode::InvalidArgument, sc.name, "webhook stage requires a url"};
        }
        auto client = webhook_factory_(sc.url);
        if (!client) return Error{client.error().code, sc.name, client.error().message};
        if (sc.kind == StageKind::Mutating) {
            mutator = std::make_shared<WebhookMutatingPlugin>(*client, timeout);
        } else {
            validator = std::make_shared<WebhookValidatingPlugin>(*client, timeout);
        }
    } else {
        return Error{ErrorCode::InvalidArgument, sc.name, "unknown stage type '" + sc.type + "'"};
    }

    if ((mutator && sc.kind != StageKind::Mutating)
        || (validator && sc.kind != StageKind::Validating)) {
        return Error{ErrorCode::InvalidArgument, sc.name,
                     "stage type '" + sc.type + "' cannot run as "
                     + std::string{to_string(sc.kind)}};
    }

    Matcher matcher;
    matcher.kinds.insert(sc.kinds.begin(), sc.kinds.end());
    matcher.operations.insert(sc.operations.begin(), sc.operations.end());
    matcher.namespaces.insert(sc.namespaces.begin(), sc.namespaces.end());

    auto stage = mutator ? AdmissionStage::mutating(sc.name, sc.order, mutator, std::move(matcher))
                         : AdmissionStage::validating(sc.name, sc.order, validator, std::move(matcher));
    stage.timeout = timeout;
    stage.failure_policy = sc.failure_policy;
    return stage;
}

// ─────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────

Result<GatewayResponse> Gateway::submit(AdmissionRequest request, std::stop_token cancel) {
    if (!running_.load()) {
        return Error{ErrorCode::Internal, "gateway is not running"};
    }
    if (auto ok = request.reconcile_namespace(); !ok) return ok.error();
    if (request.kind == "Pod" && request.namespace_name.empty()) {
        request.namespace_name = "default";
    }

    auto review = pipeline_->admit(std::move(request), cancel);
    metrics_.record_admission(review);
    if (!review.verdict.allowed) {
        return review.verdict.to_error();
    }

    if (cancel.stop_requested()) {
        return Error{ErrorCode::Cancelled, "request cancelled before it was applied"};
    }

    GatewayResponse response;
    response.review = std::move(review);
    if (auto applied = apply(response.review.request, response); !applied) {
        logger_.warn("request " + response.review.request.uid + " admitted but not applied: "
                     + applied.error().describe());
        return applied.error();
    }
    return response;
}

std::future<Result<GatewayResponse>> Gateway::submit_async(AdmissionRequest request,
                                                           std::stop_token cancel) {
    return thread_pool_.submit([this, request = std::move(request), cancel]() mutable {
        return submit(std::move(request), cancel);
    });
}

Result<void> Gateway::apply(const AdmissionRequest& request, GatewayResponse& response) {
    if (request.kind == "Pod") return apply_pod(request, response);
    if (request.kind == "PriorityClass") return apply_priority_class(request);
    if (request.kind == "Node") return apply_node(request, response);
    if (request.kind == "Namespace") return apply_namespace(request);

    logger_.debug("admitted " + request.kind + " " + request.object_name()
                  + " has no registry; nothing to apply");
    return {};
}

Result<void> Gateway::apply_pod(const AdmissionRequest& request, GatewayResponse& response) {
    switch (request.operation) {
        case Operation::Create: {
            auto workload = workload_from_pod(request.object, request.namespace_name);
            if (!workload) return workload.error();

            // The registry is authoritative whatever the stage chain did.
            auto resolved = priorities_->resolve(pod_priority_class_name(request.object));
            if (!resolved) return resolved.error();
            if (auto ok = check_declared_priority(request.object, *workload, *resolved); !ok) {
                return ok.error();
            }
            workload->priority_class_name = resolved->class_name;
            workload->priority = resolved->value;
            workload->preemption_policy = resolved->preemption_policy;

            if (auto ok = engine_->submit(std::move(*workload)); !ok) return ok.error();
            drain(response);
            return {};
        }
        case Operation::Update:
            return Error{ErrorCode::InvalidArgument,
                         "pod " + request.object_name() + " cannot be updated once admitted"};
        case Operation::Delete: {
            auto ns = request.namespace_name.empty() ? std::string{"default"} : request.namespace_name;
            auto id = Workload::make_id(ns, request.object_name());
            if (!engine_->remove_workload(id)) {
                return Error{ErrorCode::NotFound, "workload " + id + " not found"};
            }
            drain(response);
            return {};
        }
    }
    return Error{ErrorCode::Internal, "unhandled operation"};
}

Result<void> Gateway::apply_priority_class(const AdmissionRequest& request) {
    switch (request.operation) {
        case Operation::Create: {
            auto pc = priority_class_from_json(request.object);
            if (!pc) return pc.error();
            auto name = pc->name;
            if (auto ok = priorities_->create(std::move(*pc)); !ok) return ok.error();
            logger_.info("priority class " + name + " created");
            return {};
        }
        case Operation::Update:
            return Error{ErrorCode::InvalidArgument,
                         "priority class " + request.object_name() + " is immutable"};
        case Operation::Delete: {
            auto name = request.object_name();
            if (!priorities_->remove(name)) {
                return Error{ErrorCode::NotFound, "priority class " + name + " not found"};
            }
            logger_.info("priority class " + name + " deleted");
            return {};
        }
    }
    return Error{ErrorCode::Internal, "unhandled operation"};
}

Result<void> Gateway::apply_node(const AdmissionRequest& request, GatewayResponse& response) {
    switch (request.operation) {
        case Operation::Create: {
            auto pool = pool_from_node(request.object);
            if (!pool) return pool.error();
            if (auto ok = engine_->add_pool(std::move(*pool)); !ok) return ok.error();
            drain(response);
            return {};
        }
        case Operation::Update: {
            auto pool = pool_from_node(request.object);
            if (!pool) return pool.error();
            auto current = engine_->pool(pool->id);
            if (!current) {
                return Error{ErrorCode::NotFound, "pool " + pool->id + " not found"};
            }
            if (current->capacity != pool->capacity || current->labels != pool->labels) {
                return Error{ErrorCode::InvalidArgument,
                             "pool " + pool->id + ": only taints may change on update"};
            }
            auto evicted = engine_->update_taints(pool->id, std::move(pool->taints));
            if (!evicted) return evicted.error();
            response.evicted = std::move(*evicted);
            drain(response);
            return {};
        }
        case Operation::Delete: {
            auto evicted = engine_->remove_pool(request.object_name());
            if (!evicted) return evicted.error();
            response.evicted = std::move(*evicted);
            drain(response);
            return {};
        }
    }
    return Error{ErrorCode::Internal, "unhandled operation"};
}

Result<void> Gateway::apply_namespace(const AdmissionRequest& request) {
    auto name = request.object_name();
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "namespace has no metadata.name"};
    }

    switch (request.operation) {
        case Operation::Create:
            if (!namespaces_->add(name)) {
                return Error{ErrorCode::AlreadyExists, "namespace " + name + " already exists"};
            }
            return {};
        case Operation::Update:
            if (!namespaces_->contains(name)) {
                return Error{ErrorCode::NotFound, "namespace " + name + " not found"};
            }
            return {};
        case Operation::Delete:
            if (!namespaces_->remove(name)) {
                return Error{ErrorCode::NotFound, "namespace " + name + " not found"};
            }
            return {};
    }
    return Error{ErrorCode::Internal, "unhandled operation"};
}

void Gateway::drain(GatewayResponse& response) {
    for (auto& outcome : engine_->run_until_idle()) {
        metrics_.record_schedule_outcome(outcome);
        response.outcomes.push_back(std::move(outcome));
    }
}

}  // namespace cluster_gate
