/**
 * @file pipeline.cpp
 * @brief AdmissionPipeline implementation.
 * @author Dimitris Kafetzis
 */

#include "admission/pipeline.hpp"

#include "executor/thread_pool.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <set>

namespace cluster_gate {

namespace {

bool stage_before(const AdmissionStage& a, const AdmissionStage& b) {
    if (a.order != b.order) return a.order < b.order;
    return a.name < b.name;
}

/**
 * @brief Run @p fn on @p executor and wait at most the stage timeout.
 *
 * On expiry the call's stop token is triggered and AdmissionFailed returned.
 * The task owns copies of everything it touches, so an abandoned call may
 * finish later without dangling.
 */
template <typename T, typename Fn>
Result<T> call_with_deadline(ThreadPool& executor, const AdmissionStage& stage, Fn fn) {
    auto source = std::make_shared<std::stop_source>();
    auto future = executor.submit([fn = std::move(fn), source]() mutable -> Result<T> {
        return fn(source->get_token());
    });

    if (future.wait_for(stage.timeout) != std::future_status::ready) {
        source->request_stop();
        return Error{ErrorCode::AdmissionFailed, stage.name,
                     "stage timed out after " + std::to_string(stage.timeout.count()) + "ms"};
    }

    try {
        return future.get();
    } catch (const std::future_error& e) {
        return Error{ErrorCode::AdmissionFailed, stage.name,
                     std::string{"stage was not executed: "} + e.what()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, stage.name, std::string{"stage threw: "} + e.what()};
    }
}

template <typename T, typename Fn>
Result<T> call_inline(const AdmissionStage& stage, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, stage.name, std::string{"stage threw: "} + e.what()};
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

AdmissionPipeline::AdmissionPipeline(std::vector<AdmissionStage> mutating,
                                     std::vector<AdmissionStage> validating,
                                     ThreadPool* executor,
                                     std::optional<Logger> logger)
    : mutating_(std::move(mutating))
    , validating_(std::move(validating))
    , executor_(executor)
    , logger_(std::move(logger)) {}

Result<AdmissionPipeline> AdmissionPipeline::create(std::vector<AdmissionStage> stages,
                                                    ThreadPool* executor,
                                                    std::optional<Logger> logger) {
    std::vector<AdmissionStage> mutating;
    std::vector<AdmissionStage> validating;
    std::set<std::string> names;

    for (auto& stage : stages) {
        if (auto ok = stage.check(); !ok) {
            return ok.error();
        }
        if (!names.insert(stage.name).second) {
            return Error{ErrorCode::AlreadyExists, stage.name, "duplicate admission stage name"};
        }
        if (stage.timeout.count() < 0) {
            return Error{ErrorCode::InvalidArgument, stage.name, "negative stage timeout"};
        }
        if (stage.kind == StageKind::Mutating) {
            mutating.push_back(std::move(stage));
        } else {
            validating.push_back(std::move(stage));
        }
    }

    std::stable_sort(mutating.begin(), mutating.end(), stage_before);
    std::stable_sort(validating.begin(), validating.end(), stage_before);

    return AdmissionPipeline(std::move(mutating), std::move(validating), executor,
                             std::move(logger));
}

// ─────────────────────────────────────────────
// Admission
// ─────────────────────────────────────────────

AdmissionReview AdmissionPipeline::admit(AdmissionRequest request, std::stop_token cancel) const {
    AdmissionReview review;
    AdmissionRequest working = request;

    auto reject = [&](Error error) {
        log(LogLevel::Info, "request " + request.uid + " (" + request.kind + " "
                            + std::string{to_string(request.operation)} + ") rejected: "
                            + error.describe());
        review.request = std::move(request);
        review.verdict = AdmissionVerdict::reject(error);
        return std::move(review);
    };

    // ── Phase 1: mutation ────────────────────
    for (const auto& stage : mutating_) {
        if (cancel.stop_requested()) {
            return reject(Error{ErrorCode::Cancelled, stage.name, "request cancelled"});
        }
        if (!stage.matcher.matches(working)) continue;

        review.evaluated_stages.push_back(stage.name);
        auto patch = call_mutator(stage, working, cancel);

        if (!patch) {
            auto& err = patch.error();
            if (err.code == ErrorCode::AdmissionFailed
                && stage.failure_policy == FailurePolicy::Ignore) {
                log(LogLevel::Warn, "mutating stage " + stage.name
                                    + " unavailable, failing open: " + err.message);
                continue;
            }
            ErrorCode code = err.code;
            if (code == ErrorCode::Internal || code == ErrorCode::InvalidArgument) {
                code = ErrorCode::MutationFailed;
            }
            return reject(Error{code, stage.name, err.message});
        }

        if (patch->empty()) continue;

        auto patched = apply_patch(working.object, *patch);
        if (!patched) {
            return reject(Error{ErrorCode::MutationFailed, stage.name,
                                "malformed patch: " + patched.error().message});
        }
        working.object = std::move(*patched);
        log(LogLevel::Debug, "stage " + stage.name + " applied "
                             + std::to_string(patch->size()) + " patch operation(s)");
    }

    // ── Phase 2: validation ──────────────────
    const AdmissionRequest& final_request = working;

    for (const auto& stage : validating_) {
        if (cancel.stop_requested()) {
            return reject(Error{ErrorCode::Cancelled, stage.name, "request cancelled"});
        }
        if (!stage.matcher.matches(final_request)) continue;

        review.evaluated_stages.push_back(stage.name);
        auto verdict = call_validator(stage, final_request, cancel);

        if (!verdict) {
            auto& err = verdict.error();
            if (stage.failure_policy == FailurePolicy::Ignore) {
                log(LogLevel::Warn, "validating stage " + stage.name
                                    + " unavailable, failing open: " + err.message);
                continue;
            }
            ErrorCode code = err.code == ErrorCode::Internal ? ErrorCode::AdmissionFailed : err.code;
            return reject(Error{code, stage.name, err.message});
        }

        if (!verdict->allowed) {
            return reject(Error{verdict->code, stage.name, verdict->reason});
        }
    }

    review.request = std::move(working);
    review.verdict = AdmissionVerdict::allow();
    log(LogLevel::Debug, "request " + review.request.uid + " admitted after "
                         + std::to_string(review.evaluated_stages.size()) + " stage(s)");
    return review;
}

Result<Patch> AdmissionPipeline::call_mutator(const AdmissionStage& stage,
                                              const AdmissionRequest& request,
                                              std::stop_token cancel) const {
    auto plugin = std::get<std::shared_ptr<IMutatingPlugin>>(stage.plugin);

    if (stage.timeout.count() > 0 && executor_ != nullptr) {
        auto snapshot = std::make_shared<const AdmissionRequest>(request);
        return call_with_deadline<Patch>(*executor_, stage,
            [plugin, snapshot](std::stop_token stop) { return plugin->mutate(*snapshot, stop); });
    }
    return call_inline<Patch>(stage, [&] { return plugin->mutate(request, cancel); });
}

Result<AdmissionVerdict> AdmissionPipeline::call_validator(const AdmissionStage& stage,
                                                           const AdmissionRequest& request,
                                                           std::stop_token cancel) const {
    auto plugin = std::get<std::shared_ptr<IValidatingPlugin>>(stage.plugin);

    if (stage.timeout.count() > 0 && executor_ != nullptr) {
        auto snapshot = std::make_shared<const AdmissionRequest>(request);
        return call_with_deadline<AdmissionVerdict>(*executor_, stage,
            [plugin, snapshot](std::stop_token stop) { return plugin->validate(*snapshot, stop); });
    }
    return call_inline<AdmissionVerdict>(stage, [&] { return plugin->validate(request, cancel); });
}

void AdmissionPipeline::log(LogLevel level, const std::string& message) const {
    if (logger_) logger_->log(level, message);
}

}  // namespace cluster_gate
