/**
 * @file pipeline.hpp
 * @brief Ordered mutate-then-validate admission chain.
 * @author Dimitris Kafetzis
 *
 * Execution order for one request:
 *   1. every matching Mutating stage, ascending (order, name), each seeing
 *      the output of the previous one;
 *   2. every matching Validating stage, ascending (order, name), against
 *      the fully mutated request. The first Deny ends evaluation.
 *
 * The pipeline is immutable once built; admit() is safe to call from many
 * threads at once.
 */

#pragma once

#include "admission/request.hpp"
#include "admission/stage.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace cluster_gate {

class ThreadPool;

class AdmissionPipeline {
public:
    /**
     * @brief Validate and order @p stages.
     *
     * @param executor Worker pool used to enforce stage timeouts. Without
     *                 one, every stage runs inline on the caller's thread
     *                 and timeouts are left to the plugin.
     */
    static Result<AdmissionPipeline> create(std::vector<AdmissionStage> stages,
                                            ThreadPool* executor = nullptr,
                                            std::optional<Logger> logger = std::nullopt);

    /**
     * @brief Run @p request through the chain.
     *
     * @p cancel is observed before each stage begins. A request is never
     * returned half-mutated: when rejected, the review carries the input.
     */
    [[nodiscard]] AdmissionReview admit(AdmissionRequest request,
                                        std::stop_token cancel = {}) const;

    [[nodiscard]] const std::vector<AdmissionStage>& mutating_stages() const noexcept {
        return mutating_;
    }
    [[nodiscard]] const std::vector<AdmissionStage>& validating_stages() const noexcept {
        return validating_;
    }
    [[nodiscard]] size_t stage_count() const noexcept {
        return mutating_.size() + validating_.size();
    }

private:
    AdmissionPipeline(std::vector<AdmissionStage> mutating,
                      std::vector<AdmissionStage> validating,
                      ThreadPool* executor,
                      std::optional<Logger> logger);

    Result<Patch> call_mutator(const AdmissionStage& stage,
                               const AdmissionRequest& request,
                               std::stop_token cancel) const;
    Result<AdmissionVerdict> call_validator(const AdmissionStage& stage,
                                            const AdmissionRequest& request,
                                            std::stop_token cancel) const;

    void log(LogLevel level, const std::string& message) const;

    std::vector<AdmissionStage> mutating_;
    std::vector<AdmissionStage> validating_;
    ThreadPool* executor_ = nullptr;
    mutable std::optional<Logger> logger_;
};

}  // namespace cluster_gate
