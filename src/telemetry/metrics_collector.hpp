/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "admission/request.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/scheduler.hpp"
#include "store/binding_store.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace cluster_gate {

struct MetricsSnapshot {
    uint64_t admitted = 0;
    uint64_t rejected = 0;
    uint64_t bound = 0;
    uint64_t evicted = 0;
    uint64_t unschedulable = 0;
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON, and keeps
 *        running counters.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_admission(const AdmissionReview& review);
    void record_schedule_outcome(const ScheduleOutcome& outcome);
    void record_binding_event(const BindingEvent& event);
    void record_custom(std::string_view event, const nlohmann::json& payload);

    [[nodiscard]] MetricsSnapshot snapshot() const;

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    MetricsSnapshot counters_;

    void emit(const nlohmann::json& line);
};

}  // namespace cluster_gate
