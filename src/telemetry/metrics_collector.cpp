/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>

namespace cluster_gate {

namespace {

int64_t now_micros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_admission(const AdmissionReview& review) {
    nlohmann::json line{
        {"event", "admission"},
        {"uid", review.request.uid},
        {"kind", review.request.kind},
        {"operation", to_string(review.request.operation)},
        {"name", review.request.object_name()},
        {"allowed", review.verdict.allowed},
        {"stages", review.evaluated_stages}
    };
    if (!review.verdict.allowed) {
        line["code"] = to_string(review.verdict.code);
        line["stage"] = review.verdict.stage;
        line["reason"] = review.verdict.reason;
    }

    std::lock_guard lock(write_mutex_);
    if (review.verdict.allowed) {
        ++counters_.admitted;
    } else {
        ++counters_.rejected;
    }
    emit(line);
}

void MetricsCollector::record_schedule_outcome(const ScheduleOutcome& outcome) {
    nlohmann::json line{
        {"event", "schedule"},
        {"workload", outcome.workload_id},
        {"state", to_string(outcome.state)}
    };
    if (outcome.pool) line["pool"] = *outcome.pool;
    if (!outcome.evicted.empty()) line["evicted"] = outcome.evicted;
    if (!outcome.reason.empty()) line["reason"] = outcome.reason;

    std::lock_guard lock(write_mutex_);
    if (outcome.state == WorkloadState::Bound) ++counters_.bound;
    if (outcome.state == WorkloadState::Unschedulable) ++counters_.unschedulable;
    emit(line);
}

void MetricsCollector::record_binding_event(const BindingEvent& event) {
    nlohmann::json line{
        {"event", "binding"},
        {"kind", to_string(event.kind)},
        {"workload", event.binding.workload_id},
        {"pool", event.binding.pool_id},
        {"sequence", event.binding.sequence}
    };

    std::lock_guard lock(write_mutex_);
    if (event.kind == BindingEvent::Kind::Evicted) ++counters_.evicted;
    emit(line);
}

void MetricsCollector::record_custom(std::string_view event, const nlohmann::json& payload) {
    nlohmann::json line{{"event", event}, {"data", payload}};
    std::lock_guard lock(write_mutex_);
    emit(line);
}

MetricsSnapshot MetricsCollector::snapshot() const {
    std::lock_guard lock(write_mutex_);
    return counters_;
}

void MetricsCollector::emit(const nlohmann::json& line) {
    auto stamped = line;
    stamped["ts_us"] = now_micros();
    sink_->write(stamped.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace cluster_gate
