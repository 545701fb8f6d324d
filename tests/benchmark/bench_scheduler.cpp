/**
 * @file bench_scheduler.cpp
 * @brief Performance benchmarks for filtering, scoring, preemption planning,
 *        the scheduling engine and the admission pipeline.
 * @author Dimitris Kafetzis
 *
 * Usage: ./bench_scheduler [--csv]
 */

#include "admission/builtin_plugins.hpp"
#include "admission/namespace_registry.hpp"
#include "admission/pipeline.hpp"
#include "core/types.hpp"
#include "document/patch.hpp"
#include "executor/thread_pool.hpp"
#include "priority/priority_registry.hpp"
#include "scheduler/filter.hpp"
#include "scheduler/preemption.hpp"
#include "scheduler/scheduling_engine.hpp"
#include "scheduler/scoring.hpp"
#include "store/binding_store.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace cluster_gate;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

constexpr uint64_t GiB = 1ULL << 30;

Workload make_workload(size_t i, uint64_t cpu, int64_t priority = 0) {
    Workload w;
    w.name = "w" + std::to_string(i);
    w.namespace_name = "default";
    w.id = Workload::make_id(w.namespace_name, w.name);
    w.priority = priority;
    w.demand = {.cpu_millis = cpu, .memory_bytes = 256ULL << 20};
    w.creation_seq = i;
    return w;
}

std::vector<PoolView> make_views(size_t n) {
    std::vector<PoolView> views;
    views.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        PoolView v;
        v.pool.id = "pool-" + std::to_string(i);
        v.pool.capacity = {.cpu_millis = 8000, .memory_bytes = 32 * GiB};
        v.pool.labels = {{"zone", i % 2 ? "a" : "b"}};
        if (i % 5 == 0) v.pool.taints = {{"dedicated", "gpu", TaintEffect::NoSchedule}};
        v.used = {.cpu_millis = (i * 700) % 8000, .memory_bytes = (i % 7) * GiB};
        views.push_back(std::move(v));
    }
    return views;
}

std::vector<PoolOccupancy> make_full_cluster(size_t pools, size_t per_pool) {
    std::vector<PoolOccupancy> occ;
    size_t seq = 0;
    for (size_t p = 0; p < pools; ++p) {
        PoolOccupancy o;
        o.view.pool.id = "pool-" + std::to_string(p);
        o.view.pool.capacity = {.cpu_millis = 1000 * per_pool, .memory_bytes = 64 * GiB};
        for (size_t i = 0; i < per_pool; ++i) {
            auto w = make_workload(seq, 1000, static_cast<int64_t>(seq % 10));
            ++seq;
            o.view.used += w.demand;
            o.bound.push_back(std::move(w));
        }
        occ.push_back(std::move(o));
    }
    return occ;
}

AdmissionRequest make_pod_request(size_t i) {
    AdmissionRequest req;
    req.uid = "uid-" + std::to_string(i);
    req.kind = "Pod";
    req.namespace_name = "default";
    req.user = "bench";
    req.object = {
        {"metadata", {{"name", "w" + std::to_string(i)}, {"labels", {{"team", "perf"}}}}},
        {"spec", nlohmann::json::object()},
    };
    return req;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_filter_score() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;
    auto w = make_workload(0, 500);
    w.preferred_affinity = {{50, {"zone", {"a"}}}};

    for (size_t n : {10, 100, 1000}) {
        auto views = make_views(n);
        R.push_back(run_bench("filter_pools(" + std::to_string(n) + ")", "Filtering", N,
            [&]{ auto f = filter_pools(w, views); (void)f; }, std::to_string(n) + " pools"));
    }

    for (const char* name : {"least_allocated", "most_allocated"}) {
        auto strategy = make_scoring_strategy(name);
        if (!strategy) continue;
        auto views = make_views(100);
        auto filtered = filter_pools(w, views);
        R.push_back(run_bench(std::string{"pick_best("} + name + ")", "Scoring", N,
            [&]{ auto b = pick_best(**strategy, w, filtered.feasible); (void)b; },
            std::to_string(filtered.feasible.size()) + " feasible"));
    }
    return R;
}

std::vector<BenchResult> bench_preemption() {
    std::vector<BenchResult> R;
    auto preemptor = make_workload(1000000, 3000, 100);
    const std::vector<std::pair<size_t, size_t>> shapes{{4, 8}, {16, 16}, {64, 32}};
    for (const auto& shape : shapes) {
        const size_t pools = shape.first;
        const size_t per_pool = shape.second;
        auto occ = make_full_cluster(pools, per_pool);
        R.push_back(run_bench("plan_preemption(" + std::to_string(pools) + "x"
                              + std::to_string(per_pool) + ")", "Preemption", 200,
            [&]{ auto p = plan_preemption(preemptor, occ); (void)p; },
            std::to_string(pools * per_pool) + " bound"));
    }
    return R;
}

std::vector<BenchResult> bench_engine() {
    std::vector<BenchResult> R;

    for (size_t n : {100, 1000}) {
        R.push_back(run_bench("submit+drain(" + std::to_string(n) + ")", "Engine", 20, [&]{
            BindingStore store;
            auto engine = SchedulingEngine::create(store);
            if (!engine) return;
            for (size_t p = 0; p < 16; ++p) {
                (void)(*engine)->add_pool(ResourcePool{
                    "pool-" + std::to_string(p), {.cpu_millis = 16000, .memory_bytes = 64 * GiB}, {}, {}});
            }
            for (size_t i = 0; i < n; ++i) {
                (void)(*engine)->submit(make_workload(i, 100 + (i % 7) * 100, static_cast<int64_t>(i % 3)));
            }
            auto outcomes = (*engine)->run_until_idle();
            (void)outcomes;
        }, std::to_string(n) + " workloads, 16 pools"));
    }

    R.push_back(run_bench("preempt_cascade(64)", "Engine", 20, [&]{
        BindingStore store;
        auto engine = SchedulingEngine::create(store);
        if (!engine) return;
        (void)(*engine)->add_pool(ResourcePool{"pool-0", {.cpu_millis = 6400, .memory_bytes = 64 * GiB}, {}, {}});
        for (size_t i = 0; i < 64; ++i) (void)(*engine)->submit(make_workload(i, 100, 0));
        (void)(*engine)->run_until_idle();
        for (size_t i = 64; i < 96; ++i) (void)(*engine)->submit(make_workload(i, 200, 10));
        auto outcomes = (*engine)->run_until_idle();
        (void)outcomes;
    }, "64 low, 32 high"));

    BindingStore store;
    (void)store.register_pool("pool-0", {.cpu_millis = 1000, .memory_bytes = GiB});
    R.push_back(run_bench("bind+unbind", "BindingStore", 5000, [&]{
        (void)store.bind("default/x", "pool-0", {.cpu_millis = 10, .memory_bytes = 0});
        (void)store.unbind("default/x");
    }, "single pool"));
    return R;
}

std::vector<BenchResult> bench_admission() {
    std::vector<BenchResult> R;
    auto registry = std::make_shared<PriorityClassRegistry>();
    (void)registry->create(PriorityClass{"standard", 1000, true, PreemptionPolicy::CanPreemptLower, ""});
    auto namespaces = std::make_shared<NamespaceRegistry>();
    (void)namespaces->add("default");

    std::vector<AdmissionStage> stages{
        AdmissionStage::mutating("created-by", 100, std::make_shared<CreatedByLabeler>("created-by")),
        AdmissionStage::mutating("priority", 200, std::make_shared<PriorityResolver>(registry)),
        AdmissionStage::mutating("default-resources", 300, std::make_shared<DefaultResourceRequests>(
            ResourceVector{.cpu_millis = 100, .memory_bytes = 128ULL << 20})),
        AdmissionStage::validating("namespace-lifecycle", 100, std::make_shared<NamespaceLifecycle>(namespaces)),
        AdmissionStage::validating("required-labels", 200,
            std::make_shared<RequiredLabels>(std::vector<std::string>{"team"})),
    };

    auto inline_pipeline = AdmissionPipeline::create(stages);
    if (inline_pipeline) {
        size_t i = 0;
        R.push_back(run_bench("admit(builtin chain)", "Admission", 5000,
            [&]{ auto r = inline_pipeline->admit(make_pod_request(i++)); (void)r; }, "5 stages"));
    }

    ThreadPool pool(2);
    for (auto& stage : stages) stage.timeout = std::chrono::milliseconds(100);
    auto deadline_pipeline = AdmissionPipeline::create(stages, &pool);
    if (deadline_pipeline) {
        size_t i = 0;
        R.push_back(run_bench("admit(with deadlines)", "Admission", 2000,
            [&]{ auto r = deadline_pipeline->admit(make_pod_request(i++)); (void)r; },
            "5 stages, 100ms each"));
    }

    nlohmann::json doc = make_pod_request(0).object;
    auto patch = set_nested(doc, {"metadata", "labels", "created-by"}, "bench");
    R.push_back(run_bench("apply_patch(label)", "Admission", 10000,
        [&]{ auto r = apply_patch(doc, patch); (void)r; }, std::to_string(patch.size()) + " ops"));
    return R;
}

// ─────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  ClusterGate Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_filter_score());
    append(bench_preemption());
    append(bench_engine());
    append(bench_admission());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
