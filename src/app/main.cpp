/**
 * @file main.cpp
 * @brief ClusterGate entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one admission and scheduling pipeline:
 *   Config → Logger → Gateway (Admission → PriorityClasses → Scheduler → Bindings) → Telemetry
 *
 * Requests are read as NDJSON, one AdmissionRequest per line, from --requests
 * or stdin. One result line is printed per request.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "gateway/gateway.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/quantity.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace cluster_gate;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::filesystem::path requests_path;
    std::string log_dir;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: cluster_gate [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --requests <path>   NDJSON file of admission requests (default: stdin)\n"
              << "  --log-dir <path>    Log output directory\n"
              << "  --demo              Run the preemption demo, print bindings, then exit\n"
              << "  --help, -h          Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--requests" && i + 1 < argc) {
            args.requests_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

nlohmann::json outcome_to_json(const ScheduleOutcome& outcome) {
    nlohmann::json out{
        {"workload", outcome.workload_id},
        {"state", to_string(outcome.state)}
    };
    if (outcome.pool) out["pool"] = *outcome.pool;
    if (!outcome.evicted.empty()) out["evicted"] = outcome.evicted;
    if (!outcome.reason.empty()) out["reason"] = outcome.reason;
    return out;
}

nlohmann::json result_to_json(const std::string& uid, const Result<GatewayResponse>& result) {
    nlohmann::json out{{"uid", uid}, {"allowed", result.has_value()}};
    if (!result) {
        out["code"] = to_string(result.error().code);
        if (!result.error().stage.empty()) out["stage"] = result.error().stage;
        out["reason"] = result.error().message;
        return out;
    }

    auto outcomes = nlohmann::json::array();
    for (const auto& outcome : result->outcomes) {
        outcomes.push_back(outcome_to_json(outcome));
    }
    out["outcomes"] = std::move(outcomes);
    if (!result->evicted.empty()) out["evicted"] = result->evicted;
    return out;
}

void print_bindings(Gateway& gateway) {
    std::cout << "Bindings:\n";
    for (const auto& b : gateway.bindings().all_bindings()) {
        std::cout << "  " << b.workload_id << " -> " << b.pool_id
                  << " (cpu " << format_cpu_millis(b.demand.cpu_millis)
                  << ", memory " << format_memory_bytes(b.demand.memory_bytes)
                  << ", seq " << b.sequence << ")\n";
    }
}

/**
 * @brief Feed NDJSON requests from @p in through the gateway.
 */
size_t serve_requests(std::istream& in, Gateway& gateway, Logger& logger) {
    std::stop_source stop_source;
    std::string line;
    size_t handled = 0;
    size_t line_no = 0;

    while (!g_shutdown_requested && std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line.front() == '#') continue;

        auto doc = nlohmann::json::parse(line, nullptr, false);
        if (doc.is_discarded()) {
            logger.warn("line " + std::to_string(line_no) + ": not valid JSON, skipped");
            std::cout << nlohmann::json{{"line", line_no}, {"allowed", false},
                                        {"code", "InvalidArgument"},
                                        {"reason", "not valid JSON"}}.dump() << "\n";
            continue;
        }

        auto request = AdmissionRequest::from_json(doc);
        if (!request) {
            logger.warn("line " + std::to_string(line_no) + ": " + request.error().message);
            std::cout << nlohmann::json{{"line", line_no}, {"allowed", false},
                                        {"code", to_string(request.error().code)},
                                        {"reason", request.error().message}}.dump() << "\n";
            continue;
        }

        auto uid = request->uid;
        auto result = gateway.submit(std::move(*request), stop_source.get_token());
        std::cout << result_to_json(uid, result).dump(-1, ' ', false,
                                                      nlohmann::json::error_handler_t::replace)
                  << "\n";
        ++handled;
    }

    if (g_shutdown_requested) stop_source.request_stop();
    return handled;
}

AdmissionRequest demo_request(std::string uid, std::string kind, nlohmann::json object,
                              std::string ns = {}) {
    AdmissionRequest req;
    req.uid = std::move(uid);
    req.operation = Operation::Create;
    req.kind = std::move(kind);
    req.namespace_name = std::move(ns);
    req.user = "demo-admin";
    req.object = std::move(object);
    return req;
}

nlohmann::json demo_pod(const std::string& name, const std::string& priority_class) {
    return {
        {"metadata", {{"name", name}, {"namespace", "default"}}},
        {"spec", {
            {"priorityClassName", priority_class},
            {"resources", {{"requests", {{"cpu", "2"}, {"memory", "2Gi"}}}}}
        }}
    };
}

/**
 * @brief Run the preemption demo: a Never-preempt "low" pod fills the only
 *        pool, then a "high" pod evicts it.
 */
int run_demo(Config config, Logger& logger) {
    logger.info("=== Demo Mode ===");

    config.pools.clear();
    config.priority_classes.clear();
    config.admission.stages.clear();
    config.admission.required_labels.clear();
    config.namespaces.push_back("default");

    Gateway::Options opts;
    opts.config = std::move(config);
    opts.log_sink = std::make_unique<NullSink>();
    Gateway gateway(std::move(opts));
    if (auto ok = gateway.start(); !ok) {
        std::cerr << "Demo gateway failed to start: " << ok.error().describe() << std::endl;
        return 1;
    }

    const std::vector<AdmissionRequest> steps{
        demo_request("pc-high", "PriorityClass",
                     {{"metadata", {{"name", "high"}}}, {"value", 1000000},
                      {"preemptionPolicy", "PreemptLowerPriority"}}),
        demo_request("pc-low", "PriorityClass",
                     {{"metadata", {{"name", "low"}}}, {"value", 100},
                      {"preemptionPolicy", "Never"}}),
        demo_request("node-a", "Node",
                     {{"metadata", {{"name", "pool-a"}, {"labels", {{"zone", "a"}}}}},
                      {"spec", {{"capacity", {{"cpu", "2"}, {"memory", "4Gi"}}}}}}),
        demo_request("pod-low", "Pod", demo_pod("batch", "low"), "default"),
        demo_request("pod-high", "Pod", demo_pod("web", "high"), "default"),
    };

    for (const auto& step : steps) {
        auto result = gateway.submit(step);
        std::cout << result_to_json(step.uid, result).dump() << "\n";
        if (step.uid == "pod-low") print_bindings(gateway);
    }

    print_bindings(gateway);
    for (const char* id : {"default/batch", "default/web"}) {
        auto state = gateway.engine().state_of(id);
        std::cout << "  " << id << ": " << (state ? to_string(*state) : "unknown");
        if (auto reason = gateway.engine().last_reason(id); reason && !reason->empty()) {
            std::cout << " (" << *reason << ")";
        }
        std::cout << "\n";
    }

    gateway.stop();
    logger.info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        if (args.config_given || config_result.error().code != ErrorCode::NotFound) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        std::cerr << "No configuration at " << args.config_path.string()
                  << ", using defaults." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    auto make_sink = [&](const std::string& prefix) -> std::unique_ptr<ILogSink> {
        if (config.telemetry.log_dir.empty()) return std::make_unique<StdoutSink>();
        return std::make_unique<JsonFileSink>(config.telemetry.log_dir, prefix,
                                              config.telemetry.max_file_size_mb,
                                              config.telemetry.rotate_count);
    };

    Logger logger(make_sink("cluster_gate_main"), LogLevel::Info, "main");
    logger.info("ClusterGate starting: " + config.server.name);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(config, logger);
    }

    // ── Gateway ──────────────────────────────
    Gateway::Options opts;
    opts.config = config;
    opts.log_sink = make_sink("cluster_gate");
    opts.metrics_sink = config.telemetry.log_dir.empty()
        ? std::unique_ptr<ILogSink>(std::make_unique<NullSink>())
        : make_sink("metrics");

    Gateway gateway(std::move(opts));
    if (auto started = gateway.start(); !started) {
        std::cerr << "Failed to start gateway: " << started.error().describe() << std::endl;
        logger.error("gateway failed to start: " + started.error().describe());
        return 1;
    }

    size_t handled = 0;
    if (!args.requests_path.empty()) {
        std::ifstream in(args.requests_path);
        if (!in) {
            std::cerr << "Cannot open requests file: " << args.requests_path.string() << std::endl;
            return 1;
        }
        handled = serve_requests(in, gateway, logger);
    } else {
        handled = serve_requests(std::cin, gateway, logger);
    }

    print_bindings(gateway);

    auto snap = gateway.metrics().snapshot();
    logger.info("handled " + std::to_string(handled) + " requests: "
                + std::to_string(snap.admitted) + " admitted, "
                + std::to_string(snap.rejected) + " rejected, "
                + std::to_string(snap.bound) + " bound, "
                + std::to_string(snap.evicted) + " evicted");

    // ── Graceful Shutdown ────────────────────
    gateway.stop();
    logger.info("ClusterGate stopped.");
    return 0;
}
