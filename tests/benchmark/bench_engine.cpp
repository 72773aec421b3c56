/**
 * @file bench_engine.cpp
 * @brief Performance benchmarks for the graph store, scheduling engine and timers.
 *
 * Measures admission and cancellation latency under the store-wide lock,
 * cascade cost on long dependency chains, and the cost of the timer and
 * worker-pool primitives dispatch is built on.
 *
 * Usage: ./bench_engine [--csv]
 */

#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/executor.hpp"
#include "executor/timer_service.hpp"
#include "executor/worker_pool.hpp"
#include "graph/task_graph.hpp"
#include "output/output_provisioner.hpp"
#include "scheduler/scheduling_engine.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/manifest.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace task_orchestrator;
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

class NoopExecutor : public ITaskExecutor {
public:
    ExecutionResult run(const ExecutionRequest& request) override {
        ExecutionResult result;
        result.name = request.name;
        result.exit_code = 0;
        return result;
    }
};

class FixedProvisioner : public IOutputProvisioner {
public:
    OutputSink allocate(const TaskName& name, AdmissionId admission_id) override {
        return OutputSink{"/dev/null/" + name + "." + std::to_string(admission_id)};
    }
};

/// Engine on virtual time with silent telemetry; nothing ever fires.
struct EngineRig {
    ManualClock clock{1'700'000'000'000};
    ManualTimerService timers;
    WorkerPool workers{1};
    NoopExecutor executor;
    FixedProvisioner outputs;
    Logger logger{std::make_unique<NullSink>(), LogLevel::Error};
    EventRecorder events{std::make_unique<NullSink>()};
    SchedulingEngine engine{SchedulingEngine::Collaborators{
        .clock = clock, .timers = timers, .workers = workers, .executor = executor,
        .outputs = outputs, .logger = logger, .events = events}};

    EpochMillis now() const { return clock.now_ms(); }

    void chain(const std::string& prefix, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            ScheduleRequest req{.name = prefix + std::to_string(i),
                                .program_path = "/bin/true",
                                .scheduled_time = now() + static_cast<EpochMillis>(i)};
            if (i > 0) req.depends_on.push_back(prefix + std::to_string(i - 1));
            (void)engine.schedule(std::move(req));
        }
    }
};

TaskRecord make_record(const std::string& name) {
    TaskRecord r;
    r.name = name;
    r.program_path = "/bin/true";
    return r;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_graph() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    TaskGraph graph;
    size_t counter = 0;
    R.push_back(run_bench("insert_remove", "Graph Store", N, [&] {
        auto name = "t" + std::to_string(counter++);
        (void)graph.insert(make_record(name));
        (void)graph.remove(name);
    }));

    for (size_t n : {100, 1000, 10000}) {
        TaskGraph chain;
        for (size_t i = 0; i < n; ++i) {
            auto name = "c" + std::to_string(i);
            (void)chain.insert(make_record(name));
            if (i > 0) {
                auto parent = "c" + std::to_string(i - 1);
                chain.add_dependency(name, parent);
                chain.add_dependent(parent, name);
            }
        }
        R.push_back(run_bench("is_consistent(" + std::to_string(n) + ")", "Graph Store", 100,
            [&] { auto ok = chain.is_consistent(); (void)ok; }, std::to_string(n) + " tasks"));
        R.push_back(run_bench("snapshot(" + std::to_string(n) + ")", "Graph Store", 100,
            [&] { auto s = chain.snapshot(); (void)s; }, std::to_string(n) + " tasks"));
    }

    return R;
}

std::vector<BenchResult> bench_engine() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    {
        EngineRig rig;
        size_t counter = 0;
        R.push_back(run_bench("schedule_cancel_independent", "Engine", N, [&] {
            auto name = "i" + std::to_string(counter++);
            (void)rig.engine.schedule(ScheduleRequest{
                .name = name, .program_path = "/bin/true",
                .scheduled_time = rig.now() + 1000});
            (void)rig.engine.cancel(name);
        }, "arm + disarm"));
    }

    {
        EngineRig rig;
        rig.chain("base", 1);
        size_t counter = 0;
        R.push_back(run_bench("schedule_cancel_dependent", "Engine", N, [&] {
            auto name = "d" + std::to_string(counter++);
            (void)rig.engine.schedule(ScheduleRequest{
                .name = name, .program_path = "/bin/true",
                .scheduled_time = rig.now() + 1000, .depends_on = {"base0"}});
            (void)rig.engine.cancel(name);
        }, "edge link + unlink"));
    }

    for (size_t fan : {10, 100, 1000}) {
        R.push_back(run_bench("cancel_fan_out(" + std::to_string(fan) + ")", "Engine", 20, [&] {
            EngineRig rig;
            (void)rig.engine.schedule(ScheduleRequest{
                .name = "root", .program_path = "/bin/true", .scheduled_time = rig.now()});
            for (size_t i = 0; i < fan; ++i) {
                (void)rig.engine.schedule(ScheduleRequest{
                    .name = "leaf" + std::to_string(i), .program_path = "/bin/true",
                    .scheduled_time = rig.now() + 10, .depends_on = {"root"}});
            }
            (void)rig.engine.cancel("root");
        }, std::to_string(fan) + " dependents armed"));
    }

    {
        EngineRig rig;
        rig.chain("q", 1000);
        R.push_back(run_bench("find(1000 live)", "Engine", N,
            [&] { auto r = rig.engine.find("q500"); (void)r; }, "1000 tasks"));
        R.push_back(run_bench("is_consistent(1000 live)", "Engine", 100,
            [&] { auto ok = rig.engine.is_consistent(); (void)ok; }, "1000 tasks"));
    }

    return R;
}

std::vector<BenchResult> bench_contention() {
    std::vector<BenchResult> R;

    for (size_t threads : {1, 4, 8}) {
        R.push_back(run_bench("parallel_admit(" + std::to_string(threads) + "x500)",
                              "Contention", 10, [&] {
            EngineRig rig;
            std::vector<std::jthread> workers;
            for (size_t t = 0; t < threads; ++t) {
                workers.emplace_back([&rig, t] {
                    rig.chain("t" + std::to_string(t) + "-", 500);
                });
            }
        }, std::to_string(threads * 500) + " admissions"));
    }

    return R;
}

std::vector<BenchResult> bench_primitives() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    ThreadTimerService timers;
    R.push_back(run_bench("timer_arm_disarm", "Primitives", N * 4, [&] {
        auto id = timers.arm(Milliseconds{60'000}, [] {});
        timers.disarm(id);
    }));
    R.push_back(run_bench("timer_fire_latency(0ms)", "Primitives", N, [&] {
        std::promise<void> p; auto f = p.get_future();
        timers.arm(Milliseconds{0}, [&p] { p.set_value(); });
        f.wait();
    }));

    WorkerPool pool(4);
    R.push_back(run_bench("workerpool_post_roundtrip", "Primitives", N, [&] {
        std::promise<void> p; auto f = p.get_future();
        pool.post([&p] { p.set_value(); });
        f.wait();
    }));

    std::ostringstream manifest;
    for (int i = 0; i < 100; ++i) {
        manifest << "[[task]]\nname = \"m" << i << "\"\nprogram = \"/bin/true\"\ndelay_ms = "
                 << i << "\nparameters = [\"-v\"]\n";
        if (i > 0) manifest << "depends_on = [\"m" << i - 1 << "\"]\n";
    }
    auto text = manifest.str();
    R.push_back(run_bench("parse_manifest(100)", "Primitives", 100,
        [&] { auto m = parse_manifest(text, 0); (void)m; }, "100 tasks"));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  TaskOrchestrator Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_graph());
    append(bench_engine());
    append(bench_contention());
    append(bench_primitives());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
