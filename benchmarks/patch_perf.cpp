#include "json.h"
#include "patch.h"
#include "pointer.h"
#include "predicate.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

namespace bench
{

using Clock = std::chrono::high_resolution_clock;

struct Stats
{
    double min_ns;
    double max_ns;
    double mean_ns;
    double median_ns;
    double stddev_ns;
};

struct BenchConfig
{
    std::size_t warmup_runs = 1;
    std::size_t measure_runs = 5;
    double scale = 1.0;
    std::string filter;
    bool list_only = false;
    bool generate_report = false;
    std::string report_format = "text"; // text, csv, json
};

struct BenchCase
{
    std::string name;
    std::size_t inner_iterations;
    std::function<void(std::size_t)> prepare;
    std::function<void()> body;
};

struct BenchResult
{
    std::string name;
    Stats stats;
    std::size_t iterations;
};

static volatile std::uint64_t g_sink = 0;

template <class T>
inline void DoNotOptimize(const T& value)
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : "g"(&value) : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void ClobberMemory()
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void Ensure(bool condition, const std::string& message)
{
    if (!condition) {
        std::fprintf(stderr, "error: %s\n", message.c_str());
        std::exit(1);
    }
}

inline Stats
ComputeStats(std::vector<double> samples)
{
    Ensure(!samples.empty(), "ComputeStats called with empty samples");
    Stats stats;
    stats.min_ns = *std::min_element(samples.begin(), samples.end());
    stats.max_ns = *std::max_element(samples.begin(), samples.end());
    const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    stats.mean_ns = sum / samples.size();
    double variance = 0.0;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double diff = samples[i] - stats.mean_ns;
        variance += diff * diff;
    }
    variance /= samples.size();
    stats.stddev_ns = std::sqrt(variance);
    std::sort(samples.begin(), samples.end());
    if (samples.size() % 2 == 0) {
        std::size_t idx = samples.size() / 2;
        stats.median_ns = (samples[idx - 1] + samples[idx]) * 0.5;
    } else {
        stats.median_ns = samples[samples.size() / 2];
    }
    return stats;
}

inline std::size_t
ClampIterations(std::size_t base, double scale)
{
    if (base == 0) {
        return 1;
    }
    double scaled = base * scale;
    if (scaled < 1.0) {
        return 1;
    }
    return static_cast<std::size_t>(scaled);
}

inline void
PrintTextReport(const std::vector<BenchResult>& results, const BenchConfig& config)
{
    std::printf("\n=== Patch Benchmark Report ===\n");
    std::printf("Configuration: warmup=%zu runs=%zu scale=%.2f\n\n",
                config.warmup_runs, config.measure_runs, config.scale);
    for (const auto& r : results) {
        std::printf("%-36s %10.2f ns/op  (median %.2f | min %.2f | max %.2f | stddev %.2f)  iter=%zu\n",
                    r.name.c_str(),
                    r.stats.mean_ns,
                    r.stats.median_ns,
                    r.stats.min_ns,
                    r.stats.max_ns,
                    r.stats.stddev_ns,
                    r.iterations);
    }
}

inline void
PrintCSVReport(const std::vector<BenchResult>& results)
{
    std::printf("benchmark,mean_ns,median_ns,min_ns,max_ns,stddev_ns,iterations\n");
    for (const auto& r : results) {
        std::printf("%s,%.2f,%.2f,%.2f,%.2f,%.2f,%zu\n",
                    r.name.c_str(),
                    r.stats.mean_ns,
                    r.stats.median_ns,
                    r.stats.min_ns,
                    r.stats.max_ns,
                    r.stats.stddev_ns,
                    r.iterations);
    }
}

// The JSON report is built with the library itself.
inline void
PrintJSONReport(const std::vector<BenchResult>& results, const BenchConfig& config)
{
    jtools::Json report;
    report["config"]["warmup_runs"] = (unsigned long long)config.warmup_runs;
    report["config"]["measure_runs"] = (unsigned long long)config.measure_runs;
    report["config"]["scale"] = config.scale;
    report["results"].setArray();
    for (const auto& r : results) {
        jtools::Json entry;
        entry["name"] = r.name;
        entry["mean_ns"] = r.stats.mean_ns;
        entry["median_ns"] = r.stats.median_ns;
        entry["min_ns"] = r.stats.min_ns;
        entry["max_ns"] = r.stats.max_ns;
        entry["stddev_ns"] = r.stats.stddev_ns;
        entry["iterations"] = (unsigned long long)r.iterations;
        report["results"].getArray().push_back(std::move(entry));
    }
    std::printf("%s\n", report.toStringPretty().c_str());
}

class Runner
{
  public:
    explicit Runner(const BenchConfig& cfg) : config_(cfg)
    {
    }

    void run(const BenchCase& bench_case)
    {
        if (!config_.filter.empty() &&
            bench_case.name.find(config_.filter) == std::string::npos) {
            return;
        }

        const std::size_t inner = ClampIterations(bench_case.inner_iterations, config_.scale);

        if (config_.list_only) {
            std::printf("%s\n", bench_case.name.c_str());
            return;
        }

        for (std::size_t w = 0; w < config_.warmup_runs; ++w) {
            if (bench_case.prepare) {
                bench_case.prepare(inner);
            }
            for (std::size_t i = 0; i < inner; ++i) {
                bench_case.body();
            }
        }

        std::vector<double> samples;
        samples.reserve(config_.measure_runs);

        for (std::size_t run = 0; run < config_.measure_runs; ++run) {
            if (bench_case.prepare) {
                bench_case.prepare(inner);
            }
            Clock::time_point start = Clock::now();
            for (std::size_t i = 0; i < inner; ++i) {
                bench_case.body();
            }
            Clock::time_point end = Clock::now();
            double total_ns = static_cast<double>(
              std::chrono::duration_cast<std::chrono::nanoseconds>(end - start)
                .count());
            samples.push_back(total_ns / inner);
            ClobberMemory();
        }

        BenchResult result;
        result.name = bench_case.name;
        result.stats = ComputeStats(samples);
        result.iterations = inner;
        results_.push_back(result);

        if (!config_.generate_report) {
            std::printf("%-36s %10.2f ns/op  (median %.2f | min %.2f | max %.2f | stddev %.2f)  inner=%zu\n",
                        bench_case.name.c_str(),
                        result.stats.mean_ns,
                        result.stats.median_ns,
                        result.stats.min_ns,
                        result.stats.max_ns,
                        result.stats.stddev_ns,
                        inner);
        }
    }

    const std::vector<BenchResult>& getResults() const
    {
        return results_;
    }

  private:
    BenchConfig config_;
    std::vector<BenchResult> results_;
};

inline bool
HasPrefix(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

inline BenchConfig
ParseArgs(int argc, char** argv)
{
    BenchConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::printf("patch_perf options:\n");
            std::printf("  --warmup N       Number of warmup runs (default 1)\n");
            std::printf("  --runs N         Number of measured runs (default 5)\n");
            std::printf("  --scale X        Scale inner iteration counts by X\n");
            std::printf("  --filter STR     Only run benchmarks containing STR\n");
            std::printf("  --list           List benchmark names\n");
            std::printf("  --report FORMAT  Generate report (text, csv, json)\n");
            std::exit(0);
        } else if (HasPrefix(arg, "--warmup=")) {
            config.warmup_runs = static_cast<std::size_t>(std::strtoul(arg.c_str() + 9, NULL, 10));
        } else if (HasPrefix(arg, "--runs=")) {
            config.measure_runs = static_cast<std::size_t>(std::strtoul(arg.c_str() + 7, NULL, 10));
        } else if (HasPrefix(arg, "--scale=")) {
            config.scale = std::atof(arg.c_str() + 8);
        } else if (HasPrefix(arg, "--filter=")) {
            config.filter = arg.substr(9);
        } else if (HasPrefix(arg, "--report=")) {
            config.generate_report = true;
            config.report_format = arg.substr(9);
        } else if (arg == "--warmup") {
            Ensure(i + 1 < argc, "--warmup requires an argument");
            config.warmup_runs = static_cast<std::size_t>(std::strtoul(argv[++i], NULL, 10));
        } else if (arg == "--runs") {
            Ensure(i + 1 < argc, "--runs requires an argument");
            config.measure_runs = static_cast<std::size_t>(std::strtoul(argv[++i], NULL, 10));
        } else if (arg == "--scale") {
            Ensure(i + 1 < argc, "--scale requires an argument");
            config.scale = std::atof(argv[++i]);
        } else if (arg == "--filter") {
            Ensure(i + 1 < argc, "--filter requires an argument");
            config.filter = argv[++i];
        } else if (arg == "--list") {
            config.list_only = true;
        } else if (arg == "--report") {
            Ensure(i + 1 < argc, "--report requires an argument");
            config.generate_report = true;
            config.report_format = argv[++i];
        } else {
            Ensure(false, std::string("unknown argument: ") + arg);
        }
    }
    if (config.measure_runs == 0) {
        config.measure_runs = 1;
    }
    return config;
}

// An orders document with n entries, each carrying a nested customer
// and a short list of line items.
inline jtools::Json
MakeOrders(std::size_t n)
{
    jtools::Json doc;
    doc["region"] = "emea";
    doc["orders"].setArray();
    for (std::size_t i = 0; i < n; ++i) {
        jtools::Json order;
        order["id"] = (unsigned long long)i;
        order["status"] = i % 3 ? "open" : "SHIPPED";
        order["customer"]["name"] = "customer-" + std::to_string(i);
        order["customer"]["tier"] = (int)(i % 4);
        order["items"].setArray();
        for (int k = 0; k < 3; ++k) {
            jtools::Json item;
            item["sku"] = "SKU-" + std::to_string(i * 3 + k);
            item["qty"] = k + 1;
            item["price"] = 9.5 * (k + 1);
            order["items"].getArray().push_back(std::move(item));
        }
        doc["orders"].getArray().push_back(std::move(order));
    }
    return doc;
}

inline jtools::Json
Load(const char* text)
{
    std::pair<jtools::Json::Status, jtools::Json> parsed = jtools::Json::parse(text);
    Ensure(parsed.first == jtools::Json::success,
           std::string("bad fixture: ") + jtools::Json::StatusToString(parsed.first));
    return parsed.second;
}

} // namespace bench

static const char kEditPatch[] = R"([
  {"op": "test", "path": "/region", "value": "emea"},
  {"op": "replace", "path": "/orders/10/status", "value": "cancelled"},
  {"op": "add", "path": "/orders/10/items/-",
   "value": {"sku": "REFUND", "qty": -1, "price": 0}},
  {"op": "copy", "from": "/orders/20/customer", "path": "/orders/21/customer"},
  {"op": "move", "from": "/orders/30", "path": "/archived"},
  {"op": "remove", "path": "/orders/40/items/0"}
])";

static const char kGuardedPatch[] = R"([
  {"op": "and", "apply": [
    {"op": "defined", "path": "/orders/10/customer"},
    {"op": "contains", "path": "/orders/12/status", "value": "shipped",
     "ignore_case": true},
    {"op": "less", "path": "/orders/12/customer/tier", "value": 4}]},
  {"op": "replace", "path": "/orders/12/status", "value": "delivered"}
])";

static const char kPredicate[] = R"({"op": "or", "apply": [
  {"op": "matches", "path": "/orders/99/customer/name", "value": "^customer-9+$"},
  {"op": "type", "path": "/orders/99/items", "value": "object"}]})";

int
main(int argc, char** argv)
{
    using namespace bench;

    BenchConfig config = ParseArgs(argc, argv);

    const jtools::Json small_orders = MakeOrders(50);
    const jtools::Json large_orders = MakeOrders(5000);
    const jtools::Patch edit(Load(kEditPatch));
    const jtools::Patch guarded = jtools::Patch::withPredicates(Load(kGuardedPatch));
    const jtools::PredicateRegistry predicates = jtools::PredicateRegistry::standard();
    const jtools::Json predicate = Load(kPredicate);
    const jtools::Pointer deep("/orders/4999/items/2/sku");
    const jtools::Pointer escaped("/orders/0/customer/name~1alias");

    jtools::Json scratch;

    std::vector<BenchCase> cases;

    cases.push_back({ "pointer.parse",
                      20000,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          jtools::Pointer p("/orders/12/customer/a~1b~0c");
                          g_sink += p.segments().size();
                      } });

    cases.push_back({ "pointer.resolve_deep",
                      20000,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          const jtools::Json* sku = deep.value(large_orders);
                          Ensure(sku != nullptr, "pointer.resolve_deep missed");
                          g_sink += sku->getString().size();
                      } });

    cases.push_back({ "pointer.resolve_missing",
                      20000,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          g_sink += escaped.exists(large_orders);
                      } });

    cases.push_back({ "patch.apply_copy_small",
                      500,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          jtools::Json out = edit.apply(small_orders);
                          DoNotOptimize(out);
                          g_sink += out.isObject();
                      } });

    cases.push_back({ "patch.apply_copy_large",
                      5,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          jtools::Json out = edit.apply(large_orders);
                          DoNotOptimize(out);
                          g_sink += out.isObject();
                      } });

    // in place application is timed against a fresh copy made in prepare
    cases.push_back({ "patch.apply_in_place_large",
                      1,
                      [&](std::size_t) { scratch = large_orders; },
                      [&]() {
                          edit.applyInPlace(scratch);
                          g_sink += scratch.isObject();
                      } });

    cases.push_back({ "patch.guarded_small",
                      500,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          jtools::Json out = guarded.apply(small_orders);
                          g_sink += out.isObject();
                      } });

    cases.push_back({ "patch.failed_test",
                      500,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          static const jtools::Patch failing(
                            Load(R"([{"op":"test","path":"/region","value":"apac"}])"));
                          try {
                              failing.apply(small_orders);
                              Ensure(false, "patch.failed_test succeeded");
                          } catch (const jtools::FailedOperationError& e) {
                              g_sink += std::strlen(e.what());
                          }
                      } });

    cases.push_back({ "predicate.evaluate",
                      2000,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          g_sink += predicates.evaluate(predicate, large_orders);
                      } });

    cases.push_back({ "json.deep_copy_large",
                      5,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          jtools::Json copied = large_orders;
                          DoNotOptimize(copied);
                          g_sink += copied.isObject();
                      } });

    cases.push_back({ "json.equality_large",
                      5,
                      std::function<void(std::size_t)>(),
                      [&]() {
                          g_sink += large_orders == large_orders;
                      } });

    if (config.list_only) {
        for (std::size_t i = 0; i < cases.size(); ++i) {
            Runner(config).run(cases[i]);
        }
        return 0;
    }

    if (!config.generate_report) {
        std::printf("patch_perf: warmup=%zu runs=%zu scale=%.2f\n",
                    config.warmup_runs,
                    config.measure_runs,
                    config.scale);
    }

    Runner runner(config);
    for (std::size_t i = 0; i < cases.size(); ++i) {
        runner.run(cases[i]);
    }

    if (config.generate_report) {
        const std::vector<BenchResult>& results = runner.getResults();
        if (config.report_format == "csv") {
            PrintCSVReport(results);
        } else if (config.report_format == "json") {
            PrintJSONReport(results, config);
        } else {
            PrintTextReport(results, config);
        }
    } else {
        std::printf("sink=%llu\n", static_cast<unsigned long long>(g_sink));
    }

    return 0;
}
