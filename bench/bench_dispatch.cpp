#include <benchmark/benchmark.h>
#include <cstdio>
#include <future>
#include <string>
#include <vector>
#include "tally_log.hpp"

static std::string benchDir(const std::string& suffix) {
    return "/tmp/tally_bench_" + std::to_string(tally::currentProcessId()) + "_" + suffix;
}

static std::unique_ptr<tally::LogManager> quietManager(const std::string& dir,
                                                       tally::FileFormat format) {
    return tally::LogManager::configure()
        .directory(dir)
        .defaultFormat(format)
        .console(nullptr)
        .build();
}

// ---------------------------------------------------------------------------
// BM_Dispatch_ConsoleOnly
// DEBUG without saveFile: policy check only, no file I/O.
// ---------------------------------------------------------------------------
static void BM_Dispatch_ConsoleOnly(benchmark::State& state) {
    auto log = quietManager(benchDir("console"), tally::FileFormat::Json);
    for (auto _ : state) {
        log->debug("console only");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Dispatch_ConsoleOnly);

// ---------------------------------------------------------------------------
// BM_Dispatch_Json_Blocking
// One open/append/close per record.
// ---------------------------------------------------------------------------
static void BM_Dispatch_Json_Blocking(benchmark::State& state) {
    std::string dir = benchDir("json");
    auto log = quietManager(dir, tally::FileFormat::Json);
    for (auto _ : state) {
        log->error("blocking json record");
    }
    state.SetItemsProcessed(state.iterations());
    std::remove(log->filePath(tally::LogLevel::ERROR, tally::FileFormat::Json).c_str());
}
BENCHMARK(BM_Dispatch_Json_Blocking);

static void BM_Dispatch_Csv_Blocking(benchmark::State& state) {
    std::string dir = benchDir("csv");
    auto log = quietManager(dir, tally::FileFormat::Csv);
    for (auto _ : state) {
        log->error("blocking, csv record");
    }
    state.SetItemsProcessed(state.iterations());
    std::remove(log->filePath(tally::LogLevel::ERROR, tally::FileFormat::Csv).c_str());
}
BENCHMARK(BM_Dispatch_Csv_Blocking);

// ---------------------------------------------------------------------------
// BM_Dispatch_Json_Async
// Batches of non-blocking calls awaited together.
// ---------------------------------------------------------------------------
static void BM_Dispatch_Json_Async(benchmark::State& state) {
    std::string dir = benchDir("json_async");
    auto log = quietManager(dir, tally::FileFormat::Json);
    const int batch = static_cast<int>(state.range(0));
    std::vector<std::future<void> > pending;
    pending.reserve(batch);
    for (auto _ : state) {
        pending.clear();
        for (int i = 0; i < batch; ++i) {
            pending.push_back(log->errorAsync("async json record"));
        }
        for (auto& f : pending) {
            f.get();
        }
    }
    state.SetItemsProcessed(state.iterations() * batch);
    std::remove(log->filePath(tally::LogLevel::ERROR, tally::FileFormat::Json).c_str());
}
BENCHMARK(BM_Dispatch_Json_Async)->Arg(1)->Arg(64);
