#include <benchmark/benchmark.h>
#include "layer_log.hpp"
#include "null_sink.hpp"

// ---------------------------------------------------------------------------
// BM_Sync_NoLayers
// Logger with no layers: state check and an empty resolution only.
// ---------------------------------------------------------------------------
static void BM_Sync_NoLayers(benchmark::State& state) {
    layerlog::LoggerSettings s;
    s.setFlushInterval(std::chrono::milliseconds(0));
    layerlog::SyncLogger logger(s);

    for (auto _ : state) {
        benchmark::DoNotOptimize(logger.info("Hello", "APP"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sync_NoLayers);

// ---------------------------------------------------------------------------
// BM_Sync_Disabled
// DEBUG call on an INFO layer. Rejected before any record is built.
// ---------------------------------------------------------------------------
static void BM_Sync_Disabled(benchmark::State& state) {
    layerlog::SyncLogger logger(layerlog::benchSettings(layerlog::makeNullSink(), layerlog::LogLevel::INFO));

    for (auto _ : state) {
        benchmark::DoNotOptimize(logger.debug("filtered", "APP"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sync_Disabled);

// ---------------------------------------------------------------------------
// BM_Sync_SingleThread
// Full inline path: record, resolve, buffer, format on flush.
// Argument is the sink's maxBufferSize.
// ---------------------------------------------------------------------------
static void BM_Sync_SingleThread(benchmark::State& state) {
    layerlog::SyncLogger logger(layerlog::benchSettings(
        layerlog::makeNullSink(static_cast<size_t>(state.range(0)))));

    for (auto _ : state) {
        logger.info("Hello world", "APP");
    }
    logger.close();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sync_SingleThread)->Arg(1)->Arg(64)->Arg(1024);

// ---------------------------------------------------------------------------
// BM_Sync_MultiThread
// One shared logger under increasing thread counts; contention is on the
// sink's buffer mutex.
// ---------------------------------------------------------------------------
static void BM_Sync_MultiThread(benchmark::State& state) {
    static layerlog::SyncLogger* logger = new layerlog::SyncLogger(
        layerlog::benchSettings(layerlog::makeNullSink(1024)));

    for (auto _ : state) {
        logger->info("Hello world", "APP");
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sync_MultiThread)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

// ---------------------------------------------------------------------------
// BM_Async_Enqueue
// Producer-side cost of the async path with workers draining concurrently.
// Drain time is excluded.
// ---------------------------------------------------------------------------
static void BM_Async_Enqueue(benchmark::State& state) {
    layerlog::AsyncLogger logger(layerlog::benchSettings(layerlog::makeNullSink(1024)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(logger.info("Hello world", "APP"));
    }
    state.PauseTiming();
    logger.close();
    state.ResumeTiming();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Async_Enqueue);

// ---------------------------------------------------------------------------
// BM_Async_Batch
// logBatch() with 100 calls per iteration.
// ---------------------------------------------------------------------------
static void BM_Async_Batch(benchmark::State& state) {
    layerlog::AsyncLogger logger(layerlog::benchSettings(layerlog::makeNullSink(1024)));
    std::vector<layerlog::LogCall> calls;
    for (int i = 0; i < 100; ++i) {
        calls.push_back(layerlog::LogCall(layerlog::LogLevel::INFO, "batched", "APP"));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(logger.logBatch(calls));
    }
    state.PauseTiming();
    logger.close();
    state.ResumeTiming();
    state.SetItemsProcessed(state.iterations() * 100);
}
BENCHMARK(BM_Async_Batch);
