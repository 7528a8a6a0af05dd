#include <benchmark/benchmark.h>
#include "layer_log.hpp"

static layerlog::LogRecord sampleRecord() {
    layerlog::ExtraFields extra;
    extra.push_back(std::make_pair("user", "alice"));
    extra.push_back(std::make_pair("order", "12345"));
    layerlog::ContextFields ctx;
    ctx["service"] = "checkout";
    return layerlog::LogRecord(layerlog::LogLevel::INFO, "APP", "bench",
                               "Order placed", extra, ctx,
                               layerlog::CallerContext("orders.cpp", "place", 88));
}

// ---------------------------------------------------------------------------
// BM_Format_PlainText
// ---------------------------------------------------------------------------
static void BM_Format_PlainText(benchmark::State& state) {
    layerlog::LogRecord record = sampleRecord();
    layerlog::PlainTextFormatter fmt;
    for (auto _ : state) {
        benchmark::DoNotOptimize(fmt.format(record));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Format_PlainText);

// ---------------------------------------------------------------------------
// BM_Format_Json
// nlohmann ordered_json build and dump per record.
// ---------------------------------------------------------------------------
static void BM_Format_Json(benchmark::State& state) {
    layerlog::LogRecord record = sampleRecord();
    layerlog::JsonFormatter fmt;
    for (auto _ : state) {
        benchmark::DoNotOptimize(fmt.format(record));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Format_Json);

// ---------------------------------------------------------------------------
// BM_Router_Resolve
// Lookup of a configured layer and of one that falls back to "default".
// ---------------------------------------------------------------------------
static void BM_Router_Resolve(benchmark::State& state) {
    layerlog::LayerConfiguration cfg;
    for (int i = 0; i < 16; ++i) {
        cfg.addLayer("L" + std::to_string(i), layerlog::LogLevel::INFO);
    }
    cfg.addLayer("default", layerlog::LogLevel::INFO);
    layerlog::LayerRouter router(cfg);
    const std::string layer = state.range(0) ? "L7" : "UNKNOWN";

    for (auto _ : state) {
        benchmark::DoNotOptimize(router.resolve(layer));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Router_Resolve)->Arg(1)->Arg(0);
