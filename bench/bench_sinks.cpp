#include <benchmark/benchmark.h>
#include "layer_log.hpp"
#include "null_sink.hpp"

// ---------------------------------------------------------------------------
// BM_Sink_Accept
// Buffering plus inline flush every maxBufferSize records.
// ---------------------------------------------------------------------------
static void BM_Sink_Accept(benchmark::State& state) {
    layerlog::SinkPtr sink = layerlog::makeNullSink(static_cast<size_t>(state.range(0)));
    layerlog::RecordPtr record = layerlog::makeRecord(layerlog::LogLevel::INFO, "APP", "Hello world");

    for (auto _ : state) {
        benchmark::DoNotOptimize(sink->accept(record));
    }
    sink->close();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sink_Accept)->Arg(1)->Arg(100)->Arg(1000);

// ---------------------------------------------------------------------------
// BM_Sink_Filtered
// Record below the sink's minimum level.
// ---------------------------------------------------------------------------
static void BM_Sink_Filtered(benchmark::State& state) {
    layerlog::SinkPtr sink = layerlog::makeNullSink(100, layerlog::LogLevel::ERROR);
    layerlog::RecordPtr record = layerlog::makeRecord(layerlog::LogLevel::INFO, "APP", "dropped");

    for (auto _ : state) {
        benchmark::DoNotOptimize(sink->accept(record));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sink_Filtered);

// ---------------------------------------------------------------------------
// BM_Sink_JsonFlush
// Fill a 100-record buffer and flush it through the JSON formatter.
// ---------------------------------------------------------------------------
static void BM_Sink_JsonFlush(benchmark::State& state) {
    layerlog::SinkOptions opts;
    opts.setName("json-null").setMaxBufferSize(100);
    layerlog::Sink sink(opts, layerlog::detail::make_unique<layerlog::JsonFormatter>(),
                        layerlog::detail::make_unique<layerlog::NullTransport>());
    layerlog::RecordPtr record = layerlog::makeRecord(layerlog::LogLevel::INFO, "APP", "Hello world");

    for (auto _ : state) {
        for (int i = 0; i < 100; ++i) {
            sink.accept(record);
        }
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * 100);
}
BENCHMARK(BM_Sink_JsonFlush);

// ---------------------------------------------------------------------------
// BM_Sink_Contended
// Shared sink under increasing thread counts.
// ---------------------------------------------------------------------------
static void BM_Sink_Contended(benchmark::State& state) {
    static layerlog::SinkPtr sink = layerlog::makeNullSink(1024);
    layerlog::RecordPtr record = layerlog::makeRecord(layerlog::LogLevel::INFO, "APP", "Hello world");

    for (auto _ : state) {
        benchmark::DoNotOptimize(sink->accept(record));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sink_Contended)->Threads(1)->Threads(4)->Threads(8);
