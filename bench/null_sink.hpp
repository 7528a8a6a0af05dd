#pragma once
#include "layer_log.hpp"

namespace layerlog {

/// Sink over NullTransport with plain-text formatting, so benchmarks pay
/// for buffering and formatting but not for I/O.
inline SinkPtr makeNullSink(size_t maxBufferSize = 1024,
                            LogLevel minLevel = LogLevel::NOTSET) {
    SinkOptions opts;
    opts.setName("null").setMaxBufferSize(maxBufferSize).setMinLevel(minLevel);
    return std::make_shared<Sink>(opts, nullptr, detail::make_unique<NullTransport>());
}

inline LoggerSettings benchSettings(SinkPtr sink, LogLevel threshold = LogLevel::DEBUG) {
    LayerConfiguration layers;
    layers.addLayer("APP", threshold).addSink("APP", std::move(sink));
    LoggerSettings s;
    s.setName("bench").setLayers(layers).setFlushInterval(std::chrono::milliseconds(0));
    return s;
}

} // namespace layerlog
