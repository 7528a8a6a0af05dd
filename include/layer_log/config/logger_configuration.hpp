#ifndef LAYER_LOG_LOGGER_CONFIGURATION_HPP
#define LAYER_LOG_LOGGER_CONFIGURATION_HPP

#include "../core/log_level.hpp"
#include "../router/layer_configuration.hpp"
#include "../logger/logger_base.hpp"
#include "../logger/sync_logger.hpp"
#include "../logger/async_logger.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace layerlog {

    /// Fluent builder for a SyncLogger or AsyncLogger.
    ///
    /// Usage:
    /// @code
    ///   auto log = LoggerConfiguration()
    ///       .name("orders")
    ///       .layer("default", LogLevel::INFO)
    ///       .writeTo("default", makeConsoleSink())
    ///       .layer("AUDIT", LogLevel::WARNING)
    ///       .writeTo("AUDIT", makeFileSink("audit.log"))
    ///       .context("service", "orders")
    ///       .buildAsync();
    /// @endcode
    ///
    /// A configuration builds exactly one logger: the sinks it holds become
    /// owned by that logger. A second build throws std::logic_error.
    class LoggerConfiguration {
    public:
        LoggerConfiguration() : m_built(false) {}

        LoggerConfiguration(const LoggerConfiguration&) = delete;
        LoggerConfiguration& operator=(const LoggerConfiguration&) = delete;
        LoggerConfiguration(LoggerConfiguration&&) = default;
        LoggerConfiguration& operator=(LoggerConfiguration&&) = default;

        LoggerConfiguration& name(const std::string &n) {
            m_settings.setName(n);
            return *this;
        }

        /// Declare a layer or change its threshold.
        LoggerConfiguration& layer(const std::string &name, LogLevel threshold) {
            m_settings.layers_.addLayer(name, threshold);
            return *this;
        }

        /// Append a sink to a layer. Undeclared layers get threshold INFO.
        LoggerConfiguration& writeTo(const std::string &layer, SinkPtr sink) {
            m_settings.layers_.addSink(layer, std::move(sink));
            return *this;
        }

        /// Replace all layers at once, e.g. with configurationFromEnvironment().
        LoggerConfiguration& layers(LayerConfiguration config) {
            m_settings.setLayers(std::move(config));
            return *this;
        }

        LoggerConfiguration& context(const std::string &key, const std::string &value) {
            m_settings.addContext(key, value);
            return *this;
        }

        LoggerConfiguration& redact(RedactionHook hook) {
            m_settings.setRedaction(std::move(hook));
            return *this;
        }

        /// Period of the stale-buffer check. 0 disables the timer.
        LoggerConfiguration& flushInterval(std::chrono::milliseconds interval) {
            m_settings.setFlushInterval(interval);
            return *this;
        }

        /// Async only.
        LoggerConfiguration& dispatcher(DispatcherOptions opts) {
            m_async.setDispatcher(std::move(opts));
            return *this;
        }

        /// Async only. When false, workers start on AsyncLogger::start().
        LoggerConfiguration& autoStart(bool enable) {
            m_async.setAutoStart(enable);
            return *this;
        }

        const LoggerSettings &settings() const { return m_settings; }

        std::shared_ptr<SyncLogger> buildSync() {
            markBuilt();
            return std::make_shared<SyncLogger>(m_settings);
        }

        std::shared_ptr<AsyncLogger> buildAsync() {
            markBuilt();
            return std::make_shared<AsyncLogger>(m_settings, m_async);
        }

    private:
        void markBuilt() {
            if (m_built) {
                throw std::logic_error("LoggerConfiguration::build called more than once");
            }
            m_built = true;
        }

        LoggerSettings m_settings;
        AsyncOptions m_async;
        bool m_built;
    };

} // namespace layerlog

#endif // LAYER_LOG_LOGGER_CONFIGURATION_HPP
