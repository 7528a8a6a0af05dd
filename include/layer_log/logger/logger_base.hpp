#ifndef LAYER_LOG_LOGGER_BASE_HPP
#define LAYER_LOG_LOGGER_BASE_HPP

#include "logger_interface.hpp"
#include "../core/log_common.hpp"
#include "../core/log_record.hpp"
#include "../router/layer_router.hpp"
#include "../sink/flush_timer.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace layerlog {

    /// Rewrites a message before it is recorded. Exceptions are reported and
    /// the original message is kept.
    using RedactionHook = std::function<std::string(const std::string &)>;

    /// Everything a sync or async logger is built from.
    struct LoggerSettings {
        std::string name_;
        LayerConfiguration layers_;
        ContextFields context_;
        RedactionHook redaction_;
        std::chrono::milliseconds flushInterval_; ///< 0 disables the flush timer

        LoggerSettings()
            : name_("layerlog")
            , flushInterval_(100) {}

        LoggerSettings& setName(const std::string &n) { name_ = n; return *this; }
        LoggerSettings& setLayers(LayerConfiguration layers) { layers_ = std::move(layers); return *this; }
        LoggerSettings& addContext(const std::string &key, const std::string &value) {
            context_[key] = value;
            return *this;
        }
        LoggerSettings& setRedaction(RedactionHook hook) { redaction_ = std::move(hook); return *this; }
        LoggerSettings& setFlushInterval(std::chrono::milliseconds interval) {
            flushInterval_ = interval;
            return *this;
        }
    };

namespace detail {

    /// State, routing and record building shared by SyncLogger and
    /// AsyncLogger. Subclasses decide what happens to a built record.
    class LayeredLoggerBase : public ILogger {
    public:
        ~LayeredLoggerBase() override = default;

        bool isEnabled(const std::string &layer, LogLevel level) const override {
            return m_router.isEnabled(layer, level);
        }

        LoggerState state() const override { return m_state.load(); }

        const std::string &name() const override { return m_name; }

        /// Install new routing. Sinks that drop out keep their buffers and
        /// are closed when the logger closes.
        void reload(const LayerConfiguration &layers) {
            if (state() != LoggerState::Initialized) return;
            SinkList previous = m_router.allSinks();
            m_router.reload(layers);
            SinkList current = m_router.allSinks();

            std::lock_guard<std::mutex> lock(m_retiredMutex);
            for (size_t i = 0; i < previous.size(); ++i) {
                bool kept = false;
                for (size_t j = 0; j < current.size() && !kept; ++j) {
                    kept = (previous[i] == current[j]);
                }
                if (!kept) m_retired.push_back(previous[i]);
            }
        }

        /// Add or replace a static context value. Only records built
        /// afterwards carry it.
        void setContext(const std::string &key, const std::string &value) {
            std::lock_guard<std::mutex> lock(m_contextMutex);
            m_context[key] = value;
        }

        ContextFields context() const {
            std::lock_guard<std::mutex> lock(m_contextMutex);
            return m_context;
        }

        const LayerRouter &router() const { return m_router; }

        /// Flush every current sink now, without waiting for a trigger.
        void flush() {
            SinkList sinks = m_router.allSinks();
            for (size_t i = 0; i < sinks.size(); ++i) {
                sinks[i]->flush();
            }
        }

    protected:
        explicit LayeredLoggerBase(const LoggerSettings &settings)
            : m_router(settings.layers_)
            , m_name(settings.name_)
            , m_timer(m_router, settings.flushInterval_)
            , m_timerEnabled(settings.flushInterval_.count() > 0)
            , m_context(settings.context_)
            , m_redaction(settings.redaction_)
            , m_state(LoggerState::Uninitialized)
            , m_sequence(0)
            , m_logged(0) {}

        /// Uninitialized -> Initialized, starting the flush timer.
        void markInitialized() {
            LoggerState expected = LoggerState::Uninitialized;
            if (m_state.compare_exchange_strong(expected, LoggerState::Initialized) && m_timerEnabled) {
                m_timer.start();
            }
        }

        /// Moves to Closing. Returns false if another call already did.
        bool beginClose() {
            LoggerState s = m_state.load();
            while (s == LoggerState::Uninitialized || s == LoggerState::Initialized) {
                if (m_state.compare_exchange_weak(s, LoggerState::Closing)) {
                    m_timer.stop();
                    return true;
                }
            }
            return false;
        }

        void finishClose() {
            closeRetired();
            m_state.store(LoggerState::Closed);
        }

        bool acceptingRecords() const {
            return m_state.load() == LoggerState::Initialized;
        }

        /// Record with the next sequence id, static context and redacted
        /// message.
        RecordPtr buildRecord(LogLevel level, const CallerContext &caller, const std::string &message,
                              const std::string &layer, const ExtraFields &extra) {
            RecordPtr record = std::make_shared<const LogRecord>(
                level, layer, m_name, message, extra, context(), caller,
                m_sequence.fetch_add(1, std::memory_order_relaxed) + 1);
            if (!m_redaction) return record;

            try {
                std::string redacted = m_redaction(message);
                return std::make_shared<const LogRecord>(record->withMessage(std::move(redacted)));
            } catch (const std::exception &e) {
                reportInternalError("Logger:" + m_name, std::string("redaction failed, message kept: ") + e.what());
            } catch (...) {
                reportInternalError("Logger:" + m_name, "redaction failed, message kept: unknown exception");
            }
            return record;
        }

        void countLogged(size_t n = 1) {
            m_logged.fetch_add(n, std::memory_order_relaxed);
        }

        /// Counters common to sync and async loggers.
        LoggerHealth baseHealth(const char *kind) const {
            LoggerHealth h;
            h.name = m_name;
            h.kind = kind;
            h.state = state();
            h.logged = m_logged.load(std::memory_order_relaxed);
            h.layers = m_router.layerCount();
            SinkList sinks = m_router.allSinks();
            h.sinks = sinks.size();
            for (size_t i = 0; i < sinks.size(); ++i) {
                SinkStats s = sinks[i]->stats();
                h.sinkWriteErrors += s.writeErrors;
                h.recordsLost += s.lost;
            }
            return h;
        }

        LayerRouter m_router;

    private:
        void closeRetired() {
            std::vector<SinkPtr> retired;
            {
                std::lock_guard<std::mutex> lock(m_retiredMutex);
                retired.swap(m_retired);
            }
            for (size_t i = 0; i < retired.size(); ++i) {
                retired[i]->close();
            }
        }

        std::string m_name;
        FlushTimer m_timer;
        bool m_timerEnabled;

        mutable std::mutex m_contextMutex;
        ContextFields m_context;
        RedactionHook m_redaction;

        std::atomic<LoggerState> m_state;
        std::atomic<uint64_t> m_sequence;
        std::atomic<size_t> m_logged;

        std::mutex m_retiredMutex;
        std::vector<SinkPtr> m_retired;
    };

} // namespace detail
} // namespace layerlog

#endif // LAYER_LOG_LOGGER_BASE_HPP
