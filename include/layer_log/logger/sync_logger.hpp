#ifndef LAYER_LOG_SYNC_LOGGER_HPP
#define LAYER_LOG_SYNC_LOGGER_HPP

#include "logger_base.hpp"
#include <vector>

namespace layerlog {

    /// Delivers on the calling thread: resolve the layer, then accept() on
    /// each sink. A flush triggered by the call runs inline and may block on
    /// I/O. Safe to call from many threads; sinks synchronize themselves.
    class SyncLogger : public detail::LayeredLoggerBase {
    public:
        explicit SyncLogger(const LoggerSettings &settings)
            : LayeredLoggerBase(settings) {
            markInitialized();
        }

        ~SyncLogger() override {
            close();
        }

        SyncLogger(const SyncLogger&) = delete;
        SyncLogger& operator=(const SyncLogger&) = delete;

        bool logAt(LogLevel level, const CallerContext &caller, const std::string &message,
                   const std::string &layer, const ExtraFields &extra) override {
            if (!acceptingRecords()) return false;
            if (!m_router.isEnabled(layer, level)) return false;
            try {
                RecordPtr record = buildRecord(level, caller, message, layer, extra);
                deliver(record);
                countLogged();
                return true;
            } catch (const std::exception &e) {
                detail::reportInternalError("Logger:" + name(), std::string("log failed: ") + e.what());
            } catch (...) {
                detail::reportInternalError("Logger:" + name(), "log failed: unknown exception");
            }
            return false;
        }

        size_t logBatch(const std::vector<LogCall> &calls) override {
            size_t accepted = 0;
            for (size_t i = 0; i < calls.size(); ++i) {
                const LogCall &c = calls[i];
                if (logAt(c.level, CallerContext(), c.message, c.layer, c.extra)) ++accepted;
            }
            return accepted;
        }

        /// Final flush and release of every sink, including ones retired by
        /// reload(). Later calls do nothing.
        void close() override {
            if (!beginClose()) return;
            SinkList sinks = m_router.allSinks();
            for (size_t i = 0; i < sinks.size(); ++i) {
                sinks[i]->close();
            }
            finishClose();
        }

        LoggerHealth health() const override {
            return baseHealth("sync");
        }

    private:
        void deliver(const RecordPtr &record) {
            SinkListPtr sinks = m_router.resolve(record->layer());
            for (size_t i = 0; i < sinks->size(); ++i) {
                (*sinks)[i]->accept(record);
            }
        }
    };

} // namespace layerlog

#endif // LAYER_LOG_SYNC_LOGGER_HPP
