#ifndef LAYER_LOG_ASYNC_LOGGER_HPP
#define LAYER_LOG_ASYNC_LOGGER_HPP

#include "logger_base.hpp"
#include "../dispatch/async_dispatcher.hpp"
#include <chrono>
#include <vector>

namespace layerlog {

    struct AsyncOptions {
        DispatcherOptions dispatcher_;
        bool autoStart_; ///< Start workers in the constructor

        AsyncOptions() : autoStart_(true) {}

        AsyncOptions& setDispatcher(DispatcherOptions d) { dispatcher_ = std::move(d); return *this; }
        AsyncOptions& setAutoStart(bool enable) { autoStart_ = enable; return *this; }
    };

    /// Hands records to an AsyncDispatcher and returns immediately.
    ///
    /// log() returns false when the record was filtered or both dispatcher
    /// queues were full; in the latter case the drop is counted.
    ///
    /// With autoStart disabled the logger accepts records but no worker runs
    /// until start(), which is how a stalled consumer is reproduced.
    class AsyncLogger : public detail::LayeredLoggerBase {
    public:
        AsyncLogger(const LoggerSettings &settings, AsyncOptions opts = AsyncOptions())
            : LayeredLoggerBase(settings)
            , m_dispatcher(m_router, opts.dispatcher_) {
            markInitialized();
            if (opts.autoStart_) {
                m_dispatcher.start();
            }
        }

        ~AsyncLogger() override {
            close();
        }

        AsyncLogger(const AsyncLogger&) = delete;
        AsyncLogger& operator=(const AsyncLogger&) = delete;

        void start() {
            m_dispatcher.start();
        }

        bool logAt(LogLevel level, const CallerContext &caller, const std::string &message,
                   const std::string &layer, const ExtraFields &extra) override {
            if (!acceptingRecords()) return false;
            if (!m_router.isEnabled(layer, level)) return false;
            try {
                RecordPtr record = buildRecord(level, caller, message, layer, extra);
                if (m_dispatcher.enqueue(record) == EnqueueResult::Dropped) {
                    return false;
                }
                countLogged();
                return true;
            } catch (const std::exception &e) {
                detail::reportInternalError("Logger:" + name(), std::string("log failed: ") + e.what());
            } catch (...) {
                detail::reportInternalError("Logger:" + name(), "log failed: unknown exception");
            }
            return false;
        }

        /// Builds every enabled record first, then enqueues them together.
        size_t logBatch(const std::vector<LogCall> &calls) override {
            if (!acceptingRecords()) return 0;
            try {
                std::vector<RecordPtr> records;
                records.reserve(calls.size());
                for (size_t i = 0; i < calls.size(); ++i) {
                    const LogCall &c = calls[i];
                    if (!m_router.isEnabled(c.layer, c.level)) continue;
                    records.push_back(buildRecord(c.level, CallerContext(), c.message, c.layer, c.extra));
                }
                size_t accepted = m_dispatcher.enqueueBatch(records);
                countLogged(accepted);
                return accepted;
            } catch (const std::exception &e) {
                detail::reportInternalError("Logger:" + name(), std::string("batch failed: ") + e.what());
            } catch (...) {
                detail::reportInternalError("Logger:" + name(), "batch failed: unknown exception");
            }
            return 0;
        }

        /// Drain with the dispatcher's configured grace period.
        void close() override {
            close(m_dispatcher.options().drainGrace_);
        }

        /// Drain for at most @p grace; whatever is still queued is counted
        /// as dropped. Later calls do nothing.
        void close(std::chrono::milliseconds grace) {
            if (!beginClose()) return;
            m_dispatcher.drain(grace);
            finishClose();
        }

        size_t droppedCount() const { return m_dispatcher.droppedCount(); }

        const AsyncDispatcher &dispatcher() const { return m_dispatcher; }

        LoggerHealth health() const override {
            LoggerHealth h = baseHealth("async");
            DispatcherStats s = m_dispatcher.stats();
            h.dropped = s.dropped;
            h.primaryQueued = s.primarySize;
            h.overflowQueued = s.overflowSize;
            return h;
        }

    private:
        AsyncDispatcher m_dispatcher;
    };

} // namespace layerlog

#endif // LAYER_LOG_ASYNC_LOGGER_HPP
