#ifndef LAYER_LOG_COMPOSITE_LOGGER_HPP
#define LAYER_LOG_COMPOSITE_LOGGER_HPP

#include "logger_interface.hpp"
#include "../core/log_common.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace layerlog {

    /// Fans every call out to independently configured loggers.
    ///
    /// A component that throws is reported and skipped; the others still
    /// receive the record. logBatch() passes the whole batch to each
    /// component so async components can enqueue it in one go.
    ///
    /// @code
    ///   CompositeLogger both("app", {syncLogger, asyncLogger});
    ///   both.info("user signed in", "AUTH");
    /// @endcode
    class CompositeLogger : public ILogger {
    public:
        CompositeLogger(const std::string &name, std::vector<std::shared_ptr<ILogger> > components)
            : m_name(name)
            , m_components(std::move(components))
            , m_state(LoggerState::Initialized)
            , m_logged(0)
            , m_componentErrors(0) {
            std::vector<std::shared_ptr<ILogger> > present;
            for (size_t i = 0; i < m_components.size(); ++i) {
                if (m_components[i]) present.push_back(m_components[i]);
            }
            m_components.swap(present);
        }

        ~CompositeLogger() override {
            close();
        }

        CompositeLogger(const CompositeLogger&) = delete;
        CompositeLogger& operator=(const CompositeLogger&) = delete;

        /// True if at least one component accepted the record.
        bool logAt(LogLevel level, const CallerContext &caller, const std::string &message,
                   const std::string &layer, const ExtraFields &extra) override {
            if (m_state.load() != LoggerState::Initialized) return false;
            bool any = false;
            for (size_t i = 0; i < m_components.size(); ++i) {
                try {
                    if (m_components[i]->logAt(level, caller, message, layer, extra)) any = true;
                } catch (const std::exception &e) {
                    componentFailed(i, e.what());
                } catch (...) {
                    componentFailed(i, "unknown exception");
                }
            }
            if (any) m_logged.fetch_add(1, std::memory_order_relaxed);
            return any;
        }

        /// Returns the largest count any single component accepted.
        size_t logBatch(const std::vector<LogCall> &calls) override {
            if (m_state.load() != LoggerState::Initialized) return 0;
            size_t best = 0;
            for (size_t i = 0; i < m_components.size(); ++i) {
                try {
                    size_t n = m_components[i]->logBatch(calls);
                    if (n > best) best = n;
                } catch (const std::exception &e) {
                    componentFailed(i, e.what());
                } catch (...) {
                    componentFailed(i, "unknown exception");
                }
            }
            m_logged.fetch_add(best, std::memory_order_relaxed);
            return best;
        }

        bool isEnabled(const std::string &layer, LogLevel level) const override {
            for (size_t i = 0; i < m_components.size(); ++i) {
                try {
                    if (m_components[i]->isEnabled(layer, level)) return true;
                } catch (const std::exception &e) {
                    componentFailed(i, e.what());
                } catch (...) {
                    componentFailed(i, "unknown exception");
                }
            }
            return false;
        }

        void close() override {
            LoggerState expected = LoggerState::Initialized;
            if (!m_state.compare_exchange_strong(expected, LoggerState::Closing)) return;
            for (size_t i = 0; i < m_components.size(); ++i) {
                try {
                    m_components[i]->close();
                } catch (const std::exception &e) {
                    componentFailed(i, e.what());
                } catch (...) {
                    componentFailed(i, "unknown exception");
                }
            }
            m_state.store(LoggerState::Closed);
        }

        LoggerState state() const override { return m_state.load(); }
        const std::string &name() const override { return m_name; }

        size_t componentCount() const { return m_components.size(); }
        size_t componentErrors() const { return m_componentErrors.load(std::memory_order_relaxed); }

        /// Sums of the component counters, plus each component's own health.
        LoggerHealth health() const override {
            LoggerHealth h;
            h.name = m_name;
            h.kind = "composite";
            h.state = m_state.load();
            h.logged = m_logged.load(std::memory_order_relaxed);
            for (size_t i = 0; i < m_components.size(); ++i) {
                LoggerHealth c = m_components[i]->health();
                h.dropped += c.dropped;
                h.sinkWriteErrors += c.sinkWriteErrors;
                h.recordsLost += c.recordsLost;
                h.layers += c.layers;
                h.sinks += c.sinks;
                h.components.push_back(c);
            }
            return h;
        }

    private:
        void componentFailed(size_t index, const char *what) const {
            m_componentErrors.fetch_add(1, std::memory_order_relaxed);
            detail::reportInternalError("CompositeLogger:" + m_name,
                "component '" + m_components[index]->name() + "' failed: " + what);
        }

        std::string m_name;
        std::vector<std::shared_ptr<ILogger> > m_components;
        std::atomic<LoggerState> m_state;
        std::atomic<size_t> m_logged;
        mutable std::atomic<size_t> m_componentErrors;
    };

} // namespace layerlog

#endif // LAYER_LOG_COMPOSITE_LOGGER_HPP
