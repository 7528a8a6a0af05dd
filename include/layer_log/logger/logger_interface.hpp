#ifndef LAYER_LOG_LOGGER_INTERFACE_HPP
#define LAYER_LOG_LOGGER_INTERFACE_HPP

#include "../core/log_level.hpp"
#include "../core/log_record.hpp"
#include "../router/layer_configuration.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace layerlog {

    enum class LoggerState {
        Uninitialized,
        Initialized,
        Closing,
        Closed
    };

    inline const char *getLoggerStateString(LoggerState state) {
        switch (state) {
            case LoggerState::Uninitialized: return "uninitialized";
            case LoggerState::Initialized: return "initialized";
            case LoggerState::Closing: return "closing";
            case LoggerState::Closed: return "closed";
            default: return "unknown";
        }
    }

    /// Point-in-time counters of a logger, for health endpoints and tests.
    struct LoggerHealth {
        std::string name;
        std::string kind;         ///< "sync", "async" or "composite"
        LoggerState state;
        size_t logged;            ///< Records handed to the delivery path
        size_t dropped;           ///< Queue saturation and drain-deadline drops
        size_t sinkWriteErrors;
        size_t recordsLost;       ///< Records in failed sink writes
        size_t layers;
        size_t sinks;
        size_t primaryQueued;
        size_t overflowQueued;
        std::vector<LoggerHealth> components;

        LoggerHealth()
            : state(LoggerState::Uninitialized), logged(0), dropped(0), sinkWriteErrors(0)
            , recordsLost(0), layers(0), sinks(0), primaryQueued(0), overflowQueued(0) {}

        bool healthy() const {
            if (state != LoggerState::Initialized) return false;
            for (size_t i = 0; i < components.size(); ++i) {
                if (!components[i].healthy()) return false;
            }
            return true;
        }

        nlohmann::ordered_json toJson() const {
            nlohmann::ordered_json j;
            j["name"] = name;
            j["kind"] = kind;
            j["state"] = getLoggerStateString(state);
            j["healthy"] = healthy();
            j["logged"] = logged;
            j["dropped"] = dropped;
            j["sink_write_errors"] = sinkWriteErrors;
            j["records_lost"] = recordsLost;
            j["layers"] = layers;
            j["sinks"] = sinks;
            if (kind == "async") {
                j["primary_queued"] = primaryQueued;
                j["overflow_queued"] = overflowQueued;
            }
            if (!components.empty()) {
                nlohmann::ordered_json arr = nlohmann::ordered_json::array();
                for (size_t i = 0; i < components.size(); ++i) {
                    arr.push_back(components[i].toJson());
                }
                j["components"] = arr;
            }
            return j;
        }
    };

    /// One entry of a logBatch() call.
    struct LogCall {
        LogLevel level;
        std::string message;
        std::string layer;
        ExtraFields extra;

        LogCall(LogLevel level_, std::string message_,
                std::string layer_ = defaultLayerName(), ExtraFields extra_ = ExtraFields())
            : level(level_), message(std::move(message_))
            , layer(std::move(layer_)), extra(std::move(extra_)) {}
    };

    /// Common surface of sync, async and composite loggers.
    ///
    /// Logging never throws into the caller. Calls made before the logger is
    /// initialized or after close() has started are silently ignored and
    /// return false.
    class ILogger {
    public:
        virtual ~ILogger() = default;

        /// Log with explicit caller context. Returns true if the record was
        /// handed to the delivery path (a sink buffer or a dispatcher queue).
        virtual bool logAt(LogLevel level, const CallerContext &caller, const std::string &message,
                           const std::string &layer, const ExtraFields &extra) = 0;

        /// Submit several records at once. Returns how many were accepted.
        virtual size_t logBatch(const std::vector<LogCall> &calls) = 0;

        /// Fast-reject check: false when nothing would be written.
        virtual bool isEnabled(const std::string &layer, LogLevel level) const = 0;

        /// Idempotent. Flushes and releases every sink.
        virtual void close() = 0;

        virtual LoggerState state() const = 0;
        virtual const std::string &name() const = 0;
        virtual LoggerHealth health() const = 0;

        bool log(LogLevel level, const std::string &message,
                 const std::string &layer = defaultLayerName(),
                 const ExtraFields &extra = ExtraFields()) {
            return logAt(level, CallerContext(), message, layer, extra);
        }

        bool debug(const std::string &message, const std::string &layer = defaultLayerName(),
                   const ExtraFields &extra = ExtraFields()) {
            return log(LogLevel::DEBUG, message, layer, extra);
        }

        bool info(const std::string &message, const std::string &layer = defaultLayerName(),
                  const ExtraFields &extra = ExtraFields()) {
            return log(LogLevel::INFO, message, layer, extra);
        }

        bool warning(const std::string &message, const std::string &layer = defaultLayerName(),
                     const ExtraFields &extra = ExtraFields()) {
            return log(LogLevel::WARNING, message, layer, extra);
        }

        bool error(const std::string &message, const std::string &layer = defaultLayerName(),
                   const ExtraFields &extra = ExtraFields()) {
            return log(LogLevel::ERROR, message, layer, extra);
        }

        bool critical(const std::string &message, const std::string &layer = defaultLayerName(),
                      const ExtraFields &extra = ExtraFields()) {
            return log(LogLevel::CRITICAL, message, layer, extra);
        }

        bool isClosed() const {
            LoggerState s = state();
            return s == LoggerState::Closing || s == LoggerState::Closed;
        }
    };

} // namespace layerlog

#endif // LAYER_LOG_LOGGER_INTERFACE_HPP
