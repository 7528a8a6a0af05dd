#ifndef LAYER_LOG_RECORD_HPP
#define LAYER_LOG_RECORD_HPP

#include "log_level.hpp"
#include <string>
#include <chrono>
#include <vector>
#include <map>
#include <memory>
#include <utility>
#include <cstdint>

namespace layerlog {

    /// Source position of a log call. Empty unless the caller passes it
    /// explicitly or uses the LAYER_LOG_* macros.
    struct CallerContext {
        std::string file;
        std::string function;
        int line;

        CallerContext() : line(0) {}
        CallerContext(std::string file_, std::string function_, int line_)
            : file(std::move(file_)), function(std::move(function_)), line(line_) {}

        bool empty() const { return file.empty() && function.empty() && line == 0; }
    };

    using ExtraFields = std::vector<std::pair<std::string, std::string> >;
    using ContextFields = std::map<std::string, std::string>;

    /// One log call, frozen at construction.
    ///
    /// Records travel as RecordPtr (shared_ptr to const) so sinks and
    /// dispatcher workers can hold the same record concurrently. There are
    /// no setters; withMessage() produces a new record.
    class LogRecord {
    public:
        LogRecord(LogLevel level,
                  std::string layer,
                  std::string loggerName,
                  std::string message,
                  ExtraFields extra = ExtraFields(),
                  ContextFields context = ContextFields(),
                  CallerContext caller = CallerContext(),
                  uint64_t sequence = 0,
                  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now(),
                  std::chrono::steady_clock::time_point monotonic = std::chrono::steady_clock::now())
            : m_level(level)
            , m_layer(std::move(layer))
            , m_loggerName(std::move(loggerName))
            , m_message(std::move(message))
            , m_extra(std::move(extra))
            , m_context(std::move(context))
            , m_caller(std::move(caller))
            , m_sequence(sequence)
            , m_timestamp(timestamp)
            , m_monotonic(monotonic) {}

        LogLevel level() const { return m_level; }
        int levelValue() const { return static_cast<int>(m_level); }
        const char *levelName() const { return getLevelString(m_level); }
        const std::string &layer() const { return m_layer; }
        const std::string &loggerName() const { return m_loggerName; }
        const std::string &message() const { return m_message; }
        const ExtraFields &extra() const { return m_extra; }
        const ContextFields &context() const { return m_context; }
        const CallerContext &caller() const { return m_caller; }
        bool hasCaller() const { return !m_caller.empty(); }
        uint64_t sequence() const { return m_sequence; }
        std::chrono::system_clock::time_point timestamp() const { return m_timestamp; }
        std::chrono::steady_clock::time_point monotonic() const { return m_monotonic; }

        /// Copy of this record carrying a different message.
        LogRecord withMessage(std::string message) const {
            LogRecord copy(*this);
            copy.m_message = std::move(message);
            return copy;
        }

    private:
        LogLevel m_level;
        std::string m_layer;
        std::string m_loggerName;
        std::string m_message;
        ExtraFields m_extra;
        ContextFields m_context;
        CallerContext m_caller;
        uint64_t m_sequence;
        std::chrono::system_clock::time_point m_timestamp;
        std::chrono::steady_clock::time_point m_monotonic;
    };

    using RecordPtr = std::shared_ptr<const LogRecord>;

    inline RecordPtr makeRecord(LogLevel level, const std::string &layer, const std::string &message) {
        return std::make_shared<const LogRecord>(level, layer, std::string(), message);
    }
} // namespace layerlog

#endif // LAYER_LOG_RECORD_HPP
