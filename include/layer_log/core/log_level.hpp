#ifndef LAYER_LOG_LEVEL_HPP
#define LAYER_LOG_LEVEL_HPP

#include <string>
#include <cctype>

namespace layerlog {
    enum class LogLevel {
        NOTSET = 0,
        DEBUG = 10,
        INFO = 20,
        WARNING = 30,
        ERROR = 40,
        CRITICAL = 50
    };

    inline int levelValue(LogLevel level) {
        return static_cast<int>(level);
    }

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::NOTSET: return "NOTSET";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }

    /// Parse a level name (case-insensitive). WARN and FATAL are accepted
    /// as aliases. Unknown names yield @p fallback.
    inline LogLevel parseLevel(const std::string &name, LogLevel fallback = LogLevel::INFO) {
        std::string upper;
        upper.reserve(name.size());
        for (size_t i = 0; i < name.size(); ++i) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(name[i])));
        }
        if (upper == "NOTSET") return LogLevel::NOTSET;
        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "INFO") return LogLevel::INFO;
        if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
        if (upper == "ERROR") return LogLevel::ERROR;
        if (upper == "CRITICAL" || upper == "FATAL") return LogLevel::CRITICAL;
        return fallback;
    }
} // namespace layerlog

#endif // LAYER_LOG_LEVEL_HPP
