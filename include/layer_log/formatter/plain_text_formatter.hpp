#ifndef LAYER_LOG_PLAIN_TEXT_FORMATTER_HPP
#define LAYER_LOG_PLAIN_TEXT_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <sstream>

namespace layerlog {
    /// `2024-01-01 12:00:00.000 [INFO] [APP] message [file:line function] {k=v, ...}`
    class PlainTextFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            std::ostringstream oss;
            oss << formatTimestamp(record.timestamp()) << " "
                << "[" << record.levelName() << "] "
                << "[" << record.layer() << "] "
                << record.message();

            if (record.hasCaller()) {
                const CallerContext &caller = record.caller();
                oss << " [" << caller.file << ":" << caller.line << " " << caller.function << "]";
            }

            if (!record.extra().empty()) {
                oss << " {";
                const ExtraFields &extra = record.extra();
                for (size_t i = 0; i < extra.size(); ++i) {
                    if (i > 0) oss << ", ";
                    oss << extra[i].first << "=" << extra[i].second;
                }
                oss << "}";
            }

            return oss.str();
        }
    };

    /// Message text only. Used where the destination adds its own framing.
    class MessageOnlyFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            return record.message();
        }
    };
} // namespace layerlog

#endif // LAYER_LOG_PLAIN_TEXT_FORMATTER_HPP
