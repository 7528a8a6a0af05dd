#ifndef LAYER_LOG_FORMATTER_INTERFACE_HPP
#define LAYER_LOG_FORMATTER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include <string>

namespace layerlog {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogRecord &record) const = 0;
    };
} // namespace layerlog

#endif // LAYER_LOG_FORMATTER_INTERFACE_HPP
