#ifndef LAYER_LOG_JSON_FORMATTER_HPP
#define LAYER_LOG_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "json_detail.hpp"

namespace layerlog {
    /// One JSON object per record (JSON lines).
    class JsonFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            return detail::recordToJson(record).dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }
    };
} // namespace layerlog

#endif // LAYER_LOG_JSON_FORMATTER_HPP
