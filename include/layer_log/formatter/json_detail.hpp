#ifndef LAYER_LOG_JSON_DETAIL_HPP
#define LAYER_LOG_JSON_DETAIL_HPP

#include "../core/log_record.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>

namespace layerlog {
namespace detail {

    inline nlohmann::ordered_json recordToJson(const LogRecord &record) {
        nlohmann::ordered_json j;
        j["timestamp"] = formatTimestamp(record.timestamp());
        j["level"] = record.levelName();
        j["level_value"] = record.levelValue();
        j["layer"] = record.layer();
        if (!record.loggerName().empty()) {
            j["logger"] = record.loggerName();
        }
        j["message"] = record.message();
        if (record.hasCaller()) {
            j["file"] = record.caller().file;
            j["function"] = record.caller().function;
            j["line"] = record.caller().line;
        }
        if (!record.extra().empty()) {
            nlohmann::ordered_json extra = nlohmann::ordered_json::object();
            for (const auto &kv : record.extra()) {
                extra[kv.first] = kv.second;
            }
            j["extra"] = extra;
        }
        if (!record.context().empty()) {
            nlohmann::ordered_json context = nlohmann::ordered_json::object();
            for (const auto &kv : record.context()) {
                context[kv.first] = kv.second;
            }
            j["context"] = context;
        }
        return j;
    }

} // namespace detail
} // namespace layerlog

#endif // LAYER_LOG_JSON_DETAIL_HPP
