#ifndef LAYER_LOG_ENVIRONMENT_HPP
#define LAYER_LOG_ENVIRONMENT_HPP

#include "../core/log_level.hpp"
#include "../router/layer_configuration.hpp"
#include "../sink/sink_factory.hpp"
#include "../formatter/json_formatter.hpp"
#include "../formatter/plain_text_formatter.hpp"
#include <cctype>
#include <cstdlib>
#include <map>
#include <string>

namespace layerlog {

    /// Environment values consulted at startup. Empty means unset.
    struct EnvironmentInputs {
        std::string level;   ///< LAYER_LOG_LEVEL, e.g. "debug"
        std::string format;  ///< LAYER_LOG_FORMAT, "plain" or "json"
        std::string file;    ///< LAYER_LOG_FILE, path of an extra file sink
        std::string console; ///< LAYER_LOG_CONSOLE, "0"/"false"/"off"/"no" disables

        /// Read the process environment once.
        static EnvironmentInputs fromProcess() {
            EnvironmentInputs in;
            in.level = readVar("LAYER_LOG_LEVEL");
            in.format = readVar("LAYER_LOG_FORMAT");
            in.file = readVar("LAYER_LOG_FILE");
            in.console = readVar("LAYER_LOG_CONSOLE");
            return in;
        }

        static EnvironmentInputs fromMap(const std::map<std::string, std::string> &vars) {
            EnvironmentInputs in;
            in.level = lookup(vars, "LAYER_LOG_LEVEL");
            in.format = lookup(vars, "LAYER_LOG_FORMAT");
            in.file = lookup(vars, "LAYER_LOG_FILE");
            in.console = lookup(vars, "LAYER_LOG_CONSOLE");
            return in;
        }

    private:
        static std::string readVar(const char *name) {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string();
        }

        static std::string lookup(const std::map<std::string, std::string> &vars, const char *name) {
            std::map<std::string, std::string>::const_iterator it = vars.find(name);
            return it == vars.end() ? std::string() : it->second;
        }
    };

namespace detail {

    inline std::string toLower(const std::string &s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
        }
        return out;
    }

    inline bool isFalseValue(const std::string &s) {
        std::string v = toLower(s);
        return v == "0" || v == "false" || v == "off" || v == "no";
    }

    inline std::unique_ptr<IFormatter> formatterFor(const std::string &format) {
        if (toLower(format) == "json") {
            return make_unique<JsonFormatter>();
        }
        return make_unique<PlainTextFormatter>();
    }

} // namespace detail

    /// A single "default" layer derived from the environment: threshold from
    /// LAYER_LOG_LEVEL (INFO when unset or unknown), a console sink unless
    /// disabled, and a file sink when LAYER_LOG_FILE is set. Both sinks use
    /// the LAYER_LOG_FORMAT formatter.
    ///
    /// Evaluated once; the result does not track later environment changes.
    inline LayerConfiguration configurationFromEnvironment(const EnvironmentInputs &in) {
        LayerConfiguration config;
        config.addLayer(defaultLayerName(), parseLevel(in.level, LogLevel::INFO));

        if (!detail::isFalseValue(in.console)) {
            config.addSink(defaultLayerName(),
                makeConsoleSink(SinkOptions::console(), detail::formatterFor(in.format)));
        }
        if (!in.file.empty()) {
            config.addSink(defaultLayerName(),
                makeFileSink(in.file, SinkOptions::file(), detail::formatterFor(in.format)));
        }
        return config;
    }

} // namespace layerlog

#endif // LAYER_LOG_ENVIRONMENT_HPP
