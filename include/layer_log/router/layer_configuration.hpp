#ifndef LAYER_LOG_LAYER_CONFIGURATION_HPP
#define LAYER_LOG_LAYER_CONFIGURATION_HPP

#include "../core/log_level.hpp"
#include "../sink/sink.hpp"
#include <string>
#include <vector>
#include <stdexcept>

namespace layerlog {

    inline const std::string& defaultLayerName() {
        static const std::string s_name("default");
        return s_name;
    }

    struct LayerSpec {
        std::string name;
        LogLevel threshold;
        std::vector<SinkPtr> sinks;

        LayerSpec() : threshold(LogLevel::INFO) {}
        LayerSpec(std::string name_, LogLevel threshold_, std::vector<SinkPtr> sinks_ = std::vector<SinkPtr>())
            : name(std::move(name_)), threshold(threshold_), sinks(std::move(sinks_)) {}
    };

    /// Layer name -> {threshold, ordered sinks}, in insertion order.
    ///
    /// Built once from validated configuration and handed to a LayerRouter,
    /// which copies it. Changing routing later means building a new
    /// configuration and calling reload().
    ///
    /// @code
    ///   LayerConfiguration layers;
    ///   layers.addLayer("default", LogLevel::INFO)
    ///         .addSink("default", consoleSink)
    ///         .addLayer("AUDIT", LogLevel::WARNING)
    ///         .addSink("AUDIT", auditFile);
    /// @endcode
    class LayerConfiguration {
    public:
        /// Add a layer, or update the threshold of an existing one.
        /// @throws std::invalid_argument on an empty name.
        LayerConfiguration& addLayer(const std::string& name, LogLevel threshold = LogLevel::INFO) {
            requireName(name);
            LayerSpec* existing = findMutable(name);
            if (existing) {
                existing->threshold = threshold;
            } else {
                m_layers.push_back(LayerSpec(name, threshold));
            }
            return *this;
        }

        /// Append a sink to a layer, creating the layer (threshold INFO) if needed.
        LayerConfiguration& addSink(const std::string& layer, SinkPtr sink) {
            requireName(layer);
            if (!sink) {
                throw std::invalid_argument("null sink for layer '" + layer + "'");
            }
            LayerSpec* existing = findMutable(layer);
            if (!existing) {
                m_layers.push_back(LayerSpec(layer, LogLevel::INFO));
                existing = &m_layers.back();
            }
            existing->sinks.push_back(std::move(sink));
            return *this;
        }

        /// Replace a layer wholesale.
        LayerConfiguration& setLayer(const std::string& name, LogLevel threshold, std::vector<SinkPtr> sinks) {
            requireName(name);
            LayerSpec* existing = findMutable(name);
            if (existing) {
                existing->threshold = threshold;
                existing->sinks = std::move(sinks);
            } else {
                m_layers.push_back(LayerSpec(name, threshold, std::move(sinks)));
            }
            return *this;
        }

        const LayerSpec* find(const std::string& name) const {
            for (size_t i = 0; i < m_layers.size(); ++i) {
                if (m_layers[i].name == name) return &m_layers[i];
            }
            return nullptr;
        }

        const std::vector<LayerSpec>& layers() const { return m_layers; }
        size_t size() const { return m_layers.size(); }
        bool empty() const { return m_layers.empty(); }

        /// Distinct sinks across all layers, first occurrence order.
        std::vector<SinkPtr> allSinks() const {
            std::vector<SinkPtr> result;
            for (size_t i = 0; i < m_layers.size(); ++i) {
                for (size_t j = 0; j < m_layers[i].sinks.size(); ++j) {
                    const SinkPtr& sink = m_layers[i].sinks[j];
                    bool seen = false;
                    for (size_t k = 0; k < result.size() && !seen; ++k) {
                        seen = (result[k] == sink);
                    }
                    if (!seen) result.push_back(sink);
                }
            }
            return result;
        }

    private:
        static void requireName(const std::string& name) {
            if (name.empty()) {
                throw std::invalid_argument("layer name must not be empty");
            }
        }

        LayerSpec* findMutable(const std::string& name) {
            for (size_t i = 0; i < m_layers.size(); ++i) {
                if (m_layers[i].name == name) return &m_layers[i];
            }
            return nullptr;
        }

        std::vector<LayerSpec> m_layers;
    };

} // namespace layerlog

#endif // LAYER_LOG_LAYER_CONFIGURATION_HPP
