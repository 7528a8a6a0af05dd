#ifndef LAYER_LOG_LAYER_ROUTER_HPP
#define LAYER_LOG_LAYER_ROUTER_HPP

#include "layer_configuration.hpp"
#include "../core/log_level.hpp"
#include "../sink/sink.hpp"
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>

namespace layerlog {

    using SinkList = std::vector<SinkPtr>;
    using SinkListPtr = std::shared_ptr<const SinkList>;

    /// Outcome of resolving a layer name. An empty resolution means no
    /// layer is configured at all and nothing will be written.
    struct LayerResolution {
        std::string layer;
        LogLevel threshold;
        SinkListPtr sinks;

        LayerResolution() : threshold(LogLevel::NOTSET), sinks(std::make_shared<SinkList>()) {}

        bool empty() const { return layer.empty(); }
    };

    /// Maps a layer name to the ordered sinks that should receive it.
    ///
    /// Resolution order: the requested layer, then "default", then the
    /// first configured layer, then nothing. Every configured name and the
    /// fallback are resolved once when a configuration is installed, so
    /// lookups never take a lock.
    ///
    /// The router holds an immutable snapshot behind a shared_ptr. reload()
    /// builds a new snapshot and swaps it in atomically; callers that
    /// already hold a SinkListPtr keep using the old sinks until they drop it.
    class LayerRouter {
    public:
        explicit LayerRouter(const LayerConfiguration& config = LayerConfiguration())
            : m_snapshot(buildSnapshot(config)) {}

        LayerRouter(const LayerRouter&) = delete;
        LayerRouter& operator=(const LayerRouter&) = delete;

        /// Ordered sinks for @p layer. Never null, possibly empty.
        SinkListPtr resolve(const std::string& layer) const {
            return lookup(*snapshot(), layer).sinks;
        }

        /// Full resolution, including the layer it fell back to.
        LayerResolution resolution(const std::string& layer) const {
            return lookup(*snapshot(), layer);
        }

        /// Name of the layer @p layer resolves to, or "" if none.
        std::string resolvedLayer(const std::string& layer) const {
            return lookup(*snapshot(), layer).layer;
        }

        /// False if the layer resolves to nothing or @p level is below the
        /// resolved layer's threshold.
        bool isEnabled(const std::string& layer, LogLevel level) const {
            const LayerResolution& r = lookup(*snapshot(), layer);
            if (r.empty()) return false;
            return level >= r.threshold;
        }

        /// Install a new configuration. Sinks only referenced by the old one
        /// are not closed here; the owner decides when they retire.
        void reload(const LayerConfiguration& config) {
            std::shared_ptr<const Snapshot> next = buildSnapshot(config);
            std::atomic_store(&m_snapshot, next);
        }

        /// Distinct sinks of the current configuration.
        SinkList allSinks() const {
            return snapshot()->distinct;
        }

        size_t layerCount() const {
            return snapshot()->config.size();
        }

        bool hasLayer(const std::string& name) const {
            return snapshot()->config.find(name) != nullptr;
        }

        LayerConfiguration configuration() const {
            return snapshot()->config;
        }

    private:
        struct Snapshot {
            LayerConfiguration config;
            std::unordered_map<std::string, LayerResolution> byName;
            LayerResolution fallback;
            SinkList distinct;
        };

        std::shared_ptr<const Snapshot> snapshot() const {
            return std::atomic_load(&m_snapshot);
        }

        static const LayerResolution& lookup(const Snapshot& snap, const std::string& layer) {
            std::unordered_map<std::string, LayerResolution>::const_iterator it = snap.byName.find(layer);
            if (it != snap.byName.end()) {
                return it->second;
            }
            return snap.fallback;
        }

        static LayerResolution makeResolution(const LayerSpec& spec) {
            LayerResolution r;
            r.layer = spec.name;
            r.threshold = spec.threshold;
            r.sinks = std::make_shared<SinkList>(spec.sinks);
            return r;
        }

        static std::shared_ptr<const Snapshot> buildSnapshot(const LayerConfiguration& config) {
            std::shared_ptr<Snapshot> snap = std::make_shared<Snapshot>();
            snap->config = config;
            snap->distinct = config.allSinks();

            const std::vector<LayerSpec>& layers = config.layers();
            for (size_t i = 0; i < layers.size(); ++i) {
                snap->byName[layers[i].name] = makeResolution(layers[i]);
            }

            const LayerSpec* def = config.find(defaultLayerName());
            if (def) {
                snap->fallback = makeResolution(*def);
            } else if (!layers.empty()) {
                snap->fallback = makeResolution(layers.front());
            }
            return snap;
        }

        std::shared_ptr<const Snapshot> m_snapshot;
    };

} // namespace layerlog

#endif // LAYER_LOG_LAYER_ROUTER_HPP
