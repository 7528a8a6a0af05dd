#ifndef LAYER_LOG_MACROS_HPP
#define LAYER_LOG_MACROS_HPP

#ifndef LAYER_LOG_NO_MACROS

// Caller capture is opt-in: these pass __FILE__, __LINE__ and __func__.
// The enabled check runs first so the message is not built when filtered.
#define LAYER_LOG(logger, level, layer, message) \
    do { \
        auto& layer_log_ref_ = (logger); \
        auto  layer_log_lvl_ = (level); \
        const std::string layer_log_layer_ = (layer); \
        if (layer_log_ref_.isEnabled(layer_log_layer_, layer_log_lvl_)) { \
            layer_log_ref_.logAt(layer_log_lvl_, \
                ::layerlog::CallerContext(__FILE__, __func__, __LINE__), \
                (message), layer_log_layer_, ::layerlog::ExtraFields()); \
        } \
    } while (0)

#define LAYER_LOG_DEBUG(logger, layer, message)    LAYER_LOG((logger), ::layerlog::LogLevel::DEBUG, (layer), (message))
#define LAYER_LOG_INFO(logger, layer, message)     LAYER_LOG((logger), ::layerlog::LogLevel::INFO, (layer), (message))
#define LAYER_LOG_WARNING(logger, layer, message)  LAYER_LOG((logger), ::layerlog::LogLevel::WARNING, (layer), (message))
#define LAYER_LOG_ERROR(logger, layer, message)    LAYER_LOG((logger), ::layerlog::LogLevel::ERROR, (layer), (message))
#define LAYER_LOG_CRITICAL(logger, layer, message) LAYER_LOG((logger), ::layerlog::LogLevel::CRITICAL, (layer), (message))

#endif // LAYER_LOG_NO_MACROS

#endif // LAYER_LOG_MACROS_HPP
