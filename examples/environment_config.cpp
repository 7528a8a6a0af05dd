#include "layer_log.hpp"
#include <iostream>

// Try: LAYER_LOG_LEVEL=debug LAYER_LOG_FORMAT=json LAYER_LOG_FILE=env.log ./environment_config
int main() {
    layerlog::LayerConfiguration layers =
        layerlog::configurationFromEnvironment(layerlog::EnvironmentInputs::fromProcess());

    auto logger = layerlog::LoggerConfiguration()
        .name("env")
        .layers(layers)
        .redact([](const std::string& msg) {
            std::string out = msg;
            size_t pos = out.find("secret=");
            if (pos != std::string::npos) {
                out.replace(pos + 7, std::string::npos, "***");
            }
            return out;
        })
        .buildSync();

    logger->debug("Debug only when LAYER_LOG_LEVEL allows it");
    logger->info("Token refreshed, secret=hunter2");

    // Swap in a stricter configuration at runtime
    layerlog::LayerConfiguration strict;
    strict.addLayer("default", layerlog::LogLevel::ERROR).addSink("default", layerlog::makeConsoleSink());
    logger->reload(strict);
    logger->info("Suppressed after reload");
    logger->error("Still visible after reload");

    logger->close();
    std::cout << "logger state: " << layerlog::getLoggerStateString(logger->state()) << std::endl;
    return 0;
}
