#include "layer_log.hpp"
#include <iostream>

int main() {
    auto logger = layerlog::LoggerConfiguration()
        .name("basic")
        .layer("APP", layerlog::LogLevel::DEBUG)
        .layer("DB", layerlog::LogLevel::WARNING)
        .writeTo("APP", layerlog::makeConsoleSink())
        .writeTo("APP", layerlog::makeFileSink("app.log"))
        .writeTo("DB", layerlog::makeFileSink("db.json.log", layerlog::SinkOptions::file().setName("db"),
                                              layerlog::detail::make_unique<layerlog::JsonFormatter>()))
        .context("service", "example")
        .buildSync();

    logger->debug("Starting up", "APP");
    logger->info("Connection pool ready", "DB");      // below WARNING, dropped
    logger->warning("Slow query: 1200ms", "DB");
    logger->log(layerlog::LogLevel::ERROR, "Order failed", "APP",
                layerlog::ExtraFields{{"order_id", "42"}});

    // Unknown layer falls back to the first configured one (no "default" here)
    logger->info("Routed through fallback", "CACHE");

    LAYER_LOG_INFO(*logger, "APP", "With caller position");

    logger->close();
    std::cout << "Check app.log and db.json.log." << std::endl;
    return 0;
}
