#include "layer_log.hpp"
#include <iostream>
#include <thread>
#include <vector>

int main() {
    auto backup = std::make_shared<layerlog::FileBackupStore>("dropped.jsonl");

    auto logger = layerlog::LoggerConfiguration()
        .name("async")
        .layer("default", layerlog::LogLevel::INFO)
        .writeTo("default", layerlog::makeFileSink("async.log"))
        .dispatcher(layerlog::DispatcherOptions()
                        .setPrimaryCapacity(1000)
                        .setOverflowCapacity(10000)
                        .setConcurrency(layerlog::memoryScaledConcurrency())
                        .setDrainGrace(std::chrono::milliseconds(2000))
                        .setBackupStore(backup))
        .buildAsync();

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([logger, t] {
            for (int i = 0; i < 1000; ++i) {
                logger->info("producer " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }

    std::cout << logger->health().toJson().dump(2) << std::endl;

    logger->close(std::chrono::milliseconds(2000));
    std::cout << "Dropped in total: " << logger->droppedCount() << std::endl;
    return 0;
}
