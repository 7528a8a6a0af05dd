#include "layer_log.hpp"
#include <iostream>

int main() {
    layerlog::LoggerRegistry registry;

    auto audit = registry.getOrCreate("audit", [](const std::string& name) -> layerlog::LoggerPtr {
        return layerlog::LoggerConfiguration()
            .name(name)
            .writeTo("default", layerlog::makeFileSink("audit.log"))
            .buildSync();
    });

    auto console = registry.getOrCreate("console", [](const std::string& name) -> layerlog::LoggerPtr {
        return layerlog::LoggerConfiguration()
            .name(name)
            .writeTo("default", layerlog::makeConsoleSink())
            .buildAsync();
    });

    auto both = std::make_shared<layerlog::CompositeLogger>(
        "both", std::vector<std::shared_ptr<layerlog::ILogger> >{audit, console});
    registry.add("both", both);

    both->info("User alice signed in");
    both->warning("Password expires in 3 days");

    for (const auto& name : registry.names()) {
        std::cout << "registered: " << name << std::endl;
    }
    std::cout << both->health().toJson().dump(2) << std::endl;

    registry.closeAll();
    return 0;
}
