#include <tellcore/client/telldus_core.h>
#include <tellcore/core/constants.h>

#include <common/logger.h>

#include <iostream>
#include <string>

using namespace tellcore;

namespace {

void printDevices(client::TelldusCore& core) {
    auto devices = core.devices();
    std::cout << "Devices (" << devices.size() << "):" << std::endl;
    for (const auto& device : devices) {
        std::cout << "  " << device->id() << "  " << device->name() << "  ["
                  << device->protocol() << "/" << device->model() << "]";
        if (auto group = std::dynamic_pointer_cast<client::DeviceGroup>(device)) {
            std::cout << "  group of "
                      << client::DeviceGroup::formatMemberList(group->memberIds());
        }
        for (const auto &[name, value] : device->parameters()) {
            std::cout << "  " << name << "=" << value;
        }
        std::cout << std::endl;
    }
}

void printSensors(client::TelldusCore& core) {
    auto sensors = core.sensors();
    std::cout << "Sensors (" << sensors.size() << "):" << std::endl;
    for (const auto& sensor : sensors) {
        std::cout << "  " << sensor.protocol() << " " << sensor.model() << " "
                  << sensor.id();
        if (sensor.hasTemperature()) {
            std::cout << "  temperature " << sensor.temperature().value();
        }
        if (sensor.hasHumidity()) {
            std::cout << "  humidity " << sensor.humidity().value();
        }
        std::cout << std::endl;
    }
}

void printControllers(client::TelldusCore& core) {
    try {
        auto controllers = core.controllers();
        std::cout << "Controllers (" << controllers.size() << "):" << std::endl;
        for (const auto& controller : controllers) {
            std::cout << "  " << controller.id() << "  " << controller.name()
                      << "  serial " << controller.serial().value_or("-")
                      << (controller.available() ? "" : "  (unavailable)")
                      << std::endl;
        }
    } catch (const core::NotSupportedError& e) {
        std::cout << "Controllers: " << e.what() << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    core::LibraryConfig config;
    if (argc > 1 && !config.loadFromFile(argv[1])) {
        std::cerr << "Failed to load configuration from " << argv[1] << std::endl;
        return 1;
    }

    try {
        config.loadFromEnvironment();
        auto validation = config.validate();
        if (!validation.isValid) {
            std::cerr << validation.toString() << std::endl;
            return 1;
        }
        config.applyLogging();

        client::TelldusCore core(config);
        printDevices(core);
        printSensors(core);
        printControllers(core);
    } catch (const core::TellcoreError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
