#include <tellcore/client/telldus_core.h>
#include <tellcore/core/asio_callback_dispatcher.h>

#include <common/logger.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>

using namespace tellcore;

// Prints every Telldus Core event until interrupted. Events are delivered on
// the main thread through the io_context.
int main(int argc, char* argv[]) {
    common::initLogger("", common::LogLevel::INFO);

    boost::asio::io_context context;
    auto dispatcher = std::make_shared<core::AsioCallbackDispatcher>(context);

    try {
        client::TelldusCore core(argc > 1 ? argv[1] : "", dispatcher);

        core.registerDeviceEvent(
            [](int deviceId, int method, const std::string& data, int) {
                std::cout << "device " << deviceId << " method " << method
                          << (data.empty() ? "" : " data " + data) << std::endl;
            });
        core.registerDeviceChangeEvent(
            [](int deviceId, int changeEvent, int changeType, int) {
                std::cout << "device " << deviceId << " change " << changeEvent
                          << "/" << changeType << std::endl;
            });
        core.registerRawDeviceEvent(
            [](const std::string& data, int controllerId, int) {
                std::cout << "raw [" << controllerId << "] " << data << std::endl;
            });
        core.registerSensorEvent([](const std::string& protocol,
                                    const std::string& model, int id, int dataType,
                                    const std::string& value, int timestamp, int) {
            std::cout << "sensor " << protocol << " " << model << " " << id
                      << " type " << dataType << " = " << value << " @" << timestamp
                      << std::endl;
        });
        core.registerControllerEvent([](int controllerId, int changeEvent,
                                        int changeType, const std::string& newValue,
                                        int) {
            std::cout << "controller " << controllerId << " change " << changeEvent
                      << "/" << changeType << " " << newValue << std::endl;
        });

        boost::asio::signal_set signals(context, SIGINT, SIGTERM);
        signals.async_wait([&context](const boost::system::error_code&, int) {
            context.stop();
        });

        common::logInfo("Listening for events, press Ctrl+C to stop", "listener");
        context.run();
    } catch (const core::TellcoreError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
