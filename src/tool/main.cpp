/**
 * @file main.cpp
 * @brief qlnet command line entry point
 *
 * Thin executable over the library:
 * - discover: broadcast scan for printers
 * - status:   one status read from a printer
 * - send:     write a raw command file, then read status
 */

#include <qlnet/tool/config.hpp>
#include <qlnet/core/device_connection.hpp>
#include <qlnet/core/discovery_scanner.hpp>
#include <qlnet/core/errors.hpp>
#include <qlnet/net/platform.hpp>
#include <qlnet/utils/logger.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

using namespace qlnet;
using namespace qlnet::tool;

namespace {

std::string toHex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

void printStatus(const std::vector<uint8_t>& status) {
    if (status.empty()) {
        std::cout << "no status\n";
    } else {
        std::cout << toHex(status) << "\n";
    }
}

int runDiscover(const Config& config) {
    auto devices = core::listAvailableDevices(toDiscoveryConfig(config), toSnmpConfig(config));

    if (devices.empty()) {
        std::cout << "No printers found.\n";
        return 0;
    }
    for (const auto& device : devices) {
        std::cout << device.identifier << "\n";
    }
    return 0;
}

int runStatus(const Config& config) {
    auto printer = core::openDevice(config.args[0], toConnectionOptions(config),
                                    toSnmpConfig(config));
    printStatus(printer->read());
    printer->dispose();
    return 0;
}

int runSend(const Config& config) {
    const std::string& path = config.args[1];
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_ERROR("Main", "Cannot open {}", path);
        return 1;
    }
    std::vector<uint8_t> payload((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());

    auto printer = core::openDevice(config.args[0], toConnectionOptions(config),
                                    toSnmpConfig(config));
    printer->write(payload);
    LOG_INFO("Main", "Sent {} byte(s) to {}", payload.size(), config.args[0]);

    printStatus(printer->read());
    printer->dispose();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.usage_error ? 2 : 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));
    utils::Logger::instance().setColorEnabled(!config.no_color);

    net::SocketInitializer sockets;
    if (!sockets.isInitialized()) {
        LOG_ERROR("Main", "Socket layer initialization failed");
        return 1;
    }

    try {
        if (config.command == "discover") {
            return runDiscover(config);
        }
        if (config.command == "status") {
            return runStatus(config);
        }
        return runSend(config);

    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Main", "{}", e.what());
        return 2;
    } catch (const core::Error& e) {
        LOG_ERROR("Main", "{}", e.what());
        return 1;
    }
}
