/**
 * @file config.hpp
 * @brief qlnet command line configuration and argument parsing
 */

#pragma once

#include "qlnet/core/connection_strategy.hpp"
#include "qlnet/core/device_connection.hpp"
#include "qlnet/core/discovery_scanner.hpp"
#include "qlnet/snmp/snmp_status_query.hpp"
#include "qlnet/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qlnet {
namespace tool {

/**
 * @brief Command line configuration
 */
struct Config {
    std::string command;                ///< "discover", "status" or "send"
    std::vector<std::string> args;      ///< Positional arguments after the command

    // Discovery
    int64_t timeout_ms = 5000;
    size_t max_responses = 10;
    std::string broadcast_addr = "255.255.255.255";
    uint16_t snmp_port = 161;
    std::string community = "public";

    // Connection
    std::string strategy = "socket_timeout";
    int64_t read_timeout_ms = 10;
    int64_t write_timeout_ms = 10000;

    std::string log_level = "INFO";
    bool no_color = false;
    bool help = false;
    bool usage_error = false;           ///< Set together with help when parsing failed
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "qlnet - Network label printer discovery and transport\n\n"
              << "Usage: " << program_name << " [OPTIONS] <command> [args]\n\n"
              << "Commands:\n"
              << "  discover                    List printers answering a status broadcast\n"
              << "  status <identifier>         Read printer status once\n"
              << "  send <identifier> <file>    Send a raw command file, then read status\n"
              << "\nDiscovery Options:\n"
              << "  --timeout <ms>              Scan duration (default: 5000)\n"
              << "  --max-responses <n>         Stop after n printers, 0=no limit (default: 10)\n"
              << "  --broadcast <addr>          Broadcast address (default: 255.255.255.255)\n"
              << "  --snmp-port <port>          SNMP agent port (default: 161)\n"
              << "  --community <c>             SNMP community (default: public)\n"
              << "\nConnection Options:\n"
              << "  --strategy <name>           socket_timeout, try_twice, select (default: socket_timeout)\n"
              << "  --read-timeout <ms>         Status query timeout (default: 10)\n"
              << "  --write-timeout <ms>        Send timeout (default: 10000)\n"
              << "\n  --log-level <level>         TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --no-color                  Disable colored log output\n"
              << "  --help                      Show this help message\n\n"
              << "Identifiers look like tcp://192.168.1.5 or tcp://192.168.1.5:9100\n\n"
              << "Example:\n"
              << "  " << program_name << " --timeout 2000 discover\n"
              << "  " << program_name << " --strategy try_twice --read-timeout 100 status tcp://192.168.1.5\n";
}

namespace detail {

inline bool usageError(Config& config, const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    config.help = true;
    config.usage_error = true;
    return false;
}

inline bool parseNumber(Config& config, const char* option, const char* value,
                        int64_t min, int64_t max, int64_t& out) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != std::strlen(value) || parsed < min || parsed > max) {
            return usageError(config, std::string("Invalid value for ") + option + ": " + value);
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return usageError(config, std::string("Invalid value for ") + option + ": " + value);
    } catch (const std::out_of_range&) {
        return usageError(config, std::string("Value out of range for ") + option + ": " + value);
    }
}

inline size_t expectedArgs(const std::string& command) {
    if (command == "status") return 1;
    if (command == "send") return 2;
    return 0;
}

}  // namespace detail

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help and usage_error are set on failure
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        if (std::strcmp(arg, "--no-color") == 0) {
            config.no_color = true;
            continue;
        }

        if (std::strncmp(arg, "--", 2) != 0) {
            if (config.command.empty()) {
                config.command = arg;
            } else {
                config.args.push_back(arg);
            }
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            detail::usageError(config, std::string("Option ") + arg + " requires a value");
            return config;
        }

        const char* value = argv[++i];
        int64_t number = 0;

        if (std::strcmp(arg, "--timeout") == 0) {
            if (!detail::parseNumber(config, arg, value, 0, INT32_MAX, number)) return config;
            config.timeout_ms = number;
        } else if (std::strcmp(arg, "--max-responses") == 0) {
            if (!detail::parseNumber(config, arg, value, 0, INT32_MAX, number)) return config;
            config.max_responses = static_cast<size_t>(number);
        } else if (std::strcmp(arg, "--broadcast") == 0) {
            config.broadcast_addr = value;
        } else if (std::strcmp(arg, "--snmp-port") == 0) {
            if (!detail::parseNumber(config, arg, value, 1, 65535, number)) return config;
            config.snmp_port = static_cast<uint16_t>(number);
        } else if (std::strcmp(arg, "--community") == 0) {
            config.community = value;
        } else if (std::strcmp(arg, "--strategy") == 0) {
            if (!core::parseConnectionStrategy(value)) {
                detail::usageError(config, std::string("Unknown strategy ") + value);
                return config;
            }
            config.strategy = value;
        } else if (std::strcmp(arg, "--read-timeout") == 0) {
            if (!detail::parseNumber(config, arg, value, 1, INT32_MAX, number)) return config;
            config.read_timeout_ms = number;
        } else if (std::strcmp(arg, "--write-timeout") == 0) {
            if (!detail::parseNumber(config, arg, value, 1, INT32_MAX, number)) return config;
            config.write_timeout_ms = number;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else {
            detail::usageError(config, std::string("Unknown option ") + arg);
            return config;
        }
    }

    if (config.command.empty()) {
        detail::usageError(config, "Missing command");
        return config;
    }
    if (config.command != "discover" && config.command != "status" && config.command != "send") {
        detail::usageError(config, "Unknown command " + config.command);
        return config;
    }
    if (config.args.size() != detail::expectedArgs(config.command)) {
        detail::usageError(config, "Wrong number of arguments for " + config.command);
        return config;
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level string, any case
 * @return LogLevel value (defaults to INFO if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return utils::logLevelFromString(upper).value_or(utils::LogLevel::INFO);
}

inline snmp::SnmpConfig toSnmpConfig(const Config& config) {
    snmp::SnmpConfig snmpConfig;
    snmpConfig.community = config.community;
    snmpConfig.agent_port = config.snmp_port;
    snmpConfig.broadcast_addr = config.broadcast_addr;
    return snmpConfig;
}

inline core::DiscoveryConfig toDiscoveryConfig(const Config& config) {
    core::DiscoveryConfig discovery;
    discovery.max_wait = std::chrono::milliseconds(config.timeout_ms);
    discovery.max_responses = config.max_responses;
    return discovery;
}

inline core::ConnectionOptions toConnectionOptions(const Config& config) {
    core::ConnectionOptions options;
    options.strategy = core::parseConnectionStrategy(config.strategy)
                           .value_or(core::ConnectionStrategy::SINGLE_TIMEOUT);
    options.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
    options.write_timeout = std::chrono::milliseconds(config.write_timeout_ms);
    return options;
}

} // namespace tool
} // namespace qlnet
