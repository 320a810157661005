// main.cpp — cosmicconnectd: запуск демона из командной строки

#include "cosmicconnect/Daemon.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace CosmicConnect;

std::atomic<bool> g_stopRequested{false};

void handleSignal(int) {
    g_stopRequested = true;
}

void installSignalHandlers() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

struct CliOptions {
    std::string configPath;
    std::string stateDir;
    std::string deviceName;
    bool verbose = false;
    bool showHelp = false;
    std::string error;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <path>     JSON config file\n"
              << "  -s, --state-dir <path>  State directory (identity, certificate, trusted peers)\n"
              << "  -n, --name <name>       Device name shown to peers\n"
              << "  -v, --verbose           Debug logging\n"
              << "  -h, --help              Show this help\n";
}

CliOptions parseArguments(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                options.error = arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!value(options.configPath)) break;
        } else if (arg == "-s" || arg == "--state-dir") {
            if (!value(options.stateDir)) break;
        } else if (arg == "-n" || arg == "--name") {
            if (!value(options.deviceName)) break;
        } else {
            options.error = "Unknown argument: " + arg;
            break;
        }
    }
    return options;
}

void setupLogging(const DaemonConfig& config, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logFile, 5 * 1024 * 1024, 3));
    }

    auto logger = std::make_shared<spdlog::logger>("cosmicconnect", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(config.logLevel));
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options = parseArguments(argc, argv);
    if (!options.error.empty()) {
        std::cerr << options.error << "\n";
        printUsage(argv[0]);
        return 2;
    }
    if (options.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    DaemonConfig config;
    try {
        if (!options.configPath.empty()) {
            config = DaemonConfig::load(options.configPath);
        }
    } catch (const ProtocolError& e) {
        std::cerr << "Invalid config: " << e.what() << "\n";
        return 2;
    }
    if (!options.stateDir.empty()) config.stateDir = options.stateDir;
    if (!options.deviceName.empty()) config.deviceName = options.deviceName;

    try {
        setupLogging(config, options.verbose);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Log setup failed: " << e.what() << "\n";
        return 1;
    }

    installSignalHandlers();

    Daemon daemon(config);
    daemon.onPairingEvent([](const PairingEvent& event) {
        if (event.type == PairingEventType::ConfirmationRequired) {
            spdlog::info("Pairing request from {}: peer {} local {}",
                         event.deviceId, event.peerFingerprint, event.localFingerprint);
        } else {
            spdlog::info("Pairing {}: {}", event.deviceId, pairingEventTypeToString(event.type));
        }
    });
    daemon.onConnectionEvent([](const ConnectionEvent& event) {
        if (event.type == ConnectionEventType::Connected) {
            spdlog::info("Device {} connected from {}", event.deviceId, event.remoteAddress);
        } else if (event.type == ConnectionEventType::Disconnected) {
            spdlog::info("Device {} disconnected: {}", event.deviceId, disconnectReasonToString(event.reason));
        }
    });

    if (!daemon.start()) {
        spdlog::critical("cosmicconnectd: {}", daemon.getLastError());
        return 1;
    }

    while (!g_stopRequested && daemon.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    daemon.stop();
    spdlog::shutdown();
    return 0;
}
