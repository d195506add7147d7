#include "splitdeck/config/ConfigParser.hpp"
#include "splitdeck/core/SessionLifecycle.hpp"
#include "splitdeck/core/SplitLayoutEngine.hpp"
#include "splitdeck/core/Toaster.hpp"
#include "splitdeck/dnd/DragDropCoordinator.hpp"
#include "splitdeck/ipc/CommandDispatcher.hpp"
#include "splitdeck/ipc/IPCServer.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

using namespace sdeck;

// Socket to remove when a signal cuts the session short
static std::string g_socket_path;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (!g_socket_path.empty()) {
            unlink(g_socket_path.c_str());
        }
        std::_Exit(0);
    }
}

void printUsage(const char* program_name) {
    std::cout << "Splitdeck - Split Layout Engine\n"
              << "Usage: " << program_name << " [options]\n"
              << "\nOptions:\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version information\n"
              << "  -c, --config     Specify config file path\n"
              << "  --no-ipc         Don't listen on the control socket\n"
              << "  --script <file>  Run commands from a file before reading stdin\n"
              << std::endl;
}

void printVersion() {
    std::cout << "Splitdeck v0.1.0\n"
              << "Built with C++20\n"
              << std::endl;
}

/**
 * @brief Runs one command line and prints the response
 * @return false once the session should end
 */
bool runLine(CommandDispatcher& dispatcher, Toaster& toaster, const std::string& line) {
    if (line.empty() || line[0] == '#') {
        return true;
    }

    if (CommandDispatcher::isQuit(line)) {
        return false;
    }

    IPCResponse response = dispatcher.execute(line);
    std::cout << response.format() << std::endl;

    if (!response.success) {
        toaster.warning(response.message);
    }
    toaster.update();
    return true;
}

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> custom_config_path;
    std::optional<std::filesystem::path> script_path;
    bool ipc_enabled = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            printVersion();
            return 0;
        }

        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                custom_config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires a path argument" << std::endl;
                return 1;
            }
            continue;
        }

        if (arg == "--script") {
            if (i + 1 < argc) {
                script_path = argv[++i];
            } else {
                std::cerr << "Error: --script requires a path argument" << std::endl;
                return 1;
            }
            continue;
        }

        if (arg == "--no-ipc") {
            ipc_enabled = false;
            continue;
        }

        std::cerr << "Error: unknown option " << arg << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Errors are collected here and toasted once the toaster exists
    std::vector<std::string> config_errors;
    ConfigParser parser([&config_errors](const std::string& message) {
        config_errors.push_back(message);
    });

    std::filesystem::path config_path = custom_config_path.value_or(ConfigParser::getDefaultConfigPath());
    bool loaded = false;
    if (custom_config_path || std::filesystem::exists(config_path)) {
        loaded = parser.load(config_path);
        if (!loaded) {
            std::cerr << "Config: Falling back to embedded defaults" << std::endl;
        }
    }

    if (!loaded) {
        // Values from a half-read file must not leak into the defaults
        parser = ConfigParser();
        if (!parser.loadFromString(ConfigParser::getEmbeddedConfig())) {
            std::cerr << "Config: Embedded defaults are invalid" << std::endl;
            return 1;
        }
    }

    const Config& config = parser.getConfig();

    Toaster toaster(config.notifications.enabled, config.notifications.timeout_ms);
    toaster.initialize();
    for (const auto& error : config_errors) {
        toaster.configError(error);
    }

    try {
        SessionTable sessions;
        SplitLayoutEngine engine(sessions, parser.engineConfig());
        DragDropCoordinator dnd(engine);
        CommandDispatcher dispatcher(engine, dnd);

        std::unique_ptr<IPCServer> server;

        engine.subscribe([&server, &config](const LayoutEvent& event) {
            if (config.logging.verbose) {
                std::cout << "Engine: " << toString(event.type) << " tab " << event.tab << std::endl;
            }
            if (server) {
                server->broadcast(std::string("EVENT|") + toString(event.type) + "|" +
                                  std::to_string(event.tab));
            }
        });

        if (script_path) {
            std::ifstream script(*script_path);
            if (!script) {
                std::cerr << "Error: cannot open script " << *script_path << std::endl;
                return 1;
            }
            std::string line;
            while (std::getline(script, line)) {
                if (!runLine(dispatcher, toaster, line)) {
                    return 0;
                }
            }
        }

        if (ipc_enabled && config.ipc.enabled) {
            std::string socket_path = config.ipc.socket.empty()
                ? ConfigParser::getDefaultSocketPath()
                : config.ipc.socket;
            server = std::make_unique<IPCServer>(socket_path, dispatcher);
            if (server->start()) {
                g_socket_path = socket_path;
            } else {
                toaster.error("Control socket unavailable: " + socket_path);
                server.reset();
            }
        }

        std::cout << "Splitdeck ready, type 'help' for commands" << std::endl;

        std::string line;
        while (std::getline(std::cin, line)) {
            if (!runLine(dispatcher, toaster, line)) {
                break;
            }
        }

        if (server) {
            server->stop();
            server.reset();
        }

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
