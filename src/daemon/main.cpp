#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <filesystem>
#include <print>
#include <string>

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string socket_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "--config requires a path");
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--socket" || arg == "-s") {
            if (i + 1 >= argc) {
                std::println(stderr, "--socket requires a path");
                return 1;
            }
            socket_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: dictation-daemon [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -s, --socket PATH   Listen on PATH instead of the configured socket");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!socket_path.empty()) config.ipc.socket_path = socket_path;

    // Resolve before daemonizing; remote engines resolve it on their own host.
    if (config.model.engine != "lan") {
        std::error_code ec;
        auto model_path = fs::absolute(config.model.path, ec);
        if (!ec) config.model.path = model_path.string();
    }

    if (!foreground && !platform::daemonize()) {
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[dictation] Starting (engine: {}, model: {})",
                     config.model.engine, config.model.path);
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
