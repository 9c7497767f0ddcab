#include "qt.hpp"
#include "gui/RunnerWindow.hpp"
#include <iostream>
#include <string>
#include "core/ConfigManager.hpp"
#include "core/util/SignalWatcher.hpp"
#include "utils/Logger.hpp"

using namespace pyrunner;

int main(int argc, char* argv[]) {
    bool debugMode = false;
    std::string configPath;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: pyrunner [options]\n";
            std::cout << "Options:\n";
            std::cout << "  --config, -c FILE  Read settings from FILE\n";
            std::cout << "  --debug, -d        Enable debug logging\n";
            std::cout << "  --help, -h         Show this help\n";
            std::cout << "\nUse pyrunner-cli to run a script without a window.\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    // Initialize config first
    auto& config = Configs::Get();
    config.Load(configPath);

    auto& logger = Logger::getInstance();
    logger.initialize(config.GetLogToFile(), config.GetLogMaxDays(), config.GetLogColor());
    logger.setLogLevel(debugMode ? Logger::LOG_DEBUG : Logger::parseLevel(config.GetLogLevel()));
    info("Config path: {}", config.getPath());

    try {
        // Before Qt starts any thread, so only the watcher sees these
        util::blockSignals();
    } catch (const std::exception& e) {
        error("Failed to block signals: {}", e.what());
        return 1;
    }

    App app(argc, argv);
    app.setApplicationName("pyrunner");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("pyrunner");
    app.setQuitOnLastWindowClosed(false); // Keep running in tray

    try {
        RunnerWindow window(config);
        window.setupSignalHandling();
        window.show();

        info("pyrunner started");
        return app.exec();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        error("Fatal error: {}", e.what());
        return 1;
    }
}
