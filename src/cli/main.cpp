#include "CliRunner.hpp"
#include "../core/ConfigManager.hpp"
#include "../core/util/SignalWatcher.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Util.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace pyrunner;

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "pyrunner-cli";
    cli::CliOptions options;
    try {
        options = cli::parseArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const cli::UsageError& e) {
        std::cerr << e.what() << "\n\n" << cli::usage(program);
        return cli::EXIT_USAGE;
    }
    if (options.showHelp) {
        std::cout << cli::usage(program);
        return 0;
    }

    auto& config = Configs::Get();
    if (!config.Load(options.configPath) && !options.configPath.empty()) {
        warning("Config file {} could not be read", options.configPath);
    }

    auto& logger = Logger::getInstance();
    logger.initialize(config.GetLogToFile(), config.GetLogMaxDays(), config.GetLogColor());
    logger.setLogLevel(options.debug ? Logger::LOG_DEBUG : Logger::parseLevel(config.GetLogLevel()));

    std::optional<ExecutionSession> session;
    try {
        session = SessionFactory::create(cli::buildRequest(options, config));
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_USAGE;
    }

    ProcessSupervisor supervisor(ProcessSupervisor::optionsFrom(config));
    util::SignalWatcher signalWatcher;
    try {
        // Before any thread exists, so only the watcher receives these
        util::blockSignals();
        signalWatcher.setSignalCallback([&supervisor](int) { supervisor.requestStop(); });
        signalWatcher.start();
    } catch (const std::exception& e) {
        error("Failed to set up signal handling: {}", e.what());
        return cli::EXIT_SUPERVISOR_ERROR;
    }

    if (signalWatcher.shouldExitNow()) {
        return cli::EXIT_STOPPED;
    }

    RunEventQueue events;
    supervisor.start(std::move(*session), events);
    // A signal that arrived while the run was starting found nothing to stop
    if (signalWatcher.shouldExitNow()) {
        supervisor.requestStop();
    }

    int exitCode = cli::EXIT_SUPERVISOR_ERROR;
    while (!events.closed()) {
        std::visit(overloaded{
            [](const OutputEvent& output) {
                std::cout << output.line << std::endl;
            },
            [&exitCode](const RunOutcome& outcome) {
                std::cerr << describeOutcome(outcome) << "\n";
                exitCode = cli::exitCodeFor(outcome);
            },
        }, events.nextBlocking());
    }

    supervisor.wait();
    signalWatcher.stop();
    return exitCode;
}
